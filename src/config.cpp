#include "config.hpp"

#include <cerrno>
#include <cstdlib>

#include "errors.hpp"

namespace {

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

unsigned long env_number(const char* name, unsigned long fallback) {
    const char* value = env(name);
    if (!value) return fallback;

    char* end = nullptr;
    errno = 0;
    const unsigned long parsed = std::strtoul(value, &end, 10);
    if (errno != 0 || end == value || *end != '\0' || *value == '-') {
        throw ConfigurationError(std::string(name) + " must be a non-negative integer, got '" + value + "'");
    }
    return parsed;
}

} // namespace

Config load_config() {
    Config cfg;

    if (const char* source = env("LOOPCAST_SOURCE")) {
        cfg.source = source;
    } else if (const char* url = env("ICECAST_URL")) {
        cfg.source = url;
    }

    unsigned long rate = env_number("AUDIO_SAMPLE_RATE", cfg.target.sample_rate);
    rate = env_number("LOOPCAST_SAMPLE_RATE", rate);
    cfg.target.sample_rate = static_cast<unsigned>(rate);
    cfg.target.channels = static_cast<unsigned>(env_number("LOOPCAST_CHANNELS", cfg.target.channels));
    cfg.target.frame_duration_ms = static_cast<unsigned>(env_number("LOOPCAST_FRAME_MS", cfg.target.frame_duration_ms));
    if (!cfg.target.is_valid() || !cfg.target.whole_frames()) {
        throw ConfigurationError("Unusable output format: " + cfg.target.describe());
    }

    cfg.reconnect.stall_timeout =
        std::chrono::milliseconds(env_number("LOOPCAST_STALL_TIMEOUT_MS", cfg.reconnect.stall_timeout.count()));
    cfg.reconnect.base_delay =
        std::chrono::milliseconds(env_number("LOOPCAST_RECONNECT_BASE_MS", cfg.reconnect.base_delay.count()));
    cfg.reconnect.max_delay =
        std::chrono::milliseconds(env_number("LOOPCAST_RECONNECT_MAX_MS", cfg.reconnect.max_delay.count()));
    cfg.reconnect.max_attempts =
        static_cast<unsigned>(env_number("LOOPCAST_RECONNECT_ATTEMPTS", cfg.reconnect.max_attempts));
    if (cfg.reconnect.max_delay < cfg.reconnect.base_delay) {
        throw ConfigurationError("LOOPCAST_RECONNECT_MAX_MS is below LOOPCAST_RECONNECT_BASE_MS");
    }

    cfg.framer.max_silent_frames =
        static_cast<unsigned>(env_number("LOOPCAST_MAX_SILENT_FRAMES", cfg.framer.max_silent_frames));
    return cfg;
}
