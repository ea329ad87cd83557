#include "config.hpp"
#include "errors.hpp"
#include "loopback_device.hpp"
#include "playback_session.hpp"
#include "source_factory.hpp"
#include "utils.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {
volatile std::sig_atomic_t g_running = 1;

void handle_sigint(int) {
    g_running = 0;
}

void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--list-devices] [source]\n"
              << "  source: device:<index|name> | file:<path> | pipe:<command> | url:<http url>\n"
              << "          optionally followed by ;rate=<hz>;channels=<n>;bits=<n>\n"
              << "Raw PCM frames are written to stdout at the frame cadence.\n";
}

int list_devices() {
    const std::vector<AudioDevice> devices = LoopbackDevice::list_devices();
    if (devices.empty()) {
        std::cout << "No capture devices found.\n";
        return 1;
    }
    for (const auto& dev : devices) {
        std::cout << "  [" << dev.index << "] " << dev.name << " (" << dev.id << ")\n";
    }
    return 0;
}
} // namespace

int main(int argc, char** argv) {
    std::signal(SIGINT, handle_sigint);
    std::signal(SIGTERM, handle_sigint);

    std::string source_arg;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--list-devices") == 0) return list_devices();
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (!source_arg.empty()) {
            usage(argv[0]);
            return 2;
        }
        source_arg = argv[i];
    }

    Config cfg;
    try {
        cfg = load_config();
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 2;
    }
    if (!source_arg.empty()) cfg.source = source_arg;
    if (cfg.source.empty()) cfg.source = "device:1";

    AudioSourceFactory factory(LoopbackDevice::list_devices(), cfg.target, cfg.reconnect, cfg.framer);
    PlaybackSession session(factory);
    session.set_finished_callback([](const std::string& reason) {
        std::cerr << "[loopcast] Playback finished: " << reason << "\n";
    });

    try {
        if (!session.start(cfg.source)) return 1;
    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Failed to start audio source: " << e.what() << "\n";
        return 1;
    }

    const auto period = std::chrono::milliseconds(cfg.target.frame_duration_ms);
    const float silence_dbfs = -60.0f;
    const uint64_t warn_after = 10000 / cfg.target.frame_duration_ms;
    uint64_t quiet = 0;
    bool warned = false;

    std::cerr << "Streaming " << cfg.target.describe() << " to stdout. Press Ctrl+C to quit.\n";
    auto next = std::chrono::steady_clock::now();
    while (g_running) {
        auto frame = session.read();
        if (!frame) break;

        if (std::fwrite(frame->data(), 1, frame->size(), stdout) != frame->size()) {
            std::cerr << "Output closed.\n";
            break;
        }
        std::fflush(stdout);

        if (cfg.target.bit_depth == 16 && dbfs(*frame) < silence_dbfs) {
            if (++quiet >= warn_after && !warned) {
                std::cerr << "[loopcast] Warning: no audio detected - check source\n";
                warned = true;
            }
        } else {
            quiet = 0;
            warned = false;
        }

        // Keep the cadence absolute so a slow read does not shift later frames.
        next += period;
        const auto now = std::chrono::steady_clock::now();
        if (next > now) {
            std::this_thread::sleep_until(next);
        } else if (now - next > 10 * period) {
            next = now;
        }
    }

    session.stop();
    std::cerr << "Exiting after " << session.frames_played() << " frames.\n";
    return 0;
}
