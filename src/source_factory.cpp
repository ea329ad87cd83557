#include "source_factory.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>

#include "errors.hpp"
#include "http_stream.hpp"
#include "local_file.hpp"

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return lower(s.substr(0, prefix.size())) == prefix;
}

bool is_number(const std::string& s) {
    return !s.empty() && s.size() <= 9 &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

bool is_regular_file(const std::string& path) {
    struct stat st {};
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

unsigned parse_override(const std::string& key, const std::string& value, const std::string& text) {
    if (!is_number(value)) {
        throw ConfigurationError("Invalid " + key + " '" + value + "' in source " + text);
    }
    return static_cast<unsigned>(std::stoul(value));
}

bool is_format_key(const std::string& key) {
    return key == "rate" || key == "channels" || key == "bits";
}

// Applies "rate=44100;channels=1;bits=16" to format.
void apply_options(const std::string& options, AudioFormat& format, const std::string& text) {
    std::string rest = options;
    while (!rest.empty()) {
        const auto next = rest.find(';');
        const std::string item = rest.substr(0, next);
        rest = next == std::string::npos ? std::string() : rest.substr(next + 1);
        if (item.empty()) continue;

        const auto eq = item.find('=');
        if (eq == std::string::npos) throw ConfigurationError("Malformed option '" + item + "' in source " + text);
        const std::string key = lower(item.substr(0, eq));
        const std::string value = item.substr(eq + 1);

        if (key == "rate") {
            format.sample_rate = parse_override(key, value, text);
        } else if (key == "channels") {
            format.channels = parse_override(key, value, text);
        } else if (key == "bits") {
            format.bit_depth = parse_override(key, value, text);
        } else {
            throw ConfigurationError("Unknown option '" + key + "' in source " + text);
        }
    }

    if (!format.is_valid()) {
        throw ConfigurationError("Unsupported format " + format.describe() + " in source " + text);
    }
}

// Everything after the first ';' is options.
std::string split_options(const std::string& text, AudioFormat& format) {
    const auto semi = text.find(';');
    if (semi == std::string::npos) return text;
    apply_options(text.substr(semi + 1), format, text);
    return text.substr(0, semi);
}

// Shell commands contain ';' of their own, so only trailing format options
// are split off.
std::string split_command_options(const std::string& text, AudioFormat& format) {
    std::string body = text;
    for (;;) {
        const auto semi = body.rfind(';');
        if (semi == std::string::npos) break;
        const std::string item = body.substr(semi + 1);
        const auto eq = item.find('=');
        if (eq == std::string::npos || !is_format_key(lower(item.substr(0, eq)))) break;
        body.resize(semi);
    }
    if (body.size() < text.size()) apply_options(text.substr(body.size() + 1), format, text);
    return body;
}

} // namespace

SourceDescriptor parse_source_descriptor(const std::string& text) {
    SourceDescriptor out;
    out.text = text;

    const std::string body =
        starts_with(text, "pipe:") ? split_command_options(text, out.format) : split_options(text, out.format);
    if (body.empty()) throw ConfigurationError("Empty source descriptor");

    if (starts_with(body, "device:")) {
        out.kind = SourceKind::LoopbackDevice;
        out.target = body.substr(7);
    } else if (starts_with(body, "file:")) {
        out.kind = SourceKind::LocalFile;
        out.target = body.substr(5);
    } else if (starts_with(body, "pipe:")) {
        out.kind = SourceKind::LocalFile;
        out.decoder = true;
        out.target = body.substr(5);
    } else if (starts_with(body, "url:")) {
        out.kind = SourceKind::RemoteURLStream;
        out.target = body.substr(4);
    } else if (starts_with(body, "icecast:")) {
        out.kind = SourceKind::RemoteURLStream;
        out.target = body.substr(8);
    } else if (starts_with(body, "http://") || starts_with(body, "https://")) {
        out.kind = SourceKind::RemoteURLStream;
        out.target = body;
    } else if (is_regular_file(body)) {
        out.kind = SourceKind::LocalFile;
        out.target = body;
    } else {
        throw ConfigurationError("Unrecognised source '" + text +
                                 "' (expected device:, file:, pipe:, url: or an existing file)");
    }

    if (out.target.empty()) throw ConfigurationError("Source '" + text + "' names nothing");
    if (out.kind == SourceKind::RemoteURLStream) {
        parse_stream_url(out.target);
    }
    return out;
}

AudioSourceFactory::AudioSourceFactory(std::vector<AudioDevice> devices, const AudioFormat& target,
                                       const ReconnectPolicy& reconnect, const FramerOptions& framer)
    : devices_(std::move(devices)), target_(target), reconnect_(reconnect), framer_(framer) {
    if (!target_.is_valid() || !target_.whole_frames()) throw ConfigurationError("Invalid target format: " + target_.describe());
}

const AudioDevice& AudioSourceFactory::find_device(const std::string& ref) const {
    if (is_number(ref)) {
        const int index = std::stoi(ref);
        for (const auto& dev : devices_) {
            if (dev.index == index) return dev;
        }
        throw ConfigurationError("No capture device with index " + ref + " (" + std::to_string(devices_.size()) +
                                 " available; see --list-devices)");
    }

    for (const auto& dev : devices_) {
        if (dev.id == ref || dev.name == ref) return dev;
    }
    const std::string wanted = lower(ref);
    for (const auto& dev : devices_) {
        if (lower(dev.name).find(wanted) != std::string::npos) return dev;
    }
    throw ConfigurationError("No capture device matching '" + ref + "'");
}

std::unique_ptr<FrameSource> AudioSourceFactory::create_source(const SourceDescriptor& descriptor) const {
    AudioFormat native = descriptor.format;
    native.frame_duration_ms = target_.frame_duration_ms;

    switch (descriptor.kind) {
        case SourceKind::LoopbackDevice: {
            const AudioDevice& dev = find_device(descriptor.target);
            CaptureConfig cfg;
            cfg.device = dev.id;
            cfg.sample_rate = native.sample_rate;
            cfg.channels = native.channels;
            cfg.frames_per_buffer = static_cast<unsigned>(native.frame_bytes() / native.bytes_per_frame());
            return std::make_unique<LoopbackDevice>(cfg);
        }
        case SourceKind::LocalFile: {
            LocalFileConfig cfg;
            cfg.format = native;
            if (descriptor.decoder) {
                cfg.command = descriptor.target;
            } else {
                if (!is_regular_file(descriptor.target)) {
                    throw ConfigurationError("File not found: " + descriptor.target);
                }
                if (::access(descriptor.target.c_str(), R_OK) != 0) {
                    throw ConfigurationError("File not readable: " + descriptor.target);
                }
                cfg.path = descriptor.target;
            }
            return std::make_unique<LocalFile>(cfg);
        }
        case SourceKind::RemoteURLStream: {
            parse_stream_url(descriptor.target);
            HttpStreamConfig cfg;
            cfg.url = descriptor.target;
            cfg.format = native;
            return std::make_unique<ReconnectingStreamReader>(
                [cfg]() { return std::make_unique<RemoteURLStream>(cfg); }, reconnect_);
        }
    }
    throw ConfigurationError("Unknown source kind for " + descriptor.text);
}

std::unique_ptr<Framer> AudioSourceFactory::create(const std::string& descriptor) const {
    return std::make_unique<Framer>(create_source(parse_source_descriptor(descriptor)), target_, framer_);
}

std::string AudioSourceFactory::describe(const std::string& descriptor) const {
    const SourceDescriptor parsed = parse_source_descriptor(descriptor);
    switch (parsed.kind) {
        case SourceKind::LoopbackDevice: {
            const AudioDevice& dev = find_device(parsed.target);
            return "Local Device: " + dev.name + " (" + dev.id + ")";
        }
        case SourceKind::LocalFile:
            return parsed.decoder ? "Decoder: " + parsed.target : "File: " + parsed.target;
        case SourceKind::RemoteURLStream:
            return "URL Stream: " + parsed.target;
    }
    return parsed.text;
}
