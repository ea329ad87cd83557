#pragma once

#include <memory>
#include <string>
#include <vector>

#include "audio_format.hpp"
#include "frame_source.hpp"
#include "framer.hpp"
#include "loopback_device.hpp"
#include "reconnecting_reader.hpp"

struct SourceDescriptor {
    SourceKind kind = SourceKind::LoopbackDevice;
    std::string target;                    // device index/name, path, command or URL
    bool decoder = false;                  // target is a shell command (pipe:)
    AudioFormat format;                    // native layout, after ;rate=..;channels=..;bits=..
    std::string text;                      // descriptor as given
};

// Accepts device:<index|name>, file:<path>, pipe:<command>, url:<http url>,
// icecast:<http url>, a bare http:// URL or a bare path to an existing file.
// Throws ConfigurationError on anything else.
SourceDescriptor parse_source_descriptor(const std::string& text);

class AudioSourceFactory {
public:
    AudioSourceFactory(std::vector<AudioDevice> devices, const AudioFormat& target,
                       const ReconnectPolicy& reconnect = {}, const FramerOptions& framer = {});

    // Validated, unopened pipeline for the descriptor. Network sources come
    // wrapped in a ReconnectingStreamReader.
    std::unique_ptr<Framer> create(const std::string& descriptor) const;
    std::unique_ptr<FrameSource> create_source(const SourceDescriptor& descriptor) const;

    // "Local Device: ...", "File: ...", "Decoder: ..." or "URL Stream: ...".
    std::string describe(const std::string& descriptor) const;

    const std::vector<AudioDevice>& devices() const { return devices_; }
    const AudioFormat& target_format() const { return target_; }

private:
    const AudioDevice& find_device(const std::string& ref) const;

    std::vector<AudioDevice> devices_;
    AudioFormat target_;
    ReconnectPolicy reconnect_;
    FramerOptions framer_;
};
