#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "frame_source.hpp"

struct CaptureConfig {
    std::string device = "default";        // ALSA PCM name, e.g. "plughw:Loopback,1,0"
    unsigned sample_rate = 48000;          // requested; the device may pick another
    unsigned channels = 2;
    unsigned frames_per_buffer = 960;      // 20 ms at 48 kHz
};

struct AudioDevice {
    int index = 0;                         // 1-based, as shown by --list-devices
    std::string name;
    std::string id;                        // ALSA PCM name to open
};

// Captures the mixed output of a system audio device (an ALSA loopback
// subdevice or a PulseAudio monitor) as S16_LE in the device's native rate.
class LoopbackDevice : public FrameSource {
public:
    explicit LoopbackDevice(const CaptureConfig& cfg);
    ~LoopbackDevice() override;

    SourceKind kind() const override { return SourceKind::LoopbackDevice; }

    void open() override;
    std::vector<uint8_t> read_raw(std::size_t max_bytes, std::chrono::milliseconds timeout) override;
    void close() override;

    AudioFormat format() const override;
    bool is_open() const override;

    static std::vector<AudioDevice> list_devices();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
