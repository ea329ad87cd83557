#include "loopback_device.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

#include "errors.hpp"

namespace {

// read_raw never parks the pipeline longer than this, whatever the caller asks.
constexpr std::chrono::milliseconds kMaxWait{1000};

} // namespace

#if defined(__linux__) && defined(LOOPCAST_WITH_ALSA)

#include <alsa/asoundlib.h>
#include <cerrno>
#include <cstdio>
#include <sstream>

namespace {

std::string alsa_error(int code, const std::string& context) {
    std::ostringstream oss;
    oss << context << ": " << snd_strerror(code);
    return oss.str();
}

} // namespace

struct LoopbackDevice::Impl {
    explicit Impl(const CaptureConfig& cfg);
    ~Impl();

    void open();
    std::vector<uint8_t> read(std::size_t max_bytes, std::chrono::milliseconds timeout);
    void close();
    static std::vector<AudioDevice> list_devices();

    // Brings the stream back after an xrun or suspend. Throws when ALSA
    // cannot recover, which means the device itself went away.
    void recover(int err, const char* context);

    CaptureConfig cfg_;
    snd_pcm_t* handle_{nullptr};
};

LoopbackDevice::Impl::Impl(const CaptureConfig& cfg) : cfg_(cfg) {}

LoopbackDevice::Impl::~Impl() { close(); }

void LoopbackDevice::Impl::open() {
    if (handle_) return;

    int err = snd_pcm_open(&handle_, cfg_.device.c_str(), SND_PCM_STREAM_CAPTURE, 0);
    if (err < 0) {
        handle_ = nullptr;
        throw SourceUnavailable(alsa_error(err, "snd_pcm_open(" + cfg_.device + ")"));
    }

    snd_pcm_hw_params_t* hw_params = nullptr;
    snd_pcm_hw_params_malloc(&hw_params);
    if (!hw_params) {
        close();
        throw SourceUnavailable("Failed to allocate ALSA hw params");
    }

    auto fail = [&](int code, const char* context) {
        snd_pcm_hw_params_free(hw_params);
        close();
        throw SourceUnavailable(alsa_error(code, context));
    };

    snd_pcm_hw_params_any(handle_, hw_params);

    err = snd_pcm_hw_params_set_access(handle_, hw_params, SND_PCM_ACCESS_RW_INTERLEAVED);
    if (err < 0) fail(err, "snd_pcm_hw_params_set_access");

    err = snd_pcm_hw_params_set_format(handle_, hw_params, SND_PCM_FORMAT_S16_LE);
    if (err < 0) fail(err, "snd_pcm_hw_params_set_format");

    err = snd_pcm_hw_params_set_channels(handle_, hw_params, cfg_.channels);
    if (err < 0) fail(err, "snd_pcm_hw_params_set_channels");

    unsigned int rate = cfg_.sample_rate;
    err = snd_pcm_hw_params_set_rate_near(handle_, hw_params, &rate, nullptr);
    if (err < 0) fail(err, "snd_pcm_hw_params_set_rate_near");
    if (rate != cfg_.sample_rate) {
        std::cerr << "[capture] Warning: sample rate adjusted to " << rate << " Hz\n";
        cfg_.sample_rate = rate;
    }

    snd_pcm_uframes_t frames = cfg_.frames_per_buffer;
    err = snd_pcm_hw_params_set_period_size_near(handle_, hw_params, &frames, nullptr);
    if (err < 0) fail(err, "snd_pcm_hw_params_set_period_size_near");
    cfg_.frames_per_buffer = static_cast<unsigned>(frames);

    err = snd_pcm_hw_params(handle_, hw_params);
    snd_pcm_hw_params_free(hw_params);
    if (err < 0) {
        close();
        throw SourceUnavailable(alsa_error(err, "snd_pcm_hw_params"));
    }

    err = snd_pcm_prepare(handle_);
    if (err < 0) {
        close();
        throw SourceUnavailable(alsa_error(err, "snd_pcm_prepare"));
    }

    // Capture streams must be started explicitly before snd_pcm_wait.
    err = snd_pcm_start(handle_);
    if (err < 0) {
        close();
        throw SourceUnavailable(alsa_error(err, "snd_pcm_start"));
    }

    std::cerr << "[capture] Opened " << cfg_.device << " (" << cfg_.sample_rate << " Hz, " << cfg_.channels
              << " ch, period " << cfg_.frames_per_buffer << " frames)\n";
}

void LoopbackDevice::Impl::recover(int err, const char* context) {
    err = snd_pcm_recover(handle_, err, 1);
    if (err < 0) {
        throw SourceUnavailable(alsa_error(err, context));
    }
    err = snd_pcm_start(handle_);
    if (err < 0 && err != -EBADFD) {
        throw SourceUnavailable(alsa_error(err, "snd_pcm_start"));
    }
}

std::vector<uint8_t> LoopbackDevice::Impl::read(std::size_t max_bytes, std::chrono::milliseconds timeout) {
    if (!handle_) throw SourceUnavailable("Capture device " + cfg_.device + " is not open");

    const std::size_t frame_size = static_cast<std::size_t>(cfg_.channels) * sizeof(int16_t);
    const std::size_t max_frames = max_bytes / frame_size;
    if (max_frames == 0) return {};

    const auto wait = std::min(timeout, kMaxWait);
    int ready = snd_pcm_wait(handle_, static_cast<int>(std::max<std::chrono::milliseconds::rep>(wait.count(), 0)));
    if (ready == 0) return {};
    if (ready < 0) {
        recover(ready, "snd_pcm_wait");
        return {};
    }

    snd_pcm_sframes_t avail = snd_pcm_avail_update(handle_);
    if (avail < 0) {
        recover(static_cast<int>(avail), "snd_pcm_avail_update");
        return {};
    }

    const auto want = static_cast<snd_pcm_uframes_t>(std::min<std::size_t>(static_cast<std::size_t>(avail), max_frames));
    if (want == 0) return {};

    std::vector<uint8_t> out(static_cast<std::size_t>(want) * frame_size);
    snd_pcm_sframes_t frames = snd_pcm_readi(handle_, out.data(), want);
    if (frames == -EAGAIN) return {};
    if (frames < 0) {
        recover(static_cast<int>(frames), "snd_pcm_readi");
        return {};
    }

    out.resize(static_cast<std::size_t>(frames) * frame_size);
    return out;
}

void LoopbackDevice::Impl::close() {
    if (handle_) {
        snd_pcm_drop(handle_);
        snd_pcm_close(handle_);
        handle_ = nullptr;
    }
}

std::vector<AudioDevice> LoopbackDevice::Impl::list_devices() {
    std::vector<AudioDevice> devices;
    devices.push_back(AudioDevice{1, "System default capture", "default"});

    int card = -1;
    if (snd_card_next(&card) < 0 || card < 0) {
        return devices;
    }

    while (card >= 0) {
        snd_ctl_t* ctl = nullptr;
        char card_name[32];
        std::snprintf(card_name, sizeof(card_name), "hw:%d", card);
        if (snd_ctl_open(&ctl, card_name, 0) < 0) {
            snd_card_next(&card);
            continue;
        }

        snd_pcm_info_t* pcm_info = nullptr;
        snd_pcm_info_malloc(&pcm_info);
        if (!pcm_info) {
            std::cerr << "[capture] Failed to allocate pcm_info for " << card_name << "\n";
            snd_ctl_close(ctl);
            snd_card_next(&card);
            continue;
        }

        int device = -1;
        while (true) {
            if (snd_ctl_pcm_next_device(ctl, &device) < 0) break;
            if (device < 0) break;

            snd_pcm_info_set_device(pcm_info, device);
            snd_pcm_info_set_subdevice(pcm_info, 0);
            snd_pcm_info_set_stream(pcm_info, SND_PCM_STREAM_CAPTURE);

            if (snd_ctl_pcm_info(ctl, pcm_info) < 0) continue;

            const char* name = snd_pcm_info_get_name(pcm_info);
            char pcm_name[32];
            std::snprintf(pcm_name, sizeof(pcm_name), "plughw:%d,%d", card, device);

            AudioDevice entry;
            entry.index = static_cast<int>(devices.size()) + 1;
            entry.name = name ? name : pcm_name;
            entry.id = pcm_name;
            devices.push_back(entry);
        }

        snd_pcm_info_free(pcm_info);
        snd_ctl_close(ctl);
        snd_card_next(&card);
    }
    return devices;
}

#else

struct LoopbackDevice::Impl {
    explicit Impl(const CaptureConfig& cfg) : cfg_(cfg) {}

    void open() {
        throw SourceUnavailable("Loopback capture not supported on this platform");
    }
    std::vector<uint8_t> read(std::size_t, std::chrono::milliseconds) {
        throw SourceUnavailable("Capture device " + cfg_.device + " is not open");
    }
    void close() {}
    static std::vector<AudioDevice> list_devices() { return {}; }

    CaptureConfig cfg_;
    bool handle_{false};
};

#endif

LoopbackDevice::LoopbackDevice(const CaptureConfig& cfg) : impl_(std::make_unique<Impl>(cfg)) {}

LoopbackDevice::~LoopbackDevice() = default;

void LoopbackDevice::open() { impl_->open(); }

std::vector<uint8_t> LoopbackDevice::read_raw(std::size_t max_bytes, std::chrono::milliseconds timeout) {
    return impl_->read(max_bytes, timeout);
}

void LoopbackDevice::close() { impl_->close(); }

AudioFormat LoopbackDevice::format() const {
    AudioFormat fmt;
    fmt.sample_rate = impl_->cfg_.sample_rate;
    fmt.channels = impl_->cfg_.channels;
    fmt.bit_depth = 16;
    return fmt;
}

bool LoopbackDevice::is_open() const { return static_cast<bool>(impl_->handle_); }

std::vector<AudioDevice> LoopbackDevice::list_devices() { return Impl::list_devices(); }
