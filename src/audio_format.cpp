#include "audio_format.hpp"

#include <sstream>

namespace {
// Above this the resampler's fixed-point interpolation could overflow.
constexpr unsigned kMaxSampleRate = 384000;
}

std::size_t AudioFormat::frame_bytes() const {
    return static_cast<std::size_t>(sample_rate) * bytes_per_frame() * frame_duration_ms / 1000;
}

bool AudioFormat::whole_frames() const {
    const std::size_t bytes = frame_bytes();
    return bytes > 0 && bytes_per_frame() > 0 && bytes % bytes_per_frame() == 0;
}

bool AudioFormat::is_valid() const {
    if (sample_rate == 0 || sample_rate > kMaxSampleRate || frame_duration_ms == 0) return false;
    if (channels != 1 && channels != 2) return false;
    return bit_depth == 8 || bit_depth == 16 || bit_depth == 24 || bit_depth == 32;
}

std::string AudioFormat::describe() const {
    std::ostringstream oss;
    oss << sample_rate << " Hz, " << channels << " ch, " << bit_depth << "-bit, " << frame_duration_ms << " ms";
    return oss.str();
}

bool AudioFormat::operator==(const AudioFormat& other) const {
    return sample_rate == other.sample_rate && channels == other.channels && bit_depth == other.bit_depth &&
           frame_duration_ms == other.frame_duration_ms;
}

AudioFormat discord_voice_format() { return AudioFormat{}; }
