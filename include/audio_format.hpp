#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

struct AudioFormat {
    unsigned sample_rate = 48000;          // Discord voice runs at 48 kHz
    unsigned channels = 2;                 // stereo
    unsigned bit_depth = 16;               // signed little-endian PCM
    unsigned frame_duration_ms = 20;       // transport delivery cadence

    std::size_t bytes_per_sample() const { return bit_depth / 8; }
    std::size_t bytes_per_frame() const { return bytes_per_sample() * channels; }

    // Exact size of one transport frame. Every frame handed downstream of the
    // Framer has this length.
    std::size_t frame_bytes() const;

    // True when a transport frame holds a non-zero whole number of sample
    // frames. Required of output formats, not of what a source delivers.
    bool whole_frames() const;

    bool is_valid() const;
    std::string describe() const;

    bool operator==(const AudioFormat& other) const;
    bool operator!=(const AudioFormat& other) const { return !(*this == other); }
};

// 48000 Hz / stereo / 16-bit / 20 ms, i.e. 3840-byte frames.
AudioFormat discord_voice_format();
