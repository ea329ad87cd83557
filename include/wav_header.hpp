#pragma once

#include <cstddef>
#include <cstdint>

#include "audio_format.hpp"

struct WavHeader {
    AudioFormat format;
    std::size_t data_offset = 0;   // first PCM byte
    std::size_t data_size = 0;     // meaningful only when sized
    bool sized = false;            // false for the streaming marker (live streams)
};

enum class WavParse {
    Ok,
    NeedMoreData,
    NotWav,
    Unsupported,
};

// Parses a RIFF/WAVE preamble. Only integer PCM (8/16/24/32-bit) is accepted.
// frame_duration_ms of the returned format is left at its default.
WavParse parse_wav_header(const uint8_t* data, std::size_t size, WavHeader& out);

// True when the buffer starts with "RIFF....WAVE".
bool looks_like_wav(const uint8_t* data, std::size_t size);
