#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "audio_format.hpp"

// Byte length normalize() produces for input_bytes of source-format audio.
// Trailing bytes that do not make up a whole source frame are ignored.
std::size_t normalized_size(std::size_t input_bytes, const AudioFormat& source, const AudioFormat& target);

// Smallest input length (in bytes) whose rate conversion is exact, i.e.
// source_rate / gcd(source_rate, target_rate) frames. Feeding normalize() in
// multiples of this keeps the output rate exact across successive chunks.
std::size_t resample_block_bytes(const AudioFormat& source, const AudioFormat& target);

// Converts raw interleaved PCM from source to target: bit depth, channel
// count (mono duplicated to stereo, stereo averaged to mono) and sample rate
// (linear interpolation). Stateless; safe to call from any thread.
std::vector<uint8_t> normalize(const std::vector<uint8_t>& raw,
                               const AudioFormat& source,
                               const AudioFormat& target);
