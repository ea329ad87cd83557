#pragma once

#include <cstdint>
#include <vector>

// Levels of a frame of signed 16-bit little-endian PCM.
float rms(const std::vector<uint8_t>& pcm16);
float dbfs(const std::vector<uint8_t>& pcm16);
