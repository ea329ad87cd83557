#include "utils.hpp"

#include <cmath>

float rms(const std::vector<uint8_t>& pcm16) {
    const std::size_t samples = pcm16.size() / 2;
    if (samples == 0) return 0.0f;
    double acc = 0.0;
    for (std::size_t i = 0; i < samples; ++i) {
        const auto sample = static_cast<int16_t>(pcm16[2 * i] | (pcm16[2 * i + 1] << 8));
        acc += static_cast<double>(sample) * static_cast<double>(sample);
    }
    return static_cast<float>(std::sqrt(acc / static_cast<double>(samples)));
}

float dbfs(const std::vector<uint8_t>& pcm16) {
    const float r = rms(pcm16);
    const float ref = 32768.0f; // int16 max magnitude
    return 20.0f * std::log10((r + 1e-9f) / ref);
}
