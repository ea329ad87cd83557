#include "resampler.hpp"

#include <algorithm>
#include <numeric>

namespace {

// Beyond this the block would add audible latency; fall back to per-frame
// conversion and accept the rounding.
constexpr unsigned kMaxBlockMs = 100;

// Samples are carried internally at full 32-bit scale.
int32_t decode_sample(const uint8_t* p, unsigned bit_depth) {
    switch (bit_depth) {
        case 8:
            return static_cast<int32_t>(static_cast<uint32_t>(p[0] ^ 0x80u) << 24);
        case 16:
            return static_cast<int32_t>((static_cast<uint32_t>(p[0]) << 16) | (static_cast<uint32_t>(p[1]) << 24));
        case 24:
            return static_cast<int32_t>((static_cast<uint32_t>(p[0]) << 8) | (static_cast<uint32_t>(p[1]) << 16) |
                                        (static_cast<uint32_t>(p[2]) << 24));
        default:
            return static_cast<int32_t>(static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
                                        (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24));
    }
}

void encode_sample(int32_t sample, unsigned bit_depth, uint8_t* p) {
    const auto u = static_cast<uint32_t>(sample);
    switch (bit_depth) {
        case 8:
            p[0] = static_cast<uint8_t>((u >> 24) ^ 0x80u);
            break;
        case 16:
            p[0] = static_cast<uint8_t>(u >> 16);
            p[1] = static_cast<uint8_t>(u >> 24);
            break;
        case 24:
            p[0] = static_cast<uint8_t>(u >> 8);
            p[1] = static_cast<uint8_t>(u >> 16);
            p[2] = static_cast<uint8_t>(u >> 24);
            break;
        default:
            p[0] = static_cast<uint8_t>(u);
            p[1] = static_cast<uint8_t>(u >> 8);
            p[2] = static_cast<uint8_t>(u >> 16);
            p[3] = static_cast<uint8_t>(u >> 24);
            break;
    }
}

std::size_t output_frames(std::size_t in_frames, const AudioFormat& source, const AudioFormat& target) {
    if (source.sample_rate == target.sample_rate) return in_frames;
    return static_cast<std::size_t>(static_cast<uint64_t>(in_frames) * target.sample_rate / source.sample_rate);
}

// Decodes and remixes to the target channel count.
std::vector<int32_t> remix(const std::vector<uint8_t>& raw,
                           std::size_t frames,
                           const AudioFormat& source,
                           unsigned out_channels) {
    const std::size_t in_stride = source.bytes_per_frame();
    const std::size_t sample_bytes = source.bytes_per_sample();
    std::vector<int32_t> out(frames * out_channels);

    for (std::size_t f = 0; f < frames; ++f) {
        const uint8_t* frame = raw.data() + f * in_stride;
        if (source.channels == out_channels) {
            for (unsigned ch = 0; ch < out_channels; ++ch) {
                out[f * out_channels + ch] = decode_sample(frame + ch * sample_bytes, source.bit_depth);
            }
        } else if (source.channels == 1) {
            const int32_t mono = decode_sample(frame, source.bit_depth);
            for (unsigned ch = 0; ch < out_channels; ++ch) {
                out[f * out_channels + ch] = mono;
            }
        } else {
            int64_t acc = 0;
            for (unsigned ch = 0; ch < source.channels; ++ch) {
                acc += decode_sample(frame + ch * sample_bytes, source.bit_depth);
            }
            const auto mixed = static_cast<int32_t>(acc / static_cast<int64_t>(source.channels));
            for (unsigned ch = 0; ch < out_channels; ++ch) {
                out[f * out_channels + ch] = mixed;
            }
        }
    }
    return out;
}

} // namespace

std::size_t normalized_size(std::size_t input_bytes, const AudioFormat& source, const AudioFormat& target) {
    const std::size_t in_frame = source.bytes_per_frame();
    if (in_frame == 0 || source.sample_rate == 0) return 0;
    return output_frames(input_bytes / in_frame, source, target) * target.bytes_per_frame();
}

std::size_t resample_block_bytes(const AudioFormat& source, const AudioFormat& target) {
    const std::size_t in_frame = source.bytes_per_frame();
    if (source.sample_rate == target.sample_rate || source.sample_rate == 0 || target.sample_rate == 0) {
        return in_frame;
    }
    const unsigned divisor = std::gcd(source.sample_rate, target.sample_rate);
    const std::size_t block_frames = source.sample_rate / divisor;
    if (block_frames * 1000 > static_cast<std::size_t>(source.sample_rate) * kMaxBlockMs) {
        return in_frame;
    }
    return block_frames * in_frame;
}

std::vector<uint8_t> normalize(const std::vector<uint8_t>& raw,
                               const AudioFormat& source,
                               const AudioFormat& target) {
    const std::size_t out_bytes = normalized_size(raw.size(), source, target);
    std::vector<uint8_t> out(out_bytes);
    if (out_bytes == 0) return out;

    // Fast path: nothing to convert.
    if (source.sample_rate == target.sample_rate && source.channels == target.channels &&
        source.bit_depth == target.bit_depth) {
        std::copy_n(raw.begin(), out_bytes, out.begin());
        return out;
    }

    const std::size_t in_frames = raw.size() / source.bytes_per_frame();
    const std::size_t out_count = out_bytes / target.bytes_per_frame();
    const unsigned channels = target.channels;
    const std::vector<int32_t> mixed = remix(raw, in_frames, source, channels);

    const std::size_t out_sample = target.bytes_per_sample();
    for (std::size_t i = 0; i < out_count; ++i) {
        // Position of output frame i on the input timeline, as idx + num/den.
        const uint64_t scaled = static_cast<uint64_t>(i) * source.sample_rate;
        const std::size_t idx = static_cast<std::size_t>(scaled / target.sample_rate);
        const int64_t num = static_cast<int64_t>(scaled % target.sample_rate);
        const int64_t den = target.sample_rate;
        const std::size_t a = std::min(idx, in_frames - 1);
        const std::size_t b = std::min(idx + 1, in_frames - 1);

        for (unsigned ch = 0; ch < channels; ++ch) {
            const int64_t sa = mixed[a * channels + ch];
            const int64_t sb = mixed[b * channels + ch];
            // |sb - sa| < 2^33 and num < den <= 384000, so the product fits.
            const auto value = static_cast<int32_t>(sa + (sb - sa) * num / den);
            encode_sample(value, target.bit_depth, out.data() + i * target.bytes_per_frame() + ch * out_sample);
        }
    }
    return out;
}
