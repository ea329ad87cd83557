#include "wav_header.hpp"

#include <cstring>

namespace {

constexpr uint16_t kFormatPcm = 0x0001;
constexpr uint16_t kFormatExtensible = 0xFFFE;
constexpr uint32_t kUnknownSize = 0xFFFFFFFF;

uint16_t read_u16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t read_u32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) | (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

bool tag_is(const uint8_t* p, const char* tag) {
    return std::memcmp(p, tag, 4) == 0;
}

} // namespace

bool looks_like_wav(const uint8_t* data, std::size_t size) {
    return size >= 12 && tag_is(data, "RIFF") && tag_is(data + 8, "WAVE");
}

WavParse parse_wav_header(const uint8_t* data, std::size_t size, WavHeader& out) {
    if (size == 0) return WavParse::NeedMoreData;
    if (size < 12) {
        // Not enough to decide, unless what we have already rules it out.
        const std::size_t n = size < 4 ? size : 4;
        return std::memcmp(data, "RIFF", n) == 0 ? WavParse::NeedMoreData : WavParse::NotWav;
    }
    if (!looks_like_wav(data, size)) return WavParse::NotWav;

    bool have_fmt = false;
    std::size_t pos = 12;
    while (pos + 8 <= size) {
        const uint8_t* chunk = data + pos;
        const uint32_t chunk_size = read_u32(chunk + 4);

        if (tag_is(chunk, "data")) {
            if (!have_fmt) return WavParse::Unsupported;
            out.data_offset = pos + 8;
            out.sized = chunk_size != kUnknownSize;
            out.data_size = out.sized ? chunk_size : 0;
            return WavParse::Ok;
        }

        if (tag_is(chunk, "fmt ")) {
            if (chunk_size < 16) return WavParse::Unsupported;
            if (pos + 8 + 16 > size) return WavParse::NeedMoreData;

            const uint8_t* fmt = chunk + 8;
            const uint16_t format_tag = read_u16(fmt);
            if (format_tag != kFormatPcm && format_tag != kFormatExtensible) {
                return WavParse::Unsupported;
            }
            out.format.channels = read_u16(fmt + 2);
            out.format.sample_rate = read_u32(fmt + 4);
            out.format.bit_depth = read_u16(fmt + 14);
            if (!out.format.is_valid()) return WavParse::Unsupported;
            have_fmt = true;
        }

        // Chunks are word aligned.
        pos += 8 + static_cast<std::size_t>(chunk_size) + (chunk_size & 1u);
    }
    return WavParse::NeedMoreData;
}
