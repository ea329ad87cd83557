#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <vector>

#include "audio_format.hpp"
#include "frame_source.hpp"

struct FramerOptions {
    // Consecutive silence frames after which stalled() reports true.
    // 0 disables stall reporting.
    unsigned max_silent_frames = 250;
};

// Pulls from a FrameSource, normalizes to the target format and hands out
// frames of exactly target.frame_bytes(). A read() never takes longer than
// one frame period: when the source is slow it returns silence and keeps
// whatever partial data it has for the next call.
class Framer {
public:
    Framer(std::unique_ptr<FrameSource> source, const AudioFormat& target, const FramerOptions& options = {});
    ~Framer();

    Framer(const Framer&) = delete;
    Framer& operator=(const Framer&) = delete;

    // Opens the source. Throws SourceUnavailable.
    void open();

    // One frame, or std::nullopt once a finite source has been drained.
    // Throws SourceUnavailable if the source fails for good.
    std::optional<std::vector<uint8_t>> read();

    void close();

    FrameSource& source() { return *source_; }
    const AudioFormat& target_format() const { return target_; }
    std::size_t frame_bytes() const { return frame_bytes_; }
    std::size_t buffered() const { return buffer_.size(); }

    bool ended() const { return ended_; }
    bool stalled() const;

    uint64_t frames_emitted() const { return frames_emitted_; }
    uint64_t silent_frames() const { return silent_frames_; }
    unsigned consecutive_silent_frames() const { return consecutive_silent_; }

private:
    void configure(const AudioFormat& source_format);
    void append(std::vector<uint8_t> chunk);
    std::vector<uint8_t> pop_frame();
    std::optional<std::vector<uint8_t>> finish();
    std::vector<uint8_t> silence();

    std::unique_ptr<FrameSource> source_;
    AudioFormat target_;
    FramerOptions options_;
    std::size_t frame_bytes_;

    AudioFormat source_format_;
    std::size_t block_bytes_{0};           // raw bytes normalized per step
    std::size_t request_bytes_{0};         // raw bytes asked of the source per call

    std::vector<uint8_t> raw_;             // source bytes short of a whole block
    std::deque<uint8_t> buffer_;           // normalized bytes short of (or beyond) a frame

    bool ended_{false};
    uint64_t frames_emitted_{0};
    uint64_t silent_frames_{0};
    unsigned consecutive_silent_{0};
};
