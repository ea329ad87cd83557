#include "framer.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <stdexcept>

#include "errors.hpp"
#include "resampler.hpp"

namespace {
using Clock = std::chrono::steady_clock;
}

Framer::Framer(std::unique_ptr<FrameSource> source, const AudioFormat& target, const FramerOptions& options)
    : source_(std::move(source)), target_(target), options_(options), frame_bytes_(target.frame_bytes()) {
    if (!source_) throw ConfigurationError("Framer requires a source");
    if (!target_.is_valid() || !target_.whole_frames()) {
        throw ConfigurationError("Invalid target format: " + target_.describe());
    }
}

Framer::~Framer() { close(); }

void Framer::open() {
    source_->open();
    configure(source_->format());
}

void Framer::configure(const AudioFormat& source_format) {
    AudioFormat native = source_format;
    native.frame_duration_ms = target_.frame_duration_ms;
    if (!native.is_valid()) {
        throw SourceUnavailable("Unsupported native format: " + native.describe());
    }

    if (!raw_.empty() && native != source_format_) {
        // Leftovers from the previous layout cannot be mixed with the new one.
        raw_.clear();
    }
    source_format_ = native;
    block_bytes_ = resample_block_bytes(source_format_, target_);

    // Ask for about one frame period of source audio, in whole blocks.
    const std::size_t want = std::max(source_format_.frame_bytes(), block_bytes_);
    request_bytes_ = (want + block_bytes_ - 1) / block_bytes_ * block_bytes_;

    if (source_format_.sample_rate != target_.sample_rate || source_format_.channels != target_.channels ||
        source_format_.bit_depth != target_.bit_depth) {
        std::cerr << "[framer] Converting " << source_format_.describe() << " -> " << target_.describe() << "\n";
    }
}

std::optional<std::vector<uint8_t>> Framer::read() {
    if (ended_) return std::nullopt;
    if (block_bytes_ == 0) throw std::logic_error("Framer::read() called before open()");

    const auto deadline = Clock::now() + std::chrono::milliseconds(target_.frame_duration_ms);
    while (buffer_.size() < frame_bytes_) {
        if (source_->finished()) return finish();

        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (left.count() <= 0) break;

        std::vector<uint8_t> chunk;
        try {
            chunk = source_->read_raw(request_bytes_, left);
        } catch (const EndOfStream&) {
            return finish();
        } catch (const ConnectionLost& e) {
            // Unwrapped network sources cannot recover here; keep the cadence.
            std::cerr << "[framer] Warning: " << e.what() << "\n";
            break;
        }
        if (chunk.empty()) continue;

        const AudioFormat current = source_->format();
        if (current.sample_rate != source_format_.sample_rate || current.channels != source_format_.channels ||
            current.bit_depth != source_format_.bit_depth) {
            configure(current);
        }
        append(std::move(chunk));
    }

    if (buffer_.size() >= frame_bytes_) {
        consecutive_silent_ = 0;
        ++frames_emitted_;
        return pop_frame();
    }
    return silence();
}

void Framer::append(std::vector<uint8_t> chunk) {
    raw_.insert(raw_.end(), chunk.begin(), chunk.end());

    const std::size_t usable = raw_.size() / block_bytes_ * block_bytes_;
    if (usable == 0) return;

    std::vector<uint8_t> head(raw_.begin(), raw_.begin() + static_cast<std::ptrdiff_t>(usable));
    raw_.erase(raw_.begin(), raw_.begin() + static_cast<std::ptrdiff_t>(usable));

    const std::vector<uint8_t> normalized = normalize(head, source_format_, target_);
    buffer_.insert(buffer_.end(), normalized.begin(), normalized.end());
}

std::vector<uint8_t> Framer::pop_frame() {
    std::vector<uint8_t> frame(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(frame_bytes_));
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(frame_bytes_));
    return frame;
}

std::optional<std::vector<uint8_t>> Framer::finish() {
    if (!raw_.empty()) {
        const std::vector<uint8_t> tail = normalize(raw_, source_format_, target_);
        buffer_.insert(buffer_.end(), tail.begin(), tail.end());
        raw_.clear();
    }

    if (buffer_.empty()) {
        ended_ = true;
        return std::nullopt;
    }

    ++frames_emitted_;
    consecutive_silent_ = 0;
    if (buffer_.size() >= frame_bytes_) return pop_frame();

    // Last partial frame, padded with silence.
    std::vector<uint8_t> frame(buffer_.begin(), buffer_.end());
    frame.resize(frame_bytes_, 0);
    buffer_.clear();
    return frame;
}

std::vector<uint8_t> Framer::silence() {
    ++frames_emitted_;
    ++silent_frames_;
    ++consecutive_silent_;
    return std::vector<uint8_t>(frame_bytes_, 0);
}

bool Framer::stalled() const {
    return options_.max_silent_frames > 0 && consecutive_silent_ >= options_.max_silent_frames;
}

void Framer::close() {
    if (source_) source_->close();
}
