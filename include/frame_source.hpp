#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "audio_format.hpp"

enum class SourceKind {
    LoopbackDevice,
    LocalFile,
    RemoteURLStream,
};

const char* to_string(SourceKind kind);

// Capture contract shared by every backend. Sources are single-use: once
// closed or exhausted, construct a new one to start again.
class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual SourceKind kind() const = 0;

    // Acquires the native handle. Throws SourceUnavailable on failure.
    virtual void open() = 0;

    // Returns at most max_bytes of raw PCM in format(), waiting no longer than
    // timeout. An empty chunk means nothing arrived in time (or, for finite
    // sources, the end of the stream; see finished()).
    virtual std::vector<uint8_t> read_raw(std::size_t max_bytes, std::chrono::milliseconds timeout) = 0;

    // Releases the native handle. Safe to call repeatedly.
    virtual void close() = 0;

    // Native format of the bytes returned by read_raw(). Valid after open().
    virtual AudioFormat format() const = 0;

    virtual bool is_open() const = 0;

    // True once a finite source has delivered its final (empty) chunk.
    virtual bool finished() const { return false; }

    // Callable from another thread: makes a blocking open() fail promptly
    // with SourceUnavailable and read_raw() return early. Permanent.
    virtual void cancel() {}
};
