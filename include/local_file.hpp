#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "frame_source.hpp"

struct LocalFileConfig {
    std::string path;                      // WAV or raw PCM file, or
    std::string command;                   // decoder whose stdout carries PCM (e.g. ffmpeg -f s16le -)
    AudioFormat format;                    // layout of raw input; a WAV header overrides it
};

// Finite source. read_raw() returns an empty chunk exactly once at the end
// of the data and throws EndOfStream if called again.
class LocalFile : public FrameSource {
public:
    explicit LocalFile(const LocalFileConfig& cfg);
    ~LocalFile() override;

    LocalFile(const LocalFile&) = delete;
    LocalFile& operator=(const LocalFile&) = delete;

    SourceKind kind() const override { return SourceKind::LocalFile; }

    void open() override;
    std::vector<uint8_t> read_raw(std::size_t max_bytes, std::chrono::milliseconds timeout) override;
    void close() override;

    AudioFormat format() const override { return format_; }
    bool is_open() const override { return fd_ >= 0; }
    bool finished() const override { return finished_; }

    std::string describe() const;

private:
    void spawn_decoder();
    void read_header();
    std::size_t fill(uint8_t* dest, std::size_t max_bytes, std::chrono::milliseconds timeout);

    LocalFileConfig cfg_;
    AudioFormat format_;
    int fd_{-1};
    int child_{-1};
    bool finished_{false};
    bool eof_{false};
    bool limited_{false};                  // WAV data chunk with a known size
    std::size_t remaining_{0};
    std::vector<uint8_t> pending_;         // bytes read past the header
};
