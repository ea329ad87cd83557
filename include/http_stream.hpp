#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "frame_source.hpp"

struct StreamUrl {
    std::string host;
    uint16_t port = 80;
    std::string path = "/";
};

// Parses an http:// URL. Throws ConfigurationError when it is malformed or
// uses a scheme other than http.
StreamUrl parse_stream_url(const std::string& url);

struct HttpStreamConfig {
    std::string url;
    AudioFormat format;                    // layout of a headerless PCM body
    std::chrono::milliseconds connect_timeout{10000};
};

// Long-lived HTTP (Icecast/Shoutcast style) PCM stream. A dropped connection
// is reported as ConnectionLost, never as an empty chunk.
class RemoteURLStream : public FrameSource {
public:
    explicit RemoteURLStream(const HttpStreamConfig& cfg);
    ~RemoteURLStream() override;

    RemoteURLStream(const RemoteURLStream&) = delete;
    RemoteURLStream& operator=(const RemoteURLStream&) = delete;

    SourceKind kind() const override { return SourceKind::RemoteURLStream; }

    void open() override;
    std::vector<uint8_t> read_raw(std::size_t max_bytes, std::chrono::milliseconds timeout) override;
    void close() override;
    void cancel() override;

    AudioFormat format() const override { return format_; }
    bool is_open() const override { return fd_ >= 0; }

    const std::string& url() const { return cfg_.url; }

private:
    void connect(const std::string& url, std::chrono::steady_clock::time_point deadline, int redirects);
    void probe_body(std::chrono::steady_clock::time_point deadline);

    HttpStreamConfig cfg_;
    AudioFormat format_;
    int fd_{-1};
    int cancel_fd_{-1};                    // eventfd polled beside the socket
    std::vector<uint8_t> pending_;         // body bytes read along with the headers
};
