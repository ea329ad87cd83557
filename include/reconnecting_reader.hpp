#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <thread>
#include <vector>

#include "frame_source.hpp"

enum class ConnectionState {
    Connected,
    Reconnecting,
    Failed,
};

const char* to_string(ConnectionState state);

struct ReconnectPolicy {
    std::chrono::milliseconds stall_timeout{5000};     // no bytes for this long counts as a drop
    std::chrono::milliseconds base_delay{500};
    std::chrono::milliseconds max_delay{30000};
    double jitter = 0.2;                               // +/- fraction applied to each delay
    unsigned max_attempts = 0;                         // 0 retries until stopped
};

// Delay before retry number `attempt` (1-based). unit_random in [0, 1)
// picks the jitter; 0.5 yields the exact exponential value.
std::chrono::milliseconds backoff_delay(const ReconnectPolicy& policy, unsigned attempt, double unit_random);

// Keeps a network-backed source alive. Drops and stalls move the reader to
// Reconnecting, where read_raw() hands out empty chunks while a single
// background attempt reopens a fresh source with exponential backoff.
//
// read_raw() and close() must not run concurrently with each other; the
// reconnect worker never touches the source that read_raw() is using.
class ReconnectingStreamReader : public FrameSource {
public:
    using SourceFactory = std::function<std::unique_ptr<FrameSource>()>;
    using StateCallback = std::function<void(ConnectionState)>;

    explicit ReconnectingStreamReader(SourceFactory factory, const ReconnectPolicy& policy = {});
    ~ReconnectingStreamReader() override;

    ReconnectingStreamReader(const ReconnectingStreamReader&) = delete;
    ReconnectingStreamReader& operator=(const ReconnectingStreamReader&) = delete;

    SourceKind kind() const override { return SourceKind::RemoteURLStream; }

    // Opens the first connection synchronously; SourceUnavailable propagates.
    void open() override;
    std::vector<uint8_t> read_raw(std::size_t max_bytes, std::chrono::milliseconds timeout) override;
    void close() override;

    AudioFormat format() const override;
    bool is_open() const override;

    ConnectionState state() const;
    unsigned reconnects() const { return reconnects_.load(); }

    // Invoked on every state change, from whichever thread caused it.
    void set_state_callback(StateCallback cb);

private:
    void begin_reconnect(const std::string& reason);
    void reconnect_loop();
    void adopt_fresh_source();
    void notify(ConnectionState state);

    SourceFactory factory_;
    ReconnectPolicy policy_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    ConnectionState state_{ConnectionState::Failed};
    bool opened_{false};
    bool stopping_{false};
    AudioFormat format_;
    std::unique_ptr<FrameSource> fresh_;               // opened by the worker, not yet in use
    FrameSource* connecting_{nullptr};                 // candidate inside open() on the worker
    StateCallback on_state_;

    std::unique_ptr<FrameSource> source_;              // used only by the read_raw() caller
    std::chrono::steady_clock::time_point last_data_;
    std::thread worker_;
    std::mt19937 rng_;
    std::atomic<unsigned> reconnects_{0};
};
