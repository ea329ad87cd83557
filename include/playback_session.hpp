#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "framer.hpp"
#include "source_factory.hpp"

enum class SessionState {
    Idle,
    Starting,
    Active,
    Stopping,
};

const char* to_string(SessionState state);

// Binds one pipeline to one voice output. The transport calls read() once per
// frame period; stop() may come from any other thread.
class PlaybackSession {
public:
    using FinishedCallback = std::function<void(const std::string& reason)>;
    using StalledCallback = std::function<void(unsigned silent_frames)>;

    explicit PlaybackSession(const AudioSourceFactory& factory);
    ~PlaybackSession();

    PlaybackSession(const PlaybackSession&) = delete;
    PlaybackSession& operator=(const PlaybackSession&) = delete;

    // Builds and opens the pipeline. Returns false if one is already running.
    // ConfigurationError and SourceUnavailable propagate with the session
    // back in Idle.
    bool start(const std::string& descriptor);

    // Next frame, or std::nullopt once the pipeline has ended or was stopped.
    std::optional<std::vector<uint8_t>> read();

    // Returns after the source is closed. Waits for at most one in-flight read.
    void stop();

    // Releases the pipeline. Runs once per pipeline whichever path ends it;
    // later calls are no-ops.
    void cleanup();

    SessionState state() const { return state_.load(); }
    bool is_playing() const { return state() == SessionState::Active; }
    unsigned cleanups() const { return cleanups_.load(); }
    uint64_t frames_played() const { return frames_played_.load(); }
    std::string description() const;

    // Run on the thread that ended the pipeline, after cleanup.
    void set_finished_callback(FinishedCallback cb);
    void set_stalled_callback(StalledCallback cb);

private:
    void cleanup_locked();

    const AudioSourceFactory& factory_;

    mutable std::mutex mutex_;             // serializes read(), start() and stop()
    std::unique_ptr<Framer> framer_;
    std::string description_;
    bool stall_reported_{false};
    FinishedCallback on_finished_;
    StalledCallback on_stalled_;

    std::atomic<SessionState> state_{SessionState::Idle};
    std::atomic<bool> stop_requested_{false};
    std::atomic<unsigned> cleanups_{0};
    std::atomic<uint64_t> frames_played_{0};
};
