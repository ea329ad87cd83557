#include "playback_session.hpp"

#include <iostream>
#include <stdexcept>

#include "errors.hpp"

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Starting: return "starting";
        case SessionState::Active: return "active";
        case SessionState::Stopping: return "stopping";
    }
    return "unknown";
}

PlaybackSession::PlaybackSession(const AudioSourceFactory& factory) : factory_(factory) {}

PlaybackSession::~PlaybackSession() { stop(); }

bool PlaybackSession::start(const std::string& descriptor) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::Idle) {
        std::cerr << "[session] Already playing audio\n";
        return false;
    }

    state_ = SessionState::Starting;
    stop_requested_ = false;
    stall_reported_ = false;

    try {
        description_ = factory_.describe(descriptor);
        framer_ = factory_.create(descriptor);
    } catch (...) {
        state_ = SessionState::Idle;
        throw;
    }

    try {
        framer_->open();
    } catch (const std::exception& e) {
        std::cerr << "[session] Error: failed to start " << description_ << ": " << e.what() << "\n";
        cleanup_locked();
        throw;
    }

    state_ = SessionState::Active;
    std::cerr << "[session] Now playing " << description_ << "\n";
    return true;
}

std::optional<std::vector<uint8_t>> PlaybackSession::read() {
    if (stop_requested_) return std::nullopt;

    std::string reason;
    FinishedCallback finished;
    StalledCallback stalled;
    unsigned silent = 0;
    std::optional<std::vector<uint8_t>> frame;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Active || stop_requested_) return std::nullopt;

        try {
            frame = framer_->read();
            if (!frame) reason = "end of stream";
        } catch (const std::runtime_error& e) {
            std::cerr << "[session] Error: " << e.what() << "\n";
            reason = e.what();
        }

        if (frame) {
            ++frames_played_;
            if (framer_->stalled()) {
                if (!stall_reported_) {
                    stall_reported_ = true;
                    silent = framer_->consecutive_silent_frames();
                    std::cerr << "[session] Warning: no audio from " << description_ << " for " << silent
                              << " frames\n";
                    stalled = on_stalled_;
                }
            } else {
                stall_reported_ = false;
            }
        } else {
            state_ = SessionState::Stopping;
            cleanup_locked();
            finished = on_finished_;
        }
    }

    if (stalled) stalled(silent);
    if (finished) finished(reason);
    return frame;
}

void PlaybackSession::stop() {
    stop_requested_ = true;
    cleanup();
}

void PlaybackSession::cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!framer_) return;
    state_ = SessionState::Stopping;
    cleanup_locked();
}

void PlaybackSession::cleanup_locked() {
    if (!framer_) {
        state_ = SessionState::Idle;
        return;
    }
    framer_->close();
    framer_.reset();
    ++cleanups_;
    state_ = SessionState::Idle;
    std::cerr << "[session] Stopped " << description_ << "\n";
}

std::string PlaybackSession::description() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return description_;
}

void PlaybackSession::set_finished_callback(FinishedCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_finished_ = std::move(cb);
}

void PlaybackSession::set_stalled_callback(StalledCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_stalled_ = std::move(cb);
}
