#include "reconnecting_reader.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

#include "errors.hpp"

namespace {
using Clock = std::chrono::steady_clock;
}

const char* to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Reconnecting: return "reconnecting";
        case ConnectionState::Failed: return "failed";
    }
    return "unknown";
}

std::chrono::milliseconds backoff_delay(const ReconnectPolicy& policy, unsigned attempt, double unit_random) {
    const double base = static_cast<double>(policy.base_delay.count());
    const double cap = static_cast<double>(policy.max_delay.count());
    const unsigned exponent = attempt > 0 ? std::min(attempt - 1, 30u) : 0u;

    double delay = std::min(base * std::pow(2.0, exponent), cap);
    delay *= 1.0 + policy.jitter * (2.0 * unit_random - 1.0);
    return std::chrono::milliseconds(static_cast<long long>(std::max(delay, 0.0)));
}

ReconnectingStreamReader::ReconnectingStreamReader(SourceFactory factory, const ReconnectPolicy& policy)
    : factory_(std::move(factory)), policy_(policy), rng_(std::random_device{}()) {
    if (!factory_) throw ConfigurationError("ReconnectingStreamReader requires a source factory");
}

ReconnectingStreamReader::~ReconnectingStreamReader() { close(); }

void ReconnectingStreamReader::open() {
    if (is_open()) return;

    std::unique_ptr<FrameSource> first = factory_();
    first->open();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        source_ = std::move(first);
        format_ = source_->format();
        state_ = ConnectionState::Connected;
        opened_ = true;
        stopping_ = false;
    }
    last_data_ = Clock::now();
    notify(ConnectionState::Connected);
}

std::vector<uint8_t> ReconnectingStreamReader::read_raw(std::size_t max_bytes, std::chrono::milliseconds timeout) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!opened_) throw SourceUnavailable("Stream reader is not open");
        if (state_ == ConnectionState::Reconnecting) {
            cv_.wait_for(lock, timeout, [&] { return state_ != ConnectionState::Reconnecting || stopping_; });
        }
        if (state_ == ConnectionState::Failed) {
            throw SourceUnavailable("Stream reader gave up reconnecting");
        }
        if (state_ == ConnectionState::Reconnecting) return {};
    }

    adopt_fresh_source();

    std::vector<uint8_t> chunk;
    try {
        chunk = source_->read_raw(max_bytes, timeout);
    } catch (const std::runtime_error& e) {
        begin_reconnect(std::string("connection lost: ") + e.what());
        return {};
    }

    const auto now = Clock::now();
    if (!chunk.empty()) {
        last_data_ = now;
        return chunk;
    }

    if (source_->finished()) {
        begin_reconnect("stream ended");
    } else if (now - last_data_ > policy_.stall_timeout) {
        begin_reconnect("no data for " + std::to_string(policy_.stall_timeout.count()) + " ms");
    }
    return chunk;
}

void ReconnectingStreamReader::adopt_fresh_source() {
    std::unique_ptr<FrameSource> fresh;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!fresh_) return;
        fresh = std::move(fresh_);
        format_ = fresh->format();
    }
    if (source_) source_->close();
    source_ = std::move(fresh);
    last_data_ = Clock::now();
}

void ReconnectingStreamReader::begin_reconnect(const std::string& reason) {
    std::cerr << "[reconnect] " << reason << "; reconnecting\n";
    if (source_) source_->close();

    // A previous worker has finished once the state went back to Connected.
    if (worker_.joinable()) worker_.join();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        state_ = ConnectionState::Reconnecting;
    }
    notify(ConnectionState::Reconnecting);
    worker_ = std::thread(&ReconnectingStreamReader::reconnect_loop, this);
}

void ReconnectingStreamReader::reconnect_loop() {
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    for (unsigned attempt = 1;; ++attempt) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) return;
        }

        try {
            std::unique_ptr<FrameSource> candidate = factory_();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (stopping_) return;
                connecting_ = candidate.get();
            }
            try {
                candidate->open();
            } catch (...) {
                std::lock_guard<std::mutex> lock(mutex_);
                connecting_ = nullptr;
                throw;
            }

            std::unique_lock<std::mutex> lock(mutex_);
            connecting_ = nullptr;
            if (stopping_) {
                lock.unlock();
                candidate->close();
                return;
            }
            fresh_ = std::move(candidate);
            state_ = ConnectionState::Connected;
            ++reconnects_;
            lock.unlock();
            cv_.notify_all();

            std::cerr << "[reconnect] Reconnected after " << attempt << " attempt(s)\n";
            notify(ConnectionState::Connected);
            return;
        } catch (const std::exception& e) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (stopping_) return;
            }
            std::cerr << "[reconnect] Attempt " << attempt << " failed: " << e.what() << "\n";
        }

        if (policy_.max_attempts > 0 && attempt >= policy_.max_attempts) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (stopping_) return;
                state_ = ConnectionState::Failed;
            }
            cv_.notify_all();
            std::cerr << "[reconnect] Giving up after " << attempt << " attempts\n";
            notify(ConnectionState::Failed);
            return;
        }

        const auto delay = backoff_delay(policy_, attempt, unit(rng_));
        std::unique_lock<std::mutex> lock(mutex_);
        if (cv_.wait_for(lock, delay, [&] { return stopping_; })) return;
    }
}

void ReconnectingStreamReader::close() {
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!opened_ && !worker_.joinable() && !source_ && !fresh_) return;
        stopping_ = true;
        // An attempt blocked in open() would otherwise hold up the join.
        if (connecting_) connecting_->cancel();
        changed = state_ != ConnectionState::Failed;
        state_ = ConnectionState::Failed;
        opened_ = false;
    }
    cv_.notify_all();

    if (worker_.joinable()) worker_.join();

    if (source_) {
        source_->close();
        source_.reset();
    }
    std::unique_ptr<FrameSource> fresh;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fresh = std::move(fresh_);
    }
    if (fresh) fresh->close();

    if (changed) notify(ConnectionState::Failed);
}

AudioFormat ReconnectingStreamReader::format() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return format_;
}

bool ReconnectingStreamReader::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return opened_;
}

ConnectionState ReconnectingStreamReader::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void ReconnectingStreamReader::set_state_callback(StateCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_state_ = std::move(cb);
}

void ReconnectingStreamReader::notify(ConnectionState state) {
    StateCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cb = on_state_;
    }
    if (cb) cb(state);
}
