#include "reconnecting_reader.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "catch2/catch.hpp"
#include "errors.hpp"
#include "fake_source.hpp"
#include "framer.hpp"

namespace {

using std::chrono::milliseconds;

class StateLog {
public:
    void record(ConnectionState state) {
        std::lock_guard<std::mutex> lock(mutex_);
        states_.push_back(state);
    }
    std::vector<ConnectionState> states() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return states_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<ConnectionState> states_;
};

ReconnectPolicy fast_policy() {
    ReconnectPolicy policy;
    policy.base_delay = milliseconds(5);
    policy.max_delay = milliseconds(20);
    policy.jitter = 0.0;
    policy.stall_timeout = milliseconds(5000);
    return policy;
}

// Reads until data arrives or the deadline passes.
std::vector<uint8_t> read_some(FrameSource& source, milliseconds within) {
    const auto deadline = std::chrono::steady_clock::now() + within;
    while (std::chrono::steady_clock::now() < deadline) {
        auto chunk = source.read_raw(4096, milliseconds(20));
        if (!chunk.empty()) return chunk;
    }
    return {};
}

} // namespace

TEST_CASE("backoff delay grows exponentially up to the cap", "[unit]") {
    ReconnectPolicy policy;

    REQUIRE(backoff_delay(policy, 1, 0.5) == milliseconds(500));
    REQUIRE(backoff_delay(policy, 2, 0.5) == milliseconds(1000));
    REQUIRE(backoff_delay(policy, 4, 0.5) == milliseconds(4000));
    REQUIRE(backoff_delay(policy, 10, 0.5) == milliseconds(30000));
    REQUIRE(backoff_delay(policy, 1000, 0.5) == milliseconds(30000));

    SECTION("jitter spreads the delay both ways") {
        REQUIRE(backoff_delay(policy, 1, 0.0) == milliseconds(400));
        REQUIRE(backoff_delay(policy, 1, 1.0) == milliseconds(600));
    }
}

TEST_CASE("reader recovers from dropped connections", "[unit]") {
    const AudioFormat fmt = discord_voice_format();
    std::atomic<int> created{0};
    const int failures = 3;

    // Source 0 plays then drops; the next `failures` refuse to open; the
    // one after that plays again.
    auto factory = [&]() -> std::unique_ptr<FrameSource> {
        const int n = created++;
        auto source = std::make_unique<FakeSource>(fmt);
        if (n == 0) {
            source->push(std::vector<uint8_t>(100, 0xA1));
            source->push_drop();
        } else if (n <= failures) {
            source->set_fail_open(true);
        } else {
            source->push(std::vector<uint8_t>(100, 0xB2));
        }
        return source;
    };

    StateLog log;
    ReconnectingStreamReader reader(factory, fast_policy());
    reader.set_state_callback([&](ConnectionState s) { log.record(s); });
    reader.open();
    REQUIRE(reader.state() == ConnectionState::Connected);

    REQUIRE(reader.read_raw(4096, milliseconds(20)) == std::vector<uint8_t>(100, 0xA1));

    // The drop is absorbed: an empty chunk, not an exception.
    REQUIRE(reader.read_raw(4096, milliseconds(20)).empty());

    REQUIRE(read_some(reader, milliseconds(2000)) == std::vector<uint8_t>(100, 0xB2));
    REQUIRE(reader.state() == ConnectionState::Connected);
    REQUIRE(reader.reconnects() == 1);
    REQUIRE(created.load() == failures + 2);

    const auto states = log.states();
    REQUIRE(states.size() == 3);
    REQUIRE(states[0] == ConnectionState::Connected);
    REQUIRE(states[1] == ConnectionState::Reconnecting);
    REQUIRE(states[2] == ConnectionState::Connected);

    reader.close();
    REQUIRE(reader.state() == ConnectionState::Failed);
    REQUIRE_FALSE(reader.is_open());
}

TEST_CASE("framer never sees a connection error behind the reader", "[unit]") {
    const AudioFormat fmt = discord_voice_format();
    std::atomic<int> created{0};
    auto factory = [&]() -> std::unique_ptr<FrameSource> {
        auto source = std::make_unique<FakeSource>(fmt);
        // Every connection delivers a frame and a half, then drops.
        source->push(ramp_bytes(5760));
        source->push_drop();
        ++created;
        return source;
    };

    auto reader = std::make_unique<ReconnectingStreamReader>(factory, fast_policy());
    ReconnectingStreamReader* raw = reader.get();
    Framer framer(std::move(reader), fmt);
    framer.open();

    for (int i = 0; i < 12; ++i) {
        std::optional<std::vector<uint8_t>> frame;
        REQUIRE_NOTHROW(frame = framer.read());
        REQUIRE(frame.has_value());
        REQUIRE(frame->size() == 3840);
    }
    REQUIRE(raw->reconnects() >= 1);
    REQUIRE(created.load() >= 2);
}

TEST_CASE("reader gives up after the attempt limit", "[unit]") {
    const AudioFormat fmt = discord_voice_format();
    std::atomic<int> created{0};
    auto factory = [&]() -> std::unique_ptr<FrameSource> {
        auto source = std::make_unique<FakeSource>(fmt);
        if (created++ == 0) {
            source->push_drop();
        } else {
            source->set_fail_open(true);
        }
        return source;
    };

    ReconnectPolicy policy = fast_policy();
    policy.max_attempts = 2;
    ReconnectingStreamReader reader(factory, policy);
    reader.open();

    REQUIRE(reader.read_raw(4096, milliseconds(10)).empty());

    bool gave_up = false;
    for (int i = 0; i < 200 && !gave_up; ++i) {
        try {
            reader.read_raw(4096, milliseconds(10));
        } catch (const SourceUnavailable&) {
            gave_up = true;
        }
    }
    REQUIRE(gave_up);
    REQUIRE(reader.state() == ConnectionState::Failed);
    REQUIRE(created.load() == 3);
}

TEST_CASE("reader treats a silent connection as stalled", "[unit]") {
    const AudioFormat fmt = discord_voice_format();
    std::atomic<int> created{0};
    auto factory = [&]() -> std::unique_ptr<FrameSource> {
        auto source = std::make_unique<FakeSource>(fmt);
        if (created++ > 0) source->push(std::vector<uint8_t>(8, 0x01));
        return source;
    };

    ReconnectPolicy policy = fast_policy();
    policy.stall_timeout = milliseconds(60);
    ReconnectingStreamReader reader(factory, policy);
    reader.open();

    REQUIRE(read_some(reader, milliseconds(2000)) == std::vector<uint8_t>(8, 0x01));
    REQUIRE(reader.reconnects() == 1);
}

TEST_CASE("reader propagates a failed first connection", "[unit]") {
    auto factory = []() -> std::unique_ptr<FrameSource> {
        auto source = std::make_unique<FakeSource>(discord_voice_format());
        source->set_fail_open(true);
        return source;
    };
    ReconnectingStreamReader reader(factory, fast_policy());
    REQUIRE_THROWS_AS(reader.open(), SourceUnavailable);
    REQUIRE_FALSE(reader.is_open());
    REQUIRE_THROWS_AS(reader.read_raw(16, milliseconds(10)), SourceUnavailable);
}

TEST_CASE("closing interrupts the backoff wait", "[unit]") {
    std::atomic<int> created{0};
    auto factory = [&]() -> std::unique_ptr<FrameSource> {
        auto source = std::make_unique<FakeSource>(discord_voice_format());
        if (created++ == 0) {
            source->push_drop();
        } else {
            source->set_fail_open(true);
        }
        return source;
    };

    ReconnectPolicy policy;
    policy.base_delay = milliseconds(10000);
    policy.max_delay = milliseconds(10000);
    policy.jitter = 0.0;
    ReconnectingStreamReader reader(factory, policy);
    reader.open();
    REQUIRE(reader.read_raw(4096, milliseconds(10)).empty());
    REQUIRE(reader.state() == ConnectionState::Reconnecting);

    const auto begin = std::chrono::steady_clock::now();
    reader.close();
    REQUIRE(std::chrono::steady_clock::now() - begin < milliseconds(1000));
    REQUIRE(reader.state() == ConnectionState::Failed);
}

TEST_CASE("closing cancels an attempt stuck in open", "[unit]") {
    auto hung = std::make_shared<FakeSourceState>();
    std::atomic<int> created{0};
    auto factory = [&]() -> std::unique_ptr<FrameSource> {
        if (created++ == 0) {
            auto source = std::make_unique<FakeSource>(discord_voice_format());
            source->push_drop();
            return source;
        }
        auto source = std::make_unique<FakeSource>(discord_voice_format(), hung);
        source->set_hang_open(true);
        return source;
    };

    ReconnectingStreamReader reader(factory, fast_policy());
    reader.open();
    REQUIRE(reader.read_raw(4096, milliseconds(10)).empty());
    REQUIRE(reader.state() == ConnectionState::Reconnecting);

    // Let the worker get inside the hanging open().
    for (int i = 0; i < 100 && created.load() < 2; ++i) std::this_thread::sleep_for(milliseconds(5));
    std::this_thread::sleep_for(milliseconds(20));

    const auto begin = std::chrono::steady_clock::now();
    reader.close();
    REQUIRE(std::chrono::steady_clock::now() - begin < milliseconds(200));
    REQUIRE(hung->cancels.load() == 1);
    REQUIRE(reader.state() == ConnectionState::Failed);
    REQUIRE(reader.reconnects() == 0);
}
