#include "playback_session.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <stdlib.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <string>
#include <thread>
#include <vector>

#include "catch2/catch.hpp"
#include "errors.hpp"

namespace {

using std::chrono::milliseconds;

std::string scratch_path() {
    char name[] = "/tmp/loopcast-session-XXXXXX";
    int fd = ::mkstemp(name);
    REQUIRE(fd >= 0);
    ::close(fd);
    return name;
}

bool exists(const std::string& path) {
    struct stat st {};
    return ::stat(path.c_str(), &st) == 0 && st.st_size > 0;
}

} // namespace

TEST_CASE("playback session lifecycle", "[integration]") {
    FramerOptions options;
    options.max_silent_frames = 3;
    AudioSourceFactory factory({}, discord_voice_format(), ReconnectPolicy{}, options);
    PlaybackSession session(factory);
    REQUIRE(session.state() == SessionState::Idle);

    SECTION("a finite source plays out and finishes once") {
        const std::string path = scratch_path();
        {
            std::FILE* f = std::fopen(path.c_str(), "wb");
            REQUIRE(f != nullptr);
            const std::vector<uint8_t> pcm(3840 * 2 + 100, 0x10);
            REQUIRE(std::fwrite(pcm.data(), 1, pcm.size(), f) == pcm.size());
            std::fclose(f);
        }

        int finished = 0;
        std::string reason;
        session.set_finished_callback([&](const std::string& r) {
            ++finished;
            reason = r;
        });

        REQUIRE(session.start("file:" + path));
        REQUIRE(session.is_playing());
        REQUIRE(session.description() == "File: " + path);

        int frames = 0;
        while (auto frame = session.read()) {
            REQUIRE(frame->size() == 3840);
            ++frames;
            REQUIRE(frames < 10);
        }
        REQUIRE(frames == 3);
        REQUIRE(finished == 1);
        REQUIRE(reason == "end of stream");
        REQUIRE(session.state() == SessionState::Idle);
        REQUIRE(session.cleanups() == 1);

        REQUIRE_FALSE(session.read().has_value());
        session.stop();
        REQUIRE(session.cleanups() == 1);
        REQUIRE(finished == 1);
        std::remove(path.c_str());
    }

    SECTION("only one pipeline at a time") {
        REQUIRE(session.start("pipe:exec cat /dev/zero"));
        REQUIRE_FALSE(session.start("pipe:exec cat /dev/zero"));
        REQUIRE(session.is_playing());
        session.stop();
        REQUIRE(session.cleanups() == 1);

        // Stopped sessions can start again.
        REQUIRE(session.start("pipe:exec cat /dev/zero"));
        session.stop();
        REQUIRE(session.cleanups() == 2);
    }

    SECTION("configuration errors leave the session idle") {
        REQUIRE_THROWS_AS(session.start("device:4"), ConfigurationError);
        REQUIRE_THROWS_AS(session.start("nonsense"), ConfigurationError);
        REQUIRE(session.state() == SessionState::Idle);
        REQUIRE(session.cleanups() == 0);
    }

    SECTION("an unreachable source is cleaned up and rethrown") {
        REQUIRE_THROWS_AS(session.start("url:http://127.0.0.1:9/live"), SourceUnavailable);
        REQUIRE(session.state() == SessionState::Idle);
        REQUIRE(session.cleanups() == 1);
        REQUIRE_FALSE(session.read().has_value());
    }

    SECTION("stalls are reported once per episode") {
        std::atomic<int> stalls{0};
        session.set_stalled_callback([&](unsigned frames) {
            REQUIRE(frames == 3);
            ++stalls;
        });

        REQUIRE(session.start("pipe:head -c 100 /dev/zero; exec sleep 5"));
        for (int i = 0; i < 8; ++i) {
            auto frame = session.read();
            REQUIRE(frame.has_value());
            REQUIRE(frame->size() == 3840);
        }
        REQUIRE(stalls.load() == 1);
        session.stop();
    }
}

TEST_CASE("stopping an active session", "[integration]") {
    AudioSourceFactory factory({}, discord_voice_format());
    PlaybackSession session(factory);

    const std::string marker = scratch_path();
    const std::string command = "pipe:trap 'echo closed > " + marker +
                                "; exit 0' TERM; while :; do head -c 1920 /dev/zero; sleep 0.005; done";

    int finished = 0;
    session.set_finished_callback([&](const std::string&) { ++finished; });
    REQUIRE(session.start(command));

    std::atomic<bool> reading{true};
    std::atomic<int> frames{0};
    std::thread transport([&] {
        while (auto frame = session.read()) {
            ++frames;
            std::this_thread::sleep_for(milliseconds(5));
        }
        reading = false;
    });

    std::this_thread::sleep_for(milliseconds(100));
    REQUIRE(frames.load() > 0);

    const auto begin = std::chrono::steady_clock::now();
    session.stop();
    const auto took = std::chrono::steady_clock::now() - begin;
    transport.join();

    // One in-flight frame plus reaping the decoder.
    REQUIRE(took < milliseconds(20 + 50));
    REQUIRE_FALSE(reading.load());
    REQUIRE(session.state() == SessionState::Idle);
    REQUIRE(session.cleanups() == 1);
    REQUIRE(exists(marker));
    REQUIRE(finished == 0);

    session.stop();
    REQUIRE(session.cleanups() == 1);
    std::remove(marker.c_str());
}

TEST_CASE("stopping a decoder that ignores SIGTERM", "[integration]") {
    AudioSourceFactory factory({}, discord_voice_format());
    PlaybackSession session(factory);

    REQUIRE(session.start("pipe:trap '' TERM; while :; do head -c 1920 /dev/zero; sleep 0.01; done"));
    for (int i = 0; i < 5; ++i) REQUIRE(session.read().has_value());

    const auto begin = std::chrono::steady_clock::now();
    session.stop();
    const auto took = std::chrono::steady_clock::now() - begin;

    REQUIRE(took < milliseconds(500));
    REQUIRE(session.state() == SessionState::Idle);
    REQUIRE(session.cleanups() == 1);
}

TEST_CASE("cleanup is idempotent", "[integration]") {
    AudioSourceFactory factory({}, discord_voice_format());
    PlaybackSession session(factory);

    REQUIRE(session.start("pipe:exec cat /dev/zero"));
    auto frame = session.read();
    REQUIRE(frame.has_value());

    session.cleanup();
    session.cleanup();
    session.stop();
    REQUIRE(session.cleanups() == 1);
    REQUIRE(session.state() == SessionState::Idle);
    REQUIRE_FALSE(session.read().has_value());
}

TEST_CASE("stopping while the stream is reconnecting", "[integration]") {
    // Answers the first request with one frame of PCM and closes. Later
    // connections wait in the backlog and are never answered.
    int listener = ::socket(AF_INET, SOCK_STREAM, 0);
    REQUIRE(listener >= 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    REQUIRE(::bind(listener, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    REQUIRE(::listen(listener, 8) == 0);
    socklen_t len = sizeof(addr);
    REQUIRE(::getsockname(listener, reinterpret_cast<sockaddr*>(&addr), &len) == 0);

    std::thread server([listener] {
        int client = ::accept(listener, nullptr, nullptr);
        if (client < 0) return;
        char buf[1024];
        std::string request;
        while (request.find("\r\n\r\n") == std::string::npos) {
            ssize_t n = ::recv(client, buf, sizeof(buf), 0);
            if (n <= 0) break;
            request.append(buf, static_cast<std::size_t>(n));
        }
        const std::string response = "HTTP/1.0 200 OK\r\n\r\n" + std::string(3840, '\x01');
        ::send(client, response.data(), response.size(), MSG_NOSIGNAL);
        ::close(client);
    });

    ReconnectPolicy policy;
    policy.base_delay = milliseconds(10);
    policy.max_delay = milliseconds(10);
    AudioSourceFactory factory({}, discord_voice_format(), policy);
    PlaybackSession session(factory);
    REQUIRE(session.start("url:http://127.0.0.1:" + std::to_string(ntohs(addr.sin_port)) + "/live"));

    for (int i = 0; i < 20; ++i) {
        auto frame = session.read();
        REQUIRE(frame.has_value());
        REQUIRE(frame->size() == 3840);
    }

    const auto begin = std::chrono::steady_clock::now();
    session.stop();
    const auto took = std::chrono::steady_clock::now() - begin;

    server.join();
    ::close(listener);

    REQUIRE(took < milliseconds(100));
    REQUIRE(session.state() == SessionState::Idle);
    REQUIRE(session.cleanups() == 1);
}
