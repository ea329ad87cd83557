#include "local_file.hpp"

#include <signal.h>
#include <stdlib.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include "catch2/catch.hpp"
#include "errors.hpp"

namespace {

using std::chrono::milliseconds;

// Temporary file removed when the test ends.
class TempFile {
public:
    explicit TempFile(const std::vector<uint8_t>& contents) {
        char name[] = "/tmp/loopcast-test-XXXXXX";
        int fd = ::mkstemp(name);
        REQUIRE(fd >= 0);
        path_ = name;
        REQUIRE(::write(fd, contents.data(), contents.size()) == static_cast<ssize_t>(contents.size()));
        ::close(fd);
    }
    ~TempFile() { std::remove(path_.c_str()); }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

std::vector<uint8_t> wav_bytes(uint32_t rate, uint16_t channels, const std::vector<uint8_t>& data) {
    std::vector<uint8_t> out;
    auto u16 = [&](uint16_t v) {
        out.push_back(static_cast<uint8_t>(v));
        out.push_back(static_cast<uint8_t>(v >> 8));
    };
    auto u32 = [&](uint32_t v) {
        for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>(v >> (8 * i)));
    };
    auto tag = [&](const char* t) { out.insert(out.end(), t, t + 4); };

    tag("RIFF");
    u32(static_cast<uint32_t>(36 + data.size()));
    tag("WAVE");
    tag("fmt ");
    u32(16);
    u16(1);
    u16(channels);
    u32(rate);
    u32(rate * channels * 2);
    u16(static_cast<uint16_t>(channels * 2));
    u16(16);
    tag("data");
    u32(static_cast<uint32_t>(data.size()));
    out.insert(out.end(), data.begin(), data.end());
    return out;
}

// Reads until the end marker and returns everything that came before it.
std::vector<uint8_t> drain(LocalFile& file) {
    std::vector<uint8_t> all;
    for (int guard = 0; guard < 10000; ++guard) {
        auto chunk = file.read_raw(512, milliseconds(200));
        if (chunk.empty() && file.finished()) break;
        all.insert(all.end(), chunk.begin(), chunk.end());
    }
    return all;
}

} // namespace

TEST_CASE("local file end of stream", "[unit]") {
    SECTION("raw PCM: empty once at the end, then EndOfStream") {
        TempFile tmp(std::vector<uint8_t>(3000, 0x42));
        LocalFileConfig cfg;
        cfg.path = tmp.path();
        LocalFile file(cfg);
        file.open();

        REQUIRE(file.format() == discord_voice_format());
        const auto data = drain(file);
        REQUIRE(data.size() == 3000);
        REQUIRE(file.finished());
        REQUIRE_THROWS_AS(file.read_raw(512, milliseconds(10)), EndOfStream);
    }

    SECTION("wav header sets the format and bounds the data") {
        std::vector<uint8_t> bytes = wav_bytes(22050, 1, std::vector<uint8_t>(100, 0x33));
        // Trailing chunk after the data must not be played.
        bytes.insert(bytes.end(), {'L', 'I', 'S', 'T', 4, 0, 0, 0, 'x', 'x', 'x', 'x'});
        TempFile tmp(bytes);

        LocalFileConfig cfg;
        cfg.path = tmp.path();
        LocalFile file(cfg);
        file.open();

        REQUIRE(file.format().sample_rate == 22050);
        REQUIRE(file.format().channels == 1);
        REQUIRE(file.format().frame_duration_ms == 20);

        const auto data = drain(file);
        REQUIRE(data == std::vector<uint8_t>(100, 0x33));
        REQUIRE_THROWS_AS(file.read_raw(512, milliseconds(10)), EndOfStream);
    }

    SECTION("wav with an empty data chunk plays nothing of what follows") {
        std::vector<uint8_t> bytes = wav_bytes(48000, 2, {});
        bytes.insert(bytes.end(), {'L', 'I', 'S', 'T', 4, 0, 0, 0, 'x', 'x', 'x', 'x'});
        TempFile tmp(bytes);

        LocalFileConfig cfg;
        cfg.path = tmp.path();
        LocalFile file(cfg);
        file.open();

        REQUIRE(drain(file).empty());
        REQUIRE(file.finished());
    }

    SECTION("empty file ends immediately") {
        TempFile tmp({});
        LocalFileConfig cfg;
        cfg.path = tmp.path();
        LocalFile file(cfg);
        file.open();
        REQUIRE(file.read_raw(512, milliseconds(10)).empty());
        REQUIRE(file.finished());
    }
}

TEST_CASE("local file decoder process", "[unit]") {
    LocalFileConfig cfg;
    cfg.command = "head -c 5000 /dev/zero";
    LocalFile file(cfg);
    REQUIRE(file.describe() == "Decoder: head -c 5000 /dev/zero");

    file.open();
    REQUIRE(file.is_open());
    const auto data = drain(file);
    REQUIRE(data.size() == 5000);
    file.close();
    REQUIRE_FALSE(file.is_open());
}

TEST_CASE("local file close stops a decoder that ignores SIGTERM", "[unit]") {
    TempFile pidfile({});
    LocalFileConfig cfg;
    cfg.command = "echo $$ > " + pidfile.path() +
                  "; trap '' TERM; while :; do head -c 1920 /dev/zero; sleep 0.01; done";
    LocalFile file(cfg);
    file.open();
    for (int i = 0; i < 5; ++i) file.read_raw(1920, milliseconds(200));

    int pid = 0;
    std::ifstream(pidfile.path()) >> pid;
    REQUIRE(pid > 0);

    const auto begin = std::chrono::steady_clock::now();
    file.close();
    const auto took = std::chrono::steady_clock::now() - begin;

    REQUIRE(took < milliseconds(500));
    REQUIRE_FALSE(file.is_open());
    REQUIRE(::kill(pid, 0) == -1);
    REQUIRE(errno == ESRCH);
}

TEST_CASE("local file that does not exist", "[unit]") {
    LocalFileConfig cfg;
    cfg.path = "/nonexistent/loopcast/audio.wav";
    LocalFile file(cfg);
    REQUIRE_THROWS_AS(file.open(), SourceUnavailable);
    REQUIRE_FALSE(file.is_open());
}
