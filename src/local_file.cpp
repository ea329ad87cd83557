#include "local_file.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <iostream>

#include "errors.hpp"
#include "wav_header.hpp"

namespace {

// How long open() waits for a decoder to produce its first bytes.
constexpr std::chrono::milliseconds kHeaderTimeout{5000};
constexpr std::size_t kProbeBytes = 4096;
constexpr std::size_t kMaxHeaderBytes = 64 * 1024;
// Time a decoder gets to exit on SIGTERM before the group is killed.
constexpr std::chrono::milliseconds kDecoderGrace{50};

std::string errno_message(const std::string& context) {
    return context + ": " + std::strerror(errno);
}

} // namespace

LocalFile::LocalFile(const LocalFileConfig& cfg) : cfg_(cfg), format_(cfg.format) {}

LocalFile::~LocalFile() { close(); }

std::string LocalFile::describe() const {
    return cfg_.command.empty() ? "File: " + cfg_.path : "Decoder: " + cfg_.command;
}

void LocalFile::open() {
    if (fd_ >= 0) return;

    if (!cfg_.command.empty()) {
        spawn_decoder();
    } else {
        fd_ = ::open(cfg_.path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd_ < 0) {
            throw SourceUnavailable(errno_message("Cannot open " + cfg_.path));
        }
    }

    try {
        read_header();
    } catch (...) {
        close();
        throw;
    }
    std::cerr << "[file] Opened " << describe() << " (" << format_.describe() << ")\n";
}

void LocalFile::spawn_decoder() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) < 0) {
        throw SourceUnavailable(errno_message("pipe"));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(fds[0]);
        ::close(fds[1]);
        throw SourceUnavailable(errno_message("fork"));
    }

    if (pid == 0) {
        // Own process group, so close() reaches the whole pipeline.
        ::setpgid(0, 0);
        ::dup2(fds[1], STDOUT_FILENO);
        ::execl("/bin/sh", "sh", "-c", cfg_.command.c_str(), static_cast<char*>(nullptr));
        ::_exit(127);
    }

    // Also set from the parent; whichever runs first wins the race with kill().
    ::setpgid(pid, pid);
    ::close(fds[1]);
    fd_ = fds[0];
    child_ = pid;
}

void LocalFile::read_header() {
    std::vector<uint8_t> probe;
    WavHeader header;
    header.format = cfg_.format;

    while (!eof_ && probe.size() < kMaxHeaderBytes) {
        const std::size_t offset = probe.size();
        probe.resize(offset + kProbeBytes);
        const std::size_t n = fill(probe.data() + offset, kProbeBytes, kHeaderTimeout);
        probe.resize(offset + n);
        if (n == 0 && !eof_) {
            throw SourceUnavailable("Timed out waiting for data from " + describe());
        }

        const WavParse result = parse_wav_header(probe.data(), probe.size(), header);
        if (result == WavParse::NotWav) {
            pending_ = std::move(probe);
            return;
        }
        if (result == WavParse::Unsupported) {
            throw SourceUnavailable("Unsupported WAV format in " + describe());
        }
        if (result == WavParse::Ok) {
            format_ = header.format;
            format_.frame_duration_ms = cfg_.format.frame_duration_ms;
            pending_.assign(probe.begin() + static_cast<std::ptrdiff_t>(std::min(header.data_offset, probe.size())),
                            probe.end());
            if (header.sized) {
                limited_ = true;
                if (pending_.size() > header.data_size) pending_.resize(header.data_size);
                remaining_ = header.data_size - pending_.size();
            }
            return;
        }
    }

    if (looks_like_wav(probe.data(), probe.size()) || probe.size() >= kMaxHeaderBytes) {
        throw SourceUnavailable("Truncated WAV header in " + describe());
    }
    // Short raw input.
    pending_ = std::move(probe);
}

std::size_t LocalFile::fill(uint8_t* dest, std::size_t max_bytes, std::chrono::milliseconds timeout) {
    pollfd pfd{fd_, POLLIN, 0};
    int ready = ::poll(&pfd, 1, static_cast<int>(std::max<std::chrono::milliseconds::rep>(timeout.count(), 0)));
    if (ready == 0) return 0;
    if (ready < 0) {
        if (errno == EINTR) return 0;
        throw SourceUnavailable(errno_message("poll " + describe()));
    }

    ssize_t n = ::read(fd_, dest, max_bytes);
    if (n == 0) {
        eof_ = true;
        return 0;
    }
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) return 0;
        throw SourceUnavailable(errno_message("read " + describe()));
    }
    return static_cast<std::size_t>(n);
}

std::vector<uint8_t> LocalFile::read_raw(std::size_t max_bytes, std::chrono::milliseconds timeout) {
    if (finished_) {
        throw EndOfStream(describe() + " has already ended");
    }
    if (fd_ < 0) {
        throw SourceUnavailable(describe() + " is not open");
    }
    if (max_bytes == 0) return {};

    std::vector<uint8_t> out;
    if (!pending_.empty()) {
        const std::size_t take = std::min(max_bytes, pending_.size());
        out.assign(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(take));
        pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(take));
        return out;
    }

    if (eof_ || (limited_ && remaining_ == 0)) {
        finished_ = true;
        std::cerr << "[file] End of stream: " << describe() << "\n";
        return out;
    }

    const std::size_t cap = limited_ ? std::min(max_bytes, remaining_) : max_bytes;
    out.resize(cap);
    const std::size_t n = fill(out.data(), cap, timeout);
    out.resize(n);
    if (limited_) remaining_ -= n;

    if (n == 0 && eof_) {
        finished_ = true;
        std::cerr << "[file] End of stream: " << describe() << "\n";
    }
    return out;
}

void LocalFile::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    if (child_ > 0) {
        // The decoder may still be producing output; it has no reader now.
        ::kill(-child_, SIGTERM);
        int status = 0;
        pid_t reaped = 0;
        const auto give_up = std::chrono::steady_clock::now() + kDecoderGrace;
        while ((reaped = ::waitpid(child_, &status, WNOHANG)) == 0 && std::chrono::steady_clock::now() < give_up) {
            ::usleep(2000);
        }
        if (reaped == 0) {
            std::cerr << "[file] Warning: decoder ignored SIGTERM; killing it\n";
            ::kill(-child_, SIGKILL);
            reaped = ::waitpid(child_, &status, 0);
        }
        if (reaped == child_ && WIFEXITED(status) && WEXITSTATUS(status) != 0) {
            std::cerr << "[file] Warning: decoder exited with status " << WEXITSTATUS(status) << "\n";
        }
        child_ = -1;
    }
}
