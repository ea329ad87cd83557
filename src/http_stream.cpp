#include "http_stream.hpp"

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>

#include "errors.hpp"
#include "wav_header.hpp"

namespace {

using Clock = std::chrono::steady_clock;

constexpr int kMaxRedirects = 5;
constexpr std::size_t kMaxHeaderBytes = 16 * 1024;
constexpr std::size_t kMaxPreambleBytes = 64 * 1024;

std::string errno_message(const std::string& context) {
    return context + ": " + std::strerror(errno);
}

int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return {};
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

// Waits for fd to become ready for events, bounded by deadline. Throws
// SourceUnavailable as soon as cancel_fd is signalled.
bool wait_for(int fd, short events, Clock::time_point deadline, int cancel_fd) {
    for (;;) {
        pollfd pfds[2] = {{fd, events, 0}, {cancel_fd, POLLIN, 0}};
        int ready = ::poll(pfds, 2, remaining_ms(deadline));
        if (ready > 0) {
            if (pfds[1].revents & POLLIN) throw SourceUnavailable("Connection attempt cancelled");
            return true;
        }
        if (ready == 0) return false;
        if (errno != EINTR) return false;
    }
}

int connect_to(const StreamUrl& url, Clock::time_point deadline, int cancel_fd) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* results = nullptr;
    const std::string port = std::to_string(url.port);
    int err = ::getaddrinfo(url.host.c_str(), port.c_str(), &hints, &results);
    if (err != 0) {
        throw SourceUnavailable("Cannot resolve " + url.host + ": " + ::gai_strerror(err));
    }

    std::string last_error = "no addresses";
    int fd = -1;
    for (addrinfo* ai = results; ai; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_error = std::strerror(errno);
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) break;

        bool writable = false;
        if (errno == EINPROGRESS) {
            try {
                writable = wait_for(fd, POLLOUT, deadline, cancel_fd);
            } catch (...) {
                ::close(fd);
                ::freeaddrinfo(results);
                throw;
            }
        }
        if (writable) {
            int so_error = 0;
            socklen_t len = sizeof(so_error);
            ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
            if (so_error == 0) break;
            last_error = std::strerror(so_error);
        } else {
            last_error = errno == EINPROGRESS ? "connect timed out" : std::strerror(errno);
        }
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(results);

    if (fd < 0) {
        throw SourceUnavailable("Cannot connect to " + url.host + ":" + port + ": " + last_error);
    }
    return fd;
}

void send_all(int fd, const std::string& data, Clock::time_point deadline, int cancel_fd) {
    std::size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EINTR)) {
            if (!wait_for(fd, POLLOUT, deadline, cancel_fd)) throw SourceUnavailable("Timed out sending request");
            continue;
        }
        throw SourceUnavailable(errno_message("send"));
    }
}

// Reads up to the blank line that ends the response headers. Anything read
// past it is returned in body.
std::string read_headers(int fd, Clock::time_point deadline, int cancel_fd, std::vector<uint8_t>& body) {
    std::string head;
    char buf[2048];
    for (;;) {
        const auto end = head.find("\r\n\r\n");
        if (end != std::string::npos) {
            body.assign(head.begin() + static_cast<std::ptrdiff_t>(end + 4), head.end());
            head.resize(end);
            return head;
        }
        if (head.size() > kMaxHeaderBytes) throw SourceUnavailable("Response headers too large");
        if (!wait_for(fd, POLLIN, deadline, cancel_fd)) throw SourceUnavailable("Timed out waiting for response");

        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n == 0) throw SourceUnavailable("Server closed the connection before responding");
        if (n < 0) {
            if (errno == EAGAIN || errno == EINTR) continue;
            throw SourceUnavailable(errno_message("recv"));
        }
        head.append(buf, static_cast<std::size_t>(n));
    }
}

std::string header_value(const std::string& head, const std::string& name) {
    std::istringstream lines(head);
    std::string line;
    const std::string wanted = lower(name) + ":";
    while (std::getline(lines, line)) {
        if (lower(line.substr(0, wanted.size())) == wanted) {
            return trim(line.substr(wanted.size()));
        }
    }
    return {};
}

bool is_compressed(const std::string& content_type) {
    static const char* const kCompressed[] = {"audio/mpeg", "audio/aac", "audio/aacp", "audio/ogg",
                                              "application/ogg", "audio/opus", "audio/flac"};
    const std::string type = lower(content_type);
    for (const char* c : kCompressed) {
        if (type.rfind(c, 0) == 0) return true;
    }
    return false;
}

} // namespace

StreamUrl parse_stream_url(const std::string& url) {
    const std::string scheme = "http://";
    if (lower(url.substr(0, scheme.size())) != scheme) {
        throw ConfigurationError("Unsupported stream URL (expected http://): " + url);
    }

    StreamUrl out;
    std::string rest = url.substr(scheme.size());
    const auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) out.path = rest.substr(slash);

    const auto at = authority.rfind('@');
    if (at != std::string::npos) authority = authority.substr(at + 1);

    std::string port;
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string::npos) throw ConfigurationError("Malformed IPv6 host in URL: " + url);
        out.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') throw ConfigurationError("Malformed host in URL: " + url);
            port = authority.substr(close + 2);
        }
    } else {
        const auto colon = authority.find(':');
        out.host = authority.substr(0, colon);
        if (colon != std::string::npos) port = authority.substr(colon + 1);
    }

    if (out.host.empty()) throw ConfigurationError("Missing host in URL: " + url);
    if (!port.empty()) {
        if (port.size() > 5 || !std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c); })) {
            throw ConfigurationError("Invalid port in URL: " + url);
        }
        const unsigned long value = std::stoul(port);
        if (value == 0 || value > 65535) throw ConfigurationError("Invalid port in URL: " + url);
        out.port = static_cast<uint16_t>(value);
    }
    return out;
}

RemoteURLStream::RemoteURLStream(const HttpStreamConfig& cfg) : cfg_(cfg), format_(cfg.format) {
    cancel_fd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (cancel_fd_ < 0) throw SourceUnavailable(errno_message("eventfd"));
}

RemoteURLStream::~RemoteURLStream() {
    close();
    ::close(cancel_fd_);
}

void RemoteURLStream::cancel() {
    const uint64_t one = 1;
    if (::write(cancel_fd_, &one, sizeof(one)) < 0 && errno != EAGAIN) {
        std::cerr << "[stream] Warning: " << errno_message("cancel " + cfg_.url) << "\n";
    }
}

void RemoteURLStream::open() {
    if (fd_ >= 0) return;

    const auto deadline = Clock::now() + cfg_.connect_timeout;
    try {
        connect(cfg_.url, deadline, 0);
        probe_body(deadline);
    } catch (const ConfigurationError& e) {
        close();
        throw SourceUnavailable(e.what());
    } catch (...) {
        close();
        throw;
    }
    std::cerr << "[stream] Connected to " << cfg_.url << " (" << format_.describe() << ")\n";
}

void RemoteURLStream::connect(const std::string& url, Clock::time_point deadline, int redirects) {
    const StreamUrl parsed = parse_stream_url(url);
    fd_ = connect_to(parsed, deadline, cancel_fd_);

    std::ostringstream request;
    request << "GET " << parsed.path << " HTTP/1.0\r\n"
            << "Host: " << parsed.host << "\r\n"
            << "User-Agent: loopcast\r\n"
            << "Accept: */*\r\n"
            << "Icy-MetaData: 0\r\n"
            << "Connection: close\r\n\r\n";
    send_all(fd_, request.str(), deadline, cancel_fd_);

    const std::string head = read_headers(fd_, deadline, cancel_fd_, pending_);
    const std::string status_line = trim(head.substr(0, head.find("\r\n")));

    // "HTTP/1.1 200 OK" or Shoutcast's "ICY 200 OK".
    const auto space = status_line.find(' ');
    int status = 0;
    if (space != std::string::npos) {
        status = std::atoi(status_line.c_str() + space + 1);
    }

    if (status >= 300 && status < 400) {
        const std::string location = header_value(head, "Location");
        ::close(fd_);
        fd_ = -1;
        pending_.clear();
        if (location.empty() || redirects >= kMaxRedirects) {
            throw SourceUnavailable("Bad redirect from " + url + ": " + status_line);
        }
        std::string next = location;
        if (next.front() == '/') {
            next = "http://" + parsed.host + ":" + std::to_string(parsed.port) + location;
        }
        std::cerr << "[stream] Redirected to " << next << "\n";
        connect(next, deadline, redirects + 1);
        return;
    }

    if (status < 200 || status >= 300) {
        throw SourceUnavailable("Stream " + url + " returned \"" + status_line + "\"");
    }

    const std::string content_type = header_value(head, "Content-Type");
    if (is_compressed(content_type)) {
        throw SourceUnavailable("Stream " + url + " is " + content_type +
                                "; use a pipe: decoder source for compressed streams");
    }
}

void RemoteURLStream::probe_body(Clock::time_point deadline) {
    WavHeader header;
    for (;;) {
        const WavParse result = parse_wav_header(pending_.data(), pending_.size(), header);
        if (result == WavParse::NotWav) return;
        if (result == WavParse::Unsupported) throw SourceUnavailable("Unsupported WAV format from " + cfg_.url);
        if (result == WavParse::Ok) {
            format_ = header.format;
            format_.frame_duration_ms = cfg_.format.frame_duration_ms;
            pending_.erase(pending_.begin(),
                           pending_.begin() + static_cast<std::ptrdiff_t>(std::min(header.data_offset, pending_.size())));
            return;
        }
        if (pending_.size() > kMaxPreambleBytes) throw SourceUnavailable("Truncated WAV header from " + cfg_.url);

        // Need more of the preamble before the first read_raw.
        if (!wait_for(fd_, POLLIN, deadline, cancel_fd_)) throw SourceUnavailable("Timed out reading stream header");
        uint8_t buf[2048];
        ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
        if (n == 0) throw SourceUnavailable("Server closed the stream during the header");
        if (n < 0) {
            if (errno == EAGAIN || errno == EINTR) continue;
            throw SourceUnavailable(errno_message("recv"));
        }
        pending_.insert(pending_.end(), buf, buf + n);
    }
}

std::vector<uint8_t> RemoteURLStream::read_raw(std::size_t max_bytes, std::chrono::milliseconds timeout) {
    if (fd_ < 0) throw ConnectionLost("Stream " + cfg_.url + " is not connected");
    if (max_bytes == 0) return {};

    std::vector<uint8_t> out;
    if (!pending_.empty()) {
        const std::size_t take = std::min(max_bytes, pending_.size());
        out.assign(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(take));
        pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(take));
        return out;
    }

    pollfd pfds[2] = {{fd_, POLLIN, 0}, {cancel_fd_, POLLIN, 0}};
    int ready = ::poll(pfds, 2, static_cast<int>(std::max<std::chrono::milliseconds::rep>(timeout.count(), 0)));
    if (ready == 0 || (ready > 0 && !(pfds[0].revents & (POLLIN | POLLHUP | POLLERR)))) return out;
    if (ready < 0) {
        if (errno == EINTR) return out;
        throw ConnectionLost(errno_message("poll " + cfg_.url));
    }

    out.resize(max_bytes);
    ssize_t n = ::recv(fd_, out.data(), max_bytes, 0);
    if (n == 0) throw ConnectionLost("Server closed stream " + cfg_.url);
    if (n < 0) {
        if (errno == EAGAIN || errno == EINTR) return {};
        throw ConnectionLost(errno_message("recv " + cfg_.url));
    }
    out.resize(static_cast<std::size_t>(n));
    return out;
}

void RemoteURLStream::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    pending_.clear();
}
