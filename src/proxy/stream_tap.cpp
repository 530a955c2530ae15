#include "proxy/stream_tap.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <string>
#include <unistd.h>

namespace acptrace::proxy {

using core::errors::ErrorCategory;
using core::errors::ProxyError;

namespace {

constexpr int kPollIntervalMs = 50;
constexpr std::size_t kReadChunkSize = 8192;

std::string trim_end(std::string_view line) {
    std::size_t end = line.size();
    while (end > 0) {
        const char c = line[end - 1];
        if (c != '\n' && c != '\r' && c != ' ' && c != '\t') {
            break;
        }
        --end;
    }
    return std::string(line.substr(0, end));
}

std::string errno_text() {
    return std::string(std::strerror(errno));
}

// Forward first, tap second. A closed queue never affects forwarding.
core::errors::Result<std::size_t> forward_one(
    const int out_fd, const std::string_view line, const protocol::Direction direction,
    TapQueue& queue) {
    auto written = write_all(out_fd, line);
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }
    static_cast<void>(queue.push(TappedLine{direction, trim_end(line)}));
    return core::errors::get_value(written);
}

}  // namespace

core::errors::Result<std::size_t> write_all(const int fd, const std::string_view data) {
    std::size_t offset = 0;
    while (offset < data.size()) {
        const ssize_t n = write(fd, data.data() + offset, data.size() - offset);
        if (n > 0) {
            offset += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{fd, POLLOUT, 0};
            static_cast<void>(poll(&pfd, 1, kPollIntervalMs));
            continue;
        }
        return ProxyError{ErrorCategory::Io, "Write to downstream pipe failed: " + errno_text(),
                          "write_failed"};
    }
    return offset;
}

core::errors::Result<std::size_t> forward_lines(
    const int in_fd, const int out_fd, const protocol::Direction direction, TapQueue& queue,
    const std::shared_ptr<std::atomic_bool>& stop_token) {
    std::string pending;
    char buffer[kReadChunkSize];
    std::size_t lines = 0;

    while (true) {
        pollfd pfd{in_fd, POLLIN, 0};
        const int ready = poll(&pfd, 1, kPollIntervalMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return ProxyError{ErrorCategory::Io, "Polling upstream pipe failed: " + errno_text(),
                              "poll_failed"};
        }
        if (ready == 0) {
            if (stop_token && stop_token->load()) {
                break;
            }
            continue;
        }

        const ssize_t n = read(in_fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            return ProxyError{ErrorCategory::Io, "Read from upstream pipe failed: " + errno_text(),
                              "read_failed"};
        }
        if (n == 0) {
            break;
        }
        pending.append(buffer, static_cast<std::size_t>(n));

        std::size_t start = 0;
        std::size_t newline = pending.find('\n', start);
        while (newline != std::string::npos) {
            const std::string_view line(pending.data() + start, newline - start + 1);
            auto forwarded = forward_one(out_fd, line, direction, queue);
            if (core::errors::is_error(forwarded)) {
                return core::errors::get_error(forwarded);
            }
            ++lines;
            start = newline + 1;
            newline = pending.find('\n', start);
        }
        pending.erase(0, start);
    }

    // Unterminated tail at end-of-stream still goes through unchanged.
    if (!pending.empty()) {
        auto forwarded = forward_one(out_fd, pending, direction, queue);
        if (core::errors::is_error(forwarded)) {
            return core::errors::get_error(forwarded);
        }
        ++lines;
    }
    return lines;
}

}  // namespace acptrace::proxy
