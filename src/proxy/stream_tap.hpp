#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <string_view>
#include "core/errors/proxy_errors.hpp"
#include "protocol/acp_message.hpp"
#include "proxy/tap_queue.hpp"

namespace acptrace::proxy {

// Copies `in_fd` to `out_fd` line by line. Each complete line is written
// downstream first, then a copy (trailing whitespace trimmed) is pushed onto
// `queue`. Returns the number of lines forwarded once the input reaches
// end-of-stream, or once `stop_token` is raised and the input is idle.
core::errors::Result<std::size_t> forward_lines(
    int in_fd, int out_fd, protocol::Direction direction, TapQueue& queue,
    const std::shared_ptr<std::atomic_bool>& stop_token = nullptr);

// Writes every byte of `data`, retrying short writes and EINTR.
core::errors::Result<std::size_t> write_all(int fd, std::string_view data);

}  // namespace acptrace::proxy
