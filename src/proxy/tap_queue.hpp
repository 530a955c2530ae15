#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include "protocol/acp_message.hpp"

namespace acptrace::proxy {

struct TappedLine {
    protocol::Direction direction;
    std::string line;
};

// Unbounded multi-producer / single-consumer queue between the forwarders
// and the correlator. Producers never block on it.
class TapQueue {
public:
    // Returns false once the queue is closed; the item is dropped.
    bool push(TappedLine item);

    // Blocks until an item is available. Returns nullopt only after close()
    // once every queued item has been handed out.
    std::optional<TappedLine> pop();

    void close();
    bool closed() const;
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<TappedLine> items_;
    bool closed_ = false;
};

}  // namespace acptrace::proxy
