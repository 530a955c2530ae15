#include "proxy/tap_queue.hpp"

#include <utility>

namespace acptrace::proxy {

bool TapQueue::push(TappedLine item) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        items_.push_back(std::move(item));
    }
    ready_.notify_one();
    return true;
}

std::optional<TappedLine> TapQueue::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    ready_.wait(lock, [this]() { return !items_.empty() || closed_; });
    if (items_.empty()) {
        return std::nullopt;
    }
    TappedLine item = std::move(items_.front());
    items_.pop_front();
    return item;
}

void TapQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    ready_.notify_all();
}

bool TapQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t TapQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

}  // namespace acptrace::proxy
