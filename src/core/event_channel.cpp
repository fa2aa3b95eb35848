#include "core/event_channel.h"

#include <algorithm>

namespace chatgw {

EventChannel::EventChannel(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1)) {}

bool EventChannel::push(std::string event) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this]() { return closed_ || events_.size() < capacity_; });
    if (closed_) {
        return false;
    }
    events_.push_back(std::move(event));
    lock.unlock();
    not_empty_.notify_one();
    return true;
}

std::optional<std::string> EventChannel::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this]() { return closed_ || !events_.empty(); });
    if (events_.empty()) {
        return std::nullopt;
    }
    std::string event = std::move(events_.front());
    events_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return event;
}

void EventChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

bool EventChannel::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t EventChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

}  // namespace chatgw
