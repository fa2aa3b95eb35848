#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace chatgw {

/// Bounded FIFO between the upstream relay thread (producer) and the HTTP
/// response writer (consumer). Either side may close it: the producer when
/// the upstream stream has ended, the consumer when the caller went away.
class EventChannel {
public:
    explicit EventChannel(size_t capacity);

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    /// Blocks while the channel is full.
    /// @return false if the channel was closed; the event is dropped
    bool push(std::string event);

    /// Blocks while the channel is empty and open.
    /// @return next event, or std::nullopt once closed and drained
    std::optional<std::string> pop();

    void close();

    bool isClosed() const;
    size_t capacity() const { return capacity_; }
    size_t size() const;

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<std::string> events_;
    bool closed_{false};
};

}  // namespace chatgw
