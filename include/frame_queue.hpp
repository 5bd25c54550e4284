#pragma once

#include "frame.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

constexpr std::size_t DEFAULT_QUEUE_CAPACITY = 5;

// Fixed capacity FIFO between the receive path and the broadcaster.
// push() never blocks: on overflow the oldest frame is evicted first.
class FrameQueue {
public:
    explicit FrameQueue(std::size_t capacity = DEFAULT_QUEUE_CAPACITY);

    // Returns true if an older frame was evicted to make room
    bool push(Frame frame);

    // Oldest frame, or nullopt after waiting timeout with the queue empty
    std::optional<Frame> pop(std::chrono::milliseconds timeout);

    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }
    uint64_t dropped() const { return dropped_.load(); }

private:
    const std::size_t capacity_;
    std::deque<Frame> frames_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::atomic<uint64_t> dropped_{0};
};
