#include "frame_queue.hpp"
#include <stdexcept>

FrameQueue::FrameQueue(std::size_t capacity)
    : capacity_(capacity) {
    if (capacity_ == 0)
        throw std::invalid_argument("[QUEUE] capacity must be positive");
}

bool FrameQueue::push(Frame frame) {
    bool evicted = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (frames_.size() >= capacity_) {
            frames_.pop_front();
            dropped_++;
            evicted = true;
        }
        frames_.push_back(std::move(frame));
    }
    not_empty_.notify_one();
    return evicted;
}

std::optional<Frame> FrameQueue::pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!not_empty_.wait_for(lock, timeout, [this] { return !frames_.empty(); }))
        return std::nullopt;

    Frame frame = std::move(frames_.front());
    frames_.pop_front();
    return frame;
}

std::size_t FrameQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size();
}
