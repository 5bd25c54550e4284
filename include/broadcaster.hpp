#pragma once

#include "feed.hpp"
#include "frame_queue.hpp"
#include "subscriber_registry.hpp"

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

struct BroadcasterOptions {
    std::chrono::milliseconds pop_timeout{1000};   // idle poll interval
    std::chrono::milliseconds send_timeout{1000};  // all of one frame's messages to one subscriber
    std::size_t fanout_threads = 4;                // deadlines and completions only, sends never block them
};

struct BroadcasterStats {
    uint64_t frames_broadcast = 0;
    uint64_t frames_without_feeds = 0;
    uint64_t deliveries_attempted = 0;
    uint64_t delivery_failures = 0;
    uint64_t subscribers_skipped = 0;   // still busy with an earlier frame
};

// Pulls completed frames off the queue, derives feeds and fans them out to
// every live subscriber. A slow or dead subscriber never holds up the loop.
class Broadcaster {
public:
    using FailureCallback = std::function<void(const SubscriberPtr&, const std::string&)>;

    Broadcaster(FrameQueue& queue,
                SubscriberRegistry& registry,
                std::vector<FeedSourcePtr> feeds,
                BroadcasterOptions options = BroadcasterOptions());
    ~Broadcaster();

    Broadcaster(const Broadcaster&) = delete;
    Broadcaster& operator=(const Broadcaster&) = delete;

    // Invoked after a subscriber was removed because of a failed delivery
    void set_failure_callback(FailureCallback callback);

    void start();

    // No further pops; in-flight deliveries finish or time out before returning.
    // Safe to call more than once and from any thread.
    void stop();

    bool running() const { return running_.load(); }

    // One loop iteration. Returns true if a frame was taken off the queue.
    bool process_next();

    BroadcasterStats stats() const;
    uint64_t last_frame_id() const { return last_frame_id_.load(); }

private:
    class Delivery;
    using Messages = std::shared_ptr<const std::vector<std::shared_ptr<const std::string>>>;

    void run();
    void broadcast(const Frame& frame);
    void handle_failure(const SubscriberPtr& subscriber, const std::string& reason);

    FrameQueue& queue_;
    SubscriberRegistry& registry_;
    std::vector<FeedSourcePtr> feeds_;
    BroadcasterOptions options_;
    FailureCallback on_failure_;

    boost::asio::thread_pool pool_;
    std::thread loop_thread_;
    std::atomic<bool> stop_flag_{false};
    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};

    uint64_t next_frame_id_ = 1;
    std::atomic<uint64_t> last_frame_id_{0};

    std::atomic<uint64_t> frames_broadcast_{0};
    std::atomic<uint64_t> frames_without_feeds_{0};
    std::atomic<uint64_t> deliveries_attempted_{0};
    std::atomic<uint64_t> delivery_failures_{0};
    std::atomic<uint64_t> subscribers_skipped_{0};
};
