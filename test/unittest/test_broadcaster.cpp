// test/unittest/test_broadcaster.cpp
// Unit tests for the Broadcaster: fan-out, failure isolation, frame ids

#include "broadcaster.hpp"
#include "feed_message.hpp"
#include "test_harness.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <json/json.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <sstream>
#include <thread>
#include <vector>

using namespace std::chrono;

// Subscriber fakes

class RecordingSubscriber : public Subscriber {
public:
    explicit RecordingSubscriber(std::string name) : name_(std::move(name)) {}

    void async_send(std::shared_ptr<const std::string> message, SendHandler handler) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            messages_.push_back(*message);
        }
        handler(true);
    }
    std::string id() const override { return name_; }

    std::vector<std::string> messages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

private:
    std::string name_;
    mutable std::mutex mutex_;
    std::vector<std::string> messages_;
};

// Never acknowledges a write
class StalledSubscriber : public Subscriber {
public:
    void async_send(std::shared_ptr<const std::string>, SendHandler) override {
        attempts++;
    }
    std::string id() const override { return "stalled"; }
    void close() override { closed = true; }

    std::atomic<int> attempts{0};
    std::atomic<bool> closed{false};
};

class ThrowingSubscriber : public Subscriber {
public:
    void async_send(std::shared_ptr<const std::string>, SendHandler) override {
        throw std::runtime_error("connection reset");
    }
    std::string id() const override { return "throwing"; }
};

class RejectingSubscriber : public Subscriber {
public:
    void async_send(std::shared_ptr<const std::string>, SendHandler handler) override {
        handler(false);
    }
    std::string id() const override { return "rejecting"; }
};

// Acknowledges each write after a delay, from its own worker thread
class DelayedSubscriber : public Subscriber {
public:
    explicit DelayedSubscriber(milliseconds delay) : delay_(delay) {}
    ~DelayedSubscriber() override { worker_.join(); }

    void async_send(std::shared_ptr<const std::string>, SendHandler handler) override {
        auto delay = delay_;
        boost::asio::post(worker_, [this, delay, handler]() {
            std::this_thread::sleep_for(delay);
            acknowledged++;
            handler(true);
        });
    }
    std::string id() const override { return "delayed"; }

    std::atomic<int> acknowledged{0};

private:
    milliseconds delay_;
    boost::asio::thread_pool worker_{1};
};

// Holds the write open until released
class GatedSubscriber : public Subscriber {
public:
    void async_send(std::shared_ptr<const std::string>, SendHandler handler) override {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_ = std::move(handler);
        calls++;
        entered = true;
    }
    std::string id() const override { return "gated"; }

    void open_gate() {
        SendHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = std::move(pending_);
        }
        if (handler) handler(true);
    }

    std::atomic<bool> entered{false};
    std::atomic<int> calls{0};

private:
    std::mutex mutex_;
    SendHandler pending_;
};

// Feed fakes

class ReversedFeed : public FeedSource {
public:
    const std::string& name() const override { return name_; }
    bool derive(const Frame& frame, std::vector<uint8_t>& out) override {
        out.assign(frame.data.rbegin(), frame.data.rend());
        return true;
    }

private:
    std::string name_ = "processed";
};

class EmptyFeed : public FeedSource {
public:
    const std::string& name() const override { return name_; }
    bool derive(const Frame&, std::vector<uint8_t>&) override { return false; }

private:
    std::string name_ = "empty";
};

class BrokenFeed : public FeedSource {
public:
    const std::string& name() const override { return name_; }
    bool derive(const Frame&, std::vector<uint8_t>&) override {
        throw std::runtime_error("decoder failure");
    }

private:
    std::string name_ = "broken";
};

// Helpers

static Frame make_frame(std::vector<uint8_t> data) {
    Frame frame;
    frame.total_size = static_cast<uint32_t>(data.size());
    frame.data = std::move(data);
    return frame;
}

static Json::Value parse_json(const std::string& text) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::istringstream in(text);
    if (!Json::parseFromStream(builder, in, &root, &errors))
        throw std::runtime_error("invalid JSON: " + errors);
    return root;
}

static std::vector<FeedSourcePtr> passthrough_only() {
    std::vector<FeedSourcePtr> feeds;
    feeds.push_back(std::make_unique<PassthroughFeed>());
    return feeds;
}

static BroadcasterOptions fast_options() {
    BroadcasterOptions options;
    options.pop_timeout = milliseconds(20);
    options.send_timeout = milliseconds(50);
    options.fanout_threads = 4;
    return options;
}

static void wait_idle(const SubscriberPtr& subscriber) {
    auto deadline = steady_clock::now() + seconds(5);
    while (subscriber->busy() && steady_clock::now() < deadline)
        std::this_thread::sleep_for(milliseconds(1));
}

// Tests

void test_slow_subscriber_removed() {
    TEST("broadcast: timed out subscriber is removed, healthy one still served")
        FrameQueue queue;
        SubscriberRegistry registry;
        auto healthy = std::make_shared<RecordingSubscriber>("healthy");
        auto stalled = std::make_shared<StalledSubscriber>();
        registry.add(healthy);
        registry.add(stalled);

        std::atomic<int> callbacks{0};
        Broadcaster broadcaster(queue, registry, passthrough_only(), fast_options());
        broadcaster.set_failure_callback([&](const SubscriberPtr& s, const std::string&) {
            if (s == stalled) callbacks++;
        });

        queue.push(make_frame({1, 2, 3}));
        ASSERT(broadcaster.process_next(), "frame should be taken off the queue");
        broadcaster.stop();

        ASSERT(healthy->messages().size() == 1, "healthy subscriber gets the frame");
        ASSERT(stalled->attempts == 1, "stalled subscriber attempted exactly once");
        ASSERT(!registry.contains(stalled), "stalled subscriber removed");
        ASSERT(registry.contains(healthy), "healthy subscriber kept");
        ASSERT(stalled->closed, "stalled subscriber closed");
        ASSERT(callbacks == 1, "failure callback invoked once");
        ASSERT(broadcaster.stats().delivery_failures == 1, "one failure counted");
    END_TEST
}

void test_throwing_subscriber_removed() {
    TEST("broadcast: failed or throwing send removes that subscriber only")
        FrameQueue queue;
        SubscriberRegistry registry;
        auto healthy = std::make_shared<RecordingSubscriber>("healthy");
        auto throwing = std::make_shared<ThrowingSubscriber>();
        auto rejecting = std::make_shared<RejectingSubscriber>();
        registry.add(throwing);
        registry.add(rejecting);
        registry.add(healthy);

        Broadcaster broadcaster(queue, registry, passthrough_only(), fast_options());
        queue.push(make_frame({9}));
        broadcaster.process_next();
        broadcaster.stop();

        ASSERT(!registry.contains(throwing), "throwing subscriber removed");
        ASSERT(!registry.contains(rejecting), "rejecting subscriber removed");
        ASSERT(broadcaster.stats().delivery_failures == 2, "two failures counted");
        ASSERT(healthy->messages().size() == 1, "healthy subscriber served");
    END_TEST
}

void test_frame_ids_and_feed_order() {
    TEST("broadcast: frameId starts at 1, increases, feeds keep their order")
        FrameQueue queue(5);
        SubscriberRegistry registry;
        auto sub = std::make_shared<RecordingSubscriber>("sub");
        registry.add(sub);

        std::vector<FeedSourcePtr> feeds;
        feeds.push_back(std::make_unique<PassthroughFeed>());
        feeds.push_back(std::make_unique<ReversedFeed>());
        Broadcaster broadcaster(queue, registry, std::move(feeds), fast_options());

        for (uint8_t i = 0; i < 3; ++i) {
            queue.push(make_frame({i, static_cast<uint8_t>(i + 10), static_cast<uint8_t>(i + 20)}));
            broadcaster.process_next();
            wait_idle(sub);
        }
        broadcaster.stop();

        auto messages = sub->messages();
        ASSERT(messages.size() == 6, "two feeds for each of three frames");
        for (size_t i = 0; i < messages.size(); ++i) {
            Json::Value root = parse_json(messages[i]);
            ASSERT(root["type"].asString() == "frame", "type should be frame");
            ASSERT(root["frameId"].asUInt64() == i / 2 + 1, "frameId should be 1, 1, 2, 2, 3, 3");
            ASSERT(root["feed"].asString() == (i % 2 == 0 ? "original" : "processed"), "feed order mismatch");
        }

        // Frame 1 is {0, 10, 20}
        Json::Value first = parse_json(messages[0]);
        ASSERT(first["data"].asString() == base64_encode({0, 10, 20}), "original feed carries frame bytes");
        Json::Value reversed = parse_json(messages[1]);
        ASSERT(reversed["data"].asString() == base64_encode({20, 10, 0}), "processed feed carries derived bytes");
        ASSERT(broadcaster.last_frame_id() == 3, "last frame id is 3");
    END_TEST
}

void test_failing_feeds_skipped() {
    TEST("broadcast: feeds that fail or throw are left out of the frame")
        FrameQueue queue;
        SubscriberRegistry registry;
        auto sub = std::make_shared<RecordingSubscriber>("sub");
        registry.add(sub);

        std::vector<FeedSourcePtr> feeds;
        feeds.push_back(std::make_unique<BrokenFeed>());
        feeds.push_back(std::make_unique<EmptyFeed>());
        feeds.push_back(std::make_unique<PassthroughFeed>());
        Broadcaster broadcaster(queue, registry, std::move(feeds), fast_options());

        queue.push(make_frame({5, 6}));
        broadcaster.process_next();
        broadcaster.stop();

        auto messages = sub->messages();
        ASSERT(messages.size() == 1, "only the passthrough feed is sent");
        ASSERT(parse_json(messages[0])["feed"].asString() == "original", "feed should be original");
    END_TEST
}

void test_frame_without_feeds() {
    TEST("broadcast: frame with no derivable feed consumes no frameId")
        FrameQueue queue;
        SubscriberRegistry registry;
        auto sub = std::make_shared<RecordingSubscriber>("sub");
        registry.add(sub);

        std::vector<FeedSourcePtr> feeds;
        feeds.push_back(std::make_unique<EmptyFeed>());
        Broadcaster broadcaster(queue, registry, std::move(feeds), fast_options());

        queue.push(make_frame({1}));
        broadcaster.process_next();
        broadcaster.stop();

        ASSERT(sub->messages().empty(), "nothing sent");
        ASSERT(broadcaster.last_frame_id() == 0, "no frameId consumed");
        ASSERT(broadcaster.stats().frames_without_feeds == 1, "counted as without feeds");
    END_TEST
}

void test_busy_subscriber_skipped() {
    TEST("broadcast: subscriber still busy with a frame skips the next one")
        FrameQueue queue;
        SubscriberRegistry registry;
        auto gated = std::make_shared<GatedSubscriber>();
        auto fast = std::make_shared<RecordingSubscriber>("fast");
        registry.add(gated);
        registry.add(fast);

        BroadcasterOptions options = fast_options();
        options.send_timeout = milliseconds(5000);
        Broadcaster broadcaster(queue, registry, passthrough_only(), options);

        queue.push(make_frame({1}));
        broadcaster.process_next();
        auto deadline = steady_clock::now() + seconds(5);
        while (!gated->entered && steady_clock::now() < deadline)
            std::this_thread::sleep_for(milliseconds(1));
        ASSERT(gated->entered, "first delivery should be in progress");
        wait_idle(fast);

        queue.push(make_frame({2}));
        broadcaster.process_next();
        wait_idle(fast);

        ASSERT(fast->messages().size() == 2, "fast subscriber receives both frames");
        ASSERT(broadcaster.stats().subscribers_skipped == 1, "gated subscriber skipped once");

        gated->open_gate();
        broadcaster.stop();
        ASSERT(gated->calls == 1, "gated subscriber saw only the first frame");
        ASSERT(!gated->busy(), "released once its write completed");
        ASSERT(registry.contains(gated), "skipping is not a failure");
    END_TEST
}

void test_stalled_subscribers_do_not_delay_others() {
    TEST("broadcast: stalled subscribers filling every worker do not delay a healthy one")
        FrameQueue queue;
        SubscriberRegistry registry;
        BroadcasterOptions options = fast_options();
        options.send_timeout = milliseconds(800);
        options.fanout_threads = 4;

        std::vector<std::shared_ptr<StalledSubscriber>> stalled;
        for (std::size_t i = 0; i < options.fanout_threads + 2; ++i) {
            stalled.push_back(std::make_shared<StalledSubscriber>());
            registry.add(stalled.back());
        }
        auto healthy = std::make_shared<RecordingSubscriber>("healthy");
        registry.add(healthy);

        Broadcaster broadcaster(queue, registry, passthrough_only(), options);
        queue.push(make_frame({3, 1, 4}));

        auto start = steady_clock::now();
        broadcaster.process_next();
        auto deadline = start + seconds(5);
        while (healthy->messages().empty() && steady_clock::now() < deadline)
            std::this_thread::sleep_for(milliseconds(1));
        auto served_after = duration_cast<milliseconds>(steady_clock::now() - start);

        broadcaster.stop();

        ASSERT(healthy->messages().size() == 1, "healthy subscriber served");
        ASSERT(served_after < milliseconds(200), "healthy subscriber waited on stalled ones");
        for (const auto& s : stalled) {
            ASSERT(!registry.contains(s), "stalled subscriber removed at its deadline");
        }
        ASSERT(registry.size() == 1, "only the healthy subscriber is left");
    END_TEST
}

void test_deadline_covers_whole_frame() {
    TEST("broadcast: the send timeout bounds all of a frame's messages together")
        FrameQueue queue;
        SubscriberRegistry registry;
        auto slow = std::make_shared<DelayedSubscriber>(milliseconds(60));
        auto quick = std::make_shared<DelayedSubscriber>(milliseconds(5));
        registry.add(slow);
        registry.add(quick);

        std::vector<FeedSourcePtr> feeds;
        feeds.push_back(std::make_unique<PassthroughFeed>());
        feeds.push_back(std::make_unique<ReversedFeed>());

        BroadcasterOptions options = fast_options();
        options.send_timeout = milliseconds(100);
        Broadcaster broadcaster(queue, registry, std::move(feeds), options);

        // Each of slow's two writes fits the timeout, together they do not
        queue.push(make_frame({1, 2}));
        broadcaster.process_next();
        broadcaster.stop();
        auto deadline = steady_clock::now() + seconds(5);
        while (slow->acknowledged < 2 && steady_clock::now() < deadline)
            std::this_thread::sleep_for(milliseconds(5));

        ASSERT(!registry.contains(slow), "slow subscriber removed");
        ASSERT(registry.contains(quick), "quick subscriber kept");
        ASSERT(quick->acknowledged == 2, "quick subscriber got both feeds");
    END_TEST
}

void test_concurrent_stop() {
    TEST("stop: concurrent callers return once, after the loop is gone")
        FrameQueue queue;
        SubscriberRegistry registry;
        Broadcaster broadcaster(queue, registry, passthrough_only(), fast_options());
        broadcaster.start();

        std::vector<std::thread> stoppers;
        for (int i = 0; i < 4; ++i) {
            stoppers.emplace_back([&broadcaster]() { broadcaster.stop(); });
        }
        for (auto& t : stoppers) t.join();
        ASSERT(!broadcaster.running(), "loop stopped");
    END_TEST
}

void test_idle_poll() {
    TEST("process_next: empty queue returns false after the poll interval")
        FrameQueue queue;
        SubscriberRegistry registry;
        Broadcaster broadcaster(queue, registry, passthrough_only(), fast_options());
        ASSERT(!broadcaster.process_next(), "idle poll");
    END_TEST
}

void test_start_stop_loop() {
    TEST("start/stop: background loop delivers and stops cleanly")
        FrameQueue queue;
        SubscriberRegistry registry;
        auto sub = std::make_shared<RecordingSubscriber>("sub");
        registry.add(sub);

        Broadcaster broadcaster(queue, registry, passthrough_only(), fast_options());
        broadcaster.start();
        ASSERT(broadcaster.running(), "loop should be running");

        queue.push(make_frame({7, 7}));
        auto deadline = steady_clock::now() + seconds(5);
        while (sub->messages().empty() && steady_clock::now() < deadline)
            std::this_thread::sleep_for(milliseconds(5));

        broadcaster.stop();
        broadcaster.stop();
        ASSERT(!broadcaster.running(), "loop stopped");
        ASSERT(sub->messages().size() == 1, "frame delivered by the loop");
    END_TEST
}

void test_no_feeds_throws() {
    TEST("constructor: empty feed list throws")
        FrameQueue queue;
        SubscriberRegistry registry;
        bool thrown = false;
        try {
            Broadcaster broadcaster(queue, registry, std::vector<FeedSourcePtr>());
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        ASSERT(thrown, "invalid_argument expected");
    END_TEST
}

int main() {
    print_banner("Broadcaster Tests");

    test_slow_subscriber_removed();
    test_throwing_subscriber_removed();
    test_frame_ids_and_feed_order();
    test_failing_feeds_skipped();
    test_frame_without_feeds();
    test_busy_subscriber_skipped();
    test_stalled_subscribers_do_not_delay_others();
    test_deadline_covers_whole_frame();
    test_concurrent_stop();
    test_idle_poll();
    test_start_stop_loop();
    test_no_feeds_throws();

    return print_summary();
}
