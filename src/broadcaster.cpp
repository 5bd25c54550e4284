#include "broadcaster.hpp"
#include "feed_message.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <algorithm>
#include <iostream>
#include <stdexcept>

// One frame's messages on their way to one subscriber, sent in order. All
// state changes run on a strand; the deadline covers the whole frame.
class Broadcaster::Delivery : public std::enable_shared_from_this<Delivery> {
public:
    Delivery(Broadcaster& owner, SubscriberPtr subscriber, Messages messages)
        : owner_(owner),
          subscriber_(std::move(subscriber)),
          messages_(std::move(messages)),
          strand_(boost::asio::make_strand(owner.pool_)),
          deadline_(strand_) {}

    void start() {
        auto self = shared_from_this();
        boost::asio::post(strand_, [self]() {
            // Removed by a disconnect after the snapshot was taken
            if (!self->owner_.registry_.contains(self->subscriber_)) {
                self->finished_ = true;
                self->subscriber_->release();
                return;
            }

            self->deadline_.expires_after(self->owner_.options_.send_timeout);
            self->deadline_.async_wait([self](const boost::system::error_code& ec) {
                if (ec != boost::asio::error::operation_aborted)
                    self->finish(false, "send timed out");
            });
            self->send_next();
        });
    }

private:
    void send_next() {
        if (finished_) return;
        if (next_ == messages_->size()) {
            finish(true, std::string());
            return;
        }

        auto message = (*messages_)[next_++];
        owner_.deliveries_attempted_++;

        // A completion arriving after the deadline finds the delivery gone
        std::weak_ptr<Delivery> weak = shared_from_this();
        try {
            subscriber_->async_send(message, [weak](bool ok) {
                if (auto self = weak.lock()) {
                    boost::asio::post(self->strand_, [self, ok]() { self->on_sent(ok); });
                }
            });
        } catch (const std::exception& e) {
            finish(false, e.what());
        }
    }

    void on_sent(bool ok) {
        if (finished_) return;
        if (!ok) {
            finish(false, "send failed");
            return;
        }
        send_next();
    }

    void finish(bool ok, const std::string& reason) {
        if (finished_) return;
        finished_ = true;
        deadline_.cancel();

        // Closed before release so no later frame starts writing to it
        if (!ok) owner_.handle_failure(subscriber_, reason);
        subscriber_->release();
    }

    Broadcaster& owner_;
    SubscriberPtr subscriber_;
    Messages messages_;
    boost::asio::strand<boost::asio::thread_pool::executor_type> strand_;
    boost::asio::steady_timer deadline_;
    std::size_t next_ = 0;
    bool finished_ = false;
};

Broadcaster::Broadcaster(FrameQueue& queue,
                         SubscriberRegistry& registry,
                         std::vector<FeedSourcePtr> feeds,
                         BroadcasterOptions options)
    : queue_(queue),
      registry_(registry),
      feeds_(std::move(feeds)),
      options_(options),
      pool_(std::max<std::size_t>(1, options.fanout_threads)) {
    if (feeds_.empty())
        throw std::invalid_argument("[BROADCAST] at least one feed source is required");
}

Broadcaster::~Broadcaster() {
    stop();
}

void Broadcaster::set_failure_callback(FailureCallback callback) {
    on_failure_ = std::move(callback);
}

void Broadcaster::start() {
    if (running_ || stopped_) return;

    stop_flag_ = false;
    running_ = true;
    loop_thread_ = std::thread([this]() { run(); });
}

void Broadcaster::stop() {
    if (stopped_.exchange(true)) return;

    stop_flag_ = true;
    if (loop_thread_.joinable()) loop_thread_.join();
    running_ = false;

    // Let in-flight deliveries complete or hit their deadline
    pool_.join();
}

void Broadcaster::run() {
    std::cout << "[BROADCAST] Loop started with " << feeds_.size() << " feed(s)" << std::endl;
    while (!stop_flag_) {
        process_next();
    }
    std::cout << "[BROADCAST] Loop stopped" << std::endl;
}

bool Broadcaster::process_next() {
    auto frame = queue_.pop(options_.pop_timeout);
    if (!frame) return false;  // idle poll

    broadcast(*frame);
    return true;
}

void Broadcaster::broadcast(const Frame& frame) {
    std::vector<Feed> feeds;
    feeds.reserve(feeds_.size());

    for (auto& source : feeds_) {
        Feed feed;
        feed.name = source->name();
        try {
            if (!source->derive(frame, feed.data)) continue;
        } catch (const std::exception& e) {
            std::cerr << "[BROADCAST] Feed '" << feed.name << "' failed: " << e.what() << std::endl;
            continue;
        }
        feeds.push_back(std::move(feed));
    }

    if (feeds.empty()) {
        frames_without_feeds_++;
        return;
    }

    const uint64_t frame_id = next_frame_id_++;
    last_frame_id_ = frame_id;
    frames_broadcast_++;

    // Encoded once, shared by every subscriber's delivery
    auto messages = std::make_shared<std::vector<std::shared_ptr<const std::string>>>();
    messages->reserve(feeds.size());
    for (const auto& feed : feeds) {
        messages->push_back(std::make_shared<const std::string>(
            encode_feed_message(feed.name, feed.data, frame_id)));
    }
    Messages shared_messages = messages;

    for (const auto& subscriber : registry_.snapshot()) {
        if (!subscriber->try_acquire()) {
            subscribers_skipped_++;
            continue;
        }
        std::make_shared<Delivery>(*this, subscriber, shared_messages)->start();
    }
}

void Broadcaster::handle_failure(const SubscriberPtr& subscriber, const std::string& reason) {
    delivery_failures_++;

    if (!registry_.remove(subscriber)) return;

    std::cerr << "[BROADCAST] Removing subscriber " << subscriber->id()
              << ": " << reason << " (" << registry_.size() << " left)" << std::endl;
    subscriber->close();

    if (on_failure_) on_failure_(subscriber, reason);
}

BroadcasterStats Broadcaster::stats() const {
    BroadcasterStats s;
    s.frames_broadcast = frames_broadcast_.load();
    s.frames_without_feeds = frames_without_feeds_.load();
    s.deliveries_attempted = deliveries_attempted_.load();
    s.delivery_failures = delivery_failures_.load();
    s.subscribers_skipped = subscribers_skipped_.load();
    return s;
}
