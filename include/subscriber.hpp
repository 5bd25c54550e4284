#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>

// Sink capability a consumer is reached through. Identity is the object itself.
class Subscriber {
public:
    using SendHandler = std::function<void(bool ok)>;

    virtual ~Subscriber() = default;

    // Starts pushing one message and returns without waiting for it.
    // handler runs at most once, on any thread, with the outcome. A stalled
    // transport may never run it; the caller owns the deadline.
    virtual void async_send(std::shared_ptr<const std::string> message, SendHandler handler) = 0;

    // Human readable identity for logs, e.g. the peer endpoint
    virtual std::string id() const = 0;

    virtual void close() {}

    // At most one delivery per subscriber is outstanding
    bool try_acquire();
    void release();
    bool busy() const { return in_flight_.load(); }

private:
    std::atomic<bool> in_flight_{false};
};

using SubscriberPtr = std::shared_ptr<Subscriber>;
