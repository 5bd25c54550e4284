#pragma once

#include "subscriber.hpp"
#include <cstddef>
#include <mutex>
#include <vector>

// Active subscriber set. All operations hold one lock only for the
// duration of a lookup or copy; delivery happens on snapshots, outside it.
class SubscriberRegistry {
public:
    bool add(const SubscriberPtr& subscriber);
    bool remove(const SubscriberPtr& subscriber);
    bool contains(const SubscriberPtr& subscriber) const;

    // Copy of the active set in join order
    std::vector<SubscriberPtr> snapshot() const;

    std::size_t size() const;

private:
    std::vector<SubscriberPtr> subscribers_;
    mutable std::mutex mutex_;
};
