#include "subscriber_registry.hpp"
#include <algorithm>

bool SubscriberRegistry::add(const SubscriberPtr& subscriber) {
    if (!subscriber) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(subscribers_.begin(), subscribers_.end(), subscriber) != subscribers_.end())
        return false;

    subscribers_.push_back(subscriber);
    return true;
}

bool SubscriberRegistry::remove(const SubscriberPtr& subscriber) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find(subscribers_.begin(), subscribers_.end(), subscriber);
    if (it == subscribers_.end())
        return false;

    subscribers_.erase(it);
    return true;
}

bool SubscriberRegistry::contains(const SubscriberPtr& subscriber) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::find(subscribers_.begin(), subscribers_.end(), subscriber) != subscribers_.end();
}

std::vector<SubscriberPtr> SubscriberRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_;
}

std::size_t SubscriberRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}
