#include "feed.hpp"

PassthroughFeed::PassthroughFeed(std::string name)
    : name_(std::move(name)) {}

bool PassthroughFeed::derive(const Frame& frame, std::vector<uint8_t>& out) {
    if (frame.data.empty()) return false;
    out = frame.data;
    return true;
}
