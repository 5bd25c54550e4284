#pragma once

#include "frame.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Named rendition of one frame, opaque to the broadcaster
struct Feed {
    std::string name;
    std::vector<uint8_t> data;
};

// Derives one named feed from a frame. false = no feed for this frame.
class FeedSource {
public:
    virtual ~FeedSource() = default;
    virtual const std::string& name() const = 0;
    virtual bool derive(const Frame& frame, std::vector<uint8_t>& out) = 0;
};

// Forwards the frame bytes untouched
class PassthroughFeed : public FeedSource {
public:
    explicit PassthroughFeed(std::string name = "original");

    const std::string& name() const override { return name_; }
    bool derive(const Frame& frame, std::vector<uint8_t>& out) override;

private:
    std::string name_;
};

using FeedSourcePtr = std::unique_ptr<FeedSource>;
