#pragma once

#include "config.hpp"
#include "feed.hpp"
#include "ffmpeg_encoder.h"

#include <opencv2/core.hpp>
#include <memory>
#include <string>
#include <vector>

// Frame bytes -> BGR image. Raw frames are wrapped without a copy, so the
// image is only valid while the frame is alive.
bool frame_to_image(const Frame& frame, FrameFormat format,
                    const FrameGeometry& geometry, cv::Mat& out);

// "original": JPEG frames pass through, raw frames are JPEG encoded
class JpegFeed : public FeedSource {
public:
    JpegFeed(std::string name, FrameFormat format, FrameGeometry geometry, int quality);

    const std::string& name() const override { return name_; }
    bool derive(const Frame& frame, std::vector<uint8_t>& out) override;

private:
    std::string name_;
    FrameFormat format_;
    FrameGeometry geometry_;
    int quality_;
};

// "processed": Canny edges drawn over the image, JPEG encoded
class EdgeFeed : public FeedSource {
public:
    EdgeFeed(std::string name, FrameFormat format, FrameGeometry geometry, int quality);

    const std::string& name() const override { return name_; }
    bool derive(const Frame& frame, std::vector<uint8_t>& out) override;

private:
    std::string name_;
    FrameFormat format_;
    FrameGeometry geometry_;
    int quality_;
};

// "h264": one intra coded access unit per frame
class H264Feed : public FeedSource {
public:
    H264Feed(std::string name, FrameFormat format, FrameGeometry geometry, int fps, int bitrate);

    const std::string& name() const override { return name_; }
    bool derive(const Frame& frame, std::vector<uint8_t>& out) override;

private:
    std::string name_;
    FrameFormat format_;
    FrameGeometry geometry_;
    FFmpegEncoder encoder_;
    cv::Mat scaled_;
};

// Builds the feeds listed in config.feeds, throws std::invalid_argument on
// an unknown name
std::vector<FeedSourcePtr> make_feed_sources(const RelayConfig& config);
