#include "image_feeds.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <iostream>
#include <stdexcept>

namespace {

bool encode_jpeg(const cv::Mat& image, int quality, std::vector<uint8_t>& out) {
    std::vector<int> params = { cv::IMWRITE_JPEG_QUALITY, quality };
    return cv::imencode(".jpg", image, out, params);
}

} // namespace

bool frame_to_image(const Frame& frame, FrameFormat format,
                    const FrameGeometry& geometry, cv::Mat& out) {
    if (frame.data.empty()) return false;

    if (format == FrameFormat::Raw) {
        if (geometry.channels != 3 || frame.data.size() != geometry.raw_size())
            return false;
        out = cv::Mat(geometry.height, geometry.width, CV_8UC3,
                      const_cast<uint8_t*>(frame.data.data()));
        return true;
    }

    cv::Mat encoded(1, static_cast<int>(frame.data.size()), CV_8UC1,
                    const_cast<uint8_t*>(frame.data.data()));
    out = cv::imdecode(encoded, cv::IMREAD_COLOR);
    return !out.empty();
}

// ---------------------- JpegFeed ----------------------

JpegFeed::JpegFeed(std::string name, FrameFormat format, FrameGeometry geometry, int quality)
    : name_(std::move(name)), format_(format), geometry_(geometry), quality_(quality) {}

bool JpegFeed::derive(const Frame& frame, std::vector<uint8_t>& out) {
    if (format_ == FrameFormat::Jpeg) {
        if (frame.data.empty()) return false;
        out = frame.data;
        return true;
    }

    cv::Mat image;
    if (!frame_to_image(frame, format_, geometry_, image)) return false;
    return encode_jpeg(image, quality_, out);
}

// ---------------------- EdgeFeed ----------------------

EdgeFeed::EdgeFeed(std::string name, FrameFormat format, FrameGeometry geometry, int quality)
    : name_(std::move(name)), format_(format), geometry_(geometry), quality_(quality) {}

bool EdgeFeed::derive(const Frame& frame, std::vector<uint8_t>& out) {
    cv::Mat image;
    if (!frame_to_image(frame, format_, geometry_, image)) return false;

    cv::Mat gray, edges;
    cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    cv::GaussianBlur(gray, gray, cv::Size(5, 5), 1.5);
    cv::Canny(gray, edges, 50, 150);

    cv::Mat overlay = image.clone();
    overlay.setTo(cv::Scalar(0, 255, 0), edges);
    return encode_jpeg(overlay, quality_, out);
}

// ---------------------- H264Feed ----------------------

H264Feed::H264Feed(std::string name, FrameFormat format, FrameGeometry geometry, int fps, int bitrate)
    : name_(std::move(name)), format_(format), geometry_(geometry),
      encoder_(geometry.width, geometry.height, fps, bitrate) {}

bool H264Feed::derive(const Frame& frame, std::vector<uint8_t>& out) {
    cv::Mat image;
    if (!frame_to_image(frame, format_, geometry_, image)) return false;

    if (image.cols != encoder_.width() || image.rows != encoder_.height()) {
        cv::resize(image, scaled_, cv::Size(encoder_.width(), encoder_.height()));
        return encoder_.encodeFrame(scaled_, out);
    }
    return encoder_.encodeFrame(image, out);
}

// ---------------------- Factory ----------------------

std::vector<FeedSourcePtr> make_feed_sources(const RelayConfig& config) {
    std::vector<FeedSourcePtr> feeds;

    for (const auto& name : config.feeds) {
        if (name == "original") {
            feeds.push_back(std::make_unique<JpegFeed>(name, config.format, config.geometry, config.jpeg_quality));
        } else if (name == "processed") {
            feeds.push_back(std::make_unique<EdgeFeed>(name, config.format, config.geometry, config.jpeg_quality));
        } else if (name == "h264") {
            feeds.push_back(std::make_unique<H264Feed>(name, config.format, config.geometry,
                                                       config.fps, config.h264_bitrate));
        } else if (name == "raw") {
            feeds.push_back(std::make_unique<PassthroughFeed>(name));
        } else {
            throw std::invalid_argument("unknown feed '" + name + "'");
        }
        std::cout << "[FEEDS] Publishing feed '" << name << "'" << std::endl;
    }

    return feeds;
}
