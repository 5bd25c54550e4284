#pragma once

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/imgutils.h>
#include <libavutil/opt.h>
#include <libswscale/swscale.h>
}

#include <opencv2/core.hpp>
#include <cstdint>
#include <vector>

// BGR frames -> H.264 access units. Every frame is coded as an IDR picture
// so a subscriber can decode any message it receives on its own.
class FFmpegEncoder {
public:
    FFmpegEncoder(int width, int height, int fps, int bitrate);
    ~FFmpegEncoder();

    FFmpegEncoder(const FFmpegEncoder&) = delete;
    FFmpegEncoder& operator=(const FFmpegEncoder&) = delete;

    // BGR Mat (width x height) -> encoded access unit
    bool encodeFrame(const cv::Mat& bgrFrame, std::vector<uint8_t>& outEncodedData);

    int width() const { return m_width; }
    int height() const { return m_height; }
    int getBitrate() const { return m_bitrate; }

private:
    int m_width, m_height, m_fps, m_bitrate;
    int64_t frameCounter = 0;

    const AVCodec* codec = nullptr;
    AVCodecContext* codecContext = nullptr;
    AVFrame* frame = nullptr;
    AVPacket* pkt = nullptr;
    SwsContext* swsCtx = nullptr;

    void initEncoder();
    void cleanup();
};
