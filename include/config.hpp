#pragma once

#include "chunk_header.hpp"
#include "frame_queue.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

enum class FrameFormat { Raw, Jpeg };

struct FrameGeometry {
    int width = 640;
    int height = 480;
    int channels = 3;

    std::size_t raw_size() const {
        return static_cast<std::size_t>(width) * height * channels;
    }
};

struct RelayConfig {
    int udp_port = 5005;
    int ws_port = 8081;
    std::size_t max_chunk_payload = DEFAULT_MAX_CHUNK_PAYLOAD;
    std::size_t queue_capacity = DEFAULT_QUEUE_CAPACITY;
    int send_timeout_ms = 1000;
    int epoch_timeout_ms = 0;           // 0 = no expiry of stalled epochs
    int reorder_window_ms = 10;         // late chunk 0 may still join its epoch
    FrameGeometry geometry;
    FrameFormat format = FrameFormat::Raw;
    bool check_size = true;             // raw frames must be exactly width*height*channels
    std::vector<std::string> feeds = {"original", "processed"};
    std::size_t fanout_threads = 4;
    int ws_threads = 1;
    int jpeg_quality = 80;
    int h264_bitrate = 1000000;
    int fps = 30;
};

struct SenderConfig {
    std::string host = "127.0.0.1";
    int port = 5005;
    int fps = 30;
    std::string source = "0";           // camera index or video path
    bool synthetic = false;             // test pattern instead of a capture device
    int frames = 0;                     // 0 = run until interrupted
    FrameGeometry geometry;
    FrameFormat format = FrameFormat::Raw;
    int jpeg_quality = 85;
    std::size_t max_chunk_payload = DEFAULT_MAX_CHUNK_PAYLOAD;
};

// Fill config from argv; on false, error holds a one line reason
bool parse_relay_args(int argc, char** argv, RelayConfig& config, std::string& error);
bool parse_sender_args(int argc, char** argv, SenderConfig& config, std::string& error);

void print_relay_usage(const char* prog);
void print_sender_usage(const char* prog);

// Fixed total size the assembler enforces, 0 when sizes vary
uint32_t expected_total_size(const RelayConfig& config);

bool parse_frame_format(const std::string& text, FrameFormat& format);
const char* frame_format_name(FrameFormat format);

