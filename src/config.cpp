#include "config.hpp"

#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace {

bool parse_int(const std::string& text, int min_value, int max_value, int& out) {
    try {
        size_t pos = 0;
        int value = std::stoi(text, &pos);
        if (pos != text.size() || value < min_value || value > max_value) return false;
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_size(const std::string& text, std::size_t min_value, std::size_t& out) {
    int value = 0;
    if (!parse_int(text, static_cast<int>(min_value), std::numeric_limits<int>::max(), value)) return false;
    out = static_cast<std::size_t>(value);
    return true;
}

std::vector<std::string> split_list(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

// Flag value at argv[i + 1], advancing i
bool take_value(int argc, char** argv, int& i, std::string& value, std::string& error) {
    if (i + 1 >= argc) {
        error = std::string("missing value for ") + argv[i];
        return false;
    }
    value = argv[++i];
    return true;
}

} // namespace

bool parse_frame_format(const std::string& text, FrameFormat& format) {
    if (text == "raw") { format = FrameFormat::Raw; return true; }
    if (text == "jpeg") { format = FrameFormat::Jpeg; return true; }
    return false;
}

const char* frame_format_name(FrameFormat format) {
    return format == FrameFormat::Raw ? "raw" : "jpeg";
}

uint32_t expected_total_size(const RelayConfig& config) {
    if (config.format != FrameFormat::Raw || !config.check_size) return 0;
    return static_cast<uint32_t>(config.geometry.raw_size());
}

bool parse_relay_args(int argc, char** argv, RelayConfig& config, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string value;

        if (arg == "--any-size") {
            config.check_size = false;
            continue;
        }
        if (!take_value(argc, argv, i, value, error)) return false;

        bool ok = true;
        if (arg == "--udp-port") ok = parse_int(value, 1, 65535, config.udp_port);
        else if (arg == "--ws-port") ok = parse_int(value, 1, 65535, config.ws_port);
        else if (arg == "--max-chunk") ok = parse_size(value, 1, config.max_chunk_payload) &&
                                            config.max_chunk_payload <= MAX_CHUNK_PAYLOAD_LIMIT;
        else if (arg == "--queue") ok = parse_size(value, 1, config.queue_capacity);
        else if (arg == "--send-timeout-ms") ok = parse_int(value, 1, 600000, config.send_timeout_ms);
        else if (arg == "--epoch-timeout-ms") ok = parse_int(value, 0, 600000, config.epoch_timeout_ms);
        else if (arg == "--reorder-window-ms") ok = parse_int(value, 0, 1000, config.reorder_window_ms);
        else if (arg == "--width") ok = parse_int(value, 1, 16384, config.geometry.width);
        else if (arg == "--height") ok = parse_int(value, 1, 16384, config.geometry.height);
        else if (arg == "--format") ok = parse_frame_format(value, config.format);
        else if (arg == "--feeds") {
            config.feeds = split_list(value);
            ok = !config.feeds.empty();
        }
        else if (arg == "--fanout-threads") ok = parse_size(value, 1, config.fanout_threads);
        else if (arg == "--ws-threads") ok = parse_int(value, 1, 64, config.ws_threads);
        else if (arg == "--jpeg-quality") ok = parse_int(value, 1, 100, config.jpeg_quality);
        else if (arg == "--h264-bitrate") ok = parse_int(value, 10000, 100000000, config.h264_bitrate);
        else if (arg == "--fps") ok = parse_int(value, 1, 240, config.fps);
        else {
            error = "unknown option " + arg;
            return false;
        }

        if (!ok) {
            error = "invalid value '" + value + "' for " + arg;
            return false;
        }
    }
    return true;
}

bool parse_sender_args(int argc, char** argv, SenderConfig& config, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string value;

        if (arg == "--synthetic") {
            config.synthetic = true;
            continue;
        }
        if (!take_value(argc, argv, i, value, error)) return false;

        bool ok = true;
        if (arg == "--host") config.host = value;
        else if (arg == "--port") ok = parse_int(value, 1, 65535, config.port);
        else if (arg == "--fps") ok = parse_int(value, 1, 240, config.fps);
        else if (arg == "--source") config.source = value;
        else if (arg == "--frames") ok = parse_int(value, 0, std::numeric_limits<int>::max(), config.frames);
        else if (arg == "--width") ok = parse_int(value, 1, 16384, config.geometry.width);
        else if (arg == "--height") ok = parse_int(value, 1, 16384, config.geometry.height);
        else if (arg == "--format") ok = parse_frame_format(value, config.format);
        else if (arg == "--jpeg-quality") ok = parse_int(value, 1, 100, config.jpeg_quality);
        else if (arg == "--max-chunk") ok = parse_size(value, 1, config.max_chunk_payload) &&
                                            config.max_chunk_payload <= MAX_CHUNK_PAYLOAD_LIMIT;
        else {
            error = "unknown option " + arg;
            return false;
        }

        if (!ok) {
            error = "invalid value '" + value + "' for " + arg;
            return false;
        }
    }
    return true;
}

void print_relay_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "  --udp-port N          UDP port for incoming chunks (5005)\n"
              << "  --ws-port N           WebSocket port for subscribers (8081)\n"
              << "  --max-chunk N         chunk payload ceiling, must match sender (60000)\n"
              << "  --queue N             frame queue capacity (5)\n"
              << "  --send-timeout-ms N   per subscriber send timeout (1000)\n"
              << "  --epoch-timeout-ms N  drop stalled epochs after N ms, 0 = never (0)\n"
              << "  --reorder-window-ms N chunk 0 later than N ms restarts its epoch (10)\n"
              << "  --width N --height N  frame geometry (640x480)\n"
              << "  --format raw|jpeg     frame encoding on the wire (raw)\n"
              << "  --any-size            accept raw frames of any total size\n"
              << "  --feeds a,b,c         feeds to publish: original,processed,h264,raw\n"
              << "  --fanout-threads N    delivery worker threads (4)\n"
              << "  --ws-threads N        WebSocket I/O threads (1)\n"
              << "  --jpeg-quality N      JPEG quality for derived feeds (80)\n"
              << "  --h264-bitrate N      bitrate of the h264 feed in bit/s (1000000)\n"
              << "  --fps N               nominal frame rate for the h264 feed (30)\n";
}

void print_sender_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "  --host IP             relay address (127.0.0.1)\n"
              << "  --port N              relay UDP port (5005)\n"
              << "  --fps N               frames per second (30)\n"
              << "  --source S            camera index or video file (0)\n"
              << "  --synthetic           send a generated test pattern\n"
              << "  --frames N            stop after N frames, 0 = run forever (0)\n"
              << "  --width N --height N  frame geometry (640x480)\n"
              << "  --format raw|jpeg     frame encoding on the wire (raw)\n"
              << "  --jpeg-quality N      JPEG quality (85)\n"
              << "  --max-chunk N         chunk payload ceiling (60000)\n";
}
