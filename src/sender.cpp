#include "config.hpp"
#include "udp_sender.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

using namespace std;
using namespace cv;
typedef chrono::steady_clock Clock;

static std::atomic<bool> should_exit{false};

void signal_handler(int) {
    should_exit = true;
}

static bool is_device_index(const string& source) {
    if (source.empty()) return false;
    for (char c : source) {
        if (!isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// Moving colour bars with the frame number, for runs without a camera
static void make_test_pattern(const FrameGeometry& geometry, uint64_t frame_no, Mat& out) {
    out.create(geometry.height, geometry.width, CV_8UC3);
    const int bars = 8;
    const int bar_width = std::max(1, geometry.width / bars);
    const int shift = static_cast<int>(frame_no * 4 % static_cast<uint64_t>(geometry.width));

    for (int x = 0; x < geometry.width; ++x) {
        int bar = ((x + shift) / bar_width) % bars;
        Scalar colour((bar & 1) ? 255 : 0, (bar & 2) ? 255 : 0, (bar & 4) ? 255 : 0);
        line(out, Point(x, 0), Point(x, geometry.height - 1), colour);
    }

    putText(out, "frame " + to_string(frame_no), Point(20, geometry.height / 2),
            FONT_HERSHEY_SIMPLEX, 1.0, Scalar(255, 255, 255), 2);
}

int main(int argc, char** argv) {
    SenderConfig config;
    string error;
    if (!parse_sender_args(argc, argv, config, error)) {
        cerr << "[CONFIG] " << error << endl;
        print_sender_usage(argv[0]);
        return 1;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    unique_ptr<UdpSender> sender;
    try {
        sender = make_unique<UdpSender>(config.host, config.port);
    } catch (const exception& e) {
        cerr << "[ERROR] " << e.what() << endl;
        return 1;
    }

    VideoCapture cap;
    if (!config.synthetic) {
        if (is_device_index(config.source)) {
            cap.open(stoi(config.source), CAP_ANY);
        } else {
            cap.open(config.source);
        }
        if (!cap.isOpened()) {
            cerr << "[SENDER] Capture source '" << config.source << "' could not be opened." << endl;
            return 1;
        }
        cap.set(CAP_PROP_FRAME_WIDTH, config.geometry.width);
        cap.set(CAP_PROP_FRAME_HEIGHT, config.geometry.height);
        cap.set(CAP_PROP_FPS, config.fps);
    }

    cout << "[SENDER] Streaming " << config.geometry.width << "x" << config.geometry.height
         << " " << frame_format_name(config.format) << " @ " << config.fps << " fps to "
         << config.host << ":" << config.port << endl;

    chrono::milliseconds frame_duration(1000 / config.fps);
    const vector<int> jpeg_params = { IMWRITE_JPEG_QUALITY, config.jpeg_quality };

    Mat frame, resized;
    vector<uint8_t> payload;
    uint64_t frame_no = 0;

    size_t frames_this_second = 0;
    size_t chunks_this_second = 0;
    uint64_t bytes_at_start = 0;
    auto stats_start = Clock::now();

    while (!should_exit && (config.frames == 0 || frame_no < static_cast<uint64_t>(config.frames))) {
        auto t0 = Clock::now();

        if (config.synthetic) {
            make_test_pattern(config.geometry, frame_no, frame);
        } else if (!cap.read(frame) || frame.empty()) {
            cout << "[SENDER] End of capture source" << endl;
            break;
        }

        Mat* out = &frame;
        if (frame.cols != config.geometry.width || frame.rows != config.geometry.height) {
            resize(frame, resized, Size(config.geometry.width, config.geometry.height));
            out = &resized;
        }

        if (config.format == FrameFormat::Raw) {
            if (!out->isContinuous()) *out = out->clone();
            payload.assign(out->data, out->data + out->total() * out->elemSize());
        } else if (!imencode(".jpg", *out, payload, jpeg_params)) {
            cerr << "[SENDER] JPEG encoding failed, skipping frame " << frame_no << endl;
            frame_no++;
            continue;
        }

        chunks_this_second += sender->send_frame(payload, config.max_chunk_payload);
        frames_this_second++;
        frame_no++;

        auto now = Clock::now();
        if (chrono::duration_cast<chrono::seconds>(now - stats_start).count() >= 1) {
            double kbps = (sender->bytes_sent() - bytes_at_start) * 8 / 1000.0;
            cout << "[SENDER] fps=" << frames_this_second
                 << ", chunks=" << chunks_this_second
                 << ", " << kbps << " kbps"
                 << ", failed datagrams=" << sender->datagrams_failed() << endl;
            frames_this_second = 0;
            chunks_this_second = 0;
            bytes_at_start = sender->bytes_sent();
            stats_start = now;
        }

        auto loop_ms = chrono::duration_cast<chrono::milliseconds>(Clock::now() - t0);
        if (loop_ms < frame_duration) {
            this_thread::sleep_for(frame_duration - loop_ms);
        }
    }

    cout << "[SENDER] Sent " << frame_no << " frames" << endl;
    return 0;
}
