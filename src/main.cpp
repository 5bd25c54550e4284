#include "broadcaster.hpp"
#include "config.hpp"
#include "frame_queue.hpp"
#include "image_feeds.hpp"
#include "subscriber_registry.hpp"
#include "udp_receiver.hpp"
#include "ws_server.hpp"

#include <boost/asio/io_context.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

using namespace std;
using tcp = boost::asio::ip::tcp;

static std::atomic<bool> should_exit{false};

void signal_handler(int) {
    should_exit = true;
}

static void print_stats(const FrameReceiver& receiver, const FrameQueue& queue,
                        const Broadcaster& broadcaster, const SubscriberRegistry& registry) {
    ReceiverStats rs = receiver.stats();
    BroadcasterStats bs = broadcaster.stats();

    cout << "[STATS] datagrams=" << rs.datagrams
         << " frames=" << rs.assembler.frames_completed
         << " incomplete=" << (rs.assembler.epochs_discarded + rs.assembler.epochs_expired)
         << " rejected=" << (rs.assembler.chunks_rejected + rs.assembler.epoch_mismatches + rs.malformed)
         << " queue=" << queue.size() << "/" << queue.capacity()
         << " dropped=" << queue.dropped()
         << " broadcast=" << bs.frames_broadcast
         << " subscribers=" << registry.size()
         << " failures=" << bs.delivery_failures
         << " skipped=" << bs.subscribers_skipped << endl;
}

int main(int argc, char** argv) {
    RelayConfig config;
    string error;
    if (!parse_relay_args(argc, argv, config, error)) {
        cerr << "[CONFIG] " << error << endl;
        print_relay_usage(argv[0]);
        return 1;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    cout << "Starting FrameRelay..." << endl;
    cout << "UDP " << config.udp_port << " -> WebSocket " << config.ws_port
         << ", " << config.geometry.width << "x" << config.geometry.height
         << " " << frame_format_name(config.format)
         << ", queue " << config.queue_capacity << endl;

    // Declared before the registry so sessions are released before their io_context
    boost::asio::io_context ioc{config.ws_threads};
    SubscriberRegistry registry;
    FrameQueue queue(config.queue_capacity);

    vector<FeedSourcePtr> feeds;
    try {
        feeds = make_feed_sources(config);
    } catch (const exception& e) {
        cerr << "[FEEDS] " << e.what() << endl;
        return 1;
    }

    AssemblerOptions assembler_options;
    assembler_options.max_chunk_payload = config.max_chunk_payload;
    assembler_options.expected_total_size = expected_total_size(config);
    assembler_options.epoch_timeout = chrono::milliseconds(config.epoch_timeout_ms);
    assembler_options.reorder_window = chrono::milliseconds(config.reorder_window_ms);

    unique_ptr<FrameReceiver> receiver;
    shared_ptr<WsServer> ws_server;
    try {
        receiver = make_unique<FrameReceiver>(make_unique<UdpDatagramSource>(config.udp_port),
                                              queue, assembler_options);
        ws_server = make_shared<WsServer>(ioc, tcp::endpoint(tcp::v4(), static_cast<unsigned short>(config.ws_port)),
                                          registry);
    } catch (const exception& e) {
        cerr << "[ERROR] " << e.what() << endl;
        return 1;
    }

    BroadcasterOptions broadcaster_options;
    broadcaster_options.send_timeout = chrono::milliseconds(config.send_timeout_ms);
    broadcaster_options.fanout_threads = config.fanout_threads;
    Broadcaster broadcaster(queue, registry, std::move(feeds), broadcaster_options);

    ws_server->run();
    vector<thread> io_threads;
    for (int i = 0; i < config.ws_threads; ++i) {
        io_threads.emplace_back([&ioc]() { ioc.run(); });
    }

    broadcaster.start();

    thread stats_thread([&]() {
        auto last = chrono::steady_clock::now();
        while (!should_exit) {
            this_thread::sleep_for(chrono::milliseconds(100));
            auto now = chrono::steady_clock::now();
            if (now - last >= chrono::seconds(1)) {
                print_stats(*receiver, queue, broadcaster, registry);
                last = now;
            }
        }
    });

    int exit_code = 0;
    try {
        receiver->run(should_exit);
    } catch (const SocketFault& e) {
        cerr << "[RECEIVER] Fatal: " << e.what() << endl;
        exit_code = 1;
    }

    should_exit = true;
    stats_thread.join();

    broadcaster.stop();
    ws_server->stop();
    ioc.stop();
    for (auto& t : io_threads) t.join();

    receiver.reset();
    cout << "FrameRelay stopped" << endl;
    return exit_code;
}
