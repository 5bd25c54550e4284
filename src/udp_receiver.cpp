#include "udp_receiver.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <iostream>
#include <stdexcept>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

SocketFault::SocketFault(int err, const std::string& what)
    : std::system_error(err, std::system_category(), what) {}

UdpDatagramSource::UdpDatagramSource(int port,
                                     std::chrono::milliseconds read_timeout,
                                     int recv_buffer_bytes)
    : port_(port) {
    sock_ = socket(AF_INET, SOCK_DGRAM, 0);
    if (sock_ < 0)
        throw SocketFault(errno, "[RECEIVER] socket creation failed");

    int optval = 1;
    setsockopt(sock_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

    // Large frames arrive as bursts of ~60 KB datagrams
    if (setsockopt(sock_, SOL_SOCKET, SO_RCVBUF, &recv_buffer_bytes, sizeof(recv_buffer_bytes)) < 0)
        perror("[RECEIVER] SO_RCVBUF");

    timeval tv{};
    tv.tv_sec = static_cast<time_t>(read_timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((read_timeout.count() % 1000) * 1000);
    if (setsockopt(sock_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        int err = errno;
        close(sock_);
        throw SocketFault(err, "[RECEIVER] SO_RCVTIMEO failed");
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    addr.sin_addr.s_addr = INADDR_ANY;
    if (bind(sock_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        close(sock_);
        throw SocketFault(err, "[RECEIVER] bind failed on UDP " + std::to_string(port));
    }

    if (port_ == 0) {
        socklen_t len = sizeof(addr);
        if (getsockname(sock_, reinterpret_cast<sockaddr*>(&addr), &len) == 0)
            port_ = ntohs(addr.sin_port);
    }

    std::cout << "[RECEIVER] Listening UDP " << port_ << std::endl;
}

UdpDatagramSource::~UdpDatagramSource() {
    if (sock_ >= 0) {
        close(sock_);
        std::cout << "[RECEIVER] UDP " << port_ << " closed" << std::endl;
    }
}

bool UdpDatagramSource::read_datagram(std::vector<uint8_t>& out) {
    out.resize(MAX_DATAGRAM_SIZE);

    ssize_t len = recv(sock_, out.data(), out.size(), 0);
    if (len < 0) {
        out.clear();
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
            return false;
        throw SocketFault(errno, "[RECEIVER] recv failed");
    }

    out.resize(static_cast<size_t>(len));
    return true;
}

FrameReceiver::FrameReceiver(std::unique_ptr<DatagramSource> source,
                             FrameQueue& queue,
                             AssemblerOptions options)
    : source_(std::move(source)), queue_(queue), assembler_(options) {
    if (!source_)
        throw std::invalid_argument("[RECEIVER] datagram source is required");
}

void FrameReceiver::run(const std::atomic<bool>& stop) {
    std::vector<uint8_t> datagram;
    datagram.reserve(MAX_DATAGRAM_SIZE);

    std::cout << "[RECEIVER] Receive loop started" << std::endl;
    while (!stop) {
        if (!source_->read_datagram(datagram)) {
            if (assembler_.expire_stale(FrameAssembler::Clock::now())) {
                std::lock_guard<std::mutex> lock(stats_mutex_);
                stats_.assembler = assembler_.stats();
            }
            continue;
        }
        handle_datagram(datagram);
    }
    std::cout << "[RECEIVER] Receive loop stopped" << std::endl;
}

void FrameReceiver::handle_datagram(const std::vector<uint8_t>& datagram) {
    Chunk chunk;
    bool malformed = false;
    try {
        chunk = parse_chunk(datagram.data(), datagram.size());
    } catch (const MalformedHeader&) {
        malformed = true;
    }

    bool queued = false;
    if (!malformed) {
        auto now = FrameAssembler::Clock::now();
        assembler_.expire_stale(now);

        auto frame = assembler_.ingest(std::move(chunk), now);
        if (frame) {
            queue_.push(std::move(*frame));
            queued = true;
        }
    }

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.datagrams++;
    if (malformed) stats_.malformed++;
    if (queued) stats_.frames_queued++;
    stats_.assembler = assembler_.stats();
}

ReceiverStats FrameReceiver::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}
