#include "udp_sender.hpp"
#include "slicer.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

UdpSender::UdpSender(const std::string& target_ip, int port, int send_buffer_bytes)
    : target_ip_(target_ip), port_(port) {
    sock_ = socket(AF_INET, SOCK_DGRAM, 0);
    if (sock_ < 0) {
        perror("[SENDER] Socket creation failed");
        throw std::runtime_error("[SENDER] UDP socket could not be created");
    }

    // Set send buffer size for better throughput
    setsockopt(sock_, SOL_SOCKET, SO_SNDBUF, &send_buffer_bytes, sizeof(send_buffer_bytes));

    target_.sin_family = AF_INET;
    target_.sin_port = htons(static_cast<uint16_t>(port));
    if (inet_pton(AF_INET, target_ip.c_str(), &target_.sin_addr) != 1) {
        close(sock_);
        throw std::invalid_argument("[SENDER] Invalid IP address: " + target_ip);
    }

    std::cout << "[SENDER] UDP target " << target_ip << ":" << port << std::endl;
}

UdpSender::~UdpSender() {
    if (sock_ >= 0) close(sock_);
}

ssize_t UdpSender::send_datagram(const std::vector<uint8_t>& datagram) {
    ssize_t sent = -1;
    int retries = 0;
    const int max_retries = 3;

    while (retries < max_retries) {
        sent = sendto(sock_, datagram.data(), datagram.size(), MSG_DONTWAIT,
                      reinterpret_cast<sockaddr*>(&target_), sizeof(target_));

        if (sent >= 0) {
            break;
        }

        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            // Buffer full, try again after a short delay
            std::this_thread::sleep_for(std::chrono::microseconds(100));
            retries++;
        } else {
            perror("[SENDER] Send error");
            break;
        }
    }

    if (sent < 0) {
        datagrams_failed_++;
    } else {
        bytes_sent_ += static_cast<uint64_t>(sent);
    }
    return sent;
}

std::size_t UdpSender::send_frame(const std::vector<uint8_t>& frame_data,
                                  std::size_t max_chunk_payload) {
    std::size_t sent_chunks = 0;
    for (const auto& chunk : slice_frame(frame_data, max_chunk_payload)) {
        if (send_datagram(serialize_chunk(chunk)) >= 0)
            sent_chunks++;
    }
    return sent_chunks;
}
