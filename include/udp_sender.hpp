#pragma once

#include "chunk_header.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <sys/types.h>
#include <netinet/in.h>
#include <vector>

// Sends datagrams to one target. Socket is released on destruction.
class UdpSender {
public:
    UdpSender(const std::string& target_ip, int port, int send_buffer_bytes = 4 * 1024 * 1024);
    ~UdpSender();

    UdpSender(const UdpSender&) = delete;
    UdpSender& operator=(const UdpSender&) = delete;

    // Non-blocking send with a few retries when the socket buffer is full.
    // Return value < 0 means the datagram was not sent.
    ssize_t send_datagram(const std::vector<uint8_t>& datagram);

    // Slices the payload and sends every chunk, returns the number of chunks sent
    std::size_t send_frame(const std::vector<uint8_t>& frame_data,
                           std::size_t max_chunk_payload = DEFAULT_MAX_CHUNK_PAYLOAD);

    uint64_t bytes_sent() const { return bytes_sent_; }
    uint64_t datagrams_failed() const { return datagrams_failed_; }

private:
    int sock_ = -1;
    sockaddr_in target_{};
    std::string target_ip_;
    int port_;

    uint64_t bytes_sent_ = 0;
    uint64_t datagrams_failed_ = 0;
};
