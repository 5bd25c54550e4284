#pragma once

#include "frame_assembler.hpp"
#include "frame_queue.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

constexpr std::size_t MAX_DATAGRAM_SIZE = 65535;

// Bind or read failure on the receive socket, fatal to the receive path
class SocketFault : public std::system_error {
public:
    SocketFault(int err, const std::string& what);
};

// Source of raw datagrams
class DatagramSource {
public:
    virtual ~DatagramSource() = default;

    // false when no datagram arrived within the read timeout.
    // Throws SocketFault on a fatal read error.
    virtual bool read_datagram(std::vector<uint8_t>& out) = 0;
};

// Bound UDP socket; the descriptor is released when the source is destroyed
class UdpDatagramSource : public DatagramSource {
public:
    UdpDatagramSource(int port,
                      std::chrono::milliseconds read_timeout = std::chrono::milliseconds(200),
                      int recv_buffer_bytes = 4 * 1024 * 1024);
    ~UdpDatagramSource() override;

    UdpDatagramSource(const UdpDatagramSource&) = delete;
    UdpDatagramSource& operator=(const UdpDatagramSource&) = delete;

    bool read_datagram(std::vector<uint8_t>& out) override;

    int port() const { return port_; }

private:
    int sock_ = -1;
    int port_ = 0;
};

struct ReceiverStats {
    uint64_t datagrams = 0;
    uint64_t malformed = 0;
    uint64_t frames_queued = 0;
    AssemblerStats assembler;
};

// Receive path: datagrams -> chunk codec -> assembler -> frame queue.
// Single threaded; the only owner of the assembler state.
class FrameReceiver {
public:
    FrameReceiver(std::unique_ptr<DatagramSource> source,
                  FrameQueue& queue,
                  AssemblerOptions options = AssemblerOptions());

    // Runs until stop is set. SocketFault propagates to the caller.
    void run(const std::atomic<bool>& stop);

    // Handles one datagram; exposed for the loop and for tests
    void handle_datagram(const std::vector<uint8_t>& datagram);

    const FrameAssembler& assembler() const { return assembler_; }

    // Safe to call from any thread
    ReceiverStats stats() const;

private:
    std::unique_ptr<DatagramSource> source_;
    FrameQueue& queue_;
    FrameAssembler assembler_;

    ReceiverStats stats_;
    mutable std::mutex stats_mutex_;
};
