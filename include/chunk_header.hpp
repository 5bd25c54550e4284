#pragma once
#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <vector>

constexpr std::size_t CHUNK_HEADER_SIZE = 8;
constexpr std::size_t DEFAULT_MAX_CHUNK_PAYLOAD = 60000;
// 65535 minus IPv4 (20) and UDP (8) headers and the chunk header
constexpr std::size_t MAX_CHUNK_PAYLOAD_LIMIT = 65535 - 28 - CHUNK_HEADER_SIZE;

struct Chunk {
    uint32_t total_size = 0;    // bytes in the complete payload
    uint32_t chunk_index = 0;   // 0-based, 0 starts a new epoch
    std::vector<uint8_t> payload;
};

// Datagram shorter than the 8 byte header
class MalformedHeader : public std::runtime_error {
public:
    explicit MalformedHeader(std::size_t length);
    std::size_t length() const { return length_; }

private:
    std::size_t length_;
};

// (total_size, chunk_index) -> 8 byte big endian header
std::vector<uint8_t> encode_chunk_header(uint32_t total_size, uint32_t chunk_index);

// Chunk -> header + payload
std::vector<uint8_t> serialize_chunk(const Chunk& chunk);

// Byte array -> Chunk, throws MalformedHeader when len < 8
Chunk parse_chunk(const uint8_t* data, std::size_t len);
