#include "chunk_header.hpp"
#include <string>

// Datagram layout:
// [0-3]   total_size    (4 byte, big endian)
// [4-7]   chunk_index   (4 byte, big endian)
// [8...]  payload       (remaining bytes)

namespace {

void put_u32_be(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back((value >> 24) & 0xFF);
    out.push_back((value >> 16) & 0xFF);
    out.push_back((value >> 8) & 0xFF);
    out.push_back(value & 0xFF);
}

uint32_t get_u32_be(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

} // namespace

MalformedHeader::MalformedHeader(std::size_t length)
    : std::runtime_error("[chunk_header] datagram too short: " + std::to_string(length) + " bytes"),
      length_(length) {}

std::vector<uint8_t> encode_chunk_header(uint32_t total_size, uint32_t chunk_index) {
    std::vector<uint8_t> header;
    header.reserve(CHUNK_HEADER_SIZE);
    put_u32_be(header, total_size);
    put_u32_be(header, chunk_index);
    return header;
}

std::vector<uint8_t> serialize_chunk(const Chunk& chunk) {
    std::vector<uint8_t> buffer;
    buffer.reserve(CHUNK_HEADER_SIZE + chunk.payload.size());

    put_u32_be(buffer, chunk.total_size);
    put_u32_be(buffer, chunk.chunk_index);

    buffer.insert(buffer.end(), chunk.payload.begin(), chunk.payload.end());
    return buffer;
}

Chunk parse_chunk(const uint8_t* data, std::size_t len) {
    if (data == nullptr || len < CHUNK_HEADER_SIZE) {
        throw MalformedHeader(data == nullptr ? 0 : len);
    }

    Chunk chunk;
    chunk.total_size = get_u32_be(data);
    chunk.chunk_index = get_u32_be(data + 4);
    chunk.payload.assign(data + CHUNK_HEADER_SIZE, data + len);
    return chunk;
}
