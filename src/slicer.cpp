#include "slicer.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>

uint32_t chunk_count_for(uint32_t total_size, std::size_t max_chunk_payload) {
    if (max_chunk_payload == 0) return 0;
    return static_cast<uint32_t>((static_cast<uint64_t>(total_size) + max_chunk_payload - 1) / max_chunk_payload);
}

std::vector<Chunk> slice_frame(const std::vector<uint8_t>& frame_data,
                               std::size_t max_chunk_payload) {
    std::vector<Chunk> chunks;

    if (frame_data.empty() || max_chunk_payload == 0) return chunks;
    if (frame_data.size() > std::numeric_limits<uint32_t>::max())
        throw std::invalid_argument("[slicer] payload exceeds 4 GiB");

    const uint32_t total_size = static_cast<uint32_t>(frame_data.size());
    const uint32_t total_chunks = chunk_count_for(total_size, max_chunk_payload);
    chunks.reserve(total_chunks);

    for (uint32_t i = 0; i < total_chunks; ++i) {
        size_t offset = static_cast<size_t>(i) * max_chunk_payload;
        size_t len = std::min(max_chunk_payload, frame_data.size() - offset);

        Chunk c;
        c.total_size = total_size;
        c.chunk_index = i;
        c.payload.insert(c.payload.end(), frame_data.begin() + offset, frame_data.begin() + offset + len);

        chunks.push_back(std::move(c));
    }

    return chunks;
}
