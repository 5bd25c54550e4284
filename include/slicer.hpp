#pragma once
#include "chunk_header.hpp"
#include <vector>
#include <cstdint>
#include <cstddef>

// Slice a payload into ceil(size / max_chunk_payload) chunks, all tagged with
// the payload size. Empty payload or max_chunk_payload == 0 gives no chunks.
std::vector<Chunk> slice_frame(const std::vector<uint8_t>& frame_data,
                               std::size_t max_chunk_payload);

// Number of chunks a payload of total_size bytes is split into
uint32_t chunk_count_for(uint32_t total_size, std::size_t max_chunk_payload);
