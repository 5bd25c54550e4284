#pragma once
#include <cstdint>
#include <vector>

// Fully reassembled payload, data.size() == total_size
struct Frame {
    uint32_t total_size = 0;
    std::vector<uint8_t> data;
};
