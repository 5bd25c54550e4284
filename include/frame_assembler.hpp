#pragma once

#include "chunk_header.hpp"
#include "frame.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

struct AssemblerStats {
    uint64_t frames_completed = 0;
    uint64_t epochs_discarded = 0;   // superseded before completion
    uint64_t epochs_expired = 0;
    uint64_t epoch_mismatches = 0;   // non-restart chunk for an unseen epoch
    uint64_t chunks_rejected = 0;    // bad size, index or payload length
    uint64_t duplicate_chunks = 0;
};

struct AssemblerOptions {
    std::size_t max_chunk_payload = DEFAULT_MAX_CHUNK_PAYLOAD;
    uint32_t expected_total_size = 0;              // 0 = any size accepted
    std::chrono::milliseconds epoch_timeout{0};    // 0 = stalled epochs wait for the next restart
    // A chunk 0 arriving this long after its epoch was opened by a later
    // chunk starts a new epoch instead of joining. Well under a frame interval.
    std::chrono::milliseconds reorder_window{10};
};

// Reassembles one epoch at a time. Not thread safe, owned by the receive path.
class FrameAssembler {
public:
    using Clock = std::chrono::steady_clock;

    explicit FrameAssembler(AssemblerOptions options = AssemblerOptions());

    // Returns the completed frame once every chunk of the live epoch is present
    std::optional<Frame> ingest(Chunk chunk);
    std::optional<Frame> ingest(Chunk chunk, Clock::time_point now);

    // Drops the live epoch if it has not progressed within epoch_timeout
    bool expire_stale(Clock::time_point now);

    bool has_context() const { return context_.has_value(); }
    uint32_t expected_total_size() const;
    std::size_t expected_chunk_count() const;
    std::size_t received_chunks() const;

    const AssemblerOptions& options() const { return options_; }
    const AssemblerStats& stats() const { return stats_; }

private:
    struct AssemblyContext {
        uint32_t total_size = 0;
        uint32_t chunk_count = 0;
        std::vector<std::vector<uint8_t>> chunks;
        std::vector<bool> received_flags;
        std::size_t received_chunks = 0;
        Clock::time_point opened;
        Clock::time_point last_update;
    };

    bool validate(const Chunk& chunk, uint32_t chunk_count) const;
    void reset_context(uint32_t total_size, uint32_t chunk_count, Clock::time_point now);
    void discard_context();
    std::optional<Frame> take_frame();

    AssemblerOptions options_;
    std::optional<AssemblyContext> context_;
    AssemblerStats stats_;
};
