#include "frame_assembler.hpp"
#include "slicer.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

FrameAssembler::FrameAssembler(AssemblerOptions options)
    : options_(options) {
    if (options_.max_chunk_payload == 0)
        throw std::invalid_argument("[ASSEMBLER] max_chunk_payload must be positive");
}

uint32_t FrameAssembler::expected_total_size() const {
    return context_ ? context_->total_size : 0;
}

std::size_t FrameAssembler::expected_chunk_count() const {
    return context_ ? context_->chunk_count : 0;
}

std::size_t FrameAssembler::received_chunks() const {
    return context_ ? context_->received_chunks : 0;
}

std::optional<Frame> FrameAssembler::ingest(Chunk chunk) {
    return ingest(std::move(chunk), Clock::now());
}

bool FrameAssembler::validate(const Chunk& chunk, uint32_t chunk_count) const {
    if (chunk.total_size == 0)
        return false;
    if (options_.expected_total_size != 0 && chunk.total_size != options_.expected_total_size)
        return false;
    if (chunk.chunk_index >= chunk_count)
        return false;

    // Every chunk but the last is full, the last carries the remainder
    uint64_t offset = static_cast<uint64_t>(chunk.chunk_index) * options_.max_chunk_payload;
    uint64_t expected_len = std::min<uint64_t>(options_.max_chunk_payload, chunk.total_size - offset);
    return chunk.payload.size() == expected_len;
}

std::optional<Frame> FrameAssembler::ingest(Chunk chunk, Clock::time_point now) {
    const uint32_t chunk_count = chunk_count_for(chunk.total_size, options_.max_chunk_payload);

    if (!validate(chunk, chunk_count)) {
        stats_.chunks_rejected++;
        return std::nullopt;
    }

    if (!context_) {
        reset_context(chunk.total_size, chunk_count, now);
    } else if (chunk.chunk_index == 0) {
        // Restart wins, unless it is the reordered start of the epoch already being collected
        bool late_start = context_->total_size == chunk.total_size &&
                          !context_->received_flags[0] &&
                          now - context_->opened < options_.reorder_window;
        if (!late_start) {
            if (context_->received_chunks > 0) stats_.epochs_discarded++;
            reset_context(chunk.total_size, chunk_count, now);
        }
    } else if (context_->total_size != chunk.total_size) {
        if (context_->received_flags[0]) {
            // Stray from an epoch whose chunk 0 was never seen
            stats_.epoch_mismatches++;
            return std::nullopt;
        }
        // Live context never saw its start either, the newer size wins
        stats_.epochs_discarded++;
        reset_context(chunk.total_size, chunk_count, now);
    }

    auto& ctx = *context_;

    // Duplicate check
    if (ctx.received_flags[chunk.chunk_index]) {
        stats_.duplicate_chunks++;
        return std::nullopt;
    }

    ctx.chunks[chunk.chunk_index] = std::move(chunk.payload);
    ctx.received_flags[chunk.chunk_index] = true;
    ctx.received_chunks++;
    ctx.last_update = now;

    if (ctx.received_chunks == ctx.chunk_count) {
        return take_frame();
    }
    return std::nullopt;
}

bool FrameAssembler::expire_stale(Clock::time_point now) {
    if (!context_ || options_.epoch_timeout.count() <= 0)
        return false;

    if (now - context_->last_update < options_.epoch_timeout)
        return false;

    std::cerr << "[ASSEMBLER] Dropping stalled epoch (size " << context_->total_size
              << ", received: " << context_->received_chunks << "/" << context_->chunk_count << ")" << std::endl;
    stats_.epochs_expired++;
    discard_context();
    return true;
}

void FrameAssembler::reset_context(uint32_t total_size, uint32_t chunk_count, Clock::time_point now) {
    AssemblyContext ctx;
    ctx.total_size = total_size;
    ctx.chunk_count = chunk_count;
    ctx.chunks.resize(chunk_count);
    ctx.received_flags.resize(chunk_count, false);
    ctx.opened = now;
    ctx.last_update = now;
    context_ = std::move(ctx);
}

void FrameAssembler::discard_context() {
    context_.reset();
}

std::optional<Frame> FrameAssembler::take_frame() {
    auto& ctx = *context_;

    Frame frame;
    frame.total_size = ctx.total_size;
    frame.data.reserve(ctx.total_size);

    for (uint32_t i = 0; i < ctx.chunk_count; ++i) {
        if (!ctx.received_flags[i]) {
            std::cerr << "[ASSEMBLER] Chunk " << i << " missing at completion, dropping epoch" << std::endl;
            stats_.epochs_discarded++;
            discard_context();
            return std::nullopt;
        }
        frame.data.insert(frame.data.end(), ctx.chunks[i].begin(), ctx.chunks[i].end());
    }

    discard_context();

    if (frame.data.size() != frame.total_size) {
        stats_.epochs_discarded++;
        return std::nullopt;
    }

    stats_.frames_completed++;
    return frame;
}
