// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitdl/core/chunk_planner.hpp>
#include <splitdl/core/error.hpp>
#include <splitdl/core/http_session.hpp>
#include <splitdl/core/rate_limiter.hpp>
#include <splitdl/disk/output_file.hpp>
#include <atomic>
#include <cstdint>
#include <string>

namespace splitdl::core {

// Segment state machine
enum class SegmentState : std::uint8_t {
    pending,     // Not started
    downloading, // Request issued, body streaming
    completed,   // Every byte of the range written
    failed       // Abandoned; the rest of the range keeps its old content
};

// Outcome of one chunk, handed back to the engine
struct SegmentResult {
    ChunkSpec chunk;
    std::uint64_t bytes_written{0};
    std::error_code error;

    [[nodiscard]] bool ok() const noexcept { return !error; }
};

// Fetches one chunk with a single ranged GET and writes it in place.
//
// Body data is cut into quanta of at most READ_QUANTUM bytes. Each quantum
// first passes the shared limiter, then is written at the segment's cursor.
// The cursor starts at chunk.start and never passes chunk.end_inclusive + 1.
// There is no retry: the first error ends the segment.
class Segment {
public:
    Segment(ChunkSpec chunk,
            std::string url,
            std::uint64_t total_size,
            const HttpSession& session,
            RateLimiter& limiter,
            disk::OutputFile& file) noexcept;

    // Non-copyable, non-movable (atomic members)
    Segment(const Segment&) = delete;
    Segment& operator=(const Segment&) = delete;

    // Run the transfer on the calling thread. Call once.
    [[nodiscard]] SegmentResult fetch() noexcept;

    [[nodiscard]] const ChunkSpec& chunk() const noexcept { return chunk_; }
    [[nodiscard]] SegmentState state() const noexcept { return state_.load(std::memory_order_acquire); }
    [[nodiscard]] std::uint64_t written() const noexcept { return written_.load(std::memory_order_relaxed); }

private:
    // 206 always; 200 only when the chunk is the whole file
    [[nodiscard]] std::error_code check_status(std::int32_t status) const noexcept;

    // Throttle and write one block of body data
    [[nodiscard]] std::error_code consume(const char* data, std::size_t size) noexcept;

    ChunkSpec chunk_;
    std::string url_;
    std::uint64_t total_size_;
    const HttpSession& session_;
    RateLimiter& limiter_;
    disk::OutputFile& file_;

    std::uint64_t cursor_;  // Next file offset; only touched by the fetching thread
    std::atomic<std::uint64_t> written_{0};
    std::atomic<SegmentState> state_{SegmentState::pending};
};

} // namespace splitdl::core
