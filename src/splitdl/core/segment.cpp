// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/core/segment.hpp>
#include <splitdl/core/config.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <new>

namespace splitdl::core {

//=============================================================================
// Segment
//=============================================================================

Segment::Segment(ChunkSpec chunk,
                 std::string url,
                 std::uint64_t total_size,
                 const HttpSession& session,
                 RateLimiter& limiter,
                 disk::OutputFile& file) noexcept
    : chunk_(chunk)
    , url_(std::move(url))
    , total_size_(total_size)
    , session_(session)
    , limiter_(limiter)
    , file_(file)
    , cursor_(chunk.start) {}

SegmentResult Segment::fetch() noexcept {
    state_.store(SegmentState::downloading, std::memory_order_release);
    spdlog::debug("Downloading chunk {} [{}-{}]", chunk_.index, chunk_.start, chunk_.end_inclusive);

    std::error_code error;
    try {
        TransferHandlers handlers;
        handlers.on_status = [this](std::int32_t status) { return check_status(status); };
        handlers.on_data = [this](const char* data, std::size_t size) { return consume(data, size); };

        auto response = session_.get_range(url_, chunk_.start, chunk_.end_inclusive, handlers);
        if (!response) {
            error = response.error();
        } else if (cursor_ != chunk_.end_inclusive + 1) {
            error = make_error_code(DownloadErrc::short_read);
        }
    } catch (const std::bad_alloc&) {
        error = make_error_code(std::errc::not_enough_memory);
    }

    SegmentResult result{chunk_, written(), error};

    if (error) {
        state_.store(SegmentState::failed, std::memory_order_release);
        spdlog::warn("Chunk {} [{}-{}] failed after {} bytes: {}",
                     chunk_.index, chunk_.start, chunk_.end_inclusive,
                     result.bytes_written, error.message());
    } else {
        state_.store(SegmentState::completed, std::memory_order_release);
        spdlog::debug("Chunk {} [{}-{}] done", chunk_.index, chunk_.start, chunk_.end_inclusive);
    }

    return result;
}

std::error_code Segment::check_status(std::int32_t status) const noexcept {
    if (auto ec = http_status_error(status)) {
        return ec;
    }
    if (status == 206) {
        return {};
    }
    // A full-body answer is only correct if we asked for the full body
    if (status == 200 && chunk_.start == 0 && chunk_.end_inclusive + 1 == total_size_) {
        return {};
    }
    return make_error_code(DownloadErrc::range_ignored);
}

std::error_code Segment::consume(const char* data, std::size_t size) noexcept {
    const std::uint64_t limit = chunk_.end_inclusive + 1;

    while (size > 0) {
        if (cursor_ >= limit) {
            // Server sent more than the range; never write past our chunk
            return make_error_code(DownloadErrc::invalid_range);
        }

        auto quantum = static_cast<std::size_t>(
            std::min<std::uint64_t>({size, READ_QUANTUM, limit - cursor_}));

        limiter_.wait(quantum);

        if (auto ec = file_.write_at(cursor_, data, quantum)) {
            return ec;
        }

        cursor_ += quantum;
        written_.fetch_add(quantum, std::memory_order_relaxed);
        data += quantum;
        size -= quantum;
    }
    return {};
}

} // namespace splitdl::core
