// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitdl/core/error.hpp>
#include <splitdl/core/chunk_planner.hpp>
#include <splitdl/core/http_session.hpp>
#include <splitdl/core/rate_limiter.hpp>
#include <splitdl/core/segment.hpp>
#include <splitdl/core/size_probe.hpp>
#include <splitdl/disk/output_file.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace splitdl::core {

// Overall download state
enum class DownloadState : std::uint8_t {
    idle,         // Not started
    probing,      // HEAD in flight
    planning,     // Splitting the range, creating the output file
    transferring, // Fetchers running
    done,         // Every fetcher reported back (some may have failed)
    failed        // Fatal error before any transfer started; never follows transferring
};

[[nodiscard]] std::string_view to_string(DownloadState state) noexcept;

// Overall download progress
struct DownloadProgress {
    DownloadState state{DownloadState::idle};
    std::uint64_t total_bytes{0};
    std::uint64_t downloaded_bytes{0};
    std::uint32_t total_segments{0};
    std::uint32_t active_segments{0};
    std::uint32_t completed_segments{0};
    std::uint32_t failed_segments{0};
    double percent{0.0};
    std::chrono::steady_clock::duration elapsed{};
};

// Download configuration
struct DownloadConfig {
    static constexpr std::uint32_t DEFAULT_WORKERS = 4;
    static constexpr std::uint64_t DEFAULT_LIMIT_MB = 1;

    std::uint32_t workers{DEFAULT_WORKERS};
    std::uint64_t limit_mb{DEFAULT_LIMIT_MB};   // Shared cap across all workers
    LimiterStrategy strategy{LimiterStrategy::lazy};
    std::string output_path;                    // Empty: derived from the URL
};

// What a finished run looks like
struct RunReport {
    DownloadTarget target;
    std::string output_path;
    std::uint64_t chunk_size{0};
    std::vector<SegmentResult> results;         // Ordered by chunk index
    std::chrono::steady_clock::duration elapsed{};

    [[nodiscard]] std::size_t failed_count() const noexcept;
    [[nodiscard]] std::uint64_t bytes_written() const noexcept;
    [[nodiscard]] bool complete() const noexcept { return failed_count() == 0; }
};

// Runs one segmented download: probe, plan, preallocate, fetch every chunk
// on its own thread, wait for all of them.
//
// Chunk failures do not fail the run; they are reported per chunk in the
// RunReport. Only probe, planning and file creation errors are fatal.
class DownloadEngine {
public:
    explicit DownloadEngine(std::string url, DownloadConfig config = {});
    virtual ~DownloadEngine();

    // Non-copyable, non-movable (atomic members can't be moved)
    DownloadEngine(const DownloadEngine&) = delete;
    DownloadEngine& operator=(const DownloadEngine&) = delete;

    // Blocking. May be called once per engine.
    [[nodiscard]] std::expected<RunReport, std::error_code> run() noexcept;

    [[nodiscard]] DownloadState state() const noexcept { return state_.load(std::memory_order_acquire); }

    // Thread-safe snapshot; may be polled while run() is in progress
    [[nodiscard]] DownloadProgress progress() const noexcept;

    [[nodiscard]] const std::string& url() const noexcept { return url_; }
    [[nodiscard]] const DownloadConfig& config() const noexcept { return config_; }

    // Explicit output path, or the name derived from the URL
    [[nodiscard]] std::string resolved_output_path() const;

    // Global initialization
    static void global_init() noexcept { HttpSession::global_init(); }
    static void global_cleanup() noexcept { HttpSession::global_cleanup(); }

protected:
    // Start one fetcher on its own thread. May throw std::system_error when
    // no thread is available; the chunk is then fetched on the calling thread.
    [[nodiscard]] virtual std::future<SegmentResult> launch(Segment& segment);

private:
    std::expected<RunReport, std::error_code> execute();

    // Fatal-path helper: mark failed, hand the error back
    [[nodiscard]] std::unexpected<std::error_code> fail(std::error_code ec) noexcept;

    // Setup threw before any fetcher started
    [[nodiscard]] std::unexpected<std::error_code> abort_setup(std::error_code ec) noexcept;

    std::string url_;
    DownloadConfig config_;
    HttpSession http_session_;

    std::atomic<DownloadState> state_{DownloadState::idle};
    std::atomic<std::uint64_t> total_bytes_{0};
    std::chrono::steady_clock::time_point start_time_;

    std::unique_ptr<RateLimiter> limiter_;
    disk::OutputFile file_;
    std::vector<std::unique_ptr<Segment>> segments_;
    mutable std::mutex mutex_;  // Guards segments_ and start_time_
};

} // namespace splitdl::core
