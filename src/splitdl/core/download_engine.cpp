// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/core/download_engine.hpp>
#include <splitdl/core/config.hpp>
#include <splitdl/core/url.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <future>
#include <limits>
#include <new>
#include <system_error>

namespace splitdl::core {

std::string_view to_string(DownloadState state) noexcept {
    switch (state) {
        case DownloadState::idle:         return "idle";
        case DownloadState::probing:      return "probing";
        case DownloadState::planning:     return "planning";
        case DownloadState::transferring: return "transferring";
        case DownloadState::done:         return "done";
        case DownloadState::failed:       return "failed";
    }
    return "unknown";
}

//=============================================================================
// RunReport
//=============================================================================

std::size_t RunReport::failed_count() const noexcept {
    return static_cast<std::size_t>(
        std::count_if(results.begin(), results.end(), [](const SegmentResult& r) { return !r.ok(); }));
}

std::uint64_t RunReport::bytes_written() const noexcept {
    std::uint64_t total = 0;
    for (const auto& r : results) {
        total += r.bytes_written;
    }
    return total;
}

//=============================================================================
// DownloadEngine
//=============================================================================

DownloadEngine::DownloadEngine(std::string url, DownloadConfig config)
    : url_(std::move(url))
    , config_(std::move(config)) {}

DownloadEngine::~DownloadEngine() {
    // run() joins every fetcher before returning, so nothing still writes here
    if (file_.is_open()) {
        file_.close();
    }
}

std::string DownloadEngine::resolved_output_path() const {
    return config_.output_path.empty() ? output_filename(url_) : config_.output_path;
}

std::unexpected<std::error_code> DownloadEngine::fail(std::error_code ec) noexcept {
    state_.store(DownloadState::failed, std::memory_order_release);
    return std::unexpected(ec);
}

std::expected<RunReport, std::error_code> DownloadEngine::run() noexcept {
    if (state() != DownloadState::idle) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_argument));
    }

    try {
        return execute();
    } catch (const std::bad_alloc&) {
        spdlog::error("Out of memory while preparing {}", url_);
        return abort_setup(make_error_code(std::errc::not_enough_memory));
    } catch (const std::system_error& e) {
        spdlog::error("Cannot prepare {}: {}", url_, e.what());
        return abort_setup(e.code());
    } catch (const std::exception& e) {
        // length_error and friends from sizing the chunk tables
        spdlog::error("Cannot prepare {}: {}", url_, e.what());
        return abort_setup(make_error_code(std::errc::not_enough_memory));
    }
}

std::future<SegmentResult> DownloadEngine::launch(Segment& segment) {
    return std::async(std::launch::async, [&segment] { return segment.fetch(); });
}

std::unexpected<std::error_code> DownloadEngine::abort_setup(std::error_code ec) noexcept {
    if (file_.is_open()) {
        file_.close();
    }
    return fail(ec);
}

std::expected<RunReport, std::error_code> DownloadEngine::execute() {
    auto started = std::chrono::steady_clock::now();
    {
        std::lock_guard lock(mutex_);
        start_time_ = started;
    }

    // 1. Probe
    state_.store(DownloadState::probing, std::memory_order_release);
    auto target = probe_target(http_session_, url_);
    if (!target) {
        return fail(target.error());
    }
    total_bytes_.store(target->total_size, std::memory_order_relaxed);

    // 2. Plan
    state_.store(DownloadState::planning, std::memory_order_release);
    auto plan = plan_chunks(target->total_size, config_.workers);
    if (!plan) {
        spdlog::error("Cannot split {} bytes across {} workers: {}",
                      target->total_size, config_.workers, plan.error().message());
        return fail(plan.error());
    }

    if (config_.limit_mb > std::numeric_limits<std::uint64_t>::max() / BYTES_PER_MEGABYTE) {
        spdlog::error("Invalid bandwidth limit: {} MB/s", config_.limit_mb);
        return fail(make_error_code(DownloadErrc::invalid_argument));
    }
    auto limiter = make_rate_limiter(config_.strategy, config_.limit_mb * BYTES_PER_MEGABYTE);
    if (!limiter) {
        spdlog::error("Invalid bandwidth limit: {} MB/s", config_.limit_mb);
        return fail(limiter.error());
    }
    limiter_ = std::move(*limiter);

    // 3. Preallocate, only after the probe succeeded
    const std::string output_path = resolved_output_path();

    auto file = disk::OutputFile::create(output_path, target->total_size);
    if (!file) {
        spdlog::error("Cannot create {}: {}", output_path, file.error().message());
        return fail(file.error());
    }
    file_ = std::move(*file);

    spdlog::info("Downloading {} into {} chunks of up to {} bytes ({} MB/s, {} limiter) -> {}",
                 url_, plan->chunks.size(), plan->chunk_size,
                 config_.limit_mb, to_string(config_.strategy), output_path);

    RunReport report;
    report.target = *target;
    report.output_path = output_path;
    report.chunk_size = plan->chunk_size;
    report.results.reserve(plan->chunks.size());

    {
        std::lock_guard lock(mutex_);
        segments_.reserve(plan->chunks.size());
        for (const auto& chunk : plan->chunks) {
            segments_.push_back(std::make_unique<Segment>(
                chunk, url_, target->total_size, http_session_, *limiter_, file_));
        }
    }

    std::vector<std::future<SegmentResult>> futures(segments_.size());

    // 4. One thread per chunk. Nothing below throws, so the run ends in done.
    state_.store(DownloadState::transferring, std::memory_order_release);

    for (std::size_t i = 0; i < segments_.size(); ++i) {
        try {
            futures[i] = launch(*segments_[i]);
        } catch (const std::exception& e) {
            // Leave the future empty; the chunk is fetched on this thread below
            spdlog::warn("Cannot start a thread for chunk {}: {}; fetching it inline",
                         segments_[i]->chunk().index, e.what());
        }
    }

    // 5. Wait for every fetcher; a failed chunk never stops the others
    for (std::size_t i = 0; i < futures.size(); ++i) {
        if (futures[i].valid()) {
            report.results.push_back(futures[i].get());
        } else {
            report.results.push_back(segments_[i]->fetch());
        }
    }

    // 6. Close the file after all fetchers are done
    if (auto ec = file_.flush()) {
        spdlog::warn("Flushing {} failed: {}", output_path, ec.message());
    }
    file_.close();

    report.elapsed = std::chrono::steady_clock::now() - started;
    state_.store(DownloadState::done, std::memory_order_release);

    auto seconds = std::chrono::duration<double>(report.elapsed).count();
    if (report.complete()) {
        spdlog::info("Download finished in {:.2f}s: {} bytes in {} chunks",
                     seconds, report.bytes_written(), report.results.size());
    } else {
        spdlog::warn("Download finished in {:.2f}s with {} of {} chunks failed; {} of {} bytes written",
                     seconds, report.failed_count(), report.results.size(),
                     report.bytes_written(), report.target.total_size);
    }

    return report;
}

DownloadProgress DownloadEngine::progress() const noexcept {
    DownloadProgress snap;
    snap.state = state();
    snap.total_bytes = total_bytes_.load(std::memory_order_relaxed);

    std::lock_guard lock(mutex_);
    snap.total_segments = static_cast<std::uint32_t>(segments_.size());
    for (const auto& seg : segments_) {
        snap.downloaded_bytes += seg->written();
        switch (seg->state()) {
            case SegmentState::downloading: ++snap.active_segments; break;
            case SegmentState::completed:   ++snap.completed_segments; break;
            case SegmentState::failed:      ++snap.failed_segments; break;
            case SegmentState::pending:     break;
        }
    }
    if (snap.total_bytes > 0) {
        snap.percent = static_cast<double>(snap.downloaded_bytes) * 100.0
                       / static_cast<double>(snap.total_bytes);
    }
    if (snap.state != DownloadState::idle) {
        snap.elapsed = std::chrono::steady_clock::now() - start_time_;
    }
    return snap;
}

} // namespace splitdl::core
