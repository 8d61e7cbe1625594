// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/core/rate_limiter.hpp>
#include <algorithm>

namespace splitdl::core {

namespace {

// tokens + fresh, clamped to the capacity
std::uint64_t add_capped(std::uint64_t tokens, std::uint64_t fresh, std::uint64_t capacity) noexcept {
    return fresh >= capacity - tokens ? capacity : tokens + fresh;
}

// Tokens earned per refill period, at least one and at most the capacity
std::uint64_t tokens_per_tick(std::uint64_t capacity, std::chrono::milliseconds period) noexcept {
    const auto ms = static_cast<std::uint64_t>(period.count());
    if (ms >= 1000) {
        return capacity;
    }
    // capacity * ms / 1000 without forming the product
    const std::uint64_t tick = capacity / 1000 * ms + capacity % 1000 * ms / 1000;
    return std::clamp<std::uint64_t>(tick, 1, capacity);
}

} // namespace

std::optional<LimiterStrategy> parse_strategy(std::string_view name) noexcept {
    if (name == "lazy") return LimiterStrategy::lazy;
    if (name == "queue") return LimiterStrategy::queue;
    return std::nullopt;
}

std::string_view to_string(LimiterStrategy strategy) noexcept {
    switch (strategy) {
        case LimiterStrategy::lazy:  return "lazy";
        case LimiterStrategy::queue: return "queue";
    }
    return "unknown";
}

//=============================================================================
// TokenBucket
//=============================================================================

TokenBucket::TokenBucket(std::uint64_t bytes_per_sec,
                         std::chrono::milliseconds poll_interval)
    : capacity_(std::max<std::uint64_t>(bytes_per_sec, 1))
    , poll_interval_(poll_interval)
    , tokens_(capacity_)
    , last_refill_(std::chrono::steady_clock::now()) {}

void TokenBucket::wait(std::uint64_t n) {
    while (n > 0) {
        auto part = std::min(n, capacity_);
        acquire(part);
        n -= part;
    }
}

void TokenBucket::acquire(std::uint64_t n) {
    for (;;) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            refill(std::chrono::steady_clock::now());
            if (tokens_ >= n) {
                tokens_ -= n;
                return;
            }
        }
        std::this_thread::sleep_for(poll_interval_);
    }
}

void TokenBucket::refill(std::chrono::steady_clock::time_point now) noexcept {
    auto elapsed = std::chrono::duration<double>(now - last_refill_).count();
    auto earned = elapsed * static_cast<double>(capacity_);

    // Saturate before converting; a long idle gap never earns more than a full bucket
    auto fresh = earned >= static_cast<double>(capacity_)
        ? capacity_
        : static_cast<std::uint64_t>(earned);

    // Keep the old timestamp until at least one whole token has accrued
    if (fresh > 0) {
        tokens_ = add_capped(tokens_, fresh, capacity_);
        last_refill_ = now;
    }
}

//=============================================================================
// TokenQueue
//=============================================================================

TokenQueue::TokenQueue(std::uint64_t bytes_per_sec, std::chrono::milliseconds period)
    : capacity_(std::max<std::uint64_t>(bytes_per_sec, 1))
    , period_(std::max(period, std::chrono::milliseconds{1}))
    , per_tick_(tokens_per_tick(capacity_, period_))
    , tokens_(per_tick_) {
    // First tick is delivered above; the thread handles the following ones
    refiller_ = std::jthread([this](std::stop_token stoken) { refill_loop(stoken); });
}

TokenQueue::~TokenQueue() {
    refiller_.request_stop();
}

void TokenQueue::wait(std::uint64_t n) {
    while (n > 0) {
        auto part = std::min(n, capacity_);
        acquire(part);
        n -= part;
    }
}

void TokenQueue::acquire(std::uint64_t n) {
    std::unique_lock<std::mutex> lock(mutex_);
    const std::uint64_t ticket = next_ticket_++;

    cv_.wait(lock, [&] { return serving_ticket_ == ticket && tokens_ >= n; });

    tokens_ -= n;
    ++serving_ticket_;
    lock.unlock();
    cv_.notify_all();
}

void TokenQueue::refill_loop(std::stop_token stoken) {
    auto next_tick = std::chrono::steady_clock::now() + period_;

    std::unique_lock<std::mutex> lock(mutex_);
    while (!stoken.stop_requested()) {
        // Returns early only when stop is requested
        cv_.wait_until(lock, stoken, next_tick, [] { return false; });
        if (stoken.stop_requested()) break;

        tokens_ = add_capped(tokens_, per_tick_, capacity_);
        next_tick += period_;

        lock.unlock();
        cv_.notify_all();
        lock.lock();
    }
}

//=============================================================================
// Factory
//=============================================================================

std::expected<std::unique_ptr<RateLimiter>, std::error_code>
make_rate_limiter(LimiterStrategy strategy, std::uint64_t bytes_per_sec) {
    if (bytes_per_sec == 0) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_argument));
    }

    switch (strategy) {
        case LimiterStrategy::lazy:
            return std::make_unique<TokenBucket>(bytes_per_sec);
        case LimiterStrategy::queue:
            return std::make_unique<TokenQueue>(bytes_per_sec);
    }
    return std::unexpected(make_error_code(DownloadErrc::invalid_argument));
}

} // namespace splitdl::core
