// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitdl/core/config.hpp>
#include <splitdl/core/error.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <thread>

namespace splitdl::core {

// Refill strategy for the shared bandwidth limiter
enum class LimiterStrategy : std::uint8_t {
    lazy,   // refill from elapsed time on each wait, poll when short
    queue   // background tick feeds a bounded pool, waiters served in order
};

[[nodiscard]] std::optional<LimiterStrategy> parse_strategy(std::string_view name) noexcept;
[[nodiscard]] std::string_view to_string(LimiterStrategy strategy) noexcept;

// Token bucket shared by every fetcher of one run. One token is one byte.
//
// wait(n) blocks until n tokens could be taken and takes exactly n. Requests
// larger than the capacity are served in capacity-sized installments.
class RateLimiter {
public:
    virtual ~RateLimiter() = default;

    virtual void wait(std::uint64_t n) = 0;

    [[nodiscard]] virtual std::uint64_t capacity() const noexcept = 0;
};

// Lazy time-based refill. Starts full. No queueing order between waiters, so
// a caller asking for a large amount can lose repeatedly to smaller ones.
class TokenBucket final : public RateLimiter {
public:
    // bytes_per_sec must be positive
    explicit TokenBucket(std::uint64_t bytes_per_sec,
                         std::chrono::milliseconds poll_interval = LIMITER_POLL_INTERVAL);

    void wait(std::uint64_t n) override;

    [[nodiscard]] std::uint64_t capacity() const noexcept override { return capacity_; }

private:
    void acquire(std::uint64_t n);
    void refill(std::chrono::steady_clock::time_point now) noexcept;

    const std::uint64_t capacity_;
    const std::chrono::milliseconds poll_interval_;

    std::mutex mutex_;
    std::uint64_t tokens_;
    std::chrono::steady_clock::time_point last_refill_;
};

// Periodic refill into a pool bounded by the capacity. Each `period` a
// background thread adds capacity * period worth of tokens. Waiters take
// tickets and are served strictly in arrival order.
//
// The refill thread lives exactly as long as the limiter.
class TokenQueue final : public RateLimiter {
public:
    // bytes_per_sec must be positive
    explicit TokenQueue(std::uint64_t bytes_per_sec,
                        std::chrono::milliseconds period = LIMITER_REFILL_PERIOD);
    ~TokenQueue() override;

    TokenQueue(const TokenQueue&) = delete;
    TokenQueue& operator=(const TokenQueue&) = delete;

    void wait(std::uint64_t n) override;

    [[nodiscard]] std::uint64_t capacity() const noexcept override { return capacity_; }

private:
    void acquire(std::uint64_t n);
    void refill_loop(std::stop_token stoken);

    const std::uint64_t capacity_;
    const std::chrono::milliseconds period_;
    const std::uint64_t per_tick_;

    std::mutex mutex_;
    std::condition_variable_any cv_;
    std::uint64_t tokens_{0};
    std::uint64_t next_ticket_{0};
    std::uint64_t serving_ticket_{0};

    std::jthread refiller_;  // Last member: joined before the rest is destroyed
};

// Build a limiter for the given strategy. Fails with invalid_argument when
// bytes_per_sec is zero.
[[nodiscard]] std::expected<std::unique_ptr<RateLimiter>, std::error_code>
make_rate_limiter(LimiterStrategy strategy, std::uint64_t bytes_per_sec);

} // namespace splitdl::core
