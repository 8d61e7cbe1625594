// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <cstdint>
#include <chrono>

namespace splitdl::core {

// Largest slice of response body that is throttled and written at once
constexpr std::size_t READ_QUANTUM = 16 * 1024;                     // 16 KB

// Bandwidth caps are given in MB/s
constexpr std::uint64_t BYTES_PER_MEGABYTE = 1024 * 1024;

// Lazy bucket: sleep between attempts when tokens are short
constexpr std::chrono::milliseconds LIMITER_POLL_INTERVAL{10};

// Token queue: replenishment tick
constexpr std::chrono::milliseconds LIMITER_REFILL_PERIOD{1000};

// Progress redraw interval for the CLI
constexpr std::chrono::milliseconds PROGRESS_INTERVAL{100};

constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;

// Used when the URL cannot be parsed at all
constexpr const char* FALLBACK_FILENAME = "output.dat";

} // namespace splitdl::core
