// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitdl/core/error.hpp>
#include <cstdint>
#include <expected>
#include <vector>

namespace splitdl::core {

// One contiguous byte range [start, end_inclusive] owned by a single worker
struct ChunkSpec {
    std::uint32_t index{0};
    std::uint64_t start{0};
    std::uint64_t end_inclusive{0};

    [[nodiscard]] std::uint64_t length() const noexcept { return end_inclusive - start + 1; }

    friend bool operator==(const ChunkSpec&, const ChunkSpec&) = default;
};

// Result of partitioning [0, total_size)
struct ChunkPlan {
    std::uint64_t total_size{0};
    std::uint64_t chunk_size{0};
    std::vector<ChunkSpec> chunks;
};

// Split [0, total_size) into ceil(total / ceil(total / workers)) gapless
// chunks. The last chunk is clipped to total_size - 1, so when total_size is
// small there may be fewer chunks than workers, never an empty one.
[[nodiscard]] std::expected<ChunkPlan, std::error_code>
plan_chunks(std::uint64_t total_size, std::uint32_t workers);

} // namespace splitdl::core
