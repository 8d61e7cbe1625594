// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/core/chunk_planner.hpp>
#include <algorithm>

namespace splitdl::core {

std::expected<ChunkPlan, std::error_code>
plan_chunks(std::uint64_t total_size, std::uint32_t workers) {
    if (workers == 0 || total_size == 0) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_argument));
    }

    ChunkPlan plan;
    plan.total_size = total_size;
    plan.chunk_size = (total_size + workers - 1) / workers;  // Round up

    const std::uint64_t count = (total_size + plan.chunk_size - 1) / plan.chunk_size;
    plan.chunks.reserve(count);

    for (std::uint64_t i = 0; i < count; ++i) {
        ChunkSpec chunk;
        chunk.index = static_cast<std::uint32_t>(i);
        chunk.start = i * plan.chunk_size;
        chunk.end_inclusive = std::min(chunk.start + plan.chunk_size - 1, total_size - 1);
        plan.chunks.push_back(chunk);
    }

    return plan;
}

} // namespace splitdl::core
