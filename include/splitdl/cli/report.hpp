// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitdl/core/download_engine.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <system_error>

namespace splitdl::cli {

// {"url", "output", "total_size", "chunk_size", "elapsed_ms", "bytes_written",
//  "failed", "chunks": [{"index", "start", "end", "bytes_written", "ok", "error"}]}
[[nodiscard]] nlohmann::json report_to_json(const core::RunReport& report);

// Write the report, pretty-printed, to `path`
[[nodiscard]] std::error_code write_report(const core::RunReport& report, const std::string& path);

} // namespace splitdl::cli
