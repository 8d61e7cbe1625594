// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/cli/report.hpp>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <chrono>
#include <fstream>

namespace splitdl::cli {

nlohmann::json report_to_json(const core::RunReport& report) {
    nlohmann::json chunks = nlohmann::json::array();
    for (const auto& r : report.results) {
        nlohmann::json entry = {
            {"index", r.chunk.index},
            {"start", r.chunk.start},
            {"end", r.chunk.end_inclusive},
            {"bytes_written", r.bytes_written},
            {"ok", r.ok()},
        };
        if (!r.ok()) {
            entry["error"] = r.error.message();
            entry["error_category"] = r.error.category().name();
        }
        chunks.push_back(std::move(entry));
    }

    return {
        {"url", report.target.url},
        {"output", report.output_path},
        {"total_size", report.target.total_size},
        {"chunk_size", report.chunk_size},
        {"elapsed_ms", std::chrono::duration_cast<std::chrono::milliseconds>(report.elapsed).count()},
        {"bytes_written", report.bytes_written()},
        {"failed", report.failed_count()},
        {"chunks", std::move(chunks)},
    };
}

std::error_code write_report(const core::RunReport& report, const std::string& path) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        return {errno ? errno : EIO, std::generic_category()};
    }

    out << report_to_json(report).dump(2) << '\n';
    if (!out.flush()) {
        return std::make_error_code(std::errc::io_error);
    }

    spdlog::info("Report written to {}", path);
    return {};
}

} // namespace splitdl::cli
