// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitdl/core/download_engine.hpp>
#include <cstdint>
#include <expected>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace splitdl::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::string url;
    std::uint32_t workers{core::DownloadConfig::DEFAULT_WORKERS};
    std::uint64_t limit_mb{core::DownloadConfig::DEFAULT_LIMIT_MB};
    std::string output_file;
    core::LimiterStrategy strategy{core::LimiterStrategy::lazy};
    std::uint32_t bench_runs{0};   // 0: plain download
    std::string report_file;
    bool info{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;             // Set when the command line is unusable
};

// Decimal integer > 0, nothing else
[[nodiscard]] std::optional<std::uint64_t> parse_positive(std::string_view text) noexcept;

// Parse `[OPTIONS] <URL> [WORKERS] [LIMIT_MB]`. Problems are reported in
// CliArgs::error rather than thrown.
[[nodiscard]] CliArgs parse_args(int argc, const char* const argv[]);

// Interactive mode: ask for URL, worker count and limit. Empty answers keep
// the current values (the URL has none). Returns false and sets args.error
// when an answer is invalid or input ends early.
[[nodiscard]] bool prompt_args(CliArgs& args, std::istream& in, std::ostream& out);

// Engine configuration for the parsed arguments
[[nodiscard]] core::DownloadConfig make_config(const CliArgs& args);

// Download once with a progress bar
[[nodiscard]] CliResult download(const CliArgs& args);

// Download args.bench_runs times, deleting the file between runs, and
// report every run's time and the mean
[[nodiscard]] CliResult bench(const CliArgs& args);

// Probe only: show what the server reports and whether it can be split
[[nodiscard]] CliResult info(const std::string& url);

// Show help message
void print_help(std::string_view program_name);

// Show version information
void print_version();

} // namespace splitdl::cli
