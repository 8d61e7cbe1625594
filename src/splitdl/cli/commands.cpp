// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/cli/commands.hpp>
#include <splitdl/cli/progress_bar.hpp>
#include <splitdl/cli/report.hpp>
#include <splitdl/core/config.hpp>
#include <splitdl/core/size_probe.hpp>
#include <splitdl/core/url.hpp>
#include <splitdl/version.hpp>
#include <spdlog/spdlog.h>
#include <charconv>
#include <chrono>
#include <filesystem>
#include <format>
#include <future>
#include <iostream>
#include <limits>

using namespace splitdl::core;

namespace chrono = std::chrono;

namespace splitdl::cli {

namespace {

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

// Shared validation for positional and option values
bool set_workers(CliArgs& args, std::string_view text) {
    auto value = parse_positive(text);
    if (!value || *value > std::numeric_limits<std::uint32_t>::max()) {
        args.error = std::format("Invalid worker count: '{}'", text);
        return false;
    }
    args.workers = static_cast<std::uint32_t>(*value);
    return true;
}

bool set_limit(CliArgs& args, std::string_view text) {
    auto value = parse_positive(text);
    if (!value || *value > std::numeric_limits<std::uint64_t>::max() / BYTES_PER_MEGABYTE) {
        args.error = std::format("Invalid limit in MB/s: '{}'", text);
        return false;
    }
    args.limit_mb = *value;
    return true;
}

std::uint64_t average_speed(const DownloadProgress& p) noexcept {
    auto seconds = chrono::duration<double>(p.elapsed).count();
    if (seconds <= 0.0) return 0;
    return static_cast<std::uint64_t>(static_cast<double>(p.downloaded_bytes) / seconds);
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

std::optional<std::uint64_t> parse_positive(std::string_view text) noexcept {
    if (text.empty()) return std::nullopt;

    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value == 0) {
        return std::nullopt;
    }
    return value;
}

CliArgs parse_args(int argc, const char* const argv[]) {
    CliArgs args;
    int positional = 0;

    // Value of an option that takes one, or nullptr after recording the error
    auto value_of = [&](int& i, std::string_view opt) -> const char* {
        if (i + 1 >= argc) {
            args.error = std::format("Option {} requires a value", opt);
            return nullptr;
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-i" || arg == "--info") {
            args.info = true;
        } else if (arg == "-o" || arg == "--output") {
            auto v = value_of(i, arg);
            if (!v) return args;
            args.output_file = v;
        } else if (arg == "-r" || arg == "--report") {
            auto v = value_of(i, arg);
            if (!v) return args;
            args.report_file = v;
        } else if (arg == "-n" || arg == "--workers") {
            auto v = value_of(i, arg);
            if (!v || !set_workers(args, v)) return args;
        } else if (arg == "-l" || arg == "--limit") {
            auto v = value_of(i, arg);
            if (!v || !set_limit(args, v)) return args;
        } else if (arg == "-s" || arg == "--strategy") {
            auto v = value_of(i, arg);
            if (!v) return args;
            auto strategy = parse_strategy(v);
            if (!strategy) {
                args.error = std::format("Unknown limiter strategy: '{}' (expected lazy or queue)", v);
                return args;
            }
            args.strategy = *strategy;
        } else if (arg == "-b" || arg == "--bench") {
            auto v = value_of(i, arg);
            if (!v) return args;
            auto runs = parse_positive(v);
            if (!runs || *runs > std::numeric_limits<std::uint32_t>::max()) {
                args.error = std::format("Invalid run count: '{}'", v);
                return args;
            }
            args.bench_runs = static_cast<std::uint32_t>(*runs);
        } else if (arg.size() > 1 && arg.front() == '-') {
            args.error = std::format("Unknown option: {}", arg);
            return args;
        } else {
            // <URL> [WORKERS] [LIMIT_MB]
            switch (positional++) {
                case 0: args.url = arg; break;
                case 1: if (!set_workers(args, arg)) return args; break;
                case 2: if (!set_limit(args, arg)) return args; break;
                default:
                    args.error = std::format("Unexpected argument: {}", arg);
                    return args;
            }
        }
    }

    return args;
}

bool prompt_args(CliArgs& args, std::istream& in, std::ostream& out) {
    std::string line;

    out << "> File URL: " << std::flush;
    if (!std::getline(in, line) || trim(line).empty()) {
        args.error = "No URL specified";
        return false;
    }
    args.url = std::string(trim(line));

    out << "Note: a very large number of workers can cause request errors or slowdowns.\n";
    out << "> Workers [" << args.workers << "]: " << std::flush;
    if (!std::getline(in, line)) {
        args.error = "Input ended before the worker count";
        return false;
    }
    if (!trim(line).empty() && !set_workers(args, trim(line))) {
        return false;
    }

    out << "> Max speed in MB/s [" << args.limit_mb << "]: " << std::flush;
    if (!std::getline(in, line)) {
        args.error = "Input ended before the speed limit";
        return false;
    }
    if (!trim(line).empty() && !set_limit(args, trim(line))) {
        return false;
    }

    return true;
}

DownloadConfig make_config(const CliArgs& args) {
    DownloadConfig config;
    config.workers = args.workers;
    config.limit_mb = args.limit_mb;
    config.strategy = args.strategy;
    config.output_path = args.output_file;
    return config;
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(const CliArgs& args) {
    DownloadEngine engine(args.url, make_config(args));

    auto pending = std::async(std::launch::async, [&engine] { return engine.run(); });

    ProgressBar bar(std::cout, 0, "Downloading");
    Spinner spinner(std::cout);
    bool bar_shown = false;

    if (!args.quiet) {
        while (pending.wait_for(PROGRESS_INTERVAL) != std::future_status::ready) {
            auto p = engine.progress();
            if (p.state == DownloadState::transferring) {
                if (!bar_shown) {
                    spinner.clear();
                    bar.total(p.total_bytes);
                    bar_shown = true;
                }
                bar.update(p.downloaded_bytes, average_speed(p));
            } else {
                spinner.update(to_string(p.state));
            }
        }
    }

    auto result = pending.get();

    if (!result) {
        if (bar_shown) bar.clear();
        spinner.clear();
        std::cerr << "Error: " << result.error().message() << std::endl;
        return std::unexpected(result.error());
    }

    if (!args.quiet) {
        if (!bar_shown) {
            spinner.clear();
            bar.total(result->target.total_size);
        }
        bar.update(result->bytes_written());
        bar.finish();
    }

    const auto seconds = chrono::duration<double>(result->elapsed).count();
    std::cout << "Saved " << result->output_path << " (" << format_bytes(result->bytes_written())
              << " in " << std::format("{:.2f}", seconds) << "s)" << std::endl;
    if (!result->complete()) {
        std::cout << result->failed_count() << " of " << result->results.size()
                  << " chunks failed; the file is incomplete" << std::endl;
    }

    if (!args.report_file.empty()) {
        if (auto ec = write_report(*result, args.report_file)) {
            std::cerr << "Error: cannot write report " << args.report_file << ": " << ec.message() << std::endl;
            return std::unexpected(ec);
        }
    }

    // A finished run exits 0 even when chunks failed
    return 0;
}

CliResult bench(const CliArgs& args) {
    chrono::steady_clock::duration total{};
    std::optional<RunReport> last;

    for (std::uint32_t run = 1; run <= args.bench_runs; ++run) {
        spdlog::info("Run {}/{}", run, args.bench_runs);

        DownloadEngine engine(args.url, make_config(args));
        auto result = engine.run();
        if (!result) {
            std::cerr << "Error: run " << run << " failed: " << result.error().message() << std::endl;
            return std::unexpected(result.error());
        }

        spdlog::info("Run {} took {:.3f}s", run, chrono::duration<double>(result->elapsed).count());
        total += result->elapsed;

        // Start the next run from an empty directory entry
        std::error_code ec;
        std::filesystem::remove(result->output_path, ec);
        if (ec) {
            spdlog::warn("Cannot remove {}: {}", result->output_path, ec.message());
        }

        last = std::move(*result);
    }

    const auto mean = chrono::duration<double>(total).count() / args.bench_runs;
    spdlog::info("Mean over {} runs: {:.3f}s", args.bench_runs, mean);
    std::cout << std::format("Mean over {} runs: {:.3f}s", args.bench_runs, mean) << std::endl;

    if (!args.report_file.empty() && last) {
        if (auto ec = write_report(*last, args.report_file)) {
            std::cerr << "Error: cannot write report " << args.report_file << ": " << ec.message() << std::endl;
            return std::unexpected(ec);
        }
    }

    return 0;
}

CliResult info(const std::string& url) {
    HttpSession session;
    auto response = session.head(url);
    if (!response) {
        std::cerr << "Error: " << response.error().message() << std::endl;
        return std::unexpected(response.error());
    }

    auto show = [&](const char* label, const char* name) {
        const auto* value = response->header(name);
        std::cout << label << (value ? *value : "(none)") << '\n';
    };

    std::cout << "URL: " << url << '\n';
    std::cout << "Status: " << response->status_code << '\n';
    show("Content-Type: ", "content-type");
    show("Content-Length: ", "content-length");
    show("Accept-Ranges: ", "accept-ranges");
    std::cout << "Output file: " << output_filename(url) << '\n';

    auto target = evaluate_probe(url, *response);
    if (!target) {
        std::cout << "Segmented download: no (" << target.error().message() << ")" << std::endl;
        return std::unexpected(target.error());
    }

    std::cout << "Segmented download: yes (" << format_bytes(target->total_size) << ")" << std::endl;
    return 0;
}

void print_help(std::string_view program_name) {
    std::cout << "splitdl " << version.to_string() << " - segmented HTTP downloader with a shared speed cap\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <URL> [WORKERS] [LIMIT_MB]\n";
    std::cout << "  " << program_name << "            (prompts for URL, workers and limit)\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Log every chunk\n";
    std::cout << "  -q, --quiet             Warnings and errors only, no progress bar\n";
    std::cout << "  -n, --workers <N>       Number of chunks/workers (default: "
              << DownloadConfig::DEFAULT_WORKERS << ")\n";
    std::cout << "  -l, --limit <MB>        Total speed cap in MB/s (default: "
              << DownloadConfig::DEFAULT_LIMIT_MB << ")\n";
    std::cout << "  -o, --output <FILE>     Save to FILE instead of the name from the URL\n";
    std::cout << "  -s, --strategy <S>      Limiter refill: lazy (default) or queue\n";
    std::cout << "  -b, --bench <RUNS>      Download RUNS times and report the mean time\n";
    std::cout << "  -r, --report <FILE>     Write a JSON report of the run\n";
    std::cout << "  -i, --info              Probe the URL without downloading\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://example.com/file.zip 8 5\n";
    std::cout << "  " << program_name << " -n 4 -l 2 -o out.iso https://example.com/large.iso\n";
    std::cout << "  " << program_name << " -b 30 -s queue https://example.com/file.zip 4 10\n";
}

void print_version() {
    std::cout << "splitdl " << version.to_string() << " (built " << BUILD_DATE << ")\n";
    std::cout << "Built with C++23, libcurl, spdlog\n";
}

} // namespace splitdl::cli
