// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <splitdl/cli/commands.hpp>
#include <splitdl/cli/progress_bar.hpp>
#include <splitdl/cli/report.hpp>
#include "support/temp_dir.hpp"
#include "support/test_server.hpp"
#include <algorithm>
#include <filesystem>
#include <sstream>
#include <vector>

using namespace splitdl::cli;
using namespace splitdl::core;
using namespace splitdl::test;

namespace {

CliArgs parse(std::vector<const char*> argv) {
    argv.insert(argv.begin(), "splitdl");
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST_CASE("parse_positive", "[cli]") {
    CHECK(parse_positive("1") == 1u);
    CHECK(parse_positive("64") == 64u);
    CHECK(!parse_positive("0").has_value());
    CHECK(!parse_positive("-3").has_value());
    CHECK(!parse_positive("4x").has_value());
    CHECK(!parse_positive("").has_value());
    CHECK(!parse_positive(" 4").has_value());
}

TEST_CASE("parse_args - positional form", "[cli]") {
    SECTION("URL only keeps the defaults") {
        auto args = parse({"http://host/f.bin"});
        CHECK(args.error.empty());
        CHECK(args.url == "http://host/f.bin");
        CHECK(args.workers == DownloadConfig::DEFAULT_WORKERS);
        CHECK(args.limit_mb == DownloadConfig::DEFAULT_LIMIT_MB);
        CHECK(args.strategy == LimiterStrategy::lazy);
    }

    SECTION("URL, workers and limit") {
        auto args = parse({"http://host/f.bin", "8", "5"});
        CHECK(args.error.empty());
        CHECK(args.workers == 8);
        CHECK(args.limit_mb == 5);
    }

    SECTION("Invalid worker count") {
        CHECK(!parse({"http://host/f.bin", "0", "5"}).error.empty());
        CHECK(!parse({"http://host/f.bin", "abc", "5"}).error.empty());
        CHECK(!parse({"http://host/f.bin", "4294967296"}).error.empty());
    }

    SECTION("Invalid limit") {
        CHECK(!parse({"http://host/f.bin", "4", "0"}).error.empty());
        CHECK(!parse({"http://host/f.bin", "4", "1.5"}).error.empty());
        // Would overflow once converted to bytes per second
        CHECK(!parse({"http://host/f.bin", "4", "18446744073709551615"}).error.empty());
    }

    SECTION("Too many positionals") {
        CHECK(!parse({"http://host/f.bin", "4", "5", "extra"}).error.empty());
    }
}

TEST_CASE("parse_args - options", "[cli]") {
    SECTION("Everything") {
        auto args = parse({"-n", "16", "--limit", "3", "-o", "out.iso", "-s", "queue",
                           "-b", "30", "-r", "run.json", "-V", "https://host/x.iso"});
        CHECK(args.error.empty());
        CHECK(args.workers == 16);
        CHECK(args.limit_mb == 3);
        CHECK(args.output_file == "out.iso");
        CHECK(args.strategy == LimiterStrategy::queue);
        CHECK(args.bench_runs == 30);
        CHECK(args.report_file == "run.json");
        CHECK(args.verbose);
        CHECK(args.url == "https://host/x.iso");
    }

    SECTION("Flags") {
        auto args = parse({"-q", "-i", "http://host/x"});
        CHECK(args.quiet);
        CHECK(args.info);
    }

    SECTION("Help and version short-circuit") {
        CHECK(parse({"--bogus", "-h"}).error == "Unknown option: --bogus");
        CHECK(parse({"-h", "--bogus"}).help);
        CHECK(parse({"--version"}).version);
    }

    SECTION("Errors") {
        CHECK(parse({"-n"}).error == "Option -n requires a value");
        CHECK(!parse({"-s", "fast", "http://host/x"}).error.empty());
        CHECK(!parse({"-b", "0", "http://host/x"}).error.empty());
        CHECK(!parse({"--unknown", "http://host/x"}).error.empty());
    }

    SECTION("No URL is not a parse error") {
        auto args = parse({});
        CHECK(args.error.empty());
        CHECK(args.url.empty());
    }
}

TEST_CASE("prompt_args", "[cli]") {
    std::ostringstream out;

    SECTION("All answers given") {
        std::istringstream in("http://host/file.bin\n12\n7\n");
        CliArgs args;
        REQUIRE(prompt_args(args, in, out));
        CHECK(args.url == "http://host/file.bin");
        CHECK(args.workers == 12);
        CHECK(args.limit_mb == 7);
        CHECK(out.str().find("> Workers") != std::string::npos);
    }

    SECTION("Empty answers keep the defaults") {
        std::istringstream in("  http://host/file.bin  \n\n\n");
        CliArgs args;
        REQUIRE(prompt_args(args, in, out));
        CHECK(args.url == "http://host/file.bin");
        CHECK(args.workers == DownloadConfig::DEFAULT_WORKERS);
        CHECK(args.limit_mb == DownloadConfig::DEFAULT_LIMIT_MB);
    }

    SECTION("Invalid answers") {
        std::istringstream bad_workers("http://host/f\nmany\n1\n");
        CliArgs a;
        CHECK(!prompt_args(a, bad_workers, out));
        CHECK(!a.error.empty());

        std::istringstream no_url("\n");
        CliArgs b;
        CHECK(!prompt_args(b, no_url, out));
        CHECK(b.error == "No URL specified");

        std::istringstream truncated("http://host/f\n");
        CliArgs c;
        CHECK(!prompt_args(c, truncated, out));
    }
}

TEST_CASE("make_config", "[cli]") {
    auto args = parse({"-o", "x.bin", "-s", "queue", "http://host/f", "3", "9"});
    auto config = make_config(args);
    CHECK(config.workers == 3);
    CHECK(config.limit_mb == 9);
    CHECK(config.strategy == LimiterStrategy::queue);
    CHECK(config.output_path == "x.bin");
}

TEST_CASE("Formatting helpers", "[cli]") {
    CHECK(format_bytes(512) == "512 B");
    CHECK(format_bytes(2048) == "2 KB");
    CHECK(format_bytes(5 * 1024 * 1024 + 512 * 1024) == "5.5 MB");
    CHECK(format_bytes(3ull * 1024 * 1024 * 1024) == "3.00 GB");

    CHECK(format_speed(100) == "100 B/s");
    CHECK(format_speed(1536) == "1.5 KB/s");
    CHECK(format_speed(10 * 1024 * 1024) == "10.0 MB/s");

    CHECK(format_time(42) == "42s");
    CHECK(format_time(125) == "2m 5s");
    CHECK(format_time(3 * 3600 + 5 * 60 + 7) == "3h 05m 7s");
}

TEST_CASE("ProgressBar", "[cli]") {
    std::ostringstream out;
    ProgressBar bar(out, 1000, "Downloading");

    SECTION("Render") {
        CHECK(bar.render(0, 0) == "Downloading: [>                             ]   0% (0 B/1000 B)");
        CHECK(bar.render(1000, 0) == "Downloading: [==============================] 100% (1000 B/1000 B)");
        CHECK(bar.render(500, 100).find("@ 100 B/s ETA: 5s") != std::string::npos);
    }

    SECTION("Redraws only on whole-percent changes") {
        bar.update(100);
        auto first = out.str();
        bar.update(101);
        CHECK(out.str() == first);
        bar.update(200);
        CHECK(out.str().size() > first.size());
    }

    SECTION("Finish ends the line once") {
        bar.update(1000);
        bar.finish();
        bar.finish();
        auto text = out.str();
        CHECK(std::count(text.begin(), text.end(), '\n') == 1);
    }
}

TEST_CASE("Run report JSON", "[cli]") {
    RunReport report;
    report.target = {"http://host/f.bin", 1000, true};
    report.output_path = "f.bin";
    report.chunk_size = 500;
    report.elapsed = std::chrono::milliseconds(1234);
    report.results.push_back({{0, 0, 499}, 500, {}});
    report.results.push_back({{1, 500, 999}, 20, make_error_code(DownloadErrc::short_read)});

    auto json = report_to_json(report);
    CHECK(json["url"] == "http://host/f.bin");
    CHECK(json["total_size"] == 1000);
    CHECK(json["chunk_size"] == 500);
    CHECK(json["elapsed_ms"] == 1234);
    CHECK(json["bytes_written"] == 520);
    CHECK(json["failed"] == 1);
    REQUIRE(json["chunks"].size() == 2);
    CHECK(json["chunks"][0]["ok"] == true);
    CHECK(!json["chunks"][0].contains("error"));
    CHECK(json["chunks"][1]["end"] == 999);
    CHECK(json["chunks"][1]["ok"] == false);
    CHECK(json["chunks"][1]["error_category"] == "splitdl::download");

    SECTION("Written to disk") {
        TempDir dir;
        auto path = dir.file("report.json");
        REQUIRE(!write_report(report, path));
        CHECK(nlohmann::json::parse(read_file(path)) == json);
    }

    SECTION("Unwritable path") {
        TempDir dir;
        CHECK(write_report(report, dir.file("missing/report.json")));
    }
}

TEST_CASE("Commands against a live server", "[cli][http]") {
    const auto body = make_body(20'000);
    TestServer server(body);
    TempDir dir;

    SECTION("download") {
        CliArgs args;
        args.url = server.url();
        args.workers = 3;
        args.limit_mb = 16;
        args.quiet = true;
        args.output_file = dir.file("cli.bin");
        args.report_file = dir.file("cli.json");

        auto result = download(args);
        REQUIRE(result.has_value());
        CHECK(*result == 0);
        CHECK(read_file(args.output_file) == body);
        CHECK(nlohmann::json::parse(read_file(args.report_file))["failed"] == 0);
    }

    SECTION("bench removes the file after each run") {
        CliArgs args;
        args.url = server.url();
        args.workers = 2;
        args.limit_mb = 16;
        args.bench_runs = 3;
        args.output_file = dir.file("bench.bin");

        auto result = bench(args);
        REQUIRE(result.has_value());
        CHECK(server.head_count() == 3);
        CHECK(!std::filesystem::exists(args.output_file));
    }

    SECTION("info") {
        auto result = info(server.url());
        REQUIRE(result.has_value());
        CHECK(server.get_count() == 0);
        CHECK(info(server.url("/missing")).error() == make_error_code(DownloadErrc::not_found));
    }

    SECTION("Fatal download error") {
        TestServer plain(body, ServerOptions{.advertise_ranges = false});
        CliArgs args;
        args.url = plain.url();
        args.quiet = true;
        args.output_file = dir.file("never.bin");
        CHECK(download(args).error() == make_error_code(DownloadErrc::range_unsupported));
        CHECK(!std::filesystem::exists(args.output_file));
    }
}
