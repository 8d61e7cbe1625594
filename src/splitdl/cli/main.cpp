// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/cli/commands.hpp>
#include <splitdl/core/download_engine.hpp>
#include <splitdl/core/logging.hpp>
#include <iostream>
#include <unistd.h>

using namespace splitdl::cli;
using namespace splitdl::core;

int main(int argc, char* argv[]) {
    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return 0;
    }
    if (args.version) {
        print_version();
        return 0;
    }

    init_logging(args.verbose ? LogLevel::debug : args.quiet ? LogLevel::warn : LogLevel::info);

    // No URL on the command line: ask for everything, as long as someone can answer
    if (args.error.empty() && args.url.empty()) {
        if (::isatty(STDIN_FILENO)) {
            if (!prompt_args(args, std::cin, std::cout) && args.error.empty()) {
                args.error = "Invalid input";
            }
        } else {
            args.error = "No URL specified";
        }
    }

    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return 1;
    }

    DownloadEngine::global_init();

    CliResult result;
    if (args.info) {
        result = info(args.url);
    } else if (args.bench_runs > 0) {
        result = bench(args);
    } else {
        result = download(args);
    }

    DownloadEngine::global_cleanup();

    return result ? *result : 1;
}
