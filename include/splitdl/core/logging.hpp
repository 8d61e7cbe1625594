// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>

namespace splitdl::core {

enum class LogLevel : std::uint8_t {
    debug,
    info,
    warn,
    error,
    off
};

// Install the process-wide default logger: colour sink on stderr so that
// stdout stays free for the progress bar and --info output. Safe to call
// again to change the level.
void init_logging(LogLevel level = LogLevel::info);

} // namespace splitdl::core
