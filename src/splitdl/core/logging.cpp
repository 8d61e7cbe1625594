// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/core/logging.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <mutex>

namespace splitdl::core {

namespace {

spdlog::level::level_enum to_spdlog(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::debug: return spdlog::level::debug;
        case LogLevel::info:  return spdlog::level::info;
        case LogLevel::warn:  return spdlog::level::warn;
        case LogLevel::error: return spdlog::level::err;
        case LogLevel::off:   return spdlog::level::off;
    }
    return spdlog::level::info;
}

} // namespace

void init_logging(LogLevel level) {
    static std::once_flag once;
    std::call_once(once, [] {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto logger = std::make_shared<spdlog::logger>("splitdl", std::move(sink));
        logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        spdlog::set_default_logger(std::move(logger));
    });
    spdlog::set_level(to_spdlog(level));
}

} // namespace splitdl::core
