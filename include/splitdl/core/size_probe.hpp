// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitdl/core/error.hpp>
#include <splitdl/core/http_session.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace splitdl::core {

// What the server told us about the resource; immutable once probed
struct DownloadTarget {
    std::string url;
    std::uint64_t total_size{0};
    bool supports_range{false};
};

// Strict decimal parse: digits only, no sign, no whitespace, no overflow
[[nodiscard]] std::optional<std::uint64_t> parse_content_length(std::string_view value) noexcept;

// Decide whether a HEAD response describes a downloadable target.
// Requires "Accept-Ranges: bytes" (range_unsupported) and a numeric
// Content-Length (missing_length), in that order.
[[nodiscard]] std::expected<DownloadTarget, std::error_code>
evaluate_probe(const std::string& url, const HttpResponse& response);

// HEAD the URL and evaluate the answer. Transport failures come back as
// network_error. Never retried.
[[nodiscard]] std::expected<DownloadTarget, std::error_code>
probe_target(const HttpSession& session, const std::string& url);

} // namespace splitdl::core
