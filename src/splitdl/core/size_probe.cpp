// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/core/size_probe.hpp>
#include <spdlog/spdlog.h>
#include <charconv>

namespace splitdl::core {

std::optional<std::uint64_t> parse_content_length(std::string_view value) noexcept {
    if (value.empty()) return std::nullopt;

    std::uint64_t result = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc{} || ptr != value.data() + value.size()) {
        return std::nullopt;
    }
    return result;
}

std::expected<DownloadTarget, std::error_code>
evaluate_probe(const std::string& url, const HttpResponse& response) {
    const auto* accept_ranges = response.header("accept-ranges");
    if (!accept_ranges || *accept_ranges != "bytes") {
        return std::unexpected(make_error_code(DownloadErrc::range_unsupported));
    }

    const auto* content_length = response.header("content-length");
    if (!content_length) {
        return std::unexpected(make_error_code(DownloadErrc::missing_length));
    }

    auto size = parse_content_length(*content_length);
    if (!size) {
        return std::unexpected(make_error_code(DownloadErrc::missing_length));
    }

    return DownloadTarget{url, *size, true};
}

std::expected<DownloadTarget, std::error_code>
probe_target(const HttpSession& session, const std::string& url) {
    auto response = session.head(url);
    if (!response) {
        spdlog::error("Probe of {} failed: {}", url, response.error().message());
        return std::unexpected(response.error());
    }

    auto target = evaluate_probe(url, *response);
    if (!target) {
        spdlog::error("Cannot download {}: {}", url, target.error().message());
        return target;
    }

    spdlog::info("Remote size: {} bytes", target->total_size);
    return target;
}

} // namespace splitdl::core
