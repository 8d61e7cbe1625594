// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitdl/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <string>

namespace splitdl::core {

// Status line and headers of the final response (after redirects).
// Header names are lower-cased; values are trimmed.
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;

    [[nodiscard]] const std::string* header(const std::string& lower_name) const noexcept {
        auto it = headers.find(lower_name);
        return it == headers.end() ? nullptr : &it->second;
    }
};

// Callbacks for a streamed GET. Returning an error from either aborts the
// transfer and becomes the transfer's result.
struct TransferHandlers {
    // Called once with the final status, before the first body block
    std::function<std::error_code(std::int32_t status)> on_status;
    // Called for every block of body data, in stream order
    std::function<std::error_code(const char* data, std::size_t size)> on_data;
};

// Thin libcurl wrapper. Stateless apart from global init, so one instance
// may be shared or each thread may own its own.
class HttpSession {
public:
    HttpSession() = default;

    // HEAD request. Transport failures and status >= 400 are errors; missing
    // headers are not (the caller decides what it needs).
    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const std::string& url) const noexcept;

    // GET with "Range: bytes=<first>-<last>", body streamed to `handlers`
    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    get_range(const std::string& url,
              std::uint64_t first,
              std::uint64_t last,
              const TransferHandlers& handlers) const noexcept;

    // Process-wide libcurl setup; safe to call more than once
    static void global_init() noexcept;
    static void global_cleanup() noexcept;
};

// Error for an HTTP status: empty below 400, else not_found (404),
// permission_denied (401/403), invalid_range (416) or server_error
[[nodiscard]] std::error_code http_status_error(std::int32_t status) noexcept;

} // namespace splitdl::core
