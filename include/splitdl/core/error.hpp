// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace splitdl::core {

enum class DownloadErrc {
    success = 0,
    network_error,       // transport failure (connect, DNS, TLS, reset)
    range_unsupported,   // server does not answer Accept-Ranges: bytes
    missing_length,      // Content-Length absent or not a number
    not_found,
    permission_denied,
    server_error,
    invalid_url,
    invalid_argument,
    invalid_range,       // 416, or body overruns the requested range
    range_ignored,       // 200 OK for a partial range
    short_read,          // body ended before the range was filled
    write_failed,
    too_many_redirects,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "splitdl::download";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:             return "Success";
            case DownloadErrc::network_error:       return "Network error";
            case DownloadErrc::range_unsupported:   return "Server does not support range requests";
            case DownloadErrc::missing_length:      return "Server did not return a usable Content-Length";
            case DownloadErrc::not_found:           return "Resource not found (404)";
            case DownloadErrc::permission_denied:   return "Permission denied";
            case DownloadErrc::server_error:        return "Server error";
            case DownloadErrc::invalid_url:         return "Invalid URL";
            case DownloadErrc::invalid_argument:    return "Invalid argument";
            case DownloadErrc::invalid_range:       return "Invalid byte range";
            case DownloadErrc::range_ignored:       return "Server ignored the range request";
            case DownloadErrc::short_read:          return "Response body shorter than requested range";
            case DownloadErrc::write_failed:        return "Write to output file failed";
            case DownloadErrc::too_many_redirects:  return "Too many redirects";
            default:                                return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

} // namespace splitdl::core

namespace std {

template<>
struct is_error_code_enum<splitdl::core::DownloadErrc> : true_type {};

} // namespace std
