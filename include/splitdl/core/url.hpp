// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitdl/core/error.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace splitdl::core {

class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] std::string_view scheme() const noexcept { return scheme_; }
    [[nodiscard]] std::string_view host() const noexcept { return host_; }
    [[nodiscard]] std::string_view port() const noexcept { return port_; }
    [[nodiscard]] std::string_view path() const noexcept { return path_; }
    [[nodiscard]] std::string_view query() const noexcept { return query_; }
    [[nodiscard]] std::string_view fragment() const noexcept { return fragment_; }

    // The URL exactly as it was given to parse()
    [[nodiscard]] const std::string& str() const noexcept { return str_; }

    // Last path segment, percent-decoded. Directory URLs give "index.html".
    [[nodiscard]] std::string filename() const;

    // First value of a query parameter, percent-decoded
    [[nodiscard]] std::optional<std::string> query_param(std::string_view name) const;

    Url() = default;

private:
    std::string str_;
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
};

// Decode %XX escapes (and '+' when `plus_as_space` is set)
[[nodiscard]] std::string percent_decode(std::string_view in, bool plus_as_space = false);

// Local file name for a download URL: the path basename, with its extension
// replaced when the query carries a non-empty `format` parameter.
[[nodiscard]] std::string output_filename(std::string_view url_str);

} // namespace splitdl::core
