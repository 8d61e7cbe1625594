// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/core/url.hpp>
#include <splitdl/core/config.hpp>
#include <algorithm>
#include <cctype>
#include <exception>

namespace splitdl::core {

namespace {

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    try {
        Url url;

        // Parse scheme
        auto scheme_end = url_str.find("://");
        if (scheme_end == std::string_view::npos || scheme_end == 0) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        url.scheme_.reserve(scheme_end);
        for (std::size_t i = 0; i < scheme_end; ++i) {
            url.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
        }

        auto rest_start = scheme_end + 3; // Skip "://"

        auto path_start = url_str.find('/', rest_start);
        if (path_start == std::string_view::npos) {
            path_start = url_str.length();
        }

        auto query_start = url_str.find('?', rest_start);
        if (query_start == std::string_view::npos) {
            query_start = url_str.length();
        }

        auto fragment_start = url_str.find('#', rest_start);
        if (fragment_start == std::string_view::npos) {
            fragment_start = url_str.length();
        }

        // host_end is at the first of: /, ?, #, or end
        auto host_end = std::min({path_start, query_start, fragment_start});

        // Skip user:pass@ if present
        std::size_t authority_start = rest_start;
        auto at_pos = url_str.find('@', rest_start);
        if (at_pos != std::string_view::npos && at_pos < host_end) {
            authority_start = at_pos + 1;
        }

        auto bracket_start = url_str.find('[', authority_start);
        if (bracket_start != std::string_view::npos && bracket_start < host_end) {
            // IPv6 literal [::1]:port
            auto bracket_end = url_str.find(']', bracket_start);
            if (bracket_end == std::string_view::npos || bracket_end >= host_end) {
                return std::unexpected(make_error_code(DownloadErrc::invalid_url));
            }
            url.host_ = url_str.substr(bracket_start, bracket_end - bracket_start + 1);
            if (bracket_end + 1 < host_end && url_str[bracket_end + 1] == ':') {
                url.port_ = url_str.substr(bracket_end + 2, host_end - bracket_end - 2);
            }
        } else {
            auto colon_pos = url_str.find(':', authority_start);
            if (colon_pos != std::string_view::npos && colon_pos < host_end) {
                url.host_ = url_str.substr(authority_start, colon_pos - authority_start);
                url.port_ = url_str.substr(colon_pos + 1, host_end - colon_pos - 1);
            } else {
                url.host_ = url_str.substr(authority_start, host_end - authority_start);
            }
        }

        if (url.host_.empty()) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }
        if (!std::all_of(url.port_.begin(), url.port_.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        if (path_start == host_end && path_start < url_str.length()) {
            auto path_end = std::min(query_start, fragment_start);
            url.path_ = url_str.substr(path_start, path_end - path_start);
        } else {
            url.path_ = "/";
        }

        if (query_start < fragment_start) {
            url.query_ = url_str.substr(query_start + 1, fragment_start - query_start - 1);
        }

        if (fragment_start < url_str.length()) {
            url.fragment_ = url_str.substr(fragment_start + 1);
        }

        url.str_ = url_str;
        return url;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }
}

std::string Url::filename() const {
    // Decode first so an escaped '/' still separates segments
    std::string decoded = percent_decode(path_);
    auto last_slash = decoded.rfind('/');
    if (last_slash != std::string::npos) {
        decoded.erase(0, last_slash + 1);
    }
    if (decoded.empty() || decoded == "." || decoded == "..") {
        return "index.html";
    }
    return decoded;
}

std::optional<std::string> Url::query_param(std::string_view name) const {
    std::string_view rest = query_;
    while (!rest.empty()) {
        auto amp = rest.find('&');
        auto pair = rest.substr(0, amp);
        rest = amp == std::string_view::npos ? std::string_view{} : rest.substr(amp + 1);

        auto eq = pair.find('=');
        auto key = percent_decode(pair.substr(0, eq), true);
        if (key != name) continue;

        if (eq == std::string_view::npos) return std::string{};
        return percent_decode(pair.substr(eq + 1), true);
    }
    return std::nullopt;
}

std::string percent_decode(std::string_view in, bool plus_as_space) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        if (c == '%' && i + 2 < in.size()) {
            int hi = hex_value(in[i + 1]);
            int lo = hex_value(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        if (c == '+' && plus_as_space) {
            out += ' ';
            continue;
        }
        out += c;
    }
    return out;
}

std::string output_filename(std::string_view url_str) {
    auto url = Url::parse(url_str);
    if (!url) {
        return FALLBACK_FILENAME;
    }

    std::string name = url->filename();

    auto format = url->query_param("format");
    if (format && !format->empty()) {
        // Extension is everything from the last dot of the basename
        auto dot = name.rfind('.');
        if (dot != std::string::npos) {
            name.erase(dot);
        }
        name += '.';
        name += *format;
    }
    return name;
}

} // namespace splitdl::core
