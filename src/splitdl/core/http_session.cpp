// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/core/http_session.hpp>
#include <splitdl/core/config.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <cctype>
#include <format>
#include <mutex>
#include <string_view>

namespace splitdl::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

// Header callback for HEAD/GET responses
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers) return total;

    std::string_view header(buffer, total);

    // A new status line starts a new header block (redirects, 100-continue)
    if (header.starts_with("HTTP/")) {
        headers->clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' ||
                              value.back() == ' ' || value.back() == '\t')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    (*headers)[lower_name] = std::string(value);
    return total;
}

// State shared with the GET write callback
struct TransferContext {
    CURL* curl{nullptr};
    const TransferHandlers* handlers{nullptr};
    bool status_seen{false};
    std::error_code error;
};

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* ctx = static_cast<TransferContext*>(userdata);
    std::size_t bytes = size * nmemb;

    try {
        if (!ctx->status_seen) {
            ctx->status_seen = true;
            long http_code = 0;
            curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &http_code);
            if (ctx->handlers->on_status) {
                ctx->error = ctx->handlers->on_status(static_cast<std::int32_t>(http_code));
                if (ctx->error) return 0;
            }
        }

        if (ctx->handlers->on_data) {
            ctx->error = ctx->handlers->on_data(ptr, bytes);
            if (ctx->error) return 0;
        }
    } catch (const std::exception& e) {
        spdlog::error("transfer handler threw: {}", e.what());
        ctx->error = make_error_code(DownloadErrc::write_failed);
        return 0;
    }

    return bytes;
}

std::error_code curl_error_to_error_code(CURLcode code) noexcept {
    switch (code) {
        case CURLE_TOO_MANY_REDIRECTS:  return make_error_code(DownloadErrc::too_many_redirects);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL: return make_error_code(DownloadErrc::invalid_url);
        case CURLE_WRITE_ERROR:         return make_error_code(DownloadErrc::write_failed);
        default:                        return make_error_code(DownloadErrc::network_error);
    }
}

void apply_common_options(CURL* curl, const std::string& url) noexcept {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);  // Required with many threads
    if constexpr (FOLLOW_REDIRECTS) {
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    }
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);
    // No CONNECTTIMEOUT / LOW_SPEED_*: a stalled transfer waits indefinitely
}

} // namespace

std::error_code http_status_error(std::int32_t status) noexcept {
    if (status < 400) return {};
    switch (status) {
        case 404: return make_error_code(DownloadErrc::not_found);
        case 401:
        case 403: return make_error_code(DownloadErrc::permission_denied);
        case 416: return make_error_code(DownloadErrc::invalid_range);
        default:  return make_error_code(DownloadErrc::server_error);
    }
}

std::expected<HttpResponse, std::error_code>
HttpSession::head(const std::string& url) const noexcept {
    global_init();

    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    HttpResponse response{};

    apply_common_options(curl.ptr, url);
    curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &response.headers);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        spdlog::debug("HEAD {} failed: {}", url, curl_easy_strerror(result));
        return std::unexpected(curl_error_to_error_code(result));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<std::int32_t>(http_code);

    if (auto ec = http_status_error(response.status_code)) {
        return std::unexpected(ec);
    }

    return response;
}

std::expected<HttpResponse, std::error_code>
HttpSession::get_range(const std::string& url,
                       std::uint64_t first,
                       std::uint64_t last,
                       const TransferHandlers& handlers) const noexcept {
    global_init();

    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    HttpResponse response{};
    TransferContext ctx;
    ctx.curl = curl.ptr;
    ctx.handlers = &handlers;

    std::string range;
    try {
        range = std::format("{}-{}", first, last);  // Sent as "Range: bytes=<first>-<last>"
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_range));
    }

    apply_common_options(curl.ptr, url);
    curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(READ_QUANTUM));
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &ctx);

    CURLcode result = curl_easy_perform(curl.ptr);

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<std::int32_t>(http_code);

    // A handler's own error wins over the CURLE_WRITE_ERROR it caused
    if (ctx.error) {
        return std::unexpected(ctx.error);
    }

    if (result != CURLE_OK) {
        spdlog::debug("GET {} range {} failed: {}", url, range, curl_easy_strerror(result));
        return std::unexpected(curl_error_to_error_code(result));
    }

    if (auto ec = http_status_error(response.status_code)) {
        return std::unexpected(ec);
    }

    // Body-less success still reports its status to the caller
    if (!ctx.status_seen && handlers.on_status) {
        if (auto ec = handlers.on_status(response.status_code)) {
            return std::unexpected(ec);
        }
    }

    return response;
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace splitdl::core
