// Copyright (c) 2026 changcheng967. All rights reserved.

#include "test_server.hpp"
#include <boost/asio/ip/address.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <algorithm>
#include <charconv>
#include <format>

namespace splitdl::test {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

std::string to_std(beast::string_view s) {
    return std::string(s.data(), s.size());
}

// "bytes=<first>-<last>" only; that is all the client sends
bool parse_range(std::string_view header, std::uint64_t& first, std::uint64_t& last) {
    constexpr std::string_view prefix = "bytes=";
    if (!header.starts_with(prefix)) return false;
    header.remove_prefix(prefix.size());

    auto dash = header.find('-');
    if (dash == std::string_view::npos) return false;

    auto a = header.substr(0, dash);
    auto b = header.substr(dash + 1);
    auto [pa, ea] = std::from_chars(a.data(), a.data() + a.size(), first);
    auto [pb, eb] = std::from_chars(b.data(), b.data() + b.size(), last);
    return ea == std::errc{} && eb == std::errc{}
        && pa == a.data() + a.size() && pb == b.data() + b.size()
        && first <= last;
}

} // namespace

std::string make_body(std::size_t size) {
    std::string body(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        body[i] = static_cast<char>((i * 31 + i / 251 + 7) & 0xff);
    }
    return body;
}

TestServer::TestServer(std::string body, ServerOptions options)
    : body_(std::move(body))
    , options_(std::move(options))
    , acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)) {
    port_ = acceptor_.local_endpoint().port();
    accept_thread_ = std::thread([this] { accept_loop(); });
}

TestServer::~TestServer() {
    stopping_ = true;

    // Unblock accept() with a throwaway connection
    {
        net::io_context ctx;
        tcp::socket wake(ctx);
        beast::error_code ec;
        wake.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port_), ec);
    }

    accept_thread_.join();
    for (auto& t : connections_) {
        t.join();
    }
}

std::string TestServer::url(std::string_view path) const {
    return std::format("http://127.0.0.1:{}{}", port_, path);
}

std::vector<std::string> TestServer::range_headers() const {
    std::lock_guard lock(mutex_);
    return range_headers_;
}

std::size_t TestServer::head_count() const {
    std::lock_guard lock(mutex_);
    return head_count_;
}

std::size_t TestServer::get_count() const {
    std::lock_guard lock(mutex_);
    return get_count_;
}

void TestServer::accept_loop() {
    while (!stopping_) {
        tcp::socket socket(ioc_);
        beast::error_code ec;
        acceptor_.accept(socket, ec);
        if (ec || stopping_) break;
        connections_.emplace_back([this, s = std::move(socket)]() mutable { serve(std::move(s)); });
    }
}

void TestServer::serve(tcp::socket socket) {
    beast::flat_buffer buffer;
    beast::error_code ec;

    for (;;) {
        http::request<http::string_body> req;
        http::read(socket, buffer, req, ec);
        if (ec) break;

        const bool missing = req.target() == "/missing";

        if (req.method() == http::verb::head) {
            {
                std::lock_guard lock(mutex_);
                ++head_count_;
            }

            http::response<http::empty_body> res{missing ? http::status::not_found : http::status::ok,
                                                 req.version()};
            res.set(http::field::server, "splitdl-test");
            res.keep_alive(req.keep_alive());
            if (!missing) {
                if (options_.advertise_ranges) res.set(http::field::accept_ranges, "bytes");
                if (options_.send_length) res.content_length(body_.size());
            } else {
                res.content_length(0);
            }

            http::response_serializer<http::empty_body> sr{res};
            http::write_header(socket, sr, ec);
            if (ec || !req.keep_alive()) break;
            continue;
        }

        const auto range = to_std(req[http::field::range]);
        {
            std::lock_guard lock(mutex_);
            ++get_count_;
            if (!range.empty()) range_headers_.push_back(range);
        }

        http::response<http::string_body> res{http::status::ok, req.version()};
        res.set(http::field::server, "splitdl-test");
        res.keep_alive(req.keep_alive());

        std::uint64_t first = 0;
        std::uint64_t last = 0;

        if (missing) {
            res.result(http::status::not_found);
            res.body() = "not found";
        } else if (range.empty() || options_.ignore_range) {
            res.set(http::field::accept_ranges, "bytes");
            res.body() = body_;
        } else if (!parse_range(range, first, last) || first >= body_.size()) {
            res.result(http::status::range_not_satisfiable);
            res.set(http::field::content_range, std::format("bytes */{}", body_.size()));
        } else if (options_.failing_starts.contains(first)) {
            res.result(http::status::internal_server_error);
            res.body() = "boom";
        } else {
            last = std::min<std::uint64_t>(last, body_.size() - 1);
            std::uint64_t count = last - first + 1;
            if (options_.overrun_starts.contains(first)) {
                count = std::min<std::uint64_t>(count + 100, body_.size() - first);
            }
            if (options_.short_starts.contains(first)) {
                count /= 2;
            }
            res.result(http::status::partial_content);
            res.set(http::field::content_range, std::format("bytes {}-{}/{}", first, last, body_.size()));
            res.body() = body_.substr(static_cast<std::size_t>(first), static_cast<std::size_t>(count));
        }

        res.prepare_payload();
        http::write(socket, res, ec);
        if (ec || !req.keep_alive()) break;
    }

    socket.shutdown(tcp::socket::shutdown_send, ec);
}

} // namespace splitdl::test
