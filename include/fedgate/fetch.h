#pragma once
// ═══════════════════════════════════════════════════════════════════
//  fedgate/fetch.h — HTTP client for subgraph calls and checks
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto resp = fetch::get("http://localhost:4001/health", {}, 2000);
//    auto resp = fetch::post("http://localhost:4001/graphql", {{"query", "{ __typename }"}});
//    if (resp.timedOut) ...
//
//  Transport failures never throw: they come back as status 0 with
//  `error` set, and `timedOut` when the deadline expired.
// ═══════════════════════════════════════════════════════════════════

#include "compress.h"
#include "json_utils.h"
#include <algorithm>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

namespace fedgate::fetch {

namespace beast = boost::beast;
namespace http_ns = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

struct FetchResponse {
    int status = 0;
    std::string statusText;
    std::string body;
    std::unordered_map<std::string, std::string> headers;   // lowercase keys
    std::string error;
    bool timedOut = false;

    bool ok() const { return status >= 200 && status < 300; }

    nlohmann::json json() const {
        return nlohmann::json::parse(body);
    }
};

struct RequestOptions {
    std::string url;
    std::string method = "GET";
    std::unordered_map<std::string, std::string> headers;
    std::string body;
    int timeoutMs = 30000;
};

namespace detail {

struct ParsedUrl {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
};

inline ParsedUrl parseUrl(const std::string& url) {
    ParsedUrl parsed;
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        parsed.scheme = "http";
        schemeEnd = 0;
    } else {
        parsed.scheme = url.substr(0, schemeEnd);
        schemeEnd += 3;
    }

    auto pathStart = url.find('/', schemeEnd);
    std::string hostPort;
    if (pathStart == std::string::npos) {
        hostPort = url.substr(schemeEnd);
        parsed.path = "/";
    } else {
        hostPort = url.substr(schemeEnd, pathStart - schemeEnd);
        parsed.path = url.substr(pathStart);
    }

    auto colonPos = hostPort.find(':');
    if (colonPos != std::string::npos) {
        parsed.host = hostPort.substr(0, colonPos);
        parsed.port = hostPort.substr(colonPos + 1);
    } else {
        parsed.host = hostPort;
        parsed.port = (parsed.scheme == "https") ? "443" : "80";
    }

    return parsed;
}

inline std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s;
}

// getaddrinfo cannot be interrupted, and an asio resolver waits for it
// even after cancel(). The lookup runs on a detached thread with its own
// io_context so the caller can walk away at the deadline.
inline std::optional<tcp::resolver::results_type> resolveBefore(
    const std::string& host, const std::string& port,
    std::chrono::steady_clock::time_point deadline, beast::error_code& ec) {
    struct Lookup {
        beast::error_code ec;
        tcp::resolver::results_type results;
    };
    auto promise = std::make_shared<std::promise<Lookup>>();
    auto future = promise->get_future();
    std::thread([promise, host, port] {
        asio::io_context ioc;
        tcp::resolver resolver(ioc);
        Lookup lookup;
        lookup.results = resolver.resolve(host, port, lookup.ec);
        promise->set_value(std::move(lookup));
    }).detach();

    if (future.wait_until(deadline) != std::future_status::ready) {
        ec = beast::error::timeout;
        return std::nullopt;
    }
    auto lookup = future.get();
    ec = lookup.ec;
    if (ec) return std::nullopt;
    return std::move(lookup.results);
}

} // namespace detail

// ── Make an HTTP request bounded by opts.timeoutMs end to end ──
inline FetchResponse request(const RequestOptions& opts) {
    FetchResponse response;
    auto parsed = detail::parseUrl(opts.url);
    if (parsed.scheme != "http") {
        response.error = "Unsupported URL scheme '" + parsed.scheme + "'";
        return response;
    }

    asio::io_context ioc;
    beast::tcp_stream stream(ioc);
    beast::error_code ec;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(opts.timeoutMs);

    auto fail = [&](const std::string& stage) {
        response.status = 0;
        response.timedOut = ec == beast::error::timeout;
        response.error = response.timedOut
            ? stage + " timed out after " + std::to_string(opts.timeoutMs) + "ms"
            : stage + " failed: " + ec.message();
        return response;
    };

    auto results = detail::resolveBefore(parsed.host, parsed.port, deadline, ec);
    if (!results) return fail("resolve " + parsed.host);

    // tcp_stream timeouts only apply to async operations
    stream.expires_at(deadline);
    stream.async_connect(*results, [&](beast::error_code e, const tcp::endpoint&) { ec = e; });
    ioc.run();
    if (ec) return fail("connect to " + parsed.host + ":" + parsed.port);

    auto verb = http_ns::string_to_verb(opts.method);
    if (verb == http_ns::verb::unknown) verb = http_ns::verb::get;

    http_ns::request<http_ns::string_body> req{verb, parsed.path, 11};
    req.set(http_ns::field::host, parsed.host);
    req.set(http_ns::field::user_agent, "fedgate/1.0");
    req.set(http_ns::field::accept_encoding, "gzip");
    for (auto& [key, val] : opts.headers) {
        req.set(key, val);
    }
    if (!opts.body.empty()) {
        req.body() = opts.body;
        req.prepare_payload();
        if (req.find(http_ns::field::content_type) == req.end()) {
            req.set(http_ns::field::content_type, "application/json");
        }
    }

    ioc.restart();
    stream.expires_at(deadline);
    http_ns::async_write(stream, req, [&](beast::error_code e, std::size_t) { ec = e; });
    ioc.run();
    if (ec) return fail("write");

    beast::flat_buffer buffer;
    http_ns::response<http_ns::string_body> res;
    ioc.restart();
    stream.expires_at(deadline);
    http_ns::async_read(stream, buffer, res, [&](beast::error_code e, std::size_t) { ec = e; });
    ioc.run();
    if (ec) return fail("read");

    response.status = static_cast<int>(res.result_int());
    response.statusText = std::string(res.reason());
    response.body = std::move(res.body());
    for (auto& field : res) {
        response.headers[detail::toLower(std::string(field.name_string()))] = std::string(field.value());
    }

    auto encoding = response.headers.find("content-encoding");
    if (encoding != response.headers.end() && encoding->second.find("gzip") != std::string::npos) {
        try {
            response.body = compress::gzipDecompress(response.body);
        } catch (const compress::CompressionError& e) {
            response.status = 0;
            response.error = std::string("invalid gzip body: ") + e.what();
            return response;
        }
    }

    beast::error_code shutdownEc;
    stream.socket().shutdown(tcp::socket::shutdown_both, shutdownEc);
    return response;
}

inline FetchResponse get(const std::string& url,
                         const std::unordered_map<std::string, std::string>& headers = {},
                         int timeoutMs = 30000) {
    return request({.url = url, .method = "GET", .headers = headers, .timeoutMs = timeoutMs});
}

inline FetchResponse post(const std::string& url, const nlohmann::json& body,
                          const std::unordered_map<std::string, std::string>& headers = {},
                          int timeoutMs = 30000) {
    auto h = headers;
    h["Content-Type"] = "application/json";
    return request({.url = url, .method = "POST", .headers = h, .body = body.dump(),
                    .timeoutMs = timeoutMs});
}

} // namespace fedgate::fetch
