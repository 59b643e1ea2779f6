#pragma once
// ═══════════════════════════════════════════════════════════════════
//  fedgate/http.h — HTTP server, Request and Response
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto app = http::createServer();
//    app.use(middleware::bodyParser());
//    app.post("/graphql", [&](http::Request& req, http::Response& res) {
//        res.json(gateway.execute(GraphQLRequest::fromJson(req.body.raw())));
//    });
//    app.listen("0.0.0.0", 4000, 4, [] { console::info("Listening on :4000"); });
//
// ═══════════════════════════════════════════════════════════════════

#include "json_utils.h"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace fedgate::http {

class Request;
class Response;
class Server;

using NextFunction       = std::function<void()>;
using MiddlewareFunction = std::function<void(Request&, Response&, NextFunction)>;
using RouteHandler       = std::function<void(Request&, Response&)>;

// ═══════════════════════════════════════════════════════════════════
//  class Request
//  Filled by the transport (or testkit); req.body by bodyParser.
// ═══════════════════════════════════════════════════════════════════
class Request {
public:
    std::string method;
    std::string url;            // target as received, query string included
    std::string path;
    std::string rawBody;
    std::string ip;
    std::string hostname;       // Host header value
    std::chrono::steady_clock::time_point receivedAt = std::chrono::steady_clock::now();

    std::unordered_map<std::string, std::string> headers;   // lowercase keys
    std::unordered_map<std::string, std::string> params;    // "/subgraphs/:name" → params["name"]
    std::unordered_map<std::string, std::string> query;     // decoded query string

    JsonValue body;

    // Case-insensitive; empty when absent
    std::string header(const std::string& name) const;

    // Content-Type contains `type`
    bool is(const std::string& type) const;
};

// ═══════════════════════════════════════════════════════════════════
//  class Response
//  Sent at most once, through a callback so the transport (or a test)
//  decides where the bytes go.
// ═══════════════════════════════════════════════════════════════════
class Response {
public:
    using Headers = std::unordered_map<std::string, std::string>;
    using SendCallback = std::function<void(int statusCode, const Headers& headers,
                                            const std::string& body)>;
    // Runs just before the body leaves; may rewrite headers and body
    using BodyTransform = std::function<void(int statusCode, Headers& headers, std::string& body)>;

    Response() = default;
    explicit Response(SendCallback cb) : sendCallback_(std::move(cb)) {}

    Response& status(int code) {
        statusCode_ = code;
        return *this;
    }

    Response& set(const std::string& key, const std::string& value) {
        headers_[key] = value;
        return *this;
    }

    Response& type(const std::string& contentType) { return set("Content-Type", contentType); }

    void beforeSend(BodyTransform transform) { transforms_.push_back(std::move(transform)); }

    // text/plain unless a Content-Type was set; later calls are ignored
    void send(const std::string& body);
    void json(const nlohmann::json& body);
    void end() { send(""); }

    bool headersSent() const { return sent_; }
    int getStatusCode() const { return statusCode_; }
    const Headers& getHeaders() const { return headers_; }
    const std::string& getBody() const { return body_; }

private:
    int statusCode_ = 200;
    Headers headers_;
    std::string body_;
    bool sent_ = false;
    SendCallback sendCallback_;
    std::vector<BodyTransform> transforms_;
};

// ── Per-connection limits ──
struct Limits {
    std::size_t maxBodyBytes = 1024 * 1024;   // larger bodies get 413
    int readTimeoutMs = 30000;                // idle keep-alive connections close after this
};

// ═══════════════════════════════════════════════════════════════════
//  class Server
//  Routes are matched segment by segment; `:name` captures one
//  segment into req.params. A path that exists under another method
//  answers 405 with an Allow header, anything else 404. Boost.Beast
//  stays behind the pimpl.
// ═══════════════════════════════════════════════════════════════════
class Server {
public:
    Server();
    ~Server();
    Server(Server&&) noexcept;
    Server& operator=(Server&&) noexcept;

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    Server& use(MiddlewareFunction middleware);

    Server& get(const std::string& path, RouteHandler handler) {
        addRoute("GET", path, std::move(handler));
        return *this;
    }

    Server& post(const std::string& path, RouteHandler handler) {
        addRoute("POST", path, std::move(handler));
        return *this;
    }

    // Call before listen()
    void setLimits(const Limits& limits);

    // Blocks until close(); the calling thread is one of `threads`
    void listen(const std::string& host, int port, int threads = 1,
                std::function<void()> callback = nullptr);

    void close();

    // Middleware chain then routing, without a socket (transport and tests)
    void handleRequest(Request& req, Response& res);

private:
    friend class HttpSession;
    friend class HttpListener;

    struct Impl;
    std::unique_ptr<Impl> impl_;

    void addRoute(const std::string& method, const std::string& pattern, RouteHandler handler);
};

inline Server createServer() {
    return Server();
}

} // namespace fedgate::http
