// ═══════════════════════════════════════════════════════════════════
//  src/http.cpp — Routing, middleware chain and the Beast transport
// ═══════════════════════════════════════════════════════════════════

#include "fedgate/http.h"
#include "fedgate/console.h"

#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <optional>
#include <string_view>
#include <thread>

namespace fedgate::http {

namespace beast = boost::beast;
namespace net   = boost::asio;
namespace bhttp = beast::http;
using tcp       = net::ip::tcp;

using StringMap = std::unordered_map<std::string, std::string>;

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Form/URL decoding; malformed escapes are kept literally
std::string percentDecode(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '+') {
            out += ' ';
            continue;
        }
        if (in[i] == '%' && i + 2 < in.size()) {
            int hi = hexValue(in[i + 1]);
            int lo = hexValue(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += in[i];
    }
    return out;
}

StringMap parseQuery(std::string_view qs) {
    StringMap out;
    while (!qs.empty()) {
        auto amp = qs.find('&');
        auto pair = qs.substr(0, amp);
        qs = amp == std::string_view::npos ? std::string_view() : qs.substr(amp + 1);
        if (pair.empty()) continue;

        auto eq = pair.find('=');
        out[percentDecode(pair.substr(0, eq))] =
            eq == std::string_view::npos ? std::string() : percentDecode(pair.substr(eq + 1));
    }
    return out;
}

// "/a//b/" → {"a", "b"}
std::vector<std::string> splitPath(std::string_view path) {
    std::vector<std::string> segments;
    std::string segment;
    for (char c : path) {
        if (c != '/') {
            segment += c;
        } else if (!segment.empty()) {
            segments.push_back(std::move(segment));
            segment.clear();
        }
    }
    if (!segment.empty()) segments.push_back(std::move(segment));
    return segments;
}

struct Route {
    std::string method;
    std::vector<std::string> segments;
    RouteHandler handler;

    bool matches(const std::vector<std::string>& parts, StringMap& params) const {
        if (parts.size() != segments.size()) return false;
        StringMap captured;
        for (std::size_t i = 0; i < parts.size(); ++i) {
            if (segments[i].size() > 1 && segments[i][0] == ':') {
                captured[segments[i].substr(1)] = percentDecode(parts[i]);
            } else if (segments[i] != parts[i]) {
                return false;
            }
        }
        params = std::move(captured);
        return true;
    }
};

nlohmann::json errorBody(const std::string& error, const std::string& message) {
    return {{"error", error}, {"message", message}};
}

} // namespace

// ═══════════════════════════════════════════
//  Request / Response
// ═══════════════════════════════════════════
std::string Request::header(const std::string& name) const {
    auto it = headers.find(lowercase(name));
    return it != headers.end() ? it->second : "";
}

bool Request::is(const std::string& type) const {
    return header("content-type").find(type) != std::string::npos;
}

void Response::send(const std::string& body) {
    if (sent_) return;
    sent_ = true;
    headers_.emplace("Content-Type", "text/plain; charset=utf-8");
    body_ = body;
    for (auto& transform : transforms_) transform(statusCode_, headers_, body_);
    if (sendCallback_) sendCallback_(statusCode_, headers_, body_);
}

void Response::json(const nlohmann::json& body) {
    set("Content-Type", "application/json; charset=utf-8");
    send(body.dump());
}

// ═══════════════════════════════════════════
//  Server::Impl
// ═══════════════════════════════════════════
struct Server::Impl {
    std::vector<MiddlewareFunction>  middlewares;
    std::vector<Route>               routes;
    Limits                           limits;
    std::unique_ptr<net::io_context> ioc;
    std::vector<std::thread>         workers;
    std::atomic<bool>                running{false};

    // Middleware `index` gets a next() that continues with index + 1
    void runChain(Request& req, Response& res, std::size_t index) {
        if (res.headersSent()) return;
        if (index == middlewares.size()) {
            dispatch(req, res);
            return;
        }
        middlewares[index](req, res, [this, &req, &res, index] { runChain(req, res, index + 1); });
    }

    void dispatch(Request& req, Response& res) {
        auto parts = splitPath(req.path);
        std::string allowed;

        for (auto& route : routes) {
            StringMap params;
            if (!route.matches(parts, params)) continue;
            if (route.method != req.method) {
                if (allowed.find(route.method) == std::string::npos) {
                    allowed += (allowed.empty() ? "" : ", ") + route.method;
                }
                continue;
            }
            req.params = std::move(params);
            invoke(route, req, res);
            return;
        }

        if (!allowed.empty()) {
            res.status(405).set("Allow", allowed)
               .json(errorBody("Method Not Allowed", "Cannot " + req.method + " " + req.path));
            return;
        }
        res.status(404).json(errorBody("Not Found", "Cannot " + req.method + " " + req.path));
    }

    static void invoke(const Route& route, Request& req, Response& res) {
        try {
            route.handler(req, res);
        } catch (const std::exception& e) {
            console::error("Unhandled error in", req.method, req.path + ":", e.what());
            if (!res.headersSent()) res.status(500).json(errorBody("Internal Server Error", e.what()));
        }
    }
};

// ═══════════════════════════════════════════
//  HttpSession — one keep-alive connection
// ═══════════════════════════════════════════
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket socket, Server::Impl& server, Limits limits)
        : stream_(std::move(socket))
        , server_(server)
        , limits_(limits) {}

    void run() { readRequest(); }

private:
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<bhttp::request_parser<bhttp::string_body>> parser_;
    Server::Impl& server_;
    Limits limits_;
    unsigned version_ = 11;
    bool keepAlive_ = false;

    void readRequest() {
        parser_.emplace();
        parser_->body_limit(limits_.maxBodyBytes);
        stream_.expires_after(std::chrono::milliseconds(limits_.readTimeoutMs));
        bhttp::async_read(stream_, buffer_, *parser_,
                          [self = shared_from_this()](beast::error_code ec, std::size_t) {
                              self->onRead(ec);
                          });
    }

    void onRead(beast::error_code ec) {
        if (ec == bhttp::error::body_limit) {
            version_ = parser_->get().version();
            keepAlive_ = false;
            write(413, {{"Content-Type", "application/json; charset=utf-8"}},
                  errorBody("Payload Too Large", "Request bodies are limited to " +
                                                 std::to_string(limits_.maxBodyBytes) + " bytes").dump());
            return;
        }
        if (ec == bhttp::error::end_of_stream) {
            close();
            return;
        }
        if (ec) {
            if (ec != beast::error::timeout) console::debug("Dropping connection:", ec.message());
            return;
        }
        stream_.expires_never();
        process(parser_->release());
    }

    void process(bhttp::request<bhttp::string_body> incoming) {
        version_ = incoming.version();
        keepAlive_ = incoming.keep_alive();

        Request req;
        req.method = std::string(incoming.method_string());
        req.url = std::string(incoming.target());
        auto q = req.url.find('?');
        req.path = req.url.substr(0, q);
        if (q != std::string::npos) req.query = parseQuery(std::string_view(req.url).substr(q + 1));
        req.rawBody = std::move(incoming.body());
        for (auto& field : incoming) {
            req.headers[lowercase(std::string(field.name_string()))] = std::string(field.value());
        }
        req.hostname = req.header("host");

        beast::error_code ec;
        auto remote = stream_.socket().remote_endpoint(ec);
        req.ip = ec ? "unknown" : remote.address().to_string();

        Response res([self = shared_from_this()](int status, const Response::Headers& headers,
                                                 const std::string& body) {
            self->write(status, headers, body);
        });
        server_.runChain(req, res, 0);
        if (!res.headersSent()) {
            res.status(500).json(errorBody("Internal Server Error", "No response was produced"));
        }
    }

    void write(int status, const Response::Headers& headers, const std::string& body) {
        auto out = std::make_shared<bhttp::response<bhttp::string_body>>(
            static_cast<bhttp::status>(status), version_);
        for (auto& [key, value] : headers) {
            if (!value.empty()) out->set(key, value);
        }
        out->set(bhttp::field::server, "fedgate");
        out->keep_alive(keepAlive_);
        out->body() = body;
        out->prepare_payload();

        stream_.expires_after(std::chrono::milliseconds(limits_.readTimeoutMs));
        bhttp::async_write(stream_, *out,
                           [self = shared_from_this(), out](beast::error_code ec, std::size_t) {
                               if (ec || !self->keepAlive_) {
                                   self->close();
                                   return;
                               }
                               self->readRequest();
                           });
    }

    void close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }
};

// ═══════════════════════════════════════════
//  HttpListener — accept loop
// ═══════════════════════════════════════════
class HttpListener : public std::enable_shared_from_this<HttpListener> {
public:
    HttpListener(net::io_context& ioc, const tcp::endpoint& endpoint, Server::Impl& server)
        : ioc_(ioc)
        , acceptor_(net::make_strand(ioc))
        , server_(server) {
        beast::error_code ec;
        auto check = [&ec, &endpoint](const std::string& stage) {
            if (ec) {
                throw std::runtime_error("Cannot " + stage + " " + endpoint.address().to_string() + ":" +
                                         std::to_string(endpoint.port()) + ": " + ec.message());
            }
        };
        acceptor_.open(endpoint.protocol(), ec);
        check("open");
        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        check("configure");
        acceptor_.bind(endpoint, ec);
        check("bind");
        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        check("listen on");
    }

    void accept() {
        acceptor_.async_accept(net::make_strand(ioc_),
                               [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
                                   if (!ec) {
                                       std::make_shared<HttpSession>(std::move(socket), self->server_,
                                                                     self->server_.limits)->run();
                                   } else if (ec == net::error::operation_aborted) {
                                       return;
                                   }
                                   self->accept();
                               });
    }

private:
    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    Server::Impl& server_;
};

// ═══════════════════════════════════════════
//  Server
// ═══════════════════════════════════════════
Server::Server() : impl_(std::make_unique<Impl>()) {}
Server::~Server() = default;
Server::Server(Server&&) noexcept = default;
Server& Server::operator=(Server&&) noexcept = default;

Server& Server::use(MiddlewareFunction middleware) {
    impl_->middlewares.push_back(std::move(middleware));
    return *this;
}

void Server::addRoute(const std::string& method, const std::string& pattern, RouteHandler handler) {
    impl_->routes.push_back({method, splitPath(pattern), std::move(handler)});
}

void Server::setLimits(const Limits& limits) {
    impl_->limits = limits;
}

void Server::handleRequest(Request& req, Response& res) {
    impl_->runChain(req, res, 0);
}

void Server::listen(const std::string& host, int port, int threads, std::function<void()> callback) {
    threads = std::max(1, threads);
    impl_->ioc = std::make_unique<net::io_context>(threads);

    tcp::endpoint endpoint(net::ip::make_address(host), static_cast<unsigned short>(port));
    std::make_shared<HttpListener>(*impl_->ioc, endpoint, *impl_)->accept();
    impl_->running = true;
    if (callback) callback();

    // The calling thread is one of the `threads` runners
    for (int i = 1; i < threads; ++i) {
        impl_->workers.emplace_back([ioc = impl_->ioc.get()] { ioc->run(); });
    }
    impl_->ioc->run();

    for (auto& worker : impl_->workers) {
        if (worker.joinable()) worker.join();
    }
    impl_->workers.clear();
}

void Server::close() {
    if (impl_->ioc && impl_->running.exchange(false)) impl_->ioc->stop();
}

} // namespace fedgate::http
