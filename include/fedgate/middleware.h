#pragma once
// ═══════════════════════════════════════════════════════════════════
//  fedgate/middleware.h — Middleware for the gateway endpoint
// ═══════════════════════════════════════════════════════════════════
//
//    bodyParser()     JSON bodies into req.body, GraphQL-shaped 400 otherwise
//    cors()           Access-Control-* headers and preflight
//    requestLogger()  status, latency, operation name and request id
//
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include "console.h"
#include "errors.h"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace fedgate::middleware {

// ═══════════════════════════════════════════
//  bodyParser — Automatic JSON body parsing
// ═══════════════════════════════════════════
//  `application/json` bodies become req.body; invalid JSON is a 400
//  carrying a GraphQL-shaped error so clients see one error format.
//
inline http::MiddlewareFunction bodyParser() {
    return [](http::Request& req, http::Response& res, http::NextFunction next) {
        if (req.is("application/json") && !req.rawBody.empty()) {
            try {
                req.body = JsonValue(nlohmann::json::parse(req.rawBody));
            } catch (const nlohmann::json::exception& e) {
                res.status(400).json(nlohmann::json{
                    {"data", nullptr},
                    {"errors", nlohmann::json::array({graphqlError(
                        std::string("Invalid JSON body: ") + e.what(), nullptr, codes::ParseFailed)})}
                });
                return;
            }
        }
        next();
    };
}

// ═══════════════════════════════════════════
//  cors — browser access to /graphql
// ═══════════════════════════════════════════
//  An empty allow-list answers every origin with "*". Otherwise a
//  listed Origin is echoed back and unlisted ones get no CORS headers.
//
struct CorsOptions {
    std::vector<std::string> origins;
    std::string methods      = "GET, POST, OPTIONS";
    std::string allowHeaders = "Content-Type, Authorization, X-Request-Id";
    std::string exposeHeaders = "X-Request-Id";
    bool        credentials  = false;
    int         maxAgeSeconds = 86400;
};

inline http::MiddlewareFunction cors(CorsOptions options = {}) {
    return [options](http::Request& req, http::Response& res, http::NextFunction next) {
        std::string allowOrigin = "*";
        if (!options.origins.empty()) {
            auto origin = req.header("origin");
            bool listed = std::find(options.origins.begin(), options.origins.end(), origin) !=
                          options.origins.end();
            allowOrigin = listed ? origin : "";
            res.set("Vary", "Origin");
        }

        if (!allowOrigin.empty()) {
            res.set("Access-Control-Allow-Origin", allowOrigin);
            res.set("Access-Control-Allow-Methods", options.methods);
            res.set("Access-Control-Allow-Headers", options.allowHeaders);
            if (!options.exposeHeaders.empty()) res.set("Access-Control-Expose-Headers", options.exposeHeaders);
            if (options.credentials) res.set("Access-Control-Allow-Credentials", "true");
        }

        if (req.method == "OPTIONS") {
            if (!allowOrigin.empty()) res.set("Access-Control-Max-Age", std::to_string(options.maxAgeSeconds));
            res.status(204).end();
            return;
        }
        next();
    };
}

// ═══════════════════════════════════════════
//  requestLogger — one line per request
// ═══════════════════════════════════════════
//  "POST /graphql 200 12.4ms op=GetWorkflow [3f9a...]". 5xx is logged
//  as an error, 4xx as a warning, the rest at info.
//
inline http::MiddlewareFunction requestLogger() {
    return [](http::Request& req, http::Response& res, http::NextFunction next) {
        next();
        auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - req.receivedAt).count();

        std::ostringstream line;
        line << req.method << ' ' << req.path << ' ' << res.getStatusCode() << ' '
             << std::fixed << std::setprecision(1) << micros / 1000.0 << "ms";
        auto operation = req.body.get<std::string>("operationName", "");
        if (!operation.empty()) line << " op=" << operation;
        auto id = req.header("x-request-id");
        if (!id.empty()) line << " [" << id << "]";

        int status = res.getStatusCode();
        if (status >= 500) console::error(line.str());
        else if (status >= 400) console::warn(line.str());
        else console::info(line.str());
    };
}

} // namespace fedgate::middleware
