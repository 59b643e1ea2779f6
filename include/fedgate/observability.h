#pragma once
// ═══════════════════════════════════════════════════════════════════
//  fedgate/observability.h — Request ids
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include "crypto.h"
#include <algorithm>
#include <cctype>
#include <string>

namespace fedgate::observability {

inline std::string generateRequestId() {
    return crypto::randomHex(8);
}

// Client-supplied ids end up in log lines: short, printable tokens only
inline bool acceptableRequestId(const std::string& id) {
    return !id.empty() && id.size() <= 128 && std::all_of(id.begin(), id.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == ':';
    });
}

// Keeps an acceptable incoming X-Request-Id, otherwise mints one. The id
// is echoed on the response and read back by the request logger.
inline http::MiddlewareFunction requestId() {
    return [](http::Request& req, http::Response& res, http::NextFunction next) {
        auto id = req.header("x-request-id");
        if (!acceptableRequestId(id)) id = generateRequestId();
        req.headers["x-request-id"] = id;
        res.set("X-Request-Id", id);
        next();
    };
}

} // namespace fedgate::observability
