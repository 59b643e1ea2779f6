// ═══════════════════════════════════════════════════════════════════
//  src/subgraph_client.cpp — GraphQL over HTTP to subgraphs
// ═══════════════════════════════════════════════════════════════════

#include "fedgate/subgraph_client.h"
#include "fedgate/console.h"
#include "fedgate/fetch.h"

namespace fedgate::client {

nlohmann::json SubgraphRequest::body() const {
    nlohmann::json out = {{"query", query}};
    if (!variables.is_null() && !variables.empty()) out["variables"] = variables;
    if (!operationName.empty()) out["operationName"] = operationName;
    return out;
}

SubgraphResponse parseResponse(const std::string& subgraph, const std::string& body) {
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw FetchError(subgraph, "Subgraph '" + subgraph + "' returned malformed JSON: " + e.what());
    }
    if (!parsed.is_object() || (!parsed.contains("data") && !parsed.contains("errors"))) {
        throw FetchError(subgraph, "Subgraph '" + subgraph + "' returned a body that is not a GraphQL response");
    }

    SubgraphResponse response;
    response.data = parsed.value("data", nlohmann::json());
    if (parsed.contains("errors") && parsed["errors"].is_array()) {
        response.errors = parsed["errors"];
    }
    return response;
}

void SubgraphClient::checkHealth(const CheckTarget& target, std::chrono::milliseconds timeout) {
    SubgraphRequest request;
    request.subgraph = target.subgraph;
    request.url = target.url;
    request.query = "{ __typename }";
    request.timeout = timeout;
    auto response = execute(request);
    if (!response.errors.empty() && response.data.is_null()) {
        throw FetchError(target.subgraph, "Health check of '" + target.subgraph + "' returned errors: " +
                                                 response.errors.dump());
    }
}

SubgraphResponse HttpSubgraphClient::execute(const SubgraphRequest& request) {
    std::unordered_map<std::string, std::string> headers(request.headers.begin(), request.headers.end());
    auto res = fetch::post(request.url, request.body(), headers,
                           static_cast<int>(request.timeout.count()));

    if (res.timedOut) {
        throw FetchError(request.subgraph, "Subgraph '" + request.subgraph + "' " + res.error,
                         codes::Timeout);
    }
    if (res.status == 0) {
        throw FetchError(request.subgraph, "Subgraph '" + request.subgraph + "' is unreachable: " + res.error);
    }
    if (!res.ok()) {
        // GraphQL servers may answer 4xx/5xx with a well-formed error body
        if (res.headers["content-type"].find("json") != std::string::npos) {
            auto parsed = nlohmann::json::parse(res.body, nullptr, false);
            if (parsed.is_object() && parsed.contains("errors")) return parseResponse(request.subgraph, res.body);
        }
        throw FetchError(request.subgraph, "Subgraph '" + request.subgraph + "' responded with HTTP " +
                                           std::to_string(res.status) + " " + res.statusText);
    }
    console::debug("fetch", request.subgraph, res.status, res.body.size(), "bytes");
    return parseResponse(request.subgraph, res.body);
}

void HttpSubgraphClient::checkHealth(const CheckTarget& target, std::chrono::milliseconds timeout) {
    if (target.healthUrl.empty()) {
        SubgraphClient::checkHealth(target, timeout);
        return;
    }
    auto res = fetch::get(target.healthUrl, {}, static_cast<int>(timeout.count()));
    if (res.timedOut) {
        throw FetchError(target.subgraph, "Health check of '" + target.subgraph + "' " + res.error,
                         codes::Timeout);
    }
    if (!res.ok()) {
        throw FetchError(target.subgraph, "Health check of '" + target.subgraph + "' failed: " +
                         (res.status == 0 ? res.error : "HTTP " + std::to_string(res.status)));
    }
}

} // namespace fedgate::client
