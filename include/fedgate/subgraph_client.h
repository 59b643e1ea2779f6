#pragma once
// ═══════════════════════════════════════════════════════════════════
//  fedgate/subgraph_client.h — Transport seam to subgraphs
// ═══════════════════════════════════════════════════════════════════
//
//  The executor and the health monitor only see SubgraphClient; the
//  gateway wires HttpSubgraphClient, tests wire scripted clients.
// ═══════════════════════════════════════════════════════════════════

#include "errors.h"
#include <chrono>
#include <map>
#include <memory>
#include <string>

namespace fedgate::client {

struct SubgraphRequest {
    std::string subgraph;
    std::string url;
    std::string query;
    nlohmann::json variables = nlohmann::json::object();
    std::string operationName;
    std::chrono::milliseconds timeout{5000};
    std::map<std::string, std::string> headers;

    nlohmann::json body() const;
};

struct SubgraphResponse {
    nlohmann::json data;                                  // null when absent
    nlohmann::json errors = nlohmann::json::array();
};

// Where and how to check one subgraph
struct CheckTarget {
    std::string subgraph;
    std::string url;
    std::string healthUrl;    // empty: check with `{ __typename }`
};

class SubgraphClient {
public:
    virtual ~SubgraphClient() = default;

    // Throws FetchError (code FETCH_ERROR or TIMEOUT) on transport failure,
    // non-2xx status or a body that is not a GraphQL response
    virtual SubgraphResponse execute(const SubgraphRequest& request) = 0;

    // Throws FetchError when the subgraph is not answering
    virtual void checkHealth(const CheckTarget& target, std::chrono::milliseconds timeout);
};

// ── Boost.Beast implementation ──
class HttpSubgraphClient : public SubgraphClient {
public:
    SubgraphResponse execute(const SubgraphRequest& request) override;
    void checkHealth(const CheckTarget& target, std::chrono::milliseconds timeout) override;
};

// Validate and split a GraphQL response body; throws FetchError
SubgraphResponse parseResponse(const std::string& subgraph, const std::string& body);

} // namespace fedgate::client
