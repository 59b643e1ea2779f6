#pragma once
// ═══════════════════════════════════════════════════════════════════
//  fedgate/config.h — Gateway configuration file
// ═══════════════════════════════════════════════════════════════════
//
//  {
//    "server":    { "host": "0.0.0.0", "port": 4000, "threads": 4,
//                   "maxBodyBytes": 1048576, "readTimeoutMs": 30000 },
//    "subgraphs": [ { "name": "workflow", "url": "http://localhost:4001/graphql",
//                     "healthUrl": "http://localhost:4001/health" } ],
//    "planCache": { "maxEntries": 1000, "ttlMs": 300000 },
//    "health":    { "intervalMs": 5000, "timeoutMs": 2000, "slowThresholdMs": 1000,
//                   "degradedAfter": 2, "downAfter": 3 },
//    "requestTimeoutMs": 10000,
//    "fetchTimeoutMs": 5000,
//    "maxQueryDepth": 15,
//    "logLevel": "info",
//    "adminEnabled": false
//  }
//
//  Absent keys keep their defaults. FEDGATE_PORT and FEDGATE_LOG_LEVEL
//  override the file.
// ═══════════════════════════════════════════════════════════════════

#include "errors.h"
#include "json_utils.h"
#include <cstddef>
#include <string>
#include <vector>

namespace fedgate::config {

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 4000;
    int threads = 4;
    std::size_t maxBodyBytes = 1024 * 1024;
    int readTimeoutMs = 30000;
    std::vector<std::string> corsOrigins;   // empty: any origin

    FEDGATE_SERIALIZE_WITH_DEFAULT(ServerConfig, host, port, threads, maxBodyBytes, readTimeoutMs,
                                   corsOrigins)
};

struct SubgraphConfig {
    std::string name;
    std::string url;
    std::string healthUrl;

    bool operator==(const SubgraphConfig&) const = default;

    FEDGATE_SERIALIZE_WITH_DEFAULT(SubgraphConfig, name, url, healthUrl)
};

struct PlanCacheConfig {
    std::size_t maxEntries = 1000;
    int ttlMs = 300000;

    FEDGATE_SERIALIZE_WITH_DEFAULT(PlanCacheConfig, maxEntries, ttlMs)
};

struct HealthConfig {
    int intervalMs = 5000;
    int timeoutMs = 2000;
    int slowThresholdMs = 1000;
    int degradedAfter = 2;
    int downAfter = 3;

    FEDGATE_SERIALIZE_WITH_DEFAULT(HealthConfig, intervalMs, timeoutMs, slowThresholdMs,
                                   degradedAfter, downAfter)
};

struct GatewayConfig {
    ServerConfig server;
    std::vector<SubgraphConfig> subgraphs;
    PlanCacheConfig planCache;
    HealthConfig health;
    int requestTimeoutMs = 10000;
    int fetchTimeoutMs = 5000;
    int maxQueryDepth = 15;   // field nesting accepted from clients
    std::string logLevel = "info";
    bool adminEnabled = false;

    FEDGATE_SERIALIZE_WITH_DEFAULT(GatewayConfig, server, subgraphs, planCache, health,
                                   requestTimeoutMs, fetchTimeoutMs, maxQueryDepth, logLevel,
                                   adminEnabled)
};

// Decode and validate; throws ConfigError
GatewayConfig parseConfig(const nlohmann::json& j);

// Read `path`, apply environment overrides, validate; throws ConfigError
GatewayConfig loadConfig(const std::string& path);

// FEDGATE_PORT / FEDGATE_LOG_LEVEL
void applyEnvironment(GatewayConfig& config);

void validate(const GatewayConfig& config);

} // namespace fedgate::config
