// ═══════════════════════════════════════════════════════════════════
//  src/config.cpp — Configuration decoding, overrides and validation
// ═══════════════════════════════════════════════════════════════════

#include "fedgate/config.h"
#include "fedgate/console.h"
#include "fedgate/graphql.h"
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

namespace fedgate::config {

namespace {

void require(bool condition, const std::string& message) {
    if (!condition) throw ConfigError(message);
}

int parsePort(const std::string& text) {
    std::size_t consumed = 0;
    int port = 0;
    try {
        port = std::stoi(text, &consumed);
    } catch (const std::logic_error&) {
        throw ConfigError("FEDGATE_PORT must be a number, got '" + text + "'");
    }
    require(consumed == text.size(), "FEDGATE_PORT must be a number, got '" + text + "'");
    return port;
}

} // namespace

GatewayConfig parseConfig(const nlohmann::json& j) {
    if (!j.is_object()) throw ConfigError("Configuration must be a JSON object");
    GatewayConfig config;
    try {
        config = j.get<GatewayConfig>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid configuration: ") + e.what());
    }
    validate(config);
    return config;
}

GatewayConfig loadConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file) throw ConfigError("Cannot open configuration file '" + path + "'");
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto j = nlohmann::json::parse(buffer.str(), nullptr, false, true);
    if (j.is_discarded()) throw ConfigError("Configuration file '" + path + "' is not valid JSON");

    auto config = parseConfig(j);
    applyEnvironment(config);
    validate(config);
    console::debug("Loaded configuration from", path, "with", config.subgraphs.size(), "subgraph(s)");
    return config;
}

void applyEnvironment(GatewayConfig& config) {
    if (const char* port = std::getenv("FEDGATE_PORT"); port && *port) {
        config.server.port = parsePort(port);
    }
    if (const char* level = std::getenv("FEDGATE_LOG_LEVEL"); level && *level) {
        config.logLevel = level;
    }
}

void validate(const GatewayConfig& config) {
    require(config.server.port > 0 && config.server.port <= 65535,
            "server.port must be between 1 and 65535");
    require(config.server.threads >= 1, "server.threads must be at least 1");
    require(!config.server.host.empty(), "server.host must not be empty");
    require(config.server.maxBodyBytes >= 1024, "server.maxBodyBytes must be at least 1024");
    require(config.server.readTimeoutMs > 0, "server.readTimeoutMs must be positive");

    std::set<std::string> names;
    for (auto& subgraph : config.subgraphs) {
        require(!subgraph.name.empty(), "every subgraph needs a name");
        require(names.insert(subgraph.name).second, "subgraph '" + subgraph.name + "' is listed twice");
        require(subgraph.url.rfind("http://", 0) == 0,
                "subgraph '" + subgraph.name + "' url must start with http://");
        require(subgraph.healthUrl.empty() || subgraph.healthUrl.rfind("http://", 0) == 0,
                "subgraph '" + subgraph.name + "' healthUrl must start with http://");
    }

    require(config.planCache.maxEntries >= 1, "planCache.maxEntries must be at least 1");
    require(config.planCache.ttlMs >= 0, "planCache.ttlMs must not be negative");

    require(config.health.intervalMs > 0, "health.intervalMs must be positive");
    require(config.health.timeoutMs > 0, "health.timeoutMs must be positive");
    require(config.health.slowThresholdMs > 0, "health.slowThresholdMs must be positive");
    require(config.health.degradedAfter >= 1, "health.degradedAfter must be at least 1");
    require(config.health.downAfter >= 1, "health.downAfter must be at least 1");

    require(config.requestTimeoutMs > 0, "requestTimeoutMs must be positive");
    require(config.fetchTimeoutMs > 0, "fetchTimeoutMs must be positive");
    require(config.maxQueryDepth >= 1 &&
                config.maxQueryDepth <= static_cast<int>(graphql::kMaxNesting),
            "maxQueryDepth must be between 1 and " + std::to_string(graphql::kMaxNesting));

    try {
        console::parseLevel(config.logLevel);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(std::string("logLevel: ") + e.what());
    }
}

} // namespace fedgate::config
