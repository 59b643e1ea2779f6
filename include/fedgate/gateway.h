#pragma once
// ═══════════════════════════════════════════════════════════════════
//  fedgate/gateway.h — Registry, planner, executor and health wired up
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto cfg = config::loadConfig("gateway.json");
//    gateway::Gateway gw(cfg, std::make_shared<client::HttpSubgraphClient>());
//    gw.loadServiceDefinitions();          // _service { sdl } from every subgraph
//    gw.start();                           // health polling
//
//    auto app = http::createServer();
//    gw.mount(app);                        // /graphql, /health, /schema, /subgraphs
//    app.listen(cfg.server.host, cfg.server.port, cfg.server.threads);
//
// ═══════════════════════════════════════════════════════════════════

#include "config.h"
#include "executor.h"
#include "health_monitor.h"
#include "http.h"
#include "plan_cache.h"
#include "schema_registry.h"
#include <memory>
#include <mutex>
#include <string>

namespace fedgate::gateway {

// ── {query, variables, operationName} ──
struct GraphQLRequest {
    std::string query;
    nlohmann::json variables = nlohmann::json::object();
    std::string operationName;

    // Throws PlanningError when `body` is not a GraphQL request object
    static GraphQLRequest fromJson(const nlohmann::json& body);
};

health::HealthOptions healthOptions(const config::HealthConfig& config);
plan_cache::Options planCacheOptions(const config::PlanCacheConfig& config);

class Gateway {
public:
    Gateway(config::GatewayConfig config, std::shared_ptr<client::SubgraphClient> client);
    ~Gateway();

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    // Always answers {data, errors}; request-level failures come back with data: null.
    // GET requests pass allowMutations = false.
    nlohmann::json execute(const GraphQLRequest& request, bool allowMutations = true);

    // Fetch and register every configured subgraph's SDL, then compose.
    // Failures are logged per subgraph; returns how many SDLs were loaded.
    std::size_t loadServiceDefinitions();

    // Apply a new configuration and recompose; throws ConfigError and keeps
    // the current configuration when `next` is invalid
    void reload(config::GatewayConfig next);

    void start();   // health polling
    void stop();

    void mount(http::Server& server);

    nlohmann::json healthReport() const;
    nlohmann::json subgraphsReport() const;

    config::GatewayConfig config() const;
    schema::SchemaRegistry& registry() { return registry_; }
    health::HealthMonitor& health() { return health_; }
    plan_cache::PlanCache& plans() { return plans_; }

private:
    mutable std::mutex configMutex_;
    config::GatewayConfig config_;
    std::shared_ptr<client::SubgraphClient> client_;
    schema::SchemaRegistry registry_;
    health::HealthMonitor health_;
    plan_cache::PlanCache plans_;
    executor::Executor executor_;
    std::mutex loadMutex_;

    bool loadSubgraph(const config::SubgraphConfig& subgraph, std::chrono::milliseconds timeout);
    void composeRegistered();
    void applyTargets(const config::GatewayConfig& config);
};

} // namespace fedgate::gateway
