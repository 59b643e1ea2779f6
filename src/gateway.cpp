// ═══════════════════════════════════════════════════════════════════
//  src/gateway.cpp — Request pipeline, service loading, HTTP routes
// ═══════════════════════════════════════════════════════════════════

#include "fedgate/gateway.h"
#include "fedgate/console.h"
#include <algorithm>

namespace fedgate::gateway {

using json = nlohmann::json;

namespace {

json failure(const json& error) {
    return {{"data", nullptr}, {"errors", json::array({error})}};
}

} // namespace

GraphQLRequest GraphQLRequest::fromJson(const nlohmann::json& body) {
    if (!body.is_object()) throw PlanningError("Request body must be a JSON object");
    GraphQLRequest request;
    auto query = body.find("query");
    if (query == body.end() || !query->is_string() || query->get<std::string>().empty()) {
        throw PlanningError("Must provide query string.");
    }
    request.query = query->get<std::string>();

    auto variables = body.find("variables");
    if (variables != body.end() && !variables->is_null()) {
        if (!variables->is_object()) throw PlanningError("Variables must be a JSON object");
        request.variables = *variables;
    }
    auto name = body.find("operationName");
    if (name != body.end() && name->is_string()) request.operationName = name->get<std::string>();
    return request;
}

health::HealthOptions healthOptions(const config::HealthConfig& config) {
    return {
        .intervalMs = config.intervalMs,
        .timeoutMs = config.timeoutMs,
        .slowThresholdMs = config.slowThresholdMs,
        .degradedAfter = config.degradedAfter,
        .downAfter = config.downAfter,
    };
}

plan_cache::Options planCacheOptions(const config::PlanCacheConfig& config) {
    return {.maxEntries = config.maxEntries, .ttlMs = config.ttlMs};
}

// ═══════════════════════════════════════════
//  Gateway
// ═══════════════════════════════════════════

Gateway::Gateway(config::GatewayConfig config, std::shared_ptr<client::SubgraphClient> client)
    : config_(std::move(config))
    , client_(std::move(client))
    , health_(client_, healthOptions(config_.health))
    , plans_(planCacheOptions(config_.planCache))
    , executor_(client_, {.fetchTimeout = std::chrono::milliseconds(config_.fetchTimeoutMs)}) {
    applyTargets(config_);

    // A subgraph that was unreachable at startup gets its SDL once it answers
    health_.onTransition([this](const std::string& name, health::HealthState, health::HealthState to) {
        if (to != health::HealthState::Healthy || registry_.subgraph(name)) return;
        auto cfg = this->config();
        for (auto& subgraph : cfg.subgraphs) {
            if (subgraph.name != name) continue;
            std::lock_guard<std::mutex> lock(loadMutex_);
            if (loadSubgraph(subgraph, std::chrono::milliseconds(cfg.fetchTimeoutMs))) composeRegistered();
        }
    });
}

Gateway::~Gateway() {
    stop();
}

config::GatewayConfig Gateway::config() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_;
}

void Gateway::applyTargets(const config::GatewayConfig& config) {
    std::vector<client::CheckTarget> targets;
    for (auto& subgraph : config.subgraphs) {
        targets.push_back({subgraph.name, subgraph.url, subgraph.healthUrl});
    }
    health_.setTargets(std::move(targets));
}

void Gateway::start() {
    health_.start();
}

void Gateway::stop() {
    health_.stop();
}

// ── Execution pipeline: parse → plan (cached) → execute ──
nlohmann::json Gateway::execute(const GraphQLRequest& request, bool allowMutations) {
    auto schema = registry_.current();
    if (!schema) {
        return failure(graphqlError("No composed schema is available yet", nullptr, codes::Internal));
    }

    auto cfg = config();
    try {
        auto document = graphql::parse(request.query);
        auto& operation = document.operation(request.operationName);
        if (operation.operationType == "mutation" && !allowMutations) {
            throw PlanningError("Mutations are only accepted over POST");
        }
        auto depth = graphql::depth(operation.selections);
        if (depth > static_cast<std::size_t>(cfg.maxQueryDepth)) {
            throw PlanningError("Query depth " + std::to_string(depth) + " exceeds the limit of " +
                                std::to_string(cfg.maxQueryDepth));
        }

        auto signature = plan_cache::signature(operation, request.variables);
        auto plan = plans_.get(signature, schema->generation);
        if (!plan) {
            plan = std::make_shared<const planner::QueryPlan>(
                planner::plan(operation, *schema, health_.downSubgraphs()));
            plans_.put(signature, schema->generation, plan);
        }

        auto timeout = std::chrono::milliseconds(cfg.requestTimeoutMs);
        auto result = executor_.execute(*plan, *schema, request.variables,
                                        [this](const std::string& s) { return health_.isDown(s); },
                                        std::chrono::steady_clock::now() + timeout);
        return result.toJson();
    } catch (const FederationError& e) {
        console::debug("Rejected operation:", e.what());
        return failure(e.toGraphQL());
    }
}

// ── Service definitions ──
bool Gateway::loadSubgraph(const config::SubgraphConfig& subgraph, std::chrono::milliseconds timeout) {
    client::SubgraphRequest request;
    request.subgraph = subgraph.name;
    request.url = subgraph.url;
    request.query = "{ _service { sdl } }";
    request.timeout = timeout;

    try {
        auto response = client_->execute(request);
        auto sdl = response.data.is_object() ? response.data.value("_service", json()) : json();
        if (!sdl.is_object() || !sdl.contains("sdl") || !sdl["sdl"].is_string()) {
            throw FetchError(subgraph.name, "Subgraph '" + subgraph.name + "' did not return _service.sdl" +
                                            (response.errors.empty() ? "" : ": " + response.errors.dump()));
        }
        registry_.registerSubgraph(subgraph.name, subgraph.url, sdl["sdl"].get<std::string>());
        console::success("Loaded service definition for", subgraph.name);
        return true;
    } catch (const FederationError& e) {
        console::error("Failed to load service definition for", subgraph.name + ":", e.what());
        return false;
    }
}

void Gateway::composeRegistered() {
    try {
        registry_.compose();
    } catch (const CompositionError& e) {
        console::error(e.what());
        return;
    }
    for (auto& issue : registry_.validateFederation()) console::warn(issue);
}

std::size_t Gateway::loadServiceDefinitions() {
    auto cfg = config();
    std::lock_guard<std::mutex> lock(loadMutex_);

    // Drop subgraphs that left the configuration
    for (auto& registered : registry_.subgraphs()) {
        bool configured = std::any_of(cfg.subgraphs.begin(), cfg.subgraphs.end(),
                                      [&](auto& s) { return s.name == registered->name; });
        if (!configured) {
            registry_.removeSubgraph(registered->name);
            console::info("Removed subgraph", registered->name);
        }
    }

    std::size_t loaded = 0;
    for (auto& subgraph : cfg.subgraphs) {
        if (loadSubgraph(subgraph, std::chrono::milliseconds(cfg.fetchTimeoutMs))) ++loaded;
    }
    composeRegistered();
    return loaded;
}

void Gateway::reload(config::GatewayConfig next) {
    config::validate(next);
    auto previous = config();
    if (next.server.port != previous.server.port || next.server.host != previous.server.host ||
        next.server.threads != previous.server.threads) {
        console::warn("Server address and thread changes take effect after a restart");
    }

    {
        std::lock_guard<std::mutex> lock(configMutex_);
        config_ = next;
    }
    console::setLevel(console::parseLevel(next.logLevel));
    plans_.configure(planCacheOptions(next.planCache));
    executor_.setOptions({.fetchTimeout = std::chrono::milliseconds(next.fetchTimeoutMs)});
    health_.setOptions(healthOptions(next.health));
    applyTargets(next);

    auto loaded = loadServiceDefinitions();
    console::info("Reloaded configuration:", loaded, "of", next.subgraphs.size(), "subgraph(s) loaded");
}

// ── Reports ──
nlohmann::json Gateway::healthReport() const {
    auto schema = registry_.current();
    auto snapshot = health_.snapshot();
    json subgraphs = json::object();
    for (auto& [name, entry] : *snapshot) subgraphs[name] = entry.toJson();

    auto stats = plans_.stats();
    return {
        {"status", schema ? "ok" : "unavailable"},
        {"generation", schema ? schema->generation : 0},
        {"subgraphs", subgraphs},
        {"planCache", {{"size", stats.size}, {"hits", stats.hits}, {"misses", stats.misses},
                       {"evictions", stats.evictions}}}
    };
}

nlohmann::json Gateway::subgraphsReport() const {
    auto cfg = config();
    auto snapshot = health_.snapshot();
    json out = json::array();
    for (auto& subgraph : cfg.subgraphs) {
        auto registered = registry_.subgraph(subgraph.name);
        auto it = snapshot->find(subgraph.name);
        out.push_back({
            {"name", subgraph.name},
            {"url", subgraph.url},
            {"registered", registered != nullptr},
            {"types", registered ? registered->typeOrder.size() : 0},
            {"state", std::string(health::toString(it != snapshot->end() ? it->second.state
                                                                          : health::HealthState::Healthy))}
        });
    }
    return out;
}

// ═══════════════════════════════════════════
//  HTTP routes
// ═══════════════════════════════════════════
void Gateway::mount(http::Server& server) {
    server.post("/graphql", [this](http::Request& req, http::Response& res) {
        GraphQLRequest request;
        try {
            request = GraphQLRequest::fromJson(req.body.raw());
        } catch (const PlanningError& e) {
            res.status(400).json(failure(e.toGraphQL()));
            return;
        }
        res.json(execute(request));
    });

    server.get("/graphql", [this](http::Request& req, http::Response& res) {
        json body = json::object();
        if (req.query.count("query")) body["query"] = req.query["query"];
        if (req.query.count("operationName")) body["operationName"] = req.query["operationName"];
        if (req.query.count("variables") && !req.query["variables"].empty()) {
            auto variables = json::parse(req.query["variables"], nullptr, false);
            if (variables.is_discarded()) {
                res.status(400).json(failure(graphqlError("Variables are invalid JSON", nullptr,
                                                          codes::ParseFailed)));
                return;
            }
            body["variables"] = variables;
        }

        GraphQLRequest request;
        try {
            request = GraphQLRequest::fromJson(body);
        } catch (const PlanningError& e) {
            res.status(400).json(failure(e.toGraphQL()));
            return;
        }
        res.json(execute(request, false));
    });

    server.get("/health", [this](http::Request&, http::Response& res) {
        auto report = healthReport();
        res.status(report["status"] == "ok" ? 200 : 503).json(report);
    });

    server.get("/schema", [this](http::Request&, http::Response& res) {
        auto sdl = registry_.supergraphSdl();
        if (sdl.empty()) {
            res.status(503).json({{"error", "No composed schema is available yet"}});
            return;
        }
        res.type("text/plain; charset=utf-8").send(sdl);
    });

    server.get("/subgraphs", [this](http::Request&, http::Response& res) {
        res.json(subgraphsReport());
    });

    if (!config().adminEnabled) return;

    // Body: a full configuration document, or empty to re-fetch every SDL
    server.post("/admin/reload", [this](http::Request& req, http::Response& res) {
        try {
            auto& body = req.body.raw();
            reload(body.is_object() && !body.empty() ? config::parseConfig(body) : config());
        } catch (const ConfigError& e) {
            res.status(400).json({{"reloaded", false}, {"error", e.what()}});
            return;
        }
        auto schema = registry_.current();
        res.json({{"reloaded", true}, {"generation", schema ? schema->generation : 0}});
    });
}

} // namespace fedgate::gateway
