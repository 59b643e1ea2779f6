#pragma once
// ═══════════════════════════════════════════════════════════════════
//  fedgate/executor.h — Runs a QueryPlan against the subgraphs
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    executor::Executor exec(std::make_shared<client::HttpSubgraphClient>());
//    auto result = exec.execute(plan, *schema, variables,
//                               [&](auto& s) { return monitor.isDown(s); },
//                               std::chrono::steady_clock::now() + 10s);
//    res.json(result.toJson());
//
//  Each DAG level runs its fetches concurrently and joins them before the
//  next level starts. Entity fetches for the same subgraph and type in one
//  level share a single `_entities` call. Failures stay on their branch;
//  null propagation decides how far a missing value travels.
// ═══════════════════════════════════════════════════════════════════

#include "query_planner.h"
#include "subgraph_client.h"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>

namespace fedgate::executor {

struct ExecutorOptions {
    std::chrono::milliseconds fetchTimeout{5000};
};

struct ExecutionResult {
    nlohmann::json data;                                // null when nothing could be returned
    nlohmann::json errors = nlohmann::json::array();

    // {"data": ..., "errors": [...]}; errors omitted when empty
    nlohmann::json toJson() const;
};

using DownCheck = std::function<bool(const std::string& subgraph)>;

class Executor {
public:
    explicit Executor(std::shared_ptr<client::SubgraphClient> client, ExecutorOptions options = {});

    ExecutionResult execute(const planner::QueryPlan& plan,
                            const schema::ComposedSchema& schema,
                            const nlohmann::json& variables,
                            const DownCheck& isDown,
                            std::chrono::steady_clock::time_point deadline) const;

    void setOptions(ExecutorOptions options);
    ExecutorOptions options() const;

private:
    std::shared_ptr<client::SubgraphClient> client_;
    mutable std::mutex optionsMutex_;
    ExecutorOptions options_;
};

// Client variables with the operation's declared defaults filled in
nlohmann::json coerceVariables(const graphql::ParsedQuery& operation, const nlohmann::json& variables);

} // namespace fedgate::executor
