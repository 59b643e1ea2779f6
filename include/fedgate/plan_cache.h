#pragma once
// ═══════════════════════════════════════════════════════════════════
//  fedgate/plan_cache.h — Query plans keyed by operation signature
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    plan_cache::PlanCache plans({.maxEntries = 500, .ttlMs = 60000});
//    auto sig = plan_cache::signature(op, variables);
//    auto cached = plans.get(sig, schema->generation);
//    if (!cached) plans.put(sig, schema->generation, std::make_shared<const QueryPlan>(...));
//
//  Every entry is stamped with the schema generation it was planned
//  against. Seeing a newer generation clears the whole cache; requests
//  still holding an older schema neither read nor store plans.
// ═══════════════════════════════════════════════════════════════════

#include "cache.h"
#include "console.h"
#include "crypto.h"
#include "json_utils.h"
#include "query_planner.h"
#include <atomic>
#include <memory>
#include <mutex>

namespace fedgate::plan_cache {

// Printed operation + operation name + variable shape
inline std::string signature(const graphql::ParsedQuery& operation,
                             const nlohmann::json& variables) {
    return crypto::Sha256()
        .update(graphql::print(operation))
        .update(operation.operationName)
        .update(shapeOf(variables.is_null() ? nlohmann::json::object() : variables))
        .hex();
}

struct Options {
    std::size_t maxEntries = 1000;
    int ttlMs = 300000;   // 0 disables expiry
};

class PlanCache {
public:
    explicit PlanCache(Options options = {})
        : entries_(options.maxEntries, std::chrono::milliseconds(options.ttlMs)) {}

    // Null for a generation older than the cache's
    std::shared_ptr<const planner::QueryPlan> get(const std::string& sig, std::uint64_t generation) {
        if (!sync(generation)) return nullptr;
        auto entry = entries_.get(sig);
        if (!entry || entry->generation != generation) return nullptr;
        return entry->plan;
    }

    void put(const std::string& sig, std::uint64_t generation,
             std::shared_ptr<const planner::QueryPlan> plan) {
        if (!sync(generation)) return;
        entries_.put(sig, Entry{generation, std::move(plan)});
    }

    void configure(const Options& options) {
        entries_.configure(options.maxEntries, std::chrono::milliseconds(options.ttlMs));
    }

    void clear() { entries_.clear(); }

    std::uint64_t generation() const { return generation_.load(); }
    cache::CacheStats stats() const { return entries_.stats(); }

private:
    struct Entry {
        std::uint64_t generation = 0;
        std::shared_ptr<const planner::QueryPlan> plan;
    };

    cache::LRUCache<std::string, Entry> entries_;
    std::atomic<std::uint64_t> generation_{0};
    std::mutex syncMutex_;

    // Generations only move forward; false when `generation` is stale
    bool sync(std::uint64_t generation) {
        if (generation_.load() == generation) return true;
        std::lock_guard<std::mutex> lock(syncMutex_);
        auto current = generation_.load();
        if (current == generation) return true;
        if (generation < current) return false;
        auto dropped = entries_.size();
        entries_.clear();
        generation_.store(generation);
        console::debug("Plan cache now at schema generation", generation, "- dropped", dropped, "plan(s)");
        return true;
    }
};

} // namespace fedgate::plan_cache
