#pragma once
// ═══════════════════════════════════════════════════════════════════
//  fedgate/query_planner.h — Client operation -> DAG of subgraph fetches
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto doc  = graphql::parse(R"({ workflow(id: "1") { name executions { id } } })");
//    auto plan = planner::plan(doc.operation(), *registry.current(), monitor.downSubgraphs());
//    for (auto& level : plan.levels()) ...      // node ids, dependencies first
//
//  For the query above:
//    #0 workflow   root    query { workflow(id: "1") { name id } }
//    #1 execution  entity  Workflow @ [workflow] { executions { id } }   depends on #0
//
// ═══════════════════════════════════════════════════════════════════

#include "schema_registry.h"
#include <set>
#include <string>
#include <vector>

namespace fedgate::planner {

// ═══════════════════════════════════════════
//  EntityRepresentation
// ═══════════════════════════════════════════
struct EntityRepresentation {
    std::string typeName;
    std::vector<std::pair<std::string, nlohmann::json>> fields;   // key fields first, then @requires

    // {"__typename": ..., key fields...}
    nlohmann::json toJson() const;

    // Extract `keys` (and `required`) from a parent object; throws
    // EntityResolutionError when a key field is missing or null
    static EntityRepresentation fromObject(const std::string& typeName,
                                           const nlohmann::json& object,
                                           const graphql::SelectionSet& keys,
                                           const graphql::SelectionSet& required,
                                           const std::string& subgraph);

    // Check typename and key fields against the composed schema; throws EntityResolutionError
    void validate(const schema::ComposedSchema& schema, const std::string& subgraph) const;
};

// ═══════════════════════════════════════════
//  FetchNode / QueryPlan
// ═══════════════════════════════════════════
enum class FetchKind { Root, Entity };

struct FetchNode {
    int id = 0;
    std::string subgraph;
    FetchKind kind = FetchKind::Root;
    std::string operationType = "query";
    graphql::SelectionSet selections;       // root fields, or fields selected on the entity
    std::string document;                   // printed sub-query
    std::vector<std::string> variableNames; // client variables the document uses

    // Entity fetches
    std::string entityType;
    graphql::SelectionSet keyFields;
    graphql::SelectionSet requiredFields;
    std::vector<std::string> mergePath;     // response keys to the parent objects; "@" steps into lists

    std::vector<int> dependsOn;
    bool plannedDown = false;               // target was Down when the plan was built

    nlohmann::json toJson() const;
};

struct QueryPlan {
    std::vector<FetchNode> nodes;           // ids equal indices; dependencies precede dependents
    graphql::ParsedQuery operation;
    std::string rootType = "Query";

    // Topological levels of node ids
    std::vector<std::vector<int>> levels() const;

    const FetchNode& node(int id) const { return nodes.at(static_cast<std::size_t>(id)); }

    nlohmann::json toJson() const;
};

// Build the fetch DAG; throws PlanningError
QueryPlan plan(const graphql::ParsedQuery& operation,
               const schema::ComposedSchema& schema,
               const std::set<std::string>& downSubgraphs = {});

// `_entities` document for a batch of entity selections on one type
std::string entitiesDocument(const std::string& entityType,
                             const graphql::SelectionSet& selections,
                             const std::vector<graphql::VariableDefinition>& variables);

} // namespace fedgate::planner
