#pragma once
// ═══════════════════════════════════════════════════════════════════
//  fedgate/schema_registry.h — Subgraph registration and composition
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    schema::SchemaRegistry registry;
//    registry.registerSubgraph("workflow", "http://localhost:4001/graphql", workflowSdl);
//    registry.registerSubgraph("execution", "http://localhost:4002/graphql", executionSdl);
//    auto composed = registry.compose();          // throws CompositionError
//    composed->field("Workflow", "executions")->owner;   // "execution"
//
//  Snapshots are immutable. compose() publishes a new one with the next
//  generation; readers keep whatever snapshot they already hold.
// ═══════════════════════════════════════════════════════════════════

#include "sdl.h"
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fedgate::schema {

// ═══════════════════════════════════════════
//  Composed schema
// ═══════════════════════════════════════════
struct ComposedField {
    std::string name;
    graphql::TypeRef type;
    std::vector<sdl::ArgumentDefinition> arguments;
    std::string owner;                      // subgraph the planner routes to by default
    std::vector<std::string> resolvableBy;  // every subgraph able to resolve it, sorted
    bool shareable = false;
    bool keyField = false;
    graphql::SelectionSet requiredFields;   // owner's @requires
    std::map<std::string, graphql::SelectionSet> provides;  // subgraph -> @provides

    bool resolvableIn(const std::string& subgraph) const;
};

struct ComposedType {
    std::string name;
    sdl::TypeKind kind = sdl::TypeKind::Object;
    std::vector<ComposedField> fields;      // order of first appearance
    std::vector<std::string> definers;      // sorted
    std::map<std::string, std::vector<graphql::SelectionSet>> keysBySubgraph;
    graphql::SelectionSet keySelections;    // primary key
    std::vector<std::string> interfaces;
    std::vector<std::string> enumValues;
    std::vector<std::string> unionMembers;

    bool isEntity() const { return !keySelections.empty(); }
    const ComposedField* field(std::string_view fieldName) const;

    // Key the given subgraph accepts in representations (its first declared key,
    // else the primary key)
    const graphql::SelectionSet& keyFor(const std::string& subgraph) const;
};

struct ComposedSchema {
    std::map<std::string, ComposedType> types;
    std::vector<std::string> typeOrder;
    std::uint64_t generation = 0;
    std::map<std::string, std::string> subgraphUrls;

    const ComposedType* type(std::string_view typeName) const;
    const ComposedField* field(std::string_view typeName, std::string_view fieldName) const;
    bool isEntity(std::string_view typeName) const;

    // True for types whose concrete type is only known at runtime
    bool isAbstract(std::string_view typeName) const;

    // "Type.field" -> owning subgraph
    std::map<std::string, std::string> ownershipMap() const;

    // Printable supergraph SDL with the federation directive preamble
    std::string sdl() const;
};

// Merge subgraphs into a schema stamped with `generation`; throws CompositionError
ComposedSchema composeSubgraphs(const std::vector<std::shared_ptr<const sdl::SubgraphSchema>>& subgraphs,
                                std::uint64_t generation);

bool isBuiltinScalar(std::string_view typeName);

// ═══════════════════════════════════════════
//  SchemaRegistry
// ═══════════════════════════════════════════
class SchemaRegistry {
public:
    SchemaRegistry();

    // Parse, validate and add (or replace) a subgraph; throws SchemaError
    void registerSubgraph(std::string name, std::string url, std::string sdlText);

    // Replace URL and/or SDL of a registered subgraph; throws SchemaError
    void updateSubgraph(const std::string& name,
                        std::optional<std::string> url,
                        std::optional<std::string> sdlText);

    void removeSubgraph(const std::string& name);

    std::vector<std::shared_ptr<const sdl::SubgraphSchema>> subgraphs() const;
    std::shared_ptr<const sdl::SubgraphSchema> subgraph(const std::string& name) const;

    // Compose the registered set and publish it; throws CompositionError.
    // On failure the current snapshot stays in place.
    std::shared_ptr<const ComposedSchema> compose();

    // Latest snapshot, or nullptr before the first successful composition
    std::shared_ptr<const ComposedSchema> current() const { return current_.load(); }

    std::string supergraphSdl() const;

    // Informational federation compliance issues
    std::vector<std::string> validateFederation() const;

private:
    using SubgraphMap = std::map<std::string, std::shared_ptr<const sdl::SubgraphSchema>>;

    mutable std::mutex writeMutex_;
    std::atomic<std::shared_ptr<const SubgraphMap>> subgraphs_;
    std::atomic<std::shared_ptr<const ComposedSchema>> current_;
    std::uint64_t generation_ = 0;
};

} // namespace fedgate::schema
