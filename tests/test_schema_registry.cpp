// ═══════════════════════════════════════════════════════════════════
//  test_schema_registry.cpp — Registration, composition, snapshots
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include "federation_fixtures.h"
#include <algorithm>

using namespace fedgate;
using namespace fedgate::schema;

// ═══════════════════════════════════════════
//  Composition
// ═══════════════════════════════════════════

TEST(CompositionTest, OwnershipFollowsDefiningSubgraph) {
    auto registry = fixtures::registry(true);
    auto schema = registry->current();
    ASSERT_NE(schema, nullptr);
    EXPECT_EQ(schema->generation, 1u);

    EXPECT_EQ(schema->field("Query", "workflow")->owner, "workflow");
    EXPECT_EQ(schema->field("Workflow", "name")->owner, "workflow");
    EXPECT_EQ(schema->field("Workflow", "executions")->owner, "execution");
    EXPECT_EQ(schema->field("Execution", "tickets")->owner, "ticket");

    auto ownership = schema->ownershipMap();
    EXPECT_EQ(ownership["Workflow.executions"], "execution");
    EXPECT_EQ(ownership["Mutation.startExecution"], "execution");
    EXPECT_EQ(ownership.count("Query._service"), 0u);
}

TEST(CompositionTest, KeyFieldsAreResolvableEverywhere) {
    auto schema = fixtures::registry()->current();
    auto* id = schema->field("Workflow", "id");
    ASSERT_NE(id, nullptr);
    EXPECT_TRUE(id->keyField);
    EXPECT_EQ(id->owner, "workflow");
    EXPECT_EQ(id->resolvableBy, (std::vector<std::string>{"execution", "workflow"}));
    EXPECT_TRUE(schema->isEntity("Workflow"));
    EXPECT_EQ(schema->type("Workflow")->definers, (std::vector<std::string>{"execution", "workflow"}));
    EXPECT_EQ(schema->type("Workflow")->keyFor("execution")[0].name, "id");
}

TEST(CompositionTest, ShareableFieldsListEveryResolver) {
    auto schema = fixtures::registry()->current();
    auto* serverTime = schema->field("Query", "serverTime");
    EXPECT_TRUE(serverTime->shareable);
    EXPECT_TRUE(serverTime->resolvableIn("workflow"));
    EXPECT_TRUE(serverTime->resolvableIn("execution"));
    EXPECT_FALSE(serverTime->resolvableIn("ticket"));
}

TEST(CompositionTest, FederationPlumbingIsExcluded) {
    auto schema = fixtures::registry()->current();
    EXPECT_EQ(schema->type("_Service"), nullptr);
    EXPECT_EQ(schema->type("_Entity"), nullptr);
    EXPECT_EQ(schema->field("Query", "_entities"), nullptr);
}

TEST(CompositionTest, ConflictListsBothSubgraphs) {
    SchemaRegistry registry;
    registry.registerSubgraph("workflow", "http://w/graphql", R"(
        type Workflow @key(fields: "id") { id: ID! name: String }
        type Query { workflow(id: ID!): Workflow }
    )");
    registry.registerSubgraph("execution", "http://e/graphql", R"(
        extend type Workflow @key(fields: "id") { id: ID! @external name: String }
    )");

    try {
        registry.compose();
        FAIL() << "expected CompositionError";
    } catch (const CompositionError& e) {
        ASSERT_EQ(e.conflicts().size(), 1u);
        auto& conflict = e.conflicts()[0];
        EXPECT_EQ(conflict.typeName, "Workflow");
        EXPECT_EQ(conflict.fieldName, "name");
        EXPECT_EQ(conflict.subgraphs, (std::vector<std::string>{"execution", "workflow"}));
        EXPECT_EQ(e.code(), codes::Composition);
        EXPECT_NE(std::string(e.what()).find("Workflow.name [execution, workflow]"), std::string::npos);
    }
    EXPECT_EQ(registry.current(), nullptr);
}

TEST(CompositionTest, OverrideMovesOwnership) {
    SchemaRegistry registry;
    registry.registerSubgraph("workflow", "http://w/graphql", R"(
        type Workflow @key(fields: "id") { id: ID! status: String }
        type Query { workflow(id: ID!): Workflow }
    )");
    registry.registerSubgraph("execution", "http://e/graphql", R"(
        extend type Workflow @key(fields: "id") { id: ID! @external status: String @override(from: "workflow") }
    )");
    auto schema = registry.compose();
    auto* status = schema->field("Workflow", "status");
    EXPECT_EQ(status->owner, "execution");
    EXPECT_EQ(status->resolvableBy, (std::vector<std::string>{"execution"}));
}

TEST(CompositionTest, MismatchedKeysAreAConflict) {
    SchemaRegistry registry;
    registry.registerSubgraph("workflow", "http://w/graphql", R"(
        type Workflow @key(fields: "id") { id: ID! slug: String! }
        type Query { workflow(id: ID!): Workflow }
    )");
    registry.registerSubgraph("execution", "http://e/graphql", R"(
        extend type Workflow @key(fields: "slug") { slug: String! @external runs: Int }
    )");
    EXPECT_THROW(registry.compose(), CompositionError);
}

TEST(CompositionTest, ShapeDisagreementsAreConflicts) {
    SchemaRegistry registry;
    registry.registerSubgraph("a", "http://a/graphql", R"(
        type Query { now: String @shareable }
        enum Color { RED }
    )");
    registry.registerSubgraph("b", "http://b/graphql", R"(
        type Query { now: Int @shareable }
        scalar Color
    )");
    try {
        registry.compose();
        FAIL() << "expected CompositionError";
    } catch (const CompositionError& e) {
        EXPECT_EQ(e.conflicts().size(), 2u);
    }
}

TEST(CompositionTest, UnknownTypesAreReported) {
    SchemaRegistry registry;
    registry.registerSubgraph("a", "http://a/graphql", "type Query { thing: Missing }");
    EXPECT_THROW(registry.compose(), CompositionError);
}

TEST(CompositionTest, EmptyRegistryDoesNotCompose) {
    SchemaRegistry registry;
    EXPECT_THROW(registry.compose(), CompositionError);
}

// ═══════════════════════════════════════════
//  Registry lifecycle
// ═══════════════════════════════════════════

TEST(SchemaRegistryTest, GenerationIncreasesOnEveryComposition) {
    auto registry = fixtures::registry();
    auto first = registry->current();
    auto second = registry->compose();
    EXPECT_EQ(second->generation, first->generation + 1);
    // Holders of the old snapshot keep a consistent view
    EXPECT_EQ(first->generation, 1u);
}

TEST(SchemaRegistryTest, FailedCompositionKeepsCurrentSnapshot) {
    auto registry = fixtures::registry();
    auto live = registry->current();

    registry->registerSubgraph("rogue", "http://rogue/graphql", R"(
        type Execution @key(fields: "id") { id: ID! status: String! }
    )");
    EXPECT_THROW(registry->compose(), CompositionError);
    EXPECT_EQ(registry->current(), live);
    EXPECT_FALSE(registry->supergraphSdl().empty());
}

TEST(SchemaRegistryTest, InvalidSdlLeavesRegistryUntouched) {
    SchemaRegistry registry;
    EXPECT_THROW(registry.registerSubgraph("bad", "http://b/graphql", "type Query {"), SchemaError);
    EXPECT_TRUE(registry.subgraphs().empty());
}

TEST(SchemaRegistryTest, RegisterReplacesExisting) {
    SchemaRegistry registry;
    registry.registerSubgraph("a", "http://a/graphql", "type Query { one: String }");
    registry.registerSubgraph("a", "http://a2/graphql", "type Query { two: String }");
    ASSERT_EQ(registry.subgraphs().size(), 1u);
    EXPECT_EQ(registry.subgraph("a")->url, "http://a2/graphql");
    EXPECT_NE(registry.subgraph("a")->type("Query")->field("two"), nullptr);
}

TEST(SchemaRegistryTest, UpdateAndRemove) {
    SchemaRegistry registry;
    registry.registerSubgraph("a", "http://a/graphql", "type Query { one: String }");

    registry.updateSubgraph("a", std::string("http://moved/graphql"), std::nullopt);
    EXPECT_EQ(registry.subgraph("a")->url, "http://moved/graphql");
    EXPECT_NE(registry.subgraph("a")->type("Query")->field("one"), nullptr);

    registry.updateSubgraph("a", std::nullopt, std::string("type Query { two: Int }"));
    EXPECT_EQ(registry.subgraph("a")->url, "http://moved/graphql");
    EXPECT_EQ(registry.subgraph("a")->type("Query")->field("one"), nullptr);

    EXPECT_THROW(registry.updateSubgraph("missing", std::nullopt, std::nullopt), SchemaError);

    registry.removeSubgraph("a");
    EXPECT_EQ(registry.subgraph("a"), nullptr);
    EXPECT_THROW(registry.removeSubgraph("a"), SchemaError);
}

TEST(SchemaRegistryTest, SupergraphSdl) {
    auto registry = fixtures::registry();
    auto sdl = registry->supergraphSdl();
    EXPECT_NE(sdl.find("# generation 1"), std::string::npos);
    EXPECT_NE(sdl.find(R"(WORKFLOW @join__graph(name: "workflow", url: "http://workflow.local/graphql"))"),
              std::string::npos);
    EXPECT_NE(sdl.find("executions(limit: Int): [Execution!] @join__field(graph: EXECUTION)"), std::string::npos);
    EXPECT_NE(sdl.find("mutation: Mutation"), std::string::npos);

    SchemaRegistry empty;
    EXPECT_TRUE(empty.supergraphSdl().empty());
}

TEST(SchemaRegistryTest, FederationComplianceIssues) {
    SchemaRegistry registry;
    registry.registerSubgraph("plain", "http://p/graphql", R"(
        type Workflow @key(fields: "id") { id: ID! note: String @external }
        type Query { workflow: Workflow }
    )");
    auto issues = registry.validateFederation();
    auto mentions = [&](const std::string& needle) {
        return std::any_of(issues.begin(), issues.end(),
                           [&](auto& issue) { return issue.find(needle) != std::string::npos; });
    };
    EXPECT_TRUE(mentions("Query._service"));
    EXPECT_TRUE(mentions("Query._entities"));
    EXPECT_TRUE(mentions("Workflow.note is @external"));

    EXPECT_TRUE(fixtures::registry()->validateFederation().empty());
}
