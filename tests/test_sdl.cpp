// ═══════════════════════════════════════════════════════════════════
//  test_sdl.cpp — Subgraph SDL parsing and federation directives
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include "fedgate/sdl.h"

using namespace fedgate;
using namespace fedgate::sdl;

namespace {

const char* kExecutionSdl = R"(
    """Execution subgraph"""
    extend schema @link(url: "https://specs.apollo.dev/federation/v2.3", import: ["@key"])

    type Execution @key(fields: "id") {
        id: ID!
        status: ExecutionStatus!
        workflowId: ID!
    }

    enum ExecutionStatus { PENDING RUNNING DONE }

    type Workflow @key(fields: "id") {
        id: ID! @external
        executions(limit: Int = 10): [Execution!]!
        owner: User @provides(fields: "name")
    }

    type User @key(fields: "id", resolvable: false) {
        id: ID!
        name: String @external
    }

    type Query {
        execution(id: ID!): Execution @shareable
    }
)";

} // namespace

// ═══════════════════════════════════════════
//  Parsing
// ═══════════════════════════════════════════

TEST(SdlTest, ParsesTypesInDeclarationOrder) {
    auto schema = parseSubgraph("execution", "http://localhost:4002/graphql", kExecutionSdl);
    EXPECT_EQ(schema.name, "execution");
    EXPECT_EQ(schema.url, "http://localhost:4002/graphql");
    ASSERT_EQ(schema.typeOrder.size(), 5u);
    EXPECT_EQ(schema.typeOrder[0], "Execution");
    EXPECT_EQ(schema.typeOrder[4], "Query");

    auto* status = schema.type("ExecutionStatus");
    ASSERT_NE(status, nullptr);
    EXPECT_EQ(status->kind, TypeKind::Enum);
    EXPECT_EQ(status->enumValues.size(), 3u);
}

TEST(SdlTest, FieldTypesAndArguments) {
    auto schema = parseSubgraph("execution", "http://x/graphql", kExecutionSdl);
    auto* executions = schema.type("Workflow")->field("executions");
    ASSERT_NE(executions, nullptr);
    EXPECT_EQ(executions->type.toString(), "[Execution!]!");
    ASSERT_EQ(executions->arguments.size(), 1u);
    EXPECT_EQ(executions->arguments[0].name, "limit");
    ASSERT_TRUE(executions->arguments[0].defaultValue.has_value());
    EXPECT_EQ(executions->arguments[0].defaultValue->toJson(), 10);
}

TEST(SdlTest, FederationDirectives) {
    auto schema = parseSubgraph("execution", "http://x/graphql", kExecutionSdl);

    auto* execution = schema.type("Execution");
    EXPECT_TRUE(execution->isEntity());
    ASSERT_EQ(execution->keys().size(), 1u);
    EXPECT_EQ(execution->keys()[0]->fields, "id");
    EXPECT_EQ(execution->keys()[0]->selections[0].name, "id");

    auto* workflow = schema.type("Workflow");
    EXPECT_TRUE(workflow->field("id")->isExternal());
    auto* provides = workflow->field("owner")->providesDirective();
    ASSERT_NE(provides, nullptr);
    EXPECT_EQ(provides->fields, "name");

    EXPECT_FALSE(schema.type("User")->keys()[0]->resolvable);
    EXPECT_TRUE(schema.type("Query")->field("execution")->isShareable());
}

TEST(SdlTest, UnknownDirectivesAreIgnored) {
    auto schema = parseSubgraph("a", "http://a/graphql", R"(
        directive @audit(level: Int) on FIELD_DEFINITION
        type Query { hello: String @deprecated(reason: "old") @audit(level: 2) @tag(name: "x") }
    )");
    EXPECT_TRUE(schema.type("Query")->field("hello")->directives.empty());
}

TEST(SdlTest, ExtendTypeMergesWithDefinition) {
    auto schema = parseSubgraph("a", "http://a/graphql", R"(
        type Query { a: String }
        extend type Query { b: Int }
    )");
    auto* query = schema.type("Query");
    ASSERT_EQ(query->fields.size(), 2u);
    EXPECT_FALSE(query->isExtended());
}

TEST(SdlTest, ExtendsDirectiveMarksExtension) {
    auto schema = parseSubgraph("a", "http://a/graphql", R"(
        type Workflow @extends @key(fields: "id") { id: ID! @external tags: [String] }
    )");
    EXPECT_TRUE(schema.type("Workflow")->isExtended());
}

TEST(SdlTest, CustomRootTypesAreNormalized) {
    auto schema = parseSubgraph("a", "http://a/graphql", R"(
        schema { query: RootQuery }
        type RootQuery { self: RootQuery ping: String }
    )");
    ASSERT_NE(schema.type("Query"), nullptr);
    EXPECT_EQ(schema.type("RootQuery"), nullptr);
    EXPECT_EQ(schema.type("Query")->field("self")->type.namedType(), "Query");
}

TEST(SdlTest, InterfacesAndUnions) {
    auto schema = parseSubgraph("a", "http://a/graphql", R"(
        interface Node { id: ID! }
        type Task implements Node & Named { id: ID! name: String }
        interface Named { name: String }
        union SearchResult = | Task
    )");
    EXPECT_EQ(schema.type("Task")->interfaces, (std::vector<std::string>{"Node", "Named"}));
    EXPECT_EQ(schema.type("SearchResult")->kind, TypeKind::Union);
    EXPECT_EQ(schema.type("SearchResult")->unionMembers.size(), 1u);
}

// ═══════════════════════════════════════════
//  Validation
// ═══════════════════════════════════════════

TEST(SdlValidationTest, MissingKeyFieldIsRejected) {
    try {
        parseSubgraph("workflow", "http://w/graphql", R"(type Workflow @key(fields: "uuid") { id: ID! })");
        FAIL() << "expected SchemaError";
    } catch (const SchemaError& e) {
        EXPECT_EQ(e.subgraph(), "workflow");
        EXPECT_EQ(e.code(), codes::InvalidSchema);
        EXPECT_NE(std::string(e.what()).find("uuid"), std::string::npos);
    }
}

TEST(SdlValidationTest, RequiresMustReferenceKnownFields) {
    EXPECT_THROW(parseSubgraph("a", "http://a/graphql", R"(
        type Workflow @key(fields: "id") { id: ID! duration: Int @requires(fields: "startedAt") }
    )"), SchemaError);
}

TEST(SdlValidationTest, KeyOnScalarIsRejected) {
    EXPECT_THROW(parseSubgraph("a", "http://a/graphql", R"(scalar Date @key(fields: "id"))"), SchemaError);
}

TEST(SdlValidationTest, KeyWithoutFieldsArgument) {
    EXPECT_THROW(parseSubgraph("a", "http://a/graphql", R"(type T @key { id: ID! })"), SchemaError);
}

TEST(SdlValidationTest, DuplicateFieldAcrossExtension) {
    EXPECT_THROW(parseSubgraph("a", "http://a/graphql", R"(
        type Query { a: String }
        extend type Query { a: String }
    )"), SchemaError);
}

TEST(SdlValidationTest, SelfOverrideIsRejected) {
    EXPECT_THROW(parseSubgraph("a", "http://a/graphql", R"(
        type Query { a: String @override(from: "a") }
    )"), SchemaError);
}

TEST(SdlValidationTest, SyntaxErrorIsSchemaError) {
    EXPECT_THROW(parseSubgraph("a", "http://a/graphql", "type Query { a: }"), SchemaError);
    EXPECT_THROW(parseSubgraph("", "http://a/graphql", "type Query { a: String }"), SchemaError);
}

TEST(SdlValidationTest, HostileNestingIsSchemaError) {
    auto deepType = "type Query { a: " + std::string(100000, '[') + "Int }";
    EXPECT_THROW(parseSubgraph("a", "http://a/graphql", deepType), SchemaError);

    auto deepDefault = "type Query { a(x: Int = " + std::string(100000, '[') + "): Int }";
    EXPECT_THROW(parseSubgraph("a", "http://a/graphql", deepDefault), SchemaError);
}

TEST(SdlTest, FederationPlumbingNames) {
    EXPECT_TRUE(isFederationType("_Service"));
    EXPECT_TRUE(isFederationType("link__Import"));
    EXPECT_FALSE(isFederationType("Workflow"));
    EXPECT_TRUE(isFederationField("_entities"));
    EXPECT_FALSE(isFederationField("workflow"));
}
