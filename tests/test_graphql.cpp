// ═══════════════════════════════════════════════════════════════════
//  test_graphql.cpp — Executable document parsing and printing
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include "fedgate/graphql.h"

using namespace fedgate;
using namespace fedgate::graphql;

// ═══════════════════════════════════════════
//  Parser Tests
// ═══════════════════════════════════════════

TEST(GraphQLParserTest, ShorthandQuery) {
    auto doc = parse("{ workflow }");
    auto& op = doc.operation();
    EXPECT_EQ(op.operationType, "query");
    EXPECT_TRUE(op.operationName.empty());
    ASSERT_EQ(op.selections.size(), 1u);
    EXPECT_EQ(op.selections[0].name, "workflow");
}

TEST(GraphQLParserTest, NamedMutationWithVariables) {
    auto doc = parse(R"(mutation Start($id: ID!, $tags: [String!] = ["a"]) {
        startWorkflow(id: $id, tags: $tags) { id }
    })");
    auto& op = doc.operation("Start");
    EXPECT_EQ(op.operationType, "mutation");
    ASSERT_EQ(op.variables.size(), 2u);
    EXPECT_EQ(op.variables[0].type.toString(), "ID!");
    EXPECT_EQ(op.variables[1].type.toString(), "[String!]");
    ASSERT_TRUE(op.variables[1].defaultValue.has_value());
    EXPECT_EQ(op.variables[1].defaultValue->toJson(), nlohmann::json::array({"a"}));
    EXPECT_EQ(referencedVariables(op.selections), (std::set<std::string>{"id", "tags"}));
}

TEST(GraphQLParserTest, AliasesArgumentsAndDirectives) {
    auto doc = parse(R"({ first: workflow(id: "1") @include(if: $on) { name } })");
    auto& field = doc.operation().selections[0];
    EXPECT_EQ(field.alias, "first");
    EXPECT_EQ(field.name, "workflow");
    EXPECT_EQ(field.responseKey(), "first");
    ASSERT_EQ(field.arguments.size(), 1u);
    EXPECT_EQ(field.arguments[0].second.toJson(), "1");
    ASSERT_EQ(field.directives.size(), 1u);
    EXPECT_EQ(field.directives[0].name, "include");
}

TEST(GraphQLParserTest, NamedFragmentsAreInlined) {
    auto doc = parse(R"(
        query { workflow(id: "1") { ...Basics } }
        fragment Basics on Workflow { id name }
    )");
    auto& workflow = doc.operation().selections[0];
    ASSERT_EQ(workflow.selections.size(), 1u);
    auto& fragment = workflow.selections[0];
    EXPECT_TRUE(fragment.isFragment());
    EXPECT_EQ(fragment.typeCondition, "Workflow");
    ASSERT_EQ(fragment.selections.size(), 2u);
    EXPECT_EQ(fragment.selections[1].name, "name");
}

TEST(GraphQLParserTest, RecursiveFragmentIsRejected) {
    EXPECT_THROW(parse(R"(
        { workflow { ...A } }
        fragment A on Workflow { id ...A }
    )"), ParseError);
}

TEST(GraphQLParserTest, UnknownFragmentIsRejected) {
    EXPECT_THROW(parse("{ workflow { ...Missing } }"), ParseError);
}

TEST(GraphQLParserTest, SyntaxErrorsCarryPosition) {
    try {
        parse("{ workflow(id: ) }");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.line(), 1u);
        EXPECT_GT(e.column(), 1u);
        EXPECT_EQ(e.code(), codes::ParseFailed);
    }
}

TEST(GraphQLParserTest, UnterminatedInputFails) {
    EXPECT_THROW(parse("{ workflow { id }"), ParseError);
    EXPECT_THROW(parse(R"({ workflow(id: "1) { id } })"), ParseError);
    EXPECT_THROW(parse(""), ParseError);
}

TEST(GraphQLParserTest, OperationSelection) {
    auto doc = parse("query A { a } query B { b }");
    EXPECT_EQ(doc.operation("B").selections[0].name, "b");
    EXPECT_THROW(doc.operation(), PlanningError);
    EXPECT_THROW(doc.operation("C"), PlanningError);
}

TEST(GraphQLParserTest, DuplicateOperationNamesFail) {
    EXPECT_THROW(parse("query A { a } query A { b }"), ParseError);
}

TEST(GraphQLParserTest, FieldSetsParseBareOrBraced) {
    auto bare = parseSelectionSet("id owner { id }");
    ASSERT_EQ(bare.size(), 2u);
    EXPECT_EQ(bare[1].selections[0].name, "id");
    EXPECT_EQ(parseSelectionSet("{ id }").size(), 1u);
    EXPECT_THROW(parseSelectionSet(""), ParseError);
}

TEST(GraphQLParserTest, TypeReferences) {
    auto t = parseType("[Execution!]!");
    EXPECT_TRUE(t.isList());
    EXPECT_TRUE(t.nonNull);
    EXPECT_TRUE(t.ofType->nonNull);
    EXPECT_EQ(t.namedType(), "Execution");
    EXPECT_EQ(t.toString(), "[Execution!]!");
    EXPECT_FALSE(t.nullable().nonNull);
}

// ── Nesting limits ──

namespace {

std::string nestedQuery(std::size_t levels) {
    std::string query = "{";
    for (std::size_t i = 0; i < levels; ++i) query += " a {";
    query += " b";
    for (std::size_t i = 0; i <= levels; ++i) query += " }";
    return query;
}

} // namespace

TEST(GraphQLNestingTest, HostileNestingIsAParseError) {
    // Far beyond what the call stack could survive without a bound
    EXPECT_THROW(parse(nestedQuery(200000)), ParseError);
    EXPECT_THROW(parse("{ a(x: " + std::string(100000, '[') + ") }"), ParseError);
    EXPECT_THROW(parseType(std::string(100000, '[') + "Int"), ParseError);
}

TEST(GraphQLNestingTest, LimitIsInclusive) {
    // The operation's own braces count as one level
    EXPECT_NO_THROW(parse(nestedQuery(kMaxNesting - 1)));
    EXPECT_THROW(parse(nestedQuery(kMaxNesting)), ParseError);
}

TEST(GraphQLNestingTest, FragmentChainsCountOnceExpanded) {
    // Each fragment is shallow; spread into each other they are not
    std::string doc = "{ ...F0 }";
    for (std::size_t i = 0; i < kMaxNesting; ++i) {
        doc += " fragment F" + std::to_string(i) + " on Query { a { ...F" + std::to_string(i + 1) + " } }";
    }
    doc += " fragment F" + std::to_string(kMaxNesting) + " on Query { b }";
    EXPECT_THROW(parse(doc), ParseError);
}

TEST(GraphQLNestingTest, DepthCountsFieldsNotFragments) {
    EXPECT_EQ(depth(parse("{ a }").operation().selections), 1u);
    EXPECT_EQ(depth(parse("{ a { b { c } } d }").operation().selections), 3u);
    EXPECT_EQ(depth(parse("{ a { ... on A { b } ...F } } fragment F on A { c { d } }")
                        .operation().selections), 3u);
}

// ═══════════════════════════════════════════
//  Printer Tests
// ═══════════════════════════════════════════

TEST(GraphQLPrinterTest, CanonicalSingleLine) {
    auto doc = parse(R"(
        query Q($id: ID!) {
            w: workflow(id: $id) {
                name
                ... on Workflow @skip(if: false) { id }
            }
        }
    )");
    EXPECT_EQ(print(doc.operation()),
              "query Q($id: ID!) { w: workflow(id: $id) { name ... on Workflow @skip(if: false) { id } } }");
}

TEST(GraphQLPrinterTest, ValuesPrintAsLiterals) {
    auto doc = parse(R"({ search(filter: {text: "a\"b", limit: 5, tags: [A, B], exact: true, after: null}) })");
    EXPECT_EQ(print(doc.operation().selections),
              R"({ search(filter: {text: "a\"b", limit: 5, tags: [A, B], exact: true, after: null}) })");
}

TEST(GraphQLPrinterTest, PrintedDocumentReparsesIdentically) {
    std::string source = R"(mutation M($x: Int = 3) { a(x: $x) { b c { d } } e })";
    auto first = print(parse(source).operation());
    EXPECT_EQ(print(parse(first).operation()), first);
}

// ═══════════════════════════════════════════
//  @skip / @include
// ═══════════════════════════════════════════

TEST(DirectiveTest, SkipAndIncludeWithVariables) {
    auto doc = parse("query($on: Boolean) { a @include(if: $on) b @skip(if: $on) c }");
    auto& sels = doc.operation().selections;
    nlohmann::json on = {{"on", true}};
    nlohmann::json off = {{"on", false}};

    EXPECT_TRUE(shouldInclude(sels[0].directives, on));
    EXPECT_FALSE(shouldInclude(sels[0].directives, off));
    EXPECT_FALSE(shouldInclude(sels[1].directives, on));
    EXPECT_TRUE(shouldInclude(sels[1].directives, off));
    EXPECT_TRUE(shouldInclude(sels[2].directives, off));
}
