// ═══════════════════════════════════════════════════════════════════
//  test_json.cpp — JsonValue, config serialization, response paths
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include "fedgate/json_utils.h"
#include "fedgate/http.h"
#include <string>
#include <vector>

using namespace fedgate;

// ── Test structs ──
struct Endpoint {
    std::string name;
    int port = 0;
    FEDGATE_SERIALIZE_WITH_DEFAULT(Endpoint, name, port)
};

struct Limits {
    int timeoutMs = 5000;
    int retries = 2;
    FEDGATE_SERIALIZE_WITH_DEFAULT(Limits, timeoutMs, retries)
};

// ═══════════════════════════════════════════
//  JsonValue Tests
// ═══════════════════════════════════════════

TEST(JsonValueTest, DefaultIsEmptyObject) {
    JsonValue val;
    EXPECT_TRUE(val.isObject());
    EXPECT_EQ(val.dump(), "{}");
}

TEST(JsonValueTest, MissingKeysReadAsNull) {
    JsonValue val(nlohmann::json{{"query", "{ a }"}});
    EXPECT_EQ(val["query"].get<std::string>(), "{ a }");
    EXPECT_TRUE(val["variables"].isNull());
    EXPECT_TRUE(val["variables"]["id"].isNull());
}

TEST(JsonValueTest, TypedGetWithDefault) {
    JsonValue val(nlohmann::json{{"name", "Bob"}, {"count", "not a number"}});
    EXPECT_EQ(val.get<std::string>("name", "default"), "Bob");
    EXPECT_EQ(val.get<std::string>("missing", "default"), "default");
    EXPECT_EQ(val.get<int>("count", 42), 42);
}

TEST(JsonValueTest, HasMethod) {
    JsonValue val(nlohmann::json{{"a", 1}});
    EXPECT_TRUE(val.has("a"));
    EXPECT_FALSE(val.has("b"));
    EXPECT_FALSE(JsonValue(nlohmann::json::array()).has("a"));
}

// ═══════════════════════════════════════════
//  Serialization
// ═══════════════════════════════════════════

TEST(SerializationTest, StructRoundTrip) {
    Endpoint e{"workflow", 4001};
    nlohmann::json j = e;
    EXPECT_EQ(j["name"], "workflow");
    EXPECT_EQ(j.get<Endpoint>().port, 4001);
}

TEST(SerializationTest, WithDefaultKeepsMemberDefaults) {
    auto limits = nlohmann::json{{"retries", 5}}.get<Limits>();
    EXPECT_EQ(limits.retries, 5);
    EXPECT_EQ(limits.timeoutMs, 5000);
}

TEST(ResponseJsonTest, StructToJson) {
    std::string body;
    http::Response res([&](int, const auto&, const std::string& b) { body = b; });
    res.json(Endpoint{"execution", 4002});
    auto parsed = nlohmann::json::parse(body);
    EXPECT_EQ(parsed["name"], "execution");
    EXPECT_EQ(res.getHeaders().at("Content-Type"), "application/json; charset=utf-8");
}

// ═══════════════════════════════════════════
//  Response paths
// ═══════════════════════════════════════════

TEST(JsonPathTest, AppendBuildsArrays) {
    auto path = json_path::append(nullptr, "workflow");
    path = json_path::append(path, "executions");
    path = json_path::append(path, 0);
    EXPECT_EQ(path, nlohmann::json::parse(R"(["workflow","executions",0])"));
    EXPECT_EQ(json_path::toString(path), "workflow.executions.0");
}

TEST(JsonPathTest, StartsWith) {
    auto path = nlohmann::json::parse(R"(["workflow","executions",0,"id"])");
    EXPECT_TRUE(json_path::startsWith(path, nlohmann::json::parse(R"(["workflow"])")));
    EXPECT_TRUE(json_path::startsWith(path, path));
    EXPECT_TRUE(json_path::startsWith(path, nlohmann::json::array()));
    EXPECT_FALSE(json_path::startsWith(path, nlohmann::json::parse(R"(["workflow","name"])")));
    EXPECT_FALSE(json_path::startsWith(nlohmann::json::parse(R"(["workflow"])"), path));
    EXPECT_FALSE(json_path::startsWith(nullptr, path));
}

// ═══════════════════════════════════════════
//  shapeOf
// ═══════════════════════════════════════════

TEST(ShapeOfTest, IgnoresValuesKeepsTypes) {
    EXPECT_EQ(shapeOf(nlohmann::json{{"id", "1"}}), shapeOf(nlohmann::json{{"id", "2"}}));
    EXPECT_NE(shapeOf(nlohmann::json{{"id", "1"}}), shapeOf(nlohmann::json{{"id", 1}}));
    EXPECT_EQ(shapeOf(nlohmann::json::parse(R"({"ids":[1,2],"on":true})")), "{ids:[int],on:boolean}");
}

TEST(ShapeOfTest, NullAndEmpty) {
    EXPECT_EQ(shapeOf(nullptr), "null");
    EXPECT_EQ(shapeOf(nlohmann::json::object()), "{}");
    EXPECT_EQ(shapeOf(nlohmann::json::array()), "[]");
}
