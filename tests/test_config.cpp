// ═══════════════════════════════════════════════════════════════════
//  test_config.cpp — Configuration decoding, overrides, validation
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include "fedgate/config.h"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <unistd.h>

using namespace fedgate;
using namespace fedgate::config;
using json = nlohmann::json;

namespace {

json minimal() {
    return {{"subgraphs", json::array({{{"name", "workflow"}, {"url", "http://localhost:4001/graphql"}}})}};
}

std::string expectConfigError(const json& j) {
    try {
        parseConfig(j);
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.code(), codes::Config);
        return e.what();
    }
    ADD_FAILURE() << "expected ConfigError for " << j.dump();
    return "";
}

// Temp file removed at scope exit
class TempFile {
public:
    explicit TempFile(const std::string& content) {
        char name[] = "/tmp/fedgate-config-XXXXXX";
        int fd = mkstemp(name);
        if (fd >= 0) close(fd);
        path_ = name;
        std::ofstream(path_) << content;
    }
    ~TempFile() { std::remove(path_.c_str()); }
    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class EnvGuard {
public:
    EnvGuard(const char* key, const char* value) : key_(key) { setenv(key, value, 1); }
    ~EnvGuard() { unsetenv(key_); }

private:
    const char* key_;
};

} // namespace

// ═══════════════════════════════════════════
//  Decoding
// ═══════════════════════════════════════════

TEST(ConfigTest, DefaultsFillAbsentKeys) {
    auto cfg = parseConfig(minimal());
    EXPECT_EQ(cfg.server.host, "0.0.0.0");
    EXPECT_EQ(cfg.server.port, 4000);
    EXPECT_EQ(cfg.server.threads, 4);
    EXPECT_EQ(cfg.server.maxBodyBytes, 1024u * 1024u);
    EXPECT_EQ(cfg.server.readTimeoutMs, 30000);
    EXPECT_EQ(cfg.planCache.maxEntries, 1000u);
    EXPECT_EQ(cfg.planCache.ttlMs, 300000);
    EXPECT_EQ(cfg.health.degradedAfter, 2);
    EXPECT_EQ(cfg.health.downAfter, 3);
    EXPECT_EQ(cfg.requestTimeoutMs, 10000);
    EXPECT_EQ(cfg.fetchTimeoutMs, 5000);
    EXPECT_EQ(cfg.maxQueryDepth, 15);
    EXPECT_EQ(cfg.logLevel, "info");
    EXPECT_FALSE(cfg.adminEnabled);
    ASSERT_EQ(cfg.subgraphs.size(), 1u);
    EXPECT_TRUE(cfg.subgraphs[0].healthUrl.empty());
}

TEST(ConfigTest, FullDocument) {
    auto cfg = parseConfig(json::parse(R"({
        "server": { "host": "127.0.0.1", "port": 8080, "threads": 2 },
        "subgraphs": [
            { "name": "workflow",  "url": "http://localhost:4001/graphql", "healthUrl": "http://localhost:4001/health" },
            { "name": "execution", "url": "http://localhost:4002/graphql" }
        ],
        "planCache": { "maxEntries": 50, "ttlMs": 0 },
        "health": { "intervalMs": 1000, "downAfter": 5 },
        "requestTimeoutMs": 3000,
        "logLevel": "debug",
        "adminEnabled": true
    })"));
    EXPECT_EQ(cfg.server.port, 8080);
    EXPECT_EQ(cfg.subgraphs[0].healthUrl, "http://localhost:4001/health");
    EXPECT_EQ(cfg.subgraphs[1].name, "execution");
    EXPECT_EQ(cfg.planCache.ttlMs, 0);
    EXPECT_EQ(cfg.health.intervalMs, 1000);
    EXPECT_EQ(cfg.health.timeoutMs, 2000);
    EXPECT_EQ(cfg.health.downAfter, 5);
    EXPECT_TRUE(cfg.adminEnabled);

    // Round trip through to_json keeps every value
    EXPECT_EQ(json(cfg).get<GatewayConfig>().subgraphs, cfg.subgraphs);
}

TEST(ConfigTest, WrongTypesAreConfigErrors) {
    auto j = minimal();
    j["server"] = {{"port", "eighty"}};
    EXPECT_NE(expectConfigError(j).find("Invalid configuration"), std::string::npos);
    expectConfigError(json::array());
}

// ═══════════════════════════════════════════
//  Validation
// ═══════════════════════════════════════════

TEST(ConfigValidationTest, RejectsBadValues) {
    auto j = minimal();
    j["server"] = {{"port", 70000}};
    EXPECT_NE(expectConfigError(j).find("server.port"), std::string::npos);

    j = minimal();
    j["server"] = {{"threads", 0}};
    expectConfigError(j);

    j = minimal();
    j["server"] = {{"maxBodyBytes", 10}};
    EXPECT_NE(expectConfigError(j).find("maxBodyBytes"), std::string::npos);

    j = minimal();
    j["subgraphs"].push_back({{"name", "workflow"}, {"url", "http://other/graphql"}});
    EXPECT_NE(expectConfigError(j).find("listed twice"), std::string::npos);

    j = minimal();
    j["subgraphs"][0]["url"] = "ftp://workflow";
    expectConfigError(j);

    j = minimal();
    j["subgraphs"][0]["healthUrl"] = "workflow/health";
    expectConfigError(j);

    j = minimal();
    j["planCache"] = {{"maxEntries", 0}};
    expectConfigError(j);

    j = minimal();
    j["health"] = {{"downAfter", 0}};
    expectConfigError(j);

    j = minimal();
    j["fetchTimeoutMs"] = 0;
    expectConfigError(j);

    j = minimal();
    j["maxQueryDepth"] = 0;
    EXPECT_NE(expectConfigError(j).find("maxQueryDepth"), std::string::npos);
    j["maxQueryDepth"] = 1000;
    expectConfigError(j);

    j = minimal();
    j["logLevel"] = "chatty";
    EXPECT_NE(expectConfigError(j).find("logLevel"), std::string::npos);
}

TEST(ConfigValidationTest, EmptySubgraphListIsAllowed) {
    EXPECT_NO_THROW(parseConfig(json::object()));
}

// ═══════════════════════════════════════════
//  Files and environment
// ═══════════════════════════════════════════

TEST(ConfigFileTest, LoadsFileWithComments) {
    TempFile file(R"({
        // local development
        "server": { "port": 4100 },
        "subgraphs": [ { "name": "workflow", "url": "http://localhost:4001/graphql" } ]
    })");
    auto cfg = loadConfig(file.path());
    EXPECT_EQ(cfg.server.port, 4100);
    EXPECT_EQ(cfg.subgraphs.size(), 1u);
}

TEST(ConfigFileTest, MissingOrMalformedFile) {
    EXPECT_THROW(loadConfig("/nonexistent/fedgate.json"), ConfigError);
    TempFile broken("{ \"server\": ");
    try {
        loadConfig(broken.path());
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("not valid JSON"), std::string::npos);
    }
}

TEST(ConfigFileTest, EnvironmentOverridesFile) {
    TempFile file(minimal().dump());
    EnvGuard port("FEDGATE_PORT", "5050");
    EnvGuard level("FEDGATE_LOG_LEVEL", "warn");
    auto cfg = loadConfig(file.path());
    EXPECT_EQ(cfg.server.port, 5050);
    EXPECT_EQ(cfg.logLevel, "warn");
}

TEST(ConfigFileTest, NonNumericPortOverride) {
    GatewayConfig cfg;
    EnvGuard port("FEDGATE_PORT", "50x");
    EXPECT_THROW(applyEnvironment(cfg), ConfigError);
}
