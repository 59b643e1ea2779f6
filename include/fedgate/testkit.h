#pragma once
// ═══════════════════════════════════════════════════════════════════
//  fedgate/testkit.h — In-process HTTP client for route tests
// ═══════════════════════════════════════════════════════════════════
//
//  Drives Server::handleRequest directly, no socket involved:
//    testkit::TestClient client(app);
//    auto res = client.graphql("{ workflow(id: \"1\") { name } }").expect(200);
//    res.data()["workflow"];
//    res.errorCodes();   // ["SUBGRAPH_DOWN", ...]
//
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include "json_utils.h"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace fedgate::testkit {

struct TestResult {
    int status = 0;
    std::string body;
    http::Response::Headers headers;

    nlohmann::json json() const { return nlohmann::json::parse(body); }

    // GraphQL envelope accessors; null / empty when absent
    nlohmann::json data() const { return json().value("data", nlohmann::json()); }
    nlohmann::json errors() const { return json().value("errors", nlohmann::json::array()); }

    std::vector<std::string> errorCodes() const {
        std::vector<std::string> codes;
        for (auto& error : errors()) {
            auto ext = error.value("extensions", nlohmann::json::object());
            codes.push_back(ext.value("code", std::string()));
        }
        return codes;
    }
};

class TestClient {
public:
    explicit TestClient(http::Server& app) : app_(app) {}

    class RequestBuilder {
    public:
        RequestBuilder(http::Server& app, std::string method, std::string path)
            : app_(app) {
            req_.method = std::move(method);
            req_.path = std::move(path);
            req_.url = req_.path;
            req_.ip = "127.0.0.1";
            req_.hostname = "localhost";
        }

        RequestBuilder& set(std::string key, const std::string& value) {
            std::transform(key.begin(), key.end(), key.begin(), ::tolower);
            req_.headers[key] = value;
            return *this;
        }

        // Raw body; typed as JSON unless a Content-Type was set
        RequestBuilder& send(const std::string& body) {
            req_.rawBody = body;
            req_.headers.emplace("content-type", "application/json");
            return *this;
        }

        RequestBuilder& send(const char* body) { return send(std::string(body)); }

        RequestBuilder& send(const nlohmann::json& j) {
            req_.rawBody = j.dump();
            req_.headers["content-type"] = "application/json";
            return *this;
        }

        RequestBuilder& query(const std::string& key, const std::string& value) {
            req_.query[key] = value;
            return *this;
        }

        TestResult exec() {
            TestResult result;
            http::Response res([&result](int status, const http::Response::Headers& headers,
                                         const std::string& body) {
                result.status = status;
                result.headers = headers;
                result.body = body;
            });
            app_.handleRequest(req_, res);
            if (!res.headersSent()) {
                result.status = res.getStatusCode();
                result.headers = res.getHeaders();
                result.body = res.getBody();
            }
            return result;
        }

        // exec() and throw std::runtime_error on any other status
        TestResult expect(int status) {
            auto result = exec();
            if (result.status != status) {
                throw std::runtime_error("Expected status " + std::to_string(status) + " but got " +
                                         std::to_string(result.status) + ": " + result.body);
            }
            return result;
        }

    private:
        http::Server& app_;
        http::Request req_;
    };

    RequestBuilder request(const std::string& method, const std::string& path) { return {app_, method, path}; }
    RequestBuilder get(const std::string& path) { return request("GET", path); }
    RequestBuilder post(const std::string& path) { return request("POST", path); }

    // POST {query, variables, operationName} to `path`
    RequestBuilder graphql(const std::string& query,
                           const nlohmann::json& variables = nlohmann::json::object(),
                           const std::string& operationName = "",
                           const std::string& path = "/graphql") {
        nlohmann::json body = {{"query", query}, {"variables", variables}};
        if (!operationName.empty()) body["operationName"] = operationName;
        auto builder = post(path);
        builder.send(body);
        return builder;
    }

private:
    http::Server& app_;
};

} // namespace fedgate::testkit
