#pragma once
// ═══════════════════════════════════════════════════════════════════
//  federation_fixtures.h — Shared subgraph SDLs and a scripted client
// ═══════════════════════════════════════════════════════════════════

#include "fedgate/graphql.h"
#include "fedgate/schema_registry.h"
#include "fedgate/subgraph_client.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace fixtures {

inline const char* kWorkflowSdl = R"(
    scalar _Any
    type _Service { sdl: String }
    union _Entity = Workflow

    type Workflow @key(fields: "id") {
        id: ID!
        name: String!
        status: String
    }

    type Query {
        workflow(id: ID!): Workflow
        workflows: [Workflow!]!
        serverTime: String @shareable
        _service: _Service!
        _entities(representations: [_Any!]!): [_Entity]!
    }

    type Mutation {
        createWorkflow(name: String!): Workflow!
    }
)";

inline const char* kExecutionSdl = R"(
    scalar _Any
    type _Service { sdl: String }
    union _Entity = Execution | Workflow

    type Execution @key(fields: "id") {
        id: ID!
        status: String!
        startedAt: String
    }

    extend type Workflow @key(fields: "id") {
        id: ID! @external
        executions(limit: Int): [Execution!]
        latest: Execution
    }

    type Query {
        execution(id: ID!): Execution
        serverTime: String @shareable
        _service: _Service!
        _entities(representations: [_Any!]!): [_Entity]!
    }

    type Mutation {
        startExecution(workflowId: ID!): Execution!
    }
)";

inline const char* kTicketSdl = R"(
    scalar _Any
    type _Service { sdl: String }
    union _Entity = Ticket | Execution

    type Ticket @key(fields: "id") {
        id: ID!
        title: String!
    }

    extend type Execution @key(fields: "id") {
        id: ID! @external
        tickets: [Ticket!]!
    }

    type Query {
        ticket(id: ID!): Ticket
        _service: _Service!
        _entities(representations: [_Any!]!): [_Entity]!
    }
)";

// workflow + execution (+ ticket) registered and composed
inline std::shared_ptr<fedgate::schema::SchemaRegistry> registry(bool withTickets = false) {
    auto r = std::make_shared<fedgate::schema::SchemaRegistry>();
    r->registerSubgraph("workflow", "http://workflow.local/graphql", kWorkflowSdl);
    r->registerSubgraph("execution", "http://execution.local/graphql", kExecutionSdl);
    if (withTickets) r->registerSubgraph("ticket", "http://ticket.local/graphql", kTicketSdl);
    r->compose();
    return r;
}

// ═══════════════════════════════════════════
//  ScriptedClient — answers per subgraph, records every request
// ═══════════════════════════════════════════
class ScriptedClient : public fedgate::client::SubgraphClient {
public:
    using Handler = std::function<fedgate::client::SubgraphResponse(const fedgate::client::SubgraphRequest&)>;

    void on(const std::string& subgraph, Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_[subgraph] = std::move(handler);
    }

    // Reply with a fixed `data` object
    void reply(const std::string& subgraph, nlohmann::json data) {
        on(subgraph, [data](const fedgate::client::SubgraphRequest&) {
            fedgate::client::SubgraphResponse res;
            res.data = data;
            return res;
        });
    }

    void fail(const std::string& subgraph, const std::string& message) {
        on(subgraph, [subgraph, message](const fedgate::client::SubgraphRequest&) -> fedgate::client::SubgraphResponse {
            throw fedgate::FetchError(subgraph, message);
        });
    }

    void setCheckFailure(const std::string& subgraph, bool failing) {
        std::lock_guard<std::mutex> lock(mutex_);
        checkFailures_[subgraph] = failing;
    }

    fedgate::client::SubgraphResponse execute(const fedgate::client::SubgraphRequest& request) override {
        Handler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            auto it = handlers_.find(request.subgraph);
            if (it == handlers_.end()) {
                throw fedgate::FetchError(request.subgraph, "no handler for " + request.subgraph);
            }
            handler = it->second;
        }
        return handler(request);
    }

    void checkHealth(const fedgate::client::CheckTarget& target, std::chrono::milliseconds) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++checks_;
        if (checkFailures_[target.subgraph]) {
            throw fedgate::FetchError(target.subgraph, "connection refused");
        }
    }

    std::vector<fedgate::client::SubgraphRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    std::vector<fedgate::client::SubgraphRequest> requestsTo(const std::string& subgraph) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<fedgate::client::SubgraphRequest> out;
        for (auto& r : requests_) {
            if (r.subgraph == subgraph) out.push_back(r);
        }
        return out;
    }

    int checks() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return checks_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, Handler> handlers_;
    std::map<std::string, bool> checkFailures_;
    std::vector<fedgate::client::SubgraphRequest> requests_;
    int checks_ = 0;
};

// `_entities` handler that resolves each representation with `resolve`
inline ScriptedClient::Handler entities(std::function<nlohmann::json(const nlohmann::json&)> resolve) {
    return [resolve](const fedgate::client::SubgraphRequest& request) {
        fedgate::client::SubgraphResponse res;
        auto out = nlohmann::json::array();
        for (auto& rep : request.variables.at("representations")) out.push_back(resolve(rep));
        res.data = {{"_entities", out}};
        return res;
    };
}

// `_entities` handler that answers every field the document asks of a
// representation, under its response key, with `resolve(rep, field)`
inline ScriptedClient::Handler entityFields(
    std::function<nlohmann::json(const nlohmann::json&, const fedgate::graphql::FieldSelection&)> resolve) {
    return [resolve](const fedgate::client::SubgraphRequest& request) {
        auto doc = fedgate::graphql::parse(request.query);
        auto& entitiesField = doc.operation().selections.at(0);
        auto out = nlohmann::json::array();
        for (auto& rep : request.variables.at("representations")) {
            auto typeName = rep.at("__typename").get<std::string>();
            nlohmann::json entity = {{"__typename", typeName}};
            for (auto& fragment : entitiesField.selections) {
                if (fragment.typeCondition != typeName) continue;
                for (auto& field : fragment.selections) {
                    if (field.isField()) entity[field.responseKey()] = resolve(rep, field);
                }
            }
            out.push_back(std::move(entity));
        }
        fedgate::client::SubgraphResponse res;
        res.data = {{"_entities", out}};
        return res;
    };
}

} // namespace fixtures
