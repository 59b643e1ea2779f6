// ═══════════════════════════════════════════════════════════════════
//  src/executor.cpp — Level-by-level fetch execution and completion
// ═══════════════════════════════════════════════════════════════════

#include "fedgate/executor.h"
#include "fedgate/console.h"
#include "fedgate/json_utils.h"
#include <algorithm>
#include <future>
#include <map>
#include <optional>
#include <set>
#include <thread>

namespace fedgate::executor {

using json = nlohmann::json;
using Clock = std::chrono::steady_clock;

nlohmann::json ExecutionResult::toJson() const {
    json out = {{"data", data}};
    if (!errors.empty()) out["errors"] = errors;
    return out;
}

nlohmann::json coerceVariables(const graphql::ParsedQuery& operation, const nlohmann::json& variables) {
    json provided = variables.is_object() ? variables : json::object();
    json out = json::object();
    for (auto& def : operation.variables) {
        auto it = provided.find(def.name);
        if (it != provided.end()) {
            if (it->is_null() && def.type.nonNull) {
                throw PlanningError("Variable \"$" + def.name + "\" of non-null type \"" +
                                    def.type.toString() + "\" must not be null");
            }
            out[def.name] = *it;
        } else if (def.defaultValue) {
            out[def.name] = def.defaultValue->toJson();
        } else if (def.type.nonNull) {
            throw PlanningError("Variable \"$" + def.name + "\" of required type \"" +
                                def.type.toString() + "\" was not provided");
        }
    }
    return out;
}

namespace {

// ── Parent objects an entity fetch attaches to ──
struct Target {
    json path;                      // client path, e.g. ["workflow", "executions", 0]
    json::json_pointer pointer;     // same location inside the merged data
};

void collectTargets(const json& value, const std::vector<std::string>& mergePath, std::size_t depth,
                    const json& path, const json::json_pointer& pointer, std::vector<Target>& out) {
    if (value.is_null()) return;
    if (depth == mergePath.size()) {
        if (value.is_object()) out.push_back({path, pointer});
        return;
    }
    auto& segment = mergePath[depth];
    if (segment == "@") {
        if (!value.is_array()) return;
        for (std::size_t i = 0; i < value.size(); ++i) {
            collectTargets(value[i], mergePath, depth + 1, json_path::append(path, i), pointer / i, out);
        }
        return;
    }
    if (!value.is_object()) return;
    auto it = value.find(segment);
    if (it == value.end()) return;
    collectTargets(*it, mergePath, depth + 1, json_path::append(path, segment), pointer / segment, out);
}

// Response keys of the fields a fetch contributes at its own level
void topLevelKeys(const graphql::SelectionSet& selections, std::vector<std::string>& out) {
    for (auto& sel : selections) {
        if (sel.isFragment()) {
            topLevelKeys(sel.selections, out);
        } else if (sel.name != "__typename" &&
                   std::find(out.begin(), out.end(), sel.responseKey()) == out.end()) {
            out.push_back(sel.responseKey());
        }
    }
}

// Objects merge key by key, equal-length lists element by element
void deepMerge(json& target, const json& source) {
    if (target.is_object() && source.is_object()) {
        for (auto& [key, value] : source.items()) {
            auto it = target.find(key);
            if (it == target.end()) {
                target[key] = value;
            } else {
                deepMerge(*it, value);
            }
        }
        return;
    }
    if (target.is_array() && source.is_array() && target.size() == source.size()) {
        for (std::size_t i = 0; i < source.size(); ++i) deepMerge(target[i], source[i]);
        return;
    }
    if (!source.is_null() || !target.is_object()) target = source;
}

// ── Aliasing inside a shared `_entities` call ──
// Each node's top-level fields go out under "_n<id>_<key>", so two nodes
// may ask for the same field with different arguments or subfields.
std::string aliasPrefix(int node) {
    return "_n" + std::to_string(node) + "_";
}

graphql::SelectionSet aliased(const graphql::SelectionSet& selections, const std::string& prefix) {
    auto out = selections;
    for (auto& sel : out) {
        if (sel.isFragment()) {
            sel.selections = aliased(sel.selections, prefix);
        } else if (sel.name != "__typename") {
            sel.alias = prefix + sel.responseKey();
        }
    }
    return out;
}

// One node's share of an aliased entity, under its own response keys
json unaliased(const json& entity, const std::string& prefix) {
    json out = json::object();
    for (auto& [key, value] : entity.items()) {
        if (key.rfind(prefix, 0) == 0) out[key.substr(prefix.size())] = value;
    }
    return out;
}

json withSubgraph(json error, const std::string& subgraph) {
    if (!error.is_object()) error = graphqlError(error.dump());
    if (!error.contains("message")) error["message"] = "Subgraph error";
    auto& extensions = error["extensions"];
    if (!extensions.is_object()) extensions = json::object();
    if (!extensions.contains("code")) extensions["code"] = codes::Subgraph;
    extensions["subgraph"] = subgraph;
    return error;
}

// ── One subgraph call, possibly covering several entity fetches ──
struct Batch {
    std::string subgraph;
    std::string entityType;                     // empty for root fetches
    bool aliased = false;                       // more than one node shares the call
    std::vector<int> nodes;
    std::vector<planner::EntityRepresentation> representations;
    std::map<std::string, std::size_t> representationIndex;   // dedupe by serialized form

    struct Slot {
        int node;
        Target target;
        std::size_t representation;
    };
    std::vector<Slot> slots;

    client::SubgraphRequest request;
    std::shared_future<client::SubgraphResponse> response;
};

// ═══════════════════════════════════════════
//  Execution — state of one request
// ═══════════════════════════════════════════
class Execution {
public:
    Execution(const planner::QueryPlan& plan, const schema::ComposedSchema& schema,
              json variables, const DownCheck& isDown, Clock::time_point deadline,
              std::shared_ptr<client::SubgraphClient> client, std::chrono::milliseconds fetchTimeout)
        : plan_(plan), schema_(schema), variables_(std::move(variables)), isDown_(isDown)
        , deadline_(deadline), client_(std::move(client)), fetchTimeout_(fetchTimeout) {}

    ExecutionResult run() {
        auto levels = plan_.levels();
        for (std::size_t level = 0; level < levels.size(); ++level) {
            if (Clock::now() >= deadline_) {
                abandonFrom(levels, level, "Request deadline exceeded before the fetch started");
                break;
            }
            if (!runLevel(levels[level])) {
                abandonFrom(levels, level + 1, "Request deadline exceeded before the fetch started");
                break;
            }
        }

        ExecutionResult result;
        auto completed = completeObject(plan_.rootType, data_, plan_.operation.selections, json::array());
        result.data = completed ? std::move(*completed) : json(nullptr);
        result.errors = std::move(errors_);
        return result;
    }

private:
    const planner::QueryPlan& plan_;
    const schema::ComposedSchema& schema_;
    json variables_;
    const DownCheck& isDown_;
    Clock::time_point deadline_;
    std::shared_ptr<client::SubgraphClient> client_;
    std::chrono::milliseconds fetchTimeout_;

    json data_ = json::object();
    json errors_ = json::array();

    // ── Errors scoped to the fields one fetch was responsible for ──
    void branchErrors(const planner::FetchNode& node, const std::vector<Target>& targets,
                      const std::string& message, const std::string& code) {
        std::vector<std::string> keys;
        topLevelKeys(node.selections, keys);
        for (auto& target : targets) {
            for (auto& key : keys) {
                errors_.push_back(graphqlError(message, json_path::append(target.path, key), code, node.subgraph));
            }
        }
    }

    std::vector<Target> targetsOf(const planner::FetchNode& node) const {
        std::vector<Target> targets;
        if (node.kind == planner::FetchKind::Root) {
            targets.push_back({json::array(), json::json_pointer()});
        } else {
            collectTargets(data_, node.mergePath, 0, json::array(), json::json_pointer(), targets);
        }
        return targets;
    }

    void abandonFrom(const std::vector<std::vector<int>>& levels, std::size_t first, const std::string& message) {
        for (std::size_t level = first; level < levels.size(); ++level) {
            for (int id : levels[level]) {
                auto& node = plan_.node(id);
                branchErrors(node, targetsOf(node), message, codes::Timeout);
            }
        }
    }

    json nodeVariables(const planner::FetchNode& node) const {
        json out = json::object();
        for (auto& name : node.variableNames) {
            auto it = variables_.find(name);
            if (it != variables_.end()) out[name] = *it;
        }
        return out;
    }

    // Returns false when the deadline cut the level short
    bool runLevel(const std::vector<int>& ids) {
        std::vector<Batch> batches;
        std::map<std::pair<std::string, std::string>, std::size_t> entityBatches;

        for (int id : ids) {
            auto& node = plan_.node(id);
            auto targets = targetsOf(node);
            if (targets.empty()) continue;

            if (isDown_ && isDown_(node.subgraph)) {
                branchErrors(node, targets, "Subgraph '" + node.subgraph + "' is down", codes::SubgraphDown);
                continue;
            }

            if (node.kind == planner::FetchKind::Root) {
                Batch batch;
                batch.subgraph = node.subgraph;
                batch.nodes.push_back(id);
                batch.slots.push_back({id, targets.front(), 0});
                batch.request.query = node.document;
                batch.request.variables = nodeVariables(node);
                batch.request.operationName = plan_.operation.operationName;
                batches.push_back(std::move(batch));
                continue;
            }

            auto key = std::make_pair(node.subgraph, node.entityType);
            auto found = entityBatches.find(key);
            if (found == entityBatches.end()) {
                Batch batch;
                batch.subgraph = node.subgraph;
                batch.entityType = node.entityType;
                batches.push_back(std::move(batch));
                found = entityBatches.emplace(key, batches.size() - 1).first;
            }
            addEntityTargets(batches[found->second], node, targets);
        }

        for (auto& batch : batches) {
            if (!batch.entityType.empty()) prepareEntityRequest(batch);
        }
        batches.erase(std::remove_if(batches.begin(), batches.end(),
                                     [](const Batch& b) { return b.slots.empty(); }),
                      batches.end());

        for (auto& batch : batches) dispatch(batch);

        bool inTime = true;
        for (auto& batch : batches) {
            if (batch.response.wait_until(deadline_) != std::future_status::ready) {
                inTime = false;
                for (auto id : batch.nodes) {
                    auto& node = plan_.node(id);
                    branchErrors(node, slotTargets(batch, id),
                                 "Subgraph '" + node.subgraph + "' did not answer before the request deadline",
                                 codes::Timeout);
                }
                console::warn("Fetch to", batch.subgraph, "abandoned at the request deadline");
                continue;
            }
            merge(batch);
        }
        return inTime;
    }

    std::vector<Target> slotTargets(const Batch& batch, int node) const {
        std::vector<Target> out;
        for (auto& slot : batch.slots) {
            if (slot.node == node) out.push_back(slot.target);
        }
        return out;
    }

    void addEntityTargets(Batch& batch, const planner::FetchNode& node, const std::vector<Target>& targets) {
        bool added = false;
        for (auto& target : targets) {
            auto& object = data_.at(target.pointer);
            auto typeName = node.entityType;
            auto typeIt = object.find("__typename");
            if (typeIt != object.end() && typeIt->is_string()) {
                auto runtime = typeIt->get<std::string>();
                if (runtime != node.entityType && !typeApplies(node.entityType, runtime)) continue;
                if (schema_.isEntity(runtime)) typeName = runtime;
            }
            try {
                auto rep = planner::EntityRepresentation::fromObject(
                    typeName, object, node.keyFields, node.requiredFields, node.subgraph);
                rep.validate(schema_, node.subgraph);
                auto serialized = rep.toJson().dump();
                auto it = batch.representationIndex.find(serialized);
                if (it == batch.representationIndex.end()) {
                    batch.representations.push_back(std::move(rep));
                    it = batch.representationIndex.emplace(serialized, batch.representations.size() - 1).first;
                }
                batch.slots.push_back({node.id, target, it->second});
                added = true;
            } catch (const EntityResolutionError& e) {
                branchErrors(node, {target}, e.what(), codes::EntityResolution);
            }
        }
        if (added) batch.nodes.push_back(node.id);
    }

    void prepareEntityRequest(Batch& batch) {
        if (batch.slots.empty()) return;
        batch.aliased = batch.nodes.size() > 1;
        graphql::SelectionSet selections;
        std::set<std::string> names;
        for (int id : batch.nodes) {
            auto& node = plan_.node(id);
            auto part = batch.aliased ? aliased(node.selections, aliasPrefix(id)) : node.selections;
            selections.insert(selections.end(), part.begin(), part.end());
            names.insert(node.variableNames.begin(), node.variableNames.end());
        }
        std::vector<graphql::VariableDefinition> definitions;
        json variables = json::object();
        for (auto& def : plan_.operation.variables) {
            if (!names.count(def.name)) continue;
            definitions.push_back(def);
            auto it = variables_.find(def.name);
            if (it != variables_.end()) variables[def.name] = *it;
        }
        auto representations = json::array();
        for (auto& rep : batch.representations) representations.push_back(rep.toJson());
        variables["representations"] = std::move(representations);

        batch.request.query = planner::entitiesDocument(batch.entityType, selections, definitions);
        batch.request.variables = std::move(variables);
    }

    void dispatch(Batch& batch) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - Clock::now());
        batch.request.subgraph = batch.subgraph;
        auto url = schema_.subgraphUrls.find(batch.subgraph);
        if (url != schema_.subgraphUrls.end()) batch.request.url = url->second;
        batch.request.timeout = std::max(std::chrono::milliseconds(1), std::min(fetchTimeout_, remaining));

        console::debug("Fetch", batch.subgraph,
                       batch.entityType.empty() ? std::string("root") : batch.entityType,
                       "representations:", batch.representations.size());

        // Detached so the request can give up on it at the deadline
        auto promise = std::make_shared<std::promise<client::SubgraphResponse>>();
        batch.response = promise->get_future().share();
        std::thread([client = client_, request = batch.request, promise]() {
            try {
                promise->set_value(client->execute(request));
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        }).detach();
    }

    void merge(const Batch& batch) {
        client::SubgraphResponse response;
        try {
            response = batch.response.get();
        } catch (const FetchError& e) {
            failBatch(batch, "Subgraph '" + batch.subgraph + "' request failed: " + e.what(), e.code());
            return;
        } catch (const std::exception& e) {
            failBatch(batch, "Subgraph '" + batch.subgraph + "' request failed: " + e.what(), codes::Fetch);
            return;
        }

        if (batch.entityType.empty()) {
            mergeRoot(batch, response);
        } else {
            mergeEntities(batch, response);
        }
    }

    void failBatch(const Batch& batch, const std::string& message, const std::string& code) {
        console::warn(message);
        for (int id : batch.nodes) branchErrors(plan_.node(id), slotTargets(batch, id), message, code);
    }

    void mergeRoot(const Batch& batch, const client::SubgraphResponse& response) {
        for (auto& error : response.errors) errors_.push_back(withSubgraph(error, batch.subgraph));
        if (response.data.is_object()) {
            deepMerge(data_, response.data);
        } else if (response.errors.empty()) {
            failBatch(batch, "Subgraph '" + batch.subgraph + "' returned no data", codes::Fetch);
        }
    }

    void mergeEntities(const Batch& batch, const client::SubgraphResponse& response) {
        const json* entities = nullptr;
        if (response.data.is_object()) {
            auto it = response.data.find("_entities");
            if (it != response.data.end() && it->is_array()) entities = &*it;
        }

        // Errors pointing into `_entities` move to every client path using that representation
        std::set<std::size_t> explained;
        for (auto& error : response.errors) {
            auto path = error.is_object() ? error.value("path", json()) : json();
            if (path.is_array() && path.size() >= 2 && path[0] == "_entities" &&
                path[1].is_number_integer() && path[1].get<long long>() >= 0) {
                auto index = static_cast<std::size_t>(path[1].get<long long>());
                explained.insert(index);
                bool placed = false;
                for (auto& slot : batch.slots) {
                    if (slot.representation != index) continue;
                    json clientPath = slot.target.path;
                    std::size_t rest = 2;
                    if (batch.aliased && path.size() > 2) {
                        // Only the node whose alias the error names
                        auto prefix = aliasPrefix(slot.node);
                        if (!path[2].is_string() || path[2].get<std::string>().rfind(prefix, 0) != 0) continue;
                        clientPath.push_back(path[2].get<std::string>().substr(prefix.size()));
                        rest = 3;
                    }
                    for (std::size_t i = rest; i < path.size(); ++i) clientPath.push_back(path[i]);
                    auto rewritten = withSubgraph(error, batch.subgraph);
                    if (path.size() == 2) {
                        std::vector<std::string> keys;
                        topLevelKeys(plan_.node(slot.node).selections, keys);
                        if (!keys.empty()) clientPath.push_back(keys.front());
                    }
                    rewritten["path"] = clientPath;
                    errors_.push_back(std::move(rewritten));
                    placed = true;
                }
                if (placed) continue;
            }
            auto forwarded = withSubgraph(error, batch.subgraph);
            forwarded.erase("path");
            errors_.push_back(std::move(forwarded));
        }

        if (!entities) {
            if (response.errors.empty()) {
                failBatch(batch, "Subgraph '" + batch.subgraph + "' returned no _entities", codes::EntityResolution);
            } else {
                // Every representation is unresolved; the forwarded errors carry no client path
                for (int id : batch.nodes) {
                    branchErrors(plan_.node(id), slotTargets(batch, id),
                                 "Subgraph '" + batch.subgraph + "' could not resolve " + batch.entityType,
                                 codes::EntityResolution);
                }
            }
            return;
        }
        if (entities->size() != batch.representations.size()) {
            failBatch(batch, "Subgraph '" + batch.subgraph + "' returned " + std::to_string(entities->size()) +
                      " entities for " + std::to_string(batch.representations.size()) + " representations",
                      codes::EntityResolution);
            return;
        }

        for (auto& slot : batch.slots) {
            auto& entity = (*entities)[slot.representation];
            if (!entity.is_object()) {
                if (!explained.count(slot.representation)) {
                    branchErrors(plan_.node(slot.node), {slot.target},
                                 "Subgraph '" + batch.subgraph + "' returned null for " + batch.entityType +
                                 " representation " + std::to_string(slot.representation),
                                 codes::EntityResolution);
                }
                continue;
            }
            auto& object = data_.at(slot.target.pointer);
            auto copy = batch.aliased ? unaliased(entity, aliasPrefix(slot.node)) : entity;
            copy.erase("__typename");
            deepMerge(object, copy);
        }
    }

    // ═══════════════════════════════════════════
    //  Completion — project onto the client selection, propagate nulls
    // ═══════════════════════════════════════════

    bool typeApplies(const std::string& condition, const std::string& runtime) const {
        if (condition == runtime) return true;
        auto* concrete = schema_.type(runtime);
        if (concrete && std::find(concrete->interfaces.begin(), concrete->interfaces.end(), condition) !=
                            concrete->interfaces.end()) {
            return true;
        }
        auto* abstract = schema_.type(condition);
        return abstract && std::find(abstract->unionMembers.begin(), abstract->unionMembers.end(), runtime) !=
                               abstract->unionMembers.end();
    }

    bool fragmentApplies(const graphql::FieldSelection& fragment, const std::string& staticType,
                         const std::string& runtime, bool runtimeKnown, const json& source) const {
        if (fragment.typeCondition.empty() || fragment.typeCondition == staticType) return true;
        if (runtimeKnown) return typeApplies(fragment.typeCondition, runtime);
        // Unknown concrete type: the fragment applied if the subgraph answered its fields
        std::vector<std::string> keys;
        topLevelKeys(fragment.selections, keys);
        return std::any_of(keys.begin(), keys.end(), [&](auto& k) { return source.contains(k); });
    }

    void collectFields(const graphql::SelectionSet& selections, const std::string& staticType,
                       const std::string& runtime, bool runtimeKnown, const json& source,
                       std::vector<graphql::FieldSelection>& out) const {
        for (auto& sel : selections) {
            if (!graphql::shouldInclude(sel.directives, variables_)) continue;
            if (sel.isFragment()) {
                if (fragmentApplies(sel, staticType, runtime, runtimeKnown, source)) {
                    collectFields(sel.selections, staticType, runtime, runtimeKnown, source, out);
                }
                continue;
            }
            auto it = std::find_if(out.begin(), out.end(),
                                   [&](auto& f) { return f.responseKey() == sel.responseKey(); });
            if (it == out.end()) {
                out.push_back(sel);
            } else {
                it->selections.insert(it->selections.end(), sel.selections.begin(), sel.selections.end());
            }
        }
    }

    void nonNullViolation(const json& path, const std::string& coordinate) {
        for (auto& error : errors_) {
            auto existing = error.value("path", json());
            if (!existing.is_array()) continue;
            if (json_path::startsWith(path, existing) || json_path::startsWith(existing, path)) return;
        }
        errors_.push_back(graphqlError("Cannot return null for non-nullable field " + coordinate,
                                       path, codes::NonNullViolation));
    }

    // nullopt: the value is null where null is not allowed; the parent must absorb it
    std::optional<json> completeObject(const std::string& staticType, const json& source,
                                       const graphql::SelectionSet& selections, const json& path) {
        std::string runtime = staticType;
        bool runtimeKnown = !schema_.isAbstract(staticType);
        auto typeIt = source.find("__typename");
        if (typeIt != source.end() && typeIt->is_string() && schema_.type(typeIt->get<std::string>())) {
            runtime = typeIt->get<std::string>();
            runtimeKnown = true;
        }

        std::vector<graphql::FieldSelection> fields;
        collectFields(selections, staticType, runtime, runtimeKnown, source, fields);

        json out = json::object();
        for (auto& field : fields) {
            auto key = field.responseKey();
            if (field.name == "__typename") {
                out[key] = runtime;
                continue;
            }
            auto* def = schema_.field(runtime, field.name);
            if (!def) def = schema_.field(staticType, field.name);
            if (!def) {
                out[key] = nullptr;
                continue;
            }
            auto it = source.find(key);
            auto value = it != source.end() ? *it : json(nullptr);
            auto fieldPath = json_path::append(path, key);
            auto completed = completeValue(def->type, value, field.selections, fieldPath,
                                           runtime + "." + field.name);
            if (!completed) return std::nullopt;
            out[key] = std::move(*completed);
        }
        return out;
    }

    std::optional<json> completeValue(const graphql::TypeRef& type, const json& value,
                                      const graphql::SelectionSet& selections, const json& path,
                                      const std::string& coordinate) {
        auto nullResult = [&]() -> std::optional<json> {
            if (type.nonNull) {
                nonNullViolation(path, coordinate);
                return std::nullopt;
            }
            return json(nullptr);
        };

        if (value.is_null()) return nullResult();

        if (type.isList()) {
            if (!value.is_array()) return nullResult();
            json out = json::array();
            for (std::size_t i = 0; i < value.size(); ++i) {
                auto item = completeValue(*type.ofType, value[i], selections, json_path::append(path, i), coordinate);
                if (!item) return type.nonNull ? std::nullopt : std::optional<json>(json(nullptr));
                out.push_back(std::move(*item));
            }
            return out;
        }

        if (selections.empty()) return value;
        if (!value.is_object()) return nullResult();

        auto object = completeObject(type.namedType(), value, selections, path);
        if (!object) return type.nonNull ? std::nullopt : std::optional<json>(json(nullptr));
        return object;
    }
};

} // namespace

// ═══════════════════════════════════════════
//  Executor
// ═══════════════════════════════════════════

Executor::Executor(std::shared_ptr<client::SubgraphClient> client, ExecutorOptions options)
    : client_(std::move(client)), options_(options) {}

void Executor::setOptions(ExecutorOptions options) {
    std::lock_guard<std::mutex> lock(optionsMutex_);
    options_ = options;
}

ExecutorOptions Executor::options() const {
    std::lock_guard<std::mutex> lock(optionsMutex_);
    return options_;
}

ExecutionResult Executor::execute(const planner::QueryPlan& plan,
                                  const schema::ComposedSchema& schema,
                                  const nlohmann::json& variables,
                                  const DownCheck& isDown,
                                  std::chrono::steady_clock::time_point deadline) const {
    auto coerced = coerceVariables(plan.operation, variables);
    Execution execution(plan, schema, std::move(coerced), isDown, deadline, client_, options().fetchTimeout);
    return execution.run();
}

} // namespace fedgate::executor
