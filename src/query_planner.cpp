// ═══════════════════════════════════════════════════════════════════
//  src/query_planner.cpp — Greedy fetch grouping over the ownership map
// ═══════════════════════════════════════════════════════════════════

#include "fedgate/query_planner.h"
#include "fedgate/console.h"
#include <algorithm>

namespace fedgate::planner {

namespace {

// Keep only `selections` of `value` (objects and lists of objects)
nlohmann::json project(const nlohmann::json& value, const graphql::SelectionSet& selections) {
    if (value.is_array()) {
        auto out = nlohmann::json::array();
        for (auto& item : value) out.push_back(project(item, selections));
        return out;
    }
    if (!value.is_object()) return value;
    auto out = nlohmann::json::object();
    for (auto& sel : selections) {
        if (!sel.isField()) continue;
        auto it = value.find(sel.name);
        if (it == value.end()) continue;
        out[sel.name] = sel.selections.empty() ? *it : project(*it, sel.selections);
    }
    return out;
}

nlohmann::json pathJson(const std::vector<std::string>& path, const std::string& last = "") {
    auto out = nlohmann::json::array();
    for (auto& segment : path) {
        if (segment != "@") out.push_back(segment);
    }
    if (!last.empty()) out.push_back(last);
    return out;
}

std::string joinPath(const std::vector<std::string>& path) {
    std::string out;
    for (auto& segment : path) out += (out.empty() ? "" : ".") + segment;
    return out;
}

// Union of two field sets, merged by field name
void mergeFieldSet(graphql::SelectionSet& into, const graphql::SelectionSet& from) {
    for (auto& sel : from) {
        auto it = std::find_if(into.begin(), into.end(), [&](auto& existing) {
            return existing.isField() && existing.name == sel.name;
        });
        if (it == into.end()) {
            into.push_back(sel);
        } else {
            mergeFieldSet(it->selections, sel.selections);
        }
    }
}

// ═══════════════════════════════════════════
//  Planner
// ═══════════════════════════════════════════
class Planner {
public:
    Planner(const graphql::ParsedQuery& operation, const schema::ComposedSchema& schema,
            const std::set<std::string>& down)
        : op_(operation), schema_(schema), down_(down) {}

    QueryPlan run() {
        if (op_.operationType == "subscription") {
            throw PlanningError("Subscription operations are not supported by the gateway");
        }
        plan_.operation = op_;
        plan_.rootType = op_.operationType == "mutation" ? "Mutation" : "Query";
        if (!schema_.type(plan_.rootType)) {
            throw PlanningError("The composed schema does not define a " + plan_.rootType + " type");
        }
        for (auto& name : graphql::referencedVariables(op_.selections)) {
            if (!op_.variable(name)) throw PlanningError("Variable \"$" + name + "\" is not defined");
        }

        graphql::SelectionSet rootFields;
        flattenRoot(op_.selections, {}, rootFields);

        if (op_.operationType == "mutation") {
            planMutation(rootFields);
        } else {
            planQuery(rootFields);
        }
        finalize();
        return std::move(plan_);
    }

private:
    const graphql::ParsedQuery& op_;
    const schema::ComposedSchema& schema_;
    const std::set<std::string>& down_;
    QueryPlan plan_;
    std::map<std::string, int> entityNodes_;

    FetchNode& node(int id) { return plan_.nodes[static_cast<std::size_t>(id)]; }

    int newNode(const std::string& subgraph, FetchKind kind) {
        FetchNode n;
        n.id = static_cast<int>(plan_.nodes.size());
        n.subgraph = subgraph;
        n.kind = kind;
        n.operationType = kind == FetchKind::Root ? op_.operationType : "query";
        n.plannedDown = down_.count(subgraph) > 0;
        plan_.nodes.push_back(std::move(n));
        return plan_.nodes.back().id;
    }

    // Root-level inline fragments dissolve into their fields; fragment
    // directives move onto each field
    void flattenRoot(const graphql::SelectionSet& selections,
                     const std::vector<graphql::Directive>& inherited,
                     graphql::SelectionSet& out) {
        for (auto& sel : selections) {
            if (sel.isFragment()) {
                if (!sel.typeCondition.empty() && sel.typeCondition != plan_.rootType) {
                    throw PlanningError("Fragment on \"" + sel.typeCondition +
                                        "\" cannot be spread on \"" + plan_.rootType + "\"");
                }
                auto directives = inherited;
                directives.insert(directives.end(), sel.directives.begin(), sel.directives.end());
                flattenRoot(sel.selections, directives, out);
                continue;
            }
            auto field = sel;
            field.directives.insert(field.directives.end(), inherited.begin(), inherited.end());
            out.push_back(std::move(field));
        }
    }

    const schema::ComposedField& requireField(const std::string& typeName, const graphql::FieldSelection& sel,
                                              const std::vector<std::string>& path) {
        auto* field = schema_.field(typeName, sel.name);
        if (!field) {
            throw PlanningError("Cannot query field \"" + sel.name + "\" on type \"" + typeName + "\"",
                                pathJson(path, sel.responseKey()));
        }
        return *field;
    }

    // Owner, unless the field is shareable and the owner is Down
    std::string chooseSubgraph(const schema::ComposedField& field) const {
        if (field.resolvableBy.size() <= 1 || !down_.count(field.owner)) return field.owner;
        for (auto& candidate : field.resolvableBy) {
            if (!down_.count(candidate)) return candidate;
        }
        return field.owner;
    }

    void planQuery(const graphql::SelectionSet& rootFields) {
        std::map<std::string, int> rootNodes;
        for (auto& sel : rootFields) {
            if (sel.name == "__typename") continue;
            auto& field = requireField(plan_.rootType, sel, {});
            auto subgraph = chooseSubgraph(field);
            auto it = rootNodes.find(subgraph);
            int id = it != rootNodes.end() ? it->second : newNode(subgraph, FetchKind::Root);
            rootNodes[subgraph] = id;
            auto planned = planField(id, plan_.rootType, sel, {}, nullptr);
            node(id).selections.push_back(std::move(planned));
        }
    }

    // Contiguous same-subgraph runs, each run after the previous one
    void planMutation(const graphql::SelectionSet& rootFields) {
        int current = -1;
        for (auto& sel : rootFields) {
            if (sel.name == "__typename") continue;
            auto& field = requireField(plan_.rootType, sel, {});
            auto subgraph = chooseSubgraph(field);
            if (current < 0 || node(current).subgraph != subgraph) {
                int id = newNode(subgraph, FetchKind::Root);
                if (current >= 0) node(id).dependsOn.push_back(current);
                current = id;
            }
            auto planned = planField(current, plan_.rootType, sel, {}, nullptr);
            node(current).selections.push_back(std::move(planned));
        }
    }

    // The copy of `sel` that fetch `nodeId` issues
    graphql::FieldSelection planField(int nodeId, const std::string& parentType,
                                      const graphql::FieldSelection& sel,
                                      const std::vector<std::string>& path,
                                      const graphql::SelectionSet* provided) {
        auto out = sel;
        out.selections.clear();
        if (sel.selections.empty()) return out;

        auto& field = requireField(parentType, sel, path);
        auto childPath = path;
        childPath.push_back(sel.responseKey());
        for (auto* t = &field.type; t->isList(); t = t->ofType.get()) childPath.push_back("@");

        const graphql::SelectionSet* childProvided = nullptr;
        if (provided) {
            for (auto& p : *provided) {
                if (p.isField() && p.name == sel.name && !p.selections.empty()) childProvided = &p.selections;
            }
        }
        auto provides = field.provides.find(node(nodeId).subgraph);
        if (provides != field.provides.end()) childProvided = &provides->second;

        out.selections = planSelections(nodeId, field.type.namedType(), sel.selections, childPath, childProvided);
        return out;
    }

    graphql::SelectionSet planSelections(int nodeId, const std::string& parentType,
                                         const graphql::SelectionSet& selections,
                                         const std::vector<std::string>& path,
                                         const graphql::SelectionSet* provided) {
        auto* type = schema_.type(parentType);
        if (!type) throw PlanningError("Unknown type \"" + parentType + "\"", pathJson(path));

        graphql::SelectionSet out;
        for (auto& sel : selections) {
            if (sel.isFragment()) {
                auto condition = sel.typeCondition.empty() ? parentType : sel.typeCondition;
                if (!schema_.type(condition)) {
                    throw PlanningError("Unknown type \"" + condition + "\"", pathJson(path));
                }
                auto fragment = sel;
                fragment.selections = planSelections(nodeId, condition, sel.selections, path, provided);
                if (fragment.selections.empty()) {
                    fragment.selections.push_back(graphql::FieldSelection::field("__typename"));
                }
                out.push_back(std::move(fragment));
                continue;
            }
            if (sel.name == "__typename") {
                out.push_back(sel);
                continue;
            }

            auto& field = requireField(parentType, sel, path);
            auto subgraph = node(nodeId).subgraph;
            bool provides = provided && std::any_of(provided->begin(), provided->end(), [&](auto& p) {
                return p.isField() && p.name == sel.name;
            });
            if (field.resolvableIn(subgraph) || provides) {
                out.push_back(planField(nodeId, parentType, sel, path, provided));
                continue;
            }

            // Resolved elsewhere: hop through the entity's key
            if (!type->isEntity()) {
                throw PlanningError("Field \"" + parentType + "." + sel.name + "\" is resolved by subgraph '" +
                                    field.owner + "' but \"" + parentType +
                                    "\" declares no @key, so it cannot be fetched from there",
                                    pathJson(path, sel.responseKey()));
            }
            int childId = entityNode(nodeId, chooseSubgraph(field), parentType, path);
            auto planned = planField(childId, parentType, sel, path, nullptr);
            node(childId).selections.push_back(std::move(planned));
            if (!field.requiredFields.empty()) mergeFieldSet(node(childId).requiredFields, field.requiredFields);

            // __typename tells apart objects of other types sharing this path
            ensureSelected(out, graphql::FieldSelection::field("__typename"), nodeId, parentType);
            for (auto& key : node(childId).keyFields) ensureSelected(out, key, nodeId, parentType);
            for (auto& req : field.requiredFields) ensureSelected(out, req, nodeId, parentType);
        }
        return out;
    }

    int entityNode(int parentId, const std::string& subgraph, const std::string& typeName,
                   const std::vector<std::string>& path) {
        auto key = std::to_string(parentId) + "|" + subgraph + "|" + typeName + "|" + joinPath(path);
        auto it = entityNodes_.find(key);
        if (it != entityNodes_.end()) return it->second;

        int id = newNode(subgraph, FetchKind::Entity);
        auto& n = node(id);
        n.entityType = typeName;
        n.keyFields = schema_.type(typeName)->keyFor(subgraph);
        n.mergePath = path;
        n.dependsOn.push_back(parentId);
        entityNodes_[key] = id;
        return id;
    }

    // Make sure fetch `nodeId` selects `want` (a key or @requires field) at this level
    void ensureSelected(graphql::SelectionSet& out, const graphql::FieldSelection& want,
                        int nodeId, const std::string& parentType) {
        if (want.name == "__typename") {
            bool present = std::any_of(out.begin(), out.end(), [](auto& s) {
                return s.isField() && s.name == "__typename" && s.alias.empty();
            });
            if (!present) out.push_back(want);
            return;
        }

        auto& subgraph = node(nodeId).subgraph;
        auto* field = schema_.field(parentType, want.name);
        if (!field || !field->resolvableIn(subgraph)) {
            throw PlanningError("Cannot satisfy required field \"" + parentType + "." + want.name +
                                "\" from subgraph '" + subgraph + "'");
        }

        auto it = std::find_if(out.begin(), out.end(), [&](auto& s) {
            return s.isField() && s.name == want.name && s.alias.empty() && s.arguments.empty();
        });
        if (it == out.end()) {
            auto added = graphql::FieldSelection::field(want.name);
            for (auto& child : want.selections) {
                ensureSelected(added.selections, child, nodeId, field->type.namedType());
            }
            out.push_back(std::move(added));
            return;
        }
        for (auto& child : want.selections) {
            ensureSelected(it->selections, child, nodeId, field->type.namedType());
        }
    }

    void finalize() {
        std::vector<std::string> allVariables;
        for (auto& v : op_.variables) allVariables.push_back(v.name);

        for (auto& n : plan_.nodes) {
            auto used = graphql::referencedVariables(n.selections);
            std::vector<graphql::VariableDefinition> definitions;
            for (auto& v : op_.variables) {
                if (used.count(v.name)) {
                    definitions.push_back(v);
                    n.variableNames.push_back(v.name);
                }
            }
            if (n.kind == FetchKind::Root) {
                graphql::ParsedQuery query;
                query.operationType = n.operationType;
                query.operationName = op_.operationName;
                query.variables = std::move(definitions);
                query.selections = n.selections;
                n.document = graphql::print(query);
            } else {
                n.document = entitiesDocument(n.entityType, n.selections, definitions);
            }
        }

        // A query one subgraph can answer is forwarded as written
        if (plan_.nodes.size() == 1 && plan_.nodes.front().kind == FetchKind::Root) {
            plan_.nodes.front().document = graphql::print(op_);
            plan_.nodes.front().variableNames = allVariables;
        }

        console::debug("Planned", plan_.nodes.size(), "fetch(es) for",
                       op_.operationName.empty() ? "anonymous " + op_.operationType : op_.operationName);
    }
};

} // namespace

// ═══════════════════════════════════════════
//  EntityRepresentation
// ═══════════════════════════════════════════

nlohmann::json EntityRepresentation::toJson() const {
    nlohmann::json out = {{"__typename", typeName}};
    for (auto& [name, value] : fields) out[name] = value;
    return out;
}

EntityRepresentation EntityRepresentation::fromObject(const std::string& typeName,
                                                      const nlohmann::json& object,
                                                      const graphql::SelectionSet& keys,
                                                      const graphql::SelectionSet& required,
                                                      const std::string& subgraph) {
    EntityRepresentation rep;
    rep.typeName = typeName;
    for (auto& key : keys) {
        if (!key.isField()) continue;
        auto it = object.find(key.name);
        if (it == object.end() || it->is_null()) {
            throw EntityResolutionError(subgraph, "Cannot build " + typeName +
                                        " representation: key field '" + key.name + "' is missing");
        }
        rep.fields.emplace_back(key.name, key.selections.empty() ? *it : project(*it, key.selections));
    }
    for (auto& req : required) {
        if (!req.isField()) continue;
        if (std::any_of(rep.fields.begin(), rep.fields.end(), [&](auto& f) { return f.first == req.name; })) {
            continue;
        }
        auto it = object.find(req.name);
        if (it == object.end()) {
            throw EntityResolutionError(subgraph, "Cannot build " + typeName +
                                        " representation: required field '" + req.name + "' is missing");
        }
        rep.fields.emplace_back(req.name, req.selections.empty() ? *it : project(*it, req.selections));
    }
    return rep;
}

void EntityRepresentation::validate(const schema::ComposedSchema& schema,
                                    const std::string& subgraph) const {
    auto* type = schema.type(typeName);
    if (!type || !type->isEntity()) {
        throw EntityResolutionError(subgraph, "Type '" + typeName + "' is not an entity in the composed schema");
    }
    for (auto& key : type->keyFor(subgraph)) {
        if (!key.isField()) continue;
        bool present = std::any_of(fields.begin(), fields.end(), [&](auto& f) { return f.first == key.name; });
        if (!present) {
            throw EntityResolutionError(subgraph, "Representation of '" + typeName +
                                        "' lacks key field '" + key.name + "'");
        }
    }
}

// ═══════════════════════════════════════════
//  FetchNode / QueryPlan
// ═══════════════════════════════════════════

nlohmann::json FetchNode::toJson() const {
    nlohmann::json j = {
        {"id", id},
        {"subgraph", subgraph},
        {"kind", kind == FetchKind::Root ? "root" : "entity"},
        {"document", document},
        {"dependsOn", dependsOn},
        {"variables", variableNames}
    };
    if (kind == FetchKind::Entity) {
        j["entityType"] = entityType;
        j["mergePath"] = mergePath;
    }
    if (plannedDown) j["plannedDown"] = true;
    return j;
}

std::vector<std::vector<int>> QueryPlan::levels() const {
    std::vector<int> level(nodes.size(), 0);
    std::vector<std::vector<int>> out;
    for (auto& n : nodes) {
        int l = 0;
        for (int dep : n.dependsOn) l = std::max(l, level[static_cast<std::size_t>(dep)] + 1);
        level[static_cast<std::size_t>(n.id)] = l;
        if (out.size() <= static_cast<std::size_t>(l)) out.resize(static_cast<std::size_t>(l) + 1);
        out[static_cast<std::size_t>(l)].push_back(n.id);
    }
    return out;
}

nlohmann::json QueryPlan::toJson() const {
    auto j = nlohmann::json::array();
    for (auto& n : nodes) j.push_back(n.toJson());
    return {{"rootType", rootType}, {"nodes", j}, {"levels", levels()}};
}

std::string entitiesDocument(const std::string& entityType,
                             const graphql::SelectionSet& selections,
                             const std::vector<graphql::VariableDefinition>& variables) {
    graphql::ParsedQuery query;
    query.operationType = "query";

    graphql::VariableDefinition representations;
    representations.name = "representations";
    representations.type = graphql::TypeRef::listOf(graphql::TypeRef::named("_Any", true), true);
    query.variables.push_back(std::move(representations));
    query.variables.insert(query.variables.end(), variables.begin(), variables.end());

    auto entities = graphql::FieldSelection::field(
        "_entities", {graphql::FieldSelection::inlineFragment(entityType, selections)});
    entities.arguments.emplace_back("representations", graphql::InputValue::variable("representations"));
    query.selections.push_back(std::move(entities));
    return graphql::print(query);
}

QueryPlan plan(const graphql::ParsedQuery& operation,
               const schema::ComposedSchema& schema,
               const std::set<std::string>& downSubgraphs) {
    return Planner(operation, schema, downSubgraphs).run();
}

} // namespace fedgate::planner
