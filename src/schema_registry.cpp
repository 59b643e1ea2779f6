// ═══════════════════════════════════════════════════════════════════
//  src/schema_registry.cpp — Composition and snapshot publication
// ═══════════════════════════════════════════════════════════════════

#include "fedgate/schema_registry.h"
#include "fedgate/console.h"
#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>

namespace fedgate::schema {

// ═══════════════════════════════════════════
//  Snapshot accessors
// ═══════════════════════════════════════════

bool ComposedField::resolvableIn(const std::string& subgraph) const {
    return std::binary_search(resolvableBy.begin(), resolvableBy.end(), subgraph);
}

const ComposedField* ComposedType::field(std::string_view fieldName) const {
    for (auto& f : fields) {
        if (f.name == fieldName) return &f;
    }
    return nullptr;
}

const graphql::SelectionSet& ComposedType::keyFor(const std::string& subgraph) const {
    auto it = keysBySubgraph.find(subgraph);
    if (it != keysBySubgraph.end() && !it->second.empty()) return it->second.front();
    return keySelections;
}

const ComposedType* ComposedSchema::type(std::string_view typeName) const {
    auto it = types.find(std::string(typeName));
    return it == types.end() ? nullptr : &it->second;
}

const ComposedField* ComposedSchema::field(std::string_view typeName,
                                           std::string_view fieldName) const {
    auto* t = type(typeName);
    return t ? t->field(fieldName) : nullptr;
}

bool ComposedSchema::isEntity(std::string_view typeName) const {
    auto* t = type(typeName);
    return t && t->isEntity();
}

bool ComposedSchema::isAbstract(std::string_view typeName) const {
    auto* t = type(typeName);
    return t && (t->kind == sdl::TypeKind::Interface || t->kind == sdl::TypeKind::Union);
}

std::map<std::string, std::string> ComposedSchema::ownershipMap() const {
    std::map<std::string, std::string> out;
    for (auto& [typeName, t] : types) {
        if (t.kind != sdl::TypeKind::Object) continue;
        for (auto& f : t.fields) out[typeName + "." + f.name] = f.owner;
    }
    return out;
}

bool isBuiltinScalar(std::string_view typeName) {
    return typeName == "ID" || typeName == "String" || typeName == "Int" ||
           typeName == "Float" || typeName == "Boolean";
}

namespace {

// "{ id owner { id } }" -> "id owner { id }"
std::string fieldSetString(const graphql::SelectionSet& selections) {
    auto printed = graphql::print(selections);
    if (printed.size() < 4) return "";
    return printed.substr(2, printed.size() - 4);
}

std::set<std::string> topLevelNames(const graphql::SelectionSet& selections) {
    std::set<std::string> out;
    for (auto& sel : selections) {
        if (sel.isField()) out.insert(sel.name);
    }
    return out;
}

template <typename T>
void appendUnique(std::vector<T>& into, const std::vector<T>& from) {
    for (auto& item : from) {
        if (std::find(into.begin(), into.end(), item) == into.end()) into.push_back(item);
    }
}

// One subgraph's definition of one field
struct Contribution {
    std::string subgraph;
    const sdl::TypeDefinition* type = nullptr;
    const sdl::FieldDefinition* field = nullptr;
    bool external = false;
    bool shareable = false;
    std::optional<std::string> overrideFrom;
};

struct Definer {
    std::string subgraph;
    const sdl::TypeDefinition* type = nullptr;
};

class Composer {
public:
    Composer(const std::vector<std::shared_ptr<const sdl::SubgraphSchema>>& subgraphs,
             std::uint64_t generation)
        : subgraphs_(subgraphs) {
        std::sort(subgraphs_.begin(), subgraphs_.end(),
                  [](auto& a, auto& b) { return a->name < b->name; });
        out_.generation = generation;
    }

    ComposedSchema run() {
        if (subgraphs_.empty()) {
            throw CompositionError({Conflict{"", "", {}, "no subgraphs are registered"}});
        }
        for (auto& sg : subgraphs_) collect(*sg);
        for (auto& typeName : out_.typeOrder) composeType(out_.types[typeName]);
        checkReferences();
        if (!out_.type("Query")) {
            conflicts_.push_back({"Query", "", {}, "no subgraph defines a Query type"});
        }
        if (!conflicts_.empty()) throw CompositionError(std::move(conflicts_));
        return std::move(out_);
    }

private:
    std::vector<std::shared_ptr<const sdl::SubgraphSchema>> subgraphs_;
    ComposedSchema out_;
    std::vector<Conflict> conflicts_;
    std::map<std::string, std::vector<Definer>> definers_;
    std::map<std::string, std::vector<std::string>> fieldOrder_;
    std::map<std::string, std::map<std::string, std::vector<Contribution>>> contributions_;

    void collect(const sdl::SubgraphSchema& sg) {
        out_.subgraphUrls[sg.name] = sg.url;
        for (auto& typeName : sg.typeOrder) {
            if (sdl::isFederationType(typeName)) continue;
            auto& def = sg.types.at(typeName);

            auto [it, inserted] = out_.types.try_emplace(typeName);
            auto& composed = it->second;
            if (inserted) {
                composed.name = typeName;
                composed.kind = def.kind;
                out_.typeOrder.push_back(typeName);
            } else if (composed.kind != def.kind) {
                auto& first = definers_[typeName].front();
                conflicts_.push_back({typeName, "", {first.subgraph, sg.name},
                    "declared as " + std::string(sdl::toString(composed.kind)) + " in '" +
                    first.subgraph + "' but as " + std::string(sdl::toString(def.kind)) +
                    " in '" + sg.name + "'"});
                continue;
            }

            composed.definers.push_back(sg.name);
            definers_[typeName].push_back({sg.name, &def});
            for (auto* key : def.keys()) {
                if (key->resolvable) composed.keysBySubgraph[sg.name].push_back(key->selections);
            }
            appendUnique(composed.interfaces, def.interfaces);
            appendUnique(composed.enumValues, def.enumValues);
            appendUnique(composed.unionMembers, def.unionMembers);

            for (auto& field : def.fields) {
                if (typeName == "Query" && sdl::isFederationField(field.name)) continue;
                auto& list = contributions_[typeName][field.name];
                if (list.empty()) fieldOrder_[typeName].push_back(field.name);
                Contribution c;
                c.subgraph = sg.name;
                c.type = &def;
                c.field = &field;
                c.external = field.isExternal();
                c.shareable = field.isShareable() || def.isShareable();
                if (auto* over = field.overrideDirective()) c.overrideFrom = over->from;
                list.push_back(c);
            }
        }
    }

    void composeKeys(ComposedType& composed, std::set<std::string>& keyNames) {
        auto& defs = definers_[composed.name];
        bool entity = std::any_of(defs.begin(), defs.end(),
                                  [](auto& d) { return d.type->isEntity(); });
        if (!entity) return;

        std::set<std::string> originKeys;
        std::vector<std::string> origins;
        for (auto& d : defs) {
            for (auto* key : d.type->keys()) keyNames.merge(topLevelNames(key->selections));
            if (d.type->isExtended()) continue;
            origins.push_back(d.subgraph);
            for (auto* key : d.type->keys()) {
                if (composed.keySelections.empty()) composed.keySelections = key->selections;
                originKeys.insert(fieldSetString(key->selections));
            }
        }
        if (composed.keySelections.empty()) {
            for (auto& d : defs) {
                auto keys = d.type->keys();
                if (!keys.empty()) {
                    composed.keySelections = keys.front()->selections;
                    break;
                }
            }
        }

        for (auto& d : defs) {
            if (!d.type->isExtended()) continue;
            auto keys = d.type->keys();
            if (keys.empty()) {
                conflicts_.push_back({composed.name, "", {d.subgraph},
                    "extends entity type '" + composed.name + "' without declaring @key"});
                continue;
            }
            if (originKeys.empty()) continue;
            bool matches = std::any_of(keys.begin(), keys.end(), [&](auto* key) {
                return originKeys.count(fieldSetString(key->selections)) > 0;
            });
            if (!matches) {
                auto involved = origins;
                involved.push_back(d.subgraph);
                conflicts_.push_back({composed.name, "", involved,
                    "@key(fields: \"" + keys.front()->fields + "\") in '" + d.subgraph +
                    "' does not match any key of the defining subgraphs"});
            }
        }
    }

    void composeType(ComposedType& composed) {
        std::set<std::string> keyNames;
        if (composed.kind == sdl::TypeKind::Object || composed.kind == sdl::TypeKind::Interface) {
            composeKeys(composed, keyNames);
        }

        for (auto& fieldName : fieldOrder_[composed.name]) {
            auto& contribs = contributions_[composed.name][fieldName];
            if (composed.kind == sdl::TypeKind::Object) {
                composeObjectField(composed, fieldName, contribs, keyNames.count(fieldName) > 0);
            } else {
                composeShapeField(composed, fieldName, contribs);
            }
        }

        for (auto& keyName : keyNames) {
            if (!composed.field(keyName)) {
                conflicts_.push_back({composed.name, keyName, composed.definers,
                    "key field '" + keyName + "' is not defined"});
            }
        }
    }

    void checkTypesAgree(const std::string& typeName, const std::string& fieldName,
                         const std::vector<const Contribution*>& contribs) {
        for (auto* c : contribs) {
            auto& first = *contribs.front();
            if (c->field->type == first.field->type) continue;
            conflicts_.push_back({typeName, fieldName, {first.subgraph, c->subgraph},
                "has type " + first.field->type.toString() + " in '" + first.subgraph +
                "' but " + c->field->type.toString() + " in '" + c->subgraph + "'"});
        }
    }

    void composeObjectField(ComposedType& composed, const std::string& fieldName,
                            const std::vector<Contribution>& contribs, bool keyField) {
        ComposedField field;
        field.name = fieldName;
        field.type = contribs.front().field->type;
        field.arguments = contribs.front().field->arguments;
        field.keyField = keyField;

        const Contribution* overriding = nullptr;
        std::set<std::string> overridden;
        for (auto& c : contribs) {
            if (c.overrideFrom && !c.external) {
                overriding = &c;
                overridden.insert(*c.overrideFrom);
            }
        }

        std::vector<const Contribution*> resolvers;
        for (auto& c : contribs) {
            if (c.external || overridden.count(c.subgraph)) continue;
            resolvers.push_back(&c);
        }

        std::vector<std::string> involved;
        for (auto& c : contribs) involved.push_back(c.subgraph);

        if (resolvers.empty() && !keyField) {
            conflicts_.push_back({composed.name, fieldName, involved,
                "is @external in every subgraph that defines it"});
        }
        if (resolvers.size() > 1 && !keyField) {
            bool shareable = std::any_of(resolvers.begin(), resolvers.end(),
                                         [](auto* c) { return c->shareable; });
            if (!shareable) {
                std::vector<std::string> names;
                for (auto* c : resolvers) names.push_back(c->subgraph);
                conflicts_.push_back({composed.name, fieldName, names,
                    "field '" + composed.name + "." + fieldName +
                    "' is defined in multiple subgraphs without @shareable or @override"});
            }
        }
        if (resolvers.size() > 1) checkTypesAgree(composed.name, fieldName, resolvers);

        // Owner
        if (overriding) {
            field.owner = overriding->subgraph;
        } else if (keyField) {
            auto& defs = definers_[composed.name];
            auto origin = std::find_if(defs.begin(), defs.end(), [&](auto& d) {
                return !d.type->isExtended() && d.type->field(fieldName);
            });
            field.owner = origin != defs.end() ? origin->subgraph
                        : !resolvers.empty() ? resolvers.front()->subgraph
                        : contribs.front().subgraph;
        } else {
            field.owner = !resolvers.empty() ? resolvers.front()->subgraph : contribs.front().subgraph;
        }

        for (auto* c : resolvers) field.resolvableBy.push_back(c->subgraph);
        if (keyField) {
            for (auto& c : contribs) field.resolvableBy.push_back(c.subgraph);
        }
        if (field.resolvableBy.empty()) field.resolvableBy.push_back(field.owner);
        std::sort(field.resolvableBy.begin(), field.resolvableBy.end());
        field.resolvableBy.erase(std::unique(field.resolvableBy.begin(), field.resolvableBy.end()),
                                 field.resolvableBy.end());
        field.shareable = field.resolvableBy.size() > 1;

        for (auto& c : contribs) {
            if (c.subgraph == field.owner) {
                if (auto* req = c.field->requiresDirective()) field.requiredFields = req->selections;
            }
            if (auto* provides = c.field->providesDirective()) {
                field.provides[c.subgraph] = provides->selections;
            }
        }

        if (overriding && !std::any_of(contribs.begin(), contribs.end(), [&](auto& c) {
                return c.subgraph == *overriding->overrideFrom;
            })) {
            console::warn("@override on", composed.name + "." + fieldName, "names subgraph '" +
                          *overriding->overrideFrom + "' which does not define it");
        }

        composed.fields.push_back(std::move(field));
    }

    // Interface and input fields carry no resolvers; definitions only need to agree
    void composeShapeField(ComposedType& composed, const std::string& fieldName,
                           const std::vector<Contribution>& contribs) {
        std::vector<const Contribution*> all;
        for (auto& c : contribs) all.push_back(&c);
        checkTypesAgree(composed.name, fieldName, all);

        ComposedField field;
        field.name = fieldName;
        field.type = contribs.front().field->type;
        field.arguments = contribs.front().field->arguments;
        field.owner = contribs.front().subgraph;
        for (auto& c : contribs) field.resolvableBy.push_back(c.subgraph);
        std::sort(field.resolvableBy.begin(), field.resolvableBy.end());
        field.shareable = field.resolvableBy.size() > 1;
        composed.fields.push_back(std::move(field));
    }

    bool known(const std::string& typeName) const {
        return isBuiltinScalar(typeName) || out_.types.count(typeName) > 0 ||
               sdl::isFederationType(typeName);
    }

    void checkReferences() {
        for (auto& typeName : out_.typeOrder) {
            auto& composed = out_.types[typeName];
            for (auto& field : composed.fields) {
                auto& named = field.type.namedType();
                if (!known(named)) {
                    conflicts_.push_back({typeName, field.name, field.resolvableBy,
                        "references unknown type '" + named + "'"});
                }
                for (auto& arg : field.arguments) {
                    if (!known(arg.type.namedType())) {
                        conflicts_.push_back({typeName, field.name, field.resolvableBy,
                            "argument '" + arg.name + "' references unknown type '" +
                            arg.type.namedType() + "'"});
                    }
                }
            }
            for (auto& member : composed.unionMembers) {
                if (!out_.types.count(member)) {
                    conflicts_.push_back({typeName, "", composed.definers,
                        "union member '" + member + "' is not defined"});
                }
            }
            for (auto& iface : composed.interfaces) {
                if (!out_.types.count(iface)) {
                    conflicts_.push_back({typeName, "", composed.definers,
                        "implements unknown interface '" + iface + "'"});
                }
            }
        }
    }
};

constexpr const char* kFederationPreamble = R"(directive @key(fields: _FieldSet!, resolvable: Boolean = true) repeatable on OBJECT | INTERFACE
directive @extends on OBJECT | INTERFACE
directive @external on OBJECT | FIELD_DEFINITION
directive @requires(fields: _FieldSet!) on FIELD_DEFINITION
directive @provides(fields: _FieldSet!) on FIELD_DEFINITION
directive @shareable repeatable on OBJECT | FIELD_DEFINITION
directive @override(from: String!) on FIELD_DEFINITION
directive @join__graph(name: String!, url: String!) on ENUM_VALUE
directive @join__type(graph: join__Graph!, key: _FieldSet, extension: Boolean = false) repeatable on OBJECT | INTERFACE | UNION | ENUM | INPUT_OBJECT | SCALAR
directive @join__field(graph: join__Graph, requires: _FieldSet, provides: _FieldSet) repeatable on FIELD_DEFINITION

scalar _FieldSet
)";

std::string graphEnumName(const std::string& subgraph) {
    std::string out;
    for (char c : subgraph) {
        out += std::isalnum(static_cast<unsigned char>(c))
             ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : '_';
    }
    return out;
}

void printArgumentDefinitions(std::ostringstream& out, const std::vector<sdl::ArgumentDefinition>& args) {
    if (args.empty()) return;
    out << '(';
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (i) out << ", ";
        out << args[i].name << ": " << args[i].type.toString();
        if (args[i].defaultValue) out << " = " << graphql::print(*args[i].defaultValue);
    }
    out << ')';
}

} // namespace

ComposedSchema composeSubgraphs(const std::vector<std::shared_ptr<const sdl::SubgraphSchema>>& subgraphs,
                                std::uint64_t generation) {
    return Composer(subgraphs, generation).run();
}

// ═══════════════════════════════════════════
//  Supergraph SDL
// ═══════════════════════════════════════════
std::string ComposedSchema::sdl() const {
    std::ostringstream out;
    out << "# generation " << generation << "\n";
    out << "schema\n  @link(url: \"https://specs.apollo.dev/federation/v2.3\", import: "
           "[\"@key\", \"@extends\", \"@external\", \"@requires\", \"@provides\", \"@shareable\", \"@override\"])\n{\n"
        << "  query: Query\n";
    if (type("Mutation")) out << "  mutation: Mutation\n";
    out << "}\n\n" << kFederationPreamble << "\nenum join__Graph {\n";
    for (auto& [name, url] : subgraphUrls) {
        out << "  " << graphEnumName(name) << " @join__graph(name: "
            << nlohmann::json(name).dump() << ", url: " << nlohmann::json(url).dump() << ")\n";
    }
    out << "}\n";

    for (auto& typeName : typeOrder) {
        auto& t = types.at(typeName);
        out << "\n" << sdl::toString(t.kind) << ' ' << t.name;
        if (!t.interfaces.empty()) {
            out << " implements ";
            for (std::size_t i = 0; i < t.interfaces.size(); ++i) {
                if (i) out << " & ";
                out << t.interfaces[i];
            }
        }
        for (auto& definer : t.definers) {
            out << "\n  @join__type(graph: " << graphEnumName(definer);
            auto keys = t.keysBySubgraph.find(definer);
            if (keys != t.keysBySubgraph.end() && !keys->second.empty()) {
                out << ", key: " << nlohmann::json(fieldSetString(keys->second.front())).dump();
            }
            out << ')';
        }

        switch (t.kind) {
            case sdl::TypeKind::Scalar:
                out << "\n";
                break;
            case sdl::TypeKind::Union:
                out << "\n  = ";
                for (std::size_t i = 0; i < t.unionMembers.size(); ++i) {
                    if (i) out << " | ";
                    out << t.unionMembers[i];
                }
                out << "\n";
                break;
            case sdl::TypeKind::Enum:
                out << "\n{\n";
                for (auto& v : t.enumValues) out << "  " << v << "\n";
                out << "}\n";
                break;
            default:
                out << "\n{\n";
                for (auto& f : t.fields) {
                    out << "  " << f.name;
                    printArgumentDefinitions(out, f.arguments);
                    out << ": " << f.type.toString();
                    if (t.kind == sdl::TypeKind::Object) {
                        for (auto& graph : f.resolvableBy) {
                            out << " @join__field(graph: " << graphEnumName(graph);
                            if (graph == f.owner && !f.requiredFields.empty()) {
                                out << ", requires: " << nlohmann::json(fieldSetString(f.requiredFields)).dump();
                            }
                            if (auto p = f.provides.find(graph); p != f.provides.end()) {
                                out << ", provides: " << nlohmann::json(fieldSetString(p->second)).dump();
                            }
                            out << ')';
                        }
                    }
                    out << "\n";
                }
                out << "}\n";
                break;
        }
    }
    return out.str();
}

// ═══════════════════════════════════════════
//  SchemaRegistry
// ═══════════════════════════════════════════

SchemaRegistry::SchemaRegistry()
    : subgraphs_(std::make_shared<const SubgraphMap>()) {}

void SchemaRegistry::registerSubgraph(std::string name, std::string url, std::string sdlText) {
    // Parse outside the lock; a SchemaError leaves everything untouched
    auto parsed = std::make_shared<const sdl::SubgraphSchema>(
        sdl::parseSubgraph(std::move(name), std::move(url), std::move(sdlText)));

    std::lock_guard<std::mutex> lock(writeMutex_);
    auto next = std::make_shared<SubgraphMap>(*subgraphs_.load());
    bool replaced = next->count(parsed->name) > 0;
    (*next)[parsed->name] = parsed;
    subgraphs_.store(std::move(next));
    console::info(replaced ? "Replaced subgraph" : "Registered subgraph",
                  "'" + parsed->name + "'", "at", parsed->url,
                  "(" + std::to_string(parsed->types.size()) + " types)");
}

void SchemaRegistry::updateSubgraph(const std::string& name,
                                    std::optional<std::string> url,
                                    std::optional<std::string> sdlText) {
    auto existing = subgraph(name);
    if (!existing) throw SchemaError(name, "is not registered");

    auto parsed = std::make_shared<const sdl::SubgraphSchema>(sdl::parseSubgraph(
        name, url ? std::move(*url) : existing->url, sdlText ? std::move(*sdlText) : existing->sdl));

    std::lock_guard<std::mutex> lock(writeMutex_);
    auto next = std::make_shared<SubgraphMap>(*subgraphs_.load());
    if (!next->count(name)) throw SchemaError(name, "is not registered");
    (*next)[name] = parsed;
    subgraphs_.store(std::move(next));
    console::info("Updated subgraph", "'" + name + "'");
}

void SchemaRegistry::removeSubgraph(const std::string& name) {
    std::lock_guard<std::mutex> lock(writeMutex_);
    auto next = std::make_shared<SubgraphMap>(*subgraphs_.load());
    if (next->erase(name) == 0) throw SchemaError(name, "is not registered");
    subgraphs_.store(std::move(next));
    console::info("Removed subgraph", "'" + name + "'");
}

std::vector<std::shared_ptr<const sdl::SubgraphSchema>> SchemaRegistry::subgraphs() const {
    auto snapshot = subgraphs_.load();
    std::vector<std::shared_ptr<const sdl::SubgraphSchema>> out;
    out.reserve(snapshot->size());
    for (auto& [name, sg] : *snapshot) out.push_back(sg);
    return out;
}

std::shared_ptr<const sdl::SubgraphSchema> SchemaRegistry::subgraph(const std::string& name) const {
    auto snapshot = subgraphs_.load();
    auto it = snapshot->find(name);
    return it == snapshot->end() ? nullptr : it->second;
}

std::shared_ptr<const ComposedSchema> SchemaRegistry::compose() {
    std::lock_guard<std::mutex> lock(writeMutex_);
    try {
        auto composed = std::make_shared<const ComposedSchema>(
            composeSubgraphs(subgraphs(), generation_ + 1));
        generation_ = composed->generation;
        current_.store(composed);
        console::success("Composed schema generation", composed->generation, "from",
                         composed->subgraphUrls.size(), "subgraph(s),",
                         composed->types.size(), "types");
        return composed;
    } catch (const CompositionError& e) {
        auto live = current_.load();
        console::error(e.what());
        if (live) console::warn("Keeping schema generation", live->generation);
        throw;
    }
}

std::string SchemaRegistry::supergraphSdl() const {
    auto live = current_.load();
    return live ? live->sdl() : "";
}

std::vector<std::string> SchemaRegistry::validateFederation() const {
    std::vector<std::string> issues;
    for (auto& sg : subgraphs()) {
        std::vector<std::string> entities;
        std::set<std::string> referenced;
        for (auto& [typeName, def] : sg->types) {
            if (def.isEntity()) entities.push_back(typeName);
            for (auto* key : def.keys()) referenced.merge(topLevelNames(key->selections));
            for (auto& field : def.fields) {
                if (auto* req = field.requiresDirective()) referenced.merge(topLevelNames(req->selections));
            }
        }

        auto* query = sg->type("Query");
        bool hasService = query && query->field("_service");
        bool hasEntities = query && query->field("_entities");
        if (!hasService) {
            issues.push_back("Subgraph '" + sg->name + "' does not declare Query._service in its SDL");
        }
        if (!entities.empty() && !hasEntities) {
            std::string names;
            for (auto& e : entities) names += (names.empty() ? "" : ", ") + e;
            issues.push_back("Subgraph '" + sg->name + "' declares entity types [" + names +
                             "] but not Query._entities");
        }
        for (auto& [typeName, def] : sg->types) {
            for (auto& field : def.fields) {
                if (field.isExternal() && !referenced.count(field.name)) {
                    issues.push_back("Subgraph '" + sg->name + "': " + typeName + "." + field.name +
                                     " is @external but not used by @key or @requires");
                }
            }
        }
        if (!sg->type("Query") && !sg->type("Mutation") && entities.empty()) {
            issues.push_back("Subgraph '" + sg->name + "' contributes no root fields and no entities");
        }
    }
    return issues;
}

} // namespace fedgate::schema
