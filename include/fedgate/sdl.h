#pragma once
// ═══════════════════════════════════════════════════════════════════
//  fedgate/sdl.h — Subgraph SDL and federation directives
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto schema = sdl::parseSubgraph("workflow", "http://localhost:4001/graphql", R"(
//        type Workflow @key(fields: "id") { id: ID! name: String }
//        type Query { workflow(id: ID!): Workflow }
//    )");
//    schema.type("Workflow")->isEntity();   // true
//
//  Federation directives form a closed set; anything else in the SDL
//  (@deprecated, @link, @tag, ...) is accepted and ignored.
//
// ═══════════════════════════════════════════════════════════════════

#include "graphql.h"
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace fedgate::sdl {

// ═══════════════════════════════════════════
//  Federation directives
// ═══════════════════════════════════════════
struct KeyDirective {
    std::string fields;
    graphql::SelectionSet selections;
    bool resolvable = true;
};

struct ExtendsDirective {};
struct ExternalDirective {};

struct ProvidesDirective {
    std::string fields;
    graphql::SelectionSet selections;
};

struct RequiresDirective {
    std::string fields;
    graphql::SelectionSet selections;
};

struct ShareableDirective {};

struct OverrideDirective {
    std::string from;
};

using FederationDirective = std::variant<KeyDirective, ExtendsDirective, ExternalDirective,
                                         ProvidesDirective, RequiresDirective,
                                         ShareableDirective, OverrideDirective>;

// std::visit helper
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::string directiveName(const FederationDirective& directive);

// ── First directive of kind D, or nullptr ──
template <typename D>
const D* findDirective(const std::vector<FederationDirective>& directives) {
    for (auto& d : directives) {
        if (auto* hit = std::get_if<D>(&d)) return hit;
    }
    return nullptr;
}

// ═══════════════════════════════════════════
//  Type system definitions
// ═══════════════════════════════════════════
enum class TypeKind { Object, Interface, InputObject, Enum, Scalar, Union };

std::string_view toString(TypeKind kind);

struct ArgumentDefinition {
    std::string name;
    graphql::TypeRef type;
    std::optional<graphql::InputValue> defaultValue;
};

struct FieldDefinition {
    std::string name;
    std::vector<ArgumentDefinition> arguments;
    graphql::TypeRef type;
    std::vector<FederationDirective> directives;

    bool isExternal() const { return findDirective<ExternalDirective>(directives) != nullptr; }
    bool isShareable() const { return findDirective<ShareableDirective>(directives) != nullptr; }
    const RequiresDirective* requiresDirective() const { return findDirective<RequiresDirective>(directives); }
    const ProvidesDirective* providesDirective() const { return findDirective<ProvidesDirective>(directives); }
    const OverrideDirective* overrideDirective() const { return findDirective<OverrideDirective>(directives); }
};

struct TypeDefinition {
    std::string name;
    TypeKind kind = TypeKind::Object;
    bool isExtension = false;              // declared with `extend type`
    std::vector<FieldDefinition> fields;
    std::vector<FederationDirective> directives;
    std::vector<std::string> interfaces;
    std::vector<std::string> enumValues;
    std::vector<std::string> unionMembers;

    const FieldDefinition* field(std::string_view fieldName) const {
        for (auto& f : fields) {
            if (f.name == fieldName) return &f;
        }
        return nullptr;
    }

    std::vector<const KeyDirective*> keys() const {
        std::vector<const KeyDirective*> out;
        for (auto& d : directives) {
            if (auto* key = std::get_if<KeyDirective>(&d)) out.push_back(key);
        }
        return out;
    }

    bool isEntity() const { return findDirective<KeyDirective>(directives) != nullptr; }
    bool isExtended() const { return isExtension || findDirective<ExtendsDirective>(directives) != nullptr; }
    bool isShareable() const { return findDirective<ShareableDirective>(directives) != nullptr; }
};

// ═══════════════════════════════════════════
//  SubgraphSchema — immutable once registered
// ═══════════════════════════════════════════
struct SubgraphSchema {
    std::string name;
    std::string url;
    std::string sdl;
    std::map<std::string, TypeDefinition> types;
    std::vector<std::string> typeOrder;    // declaration order

    const TypeDefinition* type(std::string_view typeName) const {
        auto it = types.find(std::string(typeName));
        return it == types.end() ? nullptr : &it->second;
    }
};

// Federation plumbing types that never take part in composition
bool isFederationType(std::string_view typeName);

// Root fields every subgraph exposes for the gateway (_service, _entities)
bool isFederationField(std::string_view fieldName);

// Parse and validate one subgraph's SDL; throws SchemaError
SubgraphSchema parseSubgraph(std::string name, std::string url, std::string sdl);

} // namespace fedgate::sdl
