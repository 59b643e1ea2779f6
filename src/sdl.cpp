// ═══════════════════════════════════════════════════════════════════
//  src/sdl.cpp — SDL parser and federation directive extraction
// ═══════════════════════════════════════════════════════════════════

#include "fedgate/sdl.h"
#include <functional>

namespace fedgate::sdl {

std::string directiveName(const FederationDirective& directive) {
    return std::visit(overloaded{
        [](const KeyDirective&)       { return std::string("@key"); },
        [](const ExtendsDirective&)   { return std::string("@extends"); },
        [](const ExternalDirective&)  { return std::string("@external"); },
        [](const ProvidesDirective&)  { return std::string("@provides"); },
        [](const RequiresDirective&)  { return std::string("@requires"); },
        [](const ShareableDirective&) { return std::string("@shareable"); },
        [](const OverrideDirective&)  { return std::string("@override"); },
    }, directive);
}

std::string_view toString(TypeKind kind) {
    switch (kind) {
        case TypeKind::Object:      return "type";
        case TypeKind::Interface:   return "interface";
        case TypeKind::InputObject: return "input";
        case TypeKind::Enum:        return "enum";
        case TypeKind::Scalar:      return "scalar";
        case TypeKind::Union:       return "union";
    }
    return "type";
}

bool isFederationType(std::string_view typeName) {
    return typeName.starts_with("_") || typeName.starts_with("link__") ||
           typeName.starts_with("federation__");
}

bool isFederationField(std::string_view fieldName) {
    return fieldName == "_service" || fieldName == "_entities";
}

namespace {

// A type as written, before directive conversion
struct RawType {
    TypeDefinition def;
    std::vector<graphql::Directive> directives;
    std::vector<std::vector<graphql::Directive>> fieldDirectives;  // parallel to def.fields
};

// ═══════════════════════════════════════════
//  SdlParser — type-system documents
// ═══════════════════════════════════════════
class SdlParser : public graphql::detail::Parser {
public:
    using Parser::Parser;

    std::vector<RawType> parseTypes(std::map<std::string, std::string>& rootTypes) {
        std::vector<RawType> out;
        while (!lexer_.atEnd()) {
            skipDescription();
            if (lexer_.atEnd()) break;

            bool extension = false;
            if (lexer_.peekName("extend")) {
                lexer_.next();
                extension = true;
            }

            if (lexer_.peekName("schema")) {
                lexer_.next();
                parseSchemaDefinition(rootTypes);
                continue;
            }
            if (lexer_.peekName("directive")) {
                lexer_.next();
                parseDirectiveDefinition();
                continue;
            }

            RawType raw;
            raw.def.isExtension = extension;
            raw.def.kind = parseKind();
            raw.def.name = lexer_.expectName();

            if ((raw.def.kind == TypeKind::Object || raw.def.kind == TypeKind::Interface) &&
                lexer_.peekName("implements")) {
                lexer_.next();
                lexer_.skipPunct("&");
                raw.def.interfaces.push_back(lexer_.expectName());
                while (lexer_.skipPunct("&")) raw.def.interfaces.push_back(lexer_.expectName());
            }

            raw.directives = parseDirectives(true);

            switch (raw.def.kind) {
                case TypeKind::Object:
                case TypeKind::Interface:
                case TypeKind::InputObject:
                    if (lexer_.peekPunct("{")) parseFields(raw);
                    break;
                case TypeKind::Enum:
                    if (lexer_.skipPunct("{")) {
                        while (!lexer_.skipPunct("}")) {
                            skipDescription();
                            raw.def.enumValues.push_back(lexer_.expectName());
                            parseDirectives(true);
                        }
                    }
                    break;
                case TypeKind::Union:
                    if (lexer_.skipPunct("=")) {
                        lexer_.skipPunct("|");
                        raw.def.unionMembers.push_back(lexer_.expectName());
                        while (lexer_.skipPunct("|")) raw.def.unionMembers.push_back(lexer_.expectName());
                    }
                    break;
                case TypeKind::Scalar:
                    break;
            }
            out.push_back(std::move(raw));
        }
        return out;
    }

private:
    void skipDescription() {
        while (lexer_.peek().kind == graphql::detail::TokenKind::String) lexer_.next();
    }

    TypeKind parseKind() {
        if (lexer_.peek().kind != graphql::detail::TokenKind::Name) {
            lexer_.fail("Unexpected '" + lexer_.peek().text + "', expected a type definition");
        }
        auto keyword = lexer_.peek().text;
        TypeKind kind = TypeKind::Object;
        if (keyword == "type")           kind = TypeKind::Object;
        else if (keyword == "interface") kind = TypeKind::Interface;
        else if (keyword == "input")     kind = TypeKind::InputObject;
        else if (keyword == "enum")      kind = TypeKind::Enum;
        else if (keyword == "scalar")    kind = TypeKind::Scalar;
        else if (keyword == "union")     kind = TypeKind::Union;
        else lexer_.fail("Unexpected '" + keyword + "', expected a type definition");
        lexer_.next();
        return kind;
    }

    void parseSchemaDefinition(std::map<std::string, std::string>& rootTypes) {
        parseDirectives(true);
        if (!lexer_.skipPunct("{")) return;
        while (!lexer_.skipPunct("}")) {
            auto operation = lexer_.expectName();
            lexer_.expectPunct(":");
            rootTypes[operation] = lexer_.expectName();
        }
    }

    void parseDirectiveDefinition() {
        lexer_.expectPunct("@");
        lexer_.expectName();
        if (lexer_.peekPunct("(")) parseArgumentDefinitions();
        if (lexer_.peekName("repeatable")) lexer_.next();
        lexer_.expectKeyword("on");
        lexer_.skipPunct("|");
        lexer_.expectName();
        while (lexer_.skipPunct("|")) lexer_.expectName();
    }

    std::vector<ArgumentDefinition> parseArgumentDefinitions() {
        std::vector<ArgumentDefinition> args;
        lexer_.expectPunct("(");
        while (!lexer_.skipPunct(")")) {
            skipDescription();
            ArgumentDefinition arg;
            arg.name = lexer_.expectName();
            lexer_.expectPunct(":");
            arg.type = parseType();
            if (lexer_.skipPunct("=")) arg.defaultValue = parseValue(true);
            parseDirectives(true);
            args.push_back(std::move(arg));
        }
        return args;
    }

    void parseFields(RawType& raw) {
        lexer_.expectPunct("{");
        while (!lexer_.skipPunct("}")) {
            if (lexer_.atEnd()) lexer_.fail("Unterminated field list of '" + raw.def.name + "'");
            skipDescription();
            FieldDefinition field;
            field.name = lexer_.expectName();
            if (raw.def.kind != TypeKind::InputObject && lexer_.peekPunct("(")) {
                field.arguments = parseArgumentDefinitions();
            }
            lexer_.expectPunct(":");
            field.type = parseType();
            if (raw.def.kind == TypeKind::InputObject && lexer_.skipPunct("=")) {
                parseValue(true);
            }
            raw.fieldDirectives.push_back(parseDirectives(true));
            raw.def.fields.push_back(std::move(field));
        }
    }
};

// ═══════════════════════════════════════════
//  Directive conversion
// ═══════════════════════════════════════════

std::string stringArgument(const std::string& subgraph, const graphql::Directive& d,
                           const std::string& location, const char* argName) {
    auto* arg = d.argument(argName);
    if (!arg || arg->kind != graphql::InputValue::Kind::String) {
        throw SchemaError(subgraph, "@" + d.name + " on " + location +
                                    " requires a string argument '" + argName + "'");
    }
    return arg->scalar;
}

graphql::SelectionSet fieldSet(const std::string& subgraph, const graphql::Directive& d,
                               const std::string& location, const std::string& fields) {
    try {
        return graphql::parseSelectionSet(fields);
    } catch (const ParseError& e) {
        throw SchemaError(subgraph, "Invalid @" + d.name + "(fields: \"" + fields + "\") on " +
                                    location + ": " + e.what());
    }
}

std::vector<FederationDirective> convertDirectives(const std::string& subgraph,
                                                   const std::string& location,
                                                   const std::vector<graphql::Directive>& raw) {
    std::vector<FederationDirective> out;
    for (auto& d : raw) {
        if (d.name == "key") {
            KeyDirective key;
            key.fields = stringArgument(subgraph, d, location, "fields");
            key.selections = fieldSet(subgraph, d, location, key.fields);
            if (auto* resolvable = d.argument("resolvable")) {
                key.resolvable = resolvable->scalar != "false";
            }
            out.emplace_back(std::move(key));
        } else if (d.name == "extends") {
            out.emplace_back(ExtendsDirective{});
        } else if (d.name == "external") {
            out.emplace_back(ExternalDirective{});
        } else if (d.name == "shareable") {
            out.emplace_back(ShareableDirective{});
        } else if (d.name == "provides") {
            ProvidesDirective provides;
            provides.fields = stringArgument(subgraph, d, location, "fields");
            provides.selections = fieldSet(subgraph, d, location, provides.fields);
            out.emplace_back(std::move(provides));
        } else if (d.name == "requires") {
            RequiresDirective required;
            required.fields = stringArgument(subgraph, d, location, "fields");
            required.selections = fieldSet(subgraph, d, location, required.fields);
            out.emplace_back(std::move(required));
        } else if (d.name == "override") {
            out.emplace_back(OverrideDirective{stringArgument(subgraph, d, location, "from")});
        }
    }
    return out;
}

// ═══════════════════════════════════════════
//  Validation
// ═══════════════════════════════════════════

// Every field named by `selections` must exist on `type` (recursively for nested sets)
void checkFieldSet(const SubgraphSchema& schema, const TypeDefinition& type,
                   const graphql::SelectionSet& selections,
                   const std::function<std::string(const std::string&)>& describe) {
    for (auto& sel : selections) {
        if (!sel.isField()) {
            throw SchemaError(schema.name, describe(sel.typeCondition) + " (fragments are not allowed in field sets)");
        }
        if (sel.name == "__typename") continue;
        auto* field = type.field(sel.name);
        if (!field) throw SchemaError(schema.name, describe(sel.name));
        if (sel.selections.empty()) continue;
        auto* nested = schema.type(field->type.namedType());
        if (!nested) {
            throw SchemaError(schema.name, describe(sel.name + " { ... }") +
                              " (type '" + field->type.namedType() + "' is not defined in this subgraph)");
        }
        checkFieldSet(schema, *nested, sel.selections, describe);
    }
}

void validate(const SubgraphSchema& schema) {
    for (auto& [typeName, type] : schema.types) {
        auto keys = type.keys();
        if (!keys.empty() && type.kind != TypeKind::Object && type.kind != TypeKind::Interface) {
            throw SchemaError(schema.name, "@key is only allowed on object and interface types, found on " +
                                           std::string(toString(type.kind)) + " '" + typeName + "'");
        }
        for (auto* key : keys) {
            checkFieldSet(schema, type, key->selections, [&](const std::string& missing) {
                return "Entity type '" + typeName + "' is missing key field '" + missing +
                       "' declared in @key(fields: \"" + key->fields + "\")";
            });
        }

        for (auto& field : type.fields) {
            std::string location = typeName + "." + field.name;
            if (auto* required = field.requiresDirective()) {
                checkFieldSet(schema, type, required->selections, [&](const std::string& missing) {
                    return "@requires on " + location + " references unknown field '" + missing + "'";
                });
            }
            if (auto* provides = field.providesDirective()) {
                if (auto* target = schema.type(field.type.namedType())) {
                    checkFieldSet(schema, *target, provides->selections, [&](const std::string& missing) {
                        return "@provides on " + location + " references unknown field '" + missing +
                               "' of type '" + target->name + "'";
                    });
                }
            }
            if (auto* over = field.overrideDirective(); over && over->from == schema.name) {
                throw SchemaError(schema.name, "@override on " + location + " cannot override its own subgraph");
            }
        }
    }
}

graphql::TypeRef renamed(const graphql::TypeRef& type, const std::string& name) {
    if (!type.isList()) return graphql::TypeRef::named(name, type.nonNull);
    return graphql::TypeRef::listOf(renamed(*type.ofType, name), type.nonNull);
}

void mergeInto(SubgraphSchema& schema, TypeDefinition def) {
    auto it = schema.types.find(def.name);
    if (it == schema.types.end()) {
        schema.typeOrder.push_back(def.name);
        schema.types.emplace(def.name, std::move(def));
        return;
    }

    auto& existing = it->second;
    if (existing.kind != def.kind) {
        throw SchemaError(schema.name, "Type '" + def.name + "' is declared both as " +
                                       std::string(toString(existing.kind)) + " and " +
                                       std::string(toString(def.kind)));
    }
    for (auto& field : def.fields) {
        if (existing.field(field.name)) {
            throw SchemaError(schema.name, "Field '" + def.name + "." + field.name +
                                           "' is defined more than once");
        }
        existing.fields.push_back(std::move(field));
    }
    existing.isExtension = existing.isExtension && def.isExtension;
    for (auto& d : def.directives) existing.directives.push_back(std::move(d));
    for (auto& i : def.interfaces) existing.interfaces.push_back(std::move(i));
    for (auto& v : def.enumValues) existing.enumValues.push_back(std::move(v));
    for (auto& m : def.unionMembers) existing.unionMembers.push_back(std::move(m));
}

} // namespace

// ═══════════════════════════════════════════
//  parseSubgraph
// ═══════════════════════════════════════════
SubgraphSchema parseSubgraph(std::string name, std::string url, std::string sdl) {
    if (name.empty()) throw SchemaError(name, "subgraph name must not be empty");

    SubgraphSchema schema;
    schema.name = std::move(name);
    schema.url = std::move(url);
    schema.sdl = std::move(sdl);

    std::vector<RawType> raws;
    std::map<std::string, std::string> rootTypes;
    try {
        SdlParser parser(schema.sdl);
        raws = parser.parseTypes(rootTypes);
    } catch (const ParseError& e) {
        throw SchemaError(schema.name, std::string("Failed to parse SDL: ") + e.what());
    }

    // Custom root type names (schema { query: RootQuery }) are normalized
    std::map<std::string, std::string> renames;
    for (auto& [operation, typeName] : rootTypes) {
        std::string canonical = operation == "query"    ? "Query"
                              : operation == "mutation" ? "Mutation"
                              : "Subscription";
        if (typeName != canonical) renames[typeName] = canonical;
    }

    for (auto& raw : raws) {
        auto def = std::move(raw.def);
        if (auto it = renames.find(def.name); it != renames.end()) def.name = it->second;
        def.directives = convertDirectives(schema.name, def.name, raw.directives);
        for (std::size_t i = 0; i < def.fields.size(); ++i) {
            auto& field = def.fields[i];
            field.directives = convertDirectives(schema.name, def.name + "." + field.name,
                                                 raw.fieldDirectives[i]);
            if (auto it = renames.find(field.type.namedType()); it != renames.end()) {
                field.type = renamed(field.type, it->second);
            }
        }
        mergeInto(schema, std::move(def));
    }

    validate(schema);
    return schema;
}

} // namespace fedgate::sdl
