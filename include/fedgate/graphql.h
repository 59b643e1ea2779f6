#pragma once
// ═══════════════════════════════════════════════════════════════════
//  fedgate/graphql.h — GraphQL executable documents
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto doc = graphql::parse(R"(query Q($id: ID!) { workflow(id: $id) { name } })");
//    auto& op = doc.operation("Q");
//    std::string text = graphql::print(op);
//
//  Named fragments are expanded into inline fragments by parse(), so
//  every consumer only ever sees fields and inline fragments.
//
// ═══════════════════════════════════════════════════════════════════

#include "errors.h"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fedgate::graphql {

// ═══════════════════════════════════════════
//  Values
// ═══════════════════════════════════════════
struct InputValue {
    enum class Kind { Null, Int, Float, String, Boolean, Enum, List, Object, Variable };

    Kind kind = Kind::Null;
    std::string scalar;                                      // literal text or variable name
    std::vector<InputValue> items;                           // List
    std::vector<std::pair<std::string, InputValue>> fields;  // Object

    static InputValue variable(std::string name) {
        InputValue v;
        v.kind = Kind::Variable;
        v.scalar = std::move(name);
        return v;
    }

    static InputValue string(std::string text) {
        InputValue v;
        v.kind = Kind::String;
        v.scalar = std::move(text);
        return v;
    }

    // Resolve to JSON, substituting variables from `variables`
    nlohmann::json toJson(const nlohmann::json& variables = nlohmann::json::object()) const;

    void collectVariables(std::set<std::string>& out) const;
};

using Arguments = std::vector<std::pair<std::string, InputValue>>;

struct Directive {
    std::string name;
    Arguments arguments;

    const InputValue* argument(std::string_view argName) const {
        for (auto& [n, v] : arguments) {
            if (n == argName) return &v;
        }
        return nullptr;
    }
};

// ═══════════════════════════════════════════
//  Type references: ID, [Execution!]!, ...
// ═══════════════════════════════════════════
struct TypeRef {
    std::string name;                       // empty for list types
    bool nonNull = false;
    std::shared_ptr<const TypeRef> ofType;  // element type of a list

    static TypeRef named(std::string typeName, bool nonNull = false) {
        TypeRef t;
        t.name = std::move(typeName);
        t.nonNull = nonNull;
        return t;
    }

    static TypeRef listOf(TypeRef element, bool nonNull = false) {
        TypeRef t;
        t.nonNull = nonNull;
        t.ofType = std::make_shared<const TypeRef>(std::move(element));
        return t;
    }

    bool isList() const { return ofType != nullptr; }

    // Innermost named type
    const std::string& namedType() const {
        return ofType ? ofType->namedType() : name;
    }

    TypeRef nullable() const {
        TypeRef t = *this;
        t.nonNull = false;
        return t;
    }

    std::string toString() const {
        std::string out = ofType ? "[" + ofType->toString() + "]" : name;
        return nonNull ? out + "!" : out;
    }

    bool operator==(const TypeRef& other) const { return toString() == other.toString(); }
};

// ═══════════════════════════════════════════
//  Selections
// ═══════════════════════════════════════════
struct FieldSelection {
    enum class Kind { Field, InlineFragment, FragmentSpread };

    Kind kind = Kind::Field;
    std::string name;                      // field name, or fragment name for spreads
    std::string alias;
    Arguments arguments;
    std::vector<Directive> directives;
    std::string typeCondition;             // inline fragments; empty means the enclosing type
    std::vector<FieldSelection> selections;

    bool isField() const { return kind == Kind::Field; }
    bool isFragment() const { return kind == Kind::InlineFragment; }

    const std::string& responseKey() const { return alias.empty() ? name : alias; }

    const InputValue* argument(std::string_view argName) const {
        for (auto& [n, v] : arguments) {
            if (n == argName) return &v;
        }
        return nullptr;
    }

    static FieldSelection field(std::string fieldName,
                                std::vector<FieldSelection> children = {}) {
        FieldSelection f;
        f.name = std::move(fieldName);
        f.selections = std::move(children);
        return f;
    }

    static FieldSelection inlineFragment(std::string onType,
                                         std::vector<FieldSelection> children) {
        FieldSelection f;
        f.kind = Kind::InlineFragment;
        f.typeCondition = std::move(onType);
        f.selections = std::move(children);
        return f;
    }
};

using SelectionSet = std::vector<FieldSelection>;

struct VariableDefinition {
    std::string name;
    TypeRef type;
    std::optional<InputValue> defaultValue;
};

// ── One operation of a document ──
struct ParsedQuery {
    std::string operationType = "query";   // "query" | "mutation" | "subscription"
    std::string operationName;
    std::vector<VariableDefinition> variables;
    SelectionSet selections;

    const VariableDefinition* variable(std::string_view varName) const {
        for (auto& v : variables) {
            if (v.name == varName) return &v;
        }
        return nullptr;
    }
};

struct Document {
    std::vector<ParsedQuery> operations;

    // Pick the operation to run; an empty name is valid only for single-operation documents
    const ParsedQuery& operation(const std::string& name = "") const;
};

// ═══════════════════════════════════════════
//  Parsing — all functions throw ParseError
// ═══════════════════════════════════════════

// Selection sets (fragments expanded), list/object values and list
// types nest at most this deep
inline constexpr std::size_t kMaxNesting = 128;

Document parse(const std::string& source);

// A bare or braced selection set, e.g. a @key field set "id owner { id }"
SelectionSet parseSelectionSet(const std::string& source);

TypeRef parseType(const std::string& source);

// ═══════════════════════════════════════════
//  Printing — canonical single-line form
// ═══════════════════════════════════════════
std::string print(const ParsedQuery& operation);
std::string print(const SelectionSet& selections);
std::string print(const InputValue& value);

// Deepest chain of fields; `{ a { b } }` is 2, fragments add no level
std::size_t depth(const SelectionSet& selections);

// Variables referenced anywhere under `selections`
std::set<std::string> referencedVariables(const SelectionSet& selections);

// @skip / @include evaluation
bool shouldInclude(const std::vector<Directive>& directives, const nlohmann::json& variables);

namespace detail {

// ═══════════════════════════════════════════
//  Lexer — shared by the executable and SDL parsers
// ═══════════════════════════════════════════
enum class TokenKind { End, Punct, Name, Int, Float, String };

struct Token {
    TokenKind kind = TokenKind::End;
    std::string text;
    std::size_t line = 1;
    std::size_t column = 1;
};

class Lexer {
public:
    explicit Lexer(std::string source);

    const Token& peek() const { return current_; }
    Token next();

    bool atEnd() const { return current_.kind == TokenKind::End; }
    bool peekPunct(std::string_view p) const {
        return current_.kind == TokenKind::Punct && current_.text == p;
    }
    bool peekName(std::string_view n) const {
        return current_.kind == TokenKind::Name && current_.text == n;
    }
    bool skipPunct(std::string_view p) {
        if (!peekPunct(p)) return false;
        next();
        return true;
    }

    void expectPunct(std::string_view p);
    std::string expectName();
    void expectKeyword(std::string_view keyword);

    [[noreturn]] void fail(const std::string& message) const;

private:
    std::string source_;
    std::size_t pos_ = 0;
    std::size_t line_ = 1;
    std::size_t column_ = 1;
    Token current_;

    char peekChar(std::size_t offset = 0) const {
        return pos_ + offset < source_.size() ? source_[pos_ + offset] : '\0';
    }
    char advanceChar();
    void skipIgnored();
    Token readToken();
    std::string readString();
    std::string readBlockString();
    std::string readNumber(TokenKind& kind);
};

// ═══════════════════════════════════════════
//  Parser — values, types, directives, selections
//  SdlParser (sdl.h) derives from it for type-system documents.
// ═══════════════════════════════════════════
class Parser {
public:
    explicit Parser(std::string source) : lexer_(std::move(source)) {}
    virtual ~Parser() = default;

    Document parseDocument();
    SelectionSet parseFieldSet();
    TypeRef parseStandaloneType();

protected:
    Lexer lexer_;

    // Held while parsing one nested construct; fails past kMaxNesting
    class Nested {
    public:
        explicit Nested(Parser& parser);
        ~Nested() { --parser_.nesting_; }
        Nested(const Nested&) = delete;
        Nested& operator=(const Nested&) = delete;

    private:
        Parser& parser_;
    };

    InputValue parseValue(bool constant);
    Arguments parseArguments(bool constant);
    std::vector<Directive> parseDirectives(bool constant);
    TypeRef parseType();
    SelectionSet parseSelectionSet();

private:
    struct FragmentDefinition {
        std::string typeCondition;
        SelectionSet selections;
    };
    std::map<std::string, FragmentDefinition> fragments_;
    std::size_t nesting_ = 0;

    FieldSelection parseSelection();
    ParsedQuery parseOperation();
    void parseFragmentDefinition();
    void expandFragments(SelectionSet& selections, std::set<std::string>& visiting,
                         std::size_t level = 1);
};

} // namespace detail

} // namespace fedgate::graphql
