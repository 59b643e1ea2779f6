// ═══════════════════════════════════════════════════════════════════
//  src/graphql.cpp — GraphQL lexer, parser and printer
// ═══════════════════════════════════════════════════════════════════

#include "fedgate/graphql.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace fedgate::graphql {

// ═══════════════════════════════════════════
//  InputValue
// ═══════════════════════════════════════════

nlohmann::json InputValue::toJson(const nlohmann::json& variables) const {
    switch (kind) {
        case Kind::Null:    return nullptr;
        case Kind::Int:     return std::stoll(scalar);
        case Kind::Float:   return std::stod(scalar);
        case Kind::String:
        case Kind::Enum:    return scalar;
        case Kind::Boolean: return scalar == "true";
        case Kind::Variable:
            if (variables.is_object() && variables.contains(scalar)) return variables.at(scalar);
            return nullptr;
        case Kind::List: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto& item : items) arr.push_back(item.toJson(variables));
            return arr;
        }
        case Kind::Object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto& [key, value] : fields) obj[key] = value.toJson(variables);
            return obj;
        }
    }
    return nullptr;
}

void InputValue::collectVariables(std::set<std::string>& out) const {
    if (kind == Kind::Variable) out.insert(scalar);
    for (auto& item : items) item.collectVariables(out);
    for (auto& [key, value] : fields) value.collectVariables(out);
}

const ParsedQuery& Document::operation(const std::string& name) const {
    if (name.empty()) {
        if (operations.size() == 1) return operations.front();
        throw PlanningError("Must provide operation name if query contains multiple operations.");
    }
    for (auto& op : operations) {
        if (op.operationName == name) return op;
    }
    throw PlanningError("Unknown operation named '" + name + "'.");
}

namespace detail {

// ═══════════════════════════════════════════
//  Lexer
// ═══════════════════════════════════════════

Lexer::Lexer(std::string source) : source_(std::move(source)) {
    current_ = readToken();
}

Token Lexer::next() {
    Token previous = std::move(current_);
    current_ = readToken();
    return previous;
}

void Lexer::fail(const std::string& message) const {
    throw ParseError(message, current_.line, current_.column);
}

void Lexer::expectPunct(std::string_view p) {
    if (!peekPunct(p)) {
        fail("Expected '" + std::string(p) + "', found '" +
             (atEnd() ? std::string("<EOF>") : current_.text) + "'");
    }
    next();
}

std::string Lexer::expectName() {
    if (current_.kind != TokenKind::Name) {
        fail("Expected name, found '" + (atEnd() ? std::string("<EOF>") : current_.text) + "'");
    }
    return next().text;
}

void Lexer::expectKeyword(std::string_view keyword) {
    if (!peekName(keyword)) {
        fail("Expected '" + std::string(keyword) + "', found '" +
             (atEnd() ? std::string("<EOF>") : current_.text) + "'");
    }
    next();
}

char Lexer::advanceChar() {
    if (pos_ >= source_.size()) return '\0';
    char c = source_[pos_++];
    if (c == '\n') {
        line_++;
        column_ = 1;
    } else {
        column_++;
    }
    return c;
}

void Lexer::skipIgnored() {
    while (pos_ < source_.size()) {
        char c = peekChar();
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == ',') {
            advanceChar();
        } else if (c == '#') {
            while (pos_ < source_.size() && peekChar() != '\n') advanceChar();
        } else if (static_cast<unsigned char>(c) == 0xEF && peekChar(1) == '\xBB' && peekChar(2) == '\xBF') {
            pos_ += 3;  // byte order mark
        } else {
            break;
        }
    }
}

Token Lexer::readToken() {
    skipIgnored();
    Token token;
    token.line = line_;
    token.column = column_;

    if (pos_ >= source_.size()) {
        token.kind = TokenKind::End;
        return token;
    }

    char c = peekChar();

    if (c == '.') {
        if (peekChar(1) == '.' && peekChar(2) == '.') {
            advanceChar(); advanceChar(); advanceChar();
            token.kind = TokenKind::Punct;
            token.text = "...";
            return token;
        }
        throw ParseError("Unexpected '.'", line_, column_);
    }

    static const std::string punctuators = "!$&()/:=@[]{}|";
    if (punctuators.find(c) != std::string::npos) {
        token.kind = TokenKind::Punct;
        token.text = std::string(1, advanceChar());
        return token;
    }

    if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
        token.kind = TokenKind::Name;
        while (pos_ < source_.size()) {
            char n = peekChar();
            if (!std::isalnum(static_cast<unsigned char>(n)) && n != '_') break;
            token.text += advanceChar();
        }
        return token;
    }

    if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
        token.text = readNumber(token.kind);
        return token;
    }

    if (c == '"') {
        token.kind = TokenKind::String;
        token.text = (peekChar(1) == '"' && peekChar(2) == '"') ? readBlockString() : readString();
        return token;
    }

    throw ParseError(std::string("Unexpected character '") + c + "'", line_, column_);
}

std::string Lexer::readNumber(TokenKind& kind) {
    std::string text;
    kind = TokenKind::Int;
    if (peekChar() == '-') text += advanceChar();
    if (!std::isdigit(static_cast<unsigned char>(peekChar()))) {
        throw ParseError("Invalid number, expected digit", line_, column_);
    }
    while (std::isdigit(static_cast<unsigned char>(peekChar()))) text += advanceChar();
    if (peekChar() == '.') {
        kind = TokenKind::Float;
        text += advanceChar();
        if (!std::isdigit(static_cast<unsigned char>(peekChar()))) {
            throw ParseError("Invalid number, expected digit after '.'", line_, column_);
        }
        while (std::isdigit(static_cast<unsigned char>(peekChar()))) text += advanceChar();
    }
    if (peekChar() == 'e' || peekChar() == 'E') {
        kind = TokenKind::Float;
        text += advanceChar();
        if (peekChar() == '+' || peekChar() == '-') text += advanceChar();
        if (!std::isdigit(static_cast<unsigned char>(peekChar()))) {
            throw ParseError("Invalid number, expected digit in exponent", line_, column_);
        }
        while (std::isdigit(static_cast<unsigned char>(peekChar()))) text += advanceChar();
    }
    return text;
}

std::string Lexer::readString() {
    std::size_t startLine = line_, startColumn = column_;
    advanceChar();  // opening quote
    std::string result;
    while (true) {
        if (pos_ >= source_.size() || peekChar() == '\n') {
            throw ParseError("Unterminated string", startLine, startColumn);
        }
        char c = advanceChar();
        if (c == '"') break;
        if (c != '\\') {
            result += c;
            continue;
        }
        char esc = advanceChar();
        switch (esc) {
            case 'n':  result += '\n'; break;
            case 't':  result += '\t'; break;
            case 'r':  result += '\r'; break;
            case 'b':  result += '\b'; break;
            case 'f':  result += '\f'; break;
            case '"':  result += '"'; break;
            case '\\': result += '\\'; break;
            case '/':  result += '/'; break;
            case 'u': {
                std::string hex;
                for (int i = 0; i < 4; ++i) hex += advanceChar();
                unsigned long code = 0;
                try {
                    code = std::stoul(hex, nullptr, 16);
                } catch (const std::exception&) {
                    throw ParseError("Invalid unicode escape '\\u" + hex + "'", line_, column_);
                }
                // UTF-8 encode the BMP code point
                if (code < 0x80) {
                    result += static_cast<char>(code);
                } else if (code < 0x800) {
                    result += static_cast<char>(0xC0 | (code >> 6));
                    result += static_cast<char>(0x80 | (code & 0x3F));
                } else {
                    result += static_cast<char>(0xE0 | (code >> 12));
                    result += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
                    result += static_cast<char>(0x80 | (code & 0x3F));
                }
                break;
            }
            default:
                throw ParseError(std::string("Invalid escape sequence '\\") + esc + "'", line_, column_);
        }
    }
    return result;
}

std::string Lexer::readBlockString() {
    std::size_t startLine = line_, startColumn = column_;
    advanceChar(); advanceChar(); advanceChar();
    std::string raw;
    while (true) {
        if (pos_ >= source_.size()) {
            throw ParseError("Unterminated block string", startLine, startColumn);
        }
        if (peekChar() == '"' && peekChar(1) == '"' && peekChar(2) == '"') {
            advanceChar(); advanceChar(); advanceChar();
            break;
        }
        if (peekChar() == '\\' && peekChar(1) == '"' && peekChar(2) == '"' && peekChar(3) == '"') {
            advanceChar();
            raw += advanceChar();
            raw += advanceChar();
            raw += advanceChar();
            continue;
        }
        raw += advanceChar();
    }
    // Block strings are only descriptions here; trim the surrounding blank space
    auto first = raw.find_first_not_of(" \t\r\n");
    auto last = raw.find_last_not_of(" \t\r\n");
    return first == std::string::npos ? "" : raw.substr(first, last - first + 1);
}

// ═══════════════════════════════════════════
//  Parser
// ═══════════════════════════════════════════

Parser::Nested::Nested(Parser& parser) : parser_(parser) {
    if (parser_.nesting_ >= kMaxNesting) {
        parser_.lexer_.fail("Document nests deeper than " + std::to_string(kMaxNesting) + " levels");
    }
    ++parser_.nesting_;
}

Document Parser::parseDocument() {
    Document doc;
    while (!lexer_.atEnd()) {
        if (lexer_.peekPunct("{") || lexer_.peekName("query") ||
            lexer_.peekName("mutation") || lexer_.peekName("subscription")) {
            doc.operations.push_back(parseOperation());
        } else if (lexer_.peekName("fragment")) {
            parseFragmentDefinition();
        } else {
            lexer_.fail("Unexpected '" + lexer_.peek().text + "', expected an operation or fragment");
        }
    }

    if (doc.operations.empty()) {
        throw ParseError("Document contains no operations", 1, 1);
    }

    std::set<std::string> seen;
    for (auto& op : doc.operations) {
        if (!op.operationName.empty() && !seen.insert(op.operationName).second) {
            throw ParseError("There can be only one operation named '" + op.operationName + "'", 1, 1);
        }
        std::set<std::string> visiting;
        expandFragments(op.selections, visiting);
    }
    return doc;
}

SelectionSet Parser::parseFieldSet() {
    SelectionSet selections;
    if (lexer_.peekPunct("{")) {
        selections = parseSelectionSet();
    } else {
        while (!lexer_.atEnd()) selections.push_back(parseSelection());
    }
    if (!lexer_.atEnd()) lexer_.fail("Unexpected '" + lexer_.peek().text + "' after field set");
    if (selections.empty()) lexer_.fail("Field set is empty");
    std::set<std::string> visiting;
    expandFragments(selections, visiting);
    return selections;
}

TypeRef Parser::parseStandaloneType() {
    auto type = parseType();
    if (!lexer_.atEnd()) lexer_.fail("Unexpected '" + lexer_.peek().text + "' after type");
    return type;
}

ParsedQuery Parser::parseOperation() {
    ParsedQuery op;
    if (lexer_.peekPunct("{")) {
        op.operationType = "query";
        op.selections = parseSelectionSet();
        return op;
    }

    op.operationType = lexer_.expectName();
    if (lexer_.peek().kind == TokenKind::Name) {
        op.operationName = lexer_.expectName();
    }

    if (lexer_.skipPunct("(")) {
        while (!lexer_.skipPunct(")")) {
            VariableDefinition def;
            lexer_.expectPunct("$");
            def.name = lexer_.expectName();
            lexer_.expectPunct(":");
            def.type = parseType();
            if (lexer_.skipPunct("=")) {
                def.defaultValue = parseValue(true);
            }
            parseDirectives(true);
            if (op.variable(def.name)) {
                lexer_.fail("Variable '$" + def.name + "' is defined more than once");
            }
            op.variables.push_back(std::move(def));
        }
    }

    parseDirectives(false);
    op.selections = parseSelectionSet();
    return op;
}

void Parser::parseFragmentDefinition() {
    lexer_.expectKeyword("fragment");
    auto name = lexer_.expectName();
    if (name == "on") lexer_.fail("Fragment cannot be named 'on'");
    lexer_.expectKeyword("on");
    FragmentDefinition def;
    def.typeCondition = lexer_.expectName();
    parseDirectives(false);
    def.selections = parseSelectionSet();
    if (!fragments_.emplace(name, std::move(def)).second) {
        lexer_.fail("There can be only one fragment named '" + name + "'");
    }
}

SelectionSet Parser::parseSelectionSet() {
    Nested nested(*this);
    lexer_.expectPunct("{");
    SelectionSet selections;
    while (!lexer_.skipPunct("}")) {
        if (lexer_.atEnd()) lexer_.fail("Unterminated selection set");
        selections.push_back(parseSelection());
    }
    if (selections.empty()) lexer_.fail("Selection set must not be empty");
    return selections;
}

FieldSelection Parser::parseSelection() {
    FieldSelection sel;

    if (lexer_.skipPunct("...")) {
        if (lexer_.peekName("on")) {
            lexer_.next();
            sel.kind = FieldSelection::Kind::InlineFragment;
            sel.typeCondition = lexer_.expectName();
            sel.directives = parseDirectives(false);
            sel.selections = parseSelectionSet();
        } else if (lexer_.peek().kind == TokenKind::Name) {
            sel.kind = FieldSelection::Kind::FragmentSpread;
            sel.name = lexer_.expectName();
            sel.directives = parseDirectives(false);
        } else {
            sel.kind = FieldSelection::Kind::InlineFragment;
            sel.directives = parseDirectives(false);
            sel.selections = parseSelectionSet();
        }
        return sel;
    }

    auto nameOrAlias = lexer_.expectName();
    if (lexer_.skipPunct(":")) {
        sel.alias = nameOrAlias;
        sel.name = lexer_.expectName();
    } else {
        sel.name = nameOrAlias;
    }

    if (lexer_.peekPunct("(")) sel.arguments = parseArguments(false);
    sel.directives = parseDirectives(false);
    if (lexer_.peekPunct("{")) sel.selections = parseSelectionSet();
    return sel;
}

InputValue Parser::parseValue(bool constant) {
    InputValue value;
    const Token& token = lexer_.peek();

    if (lexer_.peekPunct("$")) {
        if (constant) lexer_.fail("Unexpected variable in constant value");
        lexer_.next();
        return InputValue::variable(lexer_.expectName());
    }

    if (lexer_.skipPunct("[")) {
        Nested nested(*this);
        value.kind = InputValue::Kind::List;
        while (!lexer_.skipPunct("]")) {
            if (lexer_.atEnd()) lexer_.fail("Unterminated list value");
            value.items.push_back(parseValue(constant));
        }
        return value;
    }

    if (lexer_.skipPunct("{")) {
        Nested nested(*this);
        value.kind = InputValue::Kind::Object;
        while (!lexer_.skipPunct("}")) {
            auto key = lexer_.expectName();
            lexer_.expectPunct(":");
            value.fields.emplace_back(key, parseValue(constant));
        }
        return value;
    }

    switch (token.kind) {
        case TokenKind::Int:
            value.kind = InputValue::Kind::Int;
            break;
        case TokenKind::Float:
            value.kind = InputValue::Kind::Float;
            break;
        case TokenKind::String:
            value.kind = InputValue::Kind::String;
            break;
        case TokenKind::Name:
            if (token.text == "true" || token.text == "false") {
                value.kind = InputValue::Kind::Boolean;
            } else if (token.text == "null") {
                value.kind = InputValue::Kind::Null;
            } else {
                value.kind = InputValue::Kind::Enum;
            }
            break;
        default:
            lexer_.fail("Unexpected '" + (lexer_.atEnd() ? std::string("<EOF>") : token.text) +
                        "', expected a value");
    }
    value.scalar = lexer_.next().text;
    return value;
}

Arguments Parser::parseArguments(bool constant) {
    Arguments args;
    lexer_.expectPunct("(");
    while (!lexer_.skipPunct(")")) {
        auto name = lexer_.expectName();
        lexer_.expectPunct(":");
        args.emplace_back(name, parseValue(constant));
    }
    return args;
}

std::vector<Directive> Parser::parseDirectives(bool constant) {
    std::vector<Directive> directives;
    while (lexer_.skipPunct("@")) {
        Directive d;
        d.name = lexer_.expectName();
        if (lexer_.peekPunct("(")) d.arguments = parseArguments(constant);
        directives.push_back(std::move(d));
    }
    return directives;
}

TypeRef Parser::parseType() {
    TypeRef type;
    if (lexer_.skipPunct("[")) {
        Nested nested(*this);
        auto element = parseType();
        lexer_.expectPunct("]");
        type = TypeRef::listOf(std::move(element));
    } else {
        type = TypeRef::named(lexer_.expectName());
    }
    if (lexer_.skipPunct("!")) type.nonNull = true;
    return type;
}

void Parser::expandFragments(SelectionSet& selections, std::set<std::string>& visiting,
                             std::size_t level) {
    // Spreading fragments into each other can nest past what parsing allowed
    if (level > kMaxNesting) {
        throw ParseError("Document nests deeper than " + std::to_string(kMaxNesting) +
                         " levels once fragments are expanded", 1, 1);
    }
    for (auto& sel : selections) {
        if (sel.kind == FieldSelection::Kind::FragmentSpread) {
            auto it = fragments_.find(sel.name);
            if (it == fragments_.end()) {
                throw ParseError("Unknown fragment '" + sel.name + "'", 1, 1);
            }
            if (!visiting.insert(sel.name).second) {
                throw ParseError("Cannot spread fragment '" + sel.name + "' within itself", 1, 1);
            }
            auto spreadName = sel.name;
            sel.kind = FieldSelection::Kind::InlineFragment;
            sel.typeCondition = it->second.typeCondition;
            sel.selections = it->second.selections;
            sel.name.clear();
            expandFragments(sel.selections, visiting, level + 1);
            visiting.erase(spreadName);
        } else if (!sel.selections.empty()) {
            expandFragments(sel.selections, visiting, level + 1);
        }
    }
}

} // namespace detail

// ═══════════════════════════════════════════
//  Public parsing entry points
// ═══════════════════════════════════════════

Document parse(const std::string& source) {
    detail::Parser parser(source);
    return parser.parseDocument();
}

SelectionSet parseSelectionSet(const std::string& source) {
    detail::Parser parser(source);
    return parser.parseFieldSet();
}

TypeRef parseType(const std::string& source) {
    detail::Parser parser(source);
    return parser.parseStandaloneType();
}

// ═══════════════════════════════════════════
//  Printer
// ═══════════════════════════════════════════

namespace {

void printArguments(std::ostringstream& out, const Arguments& args) {
    if (args.empty()) return;
    out << '(';
    bool first = true;
    for (auto& [name, value] : args) {
        if (!first) out << ", ";
        first = false;
        out << name << ": " << print(value);
    }
    out << ')';
}

void printDirectives(std::ostringstream& out, const std::vector<Directive>& directives) {
    for (auto& d : directives) {
        out << " @" << d.name;
        printArguments(out, d.arguments);
    }
}

void printSelection(std::ostringstream& out, const FieldSelection& sel) {
    switch (sel.kind) {
        case FieldSelection::Kind::Field:
            if (!sel.alias.empty()) out << sel.alias << ": ";
            out << sel.name;
            printArguments(out, sel.arguments);
            printDirectives(out, sel.directives);
            break;
        case FieldSelection::Kind::InlineFragment:
            out << "...";
            if (!sel.typeCondition.empty()) out << " on " << sel.typeCondition;
            printDirectives(out, sel.directives);
            break;
        case FieldSelection::Kind::FragmentSpread:
            out << "..." << sel.name;
            printDirectives(out, sel.directives);
            return;
    }
    if (!sel.selections.empty()) out << ' ' << print(sel.selections);
}

void collectVariables(const SelectionSet& selections, std::set<std::string>& out) {
    for (auto& sel : selections) {
        for (auto& [name, value] : sel.arguments) value.collectVariables(out);
        for (auto& d : sel.directives) {
            for (auto& [name, value] : d.arguments) value.collectVariables(out);
        }
        collectVariables(sel.selections, out);
    }
}

} // namespace

std::string print(const InputValue& value) {
    switch (value.kind) {
        case InputValue::Kind::Null:     return "null";
        case InputValue::Kind::Int:
        case InputValue::Kind::Float:
        case InputValue::Kind::Boolean:
        case InputValue::Kind::Enum:     return value.scalar;
        case InputValue::Kind::String:   return nlohmann::json(value.scalar).dump();
        case InputValue::Kind::Variable: return "$" + value.scalar;
        case InputValue::Kind::List: {
            std::string out = "[";
            for (std::size_t i = 0; i < value.items.size(); ++i) {
                if (i) out += ", ";
                out += print(value.items[i]);
            }
            return out + "]";
        }
        case InputValue::Kind::Object: {
            std::string out = "{";
            for (std::size_t i = 0; i < value.fields.size(); ++i) {
                if (i) out += ", ";
                out += value.fields[i].first + ": " + print(value.fields[i].second);
            }
            return out + "}";
        }
    }
    return "null";
}

std::string print(const SelectionSet& selections) {
    std::ostringstream out;
    out << "{";
    for (auto& sel : selections) {
        out << ' ';
        printSelection(out, sel);
    }
    out << " }";
    return out.str();
}

std::string print(const ParsedQuery& operation) {
    std::ostringstream out;
    out << operation.operationType;
    if (!operation.operationName.empty()) out << ' ' << operation.operationName;
    if (!operation.variables.empty()) {
        out << '(';
        for (std::size_t i = 0; i < operation.variables.size(); ++i) {
            auto& v = operation.variables[i];
            if (i) out << ", ";
            out << '$' << v.name << ": " << v.type.toString();
            if (v.defaultValue) out << " = " << print(*v.defaultValue);
        }
        out << ')';
    }
    out << ' ' << print(operation.selections);
    return out.str();
}

std::size_t depth(const SelectionSet& selections) {
    std::size_t deepest = 0;
    for (auto& sel : selections) {
        auto below = depth(sel.selections);
        deepest = std::max(deepest, sel.isField() ? below + 1 : below);
    }
    return deepest;
}

std::set<std::string> referencedVariables(const SelectionSet& selections) {
    std::set<std::string> out;
    collectVariables(selections, out);
    return out;
}

bool shouldInclude(const std::vector<Directive>& directives, const nlohmann::json& variables) {
    for (auto& d : directives) {
        if (d.name != "skip" && d.name != "include") continue;
        auto* condition = d.argument("if");
        if (!condition) continue;
        auto value = condition->toJson(variables);
        bool flag = value.is_boolean() && value.get<bool>();
        if (d.name == "skip" && flag) return false;
        if (d.name == "include" && !flag) return false;
    }
    return true;
}

} // namespace fedgate::graphql
