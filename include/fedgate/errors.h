#pragma once
// ═══════════════════════════════════════════════════════════════════
//  fedgate/errors.h — Gateway error taxonomy
// ═══════════════════════════════════════════════════════════════════
//
//  Every error knows the subgraph it came from (if any) and the
//  GraphQL path it belongs to, and renders itself as a GraphQL error
//  entry:
//    { "message": "...", "path": [...],
//      "extensions": { "code": "FETCH_ERROR", "subgraph": "workflow" } }
//
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace fedgate {

// ── Error codes placed in extensions.code ──
namespace codes {
inline constexpr const char* ParseFailed      = "GRAPHQL_PARSE_FAILED";
inline constexpr const char* ValidationFailed = "GRAPHQL_VALIDATION_FAILED";
inline constexpr const char* InvalidSchema    = "INVALID_SUBGRAPH_SCHEMA";
inline constexpr const char* Composition      = "COMPOSITION_ERROR";
inline constexpr const char* Fetch            = "FETCH_ERROR";
inline constexpr const char* Timeout          = "TIMEOUT";
inline constexpr const char* SubgraphDown     = "SUBGRAPH_DOWN";
inline constexpr const char* EntityResolution = "ENTITY_RESOLUTION_ERROR";
inline constexpr const char* Subgraph         = "SUBGRAPH_ERROR";
inline constexpr const char* NonNullViolation = "NON_NULL_VIOLATION";
inline constexpr const char* Config           = "CONFIG_ERROR";
inline constexpr const char* Internal         = "INTERNAL_SERVER_ERROR";
} // namespace codes

// ── Build one GraphQL error entry ──
inline nlohmann::json graphqlError(const std::string& message,
                                   const nlohmann::json& path = nullptr,
                                   const std::string& code = "",
                                   const std::string& subgraph = "") {
    nlohmann::json error = {{"message", message}};
    if (path.is_array() && !path.empty()) error["path"] = path;
    nlohmann::json extensions = nlohmann::json::object();
    if (!code.empty()) extensions["code"] = code;
    if (!subgraph.empty()) extensions["subgraph"] = subgraph;
    if (!extensions.empty()) error["extensions"] = std::move(extensions);
    return error;
}

// ═══════════════════════════════════════════
//  class FederationError — root of the hierarchy
// ═══════════════════════════════════════════
class FederationError : public std::runtime_error {
public:
    FederationError(std::string code, const std::string& message,
                    std::string subgraph = "", nlohmann::json path = nullptr)
        : std::runtime_error(message)
        , code_(std::move(code))
        , subgraph_(std::move(subgraph))
        , path_(std::move(path)) {}

    const std::string& code() const { return code_; }
    const std::string& subgraph() const { return subgraph_; }
    const nlohmann::json& path() const { return path_; }

    nlohmann::json toGraphQL() const {
        return graphqlError(what(), path_, code_, subgraph_);
    }

private:
    std::string code_;
    std::string subgraph_;
    nlohmann::json path_;
};

// ── Syntax error in a GraphQL document or SDL ──
class ParseError : public FederationError {
public:
    ParseError(const std::string& message, std::size_t line, std::size_t column)
        : FederationError(codes::ParseFailed,
              message + " (line " + std::to_string(line) + ", column " + std::to_string(column) + ")")
        , line_(line), column_(column) {}

    std::size_t line() const { return line_; }
    std::size_t column() const { return column_; }

private:
    std::size_t line_;
    std::size_t column_;
};

// ── Malformed SDL or invalid federation directives at registration ──
class SchemaError : public FederationError {
public:
    SchemaError(const std::string& subgraph, const std::string& message)
        : FederationError(codes::InvalidSchema,
              "Subgraph '" + subgraph + "': " + message, subgraph) {}
};

// ── One composition conflict ──
struct Conflict {
    std::string typeName;
    std::string fieldName;                // empty for type-level conflicts
    std::vector<std::string> subgraphs;
    std::string message;

    std::string describe() const {
        std::string target = fieldName.empty() ? typeName : typeName + "." + fieldName;
        std::string who;
        for (auto& s : subgraphs) {
            if (!who.empty()) who += ", ";
            who += s;
        }
        return target + " [" + who + "]: " + message;
    }
};

// ── Conflicting ownership/keys; lists every conflict found ──
class CompositionError : public FederationError {
public:
    explicit CompositionError(std::vector<Conflict> conflicts)
        : FederationError(codes::Composition, summarize(conflicts))
        , conflicts_(std::move(conflicts)) {}

    const std::vector<Conflict>& conflicts() const { return conflicts_; }

private:
    std::vector<Conflict> conflicts_;

    static std::string summarize(const std::vector<Conflict>& conflicts) {
        std::string out = "Schema composition failed with " +
                          std::to_string(conflicts.size()) + " conflict(s)";
        for (auto& c : conflicts) out += "\n  - " + c.describe();
        return out;
    }
};

// ── Query references something absent from the composed schema ──
class PlanningError : public FederationError {
public:
    explicit PlanningError(const std::string& message, nlohmann::json path = nullptr)
        : FederationError(codes::ValidationFailed, message, "", std::move(path)) {}
};

// ── Network failure, timeout or bad payload talking to a subgraph ──
class FetchError : public FederationError {
public:
    FetchError(const std::string& subgraph, const std::string& message,
               std::string code = codes::Fetch)
        : FederationError(std::move(code), message, subgraph) {}

    bool isTimeout() const { return code() == codes::Timeout; }
};

// ── A representation was invalid, rejected or nulled by its owner ──
class EntityResolutionError : public FederationError {
public:
    EntityResolutionError(const std::string& subgraph, const std::string& message,
                          nlohmann::json path = nullptr)
        : FederationError(codes::EntityResolution, message, subgraph, std::move(path)) {}
};

// ── Invalid gateway configuration ──
class ConfigError : public FederationError {
public:
    explicit ConfigError(const std::string& message)
        : FederationError(codes::Config, message) {}
};

} // namespace fedgate
