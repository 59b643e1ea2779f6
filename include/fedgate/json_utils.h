#pragma once
// ═══════════════════════════════════════════════════════════════════
//  fedgate/json_utils.h — JSON helpers shared by every gateway layer
// ═══════════════════════════════════════════════════════════════════
//  JsonValue wraps parsed request bodies; the path helpers address
//  nodes of a GraphQL response tree ("workflow", "executions", 0, ...).
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <set>
#include <string>

namespace fedgate {

// ─────────────────────────────────────────────
//  FEDGATE_SERIALIZE_WITH_DEFAULT
//
//    struct SubgraphConfig {
//        std::string name;
//        std::string url;
//        FEDGATE_SERIALIZE_WITH_DEFAULT(SubgraphConfig, name, url)
//    };
//  Absent keys keep the member defaults.
// ─────────────────────────────────────────────
#define FEDGATE_SERIALIZE_WITH_DEFAULT(Type, ...) \
    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(Type, __VA_ARGS__)

// ─────────────────────────────────────────────
//  class JsonValue
//  Null-safe view over nlohmann::json. Missing keys read as null
//  instead of throwing; this powers `req.body`.
// ─────────────────────────────────────────────
class JsonValue {
public:
    JsonValue() : data_(nlohmann::json::object()) {}
    JsonValue(const nlohmann::json& j) : data_(j) {}
    JsonValue(nlohmann::json&& j) : data_(std::move(j)) {}

    JsonValue operator[](const std::string& key) const {
        if (data_.is_object() && data_.contains(key)) {
            return JsonValue(data_[key]);
        }
        return JsonValue(nlohmann::json(nullptr));
    }

    JsonValue operator[](const char* key) const {
        return operator[](std::string(key));
    }

    template <typename T>
    T get() const {
        return data_.get<T>();
    }

    // Typed lookup with fallback when the key is absent or of the wrong type
    template <typename T>
    T get(const std::string& key, const T& defaultValue) const {
        if (!data_.is_object() || !data_.contains(key)) return defaultValue;
        try {
            return data_.at(key).get<T>();
        } catch (const nlohmann::json::exception&) {
            return defaultValue;
        }
    }

    bool isNull() const { return data_.is_null(); }
    bool isObject() const { return data_.is_object(); }
    bool isString() const { return data_.is_string(); }
    bool has(const std::string& key) const { return data_.is_object() && data_.contains(key); }

    std::string dump(int indent = -1) const { return data_.dump(indent); }

    const nlohmann::json& raw() const { return data_; }
    nlohmann::json& raw() { return data_; }

    bool operator==(const JsonValue& other) const { return data_ == other.data_; }

    friend void to_json(nlohmann::json& j, const JsonValue& v) { j = v.data_; }
    friend void from_json(const nlohmann::json& j, JsonValue& v) { v.data_ = j; }

private:
    nlohmann::json data_;
};

// ═══════════════════════════════════════════
//  Response paths
//  A concrete path is a JSON array of keys and list indices,
//  exactly as it appears in a GraphQL error's "path".
// ═══════════════════════════════════════════
namespace json_path {

inline nlohmann::json append(nlohmann::json path, const nlohmann::json& segment) {
    if (!path.is_array()) path = nlohmann::json::array();
    path.push_back(segment);
    return path;
}

// True when `path` equals `prefix` or lies below it
inline bool startsWith(const nlohmann::json& path, const nlohmann::json& prefix) {
    if (!path.is_array() || !prefix.is_array()) return false;
    if (prefix.size() > path.size()) return false;
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (path[i] != prefix[i]) return false;
    }
    return true;
}

// "workflow.executions.0.id"
inline std::string toString(const nlohmann::json& path) {
    std::string out;
    for (auto& segment : path) {
        if (!out.empty()) out += '.';
        out += segment.is_string() ? segment.get<std::string>() : segment.dump();
    }
    return out;
}

} // namespace json_path

// ─────────────────────────────────────────────
//  shapeOf — structural type signature of a JSON value.
//  Two variable maps with the same shape may share one query plan.
//    {"id": "1", "ids": [1, 2]}  →  {id:string,ids:[int]}
// ─────────────────────────────────────────────
inline std::string shapeOf(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:            return "null";
        case nlohmann::json::value_t::boolean:         return "boolean";
        case nlohmann::json::value_t::string:          return "string";
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned: return "int";
        case nlohmann::json::value_t::number_float:    return "float";
        case nlohmann::json::value_t::array: {
            std::set<std::string> items;
            for (auto& item : value) items.insert(shapeOf(item));
            std::string out = "[";
            for (auto& s : items) {
                if (out.size() > 1) out += '|';
                out += s;
            }
            return out + "]";
        }
        case nlohmann::json::value_t::object: {
            // nlohmann::json objects iterate in key order
            std::string out = "{";
            for (auto& [key, item] : value.items()) {
                if (out.size() > 1) out += ',';
                out += key + ":" + shapeOf(item);
            }
            return out + "}";
        }
        default:
            return "unknown";
    }
}

} // namespace fedgate
