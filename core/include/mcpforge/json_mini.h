#pragma once

// json_mini.h
//
// Thin RAII and lookup helpers over json-c. Ownership follows json-c refcounts:
// Doc owns one reference and releases it on destruction.

#include <json-c/json.h>

#include <algorithm>
#include <climits>
#include <cstdint>
#include <optional>
#include <string>

namespace mcpforge::json_mini {

struct Doc {
    json_object* root{nullptr};

    Doc() = default;
    explicit Doc(json_object* r) : root(r) {}
    Doc(const Doc&) = delete;
    Doc& operator=(const Doc&) = delete;

    Doc(Doc&& other) noexcept : root(other.root) { other.root = nullptr; }
    Doc& operator=(Doc&& other) noexcept {
        if (this != &other) {
            if (root) json_object_put(root);
            root = other.root;
            other.root = nullptr;
        }
        return *this;
    }

    ~Doc() {
        if (root) json_object_put(root);
    }

    // Hand the reference to a json-c container (e.g. json_object_object_add).
    json_object* release() {
        json_object* r = root;
        root = nullptr;
        return r;
    }

    explicit operator bool() const { return root != nullptr; }
};

// Strict parse: trailing garbage or truncated input yields an empty Doc.
inline Doc parse(const std::string& json) {
    json_tokener* tok = json_tokener_new();
    if (!tok) return Doc{};
    json_object* obj = json_tokener_parse_ex(tok, json.c_str(),
        static_cast<int>(std::min(json.size(), static_cast<size_t>(INT_MAX))));
    json_tokener_error jerr = json_tokener_get_error(tok);
    size_t end = json_tokener_get_parse_end(tok);
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        return Doc{};
    }
    for (size_t i = end; i < json.size(); i++) {
        char c = json[i];
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
            if (obj) json_object_put(obj);
            return Doc{};
        }
    }
    if (!obj && json != "null") return Doc{};
    return Doc{obj};
}

inline std::string dump(json_object* o) {
    if (!o) return "null";
    return std::string(json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN));
}

inline bool is_object(json_object* o) {
    return o && json_object_is_type(o, json_type_object);
}

inline json_object* get(json_object* o, const char* key) {
    if (!is_object(o)) return nullptr;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, key, &v)) return nullptr;
    return v;
}

inline std::optional<std::string> get_string(json_object* o, const char* key) {
    json_object* v = get(o, key);
    if (!v || !json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v));
}

inline std::optional<int64_t> get_int(json_object* o, const char* key) {
    json_object* v = get(o, key);
    if (!v || !json_object_is_type(v, json_type_int)) return std::nullopt;
    return static_cast<int64_t>(json_object_get_int64(v));
}

inline std::optional<bool> get_bool(json_object* o, const char* key) {
    json_object* v = get(o, key);
    if (!v || !json_object_is_type(v, json_type_boolean)) return std::nullopt;
    return json_object_get_boolean(v) != 0;
}

// Raw JSON text of a member, if present.
inline std::optional<std::string> get_raw(json_object* o, const char* key) {
    json_object* v = nullptr;
    if (!is_object(o) || !json_object_object_get_ex(o, key, &v)) return std::nullopt;
    return dump(v);
}

} // namespace mcpforge::json_mini
