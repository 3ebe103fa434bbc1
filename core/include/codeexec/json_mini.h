#pragma once

// json_mini.h
//
// Thin helpers over json-c: an owning document handle, typed field
// accessors that never coerce across JSON types, and a few builders.

#include <json-c/json.h>

#include <algorithm>
#include <climits>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace codeexec::json_mini {

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

    // Give up ownership (e.g. when attaching to a parent object).
    json_object* release() {
        json_object* r = root;
        root = nullptr;
        return r;
    }

    explicit operator bool() const { return root != nullptr; }
};

// Strict parse: the whole input must be one JSON value (surrounding
// whitespace allowed). Returns an empty Doc on any error. A literal
// "null" document also yields an empty Doc.
inline Doc parse(const std::string& json) {
    json_tokener* tok = json_tokener_new();
    if (!tok) return Doc{};
    const int len = static_cast<int>(std::min(json.size(), static_cast<size_t>(INT_MAX)));
    json_object* obj = json_tokener_parse_ex(tok, json.c_str(), len);
    json_tokener_error jerr = json_tokener_get_error(tok);
    size_t end = json_tokener_get_parse_end(tok);
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        return Doc{};
    }
    for (size_t i = end; i < json.size(); i++) {
        char c = json[i];
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
            if (obj) json_object_put(obj);
            return Doc{};
        }
    }
    return Doc{obj};
}

inline bool is_object(const json_object* v) {
    return v && json_object_is_type(v, json_type_object);
}

// Borrowed pointer to obj[key], nullptr when absent (or JSON null).
inline json_object* field(json_object* obj, const char* key) {
    if (!is_object(obj)) return nullptr;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(obj, key, &v)) return nullptr;
    return v;
}

inline bool has_key(json_object* obj, const char* key) {
    if (!is_object(obj)) return false;
    return json_object_object_get_ex(obj, key, nullptr) != 0;
}

inline std::optional<std::string> get_string(json_object* obj, const char* key) {
    json_object* v = field(obj, key);
    if (!v || !json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v), (size_t)json_object_get_string_len(v));
}

inline std::optional<int64_t> get_int(json_object* obj, const char* key) {
    json_object* v = field(obj, key);
    if (!v || !json_object_is_type(v, json_type_int)) return std::nullopt;
    return static_cast<int64_t>(json_object_get_int64(v));
}

// Integer or floating point; booleans and numeric strings are rejected.
inline std::optional<double> get_number(json_object* obj, const char* key) {
    json_object* v = field(obj, key);
    if (!v) return std::nullopt;
    if (!(json_object_is_type(v, json_type_double) || json_object_is_type(v, json_type_int))) return std::nullopt;
    return json_object_get_double(v);
}

inline std::optional<bool> get_bool(json_object* obj, const char* key) {
    json_object* v = field(obj, key);
    if (!v || !json_object_is_type(v, json_type_boolean)) return std::nullopt;
    return json_object_get_boolean(v) != 0;
}

inline std::vector<std::string> get_array_strings(json_object* obj, const char* key) {
    std::vector<std::string> out;
    json_object* arr = field(obj, key);
    if (!arr || !json_object_is_type(arr, json_type_array)) return out;
    const size_t n = json_object_array_length(arr);
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(arr, i);
        if (el && json_object_is_type(el, json_type_string)) {
            out.emplace_back(json_object_get_string(el));
        }
    }
    return out;
}

// ---- builders (obj takes ownership of the new values) ----

inline void set_string(json_object* obj, const char* key, const std::string& v) {
    json_object_object_add(obj, key, json_object_new_string_len(v.data(), (int)v.size()));
}

inline void set_int(json_object* obj, const char* key, int64_t v) {
    json_object_object_add(obj, key, json_object_new_int64(v));
}

inline void set_bool(json_object* obj, const char* key, bool v) {
    json_object_object_add(obj, key, json_object_new_boolean(v ? 1 : 0));
}

inline std::string to_string(json_object* obj) {
    if (!obj) return "null";
    return json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE);
}

} // namespace codeexec::json_mini
