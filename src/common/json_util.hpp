#pragma once

#include <boost/json.hpp>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace sightlink::json_util {

namespace json = boost::json;

// Safe JSON field accessors with defaults

inline std::string jstr(const json::object& obj, std::string_view key, const std::string& def = {}) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_string())
        return std::string(it->value().as_string());
    return def;
}

inline bool jbool(const json::object& obj, std::string_view key, bool def = false) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_bool())
        return it->value().as_bool();
    return def;
}

// nullopt for non-numbers and values that do not fit in int64
inline std::optional<int64_t> to_int64(const json::value& v) {
    if (v.is_int64()) return v.as_int64();
    if (v.is_uint64() && v.as_uint64() <= uint64_t(std::numeric_limits<int64_t>::max()))
        return static_cast<int64_t>(v.as_uint64());
    if (v.is_double()) {
        // 2^63; NaN compares false
        constexpr double limit = 9223372036854775808.0;
        double d = v.as_double();
        if (d >= -limit && d < limit) return static_cast<int64_t>(d);
    }
    return std::nullopt;
}

inline int64_t jint(const json::object& obj, std::string_view key, int64_t def = 0) {
    if (auto it = obj.find(key); it != obj.end()) {
        if (auto n = to_int64(it->value())) return *n;
    }
    return def;
}

inline uint64_t juint(const json::object& obj, std::string_view key, uint64_t def = 0) {
    if (auto it = obj.find(key); it != obj.end()) {
        if (it->value().is_uint64()) return it->value().as_uint64();
        if (it->value().is_int64() && it->value().as_int64() >= 0)
            return static_cast<uint64_t>(it->value().as_int64());
    }
    return def;
}

inline double jnum(const json::object& obj, std::string_view key, double def = 0.0) {
    if (auto it = obj.find(key); it != obj.end()) {
        if (it->value().is_double()) return it->value().as_double();
        if (it->value().is_int64()) return static_cast<double>(it->value().as_int64());
        if (it->value().is_uint64()) return static_cast<double>(it->value().as_uint64());
    }
    return def;
}

inline const json::object* jsection(const json::object& obj, std::string_view key) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_object())
        return &it->value().as_object();
    return nullptr;
}

inline const json::array* jarray(const json::object& obj, std::string_view key) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_array())
        return &it->value().as_array();
    return nullptr;
}

// Field type checks used by payload schemas
inline bool has_string(const json::object& obj, std::string_view key) {
    auto it = obj.find(key);
    return it != obj.end() && it->value().is_string();
}

inline bool has_number(const json::object& obj, std::string_view key) {
    auto it = obj.find(key);
    return it != obj.end() && it->value().is_number();
}

inline bool has_bool(const json::object& obj, std::string_view key) {
    auto it = obj.find(key);
    return it != obj.end() && it->value().is_bool();
}

inline bool has_key(const json::object& obj, std::string_view key) {
    return obj.find(key) != obj.end();
}

inline std::optional<std::string> jopt_str(const json::object& obj, std::string_view key) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_string())
        return std::string(it->value().as_string());
    return std::nullopt;
}

} // namespace sightlink::json_util
