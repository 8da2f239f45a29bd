#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/json_utils.h — Runtime value type and JSON helpers
// ═══════════════════════════════════════════════════════════════════
//  Every runtime value that flows through the executor (resolver
//  results, variables, arguments, the response tree) is an
//  insertion-ordered nlohmann::json, so response objects keep the
//  order in which fields were requested.
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <cmath>
#include <concepts>
#include <cstdint>
#include <limits>
#include <string>

namespace gqlpp {

using Json = nlohmann::ordered_json;

// ─────────────────────────────────────────────
//  Macro: GQLPP_SERIALIZE
//  Makes a host struct convertible to a resolver result.
//
//  Usage:
//    struct User {
//        int id;
//        std::string name;
//        GQLPP_SERIALIZE(User, id, name)
//    };
// ─────────────────────────────────────────────
#define GQLPP_SERIALIZE(Type, ...) \
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Type, __VA_ARGS__)

// ─────────────────────────────────────────────
//  Concept: JsonSerializable
//  Any type T that gqlpp::Json can be constructed from.
// ─────────────────────────────────────────────
template <typename T>
concept JsonSerializable = requires(T t) {
    { Json(t) } -> std::convertible_to<Json>;
};

template <JsonSerializable T>
inline Json toJson(const T& value) {
    return Json(value);
}

template <typename T>
inline T fromJson(const Json& j) {
    return j.get<T>();
}

// ── Human readable kind, used in coercion messages ──
inline std::string jsonTypeName(const Json& value) {
    switch (value.type()) {
        case Json::value_t::null:            return "null";
        case Json::value_t::boolean:         return "Boolean";
        case Json::value_t::number_integer:
        case Json::value_t::number_unsigned: return "Int";
        case Json::value_t::number_float:    return "Float";
        case Json::value_t::string:          return "String";
        case Json::value_t::array:           return "List";
        case Json::value_t::object:          return "Object";
        default:                             return "Value";
    }
}

// ── True for integers and for floats holding an integral value ──
inline bool isIntegral(const Json& value) {
    if (value.is_number_integer()) return true;
    if (!value.is_number_float()) return false;
    double d = value.get<double>();
    return std::isfinite(d) && std::floor(d) == d;
}

// ── True when value is integral and fits a signed 32-bit Int ──
inline bool fitsInt32(const Json& value) {
    if (!isIntegral(value)) return false;
    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>() <=
               static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max());
    }
    double d = value.get<double>();
    return d >= std::numeric_limits<std::int32_t>::min() &&
           d <= std::numeric_limits<std::int32_t>::max();
}

} // namespace gqlpp
