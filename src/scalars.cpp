// ═══════════════════════════════════════════════════════════════════
//  src/scalars.cpp — Serialization and parsing of built-in scalars
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/scalars.h"
#include "gqlpp/errors.h"
#include "gqlpp/printer.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <locale>
#include <optional>
#include <sstream>

namespace gqlpp::scalars {

const char* const kIntDescription =
    "The `Int` scalar type represents non-fractional signed whole numeric values. "
    "Int can represent values between -(2^31) and 2^31 - 1.";
const char* const kFloatDescription =
    "The `Float` scalar type represents signed double-precision fractional values "
    "as specified by [IEEE 754](https://en.wikipedia.org/wiki/IEEE_floating_point).";
const char* const kStringDescription =
    "The `String` scalar type represents textual data, represented as UTF-8 "
    "character sequences.";
const char* const kBooleanDescription =
    "The `Boolean` scalar type represents `true` or `false`.";
const char* const kIdDescription =
    "The `ID` scalar type represents a unique identifier, often used to refetch an "
    "object or as key for a cache. It is serialized as a String; an Int input is "
    "accepted as an ID.";
const char* const kDecimalDescription =
    "The `Decimal` scalar type represents a signed fixed-point decimal number with "
    "up to 28 significant digits. It is serialized as a String.";

namespace {

[[noreturn]] void reject(const std::string& typeName, const std::string& shown) {
    throw CoercionError(typeName + " cannot represent value: " + shown);
}

[[noreturn]] void rejectLiteral(const std::string& typeName, const ast::Value& literal) {
    throw CoercionError(typeName + " cannot represent a non " + typeName + " value: " + print(literal));
}

std::optional<double> parseDouble(const std::string& text) {
    std::istringstream iss(text);
    iss.imbue(std::locale::classic());
    double d = 0;
    iss >> d;
    if (iss.fail() || !iss.eof()) return std::nullopt;
    return d;
}

Json int32FromDouble(double d, const std::string& shown) {
    if (!std::isfinite(d) || std::floor(d) != d) reject("Int", shown);
    if (d < std::numeric_limits<std::int32_t>::min() || d > std::numeric_limits<std::int32_t>::max()) {
        throw CoercionError("Int cannot represent non 32-bit signed integer value: " + shown);
    }
    return Json(static_cast<std::int32_t>(d));
}

Json int32FromText(const std::string& text) {
    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() ||
        value < std::numeric_limits<std::int32_t>::min() ||
        value > std::numeric_limits<std::int32_t>::max()) {
        throw CoercionError("Int cannot represent non 32-bit signed integer value: " + text);
    }
    return Json(static_cast<std::int32_t>(value));
}

// Canonical text of a plain decimal ("-12.50", "0.5"), or nullopt. Leading
// zeros, a '+' sign and the sign of zero are dropped; fractional digits are
// kept as written.
std::optional<std::string> canonicalDecimal(const std::string& text) {
    constexpr std::size_t maxDigits = 28;

    std::size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) negative = text[pos++] == '-';

    std::string whole, fraction;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) whole += text[pos++];
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) fraction += text[pos++];
        if (fraction.empty()) return std::nullopt;
    }
    if (pos != text.size() || (whole.empty() && fraction.empty())) return std::nullopt;

    whole.erase(0, std::min(whole.find_first_not_of('0'), whole.size()));
    std::string digits = whole + fraction;
    auto significant = digits.find_first_not_of('0');
    if (significant != std::string::npos && digits.size() - significant > maxDigits) return std::nullopt;
    if (fraction.size() > maxDigits) return std::nullopt;

    std::string out = negative && significant != std::string::npos ? "-" : "";
    out += whole.empty() ? "0" : whole;
    if (!fraction.empty()) out += "." + fraction;
    return out;
}

} // namespace

// ═══════════════════════════════════════════
//  Int
// ═══════════════════════════════════════════
ScalarType intType() {
    ScalarType t;
    t.serialize = [](const Json& v) -> Json {
        if (v.is_boolean()) return Json(v.get<bool>() ? 1 : 0);
        if (v.is_number()) return int32FromDouble(v.get<double>(), v.dump());
        if (v.is_string()) {
            auto d = parseDouble(v.get<std::string>());
            if (!d) reject("Int", v.dump());
            return int32FromDouble(*d, v.dump());
        }
        reject("Int", v.dump());
    };
    t.parseValue = [](const Json& v) -> Json {
        if (!v.is_number()) reject("Int", v.dump());
        return int32FromDouble(v.get<double>(), v.dump());
    };
    t.parseLiteral = [](const ast::Value& lit) -> Json {
        if (lit.kind != ast::Value::Kind::Int) rejectLiteral("Int", lit);
        return int32FromText(lit.text);
    };
    return t;
}

// ═══════════════════════════════════════════
//  Float
// ═══════════════════════════════════════════
ScalarType floatType() {
    ScalarType t;
    t.serialize = [](const Json& v) -> Json {
        if (v.is_boolean()) return Json(v.get<bool>() ? 1.0 : 0.0);
        if (v.is_number()) {
            double d = v.get<double>();
            if (!std::isfinite(d)) reject("Float", v.dump());
            return Json(d);
        }
        if (v.is_string()) {
            auto d = parseDouble(v.get<std::string>());
            if (!d || !std::isfinite(*d)) reject("Float", v.dump());
            return Json(*d);
        }
        reject("Float", v.dump());
    };
    t.parseValue = [](const Json& v) -> Json {
        if (!v.is_number()) reject("Float", v.dump());
        return Json(v.get<double>());
    };
    t.parseLiteral = [](const ast::Value& lit) -> Json {
        if (lit.kind != ast::Value::Kind::Int && lit.kind != ast::Value::Kind::Float) {
            rejectLiteral("Float", lit);
        }
        auto d = parseDouble(lit.text);
        if (!d || !std::isfinite(*d)) rejectLiteral("Float", lit);
        return Json(*d);
    };
    return t;
}

// ═══════════════════════════════════════════
//  String
// ═══════════════════════════════════════════
ScalarType stringType() {
    ScalarType t;
    t.serialize = [](const Json& v) -> Json {
        if (v.is_string()) return v;
        if (v.is_boolean()) return Json(v.get<bool>() ? "true" : "false");
        if (v.is_number()) return Json(v.dump());
        reject("String", v.dump());
    };
    t.parseValue = [](const Json& v) -> Json {
        if (!v.is_string()) reject("String", v.dump());
        return v;
    };
    t.parseLiteral = [](const ast::Value& lit) -> Json {
        if (lit.kind != ast::Value::Kind::String) rejectLiteral("String", lit);
        return Json(lit.text);
    };
    return t;
}

// ═══════════════════════════════════════════
//  Boolean
// ═══════════════════════════════════════════
ScalarType booleanType() {
    ScalarType t;
    t.serialize = [](const Json& v) -> Json {
        if (v.is_boolean()) return v;
        if (v.is_number()) {
            double d = v.get<double>();
            if (!std::isfinite(d)) reject("Boolean", v.dump());
            return Json(d != 0);
        }
        reject("Boolean", v.dump());
    };
    t.parseValue = [](const Json& v) -> Json {
        if (!v.is_boolean()) reject("Boolean", v.dump());
        return v;
    };
    t.parseLiteral = [](const ast::Value& lit) -> Json {
        if (lit.kind != ast::Value::Kind::Boolean) rejectLiteral("Boolean", lit);
        return Json(lit.boolean);
    };
    return t;
}

// ═══════════════════════════════════════════
//  ID
// ═══════════════════════════════════════════
ScalarType idType() {
    ScalarType t;
    t.serialize = [](const Json& v) -> Json {
        if (v.is_string()) return v;
        if (v.is_number_integer()) return Json(v.dump());
        if (isIntegral(v)) return Json(std::to_string(static_cast<long long>(v.get<double>())));
        reject("ID", v.dump());
    };
    t.parseValue = [](const Json& v) -> Json {
        if (v.is_string()) return v;
        if (v.is_number_integer()) return Json(v.dump());
        reject("ID", v.dump());
    };
    t.parseLiteral = [](const ast::Value& lit) -> Json {
        if (lit.kind == ast::Value::Kind::String || lit.kind == ast::Value::Kind::Int) {
            return Json(lit.text);
        }
        rejectLiteral("ID", lit);
    };
    return t;
}

// ═══════════════════════════════════════════
//  Decimal
// ═══════════════════════════════════════════
ScalarType decimalType() {
    ScalarType t;
    t.serialize = [](const Json& v) -> Json {
        if (v.is_number_integer()) return Json(v.dump());
        if (v.is_string() || v.is_number_float()) {
            auto text = v.is_string() ? v.get<std::string>() : v.dump();
            if (auto decimal = canonicalDecimal(text)) return Json(*decimal);
        }
        reject("Decimal", v.dump());
    };
    t.parseValue = [](const Json& v) -> Json {
        if (!v.is_string()) reject("Decimal", v.dump());
        auto decimal = canonicalDecimal(v.get<std::string>());
        if (!decimal) reject("Decimal", v.dump());
        return Json(*decimal);
    };
    t.parseLiteral = [](const ast::Value& lit) -> Json {
        if (lit.kind != ast::Value::Kind::String) rejectLiteral("Decimal", lit);
        auto decimal = canonicalDecimal(lit.text);
        if (!decimal) rejectLiteral("Decimal", lit);
        return Json(*decimal);
    };
    return t;
}

void install(Schema& schema) {
    schema.scalar("Int", intType(), kIntDescription);
    schema.scalar("Float", floatType(), kFloatDescription);
    schema.scalar("String", stringType(), kStringDescription);
    schema.scalar("Boolean", booleanType(), kBooleanDescription);
    schema.scalar("ID", idType(), kIdDescription);
}

} // namespace gqlpp::scalars
