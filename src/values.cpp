// ═══════════════════════════════════════════════════════════════════
//  src/values.cpp — Input coercion
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/values.h"
#include "gqlpp/printer.h"

#include <sstream>

namespace gqlpp {

namespace {

std::string atPath(const std::string& path) {
    return path.empty() ? "" : " at \"" + path + "\"";
}

Json coerceInput(const Json& value, const TypeRef& type, const Schema& schema, const std::string& path) {
    if (type.isNonNull()) {
        if (value.is_null()) {
            throw CoercionError("Expected non-nullable type \"" + type.toString() +
                                "\" not to be null" + atPath(path) + ".");
        }
        return coerceInput(value, type.ofType(), schema, path);
    }
    if (value.is_null()) return nullptr;

    if (type.isList()) {
        Json items = Json::array();
        if (value.is_array()) {
            for (std::size_t i = 0; i < value.size(); ++i) {
                items.push_back(coerceInput(value[i], type.ofType(), schema,
                                            path + "[" + std::to_string(i) + "]"));
            }
        } else {
            items.push_back(coerceInput(value, type.ofType(), schema, path));
        }
        return items;
    }

    auto* def = schema.type(type.namedType());
    if (!def) throw CoercionError("Unknown type \"" + type.namedType() + "\"" + atPath(path) + ".");

    switch (def->kind) {
        case TypeKind::InputObject: {
            if (!value.is_object()) {
                throw CoercionError("Expected type \"" + def->name + "\" to be an object" + atPath(path) + ".");
            }
            Json result = Json::object();
            for (auto& field : def->inputObject()->fields) {
                std::string fieldPath = path.empty() ? field.name : path + "." + field.name;
                if (!value.contains(field.name)) {
                    if (field.defaultValue) {
                        result[field.name] = *field.defaultValue;
                    } else if (field.type.isNonNull()) {
                        throw CoercionError("Field \"" + field.name + "\" of required type \"" +
                                            field.type.toString() + "\" was not provided" +
                                            atPath(path) + ".");
                    }
                    continue;
                }
                result[field.name] = coerceInput(value[field.name], field.type, schema, fieldPath);
            }
            for (auto it = value.begin(); it != value.end(); ++it) {
                if (!def->inputField(it.key())) {
                    throw CoercionError("Field \"" + it.key() + "\" is not defined by type \"" +
                                        def->name + "\"" + atPath(path) + ".");
                }
            }
            return result;
        }
        case TypeKind::Enum: {
            if (!value.is_string() || !def->enumValue(value.get<std::string>())) {
                throw CoercionError("Value " + value.dump() + " does not exist in \"" + def->name +
                                    "\" enum" + atPath(path) + ".");
            }
            return value;
        }
        case TypeKind::Scalar: {
            try {
                return def->scalar()->parseValue(value);
            } catch (const CoercionError& e) {
                throw CoercionError(e.what() + atPath(path));
            }
        }
        default:
            throw CoercionError("\"" + def->name + "\" is not an input type" + atPath(path) + ".");
    }
}

} // namespace

Json coerceInputValue(const Json& value, const TypeRef& type, const Schema& schema) {
    return coerceInput(value, type, schema, "");
}

std::optional<Json> valueFromAst(const ast::Value& literal, const TypeRef& type,
                                 const Schema& schema, const Json& variables) {
    using Kind = ast::Value::Kind;

    if (literal.isVariable()) {
        if (!variables.contains(literal.text)) return std::nullopt;
        const Json& value = variables[literal.text];
        if (value.is_null() && type.isNonNull()) {
            throw CoercionError("Variable \"$" + literal.text + "\" of type \"" + type.toString() +
                                "\" must not be null.");
        }
        return value;
    }

    if (type.isNonNull()) {
        if (literal.isNull()) {
            throw CoercionError("Expected value of non-null type \"" + type.toString() + "\", found null.");
        }
        return valueFromAst(literal, type.ofType(), schema, variables);
    }
    if (literal.isNull()) return Json(nullptr);

    if (type.isList()) {
        const TypeRef& itemType = type.ofType();
        Json items = Json::array();
        if (literal.kind == Kind::List) {
            for (auto& item : literal.list) {
                auto coerced = valueFromAst(item, itemType, schema, variables);
                if (!coerced) {
                    if (itemType.isNonNull()) {
                        throw CoercionError("Variable \"$" + item.text + "\" has no value for a non-null list item.");
                    }
                    items.push_back(nullptr);
                } else {
                    items.push_back(std::move(*coerced));
                }
            }
        } else {
            auto coerced = valueFromAst(literal, itemType, schema, variables);
            if (!coerced) return std::nullopt;
            items.push_back(std::move(*coerced));
        }
        return items;
    }

    auto* def = schema.type(type.namedType());
    if (!def) throw CoercionError("Unknown type \"" + type.namedType() + "\".");

    switch (def->kind) {
        case TypeKind::InputObject: {
            if (literal.kind != Kind::Object) {
                throw CoercionError("Expected type \"" + def->name + "\", found " + print(literal) + ".");
            }
            Json result = Json::object();
            for (auto& field : def->inputObject()->fields) {
                const ast::Value* fieldLiteral = literal.field(field.name);
                std::optional<Json> coerced;
                if (fieldLiteral) coerced = valueFromAst(*fieldLiteral, field.type, schema, variables);
                if (!coerced) {
                    if (field.defaultValue) {
                        result[field.name] = *field.defaultValue;
                    } else if (field.type.isNonNull()) {
                        throw CoercionError("Field \"" + def->name + "." + field.name + "\" of required type \"" +
                                            field.type.toString() + "\" was not provided.");
                    }
                    continue;
                }
                result[field.name] = std::move(*coerced);
            }
            for (auto& f : literal.fields) {
                if (!def->inputField(f.name)) {
                    throw CoercionError("Field \"" + f.name + "\" is not defined by type \"" + def->name + "\".");
                }
            }
            return result;
        }
        case TypeKind::Enum: {
            if (literal.kind != Kind::Enum || !def->enumValue(literal.text)) {
                throw CoercionError("Value " + print(literal) + " does not exist in \"" + def->name + "\" enum.");
            }
            return Json(literal.text);
        }
        case TypeKind::Scalar:
            return def->scalar()->parseLiteral(literal);
        default:
            throw CoercionError("\"" + def->name + "\" is not an input type.");
    }
}

CoercedVariables coerceVariableValues(const Schema& schema,
                                      const ast::OperationDefinition& operation,
                                      const Json& inputs) {
    CoercedVariables result;
    static const Json kNoInputs = Json::object();
    const Json& provided = inputs.is_object() ? inputs : kNoInputs;

    for (auto& def : operation.variables) {
        const std::string& name = def.name;
        auto fail = [&](const std::string& message) {
            result.errors.emplace_back(message, std::vector<Location>{def.loc});
        };

        if (!schema.isInputType(def.type)) {
            fail("Variable \"$" + name + "\" expected value of type \"" + def.type.toString() +
                 "\" which cannot be used as an input type.");
            continue;
        }

        if (!provided.contains(name)) {
            if (def.defaultValue) {
                try {
                    auto coerced = valueFromAst(*def.defaultValue, def.type, schema, Json::object());
                    if (coerced) result.values[name] = std::move(*coerced);
                } catch (const CoercionError& e) {
                    fail("Variable \"$" + name + "\" has invalid default value: " + e.what());
                }
            } else if (def.type.isNonNull()) {
                fail("Variable \"$" + name + "\" of required type \"" + def.type.toString() +
                     "\" was not provided.");
            }
            continue;
        }

        const Json& value = provided[name];
        if (value.is_null() && def.type.isNonNull()) {
            fail("Variable \"$" + name + "\" of non-null type \"" + def.type.toString() +
                 "\" must not be null.");
            continue;
        }
        try {
            result.values[name] = coerceInputValue(value, def.type, schema);
        } catch (const CoercionError& e) {
            fail("Variable \"$" + name + "\" got invalid value " + value.dump() + "; " + e.what());
        }
    }
    return result;
}

Json coerceArguments(const std::vector<InputValueDefinition>& definitions,
                     const std::vector<ast::Argument>& arguments,
                     const Schema& schema, const Json& variables) {
    Json result = Json::object();
    for (auto& def : definitions) {
        const ast::Argument* node = nullptr;
        for (auto& a : arguments) {
            if (a.name == def.name) { node = &a; break; }
        }

        std::optional<Json> coerced;
        if (node) {
            try {
                coerced = valueFromAst(node->value, def.type, schema, variables);
            } catch (const CoercionError& e) {
                throw CoercionError("Argument \"" + def.name + "\" has invalid value " +
                                    print(node->value) + ". " + e.what());
            }
        }

        if (!coerced) {
            if (def.defaultValue) {
                result[def.name] = *def.defaultValue;
            } else if (def.type.isNonNull()) {
                if (node) {
                    throw CoercionError("Argument \"" + def.name + "\" of required type \"" +
                                        def.type.toString() + "\" was provided the variable \"$" +
                                        node->value.text + "\" which was not provided a runtime value.");
                }
                throw CoercionError("Argument \"" + def.name + "\" of required type \"" +
                                    def.type.toString() + "\" was not provided.");
            }
            continue;
        }
        result[def.name] = std::move(*coerced);
    }
    return result;
}

std::string printInputValue(const Json& value, const TypeRef& type, const Schema& schema) {
    if (value.is_null()) return "null";
    const TypeRef& t = type.isNonNull() ? type.ofType() : type;

    if (t.isList()) {
        if (!value.is_array()) return printInputValue(value, t.ofType(), schema);
        std::ostringstream oss;
        oss << '[';
        for (std::size_t i = 0; i < value.size(); ++i) {
            if (i) oss << ", ";
            oss << printInputValue(value[i], t.ofType(), schema);
        }
        oss << ']';
        return oss.str();
    }

    auto* def = schema.type(t.namedType());
    if (def && def->kind == TypeKind::InputObject && value.is_object()) {
        std::ostringstream oss;
        oss << '{';
        bool first = true;
        for (auto& field : def->inputObject()->fields) {
            if (!value.contains(field.name)) continue;
            if (!first) oss << ", ";
            first = false;
            oss << field.name << ": " << printInputValue(value[field.name], field.type, schema);
        }
        oss << '}';
        return oss.str();
    }
    if (def && def->kind == TypeKind::Enum && value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_string()) return printString(value.get<std::string>());
    return value.dump();
}

} // namespace gqlpp
