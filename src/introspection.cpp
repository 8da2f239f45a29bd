// ═══════════════════════════════════════════════════════════════════
//  src/introspection.cpp — __Schema / __Type and friends
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/introspection.h"
#include "gqlpp/executor.h"
#include "gqlpp/schema.h"
#include "gqlpp/values.h"

namespace gqlpp {

namespace {

Json nullableString(const std::string& s) {
    return s.empty() ? Json(nullptr) : Json(s);
}

Json deprecation(const std::optional<std::string>& reason) {
    return reason ? Json(*reason) : Json(nullptr);
}

Json inputValue(const InputValueDefinition& def, const Schema& schema) {
    return Json{
        {"name", def.name},
        {"description", nullableString(def.description)},
        {"type", typeHandle(def.type)},
        {"defaultValue", def.defaultValue ? Json(printInputValue(*def.defaultValue, def.type, schema))
                                          : Json(nullptr)},
        {"isDeprecated", false},
        {"deprecationReason", nullptr},
    };
}

Json inputValues(const std::vector<InputValueDefinition>& defs, const Schema& schema) {
    Json list = Json::array();
    for (auto& def : defs) list.push_back(inputValue(def, schema));
    return list;
}

Json fieldValue(const FieldDefinition& def, const Schema& schema) {
    return Json{
        {"name", def.name},
        {"description", nullableString(def.description)},
        {"args", inputValues(def.arguments, schema)},
        {"type", typeHandle(def.type)},
        {"isDeprecated", def.deprecationReason.has_value()},
        {"deprecationReason", deprecation(def.deprecationReason)},
    };
}

Json directiveValue(const DirectiveDefinition& def, const Schema& schema) {
    Json locations = Json::array();
    for (auto loc : def.locations) locations.push_back(toString(loc));
    return Json{
        {"name", def.name},
        {"description", nullableString(def.description)},
        {"locations", std::move(locations)},
        {"args", inputValues(def.arguments, schema)},
        {"isRepeatable", def.repeatable},
    };
}

// Named type behind a __Type handle, nullptr for wrappers
const TypeDefinition* namedType(const ResolveInfo& info) {
    const Json& handle = info.parent();
    if (!handle.contains("name")) return nullptr;
    return info.schema().type(handle["name"].get<std::string>());
}

bool includeDeprecated(const ResolveInfo& info) {
    const Json& flag = info.arg("includeDeprecated");
    return flag.is_boolean() && flag.get<bool>();
}

void installSchemaType(Schema& schema) {
    schema.object("__Schema")
        .describe("A GraphQL Schema defines the capabilities of a GraphQL server. It exposes all "
                  "available types and directives on the server, as well as the entry points for "
                  "query, mutation, and subscription operations.")
        .field("description", "String", [](const ResolveInfo& info) {
            return nullableString(info.schema().description());
        })
        .field("types", "[__Type!]!", [](const ResolveInfo& info) {
            Json list = Json::array();
            for (auto* t : info.schema().types()) list.push_back(Json{{"name", t->name}});
            return list;
        })
        .describe("A list of all types supported by this server.")
        .field("queryType", "__Type!", [](const ResolveInfo& info) {
            return Json{{"name", info.schema().queryType()->name}};
        })
        .describe("The type that query operations will be rooted at.")
        .field("mutationType", "__Type", [](const ResolveInfo& info) -> Json {
            auto* t = info.schema().mutationType();
            return t ? Json{{"name", t->name}} : Json(nullptr);
        })
        .describe("If this server supports mutation, the type that mutation operations will be rooted at.")
        .field("subscriptionType", "__Type", [](const ResolveInfo& info) -> Json {
            auto* t = info.schema().subscriptionType();
            return t ? Json{{"name", t->name}} : Json(nullptr);
        })
        .describe("If this server support subscription, the type that subscription operations will be rooted at.")
        .field("directives", "[__Directive!]!", [](const ResolveInfo& info) {
            Json list = Json::array();
            for (auto& d : info.schema().directives()) list.push_back(directiveValue(d, info.schema()));
            return list;
        })
        .describe("A list of all directives supported by this server.");
}

void installTypeType(Schema& schema) {
    schema.object("__Type")
        .describe("The fundamental unit of any GraphQL Schema is the type. There are many kinds of "
                  "types in GraphQL as represented by the `__TypeKind` enum.")
        .field("kind", "__TypeKind!", [](const ResolveInfo& info) -> Json {
            if (auto* t = namedType(info)) return toString(t->kind);
            return info.parent()["kind"];
        })
        .field("name", "String", [](const ResolveInfo& info) -> Json {
            if (auto* t = namedType(info)) return t->name;
            return nullptr;
        })
        .field("description", "String", [](const ResolveInfo& info) -> Json {
            if (auto* t = namedType(info)) return nullableString(t->description);
            return nullptr;
        })
        .field("specifiedByURL", "String", [](const ResolveInfo& info) -> Json {
            auto* t = namedType(info);
            if (!t || !t->scalar()) return nullptr;
            return nullableString(t->scalar()->specifiedByUrl);
        })
        .field("fields", "[__Field!]", [](const ResolveInfo& info) -> Json {
            auto* t = namedType(info);
            if (!t || !t->fields()) return nullptr;
            bool all = includeDeprecated(info);
            Json list = Json::array();
            for (auto& f : *t->fields()) {
                if (all || !f.deprecationReason) list.push_back(fieldValue(f, info.schema()));
            }
            return list;
        })
        .arg("includeDeprecated", "Boolean", Json(false))
        .field("interfaces", "[__Type!]", [](const ResolveInfo& info) -> Json {
            auto* t = namedType(info);
            if (!t) return nullptr;
            if (t->kind == TypeKind::Interface) return Json::array();
            auto* o = t->object();
            if (!o) return nullptr;
            Json list = Json::array();
            for (auto& name : o->interfaces) list.push_back(Json{{"name", name}});
            return list;
        })
        .field("possibleTypes", "[__Type!]", [](const ResolveInfo& info) -> Json {
            auto* t = namedType(info);
            if (!t || !t->isAbstract()) return nullptr;
            Json list = Json::array();
            for (auto* p : info.schema().possibleTypes(*t)) list.push_back(Json{{"name", p->name}});
            return list;
        })
        .field("enumValues", "[__EnumValue!]", [](const ResolveInfo& info) -> Json {
            auto* t = namedType(info);
            if (!t || !t->enumType()) return nullptr;
            bool all = includeDeprecated(info);
            Json list = Json::array();
            for (auto& v : t->enumType()->values) {
                if (!all && v.deprecationReason) continue;
                list.push_back(Json{
                    {"name", v.name},
                    {"description", nullableString(v.description)},
                    {"isDeprecated", v.deprecationReason.has_value()},
                    {"deprecationReason", deprecation(v.deprecationReason)},
                });
            }
            return list;
        })
        .arg("includeDeprecated", "Boolean", Json(false))
        .field("inputFields", "[__InputValue!]", [](const ResolveInfo& info) -> Json {
            auto* t = namedType(info);
            if (!t || !t->inputObject()) return nullptr;
            return inputValues(t->inputObject()->fields, info.schema());
        })
        .field("ofType", "__Type", [](const ResolveInfo& info) -> Json {
            const Json& handle = info.parent();
            return handle.contains("ofType") ? handle["ofType"] : Json(nullptr);
        });
}

void installMemberTypes(Schema& schema) {
    schema.object("__Field")
        .describe("Object and Interface types are described by a list of Fields, each of which has "
                  "a name, potentially a list of arguments, and a return type.")
        .field("name", "String!")
        .field("description", "String")
        .field("args", "[__InputValue!]!")
        .field("type", "__Type!")
        .field("isDeprecated", "Boolean!")
        .field("deprecationReason", "String");

    schema.object("__InputValue")
        .describe("Arguments provided to Fields or Directives and the input fields of an "
                  "InputObject are represented as Input Values which describe their type and "
                  "optionally a default value.")
        .field("name", "String!")
        .field("description", "String")
        .field("type", "__Type!")
        .field("defaultValue", "String")
        .describe("A GraphQL-formatted string representing the default value for this input value.")
        .field("isDeprecated", "Boolean!")
        .field("deprecationReason", "String");

    schema.object("__EnumValue")
        .describe("One possible value for a given Enum. Enum values are unique values, not a "
                  "placeholder for a string or numeric value.")
        .field("name", "String!")
        .field("description", "String")
        .field("isDeprecated", "Boolean!")
        .field("deprecationReason", "String");

    schema.object("__Directive")
        .describe("A Directive provides a way to describe alternate runtime execution and type "
                  "validation behavior in a GraphQL document.")
        .field("name", "String!")
        .field("description", "String")
        .field("isRepeatable", "Boolean!")
        .field("locations", "[__DirectiveLocation!]!")
        .field("args", "[__InputValue!]!");

    auto kinds = schema.enumType("__TypeKind");
    kinds.describe("An enum describing what kind of type a given `__Type` is.");
    for (auto* kind : {"SCALAR", "OBJECT", "INTERFACE", "UNION", "ENUM", "INPUT_OBJECT", "LIST", "NON_NULL"}) {
        kinds.value(kind);
    }

    auto locations = schema.enumType("__DirectiveLocation");
    locations.describe("A Directive can be adjacent to many parts of the GraphQL language, a "
                       "__DirectiveLocation describes one such possible adjacencies.");
    for (int i = static_cast<int>(DirectiveLocation::Query);
         i <= static_cast<int>(DirectiveLocation::InputFieldDefinition); ++i) {
        locations.value(toString(static_cast<DirectiveLocation>(i)));
    }
}

} // namespace

Json typeHandle(const TypeRef& type) {
    if (type.isNonNull()) return Json{{"kind", "NON_NULL"}, {"ofType", typeHandle(type.ofType())}};
    if (type.isList()) return Json{{"kind", "LIST"}, {"ofType", typeHandle(type.ofType())}};
    return Json{{"name", type.namedType()}};
}

void installIntrospection(Schema& schema) {
    if (schema.type("__Schema")) return;

    installSchemaType(schema);
    installTypeType(schema);
    installMemberTypes(schema);

    schema.typenameField_ = FieldDefinition{};
    schema.typenameField_.name = "__typename";
    schema.typenameField_.description = "The name of the current Object type at runtime.";
    schema.typenameField_.type = TypeRef::parse("String!");
    schema.typenameField_.resolve = [](const ResolveInfo& info) {
        return Json(info.parentType().name);
    };

    schema.schemaField_ = FieldDefinition{};
    schema.schemaField_.name = "__schema";
    schema.schemaField_.description = "Access the current type schema of this server.";
    schema.schemaField_.type = TypeRef::parse("__Schema!");
    schema.schemaField_.resolve = [](const ResolveInfo&) {
        return Json::object();
    };

    schema.typeField_ = FieldDefinition{};
    schema.typeField_.name = "__type";
    schema.typeField_.description = "Request the type information of a single type.";
    schema.typeField_.type = TypeRef::parse("__Type");
    schema.typeField_.arguments.push_back(
        InputValueDefinition{"name", "", TypeRef::parse("String!"), std::nullopt});
    schema.typeField_.resolve = [](const ResolveInfo& info) -> Json {
        const std::string name = info.arg("name").get<std::string>();
        if (!info.schema().type(name)) return nullptr;
        return Json{{"name", name}};
    };
}

} // namespace gqlpp
