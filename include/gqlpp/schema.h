#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/schema.h — Schema model: types, fields, resolvers, directives
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto schema = std::make_shared<Schema>();
//    schema->object("User")
//        .field("id", "Int!")
//        .field("name", "String");
//    schema->object("Query")
//        .field("user", "User", [](const ResolveInfo& info) {
//            return Json{{"id", info.arg("id")}, {"name", "Ann"}};
//        })
//        .arg("id", "Int!");
//    schema->setQueryType("Query");
//    schema->finalize();
//
//  Types live in an arena keyed by name; everything else refers to a
//  type by name, so recursive types need no special handling. After
//  finalize() the schema is shared read-only between requests.
// ═══════════════════════════════════════════════════════════════════

#include "ast.h"
#include "cache_control.h"
#include "json_utils.h"
#include "type_ref.h"
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace gqlpp {

class ResolveInfo;

// ── Resolver capabilities ──
using ResolveCallback = std::function<void(std::exception_ptr error, Json value)>;
using Resolver        = std::function<Json(const ResolveInfo& info)>;
using AsyncResolver   = std::function<void(const ResolveInfo& info, ResolveCallback done)>;
using TypeResolver    = std::function<std::string(const Json& value, const ResolveInfo& info)>;

enum class TypeKind { Scalar, Object, Interface, Union, Enum, InputObject };

// "SCALAR", "OBJECT", ... as used by introspection
const char* toString(TypeKind kind);

// ═══════════════════════════════════════════
//  Definitions
// ═══════════════════════════════════════════

struct InputValueDefinition {
    std::string name;
    std::string description;
    TypeRef type;
    std::optional<Json> defaultValue;
};

struct FieldDefinition {
    std::string name;
    std::string description;
    TypeRef type;
    std::vector<InputValueDefinition> arguments;
    std::optional<std::string> deprecationReason;
    CacheControl cacheControl;
    Resolver resolve;
    AsyncResolver resolveAsync;

    const InputValueDefinition* argument(std::string_view argName) const;
    bool hasResolver() const { return static_cast<bool>(resolve) || static_cast<bool>(resolveAsync); }
};

struct EnumValueDefinition {
    std::string name;
    std::string description;
    std::optional<std::string> deprecationReason;
};

// Scalar capabilities; each throws CoercionError on failure
struct ScalarType {
    std::function<Json(const Json&)> serialize;             // resolver result → response
    std::function<Json(const Json&)> parseValue;            // variable input → runtime
    std::function<Json(const ast::Value&)> parseLiteral;    // literal (no variables) → runtime
    std::string specifiedByUrl;
};

struct ObjectType {
    std::vector<FieldDefinition> fields;
    std::vector<std::string> interfaces;
};

struct InterfaceType {
    std::vector<FieldDefinition> fields;
    TypeResolver resolveType;
};

struct UnionType {
    std::vector<std::string> possibleTypes;
    TypeResolver resolveType;
};

struct EnumType {
    std::vector<EnumValueDefinition> values;
};

struct InputObjectType {
    std::vector<InputValueDefinition> fields;
};

struct TypeDefinition {
    TypeKind kind = TypeKind::Scalar;
    std::string name;
    std::string description;
    CacheControl cacheControl;
    std::variant<ScalarType, ObjectType, InterfaceType, UnionType, EnumType, InputObjectType> data;

    const ScalarType* scalar() const { return std::get_if<ScalarType>(&data); }
    const ObjectType* object() const { return std::get_if<ObjectType>(&data); }
    const InterfaceType* interfaceType() const { return std::get_if<InterfaceType>(&data); }
    const UnionType* unionType() const { return std::get_if<UnionType>(&data); }
    const EnumType* enumType() const { return std::get_if<EnumType>(&data); }
    const InputObjectType* inputObject() const { return std::get_if<InputObjectType>(&data); }

    // Declared fields of an Object or Interface, nullptr otherwise
    const std::vector<FieldDefinition>* fields() const;
    const FieldDefinition* field(std::string_view fieldName) const;
    const InputValueDefinition* inputField(std::string_view fieldName) const;
    const EnumValueDefinition* enumValue(std::string_view valueName) const;

    bool isLeaf() const { return kind == TypeKind::Scalar || kind == TypeKind::Enum; }
    bool isComposite() const {
        return kind == TypeKind::Object || kind == TypeKind::Interface || kind == TypeKind::Union;
    }
    bool isAbstract() const { return kind == TypeKind::Interface || kind == TypeKind::Union; }
    bool isInputType() const { return isLeaf() || kind == TypeKind::InputObject; }
    bool isOutputType() const { return kind != TypeKind::InputObject; }
};

enum class DirectiveLocation {
    Query, Mutation, Subscription, Field, FragmentDefinition, FragmentSpread,
    InlineFragment, VariableDefinition,
    Schema, Scalar, Object, FieldDefinition, ArgumentDefinition, Interface,
    Union, Enum, EnumValue, InputObject, InputFieldDefinition
};

// "QUERY", "FIELD", ... as used by introspection
const char* toString(DirectiveLocation location);

struct DirectiveDefinition {
    std::string name;
    std::string description;
    std::vector<DirectiveLocation> locations;
    std::vector<InputValueDefinition> arguments;
    bool repeatable = false;

    const InputValueDefinition* argument(std::string_view argName) const;
    bool allowedAt(DirectiveLocation location) const;
};

// ═══════════════════════════════════════════
//  Fluent builders
//  describe()/cacheControl()/deprecated() apply to the most recently
//  added field (or enum value), or to the type when none was added yet.
// ═══════════════════════════════════════════

template <typename Derived>
class FieldsBuilder {
public:
    explicit FieldsBuilder(TypeDefinition& type) : type_(type) {}

    Derived& field(std::string name, std::string_view type, Resolver resolve = {});
    Derived& fieldAsync(std::string name, std::string_view type, AsyncResolver resolve);
    Derived& arg(std::string name, std::string_view type,
                 std::optional<Json> defaultValue = std::nullopt, std::string description = "");
    Derived& describe(std::string description);
    Derived& deprecated(std::string reason = "No longer supported");
    Derived& cacheControl(CacheControl hint);

    TypeDefinition& definition() { return type_; }

protected:
    TypeDefinition& type_;

    std::vector<FieldDefinition>& fieldList();
    FieldDefinition* lastField();
    Derived& self() { return static_cast<Derived&>(*this); }
};

class ObjectBuilder : public FieldsBuilder<ObjectBuilder> {
public:
    using FieldsBuilder::FieldsBuilder;
    ObjectBuilder& implements(std::string interfaceName);
};

class InterfaceBuilder : public FieldsBuilder<InterfaceBuilder> {
public:
    using FieldsBuilder::FieldsBuilder;
    InterfaceBuilder& resolveType(TypeResolver resolver);
};

class UnionBuilder {
public:
    explicit UnionBuilder(TypeDefinition& type) : type_(type) {}
    UnionBuilder& member(std::string objectName);
    UnionBuilder& resolveType(TypeResolver resolver);
    UnionBuilder& describe(std::string description);
    TypeDefinition& definition() { return type_; }
private:
    TypeDefinition& type_;
};

class EnumBuilder {
public:
    explicit EnumBuilder(TypeDefinition& type) : type_(type) {}
    EnumBuilder& value(std::string name, std::string description = "");
    EnumBuilder& deprecated(std::string reason = "No longer supported");
    EnumBuilder& describe(std::string description);
    TypeDefinition& definition() { return type_; }
private:
    TypeDefinition& type_;
};

class InputObjectBuilder {
public:
    explicit InputObjectBuilder(TypeDefinition& type) : type_(type) {}
    InputObjectBuilder& field(std::string name, std::string_view type,
                              std::optional<Json> defaultValue = std::nullopt,
                              std::string description = "");
    InputObjectBuilder& describe(std::string description);
    TypeDefinition& definition() { return type_; }
private:
    TypeDefinition& type_;
};

// ═══════════════════════════════════════════
//  class Schema
// ═══════════════════════════════════════════
class Schema {
public:
    Schema();
    ~Schema();

    Schema(const Schema&) = delete;
    Schema& operator=(const Schema&) = delete;

    // ── Construction (before finalize) ──
    ObjectBuilder object(std::string name);
    InterfaceBuilder interfaceType(std::string name);
    UnionBuilder unionType(std::string name, std::vector<std::string> members = {});
    EnumBuilder enumType(std::string name, std::vector<std::string> values = {});
    InputObjectBuilder inputObject(std::string name);
    TypeDefinition& scalar(std::string name, ScalarType impl, std::string description = "");
    Schema& directive(DirectiveDefinition definition);

    Schema& setQueryType(std::string name);
    Schema& setMutationType(std::string name);
    Schema& setSubscriptionType(std::string name);
    Schema& setDescription(std::string description);

    // Checks every reference and contract, installs introspection types.
    // Throws SchemaError listing every problem found.
    void finalize();
    bool finalized() const { return finalized_; }

    // ── Lookups ──
    const TypeDefinition* type(std::string_view name) const;
    const std::vector<const TypeDefinition*>& types() const { return order_; }

    const TypeDefinition* queryType() const;
    const TypeDefinition* mutationType() const;
    const TypeDefinition* subscriptionType() const;
    const std::string& description() const { return description_; }

    const DirectiveDefinition* directive(std::string_view name) const;
    const std::vector<DirectiveDefinition>& directives() const { return directives_; }

    // Declared field or meta field (__typename, and __schema/__type on the query root)
    const FieldDefinition* fieldDefinition(const TypeDefinition& parent, std::string_view name) const;

    // ── Type relations ──
    std::vector<const TypeDefinition*> possibleTypes(const TypeDefinition& abstractType) const;
    bool isPossibleType(const TypeDefinition& abstractType, const TypeDefinition& objectType) const;
    bool doTypesOverlap(const TypeDefinition& a, const TypeDefinition& b) const;
    // Covariant check used for interface fields and variable positions
    bool isSubTypeOf(const TypeRef& maybeSubType, const TypeRef& superType) const;
    bool isInputType(const TypeRef& type) const;
    bool isOutputType(const TypeRef& type) const;

private:
    std::unordered_map<std::string, std::unique_ptr<TypeDefinition>> types_;
    std::vector<const TypeDefinition*> order_;
    std::vector<DirectiveDefinition> directives_;
    std::string queryType_;
    std::string mutationType_;
    std::string subscriptionType_;
    std::string description_;
    bool finalized_ = false;

    FieldDefinition typenameField_;
    FieldDefinition schemaField_;
    FieldDefinition typeField_;

    TypeDefinition& addType(std::string name, TypeKind kind);
    void checkTypeRefs(std::vector<std::string>& problems) const;
    void checkImplementations(std::vector<std::string>& problems) const;
    void requireMutable() const;

    friend void installIntrospection(Schema& schema);
};

} // namespace gqlpp
