// ═══════════════════════════════════════════════════════════════════
//  src/schema.cpp — Schema construction, checking and type relations
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/schema.h"
#include "gqlpp/errors.h"
#include "gqlpp/introspection.h"
#include "gqlpp/scalars.h"

#include <algorithm>
#include <sstream>

namespace gqlpp {

const char* toString(TypeKind kind) {
    switch (kind) {
        case TypeKind::Scalar:      return "SCALAR";
        case TypeKind::Object:      return "OBJECT";
        case TypeKind::Interface:   return "INTERFACE";
        case TypeKind::Union:       return "UNION";
        case TypeKind::Enum:        return "ENUM";
        case TypeKind::InputObject: return "INPUT_OBJECT";
    }
    return "SCALAR";
}

const char* toString(DirectiveLocation location) {
    switch (location) {
        case DirectiveLocation::Query:                return "QUERY";
        case DirectiveLocation::Mutation:             return "MUTATION";
        case DirectiveLocation::Subscription:         return "SUBSCRIPTION";
        case DirectiveLocation::Field:                return "FIELD";
        case DirectiveLocation::FragmentDefinition:   return "FRAGMENT_DEFINITION";
        case DirectiveLocation::FragmentSpread:       return "FRAGMENT_SPREAD";
        case DirectiveLocation::InlineFragment:       return "INLINE_FRAGMENT";
        case DirectiveLocation::VariableDefinition:   return "VARIABLE_DEFINITION";
        case DirectiveLocation::Schema:               return "SCHEMA";
        case DirectiveLocation::Scalar:               return "SCALAR";
        case DirectiveLocation::Object:               return "OBJECT";
        case DirectiveLocation::FieldDefinition:      return "FIELD_DEFINITION";
        case DirectiveLocation::ArgumentDefinition:   return "ARGUMENT_DEFINITION";
        case DirectiveLocation::Interface:            return "INTERFACE";
        case DirectiveLocation::Union:                return "UNION";
        case DirectiveLocation::Enum:                 return "ENUM";
        case DirectiveLocation::EnumValue:            return "ENUM_VALUE";
        case DirectiveLocation::InputObject:          return "INPUT_OBJECT";
        case DirectiveLocation::InputFieldDefinition: return "INPUT_FIELD_DEFINITION";
    }
    return "FIELD";
}

// ═══════════════════════════════════════════
//  Definition lookups
// ═══════════════════════════════════════════

const InputValueDefinition* FieldDefinition::argument(std::string_view argName) const {
    for (auto& arg : arguments) {
        if (arg.name == argName) return &arg;
    }
    return nullptr;
}

const InputValueDefinition* DirectiveDefinition::argument(std::string_view argName) const {
    for (auto& arg : arguments) {
        if (arg.name == argName) return &arg;
    }
    return nullptr;
}

bool DirectiveDefinition::allowedAt(DirectiveLocation location) const {
    return std::find(locations.begin(), locations.end(), location) != locations.end();
}

const std::vector<FieldDefinition>* TypeDefinition::fields() const {
    if (auto* o = object()) return &o->fields;
    if (auto* i = interfaceType()) return &i->fields;
    return nullptr;
}

const FieldDefinition* TypeDefinition::field(std::string_view fieldName) const {
    auto* list = fields();
    if (!list) return nullptr;
    for (auto& f : *list) {
        if (f.name == fieldName) return &f;
    }
    return nullptr;
}

const InputValueDefinition* TypeDefinition::inputField(std::string_view fieldName) const {
    auto* input = inputObject();
    if (!input) return nullptr;
    for (auto& f : input->fields) {
        if (f.name == fieldName) return &f;
    }
    return nullptr;
}

const EnumValueDefinition* TypeDefinition::enumValue(std::string_view valueName) const {
    auto* e = enumType();
    if (!e) return nullptr;
    for (auto& v : e->values) {
        if (v.name == valueName) return &v;
    }
    return nullptr;
}

// ═══════════════════════════════════════════
//  Builders
// ═══════════════════════════════════════════

template <typename Derived>
std::vector<FieldDefinition>& FieldsBuilder<Derived>::fieldList() {
    if (auto* o = std::get_if<ObjectType>(&type_.data)) return o->fields;
    return std::get<InterfaceType>(type_.data).fields;
}

template <typename Derived>
FieldDefinition* FieldsBuilder<Derived>::lastField() {
    auto& list = fieldList();
    return list.empty() ? nullptr : &list.back();
}

template <typename Derived>
Derived& FieldsBuilder<Derived>::field(std::string name, std::string_view type, Resolver resolve) {
    FieldDefinition def;
    def.name = std::move(name);
    def.type = TypeRef::parse(type);
    def.resolve = std::move(resolve);
    fieldList().push_back(std::move(def));
    return self();
}

template <typename Derived>
Derived& FieldsBuilder<Derived>::fieldAsync(std::string name, std::string_view type, AsyncResolver resolve) {
    FieldDefinition def;
    def.name = std::move(name);
    def.type = TypeRef::parse(type);
    def.resolveAsync = std::move(resolve);
    fieldList().push_back(std::move(def));
    return self();
}

template <typename Derived>
Derived& FieldsBuilder<Derived>::arg(std::string name, std::string_view type,
                                     std::optional<Json> defaultValue, std::string description) {
    auto* f = lastField();
    if (!f) throw SchemaError("arg(\"" + name + "\") on " + type_.name + " requires a field");
    f->arguments.push_back(InputValueDefinition{
        std::move(name), std::move(description), TypeRef::parse(type), std::move(defaultValue)});
    return self();
}

template <typename Derived>
Derived& FieldsBuilder<Derived>::describe(std::string description) {
    if (auto* f = lastField()) f->description = std::move(description);
    else type_.description = std::move(description);
    return self();
}

template <typename Derived>
Derived& FieldsBuilder<Derived>::deprecated(std::string reason) {
    auto* f = lastField();
    if (!f) throw SchemaError("deprecated() on " + type_.name + " requires a field");
    f->deprecationReason = std::move(reason);
    return self();
}

template <typename Derived>
Derived& FieldsBuilder<Derived>::cacheControl(CacheControl hint) {
    if (auto* f = lastField()) f->cacheControl = hint;
    else type_.cacheControl = hint;
    return self();
}

template class FieldsBuilder<ObjectBuilder>;
template class FieldsBuilder<InterfaceBuilder>;

ObjectBuilder& ObjectBuilder::implements(std::string interfaceName) {
    std::get<ObjectType>(type_.data).interfaces.push_back(std::move(interfaceName));
    return *this;
}

InterfaceBuilder& InterfaceBuilder::resolveType(TypeResolver resolver) {
    std::get<InterfaceType>(type_.data).resolveType = std::move(resolver);
    return *this;
}

UnionBuilder& UnionBuilder::member(std::string objectName) {
    std::get<UnionType>(type_.data).possibleTypes.push_back(std::move(objectName));
    return *this;
}

UnionBuilder& UnionBuilder::resolveType(TypeResolver resolver) {
    std::get<UnionType>(type_.data).resolveType = std::move(resolver);
    return *this;
}

UnionBuilder& UnionBuilder::describe(std::string description) {
    type_.description = std::move(description);
    return *this;
}

EnumBuilder& EnumBuilder::value(std::string name, std::string description) {
    std::get<EnumType>(type_.data).values.push_back(
        EnumValueDefinition{std::move(name), std::move(description), std::nullopt});
    return *this;
}

EnumBuilder& EnumBuilder::deprecated(std::string reason) {
    auto& values = std::get<EnumType>(type_.data).values;
    if (values.empty()) throw SchemaError("deprecated() on " + type_.name + " requires a value");
    values.back().deprecationReason = std::move(reason);
    return *this;
}

EnumBuilder& EnumBuilder::describe(std::string description) {
    auto& values = std::get<EnumType>(type_.data).values;
    if (values.empty()) type_.description = std::move(description);
    else values.back().description = std::move(description);
    return *this;
}

InputObjectBuilder& InputObjectBuilder::field(std::string name, std::string_view type,
                                              std::optional<Json> defaultValue,
                                              std::string description) {
    std::get<InputObjectType>(type_.data).fields.push_back(InputValueDefinition{
        std::move(name), std::move(description), TypeRef::parse(type), std::move(defaultValue)});
    return *this;
}

InputObjectBuilder& InputObjectBuilder::describe(std::string description) {
    type_.description = std::move(description);
    return *this;
}

// ═══════════════════════════════════════════
//  Schema construction
// ═══════════════════════════════════════════

Schema::Schema() {
    scalars::install(*this);

    auto ifArg = [](const char* description) {
        return InputValueDefinition{"if", description, TypeRef::nonNull(TypeRef::named("Boolean")), std::nullopt};
    };
    std::vector<DirectiveLocation> executable = {
        DirectiveLocation::Field, DirectiveLocation::FragmentSpread, DirectiveLocation::InlineFragment};

    directives_.push_back(DirectiveDefinition{
        "include",
        "Directs the executor to include this field or fragment only when the `if` argument is true.",
        executable, {ifArg("Included when true.")}, false});
    directives_.push_back(DirectiveDefinition{
        "skip",
        "Directs the executor to skip this field or fragment when the `if` argument is true.",
        executable, {ifArg("Skipped when true.")}, false});
    directives_.push_back(DirectiveDefinition{
        "deprecated",
        "Marks an element of a GraphQL schema as no longer supported.",
        {DirectiveLocation::FieldDefinition, DirectiveLocation::EnumValue},
        {InputValueDefinition{"reason", "Explains why this element was deprecated.",
                              TypeRef::named("String"), Json("No longer supported")}},
        false});
}

Schema::~Schema() = default;

void Schema::requireMutable() const {
    if (finalized_) throw SchemaError("Schema is finalized and can no longer be modified");
}

TypeDefinition& Schema::addType(std::string name, TypeKind kind) {
    requireMutable();
    if (name.empty()) throw SchemaError("Type name must not be empty");
    if (types_.count(name)) throw SchemaError("Type \"" + name + "\" is defined more than once");

    auto def = std::make_unique<TypeDefinition>();
    def->kind = kind;
    def->name = name;
    switch (kind) {
        case TypeKind::Scalar:      def->data = ScalarType{}; break;
        case TypeKind::Object:      def->data = ObjectType{}; break;
        case TypeKind::Interface:   def->data = InterfaceType{}; break;
        case TypeKind::Union:       def->data = UnionType{}; break;
        case TypeKind::Enum:        def->data = EnumType{}; break;
        case TypeKind::InputObject: def->data = InputObjectType{}; break;
    }

    auto& ref = *def;
    order_.push_back(def.get());
    types_.emplace(std::move(name), std::move(def));
    return ref;
}

ObjectBuilder Schema::object(std::string name) {
    return ObjectBuilder(addType(std::move(name), TypeKind::Object));
}

InterfaceBuilder Schema::interfaceType(std::string name) {
    return InterfaceBuilder(addType(std::move(name), TypeKind::Interface));
}

UnionBuilder Schema::unionType(std::string name, std::vector<std::string> members) {
    auto& def = addType(std::move(name), TypeKind::Union);
    std::get<UnionType>(def.data).possibleTypes = std::move(members);
    return UnionBuilder(def);
}

EnumBuilder Schema::enumType(std::string name, std::vector<std::string> values) {
    auto& def = addType(std::move(name), TypeKind::Enum);
    EnumBuilder builder(def);
    for (auto& v : values) builder.value(std::move(v));
    return builder;
}

InputObjectBuilder Schema::inputObject(std::string name) {
    return InputObjectBuilder(addType(std::move(name), TypeKind::InputObject));
}

TypeDefinition& Schema::scalar(std::string name, ScalarType impl, std::string description) {
    if (!impl.serialize || !impl.parseValue || !impl.parseLiteral) {
        throw SchemaError("Scalar \"" + name + "\" needs serialize, parseValue and parseLiteral");
    }
    auto& def = addType(std::move(name), TypeKind::Scalar);
    def.description = std::move(description);
    def.data = std::move(impl);
    return def;
}

Schema& Schema::directive(DirectiveDefinition definition) {
    requireMutable();
    if (directive(definition.name)) {
        throw SchemaError("Directive \"@" + definition.name + "\" is defined more than once");
    }
    directives_.push_back(std::move(definition));
    return *this;
}

Schema& Schema::setQueryType(std::string name) {
    requireMutable();
    queryType_ = std::move(name);
    return *this;
}

Schema& Schema::setMutationType(std::string name) {
    requireMutable();
    mutationType_ = std::move(name);
    return *this;
}

Schema& Schema::setSubscriptionType(std::string name) {
    requireMutable();
    subscriptionType_ = std::move(name);
    return *this;
}

Schema& Schema::setDescription(std::string description) {
    requireMutable();
    description_ = std::move(description);
    return *this;
}

// ═══════════════════════════════════════════
//  finalize — collect every contract violation
// ═══════════════════════════════════════════

void Schema::finalize() {
    requireMutable();
    installIntrospection(*this);

    std::vector<std::string> problems;

    auto checkRoot = [&](const std::string& name, const char* which, bool required) {
        if (name.empty()) {
            if (required) problems.push_back(std::string(which) + " root type must be provided");
            return;
        }
        auto* t = type(name);
        if (!t) {
            problems.push_back(std::string(which) + " root type \"" + name + "\" is not defined");
        } else if (t->kind != TypeKind::Object) {
            problems.push_back(std::string(which) + " root type \"" + name + "\" must be an Object type");
        }
    };
    checkRoot(queryType_, "Query", true);
    checkRoot(mutationType_, "Mutation", false);
    checkRoot(subscriptionType_, "Subscription", false);

    checkTypeRefs(problems);
    checkImplementations(problems);

    if (!problems.empty()) {
        std::ostringstream oss;
        oss << "Invalid schema:";
        for (auto& p : problems) oss << "\n  " << p;
        throw SchemaError(oss.str());
    }
    finalized_ = true;
}

void Schema::checkTypeRefs(std::vector<std::string>& problems) const {
    auto checkInput = [&](const InputValueDefinition& arg, const std::string& where) {
        auto* t = type(arg.type.namedType());
        if (!t) {
            problems.push_back(where + " refers to unknown type \"" + arg.type.namedType() + "\"");
        } else if (!t->isInputType()) {
            problems.push_back(where + " must be an input type, got \"" + arg.type.toString() + "\"");
        }
    };

    for (auto* t : order_) {
        if (auto* list = t->fields()) {
            if (list->empty()) problems.push_back(t->name + " must define one or more fields");
            for (auto& f : *list) {
                std::string where = t->name + "." + f.name;
                auto* ft = type(f.type.namedType());
                if (!ft) {
                    problems.push_back(where + " refers to unknown type \"" + f.type.namedType() + "\"");
                } else if (!ft->isOutputType()) {
                    problems.push_back(where + " must be an output type, got \"" + f.type.toString() + "\"");
                }
                for (auto& arg : f.arguments) {
                    checkInput(arg, where + "(" + arg.name + ":)");
                }
            }
        }
        if (auto* input = t->inputObject()) {
            if (input->fields.empty()) problems.push_back(t->name + " must define one or more input fields");
            for (auto& f : input->fields) checkInput(f, t->name + "." + f.name);
        }
        if (auto* u = t->unionType()) {
            if (u->possibleTypes.empty()) problems.push_back("Union " + t->name + " must define one or more member types");
            for (auto& member : u->possibleTypes) {
                auto* m = type(member);
                if (!m) problems.push_back("Union " + t->name + " refers to unknown type \"" + member + "\"");
                else if (m->kind != TypeKind::Object) {
                    problems.push_back("Union " + t->name + " member \"" + member + "\" must be an Object type");
                }
            }
        }
        if (auto* e = t->enumType()) {
            if (e->values.empty()) problems.push_back("Enum " + t->name + " must define one or more values");
        }
    }

    for (auto& d : directives_) {
        for (auto& arg : d.arguments) checkInput(arg, "@" + d.name + "(" + arg.name + ":)");
    }
}

void Schema::checkImplementations(std::vector<std::string>& problems) const {
    for (auto* t : order_) {
        auto* o = t->object();
        if (!o) continue;
        for (auto& ifaceName : o->interfaces) {
            auto* iface = type(ifaceName);
            if (!iface || iface->kind != TypeKind::Interface) {
                problems.push_back(t->name + " implements \"" + ifaceName + "\" which is not an Interface type");
                continue;
            }
            for (auto& ifield : *iface->fields()) {
                auto* ofield = t->field(ifield.name);
                std::string where = t->name + "." + ifield.name;
                if (!ofield) {
                    problems.push_back("Interface field " + ifaceName + "." + ifield.name +
                                       " expected but " + t->name + " does not provide it");
                    continue;
                }
                if (!isSubTypeOf(ofield->type, ifield.type)) {
                    problems.push_back(where + " has type " + ofield->type.toString() +
                                       " which is not compatible with " + ifaceName + "." +
                                       ifield.name + ": " + ifield.type.toString());
                }
                for (auto& iarg : ifield.arguments) {
                    auto* oarg = ofield->argument(iarg.name);
                    if (!oarg || oarg->type != iarg.type) {
                        problems.push_back(where + " must accept argument \"" + iarg.name + ": " +
                                           iarg.type.toString() + "\" required by " + ifaceName);
                    }
                }
            }
        }
    }
}

// ═══════════════════════════════════════════
//  Lookups
// ═══════════════════════════════════════════

const TypeDefinition* Schema::type(std::string_view name) const {
    auto it = types_.find(std::string(name));
    return it == types_.end() ? nullptr : it->second.get();
}

const TypeDefinition* Schema::queryType() const {
    return type(queryType_);
}

const TypeDefinition* Schema::mutationType() const {
    return mutationType_.empty() ? nullptr : type(mutationType_);
}

const TypeDefinition* Schema::subscriptionType() const {
    return subscriptionType_.empty() ? nullptr : type(subscriptionType_);
}

const DirectiveDefinition* Schema::directive(std::string_view name) const {
    for (auto& d : directives_) {
        if (d.name == name) return &d;
    }
    return nullptr;
}

const FieldDefinition* Schema::fieldDefinition(const TypeDefinition& parent, std::string_view name) const {
    if (name == "__typename" && parent.isComposite()) return &typenameField_;
    if (&parent == queryType()) {
        if (name == "__schema") return &schemaField_;
        if (name == "__type") return &typeField_;
    }
    return parent.field(name);
}

// ═══════════════════════════════════════════
//  Type relations
// ═══════════════════════════════════════════

std::vector<const TypeDefinition*> Schema::possibleTypes(const TypeDefinition& abstractType) const {
    std::vector<const TypeDefinition*> result;
    if (auto* u = abstractType.unionType()) {
        for (auto& member : u->possibleTypes) {
            if (auto* t = type(member)) result.push_back(t);
        }
    } else if (abstractType.kind == TypeKind::Interface) {
        for (auto* t : order_) {
            auto* o = t->object();
            if (!o) continue;
            if (std::find(o->interfaces.begin(), o->interfaces.end(), abstractType.name) != o->interfaces.end()) {
                result.push_back(t);
            }
        }
    } else if (abstractType.kind == TypeKind::Object) {
        result.push_back(&abstractType);
    }
    return result;
}

bool Schema::isPossibleType(const TypeDefinition& abstractType, const TypeDefinition& objectType) const {
    if (&abstractType == &objectType) return true;
    if (auto* u = abstractType.unionType()) {
        return std::find(u->possibleTypes.begin(), u->possibleTypes.end(), objectType.name) != u->possibleTypes.end();
    }
    if (abstractType.kind == TypeKind::Interface) {
        if (auto* o = objectType.object()) {
            return std::find(o->interfaces.begin(), o->interfaces.end(), abstractType.name) != o->interfaces.end();
        }
    }
    return false;
}

bool Schema::doTypesOverlap(const TypeDefinition& a, const TypeDefinition& b) const {
    if (&a == &b) return true;
    if (a.isAbstract()) {
        if (b.isAbstract()) {
            for (auto* t : possibleTypes(a)) {
                if (isPossibleType(b, *t)) return true;
            }
            return false;
        }
        return isPossibleType(a, b);
    }
    if (b.isAbstract()) return isPossibleType(b, a);
    return false;
}

bool Schema::isSubTypeOf(const TypeRef& maybeSubType, const TypeRef& superType) const {
    if (maybeSubType == superType) return true;

    if (superType.isNonNull()) {
        if (maybeSubType.isNonNull()) return isSubTypeOf(maybeSubType.ofType(), superType.ofType());
        return false;
    }
    if (maybeSubType.isNonNull()) return isSubTypeOf(maybeSubType.ofType(), superType);

    if (superType.isList()) {
        if (maybeSubType.isList()) return isSubTypeOf(maybeSubType.ofType(), superType.ofType());
        return false;
    }
    if (maybeSubType.isList()) return false;

    auto* sub = type(maybeSubType.namedType());
    auto* super = type(superType.namedType());
    return sub && super && super->isAbstract() && sub->kind == TypeKind::Object &&
           isPossibleType(*super, *sub);
}

bool Schema::isInputType(const TypeRef& ref) const {
    auto* t = type(ref.namedType());
    return t && t->isInputType();
}

bool Schema::isOutputType(const TypeRef& ref) const {
    auto* t = type(ref.namedType());
    return t && t->isOutputType();
}

} // namespace gqlpp
