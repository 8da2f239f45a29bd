// ═══════════════════════════════════════════════════════════════════
//  src/ast.cpp — AST helpers and structural equality
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/ast.h"

namespace gqlpp::ast {

// ═══════════════════════════════════════════
//  Value factories
// ═══════════════════════════════════════════
namespace {

Value makeScalar(Value::Kind kind, std::string text, Location loc) {
    Value v;
    v.kind = kind;
    v.text = std::move(text);
    v.loc = loc;
    return v;
}

template <typename T>
bool sameRange(const std::vector<T>& a, const std::vector<T>& b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (!(a[i] == b[i])) return false;
    }
    return true;
}

} // namespace

Value Value::makeVariable(std::string name, Location loc) {
    return makeScalar(Kind::Variable, std::move(name), loc);
}

Value Value::makeInt(std::string text, Location loc) {
    return makeScalar(Kind::Int, std::move(text), loc);
}

Value Value::makeFloat(std::string text, Location loc) {
    return makeScalar(Kind::Float, std::move(text), loc);
}

Value Value::makeString(std::string text, Location loc) {
    return makeScalar(Kind::String, std::move(text), loc);
}

Value Value::makeBoolean(bool value, Location loc) {
    Value v;
    v.kind = Kind::Boolean;
    v.boolean = value;
    v.loc = loc;
    return v;
}

Value Value::makeNull(Location loc) {
    Value v;
    v.kind = Kind::Null;
    v.loc = loc;
    return v;
}

Value Value::makeEnum(std::string name, Location loc) {
    return makeScalar(Kind::Enum, std::move(name), loc);
}

Value Value::makeList(std::vector<Value> items, Location loc) {
    Value v;
    v.kind = Kind::List;
    v.list = std::move(items);
    v.loc = loc;
    return v;
}

Value Value::makeObject(std::vector<ObjectField> fields, Location loc) {
    Value v;
    v.kind = Kind::Object;
    v.fields = std::move(fields);
    v.loc = loc;
    return v;
}

const Value* Value::field(const std::string& name) const {
    for (auto& f : fields) {
        if (f.name == name) return &f.value;
    }
    return nullptr;
}

const Argument* Directive::argument(const std::string& argName) const {
    for (auto& arg : arguments) {
        if (arg.name == argName) return &arg;
    }
    return nullptr;
}

const Argument* Field::argument(const std::string& argName) const {
    for (auto& arg : arguments) {
        if (arg.name == argName) return &arg;
    }
    return nullptr;
}

bool SelectionSet::empty() const { return selections.empty(); }
std::size_t SelectionSet::size() const { return selections.size(); }

const char* toString(OperationType type) {
    switch (type) {
        case OperationType::Query:        return "query";
        case OperationType::Mutation:     return "mutation";
        case OperationType::Subscription: return "subscription";
    }
    return "query";
}

// ═══════════════════════════════════════════
//  Document lookups
// ═══════════════════════════════════════════
const FragmentDefinition* Document::fragment(const std::string& name) const {
    for (auto& fragment : fragments) {
        if (fragment.name == name) return &fragment;
    }
    return nullptr;
}

const OperationDefinition& Document::operation(const std::string& name) const {
    if (name.empty()) {
        if (operations.size() == 1) return operations.front();
        if (operations.empty()) throw GraphQLError("Must provide an operation.");
        throw GraphQLError("Must provide operation name if query contains multiple operations.");
    }
    for (auto& op : operations) {
        if (op.name == name) return op;
    }
    throw GraphQLError("Unknown operation named \"" + name + "\".");
}

// ═══════════════════════════════════════════
//  Structural equality (locations ignored)
// ═══════════════════════════════════════════
bool operator==(const Value& a, const Value& b) {
    if (a.kind != b.kind) return false;
    switch (a.kind) {
        case Value::Kind::Boolean: return a.boolean == b.boolean;
        case Value::Kind::Null:    return true;
        case Value::Kind::List:    return sameRange(a.list, b.list);
        case Value::Kind::Object:  return sameRange(a.fields, b.fields);
        default:                   return a.text == b.text;
    }
}

bool operator==(const ObjectField& a, const ObjectField& b) {
    return a.name == b.name && a.value == b.value;
}

bool operator==(const Argument& a, const Argument& b) {
    return a.name == b.name && a.value == b.value;
}

bool operator==(const Directive& a, const Directive& b) {
    return a.name == b.name && sameRange(a.arguments, b.arguments);
}

bool operator==(const SelectionSet& a, const SelectionSet& b) {
    return sameRange(a.selections, b.selections);
}

bool operator==(const Field& a, const Field& b) {
    return a.alias == b.alias && a.name == b.name &&
           sameRange(a.arguments, b.arguments) &&
           sameRange(a.directives, b.directives) &&
           a.selectionSet == b.selectionSet;
}

bool operator==(const FragmentSpread& a, const FragmentSpread& b) {
    return a.name == b.name && sameRange(a.directives, b.directives);
}

bool operator==(const InlineFragment& a, const InlineFragment& b) {
    return a.typeCondition == b.typeCondition &&
           sameRange(a.directives, b.directives) &&
           a.selectionSet == b.selectionSet;
}

bool operator==(const Selection& a, const Selection& b) {
    return a.node == b.node;
}

bool operator==(const VariableDefinition& a, const VariableDefinition& b) {
    return a.name == b.name && a.type == b.type &&
           a.defaultValue == b.defaultValue &&
           sameRange(a.directives, b.directives);
}

bool operator==(const OperationDefinition& a, const OperationDefinition& b) {
    return a.operation == b.operation && a.name == b.name &&
           sameRange(a.variables, b.variables) &&
           sameRange(a.directives, b.directives) &&
           a.selectionSet == b.selectionSet;
}

bool operator==(const FragmentDefinition& a, const FragmentDefinition& b) {
    return a.name == b.name && a.typeCondition == b.typeCondition &&
           sameRange(a.directives, b.directives) &&
           a.selectionSet == b.selectionSet;
}

bool operator==(const Document& a, const Document& b) {
    return sameRange(a.operations, b.operations) && sameRange(a.fragments, b.fragments);
}

} // namespace gqlpp::ast
