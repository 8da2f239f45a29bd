#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/ast.h — Executable document syntax tree
// ═══════════════════════════════════════════════════════════════════
//
//  Produced by the Parser, read (never modified) by the Validator and
//  the Executor. Every node keeps the 1-based location of its first
//  token. Equality compares structure only; locations are ignored.
//
// ═══════════════════════════════════════════════════════════════════

#include "errors.h"
#include "type_ref.h"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace gqlpp::ast {

using gqlpp::Location;

// ═══════════════════════════════════════════
//  Literal values (before coercion)
// ═══════════════════════════════════════════
struct ObjectField;

struct Value {
    enum class Kind { Variable, Int, Float, String, Boolean, Null, Enum, List, Object };

    Kind kind = Kind::Null;
    // Variable/Enum: the name; Int/Float: source text; String: decoded contents
    std::string text;
    bool boolean = false;
    bool block = false;                 // String written as a block string
    std::vector<Value> list;
    std::vector<ObjectField> fields;
    Location loc;

    static Value makeVariable(std::string name, Location loc = {});
    static Value makeInt(std::string text, Location loc = {});
    static Value makeFloat(std::string text, Location loc = {});
    static Value makeString(std::string text, Location loc = {});
    static Value makeBoolean(bool value, Location loc = {});
    static Value makeNull(Location loc = {});
    static Value makeEnum(std::string name, Location loc = {});
    static Value makeList(std::vector<Value> items, Location loc = {});
    static Value makeObject(std::vector<ObjectField> fields, Location loc = {});

    bool isVariable() const { return kind == Kind::Variable; }
    bool isNull() const { return kind == Kind::Null; }

    // Object member by name, nullptr when absent
    const Value* field(const std::string& name) const;
};

struct ObjectField {
    std::string name;
    Value value;
    Location loc;
};

bool operator==(const Value& a, const Value& b);
inline bool operator!=(const Value& a, const Value& b) { return !(a == b); }
bool operator==(const ObjectField& a, const ObjectField& b);

// ═══════════════════════════════════════════
//  Arguments and directives
// ═══════════════════════════════════════════
struct Argument {
    std::string name;
    Value value;
    Location loc;
};

struct Directive {
    std::string name;
    std::vector<Argument> arguments;
    Location loc;

    const Argument* argument(const std::string& argName) const;
};

bool operator==(const Argument& a, const Argument& b);
bool operator==(const Directive& a, const Directive& b);

// ═══════════════════════════════════════════
//  Selections
// ═══════════════════════════════════════════
struct Selection;

struct SelectionSet {
    std::vector<Selection> selections;
    Location loc;

    bool empty() const;
    std::size_t size() const;
};

struct Field {
    std::string alias;                  // empty when not aliased
    std::string name;
    std::vector<Argument> arguments;
    std::vector<Directive> directives;
    SelectionSet selectionSet;          // empty for leaf selections
    Location loc;

    const std::string& responseKey() const { return alias.empty() ? name : alias; }
    const Argument* argument(const std::string& argName) const;
};

struct FragmentSpread {
    std::string name;
    std::vector<Directive> directives;
    Location loc;
};

struct InlineFragment {
    std::string typeCondition;          // empty when omitted
    std::vector<Directive> directives;
    SelectionSet selectionSet;
    Location loc;
};

struct Selection {
    std::variant<Field, FragmentSpread, InlineFragment> node;

    Selection(Field f) : node(std::move(f)) {}
    Selection(FragmentSpread s) : node(std::move(s)) {}
    Selection(InlineFragment f) : node(std::move(f)) {}

    const Field* field() const { return std::get_if<Field>(&node); }
    const FragmentSpread* fragmentSpread() const { return std::get_if<FragmentSpread>(&node); }
    const InlineFragment* inlineFragment() const { return std::get_if<InlineFragment>(&node); }
};

bool operator==(const SelectionSet& a, const SelectionSet& b);
bool operator==(const Field& a, const Field& b);
bool operator==(const FragmentSpread& a, const FragmentSpread& b);
bool operator==(const InlineFragment& a, const InlineFragment& b);
bool operator==(const Selection& a, const Selection& b);

// ═══════════════════════════════════════════
//  Definitions
// ═══════════════════════════════════════════
enum class OperationType { Query, Mutation, Subscription };

const char* toString(OperationType type);

struct VariableDefinition {
    std::string name;
    TypeRef type;
    std::optional<Value> defaultValue;
    std::vector<Directive> directives;
    Location loc;
};

struct OperationDefinition {
    OperationType operation = OperationType::Query;
    std::string name;                   // empty for anonymous operations
    std::vector<VariableDefinition> variables;
    std::vector<Directive> directives;
    SelectionSet selectionSet;
    Location loc;
};

struct FragmentDefinition {
    std::string name;
    std::string typeCondition;
    std::vector<Directive> directives;
    SelectionSet selectionSet;
    Location loc;
};

bool operator==(const VariableDefinition& a, const VariableDefinition& b);
bool operator==(const OperationDefinition& a, const OperationDefinition& b);
bool operator==(const FragmentDefinition& a, const FragmentDefinition& b);

struct Document {
    std::vector<OperationDefinition> operations;
    std::vector<FragmentDefinition> fragments;

    // First fragment with this name, nullptr when absent
    const FragmentDefinition* fragment(const std::string& name) const;

    // Operation selection: by name, or the only operation when name is empty.
    // Throws GraphQLError when no single operation matches.
    const OperationDefinition& operation(const std::string& name = "") const;
};

bool operator==(const Document& a, const Document& b);
inline bool operator!=(const Document& a, const Document& b) { return !(a == b); }

} // namespace gqlpp::ast
