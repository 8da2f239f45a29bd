// ═══════════════════════════════════════════════════════════════════
//  src/validator.cpp — Type-aware walker and the validation rules
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/validator.h"
#include "gqlpp/printer.h"

#include <algorithm>
#include <iterator>
#include <set>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace gqlpp {

// ═══════════════════════════════════════════
//  ValidationContext
// ═══════════════════════════════════════════

ValidationContext::ValidationContext(const Schema& schema, const ast::Document& document)
    : schema_(schema), document_(document) {}

void ValidationContext::report(std::string message, std::vector<Location> locations) {
    errors_.push_back(ValidationError{rule_, std::move(message), std::move(locations)});
}

const TypeDefinition* ValidationContext::parentType() const {
    return parentTypes_.empty() ? nullptr : parentTypes_.back();
}

const FieldDefinition* ValidationContext::fieldDefinition() const {
    return fields_.empty() ? nullptr : fields_.back();
}

const ast::Directive* ValidationContext::directive() const { return directive_; }
const DirectiveDefinition* ValidationContext::directiveDefinition() const { return directiveDefinition_; }
const InputValueDefinition* ValidationContext::argumentDefinition() const { return argument_; }

const TypeRef* ValidationContext::inputType() const {
    return inputTypes_.empty() ? nullptr : inputTypes_.back();
}

std::vector<const ast::FragmentSpread*>
ValidationContext::fragmentSpreads(const ast::SelectionSet& selectionSet) const {
    std::vector<const ast::FragmentSpread*> spreads;
    std::vector<const ast::SelectionSet*> pending{&selectionSet};
    while (!pending.empty()) {
        auto* set = pending.back();
        pending.pop_back();
        for (auto& selection : set->selections) {
            if (auto* field = selection.field()) {
                if (!field->selectionSet.empty()) pending.push_back(&field->selectionSet);
            } else if (auto* spread = selection.fragmentSpread()) {
                spreads.push_back(spread);
            } else if (auto* inlineFragment = selection.inlineFragment()) {
                pending.push_back(&inlineFragment->selectionSet);
            }
        }
    }
    return spreads;
}

std::vector<const ast::FragmentDefinition*>
ValidationContext::recursivelyReferencedFragments(const ast::OperationDefinition& operation) const {
    std::vector<const ast::FragmentDefinition*> fragments;
    std::set<std::string> collected;
    std::vector<const ast::SelectionSet*> pending{&operation.selectionSet};
    while (!pending.empty()) {
        auto* set = pending.back();
        pending.pop_back();
        for (auto* spread : fragmentSpreads(*set)) {
            if (!collected.insert(spread->name).second) continue;
            if (auto* fragment = document_.fragment(spread->name)) {
                fragments.push_back(fragment);
                pending.push_back(&fragment->selectionSet);
            }
        }
    }
    return fragments;
}

std::vector<VariableUsage>
ValidationContext::recursiveVariableUsages(const ast::OperationDefinition& operation) const {
    std::vector<VariableUsage> usages;
    auto append = [&](const void* scope) {
        auto it = usages_.find(scope);
        if (it != usages_.end()) usages.insert(usages.end(), it->second.begin(), it->second.end());
    };
    append(&operation);
    for (auto* fragment : recursivelyReferencedFragments(operation)) append(fragment);
    return usages;
}

// ═══════════════════════════════════════════
//  ValidationWalker — one rule, one pass
// ═══════════════════════════════════════════
namespace detail {

class ValidationWalker {
public:
    ValidationWalker(ValidationContext& ctx, ValidationRule& rule) : ctx_(ctx), rule_(rule) {}

    void walk(const ast::Document& document) {
        ctx_.rule_ = rule_.name();
        rule_.enterDocument(ctx_, document);
        for (auto& operation : document.operations) walkOperation(operation);
        for (auto& fragment : document.fragments) walkFragment(fragment);
        rule_.leaveDocument(ctx_, document);
    }

private:
    ValidationContext& ctx_;
    ValidationRule& rule_;

    const Schema& schema() const { return ctx_.schema_; }

    void walkOperation(const ast::OperationDefinition& operation) {
        ctx_.operation_ = &operation;
        ctx_.scope_ = &operation;
        rule_.enterOperation(ctx_, operation);

        for (auto& variable : operation.variables) {
            rule_.enterVariableDefinition(ctx_, variable);
            if (variable.defaultValue) walkValue(*variable.defaultValue, &variable.type, false);
            walkDirectives(variable.directives, DirectiveLocation::VariableDefinition);
        }

        const TypeDefinition* root = nullptr;
        DirectiveLocation location = DirectiveLocation::Query;
        switch (operation.operation) {
            case ast::OperationType::Query:
                root = schema().queryType();
                break;
            case ast::OperationType::Mutation:
                root = schema().mutationType();
                location = DirectiveLocation::Mutation;
                break;
            case ast::OperationType::Subscription:
                root = schema().subscriptionType();
                location = DirectiveLocation::Subscription;
                break;
        }
        walkDirectives(operation.directives, location);
        walkSelectionSet(operation.selectionSet, root);

        rule_.leaveOperation(ctx_, operation);
        ctx_.operation_ = nullptr;
        ctx_.scope_ = nullptr;
    }

    void walkFragment(const ast::FragmentDefinition& fragment) {
        ctx_.scope_ = &fragment;
        rule_.enterFragment(ctx_, fragment);
        walkDirectives(fragment.directives, DirectiveLocation::FragmentDefinition);
        walkSelectionSet(fragment.selectionSet, schema().type(fragment.typeCondition));
        rule_.leaveFragment(ctx_, fragment);
        ctx_.scope_ = nullptr;
    }

    void walkSelectionSet(const ast::SelectionSet& selectionSet, const TypeDefinition* parentType) {
        ctx_.parentTypes_.push_back(parentType);
        rule_.enterSelectionSet(ctx_, selectionSet);
        for (auto& selection : selectionSet.selections) {
            if (auto* field = selection.field()) {
                walkField(*field, parentType);
            } else if (auto* spread = selection.fragmentSpread()) {
                rule_.enterFragmentSpread(ctx_, *spread);
                walkDirectives(spread->directives, DirectiveLocation::FragmentSpread);
            } else if (auto* inlineFragment = selection.inlineFragment()) {
                auto* type = inlineFragment->typeCondition.empty()
                                 ? parentType : schema().type(inlineFragment->typeCondition);
                rule_.enterInlineFragment(ctx_, *inlineFragment);
                walkDirectives(inlineFragment->directives, DirectiveLocation::InlineFragment);
                walkSelectionSet(inlineFragment->selectionSet, type);
            }
        }
        ctx_.parentTypes_.pop_back();
    }

    void walkField(const ast::Field& field, const TypeDefinition* parentType) {
        const FieldDefinition* def = nullptr;
        if (parentType && parentType->isComposite()) def = schema().fieldDefinition(*parentType, field.name);

        ctx_.fields_.push_back(def);
        rule_.enterField(ctx_, field);
        for (auto& argument : field.arguments) {
            walkArgument(argument, def ? def->argument(argument.name) : nullptr);
        }
        walkDirectives(field.directives, DirectiveLocation::Field);
        if (!field.selectionSet.empty()) {
            walkSelectionSet(field.selectionSet, def ? schema().type(def->type.namedType()) : nullptr);
        }
        rule_.leaveField(ctx_, field);
        ctx_.fields_.pop_back();
    }

    void walkDirectives(const std::vector<ast::Directive>& directives, DirectiveLocation location) {
        if (directives.empty()) return;
        rule_.enterDirectives(ctx_, directives, location);
        for (auto& directive : directives) {
            auto* def = schema().directive(directive.name);
            ctx_.directive_ = &directive;
            ctx_.directiveDefinition_ = def;
            rule_.enterDirective(ctx_, directive, location);
            for (auto& argument : directive.arguments) {
                walkArgument(argument, def ? def->argument(argument.name) : nullptr);
            }
            ctx_.directive_ = nullptr;
            ctx_.directiveDefinition_ = nullptr;
        }
    }

    void walkArgument(const ast::Argument& argument, const InputValueDefinition* def) {
        ctx_.argument_ = def;
        rule_.enterArgument(ctx_, argument);
        walkValue(argument.value, def ? &def->type : nullptr, def && def->defaultValue.has_value());
        ctx_.argument_ = nullptr;
    }

    void walkValue(const ast::Value& value, const TypeRef* type, bool locationDefault) {
        ctx_.inputTypes_.push_back(type);
        if (value.isVariable()) {
            ctx_.usages_[ctx_.scope_].push_back(VariableUsage{&value, type, locationDefault});
        }
        rule_.enterValue(ctx_, value);

        const TypeRef* nullable = type && type->isNonNull() ? &type->ofType() : type;
        if (value.kind == ast::Value::Kind::List) {
            const TypeRef* itemType = nullable && nullable->isList() ? &nullable->ofType() : nullable;
            for (auto& item : value.list) walkValue(item, itemType, false);
        } else if (value.kind == ast::Value::Kind::Object) {
            const TypeDefinition* inputType =
                nullable && nullable->isNamed() ? schema().type(nullable->namedType()) : nullptr;
            for (auto& field : value.fields) {
                auto* def = inputType ? inputType->inputField(field.name) : nullptr;
                walkValue(field.value, def ? &def->type : nullptr, def && def->defaultValue.has_value());
            }
        }
        ctx_.inputTypes_.pop_back();
    }
};

} // namespace detail

namespace {

std::string quote(const std::string& s) { return "\"" + s + "\""; }

// ═══════════════════════════════════════════
//  Operations
// ═══════════════════════════════════════════

class UniqueOperationNames : public ValidationRule {
public:
    const char* name() const override { return "UniqueOperationNames"; }

    void enterDocument(ValidationContext&, const ast::Document&) override { seen_.clear(); }

    void enterOperation(ValidationContext& ctx, const ast::OperationDefinition& op) override {
        if (op.name.empty()) return;
        auto [it, inserted] = seen_.emplace(op.name, op.loc);
        if (!inserted) {
            ctx.report("There can be only one operation named " + quote(op.name) + ".", {it->second, op.loc});
        }
    }

private:
    std::unordered_map<std::string, Location> seen_;
};

class LoneAnonymousOperation : public ValidationRule {
public:
    const char* name() const override { return "LoneAnonymousOperation"; }

    void enterDocument(ValidationContext&, const ast::Document& doc) override {
        count_ = doc.operations.size();
    }

    void enterOperation(ValidationContext& ctx, const ast::OperationDefinition& op) override {
        if (op.name.empty() && count_ > 1) {
            ctx.report("This anonymous operation must be the only defined operation.", {op.loc});
        }
    }

private:
    std::size_t count_ = 0;
};

class SingleFieldSubscriptions : public ValidationRule {
public:
    const char* name() const override { return "SingleFieldSubscriptions"; }

    void enterOperation(ValidationContext& ctx, const ast::OperationDefinition& op) override {
        if (op.operation != ast::OperationType::Subscription) return;

        std::vector<std::pair<std::string, const ast::Field*>> fields;
        std::set<std::string> visited;
        collect(ctx, op.selectionSet, fields, visited);

        std::string subject = op.name.empty() ? "Anonymous Subscription" : "Subscription " + quote(op.name);
        if (fields.size() > 1) {
            std::vector<Location> extra;
            for (std::size_t i = 1; i < fields.size(); ++i) extra.push_back(fields[i].second->loc);
            ctx.report(subject + " must select only one top level field.", extra);
        }
        for (auto& [key, field] : fields) {
            if (field->name.rfind("__", 0) == 0) {
                ctx.report(subject + " must not select an introspection top level field.", {field->loc});
            }
        }
    }

private:
    void collect(ValidationContext& ctx, const ast::SelectionSet& set,
                 std::vector<std::pair<std::string, const ast::Field*>>& out,
                 std::set<std::string>& visited) {
        for (auto& selection : set.selections) {
            if (auto* field = selection.field()) {
                auto key = field->responseKey();
                bool known = std::any_of(out.begin(), out.end(), [&](auto& e) { return e.first == key; });
                if (!known) out.emplace_back(key, field);
            } else if (auto* spread = selection.fragmentSpread()) {
                if (!visited.insert(spread->name).second) continue;
                if (auto* fragment = ctx.document().fragment(spread->name)) {
                    collect(ctx, fragment->selectionSet, out, visited);
                }
            } else if (auto* inlineFragment = selection.inlineFragment()) {
                collect(ctx, inlineFragment->selectionSet, out, visited);
            }
        }
    }
};

// ═══════════════════════════════════════════
//  Types
// ═══════════════════════════════════════════

class KnownTypeNames : public ValidationRule {
public:
    const char* name() const override { return "KnownTypeNames"; }

    void enterVariableDefinition(ValidationContext& ctx, const ast::VariableDefinition& var) override {
        check(ctx, var.type.namedType(), var.loc);
    }
    void enterFragment(ValidationContext& ctx, const ast::FragmentDefinition& fragment) override {
        check(ctx, fragment.typeCondition, fragment.loc);
    }
    void enterInlineFragment(ValidationContext& ctx, const ast::InlineFragment& fragment) override {
        if (!fragment.typeCondition.empty()) check(ctx, fragment.typeCondition, fragment.loc);
    }

private:
    static void check(ValidationContext& ctx, const std::string& typeName, Location loc) {
        if (!ctx.schema().type(typeName)) ctx.report("Unknown type " + quote(typeName) + ".", {loc});
    }
};

class FragmentsOnCompositeTypes : public ValidationRule {
public:
    const char* name() const override { return "FragmentsOnCompositeTypes"; }

    void enterInlineFragment(ValidationContext& ctx, const ast::InlineFragment& fragment) override {
        if (fragment.typeCondition.empty()) return;
        auto* type = ctx.schema().type(fragment.typeCondition);
        if (type && !type->isComposite()) {
            ctx.report("Fragment cannot condition on non composite type " + quote(fragment.typeCondition) + ".",
                       {fragment.loc});
        }
    }

    void enterFragment(ValidationContext& ctx, const ast::FragmentDefinition& fragment) override {
        auto* type = ctx.schema().type(fragment.typeCondition);
        if (type && !type->isComposite()) {
            ctx.report("Fragment " + quote(fragment.name) + " cannot condition on non composite type " +
                       quote(fragment.typeCondition) + ".", {fragment.loc});
        }
    }
};

class VariablesAreInputTypes : public ValidationRule {
public:
    const char* name() const override { return "VariablesAreInputTypes"; }

    void enterVariableDefinition(ValidationContext& ctx, const ast::VariableDefinition& var) override {
        auto* type = ctx.schema().type(var.type.namedType());
        if (type && !type->isInputType()) {
            ctx.report("Variable \"$" + var.name + "\" cannot be non-input type " +
                       quote(var.type.toString()) + ".", {var.loc});
        }
    }
};

// ═══════════════════════════════════════════
//  Fields
// ═══════════════════════════════════════════

class FieldsOnCorrectType : public ValidationRule {
public:
    const char* name() const override { return "FieldsOnCorrectType"; }

    void enterField(ValidationContext& ctx, const ast::Field& field) override {
        auto* parent = ctx.parentType();
        if (!parent || !parent->isComposite() || ctx.fieldDefinition()) return;
        ctx.report("Cannot query field " + quote(field.name) + " on type " + quote(parent->name) + ".",
                   {field.loc});
    }
};

class ScalarLeafs : public ValidationRule {
public:
    const char* name() const override { return "ScalarLeafs"; }

    void enterField(ValidationContext& ctx, const ast::Field& field) override {
        auto* def = ctx.fieldDefinition();
        if (!def) return;
        auto* type = ctx.schema().type(def->type.namedType());
        if (!type) return;
        if (type->isLeaf() && !field.selectionSet.empty()) {
            ctx.report("Field " + quote(field.name) + " must not have a selection since type " +
                       quote(def->type.toString()) + " has no subfields.", {field.loc});
        } else if (type->isComposite() && field.selectionSet.empty()) {
            ctx.report("Field " + quote(field.name) + " of type " + quote(def->type.toString()) +
                       " must have a selection of subfields. Did you mean \"" + field.name + " { ... }\"?",
                       {field.loc});
        }
    }
};

// ═══════════════════════════════════════════
//  Fragments
// ═══════════════════════════════════════════

class UniqueFragmentNames : public ValidationRule {
public:
    const char* name() const override { return "UniqueFragmentNames"; }

    void enterDocument(ValidationContext&, const ast::Document&) override { seen_.clear(); }

    void enterFragment(ValidationContext& ctx, const ast::FragmentDefinition& fragment) override {
        auto [it, inserted] = seen_.emplace(fragment.name, fragment.loc);
        if (!inserted) {
            ctx.report("There can be only one fragment named " + quote(fragment.name) + ".",
                       {it->second, fragment.loc});
        }
    }

private:
    std::unordered_map<std::string, Location> seen_;
};

class KnownFragmentNames : public ValidationRule {
public:
    const char* name() const override { return "KnownFragmentNames"; }

    void enterFragmentSpread(ValidationContext& ctx, const ast::FragmentSpread& spread) override {
        if (!ctx.document().fragment(spread.name)) {
            ctx.report("Unknown fragment " + quote(spread.name) + ".", {spread.loc});
        }
    }
};

class NoUnusedFragments : public ValidationRule {
public:
    const char* name() const override { return "NoUnusedFragments"; }

    void leaveDocument(ValidationContext& ctx, const ast::Document& doc) override {
        std::set<const ast::FragmentDefinition*> used;
        for (auto& op : doc.operations) {
            for (auto* fragment : ctx.recursivelyReferencedFragments(op)) used.insert(fragment);
        }
        for (auto& fragment : doc.fragments) {
            if (!used.count(&fragment)) {
                ctx.report("Fragment " + quote(fragment.name) + " is never used.", {fragment.loc});
            }
        }
    }
};

class PossibleFragmentSpreads : public ValidationRule {
public:
    const char* name() const override { return "PossibleFragmentSpreads"; }

    void enterInlineFragment(ValidationContext& ctx, const ast::InlineFragment& fragment) override {
        if (fragment.typeCondition.empty()) return;
        auto* fragType = ctx.schema().type(fragment.typeCondition);
        auto* parent = ctx.parentType();
        if (!impossible(ctx, fragType, parent)) return;
        ctx.report("Fragment cannot be spread here as objects of type " + quote(parent->name) +
                   " can never be of type " + quote(fragType->name) + ".", {fragment.loc});
    }

    void enterFragmentSpread(ValidationContext& ctx, const ast::FragmentSpread& spread) override {
        auto* fragment = ctx.document().fragment(spread.name);
        if (!fragment) return;
        auto* fragType = ctx.schema().type(fragment->typeCondition);
        auto* parent = ctx.parentType();
        if (!impossible(ctx, fragType, parent)) return;
        ctx.report("Fragment " + quote(spread.name) + " cannot be spread here as objects of type " +
                   quote(parent->name) + " can never be of type " + quote(fragType->name) + ".",
                   {spread.loc});
    }

private:
    static bool impossible(ValidationContext& ctx, const TypeDefinition* fragType, const TypeDefinition* parent) {
        return fragType && parent && fragType->isComposite() && parent->isComposite() &&
               !ctx.schema().doTypesOverlap(*fragType, *parent);
    }
};

class NoFragmentCycles : public ValidationRule {
public:
    const char* name() const override { return "NoFragmentCycles"; }

    void enterDocument(ValidationContext& ctx, const ast::Document& doc) override {
        visited_.clear();
        onStack_.clear();
        path_.clear();
        for (auto& fragment : doc.fragments) detect(ctx, fragment);
    }

private:
    std::set<std::string> visited_;
    std::unordered_map<std::string, std::size_t> onStack_;
    std::vector<const ast::FragmentSpread*> path_;

    void detect(ValidationContext& ctx, const ast::FragmentDefinition& fragment) {
        if (!visited_.insert(fragment.name).second) return;

        auto spreads = ctx.fragmentSpreads(fragment.selectionSet);
        if (spreads.empty()) return;

        onStack_[fragment.name] = path_.size();
        for (auto* spread : spreads) {
            path_.push_back(spread);
            auto it = onStack_.find(spread->name);
            if (it == onStack_.end()) {
                if (auto* target = ctx.document().fragment(spread->name)) detect(ctx, *target);
            } else {
                std::vector<Location> locations;
                std::string via;
                for (std::size_t i = it->second; i < path_.size(); ++i) {
                    locations.push_back(path_[i]->loc);
                    if (i + 1 < path_.size()) {
                        if (!via.empty()) via += ", ";
                        via += quote(path_[i]->name);
                    }
                }
                ctx.report("Cannot spread fragment " + quote(spread->name) + " within itself" +
                           (via.empty() ? "." : " via " + via + "."), locations);
            }
            path_.pop_back();
        }
        onStack_.erase(fragment.name);
    }
};

// ═══════════════════════════════════════════
//  Variables
// ═══════════════════════════════════════════

class UniqueVariableNames : public ValidationRule {
public:
    const char* name() const override { return "UniqueVariableNames"; }

    void enterOperation(ValidationContext& ctx, const ast::OperationDefinition& op) override {
        std::unordered_map<std::string, Location> seen;
        for (auto& var : op.variables) {
            auto [it, inserted] = seen.emplace(var.name, var.loc);
            if (!inserted) {
                ctx.report("There can be only one variable named \"$" + var.name + "\".", {it->second, var.loc});
            }
        }
    }
};

class NoUndefinedVariables : public ValidationRule {
public:
    const char* name() const override { return "NoUndefinedVariables"; }

    void leaveDocument(ValidationContext& ctx, const ast::Document& doc) override {
        for (auto& op : doc.operations) {
            std::set<std::string> defined;
            for (auto& var : op.variables) defined.insert(var.name);
            for (auto& usage : ctx.recursiveVariableUsages(op)) {
                const std::string& var = usage.node->text;
                if (defined.count(var)) continue;
                ctx.report(op.name.empty()
                               ? "Variable \"$" + var + "\" is not defined."
                               : "Variable \"$" + var + "\" is not defined by operation " + quote(op.name) + ".",
                           {usage.node->loc, op.loc});
            }
        }
    }
};

class NoUnusedVariables : public ValidationRule {
public:
    const char* name() const override { return "NoUnusedVariables"; }

    void leaveDocument(ValidationContext& ctx, const ast::Document& doc) override {
        for (auto& op : doc.operations) {
            std::set<std::string> used;
            for (auto& usage : ctx.recursiveVariableUsages(op)) used.insert(usage.node->text);
            for (auto& var : op.variables) {
                if (used.count(var.name)) continue;
                ctx.report(op.name.empty()
                               ? "Variable \"$" + var.name + "\" is never used."
                               : "Variable \"$" + var.name + "\" is never used in operation " + quote(op.name) + ".",
                           {var.loc});
            }
        }
    }
};

class VariablesInAllowedPosition : public ValidationRule {
public:
    const char* name() const override { return "VariablesInAllowedPosition"; }

    void leaveDocument(ValidationContext& ctx, const ast::Document& doc) override {
        for (auto& op : doc.operations) {
            for (auto& usage : ctx.recursiveVariableUsages(op)) {
                if (!usage.type) continue;
                auto def = std::find_if(op.variables.begin(), op.variables.end(),
                                        [&](auto& v) { return v.name == usage.node->text; });
                if (def == op.variables.end() || !ctx.schema().type(def->type.namedType())) continue;

                if (!allowed(ctx, *def, usage)) {
                    ctx.report("Variable \"$" + def->name + "\" of type " + quote(def->type.toString()) +
                               " used in position expecting type " + quote(usage.type->toString()) + ".",
                               {def->loc, usage.node->loc});
                }
            }
        }
    }

private:
    static bool allowed(ValidationContext& ctx, const ast::VariableDefinition& def, const VariableUsage& usage) {
        const TypeRef& location = *usage.type;
        if (location.isNonNull() && !def.type.isNonNull()) {
            bool varHasDefault = def.defaultValue && !def.defaultValue->isNull();
            if (!varHasDefault && !usage.hasLocationDefault) return false;
            return ctx.schema().isSubTypeOf(def.type, location.ofType());
        }
        return ctx.schema().isSubTypeOf(def.type, location);
    }
};

// ═══════════════════════════════════════════
//  Directives
// ═══════════════════════════════════════════

class KnownDirectives : public ValidationRule {
public:
    const char* name() const override { return "KnownDirectives"; }

    void enterDirective(ValidationContext& ctx, const ast::Directive& directive, DirectiveLocation location) override {
        auto* def = ctx.directiveDefinition();
        if (!def) {
            ctx.report("Unknown directive \"@" + directive.name + "\".", {directive.loc});
        } else if (!def->allowedAt(location)) {
            ctx.report("Directive \"@" + directive.name + "\" may not be used on " + toString(location) + ".",
                       {directive.loc});
        }
    }
};

class UniqueDirectivesPerLocation : public ValidationRule {
public:
    const char* name() const override { return "UniqueDirectivesPerLocation"; }

    void enterDirectives(ValidationContext& ctx, const std::vector<ast::Directive>& directives,
                         DirectiveLocation) override {
        std::unordered_map<std::string, Location> seen;
        for (auto& directive : directives) {
            auto* def = ctx.schema().directive(directive.name);
            if (def && def->repeatable) continue;
            auto [it, inserted] = seen.emplace(directive.name, directive.loc);
            if (!inserted) {
                ctx.report("The directive \"@" + directive.name + "\" can only be used once at this location.",
                           {it->second, directive.loc});
            }
        }
    }
};

// ═══════════════════════════════════════════
//  Arguments and values
// ═══════════════════════════════════════════

class KnownArgumentNames : public ValidationRule {
public:
    const char* name() const override { return "KnownArgumentNames"; }

    void enterArgument(ValidationContext& ctx, const ast::Argument& argument) override {
        if (ctx.argumentDefinition()) return;
        if (auto* directive = ctx.directive()) {
            if (ctx.directiveDefinition()) {
                ctx.report("Unknown argument " + quote(argument.name) + " on directive \"@" +
                           directive->name + "\".", {argument.loc});
            }
            return;
        }
        auto* field = ctx.fieldDefinition();
        auto* parent = ctx.parentType();
        if (field && parent) {
            ctx.report("Unknown argument " + quote(argument.name) + " on field " +
                       quote(parent->name + "." + field->name) + ".", {argument.loc});
        }
    }
};

class UniqueArgumentNames : public ValidationRule {
public:
    const char* name() const override { return "UniqueArgumentNames"; }

    void enterField(ValidationContext& ctx, const ast::Field& field) override {
        check(ctx, field.arguments);
    }
    void enterDirective(ValidationContext& ctx, const ast::Directive& directive, DirectiveLocation) override {
        check(ctx, directive.arguments);
    }

private:
    static void check(ValidationContext& ctx, const std::vector<ast::Argument>& arguments) {
        std::unordered_map<std::string, Location> seen;
        for (auto& argument : arguments) {
            auto [it, inserted] = seen.emplace(argument.name, argument.loc);
            if (!inserted) {
                ctx.report("There can be only one argument named " + quote(argument.name) + ".",
                           {it->second, argument.loc});
            }
        }
    }
};

class ProvidedRequiredArguments : public ValidationRule {
public:
    const char* name() const override { return "ProvidedRequiredArguments"; }

    void enterField(ValidationContext& ctx, const ast::Field& field) override {
        auto* def = ctx.fieldDefinition();
        if (!def) return;
        for (auto& arg : def->arguments) {
            if (!required(arg) || field.argument(arg.name)) continue;
            ctx.report("Field " + quote(field.name) + " argument " + quote(arg.name) + " of type " +
                       quote(arg.type.toString()) + " is required, but it was not provided.", {field.loc});
        }
    }

    void enterDirective(ValidationContext& ctx, const ast::Directive& directive, DirectiveLocation) override {
        auto* def = ctx.directiveDefinition();
        if (!def) return;
        for (auto& arg : def->arguments) {
            if (!required(arg) || directive.argument(arg.name)) continue;
            ctx.report("Directive \"@" + directive.name + "\" argument " + quote(arg.name) + " of type " +
                       quote(arg.type.toString()) + " is required, but it was not provided.", {directive.loc});
        }
    }

private:
    static bool required(const InputValueDefinition& arg) {
        return arg.type.isNonNull() && !arg.defaultValue;
    }
};

class ValuesOfCorrectType : public ValidationRule {
public:
    const char* name() const override { return "ValuesOfCorrectType"; }

    void enterArgument(ValidationContext& ctx, const ast::Argument& argument) override {
        if (auto* def = ctx.argumentDefinition()) check(ctx, argument.value, def->type);
    }

    void enterVariableDefinition(ValidationContext& ctx, const ast::VariableDefinition& var) override {
        if (var.defaultValue && ctx.schema().isInputType(var.type)) check(ctx, *var.defaultValue, var.type);
    }

private:
    static void check(ValidationContext& ctx, const ast::Value& value, const TypeRef& type) {
        using Kind = ast::Value::Kind;
        if (value.isVariable()) return;

        if (type.isNonNull()) {
            if (value.isNull()) {
                ctx.report("Expected value of type " + quote(type.toString()) + ", found null.", {value.loc});
                return;
            }
            check(ctx, value, type.ofType());
            return;
        }
        if (value.isNull()) return;

        if (type.isList()) {
            if (value.kind == Kind::List) {
                for (auto& item : value.list) check(ctx, item, type.ofType());
            } else {
                check(ctx, value, type.ofType());
            }
            return;
        }

        auto* def = ctx.schema().type(type.namedType());
        if (!def) return;

        switch (def->kind) {
            case TypeKind::InputObject: {
                if (value.kind != Kind::Object) {
                    ctx.report("Expected value of type " + quote(def->name) + ", found " + print(value) + ".",
                               {value.loc});
                    return;
                }
                for (auto& field : def->inputObject()->fields) {
                    auto* provided = value.field(field.name);
                    if (!provided && field.type.isNonNull() && !field.defaultValue) {
                        ctx.report("Field " + quote(def->name + "." + field.name) + " of required type " +
                                   quote(field.type.toString()) + " was not provided.", {value.loc});
                    }
                }
                for (auto& field : value.fields) {
                    if (auto* fieldDef = def->inputField(field.name)) {
                        check(ctx, field.value, fieldDef->type);
                    } else {
                        ctx.report("Field " + quote(field.name) + " is not defined by type " +
                                   quote(def->name) + ".", {field.loc});
                    }
                }
                return;
            }
            case TypeKind::Enum: {
                if (value.kind != Kind::Enum) {
                    ctx.report("Enum " + quote(def->name) + " cannot represent non-enum value: " +
                               print(value) + ".", {value.loc});
                } else if (!def->enumValue(value.text)) {
                    ctx.report("Value " + quote(value.text) + " does not exist in " + quote(def->name) +
                               " enum.", {value.loc});
                }
                return;
            }
            case TypeKind::Scalar: {
                if (value.kind == Kind::List || value.kind == Kind::Object) {
                    ctx.report("Expected value of type " + quote(def->name) + ", found " + print(value) + ".",
                               {value.loc});
                    return;
                }
                try {
                    def->scalar()->parseLiteral(value);
                } catch (const CoercionError& e) {
                    ctx.report("Expected value of type " + quote(def->name) + ", found " + print(value) +
                               "; " + e.what(), {value.loc});
                }
                return;
            }
            default:
                return;
        }
    }
};

// ═══════════════════════════════════════════
//  OverlappingFieldsCanBeMerged
// ═══════════════════════════════════════════

class OverlappingFieldsCanBeMerged : public ValidationRule {
public:
    const char* name() const override { return "OverlappingFieldsCanBeMerged"; }

    void enterDocument(ValidationContext&, const ast::Document&) override { compared_.clear(); }

    void enterSelectionSet(ValidationContext& ctx, const ast::SelectionSet& set) override {
        FieldMap fields;
        std::set<std::string> visited;
        collect(ctx, ctx.parentType(), set, fields, visited);

        for (auto& [key, entries] : fields) {
            for (std::size_t i = 0; i < entries.size(); ++i) {
                for (std::size_t j = i + 1; j < entries.size(); ++j) {
                    auto pair = std::minmax(entries[i].node, entries[j].node);
                    if (pair.first == pair.second || !compared_.insert(pair).second) continue;
                    comparing_.clear();
                    comparing_.insert(pair);
                    if (auto conflict = compare(ctx, entries[i], entries[j], false)) {
                        ctx.report("Fields " + quote(key) + " conflict because " + conflict->reason +
                                   ". Use different aliases on the fields to fetch both if this was intentional.",
                                   conflict->locations);
                    }
                }
            }
        }
    }

private:
    struct Entry {
        const TypeDefinition* parent = nullptr;
        const ast::Field* node = nullptr;
        const FieldDefinition* def = nullptr;
    };
    using FieldMap = std::vector<std::pair<std::string, std::vector<Entry>>>;

    struct Conflict {
        std::string reason;
        std::vector<Location> locations;
    };

    std::set<std::pair<const ast::Field*, const ast::Field*>> compared_;
    // Pairs reached from the current top-level pair; fragment cycles revisit them
    std::set<std::pair<const ast::Field*, const ast::Field*>> comparing_;

    static void collect(ValidationContext& ctx, const TypeDefinition* parent, const ast::SelectionSet& set,
                        FieldMap& out, std::set<std::string>& visited) {
        for (auto& selection : set.selections) {
            if (auto* field = selection.field()) {
                const FieldDefinition* def = nullptr;
                if (parent && parent->isComposite()) def = ctx.schema().fieldDefinition(*parent, field->name);
                auto key = field->responseKey();
                auto it = std::find_if(out.begin(), out.end(), [&](auto& e) { return e.first == key; });
                if (it == out.end()) {
                    out.emplace_back(key, std::vector<Entry>{});
                    it = std::prev(out.end());
                }
                it->second.push_back(Entry{parent, field, def});
            } else if (auto* spread = selection.fragmentSpread()) {
                if (!visited.insert(spread->name).second) continue;
                if (auto* fragment = ctx.document().fragment(spread->name)) {
                    collect(ctx, ctx.schema().type(fragment->typeCondition), fragment->selectionSet, out, visited);
                }
            } else if (auto* inlineFragment = selection.inlineFragment()) {
                auto* type = inlineFragment->typeCondition.empty()
                                 ? parent : ctx.schema().type(inlineFragment->typeCondition);
                collect(ctx, type, inlineFragment->selectionSet, out, visited);
            }
        }
    }

    static bool sameArguments(const ast::Field& a, const ast::Field& b) {
        if (a.arguments.size() != b.arguments.size()) return false;
        for (auto& arg : a.arguments) {
            auto* other = b.argument(arg.name);
            if (!other || other->value != arg.value) return false;
        }
        return true;
    }

    static bool typesConflict(ValidationContext& ctx, const TypeRef& a, const TypeRef& b) {
        if (a.isList()) return b.isList() ? typesConflict(ctx, a.ofType(), b.ofType()) : true;
        if (b.isList()) return true;
        if (a.isNonNull()) return b.isNonNull() ? typesConflict(ctx, a.ofType(), b.ofType()) : true;
        if (b.isNonNull()) return true;
        auto* ta = ctx.schema().type(a.namedType());
        auto* tb = ctx.schema().type(b.namedType());
        if ((ta && ta->isLeaf()) || (tb && tb->isLeaf())) return a.namedType() != b.namedType();
        return false;
    }

    std::optional<Conflict> compare(ValidationContext& ctx, const Entry& a, const Entry& b, bool exclusive) {
        std::vector<Location> locations{a.node->loc, b.node->loc};
        bool mutuallyExclusive = exclusive ||
            (a.parent != b.parent && a.parent && b.parent &&
             a.parent->kind == TypeKind::Object && b.parent->kind == TypeKind::Object);

        if (!mutuallyExclusive) {
            if (a.node->name != b.node->name) {
                return Conflict{quote(a.node->name) + " and " + quote(b.node->name) + " are different fields",
                                locations};
            }
            if (!sameArguments(*a.node, *b.node)) return Conflict{"they have differing arguments", locations};
        }

        if (a.def && b.def && typesConflict(ctx, a.def->type, b.def->type)) {
            return Conflict{"they return conflicting types " + quote(a.def->type.toString()) + " and " +
                            quote(b.def->type.toString()), locations};
        }

        if (!a.def || !b.def || a.node->selectionSet.empty() || b.node->selectionSet.empty()) return std::nullopt;

        FieldMap subA, subB;
        std::set<std::string> visitedA, visitedB;
        collect(ctx, ctx.schema().type(a.def->type.namedType()), a.node->selectionSet, subA, visitedA);
        collect(ctx, ctx.schema().type(b.def->type.namedType()), b.node->selectionSet, subB, visitedB);

        std::string reasons;
        for (auto& [subKey, entriesA] : subA) {
            auto it = std::find_if(subB.begin(), subB.end(), [&](auto& e) { return e.first == subKey; });
            if (it == subB.end()) continue;
            for (auto& x : entriesA) {
                for (auto& y : it->second) {
                    if (x.node == y.node || !comparing_.insert(std::minmax(x.node, y.node)).second) continue;
                    if (auto sub = compare(ctx, x, y, mutuallyExclusive)) {
                        if (!reasons.empty()) reasons += " and ";
                        reasons += "subfields " + quote(subKey) + " conflict because " + sub->reason;
                        locations.insert(locations.end(), sub->locations.begin(), sub->locations.end());
                    }
                }
            }
        }
        if (reasons.empty()) return std::nullopt;
        return Conflict{reasons, locations};
    }
};

// ═══════════════════════════════════════════
//  Optional limits
// ═══════════════════════════════════════════

class MaxDepth : public ValidationRule {
public:
    explicit MaxDepth(std::size_t limit) : limit_(limit) {}

    const char* name() const override { return "MaxDepth"; }

    void enterOperation(ValidationContext& ctx, const ast::OperationDefinition& op) override {
        std::set<std::string> path;
        auto found = depth(ctx, op.selectionSet, path);
        if (found <= limit_) return;
        std::string subject = op.name.empty() ? "Operation" : "Operation " + quote(op.name);
        ctx.report(subject + " exceeds maximum depth of " + std::to_string(limit_) + ", found " +
                   std::to_string(found) + ".", {op.loc});
    }

private:
    std::size_t limit_;

    static std::size_t depth(ValidationContext& ctx, const ast::SelectionSet& set, std::set<std::string>& path) {
        std::size_t deepest = 0;
        for (auto& selection : set.selections) {
            if (auto* field = selection.field()) {
                if (field->name.rfind("__", 0) == 0) continue;
                std::size_t d = 1;
                if (!field->selectionSet.empty()) d += depth(ctx, field->selectionSet, path);
                deepest = std::max(deepest, d);
            } else if (auto* spread = selection.fragmentSpread()) {
                auto* fragment = ctx.document().fragment(spread->name);
                if (!fragment || !path.insert(spread->name).second) continue;
                deepest = std::max(deepest, depth(ctx, fragment->selectionSet, path));
                path.erase(spread->name);
            } else if (auto* inlineFragment = selection.inlineFragment()) {
                deepest = std::max(deepest, depth(ctx, inlineFragment->selectionSet, path));
            }
        }
        return deepest;
    }
};

class NoIntrospection : public ValidationRule {
public:
    const char* name() const override { return "NoIntrospection"; }

    void enterField(ValidationContext& ctx, const ast::Field& field) override {
        if (field.name == "__schema" || field.name == "__type") {
            ctx.report("GraphQL introspection has been disabled, but the requested query contained the field " +
                       quote(field.name) + ".", {field.loc});
        }
    }
};

} // namespace

RuleList specifiedRules(const ValidatorOptions& options) {
    RuleList rules;
    rules.push_back(std::make_unique<UniqueOperationNames>());
    rules.push_back(std::make_unique<LoneAnonymousOperation>());
    rules.push_back(std::make_unique<SingleFieldSubscriptions>());
    rules.push_back(std::make_unique<KnownTypeNames>());
    rules.push_back(std::make_unique<FragmentsOnCompositeTypes>());
    rules.push_back(std::make_unique<VariablesAreInputTypes>());
    rules.push_back(std::make_unique<FieldsOnCorrectType>());
    rules.push_back(std::make_unique<ScalarLeafs>());
    rules.push_back(std::make_unique<UniqueFragmentNames>());
    rules.push_back(std::make_unique<KnownFragmentNames>());
    rules.push_back(std::make_unique<NoUnusedFragments>());
    rules.push_back(std::make_unique<PossibleFragmentSpreads>());
    rules.push_back(std::make_unique<NoFragmentCycles>());
    rules.push_back(std::make_unique<UniqueVariableNames>());
    rules.push_back(std::make_unique<NoUndefinedVariables>());
    rules.push_back(std::make_unique<NoUnusedVariables>());
    rules.push_back(std::make_unique<KnownDirectives>());
    rules.push_back(std::make_unique<UniqueDirectivesPerLocation>());
    rules.push_back(std::make_unique<KnownArgumentNames>());
    rules.push_back(std::make_unique<UniqueArgumentNames>());
    rules.push_back(std::make_unique<ProvidedRequiredArguments>());
    rules.push_back(std::make_unique<ValuesOfCorrectType>());
    rules.push_back(std::make_unique<VariablesInAllowedPosition>());
    rules.push_back(std::make_unique<OverlappingFieldsCanBeMerged>());
    if (options.maxDepth) rules.push_back(std::make_unique<MaxDepth>(*options.maxDepth));
    if (!options.introspection) rules.push_back(std::make_unique<NoIntrospection>());
    return rules;
}

// ═══════════════════════════════════════════
//  Validator
// ═══════════════════════════════════════════

Validator::Validator(std::shared_ptr<const Schema> schema, ValidatorOptions options)
    : schema_(std::move(schema)), options_(options) {
    if (!schema_) throw std::invalid_argument("Validator requires a schema");
}

std::vector<ValidationError> Validator::validate(const ast::Document& document) const {
    return validate(document, specifiedRules(options_));
}

std::vector<ValidationError> Validator::validate(const ast::Document& document, const RuleList& rules) const {
    std::vector<ValidationError> errors;
    for (auto& rule : rules) {
        ValidationContext ctx(*schema_, document);
        detail::ValidationWalker(ctx, *rule).walk(document);
        errors.insert(errors.end(), ctx.errors().begin(), ctx.errors().end());
    }
    return errors;
}

} // namespace gqlpp
