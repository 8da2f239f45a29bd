#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/validator.h — Document validation against a schema
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    Validator validator(schema);
//    auto errors = validator.validate(document);
//    if (!errors.empty()) { ... reject the request ... }
//
//  Each rule is a ValidationRule visitor. A shared walker tracks the
//  parent type, field, directive and expected input type at every
//  node, so rules only look at what they check. Every rule walks the
//  whole document on its own; the error lists are concatenated in
//  rule order, so nothing one rule finds can hide another's errors.
// ═══════════════════════════════════════════════════════════════════

#include "ast.h"
#include "errors.h"
#include "schema.h"
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gqlpp {

namespace detail { class ValidationWalker; }

struct ValidatorOptions {
    std::optional<std::size_t> maxDepth;    // no limit when empty
    bool introspection = true;              // false rejects __schema / __type
};

// A variable reference together with the type expected where it is used
struct VariableUsage {
    const ast::Value* node = nullptr;
    const TypeRef* type = nullptr;          // nullptr when the position is unknown
    bool hasLocationDefault = false;        // the argument/input field has a default
};

// ═══════════════════════════════════════════
//  class ValidationContext
// ═══════════════════════════════════════════
class ValidationContext {
public:
    ValidationContext(const Schema& schema, const ast::Document& document);

    const Schema& schema() const { return schema_; }
    const ast::Document& document() const { return document_; }

    void report(std::string message, std::vector<Location> locations = {});
    const std::vector<ValidationError>& errors() const { return errors_; }

    // ── Position of the walker ──
    const TypeDefinition* parentType() const;                  // owner of the current selection set
    const FieldDefinition* fieldDefinition() const;            // nullptr when unknown
    const ast::Directive* directive() const;                   // set while inside a directive
    const DirectiveDefinition* directiveDefinition() const;
    const InputValueDefinition* argumentDefinition() const;
    const TypeRef* inputType() const;                          // expected type of the current value
    const ast::OperationDefinition* operation() const { return operation_; }

    // ── Document facts ──
    std::vector<const ast::FragmentSpread*> fragmentSpreads(const ast::SelectionSet& selectionSet) const;
    std::vector<const ast::FragmentDefinition*>
    recursivelyReferencedFragments(const ast::OperationDefinition& operation) const;
    // Complete only once the whole document was walked (leaveDocument)
    std::vector<VariableUsage> recursiveVariableUsages(const ast::OperationDefinition& operation) const;

private:
    friend class detail::ValidationWalker;

    const Schema& schema_;
    const ast::Document& document_;
    std::string rule_;
    std::vector<ValidationError> errors_;

    std::vector<const TypeDefinition*> parentTypes_;
    std::vector<const FieldDefinition*> fields_;
    const ast::Directive* directive_ = nullptr;
    const DirectiveDefinition* directiveDefinition_ = nullptr;
    const InputValueDefinition* argument_ = nullptr;
    std::vector<const TypeRef*> inputTypes_;
    const ast::OperationDefinition* operation_ = nullptr;

    const void* scope_ = nullptr;
    std::map<const void*, std::vector<VariableUsage>> usages_;
};

// ═══════════════════════════════════════════
//  class ValidationRule
//  Abstract visitor; override the hooks a rule needs.
// ═══════════════════════════════════════════
class ValidationRule {
public:
    virtual ~ValidationRule() = default;

    virtual const char* name() const = 0;

    virtual void enterDocument(ValidationContext&, const ast::Document&) {}
    virtual void leaveDocument(ValidationContext&, const ast::Document&) {}
    virtual void enterOperation(ValidationContext&, const ast::OperationDefinition&) {}
    virtual void leaveOperation(ValidationContext&, const ast::OperationDefinition&) {}
    virtual void enterVariableDefinition(ValidationContext&, const ast::VariableDefinition&) {}
    virtual void enterFragment(ValidationContext&, const ast::FragmentDefinition&) {}
    virtual void leaveFragment(ValidationContext&, const ast::FragmentDefinition&) {}
    virtual void enterSelectionSet(ValidationContext&, const ast::SelectionSet&) {}
    virtual void enterField(ValidationContext&, const ast::Field&) {}
    virtual void leaveField(ValidationContext&, const ast::Field&) {}
    virtual void enterFragmentSpread(ValidationContext&, const ast::FragmentSpread&) {}
    virtual void enterInlineFragment(ValidationContext&, const ast::InlineFragment&) {}
    // All directives of one node, before each is entered
    virtual void enterDirectives(ValidationContext&, const std::vector<ast::Directive>&, DirectiveLocation) {}
    virtual void enterDirective(ValidationContext&, const ast::Directive&, DirectiveLocation) {}
    virtual void enterArgument(ValidationContext&, const ast::Argument&) {}
    virtual void enterValue(ValidationContext&, const ast::Value&) {}
};

using RuleList = std::vector<std::unique_ptr<ValidationRule>>;

// Fresh instances of every rule, in their reporting order
RuleList specifiedRules(const ValidatorOptions& options = {});

// ═══════════════════════════════════════════
//  class Validator
// ═══════════════════════════════════════════
class Validator {
public:
    explicit Validator(std::shared_ptr<const Schema> schema, ValidatorOptions options = {});

    // Safe to call concurrently: every call gets its own rule instances
    std::vector<ValidationError> validate(const ast::Document& document) const;

    // Runs the given rules in the given order
    std::vector<ValidationError> validate(const ast::Document& document, const RuleList& rules) const;

    const ValidatorOptions& options() const { return options_; }

private:
    std::shared_ptr<const Schema> schema_;
    ValidatorOptions options_;
};

} // namespace gqlpp
