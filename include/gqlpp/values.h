#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/values.h — Coercion of variables, arguments and literals
// ═══════════════════════════════════════════════════════════════════
//
//  Variables arrive as JSON and are coerced against the operation's
//  variable definitions once per request. Arguments are literals in
//  the document, possibly referring to those variables, and are
//  coerced per field against the declared argument definitions.
//
//  Omitted nullable inputs without a default stay absent from the
//  result object; an explicit null stays null.
// ═══════════════════════════════════════════════════════════════════

#include "ast.h"
#include "errors.h"
#include "json_utils.h"
#include "schema.h"
#include <optional>
#include <string>
#include <vector>

namespace gqlpp {

// JSON input → runtime value of type. Throws CoercionError.
Json coerceInputValue(const Json& value, const TypeRef& type, const Schema& schema);

// Literal → runtime value of type, reading already coerced variables.
// Returns nullopt when the literal is a variable with no runtime value.
// Throws CoercionError.
std::optional<Json> valueFromAst(const ast::Value& literal, const TypeRef& type,
                                 const Schema& schema, const Json& variables);

struct CoercedVariables {
    Json values = Json::object();
    std::vector<GraphQLError> errors;

    bool ok() const { return errors.empty(); }
};

// Every problem with every variable is reported, not only the first one
CoercedVariables coerceVariableValues(const Schema& schema,
                                      const ast::OperationDefinition& operation,
                                      const Json& inputs);

// Field or directive arguments. Throws CoercionError naming the argument.
Json coerceArguments(const std::vector<InputValueDefinition>& definitions,
                     const std::vector<ast::Argument>& arguments,
                     const Schema& schema, const Json& variables);

// Runtime value printed as a GraphQL literal, e.g. for introspected defaults
std::string printInputValue(const Json& value, const TypeRef& type, const Schema& schema);

} // namespace gqlpp
