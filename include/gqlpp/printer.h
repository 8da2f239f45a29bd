#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/printer.h — AST back to GraphQL source
// ═══════════════════════════════════════════════════════════════════
//
//  print(parse(text)) is parseable again and yields an equal AST.
//
// ═══════════════════════════════════════════════════════════════════

#include "ast.h"
#include <string>

namespace gqlpp {

std::string print(const ast::Document& document);
std::string print(const ast::Value& value);
std::string print(const ast::SelectionSet& selectionSet);

// Quoted, escaped GraphQL string literal
std::string printString(const std::string& value);
// Triple-quoted form; falls back to printString when the value would not
// read back unchanged
std::string printBlockString(const std::string& value);

} // namespace gqlpp
