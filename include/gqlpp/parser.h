#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/parser.h — Recursive-descent parser for executable documents
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    ast::Document doc = gqlpp::parse("query Q($id: Int!) { user(id: $id) { name } }");
//
//  One member function per grammar production. The parser keeps one
//  token of lookahead; "..." is disambiguated by the token after it.
//  Throws LexError or ParseError. Selection sets, list and object
//  values and list types may nest at most maxDepth levels.
// ═══════════════════════════════════════════════════════════════════

#include "ast.h"
#include "lexer.h"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace gqlpp {

class Parser {
public:
    static constexpr std::size_t DefaultMaxDepth = 256;

    explicit Parser(std::string_view source, std::size_t maxDepth = DefaultMaxDepth);

    ast::Document parseDocument();

    // Single type reference, e.g. "[Int!]!", consuming the whole input
    TypeRef parseTypeOnly();
    // Single value literal consuming the whole input
    ast::Value parseValueOnly(bool isConst);

private:
    Lexer lexer_;
    Token token_;
    std::size_t maxDepth_;
    std::size_t depth_ = 0;

    // Held for the duration of one nested production
    class Nesting {
    public:
        explicit Nesting(Parser& parser);
        ~Nesting() { --parser_.depth_; }
        Nesting(const Nesting&) = delete;
        Nesting& operator=(const Nesting&) = delete;

    private:
        Parser& parser_;
    };

    // ── Token helpers ──
    void advance();
    bool peek(TokenKind kind) const { return token_.kind == kind; }
    bool peekKeyword(const char* keyword) const;
    bool skip(TokenKind kind);
    Token expect(TokenKind kind);
    void expectKeyword(const char* keyword);
    std::string parseName();
    [[noreturn]] void unexpected(const std::string& expected) const;

    // ── Productions ──
    void parseDefinition(ast::Document& doc);
    ast::OperationDefinition parseOperationDefinition();
    ast::OperationType parseOperationType();
    std::vector<ast::VariableDefinition> parseVariableDefinitions();
    ast::VariableDefinition parseVariableDefinition();
    std::string parseVariable();
    ast::SelectionSet parseSelectionSet();
    ast::Selection parseSelection();
    ast::Field parseField();
    std::vector<ast::Argument> parseArguments(bool isConst);
    ast::Argument parseArgument(bool isConst);
    ast::Selection parseFragment();
    ast::FragmentSpread parseFragmentSpread(Location start);
    ast::InlineFragment parseInlineFragment(Location start);
    ast::FragmentDefinition parseFragmentDefinition();
    std::string parseFragmentName();
    ast::Value parseValue(bool isConst);
    ast::Value parseList(bool isConst);
    ast::Value parseObject(bool isConst);
    std::vector<ast::Directive> parseDirectives(bool isConst);
    ast::Directive parseDirective(bool isConst);
    TypeRef parseType();
};

// ── Convenience entry points ──
ast::Document parse(std::string_view source, std::size_t maxDepth = Parser::DefaultMaxDepth);
TypeRef parseType(std::string_view source);
ast::Value parseValue(std::string_view source, bool isConst = false);

} // namespace gqlpp
