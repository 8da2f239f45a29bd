// ═══════════════════════════════════════════════════════════════════
//  src/parser.cpp — Recursive-descent parser
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/parser.h"

namespace gqlpp {

namespace detail {

inline bool isTypeSystemKeyword(const std::string& name) {
    return name == "schema" || name == "scalar" || name == "type" ||
           name == "interface" || name == "union" || name == "enum" ||
           name == "input" || name == "directive" || name == "extend";
}

} // namespace detail

Parser::Parser(std::string_view source, std::size_t maxDepth)
    : lexer_(source)
    , token_(lexer_.next())
    , maxDepth_(maxDepth) {}

Parser::Nesting::Nesting(Parser& parser) : parser_(parser) {
    if (parser_.depth_ >= parser_.maxDepth_) {
        throw ParseError(parser_.token_.loc, "at most " + std::to_string(parser_.maxDepth_) + " levels of nesting",
                         "nesting too deep");
    }
    ++parser_.depth_;
}

// ═══════════════════════════════════════════
//  Token helpers
// ═══════════════════════════════════════════

void Parser::advance() {
    token_ = lexer_.next();
}

bool Parser::peekKeyword(const char* keyword) const {
    return token_.kind == TokenKind::Name && token_.value == keyword;
}

bool Parser::skip(TokenKind kind) {
    if (token_.kind != kind) return false;
    advance();
    return true;
}

Token Parser::expect(TokenKind kind) {
    if (token_.kind != kind) {
        if (kind == TokenKind::Name || kind == TokenKind::Eof) unexpected(toString(kind));
        unexpected(std::string("\"") + toString(kind) + "\"");
    }
    Token tok = std::move(token_);
    advance();
    return tok;
}

void Parser::expectKeyword(const char* keyword) {
    if (!peekKeyword(keyword)) unexpected(std::string("\"") + keyword + "\"");
    advance();
}

std::string Parser::parseName() {
    return expect(TokenKind::Name).value;
}

void Parser::unexpected(const std::string& expected) const {
    throw ParseError(token_.loc, expected, token_.describe());
}

// ═══════════════════════════════════════════
//  Document
// ═══════════════════════════════════════════

ast::Document Parser::parseDocument() {
    ast::Document doc;
    do {
        parseDefinition(doc);
    } while (!peek(TokenKind::Eof));

    if (doc.operations.size() > 1) {
        for (auto& op : doc.operations) {
            if (op.name.empty()) {
                throw ParseError(op.loc, "named operation",
                                 "anonymous operation in a document with " +
                                 std::to_string(doc.operations.size()) + " operations");
            }
        }
    }
    return doc;
}

void Parser::parseDefinition(ast::Document& doc) {
    if (peek(TokenKind::BraceL)) {
        doc.operations.push_back(parseOperationDefinition());
        return;
    }
    if (peek(TokenKind::Name)) {
        if (token_.value == "query" || token_.value == "mutation" || token_.value == "subscription") {
            doc.operations.push_back(parseOperationDefinition());
            return;
        }
        if (token_.value == "fragment") {
            doc.fragments.push_back(parseFragmentDefinition());
            return;
        }
        if (detail::isTypeSystemKeyword(token_.value)) {
            unexpected("executable definition");
        }
    }
    unexpected("Definition");
}

ast::OperationDefinition Parser::parseOperationDefinition() {
    ast::OperationDefinition op;
    op.loc = token_.loc;

    if (peek(TokenKind::BraceL)) {
        op.operation = ast::OperationType::Query;
        op.selectionSet = parseSelectionSet();
        return op;
    }

    op.operation = parseOperationType();
    if (peek(TokenKind::Name)) op.name = parseName();
    if (peek(TokenKind::ParenL)) op.variables = parseVariableDefinitions();
    op.directives = parseDirectives(false);
    op.selectionSet = parseSelectionSet();
    return op;
}

ast::OperationType Parser::parseOperationType() {
    if (peekKeyword("query")) { advance(); return ast::OperationType::Query; }
    if (peekKeyword("mutation")) { advance(); return ast::OperationType::Mutation; }
    if (peekKeyword("subscription")) { advance(); return ast::OperationType::Subscription; }
    unexpected("operation type");
}

std::vector<ast::VariableDefinition> Parser::parseVariableDefinitions() {
    std::vector<ast::VariableDefinition> defs;
    expect(TokenKind::ParenL);
    do {
        defs.push_back(parseVariableDefinition());
    } while (!skip(TokenKind::ParenR));
    return defs;
}

ast::VariableDefinition Parser::parseVariableDefinition() {
    ast::VariableDefinition def;
    def.loc = token_.loc;
    def.name = parseVariable();
    expect(TokenKind::Colon);
    def.type = parseType();
    if (skip(TokenKind::Equals)) {
        def.defaultValue = parseValue(true);
    }
    def.directives = parseDirectives(true);
    return def;
}

std::string Parser::parseVariable() {
    expect(TokenKind::Dollar);
    return parseName();
}

// ═══════════════════════════════════════════
//  Selections
// ═══════════════════════════════════════════

ast::SelectionSet Parser::parseSelectionSet() {
    Nesting nesting(*this);
    ast::SelectionSet set;
    set.loc = token_.loc;
    expect(TokenKind::BraceL);
    do {
        set.selections.push_back(parseSelection());
    } while (!skip(TokenKind::BraceR));
    return set;
}

ast::Selection Parser::parseSelection() {
    if (peek(TokenKind::Spread)) return parseFragment();
    return ast::Selection(parseField());
}

ast::Field Parser::parseField() {
    ast::Field field;
    field.loc = token_.loc;

    std::string nameOrAlias = parseName();
    if (skip(TokenKind::Colon)) {
        field.alias = std::move(nameOrAlias);
        field.name = parseName();
    } else {
        field.name = std::move(nameOrAlias);
    }

    if (peek(TokenKind::ParenL)) field.arguments = parseArguments(false);
    field.directives = parseDirectives(false);
    if (peek(TokenKind::BraceL)) field.selectionSet = parseSelectionSet();
    return field;
}

std::vector<ast::Argument> Parser::parseArguments(bool isConst) {
    std::vector<ast::Argument> args;
    expect(TokenKind::ParenL);
    do {
        args.push_back(parseArgument(isConst));
    } while (!skip(TokenKind::ParenR));
    return args;
}

ast::Argument Parser::parseArgument(bool isConst) {
    ast::Argument arg;
    arg.loc = token_.loc;
    arg.name = parseName();
    expect(TokenKind::Colon);
    arg.value = parseValue(isConst);
    return arg;
}

// "..." followed by "on", "@" or "{" starts an inline fragment,
// any other name is a fragment spread.
ast::Selection Parser::parseFragment() {
    Location start = token_.loc;
    expect(TokenKind::Spread);
    if (peek(TokenKind::Name) && !peekKeyword("on")) {
        return ast::Selection(parseFragmentSpread(start));
    }
    return ast::Selection(parseInlineFragment(start));
}

ast::FragmentSpread Parser::parseFragmentSpread(Location start) {
    ast::FragmentSpread spread;
    spread.loc = start;
    spread.name = parseFragmentName();
    spread.directives = parseDirectives(false);
    return spread;
}

ast::InlineFragment Parser::parseInlineFragment(Location start) {
    ast::InlineFragment fragment;
    fragment.loc = start;
    if (peekKeyword("on")) {
        advance();
        fragment.typeCondition = parseName();
    }
    fragment.directives = parseDirectives(false);
    fragment.selectionSet = parseSelectionSet();
    return fragment;
}

ast::FragmentDefinition Parser::parseFragmentDefinition() {
    ast::FragmentDefinition fragment;
    fragment.loc = token_.loc;
    expectKeyword("fragment");
    fragment.name = parseFragmentName();
    expectKeyword("on");
    fragment.typeCondition = parseName();
    fragment.directives = parseDirectives(false);
    fragment.selectionSet = parseSelectionSet();
    return fragment;
}

std::string Parser::parseFragmentName() {
    if (peekKeyword("on")) unexpected("fragment name");
    return parseName();
}

// ═══════════════════════════════════════════
//  Values
// ═══════════════════════════════════════════

ast::Value Parser::parseValue(bool isConst) {
    Location loc = token_.loc;
    switch (token_.kind) {
        case TokenKind::BracketL:
            return parseList(isConst);
        case TokenKind::BraceL:
            return parseObject(isConst);
        case TokenKind::Int: {
            auto text = expect(TokenKind::Int).value;
            return ast::Value::makeInt(std::move(text), loc);
        }
        case TokenKind::Float: {
            auto text = expect(TokenKind::Float).value;
            return ast::Value::makeFloat(std::move(text), loc);
        }
        case TokenKind::String:
        case TokenKind::BlockString: {
            bool block = peek(TokenKind::BlockString);
            auto value = ast::Value::makeString(token_.value, loc);
            value.block = block;
            advance();
            return value;
        }
        case TokenKind::Name: {
            auto name = parseName();
            if (name == "true") return ast::Value::makeBoolean(true, loc);
            if (name == "false") return ast::Value::makeBoolean(false, loc);
            if (name == "null") return ast::Value::makeNull(loc);
            return ast::Value::makeEnum(std::move(name), loc);
        }
        case TokenKind::Dollar:
            if (!isConst) return ast::Value::makeVariable(parseVariable(), loc);
            unexpected("constant value");
        default:
            unexpected("value");
    }
}

ast::Value Parser::parseList(bool isConst) {
    Nesting nesting(*this);
    Location loc = token_.loc;
    expect(TokenKind::BracketL);
    std::vector<ast::Value> items;
    while (!skip(TokenKind::BracketR)) {
        items.push_back(parseValue(isConst));
    }
    return ast::Value::makeList(std::move(items), loc);
}

ast::Value Parser::parseObject(bool isConst) {
    Nesting nesting(*this);
    Location loc = token_.loc;
    expect(TokenKind::BraceL);
    std::vector<ast::ObjectField> fields;
    while (!skip(TokenKind::BraceR)) {
        ast::ObjectField field;
        field.loc = token_.loc;
        field.name = parseName();
        expect(TokenKind::Colon);
        field.value = parseValue(isConst);
        fields.push_back(std::move(field));
    }
    return ast::Value::makeObject(std::move(fields), loc);
}

// ═══════════════════════════════════════════
//  Directives and types
// ═══════════════════════════════════════════

std::vector<ast::Directive> Parser::parseDirectives(bool isConst) {
    std::vector<ast::Directive> directives;
    while (peek(TokenKind::At)) {
        directives.push_back(parseDirective(isConst));
    }
    return directives;
}

ast::Directive Parser::parseDirective(bool isConst) {
    ast::Directive directive;
    directive.loc = token_.loc;
    expect(TokenKind::At);
    directive.name = parseName();
    if (peek(TokenKind::ParenL)) directive.arguments = parseArguments(isConst);
    return directive;
}

TypeRef Parser::parseType() {
    Nesting nesting(*this);
    TypeRef type;
    if (skip(TokenKind::BracketL)) {
        TypeRef inner = parseType();
        expect(TokenKind::BracketR);
        type = TypeRef::list(std::move(inner));
    } else {
        type = TypeRef::named(parseName());
    }
    if (skip(TokenKind::Bang)) {
        type = TypeRef::nonNull(std::move(type));
    }
    return type;
}

TypeRef Parser::parseTypeOnly() {
    TypeRef type = parseType();
    expect(TokenKind::Eof);
    return type;
}

ast::Value Parser::parseValueOnly(bool isConst) {
    ast::Value value = parseValue(isConst);
    expect(TokenKind::Eof);
    return value;
}

// ═══════════════════════════════════════════
//  Entry points
// ═══════════════════════════════════════════

ast::Document parse(std::string_view source, std::size_t maxDepth) {
    Parser parser(source, maxDepth);
    return parser.parseDocument();
}

TypeRef parseType(std::string_view source) {
    Parser parser(source);
    return parser.parseTypeOnly();
}

ast::Value parseValue(std::string_view source, bool isConst) {
    Parser parser(source);
    return parser.parseValueOnly(isConst);
}

} // namespace gqlpp
