// ═══════════════════════════════════════════════════════════════════
//  test_parser.cpp — Document parsing tests
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include "gqlpp/parser.h"
#include <string>

using namespace gqlpp;

namespace {

ParseError parseFailure(std::string_view source) {
    try {
        parse(source);
    } catch (const ParseError& e) {
        return e;
    }
    ADD_FAILURE() << "expected a ParseError for: " << source;
    return ParseError({}, "", "");
}

} // namespace

// ═══════════════════════════════════════════
//  Operations
// ═══════════════════════════════════════════

TEST(ParserTest, QueryShorthand) {
    auto doc = parse("{ user }");
    ASSERT_EQ(doc.operations.size(), 1u);
    auto& op = doc.operations[0];
    EXPECT_EQ(op.operation, ast::OperationType::Query);
    EXPECT_TRUE(op.name.empty());
    ASSERT_EQ(op.selectionSet.size(), 1u);
    EXPECT_EQ(op.selectionSet.selections[0].field()->name, "user");
}

TEST(ParserTest, NamedOperationsWithVariables) {
    auto doc = parse(R"(
        query GetUser($id: Int! = 1, $tags: [String!]) @cached {
            user(id: $id) { name }
        }
        mutation Bump { increment }
        subscription OnEvent { event }
    )");
    ASSERT_EQ(doc.operations.size(), 3u);

    auto& query = doc.operations[0];
    EXPECT_EQ(query.name, "GetUser");
    ASSERT_EQ(query.variables.size(), 2u);
    EXPECT_EQ(query.variables[0].name, "id");
    EXPECT_EQ(query.variables[0].type.toString(), "Int!");
    ASSERT_TRUE(query.variables[0].defaultValue.has_value());
    EXPECT_EQ(query.variables[0].defaultValue->text, "1");
    EXPECT_EQ(query.variables[1].type.toString(), "[String!]");
    ASSERT_EQ(query.directives.size(), 1u);
    EXPECT_EQ(query.directives[0].name, "cached");

    EXPECT_EQ(doc.operations[1].operation, ast::OperationType::Mutation);
    EXPECT_EQ(doc.operations[2].operation, ast::OperationType::Subscription);
}

TEST(ParserTest, AliasesArgumentsAndNestedSelections) {
    auto doc = parse(R"({ me: user(id: 4, filter: {active: true, tags: ["a", B]}) { friends { name } } })");
    auto* field = doc.operations[0].selectionSet.selections[0].field();
    ASSERT_NE(field, nullptr);
    EXPECT_EQ(field->alias, "me");
    EXPECT_EQ(field->name, "user");
    EXPECT_EQ(field->responseKey(), "me");
    ASSERT_EQ(field->arguments.size(), 2u);

    auto* filter = field->argument("filter");
    ASSERT_NE(filter, nullptr);
    EXPECT_EQ(filter->value.kind, ast::Value::Kind::Object);
    auto* tags = filter->value.field("tags");
    ASSERT_NE(tags, nullptr);
    ASSERT_EQ(tags->list.size(), 2u);
    EXPECT_EQ(tags->list[0].kind, ast::Value::Kind::String);
    EXPECT_EQ(tags->list[1].kind, ast::Value::Kind::Enum);

    auto* friends = field->selectionSet.selections[0].field();
    ASSERT_NE(friends, nullptr);
    EXPECT_EQ(friends->selectionSet.selections[0].field()->name, "name");
}

TEST(ParserTest, ValueKinds) {
    auto v = parseValue(R"([1, 2.5, "s", true, null, RED, $var, {a: 1}])");
    ASSERT_EQ(v.list.size(), 8u);
    EXPECT_EQ(v.list[0].kind, ast::Value::Kind::Int);
    EXPECT_EQ(v.list[1].kind, ast::Value::Kind::Float);
    EXPECT_EQ(v.list[2].kind, ast::Value::Kind::String);
    EXPECT_EQ(v.list[3].kind, ast::Value::Kind::Boolean);
    EXPECT_TRUE(v.list[3].boolean);
    EXPECT_EQ(v.list[4].kind, ast::Value::Kind::Null);
    EXPECT_EQ(v.list[5].kind, ast::Value::Kind::Enum);
    EXPECT_EQ(v.list[6].kind, ast::Value::Kind::Variable);
    EXPECT_EQ(v.list[6].text, "var");
    EXPECT_EQ(v.list[7].kind, ast::Value::Kind::Object);
}

TEST(ParserTest, ConstantValuesRejectVariables) {
    EXPECT_THROW(parseValue("$x", true), ParseError);
    EXPECT_THROW(parse("query Q($a: Int = $b) { f }"), ParseError);
}

// ═══════════════════════════════════════════
//  Fragments
// ═══════════════════════════════════════════

TEST(ParserTest, FragmentSpreadsAndInlineFragments) {
    auto doc = parse(R"(
        { node { ...UserFields ... on Post { title } ... @include(if: true) { id } } }
        fragment UserFields on User { name }
    )");
    ASSERT_EQ(doc.fragments.size(), 1u);
    EXPECT_EQ(doc.fragments[0].name, "UserFields");
    EXPECT_EQ(doc.fragments[0].typeCondition, "User");

    auto& selections = doc.operations[0].selectionSet.selections[0].field()->selectionSet.selections;
    ASSERT_EQ(selections.size(), 3u);
    ASSERT_NE(selections[0].fragmentSpread(), nullptr);
    EXPECT_EQ(selections[0].fragmentSpread()->name, "UserFields");
    ASSERT_NE(selections[1].inlineFragment(), nullptr);
    EXPECT_EQ(selections[1].inlineFragment()->typeCondition, "Post");
    ASSERT_NE(selections[2].inlineFragment(), nullptr);
    EXPECT_TRUE(selections[2].inlineFragment()->typeCondition.empty());
    EXPECT_EQ(selections[2].inlineFragment()->directives[0].name, "include");

    EXPECT_NE(doc.fragment("UserFields"), nullptr);
    EXPECT_EQ(doc.fragment("Missing"), nullptr);
}

TEST(ParserTest, FragmentCannotBeNamedOn) {
    auto e = parseFailure("fragment on on User { a }");
    EXPECT_EQ(e.expected(), "fragment name");
}

// ═══════════════════════════════════════════
//  Locations
// ═══════════════════════════════════════════

TEST(ParserTest, NodesCarryLocations) {
    auto doc = parse("query Q {\n  a\n  b(x: 1)\n}");
    auto& op = doc.operations[0];
    EXPECT_EQ(op.loc, (Location{1, 1}));
    EXPECT_EQ(op.selectionSet.selections[0].field()->loc, (Location{2, 3}));
    auto* b = op.selectionSet.selections[1].field();
    EXPECT_EQ(b->loc, (Location{3, 3}));
    EXPECT_EQ(b->arguments[0].loc, (Location{3, 5}));
    EXPECT_EQ(b->arguments[0].value.loc, (Location{3, 8}));
}

// ═══════════════════════════════════════════
//  Errors
// ═══════════════════════════════════════════

TEST(ParserTest, UnclosedSelectionSet) {
    auto e = parseFailure("{ user");
    EXPECT_EQ(e.expected(), "Name");
    EXPECT_EQ(e.found(), "<EOF>");
    EXPECT_EQ(e.message(), "Syntax Error: Expected Name, found <EOF>.");
}

TEST(ParserTest, EmptySelectionSet) {
    auto e = parseFailure("{ }");
    EXPECT_EQ(e.expected(), "Name");
    EXPECT_EQ(e.found(), "\"}\"");
    EXPECT_EQ(e.location(), (Location{1, 3}));
}

TEST(ParserTest, EmptyDocument) {
    auto e = parseFailure("");
    EXPECT_EQ(e.expected(), "Definition");
}

TEST(ParserTest, TypeSystemDefinitionsAreRejected) {
    auto e = parseFailure("type User { id: ID }");
    EXPECT_EQ(e.expected(), "executable definition");
}

TEST(ParserTest, MissingColonInArgument) {
    auto e = parseFailure("{ user(id 1) }");
    EXPECT_EQ(e.expected(), "\":\"");
    EXPECT_EQ(e.found(), "Int \"1\"");
}

TEST(ParserTest, TrailingTokensAreRejected) {
    auto brace = parseFailure("{ a } }");
    EXPECT_EQ(brace.expected(), "Definition");
    EXPECT_EQ(brace.found(), "\"}\"");
    EXPECT_EQ(brace.location(), (Location{1, 7}));

    auto name = parseFailure("query Q { a } extra");
    EXPECT_EQ(name.expected(), "Definition");
    EXPECT_EQ(name.found(), "Name \"extra\"");
    EXPECT_EQ(name.message(), "Syntax Error: Expected Definition, found Name \"extra\".");
}

TEST(ParserTest, NestingDepthIsLimited) {
    auto lists = parseFailure("{ a(x: " + std::string(200000, '[') + ") }");
    EXPECT_EQ(lists.expected(), "at most 256 levels of nesting");
    EXPECT_EQ(lists.found(), "nesting too deep");
    EXPECT_EQ(lists.location(), (Location{1, 263}));

    EXPECT_NO_THROW(parse("{ a { b { c } } }", 3));
    EXPECT_THROW(parse("{ a { b { c { d } } } }", 3), ParseError);
    EXPECT_NO_THROW(parse("{ a(x: {y: [1]}) }", 3));
    EXPECT_THROW(parse("{ a { b(x: {y: [1]}) } }", 3), ParseError);
    EXPECT_THROW(parseType(std::string(300, '[') + "Int" + std::string(300, ']')), ParseError);
}

TEST(ParserTest, AnonymousOperationMustBeAlone) {
    EXPECT_THROW(parse("{ a } query B { b }"), ParseError);
}

TEST(ParserTest, LexErrorsPropagate) {
    EXPECT_THROW(parse("{ a ^ }"), LexError);
}

// ═══════════════════════════════════════════
//  Type references and operation selection
// ═══════════════════════════════════════════

TEST(ParserTest, TypeReferences) {
    auto t = parseType("[User!]!");
    EXPECT_TRUE(t.isNonNull());
    EXPECT_TRUE(t.ofType().isList());
    EXPECT_TRUE(t.ofType().ofType().isNonNull());
    EXPECT_EQ(t.namedType(), "User");
    EXPECT_EQ(t.toString(), "[User!]!");
    EXPECT_EQ(TypeRef::parse("Int"), TypeRef::named("Int"));
    EXPECT_THROW(parseType("Int!!"), ParseError);
}

TEST(ParserTest, OperationSelection) {
    auto doc = parse("query A { a } query B { b }");
    EXPECT_EQ(doc.operation("B").name, "B");
    EXPECT_THROW(doc.operation(""), GraphQLError);
    EXPECT_THROW(doc.operation("C"), GraphQLError);

    auto single = parse("{ a }");
    EXPECT_NO_THROW(single.operation(""));
}
