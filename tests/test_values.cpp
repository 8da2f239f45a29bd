// ═══════════════════════════════════════════════════════════════════
//  test_values.cpp — Variable, argument and input coercion
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include "gqlpp/parser.h"
#include "gqlpp/scalars.h"
#include "gqlpp/values.h"
#include <string>

using namespace gqlpp;

namespace {

std::shared_ptr<const Schema> inputSchema() {
    static std::shared_ptr<const Schema> schema = [] {
        auto s = std::make_shared<Schema>();
        s->enumType("Order", {"ASC", "DESC"});
        s->inputObject("Page")
            .field("first", "Int!")
            .field("order", "Order", Json("ASC"))
            .field("after", "String");
        s->object("Query")
            .field("items", "[String]")
                .arg("page", "Page")
                .arg("ids", "[ID!]")
                .arg("limit", "Int", Json(10))
                .arg("ratio", "Float!");
        s->setQueryType("Query");
        s->finalize();
        return s;
    }();
    return schema;
}

TypeRef t(const char* source) { return TypeRef::parse(source); }

std::string coercionError(const Json& value, const char* type) {
    try {
        coerceInputValue(value, t(type), *inputSchema());
    } catch (const CoercionError& e) {
        return e.what();
    }
    ADD_FAILURE() << "expected a CoercionError for " << value.dump() << " as " << type;
    return "";
}

} // namespace

// ═══════════════════════════════════════════
//  JSON inputs
// ═══════════════════════════════════════════

TEST(ValuesTest, ScalarsAndEnums) {
    auto& schema = *inputSchema();
    EXPECT_EQ(coerceInputValue(4, t("Int"), schema), Json(4));
    EXPECT_EQ(coerceInputValue(4, t("Float"), schema), Json(4.0));
    EXPECT_EQ(coerceInputValue(7, t("ID"), schema), Json("7"));
    EXPECT_EQ(coerceInputValue("DESC", t("Order"), schema), Json("DESC"));
    EXPECT_TRUE(coerceInputValue(nullptr, t("Int"), schema).is_null());
}

TEST(ValuesTest, SingleValueIsWrappedInAList) {
    auto& schema = *inputSchema();
    EXPECT_EQ(coerceInputValue(3, t("[Int]"), schema), Json::array({3}));
    EXPECT_EQ(coerceInputValue(Json::array({1, 2}), t("[Int!]!"), schema), Json::array({1, 2}));
}

TEST(ValuesTest, InputObjectsApplyDefaults) {
    auto coerced = coerceInputValue({{"first", 5}}, t("Page"), *inputSchema());
    EXPECT_EQ(coerced.dump(), R"({"first":5,"order":"ASC"})");

    coerced = coerceInputValue({{"first", 5}, {"after", nullptr}}, t("Page"), *inputSchema());
    EXPECT_EQ(coerced.dump(), R"({"first":5,"order":"ASC","after":null})");
}

TEST(ValuesTest, InputErrorsNameThePath) {
    EXPECT_EQ(coercionError(nullptr, "Int!"), "Expected non-nullable type \"Int!\" not to be null.");
    EXPECT_EQ(coercionError("x", "Int"), "Int cannot represent value: \"x\"");
    EXPECT_EQ(coercionError(Json::array({1, "b"}), "[Int]"), "Int cannot represent value: \"b\" at \"[1]\"");
    EXPECT_EQ(coercionError(Json::object(), "Page"), "Field \"first\" of required type \"Int!\" was not provided.");
    EXPECT_EQ(coercionError({{"first", 1}, {"extra", 2}}, "Page"),
              "Field \"extra\" is not defined by type \"Page\".");
    EXPECT_EQ(coercionError({{"first", 1}, {"order", "UP"}}, "Page"),
              "Value \"UP\" does not exist in \"Order\" enum at \"order\".");
    EXPECT_EQ(coercionError(3, "Page"), "Expected type \"Page\" to be an object.");
}

TEST(ValuesTest, DecimalScalar) {
    auto decimal = scalars::decimalType();
    EXPECT_EQ(decimal.parseValue("12.50"), Json("12.50"));
    EXPECT_EQ(decimal.parseValue("+007.5"), Json("7.5"));
    EXPECT_EQ(decimal.parseValue("-0.00"), Json("0.00"));
    EXPECT_EQ(decimal.parseValue(".5"), Json("0.5"));
    EXPECT_EQ(decimal.parseValue(std::string(28, '9')), Json(std::string(28, '9')));
    EXPECT_THROW(decimal.parseValue("5."), CoercionError);
    EXPECT_THROW(decimal.parseValue("1e3"), CoercionError);
    EXPECT_THROW(decimal.parseValue(std::string(29, '9')), CoercionError);
    EXPECT_THROW(decimal.parseValue("0." + std::string(29, '0')), CoercionError);

    EXPECT_EQ(decimal.serialize(12), Json("12"));
    EXPECT_EQ(decimal.serialize(2.5), Json("2.5"));
    EXPECT_EQ(decimal.serialize("003"), Json("3"));
    EXPECT_THROW(decimal.serialize(true), CoercionError);

    EXPECT_EQ(decimal.parseLiteral(parseValue("\"1.10\"")), Json("1.10"));
    try {
        decimal.parseLiteral(parseValue("1.1"));
        FAIL() << "expected a CoercionError";
    } catch (const CoercionError& e) {
        EXPECT_STREQ(e.what(), "Decimal cannot represent a non Decimal value: 1.1");
    }

    Schema schema;
    schema.scalar("Decimal", scalars::decimalType(), scalars::kDecimalDescription);
    schema.object("Query").field("price", "Decimal").arg("at", "Decimal");
    schema.setQueryType("Query");
    schema.finalize();
    EXPECT_EQ(coerceInputValue("0099.90", t("Decimal"), schema), Json("99.90"));
    try {
        coerceInputValue(1.5, t("Decimal"), schema);
        FAIL() << "expected a CoercionError";
    } catch (const CoercionError& e) {
        EXPECT_STREQ(e.what(), "Decimal cannot represent value: 1.5");
    }
}

// ═══════════════════════════════════════════
//  Variables
// ═══════════════════════════════════════════

TEST(ValuesTest, VariableValues) {
    auto doc = parse("query($page: Page, $limit: Int = 5, $ids: [ID!], $missing: String) { items }");
    auto coerced = coerceVariableValues(*inputSchema(), doc.operations[0],
                                        {{"page", {{"first", 2}}}, {"ids", 9}});
    ASSERT_TRUE(coerced.ok());
    EXPECT_EQ(coerced.values.dump(), R"({"page":{"first":2,"order":"ASC"},"limit":5,"ids":["9"]})");
}

TEST(ValuesTest, EveryVariableProblemIsReported) {
    auto doc = parse("query($a: Int!, $b: Int!, $c: Page, $d: Int = \"x\") { items }");
    auto coerced = coerceVariableValues(*inputSchema(), doc.operations[0],
                                        {{"b", nullptr}, {"c", {{"first", "two"}}}});
    ASSERT_EQ(coerced.errors.size(), 4u);
    EXPECT_EQ(coerced.errors[0].message(), "Variable \"$a\" of required type \"Int!\" was not provided.");
    EXPECT_EQ(coerced.errors[1].message(), "Variable \"$b\" of non-null type \"Int!\" must not be null.");
    EXPECT_EQ(coerced.errors[2].message(),
              "Variable \"$c\" got invalid value {\"first\":\"two\"}; "
              "Int cannot represent value: \"two\" at \"first\"");
    EXPECT_EQ(coerced.errors[3].message(),
              "Variable \"$d\" has invalid default value: Int cannot represent a non Int value: \"x\"");
    EXPECT_EQ(coerced.errors[0].locations()[0], (Location{1, 7}));
}

TEST(ValuesTest, OutputTypeVariableIsRejected) {
    Schema schema;
    schema.object("Thing").field("a", "Int");
    schema.object("Query").field("thing", "Thing");
    schema.setQueryType("Query");
    schema.finalize();

    auto doc = parse("query($t: Thing) { thing { a } }");
    auto coerced = coerceVariableValues(schema, doc.operations[0], {{"t", {{"a", 1}}}});
    ASSERT_EQ(coerced.errors.size(), 1u);
    EXPECT_EQ(coerced.errors[0].message(),
              "Variable \"$t\" expected value of type \"Thing\" which cannot be used as an input type.");
}

// ═══════════════════════════════════════════
//  Literals and arguments
// ═══════════════════════════════════════════

TEST(ValuesTest, LiteralsReadVariables) {
    auto& schema = *inputSchema();
    Json variables = {{"n", 3}, {"none", nullptr}};

    EXPECT_EQ(valueFromAst(parseValue("[1, $n]"), t("[Int]"), schema, variables)->dump(), "[1,3]");
    EXPECT_FALSE(valueFromAst(parseValue("$absent"), t("Int"), schema, variables).has_value());
    EXPECT_EQ(valueFromAst(parseValue("[$absent]"), t("[Int]"), schema, variables)->dump(), "[null]");
    EXPECT_THROW(valueFromAst(parseValue("$none"), t("Int!"), schema, variables), CoercionError);
    EXPECT_THROW(valueFromAst(parseValue("[$absent]"), t("[Int!]"), schema, variables), CoercionError);
    EXPECT_EQ(valueFromAst(parseValue("{first: $n}"), t("Page"), schema, variables)->dump(),
              R"({"first":3,"order":"ASC"})");
}

TEST(ValuesTest, ArgumentsApplyDefaultsAndRequireNonNull) {
    auto& schema = *inputSchema();
    auto* items = schema.queryType()->field("items");
    ASSERT_NE(items, nullptr);

    auto doc = parse("{ items(ratio: 0.5, ids: [1, \"b\"]) }");
    auto& arguments = doc.operations[0].selectionSet.selections[0].field()->arguments;
    auto args = coerceArguments(items->arguments, arguments, schema, Json::object());
    EXPECT_EQ(args.dump(), R"({"ids":["1","b"],"limit":10,"ratio":0.5})");

    auto missing = parse("{ items }");
    try {
        coerceArguments(items->arguments, missing.operations[0].selectionSet.selections[0].field()->arguments,
                        schema, Json::object());
        FAIL() << "expected a CoercionError";
    } catch (const CoercionError& e) {
        EXPECT_STREQ(e.what(), "Argument \"ratio\" of required type \"Float!\" was not provided.");
    }

    auto unset = parse("query($r: Float) { items(ratio: $r) }");
    try {
        coerceArguments(items->arguments, unset.operations[0].selectionSet.selections[0].field()->arguments,
                        schema, Json::object());
        FAIL() << "expected a CoercionError";
    } catch (const CoercionError& e) {
        EXPECT_STREQ(e.what(), "Argument \"ratio\" of required type \"Float!\" was provided the variable "
                               "\"$r\" which was not provided a runtime value.");
    }

    auto bad = parse("{ items(ratio: \"half\") }");
    try {
        coerceArguments(items->arguments, bad.operations[0].selectionSet.selections[0].field()->arguments,
                        schema, Json::object());
        FAIL() << "expected a CoercionError";
    } catch (const CoercionError& e) {
        EXPECT_STREQ(e.what(), "Argument \"ratio\" has invalid value \"half\". "
                               "Float cannot represent a non Float value: \"half\"");
    }
}

// ═══════════════════════════════════════════
//  Printing runtime values as literals
// ═══════════════════════════════════════════

TEST(ValuesTest, PrintInputValue) {
    auto& schema = *inputSchema();
    EXPECT_EQ(printInputValue(10, t("Int"), schema), "10");
    EXPECT_EQ(printInputValue("ASC", t("Order!"), schema), "ASC");
    EXPECT_EQ(printInputValue("a\"b", t("String"), schema), "\"a\\\"b\"");
    EXPECT_EQ(printInputValue(Json::array({"x", nullptr}), t("[String]"), schema), "[\"x\", null]");
    EXPECT_EQ(printInputValue({{"first", 1}, {"order", "DESC"}}, t("Page"), schema), "{first: 1, order: DESC}");
    EXPECT_EQ(printInputValue(nullptr, t("Page"), schema), "null");
}
