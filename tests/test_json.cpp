// ═══════════════════════════════════════════════════════════════════
//  test_json.cpp — Runtime value helpers
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include "gqlpp/json_utils.h"
#include <limits>
#include <string>
#include <vector>

using namespace gqlpp;

// ── Host structs with GQLPP_SERIALIZE ──
struct Author {
    std::string name;
    int id;
    GQLPP_SERIALIZE(Author, name, id)
};

struct Post {
    std::string title;
    std::vector<std::string> tags;
    Author author;
    GQLPP_SERIALIZE(Post, title, tags, author)
};

// ═══════════════════════════════════════════
//  Serialization
// ═══════════════════════════════════════════

TEST(JsonTest, SerializeMacroKeepsDeclarationOrder) {
    Post post{"Hello", {"intro", "news"}, {"Ann", 1}};
    Json j = toJson(post);
    EXPECT_EQ(j.dump(), R"({"title":"Hello","tags":["intro","news"],"author":{"name":"Ann","id":1}})");
}

TEST(JsonTest, RoundTripThroughFromJson) {
    Json j = {{"name", "Bob"}, {"id", 7}};
    auto author = fromJson<Author>(j);
    EXPECT_EQ(author.name, "Bob");
    EXPECT_EQ(author.id, 7);
}

TEST(JsonTest, ObjectsKeepInsertionOrder) {
    Json j = Json::object();
    j["zebra"] = 1;
    j["apple"] = 2;
    j["mango"] = 3;
    EXPECT_EQ(j.dump(), R"({"zebra":1,"apple":2,"mango":3})");
}

// ═══════════════════════════════════════════
//  Inspection helpers
// ═══════════════════════════════════════════

TEST(JsonTest, TypeNames) {
    EXPECT_EQ(jsonTypeName(nullptr), "null");
    EXPECT_EQ(jsonTypeName(true), "Boolean");
    EXPECT_EQ(jsonTypeName(3), "Int");
    EXPECT_EQ(jsonTypeName(3u), "Int");
    EXPECT_EQ(jsonTypeName(2.5), "Float");
    EXPECT_EQ(jsonTypeName("s"), "String");
    EXPECT_EQ(jsonTypeName(Json::array()), "List");
    EXPECT_EQ(jsonTypeName(Json::object()), "Object");
}

TEST(JsonTest, IntegralValues) {
    EXPECT_TRUE(isIntegral(4));
    EXPECT_TRUE(isIntegral(4.0));
    EXPECT_FALSE(isIntegral(4.5));
    EXPECT_FALSE(isIntegral(std::numeric_limits<double>::infinity()));
    EXPECT_FALSE(isIntegral("4"));
    EXPECT_FALSE(isIntegral(nullptr));
}

TEST(JsonTest, Int32Range) {
    EXPECT_TRUE(fitsInt32(0));
    EXPECT_TRUE(fitsInt32(2147483647));
    EXPECT_TRUE(fitsInt32(-2147483648LL));
    EXPECT_TRUE(fitsInt32(12.0));
    EXPECT_FALSE(fitsInt32(2147483648LL));
    EXPECT_FALSE(fitsInt32(-2147483649LL));
    EXPECT_FALSE(fitsInt32(std::numeric_limits<std::uint64_t>::max()));
    EXPECT_FALSE(fitsInt32(1.5));
    EXPECT_FALSE(fitsInt32(true));
}
