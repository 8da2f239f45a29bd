// ═══════════════════════════════════════════════════════════════════
//  blog_query.cpp — A small blog schema queried through gqlpp
// ═══════════════════════════════════════════════════════════════════
//
//  This example demonstrates:
//    • Defining object, interface and enum types with resolvers
//    • Host structs turned into resolver results with GQLPP_SERIALIZE
//    • An asynchronous resolver finishing on another thread
//    • Serial mutations, field errors and request errors
//    • Cache hints and a per-request timeout
//
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/gqlpp.h"
#include <mutex>
#include <thread>
#include <vector>

using namespace gqlpp;

struct Author {
    int id;
    std::string name;
    GQLPP_SERIALIZE(Author, id, name)
};

struct Post {
    int id;
    std::string title;
    std::string status;
    int authorId;
    std::string price;
    GQLPP_SERIALIZE(Post, id, title, status, authorId, price)
};

static std::mutex store;
static std::vector<Author> authors = {{1, "Ann"}, {2, "Bob"}};
static std::vector<Post> posts = {
    {1, "Hello, world", "PUBLISHED", 1, "0"},
    {2, "Drafting in public", "DRAFT", 2, "4.99"},
};

static Json findAuthor(int id) {
    std::lock_guard<std::mutex> lock(store);
    for (auto& a : authors) {
        if (a.id == id) return a;
    }
    return nullptr;
}

std::shared_ptr<const Schema> buildSchema() {
    auto schema = std::make_shared<Schema>();

    schema->enumType("Status", {"DRAFT", "PUBLISHED"});
    schema->scalar("Decimal", scalars::decimalType(), scalars::kDecimalDescription);

    schema->interfaceType("Node")
        .describe("Anything with a global id")
        .field("id", "Int!")
        .resolveType([](const Json& value, const ResolveInfo&) -> std::string {
            return value.contains("title") ? "Post" : "Author";
        });

    schema->object("Author")
        .implements("Node")
        .field("id", "Int!")
        .field("name", "String!")
        .field("posts", "[Post!]!", [](const ResolveInfo& info) -> Json {
            std::lock_guard<std::mutex> lock(store);
            Json list = Json::array();
            for (auto& p : posts) {
                if (p.authorId == info.parent()["id"].get<int>()) list.push_back(p);
            }
            return list;
        });

    schema->object("Post")
        .implements("Node")
        .cacheControl({true, 300})
        .field("id", "Int!")
        .field("title", "String!")
        .field("status", "Status!")
        .field("price", "Decimal!")
        .fieldAsync("author", "Author", [](const ResolveInfo& info, ResolveCallback done) {
            // pretend the author lives in another service
            int authorId = info.parent()["authorId"].get<int>();
            std::thread([done, authorId]() { done(nullptr, findAuthor(authorId)); }).detach();
        })
        .field("secret", "String", [](const ResolveInfo&) -> Json {
            throw GraphQLError("Not authorized to read secrets");
        });

    schema->object("Query")
        .cacheControl({true, 60})
        .field("posts", "[Post!]!", [](const ResolveInfo& info) -> Json {
            std::lock_guard<std::mutex> lock(store);
            Json list = Json::array();
            for (auto& p : posts) {
                if (!info.hasArg("status") || info.arg("status") == p.status) list.push_back(p);
            }
            return list;
        })
            .arg("status", "Status")
        .field("node", "Node", [](const ResolveInfo& info) -> Json {
            int id = info.arg("id").get<int>();
            std::lock_guard<std::mutex> lock(store);
            for (auto& p : posts) {
                if (p.id == id) return p;
            }
            return nullptr;
        })
            .arg("id", "Int!")
        .field("me", "Author", [](const ResolveInfo& info) -> Json {
            auto* viewerId = info.contextAs<int>();
            return viewerId ? findAuthor(*viewerId) : Json(nullptr);
        })
            .cacheControl({false, 0});

    schema->object("Mutation")
        .field("addPost", "Post!", [](const ResolveInfo& info) -> Json {
            std::lock_guard<std::mutex> lock(store);
            Post post{static_cast<int>(posts.size()) + 1, info.arg("title").get<std::string>(), "DRAFT",
                      info.arg("authorId").get<int>(), info.arg("price").get<std::string>()};
            posts.push_back(post);
            return post;
        })
            .arg("title", "String!")
            .arg("authorId", "Int!")
            .arg("price", "Decimal", Json("0"));

    schema->setQueryType("Query");
    schema->setMutationType("Mutation");
    schema->finalize();
    return schema;
}

static void show(const std::string& label, const Response& response) {
    console::log("──", label, "──");
    console::log(response.dump(2));
    if (auto header = response.cacheControl.value()) console::log("Cache-Control:", *header);
}

int main() {
    Service service(buildSchema(), ServiceOptions::fromJson({
        {"threads", 4},
        {"timeoutMs", 1000},
        {"maxDepth", 6},
        {"logLevel", "info"},
    }));

    Request published;
    published.query = R"(
        query Published($status: Status) {
            posts(status: $status) { id title author { name } }
        })";
    published.variables = {{"status", "PUBLISHED"}};
    show("published posts", service.execute(std::move(published)));

    Request node;
    node.query = "{ node(id: 2) { __typename id ... on Post { title status price secret } } }";
    show("field error", service.execute(std::move(node)));

    Request me;
    me.query = "{ me { name posts { title } } }";
    me.context = 2;
    show("context", service.execute(std::move(me)));

    Request mutation;
    mutation.query = R"(
        mutation {
            first: addPost(title: "One", authorId: 1) { id price }
            second: addPost(title: "Two", authorId: 1, price: "012.50") { id price }
        })";
    show("serial mutation", service.execute(std::move(mutation)));

    Request invalid;
    invalid.query = "{ posts { id nonsense } }";
    show("validation error", service.execute(std::move(invalid)));

    Request types;
    types.query = R"({ __type(name: "Node") { kind possibleTypes { name } } })";
    show("introspection", service.execute(std::move(types)));

    console::success("done");
}
