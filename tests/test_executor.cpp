// ═══════════════════════════════════════════════════════════════════
//  test_executor.cpp — Field resolution, completion and null bubbling
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include "gqlpp/executor.h"
#include "gqlpp/parser.h"
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace gqlpp;
using namespace std::chrono_literals;

namespace {

std::shared_ptr<Schema> userSchema() {
    auto schema = std::make_shared<Schema>();
    schema->object("User")
        .field("id", "Int!")
        .field("name", "String")
        .field("friend", "User");
    schema->object("Query")
        .field("user", "User", [](const ResolveInfo& info) -> Json {
            auto id = info.arg("id");
            if (id == 1) return {{"id", 1}, {"name", "Ann"}};
            if (id == 2) return {{"id", nullptr}, {"name", "Broken"}};
            if (id == 3) return {{"id", 3}, {"name", "Cy"}, {"friend", {{"id", nullptr}}}};
            return nullptr;
        })
        .arg("id", "Int!");
    schema->setQueryType("Query");
    schema->finalize();
    return schema;
}

ExecutionRequest request(std::shared_ptr<const Schema> schema, const char* query,
                         Json variables = Json::object()) {
    ExecutionRequest req;
    req.schema = std::move(schema);
    req.document = std::make_shared<ast::Document>(parse(query));
    req.variables = std::move(variables);
    return req;
}

class ExecutorTest : public ::testing::Test {
protected:
    Executor executor{ExecutorOptions{4}};
};

} // namespace

// ═══════════════════════════════════════════
//  Basic resolution
// ═══════════════════════════════════════════

TEST_F(ExecutorTest, ResolvesNestedFields) {
    auto result = executor.execute(request(userSchema(), "{ user(id: 1) { id name } }"));
    ASSERT_TRUE(result.data.has_value());
    EXPECT_EQ(result.data->dump(), R"({"user":{"id":1,"name":"Ann"}})");
    EXPECT_TRUE(result.errors.empty());
}

TEST_F(ExecutorTest, NullableFieldResolvesToNull) {
    auto result = executor.execute(request(userSchema(), "{ user(id: 9) { id name } }"));
    EXPECT_EQ(result.data->dump(), R"({"user":null})");
    EXPECT_TRUE(result.errors.empty());
}

TEST_F(ExecutorTest, AliasesAndDefaultResolver) {
    auto result = executor.execute(request(userSchema(), "{ a: user(id: 1) { who: name } b: user(id: 9) { id } }"));
    EXPECT_EQ(result.data->dump(), R"({"a":{"who":"Ann"},"b":null})");
}

TEST_F(ExecutorTest, ResponseKeysFollowQueryOrder) {
    auto schema = std::make_shared<Schema>();
    schema->object("Query")
        .field("slow", "Int", [](const ResolveInfo&) -> Json {
            std::this_thread::sleep_for(30ms);
            return 1;
        })
        .field("fast", "Int", [](const ResolveInfo&) -> Json { return 2; });
    schema->setQueryType("Query");
    schema->finalize();

    auto result = executor.execute(request(schema, "{ slow fast again: slow }"));
    EXPECT_EQ(result.data->dump(), R"({"slow":1,"fast":2,"again":1})");
}

TEST_F(ExecutorTest, MergesFieldsWithTheSameResponseKey) {
    auto result = executor.execute(request(userSchema(),
        "{ user(id: 1) { id } ... on Query { user(id: 1) { name } } }"));
    EXPECT_EQ(result.data->dump(), R"({"user":{"id":1,"name":"Ann"}})");
}

// ═══════════════════════════════════════════
//  Null bubbling
// ═══════════════════════════════════════════

TEST_F(ExecutorTest, NonNullFieldBubblesToNullableParent) {
    auto result = executor.execute(request(userSchema(), "{ user(id: 2) { id name } }"));
    EXPECT_EQ(result.data->dump(), R"({"user":null})");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].message(), "Cannot return null for non-nullable field User.id.");
    EXPECT_EQ(result.errors[0].path(), Json::array({"user", "id"}));
    ASSERT_EQ(result.errors[0].locations().size(), 1u);
    EXPECT_EQ(result.errors[0].locations()[0], (Location{1, 17}));
}

TEST_F(ExecutorTest, BubblingStopsAtNearestNullableAncestor) {
    auto result = executor.execute(request(userSchema(), "{ user(id: 3) { name friend { id } } }"));
    EXPECT_EQ(result.data->dump(), R"({"user":{"name":"Cy","friend":null}})");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].path(), Json::array({"user", "friend", "id"}));
}

TEST_F(ExecutorTest, NonNullRootFieldNullsData) {
    auto schema = std::make_shared<Schema>();
    schema->object("Query")
        .field("required", "String!", [](const ResolveInfo&) -> Json { throw std::runtime_error("down"); })
        .field("other", "String", [](const ResolveInfo&) -> Json { return "fine"; });
    schema->setQueryType("Query");
    schema->finalize();

    auto result = executor.execute(request(schema, "{ other required }"));
    ASSERT_TRUE(result.data.has_value());
    EXPECT_TRUE(result.data->is_null());
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].message(), "down");
    EXPECT_EQ(result.errors[0].path(), Json::array({"required"}));
}

TEST_F(ExecutorTest, FailingFieldDoesNotAffectSiblings) {
    auto schema = std::make_shared<Schema>();
    schema->object("Query")
        .field("a", "Int", [](const ResolveInfo&) -> Json { throw std::runtime_error("boom"); })
        .field("b", "Int", [](const ResolveInfo&) -> Json { return 2; });
    schema->setQueryType("Query");
    schema->finalize();

    auto result = executor.execute(request(schema, "{ a b }"));
    EXPECT_EQ(result.data->dump(), R"({"a":null,"b":2})");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].message(), "boom");
    EXPECT_EQ(result.errors[0].path(), Json::array({"a"}));
}

TEST_F(ExecutorTest, GraphQLErrorExtensionsArePreserved) {
    auto schema = std::make_shared<Schema>();
    schema->object("Query").field("secret", "String", [](const ResolveInfo&) -> Json {
        GraphQLError error("Not allowed");
        error.extensions()["code"] = "FORBIDDEN";
        throw error;
    });
    schema->setQueryType("Query");
    schema->finalize();

    auto result = executor.execute(request(schema, "{ secret }"));
    ASSERT_EQ(result.errors.size(), 1u);
    Json j = result.errors[0].toJson();
    EXPECT_EQ(j["message"], "Not allowed");
    EXPECT_EQ(j["extensions"]["code"], "FORBIDDEN");
    EXPECT_EQ(j["path"], Json::array({"secret"}));
}

TEST_F(ExecutorTest, ErrorsAreOrderedByResponsePosition) {
    auto schema = std::make_shared<Schema>();
    schema->object("Query")
        .field("first", "Int", [](const ResolveInfo&) -> Json {
            std::this_thread::sleep_for(40ms);
            throw std::runtime_error("first failed");
        })
        .field("second", "Int", [](const ResolveInfo&) -> Json { throw std::runtime_error("second failed"); });
    schema->setQueryType("Query");
    schema->finalize();

    auto result = executor.execute(request(schema, "{ first second }"));
    ASSERT_EQ(result.errors.size(), 2u);
    EXPECT_EQ(result.errors[0].message(), "first failed");
    EXPECT_EQ(result.errors[1].message(), "second failed");
}

// ═══════════════════════════════════════════
//  Lists
// ═══════════════════════════════════════════

namespace {

std::shared_ptr<Schema> listSchema() {
    auto schema = std::make_shared<Schema>();
    auto values = [](const ResolveInfo&) -> Json { return Json::array({1, "x", 3}); };
    schema->object("Query")
        .field("nullableItems", "[Int]", values)
        .field("nonNullItems", "[Int!]", values)
        .field("strict", "[Int!]!", values)
        .field("notAList", "[Int]", [](const ResolveInfo&) -> Json { return 7; })
        .field("empty", "[Int!]!", [](const ResolveInfo&) -> Json { return Json::array(); });
    schema->setQueryType("Query");
    schema->finalize();
    return schema;
}

} // namespace

TEST_F(ExecutorTest, ListItemErrorNullsOnlyThatItem) {
    auto result = executor.execute(request(listSchema(), "{ nullableItems }"));
    EXPECT_EQ(result.data->dump(), R"({"nullableItems":[1,null,3]})");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].message(), "Int cannot represent value: \"x\"");
    EXPECT_EQ(result.errors[0].path(), Json::array({"nullableItems", 1}));
}

TEST_F(ExecutorTest, NonNullItemErrorNullsTheList) {
    auto result = executor.execute(request(listSchema(), "{ nonNullItems }"));
    EXPECT_EQ(result.data->dump(), R"({"nonNullItems":null})");
    ASSERT_EQ(result.errors.size(), 1u);
}

TEST_F(ExecutorTest, NonNullListBubblesFurther) {
    auto result = executor.execute(request(listSchema(), "{ strict empty }"));
    ASSERT_TRUE(result.data.has_value());
    EXPECT_TRUE(result.data->is_null());
}

TEST_F(ExecutorTest, ListFieldRequiresAnArray) {
    auto result = executor.execute(request(listSchema(), "{ notAList empty }"));
    EXPECT_EQ(result.data->dump(), R"({"notAList":null,"empty":[]})");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].message(), "Expected Iterable, but did not find one for field \"Query.notAList\".");
}

// ═══════════════════════════════════════════
//  Enums and abstract types
// ═══════════════════════════════════════════

TEST_F(ExecutorTest, EnumValuesAreChecked) {
    auto schema = std::make_shared<Schema>();
    schema->enumType("Color", {"RED", "GREEN"});
    schema->object("Query")
        .field("good", "Color", [](const ResolveInfo&) -> Json { return "RED"; })
        .field("bad", "Color", [](const ResolveInfo&) -> Json { return "PURPLE"; });
    schema->setQueryType("Query");
    schema->finalize();

    auto result = executor.execute(request(schema, "{ good bad }"));
    EXPECT_EQ(result.data->dump(), R"({"good":"RED","bad":null})");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].message(), "Enum \"Color\" cannot represent value: \"PURPLE\"");
}

namespace {

std::shared_ptr<Schema> petSchema() {
    auto schema = std::make_shared<Schema>();
    schema->interfaceType("Pet")
        .field("name", "String")
        .resolveType([](const Json& value, const ResolveInfo&) -> std::string {
            return value.contains("barks") ? "Dog" : "Cat";
        });
    schema->object("Dog").implements("Pet").field("name", "String").field("barks", "Boolean");
    schema->object("Cat").implements("Pet").field("name", "String").field("meows", "Boolean");
    schema->object("Rock").field("weight", "Int");
    schema->unionType("Thing", {"Dog", "Cat"});
    schema->object("Query")
        .field("pets", "[Pet]", [](const ResolveInfo&) -> Json {
            return Json::array({{{"name", "Rex"}, {"barks", true}}, {{"name", "Tom"}, {"meows", false}}});
        })
        .field("things", "[Thing]", [](const ResolveInfo&) -> Json {
            return Json::array({{{"__typename", "Cat"}, {"name", "Tom"}},
                                {{"name", "Mystery"}},
                                {{"__typename", "Rock"}, {"weight", 3}}});
        });
    schema->setQueryType("Query");
    schema->finalize();
    return schema;
}

} // namespace

TEST_F(ExecutorTest, InterfaceUsesTypeResolver) {
    auto result = executor.execute(request(petSchema(),
        "{ pets { __typename name ... on Dog { barks } ... on Cat { meows } } }"));
    EXPECT_EQ(result.data->dump(),
              R"({"pets":[{"__typename":"Dog","name":"Rex","barks":true},)"
              R"({"__typename":"Cat","name":"Tom","meows":false}]})");
    EXPECT_TRUE(result.errors.empty());
}

TEST_F(ExecutorTest, UnionFallsBackToTypename) {
    auto result = executor.execute(request(petSchema(), "{ things { __typename ... on Cat { name } } }"));
    EXPECT_EQ(result.data->dump(), R"({"things":[{"__typename":"Cat","name":"Tom"},null,null]})");
    ASSERT_EQ(result.errors.size(), 2u);
    EXPECT_EQ(result.errors[0].path(), Json::array({"things", 1}));
    EXPECT_NE(result.errors[0].message().find("Abstract type \"Thing\" must resolve to an Object type"),
              std::string::npos);
    EXPECT_EQ(result.errors[1].message(), "Runtime Object type \"Rock\" is not a possible type for \"Thing\".");
}

// ═══════════════════════════════════════════
//  Directives, variables, arguments
// ═══════════════════════════════════════════

TEST_F(ExecutorTest, SkipAndInclude) {
    auto result = executor.execute(request(userSchema(), R"(
        query($withName: Boolean!) {
            user(id: 1) {
                id @skip(if: true)
                name @include(if: $withName)
                ... @include(if: false) { friend { id } }
            }
        })", {{"withName", true}}));
    EXPECT_EQ(result.data->dump(), R"({"user":{"name":"Ann"}})");
}

TEST_F(ExecutorTest, VariablesFeedArguments) {
    auto result = executor.execute(request(userSchema(), "query($id: Int!) { user(id: $id) { name } }",
                                           {{"id", 1}}));
    EXPECT_EQ(result.data->dump(), R"({"user":{"name":"Ann"}})");
}

TEST_F(ExecutorTest, MissingVariableIsARequestError) {
    auto result = executor.execute(request(userSchema(), "query($id: Int!) { user(id: $id) { name } }"));
    EXPECT_FALSE(result.data.has_value());
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].message(), "Variable \"$id\" of required type \"Int!\" was not provided.");
}

TEST_F(ExecutorTest, InvalidVariableIsARequestError) {
    auto result = executor.execute(request(userSchema(), "query($id: Int!) { user(id: $id) { name } }",
                                           {{"id", "one"}}));
    EXPECT_FALSE(result.data.has_value());
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].message(),
              "Variable \"$id\" got invalid value \"one\"; Int cannot represent value: \"one\"");
}

TEST_F(ExecutorTest, ArgumentCoercionErrorIsAFieldError) {
    auto result = executor.execute(request(userSchema(), R"({ user(id: "x") { name } })"));
    EXPECT_EQ(result.data->dump(), R"({"user":null})");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].message(),
              "Argument \"id\" has invalid value \"x\". Int cannot represent a non Int value: \"x\"");
    EXPECT_EQ(result.errors[0].path(), Json::array({"user"}));
}

TEST_F(ExecutorTest, ArgumentDefaultsApply) {
    auto schema = std::make_shared<Schema>();
    schema->object("Query")
        .field("greet", "String", [](const ResolveInfo& info) -> Json {
            return "hello " + info.arg("name").get<std::string>();
        })
        .arg("name", "String", Json("world"));
    schema->setQueryType("Query");
    schema->finalize();

    auto result = executor.execute(request(schema, R"({ a: greet b: greet(name: "Ann") })"));
    EXPECT_EQ(result.data->dump(), R"({"a":"hello world","b":"hello Ann"})");
}

// ═══════════════════════════════════════════
//  Resolver context
// ═══════════════════════════════════════════

TEST_F(ExecutorTest, ResolveInfoExposesRequest) {
    auto schema = std::make_shared<Schema>();
    schema->object("Query").field("inspect", "String", [](const ResolveInfo& info) -> Json {
        const int* tenant = info.contextAs<int>();
        return info.operation().name + "|" + info.path().dump() + "|" + info.rootValue()["greeting"].get<std::string>() +
               "|" + std::to_string(tenant ? *tenant : -1) + "|" + info.parentType().name + "." + info.fieldName();
    });
    schema->setQueryType("Query");
    schema->finalize();

    auto req = request(schema, "query Inspect { p: inspect }");
    req.rootValue = {{"greeting", "hi"}};
    req.context = 42;
    auto result = executor.execute(std::move(req));
    EXPECT_EQ((*result.data)["p"], R"(Inspect|["p"]|hi|42|Query.inspect)");
}

// ═══════════════════════════════════════════
//  Mutations
// ═══════════════════════════════════════════

namespace {

struct Counter {
    std::mutex mutex;
    int value = 0;
    std::vector<std::string> log;
};

std::shared_ptr<Schema> counterSchema(std::shared_ptr<Counter> counter) {
    auto schema = std::make_shared<Schema>();
    schema->object("Query").field("current", "Int", [counter](const ResolveInfo&) -> Json {
        std::lock_guard<std::mutex> lock(counter->mutex);
        return counter->value;
    });
    schema->object("Mutation")
        .field("increment", "Int", [counter](const ResolveInfo& info) -> Json {
            // later fields would overtake this one if they ran concurrently
            std::this_thread::sleep_for(std::chrono::milliseconds(info.arg("delay").get<int>()));
            std::lock_guard<std::mutex> lock(counter->mutex);
            counter->log.push_back(info.path()[0].get<std::string>());
            return ++counter->value;
        })
        .arg("delay", "Int", Json(0))
        .field("fail", "Int", [](const ResolveInfo&) -> Json { throw std::runtime_error("soft failure"); })
        .field("mustWork", "Int!", [](const ResolveInfo&) -> Json { throw std::runtime_error("hard failure"); });
    schema->setQueryType("Query");
    schema->setMutationType("Mutation");
    schema->finalize();
    return schema;
}

} // namespace

TEST_F(ExecutorTest, MutationFieldsRunSerially) {
    auto counter = std::make_shared<Counter>();
    auto result = executor.execute(request(counterSchema(counter),
        "mutation { a: increment(delay: 30) b: increment(delay: 10) c: increment }"));
    EXPECT_EQ(result.data->dump(), R"({"a":1,"b":2,"c":3})");
    EXPECT_EQ(counter->log, (std::vector<std::string>{"a", "b", "c"}));
}

TEST_F(ExecutorTest, NullableMutationFailureContinues) {
    auto counter = std::make_shared<Counter>();
    auto result = executor.execute(request(counterSchema(counter), "mutation { a: increment fail b: increment }"));
    EXPECT_EQ(result.data->dump(), R"({"a":1,"fail":null,"b":2})");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].message(), "soft failure");
}

TEST_F(ExecutorTest, NonNullMutationFailureStopsRemainingFields) {
    auto counter = std::make_shared<Counter>();
    auto result = executor.execute(request(counterSchema(counter), "mutation { a: increment mustWork b: increment }"));
    ASSERT_TRUE(result.data.has_value());
    EXPECT_TRUE(result.data->is_null());
    EXPECT_EQ(counter->value, 1);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].message(), "hard failure");
}

TEST_F(ExecutorTest, MutationWithoutMutationRoot) {
    auto result = executor.execute(request(userSchema(), "mutation { x }"));
    EXPECT_FALSE(result.data.has_value());
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].message(), "Schema is not configured to execute mutation operation.");
}

TEST_F(ExecutorTest, OperationSelection) {
    auto req = request(userSchema(), "query A { user(id: 1) { name } } query B { user(id: 9) { name } }");
    req.operationName = "B";
    EXPECT_EQ(executor.execute(req).data->dump(), R"({"user":null})");

    req.operationName = "C";
    auto result = executor.execute(req);
    EXPECT_FALSE(result.data.has_value());
    EXPECT_EQ(result.errors[0].message(), "Unknown operation named \"C\".");

    req.operationName.clear();
    result = executor.execute(req);
    EXPECT_EQ(result.errors[0].message(), "Must provide operation name if query contains multiple operations.");
}

TEST_F(ExecutorTest, RequestWithoutDocumentThrows) {
    ExecutionRequest req;
    req.schema = userSchema();
    EXPECT_THROW(executor.execute(req), std::invalid_argument);
}

// ═══════════════════════════════════════════
//  Asynchronous resolvers
// ═══════════════════════════════════════════

TEST_F(ExecutorTest, AsyncResolversCompleteFromOtherThreads) {
    std::mutex mutex;
    std::vector<std::thread> workers;

    auto schema = std::make_shared<Schema>();
    schema->object("Query")
        .fieldAsync("later", "String", [&](const ResolveInfo& info, ResolveCallback done) {
            std::string text = "later " + info.arg("n").dump();
            std::lock_guard<std::mutex> lock(mutex);
            workers.emplace_back([done, text]() {
                std::this_thread::sleep_for(10ms);
                done(nullptr, text);
            });
        })
        .arg("n", "Int")
        .fieldAsync("broken", "String", [&](const ResolveInfo&, ResolveCallback done) {
            std::lock_guard<std::mutex> lock(mutex);
            workers.emplace_back([done]() {
                done(std::make_exception_ptr(std::runtime_error("async failure")), nullptr);
            });
        })
        .fieldAsync("immediate", "Int", [](const ResolveInfo&, ResolveCallback done) { done(nullptr, 5); });
    schema->setQueryType("Query");
    schema->finalize();

    auto result = executor.execute(request(schema, "{ x: later(n: 1) broken immediate y: later(n: 2) }"));
    for (auto& w : workers) w.join();

    EXPECT_EQ(result.data->dump(), R"({"x":"later 1","broken":null,"immediate":5,"y":"later 2"})");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].message(), "async failure");
    EXPECT_EQ(result.errors[0].path(), Json::array({"broken"}));
}

TEST_F(ExecutorTest, ExecuteAsyncDeliversResultOnce) {
    std::promise<ExecutionResult> promise;
    std::atomic<int> calls{0};
    executor.executeAsync(request(userSchema(), "{ user(id: 1) { name } }"), [&](ExecutionResult result) {
        ++calls;
        promise.set_value(std::move(result));
    });
    auto result = promise.get_future().get();
    EXPECT_EQ(result.data->dump(), R"({"user":{"name":"Ann"}})");
    EXPECT_EQ(calls.load(), 1);
}

// ═══════════════════════════════════════════
//  Deadlines and cancellation
// ═══════════════════════════════════════════

namespace {

std::shared_ptr<Schema> hangingSchema(std::shared_ptr<std::promise<void>> started = nullptr) {
    auto schema = std::make_shared<Schema>();
    schema->object("Query")
        .field("fast", "Int", [](const ResolveInfo&) -> Json { return 1; })
        .fieldAsync("hang", "Int", [started](const ResolveInfo&, ResolveCallback) {
            // never calls back
            if (started) started->set_value();
        })
        .fieldAsync("required", "Int!", [](const ResolveInfo&, ResolveCallback) {});
    schema->setQueryType("Query");
    schema->finalize();
    return schema;
}

} // namespace

TEST_F(ExecutorTest, DeadlineAbortsPendingFieldsAndKeepsCompletedOnes) {
    auto req = request(hangingSchema(), "{ fast hang }");
    req.timeout = 50ms;
    auto startedAt = std::chrono::steady_clock::now();
    auto result = executor.execute(std::move(req));
    EXPECT_GE(std::chrono::steady_clock::now() - startedAt, 50ms);

    EXPECT_EQ(result.data->dump(), R"({"fast":1,"hang":null})");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].message(), "Execution aborted");
    EXPECT_EQ(result.errors[0].path(), Json::array({"hang"}));
}

TEST_F(ExecutorTest, AbortedNonNullFieldBubbles) {
    auto req = request(hangingSchema(), "{ fast required }");
    req.timeout = 20ms;
    auto result = executor.execute(std::move(req));
    ASSERT_TRUE(result.data.has_value());
    EXPECT_TRUE(result.data->is_null());
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].message(), "Execution aborted");
}

TEST_F(ExecutorTest, DeadlineDoesNotFireForFastRequests) {
    auto req = request(userSchema(), "{ user(id: 1) { name } }");
    req.timeout = 5s;
    auto startedAt = std::chrono::steady_clock::now();
    auto result = executor.execute(std::move(req));
    EXPECT_LT(std::chrono::steady_clock::now() - startedAt, 5s);
    EXPECT_TRUE(result.errors.empty());
}

TEST_F(ExecutorTest, CancellationSourceAbortsInFlightFields) {
    auto started = std::make_shared<std::promise<void>>();
    auto startedFuture = started->get_future();
    auto cancel = std::make_shared<CancellationSource>();

    std::thread canceller([&]() {
        startedFuture.wait();
        cancel->cancel();
    });

    auto req = request(hangingSchema(started), "{ fast hang }");
    req.cancellation = cancel;
    auto result = executor.execute(std::move(req));
    canceller.join();

    EXPECT_EQ(result.data->dump(), R"({"fast":1,"hang":null})");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].message(), "Execution aborted");
}

TEST_F(ExecutorTest, AlreadyCancelledRequestAbortsEveryField) {
    auto cancel = std::make_shared<CancellationSource>();
    cancel->cancel();
    auto req = request(userSchema(), "{ a: user(id: 1) { name } b: user(id: 9) { name } }");
    req.cancellation = cancel;
    auto result = executor.execute(std::move(req));
    EXPECT_EQ(result.data->dump(), R"({"a":null,"b":null})");
    ASSERT_EQ(result.errors.size(), 2u);
    for (auto& e : result.errors) EXPECT_EQ(e.message(), "Execution aborted");
}

TEST(CancellationSourceTest, SubscribersRunOnce) {
    CancellationSource source;
    int calls = 0;
    auto handle = source.subscribe([&]() { ++calls; });
    auto removed = source.subscribe([&]() { calls += 100; });
    source.unsubscribe(removed);
    EXPECT_NE(handle, 0u);
    EXPECT_FALSE(source.cancelled());

    source.cancel();
    source.cancel();
    EXPECT_TRUE(source.cancelled());
    EXPECT_EQ(calls, 1);

    source.subscribe([&]() { ++calls; });
    EXPECT_EQ(calls, 2);
}
