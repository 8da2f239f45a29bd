#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/executor.h — Concurrent field resolution over a thread pool
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    Executor executor({4});
//    ExecutionRequest req;
//    req.schema = schema;
//    req.document = std::make_shared<ast::Document>(parse("{ user(id: 1) { name } }"));
//    ExecutionResult result = executor.execute(req);
//
//  Synchronous resolvers run on the executor's pool; asynchronous ones
//  are started inline and finish whenever they call their callback.
//  Every selection set joins its children without blocking a worker,
//  so one slow resolver never holds back unrelated branches. The
//  blocking execute() must not be called from a resolver.
// ═══════════════════════════════════════════════════════════════════

#include "ast.h"
#include "cancellation.h"
#include "errors.h"
#include "json_utils.h"
#include "schema.h"
#include <boost/asio/thread_pool.hpp>
#include <algorithm>
#include <any>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace gqlpp {

namespace detail { struct RequestState; }

struct ExecutorOptions {
    std::size_t threads = std::max(2u, std::thread::hardware_concurrency());
};

// ═══════════════════════════════════════════
//  class ResolveInfo
//  Everything a resolver may read about the field being resolved.
//  Cheap to copy; async resolvers may keep a copy until they finish.
// ═══════════════════════════════════════════
class ResolveInfo {
public:
    const Json& parent() const { return *parent_; }
    const Json& args() const { return args_; }
    // Coerced argument, null when omitted
    const Json& arg(const std::string& name) const;
    bool hasArg(const std::string& name) const { return args_.contains(name); }

    const std::string& fieldName() const;
    const Json& path() const { return path_; }
    const TypeDefinition& parentType() const { return *parentType_; }
    const FieldDefinition& fieldDefinition() const { return *fieldDef_; }
    const TypeRef& returnType() const { return fieldDef_->type; }
    const ast::Field& field() const { return *field_; }

    const Schema& schema() const;
    const ast::OperationDefinition& operation() const;
    const Json& rootValue() const;
    const Json& variables() const;

    // Host context handed in with the request
    const std::any& context() const;
    template <typename T>
    const T* contextAs() const { return std::any_cast<T>(&context()); }

    // True once the request was cancelled or ran past its deadline
    bool cancelled() const;

private:
    friend struct detail::RequestState;

    std::shared_ptr<detail::RequestState> request_;
    std::shared_ptr<const Json> parent_;
    Json args_ = Json::object();
    const TypeDefinition* parentType_ = nullptr;
    const FieldDefinition* fieldDef_ = nullptr;
    const ast::Field* field_ = nullptr;
    Json path_ = Json::array();
};

// ── One operation to run ──
struct ExecutionRequest {
    std::shared_ptr<const Schema> schema;
    std::shared_ptr<const ast::Document> document;
    std::string operationName;
    Json variables = Json::object();        // raw inputs, coerced by the executor
    Json rootValue = Json::object();
    std::any context;
    std::optional<std::chrono::milliseconds> timeout;
    std::shared_ptr<CancellationSource> cancellation;
};

// ── data is absent for request errors, null when the root bubbled ──
struct ExecutionResult {
    std::optional<Json> data;
    std::vector<GraphQLError> errors;
};

// ═══════════════════════════════════════════
//  class Executor
//  Shared by every request; joins its pool on destruction.
// ═══════════════════════════════════════════
class Executor {
public:
    using Callback = std::function<void(ExecutionResult)>;

    explicit Executor(ExecutorOptions options = {});
    ~Executor();

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    // Blocks the calling thread until the result is assembled
    ExecutionResult execute(ExecutionRequest request);

    // done runs exactly once, on whichever thread completes the last field
    void executeAsync(ExecutionRequest request, Callback done);

    std::size_t threads() const { return options_.threads; }

private:
    ExecutorOptions options_;
    boost::asio::thread_pool pool_;
};

} // namespace gqlpp
