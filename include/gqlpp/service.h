#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/service.h — The whole pipeline behind one call
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    Service service(schema, ServiceOptions::fromJson(config));
//
//    Response res = service.execute({.query = "{ user(id: 1) { name } }"});
//    res.cacheControl.value();   // "max-age=30"
//
//    Json body = service.execute("query($id: Int!) { user(id: $id) { name } }",
//                                {{"id", 1}});
//
//  Syntax, validation and variable errors are request errors: the
//  response carries them and no "data" member.
// ═══════════════════════════════════════════════════════════════════

#include "cancellation.h"
#include "console.h"
#include "executor.h"
#include "json_utils.h"
#include "parser.h"
#include "response.h"
#include "schema.h"
#include "validator.h"
#include <any>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace gqlpp {

// ═══════════════════════════════════════════
//  ServiceOptions
// ═══════════════════════════════════════════
struct ServiceOptions {
    std::size_t threads = ExecutorOptions{}.threads;
    std::optional<std::chrono::milliseconds> timeout;   // per request, none by default
    bool introspection = true;
    std::optional<std::size_t> maxDepth;
    std::size_t maxParseDepth = Parser::DefaultMaxDepth;
    std::optional<console::Level> logLevel;             // leaves the logger alone when empty

    // {"threads": 4, "timeoutMs": 500, "introspection": false,
    //  "maxDepth": 10, "maxParseDepth": 64, "logLevel": "warn"}
    // Unknown keys are ignored; a wrongly typed value throws std::invalid_argument.
    static ServiceOptions fromJson(const Json& config);

    ExecutorOptions executorOptions() const { return ExecutorOptions{threads}; }
    ValidatorOptions validatorOptions() const { return ValidatorOptions{maxDepth, introspection}; }
};

// ── One incoming request ──
struct Request {
    std::string query;
    std::string operationName;
    Json variables = Json::object();
    Json rootValue = Json::object();
    std::any context;
    std::optional<std::chrono::milliseconds> timeout;   // overrides ServiceOptions::timeout
    std::shared_ptr<CancellationSource> cancellation;
};

// ═══════════════════════════════════════════
//  class Service
// ═══════════════════════════════════════════
class Service {
public:
    // Finalizes nothing: the schema must already be finalized
    explicit Service(std::shared_ptr<const Schema> schema, ServiceOptions options = {});

    Response execute(Request request);
    Json execute(const std::string& query, Json variables = Json::object());

    const Schema& schema() const { return *schema_; }
    const ServiceOptions& options() const { return options_; }

private:
    std::shared_ptr<const Schema> schema_;
    ServiceOptions options_;
    Validator validator_;
    Executor executor_;
};

} // namespace gqlpp
