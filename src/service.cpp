// ═══════════════════════════════════════════════════════════════════
//  src/service.cpp — Parse → validate → execute → assemble
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/service.h"
#include "gqlpp/cache_control.h"
#include "gqlpp/parser.h"

#include <cstdint>
#include <stdexcept>
#include <utility>

namespace gqlpp {

namespace {

std::size_t readCount(const Json& config, const char* key) {
    const Json& value = config.at(key);
    if (!value.is_number_integer() || (!value.is_number_unsigned() && value.get<std::int64_t>() < 0)) {
        throw std::invalid_argument(std::string("Option '") + key +
                                    "' must be a non-negative integer, got " + jsonTypeName(value) +
                                    " " + value.dump());
    }
    return value.get<std::size_t>();
}

} // namespace

// ═══════════════════════════════════════════
//  ServiceOptions
// ═══════════════════════════════════════════

ServiceOptions ServiceOptions::fromJson(const Json& config) {
    if (!config.is_object()) {
        throw std::invalid_argument("Service configuration must be an object, got " + jsonTypeName(config));
    }

    ServiceOptions options;
    if (config.contains("threads")) {
        options.threads = readCount(config, "threads");
        if (options.threads == 0) throw std::invalid_argument("Option 'threads' must be at least 1");
    }
    if (config.contains("timeoutMs") && !config["timeoutMs"].is_null()) {
        options.timeout = std::chrono::milliseconds(readCount(config, "timeoutMs"));
    }
    if (config.contains("introspection")) {
        const Json& value = config["introspection"];
        if (!value.is_boolean()) {
            throw std::invalid_argument("Option 'introspection' must be a Boolean, got " + jsonTypeName(value));
        }
        options.introspection = value.get<bool>();
    }
    if (config.contains("maxDepth") && !config["maxDepth"].is_null()) {
        options.maxDepth = readCount(config, "maxDepth");
    }
    if (config.contains("maxParseDepth")) {
        options.maxParseDepth = readCount(config, "maxParseDepth");
        if (options.maxParseDepth == 0) throw std::invalid_argument("Option 'maxParseDepth' must be at least 1");
    }
    if (config.contains("logLevel")) {
        const Json& value = config["logLevel"];
        if (!value.is_string()) {
            throw std::invalid_argument("Option 'logLevel' must be a String, got " + jsonTypeName(value));
        }
        options.logLevel = console::parseLevel(value.get<std::string>());
    }
    return options;
}

// ═══════════════════════════════════════════
//  Service
// ═══════════════════════════════════════════

Service::Service(std::shared_ptr<const Schema> schema, ServiceOptions options)
    : schema_(std::move(schema))
    , options_(options)
    , validator_(schema_, options.validatorOptions())
    , executor_(options.executorOptions()) {
    if (!schema_->finalized()) throw SchemaError("Service requires a finalized schema");
    if (options_.logLevel) console::setLevel(*options_.logLevel);
}

Response Service::execute(Request request) {
    std::shared_ptr<const ast::Document> document;
    try {
        document = std::make_shared<const ast::Document>(parse(request.query, options_.maxParseDepth));
    } catch (const GraphQLError& e) {
        console::debug("rejected request:", e.message());
        return Response::fromErrors({e});
    }

    auto validationErrors = validator_.validate(*document);
    if (!validationErrors.empty()) {
        std::vector<GraphQLError> errors;
        errors.reserve(validationErrors.size());
        for (auto& error : validationErrors) errors.push_back(error.toGraphQLError());
        console::debug("rejected request:", errors.size(), "validation error(s)");
        return Response::fromErrors(std::move(errors));
    }

    const ast::OperationDefinition* operation = nullptr;
    try {
        operation = &document->operation(request.operationName);
    } catch (const GraphQLError& e) {
        console::debug("rejected request:", e.message());
        return Response::fromErrors({e});
    }
    CacheControl cacheControl = computeCacheControl(*schema_, *document, *operation);

    ExecutionRequest exec;
    exec.schema = schema_;
    exec.document = document;
    exec.operationName = std::move(request.operationName);
    exec.variables = std::move(request.variables);
    exec.rootValue = std::move(request.rootValue);
    exec.context = std::move(request.context);
    exec.timeout = request.timeout ? request.timeout : options_.timeout;
    exec.cancellation = std::move(request.cancellation);

    Response response = assembleResponse(executor_.execute(std::move(exec)));
    if (response.data) response.cacheControl = cacheControl;
    return response;
}

Json Service::execute(const std::string& query, Json variables) {
    Request request;
    request.query = query;
    request.variables = std::move(variables);
    return execute(std::move(request)).toJson();
}

} // namespace gqlpp
