#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/response.h — The {data, errors, extensions} envelope
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    Response res = assembleResponse(executor.execute(req));
//    std::cout << res.dump(2) << std::endl;
//
//  "data" comes first and is left out entirely for request errors;
//  "errors" and "extensions" are left out when empty.
// ═══════════════════════════════════════════════════════════════════

#include "cache_control.h"
#include "errors.h"
#include "executor.h"
#include "json_utils.h"
#include <optional>
#include <string>
#include <vector>

namespace gqlpp {

struct Response {
    std::optional<Json> data;
    std::vector<GraphQLError> errors;
    CacheControl cacheControl;
    Json extensions = Json::object();

    // Request errors: nothing was executed
    static Response fromErrors(std::vector<GraphQLError> errors);

    bool ok() const { return errors.empty(); }

    Json toJson() const;
    std::string dump(int indent = -1) const { return toJson().dump(indent); }
};

Response assembleResponse(ExecutionResult&& result);

} // namespace gqlpp
