// ═══════════════════════════════════════════════════════════════════
//  src/response.cpp — Response envelope
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/response.h"

namespace gqlpp {

Response Response::fromErrors(std::vector<GraphQLError> errors) {
    Response response;
    response.errors = std::move(errors);
    return response;
}

Json Response::toJson() const {
    Json out = Json::object();
    if (data) out["data"] = *data;
    if (!errors.empty()) {
        Json list = Json::array();
        for (auto& e : errors) list.push_back(e.toJson());
        out["errors"] = std::move(list);
    }
    if (!extensions.empty()) out["extensions"] = extensions;
    return out;
}

Response assembleResponse(ExecutionResult&& result) {
    Response response;
    response.data = std::move(result.data);
    response.errors = std::move(result.errors);
    return response;
}

} // namespace gqlpp
