// ═══════════════════════════════════════════════════════════════════
//  src/errors.cpp — Error serialization and ordered collection
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/errors.h"

#include <algorithm>

namespace gqlpp {

Json GraphQLError::toJson() const {
    Json j = Json::object();
    j["message"] = message();
    if (!locations_.empty()) {
        Json locs = Json::array();
        for (auto& loc : locations_) {
            locs.push_back(Json{{"line", loc.line}, {"column", loc.column}});
        }
        j["locations"] = std::move(locs);
    }
    if (path_.is_array() && !path_.empty()) {
        j["path"] = path_;
    }
    if (extensions_.is_object() && !extensions_.empty()) {
        j["extensions"] = extensions_;
    }
    return j;
}

void ErrorCollector::add(GraphQLError error, std::vector<std::size_t> order) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(Entry{std::move(order), entries_.size(), std::move(error)});
}

std::size_t ErrorCollector::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::vector<GraphQLError> ErrorCollector::sorted() const {
    std::vector<Entry> copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        copy = entries_;
    }
    std::stable_sort(copy.begin(), copy.end(), [](const Entry& a, const Entry& b) {
        if (a.order != b.order) return a.order < b.order;
        return a.sequence < b.sequence;
    });

    std::vector<GraphQLError> result;
    result.reserve(copy.size());
    for (auto& entry : copy) {
        result.push_back(std::move(entry.error));
    }
    return result;
}

} // namespace gqlpp
