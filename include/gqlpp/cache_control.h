#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/cache_control.h — HTTP cache hints derived from a query
// ═══════════════════════════════════════════════════════════════════
//
//  Types and fields may carry a hint; a query's hint is the merge of
//  every field it selects and every object type it reaches:
//
//    schema.object("Query").cacheControl({true, 60})
//        .field("value1", "Int").cacheControl({true, 30})
//        .field("value2", "Int").cacheControl({false, 0});
//
//    { value1 }          → public, max-age=30
//    { value2 }          → private, max-age=60
//    { value1 value2 }   → private, max-age=30
//
// ═══════════════════════════════════════════════════════════════════

#include <cstddef>
#include <optional>
#include <string>

namespace gqlpp {

class Schema;
namespace ast { struct Document; struct OperationDefinition; }

struct CacheControl {
    bool isPublic = true;
    std::size_t maxAge = 0;

    // Public only if both are; max age is the smallest non-zero one
    CacheControl merge(const CacheControl& other) const;

    // "max-age=N" or "max-age=N, private"; nothing when maxAge is 0
    std::optional<std::string> value() const;

    bool operator==(const CacheControl& other) const {
        return isPublic == other.isPublic && maxAge == other.maxAge;
    }
    bool operator!=(const CacheControl& other) const { return !(*this == other); }
};

// Merged hint of every field and object type the operation can select
CacheControl computeCacheControl(const Schema& schema,
                                 const ast::Document& document,
                                 const ast::OperationDefinition& operation);

} // namespace gqlpp
