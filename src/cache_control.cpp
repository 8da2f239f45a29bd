// ═══════════════════════════════════════════════════════════════════
//  src/cache_control.cpp — Cache hint merging
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/cache_control.h"
#include "gqlpp/ast.h"
#include "gqlpp/schema.h"

#include <algorithm>
#include <set>

namespace gqlpp {

CacheControl CacheControl::merge(const CacheControl& other) const {
    CacheControl merged;
    merged.isPublic = isPublic && other.isPublic;
    if (maxAge == 0) merged.maxAge = other.maxAge;
    else if (other.maxAge == 0) merged.maxAge = maxAge;
    else merged.maxAge = std::min(maxAge, other.maxAge);
    return merged;
}

std::optional<std::string> CacheControl::value() const {
    if (maxAge == 0) return std::nullopt;
    std::string header = "max-age=" + std::to_string(maxAge);
    if (!isPublic) header += ", private";
    return header;
}

namespace {

class HintCollector {
public:
    HintCollector(const Schema& schema, const ast::Document& document)
        : schema_(schema), document_(document) {}

    void visit(const ast::SelectionSet& selectionSet, const TypeDefinition* parent) {
        if (!parent) return;
        if (parent->kind == TypeKind::Object) result_ = result_.merge(parent->cacheControl);

        for (auto& selection : selectionSet.selections) {
            if (auto* field = selection.field()) {
                auto* def = schema_.fieldDefinition(*parent, field->name);
                if (!def) continue;
                result_ = result_.merge(def->cacheControl);
                if (!field->selectionSet.empty()) {
                    visit(field->selectionSet, schema_.type(def->type.namedType()));
                }
            } else if (auto* spread = selection.fragmentSpread()) {
                auto* fragment = document_.fragment(spread->name);
                if (!fragment || !visited_.insert(spread->name).second) continue;
                visit(fragment->selectionSet, schema_.type(fragment->typeCondition));
            } else if (auto* inlineFragment = selection.inlineFragment()) {
                auto* type = inlineFragment->typeCondition.empty()
                                 ? parent : schema_.type(inlineFragment->typeCondition);
                visit(inlineFragment->selectionSet, type);
            }
        }
    }

    CacheControl result() const { return result_; }

private:
    const Schema& schema_;
    const ast::Document& document_;
    std::set<std::string> visited_;
    CacheControl result_;
};

} // namespace

CacheControl computeCacheControl(const Schema& schema,
                                 const ast::Document& document,
                                 const ast::OperationDefinition& operation) {
    const TypeDefinition* root = nullptr;
    switch (operation.operation) {
        case ast::OperationType::Query:        root = schema.queryType(); break;
        case ast::OperationType::Mutation:     root = schema.mutationType(); break;
        case ast::OperationType::Subscription: root = schema.subscriptionType(); break;
    }
    HintCollector collector(schema, document);
    collector.visit(operation.selectionSet, root);
    return collector.result();
}

} // namespace gqlpp
