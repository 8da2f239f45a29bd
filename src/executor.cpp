// ═══════════════════════════════════════════════════════════════════
//  src/executor.cpp — Field collection, resolution and completion
// ═══════════════════════════════════════════════════════════════════
//
//  Every step reports through a Completion(value, failed). "failed"
//  means the position is null because of an error that was already
//  recorded; a nullable field or list item absorbs it, a NonNull one
//  hands it to its parent.
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/executor.h"
#include "gqlpp/console.h"
#include "gqlpp/values.h"

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <atomic>
#include <future>
#include <map>
#include <mutex>
#include <set>
#include <unordered_map>
#include <utility>

namespace gqlpp {

namespace detail {

using Completion = std::function<void(Json value, bool failed)>;
using Order = std::vector<std::size_t>;
using FieldNodes = std::vector<const ast::Field*>;

struct CollectedField {
    std::string responseKey;
    FieldNodes nodes;
    const FieldDefinition* definition = nullptr;
};
using CollectedFields = std::vector<CollectedField>;

// Field being completed; shared by every continuation below it
struct FieldContext {
    const TypeDefinition* parentType = nullptr;
    const FieldDefinition* definition = nullptr;
    FieldNodes nodes;
    ResolveInfo info;

    std::string coordinate() const { return parentType->name + "." + definition->name; }
};
using FieldContextPtr = std::shared_ptr<const FieldContext>;

// One resolver call in flight; settles exactly once
struct Invocation {
    std::size_t id = 0;
    std::atomic<bool> settled{false};
    ResolveCallback continuation;
};

// Join over the children of one selection set or list
struct Join {
    std::vector<Json> values;
    std::atomic<std::size_t> remaining{0};
    std::atomic<bool> failed{false};
};

// ═══════════════════════════════════════════
//  RequestState — one per executed operation
// ═══════════════════════════════════════════
struct RequestState : std::enable_shared_from_this<RequestState> {
    explicit RequestState(boost::asio::thread_pool& pool) : pool(pool) {}

    boost::asio::thread_pool& pool;
    std::shared_ptr<const Schema> schema;
    std::shared_ptr<const ast::Document> document;
    const ast::OperationDefinition* operation = nullptr;
    Json variables = Json::object();
    std::shared_ptr<const Json> rootValue;
    std::any context;
    ErrorCollector errors;
    std::atomic<bool> cancelled{false};
    Executor::Callback onDone;

    std::mutex mutex;
    std::unordered_map<std::size_t, std::shared_ptr<Invocation>> inflight;
    std::size_t nextInvocation = 0;
    std::map<std::pair<std::string, std::string>, bool> conditionCache;

    std::shared_ptr<boost::asio::steady_timer> deadline;
    std::shared_ptr<CancellationSource> cancellation;
    std::size_t cancellationHandle = 0;

    // ── Errors ──

    void fieldError(GraphQLError error, const Order& order) {
        console::debug("field error at", error.path().dump(), error.message());
        errors.add(std::move(error), order);
    }

    void fieldError(const std::string& message, const FieldContext& ctx, const Json& path, const Order& order) {
        std::vector<Location> locations;
        for (auto* node : ctx.nodes) locations.push_back(node->loc);
        fieldError(GraphQLError(message, std::move(locations), path), order);
    }

    void fieldError(const std::exception_ptr& error, const FieldContext& ctx, const Json& path, const Order& order) {
        std::string message;
        Json extensions = Json::object();
        try {
            std::rethrow_exception(error);
        } catch (const GraphQLError& e) {
            message = e.message();
            extensions = e.extensions();
        } catch (const std::exception& e) {
            message = e.what();
        } catch (...) {
            message = "Unknown error";
        }
        std::vector<Location> locations;
        for (auto* node : ctx.nodes) locations.push_back(node->loc);
        GraphQLError recorded(message, std::move(locations), path);
        recorded.extensions() = std::move(extensions);
        fieldError(std::move(recorded), order);
    }

    // ── Resolver invocations ──

    // nullptr when the request is already cancelled; continuation then ran with the abort error
    std::shared_ptr<Invocation> begin(ResolveCallback continuation) {
        auto invocation = std::make_shared<Invocation>();
        invocation->continuation = std::move(continuation);
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!cancelled) {
                invocation->id = ++nextInvocation;
                inflight.emplace(invocation->id, invocation);
                return invocation;
            }
        }
        settle(invocation, abortError(), nullptr);
        return nullptr;
    }

    void settle(const std::shared_ptr<Invocation>& invocation, std::exception_ptr error, Json value) {
        if (invocation->settled.exchange(true)) return;
        {
            std::lock_guard<std::mutex> lock(mutex);
            inflight.erase(invocation->id);
        }
        auto continuation = std::move(invocation->continuation);
        continuation(std::move(error), std::move(value));
    }

    static std::exception_ptr abortError() {
        return std::make_exception_ptr(GraphQLError("Execution aborted"));
    }

    void abort() {
        std::vector<std::shared_ptr<Invocation>> pending;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (cancelled) return;
            cancelled = true;
            for (auto& entry : inflight) pending.push_back(entry.second);
            inflight.clear();
        }
        console::debug("aborting", pending.size(), "in-flight resolver(s)");
        for (auto& invocation : pending) settle(invocation, abortError(), nullptr);
    }

    // ── Field collection ──

    bool conditionMatches(const std::string& condition, const TypeDefinition& type) {
        if (condition.empty() || condition == type.name) return true;
        auto key = std::make_pair(condition, type.name);
        std::lock_guard<std::mutex> lock(mutex);
        auto it = conditionCache.find(key);
        if (it != conditionCache.end()) return it->second;
        auto* conditionType = schema->type(condition);
        bool match = conditionType && conditionType->isAbstract() &&
                     schema->isPossibleType(*conditionType, type);
        conditionCache.emplace(std::move(key), match);
        return match;
    }

    bool shouldInclude(const std::vector<ast::Directive>& directives) {
        for (auto& directive : directives) {
            if (directive.name != "skip" && directive.name != "include") continue;
            auto* def = schema->directive(directive.name);
            Json args;
            try {
                args = coerceArguments(def->arguments, directive.arguments, *schema, variables);
            } catch (const CoercionError& e) {
                console::warn("@" + directive.name, "ignored:", e.what());
                continue;
            }
            bool flag = args["if"].get<bool>();
            if (directive.name == "skip" && flag) return false;
            if (directive.name == "include" && !flag) return false;
        }
        return true;
    }

    void collectFields(const TypeDefinition& type, const ast::SelectionSet& selectionSet,
                       std::set<std::string>& visitedFragments, CollectedFields& out,
                       std::unordered_map<std::string, std::size_t>& index) {
        for (auto& selection : selectionSet.selections) {
            if (auto* field = selection.field()) {
                if (!shouldInclude(field->directives)) continue;
                auto key = field->responseKey();
                auto it = index.find(key);
                if (it != index.end()) {
                    out[it->second].nodes.push_back(field);
                    continue;
                }
                auto* def = schema->fieldDefinition(type, field->name);
                if (!def) continue;
                index.emplace(key, out.size());
                out.push_back(CollectedField{key, {field}, def});
            } else if (auto* spread = selection.fragmentSpread()) {
                if (!shouldInclude(spread->directives)) continue;
                if (!visitedFragments.insert(spread->name).second) continue;
                auto* fragment = document->fragment(spread->name);
                if (!fragment || !conditionMatches(fragment->typeCondition, type)) continue;
                collectFields(type, fragment->selectionSet, visitedFragments, out, index);
            } else if (auto* inlineFragment = selection.inlineFragment()) {
                if (!shouldInclude(inlineFragment->directives)) continue;
                if (!conditionMatches(inlineFragment->typeCondition, type)) continue;
                collectFields(type, inlineFragment->selectionSet, visitedFragments, out, index);
            }
        }
    }

    CollectedFields collectSubfields(const TypeDefinition& type, const FieldNodes& nodes) {
        CollectedFields out;
        std::unordered_map<std::string, std::size_t> index;
        std::set<std::string> visited;
        for (auto* node : nodes) collectFields(type, node->selectionSet, visited, out, index);
        return out;
    }

    // ── Selection sets ──

    void executeFields(const TypeDefinition& type, CollectedFields fields,
                       std::shared_ptr<const Json> parent, const Json& path, const Order& order,
                       Completion done) {
        if (fields.empty()) {
            done(Json::object(), false);
            return;
        }

        auto join = std::make_shared<Join>();
        auto keys = std::make_shared<std::vector<std::string>>();
        for (auto& f : fields) keys->push_back(f.responseKey);
        join->values.resize(fields.size());
        join->remaining = fields.size();

        auto finish = [join, keys, done = std::move(done)]() {
            if (join->failed) {
                done(nullptr, true);
                return;
            }
            Json object = Json::object();
            for (std::size_t i = 0; i < keys->size(); ++i) {
                object[(*keys)[i]] = std::move(join->values[i]);
            }
            done(std::move(object), false);
        };

        for (std::size_t i = 0; i < fields.size(); ++i) {
            Json childPath = path;
            childPath.push_back(fields[i].responseKey);
            Order childOrder = order;
            childOrder.push_back(i);
            executeField(type, std::move(fields[i]), parent, std::move(childPath), std::move(childOrder),
                         [join, i, finish](Json value, bool failed) {
                             join->values[i] = std::move(value);
                             if (failed) join->failed = true;
                             if (join->remaining.fetch_sub(1, std::memory_order_acq_rel) == 1) finish();
                         });
        }
    }

    // Mutation root: field i+1 starts once field i is completely resolved
    void executeFieldsSerially(const TypeDefinition& type, std::shared_ptr<CollectedFields> fields,
                               std::size_t i, std::shared_ptr<const Json> parent,
                               std::shared_ptr<Json> result, Completion done) {
        if (i == fields->size()) {
            done(std::move(*result), false);
            return;
        }
        auto self = shared_from_this();
        const auto& field = (*fields)[i];
        Json path = Json::array({field.responseKey});
        executeField(type, field, parent, std::move(path), Order{i},
                     [self, &type, fields, i, parent, result, done](Json value, bool failed) {
                         if (failed) {
                             done(nullptr, true);
                             return;
                         }
                         (*result)[(*fields)[i].responseKey] = std::move(value);
                         self->executeFieldsSerially(type, fields, i + 1, parent, result, done);
                     });
    }

    // ── Fields ──

    void executeField(const TypeDefinition& parentType, CollectedField field,
                      std::shared_ptr<const Json> parent, Json path, Order order, Completion done) {
        auto self = shared_from_this();
        const FieldDefinition* def = field.definition;
        bool nonNull = def->type.isNonNull();

        auto ctx = std::make_shared<FieldContext>();
        ctx->parentType = &parentType;
        ctx->definition = def;
        ctx->nodes = std::move(field.nodes);

        // A failed nullable field becomes null; a NonNull one fails its parent
        Completion fieldDone = [nonNull, done = std::move(done)](Json value, bool failed) {
            if (failed && !nonNull) done(nullptr, false);
            else done(std::move(value), failed);
        };

        if (cancelled) {
            fieldError(abortError(), *ctx, path, order);
            fieldDone(nullptr, true);
            return;
        }

        Json args;
        try {
            args = coerceArguments(def->arguments, ctx->nodes.front()->arguments, *schema, variables);
        } catch (const CoercionError& e) {
            fieldError(e.what(), *ctx, path, order);
            fieldDone(nullptr, true);
            return;
        }

        ResolveInfo& info = ctx->info;
        info.request_ = self;
        info.parent_ = parent;
        info.args_ = std::move(args);
        info.parentType_ = &parentType;
        info.fieldDef_ = def;
        info.field_ = ctx->nodes.front();
        info.path_ = path;

        FieldContextPtr shared = ctx;
        ResolveCallback complete = [self, shared, path, order, fieldDone](std::exception_ptr error, Json raw) {
            if (error) {
                self->fieldError(error, *shared, path, order);
                fieldDone(nullptr, true);
                return;
            }
            self->completeValue(shared->definition->type, shared, path, order, std::move(raw), fieldDone);
        };

        if (def->resolveAsync) {
            auto invocation = begin(std::move(complete));
            if (!invocation) return;
            try {
                def->resolveAsync(info, [self, invocation](std::exception_ptr error, Json value) {
                    self->settle(invocation, std::move(error), std::move(value));
                });
            } catch (...) {
                settle(invocation, std::current_exception(), nullptr);
            }
        } else if (def->resolve) {
            auto invocation = begin(std::move(complete));
            if (!invocation) return;
            boost::asio::post(pool, [self, invocation, shared]() {
                if (invocation->settled) return;
                Json result;
                try {
                    result = shared->definition->resolve(shared->info);
                } catch (...) {
                    self->settle(invocation, std::current_exception(), nullptr);
                    return;
                }
                self->settle(invocation, nullptr, std::move(result));
            });
        } else {
            Json value;
            if (parent->is_object() && parent->contains(def->name)) value = (*parent)[def->name];
            complete(nullptr, std::move(value));
        }
    }

    // ── Result completion ──

    void completeValue(const TypeRef& type, const FieldContextPtr& ctx, const Json& path,
                       const Order& order, Json raw, Completion done) {
        if (type.isNonNull()) {
            auto self = shared_from_this();
            completeValue(type.ofType(), ctx, path, order, std::move(raw),
                          [self, ctx, path, order, done](Json value, bool failed) {
                              if (failed) {
                                  done(nullptr, true);
                                  return;
                              }
                              if (value.is_null()) {
                                  self->fieldError("Cannot return null for non-nullable field " +
                                                   ctx->coordinate() + ".", *ctx, path, order);
                                  done(nullptr, true);
                                  return;
                              }
                              done(std::move(value), false);
                          });
            return;
        }

        if (raw.is_null()) {
            done(nullptr, false);
            return;
        }

        if (type.isList()) {
            completeList(type.ofType(), ctx, path, order, std::move(raw), std::move(done));
            return;
        }

        const TypeDefinition* def = schema->type(type.namedType());
        switch (def->kind) {
            case TypeKind::Scalar: {
                Json serialized;
                try {
                    serialized = def->scalar()->serialize(raw);
                } catch (const std::exception& e) {
                    fieldError(e.what(), *ctx, path, order);
                    done(nullptr, true);
                    return;
                }
                done(std::move(serialized), false);
                return;
            }
            case TypeKind::Enum: {
                if (!raw.is_string() || !def->enumValue(raw.get<std::string>())) {
                    fieldError("Enum \"" + def->name + "\" cannot represent value: " + raw.dump(),
                               *ctx, path, order);
                    done(nullptr, true);
                    return;
                }
                done(std::move(raw), false);
                return;
            }
            case TypeKind::Object:
                completeObject(*def, ctx, path, order, std::move(raw), std::move(done));
                return;
            case TypeKind::Interface:
            case TypeKind::Union:
                completeAbstract(*def, ctx, path, order, std::move(raw), std::move(done));
                return;
            case TypeKind::InputObject:
                break;
        }
        fieldError("Cannot complete value of input type \"" + def->name + "\".", *ctx, path, order);
        done(nullptr, true);
    }

    void completeList(const TypeRef& itemType, const FieldContextPtr& ctx, const Json& path,
                      const Order& order, Json raw, Completion done) {
        if (!raw.is_array()) {
            fieldError("Expected Iterable, but did not find one for field \"" + ctx->coordinate() + "\".",
                       *ctx, path, order);
            done(nullptr, true);
            return;
        }
        if (raw.empty()) {
            done(Json::array(), false);
            return;
        }

        auto join = std::make_shared<Join>();
        join->values.resize(raw.size());
        join->remaining = raw.size();
        bool nullableItems = !itemType.isNonNull();

        auto finish = [join, done = std::move(done)]() {
            if (join->failed) {
                done(nullptr, true);
                return;
            }
            Json items = Json::array();
            for (auto& v : join->values) items.push_back(std::move(v));
            done(std::move(items), false);
        };

        for (std::size_t i = 0; i < raw.size(); ++i) {
            Json itemPath = path;
            itemPath.push_back(i);
            Order itemOrder = order;
            itemOrder.push_back(i);
            completeValue(itemType, ctx, itemPath, itemOrder, std::move(raw[i]),
                          [join, i, nullableItems, finish](Json value, bool failed) {
                              if (failed && nullableItems) {
                                  value = nullptr;
                                  failed = false;
                              }
                              join->values[i] = std::move(value);
                              if (failed) join->failed = true;
                              if (join->remaining.fetch_sub(1, std::memory_order_acq_rel) == 1) finish();
                          });
        }
    }

    void completeAbstract(const TypeDefinition& abstractType, const FieldContextPtr& ctx, const Json& path,
                          const Order& order, Json raw, Completion done) {
        const TypeResolver* resolver = nullptr;
        if (auto* iface = abstractType.interfaceType()) resolver = &iface->resolveType;
        if (auto* u = abstractType.unionType()) resolver = &u->resolveType;

        std::string typeName;
        try {
            if (resolver && *resolver) {
                typeName = (*resolver)(raw, ctx->info);
            } else if (raw.is_object() && raw.contains("__typename") && raw["__typename"].is_string()) {
                typeName = raw["__typename"].get<std::string>();
            }
        } catch (const std::exception& e) {
            fieldError(e.what(), *ctx, path, order);
            done(nullptr, true);
            return;
        }

        auto* runtime = typeName.empty() ? nullptr : schema->type(typeName);
        if (!runtime || runtime->kind != TypeKind::Object) {
            fieldError("Abstract type \"" + abstractType.name + "\" must resolve to an Object type at "
                       "runtime for field \"" + ctx->coordinate() + "\". Either the \"" +
                       abstractType.name + "\" type should provide a type resolver or each possible "
                       "type should provide a \"__typename\".", *ctx, path, order);
            done(nullptr, true);
            return;
        }
        if (!schema->isPossibleType(abstractType, *runtime)) {
            fieldError("Runtime Object type \"" + runtime->name + "\" is not a possible type for \"" +
                       abstractType.name + "\".", *ctx, path, order);
            done(nullptr, true);
            return;
        }
        completeObject(*runtime, ctx, path, order, std::move(raw), std::move(done));
    }

    void completeObject(const TypeDefinition& objectType, const FieldContextPtr& ctx, const Json& path,
                        const Order& order, Json raw, Completion done) {
        auto fields = collectSubfields(objectType, ctx->nodes);
        executeFields(objectType, std::move(fields), std::make_shared<const Json>(std::move(raw)),
                      path, order, std::move(done));
    }

    // ── Operation ──

    void run(const TypeDefinition& root) {
        auto self = shared_from_this();
        CollectedFields fields;
        std::unordered_map<std::string, std::size_t> index;
        std::set<std::string> visited;
        collectFields(root, operation->selectionSet, visited, fields, index);

        Completion done = [self](Json data, bool failed) {
            self->finish(failed ? Json(nullptr) : std::move(data));
        };

        if (operation->operation == ast::OperationType::Mutation) {
            executeFieldsSerially(root, std::make_shared<CollectedFields>(std::move(fields)), 0,
                                  rootValue, std::make_shared<Json>(Json::object()), std::move(done));
        } else {
            executeFields(root, std::move(fields), rootValue, Json::array(), Order{}, std::move(done));
        }
    }

    void finish(Json data) {
        if (deadline) {
            auto timer = deadline;
            boost::asio::post(timer->get_executor(), [timer]() { timer->cancel(); });
        }
        if (cancellation) cancellation->unsubscribe(cancellationHandle);

        ExecutionResult result;
        result.data = std::move(data);
        result.errors = errors.sorted();
        console::debug("operation finished with", result.errors.size(), "error(s)");

        auto callback = std::move(onDone);
        callback(std::move(result));
    }
};

} // namespace detail

// ═══════════════════════════════════════════
//  ResolveInfo
// ═══════════════════════════════════════════

const Json& ResolveInfo::arg(const std::string& name) const {
    static const Json kNull;
    auto it = args_.find(name);
    return it == args_.end() ? kNull : *it;
}

const std::string& ResolveInfo::fieldName() const { return fieldDef_->name; }
const Schema& ResolveInfo::schema() const { return *request_->schema; }
const ast::OperationDefinition& ResolveInfo::operation() const { return *request_->operation; }
const Json& ResolveInfo::rootValue() const { return *request_->rootValue; }
const Json& ResolveInfo::variables() const { return request_->variables; }
const std::any& ResolveInfo::context() const { return request_->context; }
bool ResolveInfo::cancelled() const { return request_->cancelled; }

// ═══════════════════════════════════════════
//  Executor
// ═══════════════════════════════════════════

Executor::Executor(ExecutorOptions options)
    : options_(options)
    , pool_(std::max<std::size_t>(1, options.threads)) {}

Executor::~Executor() {
    pool_.join();
}

ExecutionResult Executor::execute(ExecutionRequest request) {
    std::promise<ExecutionResult> promise;
    auto future = promise.get_future();
    executeAsync(std::move(request), [&promise](ExecutionResult result) {
        promise.set_value(std::move(result));
    });
    return future.get();
}

void Executor::executeAsync(ExecutionRequest request, Callback done) {
    if (!request.schema || !request.document) {
        throw std::invalid_argument("ExecutionRequest requires a schema and a document");
    }

    auto requestError = [&done](std::vector<GraphQLError> errors) {
        ExecutionResult result;
        result.errors = std::move(errors);
        done(std::move(result));
    };

    const ast::OperationDefinition* operation = nullptr;
    try {
        operation = &request.document->operation(request.operationName);
    } catch (const GraphQLError& e) {
        requestError({e});
        return;
    }

    const TypeDefinition* root = nullptr;
    switch (operation->operation) {
        case ast::OperationType::Query:        root = request.schema->queryType(); break;
        case ast::OperationType::Mutation:     root = request.schema->mutationType(); break;
        case ast::OperationType::Subscription: root = request.schema->subscriptionType(); break;
    }
    if (!root) {
        requestError({GraphQLError(std::string("Schema is not configured to execute ") +
                                   ast::toString(operation->operation) + " operation.",
                                   {operation->loc})});
        return;
    }

    auto coerced = coerceVariableValues(*request.schema, *operation, request.variables);
    if (!coerced.ok()) {
        requestError(std::move(coerced.errors));
        return;
    }

    auto state = std::make_shared<detail::RequestState>(pool_);
    state->schema = std::move(request.schema);
    state->document = std::move(request.document);
    state->operation = operation;
    state->variables = std::move(coerced.values);
    state->rootValue = std::make_shared<const Json>(std::move(request.rootValue));
    state->context = std::move(request.context);
    state->onDone = std::move(done);

    console::debug("executing", ast::toString(operation->operation),
                   operation->name.empty() ? std::string("<anonymous>") : operation->name);

    std::weak_ptr<detail::RequestState> weak = state;
    if (request.timeout) {
        auto timeout = *request.timeout;
        state->deadline = std::make_shared<boost::asio::steady_timer>(boost::asio::make_strand(pool_));
        state->deadline->expires_after(timeout);
        state->deadline->async_wait([weak, timeout](const boost::system::error_code& ec) {
            if (ec) return;
            if (auto s = weak.lock()) {
                console::warn("deadline of", timeout.count(), "ms expired, aborting in-flight fields");
                s->abort();
            }
        });
    }
    if (request.cancellation) {
        state->cancellation = request.cancellation;
        state->cancellationHandle = request.cancellation->subscribe([weak]() {
            if (auto s = weak.lock()) s->abort();
        });
    }

    state->run(*root);
}

} // namespace gqlpp
