#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/errors.h — Error types and the per-request error collector
// ═══════════════════════════════════════════════════════════════════
//
//  Request errors (lex, parse, validation, variable coercion) stop
//  the pipeline. Field errors are appended to an ErrorCollector while
//  the executor keeps resolving unrelated branches.
//
// ═══════════════════════════════════════════════════════════════════

#include "json_utils.h"
#include <cstddef>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace gqlpp {

// ── 1-based source position ──
struct Location {
    int line = 0;
    int column = 0;

    bool operator==(const Location& other) const {
        return line == other.line && column == other.column;
    }
    bool operator!=(const Location& other) const { return !(*this == other); }
};

// ═══════════════════════════════════════════
//  class GraphQLError
//  An error as it appears in a response's "errors" list.
// ═══════════════════════════════════════════
class GraphQLError : public std::runtime_error {
public:
    explicit GraphQLError(const std::string& message,
                          std::vector<Location> locations = {},
                          Json path = Json::array())
        : std::runtime_error(message)
        , locations_(std::move(locations))
        , path_(std::move(path)) {}

    std::string message() const { return what(); }
    const std::vector<Location>& locations() const { return locations_; }
    const Json& path() const { return path_; }

    Json& extensions() { return extensions_; }
    const Json& extensions() const { return extensions_; }

    // {message, locations, path, extensions}; empty members omitted
    Json toJson() const;

private:
    std::vector<Location> locations_;
    Json path_;
    Json extensions_ = Json::object();
};

// ── Malformed source text ──
class LexError : public GraphQLError {
public:
    LexError(Location location, const std::string& reason)
        : GraphQLError("Syntax Error: " + reason, {location})
        , location_(location), reason_(reason) {}

    Location location() const { return location_; }
    const std::string& reason() const { return reason_; }

private:
    Location location_;
    std::string reason_;
};

// ── Grammar violation ──
class ParseError : public GraphQLError {
public:
    ParseError(Location location, const std::string& expected, const std::string& found)
        : GraphQLError("Syntax Error: Expected " + expected + ", found " + found + ".", {location})
        , location_(location), expected_(expected), found_(found) {}

    Location location() const { return location_; }
    const std::string& expected() const { return expected_; }
    const std::string& found() const { return found_; }

private:
    Location location_;
    std::string expected_;
    std::string found_;
};

// ── Invalid schema construction ──
class SchemaError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ── A value could not be coerced to a type ──
class CoercionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ── One failed validation rule ──
struct ValidationError {
    std::string rule;
    std::string message;
    std::vector<Location> locations;

    GraphQLError toGraphQLError() const { return GraphQLError(message, locations); }
};

// ═══════════════════════════════════════════
//  class ErrorCollector
//  Append-only, safe under concurrent appends from resolver branches.
//  Each error carries the position of its response path (collection
//  index per level, list index for items) so the final order does not
//  depend on which branch finished first.
// ═══════════════════════════════════════════
class ErrorCollector {
public:
    void add(GraphQLError error, std::vector<std::size_t> order = {});

    std::size_t size() const;
    bool empty() const { return size() == 0; }

    // Errors ordered by response position, ties by insertion
    std::vector<GraphQLError> sorted() const;

private:
    struct Entry {
        std::vector<std::size_t> order;
        std::size_t sequence;
        GraphQLError error;
    };

    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
};

} // namespace gqlpp
