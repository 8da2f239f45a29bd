#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/introspection.h — Schema self-description
// ═══════════════════════════════════════════════════════════════════
//
//  Registers __Schema, __Type, __Field, __InputValue, __EnumValue,
//  __Directive, __TypeKind and __DirectiveLocation as ordinary types
//  and wires the meta fields __typename, __schema and __type. The
//  resolvers read the Schema the request runs against, so an
//  introspection query goes through the executor like any other.
//
//  A __Type value is a small handle: {"name": "User"} for a named
//  type, {"kind": "LIST" | "NON_NULL", "ofType": <handle>} for
//  wrappers. Schema::finalize() calls installIntrospection().
// ═══════════════════════════════════════════════════════════════════

#include "json_utils.h"
#include "type_ref.h"

namespace gqlpp {

class Schema;

void installIntrospection(Schema& schema);

// __Type handle for a type reference
Json typeHandle(const TypeRef& type);

} // namespace gqlpp
