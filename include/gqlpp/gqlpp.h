#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/gqlpp.h — Umbrella header for the gqlpp library
// ═══════════════════════════════════════════════════════════════════
//
//  #include "gqlpp/gqlpp.h"
//  using namespace gqlpp;
//
//  This single include gives you everything:
//    • Schema and its fluent builders
//    • parse(), print()
//    • Validator, Executor, Service
//    • Response, CacheControl
//    • console::log(), debug(), warn(), error()
//    • Json, GQLPP_SERIALIZE
//
// ═══════════════════════════════════════════════════════════════════

// Core
#include "json_utils.h"
#include "console.h"
#include "errors.h"

// Syntax
#include "type_ref.h"
#include "ast.h"
#include "lexer.h"
#include "parser.h"
#include "printer.h"

// Type system
#include "schema.h"
#include "scalars.h"
#include "introspection.h"
#include "values.h"

// Pipeline
#include "validator.h"
#include "cancellation.h"
#include "executor.h"
#include "cache_control.h"
#include "response.h"
#include "service.h"
