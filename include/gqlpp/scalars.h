#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/scalars.h — Built-in scalar types
// ═══════════════════════════════════════════════════════════════════
//
//  Int, Float, String, Boolean and ID, registered by every Schema.
//  Int is a signed 32-bit integer; larger integral values are a
//  coercion error both on input and on output.
//
//  Decimal is optional; a host registers it with
//    schema.scalar("Decimal", scalars::decimalType(), scalars::kDecimalDescription);
//
// ═══════════════════════════════════════════════════════════════════

#include "schema.h"

namespace gqlpp::scalars {

ScalarType intType();
ScalarType floatType();
ScalarType stringType();
ScalarType booleanType();
ScalarType idType();
// Fixed-point number carried as a String so no digit is lost
ScalarType decimalType();

extern const char* const kIntDescription;
extern const char* const kFloatDescription;
extern const char* const kStringDescription;
extern const char* const kBooleanDescription;
extern const char* const kIdDescription;
extern const char* const kDecimalDescription;

// Registers the five built-in scalars on a schema
void install(Schema& schema);

} // namespace gqlpp::scalars
