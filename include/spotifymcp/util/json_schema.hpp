#pragma once
#include "spotifymcp/exceptions.hpp"
#include "spotifymcp/tools/schema.hpp"
#include "spotifymcp/types.hpp"

#include <optional>
#include <string>

namespace spotifymcp::util::schema
{

// Argument validation against a tool's InputSchema.
//
// Fields are processed in declaration order:
//   1. absent + default  -> default substituted
//   2. absent + required -> MissingRequiredField
//   3. present           -> kind check/coercion (TypeMismatch)
//   4. enum declared     -> membership (InvalidEnumValue)
//   5. bounds declared   -> range/length (OutOfRange)
// A JSON null counts as absent. Undeclared fields are dropped, not rejected.
// Returns the validated argument object; throws ValidationError.
Json validate(const tools::InputSchema& schema, const Json& arguments);

// Returns the value converted to `kind`, or nullopt if it is not of that kind.
// Integral floating-point numbers (e.g. 20.0) are accepted as integers.
std::optional<Json> coerce(FieldKind kind, const Json& value);

// Human-readable description of a kind, e.g. "array of string".
std::string describe(FieldKind kind);

// Human-readable bounds, e.g. "0..100", ">= 1".
std::string describe_bounds(const tools::FieldSpec& field);

// The quantity bounds apply to: the integer value, or the length of a string/array.
std::optional<long long> measure(const tools::FieldSpec& field, const Json& value);

} // namespace spotifymcp::util::schema
