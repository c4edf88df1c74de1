#pragma once
#include "easymcp/exceptions.hpp"
#include "easymcp/types.hpp"

#include <string>

namespace easymcp::util::schema
{

// Minimal JSON Schema subset:
// - type: object, array, string, number, integer, boolean, null
// - required: [..]
// - properties: { name: <schema> }   (recursive)
// - items: <schema>                  (applied to every array element)
// - description: documentation only
//
// Throws ValidationError naming the failing path ("$", "$.a.b", "$.items[2]")
// and the expected vs. actual shape.

void validate(const Json& schema, const Json& instance);

/// True when the schema places no constraint (null or empty object).
bool is_unconstrained(const Json& schema);

/// JSON type name of a value as used in schemas ("object", "integer", ...).
std::string type_name(const Json& instance);

} // namespace easymcp::util::schema
