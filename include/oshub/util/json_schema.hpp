#pragma once
#include "oshub/exceptions.hpp"
#include "oshub/types.hpp"

#include <string>

namespace oshub::util::schema
{

// Minimal JSON Schema validator for tool arguments, supporting:
// - type: object, array, string, number, integer, boolean
// - required: [..]
// - properties: { name: { type: ... } }
// Throws ValidationError naming the offending argument.

void validate(const Json& schema, const Json& instance);

/// JSON type name of a value, in JSON Schema vocabulary.
std::string type_name(const Json& instance);

} // namespace oshub::util::schema
