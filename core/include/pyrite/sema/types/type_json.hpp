// pyrite/sema/types/type_json.hpp - JSON dumps of types and substitutions
//
#pragma once

#include <nlohmann/json.hpp>

#include "pyrite/sema/types/substitution.hpp"
#include "pyrite/sema/types/type.hpp"

namespace pyrite
{

/**
 * Structural JSON form of a type.
 *
 *   {"kind": "Parametric", "name": "list", "parameters": [{"kind": "Primitive", "name": "int"}]}
 */
[[nodiscard]] nlohmann::json to_json(const Type * type);

/// Object keyed by variable name, values are to_json() of the bound type.
[[nodiscard]] nlohmann::json to_json(const Substitution & substitution);

}  // namespace pyrite
