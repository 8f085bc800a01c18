// pyrite/sema/analysis/invariance.hpp - Invariance mismatch detection
//
#pragma once

#include "pyrite/sema/resolution/resolution.hpp"
#include "pyrite/sema/types/type.hpp"

namespace pyrite
{

/**
 * Whether `left <= right` fails only because of an invariant parameter.
 *
 * True if both are the same generic class with the same arity and some
 * invariant position has `left_arg <= right_arg`. `list[int]` against
 * `list[float]` is the typical case. Used for diagnostics only.
 */
[[nodiscard]] bool is_invariance_mismatch(
  const Resolution & resolution, const Type * left, const Type * right);

}  // namespace pyrite
