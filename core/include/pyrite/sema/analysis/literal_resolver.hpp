// pyrite/sema/analysis/literal_resolver.hpp - Types of literal-shaped expressions
//
// These functions never evaluate general expressions and never consult
// local bindings. Every shape has a fallback, so they cannot fail.
//
#pragma once

#include "pyrite/ast/ast.hpp"
#include "pyrite/sema/resolution/resolution.hpp"
#include "pyrite/sema/types/type.hpp"

namespace pyrite
{

/**
 * Structural type of a literal expression.
 *
 * `[1, 2]` is `list[int]`, `(1, "a")` is `typing.Tuple[int, str]`, a bare
 * class name is its meta type and a call of a class name is an instance.
 * Joins that are not concrete, and every unsupported form, yield Object.
 */
[[nodiscard]] const Type * resolve_literal(const Resolution & resolution, const Expr * expr);

/**
 * Widen the inferred type of a container literal towards `expected`.
 *
 * Applies only when `expr` is a list, set or dictionary display or
 * comprehension, `resolved` and `expected` are the matching container and
 * each inferred parameter is below the expected one. Otherwise `resolved`
 * is returned. `expr` may be nullptr.
 */
[[nodiscard]] const Type * resolve_mutable_literals(
  const Resolution & resolution, const Expr * expr, const Type * resolved,
  const Type * expected);

}  // namespace pyrite
