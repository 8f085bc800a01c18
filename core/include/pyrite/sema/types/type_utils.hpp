// pyrite/sema/types/type_utils.hpp - Structural queries and rewrites over types
//
#pragma once

#include <functional>
#include <set>
#include <string>

#include "pyrite/sema/types/type.hpp"

namespace pyrite
{

// ============================================================================
// Printing
// ============================================================================

/**
 * Convert a Type to its string representation.
 *
 * Examples: "list[int]", "typing.Optional[str]", "typing.Tuple[int, ...]",
 * "typing.Callable[[int], str]", "typing.Type[Foo]". Top prints as
 * "unknown" and Bottom as "undefined".
 */
[[nodiscard]] std::string to_string(const Type * type);

[[nodiscard]] std::string to_string(Variance variance);

// ============================================================================
// Structural Queries
// ============================================================================

/// True if any sub-tree (the type itself included) satisfies `predicate`.
[[nodiscard]] bool exists(const Type * type, const std::function<bool(const Type *)> & predicate);

[[nodiscard]] bool contains_variable(const Type * type);

/// No free type variable anywhere in the tree.
[[nodiscard]] inline bool is_resolved(const Type * type) { return !contains_variable(type); }

/// No Top and no Bottom anywhere in the tree. Object counts as concrete.
[[nodiscard]] bool is_concrete(const Type * type);

/// Names of every nominal type occurring in the tree.
[[nodiscard]] std::set<std::string> elements(const Type * type);

// ============================================================================
// Rewriting
// ============================================================================

/// Returns a replacement for a sub-tree, or nullptr to keep descending.
using TypeMapping = std::function<const Type *(const Type *)>;

/**
 * Rewrite `type` top-down.
 *
 * `mapping` is consulted at every node before its children; a non-null
 * result replaces the whole sub-tree. Rebuilt nodes are re-interned, so
 * unions are normalised again.
 */
[[nodiscard]] const Type * instantiate(
  TypeContext & types, const Type * type, const TypeMapping & mapping);

// ============================================================================
// Projections
// ============================================================================

/// `typing.Awaitable[T]` yields T; anything else yields Top.
[[nodiscard]] const Type * awaitable_value(TypeContext & types, const Type * type);

/// The only parameter of a one-argument parametric type, or nullptr.
[[nodiscard]] const Type * single_parameter(const Type * type);

}  // namespace pyrite
