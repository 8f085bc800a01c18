// pyrite/sema/analysis/annotation_parser.hpp - Annotation expressions to types
//
#pragma once

#include "pyrite/ast/ast.hpp"
#include "pyrite/sema/resolution/resolution.hpp"
#include "pyrite/sema/types/type.hpp"

namespace pyrite
{

/**
 * Convert an annotation expression to a type under `resolution`.
 *
 * - Names containing the synthetic local marker are delocalized first.
 * - The raw parser of the environment produces the candidate; an
 *   expression it does not understand is Top.
 * - Primitive names that originate from an empty stub module become
 *   Object.
 * - If any name is untracked by the lattice, the whole annotation is Top
 *   unless `allow_untracked` is set.
 */
[[nodiscard]] const Type * parse_annotation(
  const Resolution & resolution, const Expr * expr, bool allow_untracked = false);

}  // namespace pyrite
