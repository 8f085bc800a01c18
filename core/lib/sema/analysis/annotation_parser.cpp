// pyrite/sema/analysis/annotation_parser.cpp - Annotation expressions to types
//
#include "pyrite/sema/analysis/annotation_parser.hpp"

#include <string>

#include "pyrite/ast/ast_context.hpp"
#include "pyrite/ast/ast_utils.hpp"
#include "pyrite/basic/log.hpp"
#include "pyrite/sema/types/type_utils.hpp"

namespace pyrite
{

const Type * parse_annotation(
  const Resolution & resolution, const Expr * expr, bool allow_untracked)
{
  TypeContext & types = resolution.types();

  // Scratch arena for the delocalized copy; the parsed type does not refer to it.
  AstContext scratch(1024);
  const Expr * annotation_expr = expr;
  if (to_string(expr).find(k_local_marker) != std::string::npos) {
    annotation_expr = delocalize(scratch, expr);
  }

  const Type * parsed = resolution.environment().parse_annotation(annotation_expr);
  if (!parsed) return types.top_type();

  const Type * annotation = instantiate(types, parsed, [&](const Type * t) -> const Type * {
    if (t->is_primitive() && resolution.module_from_empty_stub(Access::create(t->name))) {
      return types.object_type();
    }
    return nullptr;
  });

  if (!allow_untracked && resolution.contains_untracked(annotation)) {
    log::debug(
      "annotation", "`{}` refers to untracked types, treating as unknown", to_string(annotation));
    return types.top_type();
  }
  return annotation;
}

}  // namespace pyrite
