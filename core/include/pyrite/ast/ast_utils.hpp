// pyrite/ast/ast_utils.hpp - Printing and rewriting expressions
//
#pragma once

#include <string>

#include "pyrite/ast/ast.hpp"
#include "pyrite/ast/ast_context.hpp"

namespace pyrite
{

/// Python-like source rendering of an expression, e.g. `[1, 2.0, "a"]`.
[[nodiscard]] std::string to_string(const Expr * expr);

/**
 * Deep-copy `expr` into `ctx` with every name delocalized.
 *
 * The copy lives as long as `ctx`; the input is left untouched.
 */
[[nodiscard]] Expr * delocalize(AstContext & ctx, const Expr * expr);

}  // namespace pyrite
