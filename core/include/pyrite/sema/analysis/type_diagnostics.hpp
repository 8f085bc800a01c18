// pyrite/sema/analysis/type_diagnostics.hpp - Reporting type incompatibilities
//
#pragma once

#include <string_view>

#include "pyrite/basic/diagnostic.hpp"
#include "pyrite/basic/source_range.hpp"
#include "pyrite/sema/resolution/resolution.hpp"
#include "pyrite/sema/types/type.hpp"

namespace pyrite
{

/// Diagnostic code of "incompatible type" errors.
inline constexpr const char * k_incompatible_type_code = "E0101";

/**
 * Report that `actual` cannot be used where `expected` is required.
 *
 * `context` names the use site ("parameter `x`", "return value", ...). When
 * the failure is only due to an invariant parameter, a help message points
 * at a covariant alternative.
 */
void report_incompatible_type(
  DiagnosticBag & diagnostics, const Resolution & resolution, SourceRange range,
  const Type * expected, const Type * actual, std::string_view context);

}  // namespace pyrite
