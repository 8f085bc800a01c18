// pyrite/sema/analysis/type_diagnostics.cpp - Reporting type incompatibilities
//
#include "pyrite/sema/analysis/type_diagnostics.hpp"

#include <fmt/format.h>

#include "pyrite/sema/analysis/invariance.hpp"
#include "pyrite/sema/types/type_utils.hpp"

namespace pyrite
{

namespace
{

/// Read-only protocol to suggest instead of an invariant container.
const char * covariant_alternative(const Type * type)
{
  if (type->name == builtin::k_list) return "typing.Sequence";
  if (type->name == builtin::k_dict) return "typing.Mapping";
  if (type->name == builtin::k_set) return "typing.AbstractSet";
  return nullptr;
}

}  // namespace

void report_incompatible_type(
  DiagnosticBag & diagnostics, const Resolution & resolution, SourceRange range,
  const Type * expected, const Type * actual, std::string_view context)
{
  const std::string expected_text = to_string(expected);
  const std::string actual_text = to_string(actual);

  auto builder = diagnostics.report_error(
    range, fmt::format("incompatible type for {}", context),
    fmt::format("expected `{}`, found `{}`", expected_text, actual_text));
  builder.with_code(k_incompatible_type_code);

  if (!is_invariance_mismatch(resolution, actual, expected)) return;

  builder.with_note(fmt::format(
    "`{}` is invariant in its type parameters, so `{}` is not a subtype of `{}`", expected->name,
    actual_text, expected_text));
  if (const char * alternative = covariant_alternative(expected)) {
    builder.with_help(fmt::format("consider using `{}`, which is covariant", alternative));
  } else {
    builder.with_help("consider using a covariant type variable or a read-only protocol");
  }
}

}  // namespace pyrite
