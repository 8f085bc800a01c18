// tests/unit/sema/test_invariance.cpp - Unit tests for invariance diagnostics
//

#include <gtest/gtest.h>

#include "pyrite/sema/analysis/invariance.hpp"
#include "pyrite/sema/analysis/type_diagnostics.hpp"
#include "pyrite/test_support/stub_environment.hpp"

using namespace pyrite;
using pyrite::test_support::TestContext;

// ============================================================================
// Detection
// ============================================================================

TEST(SemaInvariance, InvariantUserGeneric)
{
  TestContext ctx;
  ctx.add_class("Box", {ctx.types.get_variable_type("T")});

  const Type * box_int = ctx.types.get_parametric_type("Box", {ctx.types.integer_type()});
  const Type * box_object = ctx.types.get_parametric_type("Box", {ctx.types.object_type()});
  const Resolution r = ctx.resolution();

  EXPECT_TRUE(is_invariance_mismatch(r, box_int, box_object));
  EXPECT_FALSE(is_invariance_mismatch(r, box_object, box_int));
}

TEST(SemaInvariance, BuiltinContainers)
{
  TestContext ctx;
  auto & types = ctx.types;
  const Type * i = types.integer_type();
  const Type * f = types.float_type();
  const Type * s = types.string_type();
  const Resolution r = ctx.resolution();

  EXPECT_TRUE(is_invariance_mismatch(r, types.list_type(i), types.list_type(f)));
  EXPECT_FALSE(is_invariance_mismatch(r, types.list_type(s), types.list_type(f)));
  EXPECT_TRUE(
    is_invariance_mismatch(r, types.dictionary_type(s, i), types.dictionary_type(s, f)));
}

TEST(SemaInvariance, CovariantParametersNeverMismatch)
{
  TestContext ctx;
  ctx.add_class("Reader", {ctx.types.get_variable_type("T_co", Variance::Covariant)});
  const Type * ints = ctx.types.get_parametric_type("Reader", {ctx.types.integer_type()});
  const Type * floats = ctx.types.get_parametric_type("Reader", {ctx.types.float_type()});
  EXPECT_FALSE(is_invariance_mismatch(ctx.resolution(), ints, floats));
}

TEST(SemaInvariance, ShapeMismatches)
{
  TestContext ctx;
  auto & types = ctx.types;
  const Type * i = types.integer_type();
  const Type * f = types.float_type();
  const Resolution r = ctx.resolution();

  EXPECT_FALSE(is_invariance_mismatch(r, types.list_type(i), types.set_type(f)));
  EXPECT_FALSE(is_invariance_mismatch(r, i, f));
  EXPECT_FALSE(is_invariance_mismatch(
    r, types.get_parametric_type("list", {i, i}), types.get_parametric_type("list", {f, f})));
  EXPECT_FALSE(is_invariance_mismatch(
    r, types.get_parametric_type("Missing", {i}), types.get_parametric_type("Missing", {f})));
}

// ============================================================================
// Reporting
// ============================================================================

TEST(SemaTypeDiagnostics, PlainIncompatibility)
{
  TestContext ctx;
  DiagnosticBag diags;
  report_incompatible_type(
    diags, ctx.resolution(), SourceRange(4, 9), ctx.types.integer_type(),
    ctx.types.string_type(), "parameter `x`");

  ASSERT_EQ(diags.size(), 1u);
  const Diagnostic & d = diags.all().front();
  EXPECT_EQ(d.severity, Severity::Error);
  EXPECT_EQ(d.code, k_incompatible_type_code);
  EXPECT_EQ(d.message, "incompatible type for parameter `x`");
  ASSERT_NE(d.primary_label(), nullptr);
  EXPECT_EQ(d.primary_label()->message, "expected `int`, found `str`");
  EXPECT_EQ(d.primary_range(), SourceRange(4, 9));
  EXPECT_TRUE(d.notes.empty());
  EXPECT_FALSE(d.help_message.has_value());
}

TEST(SemaTypeDiagnostics, InvarianceSuggestsCovariantAlternative)
{
  TestContext ctx;
  auto & types = ctx.types;
  DiagnosticBag diags;
  report_incompatible_type(
    diags, ctx.resolution(), SourceRange(0, 3), types.list_type(types.float_type()),
    types.list_type(types.integer_type()), "return value");

  ASSERT_EQ(diags.size(), 1u);
  const Diagnostic & d = diags.all().front();
  ASSERT_EQ(d.notes.size(), 1u);
  EXPECT_NE(d.notes.front().find("`list` is invariant"), std::string::npos);
  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_EQ(*d.help_message, "consider using `typing.Sequence`, which is covariant");
}

TEST(SemaTypeDiagnostics, InvarianceOnUserGenericGetsGenericHelp)
{
  TestContext ctx;
  ctx.add_class("Box", {ctx.types.get_variable_type("T")});
  const Type * expected = ctx.types.get_parametric_type("Box", {ctx.types.object_type()});
  const Type * actual = ctx.types.get_parametric_type("Box", {ctx.types.integer_type()});

  DiagnosticBag diags;
  report_incompatible_type(diags, ctx.resolution(), SourceRange(), expected, actual, "argument");

  ASSERT_EQ(diags.size(), 1u);
  ASSERT_TRUE(diags.all().front().help_message.has_value());
  EXPECT_NE(diags.all().front().help_message->find("covariant"), std::string::npos);
}
