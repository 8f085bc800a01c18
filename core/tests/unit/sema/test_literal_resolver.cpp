// tests/unit/sema/test_literal_resolver.cpp - Unit tests for literal inference and reconciliation
//

#include <gtest/gtest.h>

#include "pyrite/sema/analysis/literal_resolver.hpp"
#include "pyrite/test_support/stub_environment.hpp"

using namespace pyrite;
using pyrite::test_support::TestContext;

namespace
{

struct SemaLiteralResolver : public ::testing::Test
{
  TestContext ctx;

  const Type * literal(const Expr * expr) { return resolve_literal(ctx.resolution(), expr); }
};

}  // namespace

// ============================================================================
// Scalars
// ============================================================================

TEST_F(SemaLiteralResolver, Scalars)
{
  auto & b = ctx.b;
  auto & types = ctx.types;
  EXPECT_EQ(literal(b.boolean(true)), types.bool_type());
  EXPECT_EQ(literal(b.integer(1)), types.integer_type());
  EXPECT_EQ(literal(b.floating(1.5)), types.float_type());
  EXPECT_EQ(literal(b.complex(2.0)), types.complex_type());
  EXPECT_EQ(literal(b.string("a")), types.string_type());
  EXPECT_EQ(literal(b.string("a", StringKind::Format)), types.string_type());
  EXPECT_EQ(literal(b.bytes("a")), types.bytes_type());
}

TEST_F(SemaLiteralResolver, UnsupportedFormsAreObject)
{
  auto & b = ctx.b;
  EXPECT_EQ(literal(b.unary(UnaryOp::Negate, b.integer(1))), ctx.types.object_type());
  EXPECT_EQ(literal(b.starred(b.list({}))), ctx.types.object_type());
}

// ============================================================================
// Names and Calls
// ============================================================================

TEST_F(SemaLiteralResolver, ClassNameIsMetaType)
{
  ctx.add_class("Foo");
  EXPECT_EQ(literal(ctx.b.name("Foo")), ctx.types.get_meta_type(ctx.type("Foo")));
}

TEST_F(SemaLiteralResolver, CallOfClassIsInstance)
{
  ctx.add_class("Foo");
  EXPECT_EQ(literal(ctx.b.call(ctx.b.name("Foo"), {ctx.b.integer(1)})), ctx.type("Foo"));
  EXPECT_EQ(literal(ctx.b.call(ctx.b.name("make"))), ctx.types.object_type());
  EXPECT_EQ(literal(ctx.b.call(ctx.b.call(ctx.b.name("Foo")))), ctx.types.object_type());
}

TEST_F(SemaLiteralResolver, NoneNameIsNoneType)
{
  EXPECT_EQ(literal(ctx.b.name("None")), ctx.types.none_type());
}

TEST_F(SemaLiteralResolver, UnknownNameIsObject)
{
  EXPECT_EQ(literal(ctx.b.name("x")), ctx.types.object_type());
}

// ============================================================================
// Compound Forms
// ============================================================================

TEST_F(SemaLiteralResolver, ListJoinsElements)
{
  auto & b = ctx.b;
  auto & types = ctx.types;
  EXPECT_EQ(
    literal(b.list({b.integer(1), b.integer(2), b.integer(3)})),
    types.list_type(types.integer_type()));
  EXPECT_EQ(literal(b.list({b.integer(1), b.floating(2.0)})), types.list_type(types.float_type()));
  EXPECT_EQ(
    literal(b.list({b.integer(1), b.string("a")})), types.list_type(types.object_type()));
  EXPECT_EQ(literal(b.list({})), types.object_type());
}

TEST_F(SemaLiteralResolver, SetJoinsElements)
{
  auto & b = ctx.b;
  EXPECT_EQ(
    literal(b.set({b.boolean(true), b.integer(2)})),
    ctx.types.set_type(ctx.types.integer_type()));
}

TEST_F(SemaLiteralResolver, DictionaryJoinsKeysAndValues)
{
  auto & b = ctx.b;
  auto & types = ctx.types;
  EXPECT_EQ(
    literal(b.dict({{b.string("a"), b.integer(1)}, {b.string("b"), b.floating(2.0)}})),
    types.dictionary_type(types.string_type(), types.float_type()));
  EXPECT_EQ(literal(b.dict({})), types.object_type());
  EXPECT_EQ(
    literal(b.dict({{b.string("a"), b.integer(1)}}, {b.name("rest")})), types.object_type());
}

TEST_F(SemaLiteralResolver, TupleKeepsPositions)
{
  auto & b = ctx.b;
  auto & types = ctx.types;
  EXPECT_EQ(
    literal(b.tuple({b.integer(1), b.string("a")})),
    types.get_bounded_tuple_type({types.integer_type(), types.string_type()}));
  EXPECT_EQ(literal(b.tuple({})), types.get_bounded_tuple_type({}));
}

TEST_F(SemaLiteralResolver, BooleanOperatorAndTernaryJoin)
{
  auto & b = ctx.b;
  auto & types = ctx.types;
  EXPECT_EQ(
    literal(b.boolean(b.integer(1), BooleanOp::Or, b.floating(1.0))), types.float_type());
  EXPECT_EQ(
    literal(b.ternary(b.integer(1), b.boolean(true), b.name("None"))),
    types.get_optional_type(types.integer_type()));
  EXPECT_EQ(
    literal(b.boolean(b.integer(1), BooleanOp::And, b.list({}))), types.object_type());
}

TEST_F(SemaLiteralResolver, AwaitAndYield)
{
  auto & b = ctx.b;
  auto & types = ctx.types;
  EXPECT_EQ(literal(b.await(b.integer(1))), types.top_type());
  EXPECT_EQ(
    literal(b.yield(b.integer(1))),
    types.generator_type(types.object_type(), types.none_type(), types.none_type()));
}

// ============================================================================
// Mutable Literals
// ============================================================================

TEST_F(SemaLiteralResolver, ListLiteralWidensToExpected)
{
  auto & b = ctx.b;
  auto & types = ctx.types;
  const Type * ints = types.list_type(types.integer_type());
  const Type * floats = types.list_type(types.float_type());
  const Expr * literal_expr = b.list({b.integer(1), b.integer(2), b.integer(3)});

  const Resolution r = ctx.resolution();
  EXPECT_EQ(resolve_mutable_literals(r, literal_expr, ints, floats), floats);
  EXPECT_EQ(resolve_mutable_literals(r, b.name("xs"), ints, floats), ints);
  EXPECT_EQ(resolve_mutable_literals(r, nullptr, ints, floats), ints);
}

TEST_F(SemaLiteralResolver, MutableLiteralRequiresSubtypeParameters)
{
  auto & b = ctx.b;
  auto & types = ctx.types;
  const Type * floats = types.list_type(types.float_type());
  const Type * strs = types.list_type(types.string_type());
  const Resolution r = ctx.resolution();

  EXPECT_EQ(resolve_mutable_literals(r, b.list({b.string("a")}), strs, floats), strs);
}

TEST_F(SemaLiteralResolver, MutableLiteralRequiresMatchingContainer)
{
  auto & b = ctx.b;
  auto & types = ctx.types;
  const Type * int_set = types.set_type(types.integer_type());
  const Type * float_list = types.list_type(types.float_type());
  const Resolution r = ctx.resolution();

  EXPECT_EQ(resolve_mutable_literals(r, b.set({b.integer(1)}), int_set, float_list), int_set);
  // The expression shape decides, not the inferred type.
  EXPECT_EQ(
    resolve_mutable_literals(
      r, b.set({b.integer(1)}), types.list_type(types.integer_type()), float_list),
    types.list_type(types.integer_type()));
}

TEST_F(SemaLiteralResolver, MutableDictionaryAndComprehensions)
{
  auto & b = ctx.b;
  auto & types = ctx.types;
  const Resolution r = ctx.resolution();

  const Type * str_int = types.dictionary_type(types.string_type(), types.integer_type());
  const Type * str_float = types.dictionary_type(types.string_type(), types.float_type());
  const Type * str_obj = types.dictionary_type(types.string_type(), types.object_type());
  const Expr * dict = b.dict({{b.string("a"), b.integer(1)}});
  EXPECT_EQ(resolve_mutable_literals(r, dict, str_int, str_float), str_float);
  EXPECT_EQ(resolve_mutable_literals(r, dict, str_int, str_obj), str_obj);

  const Expr * comprehension =
    b.dict_comprehension(b.name("k"), b.name("v"), b.name("k"), b.name("xs"));
  EXPECT_EQ(resolve_mutable_literals(r, comprehension, str_int, str_float), str_float);

  const Type * int_set = types.set_type(types.integer_type());
  const Type * float_set = types.set_type(types.float_type());
  const Expr * set_comp = b.set_comprehension(b.name("x"), b.name("x"), b.name("xs"));
  EXPECT_EQ(resolve_mutable_literals(r, set_comp, int_set, float_set), float_set);
}
