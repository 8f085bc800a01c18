// tests/unit/ast/test_ast_utils.cpp - Unit tests for expression printing and delocalization
//

#include <gtest/gtest.h>

#include "pyrite/ast/ast_context.hpp"
#include "pyrite/ast/ast_utils.hpp"
#include "pyrite/test_support/expr_builder.hpp"

using namespace pyrite;
using pyrite::test_support::ExprBuilder;

struct TestContext
{
  AstContext ast;
  ExprBuilder b{ast};
};

TEST(AstUtils, PrintsLiterals)
{
  TestContext ctx;
  auto & b = ctx.b;
  EXPECT_EQ(to_string(b.integer(42)), "42");
  EXPECT_EQ(to_string(b.floating(1.0)), "1.0");
  EXPECT_EQ(to_string(b.floating(2.5)), "2.5");
  EXPECT_EQ(to_string(b.boolean(true)), "True");
  EXPECT_EQ(to_string(b.string("a")), "\"a\"");
  EXPECT_EQ(to_string(b.bytes("a")), "b\"a\"");
}

TEST(AstUtils, PrintsDisplays)
{
  TestContext ctx;
  auto & b = ctx.b;
  EXPECT_EQ(to_string(b.list({b.integer(1), b.integer(2)})), "[1, 2]");
  EXPECT_EQ(to_string(b.set({b.integer(1)})), "{1}");
  EXPECT_EQ(to_string(b.tuple({b.integer(1)})), "(1,)");
  EXPECT_EQ(to_string(b.tuple({b.integer(1), b.string("a")})), "(1, \"a\")");
  EXPECT_EQ(to_string(b.dict({{b.string("k"), b.integer(1)}}, {b.name("rest")})),
            "{\"k\": 1, **rest}");
}

TEST(AstUtils, PrintsCompoundForms)
{
  TestContext ctx;
  auto & b = ctx.b;
  EXPECT_EQ(to_string(b.call(b.name("typing.cast"), {b.name("x")})), "typing.cast(x)");
  EXPECT_EQ(to_string(b.await(b.name("task"))), "await task");
  EXPECT_EQ(to_string(b.boolean(b.name("a"), BooleanOp::Or, b.integer(0))), "a or 0");
  EXPECT_EQ(to_string(b.ternary(b.integer(1), b.name("c"), b.integer(2))), "1 if c else 2");
  EXPECT_EQ(to_string(b.unary(UnaryOp::Not, b.name("x"))), "not x");
  EXPECT_EQ(to_string(b.yield()), "yield");
  EXPECT_EQ(
    to_string(b.list_comprehension(b.name("x"), b.name("x"), b.name("xs"))), "[x for x in xs]");
}

TEST(AstUtils, DelocalizeRewritesNestedNames)
{
  TestContext ctx;
  auto & b = ctx.b;
  Expr * original = b.list({b.name("$local_m?f$Foo"), b.call(b.name("$local_$Bar"))});

  AstContext scratch;
  const Expr * copy = delocalize(scratch, original);

  EXPECT_EQ(to_string(copy), "[m.f.Foo, Bar()]");
  // The input tree is untouched.
  EXPECT_EQ(to_string(original), "[$local_m?f$Foo, $local_$Bar()]");
}

TEST(AstUtils, DelocalizeKeepsShape)
{
  TestContext ctx;
  auto & b = ctx.b;
  Expr * original = b.dict({{b.string("k"), b.name("$local_$v")}});

  AstContext scratch;
  const Expr * copy = delocalize(scratch, original);

  ASSERT_TRUE(isa<DictionaryExpr>(copy));
  EXPECT_NE(copy, original);
  EXPECT_EQ(to_string(copy), "{\"k\": v}");
}
