// tests/unit/sema/test_constraint_solver.cpp - Unit tests for generic constraint solving
//

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "pyrite/sema/analysis/constraint_solver.hpp"
#include "pyrite/sema/types/type_utils.hpp"
#include "pyrite/test_support/stub_environment.hpp"

using namespace pyrite;
using pyrite::test_support::TestContext;

namespace
{

struct SemaConstraintSolver : public ::testing::Test
{
  TestContext ctx;
  TypeContext & types = ctx.types;

  const Type * i = types.integer_type();
  const Type * f = types.float_type();
  const Type * s = types.string_type();
  const Type * t = types.get_variable_type("T");

  std::optional<Substitution> solve(
    const Type * source, const Type * target, const Substitution & constraints = {})
  {
    return solve_constraints(ctx.resolution(), constraints, source, target);
  }

  bool exists(const Type * source, const Type * target)
  {
    return constraints_solution_exists(ctx.resolution(), source, target);
  }

  const Type * callable(const Type * result, std::vector<const Type *> params)
  {
    CallableSignature sig;
    sig.annotation = result;
    std::vector<CallableParameter> defined;
    for (const Type * p : params) defined.push_back(CallableParameter{"", p, false});
    sig.parameters = std::move(defined);
    return types.get_callable_type(std::move(sig));
  }

  const Type * iterable(const Type * element)
  {
    return types.get_parametric_type("typing.Iterable", {element});
  }
};

}  // namespace

// ============================================================================
// Resolved Targets
// ============================================================================

TEST_F(SemaConstraintSolver, Reflexivity)
{
  const std::vector<const Type *> samples = {
    i,
    types.list_type(i),
    types.dictionary_type(s, i),
    types.get_bounded_tuple_type({i, s}),
    types.get_unbounded_tuple_type(f),
    types.get_optional_type(i),
    types.get_union_type({i, s}),
    types.get_meta_type(i),
    callable(s, {i}),
  };
  for (const Type * sample : samples) {
    EXPECT_TRUE(exists(sample, sample)) << to_string(sample);
  }
}

TEST_F(SemaConstraintSolver, BottomSourceSolvesAnything)
{
  const Substitution seeded = Substitution().with_binding(t, s);
  for (const Type * target : {i, t, types.list_type(t), types.top_type(), types.bottom_type()}) {
    auto result = solve(types.bottom_type(), target, seeded);
    ASSERT_TRUE(result.has_value()) << to_string(target);
    EXPECT_EQ(*result, seeded);
  }
}

TEST_F(SemaConstraintSolver, TopAgainstObject)
{
  auto result = solve(types.top_type(), types.object_type());
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->empty());
  EXPECT_FALSE(exists(types.top_type(), i));
}

TEST_F(SemaConstraintSolver, UnionSourceIsConjunction)
{
  const Type * u = types.get_union_type({i, s});
  EXPECT_TRUE(exists(u, types.object_type()));
  EXPECT_FALSE(exists(u, i));
  EXPECT_TRUE(exists(i, i));
}

TEST_F(SemaConstraintSolver, ResolvedTargetUsesSubtyping)
{
  EXPECT_TRUE(exists(types.bool_type(), f));
  EXPECT_FALSE(exists(f, i));
  EXPECT_FALSE(exists(types.list_type(i), types.list_type(f)));
  EXPECT_TRUE(exists(types.list_type(i), iterable(f)));
}

// ============================================================================
// Variables
// ============================================================================

TEST_F(SemaConstraintSolver, GenericBinding)
{
  auto result = solve(types.list_type(i), types.list_type(t));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->size(), 1u);
  EXPECT_EQ(result->find(t), i);
}

TEST_F(SemaConstraintSolver, BindingThroughAncestor)
{
  auto result = solve(types.dictionary_type(s, i), iterable(t));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->find(t), s);

  EXPECT_FALSE(solve(i, types.list_type(t)).has_value());
}

TEST_F(SemaConstraintSolver, RepeatedBindingJoins)
{
  auto widened = solve(types.get_union_type({i, f}), t);
  ASSERT_TRUE(widened.has_value());
  EXPECT_EQ(widened->find(t), f);

  // The lattice join of int and str is object, which is wider than the union.
  auto unioned = solve(types.get_union_type({i, s}), t);
  ASSERT_TRUE(unioned.has_value());
  EXPECT_EQ(unioned->find(t), types.get_union_type({i, s}));

  auto seeded = solve(s, t, Substitution().with_binding(t, i));
  ASSERT_TRUE(seeded.has_value());
  EXPECT_EQ(seeded->find(t), types.get_union_type({i, s}));
}

TEST_F(SemaConstraintSolver, BoundVariable)
{
  const Type * bounded = types.get_bound_variable_type("N", f);
  auto result = solve(i, bounded);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->find(bounded), i);
  EXPECT_FALSE(solve(s, bounded).has_value());
}

TEST_F(SemaConstraintSolver, ExplicitVariableBindsToAlternative)
{
  const Type * any_str = types.get_explicit_variable_type("AnyStr", {s, types.bytes_type()});
  const Type * number = types.get_explicit_variable_type("Number", {i, f});

  auto result = solve(types.bool_type(), number);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->find(number), i);

  result = solve(types.bytes_type(), any_str);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->find(any_str), types.bytes_type());

  EXPECT_FALSE(solve(types.complex_type(), number).has_value());
}

TEST_F(SemaConstraintSolver, ExplicitVariableAgainstVariables)
{
  const Type * wide = types.get_explicit_variable_type("W", {i, s, types.bytes_type()});
  const Type * narrow = types.get_explicit_variable_type("Nw", {i, s});
  const Type * other = types.get_explicit_variable_type("O", {i, f});

  auto result = solve(narrow, wide);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->find(wide), narrow);
  EXPECT_FALSE(solve(other, wide).has_value());

  const Type * bounded = types.get_bound_variable_type("B", types.bool_type());
  result = solve(bounded, types.get_explicit_variable_type("Number", {i, f}));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->begin()->second, i);
}

// ============================================================================
// Parametric Variance
// ============================================================================

TEST_F(SemaConstraintSolver, InvariantParametersMustAgree)
{
  EXPECT_FALSE(solve(types.dictionary_type(s, i), types.dictionary_type(t, t)).has_value());

  auto result = solve(types.dictionary_type(s, s), types.dictionary_type(t, t));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->find(t), s);
}

TEST_F(SemaConstraintSolver, UserGenericThroughBase)
{
  const Type * box_var = types.get_variable_type("B");
  ctx.add_class("Box", {box_var}, {types.list_type(box_var)});

  auto result = solve(types.get_parametric_type("Box", {i}), types.list_type(t));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->find(t), i);
}

// ============================================================================
// Optionals, Tuples, Unions
// ============================================================================

TEST_F(SemaConstraintSolver, OptionalUnwrapping)
{
  auto both = solve(types.get_optional_type(i), types.get_optional_type(t));
  ASSERT_TRUE(both.has_value());
  EXPECT_EQ(both->find(t), i);

  auto right_only = solve(s, types.get_optional_type(t));
  ASSERT_TRUE(right_only.has_value());
  EXPECT_EQ(right_only->find(t), s);
}

TEST_F(SemaConstraintSolver, TupleCollapse)
{
  const Type * pair = types.get_bounded_tuple_type({i, s});
  EXPECT_TRUE(exists(pair, types.get_unbounded_tuple_type(types.object_type())));

  auto result = solve(pair, types.get_unbounded_tuple_type(t));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->find(t), types.get_union_type({i, s}));
}

TEST_F(SemaConstraintSolver, TupleShapes)
{
  const Type * u = types.get_variable_type("U");

  auto elementwise =
    solve(types.get_bounded_tuple_type({i, s}), types.get_bounded_tuple_type({t, u}));
  ASSERT_TRUE(elementwise.has_value());
  EXPECT_EQ(elementwise->find(t), i);
  EXPECT_EQ(elementwise->find(u), s);

  EXPECT_FALSE(
    solve(types.get_bounded_tuple_type({i}), types.get_bounded_tuple_type({t, u})).has_value());

  auto replicated =
    solve(types.get_unbounded_tuple_type(i), types.get_bounded_tuple_type({t, u}));
  ASSERT_TRUE(replicated.has_value());
  EXPECT_EQ(replicated->find(t), i);
  EXPECT_EQ(replicated->find(u), i);

  auto unbounded = solve(types.get_unbounded_tuple_type(f), types.get_unbounded_tuple_type(t));
  ASSERT_TRUE(unbounded.has_value());
  EXPECT_EQ(unbounded->find(t), f);

  EXPECT_FALSE(solve(types.list_type(i), types.get_unbounded_tuple_type(t)).has_value());
}

TEST_F(SemaConstraintSolver, UnionTargetTakesFirstMatch)
{
  const Type * list_t = types.list_type(t);
  const Type * target = types.get_union_type({list_t, types.get_optional_type(s)});
  ASSERT_TRUE(target->is_union());

  auto result = solve(types.list_type(i), target);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->find(t), i);

  // Both alternatives accept a list; the earlier one decides the binding.
  const Type * u = types.get_variable_type("U");
  const Type * ambiguous = types.get_union_type({u, list_t});
  result = solve(types.list_type(i), ambiguous);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->size(), 1u);
  const Type * first = ambiguous->parameters.front();
  if (first == u) {
    EXPECT_EQ(result->find(u), types.list_type(i));
  } else {
    EXPECT_EQ(result->find(t), i);
  }

  EXPECT_FALSE(solve(types.bytes_type(), target).has_value());
}

// ============================================================================
// Callables
// ============================================================================

TEST_F(SemaConstraintSolver, CallableReturnBinds)
{
  auto result = solve(callable(i, {s}), callable(t, {s}));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->find(t), i);
}

TEST_F(SemaConstraintSolver, CallableArityTolerance)
{
  auto result = solve(callable(i, {i, s}), callable(t, {i}));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->find(t), i);

  result = solve(callable(i, {i}), callable(t, {i, s}));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->find(t), i);
}

TEST_F(SemaConstraintSolver, CallableSharedParameterMustAgree)
{
  EXPECT_FALSE(solve(callable(i, {s, i}), callable(t, {i})).has_value());
  EXPECT_FALSE(solve(callable(s, {i}), callable(types.list_type(t), {i})).has_value());
}

TEST_F(SemaConstraintSolver, CallableParametersBind)
{
  const Type * u = types.get_variable_type("U");
  auto result = solve(callable(i, {s, f}), callable(t, {u}));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->find(t), i);
  EXPECT_EQ(result->find(u), s);
}

TEST_F(SemaConstraintSolver, ClassObjectIsItsConstructor)
{
  ctx.add_class("Foo");
  const Type * foo = ctx.type("Foo");

  auto result = solve(types.get_meta_type(foo), callable(t, {}));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->find(t), foo);

  // No class definition: the meta type is not callable.
  EXPECT_FALSE(solve(types.get_meta_type(i), callable(t, {})).has_value());
}

TEST_F(SemaConstraintSolver, ClassObjectUsesCustomConstructor)
{
  ctx.add_class("Point");
  const Type * point = ctx.type("Point");
  ctx.env.add_class("Point", callable(point, {i, i}));

  auto result = solve(types.get_meta_type(point), callable(t, {i, i}));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->find(t), point);
  EXPECT_FALSE(solve(types.get_meta_type(point), callable(t, {s})).has_value());
}

TEST_F(SemaConstraintSolver, ClassObjectTargetBindsItsInstance)
{
  auto result = solve(types.get_meta_type(i), types.get_meta_type(t));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->find(t), i);

  // The nominal spelling of a class object meets `Type[T]` through `type`.
  auto nominal = solve(types.get_parametric_type("type", {s}), types.get_meta_type(t));
  ASSERT_TRUE(nominal.has_value());
  EXPECT_EQ(nominal->find(t), s);

  auto nested =
    solve(types.get_meta_type(types.list_type(i)), types.get_meta_type(types.list_type(t)));
  ASSERT_TRUE(nested.has_value());
  EXPECT_EQ(nested->find(t), i);

  EXPECT_FALSE(solve(i, types.get_meta_type(t)).has_value());
  EXPECT_FALSE(solve(types.get_meta_type(s), types.get_meta_type(types.list_type(t))).has_value());
}

// ============================================================================
// Failure Containment
// ============================================================================

TEST_F(SemaConstraintSolver, UntrackedNameIsFailure)
{
  const Type * missing = ctx.type("Missing");
  std::optional<Substitution> result;
  EXPECT_NO_THROW(result = solve(missing, types.list_type(t)));
  EXPECT_FALSE(result.has_value());

  EXPECT_NO_THROW(result = solve(types.top_type(), types.list_type(t)));
  EXPECT_FALSE(result.has_value());
}

TEST_F(SemaConstraintSolver, FailedBranchLeavesInputUnchanged)
{
  const Substitution seeded = Substitution().with_binding(t, i);
  ConstraintSolver solver(ctx.resolution());

  const Type * source = types.get_bounded_tuple_type({i, s});
  const Type * target = types.get_bounded_tuple_type({t, i});
  EXPECT_FALSE(solver.solve(seeded, source, target).has_value());
  EXPECT_EQ(seeded.size(), 1u);
  EXPECT_EQ(seeded.find(t), i);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(SemaConstraintSolver, IndependentSolvesRunInParallel)
{
  constexpr int k_workers = 4;
  constexpr int k_rounds = 200;

  std::vector<const Type *> classes;
  for (int w = 0; w < k_workers; ++w) {
    const std::string name = "C" + std::to_string(w);
    ctx.add_class(name);
    classes.push_back(ctx.type(name));
  }

  std::atomic<int> failures{0};
  std::vector<std::thread> workers;
  for (int w = 0; w < k_workers; ++w) {
    workers.emplace_back([&, w] {
      const Resolution resolution = ctx.resolution();
      const Type * source = types.get_bounded_tuple_type({i, classes[w]});
      const Type * target = types.get_unbounded_tuple_type(t);
      for (int round = 0; round < k_rounds; ++round) {
        auto result = solve_constraints(resolution, Substitution{}, source, target);
        if (!result || result->find(t) != types.get_union_type({i, classes[w]})) ++failures;
      }
    });
  }
  for (auto & worker : workers) worker.join();

  EXPECT_EQ(failures.load(), 0);
}
