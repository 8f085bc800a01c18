// tests/unit/sema/test_types.cpp - Unit tests for the type model and type utilities
//

#include <gtest/gtest.h>

#include "pyrite/sema/types/substitution.hpp"
#include "pyrite/sema/types/type.hpp"
#include "pyrite/sema/types/type_json.hpp"
#include "pyrite/sema/types/type_utils.hpp"

using namespace pyrite;

namespace
{

CallableSignature signature(const Type * result, std::vector<const Type *> params)
{
  CallableSignature sig;
  sig.annotation = result;
  std::vector<CallableParameter> defined;
  for (const Type * p : params) defined.push_back(CallableParameter{"", p, false});
  sig.parameters = std::move(defined);
  return sig;
}

}  // namespace

// ============================================================================
// Interning
// ============================================================================

TEST(SemaTypes, InterningGivesPointerEquality)
{
  TypeContext types;
  EXPECT_EQ(types.integer_type(), types.get_primitive_type("int"));
  EXPECT_EQ(types.list_type(types.integer_type()), types.list_type(types.integer_type()));
  EXPECT_NE(types.list_type(types.integer_type()), types.set_type(types.integer_type()));

  const Type * t = types.get_variable_type("T");
  EXPECT_EQ(t, types.get_variable_type("T"));
  EXPECT_NE(t, types.get_variable_type("T", Variance::Covariant));
  EXPECT_NE(t, types.get_bound_variable_type("T", types.integer_type()));
}

TEST(SemaTypes, IdsFollowCreationOrder)
{
  TypeContext types;
  const Type * a = types.get_primitive_type("a");
  const Type * b = types.get_primitive_type("b");
  EXPECT_LT(a->id, b->id);
  EXPECT_TRUE(TypeLess{}(a, b));

  const size_t before = types.size();
  (void)types.get_primitive_type("a");
  EXPECT_EQ(types.size(), before);
}

TEST(SemaTypes, ParametricWithoutParametersIsPrimitive)
{
  TypeContext types;
  EXPECT_EQ(types.get_parametric_type("list", {}), types.get_primitive_type("list"));
}

TEST(SemaTypes, CallablesCompareBySignature)
{
  TypeContext types;
  const Type * a = types.get_callable_type(signature(types.integer_type(), {types.string_type()}));
  const Type * b = types.get_callable_type(signature(types.integer_type(), {types.string_type()}));
  const Type * named =
    types.get_callable_type(signature(types.integer_type(), {types.string_type()}), {}, "f");
  EXPECT_EQ(a, b);
  EXPECT_NE(a, named);

  CallableSignature undefined;
  undefined.annotation = types.integer_type();
  EXPECT_NE(
    types.get_callable_type(undefined),
    types.get_callable_type(signature(types.integer_type(), {})));
}

// ============================================================================
// Union / Optional Normalisation
// ============================================================================

TEST(SemaTypes, UnionIsFlattenedAndDeduplicated)
{
  TypeContext types;
  const Type * i = types.integer_type();
  const Type * s = types.string_type();
  const Type * b = types.bytes_type();

  const Type * inner = types.get_union_type({s, b});
  const Type * u = types.get_union_type({i, inner, i, types.bottom_type()});
  ASSERT_TRUE(u->is_union());
  EXPECT_EQ(u->parameters.size(), 3u);
  EXPECT_EQ(u, types.get_union_type({b, s, i}));
}

TEST(SemaTypes, UnionDegenerateCases)
{
  TypeContext types;
  const Type * i = types.integer_type();
  EXPECT_EQ(types.get_union_type({}), types.bottom_type());
  EXPECT_EQ(types.get_union_type({types.bottom_type()}), types.bottom_type());
  EXPECT_EQ(types.get_union_type({i}), i);
  EXPECT_EQ(types.get_union_type({i, i}), i);
  EXPECT_EQ(types.get_union_type({i, types.top_type()}), types.top_type());
  EXPECT_EQ(types.get_union_type({i, types.object_type()}), types.object_type());
  EXPECT_EQ(types.get_union_type({types.object_type(), types.top_type()}), types.top_type());
}

TEST(SemaTypes, OptionalIsNeverNested)
{
  TypeContext types;
  const Type * opt = types.get_optional_type(types.integer_type());
  EXPECT_EQ(types.get_optional_type(opt), opt);
  EXPECT_EQ(types.get_optional_type(types.top_type()), types.top_type());
}

// ============================================================================
// Printing
// ============================================================================

TEST(SemaTypes, ToString)
{
  TypeContext types;
  const Type * i = types.integer_type();
  const Type * s = types.string_type();

  EXPECT_EQ(to_string(types.top_type()), "unknown");
  EXPECT_EQ(to_string(types.bottom_type()), "undefined");
  EXPECT_EQ(to_string(types.object_type()), "object");
  EXPECT_EQ(to_string(types.dictionary_type(s, i)), "dict[str, int]");
  EXPECT_EQ(to_string(types.get_union_type({i, s})), "typing.Union[int, str]");
  EXPECT_EQ(to_string(types.get_optional_type(i)), "typing.Optional[int]");
  EXPECT_EQ(to_string(types.get_bounded_tuple_type({i, s})), "typing.Tuple[int, str]");
  EXPECT_EQ(to_string(types.get_bounded_tuple_type({})), "typing.Tuple[()]");
  EXPECT_EQ(to_string(types.get_unbounded_tuple_type(i)), "typing.Tuple[int, ...]");
  EXPECT_EQ(to_string(types.get_meta_type(i)), "typing.Type[int]");
  EXPECT_EQ(to_string(types.get_callable_type(signature(s, {i}))), "typing.Callable[[int], str]");
  EXPECT_EQ(
    to_string(types.get_callable_type(signature(s, {i}), {}, "f")),
    "typing.Callable(f)[[int], str]");

  CallableSignature undefined;
  undefined.annotation = i;
  EXPECT_EQ(to_string(types.get_callable_type(undefined)), "typing.Callable[..., int]");
}

TEST(SemaTypes, ToStringOfNamedParametersAndVariables)
{
  TypeContext types;
  const Type * i = types.integer_type();

  CallableSignature sig;
  sig.annotation = i;
  sig.parameters = std::vector<CallableParameter>{{"x", i, false}, {"y", i, true}};
  EXPECT_EQ(
    to_string(types.get_callable_type(sig)),
    "typing.Callable[[Named(x, int), Named(y, int, default)], int]");

  EXPECT_EQ(to_string(types.get_variable_type("T")), "Variable[T]");
  EXPECT_EQ(to_string(types.get_bound_variable_type("T", i)), "Variable[T (bound to int)]");
  EXPECT_EQ(
    to_string(types.get_explicit_variable_type("T", {i, types.string_type()})),
    "Variable[T <: [int, str]]");
}

// ============================================================================
// Structural Queries
// ============================================================================

TEST(SemaTypes, ResolvedAndConcrete)
{
  TypeContext types;
  const Type * t = types.get_variable_type("T");
  const Type * i = types.integer_type();

  EXPECT_TRUE(is_resolved(types.list_type(i)));
  EXPECT_FALSE(is_resolved(types.list_type(t)));
  EXPECT_FALSE(is_resolved(types.get_callable_type(signature(i, {t}))));

  EXPECT_TRUE(is_concrete(types.list_type(types.object_type())));
  EXPECT_FALSE(is_concrete(types.list_type(types.top_type())));
  EXPECT_FALSE(is_concrete(types.get_bounded_tuple_type({i, types.bottom_type()})));
}

TEST(SemaTypes, ElementsCollectsNominalNames)
{
  TypeContext types;
  const Type * t = types.dictionary_type(
    types.string_type(), types.get_optional_type(types.list_type(types.get_primitive_type("Foo"))));
  EXPECT_EQ(elements(t), (std::set<std::string>{"dict", "str", "list", "Foo"}));
}

TEST(SemaTypes, InstantiateIsTopDown)
{
  TypeContext types;
  const Type * i = types.integer_type();
  const Type * list_of_int = types.list_type(i);
  const Type * outer = types.list_type(list_of_int);

  // The outer node is offered to the mapping first and replaced whole.
  const Type * replaced = instantiate(types, outer, [&](const Type * t) -> const Type * {
    if (t == outer) return types.string_type();
    if (t == i) return types.float_type();
    return nullptr;
  });
  EXPECT_EQ(replaced, types.string_type());

  const Type * inner_only = instantiate(types, outer, [&](const Type * t) -> const Type * {
    return t == i ? types.float_type() : nullptr;
  });
  EXPECT_EQ(inner_only, types.list_type(types.list_type(types.float_type())));
}

TEST(SemaTypes, InstantiateRenormalisesUnions)
{
  TypeContext types;
  const Type * t = types.get_variable_type("T");
  const Type * u = types.get_union_type({t, types.integer_type()});
  const Type * result = instantiate(types, u, [&](const Type * x) -> const Type * {
    return x == t ? types.integer_type() : nullptr;
  });
  EXPECT_EQ(result, types.integer_type());
}

TEST(SemaTypes, Projections)
{
  TypeContext types;
  const Type * i = types.integer_type();
  EXPECT_EQ(awaitable_value(types, types.awaitable_type(i)), i);
  EXPECT_EQ(awaitable_value(types, i), types.top_type());
  EXPECT_EQ(single_parameter(types.list_type(i)), i);
  EXPECT_EQ(single_parameter(types.dictionary_type(i, i)), nullptr);
  EXPECT_EQ(single_parameter(i), nullptr);
}

// ============================================================================
// Substitution
// ============================================================================

TEST(SemaTypes, SubstitutionIsPersistent)
{
  TypeContext types;
  const Type * t = types.get_variable_type("T");
  const Type * u = types.get_variable_type("U");

  const Substitution empty;
  const Substitution one = empty.with_binding(t, types.integer_type());
  const Substitution two = one.with_binding(u, types.string_type());

  EXPECT_TRUE(empty.empty());
  EXPECT_EQ(one.size(), 1u);
  EXPECT_EQ(two.size(), 2u);
  EXPECT_EQ(one.find(u), nullptr);
  EXPECT_EQ(two.find(t), types.integer_type());
  EXPECT_EQ(two.to_string(), "{T -> int, U -> str}");

  EXPECT_EQ(
    two.apply(types, types.dictionary_type(t, u)),
    types.dictionary_type(types.integer_type(), types.string_type()));
  EXPECT_EQ(one.apply(types, types.list_type(u)), types.list_type(u));
}

// ============================================================================
// JSON
// ============================================================================

TEST(SemaTypes, JsonDump)
{
  TypeContext types;
  const Type * i = types.integer_type();

  const auto list = to_json(types.list_type(i));
  EXPECT_EQ(list["kind"], "Parametric");
  EXPECT_EQ(list["name"], "list");
  ASSERT_EQ(list["parameters"].size(), 1u);
  EXPECT_EQ(list["parameters"][0]["name"], "int");

  const auto tuple = to_json(types.get_unbounded_tuple_type(i));
  EXPECT_EQ(tuple["kind"], "Tuple");
  EXPECT_TRUE(tuple["unbounded"].get<bool>());
  EXPECT_EQ(tuple["element"]["kind"], "Primitive");

  const auto variable = to_json(types.get_bound_variable_type("T", i, Variance::Covariant));
  EXPECT_EQ(variable["variance"], "covariant");
  EXPECT_EQ(variable["bound"]["name"], "int");

  const Substitution s =
    Substitution().with_binding(types.get_variable_type("T"), types.string_type());
  EXPECT_EQ(to_json(s)["T"]["name"], "str");
}
