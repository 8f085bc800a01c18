// pyrite/sema/analysis/literal_resolver.cpp - Types of literal-shaped expressions
//
#include "pyrite/sema/analysis/literal_resolver.hpp"

#include <string_view>
#include <utility>
#include <vector>

#include "pyrite/basic/casting.hpp"
#include "pyrite/sema/analysis/annotation_parser.hpp"
#include "pyrite/sema/types/type_utils.hpp"

namespace pyrite
{

namespace
{

const Type * join_or_object(const Resolution & resolution, const Type * left, const Type * right)
{
  const Type * joined = resolution.join(left, right);
  return is_concrete(joined) ? joined : resolution.types().object_type();
}

const Type * join_elements(const Resolution & resolution, gsl::span<Expr *> elements)
{
  const Type * parameter = resolution.types().bottom_type();
  for (const Expr * element : elements) {
    parameter = resolution.join(parameter, resolve_literal(resolution, element));
  }
  return parameter;
}

bool is_defined(const Resolution & resolution, const Type * type)
{
  return resolution.class_definition(type) != nullptr;
}

}  // namespace

const Type * resolve_literal(const Resolution & resolution, const Expr * expr)
{
  TypeContext & types = resolution.types();

  switch (expr->get_kind()) {
    case NodeKind::Name: {
      const Type * class_type = parse_annotation(resolution, expr);
      // None has no constructor; the name denotes the instance type.
      if (class_type == types.none_type()) return class_type;
      if (is_defined(resolution, class_type)) return types.get_meta_type(class_type);
      return types.object_type();
    }

    case NodeKind::Call: {
      const auto * call = cast<CallExpr>(expr);
      if (!isa<NameExpr>(call->callee)) return types.object_type();
      const Type * class_type = parse_annotation(resolution, call->callee);
      return is_defined(resolution, class_type) ? class_type : types.object_type();
    }

    case NodeKind::Await:
      return awaitable_value(types, resolve_literal(resolution, cast<AwaitExpr>(expr)->operand));

    case NodeKind::BooleanOperator: {
      const auto * op = cast<BooleanOperatorExpr>(expr);
      return join_or_object(
        resolution, resolve_literal(resolution, op->left), resolve_literal(resolution, op->right));
    }

    case NodeKind::Ternary: {
      const auto * ternary = cast<TernaryExpr>(expr);
      return join_or_object(
        resolution, resolve_literal(resolution, ternary->target),
        resolve_literal(resolution, ternary->alternative));
    }

    case NodeKind::BoolLiteral:
      return types.bool_type();
    case NodeKind::IntegerLiteral:
      return types.integer_type();
    case NodeKind::FloatLiteral:
      return types.float_type();
    case NodeKind::ComplexLiteral:
      return types.complex_type();
    case NodeKind::StringLiteral:
      return cast<StringLiteralExpr>(expr)->string_kind == StringKind::Bytes ? types.bytes_type()
                                                                             : types.string_type();

    case NodeKind::List: {
      const Type * parameter = join_elements(resolution, cast<ListExpr>(expr)->elements);
      return is_concrete(parameter) ? types.list_type(parameter) : types.object_type();
    }

    case NodeKind::Set: {
      const Type * parameter = join_elements(resolution, cast<SetExpr>(expr)->elements);
      return is_concrete(parameter) ? types.set_type(parameter) : types.object_type();
    }

    case NodeKind::Dictionary: {
      const auto * dict = cast<DictionaryExpr>(expr);
      if (!dict->keywords.empty()) return types.object_type();

      const Type * key = types.bottom_type();
      const Type * value = types.bottom_type();
      for (const auto & entry : dict->entries) {
        key = resolution.join(key, resolve_literal(resolution, entry.key));
        value = resolution.join(value, resolve_literal(resolution, entry.value));
      }
      if (is_concrete(key) && is_concrete(value)) return types.dictionary_type(key, value);
      return types.object_type();
    }

    case NodeKind::Tuple: {
      std::vector<const Type *> elements;
      for (const Expr * element : cast<TupleExpr>(expr)->elements) {
        elements.push_back(resolve_literal(resolution, element));
      }
      return types.get_bounded_tuple_type(std::move(elements));
    }

    case NodeKind::Yield:
      return types.generator_type(types.object_type(), types.none_type(), types.none_type());

    default:
      return types.object_type();
  }
}

// ============================================================================
// Mutable Literals
// ============================================================================

namespace
{

/// Container name a literal or comprehension of this kind produces, or empty.
std::string_view container_name(const Expr * expr)
{
  switch (expr->get_kind()) {
    case NodeKind::List:
    case NodeKind::ListComprehension:
      return builtin::k_list;
    case NodeKind::Set:
    case NodeKind::SetComprehension:
      return builtin::k_set;
    case NodeKind::Dictionary:
    case NodeKind::DictionaryComprehension:
      return builtin::k_dict;
    default:
      return {};
  }
}

}  // namespace

const Type * resolve_mutable_literals(
  const Resolution & resolution, const Expr * expr, const Type * resolved, const Type * expected)
{
  if (!expr) return resolved;

  const std::string_view container = container_name(expr);
  if (container.empty()) return resolved;

  const size_t arity = container == builtin::k_dict ? 2 : 1;
  if (!resolved->is_parametric() || !expected->is_parametric()) return resolved;
  if (resolved->name != container || expected->name != container) return resolved;
  if (resolved->parameters.size() != arity || expected->parameters.size() != arity) {
    return resolved;
  }

  for (size_t i = 0; i < arity; ++i) {
    if (!resolution.less_or_equal(resolved->parameters[i], expected->parameters[i])) {
      return resolved;
    }
  }
  return expected;
}

}  // namespace pyrite
