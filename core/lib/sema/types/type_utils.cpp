// pyrite/sema/types/type_utils.cpp - Structural queries and rewrites over types
//
#include "pyrite/sema/types/type_utils.hpp"

#include <utility>
#include <vector>

namespace pyrite
{

// ============================================================================
// Printing
// ============================================================================

namespace
{

std::string join_types(const std::vector<const Type *> & types)
{
  std::string out;
  for (size_t i = 0; i < types.size(); ++i) {
    if (i > 0) out += ", ";
    out += to_string(types[i]);
  }
  return out;
}

std::string signature_to_string(const CallableSignature & signature)
{
  std::string out = "[";
  if (!signature.parameters) {
    out += "...";
  } else {
    out += "[";
    const auto & params = *signature.parameters;
    for (size_t i = 0; i < params.size(); ++i) {
      if (i > 0) out += ", ";
      if (!params[i].name.empty()) {
        out += "Named(" + params[i].name + ", " + to_string(params[i].annotation);
        if (params[i].has_default) out += ", default";
        out += ")";
      } else {
        out += to_string(params[i].annotation);
      }
    }
    out += "]";
  }
  out += ", " + to_string(signature.annotation) + "]";
  return out;
}

}  // namespace

std::string to_string(Variance variance)
{
  switch (variance) {
    case Variance::Covariant:
      return "covariant";
    case Variance::Contravariant:
      return "contravariant";
    case Variance::Invariant:
      return "invariant";
  }
  return "invariant";
}

std::string to_string(const Type * type)
{
  if (!type) return "<null>";

  switch (type->kind) {
    case TypeKind::Top:
      return "unknown";
    case TypeKind::Bottom:
      return "undefined";
    case TypeKind::Object:
      return "object";
    case TypeKind::Deleted:
      return "deleted";
    case TypeKind::Primitive:
      return type->name;
    case TypeKind::Parametric:
      return type->name + "[" + join_types(type->parameters) + "]";
    case TypeKind::Union:
      return "typing.Union[" + join_types(type->parameters) + "]";
    case TypeKind::Optional:
      return "typing.Optional[" + to_string(type->element) + "]";
    case TypeKind::Tuple:
      if (type->unbounded) {
        return "typing.Tuple[" + to_string(type->element) + ", ...]";
      }
      if (type->parameters.empty()) return "typing.Tuple[()]";
      return "typing.Tuple[" + join_types(type->parameters) + "]";
    case TypeKind::Callable: {
      std::string out = "typing.Callable";
      if (!type->name.empty()) out += "(" + type->name + ")";
      out += signature_to_string(type->implementation);
      if (!type->overloads.empty()) {
        out += "[[";
        for (size_t i = 0; i < type->overloads.size(); ++i) {
          if (i > 0) out += ", ";
          out += signature_to_string(type->overloads[i]);
        }
        out += "]]";
      }
      return out;
    }
    case TypeKind::Variable:
      switch (type->constraint) {
        case VariableConstraint::Unconstrained:
          return "Variable[" + type->name + "]";
        case VariableConstraint::Bound:
          return "Variable[" + type->name + " (bound to " + to_string(type->element) + ")]";
        case VariableConstraint::Explicit:
          return "Variable[" + type->name + " <: [" + join_types(type->parameters) + "]]";
      }
      return "Variable[" + type->name + "]";
    case TypeKind::Meta:
      return "typing.Type[" + to_string(type->element) + "]";
  }
  return "<unknown>";
}

// ============================================================================
// Structural Queries
// ============================================================================

namespace
{

bool signature_exists(
  const CallableSignature & signature, const std::function<bool(const Type *)> & predicate)
{
  if (signature.annotation && exists(signature.annotation, predicate)) return true;
  if (!signature.parameters) return false;
  for (const auto & param : *signature.parameters) {
    if (param.annotation && exists(param.annotation, predicate)) return true;
  }
  return false;
}

}  // namespace

bool exists(const Type * type, const std::function<bool(const Type *)> & predicate)
{
  if (predicate(type)) return true;

  for (const Type * param : type->parameters) {
    if (exists(param, predicate)) return true;
  }
  if (type->element && exists(type->element, predicate)) return true;

  if (type->is_callable()) {
    if (signature_exists(type->implementation, predicate)) return true;
    for (const auto & overload : type->overloads) {
      if (signature_exists(overload, predicate)) return true;
    }
  }
  return false;
}

bool contains_variable(const Type * type)
{
  return exists(type, [](const Type * t) { return t->is_variable(); });
}

bool is_concrete(const Type * type)
{
  return !exists(type, [](const Type * t) { return t->is_top() || t->is_bottom(); });
}

std::set<std::string> elements(const Type * type)
{
  std::set<std::string> names;
  (void)exists(type, [&names](const Type * t) {
    if (t->is_nominal()) names.insert(t->name);
    return false;
  });
  return names;
}

// ============================================================================
// Rewriting
// ============================================================================

namespace
{

CallableSignature instantiate_signature(
  TypeContext & types, const CallableSignature & signature, const TypeMapping & mapping)
{
  CallableSignature result;
  result.annotation =
    signature.annotation ? instantiate(types, signature.annotation, mapping) : nullptr;
  if (signature.parameters) {
    std::vector<CallableParameter> params = *signature.parameters;
    for (auto & param : params) {
      if (param.annotation) param.annotation = instantiate(types, param.annotation, mapping);
    }
    result.parameters = std::move(params);
  }
  return result;
}

std::vector<const Type *> instantiate_all(
  TypeContext & types, const std::vector<const Type *> & list, const TypeMapping & mapping)
{
  std::vector<const Type *> result;
  result.reserve(list.size());
  for (const Type * t : list) result.push_back(instantiate(types, t, mapping));
  return result;
}

}  // namespace

const Type * instantiate(TypeContext & types, const Type * type, const TypeMapping & mapping)
{
  if (const Type * replacement = mapping(type)) {
    return replacement;
  }

  switch (type->kind) {
    case TypeKind::Top:
    case TypeKind::Bottom:
    case TypeKind::Object:
    case TypeKind::Deleted:
    case TypeKind::Primitive:
      return type;
    case TypeKind::Parametric:
      return types.get_parametric_type(
        type->name, instantiate_all(types, type->parameters, mapping));
    case TypeKind::Union:
      return types.get_union_type(instantiate_all(types, type->parameters, mapping));
    case TypeKind::Optional:
      return types.get_optional_type(instantiate(types, type->element, mapping));
    case TypeKind::Tuple:
      if (type->unbounded) {
        return types.get_unbounded_tuple_type(instantiate(types, type->element, mapping));
      }
      return types.get_bounded_tuple_type(instantiate_all(types, type->parameters, mapping));
    case TypeKind::Callable: {
      std::vector<CallableSignature> overloads;
      overloads.reserve(type->overloads.size());
      for (const auto & overload : type->overloads) {
        overloads.push_back(instantiate_signature(types, overload, mapping));
      }
      return types.get_callable_type(
        instantiate_signature(types, type->implementation, mapping), std::move(overloads),
        type->name);
    }
    case TypeKind::Variable:
      // Constraints describe the variable itself and are not rewritten.
      return type;
    case TypeKind::Meta:
      return types.get_meta_type(instantiate(types, type->element, mapping));
  }
  return type;
}

// ============================================================================
// Projections
// ============================================================================

const Type * awaitable_value(TypeContext & types, const Type * type)
{
  if (type->is_parametric() && type->name == builtin::k_awaitable &&
      type->parameters.size() == 1) {
    return type->parameters.front();
  }
  return types.top_type();
}

const Type * single_parameter(const Type * type)
{
  if (type->is_parametric() && type->parameters.size() == 1) {
    return type->parameters.front();
  }
  return nullptr;
}

}  // namespace pyrite
