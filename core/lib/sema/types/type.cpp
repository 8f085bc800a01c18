// pyrite/sema/types/type.cpp - Type context implementation
//
#include "pyrite/sema/types/type.hpp"

#include <algorithm>
#include <functional>
#include <utility>

namespace pyrite
{

namespace
{

void hash_combine(size_t & seed, size_t value) noexcept
{
  seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

void hash_signature(size_t & seed, const CallableSignature & signature) noexcept
{
  hash_combine(seed, std::hash<const Type *>{}(signature.annotation));
  if (!signature.parameters) {
    hash_combine(seed, 0x5eed);
    return;
  }
  for (const auto & param : *signature.parameters) {
    hash_combine(seed, std::hash<std::string>{}(param.name));
    hash_combine(seed, std::hash<const Type *>{}(param.annotation));
    hash_combine(seed, param.has_default ? 1 : 0);
  }
}

}  // namespace

// ============================================================================
// Interning
// ============================================================================

size_t TypeContext::StructuralHash::operator()(const Type * type) const noexcept
{
  size_t seed = static_cast<size_t>(type->kind);
  hash_combine(seed, std::hash<std::string>{}(type->name));
  for (const Type * param : type->parameters) {
    hash_combine(seed, std::hash<const Type *>{}(param));
  }
  hash_combine(seed, std::hash<const Type *>{}(type->element));
  hash_combine(seed, type->unbounded ? 1 : 0);
  hash_combine(seed, static_cast<size_t>(type->variance));
  hash_combine(seed, static_cast<size_t>(type->constraint));
  if (type->kind == TypeKind::Callable) {
    hash_signature(seed, type->implementation);
    for (const auto & overload : type->overloads) {
      hash_signature(seed, overload);
    }
  }
  return seed;
}

bool TypeContext::StructuralEqual::operator()(const Type * a, const Type * b) const noexcept
{
  return a->kind == b->kind && a->name == b->name && a->parameters == b->parameters &&
         a->element == b->element && a->unbounded == b->unbounded &&
         a->variance == b->variance && a->constraint == b->constraint &&
         a->implementation == b->implementation && a->overloads == b->overloads;
}

const Type * TypeContext::intern(Type candidate)
{
  const std::lock_guard<std::mutex> lock(mutex_);
  auto it = interned_.find(&candidate);
  if (it != interned_.end()) {
    return *it;
  }

  candidate.id = static_cast<uint32_t>(types_.size());
  types_.push_back(std::move(candidate));
  const Type * stored = &types_.back();
  interned_.insert(stored);
  return stored;
}

size_t TypeContext::size() const
{
  const std::lock_guard<std::mutex> lock(mutex_);
  return types_.size();
}

// ============================================================================
// TypeContext Implementation
// ============================================================================

TypeContext::TypeContext()
{
  top_ = intern(Type{TypeKind::Top});
  bottom_ = intern(Type{TypeKind::Bottom});
  object_ = intern(Type{TypeKind::Object});
  deleted_ = intern(Type{TypeKind::Deleted});
}

const Type * TypeContext::get_primitive_type(std::string_view name)
{
  Type type{TypeKind::Primitive};
  type.name = std::string(name);
  return intern(std::move(type));
}

const Type * TypeContext::get_parametric_type(
  std::string_view name, std::vector<const Type *> parameters)
{
  if (parameters.empty()) {
    return get_primitive_type(name);
  }

  Type type{TypeKind::Parametric};
  type.name = std::string(name);
  type.parameters = std::move(parameters);
  return intern(std::move(type));
}

const Type * TypeContext::get_union_type(std::vector<const Type *> members)
{
  std::vector<const Type *> flat;
  flat.reserve(members.size());

  bool has_object = false;
  for (const Type * member : members) {
    if (member->is_top()) {
      return top_;
    }
    if (member->is_union()) {
      flat.insert(flat.end(), member->parameters.begin(), member->parameters.end());
      continue;
    }
    if (member->is_object()) has_object = true;
    if (!member->is_bottom()) flat.push_back(member);
  }

  if (has_object) {
    return object_;
  }

  std::sort(flat.begin(), flat.end(), TypeLess{});
  flat.erase(std::unique(flat.begin(), flat.end()), flat.end());

  if (flat.empty()) {
    return bottom_;
  }
  if (flat.size() == 1) {
    return flat.front();
  }

  Type type{TypeKind::Union};
  type.parameters = std::move(flat);
  return intern(std::move(type));
}

const Type * TypeContext::get_optional_type(const Type * inner)
{
  // Don't double-wrap optional
  if (inner->is_optional() || inner->is_top()) {
    return inner;
  }

  Type type{TypeKind::Optional};
  type.element = inner;
  return intern(std::move(type));
}

const Type * TypeContext::get_bounded_tuple_type(std::vector<const Type *> elements)
{
  Type type{TypeKind::Tuple};
  type.parameters = std::move(elements);
  return intern(std::move(type));
}

const Type * TypeContext::get_unbounded_tuple_type(const Type * element)
{
  Type type{TypeKind::Tuple};
  type.element = element;
  type.unbounded = true;
  return intern(std::move(type));
}

const Type * TypeContext::get_callable_type(
  CallableSignature implementation, std::vector<CallableSignature> overloads,
  std::string_view name)
{
  Type type{TypeKind::Callable};
  type.name = std::string(name);
  type.implementation = std::move(implementation);
  type.overloads = std::move(overloads);
  return intern(std::move(type));
}

const Type * TypeContext::get_variable_type(std::string_view name, Variance variance)
{
  Type type{TypeKind::Variable};
  type.name = std::string(name);
  type.variance = variance;
  return intern(std::move(type));
}

const Type * TypeContext::get_bound_variable_type(
  std::string_view name, const Type * bound, Variance variance)
{
  Type type{TypeKind::Variable};
  type.name = std::string(name);
  type.variance = variance;
  type.constraint = VariableConstraint::Bound;
  type.element = bound;
  return intern(std::move(type));
}

const Type * TypeContext::get_explicit_variable_type(
  std::string_view name, std::vector<const Type *> constraints, Variance variance)
{
  Type type{TypeKind::Variable};
  type.name = std::string(name);
  type.variance = variance;
  type.constraint = VariableConstraint::Explicit;
  type.parameters = std::move(constraints);
  return intern(std::move(type));
}

const Type * TypeContext::get_meta_type(const Type * instance)
{
  Type type{TypeKind::Meta};
  type.element = instance;
  return intern(std::move(type));
}

}  // namespace pyrite
