// pyrite/sema/resolution/resolution.cpp - Immutable type environment
//
#include "pyrite/sema/resolution/resolution.hpp"

#include <utility>

#include "pyrite/sema/types/type_utils.hpp"

namespace pyrite
{

Resolution::Resolution(
  TypeContext & types, const TypeLattice & order, const ResolutionEnvironment & environment,
  AnnotationMap annotations, std::optional<Access> parent)
: types_(&types),
  order_(&order),
  environment_(&environment),
  annotations_(std::make_shared<const AnnotationMap>(std::move(annotations))),
  parent_(std::move(parent))
{
}

// ============================================================================
// Locals
// ============================================================================

Resolution Resolution::set_local(const Access & name, const Annotation & annotation) const
{
  AnnotationMap updated = *annotations_;
  updated.insert_or_assign(name, annotation);
  return with_annotations(std::move(updated));
}

Resolution Resolution::unset_local(const Access & name) const
{
  if (annotations_->find(name) == annotations_->end()) return *this;
  AnnotationMap updated = *annotations_;
  updated.erase(name);
  return with_annotations(std::move(updated));
}

std::optional<Annotation> Resolution::get_local(const Access & name, bool global_fallback) const
{
  auto it = annotations_->find(name);
  if (it != annotations_->end() && !it->second.type->is_deleted()) {
    return it->second;
  }
  if (global_fallback) {
    return global(name.delocalize());
  }
  return std::nullopt;
}

Resolution Resolution::with_annotations(AnnotationMap annotations) const
{
  Resolution copy = *this;
  copy.annotations_ = std::make_shared<const AnnotationMap>(std::move(annotations));
  return copy;
}

Resolution Resolution::with_parent(std::optional<Access> parent) const
{
  Resolution copy = *this;
  copy.parent_ = std::move(parent);
  return copy;
}

// ============================================================================
// Injected Capabilities
// ============================================================================

const Type * Resolution::resolve(const Expr * expr) const
{
  return environment_->resolve(*this, expr);
}

std::optional<Annotation> Resolution::global(const Access & name) const
{
  return environment_->global(name);
}

const ModuleDefinition * Resolution::module_definition(const Access & name) const
{
  return environment_->module_definition(name);
}

const ClassDefinition * Resolution::class_definition(const Type * type) const
{
  return environment_->class_definition(type);
}

const ClassRepresentation * Resolution::class_representation(const Type * type) const
{
  return environment_->class_representation(type);
}

const Type * Resolution::constructor(
  const Type * instantiated, const ClassDefinition & definition) const
{
  return environment_->constructor(instantiated, *this, definition);
}

std::optional<std::vector<FunctionDefinition>> Resolution::function_definitions(
  const Access & name) const
{
  size_t length = 0;
  while (length < name.size() && module_definition(name.prefix(length + 1))) {
    ++length;
  }
  if (length == 0) return std::nullopt;

  const ModuleDefinition * module = module_definition(name.prefix(length));
  std::vector<FunctionDefinition> result;
  for (const auto & define : module->defines) {
    if (define.name.starts_with(name)) result.push_back(define);
  }
  return result;
}

bool Resolution::module_from_empty_stub(const Access & name) const
{
  for (size_t length = 1; length <= name.size(); ++length) {
    const ModuleDefinition * module = module_definition(name.prefix(length));
    if (module && module->is_empty_stub) return true;
  }
  return false;
}

// ============================================================================
// Lattice Shortcuts
// ============================================================================

bool Resolution::less_or_equal(const Type * left, const Type * right) const
{
  return order_->less_or_equal(left, right);
}

const Type * Resolution::join(const Type * left, const Type * right) const
{
  return order_->join(left, right);
}

const Type * Resolution::meet(const Type * left, const Type * right) const
{
  return order_->meet(left, right);
}

const Type * Resolution::widen(
  const Type * previous, const Type * next, int iteration, int widening_threshold) const
{
  return order_->widen(previous, next, iteration, widening_threshold);
}

bool Resolution::is_instantiated(const Type * type) const
{
  return order_->is_instantiated(type);
}

bool Resolution::is_tracked(const Type * type) const { return order_->contains(type); }

bool Resolution::contains_untracked(const Type * type) const
{
  for (const auto & name : elements(type)) {
    if (!is_tracked(types_->get_primitive_type(name))) return true;
  }
  return false;
}

std::string Resolution::to_string() const
{
  std::string out = "[";
  bool first = true;
  for (const auto & [name, annotation] : *annotations_) {
    if (!first) out += ", ";
    first = false;
    out += name.to_string() + " -> " + pyrite::to_string(annotation);
  }
  out += "]";
  return out;
}

}  // namespace pyrite
