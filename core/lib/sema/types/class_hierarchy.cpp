// pyrite/sema/types/class_hierarchy.cpp - Nominal class lattice
//
#include "pyrite/sema/types/class_hierarchy.hpp"

#include <algorithm>

#include "pyrite/basic/log.hpp"
#include "pyrite/sema/types/type_utils.hpp"

namespace pyrite
{

namespace
{

bool is_none(const Type * type)
{
  return type->is_primitive() && type->name == builtin::k_none;
}

/// C3 merge; std::nullopt when no consistent order exists.
std::optional<std::vector<std::string>> c3_merge(std::vector<std::vector<std::string>> sequences)
{
  std::vector<std::string> result;

  while (true) {
    sequences.erase(
      std::remove_if(
        sequences.begin(), sequences.end(), [](const auto & seq) { return seq.empty(); }),
      sequences.end());
    if (sequences.empty()) return result;

    const std::string * candidate = nullptr;
    for (const auto & seq : sequences) {
      const std::string & head = seq.front();
      const bool in_tail = std::any_of(sequences.begin(), sequences.end(), [&](const auto & other) {
        return std::find(other.begin() + 1, other.end(), head) != other.end();
      });
      if (!in_tail) {
        candidate = &head;
        break;
      }
    }
    if (!candidate) return std::nullopt;

    const std::string chosen = *candidate;
    result.push_back(chosen);
    for (auto & seq : sequences) {
      if (!seq.empty() && seq.front() == chosen) seq.erase(seq.begin());
    }
  }
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

ClassHierarchy::ClassHierarchy(TypeContext & types) : types_(&types) {}

const ClassInfo * ClassHierarchy::find(std::string_view name) const
{
  auto it = classes_.find(name);
  return it != classes_.end() ? &it->second : nullptr;
}

DefineResult ClassHierarchy::define(
  std::string_view name, std::vector<const Type *> variables, std::vector<const Type *> bases)
{
  if (find(name)) {
    return DefineResult::fail("class `" + std::string(name) + "` is already defined");
  }

  for (const Type * variable : variables) {
    if (!variable->is_variable()) {
      return DefineResult::fail(
        "generic parameter `" + to_string(variable) + "` of `" + std::string(name) +
        "` is not a type variable");
    }
  }

  std::vector<std::vector<std::string>> sequences;
  std::vector<std::string> direct;
  std::vector<const Type *> kept_bases;
  for (const Type * base : bases) {
    if (base->is_object()) continue;
    if (!base->is_nominal()) {
      return DefineResult::fail(
        "base `" + to_string(base) + "` of `" + std::string(name) + "` is not a class");
    }
    const ClassInfo * info = find(base->name);
    if (!info) {
      return DefineResult::fail(
        "unknown base `" + base->name + "` of `" + std::string(name) + "`");
    }
    if (base->name == builtin::k_object) continue;
    sequences.push_back(info->linearization);
    direct.push_back(base->name);
    kept_bases.push_back(base);
  }

  if (direct.empty() && name != builtin::k_object && find(builtin::k_object)) {
    sequences.push_back({std::string(builtin::k_object)});
  }
  sequences.push_back(direct);

  auto merged = c3_merge(std::move(sequences));
  if (!merged) {
    return DefineResult::fail(
      "cannot create a consistent method resolution order for `" + std::string(name) + "`");
  }

  ClassInfo info;
  info.name = std::string(name);
  info.variables = std::move(variables);
  info.bases = std::move(kept_bases);
  info.linearization.push_back(info.name);
  info.linearization.insert(info.linearization.end(), merged->begin(), merged->end());

  log::trace("hierarchy", "defined `{}` with {} base(s)", info.name, info.bases.size());
  classes_.emplace(info.name, std::move(info));
  return DefineResult::ok();
}

void ClassHierarchy::register_builtins()
{
  if (find(builtin::k_object)) return;

  TypeContext & t = *types_;
  const Type * t_co = t.get_variable_type("_T_co", Variance::Covariant);
  const Type * t_inv = t.get_variable_type("_T");
  const Type * kt = t.get_variable_type("_KT");
  const Type * vt = t.get_variable_type("_VT");
  const Type * t_contra = t.get_variable_type("_T_contra", Variance::Contravariant);
  const Type * v_co = t.get_variable_type("_V_co", Variance::Covariant);

  auto iterable = [&t](const Type * element) {
    return t.get_parametric_type(builtin::k_iterable, {element});
  };

  auto install = [this](
                   std::string_view name, std::vector<const Type *> variables,
                   std::vector<const Type *> bases) {
    const DefineResult result = define(name, std::move(variables), std::move(bases));
    if (!result.success) {
      log::error("hierarchy", "builtin `{}`: {}", name, result.error);
    }
  };

  install(builtin::k_object, {}, {});

  install(builtin::k_complex, {}, {});
  install(builtin::k_float, {}, {t.complex_type()});
  install(builtin::k_int, {}, {t.float_type()});
  install(builtin::k_bool, {}, {t.integer_type()});

  install(builtin::k_str, {}, {});
  install(builtin::k_bytes, {}, {});
  install(builtin::k_none, {}, {});

  install(builtin::k_type, {t_co}, {});
  install(builtin::k_iterable, {t_co}, {});
  install(builtin::k_list, {t_inv}, {iterable(t_inv)});
  install(builtin::k_set, {t_inv}, {iterable(t_inv)});
  install(builtin::k_dict, {kt, vt}, {iterable(kt)});
  install(builtin::k_tuple, {t_co}, {iterable(t_co)});
  install(builtin::k_awaitable, {t_co}, {});
  install(builtin::k_generator, {t_co, t_contra, v_co}, {iterable(t_co)});
}

// ============================================================================
// Helpers
// ============================================================================

const Type * ClassHierarchy::collapse_tuple(const Type * tuple) const
{
  if (tuple->unbounded) return tuple->element;
  return types_->get_union_type(tuple->parameters);
}

const Type * ClassHierarchy::nominal_view(const Type * type) const
{
  switch (type->kind) {
    case TypeKind::Primitive:
    case TypeKind::Parametric:
      return type;
    case TypeKind::Object:
      return types_->get_primitive_type(builtin::k_object);
    case TypeKind::Tuple:
      return types_->get_parametric_type(builtin::k_tuple, {collapse_tuple(type)});
    case TypeKind::Meta:
      return types_->get_parametric_type(builtin::k_type, {type->element});
    default:
      return nullptr;
  }
}

std::optional<std::vector<const Type *>> ClassHierarchy::search_ancestor(
  const ClassInfo & info, const std::vector<const Type *> & parameters,
  std::string_view target) const
{
  // Raw or mis-sized references fill the missing positions with Top.
  std::vector<const Type *> actual = parameters;
  if (actual.size() != info.variables.size()) {
    actual.resize(info.variables.size(), types_->top_type());
  }

  if (info.name == target) return actual;

  for (const Type * base : info.bases) {
    const Type * instantiated = instantiate(*types_, base, [&](const Type * t) -> const Type * {
      if (!t->is_variable()) return nullptr;
      for (size_t i = 0; i < info.variables.size(); ++i) {
        if (info.variables[i] == t) return actual[i];
      }
      return nullptr;
    });

    const ClassInfo * base_info = find(instantiated->name);
    if (!base_info) continue;
    if (auto found = search_ancestor(*base_info, instantiated->parameters, target)) {
      return found;
    }
  }

  if (target == builtin::k_object) return std::vector<const Type *>{};
  return std::nullopt;
}

// ============================================================================
// Subtyping
// ============================================================================

bool ClassHierarchy::less_or_equal(const Type * left, const Type * right) const
{
  if (left == right) return true;
  if (right->is_top()) return true;
  if (left->is_top()) return false;
  if (left->is_bottom()) return true;
  if (right->is_bottom()) return false;
  if (left->is_deleted() || right->is_deleted()) return false;
  if (right->is_object()) return true;
  if (left->is_object()) return right->is_primitive() && right->name == builtin::k_object;

  if (left->is_union()) {
    return std::all_of(left->parameters.begin(), left->parameters.end(), [&](const Type * m) {
      return less_or_equal(m, right);
    });
  }

  if (left->is_variable()) {
    if (right->is_variable()) return false;
    switch (left->constraint) {
      case VariableConstraint::Bound:
        return less_or_equal(left->element, right);
      case VariableConstraint::Explicit:
        return less_or_equal(types_->get_union_type(left->parameters), right);
      case VariableConstraint::Unconstrained:
        return less_or_equal(types_->object_type(), right);
    }
    return false;
  }

  if (left->is_optional()) {
    return less_or_equal(types_->none_type(), right) && less_or_equal(left->element, right);
  }

  if (right->is_union()) {
    return std::any_of(right->parameters.begin(), right->parameters.end(), [&](const Type * m) {
      return less_or_equal(left, m);
    });
  }

  if (right->is_variable()) return false;

  if (right->is_optional()) {
    return is_none(left) || less_or_equal(left, right->element);
  }

  if (left->is_tuple() && right->is_tuple()) {
    if (left->unbounded) {
      return right->unbounded && less_or_equal(left->element, right->element);
    }
    if (right->unbounded) {
      return std::all_of(left->parameters.begin(), left->parameters.end(), [&](const Type * e) {
        return less_or_equal(e, right->element);
      });
    }
    if (left->parameters.size() != right->parameters.size()) return false;
    for (size_t i = 0; i < left->parameters.size(); ++i) {
      if (!less_or_equal(left->parameters[i], right->parameters[i])) return false;
    }
    return true;
  }
  if (right->is_tuple()) return false;

  if (left->is_callable() || right->is_callable()) {
    return left->is_callable() && right->is_callable() && callable_less_or_equal(left, right);
  }

  if (left->is_meta() && right->is_meta()) {
    return less_or_equal(left->element, right->element);
  }
  if (right->is_meta()) return false;

  const Type * left_view = nominal_view(left);
  const Type * right_view = nominal_view(right);
  if (!left_view || !right_view) return false;
  return nominal_less_or_equal(left_view, right_view);
}

bool ClassHierarchy::nominal_less_or_equal(const Type * left, const Type * right) const
{
  const ClassInfo * left_info = find(left->name);
  if (!left_info || !find(right->name)) return false;

  if (right->name == builtin::k_object) return true;

  if (left->name == right->name) {
    return parameters_less_or_equal(right->name, left->parameters, right->parameters);
  }

  const auto parameters = search_ancestor(*left_info, left->parameters, right->name);
  if (!parameters) return false;
  return parameters_less_or_equal(right->name, *parameters, right->parameters);
}

bool ClassHierarchy::parameters_less_or_equal(
  std::string_view name, const std::vector<const Type *> & left,
  const std::vector<const Type *> & right) const
{
  if (left.empty() || right.empty()) return true;
  if (left.size() != right.size()) return false;

  const ClassInfo * info = find(name);
  for (size_t i = 0; i < left.size(); ++i) {
    const Type * l = left[i];
    const Type * r = right[i];
    if (l->is_top() || r->is_top()) continue;

    const Variance variance = info && i < info->variables.size() ? info->variables[i]->variance
                                                                 : Variance::Invariant;
    switch (variance) {
      case Variance::Covariant:
        if (!less_or_equal(l, r)) return false;
        break;
      case Variance::Contravariant:
        if (!less_or_equal(r, l)) return false;
        break;
      case Variance::Invariant:
        if (!less_or_equal(l, r) || !less_or_equal(r, l)) return false;
        break;
    }
  }
  return true;
}

bool ClassHierarchy::callable_less_or_equal(const Type * left, const Type * right) const
{
  const CallableSignature & l = left->implementation;
  const CallableSignature & r = right->implementation;

  const Type * l_return = l.annotation ? l.annotation : types_->top_type();
  const Type * r_return = r.annotation ? r.annotation : types_->top_type();
  if (!less_or_equal(l_return, r_return)) return false;

  if (!l.parameters || !r.parameters) return true;

  const auto & l_params = *l.parameters;
  const auto & r_params = *r.parameters;
  if (l_params.size() < r_params.size()) return false;

  for (size_t i = 0; i < l_params.size(); ++i) {
    if (i >= r_params.size()) {
      if (!l_params[i].has_default) return false;
      continue;
    }
    const Type * l_param = l_params[i].annotation ? l_params[i].annotation : types_->top_type();
    const Type * r_param = r_params[i].annotation ? r_params[i].annotation : types_->top_type();
    if (!less_or_equal(r_param, l_param)) return false;
  }
  return true;
}

// ============================================================================
// Join / Meet / Widen
// ============================================================================

const Type * ClassHierarchy::join(const Type * left, const Type * right) const
{
  if (less_or_equal(left, right)) return right;
  if (less_or_equal(right, left)) return left;

  if (left->is_union() || right->is_union() || left->is_variable() || right->is_variable() ||
      left->is_callable() || right->is_callable() || left->is_deleted() || right->is_deleted()) {
    return types_->get_union_type({left, right});
  }

  if (left->is_optional() || right->is_optional() || is_none(left) || is_none(right)) {
    if (is_none(left)) return types_->get_optional_type(right);
    if (is_none(right)) return types_->get_optional_type(left);
    const Type * l = left->is_optional() ? left->element : left;
    const Type * r = right->is_optional() ? right->element : right;
    return types_->get_optional_type(join(l, r));
  }

  if (left->is_tuple() && right->is_tuple()) {
    if (left->is_bounded_tuple() && right->is_bounded_tuple() &&
        left->parameters.size() == right->parameters.size()) {
      std::vector<const Type *> elements;
      elements.reserve(left->parameters.size());
      for (size_t i = 0; i < left->parameters.size(); ++i) {
        elements.push_back(join(left->parameters[i], right->parameters[i]));
      }
      return types_->get_bounded_tuple_type(std::move(elements));
    }
    return types_->get_unbounded_tuple_type(join(collapse_tuple(left), collapse_tuple(right)));
  }

  if (left->is_meta() && right->is_meta()) {
    return types_->get_meta_type(join(left->element, right->element));
  }

  const Type * left_view = nominal_view(left);
  const Type * right_view = nominal_view(right);
  if (left_view && right_view) return nominal_join(left_view, right_view);
  return types_->object_type();
}

const Type * ClassHierarchy::nominal_join(const Type * left, const Type * right) const
{
  const ClassInfo * left_info = find(left->name);
  const ClassInfo * right_info = find(right->name);
  if (!left_info || !right_info) return types_->top_type();

  for (const std::string & ancestor : left_info->linearization) {
    if (ancestor == builtin::k_object) break;
    const auto & right_lin = right_info->linearization;
    if (std::find(right_lin.begin(), right_lin.end(), ancestor) == right_lin.end()) continue;

    const auto l_params = search_ancestor(*left_info, left->parameters, ancestor);
    const auto r_params = search_ancestor(*right_info, right->parameters, ancestor);
    if (!l_params || !r_params) continue;

    const ClassInfo * info = find(ancestor);
    std::vector<const Type *> joined;
    bool compatible = true;
    for (size_t i = 0; i < info->variables.size() && compatible; ++i) {
      const Type * l = (*l_params)[i];
      const Type * r = (*r_params)[i];
      if (l->is_top() || r->is_top()) {
        joined.push_back(types_->top_type());
        continue;
      }
      switch (info->variables[i]->variance) {
        case Variance::Covariant:
          joined.push_back(join(l, r));
          break;
        case Variance::Contravariant:
          joined.push_back(meet(l, r));
          break;
        case Variance::Invariant:
          if (l == r) {
            joined.push_back(l);
          } else {
            compatible = false;
          }
          break;
      }
    }
    if (!compatible) continue;
    return types_->get_parametric_type(ancestor, std::move(joined));
  }
  return types_->object_type();
}

const Type * ClassHierarchy::meet(const Type * left, const Type * right) const
{
  if (less_or_equal(left, right)) return left;
  if (less_or_equal(right, left)) return right;

  if (left->is_union()) {
    std::vector<const Type *> members;
    for (const Type * m : left->parameters) members.push_back(meet(m, right));
    return types_->get_union_type(std::move(members));
  }
  if (right->is_union()) {
    std::vector<const Type *> members;
    for (const Type * m : right->parameters) members.push_back(meet(left, m));
    return types_->get_union_type(std::move(members));
  }

  if (left->is_optional() && right->is_optional()) {
    return types_->get_optional_type(meet(left->element, right->element));
  }
  if (left->is_optional()) return meet(left->element, right);
  if (right->is_optional()) return meet(left, right->element);

  if (left->is_bounded_tuple() && right->is_bounded_tuple() &&
      left->parameters.size() == right->parameters.size()) {
    std::vector<const Type *> elements;
    elements.reserve(left->parameters.size());
    for (size_t i = 0; i < left->parameters.size(); ++i) {
      const Type * element = meet(left->parameters[i], right->parameters[i]);
      if (element->is_bottom()) return types_->bottom_type();
      elements.push_back(element);
    }
    return types_->get_bounded_tuple_type(std::move(elements));
  }

  if (left->is_meta() && right->is_meta()) {
    const Type * element = meet(left->element, right->element);
    return element->is_bottom() ? element : types_->get_meta_type(element);
  }

  return types_->bottom_type();
}

const Type * ClassHierarchy::widen(
  const Type * previous, const Type * next, int iteration, int widening_threshold) const
{
  if (iteration > widening_threshold) return types_->top_type();
  return join(previous, next);
}

// ============================================================================
// Queries
// ============================================================================

bool ClassHierarchy::contains(const Type * type) const
{
  if (!type->is_nominal()) return true;
  return find(type->name) != nullptr;
}

std::optional<std::vector<const Type *>> ClassHierarchy::variables(std::string_view name) const
{
  const ClassInfo * info = find(name);
  if (!info) return std::nullopt;
  return info->variables;
}

std::optional<std::vector<const Type *>> ClassHierarchy::instantiate_successors_parameters(
  const Type * source, std::string_view target) const
{
  const ClassInfo * target_info = find(target);
  if (!target_info) throw UntrackedType(std::string(target));

  switch (source->kind) {
    case TypeKind::Top:
      throw UntrackedType(to_string(source));
    case TypeKind::Bottom:
      return std::vector<const Type *>(target_info->variables.size(), types_->bottom_type());
    case TypeKind::Variable:
      switch (source->constraint) {
        case VariableConstraint::Bound:
          return instantiate_successors_parameters(source->element, target);
        case VariableConstraint::Explicit:
          return std::nullopt;
        case VariableConstraint::Unconstrained:
          return instantiate_successors_parameters(types_->object_type(), target);
      }
      return std::nullopt;
    default:
      break;
  }

  const Type * view = nominal_view(source);
  if (!view) return std::nullopt;

  const ClassInfo * info = find(view->name);
  if (!info) throw UntrackedType(view->name);
  return search_ancestor(*info, view->parameters, target);
}

bool ClassHierarchy::is_instantiated(const Type * type) const
{
  return !exists(type, [this](const Type * t) {
    return t->is_top() || t->is_bottom() || (t->is_nominal() && !find(t->name));
  });
}

std::vector<std::string> ClassHierarchy::successors(std::string_view name) const
{
  const ClassInfo * info = find(name);
  if (!info) return {};
  return std::vector<std::string>(info->linearization.begin() + 1, info->linearization.end());
}

}  // namespace pyrite
