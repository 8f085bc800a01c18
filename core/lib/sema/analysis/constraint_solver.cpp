// pyrite/sema/analysis/constraint_solver.cpp - Generic constraint solving
//
#include "pyrite/sema/analysis/constraint_solver.hpp"

#include <algorithm>

#include "pyrite/basic/log.hpp"
#include "pyrite/sema/types/type_lattice.hpp"
#include "pyrite/sema/types/type_utils.hpp"

namespace pyrite
{

ConstraintSolver::ConstraintSolver(const Resolution & resolution)
: resolution_(resolution), types_(resolution.types())
{
}

std::optional<Substitution> ConstraintSolver::solve(
  const Substitution & constraints, const Type * source, const Type * target) const
{
  try {
    return solve_throws(constraints, source, target);
  } catch (const UntrackedType & e) {
    log::debug(
      "solver", "{} while solving `{}` against `{}`", e.what(), to_string(source),
      to_string(target));
    return std::nullopt;
  }
}

std::optional<Substitution> ConstraintSolver::solve_all(
  const Substitution & constraints, const std::vector<const Type *> & sources,
  const std::vector<const Type *> & targets, bool ignore_length_mismatch) const
{
  if (sources.size() != targets.size()) {
    if (ignore_length_mismatch) return constraints;
    return std::nullopt;
  }

  std::optional<Substitution> current = constraints;
  for (size_t i = 0; i < sources.size() && current; ++i) {
    current = solve_throws(*current, sources[i], targets[i]);
  }
  return current;
}

const Type * ConstraintSolver::true_join(const Type * left, const Type * right) const
{
  // The lattice join may jump to a common ancestor that admits far more
  // than either side; the plain union is preferred then.
  const Type * joined = resolution_.join(left, right);
  const Type * unionized = types_.get_union_type({left, right});
  if (!resolution_.less_or_equal(joined, unionized)) return unionized;
  return joined;
}

// ============================================================================
// Dispatch
// ============================================================================

std::optional<Substitution> ConstraintSolver::solve_throws(
  const Substitution & constraints, const Type * source, const Type * target) const
{
  if (log::Logger::instance().enabled(log::Level::Trace)) {
    log::trace(
      "solver", "`{}` against `{}` with {}", to_string(source), to_string(target),
      constraints.to_string());
  }

  // Calling a class object is calling its constructor.
  if (source->is_meta() && target->is_callable()) {
    const Type * instantiated = source->element;
    if (const ClassDefinition * definition = resolution_.class_definition(instantiated)) {
      source = resolution_.constructor(instantiated, *definition);
    }
  }

  if (source->is_bottom()) {
    return constraints;
  }

  if (source->is_union()) {
    const std::vector<const Type *> targets(source->parameters.size(), target);
    return solve_all(constraints, source->parameters, targets);
  }

  if (is_resolved(target)) {
    if (source->is_top() && target->is_object()) return constraints;
    if (resolution_.less_or_equal(source, target)) return constraints;
    return std::nullopt;
  }

  switch (target->kind) {
    case TypeKind::Variable:
      return solve_variable(constraints, source, target);

    case TypeKind::Parametric:
      return solve_parametric(constraints, source, target);

    case TypeKind::Optional:
      if (source->is_optional()) {
        return solve_throws(constraints, source->element, target->element);
      }
      return solve_throws(constraints, source, target->element);

    case TypeKind::Tuple:
      if (source->is_tuple()) return solve_tuple(constraints, source, target);
      return std::nullopt;

    case TypeKind::Union:
      // First successful alternative wins; alternatives are not reconciled.
      for (const Type * member : target->parameters) {
        if (auto solved = solve_throws(constraints, source, member)) return solved;
      }
      return std::nullopt;

    case TypeKind::Callable:
      if (source->is_callable()) return solve_callable(constraints, source, target);
      return std::nullopt;

    case TypeKind::Meta:
      if (source->is_meta()) {
        return solve_throws(constraints, source->element, target->element);
      }
      // `Type[T]` is the class `type[T]` for anything that is not itself a class object.
      return solve_parametric(
        constraints, source, types_.get_parametric_type(builtin::k_type, {target->element}));

    default:
      return std::nullopt;
  }
}

// ============================================================================
// Cases
// ============================================================================

std::optional<Substitution> ConstraintSolver::solve_variable(
  const Substitution & constraints, const Type * source, const Type * variable) const
{
  const Type * existing = constraints.find(variable);
  const Type * joined = existing ? true_join(existing, source) : source;

  const Type * accepted = nullptr;
  switch (variable->constraint) {
    case VariableConstraint::Explicit: {
      const auto & allowed = variable->parameters;
      if (joined->is_variable() && joined->constraint == VariableConstraint::Explicit) {
        const bool subset =
          std::all_of(joined->parameters.begin(), joined->parameters.end(), [&](const Type * t) {
            return std::find(allowed.begin(), allowed.end(), t) != allowed.end();
          });
        if (subset) accepted = joined;
        break;
      }
      const Type * candidate =
        joined->is_variable() && joined->constraint == VariableConstraint::Bound ? joined->element
                                                                                 : joined;
      auto it = std::find_if(allowed.begin(), allowed.end(), [&](const Type * entry) {
        return resolution_.less_or_equal(candidate, entry);
      });
      if (it != allowed.end()) accepted = *it;
      break;
    }
    case VariableConstraint::Bound:
      if (resolution_.less_or_equal(joined, variable->element)) accepted = joined;
      break;
    case VariableConstraint::Unconstrained:
      accepted = joined;
      break;
  }

  if (!accepted) return std::nullopt;
  return constraints.with_binding(variable, accepted);
}

std::optional<Substitution> ConstraintSolver::solve_parametric(
  const Substitution & constraints, const Type * source, const Type * target) const
{
  const auto resolved_parameters =
    resolution_.order().instantiate_successors_parameters(source, target->name);
  if (!resolved_parameters) return std::nullopt;

  auto solved = solve_all(constraints, *resolved_parameters, target->parameters);
  if (!solved) return std::nullopt;

  // Parameters solved one by one may still violate the declared variance.
  const Type * instantiated_target = solved->apply(types_, target);
  if (!resolution_.less_or_equal(source, instantiated_target)) return std::nullopt;
  return solved;
}

std::optional<Substitution> ConstraintSolver::solve_tuple(
  const Substitution & constraints, const Type * source, const Type * target) const
{
  if (source->unbounded && target->unbounded) {
    return solve_throws(constraints, source->element, target->element);
  }
  if (!source->unbounded && !target->unbounded) {
    return solve_all(constraints, source->parameters, target->parameters);
  }
  if (source->unbounded) {
    const std::vector<const Type *> sources(target->parameters.size(), source->element);
    return solve_all(constraints, sources, target->parameters);
  }
  return solve_throws(constraints, types_.get_union_type(source->parameters), target->element);
}

std::optional<Substitution> ConstraintSolver::solve_callable(
  const Substitution & constraints, const Type * source, const Type * target) const
{
  const CallableSignature & s = source->implementation;
  const CallableSignature & t = target->implementation;

  auto solved = solve_throws(
    constraints, s.annotation ? s.annotation : types_.top_type(),
    t.annotation ? t.annotation : types_.top_type());
  if (!solved) return std::nullopt;

  auto annotations = [this](const CallableSignature & signature) {
    std::vector<const Type *> result;
    if (!signature.parameters) return result;
    for (const auto & param : *signature.parameters) {
      result.push_back(param.annotation ? param.annotation : types_.top_type());
    }
    return result;
  };

  std::vector<const Type *> sources = annotations(s);
  std::vector<const Type *> targets = annotations(t);

  // Differing arities (defaults, *args) are tolerated; shared positions must agree.
  const size_t shared = std::min(sources.size(), targets.size());
  sources.resize(shared);
  targets.resize(shared);
  return solve_all(*solved, sources, targets, true);
}

// ============================================================================
// Entry Points
// ============================================================================

std::optional<Substitution> solve_constraints(
  const Resolution & resolution, const Substitution & constraints, const Type * source,
  const Type * target)
{
  return ConstraintSolver(resolution).solve(constraints, source, target);
}

bool constraints_solution_exists(
  const Resolution & resolution, const Type * source, const Type * target)
{
  return solve_constraints(resolution, Substitution{}, source, target).has_value();
}

}  // namespace pyrite
