// pyrite/sema/analysis/constraint_solver.hpp - Generic constraint solving
//
// Decides whether a value of type `source` can be used where `target` is
// expected and, when `target` mentions type variables, how they must be
// bound for that to hold.
//
#pragma once

#include <optional>
#include <vector>

#include "pyrite/sema/resolution/resolution.hpp"
#include "pyrite/sema/types/substitution.hpp"
#include "pyrite/sema/types/type.hpp"

namespace pyrite
{

/**
 * Recursive unifier over the type structure.
 *
 * Each step returns a new Substitution or std::nullopt; the input
 * substitution is never modified. UntrackedType raised by the lattice is
 * caught in solve() and reported as failure.
 *
 * Example:
 * @code
 *   ConstraintSolver solver(resolution);
 *   auto result = solver.solve({}, types.list_type(types.integer_type()),
 *                              types.list_type(types.get_variable_type("T")));
 *   // result->find(T) == int
 * @endcode
 */
class ConstraintSolver
{
public:
  explicit ConstraintSolver(const Resolution & resolution);

  [[nodiscard]] std::optional<Substitution> solve(
    const Substitution & constraints, const Type * source, const Type * target) const;

private:
  [[nodiscard]] std::optional<Substitution> solve_throws(
    const Substitution & constraints, const Type * source, const Type * target) const;

  /// Pairwise fold; a length mismatch fails unless `ignore_length_mismatch`.
  [[nodiscard]] std::optional<Substitution> solve_all(
    const Substitution & constraints, const std::vector<const Type *> & sources,
    const std::vector<const Type *> & targets, bool ignore_length_mismatch = false) const;

  [[nodiscard]] std::optional<Substitution> solve_variable(
    const Substitution & constraints, const Type * source, const Type * variable) const;
  [[nodiscard]] std::optional<Substitution> solve_parametric(
    const Substitution & constraints, const Type * source, const Type * target) const;
  [[nodiscard]] std::optional<Substitution> solve_tuple(
    const Substitution & constraints, const Type * source, const Type * target) const;
  [[nodiscard]] std::optional<Substitution> solve_callable(
    const Substitution & constraints, const Type * source, const Type * target) const;

  /// Union unless the lattice join is below the union.
  [[nodiscard]] const Type * true_join(const Type * left, const Type * right) const;

  const Resolution & resolution_;
  TypeContext & types_;
};

/// One-shot ConstraintSolver::solve().
[[nodiscard]] std::optional<Substitution> solve_constraints(
  const Resolution & resolution, const Substitution & constraints, const Type * source,
  const Type * target);

/// Whether `source` can be used as `target` for some binding of its variables.
[[nodiscard]] bool constraints_solution_exists(
  const Resolution & resolution, const Type * source, const Type * target);

}  // namespace pyrite
