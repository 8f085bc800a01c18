// pyrite/sema/types/type_lattice.hpp - Subtyping oracle interface
//
// The lattice answers nominal and structural subtyping questions and knows
// which names exist ("tracked" types). The environment and the solver only
// ever talk to it through this interface.
//
#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pyrite/sema/types/type.hpp"

namespace pyrite
{

/**
 * Raised when an ancestry query names a class the lattice does not track.
 *
 * Only instantiate_successors_parameters() throws it. Callers that expose a
 * public boundary must catch it and turn it into a failed result.
 */
class UntrackedType : public std::runtime_error
{
public:
  explicit UntrackedType(std::string name)
  : std::runtime_error("untracked type `" + name + "`"), name_(std::move(name))
  {
  }

  [[nodiscard]] const std::string & name() const noexcept { return name_; }

private:
  std::string name_;
};

class TypeLattice
{
public:
  virtual ~TypeLattice() = default;

  /// `left <= right`. Untracked names are never related; this never throws.
  [[nodiscard]] virtual bool less_or_equal(const Type * left, const Type * right) const = 0;

  [[nodiscard]] virtual const Type * join(const Type * left, const Type * right) const = 0;
  [[nodiscard]] virtual const Type * meet(const Type * left, const Type * right) const = 0;

  /// Join of `previous` and `next`, or Top once `iteration` exceeds the threshold.
  [[nodiscard]] virtual const Type * widen(
    const Type * previous, const Type * next, int iteration, int widening_threshold) const = 0;

  /// Whether the type's nominal name is tracked. Non-nominal types are tracked.
  [[nodiscard]] virtual bool contains(const Type * type) const = 0;

  /// Declared type variables of a generic class; std::nullopt for unknown names.
  [[nodiscard]] virtual std::optional<std::vector<const Type *>> variables(
    std::string_view name) const = 0;

  /**
   * Parameters `source` supplies to its ancestor `target`.
   *
   * For `class IntList(list[int])`, asking about ("IntList", "list") yields
   * `[int]`. Returns std::nullopt when `target` is not an ancestor.
   *
   * @throws UntrackedType if either name is unknown
   */
  [[nodiscard]] virtual std::optional<std::vector<const Type *>> instantiate_successors_parameters(
    const Type * source, std::string_view target) const = 0;

  /// No Top, no Bottom and no untracked name anywhere in the type.
  [[nodiscard]] virtual bool is_instantiated(const Type * type) const = 0;

  /// Linearised ancestors of `name`, excluding `name` itself.
  [[nodiscard]] virtual std::vector<std::string> successors(std::string_view name) const = 0;
};

}  // namespace pyrite
