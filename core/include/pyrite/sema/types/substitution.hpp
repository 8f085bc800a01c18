// pyrite/sema/types/substitution.hpp - Variable bindings produced by solving
//
#pragma once

#include <map>
#include <string>
#include <utility>

#include "pyrite/sema/types/type.hpp"

namespace pyrite
{

/**
 * Immutable mapping from type variables to their inferred types.
 *
 * At most one binding exists per variable. with_binding() returns a new
 * substitution and leaves the receiver untouched, so a failed solving
 * branch never leaks partial bindings.
 */
class Substitution
{
public:
  using Map = std::map<const Type *, const Type *, TypeLess>;
  using const_iterator = Map::const_iterator;

  Substitution() = default;
  explicit Substitution(Map bindings) : bindings_(std::move(bindings)) {}

  /// Binding for `variable`, or nullptr.
  [[nodiscard]] const Type * find(const Type * variable) const;

  [[nodiscard]] Substitution with_binding(const Type * variable, const Type * value) const;

  [[nodiscard]] size_t size() const noexcept { return bindings_.size(); }
  [[nodiscard]] bool empty() const noexcept { return bindings_.empty(); }

  [[nodiscard]] const_iterator begin() const noexcept { return bindings_.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return bindings_.end(); }

  /// Replace every bound variable occurring in `type`.
  [[nodiscard]] const Type * apply(TypeContext & types, const Type * type) const;

  /// `{T -> int, U -> str}`
  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] bool operator==(const Substitution & other) const
  {
    return bindings_ == other.bindings_;
  }
  [[nodiscard]] bool operator!=(const Substitution & other) const { return !(*this == other); }

private:
  Map bindings_;
};

}  // namespace pyrite
