// pyrite/sema/types/class_hierarchy.hpp - Nominal class lattice
//
#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pyrite/sema/types/type.hpp"
#include "pyrite/sema/types/type_lattice.hpp"

namespace pyrite
{

/**
 * A class known to the hierarchy.
 *
 * `bases` are written in terms of `variables`, e.g. `class Foo(Mapping[str, _T])`.
 */
struct ClassInfo
{
  std::string name;
  std::vector<const Type *> variables;
  std::vector<const Type *> bases;

  /// C3 linearisation, starting with the class itself.
  std::vector<std::string> linearization;
};

/**
 * Result of ClassHierarchy::define().
 */
struct DefineResult
{
  bool success = false;
  std::string error;

  static DefineResult ok()
  {
    DefineResult r;
    r.success = true;
    return r;
  }

  static DefineResult fail(std::string msg)
  {
    DefineResult r;
    r.error = std::move(msg);
    return r;
  }
};

/**
 * Concrete TypeLattice over a set of declared classes.
 *
 * Classes must be defined after their bases, which keeps the graph acyclic.
 * Every class implicitly derives from `object`.
 *
 * Structural rules: unions, optionals, tuples (also instances of
 * `tuple[T]`), callables (covariant return, contravariant parameters) and
 * meta types (instances of `type[T]`).
 */
class ClassHierarchy final : public TypeLattice
{
public:
  explicit ClassHierarchy(TypeContext & types);

  /// Declare a class. Fails on redefinition, unknown bases or an inconsistent MRO.
  DefineResult define(
    std::string_view name, std::vector<const Type *> variables = {},
    std::vector<const Type *> bases = {});

  /// Install `object`, the numeric tower, strings, containers and typing protocols.
  void register_builtins();

  [[nodiscard]] const ClassInfo * find(std::string_view name) const;

  [[nodiscard]] size_t size() const noexcept { return classes_.size(); }

  [[nodiscard]] TypeContext & types() const noexcept { return *types_; }

  // ===========================================================================
  // TypeLattice
  // ===========================================================================

  [[nodiscard]] bool less_or_equal(const Type * left, const Type * right) const override;
  [[nodiscard]] const Type * join(const Type * left, const Type * right) const override;
  [[nodiscard]] const Type * meet(const Type * left, const Type * right) const override;
  [[nodiscard]] const Type * widen(
    const Type * previous, const Type * next, int iteration,
    int widening_threshold) const override;
  [[nodiscard]] bool contains(const Type * type) const override;
  [[nodiscard]] std::optional<std::vector<const Type *>> variables(
    std::string_view name) const override;
  [[nodiscard]] std::optional<std::vector<const Type *>> instantiate_successors_parameters(
    const Type * source, std::string_view target) const override;
  [[nodiscard]] bool is_instantiated(const Type * type) const override;
  [[nodiscard]] std::vector<std::string> successors(std::string_view name) const override;

private:
  /// Nominal view of a type: tuples become `tuple[...]`, meta types `type[...]`.
  [[nodiscard]] const Type * nominal_view(const Type * type) const;

  [[nodiscard]] bool nominal_less_or_equal(const Type * left, const Type * right) const;
  [[nodiscard]] bool parameters_less_or_equal(
    std::string_view name, const std::vector<const Type *> & left,
    const std::vector<const Type *> & right) const;
  [[nodiscard]] bool callable_less_or_equal(const Type * left, const Type * right) const;
  [[nodiscard]] const Type * nominal_join(const Type * left, const Type * right) const;

  /// Element type that a tuple contributes to `tuple[T]`.
  [[nodiscard]] const Type * collapse_tuple(const Type * tuple) const;

  std::optional<std::vector<const Type *>> search_ancestor(
    const ClassInfo & info, const std::vector<const Type *> & parameters,
    std::string_view target) const;

  TypeContext * types_;
  std::map<std::string, ClassInfo, std::less<>> classes_;
};

}  // namespace pyrite
