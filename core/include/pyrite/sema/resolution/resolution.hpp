// pyrite/sema/resolution/resolution.hpp - Immutable type environment
//
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "pyrite/ast/access.hpp"
#include "pyrite/ast/ast.hpp"
#include "pyrite/sema/resolution/annotation.hpp"
#include "pyrite/sema/resolution/environment.hpp"
#include "pyrite/sema/types/type.hpp"
#include "pyrite/sema/types/type_lattice.hpp"

namespace pyrite
{

/**
 * Snapshot of local annotations plus the capabilities to look up globals,
 * modules and classes.
 *
 * Resolution is a value: every "mutator" returns a new Resolution and the
 * receiver is never changed. The locals map is shared between copies until
 * one of them is modified, so forking per control-flow branch is cheap.
 *
 * The TypeContext, lattice and environment must outlive every Resolution
 * that refers to them.
 *
 * Example:
 * @code
 *   Resolution r(types, hierarchy, env);
 *   Resolution inner = r.set_local(Access::create("x"), Annotation::create(types.integer_type()));
 *   inner.get_local(Access::create("x"));  // int
 *   r.get_local(Access::create("x"));      // falls back to globals
 * @endcode
 */
class Resolution
{
public:
  using AnnotationMap = std::map<Access, Annotation>;

  Resolution(
    TypeContext & types, const TypeLattice & order, const ResolutionEnvironment & environment,
    AnnotationMap annotations = {}, std::optional<Access> parent = std::nullopt);

  // ===========================================================================
  // Locals
  // ===========================================================================

  [[nodiscard]] Resolution set_local(const Access & name, const Annotation & annotation) const;
  [[nodiscard]] Resolution unset_local(const Access & name) const;

  /**
   * Local binding of `name`.
   *
   * A binding to the deleted sentinel counts as absent. Absent names are
   * delocalized and looked up in the global table when `global_fallback`
   * is set.
   */
  [[nodiscard]] std::optional<Annotation> get_local(
    const Access & name, bool global_fallback = true) const;

  [[nodiscard]] const AnnotationMap & annotations() const noexcept { return *annotations_; }
  [[nodiscard]] Resolution with_annotations(AnnotationMap annotations) const;

  /// Qualified name of the enclosing scope, if any.
  [[nodiscard]] const std::optional<Access> & parent() const noexcept { return parent_; }
  [[nodiscard]] Resolution with_parent(std::optional<Access> parent) const;

  [[nodiscard]] const TypeLattice & order() const noexcept { return *order_; }
  [[nodiscard]] TypeContext & types() const noexcept { return *types_; }
  [[nodiscard]] const ResolutionEnvironment & environment() const noexcept
  {
    return *environment_;
  }

  // ===========================================================================
  // Injected Capabilities
  // ===========================================================================

  [[nodiscard]] const Type * resolve(const Expr * expr) const;
  [[nodiscard]] std::optional<Annotation> global(const Access & name) const;
  [[nodiscard]] const ModuleDefinition * module_definition(const Access & name) const;
  [[nodiscard]] const ClassDefinition * class_definition(const Type * type) const;
  [[nodiscard]] const ClassRepresentation * class_representation(const Type * type) const;
  [[nodiscard]] const Type * constructor(
    const Type * instantiated, const ClassDefinition & definition) const;

  /**
   * Functions named `name` and the functions nested in them, looked up in
   * the module given by the longest leading run of `name` that names known
   * modules.
   *
   * std::nullopt when no prefix of `name` is a module.
   */
  [[nodiscard]] std::optional<std::vector<FunctionDefinition>> function_definitions(
    const Access & name) const;

  /// True if some prefix of `name` is an empty stub module.
  [[nodiscard]] bool module_from_empty_stub(const Access & name) const;

  // ===========================================================================
  // Lattice Shortcuts
  // ===========================================================================

  [[nodiscard]] bool less_or_equal(const Type * left, const Type * right) const;
  [[nodiscard]] const Type * join(const Type * left, const Type * right) const;
  [[nodiscard]] const Type * meet(const Type * left, const Type * right) const;
  [[nodiscard]] const Type * widen(
    const Type * previous, const Type * next, int iteration, int widening_threshold) const;
  [[nodiscard]] bool is_instantiated(const Type * type) const;
  [[nodiscard]] bool is_tracked(const Type * type) const;

  /// Some nominal name inside `type` is unknown to the lattice.
  [[nodiscard]] bool contains_untracked(const Type * type) const;

  /// `[a -> int, b -> str]`
  [[nodiscard]] std::string to_string() const;

private:
  TypeContext * types_;
  const TypeLattice * order_;
  const ResolutionEnvironment * environment_;
  std::shared_ptr<const AnnotationMap> annotations_;
  std::optional<Access> parent_;
};

}  // namespace pyrite
