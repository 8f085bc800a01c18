// pyrite/test_support/stub_environment.hpp - In-memory ResolutionEnvironment for tests
//
// Every capability is backed by a plain map the test fills in. Unregistered
// lookups answer "absent", mirroring an empty symbol table.
//
#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pyrite/ast/ast_context.hpp"
#include "pyrite/ast/ast_utils.hpp"
#include "pyrite/basic/casting.hpp"
#include "pyrite/sema/analysis/literal_resolver.hpp"
#include "pyrite/sema/resolution/environment.hpp"
#include "pyrite/sema/resolution/resolution.hpp"
#include "pyrite/sema/types/class_hierarchy.hpp"
#include "pyrite/sema/types/type.hpp"
#include "pyrite/test_support/expr_builder.hpp"

namespace pyrite::test_support
{

class StubEnvironment : public ResolutionEnvironment
{
public:
  explicit StubEnvironment(TypeContext & types) : types_(types) {}

  // ===========================================================================
  // Registration
  // ===========================================================================

  /// Result of the general resolver for an expression, keyed by its source text.
  void add_resolved(std::string text, const Type * type) { resolved_[std::move(text)] = type; }

  /// Result of the raw annotation parser, keyed by source text.
  void add_annotation(std::string text, const Type * type)
  {
    annotations_[std::move(text)] = type;
  }

  void add_global(std::string_view name, Annotation annotation)
  {
    globals_.insert_or_assign(Access::create(name), annotation);
  }

  ModuleDefinition & add_module(std::string_view name, bool is_empty_stub = false)
  {
    ModuleDefinition module;
    module.qualifier = Access::create(name);
    module.is_stub = is_empty_stub;
    module.is_empty_stub = is_empty_stub;
    auto [it, inserted] = modules_.insert_or_assign(module.qualifier, std::move(module));
    (void)inserted;
    return it->second;
  }

  /// Declare a class; its instances use `constructor` when called (default: `() -> instance`).
  ClassDefinition & add_class(std::string_view name, const Type * constructor = nullptr)
  {
    ClassDefinition definition;
    definition.name = Access::create(name);
    auto [it, inserted] = classes_.insert_or_assign(std::string(name), std::move(definition));
    (void)inserted;
    if (constructor) constructors_[std::string(name)] = constructor;
    return it->second;
  }

  ClassRepresentation & add_representation(std::string_view name)
  {
    ClassRepresentation representation;
    representation.definition.name = Access::create(name);
    auto [it, inserted] =
      representations_.insert_or_assign(std::string(name), std::move(representation));
    (void)inserted;
    return it->second;
  }

  // ===========================================================================
  // ResolutionEnvironment
  // ===========================================================================

  const Type * resolve(const Resolution & resolution, const Expr * expr) const override
  {
    auto it = resolved_.find(to_string(expr));
    if (it != resolved_.end()) return it->second;
    return resolve_literal(resolution, expr);
  }

  const Type * parse_annotation(const Expr * expr) const override
  {
    auto it = annotations_.find(to_string(expr));
    if (it != annotations_.end()) return it->second;

    const auto * name = dyn_cast<NameExpr>(expr);
    if (!name) return nullptr;
    const std::string text = name->access().to_string();
    if (text == builtin::k_object) return types_.object_type();
    if (text == builtin::k_none) return types_.none_type();
    return types_.get_primitive_type(text);
  }

  std::optional<Annotation> global(const Access & name) const override
  {
    auto it = globals_.find(name);
    if (it == globals_.end()) return std::nullopt;
    return it->second;
  }

  const ModuleDefinition * module_definition(const Access & name) const override
  {
    auto it = modules_.find(name);
    return it != modules_.end() ? &it->second : nullptr;
  }

  const ClassDefinition * class_definition(const Type * type) const override
  {
    if (!type->is_nominal()) return nullptr;
    auto it = classes_.find(type->name);
    return it != classes_.end() ? &it->second : nullptr;
  }

  const ClassRepresentation * class_representation(const Type * type) const override
  {
    if (!type->is_nominal()) return nullptr;
    auto it = representations_.find(type->name);
    return it != representations_.end() ? &it->second : nullptr;
  }

  const Type * constructor(
    const Type * instantiated, const Resolution & /*resolution*/,
    const ClassDefinition & definition) const override
  {
    auto it = constructors_.find(definition.name.to_string());
    if (it != constructors_.end()) return it->second;

    CallableSignature signature;
    signature.annotation = instantiated;
    signature.parameters = std::vector<CallableParameter>{};
    return types_.get_callable_type(std::move(signature), {}, definition.name.to_string());
  }

private:
  TypeContext & types_;
  std::map<std::string, const Type *> resolved_;
  std::map<std::string, const Type *> annotations_;
  std::map<Access, Annotation> globals_;
  std::map<Access, ModuleDefinition> modules_;
  std::map<std::string, ClassDefinition> classes_;
  std::map<std::string, ClassRepresentation> representations_;
  std::map<std::string, const Type *> constructors_;
};

/**
 * Everything a test of the analysis layer needs, wired together.
 *
 * The hierarchy starts with the builtin classes registered.
 */
struct TestContext
{
  TypeContext types;
  ClassHierarchy hierarchy{types};
  StubEnvironment env{types};
  AstContext ast;
  ExprBuilder b{ast};

  TestContext() { hierarchy.register_builtins(); }

  [[nodiscard]] Resolution resolution() { return Resolution(types, hierarchy, env); }

  /// Declare `name` in both the lattice and the class table.
  void add_class(std::string_view name, std::vector<const Type *> variables = {},
                 std::vector<const Type *> bases = {})
  {
    const DefineResult result = hierarchy.define(name, std::move(variables), std::move(bases));
    if (!result.success) throw std::runtime_error(result.error);
    env.add_class(name);
  }

  const Type * type(std::string_view name) { return types.get_primitive_type(name); }
};

}  // namespace pyrite::test_support
