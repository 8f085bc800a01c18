// pyrite/sema/resolution/environment.hpp - Capabilities injected into a Resolution
//
// The symbol tables, the general expression evaluator and the raw
// annotation parser live outside this library. They are reached through
// ResolutionEnvironment, which callers implement once and share across
// every Resolution they create. All lookups are read-only.
//
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "pyrite/ast/access.hpp"
#include "pyrite/ast/ast.hpp"
#include "pyrite/sema/resolution/annotation.hpp"
#include "pyrite/sema/types/type.hpp"

namespace pyrite
{

class Resolution;

// ============================================================================
// Symbol Table Records
// ============================================================================

struct FunctionDefinition
{
  Access name;
  CallableSignature signature;
};

struct ModuleDefinition
{
  Access qualifier;
  bool is_stub = false;

  /// A stub module without declarations: "exists, but nothing is known".
  bool is_empty_stub = false;

  /// Every function defined in the module, nested ones included.
  std::vector<FunctionDefinition> defines;
};

struct ClassDefinition
{
  Access name;
  std::vector<const Type *> bases;
  bool is_stub = false;
};

struct Attribute
{
  std::string name;
  Annotation annotation;
};

/**
 * Cached class model, produced and owned by the class-model subsystem.
 */
struct ClassRepresentation
{
  ClassDefinition definition;

  /// Linearised ancestors, nearest first.
  std::vector<std::string> successors;

  std::map<std::string, Attribute> explicit_attributes;

  /// Inferred attributes, e.g. assigned in the constructor.
  std::map<std::string, Attribute> implicit_attributes;

  bool is_test = false;
  std::vector<FunctionDefinition> methods;
};

// ============================================================================
// Environment Interface
// ============================================================================

class ResolutionEnvironment
{
public:
  virtual ~ResolutionEnvironment() = default;

  /// General expression evaluator.
  [[nodiscard]] virtual const Type * resolve(
    const Resolution & resolution, const Expr * expr) const = 0;

  /// Syntax-level annotation parser. nullptr if `expr` is not a type expression.
  [[nodiscard]] virtual const Type * parse_annotation(const Expr * expr) const = 0;

  [[nodiscard]] virtual std::optional<Annotation> global(const Access & name) const = 0;

  [[nodiscard]] virtual const ModuleDefinition * module_definition(
    const Access & name) const = 0;

  [[nodiscard]] virtual const ClassDefinition * class_definition(const Type * type) const = 0;

  [[nodiscard]] virtual const ClassRepresentation * class_representation(
    const Type * type) const = 0;

  /// Type produced by calling the class object, i.e. the constructor signature.
  [[nodiscard]] virtual const Type * constructor(
    const Type * instantiated, const Resolution & resolution,
    const ClassDefinition & definition) const = 0;
};

}  // namespace pyrite
