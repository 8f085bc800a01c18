// pyrite/sema/types/type.hpp - Semantic type representation
//
// Types are interned by TypeContext: two types are structurally equal if and
// only if they are the same pointer. This makes `const Type *` usable as a
// map key and keeps comparisons in the solver cheap.
//
#pragma once

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace pyrite
{

// ============================================================================
// Type Kind
// ============================================================================

enum class TypeKind : uint8_t {
  Top,         ///< Unknown / dynamic
  Bottom,      ///< Never assigned
  Object,      ///< Universal supertype of known types
  Deleted,     ///< Sentinel stored for `del x`
  Primitive,   ///< Nominal type without arguments: `int`
  Parametric,  ///< Nominal type with arguments: `list[int]`
  Union,       ///< `typing.Union[a, b]`
  Optional,    ///< `typing.Optional[a]`
  Tuple,       ///< Bounded `Tuple[a, b]` or unbounded `Tuple[a, ...]`
  Callable,    ///< `typing.Callable[[a], r]` with overloads
  Variable,    ///< Type parameter awaiting a binding
  Meta,        ///< The class object: `typing.Type[a]`
};

enum class Variance : uint8_t {
  Covariant,
  Contravariant,
  Invariant,
};

enum class VariableConstraint : uint8_t {
  Unconstrained,
  Bound,     ///< Single upper bound
  Explicit,  ///< One of an explicit list of alternatives
};

struct Type;

// ============================================================================
// Callable Signatures
// ============================================================================

struct CallableParameter
{
  std::string name;
  const Type * annotation = nullptr;
  bool has_default = false;

  [[nodiscard]] bool operator==(const CallableParameter & other) const
  {
    return name == other.name && annotation == other.annotation &&
           has_default == other.has_default;
  }
  [[nodiscard]] bool operator!=(const CallableParameter & other) const { return !(*this == other); }
};

/**
 * One signature of a callable.
 *
 * `parameters` is std::nullopt for an undefined parameter list (`...`).
 */
struct CallableSignature
{
  const Type * annotation = nullptr;  ///< Return annotation
  std::optional<std::vector<CallableParameter>> parameters;

  [[nodiscard]] bool operator==(const CallableSignature & other) const
  {
    return annotation == other.annotation && parameters == other.parameters;
  }
  [[nodiscard]] bool operator!=(const CallableSignature & other) const { return !(*this == other); }
};

// ============================================================================
// Type
// ============================================================================

/**
 * Semantic type.
 *
 * Field usage by kind:
 * - Primitive:  name
 * - Parametric: name, parameters
 * - Union:      parameters (normalised members)
 * - Optional:   element
 * - Tuple:      parameters (bounded) or element (unbounded)
 * - Callable:   name (may be empty), implementation, overloads
 * - Variable:   name, variance, constraint, element (bound) or parameters (explicit)
 * - Meta:       element (the instance type)
 */
struct Type
{
  TypeKind kind;

  /// Interning order; stable for the lifetime of the owning TypeContext.
  uint32_t id = 0;

  std::string name;
  std::vector<const Type *> parameters;
  const Type * element = nullptr;
  bool unbounded = false;

  Variance variance = Variance::Invariant;
  VariableConstraint constraint = VariableConstraint::Unconstrained;

  CallableSignature implementation;
  std::vector<CallableSignature> overloads;

  // ===========================================================================
  // Type Queries
  // ===========================================================================

  [[nodiscard]] bool is_top() const noexcept { return kind == TypeKind::Top; }
  [[nodiscard]] bool is_bottom() const noexcept { return kind == TypeKind::Bottom; }
  [[nodiscard]] bool is_object() const noexcept { return kind == TypeKind::Object; }
  [[nodiscard]] bool is_deleted() const noexcept { return kind == TypeKind::Deleted; }
  [[nodiscard]] bool is_primitive() const noexcept { return kind == TypeKind::Primitive; }
  [[nodiscard]] bool is_parametric() const noexcept { return kind == TypeKind::Parametric; }
  [[nodiscard]] bool is_union() const noexcept { return kind == TypeKind::Union; }
  [[nodiscard]] bool is_optional() const noexcept { return kind == TypeKind::Optional; }
  [[nodiscard]] bool is_tuple() const noexcept { return kind == TypeKind::Tuple; }
  [[nodiscard]] bool is_callable() const noexcept { return kind == TypeKind::Callable; }
  [[nodiscard]] bool is_variable() const noexcept { return kind == TypeKind::Variable; }
  [[nodiscard]] bool is_meta() const noexcept { return kind == TypeKind::Meta; }

  /// Primitive or Parametric: a type the lattice knows by name.
  [[nodiscard]] bool is_nominal() const noexcept
  {
    return kind == TypeKind::Primitive || kind == TypeKind::Parametric;
  }

  [[nodiscard]] bool is_bounded_tuple() const noexcept { return is_tuple() && !unbounded; }
  [[nodiscard]] bool is_unbounded_tuple() const noexcept { return is_tuple() && unbounded; }
};

/// Orders interned types by creation; deterministic within one TypeContext.
struct TypeLess
{
  bool operator()(const Type * a, const Type * b) const noexcept { return a->id < b->id; }
};

// ============================================================================
// Builtin Names
// ============================================================================

namespace builtin
{
inline constexpr std::string_view k_object = "object";
inline constexpr std::string_view k_bool = "bool";
inline constexpr std::string_view k_int = "int";
inline constexpr std::string_view k_float = "float";
inline constexpr std::string_view k_complex = "complex";
inline constexpr std::string_view k_str = "str";
inline constexpr std::string_view k_bytes = "bytes";
inline constexpr std::string_view k_none = "None";
inline constexpr std::string_view k_type = "type";
inline constexpr std::string_view k_list = "list";
inline constexpr std::string_view k_set = "set";
inline constexpr std::string_view k_dict = "dict";
inline constexpr std::string_view k_tuple = "tuple";
inline constexpr std::string_view k_iterable = "typing.Iterable";
inline constexpr std::string_view k_awaitable = "typing.Awaitable";
inline constexpr std::string_view k_generator = "typing.Generator";
}  // namespace builtin

// ============================================================================
// Type Context
// ============================================================================

/**
 * Interning factory for semantic types.
 *
 * Every factory returns the unique instance for its structure. Returned
 * pointers stay valid for the lifetime of the context.
 */
class TypeContext
{
public:
  TypeContext();

  TypeContext(const TypeContext &) = delete;
  TypeContext & operator=(const TypeContext &) = delete;

  // ===========================================================================
  // Singletons
  // ===========================================================================

  [[nodiscard]] const Type * top_type() const noexcept { return top_; }
  [[nodiscard]] const Type * bottom_type() const noexcept { return bottom_; }
  [[nodiscard]] const Type * object_type() const noexcept { return object_; }
  [[nodiscard]] const Type * deleted_type() const noexcept { return deleted_; }

  // ===========================================================================
  // Constructors (Interned)
  // ===========================================================================

  const Type * get_primitive_type(std::string_view name);

  /// `name[parameters...]`; an empty parameter list yields the primitive.
  const Type * get_parametric_type(std::string_view name, std::vector<const Type *> parameters);

  /**
   * Normalised union.
   *
   * Nested unions are flattened, Bottom members dropped and duplicates
   * removed. Top absorbs everything, then Object. An empty union is Bottom
   * and a single member is returned unchanged.
   */
  const Type * get_union_type(std::vector<const Type *> members);

  /// `Optional[inner]`; never double-wrapped, `Optional[Top]` is Top.
  const Type * get_optional_type(const Type * inner);

  const Type * get_bounded_tuple_type(std::vector<const Type *> elements);
  const Type * get_unbounded_tuple_type(const Type * element);

  const Type * get_callable_type(
    CallableSignature implementation, std::vector<CallableSignature> overloads = {},
    std::string_view name = {});

  const Type * get_variable_type(std::string_view name, Variance variance = Variance::Invariant);
  const Type * get_bound_variable_type(
    std::string_view name, const Type * bound, Variance variance = Variance::Invariant);
  const Type * get_explicit_variable_type(
    std::string_view name, std::vector<const Type *> constraints,
    Variance variance = Variance::Invariant);

  const Type * get_meta_type(const Type * instance);

  // ===========================================================================
  // Builtin Shorthands
  // ===========================================================================

  const Type * bool_type() { return get_primitive_type(builtin::k_bool); }
  const Type * integer_type() { return get_primitive_type(builtin::k_int); }
  const Type * float_type() { return get_primitive_type(builtin::k_float); }
  const Type * complex_type() { return get_primitive_type(builtin::k_complex); }
  const Type * string_type() { return get_primitive_type(builtin::k_str); }
  const Type * bytes_type() { return get_primitive_type(builtin::k_bytes); }
  const Type * none_type() { return get_primitive_type(builtin::k_none); }

  const Type * list_type(const Type * element)
  {
    return get_parametric_type(builtin::k_list, {element});
  }
  const Type * set_type(const Type * element)
  {
    return get_parametric_type(builtin::k_set, {element});
  }
  const Type * dictionary_type(const Type * key, const Type * value)
  {
    return get_parametric_type(builtin::k_dict, {key, value});
  }
  const Type * awaitable_type(const Type * value)
  {
    return get_parametric_type(builtin::k_awaitable, {value});
  }
  const Type * generator_type(const Type * yield, const Type * send, const Type * result)
  {
    return get_parametric_type(builtin::k_generator, {yield, send, result});
  }

  /// Number of interned types, singletons included.
  [[nodiscard]] size_t size() const;

private:
  struct StructuralHash
  {
    size_t operator()(const Type * type) const noexcept;
  };

  struct StructuralEqual
  {
    bool operator()(const Type * a, const Type * b) const noexcept;
  };

  const Type * intern(Type candidate);

  // Stable element addresses are required: pointers are handed out widely.
  std::deque<Type> types_;
  std::unordered_set<const Type *, StructuralHash, StructuralEqual> interned_;

  // Solves on separate threads intern into the same context.
  mutable std::mutex mutex_;

  const Type * top_ = nullptr;
  const Type * bottom_ = nullptr;
  const Type * object_ = nullptr;
  const Type * deleted_ = nullptr;
};

}  // namespace pyrite
