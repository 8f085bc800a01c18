// pyrite/sema/resolution/annotation.hpp - Type plus binding mutability
//
#pragma once

#include <cstdint>
#include <string>

#include "pyrite/sema/types/type.hpp"

namespace pyrite
{

enum class Mutability : uint8_t {
  Mutable,    ///< May be silently refined by later assignments
  Immutable,  ///< Declared; assignments are checked against it
};

enum class AnnotationScope : uint8_t {
  Local,
  Global,
};

/**
 * Value stored for a binding in the environment and in global tables.
 *
 * For immutable annotations `original` keeps the declared type while
 * `type` may be refined by the analysis.
 */
struct Annotation
{
  const Type * type = nullptr;
  Mutability mutability = Mutability::Mutable;
  AnnotationScope scope = AnnotationScope::Local;
  const Type * original = nullptr;
  bool is_final = false;

  static Annotation create(const Type * type)
  {
    Annotation a;
    a.type = type;
    return a;
  }

  static Annotation create_immutable(
    const Type * type, AnnotationScope scope = AnnotationScope::Global,
    const Type * original = nullptr, bool is_final = false)
  {
    Annotation a;
    a.type = type;
    a.mutability = Mutability::Immutable;
    a.scope = scope;
    a.original = original ? original : type;
    a.is_final = is_final;
    return a;
  }

  [[nodiscard]] bool is_immutable() const noexcept { return mutability == Mutability::Immutable; }

  /// Copy with a different current type; mutability metadata is kept.
  [[nodiscard]] Annotation with_type(const Type * new_type) const
  {
    Annotation a = *this;
    a.type = new_type;
    return a;
  }

  [[nodiscard]] bool operator==(const Annotation & other) const
  {
    return type == other.type && mutability == other.mutability && scope == other.scope &&
           original == other.original && is_final == other.is_final;
  }
  [[nodiscard]] bool operator!=(const Annotation & other) const { return !(*this == other); }
};

/// "int" for mutable bindings, "int (immutable)" or "int (final)" otherwise.
[[nodiscard]] std::string to_string(const Annotation & annotation);

}  // namespace pyrite
