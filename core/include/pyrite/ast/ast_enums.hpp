// pyrite/ast/ast_enums.hpp - AST enumeration definitions
//
#pragma once

#include <cstdint>
#include <string_view>

namespace pyrite
{

// ============================================================================
// NodeKind - Identifies all expression node types
// ============================================================================

enum class NodeKind : uint8_t {
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#include "pyrite/ast/ast_nodes.def"
};

/// snake_case name of a node kind, e.g. "list_comprehension".
[[nodiscard]] constexpr std::string_view node_kind_name(NodeKind kind) noexcept
{
  switch (kind) {
#define AST_NODE_EXPR(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Snake;
#include "pyrite/ast/ast_nodes.def"
  }
  return "unknown";
}

// ============================================================================
// Operators
// ============================================================================

enum class BooleanOp : uint8_t {
  And,  ///< and
  Or,   ///< or
};

enum class UnaryOp : uint8_t {
  Not,     ///< not
  Negate,  ///< -
  Plus,    ///< +
  Invert,  ///< ~
};

enum class StringKind : uint8_t {
  String,  ///< "..."
  Bytes,   ///< b"..."
  Format,  ///< f"..."
};

[[nodiscard]] constexpr std::string_view to_string(BooleanOp op) noexcept
{
  return op == BooleanOp::And ? "and" : "or";
}

[[nodiscard]] constexpr std::string_view to_string(UnaryOp op) noexcept
{
  switch (op) {
    case UnaryOp::Not:
      return "not ";
    case UnaryOp::Negate:
      return "-";
    case UnaryOp::Plus:
      return "+";
    case UnaryOp::Invert:
      return "~";
  }
  return "";
}

}  // namespace pyrite
