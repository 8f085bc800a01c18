// pyrite/ast/ast.hpp - Expression node class definitions
//
// Only the expression shapes the type environment inspects are modelled.
// Nodes follow the LLVM/Clang style with classof() for RTTI support and are
// owned by an AstContext arena.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <string_view>

#include "pyrite/ast/access.hpp"
#include "pyrite/ast/ast_enums.hpp"
#include "pyrite/basic/casting.hpp"
#include "pyrite/basic/source_range.hpp"

namespace pyrite
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Nodes are non-copyable, trivially destructible and managed by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }

  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;
};

/**
 * CRTP base class that implements classof() for a concrete node kind.
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

class Expr : public AstNode
{
public:
  static bool classof(const AstNode * /*node*/) { return true; }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

// ============================================================================
// Supporting Structures
// ============================================================================

struct DictionaryEntry
{
  Expr * key = nullptr;
  Expr * value = nullptr;
};

/// `for target in iterator if c1 if c2`
struct ComprehensionGenerator
{
  Expr * target = nullptr;
  Expr * iterator = nullptr;
  gsl::span<Expr *> conditions;
  bool is_async = false;
};

// ============================================================================
// Names and Calls
// ============================================================================

/// Possibly dotted name: `x`, `typing.List`, `$local_f$x`.
class NameExpr : public NodeBase<NameExpr, Expr, NodeKind::Name>
{
public:
  gsl::span<std::string_view> identifiers;

  explicit NameExpr(gsl::span<std::string_view> ids, SourceRange r = {})
  : NodeBase(r), identifiers(ids)
  {
  }

  [[nodiscard]] Access access() const
  {
    std::vector<std::string> parts;
    parts.reserve(identifiers.size());
    for (const auto id : identifiers) parts.emplace_back(id);
    return Access(std::move(parts));
  }
};

/// `callee(arguments...)`
class CallExpr : public NodeBase<CallExpr, Expr, NodeKind::Call>
{
public:
  Expr * callee;
  gsl::span<Expr *> arguments;

  CallExpr(Expr * c, gsl::span<Expr *> args, SourceRange r = {})
  : NodeBase(r), callee(c), arguments(args)
  {
  }
};

// ============================================================================
// Operators
// ============================================================================

class AwaitExpr : public NodeBase<AwaitExpr, Expr, NodeKind::Await>
{
public:
  Expr * operand;

  explicit AwaitExpr(Expr * e, SourceRange r = {}) : NodeBase(r), operand(e) {}
};

/// `left and right`, `left or right`
class BooleanOperatorExpr
: public NodeBase<BooleanOperatorExpr, Expr, NodeKind::BooleanOperator>
{
public:
  Expr * left;
  BooleanOp op;
  Expr * right;

  BooleanOperatorExpr(Expr * l, BooleanOp o, Expr * rhs, SourceRange r = {})
  : NodeBase(r), left(l), op(o), right(rhs)
  {
  }
};

class UnaryOperatorExpr : public NodeBase<UnaryOperatorExpr, Expr, NodeKind::UnaryOperator>
{
public:
  UnaryOp op;
  Expr * operand;

  UnaryOperatorExpr(UnaryOp o, Expr * e, SourceRange r = {}) : NodeBase(r), op(o), operand(e) {}
};

/// `target if test else alternative`
class TernaryExpr : public NodeBase<TernaryExpr, Expr, NodeKind::Ternary>
{
public:
  Expr * target;
  Expr * test;
  Expr * alternative;

  TernaryExpr(Expr * t, Expr * c, Expr * a, SourceRange r = {})
  : NodeBase(r), target(t), test(c), alternative(a)
  {
  }
};

// ============================================================================
// Literals
// ============================================================================

class IntegerLiteralExpr : public NodeBase<IntegerLiteralExpr, Expr, NodeKind::IntegerLiteral>
{
public:
  int64_t value;

  explicit IntegerLiteralExpr(int64_t v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class FloatLiteralExpr : public NodeBase<FloatLiteralExpr, Expr, NodeKind::FloatLiteral>
{
public:
  double value;

  explicit FloatLiteralExpr(double v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// Imaginary literal such as `2j`.
class ComplexLiteralExpr : public NodeBase<ComplexLiteralExpr, Expr, NodeKind::ComplexLiteral>
{
public:
  double imaginary;

  explicit ComplexLiteralExpr(double v, SourceRange r = {}) : NodeBase(r), imaginary(v) {}
};

class StringLiteralExpr : public NodeBase<StringLiteralExpr, Expr, NodeKind::StringLiteral>
{
public:
  std::string_view value;
  StringKind string_kind;

  explicit StringLiteralExpr(
    std::string_view v, StringKind k = StringKind::String, SourceRange r = {})
  : NodeBase(r), value(v), string_kind(k)
  {
  }
};

class BoolLiteralExpr : public NodeBase<BoolLiteralExpr, Expr, NodeKind::BoolLiteral>
{
public:
  bool value;

  explicit BoolLiteralExpr(bool v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

// ============================================================================
// Displays and Comprehensions
// ============================================================================

class ListExpr : public NodeBase<ListExpr, Expr, NodeKind::List>
{
public:
  gsl::span<Expr *> elements;

  explicit ListExpr(gsl::span<Expr *> elems, SourceRange r = {}) : NodeBase(r), elements(elems) {}
};

class SetExpr : public NodeBase<SetExpr, Expr, NodeKind::Set>
{
public:
  gsl::span<Expr *> elements;

  explicit SetExpr(gsl::span<Expr *> elems, SourceRange r = {}) : NodeBase(r), elements(elems) {}
};

class TupleExpr : public NodeBase<TupleExpr, Expr, NodeKind::Tuple>
{
public:
  gsl::span<Expr *> elements;

  explicit TupleExpr(gsl::span<Expr *> elems, SourceRange r = {}) : NodeBase(r), elements(elems)
  {
  }
};

/// `{k: v, **other}`; keyword splats are kept separately from entries.
class DictionaryExpr : public NodeBase<DictionaryExpr, Expr, NodeKind::Dictionary>
{
public:
  gsl::span<DictionaryEntry> entries;
  gsl::span<Expr *> keywords;

  DictionaryExpr(
    gsl::span<DictionaryEntry> e, gsl::span<Expr *> kw = {}, SourceRange r = {})
  : NodeBase(r), entries(e), keywords(kw)
  {
  }
};

class ListComprehensionExpr
: public NodeBase<ListComprehensionExpr, Expr, NodeKind::ListComprehension>
{
public:
  Expr * element;
  gsl::span<ComprehensionGenerator> generators;

  ListComprehensionExpr(Expr * e, gsl::span<ComprehensionGenerator> g, SourceRange r = {})
  : NodeBase(r), element(e), generators(g)
  {
  }
};

class SetComprehensionExpr
: public NodeBase<SetComprehensionExpr, Expr, NodeKind::SetComprehension>
{
public:
  Expr * element;
  gsl::span<ComprehensionGenerator> generators;

  SetComprehensionExpr(Expr * e, gsl::span<ComprehensionGenerator> g, SourceRange r = {})
  : NodeBase(r), element(e), generators(g)
  {
  }
};

class DictionaryComprehensionExpr
: public NodeBase<DictionaryComprehensionExpr, Expr, NodeKind::DictionaryComprehension>
{
public:
  DictionaryEntry element;
  gsl::span<ComprehensionGenerator> generators;

  DictionaryComprehensionExpr(
    DictionaryEntry e, gsl::span<ComprehensionGenerator> g, SourceRange r = {})
  : NodeBase(r), element(e), generators(g)
  {
  }
};

// ============================================================================
// Other Forms
// ============================================================================

/// `yield` or `yield value`; value is nullptr for a bare yield.
class YieldExpr : public NodeBase<YieldExpr, Expr, NodeKind::Yield>
{
public:
  Expr * value;

  explicit YieldExpr(Expr * v = nullptr, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// `*value` or `**value`
class StarredExpr : public NodeBase<StarredExpr, Expr, NodeKind::Starred>
{
public:
  Expr * value;
  bool double_star;

  explicit StarredExpr(Expr * v, bool twice = false, SourceRange r = {})
  : NodeBase(r), value(v), double_star(twice)
  {
  }
};

}  // namespace pyrite
