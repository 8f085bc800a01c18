// pyrite/test_support/expr_builder.hpp - Terse construction of expression trees
//
// Tests have no parser; they build the trees they need directly:
//
//   ExprBuilder b(ast);
//   auto * list = b.list({b.integer(1), b.integer(2)});
//   auto * call = b.call(b.name("Foo"), {b.string("x")});
//
#pragma once

#include <initializer_list>
#include <string_view>
#include <utility>
#include <vector>

#include "pyrite/ast/ast.hpp"
#include "pyrite/ast/ast_context.hpp"

namespace pyrite::test_support
{

class ExprBuilder
{
public:
  explicit ExprBuilder(AstContext & ast) : ast_(ast) {}

  /// Dotted name; "a.b.c" has three identifiers.
  NameExpr * name(std::string_view dotted)
  {
    std::vector<std::string_view> ids;
    size_t start = 0;
    while (start <= dotted.size()) {
      const size_t dot = dotted.find('.', start);
      const size_t end = dot == std::string_view::npos ? dotted.size() : dot;
      ids.push_back(ast_.intern(dotted.substr(start, end - start)));
      if (dot == std::string_view::npos) break;
      start = dot + 1;
    }
    return ast_.create<NameExpr>(ast_.copy_to_arena(ids));
  }

  CallExpr * call(Expr * callee, std::initializer_list<Expr *> arguments = {})
  {
    return ast_.create<CallExpr>(callee, ast_.copy_to_arena(arguments));
  }

  AwaitExpr * await(Expr * operand) { return ast_.create<AwaitExpr>(operand); }

  BooleanOperatorExpr * boolean(Expr * left, BooleanOp op, Expr * right)
  {
    return ast_.create<BooleanOperatorExpr>(left, op, right);
  }

  UnaryOperatorExpr * unary(UnaryOp op, Expr * operand)
  {
    return ast_.create<UnaryOperatorExpr>(op, operand);
  }

  TernaryExpr * ternary(Expr * target, Expr * test, Expr * alternative)
  {
    return ast_.create<TernaryExpr>(target, test, alternative);
  }

  IntegerLiteralExpr * integer(int64_t value) { return ast_.create<IntegerLiteralExpr>(value); }
  FloatLiteralExpr * floating(double value) { return ast_.create<FloatLiteralExpr>(value); }
  ComplexLiteralExpr * complex(double imaginary)
  {
    return ast_.create<ComplexLiteralExpr>(imaginary);
  }
  BoolLiteralExpr * boolean(bool value) { return ast_.create<BoolLiteralExpr>(value); }

  StringLiteralExpr * string(std::string_view value, StringKind kind = StringKind::String)
  {
    return ast_.create<StringLiteralExpr>(ast_.intern(value), kind);
  }
  StringLiteralExpr * bytes(std::string_view value) { return string(value, StringKind::Bytes); }

  ListExpr * list(std::initializer_list<Expr *> elements)
  {
    return ast_.create<ListExpr>(ast_.copy_to_arena(elements));
  }

  SetExpr * set(std::initializer_list<Expr *> elements)
  {
    return ast_.create<SetExpr>(ast_.copy_to_arena(elements));
  }

  TupleExpr * tuple(std::initializer_list<Expr *> elements)
  {
    return ast_.create<TupleExpr>(ast_.copy_to_arena(elements));
  }

  DictionaryExpr * dict(
    std::initializer_list<std::pair<Expr *, Expr *>> entries,
    std::initializer_list<Expr *> keywords = {})
  {
    std::vector<DictionaryEntry> items;
    for (const auto & [key, value] : entries) items.push_back(DictionaryEntry{key, value});
    return ast_.create<DictionaryExpr>(
      ast_.copy_to_arena(items), ast_.copy_to_arena(keywords));
  }

  /// Single `for target in iterator` clause.
  ListComprehensionExpr * list_comprehension(Expr * element, Expr * target, Expr * iterator)
  {
    return ast_.create<ListComprehensionExpr>(element, generator(target, iterator));
  }

  SetComprehensionExpr * set_comprehension(Expr * element, Expr * target, Expr * iterator)
  {
    return ast_.create<SetComprehensionExpr>(element, generator(target, iterator));
  }

  DictionaryComprehensionExpr * dict_comprehension(
    Expr * key, Expr * value, Expr * target, Expr * iterator)
  {
    return ast_.create<DictionaryComprehensionExpr>(
      DictionaryEntry{key, value}, generator(target, iterator));
  }

  YieldExpr * yield(Expr * value = nullptr) { return ast_.create<YieldExpr>(value); }

  StarredExpr * starred(Expr * value, bool double_star = false)
  {
    return ast_.create<StarredExpr>(value, double_star);
  }

private:
  gsl::span<ComprehensionGenerator> generator(Expr * target, Expr * iterator)
  {
    ComprehensionGenerator clause;
    clause.target = target;
    clause.iterator = iterator;
    return ast_.copy_to_arena({clause});
  }

  AstContext & ast_;
};

}  // namespace pyrite::test_support
