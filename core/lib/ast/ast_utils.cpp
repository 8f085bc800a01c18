// pyrite/ast/ast_utils.cpp - Expression printing and delocalization
//
#include "pyrite/ast/ast_utils.hpp"

#include <fmt/core.h>

#include <string_view>
#include <vector>

namespace pyrite
{

namespace
{

// ============================================================================
// Printing
// ============================================================================

std::string join_exprs(gsl::span<Expr *> exprs)
{
  std::string out;
  for (size_t i = 0; i < exprs.size(); ++i) {
    if (i > 0) out += ", ";
    out += to_string(exprs[i]);
  }
  return out;
}

std::string print_generators(gsl::span<ComprehensionGenerator> generators)
{
  std::string out;
  for (const auto & generator : generators) {
    out += generator.is_async ? " async for " : " for ";
    out += to_string(generator.target);
    out += " in ";
    out += to_string(generator.iterator);
    for (const Expr * condition : generator.conditions) {
      out += " if ";
      out += to_string(condition);
    }
  }
  return out;
}

std::string print_float(double value)
{
  std::string text = fmt::format("{}", value);
  if (text.find_first_of(".eni") == std::string::npos) text += ".0";
  return text;
}

// ============================================================================
// Delocalization
// ============================================================================

class Delocalizer
{
public:
  explicit Delocalizer(AstContext & ctx) : ctx_(ctx) {}

  Expr * copy(const Expr * expr)
  {
    if (expr == nullptr) return nullptr;

    switch (expr->get_kind()) {
      case NodeKind::Name: {
        const auto * name = cast<NameExpr>(expr);
        std::vector<std::string_view> ids;
        for (const auto id : name->identifiers) {
          for (const auto & part : delocalize_identifier(id)) {
            ids.push_back(ctx_.intern(part));
          }
        }
        return ctx_.create<NameExpr>(ctx_.copy_to_arena(ids), expr->get_range());
      }
      case NodeKind::Call: {
        const auto * call = cast<CallExpr>(expr);
        return ctx_.create<CallExpr>(
          copy(call->callee), copy_all(call->arguments), expr->get_range());
      }
      case NodeKind::Await:
        return ctx_.create<AwaitExpr>(copy(cast<AwaitExpr>(expr)->operand), expr->get_range());
      case NodeKind::BooleanOperator: {
        const auto * op = cast<BooleanOperatorExpr>(expr);
        return ctx_.create<BooleanOperatorExpr>(
          copy(op->left), op->op, copy(op->right), expr->get_range());
      }
      case NodeKind::UnaryOperator: {
        const auto * op = cast<UnaryOperatorExpr>(expr);
        return ctx_.create<UnaryOperatorExpr>(op->op, copy(op->operand), expr->get_range());
      }
      case NodeKind::IntegerLiteral:
        return ctx_.create<IntegerLiteralExpr>(
          cast<IntegerLiteralExpr>(expr)->value, expr->get_range());
      case NodeKind::FloatLiteral:
        return ctx_.create<FloatLiteralExpr>(
          cast<FloatLiteralExpr>(expr)->value, expr->get_range());
      case NodeKind::ComplexLiteral:
        return ctx_.create<ComplexLiteralExpr>(
          cast<ComplexLiteralExpr>(expr)->imaginary, expr->get_range());
      case NodeKind::StringLiteral: {
        const auto * str = cast<StringLiteralExpr>(expr);
        return ctx_.create<StringLiteralExpr>(
          ctx_.intern(str->value), str->string_kind, expr->get_range());
      }
      case NodeKind::BoolLiteral:
        return ctx_.create<BoolLiteralExpr>(cast<BoolLiteralExpr>(expr)->value, expr->get_range());
      case NodeKind::List:
        return ctx_.create<ListExpr>(copy_all(cast<ListExpr>(expr)->elements), expr->get_range());
      case NodeKind::Set:
        return ctx_.create<SetExpr>(copy_all(cast<SetExpr>(expr)->elements), expr->get_range());
      case NodeKind::Tuple:
        return ctx_.create<TupleExpr>(copy_all(cast<TupleExpr>(expr)->elements), expr->get_range());
      case NodeKind::Dictionary: {
        const auto * dict = cast<DictionaryExpr>(expr);
        std::vector<DictionaryEntry> entries;
        for (const auto & entry : dict->entries) entries.push_back(copy_entry(entry));
        return ctx_.create<DictionaryExpr>(
          ctx_.copy_to_arena(entries), copy_all(dict->keywords), expr->get_range());
      }
      case NodeKind::ListComprehension: {
        const auto * comp = cast<ListComprehensionExpr>(expr);
        return ctx_.create<ListComprehensionExpr>(
          copy(comp->element), copy_generators(comp->generators), expr->get_range());
      }
      case NodeKind::SetComprehension: {
        const auto * comp = cast<SetComprehensionExpr>(expr);
        return ctx_.create<SetComprehensionExpr>(
          copy(comp->element), copy_generators(comp->generators), expr->get_range());
      }
      case NodeKind::DictionaryComprehension: {
        const auto * comp = cast<DictionaryComprehensionExpr>(expr);
        return ctx_.create<DictionaryComprehensionExpr>(
          copy_entry(comp->element), copy_generators(comp->generators), expr->get_range());
      }
      case NodeKind::Ternary: {
        const auto * ternary = cast<TernaryExpr>(expr);
        return ctx_.create<TernaryExpr>(
          copy(ternary->target), copy(ternary->test), copy(ternary->alternative),
          expr->get_range());
      }
      case NodeKind::Yield:
        return ctx_.create<YieldExpr>(copy(cast<YieldExpr>(expr)->value), expr->get_range());
      case NodeKind::Starred: {
        const auto * starred = cast<StarredExpr>(expr);
        return ctx_.create<StarredExpr>(
          copy(starred->value), starred->double_star, expr->get_range());
      }
    }
    return nullptr;
  }

private:
  gsl::span<Expr *> copy_all(gsl::span<Expr *> exprs)
  {
    std::vector<Expr *> copies;
    copies.reserve(exprs.size());
    for (const Expr * e : exprs) copies.push_back(copy(e));
    return ctx_.copy_to_arena(copies);
  }

  DictionaryEntry copy_entry(const DictionaryEntry & entry)
  {
    return DictionaryEntry{copy(entry.key), copy(entry.value)};
  }

  gsl::span<ComprehensionGenerator> copy_generators(gsl::span<ComprehensionGenerator> generators)
  {
    std::vector<ComprehensionGenerator> copies;
    for (const auto & generator : generators) {
      copies.push_back(ComprehensionGenerator{
        copy(generator.target), copy(generator.iterator), copy_all(generator.conditions),
        generator.is_async});
    }
    return ctx_.copy_to_arena(copies);
  }

  AstContext & ctx_;
};

}  // namespace

std::string to_string(const Expr * expr)
{
  if (expr == nullptr) return "";

  switch (expr->get_kind()) {
    case NodeKind::Name: {
      std::string out;
      for (const auto id : cast<NameExpr>(expr)->identifiers) {
        if (!out.empty()) out += '.';
        out += id;
      }
      return out;
    }
    case NodeKind::Call: {
      const auto * call = cast<CallExpr>(expr);
      return to_string(call->callee) + "(" + join_exprs(call->arguments) + ")";
    }
    case NodeKind::Await:
      return "await " + to_string(cast<AwaitExpr>(expr)->operand);
    case NodeKind::BooleanOperator: {
      const auto * op = cast<BooleanOperatorExpr>(expr);
      return fmt::format("{} {} {}", to_string(op->left), to_string(op->op), to_string(op->right));
    }
    case NodeKind::UnaryOperator: {
      const auto * op = cast<UnaryOperatorExpr>(expr);
      return std::string(to_string(op->op)) + to_string(op->operand);
    }
    case NodeKind::IntegerLiteral:
      return std::to_string(cast<IntegerLiteralExpr>(expr)->value);
    case NodeKind::FloatLiteral:
      return print_float(cast<FloatLiteralExpr>(expr)->value);
    case NodeKind::ComplexLiteral:
      return fmt::format("{}j", cast<ComplexLiteralExpr>(expr)->imaginary);
    case NodeKind::StringLiteral: {
      const auto * str = cast<StringLiteralExpr>(expr);
      const char * prefix = str->string_kind == StringKind::Bytes    ? "b"
                            : str->string_kind == StringKind::Format ? "f"
                                                                     : "";
      return fmt::format("{}\"{}\"", prefix, str->value);
    }
    case NodeKind::BoolLiteral:
      return cast<BoolLiteralExpr>(expr)->value ? "True" : "False";
    case NodeKind::List:
      return "[" + join_exprs(cast<ListExpr>(expr)->elements) + "]";
    case NodeKind::Set:
      return "{" + join_exprs(cast<SetExpr>(expr)->elements) + "}";
    case NodeKind::Tuple: {
      const auto elements = cast<TupleExpr>(expr)->elements;
      return elements.size() == 1 ? "(" + to_string(elements[0]) + ",)"
                                  : "(" + join_exprs(elements) + ")";
    }
    case NodeKind::Dictionary: {
      const auto * dict = cast<DictionaryExpr>(expr);
      std::string out = "{";
      bool first = true;
      for (const auto & entry : dict->entries) {
        if (!first) out += ", ";
        first = false;
        out += to_string(entry.key) + ": " + to_string(entry.value);
      }
      for (const Expr * keyword : dict->keywords) {
        if (!first) out += ", ";
        first = false;
        out += "**" + to_string(keyword);
      }
      return out + "}";
    }
    case NodeKind::ListComprehension: {
      const auto * comp = cast<ListComprehensionExpr>(expr);
      return "[" + to_string(comp->element) + print_generators(comp->generators) + "]";
    }
    case NodeKind::SetComprehension: {
      const auto * comp = cast<SetComprehensionExpr>(expr);
      return "{" + to_string(comp->element) + print_generators(comp->generators) + "}";
    }
    case NodeKind::DictionaryComprehension: {
      const auto * comp = cast<DictionaryComprehensionExpr>(expr);
      return "{" + to_string(comp->element.key) + ": " + to_string(comp->element.value) +
             print_generators(comp->generators) + "}";
    }
    case NodeKind::Ternary: {
      const auto * ternary = cast<TernaryExpr>(expr);
      return fmt::format(
        "{} if {} else {}", to_string(ternary->target), to_string(ternary->test),
        to_string(ternary->alternative));
    }
    case NodeKind::Yield: {
      const Expr * value = cast<YieldExpr>(expr)->value;
      return value != nullptr ? "yield " + to_string(value) : "yield";
    }
    case NodeKind::Starred: {
      const auto * starred = cast<StarredExpr>(expr);
      return (starred->double_star ? "**" : "*") + to_string(starred->value);
    }
  }
  return "";
}

Expr * delocalize(AstContext & ctx, const Expr * expr) { return Delocalizer(ctx).copy(expr); }

}  // namespace pyrite
