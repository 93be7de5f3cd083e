#include "parser_internal.h"

#include <memory>

#include "../util/string_util.h"

namespace etlq {

/// Parses an expression with OR precedence.
/// MUST build BinaryExpr nodes in left-associative order.
/// Inputs are tokens; outputs are Expr or errors.
bool Parser::parse_expr(Expr& out) {
  Expr left;
  if (!parse_and_expr(left)) return false;
  while (current_.type == TokenType::KeywordOr) {
    size_t start = current_.pos;
    advance();
    Expr right;
    if (!parse_and_expr(right)) return false;
    auto node = std::make_shared<BinaryExpr>();
    node->op = BinaryExpr::Op::Or;
    node->left = std::move(left);
    node->right = std::move(right);
    node->span = Span{start, last_end_};
    left = node;
  }
  out = std::move(left);
  return true;
}

/// Parses an expression with AND precedence.
/// MUST build BinaryExpr nodes in left-associative order.
bool Parser::parse_and_expr(Expr& out) {
  Expr left;
  if (!parse_not_expr(left)) return false;
  while (current_.type == TokenType::KeywordAnd) {
    size_t start = current_.pos;
    advance();
    Expr right;
    if (!parse_not_expr(right)) return false;
    auto node = std::make_shared<BinaryExpr>();
    node->op = BinaryExpr::Op::And;
    node->left = std::move(left);
    node->right = std::move(right);
    node->span = Span{start, last_end_};
    left = node;
  }
  out = std::move(left);
  return true;
}

bool Parser::parse_not_expr(Expr& out) {
  if (current_.type == TokenType::KeywordNot) {
    size_t start = current_.pos;
    advance();
    Expr operand;
    if (!parse_not_expr(operand)) return false;
    auto node = std::make_shared<NotExpr>();
    node->operand = std::move(operand);
    node->span = Span{start, last_end_};
    out = node;
    return true;
  }
  return parse_cmp_expr(out);
}

/// Parses parenthesized expressions, comparisons, and LIKE predicates.
/// MUST require a column on the left of LIKE and a string pattern on the right.
/// Inputs are tokens; outputs are Expr or errors.
bool Parser::parse_cmp_expr(Expr& out) {
  if (current_.type == TokenType::LParen) {
    advance();
    Expr inner;
    if (!parse_expr(inner)) return false;
    if (!consume(TokenType::RParen, "Expected ) to close expression")) return false;
    out = std::move(inner);
    return true;
  }
  size_t start = current_.pos;
  Operand lhs;
  if (!parse_operand(lhs)) return false;

  bool negate_like = false;
  if (current_.type == TokenType::KeywordNot && peek().type == TokenType::KeywordLike) {
    negate_like = true;
    advance();
  }
  if (current_.type == TokenType::KeywordLike) {
    const auto* column = std::get_if<ColumnRef>(&lhs);
    if (column == nullptr) {
      return set_error("LIKE expects a column on its left side");
    }
    LikeExpr like;
    like.column = *column;
    advance();
    if (current_.type != TokenType::String) {
      return set_error("Expected string pattern after LIKE");
    }
    like.pattern = current_.text;
    advance();
    like.span = Span{start, last_end_};
    if (!negate_like) {
      out = std::move(like);
      return true;
    }
    auto node = std::make_shared<NotExpr>();
    node->operand = std::move(like);
    node->span = Span{start, last_end_};
    out = node;
    return true;
  }

  CompareExpr cmp;
  cmp.lhs = std::move(lhs);
  switch (current_.type) {
    case TokenType::Equal: cmp.op = CompareExpr::Op::Eq; break;
    case TokenType::NotEqual: cmp.op = CompareExpr::Op::NotEq; break;
    case TokenType::Less: cmp.op = CompareExpr::Op::Lt; break;
    case TokenType::LessEqual: cmp.op = CompareExpr::Op::Le; break;
    case TokenType::Greater: cmp.op = CompareExpr::Op::Gt; break;
    case TokenType::GreaterEqual: cmp.op = CompareExpr::Op::Ge; break;
    default:
      return set_error("Expected comparison operator (=, !=, <, <=, >, >=) or LIKE");
  }
  advance();
  if (!parse_operand(cmp.rhs)) return false;
  cmp.span = Span{start, last_end_};
  out = std::move(cmp);
  return true;
}

bool Parser::parse_operand(Operand& operand) {
  if (current_.type == TokenType::String || current_.type == TokenType::Number) {
    Literal literal;
    if (!parse_literal(literal)) return false;
    operand = std::move(literal);
    return true;
  }
  ColumnRef ref;
  if (!parse_column_ref(ref)) return false;
  operand = std::move(ref);
  return true;
}

/// Parses a string or numeric literal.
/// MUST keep integers as int64 and decimals as double.
bool Parser::parse_literal(Literal& literal) {
  size_t start = current_.pos;
  if (current_.type == TokenType::String) {
    literal.value = current_.text;
  } else if (current_.type == TokenType::Number) {
    if (auto integer = util::parse_int64(current_.text)) {
      literal.value = *integer;
    } else if (auto decimal = util::parse_double(current_.text)) {
      literal.value = *decimal;
    } else {
      return set_error("Invalid numeric literal");
    }
  } else {
    return set_error("Expected string or number literal");
  }
  advance();
  literal.span = Span{start, last_end_};
  return true;
}

}  // namespace etlq
