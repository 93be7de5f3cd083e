#include "parser_internal.h"

#include "../util/string_util.h"

namespace etlq {

/// Parses `INSERT INTO target [(columns)] VALUES (v, ...), ...`.
/// MUST keep every VALUES row at the same arity as the column list.
/// Inputs are tokens; outputs are InsertStatement or errors.
bool Parser::parse_insert(InsertStatement& stmt) {
  size_t start = current_.pos;
  advance();
  if (!consume(TokenType::KeywordInto, "Expected INTO after INSERT")) return false;
  if (!parse_datasource(stmt.target)) return false;
  if (current_.type == TokenType::LParen) {
    advance();
    while (true) {
      if (current_.type != TokenType::Identifier && current_.type != TokenType::BracketName) {
        return set_error("Expected column name in INSERT column list");
      }
      stmt.columns.push_back(current_.text);
      advance();
      if (current_.type == TokenType::Comma) {
        advance();
        continue;
      }
      if (!consume(TokenType::RParen, "Expected , or ) after INSERT column")) return false;
      break;
    }
  }
  if (!consume(TokenType::KeywordValues, "Expected VALUES")) return false;
  while (true) {
    if (!consume(TokenType::LParen, "Expected ( to start VALUES row")) return false;
    std::vector<Literal> row;
    while (true) {
      Literal literal;
      if (!parse_literal(literal)) return false;
      row.push_back(std::move(literal));
      if (current_.type == TokenType::Comma) {
        advance();
        continue;
      }
      break;
    }
    size_t expected = !stmt.columns.empty() ? stmt.columns.size()
                      : stmt.rows.empty()   ? row.size()
                                            : stmt.rows.front().size();
    if (row.size() != expected) {
      return set_error("VALUES row has " + std::to_string(row.size()) + " values, expected " +
                       std::to_string(expected));
    }
    if (!consume(TokenType::RParen, "Expected , or ) in VALUES row")) return false;
    stmt.rows.push_back(std::move(row));
    if (current_.type != TokenType::Comma) break;
    advance();
  }
  stmt.span = Span{start, last_end_};
  return true;
}

/// Parses `UPDATE target SET col = v, ... [WHERE cond]`.
bool Parser::parse_update(UpdateStatement& stmt) {
  size_t start = current_.pos;
  advance();
  if (!parse_datasource(stmt.target)) return false;
  if (!consume(TokenType::KeywordSet, "Expected SET after UPDATE target")) return false;
  while (true) {
    Assignment assignment;
    if (!parse_column_ref(assignment.column)) return false;
    if (!consume(TokenType::Equal, "Expected = in SET assignment")) return false;
    if (!parse_literal(assignment.value)) return false;
    stmt.assignments.push_back(std::move(assignment));
    if (current_.type != TokenType::Comma) break;
    advance();
  }
  if (current_.type == TokenType::KeywordWhere) {
    advance();
    Expr expr;
    if (!parse_expr(expr)) return false;
    stmt.where = std::move(expr);
  }
  stmt.span = Span{start, last_end_};
  return true;
}

/// Parses `DELETE FROM target [WHERE cond]`.
bool Parser::parse_delete(DeleteStatement& stmt) {
  size_t start = current_.pos;
  advance();
  if (!consume(TokenType::KeywordFrom, "Expected FROM after DELETE")) return false;
  if (!parse_datasource(stmt.target)) return false;
  if (current_.type == TokenType::KeywordWhere) {
    advance();
    Expr expr;
    if (!parse_expr(expr)) return false;
    stmt.where = std::move(expr);
  }
  stmt.span = Span{start, last_end_};
  return true;
}

}  // namespace etlq
