#include "parser_internal.h"

#include <memory>

#include "../util/string_util.h"

namespace etlq {

/// Parses a datasource literal `{type:path}` or a bare table name.
/// MUST validate the remote descriptor when the type is gee.
/// Inputs are tokens; outputs are Datasource or errors.
bool Parser::parse_datasource(Datasource& source) {
  if (current_.type == TokenType::Identifier) {
    // A bare name is shorthand for {table:name}.
    source.type = "table";
    source.path = current_.text;
    advance();
    return true;
  }
  if (current_.type != TokenType::Datasource) {
    return set_error("Expected datasource {type:path} or table name");
  }
  const std::string& raw = current_.text;
  size_t colon = raw.find(':');
  if (colon == std::string::npos) {
    return set_error("Datasource literal must look like {type:path}");
  }
  source.type = util::trim_ws(raw.substr(0, colon));
  source.path = util::trim_ws(raw.substr(colon + 1));
  if (source.type.empty()) {
    return set_error("Datasource literal is missing its type");
  }
  if (source.path.empty()) {
    return set_error("Datasource literal is missing its path");
  }
  if (util::to_lower(source.type) == "gee") {
    std::string error;
    auto descriptor = parse_remote_descriptor(source.path, error);
    if (!descriptor.has_value()) {
      return set_error("Invalid gee descriptor: " + error);
    }
    source.remote = std::move(*descriptor);
  }
  advance();
  return true;
}

/// Parses a datasource plus optional `AS alias`.
/// A bare table name doubles as its own alias when none is given.
bool Parser::parse_table_source(TableSource& source) {
  size_t start = current_.pos;
  bool bare = current_.type == TokenType::Identifier;
  if (!parse_datasource(source.datasource)) return false;
  if (current_.type == TokenType::KeywordAs) {
    advance();
    if (current_.type != TokenType::Identifier) {
      return set_error("Expected alias after AS");
    }
    source.alias = current_.text;
    advance();
  } else if (bare) {
    source.alias = source.datasource.path;
  }
  source.span = Span{start, last_end_};
  return true;
}

/// Parses `[INNER | LEFT [OUTER] | RIGHT [OUTER] | FULL [OUTER]] JOIN source ON cond`.
/// MUST default a missing qualifier to INNER.
bool Parser::parse_join_clause(JoinClause& join) {
  size_t start = current_.pos;
  switch (current_.type) {
    case TokenType::KeywordInner:
      join.kind = JoinClause::Kind::Inner;
      advance();
      break;
    case TokenType::KeywordLeft:
      join.kind = JoinClause::Kind::Left;
      advance();
      if (current_.type == TokenType::KeywordOuter) advance();
      break;
    case TokenType::KeywordRight:
      join.kind = JoinClause::Kind::Right;
      advance();
      if (current_.type == TokenType::KeywordOuter) advance();
      break;
    case TokenType::KeywordFull:
      join.kind = JoinClause::Kind::Outer;
      advance();
      if (current_.type == TokenType::KeywordOuter) advance();
      break;
    default:
      join.kind = JoinClause::Kind::Inner;
      break;
  }
  if (!consume(TokenType::KeywordJoin, "Expected JOIN")) return false;
  if (!parse_table_source(join.source)) return false;
  if (!consume(TokenType::KeywordOn, "Expected ON after JOIN source")) return false;
  if (!parse_join_condition(join.on)) return false;
  join.span = Span{start, last_end_};
  return true;
}

/// Parses an ON condition with OR precedence.
/// OR is accepted here and rejected when the plan is built.
bool Parser::parse_join_condition(JoinCondition& out) {
  JoinCondition left;
  if (!parse_join_and(left)) return false;
  while (current_.type == TokenType::KeywordOr) {
    size_t start = current_.pos;
    advance();
    JoinCondition right;
    if (!parse_join_and(right)) return false;
    auto node = std::make_shared<JoinBinary>();
    node->op = JoinBinary::Op::Or;
    node->left = std::move(left);
    node->right = std::move(right);
    node->span = Span{start, last_end_};
    left = node;
  }
  out = std::move(left);
  return true;
}

bool Parser::parse_join_and(JoinCondition& out) {
  JoinCondition left;
  if (!parse_join_primary(left)) return false;
  while (current_.type == TokenType::KeywordAnd) {
    size_t start = current_.pos;
    advance();
    JoinCondition right;
    if (!parse_join_primary(right)) return false;
    auto node = std::make_shared<JoinBinary>();
    node->op = JoinBinary::Op::And;
    node->left = std::move(left);
    node->right = std::move(right);
    node->span = Span{start, last_end_};
    left = node;
  }
  out = std::move(left);
  return true;
}

/// Parses a parenthesized ON condition or a `column = column` leaf.
bool Parser::parse_join_primary(JoinCondition& out) {
  if (current_.type == TokenType::LParen) {
    advance();
    JoinCondition inner;
    if (!parse_join_condition(inner)) return false;
    if (!consume(TokenType::RParen, "Expected ) to close join condition")) return false;
    out = std::move(inner);
    return true;
  }
  JoinLeaf leaf;
  size_t start = current_.pos;
  if (!parse_column_ref(leaf.left)) return false;
  if (current_.type != TokenType::Equal) {
    return set_error("Join conditions only support column = column");
  }
  advance();
  if (!parse_column_ref(leaf.right)) return false;
  leaf.span = Span{start, last_end_};
  out = std::move(leaf);
  return true;
}

}  // namespace etlq
