#include "parser_internal.h"

#include "../util/string_util.h"

namespace etlq {

Parser::Parser(const std::string& input) : lexer_(input) {
  advance();
}

/// Parses one statement and enforces the terminating semicolon.
/// MUST reject trailing tokens after `;`.
/// Inputs are token streams; outputs are ParseResult.
ParseResult Parser::parse() {
  Statement stmt;
  if (!parse_statement_body(stmt)) return error_result();
  if (!consume(TokenType::Semicolon, "Expected ; to end statement")) return error_result();
  if (current_.type != TokenType::End) {
    set_error("Unexpected token after ;");
    return error_result();
  }
  ParseResult res;
  res.statement = std::move(stmt);
  return res;
}

bool Parser::parse_statement_body(Statement& out) {
  switch (current_.type) {
    case TokenType::KeywordSelect: {
      SelectStatement stmt;
      if (!parse_select(stmt)) return false;
      out = std::move(stmt);
      return true;
    }
    case TokenType::KeywordInsert: {
      InsertStatement stmt;
      if (!parse_insert(stmt)) return false;
      out = std::move(stmt);
      return true;
    }
    case TokenType::KeywordUpdate: {
      UpdateStatement stmt;
      if (!parse_update(stmt)) return false;
      out = std::move(stmt);
      return true;
    }
    case TokenType::KeywordDelete: {
      DeleteStatement stmt;
      if (!parse_delete(stmt)) return false;
      out = std::move(stmt);
      return true;
    }
    default:
      return set_error("Expected SELECT, INSERT, UPDATE, or DELETE");
  }
}

/// Parses the SELECT clauses in their fixed order.
/// MUST parse DISTINCT/INTO/FROM/JOIN/WHERE/GROUP/ORDER/LIMIT consistently.
/// Inputs are token streams; outputs are SelectStatement or errors.
bool Parser::parse_select(SelectStatement& stmt) {
  size_t start = current_.pos;
  if (!consume(TokenType::KeywordSelect, "Expected SELECT")) return false;
  if (current_.type == TokenType::KeywordDistinct) {
    stmt.distinct = true;
    advance();
  }
  if (!parse_select_columns(stmt.columns)) return false;

  if (current_.type == TokenType::KeywordInto) {
    advance();
    Datasource into;
    if (!parse_datasource(into)) return false;
    stmt.into = std::move(into);
  }

  if (!consume(TokenType::KeywordFrom, "Expected FROM")) return false;
  if (!parse_table_source(stmt.source)) return false;

  while (current_.type == TokenType::KeywordJoin || current_.type == TokenType::KeywordInner ||
         current_.type == TokenType::KeywordLeft || current_.type == TokenType::KeywordRight ||
         current_.type == TokenType::KeywordFull) {
    JoinClause join;
    if (!parse_join_clause(join)) return false;
    stmt.joins.push_back(std::move(join));
  }

  if (current_.type == TokenType::KeywordWhere) {
    advance();
    Expr expr;
    if (!parse_expr(expr)) return false;
    stmt.where = std::move(expr);
  }

  if (current_.type == TokenType::KeywordGroup) {
    advance();
    if (!consume(TokenType::KeywordBy, "Expected BY after GROUP")) return false;
    std::vector<ColumnRef> keys;
    if (!parse_column_list(keys)) return false;
    stmt.group_by = std::move(keys);
  }

  if (current_.type == TokenType::KeywordOrder) {
    advance();
    if (!consume(TokenType::KeywordBy, "Expected BY after ORDER")) return false;
    std::vector<OrderByParameter> params;
    if (!parse_order_by(params)) return false;
    stmt.order_by = std::move(params);
  }

  if (current_.type == TokenType::KeywordLimit || current_.type == TokenType::KeywordTail) {
    LimitClause limit;
    if (!parse_limit(limit)) return false;
    stmt.limit = limit;
  }
  stmt.span = Span{start, last_end_};
  return true;
}

bool Parser::parse_column_list(std::vector<ColumnRef>& refs) {
  while (true) {
    ColumnRef ref;
    if (!parse_column_ref(ref)) return false;
    refs.push_back(std::move(ref));
    if (current_.type != TokenType::Comma) break;
    advance();
  }
  return true;
}

/// Parses ORDER BY parameters; aggregations are allowed here and validated later.
/// MUST keep list order as priority order.
bool Parser::parse_order_by(std::vector<OrderByParameter>& params) {
  while (true) {
    OrderByParameter param;
    size_t start = current_.pos;
    if (current_.type == TokenType::Identifier && peek().type == TokenType::LParen) {
      Aggregation agg;
      if (!parse_aggregation(agg)) return false;
      param.parameter = std::move(agg);
    } else {
      ColumnRef ref;
      if (!parse_column_ref(ref)) return false;
      param.parameter = std::move(ref);
    }
    if (current_.type == TokenType::KeywordAsc) {
      advance();
    } else if (current_.type == TokenType::KeywordDesc) {
      param.direction = OrderByParameter::Direction::Desc;
      advance();
    }
    param.span = Span{start, last_end_};
    params.push_back(std::move(param));
    if (current_.type != TokenType::Comma) break;
    advance();
  }
  return true;
}

/// Parses `LIMIT n` or `TAIL n`.
/// MUST require an integer literal; negative counts are rejected at execution.
bool Parser::parse_limit(LimitClause& limit) {
  size_t start = current_.pos;
  limit.kind = current_.type == TokenType::KeywordTail ? LimitClause::Kind::Tail : LimitClause::Kind::Limit;
  std::string keyword = limit.kind == LimitClause::Kind::Tail ? "TAIL" : "LIMIT";
  advance();
  if (current_.type != TokenType::Number) {
    return set_error("Expected integer after " + keyword);
  }
  auto value = util::parse_int64(current_.text);
  if (!value.has_value()) {
    return set_error("Expected integer after " + keyword);
  }
  limit.count = *value;
  advance();
  limit.span = Span{start, last_end_};
  return true;
}

ParseResult parse_query(const std::string& input) {
  Parser parser(input);
  return parser.parse();
}

Statement parse_statement(const std::string& input) {
  ParseResult result = parse_query(input);
  if (!result.statement.has_value()) {
    const ParseError& err = *result.error;
    throw SyntaxError(err.kind, err.message, err.token, err.line, err.column, err.position);
  }
  return std::move(*result.statement);
}

}  // namespace etlq
