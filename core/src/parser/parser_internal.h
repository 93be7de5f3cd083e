#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../query_parser.h"
#include "lexer.h"

namespace etlq {

class Parser {
 public:
  explicit Parser(const std::string& input);
  ParseResult parse();

 private:
  bool parse_statement_body(Statement& out);
  bool parse_select(SelectStatement& stmt);
  bool parse_insert(InsertStatement& stmt);
  bool parse_update(UpdateStatement& stmt);
  bool parse_delete(DeleteStatement& stmt);

  bool parse_select_columns(SelectColumns& columns);
  bool parse_select_item(SelectItem& item);
  bool parse_aggregation(Aggregation& agg);
  bool parse_column_ref(ColumnRef& ref);
  bool parse_column_list(std::vector<ColumnRef>& refs);
  bool parse_order_by(std::vector<OrderByParameter>& params);
  bool parse_limit(LimitClause& limit);

  bool parse_datasource(Datasource& source);
  bool parse_table_source(TableSource& source);
  bool parse_join_clause(JoinClause& join);
  bool parse_join_condition(JoinCondition& out);
  bool parse_join_and(JoinCondition& out);
  bool parse_join_primary(JoinCondition& out);

  bool parse_expr(Expr& out);
  bool parse_and_expr(Expr& out);
  bool parse_not_expr(Expr& out);
  bool parse_cmp_expr(Expr& out);
  bool parse_operand(Operand& operand);
  bool parse_literal(Literal& literal);

  bool consume(TokenType type, const std::string& message);
  bool set_error(const std::string& message);
  bool set_error(ErrorKind kind, const std::string& message);
  ParseResult error_result();

  void advance();
  Token peek();

  bool at_column_start() const;
  static bool is_aggregation_function(const std::string& name);

  Lexer lexer_;
  Token current_{};
  Token peek_{};
  bool has_peek_ = false;
  // End offset of the most recently consumed token, for spans.
  size_t last_end_ = 0;
  std::optional<ParseError> error_;
};

}  // namespace etlq
