#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "etlq/datasource.h"
#include "etlq/relation.h"

namespace etlq {

struct Span {
  size_t start = 0;
  size_t end = 0;
};

/// A column written as `name`, `[name]` or `#N`, optionally `alias.`-qualified.
/// Resolution against a schema happens at execution time.
struct ColumnRef {
  enum class Kind { Name, Bracketed, Index } kind = Kind::Name;
  std::string name;
  size_t index = 0;
  std::optional<std::string> qualifier;
  Span span;
};

struct Wildcard {
  Span span;
};

/// `fn(column)` or `fn(*)`; function is stored lowercased.
struct Aggregation {
  std::string function;
  // nullopt is the wildcard.
  std::optional<ColumnRef> column;
  Span span;
};

using SelectItem = std::variant<ColumnRef, Aggregation>;
using SelectColumns = std::variant<Wildcard, std::vector<SelectItem>>;

struct Literal {
  Value value;
  Span span;
};

using Operand = std::variant<ColumnRef, Literal>;

struct CompareExpr {
  enum class Op { Eq, NotEq, Lt, Le, Gt, Ge } op = Op::Eq;
  Operand lhs;
  Operand rhs;
  Span span;
};

struct LikeExpr {
  ColumnRef column;
  std::string pattern;
  Span span;
};

struct NotExpr;
struct BinaryExpr;
using Expr = std::variant<CompareExpr, LikeExpr, std::shared_ptr<NotExpr>, std::shared_ptr<BinaryExpr>>;

struct NotExpr {
  Expr operand;
  Span span;
};

struct BinaryExpr {
  enum class Op { And, Or } op = Op::And;
  Expr left;
  Expr right;
  Span span;
};

/// `left = right` inside a JOIN ... ON clause.
struct JoinLeaf {
  ColumnRef left;
  ColumnRef right;
  Span span;
};

struct JoinBinary;
using JoinCondition = std::variant<JoinLeaf, std::shared_ptr<JoinBinary>>;

struct JoinBinary {
  enum class Op { And, Or } op = Op::And;
  JoinCondition left;
  JoinCondition right;
  Span span;
};

struct TableSource {
  Datasource datasource;
  std::optional<std::string> alias;
  Span span;
};

struct JoinClause {
  enum class Kind { Inner, Left, Right, Outer } kind = Kind::Inner;
  TableSource source;
  JoinCondition on;
  Span span;
};

struct OrderByParameter {
  enum class Direction { Asc, Desc } direction = Direction::Asc;
  std::variant<ColumnRef, Aggregation> parameter;
  Span span;
};

struct LimitClause {
  enum class Kind { Limit, Tail } kind = Kind::Limit;
  int64_t count = 0;
  Span span;
};

struct SelectStatement {
  bool distinct = false;
  SelectColumns columns;
  std::optional<Datasource> into;
  TableSource source;
  std::vector<JoinClause> joins;
  std::optional<Expr> where;
  std::optional<std::vector<ColumnRef>> group_by;
  std::optional<std::vector<OrderByParameter>> order_by;
  std::optional<LimitClause> limit;
  Span span;
};

struct InsertStatement {
  Datasource target;
  std::vector<std::string> columns;
  std::vector<std::vector<Literal>> rows;
  Span span;
};

struct Assignment {
  ColumnRef column;
  Literal value;
};

struct UpdateStatement {
  Datasource target;
  std::vector<Assignment> assignments;
  std::optional<Expr> where;
  Span span;
};

struct DeleteStatement {
  Datasource target;
  std::optional<Expr> where;
  Span span;
};

using Statement = std::variant<SelectStatement, InsertStatement, UpdateStatement, DeleteStatement>;

/// Returns the display text of a column reference (`a.[b c]`, `#2`, `name`).
std::string format_column_ref(const ColumnRef& ref);
/// Returns the output column name of an aggregation: `fn(column)` or `fn(*)`.
std::string aggregation_name(const Aggregation& agg);
std::string join_kind_name(JoinClause::Kind kind);
/// Renders a WHERE condition fully parenthesized, e.g. `((a = 1) AND (b LIKE 'x%'))`.
std::string format_expr(const Expr& expr);

/// Renders a statement into a canonical single-line form.
/// MUST produce identical text for structurally equal statements.
/// Inputs are AST values; outputs are strings with no side effects.
std::string dump_statement(const Statement& statement);

}  // namespace etlq
