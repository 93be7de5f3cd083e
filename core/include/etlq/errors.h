#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace etlq {

/// Discriminates every failure the compiler, planner, engine, and adapters raise.
/// MUST stay stable because the CLI prints these names and tests match on them.
enum class ErrorKind {
  SyntaxError,
  AggregationOnWildcardDisallowed,
  ColumnNotInGroupBy,
  MixedAggregationWithoutGroup,
  ColumnIndexOutOfRange,
  ColumnNotFound,
  InvalidJoinKind,
  MissingJoinColumn,
  InvalidLimit,
  NullInput,
  UnknownSourceType,
  DuplicateAlias,
  UnknownAlias,
  UnsupportedJoinCondition,
  UnsupportedStatement,
  InvalidOrderBy,
  InvalidAggregation,
  JoinFailed,
  ExtractFailed,
  LoadFailed,
  ConfigError
};

/// Returns the stable display name of an error kind (e.g. "ColumnNotInGroupBy").
const char* error_kind_name(ErrorKind kind);

/// Base exception for all statement failures.
/// MUST carry a kind so callers can branch without parsing messages.
/// Inputs are kind/message; side effects are none.
class QueryError : public std::runtime_error {
 public:
  QueryError(ErrorKind kind, const std::string& message);

  ErrorKind kind() const { return kind_; }

 private:
  ErrorKind kind_;
};

/// Parse-time failure anchored at the offending token.
/// MUST report 1-based line/column and the 0-based byte position in the query text.
class SyntaxError : public QueryError {
 public:
  SyntaxError(ErrorKind kind,
              const std::string& message,
              std::string token,
              size_t line,
              size_t column,
              size_t position);

  const std::string& token() const { return token_; }
  size_t line() const { return line_; }
  size_t column() const { return column_; }
  size_t position() const { return position_; }

 private:
  std::string token_;
  size_t line_ = 1;
  size_t column_ = 1;
  size_t position_ = 0;
};

/// Raised when a join key is absent from its input relation.
class MissingJoinColumnError : public QueryError {
 public:
  enum class Side { Left, Right };

  MissingJoinColumnError(Side side, std::string column, std::vector<std::string> available);

  Side side() const { return side_; }
  const std::string& column() const { return column_; }
  const std::vector<std::string>& available() const { return available_; }

 private:
  Side side_;
  std::string column_;
  std::vector<std::string> available_;
};

}  // namespace etlq
