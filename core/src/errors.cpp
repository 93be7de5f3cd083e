#include "etlq/errors.h"

#include <sstream>
#include <utility>

namespace etlq {

namespace {

std::string missing_join_column_message(MissingJoinColumnError::Side side,
                                        const std::string& column,
                                        const std::vector<std::string>& available) {
  std::ostringstream oss;
  oss << "Column '" << column << "' not found in "
      << (side == MissingJoinColumnError::Side::Left ? "left" : "right")
      << " relation. Available: [";
  for (size_t i = 0; i < available.size(); ++i) {
    if (i > 0) oss << ", ";
    oss << "'" << available[i] << "'";
  }
  oss << "]";
  return oss.str();
}

}  // namespace

const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::SyntaxError: return "SyntaxError";
    case ErrorKind::AggregationOnWildcardDisallowed: return "AggregationOnWildcardDisallowed";
    case ErrorKind::ColumnNotInGroupBy: return "ColumnNotInGroupBy";
    case ErrorKind::MixedAggregationWithoutGroup: return "MixedAggregationWithoutGroup";
    case ErrorKind::ColumnIndexOutOfRange: return "ColumnIndexOutOfRange";
    case ErrorKind::ColumnNotFound: return "ColumnNotFound";
    case ErrorKind::InvalidJoinKind: return "InvalidJoinKind";
    case ErrorKind::MissingJoinColumn: return "MissingJoinColumn";
    case ErrorKind::InvalidLimit: return "InvalidLimit";
    case ErrorKind::NullInput: return "NullInput";
    case ErrorKind::UnknownSourceType: return "UnknownSourceType";
    case ErrorKind::DuplicateAlias: return "DuplicateAlias";
    case ErrorKind::UnknownAlias: return "UnknownAlias";
    case ErrorKind::UnsupportedJoinCondition: return "UnsupportedJoinCondition";
    case ErrorKind::UnsupportedStatement: return "UnsupportedStatement";
    case ErrorKind::InvalidOrderBy: return "InvalidOrderBy";
    case ErrorKind::InvalidAggregation: return "InvalidAggregation";
    case ErrorKind::JoinFailed: return "JoinFailed";
    case ErrorKind::ExtractFailed: return "ExtractFailed";
    case ErrorKind::LoadFailed: return "LoadFailed";
    case ErrorKind::ConfigError: return "ConfigError";
  }
  return "Unknown";
}

QueryError::QueryError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

SyntaxError::SyntaxError(ErrorKind kind,
                         const std::string& message,
                         std::string token,
                         size_t line,
                         size_t column,
                         size_t position)
    : QueryError(kind, message),
      token_(std::move(token)),
      line_(line),
      column_(column),
      position_(position) {}

MissingJoinColumnError::MissingJoinColumnError(Side side,
                                               std::string column,
                                               std::vector<std::string> available)
    : QueryError(ErrorKind::MissingJoinColumn,
                 missing_join_column_message(side, column, available)),
      side_(side),
      column_(std::move(column)),
      available_(std::move(available)) {}

}  // namespace etlq
