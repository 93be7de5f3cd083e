#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace etlq {

/// Dynamically typed cell value. std::monostate is SQL NULL.
using Value = std::variant<std::monostate, bool, int64_t, double, std::string>;
using Row = std::vector<Value>;

inline bool is_null(const Value& value) { return std::holds_alternative<std::monostate>(value); }
inline bool is_number(const Value& value) {
  return std::holds_alternative<int64_t>(value) || std::holds_alternative<double>(value);
}

/// Converts integer or float cells to double.
/// MUST only be called on numeric values.
double as_double(const Value& value);

/// Total order used by ORDER BY, MIN/MAX and sorting helpers.
/// MUST rank values null < bool < number < string and compare numbers numerically.
/// Inputs are two values; outputs are -1/0/1 with no side effects.
int compare_values(const Value& left, const Value& right);

/// Equality used by DISTINCT, GROUP BY and join keys (1 == 1.0, NULL == NULL).
bool values_equal(const Value& left, const Value& right);

/// Produces a canonical hashing key that agrees with values_equal.
std::string value_key(const Value& value);

/// Renders a value for humans: NULL for null, true/false for booleans,
/// floats always with a fractional part ("30.0").
std::string format_value(const Value& value);

/// Renders a value for delimited output where null is the empty string.
std::string format_cell(const Value& value);

/// Records which aliased source a column came from so qualified
/// references keep resolving after joins rename columns.
struct ColumnOrigin {
  std::string qualifier;
  std::string name;
  // Qualifiers of equally named join keys coalesced into this column.
  std::vector<std::string> merged;
};

/// An ordered set of uniquely named columns plus rows aligned to them.
/// MUST keep every row at exactly column_count() cells and names unique.
/// Mutation is limited to appending rows; pipeline stages build new relations.
class Relation {
 public:
  Relation() = default;
  explicit Relation(std::vector<std::string> columns);
  Relation(std::vector<std::string> columns, std::vector<Row> rows);

  const std::vector<std::string>& columns() const { return columns_; }
  const std::vector<Row>& rows() const { return rows_; }
  const std::vector<ColumnOrigin>& origins() const { return origins_; }

  size_t column_count() const { return columns_.size(); }
  size_t row_count() const { return rows_.size(); }
  /// True when the relation has no rows (a schema may still be present).
  bool empty() const { return rows_.empty(); }

  std::optional<size_t> find_column(const std::string& name) const;

  /// Appends a row, throwing std::invalid_argument on an arity mismatch.
  void add_row(Row row);
  void reserve(size_t rows) { rows_.reserve(rows); }

  /// Replaces column origins; MUST be empty or aligned with columns().
  void set_origins(std::vector<ColumnOrigin> origins);
  /// Stamps every column with the given qualifier using its current name.
  void stamp_origins(const std::string& qualifier);
  /// Returns origins() or, when absent, unqualified origins derived from names.
  std::vector<ColumnOrigin> effective_origins() const;

  /// Copy with the same columns/origins and no rows.
  Relation schema_only() const;

  friend bool operator==(const Relation& left, const Relation& right);
  friend bool operator!=(const Relation& left, const Relation& right) { return !(left == right); }

 private:
  std::vector<std::string> columns_;
  std::vector<Row> rows_;
  std::vector<ColumnOrigin> origins_;
};

/// Makes column names unique by suffixing repeats with ".1", ".2", ...
std::vector<std::string> make_unique_column_names(const std::vector<std::string>& names);

}  // namespace etlq
