#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../executor.h"

namespace etlq::executor_internal {

/// Selects how a bare column name is matched against a schema.
/// Lenient also tries footnote-stripped display names and join origins;
/// Exact matches the column name verbatim.
enum class ResolveMode { Lenient, Exact };

/// Finds the column a reference denotes without throwing.
/// MUST range-check indexes and resolve qualifiers through column origins.
/// Inputs are relation/ref/mode; outputs are a column index or nullopt.
std::optional<size_t> find_column(const Relation& relation, const ColumnRef& ref, ResolveMode mode);
/// Resolves a column reference or throws ColumnIndexOutOfRange / ColumnNotFound.
size_t resolve_column(const Relation& relation, const ColumnRef& ref, ResolveMode mode);

/// Keeps the rows of relation that satisfy expr, in order.
/// MUST treat comparisons involving NULL as false.
Relation apply_filter(const Relation& relation, const Expr& expr);

/// Compares two cells for WHERE predicates.
/// MUST return nullopt when either side is NULL or the values are incomparable.
/// Inputs are values; outputs are -1/0/1 or nullopt with no side effects.
std::optional<int> compare_for_filter(const Value& left, const Value& right);

struct SortKey {
  size_t column = 0;
  bool descending = false;
};

/// Stable multi-key sort with NULLs last in both directions.
/// MUST keep the relative order of rows that compare equal on every key.
void sort_rows(std::vector<Row>& rows, const std::vector<SortKey>& keys);

/// Computes one aggregation over a column's values (or all rows for size(*)).
/// MUST skip NULLs except for size and MUST raise InvalidAggregation on non-numeric input.
/// Inputs are function name/values/label; outputs are a single value.
Value aggregate_values(const std::string& function, const std::vector<Value>& values, const std::string& label);

/// Builds a hashing key for a whole tuple so equal tuples collide.
std::string tuple_key(const Row& row, const std::vector<size_t>& columns);

}  // namespace etlq::executor_internal
