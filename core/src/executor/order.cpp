#include "executor_internal.h"

#include <algorithm>

namespace etlq::executor_internal {

/// Sorts rows by the given keys in priority order.
/// MUST place NULLs after every non-null value regardless of direction.
/// Inputs are rows/keys; outputs are rows reordered in place.
void sort_rows(std::vector<Row>& rows, const std::vector<SortKey>& keys) {
  if (keys.empty()) return;
  std::stable_sort(rows.begin(), rows.end(), [&](const Row& left, const Row& right) {
    for (const auto& key : keys) {
      const Value& a = left[key.column];
      const Value& b = right[key.column];
      bool a_null = is_null(a);
      bool b_null = is_null(b);
      if (a_null || b_null) {
        if (a_null && b_null) continue;
        // WHY: keep NULLs last to match user expectations in ORDER BY.
        return b_null;
      }
      int cmp = compare_values(a, b);
      if (cmp == 0) continue;
      if (key.descending) {
        return cmp > 0;
      }
      return cmp < 0;
    }
    return false;
  });
}

std::string tuple_key(const Row& row, const std::vector<size_t>& columns) {
  std::string key;
  for (size_t column : columns) {
    // Length-prefixed so string cells cannot fake a column boundary.
    std::string cell = value_key(row[column]);
    key += std::to_string(cell.size());
    key.push_back(':');
    key += cell;
  }
  return key;
}

}  // namespace etlq::executor_internal
