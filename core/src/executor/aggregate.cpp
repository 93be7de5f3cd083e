#include "executor_internal.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_set>

#include "etlq/errors.h"

namespace etlq::executor_internal {

namespace {

/// Collects numeric inputs, skipping NULLs.
/// MUST reject strings and booleans so sums never coerce silently.
std::vector<Value> numeric_inputs(const std::vector<Value>& values, const std::string& label) {
  std::vector<Value> out;
  out.reserve(values.size());
  for (const auto& value : values) {
    if (is_null(value)) continue;
    if (!is_number(value)) {
      throw QueryError(ErrorKind::InvalidAggregation,
                       "Aggregation " + label + " requires numeric values, found '" + format_value(value) + "'");
    }
    out.push_back(value);
  }
  return out;
}

bool all_integers(const std::vector<Value>& values) {
  for (const auto& value : values) {
    if (!std::holds_alternative<int64_t>(value)) return false;
  }
  return true;
}

/// Adds into out unless the result leaves the int64_t range.
bool checked_add(int64_t a, int64_t b, int64_t& out) {
  using limits = std::numeric_limits<int64_t>;
  if ((b > 0 && a > limits::max() - b) || (b < 0 && a < limits::min() - b)) return false;
  out = a + b;
  return true;
}

/// Multiplies into out unless the result leaves the int64_t range.
bool checked_multiply(int64_t a, int64_t b, int64_t& out) {
  using limits = std::numeric_limits<int64_t>;
  if (a == 0 || b == 0) {
    out = 0;
    return true;
  }
  if ((a == -1 && b == limits::min()) || (b == -1 && a == limits::min())) return false;
  if (a > 0 ? (b > 0 ? a > limits::max() / b : b < limits::min() / a)
            : (b > 0 ? a < limits::min() / b : a < limits::max() / b)) {
    return false;
  }
  out = a * b;
  return true;
}

Value sum_of(const std::vector<Value>& values) {
  if (all_integers(values)) {
    int64_t total = 0;
    bool overflow = false;
    for (const auto& value : values) {
      if (!checked_add(total, std::get<int64_t>(value), total)) {
        overflow = true;
        break;
      }
    }
    if (!overflow) return total;
  }
  double total = 0.0;
  for (const auto& value : values) total += as_double(value);
  return total;
}

Value product_of(const std::vector<Value>& values) {
  if (all_integers(values)) {
    int64_t total = 1;
    bool overflow = false;
    for (const auto& value : values) {
      if (!checked_multiply(total, std::get<int64_t>(value), total)) {
        overflow = true;
        break;
      }
    }
    if (!overflow) return total;
  }
  double total = 1.0;
  for (const auto& value : values) total *= as_double(value);
  return total;
}

Value mean_of(const std::vector<Value>& values) {
  if (values.empty()) return std::monostate{};
  double total = 0.0;
  for (const auto& value : values) total += as_double(value);
  return total / static_cast<double>(values.size());
}

Value median_of(const std::vector<Value>& values) {
  if (values.empty()) return std::monostate{};
  std::vector<double> sorted;
  sorted.reserve(values.size());
  for (const auto& value : values) sorted.push_back(as_double(value));
  std::sort(sorted.begin(), sorted.end());
  size_t mid = sorted.size() / 2;
  if (sorted.size() % 2 == 1) return sorted[mid];
  return (sorted[mid - 1] + sorted[mid]) / 2.0;
}

Value variance_of(const std::vector<Value>& values) {
  if (values.size() < 2) return std::monostate{};
  double mean = std::get<double>(mean_of(values));
  double squares = 0.0;
  for (const auto& value : values) {
    double delta = as_double(value) - mean;
    squares += delta * delta;
  }
  return squares / static_cast<double>(values.size() - 1);
}

Value extreme_of(const std::vector<Value>& values, bool want_max) {
  const Value* best = nullptr;
  for (const auto& value : values) {
    if (is_null(value)) continue;
    if (best == nullptr) {
      best = &value;
      continue;
    }
    int cmp = compare_values(value, *best);
    if (want_max ? cmp > 0 : cmp < 0) best = &value;
  }
  if (best == nullptr) return std::monostate{};
  return *best;
}

}  // namespace

/// Computes an aggregation over values gathered from one group.
/// MUST follow the NULL-skipping rules of each function.
/// Inputs are function name/values/label; outputs are one value or InvalidAggregation.
Value aggregate_values(const std::string& function, const std::vector<Value>& values, const std::string& label) {
  if (function == "size") {
    return static_cast<int64_t>(values.size());
  }
  if (function == "count") {
    int64_t count = 0;
    for (const auto& value : values) {
      if (!is_null(value)) ++count;
    }
    return count;
  }
  if (function == "nunique") {
    std::unordered_set<std::string> seen;
    for (const auto& value : values) {
      if (!is_null(value)) seen.insert(value_key(value));
    }
    return static_cast<int64_t>(seen.size());
  }
  if (function == "first") {
    for (const auto& value : values) {
      if (!is_null(value)) return value;
    }
    return std::monostate{};
  }
  if (function == "last") {
    for (auto it = values.rbegin(); it != values.rend(); ++it) {
      if (!is_null(*it)) return *it;
    }
    return std::monostate{};
  }
  if (function == "min") return extreme_of(values, false);
  if (function == "max") return extreme_of(values, true);

  std::vector<Value> numbers = numeric_inputs(values, label);
  if (function == "sum") return sum_of(numbers);
  if (function == "prod") return product_of(numbers);
  if (function == "mean" || function == "avg") return mean_of(numbers);
  if (function == "median") return median_of(numbers);
  if (function == "var") return variance_of(numbers);
  if (function == "std") {
    Value variance = variance_of(numbers);
    if (is_null(variance)) return variance;
    return std::sqrt(std::get<double>(variance));
  }
  throw QueryError(ErrorKind::InvalidAggregation, "Unknown aggregation function '" + function + "'");
}

}  // namespace etlq::executor_internal
