#include "etlq/relation.h"

#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace etlq {

namespace {

int type_rank(const Value& value) {
  if (is_null(value)) return 0;
  if (std::holds_alternative<bool>(value)) return 1;
  if (is_number(value)) return 2;
  return 3;
}

std::string format_double(double value) {
  if (std::isnan(value)) return "NaN";
  if (std::isinf(value)) return value > 0 ? "inf" : "-inf";
  std::ostringstream oss;
  oss << std::setprecision(15) << value;
  std::string out = oss.str();
  if (out.find_first_of(".eE") == std::string::npos) {
    out += ".0";
  }
  return out;
}

/// Returns the integral value of a double when it fits int64 exactly.
std::optional<int64_t> integral_value(double value) {
  if (!std::isfinite(value)) return std::nullopt;
  if (value != std::trunc(value)) return std::nullopt;
  if (value < -9.2e18 || value > 9.2e18) return std::nullopt;
  return static_cast<int64_t>(value);
}

}  // namespace

double as_double(const Value& value) {
  if (const auto* i = std::get_if<int64_t>(&value)) return static_cast<double>(*i);
  if (const auto* d = std::get_if<double>(&value)) return *d;
  throw std::invalid_argument("as_double on a non-numeric value");
}

int compare_values(const Value& left, const Value& right) {
  int left_rank = type_rank(left);
  int right_rank = type_rank(right);
  if (left_rank != right_rank) return left_rank < right_rank ? -1 : 1;
  switch (left_rank) {
    case 0:
      return 0;
    case 1: {
      bool l = std::get<bool>(left);
      bool r = std::get<bool>(right);
      if (l == r) return 0;
      return l ? 1 : -1;
    }
    case 2: {
      if (std::holds_alternative<int64_t>(left) && std::holds_alternative<int64_t>(right)) {
        int64_t l = std::get<int64_t>(left);
        int64_t r = std::get<int64_t>(right);
        if (l < r) return -1;
        if (l > r) return 1;
        return 0;
      }
      double l = as_double(left);
      double r = as_double(right);
      if (l < r) return -1;
      if (l > r) return 1;
      return 0;
    }
    default: {
      int cmp = std::get<std::string>(left).compare(std::get<std::string>(right));
      if (cmp < 0) return -1;
      if (cmp > 0) return 1;
      return 0;
    }
  }
}

bool values_equal(const Value& left, const Value& right) {
  return compare_values(left, right) == 0;
}

std::string value_key(const Value& value) {
  switch (type_rank(value)) {
    case 0:
      return std::string("\x01N", 2);
    case 1:
      return std::get<bool>(value) ? "\x02T" : "\x02F";
    case 2: {
      if (const auto* i = std::get_if<int64_t>(&value)) {
        return "\x03" + std::to_string(*i);
      }
      double d = std::get<double>(value);
      if (auto integral = integral_value(d)) {
        return "\x03" + std::to_string(*integral);
      }
      std::ostringstream oss;
      oss << std::setprecision(17) << d;
      return "\x03" + oss.str();
    }
    default:
      return "\x04" + std::get<std::string>(value);
  }
}

std::string format_value(const Value& value) {
  if (is_null(value)) return "NULL";
  if (const auto* b = std::get_if<bool>(&value)) return *b ? "true" : "false";
  if (const auto* i = std::get_if<int64_t>(&value)) return std::to_string(*i);
  if (const auto* d = std::get_if<double>(&value)) return format_double(*d);
  return std::get<std::string>(value);
}

std::string format_cell(const Value& value) {
  if (is_null(value)) return "";
  return format_value(value);
}

Relation::Relation(std::vector<std::string> columns) : columns_(std::move(columns)) {
  std::unordered_set<std::string> seen;
  for (const auto& name : columns_) {
    if (!seen.insert(name).second) {
      throw std::invalid_argument("Duplicate column name in relation: " + name);
    }
  }
}

Relation::Relation(std::vector<std::string> columns, std::vector<Row> rows)
    : Relation(std::move(columns)) {
  rows_.reserve(rows.size());
  for (auto& row : rows) {
    add_row(std::move(row));
  }
}

std::optional<size_t> Relation::find_column(const std::string& name) const {
  for (size_t i = 0; i < columns_.size(); ++i) {
    if (columns_[i] == name) return i;
  }
  return std::nullopt;
}

void Relation::add_row(Row row) {
  if (row.size() != columns_.size()) {
    throw std::invalid_argument("Row has " + std::to_string(row.size()) + " cells but relation has " +
                                std::to_string(columns_.size()) + " columns");
  }
  rows_.push_back(std::move(row));
}

void Relation::set_origins(std::vector<ColumnOrigin> origins) {
  if (!origins.empty() && origins.size() != columns_.size()) {
    throw std::invalid_argument("Column origins must align with columns");
  }
  origins_ = std::move(origins);
}

void Relation::stamp_origins(const std::string& qualifier) {
  origins_.clear();
  origins_.reserve(columns_.size());
  for (const auto& name : columns_) {
    origins_.push_back(ColumnOrigin{qualifier, name});
  }
}

std::vector<ColumnOrigin> Relation::effective_origins() const {
  if (!origins_.empty()) return origins_;
  std::vector<ColumnOrigin> out;
  out.reserve(columns_.size());
  for (const auto& name : columns_) {
    out.push_back(ColumnOrigin{"", name});
  }
  return out;
}

Relation Relation::schema_only() const {
  Relation out(columns_);
  out.origins_ = origins_;
  return out;
}

bool operator==(const Relation& left, const Relation& right) {
  if (left.columns_ != right.columns_) return false;
  if (left.rows_.size() != right.rows_.size()) return false;
  for (size_t r = 0; r < left.rows_.size(); ++r) {
    const Row& a = left.rows_[r];
    const Row& b = right.rows_[r];
    for (size_t c = 0; c < a.size(); ++c) {
      if (a[c].index() != b[c].index() && !(is_number(a[c]) && is_number(b[c]))) return false;
      if (!values_equal(a[c], b[c])) return false;
    }
  }
  return true;
}

std::vector<std::string> make_unique_column_names(const std::vector<std::string>& names) {
  std::vector<std::string> out;
  out.reserve(names.size());
  std::unordered_set<std::string> used(names.begin(), names.end());
  std::unordered_map<std::string, size_t> repeats;
  std::unordered_set<std::string> emitted;
  for (const auto& name : names) {
    if (emitted.insert(name).second) {
      out.push_back(name);
      continue;
    }
    size_t& n = repeats[name];
    std::string candidate;
    do {
      ++n;
      candidate = name + "." + std::to_string(n);
    } while (used.count(candidate) > 0 || emitted.count(candidate) > 0);
    emitted.insert(candidate);
    out.push_back(candidate);
  }
  return out;
}

}  // namespace etlq
