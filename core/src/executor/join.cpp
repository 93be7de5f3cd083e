#include "../executor.h"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

#include "etlq/errors.h"
#include "executor_internal.h"

namespace etlq {

namespace {

const char* const kJoinKinds[] = {"inner", "left", "right", "outer"};

bool is_valid_kind(const std::string& kind) {
  for (const char* valid : kJoinKinds) {
    if (kind == valid) return true;
  }
  return false;
}

/// Output column layout for a merge.
/// MUST coalesce equally named key pairs and suffix other shared names.
struct JoinLayout {
  std::vector<std::string> names;
  std::vector<ColumnOrigin> origins;
  // For each left column, the right column coalesced into it, if any.
  std::vector<std::optional<size_t>> coalesced_right;
  // Right columns that get their own output column.
  std::vector<size_t> right_columns;
};

JoinLayout make_layout(const Relation& left,
                       const Relation& right,
                       const std::vector<std::pair<std::string, std::string>>& keys) {
  JoinLayout layout;
  std::unordered_map<size_t, size_t> coalesce;  // left column -> right column
  std::unordered_set<size_t> coalesced_right;
  for (const auto& key : keys) {
    if (key.first != key.second) continue;
    auto l = left.find_column(key.first);
    auto r = right.find_column(key.second);
    if (l.has_value() && r.has_value()) {
      coalesce[*l] = *r;
      coalesced_right.insert(*r);
    }
  }

  std::unordered_set<std::string> left_names(left.columns().begin(), left.columns().end());
  std::unordered_set<std::string> right_names;
  for (size_t r = 0; r < right.column_count(); ++r) {
    if (coalesced_right.count(r) == 0) right_names.insert(right.columns()[r]);
  }

  std::vector<ColumnOrigin> left_origins = left.effective_origins();
  std::vector<ColumnOrigin> right_origins = right.effective_origins();
  for (size_t l = 0; l < left.column_count(); ++l) {
    const std::string& name = left.columns()[l];
    ColumnOrigin origin = left_origins[l];
    auto it = coalesce.find(l);
    if (it != coalesce.end()) {
      const ColumnOrigin& other = right_origins[it->second];
      if (!other.qualifier.empty()) origin.merged.push_back(other.qualifier);
      origin.merged.insert(origin.merged.end(), other.merged.begin(), other.merged.end());
      layout.names.push_back(name);
      layout.coalesced_right.push_back(it->second);
    } else {
      layout.names.push_back(right_names.count(name) > 0 ? name + "_left" : name);
      layout.coalesced_right.push_back(std::nullopt);
    }
    layout.origins.push_back(std::move(origin));
  }
  for (size_t r = 0; r < right.column_count(); ++r) {
    if (coalesced_right.count(r) > 0) continue;
    const std::string& name = right.columns()[r];
    layout.names.push_back(left_names.count(name) > 0 ? name + "_right" : name);
    layout.origins.push_back(right_origins[r]);
    layout.right_columns.push_back(r);
  }
  layout.names = make_unique_column_names(layout.names);
  return layout;
}

Relation empty_with_layout(const JoinLayout& layout) {
  Relation out(layout.names);
  out.set_origins(layout.origins);
  return out;
}

/// Key tuple for hashing; nullopt when any key cell is NULL (NULL never matches).
std::optional<std::string> key_of(const Row& row, const std::vector<size_t>& columns) {
  for (size_t column : columns) {
    if (is_null(row[column])) return std::nullopt;
  }
  return executor_internal::tuple_key(row, columns);
}

using RowIndex = std::unordered_map<std::string, std::vector<size_t>>;

RowIndex index_rows(const Relation& relation, const std::vector<size_t>& columns) {
  RowIndex index;
  for (size_t r = 0; r < relation.row_count(); ++r) {
    if (auto key = key_of(relation.rows()[r], columns)) {
      index[*key].push_back(r);
    }
  }
  return index;
}

Row combine(const JoinLayout& layout, const Row* left_row, const Row* right_row, size_t left_width) {
  Row out;
  out.reserve(layout.names.size());
  for (size_t l = 0; l < left_width; ++l) {
    if (left_row != nullptr) {
      out.push_back((*left_row)[l]);
    } else if (layout.coalesced_right[l].has_value() && right_row != nullptr) {
      out.push_back((*right_row)[*layout.coalesced_right[l]]);
    } else {
      out.push_back(std::monostate{});
    }
  }
  for (size_t r : layout.right_columns) {
    out.push_back(right_row != nullptr ? (*right_row)[r] : Value{});
  }
  return out;
}

/// Merges rows on key equality for the requested kind.
/// MUST keep left order for inner/left, right order for right, and append
/// unmatched right rows after the left pass for outer.
Relation merge(const Relation& left,
               const Relation& right,
               const std::vector<size_t>& left_keys,
               const std::vector<size_t>& right_keys,
               const std::string& kind,
               const JoinLayout& layout) {
  Relation out = empty_with_layout(layout);
  size_t left_width = left.column_count();

  if (kind == "right") {
    RowIndex left_index = index_rows(left, left_keys);
    for (const auto& right_row : right.rows()) {
      auto key = key_of(right_row, right_keys);
      auto it = key.has_value() ? left_index.find(*key) : left_index.end();
      if (it == left_index.end()) {
        out.add_row(combine(layout, nullptr, &right_row, left_width));
        continue;
      }
      for (size_t l : it->second) {
        out.add_row(combine(layout, &left.rows()[l], &right_row, left_width));
      }
    }
    return out;
  }

  RowIndex right_index = index_rows(right, right_keys);
  std::vector<bool> right_matched(right.row_count(), false);
  for (const auto& left_row : left.rows()) {
    auto key = key_of(left_row, left_keys);
    auto it = key.has_value() ? right_index.find(*key) : right_index.end();
    if (it == right_index.end()) {
      if (kind != "inner") out.add_row(combine(layout, &left_row, nullptr, left_width));
      continue;
    }
    for (size_t r : it->second) {
      right_matched[r] = true;
      out.add_row(combine(layout, &left_row, &right.rows()[r], left_width));
    }
  }
  if (kind == "outer") {
    for (size_t r = 0; r < right.row_count(); ++r) {
      if (!right_matched[r]) out.add_row(combine(layout, nullptr, &right.rows()[r], left_width));
    }
  }
  return out;
}

std::string describe_keys(const std::vector<std::pair<std::string, std::string>>& keys) {
  std::string left_cols;
  std::string right_cols;
  for (size_t i = 0; i < keys.size(); ++i) {
    if (i > 0) {
      left_cols += ",";
      right_cols += ",";
    }
    left_cols += keys[i].first;
    right_cols += keys[i].second;
  }
  return "left_col=" + left_cols + ", right_col=" + right_cols;
}

}  // namespace

Relation join(const Relation& left,
              const Relation& right,
              const std::vector<std::pair<std::string, std::string>>& keys,
              const std::string& kind) {
  if (!is_valid_kind(kind)) {
    throw QueryError(ErrorKind::InvalidJoinKind,
                     "Invalid join type '" + kind + "'. Must be one of ['inner', 'left', 'right', 'outer']");
  }
  if (keys.empty()) {
    throw QueryError(ErrorKind::JoinFailed, "Join requires at least one key pair");
  }

  if (left.empty() || right.empty()) {
    JoinLayout layout = make_layout(left, right, keys);
    if (left.empty() && right.empty()) return empty_with_layout(layout);
    if (left.empty()) {
      if (kind == "inner" || kind == "left") return empty_with_layout(layout);
      return right;
    }
    if (kind == "inner" || kind == "right") return empty_with_layout(layout);
    return left;
  }

  std::vector<size_t> left_keys;
  std::vector<size_t> right_keys;
  for (const auto& key : keys) {
    auto l = left.find_column(key.first);
    if (!l.has_value()) {
      throw MissingJoinColumnError(MissingJoinColumnError::Side::Left, key.first, left.columns());
    }
    auto r = right.find_column(key.second);
    if (!r.has_value()) {
      throw MissingJoinColumnError(MissingJoinColumnError::Side::Right, key.second, right.columns());
    }
    left_keys.push_back(*l);
    right_keys.push_back(*r);
  }

  try {
    JoinLayout layout = make_layout(left, right, keys);
    return merge(left, right, left_keys, right_keys, kind, layout);
  } catch (const QueryError&) {
    throw;
  } catch (const std::exception& e) {
    throw QueryError(ErrorKind::JoinFailed,
                     "Error during join: " + std::string(e.what()) + " (" + describe_keys(keys) + ", how=" + kind + ")");
  }
}

Relation join(const Relation& left,
              const Relation& right,
              const std::string& left_col,
              const std::string& right_col,
              const std::string& kind) {
  return join(left, right, std::vector<std::pair<std::string, std::string>>{{left_col, right_col}}, kind);
}

}  // namespace etlq
