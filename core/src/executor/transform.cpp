#include "../executor.h"

#include <algorithm>
#include <unordered_map>

#include "etlq/errors.h"
#include "executor_internal.h"

namespace etlq {

namespace {

using executor_internal::ResolveMode;
using executor_internal::SortKey;

/// Builds a relation with the schema and origins of `shape` and the given rows.
Relation with_rows(const Relation& shape, std::vector<Row> rows) {
  Relation out(shape.columns(), std::move(rows));
  out.set_origins(shape.origins());
  return out;
}

bool contains(const std::vector<size_t>& values, size_t value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

bool select_is_all_aggregations(const SelectColumns& columns) {
  const auto* items = std::get_if<std::vector<SelectItem>>(&columns);
  if (items == nullptr || items->empty()) return false;
  for (const auto& item : *items) {
    if (!std::holds_alternative<Aggregation>(item)) return false;
  }
  return true;
}

bool select_has_aggregation(const SelectColumns& columns) {
  const auto* items = std::get_if<std::vector<SelectItem>>(&columns);
  if (items == nullptr) return false;
  for (const auto& item : *items) {
    if (std::holds_alternative<Aggregation>(item)) return true;
  }
  return false;
}

std::optional<size_t> aggregation_column(const Relation& relation, const Aggregation& agg) {
  if (!agg.column.has_value()) return std::nullopt;
  return executor_internal::resolve_column(relation, *agg.column, ResolveMode::Lenient);
}

/// Gathers the inputs of one aggregation over a subset of rows.
/// size(*) has no column and counts rows, so it gathers NULL placeholders.
std::vector<Value> gather(const Relation& relation,
                          const std::vector<size_t>& row_indices,
                          std::optional<size_t> column) {
  std::vector<Value> values;
  values.reserve(row_indices.size());
  for (size_t r : row_indices) {
    if (column.has_value()) {
      values.push_back(relation.rows()[r][*column]);
    } else {
      values.push_back(std::monostate{});
    }
  }
  return values;
}

std::vector<size_t> all_row_indices(const Relation& relation) {
  std::vector<size_t> out(relation.row_count());
  for (size_t i = 0; i < out.size(); ++i) out[i] = i;
  return out;
}

ColumnOrigin origin_of(const Relation& relation, size_t column) {
  if (relation.origins().empty()) return ColumnOrigin{"", relation.columns()[column]};
  return relation.origins()[column];
}

/// Orders raw rows when no GROUP BY is present.
/// MUST resolve ORDER BY columns exactly (no footnote stripping).
Relation order_rows(const Relation& relation, const std::vector<OrderByParameter>& params) {
  std::vector<SortKey> keys;
  for (const auto& param : params) {
    const auto& ref = std::get<ColumnRef>(param.parameter);
    keys.push_back(SortKey{executor_internal::resolve_column(relation, ref, ResolveMode::Exact),
                           param.direction == OrderByParameter::Direction::Desc});
  }
  std::vector<Row> rows = relation.rows();
  executor_internal::sort_rows(rows, keys);
  return with_rows(relation, std::move(rows));
}

struct OutputColumn {
  std::string name;
  std::optional<size_t> plain;
  const Aggregation* aggregation = nullptr;
  std::optional<size_t> input;
};

[[noreturn]] void throw_not_in_group_by(const std::string& column) {
  throw QueryError(ErrorKind::ColumnNotInGroupBy,
                   "Column '" + column + "' must appear in GROUP BY or be used in an aggregation");
}

/// Partitions rows by the GROUP BY key tuple and computes one row per group.
/// MUST keep groups in first-seen order unless ORDER BY reorders them.
/// Inputs are the filtered relation/criteria; outputs are the grouped relation.
Relation group_rows(const Relation& relation, const TransformCriteria& criteria) {
  std::vector<size_t> key_columns;
  for (const auto& ref : *criteria.group_by) {
    size_t index = executor_internal::resolve_column(relation, ref, ResolveMode::Lenient);
    if (!contains(key_columns, index)) key_columns.push_back(index);
  }

  std::vector<OutputColumn> outputs;
  if (std::holds_alternative<Wildcard>(criteria.columns)) {
    for (size_t i = 0; i < relation.column_count(); ++i) {
      if (!contains(key_columns, i)) throw_not_in_group_by(relation.columns()[i]);
      outputs.push_back(OutputColumn{relation.columns()[i], i, nullptr, std::nullopt});
    }
  } else {
    for (const auto& item : std::get<std::vector<SelectItem>>(criteria.columns)) {
      if (const auto* ref = std::get_if<ColumnRef>(&item)) {
        size_t index = executor_internal::resolve_column(relation, *ref, ResolveMode::Lenient);
        if (!contains(key_columns, index)) throw_not_in_group_by(relation.columns()[index]);
        outputs.push_back(OutputColumn{relation.columns()[index], index, nullptr, std::nullopt});
      } else {
        const auto& agg = std::get<Aggregation>(item);
        outputs.push_back(OutputColumn{aggregation_name(agg), std::nullopt, &agg, aggregation_column(relation, agg)});
      }
    }
  }

  std::vector<std::vector<size_t>> groups;
  std::unordered_map<std::string, size_t> group_index;
  for (size_t r = 0; r < relation.row_count(); ++r) {
    std::string key = executor_internal::tuple_key(relation.rows()[r], key_columns);
    auto it = group_index.find(key);
    if (it == group_index.end()) {
      group_index.emplace(std::move(key), groups.size());
      groups.push_back({r});
    } else {
      groups[it->second].push_back(r);
    }
  }

  std::vector<Row> out_rows;
  out_rows.reserve(groups.size());
  for (const auto& members : groups) {
    Row row;
    row.reserve(outputs.size());
    for (const auto& output : outputs) {
      if (output.plain.has_value()) {
        row.push_back(relation.rows()[members.front()][*output.plain]);
      } else {
        row.push_back(executor_internal::aggregate_values(output.aggregation->function,
                                                          gather(relation, members, output.input), output.name));
      }
    }
    out_rows.push_back(std::move(row));
  }

  if (criteria.order_by.has_value()) {
    // Each sort row holds the ORDER BY values followed by the group position.
    const auto& params = *criteria.order_by;
    std::vector<Row> sort_table(groups.size());
    std::vector<SortKey> keys;
    for (size_t p = 0; p < params.size(); ++p) {
      keys.push_back(SortKey{p, params[p].direction == OrderByParameter::Direction::Desc});
      if (const auto* ref = std::get_if<ColumnRef>(&params[p].parameter)) {
        size_t index = executor_internal::resolve_column(relation, *ref, ResolveMode::Exact);
        if (!contains(key_columns, index)) {
          throw QueryError(ErrorKind::InvalidOrderBy,
                           "ORDER BY column '" + format_column_ref(*ref) + "' must be a GROUP BY key or an aggregation");
        }
        for (size_t g = 0; g < groups.size(); ++g) {
          sort_table[g].push_back(relation.rows()[groups[g].front()][index]);
        }
        continue;
      }
      const auto& agg = std::get<Aggregation>(params[p].parameter);
      std::string name = aggregation_name(agg);
      std::optional<size_t> selected;
      for (size_t o = 0; o < outputs.size(); ++o) {
        if (outputs[o].aggregation != nullptr && outputs[o].name == name) {
          selected = o;
          break;
        }
      }
      std::optional<size_t> input;
      if (!selected.has_value()) input = aggregation_column(relation, agg);
      for (size_t g = 0; g < groups.size(); ++g) {
        if (selected.has_value()) {
          sort_table[g].push_back(out_rows[g][*selected]);
        } else {
          sort_table[g].push_back(
              executor_internal::aggregate_values(agg.function, gather(relation, groups[g], input), name));
        }
      }
    }
    for (size_t g = 0; g < groups.size(); ++g) {
      sort_table[g].push_back(static_cast<int64_t>(g));
    }
    executor_internal::sort_rows(sort_table, keys);
    std::vector<Row> ordered;
    ordered.reserve(out_rows.size());
    for (const auto& sort_row : sort_table) {
      ordered.push_back(std::move(out_rows[static_cast<size_t>(std::get<int64_t>(sort_row.back()))]));
    }
    out_rows = std::move(ordered);
  }

  std::vector<std::string> names;
  std::vector<ColumnOrigin> origins;
  for (const auto& output : outputs) {
    names.push_back(output.name);
    if (output.plain.has_value()) {
      origins.push_back(origin_of(relation, *output.plain));
    } else {
      origins.push_back(ColumnOrigin{"", output.name});
    }
  }
  Relation out(make_unique_column_names(names), std::move(out_rows));
  out.set_origins(std::move(origins));
  return out;
}

/// Computes a single row of aggregations over every row.
Relation aggregate_all(const Relation& relation, const std::vector<SelectItem>& items) {
  std::vector<std::string> names;
  Row row;
  std::vector<size_t> rows = all_row_indices(relation);
  for (const auto& item : items) {
    const auto& agg = std::get<Aggregation>(item);
    std::string name = aggregation_name(agg);
    row.push_back(executor_internal::aggregate_values(agg.function,
                                                      gather(relation, rows, aggregation_column(relation, agg)), name));
    names.push_back(std::move(name));
  }
  Relation out(make_unique_column_names(names));
  out.add_row(std::move(row));
  return out;
}

/// Projects the requested columns in order.
Relation project(const Relation& relation, const std::vector<SelectItem>& items) {
  std::vector<size_t> indexes;
  std::vector<std::string> names;
  std::vector<ColumnOrigin> origins;
  for (const auto& item : items) {
    const auto& ref = std::get<ColumnRef>(item);
    size_t index = executor_internal::resolve_column(relation, ref, ResolveMode::Lenient);
    indexes.push_back(index);
    names.push_back(relation.columns()[index]);
    origins.push_back(origin_of(relation, index));
  }
  std::vector<Row> rows;
  rows.reserve(relation.row_count());
  for (const auto& source : relation.rows()) {
    Row row;
    row.reserve(indexes.size());
    for (size_t index : indexes) row.push_back(source[index]);
    rows.push_back(std::move(row));
  }
  Relation out(make_unique_column_names(names), std::move(rows));
  out.set_origins(std::move(origins));
  return out;
}

Relation distinct_rows(const Relation& relation) {
  std::vector<size_t> all_columns(relation.column_count());
  for (size_t i = 0; i < all_columns.size(); ++i) all_columns[i] = i;
  std::unordered_map<std::string, bool> seen;
  std::vector<Row> rows;
  for (const auto& row : relation.rows()) {
    if (seen.emplace(executor_internal::tuple_key(row, all_columns), true).second) {
      rows.push_back(row);
    }
  }
  return with_rows(relation, std::move(rows));
}

/// Keeps the first (LIMIT) or last (TAIL) n rows.
/// MUST reject negative counts and preserve the schema for n == 0.
Relation limit_rows(const Relation& relation, const LimitClause& limit) {
  if (limit.count < 0) {
    throw QueryError(ErrorKind::InvalidLimit, "LIMIT/TAIL requires a non-negative integer, got " +
                                                  std::to_string(limit.count));
  }
  size_t n = static_cast<size_t>(limit.count);
  if (n == 0) return relation.schema_only();
  if (n >= relation.row_count()) return relation;
  const auto& rows = relation.rows();
  if (limit.kind == LimitClause::Kind::Limit) {
    return with_rows(relation, std::vector<Row>(rows.begin(), rows.begin() + static_cast<std::ptrdiff_t>(n)));
  }
  return with_rows(relation, std::vector<Row>(rows.end() - static_cast<std::ptrdiff_t>(n), rows.end()));
}

}  // namespace

/// Runs the SELECT pipeline over one relation.
/// MUST apply filter, order, group, project, distinct, and limit in that order.
/// Inputs are relation/criteria; outputs are a fresh relation or a thrown QueryError.
Relation transform(const Relation* relation, const TransformCriteria& criteria) {
  if (relation == nullptr) {
    throw QueryError(ErrorKind::NullInput, "Input relation is null");
  }
  bool all_aggregations = select_is_all_aggregations(criteria.columns);

  Relation data = criteria.filter.has_value() ? executor_internal::apply_filter(*relation, *criteria.filter)
                                              : *relation;

  // An all-aggregation select collapses to one row, so its ORDER BY is skipped.
  if (!criteria.group_by.has_value() && criteria.order_by.has_value() && !all_aggregations) {
    for (const auto& param : *criteria.order_by) {
      if (std::holds_alternative<Aggregation>(param.parameter)) {
        throw QueryError(ErrorKind::InvalidOrderBy, "Aggregation " +
                                                        aggregation_name(std::get<Aggregation>(param.parameter)) +
                                                        " in ORDER BY requires GROUP BY");
      }
    }
    data = order_rows(data, *criteria.order_by);
  }

  if (criteria.group_by.has_value()) {
    data = group_rows(data, criteria);
  } else if (const auto* items = std::get_if<std::vector<SelectItem>>(&criteria.columns)) {
    if (all_aggregations) {
      data = aggregate_all(data, *items);
    } else if (select_has_aggregation(criteria.columns)) {
      throw QueryError(ErrorKind::MixedAggregationWithoutGroup,
                       "Aggregation functions cannot be mixed with plain columns without GROUP BY");
    } else {
      data = project(data, *items);
    }
  }

  if (criteria.distinct) {
    data = distinct_rows(data);
  }

  if (criteria.limit_or_tail.has_value()) {
    data = limit_rows(data, *criteria.limit_or_tail);
  }
  return data;
}

}  // namespace etlq
