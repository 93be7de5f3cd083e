#include "plan.h"

#include <nlohmann/json.hpp>

namespace etlq {

namespace {

using json = nlohmann::ordered_json;

json value_to_json(const Value& value) {
  if (std::holds_alternative<std::monostate>(value)) return nullptr;
  if (const auto* b = std::get_if<bool>(&value)) return *b;
  if (const auto* i = std::get_if<int64_t>(&value)) return *i;
  if (const auto* d = std::get_if<double>(&value)) return *d;
  return std::get<std::string>(value);
}

json datasource_to_json(const Datasource& source) {
  json out = json::object();
  out["type"] = source.type;
  out["path"] = source.path;
  if (source.remote.has_value()) {
    const RemoteDescriptor& remote = *source.remote;
    out["remote"] = {{"project", remote.project},
                     {"dataset", remote.dataset},
                     {"start_date", remote.start_date},
                     {"end_date", remote.end_date},
                     {"longitude", remote.longitude},
                     {"latitude", remote.latitude},
                     {"scale", remote.scale}};
  }
  return out;
}

json columns_to_json(const SelectColumns& columns) {
  if (std::holds_alternative<Wildcard>(columns)) return "*";
  json out = json::array();
  for (const auto& item : std::get<std::vector<SelectItem>>(columns)) {
    if (const auto* ref = std::get_if<ColumnRef>(&item)) {
      out.push_back(format_column_ref(*ref));
    } else {
      out.push_back(aggregation_name(std::get<Aggregation>(item)));
    }
  }
  return out;
}

json transform_to_json(const TransformCriteria& criteria) {
  json out = json::object();
  out["step"] = "transform";
  out["columns"] = columns_to_json(criteria.columns);
  out["distinct"] = criteria.distinct;
  out["filter"] = criteria.filter.has_value() ? json(format_expr(*criteria.filter)) : json(nullptr);
  if (criteria.group_by.has_value()) {
    json keys = json::array();
    for (const auto& ref : *criteria.group_by) keys.push_back(format_column_ref(ref));
    out["group_by"] = keys;
  } else {
    out["group_by"] = nullptr;
  }
  if (criteria.order_by.has_value()) {
    json params = json::array();
    for (const auto& param : *criteria.order_by) {
      std::string key;
      if (const auto* ref = std::get_if<ColumnRef>(&param.parameter)) {
        key = format_column_ref(*ref);
      } else {
        key = aggregation_name(std::get<Aggregation>(param.parameter));
      }
      params.push_back({{"key", key},
                        {"direction", param.direction == OrderByParameter::Direction::Desc ? "desc" : "asc"}});
    }
    out["order_by"] = params;
  } else {
    out["order_by"] = nullptr;
  }
  if (criteria.limit_or_tail.has_value()) {
    out["limit"] = {{"kind", criteria.limit_or_tail->kind == LimitClause::Kind::Tail ? "tail" : "limit"},
                    {"count", criteria.limit_or_tail->count}};
  } else {
    out["limit"] = nullptr;
  }
  return out;
}

struct StepToJson {
  json operator()(const ExtractStep& step) const {
    json out = json::object();
    out["step"] = "extract";
    out["id"] = step.id;
    json source = datasource_to_json(step.source);
    for (auto it = source.begin(); it != source.end(); ++it) out[it.key()] = it.value();
    out["alias"] = step.alias.empty() ? json(nullptr) : json(step.alias);
    return out;
  }
  json operator()(const ValuesStep& step) const {
    json rows = json::array();
    for (const auto& row : step.relation.rows()) {
      json cells = json::array();
      for (const auto& cell : row) cells.push_back(value_to_json(cell));
      rows.push_back(cells);
    }
    return {{"step", "values"}, {"columns", step.relation.columns()}, {"rows", rows}};
  }
  json operator()(const JoinStep& step) const {
    json keys = json::array();
    for (const auto& key : step.keys) {
      keys.push_back({{"left", format_column_ref(key.left)}, {"right", format_column_ref(key.right)}});
    }
    return {{"step", "join"}, {"kind", join_kind_name(step.kind)}, {"right", step.right_step}, {"keys", keys}};
  }
  json operator()(const TransformStep& step) const {
    return transform_to_json(step.criteria);
  }
  json operator()(const LoadStep& step) const {
    json out = json::object();
    out["step"] = "load";
    json destination = datasource_to_json(step.destination);
    for (auto it = destination.begin(); it != destination.end(); ++it) out[it.key()] = it.value();
    return out;
  }
};

struct StepDescriber {
  std::string operator()(const ExtractStep& step) const {
    std::string out = "extract " + datasource_label(step.source);
    if (!step.alias.empty()) out += " as " + step.alias;
    return out;
  }
  std::string operator()(const ValuesStep& step) const {
    return "values (" + std::to_string(step.relation.row_count()) + " rows)";
  }
  std::string operator()(const JoinStep& step) const {
    std::string out = join_kind_name(step.kind) + " join with step " + std::to_string(step.right_step) + " on ";
    for (size_t i = 0; i < step.keys.size(); ++i) {
      if (i > 0) out += " and ";
      out += format_column_ref(step.keys[i].left) + " = " + format_column_ref(step.keys[i].right);
    }
    return out;
  }
  std::string operator()(const TransformStep&) const {
    return "transform";
  }
  std::string operator()(const LoadStep& step) const {
    return "load into " + datasource_label(step.destination);
  }
};

}  // namespace

std::string describe_step(const PlanStep& step) {
  return std::visit(StepDescriber{}, step);
}

/// Serializes a plan for --explain.
/// MUST keep step order and MUST NOT depend on execution state.
/// Inputs are plans; outputs are JSON text with no side effects.
std::string plan_to_json(const Plan& plan, int indent) {
  json doc = json::object();
  json aliases = json::object();
  for (const auto& entry : plan.aliases) aliases[entry.first] = entry.second;
  doc["aliases"] = aliases;
  json steps = json::array();
  for (const auto& step : plan.steps) steps.push_back(std::visit(StepToJson{}, step));
  doc["steps"] = steps;
  return doc.dump(indent);
}

}  // namespace etlq
