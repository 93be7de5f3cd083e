#include "etlq/etlq.h"

#include <optional>
#include <stdexcept>

#include "../executor/executor_internal.h"
#include "../executor.h"
#include "../query_parser.h"
#include "etlq_internal.h"

namespace etlq {

namespace {

/// Pulls one relation through the adapter registered for the source type.
/// MUST leave UnknownSourceType untouched and wrap every adapter failure.
/// Inputs are the step and registry; outputs are the stamped relation.
Relation run_extract(const ExtractStep& step, const AdapterRegistry& registry) {
  Extractor& extractor = registry.extractor(step.source.type);
  Relation relation;
  try {
    relation = extractor.extract(step.source.path);
  } catch (const std::exception& e) {
    throw QueryError(ErrorKind::ExtractFailed,
                     "Error extracting data from '" + datasource_label(step.source) + "': " + e.what());
  }
  if (!step.alias.empty()) relation.stamp_origins(step.alias);
  return relation;
}

void run_load(const LoadStep& step, const Relation& relation, const AdapterRegistry& registry) {
  Loader& loader = registry.loader(step.destination.type);
  try {
    loader.load(relation, step.destination.path);
  } catch (const std::exception& e) {
    throw QueryError(ErrorKind::LoadFailed,
                     "Error loading data to '" + datasource_label(step.destination) + "': " + e.what());
  }
}

/// Maps a key reference to the column name the join operator expects.
/// Unresolvable references fall through by name so the join reports MissingJoinColumn.
std::string key_column_name(const Relation& relation, const ColumnRef& ref) {
  auto index = executor_internal::find_column(relation, ref, executor_internal::ResolveMode::Lenient);
  if (index.has_value()) return relation.columns()[*index];
  if (ref.kind == ColumnRef::Kind::Index) return "#" + std::to_string(ref.index);
  return ref.name;
}

Relation run_join(const JoinStep& step, const Relation& left, const Relation& right) {
  std::vector<std::pair<std::string, std::string>> keys;
  keys.reserve(step.keys.size());
  for (const auto& key : step.keys) {
    keys.emplace_back(key_column_name(left, key.left), key_column_name(right, key.right));
  }
  return join(left, right, keys, join_kind_name(step.kind));
}

}  // namespace

ExecutionResult run_plan(const Plan& plan, const AdapterRegistry& registry, ExecutionObserver* observer) {
  std::vector<std::optional<Relation>> extracted;
  std::optional<Relation> current;
  std::optional<std::string> loaded_to;

  for (size_t i = 0; i < plan.steps.size(); ++i) {
    const PlanStep& step = plan.steps[i];
    if (observer) observer->on_step_begin(i, describe_step(step));

    if (const auto* extract = std::get_if<ExtractStep>(&step)) {
      if (extracted.size() <= extract->id) extracted.resize(extract->id + 1);
      extracted[extract->id] = run_extract(*extract, registry);
      if (extract->id == 0) current = extracted[0];
      if (observer) observer->on_step_end(i, *extracted[extract->id]);
      continue;
    }
    if (const auto* values = std::get_if<ValuesStep>(&step)) {
      current = values->relation;
    } else if (const auto* join_step = std::get_if<JoinStep>(&step)) {
      if (!current.has_value() || join_step->right_step >= extracted.size() ||
          !extracted[join_step->right_step].has_value()) {
        throw QueryError(ErrorKind::JoinFailed, "Join step refers to a source that was not extracted");
      }
      current = run_join(*join_step, *current, *extracted[join_step->right_step]);
    } else if (const auto* transform_step = std::get_if<TransformStep>(&step)) {
      current = transform(current.has_value() ? &*current : nullptr, transform_step->criteria);
    } else {
      const auto& load = std::get<LoadStep>(step);
      if (!current.has_value()) {
        throw QueryError(ErrorKind::NullInput, "Nothing to load into '" + datasource_label(load.destination) + "'");
      }
      run_load(load, *current, registry);
      loaded_to = datasource_label(load.destination);
    }
    if (observer && current.has_value()) observer->on_step_end(i, *current);
  }

  if (!current.has_value()) {
    throw QueryError(ErrorKind::NullInput, "Plan produced no relation");
  }
  return ExecutionResult{std::move(*current), loaded_to};
}

ExecutionResult execute_query(const std::string& query,
                              const AdapterRegistry& registry,
                              ExecutionObserver* observer) {
  Statement statement = parse_statement(query);
  Plan plan = build_plan(statement);
  return run_plan(plan, registry, observer);
}

std::string explain_query(const std::string& query, int indent) {
  Statement statement = parse_statement(query);
  return plan_to_json(build_plan(statement), indent);
}

}  // namespace etlq
