#pragma once

#include <map>
#include <string>
#include <variant>
#include <vector>

#include "../ast.h"
#include "../executor.h"

namespace etlq {

/// Pulls one relation from an adapter and stamps its columns with the alias.
struct ExtractStep {
  size_t id = 0;
  Datasource source;
  std::string alias;
};

/// One `left = right` key pair, already oriented so `right` belongs to the joined source.
struct JoinKey {
  ColumnRef left;
  ColumnRef right;
};

/// Folds the extraction `right_step` into the accumulated relation.
struct JoinStep {
  size_t right_step = 0;
  JoinClause::Kind kind = JoinClause::Kind::Inner;
  std::vector<JoinKey> keys;
};

struct TransformStep {
  TransformCriteria criteria;
};

struct LoadStep {
  Datasource destination;
};

/// Literal rows from INSERT ... VALUES.
struct ValuesStep {
  Relation relation;
};

using PlanStep = std::variant<ExtractStep, ValuesStep, JoinStep, TransformStep, LoadStep>;

/// Ordered steps interpreted directly by the engine.
/// MUST list extractions first, then joins in clause order, then transform, then load.
struct Plan {
  std::vector<PlanStep> steps;
  std::map<std::string, size_t> aliases;
};

/// Lowers a SELECT into extract/join/transform/load steps.
/// MUST reject duplicate aliases, unknown qualifiers, and non-equality-conjunction ON clauses.
/// Inputs are parsed statements; outputs are plans or a thrown QueryError.
Plan build_plan(const SelectStatement& select);
/// Lowers any statement; INSERT becomes values+load, UPDATE/DELETE are rejected.
Plan build_plan(const Statement& statement);

/// One-line human description of a step (used for --verbose progress).
std::string describe_step(const PlanStep& step);

/// Renders the plan as a JSON document.
std::string plan_to_json(const Plan& plan, int indent = 2);

}  // namespace etlq
