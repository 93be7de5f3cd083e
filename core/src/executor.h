#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "ast.h"
#include "etlq/etlq.h"
#include "etlq/relation.h"

namespace etlq {

/// Bundle of SELECT clauses applied to one relation by transform().
/// MUST be built from a single statement and never mutated afterwards.
struct TransformCriteria {
  SelectColumns columns;
  bool distinct = false;
  std::optional<Expr> filter;
  std::optional<std::vector<ColumnRef>> group_by;
  std::optional<std::vector<OrderByParameter>> order_by;
  std::optional<LimitClause> limit_or_tail;
};

/// Applies filter, order, group/aggregate, projection, distinct, and limit/tail.
/// MUST run stages in that fixed order and MUST NOT mutate the input.
/// Inputs are relation/criteria; outputs are a fresh relation or a thrown QueryError.
Relation transform(const Relation* relation, const TransformCriteria& criteria);

}  // namespace etlq
