#include "plan.h"

#include <memory>

#include "etlq/errors.h"

namespace etlq {

namespace {

enum class Side { Earlier, Joined, Unknown };

/// Tracks aliases as sources are added so ON clauses only see what precedes them.
class AliasScope {
 public:
  void add(const std::optional<std::string>& alias, size_t step) {
    if (!alias.has_value()) return;
    if (!aliases_.emplace(*alias, step).second) {
      throw QueryError(ErrorKind::DuplicateAlias, "Duplicate table alias '" + *alias + "'");
    }
  }

  void check(const ColumnRef& ref) const {
    if (!ref.qualifier.has_value()) return;
    if (aliases_.count(*ref.qualifier) == 0) {
      throw QueryError(ErrorKind::UnknownAlias,
                       "Unknown table alias '" + *ref.qualifier + "' in " + format_column_ref(ref));
    }
  }

  const std::map<std::string, size_t>& aliases() const { return aliases_; }

 private:
  std::map<std::string, size_t> aliases_;
};

void check_expr(const AliasScope& scope, const Expr& expr) {
  if (const auto* cmp = std::get_if<CompareExpr>(&expr)) {
    if (const auto* ref = std::get_if<ColumnRef>(&cmp->lhs)) scope.check(*ref);
    if (const auto* ref = std::get_if<ColumnRef>(&cmp->rhs)) scope.check(*ref);
    return;
  }
  if (const auto* like = std::get_if<LikeExpr>(&expr)) {
    scope.check(like->column);
    return;
  }
  if (const auto* node = std::get_if<std::shared_ptr<NotExpr>>(&expr)) {
    check_expr(scope, (*node)->operand);
    return;
  }
  const auto& node = std::get<std::shared_ptr<BinaryExpr>>(expr);
  check_expr(scope, node->left);
  check_expr(scope, node->right);
}

void check_aggregation(const AliasScope& scope, const Aggregation& agg) {
  if (agg.column.has_value()) scope.check(*agg.column);
}

/// Flattens an AND-chain of equalities into leaves.
/// MUST reject OR anywhere in the tree.
void collect_leaves(const JoinCondition& condition, std::vector<JoinLeaf>& leaves) {
  if (const auto* leaf = std::get_if<JoinLeaf>(&condition)) {
    leaves.push_back(*leaf);
    return;
  }
  const auto& node = std::get<std::shared_ptr<JoinBinary>>(condition);
  if (node->op == JoinBinary::Op::Or) {
    throw QueryError(ErrorKind::UnsupportedJoinCondition,
                     "OR is not supported in JOIN ... ON; use equalities joined with AND");
  }
  collect_leaves(node->left, leaves);
  collect_leaves(node->right, leaves);
}

Side side_of(const ColumnRef& ref, const std::optional<std::string>& joined_alias) {
  if (!ref.qualifier.has_value()) return Side::Unknown;
  if (joined_alias.has_value() && *ref.qualifier == *joined_alias) return Side::Joined;
  return Side::Earlier;
}

/// Orients a leaf so its right column belongs to the joined source.
/// Unqualified columns are taken positionally (left = earlier, right = joined).
JoinKey orient(const JoinLeaf& leaf, const std::optional<std::string>& joined_alias) {
  Side left = side_of(leaf.left, joined_alias);
  Side right = side_of(leaf.right, joined_alias);
  if ((left == Side::Earlier && right == Side::Earlier) || (left == Side::Joined && right == Side::Joined)) {
    throw QueryError(ErrorKind::UnsupportedJoinCondition,
                     "Join condition " + format_column_ref(leaf.left) + " = " + format_column_ref(leaf.right) +
                         " must compare the joined source with an earlier source");
  }
  bool swap = left == Side::Joined || (left == Side::Unknown && right == Side::Earlier);
  if (swap) return JoinKey{leaf.right, leaf.left};
  return JoinKey{leaf.left, leaf.right};
}

Relation values_relation(const InsertStatement& insert) {
  std::vector<std::string> columns = insert.columns;
  if (columns.empty() && !insert.rows.empty()) {
    for (size_t i = 0; i < insert.rows.front().size(); ++i) {
      columns.push_back("col" + std::to_string(i + 1));
    }
  }
  Relation relation(make_unique_column_names(columns));
  for (const auto& literals : insert.rows) {
    Row row;
    row.reserve(literals.size());
    for (const auto& literal : literals) row.push_back(literal.value);
    relation.add_row(std::move(row));
  }
  return relation;
}

}  // namespace

/// Lowers a SELECT into an ordered plan.
/// MUST emit extractions (FROM first), joins left-to-right, one transform, then an optional load.
/// Inputs are SelectStatement values; outputs are plans or a thrown QueryError.
Plan build_plan(const SelectStatement& select) {
  Plan plan;
  AliasScope scope;
  std::vector<JoinStep> joins;

  plan.steps.push_back(ExtractStep{0, select.source.datasource, select.source.alias.value_or("")});
  scope.add(select.source.alias, 0);

  for (size_t i = 0; i < select.joins.size(); ++i) {
    const JoinClause& clause = select.joins[i];
    size_t step_id = i + 1;
    plan.steps.push_back(ExtractStep{step_id, clause.source.datasource, clause.source.alias.value_or("")});
    scope.add(clause.source.alias, step_id);

    std::vector<JoinLeaf> leaves;
    collect_leaves(clause.on, leaves);
    JoinStep join;
    join.right_step = step_id;
    join.kind = clause.kind;
    for (const auto& leaf : leaves) {
      scope.check(leaf.left);
      scope.check(leaf.right);
      join.keys.push_back(orient(leaf, clause.source.alias));
    }
    joins.push_back(std::move(join));
  }
  for (auto& join : joins) {
    plan.steps.push_back(std::move(join));
  }

  if (const auto* items = std::get_if<std::vector<SelectItem>>(&select.columns)) {
    for (const auto& item : *items) {
      if (const auto* ref = std::get_if<ColumnRef>(&item)) {
        scope.check(*ref);
      } else {
        check_aggregation(scope, std::get<Aggregation>(item));
      }
    }
  }
  if (select.where.has_value()) check_expr(scope, *select.where);
  if (select.group_by.has_value()) {
    for (const auto& ref : *select.group_by) scope.check(ref);
  }
  if (select.order_by.has_value()) {
    for (const auto& param : *select.order_by) {
      if (const auto* ref = std::get_if<ColumnRef>(&param.parameter)) {
        scope.check(*ref);
      } else {
        check_aggregation(scope, std::get<Aggregation>(param.parameter));
      }
    }
  }

  TransformCriteria criteria;
  criteria.columns = select.columns;
  criteria.distinct = select.distinct;
  criteria.filter = select.where;
  criteria.group_by = select.group_by;
  criteria.order_by = select.order_by;
  criteria.limit_or_tail = select.limit;
  plan.steps.push_back(TransformStep{std::move(criteria)});

  if (select.into.has_value()) {
    plan.steps.push_back(LoadStep{*select.into});
  }
  plan.aliases = scope.aliases();
  return plan;
}

Plan build_plan(const Statement& statement) {
  if (const auto* select = std::get_if<SelectStatement>(&statement)) {
    return build_plan(*select);
  }
  if (const auto* insert = std::get_if<InsertStatement>(&statement)) {
    Plan plan;
    plan.steps.push_back(ValuesStep{values_relation(*insert)});
    plan.steps.push_back(LoadStep{insert->target});
    return plan;
  }
  if (std::holds_alternative<UpdateStatement>(statement)) {
    throw QueryError(ErrorKind::UnsupportedStatement, "UPDATE statements are parsed but cannot be executed");
  }
  throw QueryError(ErrorKind::UnsupportedStatement, "DELETE statements are parsed but cannot be executed");
}

}  // namespace etlq
