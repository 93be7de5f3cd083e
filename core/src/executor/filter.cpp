#include "executor_internal.h"

#include <unordered_map>

#include "../util/string_util.h"

namespace etlq::executor_internal {

namespace {

int sign(int cmp) {
  if (cmp < 0) return -1;
  if (cmp > 0) return 1;
  return 0;
}

int compare_doubles(double left, double right) {
  if (left < right) return -1;
  if (left > right) return 1;
  return 0;
}

std::optional<double> numeric_view(const Value& value) {
  if (is_number(value)) return as_double(value);
  if (const auto* b = std::get_if<bool>(&value)) return *b ? 1.0 : 0.0;
  if (const auto* s = std::get_if<std::string>(&value)) return util::parse_double(util::trim_ws(*s));
  return std::nullopt;
}

/// Evaluates predicates with column positions bound once per relation.
class Evaluator {
 public:
  explicit Evaluator(const Relation& relation) : relation_(relation) {}

  /// Resolves every column up front so unknown columns fail even on empty input.
  void bind(const Expr& expr) {
    if (const auto* cmp = std::get_if<CompareExpr>(&expr)) {
      if (const auto* ref = std::get_if<ColumnRef>(&cmp->lhs)) column_of(*ref);
      if (const auto* ref = std::get_if<ColumnRef>(&cmp->rhs)) column_of(*ref);
      return;
    }
    if (const auto* like = std::get_if<LikeExpr>(&expr)) {
      column_of(like->column);
      return;
    }
    if (const auto* node = std::get_if<std::shared_ptr<NotExpr>>(&expr)) {
      bind((*node)->operand);
      return;
    }
    const auto& node = std::get<std::shared_ptr<BinaryExpr>>(expr);
    bind(node->left);
    bind(node->right);
  }

  bool eval(const Expr& expr, const Row& row) {
    if (const auto* cmp = std::get_if<CompareExpr>(&expr)) return eval_compare(*cmp, row);
    if (const auto* like = std::get_if<LikeExpr>(&expr)) return eval_like(*like, row);
    if (const auto* node = std::get_if<std::shared_ptr<NotExpr>>(&expr)) {
      return !eval((*node)->operand, row);
    }
    const auto& node = std::get<std::shared_ptr<BinaryExpr>>(expr);
    if (node->op == BinaryExpr::Op::And) {
      return eval(node->left, row) && eval(node->right, row);
    }
    return eval(node->left, row) || eval(node->right, row);
  }

 private:
  size_t column_of(const ColumnRef& ref) {
    auto it = bound_.find(&ref);
    if (it != bound_.end()) return it->second;
    size_t index = resolve_column(relation_, ref, ResolveMode::Lenient);
    bound_.emplace(&ref, index);
    return index;
  }

  const Value& operand_value(const Operand& operand, const Row& row) {
    if (const auto* ref = std::get_if<ColumnRef>(&operand)) {
      return row[column_of(*ref)];
    }
    return std::get<Literal>(operand).value;
  }

  bool eval_compare(const CompareExpr& cmp, const Row& row) {
    const Value& left = operand_value(cmp.lhs, row);
    const Value& right = operand_value(cmp.rhs, row);
    if (is_null(left) || is_null(right)) return false;
    std::optional<int> order = compare_for_filter(left, right);
    if (!order.has_value()) {
      // Incomparable values are only ever unequal.
      return cmp.op == CompareExpr::Op::NotEq;
    }
    switch (cmp.op) {
      case CompareExpr::Op::Eq: return *order == 0;
      case CompareExpr::Op::NotEq: return *order != 0;
      case CompareExpr::Op::Lt: return *order < 0;
      case CompareExpr::Op::Le: return *order <= 0;
      case CompareExpr::Op::Gt: return *order > 0;
      case CompareExpr::Op::Ge: return *order >= 0;
    }
    return false;
  }

  bool eval_like(const LikeExpr& like, const Row& row) {
    const Value& value = row[column_of(like.column)];
    if (is_null(value)) return false;
    return util::like_match(format_value(value), like.pattern);
  }

  const Relation& relation_;
  std::unordered_map<const ColumnRef*, size_t> bound_;
};

}  // namespace

std::optional<int> compare_for_filter(const Value& left, const Value& right) {
  if (is_null(left) || is_null(right)) return std::nullopt;
  if (is_number(left) && is_number(right)) return compare_values(left, right);
  const auto* ls = std::get_if<std::string>(&left);
  const auto* rs = std::get_if<std::string>(&right);
  if (ls != nullptr && rs != nullptr) return sign(ls->compare(*rs));
  const auto* lb = std::get_if<bool>(&left);
  const auto* rb = std::get_if<bool>(&right);
  if (lb != nullptr && rb != nullptr) return compare_values(left, right);
  if ((lb != nullptr && rs != nullptr) || (ls != nullptr && rb != nullptr)) {
    std::string text = util::to_lower(util::trim_ws(ls != nullptr ? *ls : *rs));
    if (text != "true" && text != "false") return std::nullopt;
    bool parsed = text == "true";
    Value as_bool = parsed;
    return lb != nullptr ? compare_values(left, as_bool) : compare_values(as_bool, right);
  }
  // Mixed number/string (or number/bool): compare numerically when the text parses.
  std::optional<double> l = numeric_view(left);
  std::optional<double> r = numeric_view(right);
  if (!l.has_value() || !r.has_value()) return std::nullopt;
  return compare_doubles(*l, *r);
}

/// Filters rows with the WHERE condition tree.
/// MUST preserve input order and schema.
/// Inputs are relation/expr; outputs are a new relation.
Relation apply_filter(const Relation& relation, const Expr& expr) {
  Relation out = relation.schema_only();
  Evaluator evaluator(relation);
  evaluator.bind(expr);
  for (const auto& row : relation.rows()) {
    if (evaluator.eval(expr, row)) out.add_row(row);
  }
  return out;
}

}  // namespace etlq::executor_internal
