#include "ast.h"

#include <sstream>

namespace etlq {

namespace {

std::string quote(const std::string& text) {
  std::string out = "'";
  for (char c : text) {
    if (c == '\'') out.push_back('\'');
    out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

std::string format_literal(const Literal& literal) {
  if (const auto* s = std::get_if<std::string>(&literal.value)) {
    return quote(*s);
  }
  return format_value(literal.value);
}

std::string format_operand(const Operand& operand) {
  if (const auto* ref = std::get_if<ColumnRef>(&operand)) {
    return format_column_ref(*ref);
  }
  return format_literal(std::get<Literal>(operand));
}

const char* compare_op_text(CompareExpr::Op op) {
  switch (op) {
    case CompareExpr::Op::Eq: return "=";
    case CompareExpr::Op::NotEq: return "!=";
    case CompareExpr::Op::Lt: return "<";
    case CompareExpr::Op::Le: return "<=";
    case CompareExpr::Op::Gt: return ">";
    case CompareExpr::Op::Ge: return ">=";
  }
  return "?";
}

std::string format_datasource(const Datasource& source) {
  return "{" + source.type + ":" + source.path + "}";
}

std::string format_table_source(const TableSource& source) {
  std::string out = format_datasource(source.datasource);
  if (source.alias.has_value()) out += " AS " + *source.alias;
  return out;
}

struct ExprFormatter {
  std::string operator()(const CompareExpr& cmp) const {
    return "(" + format_operand(cmp.lhs) + " " + compare_op_text(cmp.op) + " " + format_operand(cmp.rhs) + ")";
  }
  std::string operator()(const LikeExpr& like) const {
    return "(" + format_column_ref(like.column) + " LIKE " + quote(like.pattern) + ")";
  }
  std::string operator()(const std::shared_ptr<NotExpr>& node) const {
    return "(NOT " + format_expr(node->operand) + ")";
  }
  std::string operator()(const std::shared_ptr<BinaryExpr>& node) const {
    return "(" + format_expr(node->left) + (node->op == BinaryExpr::Op::And ? " AND " : " OR ") +
           format_expr(node->right) + ")";
  }
};

std::string format_join_condition(const JoinCondition& condition) {
  if (const auto* leaf = std::get_if<JoinLeaf>(&condition)) {
    return "(" + format_column_ref(leaf->left) + " = " + format_column_ref(leaf->right) + ")";
  }
  const auto& node = std::get<std::shared_ptr<JoinBinary>>(condition);
  return "(" + format_join_condition(node->left) + (node->op == JoinBinary::Op::And ? " AND " : " OR ") +
         format_join_condition(node->right) + ")";
}

std::string format_select_item(const SelectItem& item) {
  if (const auto* ref = std::get_if<ColumnRef>(&item)) return format_column_ref(*ref);
  return aggregation_name(std::get<Aggregation>(item));
}

std::string dump_select(const SelectStatement& stmt) {
  std::ostringstream oss;
  oss << "SELECT ";
  if (stmt.distinct) oss << "DISTINCT ";
  if (std::holds_alternative<Wildcard>(stmt.columns)) {
    oss << "*";
  } else {
    const auto& items = std::get<std::vector<SelectItem>>(stmt.columns);
    for (size_t i = 0; i < items.size(); ++i) {
      if (i > 0) oss << ", ";
      oss << format_select_item(items[i]);
    }
  }
  if (stmt.into.has_value()) oss << " INTO " << format_datasource(*stmt.into);
  oss << " FROM " << format_table_source(stmt.source);
  for (const auto& join : stmt.joins) {
    oss << " " << join_kind_name(join.kind) << " JOIN " << format_table_source(join.source) << " ON "
        << format_join_condition(join.on);
  }
  if (stmt.where.has_value()) oss << " WHERE " << format_expr(*stmt.where);
  if (stmt.group_by.has_value()) {
    oss << " GROUP BY ";
    for (size_t i = 0; i < stmt.group_by->size(); ++i) {
      if (i > 0) oss << ", ";
      oss << format_column_ref((*stmt.group_by)[i]);
    }
  }
  if (stmt.order_by.has_value()) {
    oss << " ORDER BY ";
    for (size_t i = 0; i < stmt.order_by->size(); ++i) {
      const auto& param = (*stmt.order_by)[i];
      if (i > 0) oss << ", ";
      if (const auto* ref = std::get_if<ColumnRef>(&param.parameter)) {
        oss << format_column_ref(*ref);
      } else {
        oss << aggregation_name(std::get<Aggregation>(param.parameter));
      }
      oss << (param.direction == OrderByParameter::Direction::Desc ? " DESC" : " ASC");
    }
  }
  if (stmt.limit.has_value()) {
    oss << (stmt.limit->kind == LimitClause::Kind::Tail ? " TAIL " : " LIMIT ") << stmt.limit->count;
  }
  oss << ";";
  return oss.str();
}

std::string dump_insert(const InsertStatement& stmt) {
  std::ostringstream oss;
  oss << "INSERT INTO " << format_datasource(stmt.target);
  if (!stmt.columns.empty()) {
    oss << " (";
    for (size_t i = 0; i < stmt.columns.size(); ++i) {
      if (i > 0) oss << ", ";
      oss << "[" << stmt.columns[i] << "]";
    }
    oss << ")";
  }
  oss << " VALUES ";
  for (size_t r = 0; r < stmt.rows.size(); ++r) {
    if (r > 0) oss << ", ";
    oss << "(";
    for (size_t i = 0; i < stmt.rows[r].size(); ++i) {
      if (i > 0) oss << ", ";
      oss << format_literal(stmt.rows[r][i]);
    }
    oss << ")";
  }
  oss << ";";
  return oss.str();
}

std::string dump_update(const UpdateStatement& stmt) {
  std::ostringstream oss;
  oss << "UPDATE " << format_datasource(stmt.target) << " SET ";
  for (size_t i = 0; i < stmt.assignments.size(); ++i) {
    if (i > 0) oss << ", ";
    oss << format_column_ref(stmt.assignments[i].column) << " = " << format_literal(stmt.assignments[i].value);
  }
  if (stmt.where.has_value()) oss << " WHERE " << format_expr(*stmt.where);
  oss << ";";
  return oss.str();
}

std::string dump_delete(const DeleteStatement& stmt) {
  std::string out = "DELETE FROM " + format_datasource(stmt.target);
  if (stmt.where.has_value()) out += " WHERE " + format_expr(*stmt.where);
  return out + ";";
}

}  // namespace

std::string format_expr(const Expr& expr) {
  return std::visit(ExprFormatter{}, expr);
}

std::string format_column_ref(const ColumnRef& ref) {
  std::string out;
  if (ref.qualifier.has_value()) out = *ref.qualifier + ".";
  switch (ref.kind) {
    case ColumnRef::Kind::Name:
      out += ref.name;
      break;
    case ColumnRef::Kind::Bracketed:
      out += "[" + ref.name + "]";
      break;
    case ColumnRef::Kind::Index:
      out += "#" + std::to_string(ref.index);
      break;
  }
  return out;
}

std::string aggregation_name(const Aggregation& agg) {
  if (!agg.column.has_value()) return agg.function + "(*)";
  const ColumnRef& ref = *agg.column;
  // Bracketed names are shown bare so `sum([amount])` and `sum(amount)` agree.
  std::string inner = ref.qualifier.has_value() ? *ref.qualifier + "." : "";
  inner += ref.kind == ColumnRef::Kind::Index ? "#" + std::to_string(ref.index) : ref.name;
  return agg.function + "(" + inner + ")";
}

std::string join_kind_name(JoinClause::Kind kind) {
  switch (kind) {
    case JoinClause::Kind::Inner: return "inner";
    case JoinClause::Kind::Left: return "left";
    case JoinClause::Kind::Right: return "right";
    case JoinClause::Kind::Outer: return "outer";
  }
  return "inner";
}

std::string dump_statement(const Statement& statement) {
  if (const auto* select = std::get_if<SelectStatement>(&statement)) return dump_select(*select);
  if (const auto* insert = std::get_if<InsertStatement>(&statement)) return dump_insert(*insert);
  if (const auto* update = std::get_if<UpdateStatement>(&statement)) return dump_update(*update);
  return dump_delete(std::get<DeleteStatement>(statement));
}

}  // namespace etlq
