#include "executor_internal.h"

#include <algorithm>

#include "../util/string_util.h"
#include "etlq/errors.h"

namespace etlq::executor_internal {

namespace {

bool origin_has_qualifier(const ColumnOrigin& origin, const std::string& qualifier) {
  if (origin.qualifier == qualifier) return true;
  return std::find(origin.merged.begin(), origin.merged.end(), qualifier) != origin.merged.end();
}

}  // namespace

std::optional<size_t> find_column(const Relation& relation, const ColumnRef& ref, ResolveMode mode) {
  if (ref.kind == ColumnRef::Kind::Index) {
    if (ref.index >= relation.column_count()) return std::nullopt;
    return ref.index;
  }
  if (ref.qualifier.has_value()) {
    std::vector<ColumnOrigin> origins = relation.effective_origins();
    for (size_t i = 0; i < origins.size(); ++i) {
      if (origin_has_qualifier(origins[i], *ref.qualifier) && origins[i].name == ref.name) return i;
    }
    return std::nullopt;
  }
  if (auto exact = relation.find_column(ref.name)) return exact;
  if (mode == ResolveMode::Exact) return std::nullopt;

  const auto& columns = relation.columns();
  for (size_t i = 0; i < columns.size(); ++i) {
    if (util::strip_footnotes(columns[i]) == ref.name) return i;
  }
  // A join may have renamed the column (`amount_left`); accept a unique origin match.
  std::optional<size_t> match;
  for (size_t i = 0; i < relation.origins().size(); ++i) {
    if (relation.origins()[i].name != ref.name) continue;
    if (match.has_value()) return std::nullopt;
    match = i;
  }
  return match;
}

size_t resolve_column(const Relation& relation, const ColumnRef& ref, ResolveMode mode) {
  if (auto index = find_column(relation, ref, mode)) return *index;
  if (ref.kind == ColumnRef::Kind::Index) {
    throw QueryError(ErrorKind::ColumnIndexOutOfRange,
                     "Column index " + std::to_string(ref.index) + " out of range (relation has " +
                         std::to_string(relation.column_count()) + " columns)");
  }
  std::string message = "Column '" + format_column_ref(ref) + "' not found. Available: [";
  for (size_t i = 0; i < relation.columns().size(); ++i) {
    if (i > 0) message += ", ";
    message += "'" + relation.columns()[i] + "'";
  }
  message += "]";
  throw QueryError(ErrorKind::ColumnNotFound, message);
}

}  // namespace etlq::executor_internal
