#include "parser_internal.h"

#include "../util/string_util.h"

namespace etlq {

/// Parses `*` or a comma-separated list of columns and aggregations.
/// Inputs are token stream; outputs are select columns or errors.
bool Parser::parse_select_columns(SelectColumns& columns) {
  if (current_.type == TokenType::Star) {
    columns = Wildcard{Span{current_.pos, current_.pos + 1}};
    advance();
    return true;
  }
  std::vector<SelectItem> items;
  while (true) {
    SelectItem item;
    if (!parse_select_item(item)) return false;
    items.push_back(std::move(item));
    if (current_.type != TokenType::Comma) break;
    advance();
  }
  columns = std::move(items);
  return true;
}

bool Parser::parse_select_item(SelectItem& item) {
  if (current_.type == TokenType::Identifier && peek().type == TokenType::LParen) {
    Aggregation agg;
    if (!parse_aggregation(agg)) return false;
    item = std::move(agg);
    return true;
  }
  ColumnRef ref;
  if (!parse_column_ref(ref)) return false;
  item = std::move(ref);
  return true;
}

/// Parses `fn(column)` or `fn(*)`.
/// MUST reject unknown functions and wildcard use outside size(*).
/// Inputs are tokens; outputs are Aggregation or errors.
bool Parser::parse_aggregation(Aggregation& agg) {
  size_t start = current_.pos;
  if (!is_aggregation_function(current_.text)) {
    return set_error("Unknown aggregation function '" + current_.text + "'");
  }
  agg.function = util::to_lower(current_.text);
  advance();
  if (!consume(TokenType::LParen, "Expected ( after aggregation function")) return false;
  if (current_.type == TokenType::Star) {
    if (agg.function != "size") {
      // WHY: only row counting is meaningful over every column at once.
      return set_error(ErrorKind::AggregationOnWildcardDisallowed,
                       "You cannot use * with aggregation functions except size(*)");
    }
    agg.column.reset();
    advance();
  } else {
    ColumnRef ref;
    if (!parse_column_ref(ref)) return false;
    agg.column = std::move(ref);
  }
  if (!consume(TokenType::RParen, "Expected ) to close aggregation")) return false;
  agg.span = Span{start, last_end_};
  return true;
}

/// Parses `name`, `[name]`, `#N`, `alias.name`, or `alias.[name]`.
/// MUST treat bracketed text as a name even when it is all digits.
/// Inputs are tokens; outputs are ColumnRef or errors.
bool Parser::parse_column_ref(ColumnRef& ref) {
  size_t start = current_.pos;
  if (current_.type == TokenType::Identifier && peek().type == TokenType::LParen) {
    if (is_aggregation_function(current_.text)) {
      return set_error("Aggregation " + util::to_lower(current_.text) + "() is not allowed here");
    }
    return set_error("Unknown function '" + current_.text + "'");
  }
  if (current_.type == TokenType::Identifier && peek().type == TokenType::Dot) {
    ref.qualifier = current_.text;
    advance();
    advance();
    if (current_.type == TokenType::Identifier) {
      ref.kind = ColumnRef::Kind::Name;
    } else if (current_.type == TokenType::BracketName) {
      ref.kind = ColumnRef::Kind::Bracketed;
    } else {
      return set_error("Expected column name after " + *ref.qualifier + ".");
    }
    ref.name = current_.text;
    advance();
    ref.span = Span{start, last_end_};
    return true;
  }
  if (current_.type == TokenType::Identifier) {
    ref.kind = ColumnRef::Kind::Name;
    ref.name = current_.text;
  } else if (current_.type == TokenType::BracketName) {
    ref.kind = ColumnRef::Kind::Bracketed;
    ref.name = current_.text;
  } else if (current_.type == TokenType::IndexRef) {
    auto index = util::parse_int64(current_.text);
    if (!index.has_value()) {
      return set_error("Column index is too large");
    }
    ref.kind = ColumnRef::Kind::Index;
    ref.index = static_cast<size_t>(*index);
    ref.name = "#" + current_.text;
  } else {
    return set_error("Expected column name, [column], or #index");
  }
  advance();
  ref.span = Span{start, last_end_};
  return true;
}

}  // namespace etlq
