#pragma once

#include <optional>
#include <string>

#include "ast.h"
#include "etlq/errors.h"

namespace etlq {

/// Describes a parse failure with a message and source location.
/// MUST report positions relative to the original input string.
/// Inputs are parser diagnostics; outputs are error details only.
struct ParseError {
  std::string message;
  std::string token;
  size_t position = 0;
  size_t line = 1;
  size_t column = 1;
  ErrorKind kind = ErrorKind::SyntaxError;
};

/// Wraps either a parsed Statement or a ParseError.
/// MUST contain exactly one of statement or error.
struct ParseResult {
  std::optional<Statement> statement;
  std::optional<ParseError> error;
};

/// Parses one `;`-terminated statement into an AST.
/// MUST return errors without throwing on invalid syntax.
/// Inputs are query text; outputs are ParseResult with optional error.
ParseResult parse_query(const std::string& input);

/// Parses like parse_query but throws SyntaxError on failure.
Statement parse_statement(const std::string& input);

}  // namespace etlq
