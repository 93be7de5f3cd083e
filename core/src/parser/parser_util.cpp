#include "parser_internal.h"

#include "../util/string_util.h"

namespace etlq {

/// Consumes a token of the expected type or sets a parse error.
/// MUST advance the token stream on success.
/// Inputs are token type/message; outputs are success or error.
bool Parser::consume(TokenType type, const std::string& message) {
  if (current_.type != type) {
    return set_error(message);
  }
  advance();
  return true;
}

bool Parser::set_error(const std::string& message) {
  return set_error(ErrorKind::SyntaxError, message);
}

/// Records the first parse error for reporting.
/// MUST preserve the earliest error; lexer-level problems override the message.
/// Inputs are kind/message; outputs are false with stored error.
bool Parser::set_error(ErrorKind kind, const std::string& message) {
  if (error_.has_value()) return false;
  ParseError err;
  err.kind = kind;
  err.message = message;
  err.token = current_.text;
  err.position = current_.pos;
  err.line = current_.line;
  err.column = current_.column;
  if (current_.type == TokenType::Invalid) {
    char first = current_.text.empty() ? '\0' : current_.text[0];
    if (first == '\'' || first == '"') {
      err.message = "Unterminated string literal";
    } else if (first == '[') {
      err.message = "Unterminated bracketed column name";
    } else if (first == '{') {
      err.message = "Unterminated datasource literal";
    } else if (first == '#') {
      err.message = "Expected column index digits after #";
    } else {
      err.message = "Unexpected character '" + current_.text + "'";
    }
  } else if (current_.type == TokenType::End) {
    err.message = message + " but reached end of input";
  }
  error_ = err;
  return false;
}

/// Produces a ParseResult using the recorded error.
/// MUST return an empty statement with the stored error.
ParseResult Parser::error_result() {
  ParseResult res;
  res.error = error_;
  if (!res.error.has_value()) {
    res.error = ParseError{"Invalid statement", current_.text, current_.pos, current_.line, current_.column,
                           ErrorKind::SyntaxError};
  }
  return res;
}

/// Advances to the next token in the input stream.
/// MUST be called after consuming tokens to keep state in sync.
/// Inputs are internal state; outputs are updated current_.
void Parser::advance() {
  last_end_ = current_.pos + current_.length;
  if (has_peek_) {
    current_ = peek_;
    has_peek_ = false;
    return;
  }
  current_ = lexer_.next();
}

/// Peeks one token ahead without consuming it.
/// MUST preserve current_ and return a cached lookahead.
Token Parser::peek() {
  if (!has_peek_) {
    peek_ = lexer_.next();
    has_peek_ = true;
  }
  return peek_;
}

bool Parser::at_column_start() const {
  return current_.type == TokenType::Identifier || current_.type == TokenType::BracketName ||
         current_.type == TokenType::IndexRef;
}

bool Parser::is_aggregation_function(const std::string& name) {
  static const char* const kFunctions[] = {"sum",   "mean", "avg",   "median", "min", "max",  "count",
                                           "nunique", "std", "var", "first", "last", "prod", "size"};
  std::string lower = util::to_lower(name);
  for (const char* fn : kFunctions) {
    if (lower == fn) return true;
  }
  return false;
}

}  // namespace etlq
