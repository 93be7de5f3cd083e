#pragma once

#include <string>

#include "tokens.h"

namespace etlq {

/// Tokenizes query input into a stream for the parser.
/// MUST be deterministic and MUST not skip meaningful characters.
/// Inputs are query strings; outputs are tokens with position metadata.
class Lexer {
 public:
  /// Constructs a lexer over a stable input string reference.
  /// MUST NOT outlive the referenced input buffer.
  explicit Lexer(const std::string& input);
  /// Produces the next token from the input stream.
  /// MUST advance the cursor and MUST return End at input exhaustion.
  /// Inputs are internal state; outputs are tokens with positions.
  Token next();

 private:
  /// Lexes a quoted string token where a doubled quote escapes itself.
  /// MUST return Invalid when the closing quote is missing.
  Token lex_string();
  /// Lexes `[any text]` as a literal column name.
  Token lex_bracket_name();
  /// Lexes `{type:path}` keeping the raw inner text.
  Token lex_datasource();
  /// Lexes `#N` positional column references.
  Token lex_index();
  /// Lexes identifiers and recognizes keyword forms.
  /// MUST map keywords case-insensitively and preserve original text.
  Token lex_identifier_or_keyword();
  /// Lexes an integer or decimal literal with an optional leading minus.
  Token lex_number();
  /// Skips whitespace and `--` line comments between tokens.
  void skip_ws();
  Token make_token(TokenType type, std::string text, size_t start);

  static bool is_ident_start(char c);
  static bool is_ident_char(char c);

  const std::string& input_;
  size_t pos_ = 0;
  // Incremental line tracking; token starts never move backwards.
  size_t line_scan_pos_ = 0;
  size_t line_ = 1;
  size_t line_start_ = 0;
};

}  // namespace etlq
