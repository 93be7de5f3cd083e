#pragma once

#include <cstddef>
#include <string>

namespace etlq {

/// Enumerates lexical tokens produced by the query lexer.
/// MUST remain consistent with parser expectations and keyword mapping.
/// Inputs are characters; outputs are token kinds with no side effects.
enum class TokenType {
  Identifier,
  BracketName,
  IndexRef,
  String,
  Number,
  Datasource,
  Comma,
  Dot,
  LParen,
  RParen,
  Semicolon,
  Star,
  End,
  Invalid,
  KeywordSelect,
  KeywordDistinct,
  KeywordInto,
  KeywordFrom,
  KeywordAs,
  KeywordJoin,
  KeywordInner,
  KeywordLeft,
  KeywordRight,
  KeywordFull,
  KeywordOuter,
  KeywordOn,
  KeywordWhere,
  KeywordAnd,
  KeywordOr,
  KeywordNot,
  KeywordLike,
  KeywordGroup,
  KeywordOrder,
  KeywordBy,
  KeywordAsc,
  KeywordDesc,
  KeywordLimit,
  KeywordTail,
  KeywordInsert,
  KeywordValues,
  KeywordUpdate,
  KeywordSet,
  KeywordDelete,
  Equal,
  NotEqual,
  Less,
  LessEqual,
  Greater,
  GreaterEqual
};

/// Represents a single token with source text and position metadata.
/// MUST track byte positions and 1-based line/column for error reporting.
/// Inputs are lexer output; outputs are consumed by the parser.
struct Token {
  TokenType type = TokenType::End;
  std::string text;
  size_t pos = 0;
  size_t line = 1;
  size_t column = 1;
  // Raw source length, which differs from text for quoted or bracketed forms.
  size_t length = 0;
};

}  // namespace etlq
