#include "lexer.h"

#include <cctype>

#include "../util/string_util.h"

namespace etlq {

Lexer::Lexer(const std::string& input) : input_(input) {}

Token Lexer::next() {
  skip_ws();
  if (pos_ >= input_.size()) {
    return make_token(TokenType::End, "", pos_);
  }

  char c = input_[pos_];
  char n = pos_ + 1 < input_.size() ? input_[pos_ + 1] : '\0';
  if (c == ',') {
    ++pos_;
    return make_token(TokenType::Comma, ",", pos_ - 1);
  }
  if (c == '.') {
    ++pos_;
    return make_token(TokenType::Dot, ".", pos_ - 1);
  }
  if (c == '(') {
    ++pos_;
    return make_token(TokenType::LParen, "(", pos_ - 1);
  }
  if (c == ')') {
    ++pos_;
    return make_token(TokenType::RParen, ")", pos_ - 1);
  }
  if (c == ';') {
    ++pos_;
    return make_token(TokenType::Semicolon, ";", pos_ - 1);
  }
  if (c == '*') {
    ++pos_;
    return make_token(TokenType::Star, "*", pos_ - 1);
  }
  if (c == '=') {
    ++pos_;
    return make_token(TokenType::Equal, "=", pos_ - 1);
  }
  if (c == '!' && n == '=') {
    pos_ += 2;
    return make_token(TokenType::NotEqual, "!=", pos_ - 2);
  }
  if (c == '<') {
    if (n == '>') {
      pos_ += 2;
      return make_token(TokenType::NotEqual, "<>", pos_ - 2);
    }
    if (n == '=') {
      pos_ += 2;
      return make_token(TokenType::LessEqual, "<=", pos_ - 2);
    }
    ++pos_;
    return make_token(TokenType::Less, "<", pos_ - 1);
  }
  if (c == '>') {
    if (n == '=') {
      pos_ += 2;
      return make_token(TokenType::GreaterEqual, ">=", pos_ - 2);
    }
    ++pos_;
    return make_token(TokenType::Greater, ">", pos_ - 1);
  }
  if (c == '\'' || c == '\"') {
    return lex_string();
  }
  if (c == '[') {
    return lex_bracket_name();
  }
  if (c == '{') {
    return lex_datasource();
  }
  if (c == '#') {
    return lex_index();
  }
  if (std::isdigit(static_cast<unsigned char>(c)) ||
      (c == '-' && std::isdigit(static_cast<unsigned char>(n)))) {
    return lex_number();
  }
  if (is_ident_start(c)) {
    return lex_identifier_or_keyword();
  }

  // WHY: advance on unknown input to avoid infinite loops on malformed queries.
  ++pos_;
  return make_token(TokenType::Invalid, std::string(1, c), pos_ - 1);
}

Token Lexer::lex_string() {
  size_t start = pos_;
  char quote = input_[pos_++];
  std::string out;
  while (pos_ < input_.size()) {
    char c = input_[pos_++];
    if (c == quote) {
      if (pos_ < input_.size() && input_[pos_] == quote) {
        out.push_back(quote);
        ++pos_;
        continue;
      }
      return make_token(TokenType::String, out, start);
    }
    out.push_back(c);
  }
  return make_token(TokenType::Invalid, input_.substr(start), start);
}

Token Lexer::lex_bracket_name() {
  size_t start = pos_++;
  size_t close = input_.find(']', pos_);
  if (close == std::string::npos) {
    pos_ = input_.size();
    return make_token(TokenType::Invalid, input_.substr(start), start);
  }
  std::string out = input_.substr(pos_, close - pos_);
  pos_ = close + 1;
  return make_token(TokenType::BracketName, out, start);
}

Token Lexer::lex_datasource() {
  size_t start = pos_++;
  size_t close = input_.find('}', pos_);
  if (close == std::string::npos) {
    pos_ = input_.size();
    return make_token(TokenType::Invalid, input_.substr(start), start);
  }
  std::string out = input_.substr(pos_, close - pos_);
  pos_ = close + 1;
  return make_token(TokenType::Datasource, out, start);
}

Token Lexer::lex_index() {
  size_t start = pos_++;
  std::string out;
  while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_]))) {
    out.push_back(input_[pos_++]);
  }
  if (out.empty()) {
    return make_token(TokenType::Invalid, "#", start);
  }
  return make_token(TokenType::IndexRef, out, start);
}

Token Lexer::lex_identifier_or_keyword() {
  size_t start = pos_;
  std::string out;
  while (pos_ < input_.size() && is_ident_char(input_[pos_])) {
    out.push_back(input_[pos_++]);
  }
  std::string upper = util::to_upper(out);
  if (upper == "SELECT") return make_token(TokenType::KeywordSelect, out, start);
  if (upper == "DISTINCT") return make_token(TokenType::KeywordDistinct, out, start);
  if (upper == "INTO") return make_token(TokenType::KeywordInto, out, start);
  if (upper == "FROM") return make_token(TokenType::KeywordFrom, out, start);
  if (upper == "AS") return make_token(TokenType::KeywordAs, out, start);
  if (upper == "JOIN") return make_token(TokenType::KeywordJoin, out, start);
  if (upper == "INNER") return make_token(TokenType::KeywordInner, out, start);
  if (upper == "LEFT") return make_token(TokenType::KeywordLeft, out, start);
  if (upper == "RIGHT") return make_token(TokenType::KeywordRight, out, start);
  if (upper == "FULL") return make_token(TokenType::KeywordFull, out, start);
  if (upper == "OUTER") return make_token(TokenType::KeywordOuter, out, start);
  if (upper == "ON") return make_token(TokenType::KeywordOn, out, start);
  if (upper == "WHERE") return make_token(TokenType::KeywordWhere, out, start);
  if (upper == "AND") return make_token(TokenType::KeywordAnd, out, start);
  if (upper == "OR") return make_token(TokenType::KeywordOr, out, start);
  if (upper == "NOT") return make_token(TokenType::KeywordNot, out, start);
  if (upper == "LIKE") return make_token(TokenType::KeywordLike, out, start);
  if (upper == "GROUP") return make_token(TokenType::KeywordGroup, out, start);
  if (upper == "ORDER") return make_token(TokenType::KeywordOrder, out, start);
  if (upper == "BY") return make_token(TokenType::KeywordBy, out, start);
  if (upper == "ASC") return make_token(TokenType::KeywordAsc, out, start);
  if (upper == "DESC") return make_token(TokenType::KeywordDesc, out, start);
  if (upper == "LIMIT") return make_token(TokenType::KeywordLimit, out, start);
  if (upper == "TAIL") return make_token(TokenType::KeywordTail, out, start);
  if (upper == "INSERT") return make_token(TokenType::KeywordInsert, out, start);
  if (upper == "VALUES") return make_token(TokenType::KeywordValues, out, start);
  if (upper == "UPDATE") return make_token(TokenType::KeywordUpdate, out, start);
  if (upper == "SET") return make_token(TokenType::KeywordSet, out, start);
  if (upper == "DELETE") return make_token(TokenType::KeywordDelete, out, start);
  return make_token(TokenType::Identifier, out, start);
}

Token Lexer::lex_number() {
  size_t start = pos_;
  std::string out;
  if (input_[pos_] == '-') {
    out.push_back(input_[pos_++]);
  }
  while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_]))) {
    out.push_back(input_[pos_++]);
  }
  if (pos_ + 1 < input_.size() && input_[pos_] == '.' &&
      std::isdigit(static_cast<unsigned char>(input_[pos_ + 1]))) {
    out.push_back(input_[pos_++]);
    while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_]))) {
      out.push_back(input_[pos_++]);
    }
  }
  return make_token(TokenType::Number, out, start);
}

void Lexer::skip_ws() {
  while (pos_ < input_.size()) {
    char c = input_[pos_];
    if (std::isspace(static_cast<unsigned char>(c))) {
      ++pos_;
      continue;
    }
    if (c == '-' && pos_ + 1 < input_.size() && input_[pos_ + 1] == '-') {
      while (pos_ < input_.size() && input_[pos_] != '\n') {
        ++pos_;
      }
      continue;
    }
    break;
  }
}

Token Lexer::make_token(TokenType type, std::string text, size_t start) {
  while (line_scan_pos_ < start && line_scan_pos_ < input_.size()) {
    if (input_[line_scan_pos_] == '\n') {
      ++line_;
      line_start_ = line_scan_pos_ + 1;
    }
    ++line_scan_pos_;
  }
  Token token;
  token.type = type;
  token.text = std::move(text);
  token.pos = start;
  token.line = line_;
  token.column = start - line_start_ + 1;
  token.length = pos_ > start ? pos_ - start : 0;
  return token;
}

bool Lexer::is_ident_start(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool Lexer::is_ident_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

}  // namespace etlq
