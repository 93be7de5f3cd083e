#pragma once

#include <string>

namespace etlq::cli {

constexpr const char* kReset = "\033[0m";

/// What a piece of CLI output means; each role maps to one ANSI style.
/// MUST keep every role's code a valid SGR sequence so terminals never see raw bytes.
enum class Style {
  Error,
  Caret,
  StepLog,
  LoadSummary,
  Header,
  NullCell,
  Prompt,
  ContinuationPrompt,
  JsonString,
  JsonNumber,
  JsonLiteral,
  JsonNull,
  JsonPunctuation
};

/// Returns the SGR escape for a role.
const char* style_code(Style style);

/// Wraps text in the role's escape and a reset when enabled; returns text untouched otherwise.
std::string paint(const std::string& text, Style style, bool enabled);

}  // namespace etlq::cli
