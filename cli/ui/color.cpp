#include "color.h"

namespace etlq::cli {

const char* style_code(Style style) {
  switch (style) {
    case Style::Error: return "\033[31m";
    case Style::Caret: return "\033[1;33m";
    case Style::StepLog: return "\033[2m";
    case Style::LoadSummary: return "\033[32m";
    case Style::Header: return "\033[1m";
    case Style::NullCell: return "\033[2;3m";
    case Style::Prompt: return "\033[34m";
    case Style::ContinuationPrompt: return "\033[36m";
    case Style::JsonString: return "\033[32m";
    case Style::JsonNumber: return "\033[36m";
    case Style::JsonLiteral: return "\033[33m";
    case Style::JsonNull: return "\033[35m";
    case Style::JsonPunctuation: return "\033[2m";
  }
  return kReset;
}

std::string paint(const std::string& text, Style style, bool enabled) {
  if (!enabled || text.empty()) return text;
  return std::string(style_code(style)) + text + kReset;
}

}  // namespace etlq::cli
