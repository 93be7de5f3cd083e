#include "cli_utils.h"

#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "etlq/adapters.h"
#include "etlq/errors.h"
#include "render/duckbox_renderer.h"
#include "ui/color.h"
#include "util/string_util.h"

namespace etlq::cli {

namespace {

struct ScanState {
  bool ends_with_semicolon = false;
  bool in_comment = false;
};

/// Walks query text tracking quotes and `--` comments.
/// Inputs are raw text; outputs describe how the text ends.
ScanState scan_query(const std::string& text) {
  ScanState state;
  char quote = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (state.in_comment) {
      if (c == '\n') state.in_comment = false;
      continue;
    }
    if (quote) {
      if (c == quote) quote = 0;
      state.ends_with_semicolon = false;
      continue;
    }
    if (c == '\'' || c == '"') {
      quote = c;
      state.ends_with_semicolon = false;
    } else if (c == '-' && i + 1 < text.size() && text[i + 1] == '-') {
      state.in_comment = true;
      ++i;
    } else if (c == ';') {
      state.ends_with_semicolon = true;
    } else if (!std::isspace(static_cast<unsigned char>(c))) {
      state.ends_with_semicolon = false;
    }
  }
  if (quote) state.ends_with_semicolon = false;
  return state;
}

std::string line_at(const std::string& text, size_t line_no) {
  size_t start = 0;
  for (size_t line = 1; line < line_no; ++line) {
    size_t next = text.find('\n', start);
    if (next == std::string::npos) return "";
    start = next + 1;
  }
  size_t end = text.find('\n', start);
  std::string out = text.substr(start, end == std::string::npos ? std::string::npos : end - start);
  if (!out.empty() && out.back() == '\r') out.pop_back();
  return out;
}

}  // namespace

std::string read_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

std::string read_stdin() {
  std::ostringstream buffer;
  buffer << std::cin.rdbuf();
  return buffer.str();
}

std::string ensure_terminated(const std::string& query) {
  std::string value = query;
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
    value.pop_back();
  }
  ScanState state = scan_query(value);
  if (state.ends_with_semicolon) return value;
  // WHY: a `;` appended to a trailing comment would be swallowed by it.
  return value + (state.in_comment ? "\n;" : ";");
}

bool statement_complete(const std::string& text) {
  return scan_query(text).ends_with_semicolon;
}

std::string colorize_json(const std::string& input, bool enable) {
  if (!enable) return input;
  std::string out;
  out.reserve(input.size() * 2);
  bool in_string = false;
  bool escape = false;
  for (size_t i = 0; i < input.size(); ++i) {
    char c = input[i];
    if (in_string) {
      if (escape) {
        escape = false;
      } else if (c == '\\') {
        escape = true;
      } else if (c == '"') {
        in_string = false;
        out += '"';
        out += kReset;
        continue;
      }
      out += c;
      continue;
    }

    if (c == '"') {
      in_string = true;
      out += style_code(Style::JsonString);
      out += '"';
      continue;
    }

    if (std::isdigit(static_cast<unsigned char>(c)) || c == '-') {
      out += style_code(Style::JsonNumber);
      while (i < input.size() &&
             (std::isdigit(static_cast<unsigned char>(input[i])) || input[i] == '.' || input[i] == '-' ||
              input[i] == 'e' || input[i] == 'E' || input[i] == '+')) {
        out += input[i++];
      }
      --i;
      out += kReset;
      continue;
    }

    if (input.compare(i, 4, "true") == 0 || input.compare(i, 5, "false") == 0) {
      size_t len = input.compare(i, 4, "true") == 0 ? 4 : 5;
      out += style_code(Style::JsonLiteral);
      out.append(input, i, len);
      out += kReset;
      i += len - 1;
      continue;
    }

    if (input.compare(i, 4, "null") == 0) {
      out += style_code(Style::JsonNull);
      out.append(input, i, 4);
      out += kReset;
      i += 3;
      continue;
    }

    if (c == '{' || c == '}' || c == '[' || c == ']' || c == ':' || c == ',') {
      out += style_code(Style::JsonPunctuation);
      out += c;
      out += kReset;
      continue;
    }

    out += c;
  }
  return out;
}

std::string sanitize_pasted_line(std::string line) {
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  if (line.rfind("etlq> ", 0) == 0) {
    line = line.substr(6);
  } else if (line.rfind("   > ", 0) == 0) {
    line = line.substr(5);
  }
  return util::trim_ws(line);
}

std::string format_error(const std::exception& error, const std::string& query, bool color) {
  std::ostringstream oss;
  const auto* query_error = dynamic_cast<const QueryError*>(&error);
  std::string headline = query_error ? "Error[" + std::string(error_kind_name(query_error->kind())) + "]: "
                                     : std::string("Error: ");
  oss << paint(headline + error.what(), Style::Error, color);

  const auto* syntax = dynamic_cast<const SyntaxError*>(&error);
  if (syntax) {
    std::string text = line_at(query, syntax->line());
    if (!text.empty()) {
      size_t caret = syntax->column() > 0 ? syntax->column() - 1 : 0;
      if (caret > text.size()) caret = text.size();
      oss << "\n  " << text << "\n  " << std::string(caret, ' ') << paint("^", Style::Caret, color);
    }
  }
  return oss.str();
}

std::string render_relation(const Relation& relation, const RunConfig& config, bool is_tty) {
  if (config.output_mode == "json") {
    return colorize_json(relation_to_json(relation, 2), config.color && is_tty);
  }
  if (config.output_mode == "csv" || config.output_mode == "plain") {
    std::ostringstream oss;
    write_csv(oss, relation, config.output_mode == "csv" ? ',' : '\t');
    std::string out = oss.str();
    if (!out.empty() && out.back() == '\n') out.pop_back();
    return out;
  }
  render::DuckboxOptions options;
  options.max_width = is_tty ? 0 : 120;
  options.max_rows = config.max_rows;
  options.highlight = config.highlight;
  options.is_tty = is_tty && config.color;
  return render::render_duckbox(relation, options);
}

}  // namespace etlq::cli
