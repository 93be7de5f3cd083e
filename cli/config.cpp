#include "config.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "cli_args.h"
#include "util/string_util.h"

namespace etlq::cli {

namespace {

std::string get_env(const char* name) {
  if (const char* value = std::getenv(name)) {
    if (*value) return value;
  }
  return {};
}

bool parse_bool(const std::string& raw, bool& out) {
  std::string lower = util::to_lower(raw);
  if (lower == "true") {
    out = true;
    return true;
  }
  if (lower == "false") {
    out = false;
    return true;
  }
  return false;
}

std::string parse_string_value(const std::string& raw, bool& ok) {
  std::string trimmed = util::trim_ws(raw);
  if (trimmed.empty()) {
    ok = false;
    return {};
  }
  if ((trimmed.front() == '"' || trimmed.front() == '\'') && trimmed.size() >= 2 &&
      trimmed.back() == trimmed.front()) {
    ok = true;
    return trimmed.substr(1, trimmed.size() - 2);
  }
  ok = true;
  return trimmed;
}

/// Drops a trailing `# comment` that sits outside quotes.
std::string strip_comment(const std::string& line) {
  char quote = 0;
  for (size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (quote) {
      if (c == quote) quote = 0;
    } else if (c == '"' || c == '\'') {
      quote = c;
    } else if (c == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

}  // namespace

std::string resolve_config_path() {
  std::string override = get_env("ETLQ_CONFIG");
  if (!override.empty()) {
    return override;
  }
  std::string xdg_config = get_env("XDG_CONFIG_HOME");
  if (!xdg_config.empty()) {
    return (std::filesystem::path(xdg_config) / "etlq" / "config.toml").string();
  }
  std::string home = get_env("HOME");
  if (!home.empty()) {
    return (std::filesystem::path(home) / ".config" / "etlq" / "config.toml").string();
  }
  return "etlq.config.toml";
}

bool load_config(const std::string& path, CliSettings& out, std::string& error) {
  out = CliSettings{};
  if (path.empty() || !std::filesystem::exists(path)) {
    return true;
  }
  std::ifstream in(path);
  if (!in) {
    error = "Failed to open config: " + path;
    return false;
  }
  std::string section;
  std::string line;
  size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    std::string trimmed = util::trim_ws(strip_comment(line));
    if (trimmed.empty()) continue;
    if (trimmed.front() == '[' && trimmed.back() == ']') {
      section = util::trim_ws(trimmed.substr(1, trimmed.size() - 2));
      continue;
    }
    size_t eq = trimmed.find('=');
    if (eq == std::string::npos) {
      error = "Expected key = value at line " + std::to_string(line_no);
      return false;
    }
    std::string key = util::trim_ws(trimmed.substr(0, eq));
    std::string value = util::trim_ws(trimmed.substr(eq + 1));
    if (key.empty()) {
      error = "Missing key at line " + std::to_string(line_no);
      return false;
    }
    std::string full_key = section.empty() ? key : section + "." + key;
    std::string invalid = "Invalid " + full_key + " at line " + std::to_string(line_no);
    bool ok = false;
    if (full_key == "cli.output_mode") {
      std::string parsed = util::to_lower(parse_string_value(value, ok));
      if (!ok || !is_output_mode(parsed)) {
        error = invalid;
        return false;
      }
      out.output_mode = parsed;
    } else if (full_key == "cli.max_rows") {
      size_t parsed = 0;
      if (!parse_max_rows(parse_string_value(value, ok), parsed) || !ok) {
        error = invalid;
        return false;
      }
      out.max_rows = parsed;
    } else if (full_key == "cli.highlight" || full_key == "cli.color") {
      bool parsed = false;
      if (!parse_bool(value, parsed)) {
        error = invalid;
        return false;
      }
      if (full_key == "cli.highlight") {
        out.highlight = parsed;
      } else {
        out.color = parsed;
      }
    } else if (full_key == "adapters.http.timeout_ms") {
      auto parsed = util::parse_int64(value);
      if (!parsed.has_value() || *parsed <= 0 || *parsed > 3600000) {
        error = invalid;
        return false;
      }
      out.http_timeout_ms = static_cast<int>(*parsed);
    } else if (full_key == "adapters.csv.delimiter") {
      std::string parsed = parse_string_value(value, ok);
      if (parsed == "\\t") parsed = "\t";
      if (!ok || parsed.size() != 1) {
        error = invalid;
        return false;
      }
      out.csv_delimiter = parsed[0];
    } else {
      error = "Unknown config key " + full_key + " at line " + std::to_string(line_no);
      return false;
    }
  }
  return true;
}

}  // namespace etlq::cli
