#pragma once

#include <cstddef>
#include <exception>
#include <string>

#include "etlq/relation.h"

namespace etlq::cli {

/// Output settings shared by one-shot runs and the REPL.
/// MUST keep output_mode one of duckbox/json/csv/plain.
struct RunConfig {
  std::string output_mode = "duckbox";
  size_t max_rows = 40;
  bool color = true;
  bool highlight = true;
  bool explain = false;
  bool verbose = false;
};

/// Reads a file into memory for --query-file.
/// MUST throw on missing/unreadable files and MUST not perform network IO.
/// Inputs are a path; outputs are contents; side effects are file reads/errors.
std::string read_file(const std::string& path);
/// Reads all stdin content for piped queries.
std::string read_stdin();
/// Appends the terminating `;` when the statement lacks one.
/// MUST leave already-terminated text unchanged apart from trailing whitespace.
std::string ensure_terminated(const std::string& query);
/// Reports whether buffered REPL input ends a statement (a `;` outside quotes and comments).
bool statement_complete(const std::string& text);
/// Applies ANSI coloring to JSON for readability when enabled.
/// MUST NOT alter JSON semantics and MUST be disabled for non-TTY output.
/// Inputs are JSON text and a flag; outputs are colored text with no side effects.
std::string colorize_json(const std::string& input, bool enable);
/// Cleans up pasted lines by removing prompts and surrounding whitespace.
std::string sanitize_pasted_line(std::string line);

/// Formats a failure as `Error[<kind>]: message`, adding the offending line and
/// a caret under the token for syntax errors.
/// Inputs are the exception and the query text; outputs are text without a trailing newline.
std::string format_error(const std::exception& error, const std::string& query, bool color);

/// Renders a relation in the configured output mode.
/// MUST honor max_rows only for duckbox; json/csv/plain always carry every row.
/// Inputs are relation/config/tty flag; outputs are text without a trailing newline.
std::string render_relation(const Relation& relation, const RunConfig& config, bool is_tty);

}  // namespace etlq::cli
