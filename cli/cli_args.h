#pragma once

#include <cstddef>
#include <ostream>
#include <string>

namespace etlq::cli {

/// Captures CLI arguments so main can dispatch without re-parsing raw argv.
/// MUST keep defaults consistent with CLI behavior and MUST validate after parsing.
/// Inputs are argv; outputs are populated fields with no side effects by itself.
struct CliOptions {
  std::string query;
  std::string query_file;
  std::string config_path;
  bool interactive = false;
  bool explain = false;
  bool verbose = false;
  bool show_help = false;

  // Settings below may also come from the config file; the *_set flags record
  // that the command line overrides it.
  std::string output_mode = "duckbox";
  bool output_mode_set = false;
  bool color = true;
  bool color_set = false;
  size_t max_rows = 40;
  bool max_rows_set = false;
  int timeout_ms = 5000;
  bool timeout_set = false;
};

/// Prints the brief startup help shown when no arguments are provided.
/// MUST remain user-facing and MUST not throw on stream failures.
/// Inputs are the output stream; side effects are writing help text.
void print_startup_help(std::ostream& os);
/// Prints the full help text for explicit --help.
void print_help(std::ostream& os);
/// Parses CLI flags into options and reports a user-facing error string.
/// MUST leave options in a valid state and MUST return false on invalid flags.
/// Inputs are argc/argv; outputs are options/error with no external side effects.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error);

/// Accepts duckbox, json, csv, and plain.
bool is_output_mode(const std::string& mode);
/// Parses a row cap where "inf" means unlimited (0).
bool parse_max_rows(const std::string& text, size_t& out);

}  // namespace etlq::cli
