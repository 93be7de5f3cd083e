#include "cli_args.h"

#include <string>

#include "util/string_util.h"

namespace etlq::cli {

/// Prints the startup help so users see baseline usage without flags.
/// MUST keep examples aligned with current CLI and MUST not throw on stream errors.
/// Inputs are the output stream; side effects are writing text to stdout/stderr.
void print_startup_help(std::ostream& os) {
  os << "etlq - query and move tabular data with SQL\n\n";
  os << "Usage:\n";
  os << "  etlq --query <query>\n";
  os << "  etlq --query-file <file>\n";
  os << "  etlq --interactive\n";
  os << "  etlq --mode duckbox|json|csv|plain\n";
  os << "  etlq --explain\n";
  os << "  etlq --max-rows <n|inf>\n";
  os << "  etlq --timeout-ms <n>\n";
  os << "  etlq --color=disabled\n\n";
  os << "Notes:\n";
  os << "  - Sources are written {type:path}, e.g. {csv:./sales.csv}.\n";
  os << "  - Built-in types: csv, json, parquet, html, http, https.\n";
  os << "  - SELECT ... INTO {type:path} writes the result instead of printing it.\n";
  os << "  - A bare name (FROM sales) means {table:sales}; the CLI registers no table adapter.\n\n";
  os << "Examples:\n";
  os << "  etlq --query \"SELECT region, sum(amount) FROM {csv:sales.csv} GROUP BY region;\"\n";
  os << "  etlq --query \"SELECT * INTO {json:out.json} FROM {csv:sales.csv} WHERE amount > 10;\"\n";
  os << "  etlq --interactive\n";
}

void print_help(std::ostream& os) {
  os << "Usage: etlq --query <query>\n";
  os << "       etlq --query-file <file>\n";
  os << "       etlq --interactive\n";
  os << "Options:\n";
  os << "  --mode duckbox|json|csv|plain  output format (default duckbox)\n";
  os << "  --explain                      print the plan as JSON instead of running it\n";
  os << "  --max-rows <n|inf>             rows shown in duckbox mode (default 40)\n";
  os << "  --timeout-ms <n>               timeout for http/https sources (default 5000)\n";
  os << "  --color=disabled               disable ANSI colors\n";
  os << "  --verbose                      report each plan step on stderr\n";
  os << "  --config <path>                read settings from this file\n";
  os << "  --help                         show this help\n";
  os << "Sources are written {type:path} (csv, json, parquet, html, http, https).\n";
  os << "A bare name such as FROM sales means {table:sales}, which the CLI does not provide.\n";
  os << "A missing trailing ';' is added automatically.\n";
}

bool is_output_mode(const std::string& mode) {
  return mode == "duckbox" || mode == "json" || mode == "csv" || mode == "plain";
}

bool parse_max_rows(const std::string& text, size_t& out) {
  std::string value = util::to_lower(util::trim_ws(text));
  if (value == "inf") {
    out = 0;
    return true;
  }
  auto parsed = util::parse_int64(value);
  if (!parsed.has_value() || *parsed < 0) return false;
  out = static_cast<size_t>(*parsed);
  return true;
}

/// Parses argv into typed options so main can dispatch consistently.
/// MUST return false for invalid flags or missing values.
/// Inputs are argc/argv; outputs are options/error and no external side effects.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    bool has_value = i + 1 < argc;
    if (arg == "--query" && has_value) {
      options.query = argv[++i];
    } else if (arg == "--query-file" && has_value) {
      options.query_file = argv[++i];
    } else if (arg == "--config" && has_value) {
      options.config_path = argv[++i];
    } else if (arg == "--interactive") {
      options.interactive = true;
    } else if (arg == "--explain") {
      options.explain = true;
    } else if (arg == "--verbose") {
      options.verbose = true;
    } else if (arg == "--mode" && has_value) {
      std::string mode = util::to_lower(argv[++i]);
      if (!is_output_mode(mode)) {
        error = "Invalid --mode value '" + mode + "' (use duckbox|json|csv|plain)";
        return false;
      }
      options.output_mode = mode;
      options.output_mode_set = true;
    } else if (arg == "--max-rows" && has_value) {
      if (!parse_max_rows(argv[++i], options.max_rows)) {
        error = "Invalid --max-rows value (use a non-negative integer or inf)";
        return false;
      }
      options.max_rows_set = true;
    } else if (arg == "--timeout-ms" && has_value) {
      auto timeout = util::parse_int64(argv[++i]);
      if (!timeout.has_value() || *timeout <= 0 || *timeout > 3600000) {
        // WHY: invalid timeouts must fail fast instead of silently disabling network limits.
        error = "Invalid --timeout-ms value (use a positive number of milliseconds)";
        return false;
      }
      options.timeout_ms = static_cast<int>(*timeout);
      options.timeout_set = true;
    } else if (arg == "--color=disabled") {
      options.color = false;
      options.color_set = true;
    } else if (arg == "--help" || arg == "-h") {
      options.show_help = true;
    } else if (arg == "--query" || arg == "--query-file" || arg == "--config" || arg == "--mode" ||
               arg == "--max-rows" || arg == "--timeout-ms") {
      error = "Missing value for " + arg;
      return false;
    } else {
      error = "Unknown argument: " + arg;
      return false;
    }
  }
  if (!options.query.empty() && !options.query_file.empty()) {
    error = "Use either --query or --query-file, not both";
    return false;
  }
  return true;
}

}  // namespace etlq::cli
