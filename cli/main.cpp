#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

#include <unistd.h>

#include "cli_args.h"
#include "cli_utils.h"
#include "config.h"
#include "etlq/adapters.h"
#include "etlq/errors.h"
#include "query_runner.h"
#include "repl/core/repl.h"
#include "util/string_util.h"

using namespace etlq::cli;

namespace {

/// Merges config-file settings under command line flags.
/// MUST let every explicitly passed flag win over the file.
void apply_settings(const CliSettings& settings, CliOptions& options) {
  if (settings.output_mode.has_value() && !options.output_mode_set) {
    options.output_mode = *settings.output_mode;
  }
  if (settings.max_rows.has_value() && !options.max_rows_set) {
    options.max_rows = *settings.max_rows;
  }
  if (settings.color.has_value() && !options.color_set) {
    options.color = *settings.color;
  }
  if (settings.http_timeout_ms.has_value() && !options.timeout_set) {
    options.timeout_ms = *settings.http_timeout_ms;
  }
}

}  // namespace

int main(int argc, char** argv) {
  if (argc == 1) {
    print_startup_help(std::cout);
    return 0;
  }

  CliOptions options;
  std::string arg_error;
  if (!parse_cli_args(argc, argv, options, arg_error)) {
    std::cerr << "Error: " << arg_error << std::endl;
    return 1;
  }
  if (options.show_help) {
    print_help(std::cout);
    return 0;
  }

  bool stdout_tty = isatty(fileno(stdout)) != 0;
  bool stdin_tty = isatty(fileno(stdin)) != 0;

  std::string config_path = options.config_path.empty() ? resolve_config_path() : options.config_path;
  if (!options.config_path.empty() && !std::filesystem::exists(config_path)) {
    etlq::QueryError missing(etlq::ErrorKind::ConfigError, "Config file not found: " + config_path);
    std::cerr << format_error(missing, "", options.color && stdout_tty) << std::endl;
    return 1;
  }
  CliSettings settings;
  std::string config_error;
  if (!load_config(config_path, settings, config_error)) {
    etlq::QueryError invalid(etlq::ErrorKind::ConfigError, config_error + " (" + config_path + ")");
    std::cerr << format_error(invalid, "", options.color && stdout_tty) << std::endl;
    return 1;
  }
  apply_settings(settings, options);

  RunConfig config;
  config.output_mode = options.output_mode;
  config.max_rows = options.max_rows;
  config.explain = options.explain;
  config.verbose = options.verbose;
  // WHY: ANSI escapes corrupt piped output, so color follows the terminal.
  config.color = options.color && stdout_tty;
  config.highlight = settings.highlight.value_or(true) && stdout_tty;

  etlq::AdapterOptions adapter_options;
  adapter_options.http_timeout_ms = options.timeout_ms;
  adapter_options.csv_delimiter = settings.csv_delimiter.value_or(',');
  etlq::AdapterRegistry registry = etlq::make_default_registry(adapter_options);

  if (options.interactive) {
    return run_repl(config, registry, std::cin, std::cout, std::cerr, stdin_tty && stdout_tty);
  }

  std::string query = options.query;
  try {
    if (!options.query_file.empty()) {
      query = read_file(options.query_file);
    } else if (query.empty() && !stdin_tty) {
      query = read_stdin();
    }
  } catch (const std::exception& ex) {
    std::cerr << format_error(ex, "", config.color) << std::endl;
    return 1;
  }
  if (etlq::util::trim_ws(query).empty()) {
    std::cerr << "Error: no query given (use --query, --query-file, or --interactive)" << std::endl;
    return 1;
  }
  return run_statement(query, config, registry, std::cout, std::cerr, stdout_tty);
}
