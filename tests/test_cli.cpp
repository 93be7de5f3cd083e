#include "test_harness.h"

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "cli_args.h"
#include "cli_utils.h"
#include "config.h"
#include "etlq/errors.h"
#include "query_runner.h"
#include "render/duckbox_renderer.h"
#include "repl/core/repl.h"
#include "test_utils.h"
#include "ui/color.h"

namespace {

using etlq::Relation;
using etlq::Value;

bool parse_args(std::vector<std::string> args, etlq::cli::CliOptions& options, std::string& error) {
  args.insert(args.begin(), "etlq");
  std::vector<char*> argv;
  for (auto& arg : args) argv.push_back(arg.data());
  return etlq::cli::parse_cli_args(static_cast<int>(argv.size()), argv.data(), options, error);
}

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

etlq::cli::RunConfig plain_config(const std::string& mode) {
  etlq::cli::RunConfig config;
  config.output_mode = mode;
  config.color = false;
  config.highlight = false;
  return config;
}

std::shared_ptr<MemoryStore> sales_store() {
  auto store = std::make_shared<MemoryStore>();
  store->put("sales", sales_relation());
  return store;
}

void test_cli_args_parse() {
  etlq::cli::CliOptions options;
  std::string error;
  expect_true(parse_args({"--query", "SELECT * FROM t;", "--mode", "JSON", "--max-rows", "inf", "--verbose"},
                         options, error),
              "valid flags parse");
  expect_str_eq(options.output_mode, "json", "mode lowercased");
  expect_true(options.output_mode_set, "mode recorded as explicit");
  expect_eq(options.max_rows, 0, "inf means unlimited");
  expect_true(options.verbose, "verbose flag");

  etlq::cli::CliOptions missing;
  expect_true(!parse_args({"--query"}, missing, error), "missing value rejected");
  expect_str_eq(error, "Missing value for --query", "missing value message");

  etlq::cli::CliOptions unknown;
  expect_true(!parse_args({"--frobnicate"}, unknown, error), "unknown flag rejected");
  expect_str_eq(error, "Unknown argument: --frobnicate", "unknown flag message");

  etlq::cli::CliOptions both;
  expect_true(!parse_args({"--query", "x", "--query-file", "y"}, both, error), "query and file conflict");

  etlq::cli::CliOptions bad_timeout;
  expect_true(!parse_args({"--timeout-ms", "0"}, bad_timeout, error), "zero timeout rejected");
  etlq::cli::CliOptions bad_mode;
  expect_true(!parse_args({"--mode", "xml"}, bad_mode, error), "unknown mode rejected");
}

void test_config_file() {
  auto path = temp_path("config.toml");
  write_string_to_file(path,
                       "# etlq settings\n"
                       "[cli]\n"
                       "output_mode = \"csv\"  # comment\n"
                       "max_rows = 15\n"
                       "color = false\n"
                       "[adapters.http]\n"
                       "timeout_ms = 2500\n"
                       "[adapters.csv]\n"
                       "delimiter = '\\t'\n");
  etlq::cli::CliSettings settings;
  std::string error;
  expect_true(etlq::cli::load_config(path.string(), settings, error), "valid config loads");
  expect_true(settings.output_mode == std::string("csv"), "output mode");
  expect_true(settings.max_rows == size_t{15}, "max rows");
  expect_true(settings.color == false, "color");
  expect_true(!settings.highlight.has_value(), "unset key stays unset");
  expect_true(settings.http_timeout_ms == 2500, "timeout");
  expect_true(settings.csv_delimiter == '\t', "escaped tab delimiter");

  write_string_to_file(path, "[cli]\nfavorite = 1\n");
  expect_true(!etlq::cli::load_config(path.string(), settings, error), "unknown key rejected");
  expect_str_eq(error, "Unknown config key cli.favorite at line 2", "unknown key message");

  write_string_to_file(path, "[cli]\nmax_rows = many\n");
  expect_true(!etlq::cli::load_config(path.string(), settings, error), "invalid value rejected");
  expect_str_eq(error, "Invalid cli.max_rows at line 2", "invalid value message");

  expect_true(etlq::cli::load_config(temp_path("absent.toml").string(), settings, error),
              "missing file is not an error");
  expect_true(!settings.output_mode.has_value(), "missing file yields defaults");
}

void test_statement_termination() {
  expect_str_eq(etlq::cli::ensure_terminated("SELECT * FROM t"), "SELECT * FROM t;", "semicolon appended");
  expect_str_eq(etlq::cli::ensure_terminated("SELECT * FROM t;  \n"), "SELECT * FROM t;", "already terminated");
  expect_str_eq(etlq::cli::ensure_terminated("SELECT * FROM t -- note"), "SELECT * FROM t -- note\n;",
                "semicolon placed after a trailing comment");
  expect_true(etlq::cli::statement_complete("SELECT 'a;b' FROM t;"), "complete statement");
  expect_true(!etlq::cli::statement_complete("SELECT 'a;"), "semicolon inside quotes");
  expect_true(!etlq::cli::statement_complete("SELECT a -- done;"), "semicolon inside comment");
}

void test_sanitize_pasted_line() {
  expect_str_eq(etlq::cli::sanitize_pasted_line("etlq> SELECT 1;\r"), "SELECT 1;", "prompt and CR removed");
  expect_str_eq(etlq::cli::sanitize_pasted_line("   > FROM t;"), "FROM t;", "continuation prompt removed");
  expect_str_eq(etlq::cli::sanitize_pasted_line("  WHERE x = 1  "), "WHERE x = 1", "whitespace trimmed");
}

void test_format_error() {
  std::string query = "SELECT *\nFROM sales WHERE;";
  try {
    etlq::execute_query(query, etlq::make_default_registry());
    expect_true(false, "syntax error expected");
  } catch (const etlq::SyntaxError& e) {
    std::string text = etlq::cli::format_error(e, query, false);
    expect_true(text.rfind("Error[SyntaxError]: ", 0) == 0, "kind prefix");
    expect_true(contains(text, "\n  FROM sales WHERE;\n"), "offending line echoed");
    expect_true(contains(text, "^"), "caret under the token");
  }
  etlq::QueryError plain(etlq::ErrorKind::ColumnNotFound, "Column 'x' not found");
  expect_str_eq(etlq::cli::format_error(plain, "", false), "Error[ColumnNotFound]: Column 'x' not found",
                "non-syntax error has no caret");
  std::runtime_error other("disk full");
  expect_str_eq(etlq::cli::format_error(other, "", false), "Error: disk full", "foreign exception");
}

void test_render_modes() {
  Relation relation = make_relation({"name", "score"}, {{std::string("a"), int64_t{1}}, {std::string("b"), Value{}}});
  expect_str_eq(etlq::cli::render_relation(relation, plain_config("csv"), false), "name,score\na,1\nb,",
                "csv output");
  expect_str_eq(etlq::cli::render_relation(relation, plain_config("plain"), false), "name\tscore\na\t1\nb\t",
                "plain output is tab separated");
  std::string json = etlq::cli::render_relation(relation, plain_config("json"), true);
  expect_true(contains(json, "\"score\": null"), "json nulls");
  expect_true(!contains(json, "\033["), "color off means no escapes");
}

void test_duckbox_layout() {
  Relation relation = make_relation({"region", "amount"}, {{std::string("east"), int64_t{10}},
                                                           {std::string("west"), Value{}},
                                                           {std::string("east"), int64_t{20}}});
  etlq::render::DuckboxOptions options;
  options.max_width = 80;
  options.max_rows = 0;
  options.highlight = false;
  std::string full = etlq::render::render_duckbox(relation, options);
  expect_true(full.rfind("┌", 0) == 0, "box top");
  expect_true(contains(full, "NULL"), "NULL cell rendered");
  expect_true(contains(full, "│     10 │"), "numbers right aligned");
  expect_true(full.size() >= 17 && full.substr(full.size() - 17) == "3 rows, 2 columns", "footer");

  options.max_rows = 2;
  std::string truncated = etlq::render::render_duckbox(relation, options);
  expect_true(contains(truncated, "truncated"), "truncation notice");
  options.max_width = 200;
  Relation wide = make_relation({"a_rather_long_column_name", "another_long_column_name"},
                                {{int64_t{1}, int64_t{2}}, {int64_t{3}, int64_t{4}}});
  options.max_rows = 1;
  expect_true(contains(etlq::render::render_duckbox(wide, options), "showing first 1 of 2 rows"),
              "notice fits in a wide table");
  expect_true(!contains(truncated, "│     20 │"), "hidden row not printed");
}

void test_styled_output() {
  using etlq::cli::Style;
  expect_str_eq(etlq::cli::paint("x", Style::Error, false), "x", "disabled paint is a no-op");
  expect_str_eq(etlq::cli::paint("x", Style::Error, true),
                std::string(etlq::cli::style_code(Style::Error)) + "x" + etlq::cli::kReset, "enabled paint wraps");

  Relation relation = make_relation({"region", "amount"}, {{std::string("west"), Value{}}});
  etlq::render::DuckboxOptions options;
  options.max_width = 80;
  options.is_tty = true;
  std::string table = etlq::render::render_duckbox(relation, options);
  expect_true(contains(table, etlq::cli::paint("region", Style::Header, true)), "bold header");
  expect_true(contains(table, etlq::cli::paint("NULL  ", Style::NullCell, true)), "NULL cell dimmed");
  expect_true(!contains(table, etlq::cli::paint("west  ", Style::NullCell, true)), "values not dimmed");

  etlq::QueryError error(etlq::ErrorKind::InvalidLimit, "bad");
  expect_str_eq(etlq::cli::format_error(error, "", true),
                etlq::cli::paint("Error[InvalidLimit]: bad", Style::Error, true), "error line colored");
}

void test_run_statement() {
  auto store = sales_store();
  etlq::AdapterRegistry registry = make_test_registry(store);

  std::ostringstream out;
  std::ostringstream err;
  int rc = etlq::cli::run_statement("SELECT region FROM sales WHERE amount > 6", plain_config("csv"), registry, out,
                                    err, false);
  expect_eq(static_cast<size_t>(rc), 0, "success status");
  expect_str_eq(out.str(), "region\neast\neast\n", "missing semicolon tolerated");

  std::ostringstream load_out;
  rc = etlq::cli::run_statement("SELECT * INTO {table:copy} FROM sales;", plain_config("duckbox"), registry, load_out,
                                err, false);
  expect_eq(static_cast<size_t>(rc), 0, "load status");
  expect_str_eq(load_out.str(), "Wrote 3 rows to table:copy\n", "load summary");
  expect_true(store->has("copy"), "rows loaded");

  auto explain = plain_config("csv");
  explain.explain = true;
  std::ostringstream plan_out;
  etlq::cli::run_statement("SELECT * INTO {table:never} FROM sales;", explain, registry, plan_out, err, false);
  expect_true(contains(plan_out.str(), "\"step\": \"extract\""), "plan printed");
  expect_true(!store->has("never"), "explain does not load");

  auto verbose = plain_config("csv");
  verbose.verbose = true;
  std::ostringstream verbose_out;
  std::ostringstream verbose_err;
  etlq::cli::run_statement("SELECT * FROM sales;", verbose, registry, verbose_out, verbose_err, false);
  expect_true(contains(verbose_err.str(), "[step 1] extract table:sales"), "step log");
  expect_true(contains(verbose_err.str(), "-> 3 rows, 2 columns"), "step result log");

  std::ostringstream fail_out;
  std::ostringstream fail_err;
  rc = etlq::cli::run_statement("SELECT nope FROM sales;", plain_config("csv"), registry, fail_out, fail_err, false);
  expect_eq(static_cast<size_t>(rc), 1, "failure status");
  expect_true(fail_err.str().rfind("Error[ColumnNotFound]: ", 0) == 0, "error printed with kind");
  expect_true(fail_out.str().empty(), "nothing on stdout");
}

void test_repl_session() {
  auto store = sales_store();
  etlq::AdapterRegistry registry = make_test_registry(store);
  etlq::cli::RunConfig config = plain_config("duckbox");
  std::istringstream in(
      ".mode csv\n"
      "SELECT region\n"
      "FROM sales\n"
      "WHERE amount > 6;\n"
      ".bogus\n"
      "SELECT nope FROM sales;\n"
      ".max_rows 5\n"
      "SELECT amount FROM sales TAIL 1\n");
  std::ostringstream out;
  std::ostringstream err;
  int rc = etlq::cli::run_repl(config, registry, in, out, err, false);
  expect_eq(static_cast<size_t>(rc), 0, "repl exits cleanly at end of input");
  expect_str_eq(config.output_mode, "csv", ".mode changes the session");
  expect_eq(config.max_rows, 5, ".max_rows changes the session");
  expect_true(contains(out.str(), "Output mode: csv\n"), "mode acknowledged");
  expect_true(contains(out.str(), "region\neast\neast\n"), "multi-line statement ran");
  expect_true(contains(out.str(), "amount\n20\n"), "unterminated statement at end of input ran");
  expect_true(contains(err.str(), "Unknown command: .bogus (try .help)"), "unknown command reported");
  expect_true(contains(err.str(), "Error[ColumnNotFound]"), "statement error reported and loop continued");
}

void test_repl_quit() {
  auto store = sales_store();
  etlq::AdapterRegistry registry = make_test_registry(store);
  etlq::cli::RunConfig config = plain_config("csv");
  std::istringstream in(".quit\nSELECT * INTO {table:after} FROM sales;\n");
  std::ostringstream out;
  std::ostringstream err;
  etlq::cli::run_repl(config, registry, in, out, err, false);
  expect_true(!store->has("after"), "nothing runs after .quit");
  expect_true(out.str().empty() && err.str().empty(), "no prompt without a terminal");
}

}  // namespace

void register_cli_tests(std::vector<TestCase>& tests) {
  tests.push_back({"cli_args_parse", test_cli_args_parse});
  tests.push_back({"config_file", test_config_file});
  tests.push_back({"statement_termination", test_statement_termination});
  tests.push_back({"sanitize_pasted_line", test_sanitize_pasted_line});
  tests.push_back({"format_error", test_format_error});
  tests.push_back({"render_modes", test_render_modes});
  tests.push_back({"duckbox_layout", test_duckbox_layout});
  tests.push_back({"styled_output", test_styled_output});
  tests.push_back({"run_statement", test_run_statement});
  tests.push_back({"repl_session", test_repl_session});
  tests.push_back({"repl_quit", test_repl_quit});
}
