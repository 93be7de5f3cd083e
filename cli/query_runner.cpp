#include "query_runner.h"

#include <exception>

#include "ui/color.h"

namespace etlq::cli {

void StepLogger::on_step_begin(size_t index, const std::string& description) {
  err_ << paint("[step " + std::to_string(index + 1) + "] " + description, Style::StepLog, color_) << std::endl;
}

void StepLogger::on_step_end(size_t index, const Relation& result) {
  (void)index;
  std::string summary = "         -> " + std::to_string(result.row_count()) + " rows, " +
                        std::to_string(result.column_count()) + " columns";
  err_ << paint(summary, Style::StepLog, color_) << std::endl;
}

int run_statement(const std::string& query,
                  const RunConfig& config,
                  const AdapterRegistry& registry,
                  std::ostream& out,
                  std::ostream& err,
                  bool is_tty) {
  std::string text = ensure_terminated(query);
  try {
    if (config.explain) {
      out << colorize_json(explain_query(text, 2), config.color && is_tty) << std::endl;
      return 0;
    }
    StepLogger logger(err, config.color);
    ExecutionResult result = execute_query(text, registry, config.verbose ? &logger : nullptr);
    if (result.loaded_to.has_value()) {
      std::string summary = "Wrote " + std::to_string(result.relation.row_count()) + " rows to " + *result.loaded_to;
      out << paint(summary, Style::LoadSummary, config.color) << std::endl;
      return 0;
    }
    out << render_relation(result.relation, config, is_tty) << std::endl;
    return 0;
  } catch (const std::exception& ex) {
    err << format_error(ex, text, config.color) << std::endl;
    return 1;
  }
}

}  // namespace etlq::cli
