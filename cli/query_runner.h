#pragma once

#include <ostream>
#include <string>

#include "cli_utils.h"
#include "etlq/etlq.h"

namespace etlq::cli {

/// Writes one line per plan step to the diagnostic stream for --verbose.
class StepLogger : public ExecutionObserver {
 public:
  StepLogger(std::ostream& err, bool color) : err_(err), color_(color) {}

  void on_step_begin(size_t index, const std::string& description) override;
  void on_step_end(size_t index, const Relation& result) override;

 private:
  std::ostream& err_;
  bool color_;
};

/// Runs (or explains) one statement and prints its result.
/// MUST print errors as `Error[<kind>]: ...` on err and MUST return 0 on success, 1 on failure.
/// Inputs are query text/config/registry; side effects are adapter I/O and stream writes.
int run_statement(const std::string& query,
                  const RunConfig& config,
                  const AdapterRegistry& registry,
                  std::ostream& out,
                  std::ostream& err,
                  bool is_tty);

}  // namespace etlq::cli
