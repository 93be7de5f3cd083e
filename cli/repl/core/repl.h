#pragma once

#include <istream>
#include <ostream>

#include "cli_utils.h"
#include "etlq/adapters.h"

namespace etlq::cli {

/// Runs the interactive loop: lines accumulate until a statement ends with `;`,
/// dot commands are handled immediately.
/// MUST keep running after statement errors and MUST return 0 on .quit or end of input.
/// Inputs are config/registry/streams; outputs are a status with stream side effects.
int run_repl(RunConfig& config,
             const AdapterRegistry& registry,
             std::istream& in,
             std::ostream& out,
             std::ostream& err,
             bool is_tty);

}  // namespace etlq::cli
