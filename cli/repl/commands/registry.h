#pragma once

#include <functional>
#include <ostream>
#include <string>
#include <vector>

#include "cli_utils.h"

namespace etlq::cli {

/// Session state a dot command may read or change.
struct CommandContext {
  RunConfig& config;
  std::ostream& out;
  std::ostream& err;
};

/// Returns true when the line was handled, even if it reported a usage error.
using CommandHandler = std::function<bool(const std::string&, CommandContext&)>;

class CommandRegistry {
 public:
  void add(CommandHandler handler);
  bool try_handle(const std::string& line, CommandContext& ctx) const;

 private:
  std::vector<CommandHandler> handlers_;
};

CommandHandler make_help_command();
CommandHandler make_mode_command();
CommandHandler make_explain_command();
CommandHandler make_max_rows_command();

void register_default_commands(CommandRegistry& registry);

}  // namespace etlq::cli
