#include "registry.h"

namespace etlq::cli {

void CommandRegistry::add(CommandHandler handler) {
  handlers_.push_back(std::move(handler));
}

bool CommandRegistry::try_handle(const std::string& line, CommandContext& ctx) const {
  for (const auto& handler : handlers_) {
    if (handler(line, ctx)) {
      return true;
    }
  }
  return false;
}

void register_default_commands(CommandRegistry& registry) {
  registry.add(make_help_command());
  registry.add(make_mode_command());
  registry.add(make_explain_command());
  registry.add(make_max_rows_command());
}

}  // namespace etlq::cli
