#include "repl.h"

#include <string>

#include "query_runner.h"
#include "repl/commands/registry.h"
#include "ui/color.h"
#include "util/string_util.h"

namespace etlq::cli {

int run_repl(RunConfig& config,
             const AdapterRegistry& registry,
             std::istream& in,
             std::ostream& out,
             std::ostream& err,
             bool is_tty) {
  CommandRegistry commands;
  register_default_commands(commands);
  CommandContext ctx{config, out, err};

  std::string prompt = "etlq> ";
  std::string cont_prompt = "   > ";
  bool show_prompt = is_tty;
  if (config.color && is_tty) {
    prompt = paint(prompt, Style::Prompt, true);
    cont_prompt = paint(cont_prompt, Style::ContinuationPrompt, true);
  }

  std::string buffer;
  std::string line;
  while (true) {
    if (show_prompt) {
      out << (buffer.empty() ? prompt : cont_prompt) << std::flush;
    }
    if (!std::getline(in, line)) {
      break;
    }
    line = sanitize_pasted_line(line);
    if (buffer.empty()) {
      if (line.empty()) continue;
      if (line == ".quit" || line == ".exit" || line == ".q") {
        break;
      }
      if (line[0] == '.') {
        if (!commands.try_handle(line, ctx)) {
          err << "Unknown command: " << line << " (try .help)" << std::endl;
        }
        continue;
      }
    }
    buffer += buffer.empty() ? line : "\n" + line;
    if (!statement_complete(buffer)) {
      continue;
    }
    run_statement(buffer, config, registry, out, err, is_tty);
    buffer.clear();
  }
  if (!util::trim_ws(buffer).empty()) {
    run_statement(buffer, config, registry, out, err, is_tty);
  }
  return 0;
}

}  // namespace etlq::cli
