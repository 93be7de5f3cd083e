#include "registry.h"

#include <sstream>

#include "cli_args.h"

namespace etlq::cli {

CommandHandler make_mode_command() {
  return [](const std::string& line, CommandContext& ctx) -> bool {
    if (line.rfind(".mode", 0) != 0) {
      return false;
    }
    std::istringstream iss(line);
    std::string cmd;
    std::string mode;
    iss >> cmd >> mode;
    if (is_output_mode(mode)) {
      ctx.config.output_mode = mode;
      ctx.out << "Output mode: " << ctx.config.output_mode << std::endl;
    } else {
      ctx.err << "Usage: .mode duckbox|json|csv|plain" << std::endl;
    }
    return true;
  };
}

}  // namespace etlq::cli
