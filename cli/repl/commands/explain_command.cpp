#include "registry.h"

#include <sstream>

namespace etlq::cli {

CommandHandler make_explain_command() {
  return [](const std::string& line, CommandContext& ctx) -> bool {
    if (line.rfind(".explain", 0) != 0) {
      return false;
    }
    std::istringstream iss(line);
    std::string cmd;
    std::string value;
    iss >> cmd >> value;
    if (value == "on" || value == "off") {
      ctx.config.explain = value == "on";
      ctx.out << "Explain: " << value << std::endl;
    } else {
      ctx.err << "Usage: .explain on|off" << std::endl;
    }
    return true;
  };
}

}  // namespace etlq::cli
