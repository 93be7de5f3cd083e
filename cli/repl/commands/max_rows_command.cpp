#include "registry.h"

#include <sstream>

#include "cli_args.h"
#include "util/string_util.h"

namespace etlq::cli {

CommandHandler make_max_rows_command() {
  return [](const std::string& line, CommandContext& ctx) -> bool {
    if (line.rfind(".max_rows", 0) != 0) {
      return false;
    }
    std::istringstream iss(line);
    std::string cmd;
    std::string value;
    iss >> cmd >> value;
    size_t parsed = 0;
    if (value.empty() || !parse_max_rows(value, parsed)) {
      ctx.err << "Usage: .max_rows <n|inf>" << std::endl;
    } else if (parsed == 0 && util::to_lower(value) != "inf") {
      ctx.err << "Use .max_rows inf for unlimited" << std::endl;
    } else {
      ctx.config.max_rows = parsed;
      if (parsed == 0) {
        ctx.out << "Duckbox max rows: unlimited" << std::endl;
      } else {
        ctx.out << "Duckbox max rows: " << parsed << std::endl;
      }
    }
    return true;
  };
}

}  // namespace etlq::cli
