#include "registry.h"

namespace etlq::cli {

CommandHandler make_help_command() {
  return [](const std::string& line, CommandContext& ctx) -> bool {
    if (line != ".help") {
      return false;
    }
    ctx.out << "Commands:\n";
    ctx.out << "  .help                           Show this help\n";
    ctx.out << "  .mode duckbox|json|csv|plain    Set output mode\n";
    ctx.out << "  .explain on|off                 Print plans instead of running statements\n";
    ctx.out << "  .max_rows <n|inf>               Set duckbox max rows (inf = no limit)\n";
    ctx.out << "  .quit / .q                      Exit\n";
    ctx.out << "Statements end with ';' and may span several lines.\n";
    ctx.out << "  SELECT ... [INTO {type:path}] FROM {type:path} [AS a] [JOIN ...] [WHERE ...]\n";
    ctx.out << "    [GROUP BY ...] [ORDER BY ...] [LIMIT n | TAIL n];\n";
    ctx.out << "  INSERT INTO {type:path} [(cols)] VALUES (...), ...;" << std::endl;
    return true;
  };
}

}  // namespace etlq::cli
