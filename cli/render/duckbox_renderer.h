#pragma once

#include <cstddef>
#include <string>

#include "etlq/relation.h"

namespace etlq::render {

/// Controls how the duckbox table is laid out.
/// max_rows == 0 shows every row; max_width == 0 uses the terminal width.
struct DuckboxOptions {
  size_t max_rows = 40;
  size_t max_width = 0;
  bool highlight = true;
  bool is_tty = false;
  bool show_footer = true;
};

std::string render_duckbox(const Relation& relation, const DuckboxOptions& options);

}  // namespace etlq::render
