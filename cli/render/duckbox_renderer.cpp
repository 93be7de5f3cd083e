#include "render/duckbox_renderer.h"

#include <algorithm>
#include <clocale>
#include <cstring>
#include <cwchar>
#include <sstream>
#include <string>
#include <vector>

#include <sys/ioctl.h>
#include <unistd.h>

#include "ui/color.h"

namespace etlq::render {

namespace {

constexpr size_t kMinColumnWidth = 4;
constexpr size_t kFallbackWidth = 120;
const char* const kEllipsis = "…";

size_t terminal_width() {
  struct winsize w {};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
    return static_cast<size_t>(w.ws_col);
  }
  return kFallbackWidth;
}

/// Calls fn(bytes, length, columns) for each character of a UTF-8 string until fn returns false.
/// Invalid bytes count as one column each.
template <typename Fn>
void walk_glyphs(const std::string& text, Fn fn) {
  static const bool locale_ready = [] {
    std::setlocale(LC_CTYPE, "");
    return true;
  }();
  (void)locale_ready;
  std::mbstate_t state{};
  const char* ptr = text.c_str();
  size_t remaining = text.size();
  while (remaining > 0) {
    wchar_t wc = 0;
    size_t len = std::mbrtowc(&wc, ptr, remaining, &state);
    size_t columns = 1;
    if (len == static_cast<size_t>(-1) || len == static_cast<size_t>(-2)) {
      len = 1;
      std::memset(&state, 0, sizeof(state));
    } else if (len == 0) {
      return;
    } else {
      int w = ::wcwidth(wc);
      columns = w < 0 ? 1 : static_cast<size_t>(w);
    }
    if (!fn(ptr, len, columns)) return;
    ptr += len;
    remaining -= len;
  }
}

size_t display_width(const std::string& text) {
  size_t width = 0;
  walk_glyphs(text, [&](const char*, size_t, size_t columns) {
    width += columns;
    return true;
  });
  return width;
}

std::string fit(const std::string& text, size_t width) {
  if (display_width(text) <= width) return text;
  if (width == 0) return "";
  size_t room = width - 1;
  std::string out;
  size_t used = 0;
  walk_glyphs(text, [&](const char* bytes, size_t len, size_t columns) {
    if (used + columns > room) return false;
    out.append(bytes, len);
    used += columns;
    return true;
  });
  return out + kEllipsis;
}

std::string pad(const std::string& text, size_t width, bool right_align) {
  size_t w = display_width(text);
  if (w >= width) return text;
  std::string fill(width - w, ' ');
  return right_align ? fill + text : text + fill;
}

/// One rendered column: header, display cells, and layout decisions.
struct ColumnLayout {
  std::string header;
  std::vector<std::string> cells;
  std::vector<bool> nulls;
  size_t width = kMinColumnWidth;
  bool numeric = true;
};

std::vector<ColumnLayout> layout_columns(const Relation& relation, size_t rows_to_render) {
  std::vector<ColumnLayout> layout(relation.column_count());
  for (size_t c = 0; c < layout.size(); ++c) {
    ColumnLayout& column = layout[c];
    column.header = relation.columns()[c];
    column.width = std::max(column.width, display_width(column.header));
    bool any_value = false;
    for (size_t r = 0; r < rows_to_render; ++r) {
      const Value& value = relation.rows()[r][c];
      std::string text = format_value(value);
      std::replace_if(text.begin(), text.end(), [](char ch) { return ch == '\n' || ch == '\r' || ch == '\t'; },
                      ' ');
      column.width = std::max(column.width, display_width(text));
      column.cells.push_back(std::move(text));
      column.nulls.push_back(is_null(value));
      if (!is_null(value)) {
        any_value = true;
        column.numeric = column.numeric && is_number(value);
      }
    }
    // Numeric columns right-align as a whole, NULL cells included.
    column.numeric = column.numeric && any_value;
  }
  return layout;
}

size_t table_width(const std::vector<ColumnLayout>& layout) {
  size_t total = 1;
  for (const auto& column : layout) total += column.width + 3;
  return total;
}

/// Narrows the widest columns one step at a time until the table fits or nothing can shrink.
void shrink_to(std::vector<ColumnLayout>& layout, size_t max_width) {
  while (table_width(layout) > max_width) {
    auto widest = std::max_element(layout.begin(), layout.end(),
                                   [](const ColumnLayout& a, const ColumnLayout& b) { return a.width < b.width; });
    if (widest == layout.end() || widest->width <= kMinColumnWidth) return;
    --widest->width;
  }
}

std::string rule(const std::vector<ColumnLayout>& layout, const char* left, const char* mid, const char* right) {
  std::string out = left;
  for (size_t c = 0; c < layout.size(); ++c) {
    for (size_t i = 0; i < layout[c].width + 2; ++i) out += "─";
    out += c + 1 < layout.size() ? mid : right;
  }
  if (layout.empty()) out += right;
  return out;
}

}  // namespace

/// Renders a relation as a box-drawing table sized to the terminal.
/// MUST keep the header visible and MUST report rows hidden by max_rows.
/// Inputs are relation/options; outputs are text with no side effects.
std::string render_duckbox(const Relation& relation, const DuckboxOptions& options) {
  size_t rows_to_render = relation.row_count();
  if (options.max_rows != 0) rows_to_render = std::min(rows_to_render, options.max_rows);
  size_t max_width = options.max_width == 0 ? terminal_width() : options.max_width;

  std::vector<ColumnLayout> layout = layout_columns(relation, rows_to_render);
  shrink_to(layout, std::max<size_t>(max_width, 20));
  bool styled = options.is_tty;

  std::ostringstream oss;
  oss << rule(layout, "┌", "┬", "┐") << "\n│";
  for (const auto& column : layout) {
    std::string header = pad(fit(column.header, column.width), column.width, false);
    header = cli::paint(header, cli::Style::Header, styled && options.highlight);
    oss << " " << header << " │";
  }
  oss << "\n" << rule(layout, "├", "┼", "┤") << "\n";

  for (size_t r = 0; r < rows_to_render; ++r) {
    oss << "│";
    for (const auto& column : layout) {
      std::string cell = pad(fit(column.cells[r], column.width), column.width, column.numeric);
      cell = cli::paint(cell, cli::Style::NullCell, styled && column.nulls[r]);
      oss << " " << cell << " │";
    }
    oss << "\n";
  }

  if (rows_to_render < relation.row_count()) {
    size_t inner = table_width(layout) >= 4 ? table_width(layout) - 4 : 0;
    std::ostringstream note;
    note << kEllipsis << " truncated, showing first " << rows_to_render << " of " << relation.row_count()
         << " rows " << kEllipsis;
    oss << "│ " << pad(fit(note.str(), inner), inner, false) << " │\n";
  }

  oss << rule(layout, "└", "┴", "┘");
  if (options.show_footer) {
    size_t rows = relation.row_count();
    size_t cols = relation.column_count();
    oss << "\n" << rows << (rows == 1 ? " row, " : " rows, ") << cols << (cols == 1 ? " column" : " columns");
  }
  return oss.str();
}

}  // namespace etlq::render
