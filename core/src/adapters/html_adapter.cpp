#include "adapters_internal.h"

#include <cctype>
#include <stdexcept>

#include "../util/string_util.h"

#ifdef ETLQ_USE_LIBXML2
#include <libxml/HTMLparser.h>
#include <libxml/parser.h>
#include <libxml/tree.h>
#endif

namespace etlq::adapters_internal {

namespace {

#ifdef ETLQ_USE_LIBXML2

struct RawCell {
  std::string text;
  bool header = false;
};

using RawRow = std::vector<RawCell>;

/// Collapses whitespace runs so cell text matches what a browser shows.
std::string normalize_cell_text(const std::string& value) {
  std::string trimmed = util::trim_ws(value);
  std::string out;
  out.reserve(trimmed.size());
  bool in_space = false;
  for (char c : trimmed) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      if (!in_space) {
        out.push_back(' ');
        in_space = true;
      }
      continue;
    }
    in_space = false;
    out.push_back(c);
  }
  return out;
}

/// Builds a relation from raw rows; a table without rows has no columns.
/// MUST use the first all-<th> row as the header, else the first row, and pad
/// short rows with NULL.
Relation rows_to_relation(const std::vector<RawRow>& rows) {
  if (rows.empty()) return Relation();
  size_t header_index = 0;
  for (size_t r = 0; r < rows.size(); ++r) {
    bool all_header = !rows[r].empty();
    for (const auto& cell : rows[r]) {
      if (!cell.header) all_header = false;
    }
    if (all_header) {
      header_index = r;
      break;
    }
  }
  std::vector<std::string> header;
  for (size_t i = 0; i < rows[header_index].size(); ++i) {
    const std::string& text = rows[header_index][i].text;
    header.push_back(text.empty() ? "col" + std::to_string(i + 1) : text);
  }
  Relation relation(make_unique_column_names(header));
  for (size_t r = header_index + 1; r < rows.size(); ++r) {
    Row row;
    row.reserve(header.size());
    for (size_t i = 0; i < header.size(); ++i) {
      row.push_back(i < rows[r].size() ? infer_value(rows[r][i].text) : Value{});
    }
    relation.add_row(std::move(row));
  }
  return relation;
}

std::string node_name(xmlNode* node) {
  return util::to_lower(reinterpret_cast<const char*>(node->name));
}

std::string node_text(xmlNode* node) {
  xmlChar* content = xmlNodeGetContent(node);
  if (!content) return "";
  std::string out = reinterpret_cast<const char*>(content);
  xmlFree(content);
  return normalize_cell_text(out);
}

/// Collects <tr> rows that belong to this table, skipping nested tables.
void collect_rows(xmlNode* node, std::vector<RawRow>& rows) {
  for (xmlNode* cur = node; cur != nullptr; cur = cur->next) {
    if (cur->type != XML_ELEMENT_NODE) continue;
    std::string name = node_name(cur);
    if (name == "table") continue;
    if (name == "tr") {
      RawRow row;
      for (xmlNode* cell = cur->children; cell != nullptr; cell = cell->next) {
        if (cell->type != XML_ELEMENT_NODE) continue;
        std::string cell_name = node_name(cell);
        if (cell_name == "td" || cell_name == "th") {
          row.push_back(RawCell{node_text(cell), cell_name == "th"});
        }
      }
      if (!row.empty()) rows.push_back(std::move(row));
      continue;
    }
    if (cur->children) collect_rows(cur->children, rows);
  }
}

void collect_tables(xmlNode* node, std::vector<xmlNode*>& tables) {
  for (xmlNode* cur = node; cur != nullptr; cur = cur->next) {
    if (cur->type == XML_ELEMENT_NODE && node_name(cur) == "table") {
      tables.push_back(cur);
    }
    if (cur->children) collect_tables(cur->children, tables);
  }
}

#endif

}  // namespace

std::vector<Relation> parse_html_tables(const std::string& html) {
#ifdef ETLQ_USE_LIBXML2
  // WHY: recovery mode handles malformed HTML commonly found on the web.
  htmlDocPtr doc = htmlReadMemory(html.data(),
                                  static_cast<int>(html.size()),
                                  nullptr,
                                  nullptr,
                                  HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET);
  if (!doc) {
    throw std::runtime_error("Failed to parse HTML document");
  }
  std::vector<xmlNode*> tables;
  collect_tables(xmlDocGetRootElement(doc), tables);
  std::vector<Relation> out;
  try {
    for (xmlNode* table : tables) {
      std::vector<RawRow> rows;
      collect_rows(table->children, rows);
      out.push_back(rows_to_relation(rows));
    }
  } catch (const std::exception&) {
    xmlFreeDoc(doc);
    throw;
  }
  xmlFreeDoc(doc);
  return out;
#else
  (void)html;
  throw std::runtime_error("html sources require the libxml2 feature");
#endif
}

Relation HtmlTableExtractor::extract(const std::string& path) {
  std::string file = path;
  size_t table_number = 1;
  size_t hash = path.rfind('#');
  if (hash != std::string::npos) {
    auto number = util::parse_int64(path.substr(hash + 1));
    if (!number.has_value() || *number < 1) {
      throw std::runtime_error("Invalid table number in '" + path + "'; expected file#N with N >= 1");
    }
    file = path.substr(0, hash);
    table_number = static_cast<size_t>(*number);
  }
  std::vector<Relation> tables = parse_html_tables(read_file(file));
  if (tables.size() < table_number) {
    throw std::runtime_error("Table " + std::to_string(table_number) + " not found in " + file + " (found " +
                             std::to_string(tables.size()) + ")");
  }
  return tables[table_number - 1];
}

}  // namespace etlq::adapters_internal
