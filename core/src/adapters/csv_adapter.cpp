#include "adapters_internal.h"

#include <fstream>
#include <istream>
#include <iterator>
#include <ostream>
#include <sstream>
#include <stdexcept>

#include "../util/string_util.h"

namespace etlq {

namespace {

/// Splits delimited text into records, honoring double-quoted fields.
/// MUST keep delimiters and newlines that appear inside quotes.
/// Inputs are the full text; outputs are records of raw fields.
std::vector<std::vector<std::string>> split_records(const std::string& text, char delimiter) {
  std::vector<std::vector<std::string>> records;
  std::vector<std::string> record;
  std::string field;
  bool in_quotes = false;
  bool field_started = false;
  size_t i = 0;
  // WHY: spreadsheet exports often start with a UTF-8 byte-order mark.
  if (text.compare(0, 3, "\xEF\xBB\xBF") == 0) i = 3;
  for (; i < text.size(); ++i) {
    char c = text[i];
    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') {
          field.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        field.push_back(c);
      }
      continue;
    }
    if (c == '"') {
      in_quotes = true;
      field_started = true;
    } else if (c == delimiter) {
      record.push_back(std::move(field));
      field.clear();
      field_started = true;
    } else if (c == '\r') {
      continue;
    } else if (c == '\n') {
      if (field_started || !field.empty() || !record.empty()) {
        record.push_back(std::move(field));
        records.push_back(std::move(record));
      }
      record.clear();
      field.clear();
      field_started = false;
    } else {
      field.push_back(c);
      field_started = true;
    }
  }
  if (in_quotes) {
    throw std::runtime_error("Unterminated quoted field in delimited input");
  }
  if (field_started || !field.empty() || !record.empty()) {
    record.push_back(std::move(field));
    records.push_back(std::move(record));
  }
  return records;
}

std::string csv_escape(const std::string& value, char delimiter) {
  bool needs_quotes = false;
  for (char c : value) {
    if (c == delimiter || c == '"' || c == '\n' || c == '\r') {
      needs_quotes = true;
      break;
    }
  }
  if (!needs_quotes) return value;
  std::string out;
  out.reserve(value.size() + 2);
  out.push_back('"');
  for (char c : value) {
    if (c == '"') {
      out.push_back('"');
      out.push_back('"');
    } else {
      out.push_back(c);
    }
  }
  out.push_back('"');
  return out;
}

}  // namespace

Value infer_value(const std::string& text) {
  if (text.empty()) return Value{};
  if (auto i = util::parse_int64(text)) return *i;
  if (auto d = util::parse_double(text)) return *d;
  std::string lower = util::to_lower(text);
  if (lower == "true") return true;
  if (lower == "false") return false;
  return text;
}

Relation read_csv(std::istream& in, char delimiter) {
  std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  auto records = split_records(text, delimiter);
  if (records.empty()) {
    throw std::runtime_error("Delimited input has no header row");
  }
  std::vector<std::string> header;
  header.reserve(records[0].size());
  for (size_t i = 0; i < records[0].size(); ++i) {
    std::string name = util::trim_ws(records[0][i]);
    header.push_back(name.empty() ? "col" + std::to_string(i + 1) : name);
  }
  Relation relation(make_unique_column_names(header));
  relation.reserve(records.size() - 1);
  for (size_t r = 1; r < records.size(); ++r) {
    const auto& record = records[r];
    if (record.size() != header.size()) {
      throw std::runtime_error("Row " + std::to_string(r + 1) + " has " + std::to_string(record.size()) +
                               " fields, expected " + std::to_string(header.size()));
    }
    Row row;
    row.reserve(record.size());
    for (const auto& field : record) row.push_back(infer_value(field));
    relation.add_row(std::move(row));
  }
  return relation;
}

void write_csv(std::ostream& out, const Relation& relation, char delimiter) {
  for (size_t i = 0; i < relation.column_count(); ++i) {
    if (i > 0) out << delimiter;
    out << csv_escape(relation.columns()[i], delimiter);
  }
  out << "\n";
  for (const auto& row : relation.rows()) {
    for (size_t i = 0; i < row.size(); ++i) {
      if (i > 0) out << delimiter;
      out << csv_escape(format_cell(row[i]), delimiter);
    }
    out << "\n";
  }
}

namespace adapters_internal {

std::string read_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

void write_file(const std::string& path, const std::string& text) {
  std::ofstream out(path, std::ios::binary);
  if (!out) {
    throw std::runtime_error("Failed to open file for writing: " + path);
  }
  out << text;
  if (!out) {
    throw std::runtime_error("Failed to write file: " + path);
  }
}

Relation CsvAdapter::extract(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  return read_csv(file, delimiter_);
}

void CsvAdapter::load(const Relation& relation, const std::string& destination) {
  std::ostringstream out;
  write_csv(out, relation, delimiter_);
  write_file(destination, out.str());
}

}  // namespace adapters_internal

}  // namespace etlq
