#include "adapters_internal.h"

#include <cstdint>
#include <map>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace etlq {

namespace {

using json = nlohmann::ordered_json;

Value json_to_value(const json& node) {
  switch (node.type()) {
    case json::value_t::null:
      return Value{};
    case json::value_t::boolean:
      return node.get<bool>();
    case json::value_t::number_integer:
      return node.get<int64_t>();
    case json::value_t::number_unsigned: {
      auto value = node.get<uint64_t>();
      if (value > static_cast<uint64_t>(INT64_MAX)) return static_cast<double>(value);
      return static_cast<int64_t>(value);
    }
    case json::value_t::number_float:
      return node.get<double>();
    case json::value_t::string:
      return node.get<std::string>();
    default:
      // Nested arrays/objects stay readable as their compact JSON text.
      return node.dump();
  }
}

json value_to_json(const Value& value) {
  if (std::holds_alternative<std::monostate>(value)) return nullptr;
  if (const auto* b = std::get_if<bool>(&value)) return *b;
  if (const auto* i = std::get_if<int64_t>(&value)) return *i;
  if (const auto* d = std::get_if<double>(&value)) return *d;
  return std::get<std::string>(value);
}

}  // namespace

/// Decodes an array of records into a relation.
/// MUST order columns by first appearance and fill absent keys with NULL.
/// Inputs are JSON text; outputs are relations or std::runtime_error.
Relation relation_from_json(const std::string& text) {
  json doc;
  try {
    doc = json::parse(text);
  } catch (const json::parse_error& e) {
    throw std::runtime_error(std::string("Invalid JSON: ") + e.what());
  }
  if (!doc.is_array()) {
    throw std::runtime_error("JSON input must be an array of objects");
  }
  std::vector<std::string> columns;
  std::map<std::string, size_t> positions;
  for (const auto& record : doc) {
    if (!record.is_object()) {
      throw std::runtime_error("JSON input must be an array of objects");
    }
    for (auto it = record.begin(); it != record.end(); ++it) {
      if (positions.emplace(it.key(), columns.size()).second) {
        columns.push_back(it.key());
      }
    }
  }
  Relation relation(columns);
  relation.reserve(doc.size());
  for (const auto& record : doc) {
    Row row(columns.size());
    for (auto it = record.begin(); it != record.end(); ++it) {
      row[positions.at(it.key())] = json_to_value(it.value());
    }
    relation.add_row(std::move(row));
  }
  return relation;
}

std::string relation_to_json(const Relation& relation, int indent) {
  json out = json::array();
  for (const auto& row : relation.rows()) {
    json record = json::object();
    for (size_t i = 0; i < relation.column_count(); ++i) {
      record[relation.columns()[i]] = value_to_json(row[i]);
    }
    out.push_back(std::move(record));
  }
  return out.dump(indent);
}

namespace adapters_internal {

Relation JsonAdapter::extract(const std::string& path) {
  return relation_from_json(read_file(path));
}

void JsonAdapter::load(const Relation& relation, const std::string& destination) {
  write_file(destination, relation_to_json(relation, 2) + "\n");
}

}  // namespace adapters_internal

}  // namespace etlq
