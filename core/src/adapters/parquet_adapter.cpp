#include "adapters_internal.h"

#include <stdexcept>

#ifdef ETLQ_USE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>
#endif

namespace etlq::adapters_internal {

#ifdef ETLQ_USE_ARROW

namespace {

void check(const arrow::Status& status) {
  if (!status.ok()) {
    throw std::runtime_error(status.ToString());
  }
}

enum class ColumnKind { Int, Float, Bool, String };

/// Picks the narrowest Arrow type that holds every non-null cell of a column.
ColumnKind column_kind(const Relation& relation, size_t column) {
  bool any = false;
  bool all_int = true;
  bool all_number = true;
  bool all_bool = true;
  for (const auto& row : relation.rows()) {
    const Value& cell = row[column];
    if (is_null(cell)) continue;
    any = true;
    if (!std::holds_alternative<int64_t>(cell)) all_int = false;
    if (!is_number(cell)) all_number = false;
    if (!std::holds_alternative<bool>(cell)) all_bool = false;
  }
  if (!any) return ColumnKind::String;
  if (all_int) return ColumnKind::Int;
  if (all_number) return ColumnKind::Float;
  if (all_bool) return ColumnKind::Bool;
  return ColumnKind::String;
}

std::shared_ptr<arrow::Array> build_column(const Relation& relation, size_t column, ColumnKind kind) {
  std::shared_ptr<arrow::Array> array;
  switch (kind) {
    case ColumnKind::Int: {
      arrow::Int64Builder builder;
      for (const auto& row : relation.rows()) {
        const Value& cell = row[column];
        check(is_null(cell) ? builder.AppendNull() : builder.Append(std::get<int64_t>(cell)));
      }
      check(builder.Finish(&array));
      break;
    }
    case ColumnKind::Float: {
      arrow::DoubleBuilder builder;
      for (const auto& row : relation.rows()) {
        const Value& cell = row[column];
        check(is_null(cell) ? builder.AppendNull() : builder.Append(as_double(cell)));
      }
      check(builder.Finish(&array));
      break;
    }
    case ColumnKind::Bool: {
      arrow::BooleanBuilder builder;
      for (const auto& row : relation.rows()) {
        const Value& cell = row[column];
        check(is_null(cell) ? builder.AppendNull() : builder.Append(std::get<bool>(cell)));
      }
      check(builder.Finish(&array));
      break;
    }
    case ColumnKind::String: {
      arrow::StringBuilder builder;
      for (const auto& row : relation.rows()) {
        const Value& cell = row[column];
        if (is_null(cell)) {
          check(builder.AppendNull());
        } else if (const auto* s = std::get_if<std::string>(&cell)) {
          check(builder.Append(*s));
        } else {
          check(builder.Append(format_value(cell)));
        }
      }
      check(builder.Finish(&array));
      break;
    }
  }
  return array;
}

std::shared_ptr<arrow::DataType> arrow_type(ColumnKind kind) {
  switch (kind) {
    case ColumnKind::Int: return arrow::int64();
    case ColumnKind::Float: return arrow::float64();
    case ColumnKind::Bool: return arrow::boolean();
    case ColumnKind::String: return arrow::utf8();
  }
  return arrow::utf8();
}

/// Converts one Arrow cell to a Value; unhandled types fall back to the scalar's text.
Value cell_value(const arrow::Array& array, int64_t index) {
  if (array.IsNull(index)) return Value{};
  switch (array.type_id()) {
    case arrow::Type::BOOL:
      return static_cast<const arrow::BooleanArray&>(array).Value(index);
    case arrow::Type::INT8:
      return static_cast<int64_t>(static_cast<const arrow::Int8Array&>(array).Value(index));
    case arrow::Type::INT16:
      return static_cast<int64_t>(static_cast<const arrow::Int16Array&>(array).Value(index));
    case arrow::Type::INT32:
      return static_cast<int64_t>(static_cast<const arrow::Int32Array&>(array).Value(index));
    case arrow::Type::INT64:
      return static_cast<const arrow::Int64Array&>(array).Value(index);
    case arrow::Type::FLOAT:
      return static_cast<double>(static_cast<const arrow::FloatArray&>(array).Value(index));
    case arrow::Type::DOUBLE:
      return static_cast<const arrow::DoubleArray&>(array).Value(index);
    case arrow::Type::STRING:
      return static_cast<const arrow::StringArray&>(array).GetString(index);
    case arrow::Type::LARGE_STRING:
      return static_cast<const arrow::LargeStringArray&>(array).GetString(index);
    default:
      break;
  }
  auto scalar = array.GetScalar(index);
  if (!scalar.ok()) {
    throw std::runtime_error(scalar.status().ToString());
  }
  return (*scalar)->ToString();
}

}  // namespace

Relation ParquetAdapter::extract(const std::string& path) {
  auto input_res = arrow::io::ReadableFile::Open(path);
  if (!input_res.ok()) {
    throw std::runtime_error(input_res.status().ToString());
  }
  parquet::arrow::FileReaderBuilder builder;
  check(builder.Open(*input_res));
  std::unique_ptr<parquet::arrow::FileReader> reader;
  check(builder.Build(&reader));
  std::shared_ptr<arrow::Table> table;
  check(reader->ReadTable(&table));

  std::vector<std::string> columns;
  for (const auto& field : table->schema()->fields()) columns.push_back(field->name());
  Relation relation(make_unique_column_names(columns));
  std::vector<Row> rows(static_cast<size_t>(table->num_rows()), Row(columns.size()));
  for (int c = 0; c < table->num_columns(); ++c) {
    size_t row_index = 0;
    for (const auto& chunk : table->column(c)->chunks()) {
      for (int64_t i = 0; i < chunk->length(); ++i) {
        rows[row_index++][static_cast<size_t>(c)] = cell_value(*chunk, i);
      }
    }
  }
  for (auto& row : rows) relation.add_row(std::move(row));
  return relation;
}

void ParquetAdapter::load(const Relation& relation, const std::string& destination) {
  std::vector<std::shared_ptr<arrow::Field>> fields;
  std::vector<std::shared_ptr<arrow::Array>> arrays;
  fields.reserve(relation.column_count());
  arrays.reserve(relation.column_count());
  for (size_t i = 0; i < relation.column_count(); ++i) {
    ColumnKind kind = column_kind(relation, i);
    fields.push_back(arrow::field(relation.columns()[i], arrow_type(kind), true));
    arrays.push_back(build_column(relation, i, kind));
  }
  auto table = arrow::Table::Make(arrow::schema(fields), arrays);
  auto output_res = arrow::io::FileOutputStream::Open(destination);
  if (!output_res.ok()) {
    throw std::runtime_error(output_res.status().ToString());
  }
  check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), *output_res, 1024));
}

#else

Relation ParquetAdapter::extract(const std::string&) {
  throw std::runtime_error("parquet sources require the Apache Arrow feature");
}

void ParquetAdapter::load(const Relation&, const std::string&) {
  throw std::runtime_error("parquet destinations require the Apache Arrow feature");
}

#endif

}  // namespace etlq::adapters_internal
