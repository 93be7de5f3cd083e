#include "test_harness.h"

#include <filesystem>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "adapters/adapters_internal.h"
#include "etlq/adapters.h"
#include "etlq/etlq.h"
#include "test_utils.h"

namespace {

using etlq::Relation;
using etlq::Value;

bool throws_runtime_error(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

class FixedCollector : public etlq::RemoteCollector {
 public:
  Relation collect(const etlq::RemoteDescriptor& descriptor) override {
    last_dataset = descriptor.dataset;
    return make_relation({"date", "value"}, {{std::string(descriptor.start_date), 0.5}});
  }

  std::string last_dataset;
};

void test_infer_value() {
  expect_true(etlq::is_null(etlq::infer_value("")), "empty is NULL");
  expect_true(etlq::infer_value("42") == Value(int64_t{42}), "integer");
  expect_true(etlq::infer_value("-3.25") == Value(-3.25), "float");
  expect_true(etlq::infer_value("TRUE") == Value(true), "boolean is case-insensitive");
  expect_true(etlq::infer_value("false") == Value(false), "false");
  expect_true(etlq::infer_value("12abc") == Value(std::string("12abc")), "text");
}

void test_read_csv_quoting() {
  std::istringstream in(
      "\xEF\xBB\xBF"
      "name,note,amount\r\n"
      "ann,\"hello, world\",1\r\n"
      "bob,\"say \"\"hi\"\"\",2.5\r\n"
      "cy,\"two\nlines\",\r\n");
  Relation relation = etlq::read_csv(in);
  expect_true(relation.columns() == std::vector<std::string>({"name", "note", "amount"}), "header without BOM");
  expect_eq(relation.row_count(), 3, "three records");
  expect_true(relation.rows()[0][1] == Value(std::string("hello, world")), "delimiter inside quotes");
  expect_true(relation.rows()[1][1] == Value(std::string("say \"hi\"")), "doubled quotes");
  expect_true(relation.rows()[1][2] == Value(2.5), "inferred float");
  expect_true(relation.rows()[2][1] == Value(std::string("two\nlines")), "newline inside quotes");
  expect_true(etlq::is_null(relation.rows()[2][2]), "empty field is NULL");
}

void test_read_csv_header_names() {
  std::istringstream in("a,,a\n1,2,3\n");
  Relation relation = etlq::read_csv(in);
  expect_true(relation.columns() == std::vector<std::string>({"a", "col2", "a.1"}), "blank and repeated headers");
}

void test_read_csv_errors() {
  expect_true(throws_runtime_error([] {
                std::istringstream in("a,b\n1,2,3\n");
                etlq::read_csv(in);
              }),
              "ragged row");
  expect_true(throws_runtime_error([] {
                std::istringstream in("");
                etlq::read_csv(in);
              }),
              "no header");
  expect_true(throws_runtime_error([] {
                std::istringstream in("a\n\"open\n");
                etlq::read_csv(in);
              }),
              "unterminated quote");
}

void test_read_csv_custom_delimiter() {
  std::istringstream in("a;b\n1;x,y\n");
  Relation relation = etlq::read_csv(in, ';');
  expect_true(relation.rows()[0][1] == Value(std::string("x,y")), "comma is data with ; delimiter");
}

void test_write_csv() {
  Relation relation = make_relation({"name", "value"}, {{std::string("a,b"), 2.0},
                                                        {std::string("say \"x\""), Value{}},
                                                        {Value(true), int64_t{7}}});
  std::ostringstream out;
  etlq::write_csv(out, relation);
  expect_str_eq(out.str(), "name,value\n\"a,b\",2.0\n\"say \"\"x\"\"\",\ntrue,7\n", "escaped output");
}

void test_csv_file_adapter_round_trip() {
  auto path = temp_path("round_trip.csv");
  auto store = std::make_shared<MemoryStore>();
  store->put("sales", sales_relation());
  run_query(store, "SELECT * INTO {csv:" + path.string() + "} FROM sales;");
  Relation back = run_query(store, "SELECT region, amount FROM {csv:" + path.string() + "} WHERE amount > 6;");
  expect_eq(back.row_count(), 2, "filtered rows read back");
  expect_true(back.rows()[1][1] == Value(int64_t{20}), "values typed on read");
  std::filesystem::remove(path);
}

void test_csv_adapter_delimiter_option() {
  auto path = temp_path("semicolon.csv");
  write_string_to_file(path, "a;b\n1;2\n");
  etlq::AdapterOptions options;
  options.csv_delimiter = ';';
  etlq::AdapterRegistry registry = etlq::make_default_registry(options);
  Relation out = etlq::execute_query("SELECT b FROM {csv:" + path.string() + "};", registry).relation;
  expect_true(out.rows()[0][0] == Value(int64_t{2}), "configured delimiter used");
  std::filesystem::remove(path);
}

void test_relation_from_json() {
  Relation relation = etlq::relation_from_json(
      R"([{"b": 1, "a": "x"}, {"a": "y", "c": [1, 2], "d": null}, {"b": 2.5, "e": true}])");
  expect_true(relation.columns() == std::vector<std::string>({"b", "a", "c", "d", "e"}), "first-seen key order");
  expect_true(etlq::is_null(relation.rows()[0][2]), "missing key is NULL");
  expect_true(relation.rows()[1][2] == Value(std::string("[1,2]")), "nested value kept as JSON text");
  expect_true(relation.rows()[2][0] == Value(2.5), "float");
  expect_true(relation.rows()[2][4] == Value(true), "boolean");
  expect_true(throws_runtime_error([] { etlq::relation_from_json("{\"a\": 1}"); }), "object is not an array");
  expect_true(throws_runtime_error([] { etlq::relation_from_json("[1, 2]"); }), "array of scalars");
  expect_true(throws_runtime_error([] { etlq::relation_from_json("[{"); }), "malformed JSON");
}

void test_relation_to_json() {
  Relation relation = make_relation({"name", "n"}, {{std::string("a"), Value{}}});
  expect_str_eq(etlq::relation_to_json(relation, -1), "[{\"name\":\"a\",\"n\":null}]", "compact records");
}

void test_json_file_adapter() {
  auto path = temp_path("records.json");
  write_string_to_file(path, R"([{"region": "north", "amount": 4}, {"region": "south", "amount": 9}])");
  auto store = std::make_shared<MemoryStore>();
  Relation out = run_query(store, "SELECT max(amount) FROM {json:" + path.string() + "};");
  expect_true(out.rows()[0][0] == Value(int64_t{9}), "max over JSON records");
  std::filesystem::remove(path);
}

void test_detect_body_format() {
  using etlq::adapters_internal::BodyFormat;
  using etlq::adapters_internal::detect_body_format;
  expect_true(detect_body_format("application/json; charset=utf-8", "https://x/data") == BodyFormat::Json,
              "JSON content type with parameters");
  expect_true(detect_body_format("application/vnd.api+json", "https://x/data") == BodyFormat::Json,
              "structured JSON suffix");
  expect_true(detect_body_format("text/csv", "https://x/data") == BodyFormat::Csv, "CSV content type");
  expect_true(detect_body_format("", "https://x/data.csv?v=1") == BodyFormat::Csv, "CSV by URL suffix");
  expect_true(detect_body_format("text/plain", "https://x/DATA.JSON") == BodyFormat::Json, "JSON by URL suffix");
  expect_true(detect_body_format("text/html", "https://x/page") == BodyFormat::Unknown, "unsupported body");
}

void test_registry_lookup() {
  etlq::AdapterRegistry registry = etlq::make_default_registry();
  expect_true(registry.has_extractor("CSV") && registry.has_loader("Json"), "types are case-insensitive");
  expect_true(registry.has_extractor("https") && !registry.has_loader("https"), "http sources are read-only");
  expect_true(!registry.has_extractor("gee"), "remote source needs a collector");
  try {
    registry.extractor("xlsx");
    expect_true(false, "unknown type should throw");
  } catch (const etlq::QueryError& e) {
    expect_true(e.kind() == etlq::ErrorKind::UnknownSourceType, "unknown source kind");
    expect_true(std::string(e.what()).find("'csv'") != std::string::npos, "message lists available types");
  }
  expect_error_kind([&] { registry.loader("html"); }, etlq::ErrorKind::UnknownSourceType, "html has no loader");
}

void test_remote_collector_source() {
  auto collector = std::make_shared<FixedCollector>();
  etlq::AdapterOptions options;
  options.remote_collector = collector;
  etlq::AdapterRegistry registry = etlq::make_default_registry(options);
  Relation out =
      etlq::execute_query("SELECT * FROM {gee:proj|ndvi|2024-01-01|2024-01-31|104.9|11.5|30};", registry).relation;
  expect_str_eq(collector->last_dataset, "ndvi", "descriptor handed to the collector");
  expect_true(out.rows()[0][0] == Value(std::string("2024-01-01")), "collector rows returned");
}

void test_missing_file_is_extract_failure() {
  auto store = std::make_shared<MemoryStore>();
  std::string path = temp_path("does_not_exist.csv").string();
  expect_error_kind([&] { run_query(store, "SELECT * FROM {csv:" + path + "};"); }, etlq::ErrorKind::ExtractFailed,
                    "missing file");
}

void test_html_tables() {
  auto path = temp_path("tables.html");
  write_string_to_file(path,
                       "<html><body><table><tr><td>skip</td></tr></table>"
                       "<table><tr><th>City</th><th>Pop</th></tr>"
                       "<tr><td> Paris </td><td>2100</td></tr><tr><td>Oslo</td></tr></table></body></html>");
  auto store = std::make_shared<MemoryStore>();
#ifdef ETLQ_USE_LIBXML2
  Relation out = run_query(store, "SELECT * FROM {html:" + path.string() + "#2};");
  expect_true(out.columns() == std::vector<std::string>({"City", "Pop"}), "th row is the header");
  expect_eq(out.row_count(), 2, "two data rows");
  expect_true(out.rows()[0][0] == Value(std::string("Paris")), "cell text trimmed");
  expect_true(out.rows()[0][1] == Value(int64_t{2100}), "cell value inferred");
  expect_true(etlq::is_null(out.rows()[1][1]), "short row padded with NULL");
  expect_error_kind([&] { run_query(store, "SELECT * FROM {html:" + path.string() + "#3};"); },
                    etlq::ErrorKind::ExtractFailed, "table number past the document");
#else
  expect_error_kind([&] { run_query(store, "SELECT * FROM {html:" + path.string() + "};"); },
                    etlq::ErrorKind::ExtractFailed, "html reports the missing feature");
#endif
  std::filesystem::remove(path);
}

void test_parquet_round_trip() {
  auto path = temp_path("sales.parquet");
  auto store = std::make_shared<MemoryStore>();
  store->put("sales", sales_relation());
#ifdef ETLQ_USE_ARROW
  run_query(store, "SELECT * INTO {parquet:" + path.string() + "} FROM sales;");
  Relation back = run_query(store, "SELECT * FROM {parquet:" + path.string() + "};");
  expect_true(back == sales_relation(), "parquet preserves rows and types");
  std::filesystem::remove(path);
#else
  expect_error_kind([&] { run_query(store, "SELECT * INTO {parquet:" + path.string() + "} FROM sales;"); },
                    etlq::ErrorKind::LoadFailed, "parquet reports the missing feature");
#endif
}

}  // namespace

void register_adapter_tests(std::vector<TestCase>& tests) {
  tests.push_back({"infer_value", test_infer_value});
  tests.push_back({"read_csv_quoting", test_read_csv_quoting});
  tests.push_back({"read_csv_header_names", test_read_csv_header_names});
  tests.push_back({"read_csv_errors", test_read_csv_errors});
  tests.push_back({"read_csv_custom_delimiter", test_read_csv_custom_delimiter});
  tests.push_back({"write_csv", test_write_csv});
  tests.push_back({"csv_file_adapter_round_trip", test_csv_file_adapter_round_trip});
  tests.push_back({"csv_adapter_delimiter_option", test_csv_adapter_delimiter_option});
  tests.push_back({"relation_from_json", test_relation_from_json});
  tests.push_back({"relation_to_json", test_relation_to_json});
  tests.push_back({"json_file_adapter", test_json_file_adapter});
  tests.push_back({"detect_body_format", test_detect_body_format});
  tests.push_back({"registry_lookup", test_registry_lookup});
  tests.push_back({"remote_collector_source", test_remote_collector_source});
  tests.push_back({"missing_file_is_extract_failure", test_missing_file_is_extract_failure});
  tests.push_back({"html_tables", test_html_tables});
  tests.push_back({"parquet_round_trip", test_parquet_round_trip});
}
