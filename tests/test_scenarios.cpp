#include "test_harness.h"

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "cli_args.h"
#include "etlq/etlq.h"
#include "test_utils.h"

namespace {

using etlq::Relation;
using etlq::Value;

std::shared_ptr<MemoryStore> shop_store() {
  auto store = std::make_shared<MemoryStore>();
  store->put("sales", sales_relation());
  store->put("orders", make_relation({"order_id", "cust_id"},
                                     {{int64_t{1}, int64_t{10}}, {int64_t{2}, int64_t{20}}, {int64_t{3}, int64_t{10}}}));
  store->put("customers", make_relation({"id", "name"}, {}));
  store->put("people", make_relation({"id", "name"}, {{int64_t{10}, std::string("ann")},
                                                      {int64_t{20}, std::string("bob")}}));
  store->put("cities", make_relation({"id", "city"}, {{int64_t{10}, std::string("Paris")}}));
  return store;
}

class CountingObserver : public etlq::ExecutionObserver {
 public:
  void on_step_begin(size_t, const std::string& description) override { descriptions.push_back(description); }
  void on_step_end(size_t, const Relation&) override { ++ended; }

  std::vector<std::string> descriptions;
  size_t ended = 0;
};

void test_scenario_group_by_sum() {
  auto store = shop_store();
  Relation out = run_query(store, "SELECT region, sum(amount) FROM sales GROUP BY region;");
  Relation expected = make_relation({"region", "sum(amount)"},
                                    {{std::string("east"), int64_t{30}}, {std::string("west"), int64_t{5}}});
  expect_true(out == expected, "east first with 30, then west with 5");
}

void test_scenario_order_desc_limit() {
  auto store = shop_store();
  Relation out = run_query(store, "SELECT * FROM sales ORDER BY amount DESC LIMIT 2;");
  Relation expected = make_relation({"region", "amount"},
                                    {{std::string("east"), int64_t{20}}, {std::string("east"), int64_t{10}}});
  expect_true(out == expected, "two largest amounts");
}

void test_scenario_filtered_aggregate() {
  auto store = shop_store();
  Relation out = run_query(store, "SELECT sum(amount) FROM sales WHERE region = 'east';");
  expect_eq(out.row_count(), 1, "single row");
  expect_true(out.rows()[0][0] == Value(int64_t{30}), "sum of east");
}

void test_scenario_column_not_in_group_by() {
  auto store = shop_store();
  expect_error_kind([&] { run_query(store, "SELECT region FROM sales GROUP BY amount;"); },
                    etlq::ErrorKind::ColumnNotInGroupBy, "region is neither key nor aggregated");
}

void test_scenario_left_join_empty_right() {
  auto store = shop_store();
  Relation out = run_query(store, "SELECT * FROM orders LEFT JOIN customers ON cust_id = id;");
  expect_true(out == store->get("orders"), "copy of the left relation");
}

void test_sql_join_qualified_columns() {
  auto store = shop_store();
  Relation out = run_query(store,
                           "SELECT o.order_id, p.name FROM orders AS o JOIN people AS p ON o.cust_id = p.id "
                           "WHERE p.name = 'ann' ORDER BY order_id DESC;");
  expect_true(out.columns() == std::vector<std::string>({"order_id", "name"}), "projected join columns");
  expect_eq(out.row_count(), 2, "ann has two orders");
  expect_true(out.rows()[0][0] == Value(int64_t{3}), "descending order ids");
}

void test_sql_join_renamed_and_coalesced_keys() {
  auto store = shop_store();
  Relation renamed = run_query(store, "SELECT p.id, c.city FROM people AS p JOIN cities AS c ON p.name = c.city;");
  expect_eq(renamed.row_count(), 0, "no name equals a city");
  expect_true(renamed.columns() == std::vector<std::string>({"id_left", "city"}), "shared name suffixed");

  Relation coalesced = run_query(store, "SELECT c.id, p.name, c.city FROM people AS p JOIN cities AS c ON p.id = c.id;");
  expect_true(coalesced.columns() == std::vector<std::string>({"id", "name", "city"}), "equal keys coalesced");
  expect_true(coalesced.rows()[0][2] == Value(std::string("Paris")), "joined value");
}

void test_sql_three_way_join() {
  auto store = shop_store();
  Relation out = run_query(store,
                           "SELECT order_id, name, city FROM orders AS o JOIN people AS p ON o.cust_id = p.id "
                           "LEFT JOIN cities AS c ON p.id = c.id;");
  expect_eq(out.row_count(), 3, "every order matches a person");
  expect_true(out.rows()[1][2] == Value{}, "bob has no city");
  expect_true(out.rows()[2][2] == Value(std::string("Paris")), "ann's city");
}

void test_select_into_loads_result() {
  auto store = shop_store();
  etlq::AdapterRegistry registry = make_test_registry(store);
  etlq::ExecutionResult result =
      etlq::execute_query("SELECT region, sum(amount) INTO {table:totals} FROM sales GROUP BY region;", registry);
  expect_true(result.loaded_to.has_value() && *result.loaded_to == "table:totals", "load target reported");
  expect_true(store->has("totals"), "destination written");
  expect_eq(store->get("totals").row_count(), 2, "grouped rows written");
}

void test_insert_values_loads_rows() {
  auto store = shop_store();
  run_query(store, "INSERT INTO {table:fresh} (name, score) VALUES ('a', 1), ('b', 2.5);");
  expect_true(store->has("fresh"), "insert target written");
  const Relation& fresh = store->get("fresh");
  expect_true(fresh.columns() == std::vector<std::string>({"name", "score"}), "insert columns");
  expect_true(fresh.rows()[1][1] == Value(2.5), "decimal value");
}

void test_execution_errors() {
  auto store = shop_store();
  expect_error_kind([&] { run_query(store, "SELECT * FROM {nosuch:x};"); }, etlq::ErrorKind::UnknownSourceType,
                    "unregistered source type");
  expect_error_kind([&] { run_query(store, "SELECT * FROM {table:missing};"); }, etlq::ErrorKind::ExtractFailed,
                    "adapter failure wrapped");
  expect_error_kind([&] { run_query(store, "SELECT * INTO {nosuch:x} FROM sales;"); },
                    etlq::ErrorKind::UnknownSourceType, "unregistered destination type");
  expect_error_kind([&] { run_query(store, "SELECT * FROM sales WHERE;"); }, etlq::ErrorKind::SyntaxError,
                    "syntax errors propagate");
  expect_error_kind([&] { run_query(store, "DELETE FROM sales;"); }, etlq::ErrorKind::UnsupportedStatement,
                    "delete is not executed");
  expect_error_kind([&] { run_query(store, "SELECT * FROM orders JOIN people ON order_id = missing;"); },
                    etlq::ErrorKind::MissingJoinColumn, "join key absent on the right");
  try {
    run_query(store, "SELECT * FROM {table:missing};");
  } catch (const etlq::QueryError& e) {
    expect_str_eq(e.what(), "Error extracting data from 'table:missing': No table named missing",
                  "extract error names the source");
  }
}

void test_bare_name_needs_table_source() {
  etlq::AdapterRegistry registry = etlq::make_default_registry();
  expect_error_kind([&] { etlq::execute_query("SELECT * FROM sales;", registry); },
                    etlq::ErrorKind::UnknownSourceType, "default registry has no table adapter");
  try {
    etlq::execute_query("SELECT * FROM sales;", registry);
  } catch (const etlq::QueryError& e) {
    std::string message = e.what();
    expect_true(message.find("Unknown source type 'table'") != std::string::npos, "names the missing type");
    expect_true(message.find("write {type:path} instead") != std::string::npos, "suggests an explicit source");
  }
  try {
    etlq::execute_query("SELECT * FROM {nosuch:x};", registry);
  } catch (const etlq::QueryError& e) {
    expect_true(std::string(e.what()).find("{type:path}") == std::string::npos, "hint only for table");
  }
  std::ostringstream help;
  etlq::cli::print_help(help);
  expect_true(help.str().find("A bare name such as FROM sales means {table:sales}") != std::string::npos,
              "help explains bare names");
}

void test_failed_statement_loads_nothing() {
  auto store = shop_store();
  expect_error_kind([&] { run_query(store, "SELECT nope INTO {table:out} FROM sales;"); },
                    etlq::ErrorKind::ColumnNotFound, "transform fails");
  expect_true(!store->has("out"), "no partial load");
}

void test_load_failure_wrapped() {
  auto store = shop_store();
  std::string query = "SELECT * INTO {csv:" + temp_path("missing_dir/out.csv").string() + "} FROM sales;";
  expect_error_kind([&] { run_query(store, query); }, etlq::ErrorKind::LoadFailed, "unwritable destination");
}

void test_observer_sees_every_step() {
  auto store = shop_store();
  etlq::AdapterRegistry registry = make_test_registry(store);
  CountingObserver observer;
  etlq::execute_query("SELECT * FROM orders AS o JOIN people AS p ON o.cust_id = p.id;", registry, &observer);
  expect_eq(observer.descriptions.size(), 4, "extract, extract, join, transform");
  expect_eq(observer.ended, 4, "every step reported its result");
  expect_str_eq(observer.descriptions[0], "extract table:orders as o", "first step description");
}

void test_explain_does_not_execute() {
  std::string plan = etlq::explain_query("SELECT * INTO {table:never} FROM {table:nowhere};");
  expect_true(plan.find("\"step\": \"load\"") != std::string::npos, "load step listed");
  expect_error_kind([] { etlq::explain_query("SELECT * FROM a AS x JOIN b AS x ON x.id = x.id;"); },
                    etlq::ErrorKind::DuplicateAlias, "explain validates the plan");
}

}  // namespace

void register_scenario_tests(std::vector<TestCase>& tests) {
  tests.push_back({"scenario_group_by_sum", test_scenario_group_by_sum});
  tests.push_back({"scenario_order_desc_limit", test_scenario_order_desc_limit});
  tests.push_back({"scenario_filtered_aggregate", test_scenario_filtered_aggregate});
  tests.push_back({"scenario_column_not_in_group_by", test_scenario_column_not_in_group_by});
  tests.push_back({"scenario_left_join_empty_right", test_scenario_left_join_empty_right});
  tests.push_back({"sql_join_qualified_columns", test_sql_join_qualified_columns});
  tests.push_back({"sql_join_renamed_and_coalesced_keys", test_sql_join_renamed_and_coalesced_keys});
  tests.push_back({"sql_three_way_join", test_sql_three_way_join});
  tests.push_back({"select_into_loads_result", test_select_into_loads_result});
  tests.push_back({"insert_values_loads_rows", test_insert_values_loads_rows});
  tests.push_back({"execution_errors", test_execution_errors});
  tests.push_back({"bare_name_needs_table_source", test_bare_name_needs_table_source});
  tests.push_back({"failed_statement_loads_nothing", test_failed_statement_loads_nothing});
  tests.push_back({"load_failure_wrapped", test_load_failure_wrapped});
  tests.push_back({"observer_sees_every_step", test_observer_sees_every_step});
  tests.push_back({"explain_does_not_execute", test_explain_does_not_execute});
}
