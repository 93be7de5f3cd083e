#include "test_harness.h"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "plan/plan.h"
#include "query_parser.h"

namespace {

etlq::Plan plan_for(const std::string& query) {
  return etlq::build_plan(etlq::parse_statement(query));
}

void test_plan_step_order() {
  etlq::Plan plan = plan_for(
      "SELECT a.id INTO {json:out.json} FROM {csv:a.csv} AS a JOIN {csv:b.csv} AS b ON a.id = b.id "
      "LEFT JOIN {csv:c.csv} AS c ON b.k = c.k;");
  expect_eq(plan.steps.size(), 7, "three extracts, two joins, transform, load");
  expect_true(std::holds_alternative<etlq::ExtractStep>(plan.steps[0]), "step 0 extract");
  expect_true(std::holds_alternative<etlq::ExtractStep>(plan.steps[1]), "step 1 extract");
  expect_true(std::holds_alternative<etlq::ExtractStep>(plan.steps[2]), "step 2 extract");
  expect_true(std::holds_alternative<etlq::JoinStep>(plan.steps[3]), "step 3 join");
  expect_true(std::holds_alternative<etlq::JoinStep>(plan.steps[4]), "step 4 join");
  expect_true(std::holds_alternative<etlq::TransformStep>(plan.steps[5]), "step 5 transform");
  expect_true(std::holds_alternative<etlq::LoadStep>(plan.steps[6]), "step 6 load");
  const auto& second_join = std::get<etlq::JoinStep>(plan.steps[4]);
  expect_eq(second_join.right_step, 2, "second join folds in the third source");
  expect_true(second_join.kind == etlq::JoinClause::Kind::Left, "join kind carried");
  expect_eq(plan.aliases.size(), 3, "three aliases");
  expect_eq(plan.aliases.at("c"), 2, "alias maps to extract id");
}

void test_plan_without_joins() {
  etlq::Plan plan = plan_for("SELECT * FROM {csv:a.csv};");
  expect_eq(plan.steps.size(), 2, "extract and transform");
  const auto& extract = std::get<etlq::ExtractStep>(plan.steps[0]);
  expect_true(extract.alias.empty(), "datasource literal without AS has no alias");
  expect_true(plan.aliases.empty(), "no aliases");
}

void test_plan_duplicate_alias() {
  expect_error_kind([] { plan_for("SELECT * FROM {csv:a.csv} AS x JOIN {csv:b.csv} AS x ON x.id = x.id;"); },
                    etlq::ErrorKind::DuplicateAlias, "alias reused");
  expect_error_kind([] { plan_for("SELECT * FROM t JOIN t ON t.id = t.id;"); }, etlq::ErrorKind::DuplicateAlias,
                    "bare table joined to itself without aliases");
}

void test_plan_unknown_alias() {
  expect_error_kind([] { plan_for("SELECT z.id FROM {csv:a.csv} AS a;"); }, etlq::ErrorKind::UnknownAlias,
                    "unknown qualifier in select");
  expect_error_kind([] { plan_for("SELECT * FROM {csv:a.csv} AS a WHERE q.x = 1;"); }, etlq::ErrorKind::UnknownAlias,
                    "unknown qualifier in where");
  expect_error_kind(
      [] {
        plan_for("SELECT * FROM {csv:a.csv} AS a JOIN {csv:b.csv} AS b ON a.id = c.id "
                 "JOIN {csv:c.csv} AS c ON b.id = c.id;");
      },
      etlq::ErrorKind::UnknownAlias, "ON may only see sources introduced so far");
}

void test_plan_rejects_or_in_join() {
  expect_error_kind(
      [] { plan_for("SELECT * FROM {csv:a.csv} AS a JOIN {csv:b.csv} AS b ON a.id = b.id OR a.k = b.k;"); },
      etlq::ErrorKind::UnsupportedJoinCondition, "OR in ON");
  expect_error_kind([] { plan_for("SELECT * FROM {csv:a.csv} AS a JOIN {csv:b.csv} AS b ON a.id = a.k;"); },
                    etlq::ErrorKind::UnsupportedJoinCondition, "both sides from the same source");
}

void test_plan_orients_join_keys() {
  etlq::Plan plan = plan_for("SELECT * FROM {csv:a.csv} AS a JOIN {csv:b.csv} AS b ON b.ref = a.id AND a.k = b.k;");
  const auto& join = std::get<etlq::JoinStep>(plan.steps[2]);
  expect_eq(join.keys.size(), 2, "two key pairs");
  expect_str_eq(etlq::format_column_ref(join.keys[0].left), "a.id", "swapped left key");
  expect_str_eq(etlq::format_column_ref(join.keys[0].right), "b.ref", "swapped right key");
  expect_str_eq(etlq::format_column_ref(join.keys[1].left), "a.k", "unchanged left key");
}

void test_plan_insert_and_unsupported() {
  etlq::Plan plan = plan_for("INSERT INTO {csv:out.csv} VALUES (1, 'a'), (2, 'b');");
  expect_eq(plan.steps.size(), 2, "values and load");
  const auto& values = std::get<etlq::ValuesStep>(plan.steps[0]);
  expect_eq(values.relation.row_count(), 2, "two literal rows");
  expect_true(values.relation.columns() == std::vector<std::string>({"col1", "col2"}), "generated column names");
  expect_error_kind([] { plan_for("UPDATE t SET a = 1;"); }, etlq::ErrorKind::UnsupportedStatement, "update");
  expect_error_kind([] { plan_for("DELETE FROM t;"); }, etlq::ErrorKind::UnsupportedStatement, "delete");
}

void test_plan_json_shape() {
  etlq::Plan plan = plan_for(
      "SELECT region, sum(amount) FROM {csv:s.csv} AS s JOIN {csv:r.csv} AS r ON s.region = r.region "
      "WHERE amount > 2 GROUP BY region ORDER BY sum(amount) DESC LIMIT 10;");
  auto doc = nlohmann::json::parse(etlq::plan_to_json(plan));
  expect_eq(doc["steps"].size(), 4, "four steps");
  expect_true(doc["aliases"]["r"] == 1, "alias table");
  const auto& extract = doc["steps"][0];
  expect_true(extract["step"] == "extract" && extract["type"] == "csv" && extract["path"] == "s.csv",
              "extract fields");
  expect_true(extract["alias"] == "s", "extract alias");
  const auto& join = doc["steps"][2];
  expect_true(join["kind"] == "inner" && join["right"] == 1, "join fields");
  expect_true(join["keys"][0]["left"] == "s.region" && join["keys"][0]["right"] == "r.region", "join keys");
  const auto& transform = doc["steps"][3];
  expect_true(transform["columns"][1] == "sum(amount)", "aggregation column name");
  expect_true(transform["filter"] == "(amount > 2)", "filter text");
  expect_true(transform["group_by"][0] == "region", "group key");
  expect_true(transform["order_by"][0]["direction"] == "desc", "order direction");
  expect_true(transform["limit"]["kind"] == "limit" && transform["limit"]["count"] == 10, "limit");
  expect_true(transform["distinct"] == false, "distinct flag");
}

void test_plan_describe_steps() {
  etlq::Plan plan = plan_for(
      "SELECT * INTO {json:o.json} FROM {csv:a.csv} AS a RIGHT JOIN {csv:b.csv} AS b ON a.id = b.id;");
  expect_str_eq(etlq::describe_step(plan.steps[0]), "extract csv:a.csv as a", "extract description");
  expect_str_eq(etlq::describe_step(plan.steps[2]), "right join with step 1 on a.id = b.id", "join description");
  expect_str_eq(etlq::describe_step(plan.steps[3]), "transform", "transform description");
  expect_str_eq(etlq::describe_step(plan.steps[4]), "load into json:o.json", "load description");
}

}  // namespace

void register_plan_tests(std::vector<TestCase>& tests) {
  tests.push_back({"plan_step_order", test_plan_step_order});
  tests.push_back({"plan_without_joins", test_plan_without_joins});
  tests.push_back({"plan_duplicate_alias", test_plan_duplicate_alias});
  tests.push_back({"plan_unknown_alias", test_plan_unknown_alias});
  tests.push_back({"plan_rejects_or_in_join", test_plan_rejects_or_in_join});
  tests.push_back({"plan_orients_join_keys", test_plan_orients_join_keys});
  tests.push_back({"plan_insert_and_unsupported", test_plan_insert_and_unsupported});
  tests.push_back({"plan_json_shape", test_plan_json_shape});
  tests.push_back({"plan_describe_steps", test_plan_describe_steps});
}
