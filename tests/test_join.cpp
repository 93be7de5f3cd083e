#include "test_harness.h"

#include <string>
#include <vector>

#include "etlq/etlq.h"
#include "test_utils.h"

namespace {

using etlq::Relation;
using etlq::Value;

Relation orders() {
  return make_relation({"order_id", "cust_id"},
                       {{int64_t{1}, int64_t{10}}, {int64_t{2}, int64_t{20}}, {int64_t{3}, int64_t{10}}});
}

Relation customers() {
  return make_relation({"id", "name"}, {{int64_t{10}, std::string("ann")}, {int64_t{30}, std::string("cy")}});
}

void test_join_inner_keeps_left_order() {
  Relation out = etlq::join(orders(), customers(), "cust_id", "id", "inner");
  expect_true(out.columns() == std::vector<std::string>({"order_id", "cust_id", "id", "name"}), "merged columns");
  expect_eq(out.row_count(), 2, "two matches");
  expect_true(out.rows()[0][0] == Value(int64_t{1}) && out.rows()[1][0] == Value(int64_t{3}), "left order");
  expect_true(out.rows()[1][3] == Value(std::string("ann")), "right cells copied");
}

void test_join_left_fills_nulls() {
  Relation out = etlq::join(orders(), customers(), "cust_id", "id", "left");
  expect_eq(out.row_count(), 3, "every left row kept");
  expect_true(etlq::is_null(out.rows()[1][2]) && etlq::is_null(out.rows()[1][3]), "unmatched right side is NULL");
}

void test_join_right_follows_right_order() {
  Relation out = etlq::join(orders(), customers(), "cust_id", "id", "right");
  expect_eq(out.row_count(), 3, "two matches for id 10 plus unmatched id 30");
  expect_true(out.rows()[0][0] == Value(int64_t{1}) && out.rows()[1][0] == Value(int64_t{3}),
              "matches for first right row first");
  expect_true(etlq::is_null(out.rows()[2][0]) && out.rows()[2][3] == Value(std::string("cy")),
              "unmatched right row last");
}

void test_join_outer_appends_unmatched_right() {
  Relation out = etlq::join(orders(), customers(), "cust_id", "id", "outer");
  expect_eq(out.row_count(), 4, "three left rows plus one unmatched right row");
  expect_true(out.rows()[1][0] == Value(int64_t{2}) && etlq::is_null(out.rows()[1][3]), "unmatched left in place");
  expect_true(etlq::is_null(out.rows()[3][0]) && out.rows()[3][2] == Value(int64_t{30}), "unmatched right at end");
}

void test_join_coalesces_equal_key_names() {
  Relation left = make_relation({"id", "v"}, {{int64_t{1}, std::string("a")}, {int64_t{2}, std::string("b")}});
  Relation right = make_relation({"id", "w"}, {{int64_t{2}, std::string("x")}, {int64_t{3}, std::string("y")}});
  Relation out = etlq::join(left, right, "id", "id", "outer");
  expect_true(out.columns() == std::vector<std::string>({"id", "v", "w"}), "single key column");
  expect_eq(out.row_count(), 3, "outer rows");
  expect_true(out.rows()[2][0] == Value(int64_t{3}), "key taken from right for unmatched right row");
  expect_true(etlq::is_null(out.rows()[2][1]), "left value NULL");
}

void test_join_suffixes_shared_names() {
  Relation left = make_relation({"id", "name"}, {{int64_t{1}, std::string("l")}});
  Relation right = make_relation({"rid", "name"}, {{int64_t{1}, std::string("r")}});
  Relation out = etlq::join(left, right, "id", "rid", "inner");
  expect_true(out.columns() == std::vector<std::string>({"id", "name_left", "rid", "name_right"}),
              "shared non-key names suffixed");
}

void test_join_multi_key() {
  Relation left = make_relation({"a", "b", "v"}, {{int64_t{1}, int64_t{1}, std::string("x")},
                                                  {int64_t{1}, int64_t{2}, std::string("y")}});
  Relation right = make_relation({"c", "d", "w"}, {{int64_t{1}, int64_t{2}, std::string("z")}});
  Relation out = etlq::join(left, right, {{"a", "c"}, {"b", "d"}}, "inner");
  expect_eq(out.row_count(), 1, "both keys must match");
  expect_true(out.rows()[0][2] == Value(std::string("y")), "matching row");
}

void test_join_null_keys_never_match() {
  Relation left = make_relation({"k"}, {{Value{}}, {int64_t{1}}});
  Relation right = make_relation({"j"}, {{Value{}}, {int64_t{1}}});
  Relation out = etlq::join(left, right, "k", "j", "inner");
  expect_eq(out.row_count(), 1, "only the non-null key matches");
}

void test_join_numeric_keys_compare_by_value() {
  Relation left = make_relation({"k"}, {{int64_t{1}}});
  Relation right = make_relation({"j"}, {{1.0}});
  Relation out = etlq::join(left, right, "k", "j", "inner");
  expect_eq(out.row_count(), 1, "1 joins 1.0");
}

void test_join_empty_input_rules() {
  Relation empty_left = make_relation({"order_id", "cust_id"}, {});
  Relation empty_right = make_relation({"id", "name"}, {});

  expect_true(etlq::join(orders(), empty_right, "cust_id", "id", "left") == orders(), "left kind keeps left");
  expect_true(etlq::join(orders(), empty_right, "cust_id", "id", "outer") == orders(), "outer kind keeps left");
  Relation inner = etlq::join(orders(), empty_right, "cust_id", "id", "inner");
  expect_eq(inner.row_count(), 0, "inner with empty right is empty");
  expect_eq(inner.column_count(), 4, "empty result keeps the merged schema");
  expect_eq(etlq::join(orders(), empty_right, "cust_id", "id", "right").row_count(), 0, "right kind is empty");

  expect_true(etlq::join(empty_left, customers(), "cust_id", "id", "right") == customers(), "right keeps right");
  expect_true(etlq::join(empty_left, customers(), "cust_id", "id", "outer") == customers(), "outer keeps right");
  expect_eq(etlq::join(empty_left, customers(), "cust_id", "id", "left").row_count(), 0, "left kind is empty");
  expect_eq(etlq::join(empty_left, empty_right, "cust_id", "id", "outer").row_count(), 0, "both empty");
}

void test_join_empty_input_skips_key_check() {
  Relation empty_right = make_relation({"other"}, {});
  Relation out = etlq::join(orders(), empty_right, "cust_id", "missing", "left");
  expect_true(out == orders(), "missing key column is not checked for empty input");
}

void test_join_invalid_kind() {
  expect_error_kind([] { etlq::join(orders(), customers(), "cust_id", "id", "cross"); },
                    etlq::ErrorKind::InvalidJoinKind, "unknown join kind");
  expect_error_kind([] { etlq::join(orders(), customers(), "cust_id", "id", "INNER"); },
                    etlq::ErrorKind::InvalidJoinKind, "kind names are lowercase");
}

void test_join_missing_column() {
  try {
    etlq::join(orders(), customers(), "customer", "id", "inner");
    expect_true(false, "missing left key should throw");
  } catch (const etlq::MissingJoinColumnError& e) {
    expect_true(e.side() == etlq::MissingJoinColumnError::Side::Left, "left side reported");
    expect_str_eq(e.column(), "customer", "missing column name");
    expect_eq(e.available().size(), 2, "available columns listed");
    expect_true(e.kind() == etlq::ErrorKind::MissingJoinColumn, "kind");
  }
  expect_error_kind([] { etlq::join(orders(), customers(), "cust_id", "nope", "inner"); },
                    etlq::ErrorKind::MissingJoinColumn, "missing right key");
}

}  // namespace

void register_join_tests(std::vector<TestCase>& tests) {
  tests.push_back({"join_inner_keeps_left_order", test_join_inner_keeps_left_order});
  tests.push_back({"join_left_fills_nulls", test_join_left_fills_nulls});
  tests.push_back({"join_right_follows_right_order", test_join_right_follows_right_order});
  tests.push_back({"join_outer_appends_unmatched_right", test_join_outer_appends_unmatched_right});
  tests.push_back({"join_coalesces_equal_key_names", test_join_coalesces_equal_key_names});
  tests.push_back({"join_suffixes_shared_names", test_join_suffixes_shared_names});
  tests.push_back({"join_multi_key", test_join_multi_key});
  tests.push_back({"join_null_keys_never_match", test_join_null_keys_never_match});
  tests.push_back({"join_numeric_keys_compare_by_value", test_join_numeric_keys_compare_by_value});
  tests.push_back({"join_empty_input_rules", test_join_empty_input_rules});
  tests.push_back({"join_empty_input_skips_key_check", test_join_empty_input_skips_key_check});
  tests.push_back({"join_invalid_kind", test_join_invalid_kind});
  tests.push_back({"join_missing_column", test_join_missing_column});
}
