#include <string>

#include "test_harness.h"
#include "test_utils.h"

namespace {

using navsql::Cell;
using navsql::Value;

/// Lays out cells by profile field so tests do not depend on the select order.
std::vector<Cell> row_for(const navsql::Plan& plan, const std::vector<Cell>& fields) {
  std::vector<Cell> row(plan.domains.size());
  for (size_t i = 0; i < fields.size() && i < plan.outputs.size(); ++i) {
    row[plan.outputs[i]] = fields[i];
  }
  return row;
}

void test_permission_checked_first() {
  auto catalog = make_university_catalog();
  navsql::Pipe pipe = navsql::translate("/school", *catalog);
  FakeConnection connection;
  connection.readable = false;
  bool threw = false;
  try {
    pipe(connection);
  } catch (const navsql::PermissionError&) {
    threw = true;
  }
  expect_true(threw, "an unreadable connection is refused");
  expect_eq(connection.executions, 0, "nothing is executed without permission");
}

void test_driver_failure_wrapped() {
  auto catalog = make_university_catalog();
  navsql::Pipe pipe = navsql::translate("/school", *catalog);
  FakeConnection connection;
  connection.fail_execute = true;
  std::string message;
  try {
    pipe(connection);
  } catch (const navsql::EngineError& ex) {
    message = ex.what();
  }
  expect_contains(message, "relation \"ad.school\" does not exist",
                  "driver message is carried verbatim");
}

void test_column_count_checked() {
  auto catalog = make_university_catalog();
  navsql::Pipe pipe = navsql::translate("/school{code, name}", *catalog);
  FakeConnection connection;
  connection.rows.push_back({Cell("eng")});
  bool threw = false;
  try {
    pipe(connection);
  } catch (const navsql::EngineError& ex) {
    threw = true;
    expect_contains(ex.what(), "columns per row", "mismatch names the column count");
  }
  expect_true(threw, "short rows are rejected");
}

void test_conversion_failure() {
  auto catalog = make_university_catalog();
  navsql::Pipe pipe = navsql::translate("/course{no}", *catalog);
  FakeConnection connection;
  connection.rows.push_back(row_for(pipe.plan(), {Cell("twelve")}));
  std::string message;
  try {
    pipe(connection);
  } catch (const navsql::EngineError& ex) {
    message = ex.what();
  }
  expect_contains(message, "unable to convert a result value", "bad cells are engine errors");
}

void test_empty_result_has_no_data() {
  auto catalog = make_university_catalog();
  navsql::Pipe pipe = navsql::translate("/school", *catalog);
  FakeConnection connection;
  navsql::Product product = pipe(connection);
  expect_eq(connection.executions, 1, "the statement runs once");
  expect_true(!product.data.has_value(), "no rows leaves the data unset");
  expect_eq(product.profile.fields.size(), 3, "the profile is still returned");
}

void test_rows_are_converted() {
  auto catalog = make_university_catalog();
  navsql::Pipe pipe = navsql::translate("/school{code, exists(department), campus}", *catalog);
  FakeConnection connection;
  connection.rows.push_back(row_for(pipe.plan(), {Cell("eng"), Cell("t"), Cell("old")}));
  connection.rows.push_back(row_for(pipe.plan(), {Cell("la"), Cell("0"), std::nullopt}));
  navsql::Product product = pipe(connection);
  expect_true(product.data.has_value(), "rows are returned");
  if (!product.data || product.data->size() != 2) return;
  const navsql::Row& first = (*product.data)[0];
  const navsql::Row& second = (*product.data)[1];
  expect_true(first[0] == Value::text("eng"), "text cell");
  expect_true(first[1] == Value::boolean(true), "'t' is true");
  expect_true(second[1] == Value::boolean(false), "'0' is false");
  expect_true(second[2].is_null(), "NULL cell stays null");
  expect_str(connection.last_sql, pipe.plan().sql, "the plan SQL is executed as is");
}

void test_parameters_in_placeholder_order() {
  auto catalog = make_university_catalog();
  navsql::Environment environment;
  environment["c"] = navsql::ParameterValue{Value::text("eng"), navsql::Domain::untyped()};
  environment["n"] = navsql::ParameterValue{Value(), navsql::Domain::untyped()};
  navsql::Pipe pipe = navsql::translate("/school?code=$c|name==$n|name=$c", *catalog, environment);
  FakeConnection connection;
  pipe(connection);
  const auto& placeholders = pipe.plan().placeholders;
  expect_eq(connection.last_parameters.size(), placeholders.size(),
            "one parameter per placeholder");
  for (size_t i = 0; i < placeholders.size() && i < connection.last_parameters.size(); ++i) {
    const Cell& cell = connection.last_parameters[i];
    if (placeholders[i].name == "c") {
      expect_true(cell && *cell == "eng", "text parameter is passed as text");
    } else {
      expect_true(!cell, "null parameter is passed as NULL");
    }
  }
}

void test_empty_query_not_executed() {
  auto catalog = make_university_catalog();
  navsql::Pipe pipe = navsql::translate("/", *catalog);
  FakeConnection connection;
  navsql::Product product = pipe(connection);
  expect_eq(connection.executions, 0, "an empty plan never reaches the engine");
  expect_true(!product.data.has_value(), "and yields no data");
}

}  // namespace

void register_pipe_tests(std::vector<TestCase>& tests) {
  tests.push_back({"pipe_permission_checked_first", test_permission_checked_first});
  tests.push_back({"pipe_driver_failure_wrapped", test_driver_failure_wrapped});
  tests.push_back({"pipe_column_count_checked", test_column_count_checked});
  tests.push_back({"pipe_conversion_failure", test_conversion_failure});
  tests.push_back({"pipe_empty_result_has_no_data", test_empty_result_has_no_data});
  tests.push_back({"pipe_rows_are_converted", test_rows_are_converted});
  tests.push_back({"pipe_parameters_in_placeholder_order", test_parameters_in_placeholder_order});
  tests.push_back({"pipe_empty_query_not_executed", test_empty_query_not_executed});
}
