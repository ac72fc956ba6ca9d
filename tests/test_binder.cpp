#include <memory>
#include <string>

#include "bind/binder.h"
#include "syntax/syntax.h"
#include "test_harness.h"
#include "test_utils.h"

namespace {

using navsql::BindingKind;
using navsql::BindingPtr;

BindingPtr bind_text(const navsql::Catalog& catalog, const std::string& query,
                     const navsql::Environment& environment = {}) {
  auto text = std::make_shared<const std::string>(query);
  navsql::ParseResult parsed = navsql::parse_query(query);
  if (!parsed.query) return nullptr;
  navsql::Binder binder(catalog, environment, text);
  return binder.bind_query(*parsed.query, std::nullopt);
}

std::string describe_failure(const std::string& query) {
  auto catalog = make_university_catalog();
  try {
    bind_text(*catalog, query);
  } catch (const navsql::Error& ex) {
    return ex.describe();
  }
  return {};
}

void test_bind_table_selection() {
  auto catalog = make_university_catalog();
  BindingPtr collect = bind_text(*catalog, "/school{code, name}");
  expect_true(collect && collect->kind == BindingKind::Collect, "query binds to a collect");
  if (!collect) return;
  expect_true(collect->seed->kind == BindingKind::Selection, "seed is a selection");
  expect_eq(collect->seed->elements.size(), 2, "two elements");
  expect_str(collect->title, "school", "collect is titled after the table");
  expect_str(collect->seed->domain->to_string(), "{code: text, name: text}", "record domain");
}

void test_bare_table_expands_columns() {
  auto catalog = make_university_catalog();
  BindingPtr collect = bind_text(*catalog, "/school");
  if (!collect) {
    expect_true(false, "query binds");
    return;
  }
  expect_eq(collect->seed->elements.size(), 3, "all public columns are selected");
  expect_str(collect->seed->elements[2]->title, "campus", "columns keep catalog order");
}

void test_bare_slash_binds_nothing() {
  auto catalog = make_university_catalog();
  expect_true(bind_text(*catalog, "/") == nullptr, "bare slash has no binding");
}

void test_names_are_case_insensitive() {
  auto catalog = make_university_catalog();
  BindingPtr collect = bind_text(*catalog, "/School{CODE}");
  expect_true(collect != nullptr, "mixed case names resolve");
}

void test_column_link_navigates() {
  auto catalog = make_university_catalog();
  BindingPtr collect = bind_text(*catalog, "/department{code, school_code.name}");
  expect_true(collect != nullptr, "single-column foreign key acts as a link");
  BindingPtr target = bind_text(*catalog, "/department.school_code");
  if (!target) {
    expect_true(false, "link as a flow binds");
    return;
  }
  expect_eq(target->seed->elements.size(), 3, "linked flow selects the target columns");
}

void test_unknown_attribute() {
  expect_str(translate_error("/school{code, rector}"), "unable to find attribute 'rector'",
             "unknown column");
  expect_str(translate_error("/faculty"), "unable to find attribute 'faculty'", "unknown table");
}

void test_ambiguous_direct_link() {
  expect_str(translate_error("/transfer{school.name}"), "ambiguous name 'school'",
             "two foreign keys reach school");
  std::string described = describe_failure("/transfer{school.name}");
  expect_contains(described, "candidates are link transfer(from_school) -> school(code)",
                  "first candidate listed");
  expect_contains(described, "and link transfer(to_school) -> school(code)",
                  "second candidate listed");
  expect_contains(described, "While translating:", "excerpt follows the message");
}

void test_ambiguous_reverse_link() {
  expect_str(translate_error("/school{code, count(transfer)}"), "ambiguous name 'transfer'",
             "two foreign keys refer to school");
  std::string described = describe_failure("/school{code, count(transfer)}");
  expect_contains(described, "reverse link school(code) -> transfer(from_school)",
                  "reverse candidate listed");
}

void test_unambiguous_through_column() {
  expect_str(translate_error("/transfer{id, from_school.name, to_school.name}"), "",
             "column links disambiguate");
}

void test_parameter_errors() {
  expect_str(translate_error("/school?code=$code"), "unable to find parameter '$code'",
             "missing parameter");
  navsql::Environment environment;
  environment["code"] = navsql::ParameterValue{navsql::Value::text("eng"),
                                               navsql::Domain::untyped()};
  expect_str(translate_error("/school?code=$code", environment), "", "bound parameter");
}

void test_type_errors() {
  expect_str(translate_error("/student?dob='2010-13-01'"),
             "cannot convert '2010-13-01' to date", "untyped literal converts to date");
  expect_str(translate_error("/school{sum(department.name)}"), "expected a numeric argument",
             "sum needs numbers");
  expect_str(translate_error("/school{frobnicate(code)}"), "unable to find function 'frobnicate'",
             "unknown function");
  expect_str(translate_error("/school.limit(-1)"), "expected a non-negative integer",
             "negative limit");
}

void test_function_arity() {
  std::string message = translate_error("/school{count(department, code)}");
  expect_contains(message, "function 'count' expects 1 argument", "arity message");
}

}  // namespace

void register_binder_tests(std::vector<TestCase>& tests) {
  tests.push_back({"binder_table_selection", test_bind_table_selection});
  tests.push_back({"binder_bare_table_expands_columns", test_bare_table_expands_columns});
  tests.push_back({"binder_bare_slash_binds_nothing", test_bare_slash_binds_nothing});
  tests.push_back({"binder_names_are_case_insensitive", test_names_are_case_insensitive});
  tests.push_back({"binder_column_link_navigates", test_column_link_navigates});
  tests.push_back({"binder_unknown_attribute", test_unknown_attribute});
  tests.push_back({"binder_ambiguous_direct_link", test_ambiguous_direct_link});
  tests.push_back({"binder_ambiguous_reverse_link", test_ambiguous_reverse_link});
  tests.push_back({"binder_unambiguous_through_column", test_unambiguous_through_column});
  tests.push_back({"binder_parameter_errors", test_parameter_errors});
  tests.push_back({"binder_type_errors", test_type_errors});
  tests.push_back({"binder_function_arity", test_function_arity});
}
