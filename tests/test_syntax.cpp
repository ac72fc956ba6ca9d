#include <string>

#include "syntax/syntax.h"
#include "test_harness.h"

namespace {

using navsql::ParseResult;
using navsql::SyntaxKind;

std::string canonical(const std::string& query) {
  ParseResult result = navsql::parse_query(query);
  if (!result.query || !result.query->flow) return {};
  return navsql::syntax_to_string(*result.query->flow);
}

void test_parse_bare_slash() {
  ParseResult result = navsql::parse_query("/");
  expect_true(result.query.has_value(), "bare slash parses");
  expect_true(result.query && !result.query->flow, "bare slash has no flow");
}

void test_parse_selection_and_sieve() {
  ParseResult result = navsql::parse_query("/school{code, name}?campus='old'");
  expect_true(result.query.has_value(), "selection with sieve parses");
  if (!result.query) return;
  const auto& flow = *result.query->flow;
  expect_true(flow.kind == SyntaxKind::Sieve, "sieve binds loosest");
  expect_true(flow.lhs->kind == SyntaxKind::Select, "selection under the sieve");
  expect_eq(flow.lhs->rhs->args.size(), 2, "two selected fields");
}

void test_canonical_rendering() {
  expect_str(canonical("/school{code,count(department)}"), "school{code,count(department)}",
             "selection with aggregate");
  expect_str(canonical("/school.sort(code-)"), "school.sort(code-)", "descending direction");
  expect_str(canonical("/course?title~'lab'&credits>=3"), "course?title~'lab'&credits>=3",
             "comparison chain");
  expect_str(canonical("/school?name='Bob''s'"), "school?name='Bob''s'",
             "doubled quotes survive");
  expect_str(canonical("/department^school_code"), "department^school_code", "projection");
}

void test_operator_precedence() {
  ParseResult result = navsql::parse_query("/course?credits+1*2=5|!is_null(description)");
  expect_true(result.query.has_value(), "mixed operators parse");
  if (!result.query) return;
  const auto& filter = *result.query->flow->rhs;
  expect_true(filter.kind == SyntaxKind::Operator && filter.text == "|", "or is outermost");
  const auto& equality = *filter.lhs;
  expect_true(equality.text == "=", "comparison below or");
  expect_true(equality.lhs->text == "+", "addition below comparison");
  expect_true(equality.lhs->rhs->text == "*", "multiplication binds tighter");
  expect_true(filter.rhs->kind == SyntaxKind::Prefix, "negation prefix");
}

void test_spans_cover_fragments() {
  std::string query = "/school?name='x'";
  ParseResult result = navsql::parse_query(query);
  if (!result.query) {
    expect_true(false, "query parses");
    return;
  }
  const auto& rhs = *result.query->flow->rhs;
  expect_str(query.substr(rhs.span.start, rhs.span.end - rhs.span.start), "name='x'",
             "span of the filter");
}

void test_parse_errors() {
  ParseResult missing_slash = navsql::parse_query("school");
  expect_true(missing_slash.error.has_value(), "leading slash required");
  if (missing_slash.error) {
    expect_str(missing_slash.error->message, "Expected '/' at the start of a query",
               "missing slash message");
    expect_eq(missing_slash.error->position, 0, "error at the start");
  }

  ParseResult open_selection = navsql::parse_query("/school{code");
  expect_true(open_selection.error.has_value(), "unclosed selection");
  if (open_selection.error) {
    expect_str(open_selection.error->message, "Expected ',' or '}' after selection item",
               "unclosed selection message");
  }

  ParseResult open_string = navsql::parse_query("/school?name='x");
  expect_true(open_string.error.has_value(), "unterminated string");
  if (open_string.error) {
    expect_str(open_string.error->message, "Unterminated string literal",
               "unterminated string message");
    expect_eq(open_string.error->position, 13, "error at the opening quote");
  }

  ParseResult trailing = navsql::parse_query("/school)");
  expect_true(trailing.error.has_value(), "trailing token");
}

void test_trailing_comma_accepted() {
  expect_str(canonical("/school{code,}"), "school{code}", "trailing comma dropped");
}

}  // namespace

void register_syntax_tests(std::vector<TestCase>& tests) {
  tests.push_back({"syntax_parse_bare_slash", test_parse_bare_slash});
  tests.push_back({"syntax_parse_selection_and_sieve", test_parse_selection_and_sieve});
  tests.push_back({"syntax_canonical_rendering", test_canonical_rendering});
  tests.push_back({"syntax_operator_precedence", test_operator_precedence});
  tests.push_back({"syntax_spans_cover_fragments", test_spans_cover_fragments});
  tests.push_back({"syntax_parse_errors", test_parse_errors});
  tests.push_back({"syntax_trailing_comma_accepted", test_trailing_comma_accepted});
}
