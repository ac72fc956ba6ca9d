#include <string>

#include "test_harness.h"
#include "test_utils.h"

namespace {

using navsql::Dialect;

navsql::Environment untyped(const std::string& name, const std::string& value) {
  navsql::Environment environment;
  environment[name] = navsql::ParameterValue{navsql::Value::text(value), navsql::Domain::untyped()};
  return environment;
}

size_t count_of(const std::string& haystack, const std::string& needle) {
  size_t count = 0;
  for (size_t pos = haystack.find(needle); pos != std::string::npos;
       pos = haystack.find(needle, pos + needle.size())) {
    ++count;
  }
  return count;
}

void test_table_query() {
  std::string sql = translate_sql("/school");
  expect_str(sql,
             "SELECT \"school\".\"code\", \"school\".\"name\", \"school\".\"campus\"\n"
             "FROM \"ad\".\"school\" AS \"school\"\n"
             "ORDER BY \"school\".\"code\" ASC",
             "a table selects its columns ordered by the primary key");
}

void test_filter_query() {
  std::string sieve = translate_sql("/school?name='x'");
  expect_contains(sieve, "WHERE \"school\".\"name\" = 'x'", "sieve becomes WHERE");
  expect_eq(count_of(sieve, "FROM"), 1, "no nested SELECT for a plain filter");
  expect_missing(sieve, "(SELECT", "filter is flattened");

  std::string call = translate_sql("/school.filter(name='x')");
  expect_str(call, sieve, "filter() and ? agree");
}

void test_aggregate_query() {
  std::string sql = translate_sql("/school{code, count(department)}");
  expect_contains(sql, "COUNT(", "count becomes an aggregate");
  expect_contains(sql, "GROUP BY", "the aggregate is grouped");
  expect_contains(sql, "LEFT OUTER JOIN", "schools without departments are kept");
}

void test_profile_shape() {
  auto catalog = make_university_catalog();
  navsql::Pipe pipe = navsql::translate("/school{code, count(department)}", *catalog);
  const navsql::Plan& plan = pipe.plan();
  expect_str(plan.profile.tag, "school", "profile tag");
  expect_eq(plan.profile.fields.size(), 2, "two profile fields");
  if (plan.profile.fields.size() == 2) {
    expect_str(plan.profile.fields[1].title, "count(department)", "field title is the syntax");
    expect_true(plan.profile.fields[1].domain->kind() == navsql::DomainKind::Integer,
                "count is an integer");
  }
  expect_eq(plan.outputs.size(), 2, "one output per field");
  expect_eq(plan.domains.size(), 2, "one domain per select column");
}

void test_link_and_aliases() {
  std::string sql = translate_sql("/transfer{id, from_school.name, to_school.name}");
  expect_contains(sql, "\"ad\".\"school\" AS \"school\"", "first school alias");
  expect_contains(sql, "\"ad\".\"school\" AS \"school_2\"", "second school alias is numbered");

  std::string filtered = translate_sql("/department?school_code.campus='old'");
  expect_contains(filtered, "JOIN", "filtering through a link joins the target");
  expect_contains(filtered, "'old'", "the enum label is a literal");
}

void test_sorting_and_slicing() {
  std::string sorted = translate_sql("/school.sort(name-)");
  expect_contains(sorted, "ORDER BY \"school\".\"name\" DESC", "descending sort");

  std::string ansi = translate_sql("/course.limit(5, 10)");
  expect_contains(ansi, "OFFSET 10 ROWS\nFETCH FIRST 5 ROWS ONLY", "ANSI slicing");
  std::string pgsql = translate_sql("/course.limit(5, 10)", Dialect::PgSql);
  expect_contains(pgsql, "LIMIT 5\nOFFSET 10", "PostgreSQL slicing");
  std::string sqlite = translate_sql("/course.limit(0, 10)", Dialect::Sqlite);
  expect_contains(sqlite, "LIMIT 0\nOFFSET 10", "SQLite slicing");
}

void test_global_limit() {
  auto catalog = make_university_catalog();
  navsql::TranslateOptions options;
  options.limit = 10;
  std::string ansi = navsql::translate("/school", *catalog, {}, options).plan().sql;
  expect_contains(ansi, "FETCH FIRST 10 ROWS ONLY", "limit option applies to the segment");
  options.dialect = Dialect::Sqlite;
  std::string sqlite = navsql::translate("/school", *catalog, {}, options).plan().sql;
  expect_contains(sqlite, "LIMIT 10", "limit option in SQLite");
}

void test_placeholders_per_dialect() {
  navsql::Environment environment = untyped("c", "eng");
  auto catalog = make_university_catalog();

  navsql::TranslateOptions options;
  navsql::Pipe ansi = navsql::translate("/school?code=$c|name=$c", *catalog, environment, options);
  expect_eq(count_of(ansi.plan().sql, "?"), 2, "ANSI repeats the marker");
  expect_eq(ansi.plan().placeholders.size(), 2, "one placeholder per marker");

  options.dialect = Dialect::PgSql;
  navsql::Pipe pgsql = navsql::translate("/school?code=$c|name=$c", *catalog, environment, options);
  expect_eq(count_of(pgsql.plan().sql, "$1"), 2, "PostgreSQL reuses the numbered marker");
  expect_eq(pgsql.plan().placeholders.size(), 1, "one placeholder per name");
  if (!pgsql.plan().placeholders.empty()) {
    expect_str(pgsql.plan().placeholders[0].name, "c", "placeholder names its parameter");
    expect_true(pgsql.plan().placeholders[0].domain->kind() == navsql::DomainKind::Text,
                "untyped parameter takes the column type");
  }
  expect_missing(pgsql.plan().sql, "eng", "parameter values never reach the SQL text");
}

void test_dialect_operators() {
  navsql::Environment environment = untyped("c", "old");
  expect_contains(translate_sql("/school?campus==$c", Dialect::PgSql, environment),
                  "IS NOT DISTINCT FROM $1", "total equality in PostgreSQL");
  expect_contains(translate_sql("/school?campus==$c", Dialect::Sqlite, environment),
                  "\"school\".\"campus\" IS ?", "total equality in SQLite");
  expect_contains(translate_sql("/school?name~'art'", Dialect::PgSql), "ILIKE",
                  "case-insensitive match in PostgreSQL");
  expect_contains(translate_sql("/school?name~'art'"), "LOWER(", "case folding in ANSI");
  expect_contains(translate_sql("/school?campus==null"), "IS NULL",
                  "total equality with null is a null test");
}

void test_literal_limits() {
  expect_str(translate_error("/course?credits=99999999999999999999"), "invalid integer value",
             "integers beyond 64 bits cannot be written");
  expect_contains(translate_sql("/course?credits=99"), "= 99", "small integers are inline");
}

void test_explain_stages() {
  auto catalog = make_university_catalog();
  navsql::TranslateOptions options;
  options.explain = true;
  navsql::Pipe pipe = navsql::translate("/school{code}", *catalog, {}, options);
  const auto& stages = pipe.explanation().stages;
  const char* expected[] = {"binding", "encoded", "rewritten", "compiled",
                            "assembled", "reduced", "serialized"};
  expect_eq(stages.size(), 7, "every stage is recorded");
  for (size_t i = 0; i < stages.size() && i < 7; ++i) {
    expect_str(stages[i].first, expected[i], "stage order");
  }
  navsql::Pipe quiet = navsql::translate("/school{code}", *catalog);
  expect_true(quiet.explanation().stages.empty(), "no stages without explain");
}

void test_empty_query() {
  auto catalog = make_university_catalog();
  navsql::Pipe pipe = navsql::translate("/", *catalog);
  expect_true(pipe.plan().sql.empty(), "a bare slash has no SQL");
  expect_true(pipe.plan().placeholders.empty(), "and no placeholders");
}

void test_parse_error_carries_mark() {
  auto catalog = make_university_catalog();
  bool threw = false;
  try {
    navsql::translate("/school{code", *catalog);
  } catch (const navsql::Error& ex) {
    threw = true;
    expect_true(!ex.mark().empty(), "parse errors point into the query");
    expect_contains(ex.describe(), "While translating:", "parse errors quote the query");
  }
  expect_true(threw, "unclosed selection is an error");
}

void test_selection_then_flow_operations() {
  std::string sieve = translate_sql("/school{code}?campus='old'");
  expect_contains(sieve, "WHERE \"school\".\"campus\" = 'old'", "a sieve may follow a selection");
  expect_missing(sieve, "\"school\".\"name\"", "the selection still picks the columns");

  std::string limited = translate_sql("/school{code, count(department)}.limit(2)");
  expect_contains(limited, "FETCH FIRST 2 ROWS ONLY", "limit applies to a selection");
  expect_contains(limited, "COUNT(", "the aggregate survives the limit");

  std::string sorted = translate_sql("/school{code}.sort(name)");
  expect_contains(sorted, "ORDER BY \"school\".\"name\" ASC", "sort keys see the selected flow");

  expect_str(translate_error("/course{title, department_code.name}?credits>3"), "",
             "a linked selection accepts a filter");
}

void test_quotient_keeps_order() {
  std::string sql = translate_sql("/program^degree");
  expect_contains(sql, "GROUP BY", "a quotient groups by its kernel");
  expect_contains(sql, "ORDER BY", "the kernel order survives");
  expect_contains(sql, "\"degree\" ASC", "the quotient is ordered by its kernel");
}

void test_plural_operand_errors() {
  expect_str(translate_error("/school{count(name)}"), "a plural operand is required",
             "an aggregate over the current flow is rejected");
  expect_str(translate_error("/school{count(department.name=program.title)}"),
             "invalid plural operand", "two unrelated plural flows are ambiguous");
  expect_str(translate_error("/school{count(department)}"), "", "a single plural flow is fine");
}

void test_total_equality_of_literals() {
  std::string sql = translate_sql("/{'abc'=='ABC'}", Dialect::PgSql);
  expect_contains(sql, "IS NOT DISTINCT FROM", "text comparison is left to the engine");
  expect_missing(sql, "FALSE", "no constant folding across collations");
}

}  // namespace

void register_translate_tests(std::vector<TestCase>& tests) {
  tests.push_back({"translate_table_query", test_table_query});
  tests.push_back({"translate_filter_query", test_filter_query});
  tests.push_back({"translate_aggregate_query", test_aggregate_query});
  tests.push_back({"translate_profile_shape", test_profile_shape});
  tests.push_back({"translate_link_and_aliases", test_link_and_aliases});
  tests.push_back({"translate_sorting_and_slicing", test_sorting_and_slicing});
  tests.push_back({"translate_global_limit", test_global_limit});
  tests.push_back({"translate_placeholders_per_dialect", test_placeholders_per_dialect});
  tests.push_back({"translate_dialect_operators", test_dialect_operators});
  tests.push_back({"translate_literal_limits", test_literal_limits});
  tests.push_back({"translate_explain_stages", test_explain_stages});
  tests.push_back({"translate_empty_query", test_empty_query});
  tests.push_back({"translate_parse_error_carries_mark", test_parse_error_carries_mark});
  tests.push_back({"translate_selection_then_flow_operations",
                   test_selection_then_flow_operations});
  tests.push_back({"translate_quotient_keeps_order", test_quotient_keeps_order});
  tests.push_back({"translate_plural_operand_errors", test_plural_operand_errors});
  tests.push_back({"translate_total_equality_of_literals", test_total_equality_of_literals});
}
