#include <stdexcept>
#include <string>

#include "navsql/domain.h"
#include "test_harness.h"

namespace {

using navsql::Domain;
using navsql::DomainKind;
using navsql::Value;

bool rejects(const navsql::DomainPtr& domain, const std::string& text) {
  try {
    domain->parse(text);
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

void test_boolean_literals() {
  expect_true(Domain::boolean()->parse("true") == Value::boolean(true), "true parses");
  expect_true(Domain::boolean()->parse("false") == Value::boolean(false), "false parses");
  expect_true(rejects(Domain::boolean(), "yes"), "yes is not a boolean");
  expect_str(Domain::boolean()->dump(Value::boolean(false)), "false", "boolean dump");
}

void test_integer_literals() {
  Value big = Domain::integer()->parse("123456789012345678901234567890");
  expect_str(Domain::integer()->dump(big), "123456789012345678901234567890",
             "integers are unbounded");
  expect_str(Domain::integer()->dump(Domain::integer()->parse("-42")), "-42", "negative integer");
  expect_true(rejects(Domain::integer(), "12a"), "trailing garbage rejected");
  expect_true(rejects(Domain::integer(), "-"), "sign alone rejected");
}

void test_decimal_values_compare_numerically() {
  Value a = Domain::decimal()->parse("1.50");
  Value b = Domain::decimal()->parse("1.5");
  expect_true(a == b, "1.50 equals 1.5");
  expect_true(a.hash() == b.hash(), "equal decimals hash alike");
  expect_str(Domain::decimal()->dump(Domain::decimal()->parse("-0.05")), "-0.05",
             "small negative decimal");
  expect_str(Domain::decimal()->dump(Domain::decimal()->parse("12e2")), "1200",
             "exponent folds into the digits");
  expect_true(rejects(Domain::decimal(), "1.2.3"), "two points rejected");
}

void test_float_literals() {
  expect_str(Domain::floating()->dump(Value::floating(2.0)), "2.0", "whole float keeps a point");
  expect_str(Domain::floating()->dump(Value::floating(0.1)), "0.1", "shortest round trip");
  expect_true(rejects(Domain::floating(), "inf"), "infinity rejected");
  expect_true(rejects(Domain::floating(), " 1.0"), "leading space rejected");
}

void test_date_and_time_literals() {
  Value date = Domain::date()->parse("2010-04-15");
  expect_str(Domain::date()->dump(date), "2010-04-15", "date dump");
  expect_true(rejects(Domain::date(), "2010-02-30"), "day out of range");
  expect_true(rejects(Domain::date(), "2010-13-01"), "month out of range");

  Value time = Domain::time()->parse("09:30");
  expect_str(Domain::time()->dump(time), "09:30:00", "seconds default to zero");
  expect_str(Domain::time()->dump(Domain::time()->parse("09:30:05.25")), "09:30:05.250000",
             "fractions pad to microseconds");
  expect_true(rejects(Domain::time(), "24:00"), "hour out of range");

  Value stamp = Domain::datetime()->parse("2010-04-15T09:30:00");
  expect_str(Domain::datetime()->dump(stamp), "2010-04-15 09:30:00", "datetime dump");
}

void test_enum_labels() {
  auto campus = Domain::enumeration({"old", "north", "south"});
  expect_true(campus->parse("north") == Value::text("north"), "known label");
  expect_true(rejects(campus, "east"), "unknown label rejected");
}

void test_list_and_record_values() {
  auto list = Domain::list(Domain::text());
  Value items = list->parse("['a', 'b''c', null]");
  expect_eq(items.as_list().size(), 3, "three list items");
  expect_true(items.as_list()[1] == Value::text("b'c"), "quotes are doubled inside items");
  expect_true(items.as_list()[2].is_null(), "null item");
  expect_true(list->parse(list->dump(items)) == items, "list dump parses back");

  auto record = Domain::record({{"code", Domain::text()}, {"no", Domain::integer()}});
  expect_true(rejects(record, "('a')"), "record arity enforced");
}

void test_identity_locators() {
  auto program = Domain::identity({Domain::text(), Domain::text()});
  Value value = program->parse("eng.gme");
  expect_str(program->dump(value), "eng.gme", "plain labels stay bare");
  auto quoted = Domain::identity({Domain::text()});
  expect_str(quoted->dump(Value::list({Value::text("a b")})), "'a b'",
             "labels with spaces are quoted");
  expect_true(rejects(program, "eng"), "missing component rejected");
}

void test_coercion() {
  expect_true(navsql::coerce(Domain::integer(), Domain::decimal())->kind() == DomainKind::Decimal,
              "integer widens to decimal");
  expect_true(navsql::coerce(Domain::untyped(), Domain::date())->kind() == DomainKind::Date,
              "untyped takes the other side");
  expect_true(navsql::coerce(Domain::enumeration({"a"}), Domain::text())->kind() ==
                  DomainKind::Text,
              "enum and text meet at text");
  expect_true(navsql::coerce(Domain::date(), Domain::integer()) == nullptr,
              "date and integer do not mix");
}

void test_structural_equality() {
  expect_true(navsql::same_domain(Domain::list(Domain::integer()), Domain::list(Domain::integer())),
              "equal shapes compare equal");
  expect_true(!navsql::same_domain(Domain::enumeration({"a"}), Domain::enumeration({"b"})),
              "labels take part in equality");
  expect_str(Domain::record({{"code", Domain::text()}})->to_string(), "{code: text}",
             "record rendering");
}

void test_factories_share_instances() {
  expect_true(Domain::text() == Domain::text(), "scalar factories return one shared instance");
  expect_true(Domain::integer()->kind() == DomainKind::Integer, "the instance keeps its kind");
  navsql::DomainPtr first = Domain::enumeration({"a", "b"});
  navsql::DomainPtr second = Domain::enumeration({"a", "b"});
  expect_true(first != second, "composite factories build a fresh domain");
  expect_true(navsql::same_domain(first, second), "fresh domains still compare by shape");
  expect_eq(static_cast<size_t>(first.use_count()), 1, "the caller owns the only reference");
}

}  // namespace

void register_domain_tests(std::vector<TestCase>& tests) {
  tests.push_back({"domain_boolean_literals", test_boolean_literals});
  tests.push_back({"domain_integer_literals", test_integer_literals});
  tests.push_back({"domain_decimal_values_compare_numerically",
                   test_decimal_values_compare_numerically});
  tests.push_back({"domain_float_literals", test_float_literals});
  tests.push_back({"domain_date_and_time_literals", test_date_and_time_literals});
  tests.push_back({"domain_enum_labels", test_enum_labels});
  tests.push_back({"domain_list_and_record_values", test_list_and_record_values});
  tests.push_back({"domain_identity_locators", test_identity_locators});
  tests.push_back({"domain_coercion", test_coercion});
  tests.push_back({"domain_structural_equality", test_structural_equality});
  tests.push_back({"domain_factories_share_instances", test_factories_share_instances});
}
