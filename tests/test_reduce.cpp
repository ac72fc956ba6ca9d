#include <memory>
#include <string>

#include "test_harness.h"
#include "test_utils.h"
#include "tr/frame.h"
#include "tr/reduce.h"

namespace {

using navsql::Domain;
using navsql::FrameKind;
using navsql::PhraseKind;
using navsql::PhrasePtr;
using navsql::Signature;
using navsql::SignatureKind;
using navsql::Value;

PhrasePtr boolean(bool value) { return navsql::make_literal_phrase(Value::boolean(value), Domain::boolean()); }

PhrasePtr null_text() { return navsql::make_literal_phrase(Value(), Domain::text()); }

PhrasePtr text_parameter(const std::string& name) {
  return navsql::make_parameter_phrase(name, Domain::text());
}

PhrasePtr formula(SignatureKind kind, std::vector<PhrasePtr> args, bool is_nullable = true,
                  navsql::DomainPtr domain = Domain::boolean()) {
  return navsql::make_formula_phrase(Signature::make(kind), std::move(domain), is_nullable,
                                     std::move(args));
}

PhrasePtr equals(PhrasePtr left, PhrasePtr right) {
  return navsql::make_formula_phrase(Signature::polar(SignatureKind::IsEqual, 1), Domain::boolean(),
                                     true, {std::move(left), std::move(right)});
}

void test_connectives_fold() {
  navsql::Reducer reducer;
  PhrasePtr a = equals(text_parameter("a"), text_parameter("b"));
  PhrasePtr b = equals(text_parameter("c"), text_parameter("d"));

  PhrasePtr folded = reducer.reduce_phrase(formula(SignatureKind::And, {boolean(true), a}));
  expect_true(navsql::same_phrase(folded, a), "TRUE drops out of AND");

  folded = reducer.reduce_phrase(formula(SignatureKind::And, {a, boolean(false), b}));
  expect_true(navsql::is_boolean_literal(folded, false), "FALSE absorbs AND");

  folded = reducer.reduce_phrase(formula(SignatureKind::Or, {a, boolean(true)}));
  expect_true(navsql::is_boolean_literal(folded, true), "TRUE absorbs OR");

  folded = reducer.reduce_phrase(
      formula(SignatureKind::And, {a, formula(SignatureKind::And, {b, a})}));
  expect_true(folded->kind == PhraseKind::Formula && folded->signature.kind == SignatureKind::And,
              "nested AND stays a conjunction");
  expect_eq(folded->args.size(), 2, "nested AND flattens and drops duplicates");
}

void test_negation_and_null_tests() {
  navsql::Reducer reducer;
  PhrasePtr a = equals(text_parameter("a"), text_parameter("b"));
  PhrasePtr twice = formula(SignatureKind::Not, {formula(SignatureKind::Not, {a})});
  expect_true(navsql::same_phrase(reducer.reduce_phrase(twice), a), "double negation cancels");
  expect_true(navsql::is_boolean_literal(
                  reducer.reduce_phrase(formula(SignatureKind::Not, {boolean(true)})), false),
              "NOT TRUE is FALSE");

  PhrasePtr is_null = navsql::make_formula_phrase(Signature::polar(SignatureKind::IsNull, 1),
                                                  Domain::boolean(), false, {null_text()});
  expect_true(navsql::is_boolean_literal(reducer.reduce_phrase(is_null), true),
              "NULL IS NULL folds to TRUE");

  PhrasePtr totally = navsql::make_formula_phrase(
      Signature::polar(SignatureKind::IsTotallyEqual, -1), Domain::boolean(), false,
      {text_parameter("a"), null_text()});
  PhrasePtr reduced = reducer.reduce_phrase(totally);
  expect_true(reduced->signature.kind == SignatureKind::IsNull && reduced->signature.polarity < 0,
              "total inequality against NULL becomes IS NOT NULL");
}

void test_null_propagation() {
  navsql::Reducer reducer;
  PhrasePtr sum = formula(SignatureKind::Add,
                          {navsql::make_parameter_phrase("n", Domain::integer()),
                           navsql::make_literal_phrase(Value(), Domain::integer())},
                          true, Domain::integer());
  PhrasePtr reduced = reducer.reduce_phrase(sum);
  expect_true(reduced->kind == PhraseKind::Literal && reduced->value.is_null(),
              "arithmetic with NULL is NULL");

  PhrasePtr coalesce = formula(SignatureKind::IfNull, {null_text(), text_parameter("a")}, true,
                               Domain::text());
  reduced = reducer.reduce_phrase(coalesce);
  expect_true(reduced->kind == PhraseKind::Parameter, "NULL operands of COALESCE are dropped");
}

void test_concat_guards_nullable_operands() {
  navsql::Reducer reducer;
  PhrasePtr concat = formula(SignatureKind::Concat, {text_parameter("a"), null_text()}, true,
                             Domain::text());
  PhrasePtr reduced = reducer.reduce_phrase(concat);
  expect_true(reduced->kind == PhraseKind::Formula && reduced->signature.kind == SignatureKind::Concat,
              "concatenation survives a NULL operand");
  expect_true(!reduced->is_nullable, "guarded concatenation is not nullable");
  if (reduced->args.size() == 2) {
    expect_true(reduced->args[0]->signature.kind == SignatureKind::IfNull,
                "nullable operand wrapped in COALESCE");
    expect_true(reduced->args[1]->kind == PhraseKind::Literal &&
                    reduced->args[1]->value == Value::text(""),
                "NULL operand becomes an empty string");
  }
}

void test_total_equality_of_literals() {
  navsql::Reducer reducer;
  auto totally = [](PhrasePtr left, PhrasePtr right) {
    return navsql::make_formula_phrase(Signature::polar(SignatureKind::IsTotallyEqual, 1),
                                       Domain::boolean(), false,
                                       {std::move(left), std::move(right)});
  };
  auto text = [](const char* value) {
    return navsql::make_literal_phrase(Value::text(value), Domain::text());
  };

  PhrasePtr reduced = reducer.reduce_phrase(totally(text("abc"), text("ABC")));
  expect_true(reduced->kind == PhraseKind::Formula &&
                  reduced->signature.kind == SignatureKind::IsTotallyEqual,
              "text literals are left to the engine collation");

  reduced = reducer.reduce_phrase(totally(boolean(true), boolean(false)));
  expect_true(navsql::is_boolean_literal(reduced, false), "boolean literals fold");

  reduced = reducer.reduce_phrase(totally(text("abc"), null_text()));
  expect_true(navsql::is_boolean_literal(reduced, false), "a literal is never NULL");

  reduced = reducer.reduce_phrase(totally(null_text(), null_text()));
  expect_true(navsql::is_boolean_literal(reduced, true), "NULL totally equals NULL");
}

void test_frame_cleanup() {
  auto catalog = make_university_catalog();
  const navsql::Table* school = catalog->find_schema("ad")->find_table("school");

  auto table = std::make_shared<navsql::Frame>();
  table->kind = FrameKind::Table;
  table->tag = 2;
  table->table = school;

  auto segment = std::make_shared<navsql::Frame>();
  segment->kind = FrameKind::Segment;
  segment->tag = 1;
  segment->include.push_back(navsql::Anchor{table, nullptr, false, false});
  PhrasePtr code = navsql::make_column_phrase(2, *school->find_column("code"), false);
  segment->select.push_back(code);
  segment->outputs.push_back(0);
  segment->where = formula(SignatureKind::And, {boolean(true), boolean(true)});
  segment->group.push_back(boolean(true));
  segment->order.emplace_back(boolean(true), 1);
  segment->order.emplace_back(code, -1);

  navsql::Reducer reducer;
  navsql::FramePtr reduced = reducer.run(segment);
  expect_true(!reduced->where, "WHERE TRUE is dropped");
  expect_true(reduced->group.empty(), "literal GROUP BY entries are dropped");
  expect_eq(reduced->order.size(), 1, "literal ORDER BY entries are dropped");
  expect_eq(reduced->include.size(), 1, "table anchors are kept");
}

void test_collapse_merges_nested_head() {
  auto catalog = make_university_catalog();
  const navsql::Table* school = catalog->find_schema("ad")->find_table("school");
  const navsql::Column* code = school->find_column("code");

  auto table = std::make_shared<navsql::Frame>();
  table->kind = FrameKind::Table;
  table->tag = 3;
  table->table = school;

  auto nested = std::make_shared<navsql::Frame>();
  nested->kind = FrameKind::Nested;
  nested->tag = 2;
  nested->include.push_back(navsql::Anchor{table, nullptr, false, false});
  nested->select.push_back(navsql::make_column_phrase(3, *code, false));
  nested->where = equals(navsql::make_column_phrase(3, *code, false), text_parameter("code"));

  auto segment = std::make_shared<navsql::Frame>();
  segment->kind = FrameKind::Segment;
  segment->tag = 1;
  segment->include.push_back(navsql::Anchor{nested, nullptr, false, false});
  segment->select.push_back(navsql::make_reference_phrase(2, 0, Domain::text(), false));
  segment->outputs.push_back(0);

  navsql::Reducer reducer;
  navsql::FramePtr reduced = reducer.run(segment);
  expect_eq(reduced->include.size(), 1, "single FROM entry after the merge");
  if (!reduced->include.empty()) {
    expect_true(reduced->include.front().frame->kind == FrameKind::Table,
                "the nested SELECT is flattened into its table");
  }
  expect_true(reduced->where != nullptr, "the nested condition moves up");
  expect_true(reduced->select.front()->kind == PhraseKind::Column,
              "references are replaced by the nested select");
}

void test_collapse_keeps_grouped_order() {
  auto catalog = make_university_catalog();
  const navsql::Table* program = catalog->find_schema("ad")->find_table("program");
  const navsql::Column* degree = program->find_column("degree");

  auto table = std::make_shared<navsql::Frame>();
  table->kind = FrameKind::Table;
  table->tag = 3;
  table->table = program;

  auto nested = std::make_shared<navsql::Frame>();
  nested->kind = FrameKind::Nested;
  nested->tag = 2;
  nested->include.push_back(navsql::Anchor{table, nullptr, false, false});
  nested->select.push_back(navsql::make_column_phrase(3, *degree, true));
  nested->group.push_back(navsql::make_column_phrase(3, *degree, true));
  nested->order.emplace_back(navsql::make_column_phrase(3, *degree, true), 1);

  auto segment = std::make_shared<navsql::Frame>();
  segment->kind = FrameKind::Segment;
  segment->tag = 1;
  segment->include.push_back(navsql::Anchor{nested, nullptr, false, false});
  segment->select.push_back(navsql::make_reference_phrase(2, 0, Domain::text(), true));
  segment->outputs.push_back(0);

  navsql::Reducer reducer;
  navsql::FramePtr reduced = reducer.run(segment);
  expect_eq(reduced->group.size(), 1, "the grouped head is merged");
  expect_eq(reduced->order.size(), 1, "the head ordering survives the merge");
}

}  // namespace

void register_reduce_tests(std::vector<TestCase>& tests) {
  tests.push_back({"reduce_connectives_fold", test_connectives_fold});
  tests.push_back({"reduce_negation_and_null_tests", test_negation_and_null_tests});
  tests.push_back({"reduce_null_propagation", test_null_propagation});
  tests.push_back({"reduce_concat_guards_nullable_operands",
                   test_concat_guards_nullable_operands});
  tests.push_back({"reduce_total_equality_of_literals", test_total_equality_of_literals});
  tests.push_back({"reduce_frame_cleanup", test_frame_cleanup});
  tests.push_back({"reduce_collapse_merges_nested_head", test_collapse_merges_nested_head});
  tests.push_back({"reduce_collapse_keeps_grouped_order", test_collapse_keeps_grouped_order});
}
