#include <string>

#include "test_harness.h"
#include "test_utils.h"
#include "tr/assemble.h"
#include "tr/compile.h"
#include "tr/encode.h"
#include "tr/reduce.h"
#include "tr/rewrite.h"
#include "tr/space.h"

namespace {

using navsql::FrameKind;
using navsql::FramePtr;

struct Assembled {
  navsql::Assembler assembler;
  FramePtr frame;
};

void assemble_query(const navsql::Catalog& catalog, const std::string& query, Assembled& out) {
  navsql::Segment segment = encode_query(catalog, query);
  navsql::Rewriter rewriter(segment.root);
  segment = rewriter.run(segment);
  navsql::Compiler compiler(segment.root);
  navsql::TermPtr term = compiler.compile_segment(segment);
  out.frame = out.assembler.assemble_segment(term);
}

void test_every_claim_supplied() {
  auto catalog = make_university_catalog();
  const char* queries[] = {
      "/school",
      "/school{code, count(department)}",
      "/department{name, school_code.name, count(course?credits>2)}",
      "/school{code, exists(program?degree='bs')}",
      "/department^school_code{school_code, count(^)}",
  };
  for (const char* query : queries) {
    Assembled assembled;
    assemble_query(*catalog, query, assembled);
    expect_true(assembled.frame && assembled.frame->kind == FrameKind::Segment,
                std::string("segment frame for ") + query);
    expect_eq(assembled.assembler.supplied(), assembled.assembler.demanded(),
              std::string("claims supplied for ") + query);
  }
}

void test_segment_outputs_follow_selection() {
  auto catalog = make_university_catalog();
  Assembled assembled;
  assemble_query(*catalog, "/school{name, code, name}", assembled);
  const navsql::Frame& frame = *assembled.frame;
  expect_eq(frame.outputs.size(), 3, "one output per selected field");
  expect_eq(frame.select.size(), 2, "duplicate values share a select column");
  if (frame.outputs.size() == 3) {
    expect_eq(frame.outputs[0], frame.outputs[2], "repeated field reads the same column");
  }
}

void test_table_frame_is_leaf() {
  auto catalog = make_university_catalog();
  Assembled assembled;
  assemble_query(*catalog, "/school", assembled);
  const navsql::Frame& frame = *assembled.frame;
  expect_true(!frame.include.empty(), "segment has a FROM list");
  bool found_table = false;
  std::vector<FramePtr> pending{assembled.frame};
  while (!pending.empty()) {
    FramePtr current = pending.back();
    pending.pop_back();
    if (current->kind == FrameKind::Table) {
      found_table = current->table && current->table->name() == "school";
    }
    for (const auto& anchor : current->include) pending.push_back(anchor.frame);
  }
  expect_true(found_table, "the school table is a leaf frame");
}

void test_predicate_wrappers() {
  auto condition = navsql::make_formula_phrase(
      navsql::Signature::polar(navsql::SignatureKind::IsNull, 1), navsql::Domain::boolean(),
      false, {navsql::make_parameter_phrase("x", navsql::Domain::text())});
  auto predicate = navsql::to_predicate(condition);
  expect_true(predicate->kind == navsql::PhraseKind::Formula &&
                  predicate->signature.kind == navsql::SignatureKind::ToPredicate,
              "values become predicates through a wrapper");
  navsql::Reducer reducer;
  expect_true(navsql::same_phrase(reducer.reduce_phrase(navsql::from_predicate(predicate)),
                                  condition),
              "paired wrappers cancel out when reduced");
}

void test_plural_code_is_not_compiled() {
  auto catalog = make_university_catalog();
  const navsql::Table* school = catalog->find_schema("ad")->find_table("school");
  const navsql::Table* department = catalog->find_schema("ad")->find_table("department");
  const navsql::ForeignKey* link = department->foreign_keys().front();

  navsql::Segment segment;
  segment.root = navsql::make_root();
  segment.space = navsql::make_direct_table(segment.root, *school);
  navsql::SpacePtr departments =
      navsql::make_fiber_table(segment.space, navsql::Join::reverse(*link));
  segment.codes.push_back(
      navsql::make_column_unit(*department->find_column("name"), departments));

  std::string message;
  try {
    navsql::Compiler compiler(segment.root);
    compiler.compile_segment(segment);
  } catch (const navsql::Error& ex) {
    message = ex.what();
  }
  expect_str(message, "expected a singular expression",
             "a department column cannot be selected per school");
}

}  // namespace

void register_assemble_tests(std::vector<TestCase>& tests) {
  tests.push_back({"assemble_every_claim_supplied", test_every_claim_supplied});
  tests.push_back({"assemble_segment_outputs_follow_selection",
                   test_segment_outputs_follow_selection});
  tests.push_back({"assemble_table_frame_is_leaf", test_table_frame_is_leaf});
  tests.push_back({"assemble_predicate_wrappers", test_predicate_wrappers});
  tests.push_back({"assemble_plural_code_is_not_compiled", test_plural_code_is_not_compiled});
}
