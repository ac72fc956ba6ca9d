#include <string>

#include "test_harness.h"
#include "test_utils.h"
#include "tr/rewrite.h"

namespace {

using navsql::Segment;

bool same_segment(const Segment& left, const Segment& right) {
  if (!navsql::same_space(left.space, right.space)) return false;
  if (!navsql::same_space(left.root, right.root)) return false;
  if (left.codes.size() != right.codes.size()) return false;
  for (size_t i = 0; i < left.codes.size(); ++i) {
    if (!navsql::same_code(left.codes[i], right.codes[i])) return false;
  }
  return true;
}

Segment rewrite_query(const navsql::Catalog& catalog, const std::string& query) {
  Segment segment = encode_query(catalog, query);
  navsql::Rewriter rewriter(segment.root);
  return rewriter.run(segment);
}

void test_true_filter_dropped() {
  auto catalog = make_university_catalog();
  Segment plain = rewrite_query(*catalog, "/school");
  Segment filtered = rewrite_query(*catalog, "/school?true");
  expect_true(navsql::same_space(plain.space, filtered.space), "a TRUE filter is dropped");
}

void test_rewrite_is_idempotent() {
  auto catalog = make_university_catalog();
  const char* queries[] = {
      "/school",
      "/school{code, count(department?name~'art')}?campus='old'",
      "/department{name, school_code.name}.sort(name)",
      "/course.limit(5, 10)",
  };
  for (const char* query : queries) {
    Segment once = rewrite_query(*catalog, query);
    navsql::Rewriter again(once.root);
    Segment twice = again.run(once);
    expect_true(same_segment(once, twice), std::string("rewrite is idempotent for ") + query);
  }
}

void test_unmask_prunes_enforced_filter() {
  auto catalog = make_university_catalog();
  const navsql::Table* school = catalog->find_schema("ad")->find_table("school");
  const navsql::Column* campus = school->find_column("campus");
  auto root = navsql::make_root();
  auto schools = navsql::make_direct_table(root, *school);
  auto condition = navsql::make_formula(
      navsql::Signature::polar(navsql::SignatureKind::IsEqual, 1), navsql::Domain::boolean(),
      {navsql::make_column_unit(*campus, schools),
       navsql::make_literal(navsql::Value::text("old"), campus->domain)});
  auto old = navsql::make_filtered(schools, condition);

  expect_true(navsql::same_space(navsql::rewrite_space(old, old), schools),
              "a filter the mask enforces is pruned");
  expect_true(navsql::same_space(navsql::rewrite_space(old, root), old),
              "a filter outside the mask is kept");
}

void test_constant_kernel_rejected() {
  expect_str(translate_error("/department^'x'"), "an empty or constant kernel is not allowed",
             "constant projection kernel");
}

}  // namespace

void register_rewrite_tests(std::vector<TestCase>& tests) {
  tests.push_back({"rewrite_true_filter_dropped", test_true_filter_dropped});
  tests.push_back({"rewrite_is_idempotent", test_rewrite_is_idempotent});
  tests.push_back({"rewrite_unmask_prunes_enforced_filter", test_unmask_prunes_enforced_filter});
  tests.push_back({"rewrite_constant_kernel_rejected", test_constant_kernel_rejected});
}
