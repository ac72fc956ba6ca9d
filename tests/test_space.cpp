#include <string>

#include "test_harness.h"
#include "test_utils.h"
#include "tr/space.h"
#include "tr/stitch.h"

namespace {

using navsql::SpacePtr;

struct Fixture {
  std::unique_ptr<navsql::Catalog> catalog = make_university_catalog();
  const navsql::Schema* ad = catalog->find_schema("ad");
  const navsql::Table* school = ad->find_table("school");
  const navsql::Table* department = ad->find_table("department");
  const navsql::ForeignKey* department_school = department->foreign_keys().front();

  SpacePtr root = navsql::make_root();
  SpacePtr schools = navsql::make_direct_table(root, *school);
  SpacePtr departments = navsql::make_direct_table(root, *department);
  // department -> school, one school per department
  SpacePtr department_school_space =
      navsql::make_fiber_table(departments, navsql::Join::direct(*department_school));
  // school -> department, any number of departments per school
  SpacePtr school_departments =
      navsql::make_fiber_table(schools, navsql::Join::reverse(*department_school));
};

navsql::CodePtr campus_is_old(const Fixture& f, const SpacePtr& space) {
  const navsql::Column* campus = f.school->find_column("campus");
  auto unit = navsql::make_column_unit(*campus, space);
  auto label = navsql::make_literal(navsql::Value::text("old"), campus->domain);
  return navsql::make_formula(navsql::Signature::polar(navsql::SignatureKind::IsEqual, 1),
                              navsql::Domain::boolean(), {unit, label});
}

void test_structural_equality() {
  Fixture f;
  SpacePtr again = navsql::make_direct_table(navsql::make_root(), *f.school);
  expect_true(navsql::same_space(f.schools, again), "equal chains compare equal");
  expect_true(f.schools->hash_value == again->hash_value, "equal chains hash alike");
  expect_true(!navsql::same_space(f.schools, f.departments), "different tables differ");
}

void test_join_flags() {
  Fixture f;
  expect_true(f.department_school_space->is_contracting, "direct join to a key contracts");
  expect_true(f.department_school_space->is_expanding, "non-null direct join expands");
  expect_true(!f.school_departments->is_contracting, "reverse join does not contract");
  expect_true(!f.school_departments->is_expanding, "reverse join may lose rows");
}

void test_spans() {
  Fixture f;
  expect_true(navsql::spans(f.schools, f.schools), "spans is reflexive");
  expect_true(navsql::spans(f.departments, f.department_school_space),
              "a department determines its school");
  expect_true(navsql::spans(f.school_departments, f.schools),
              "a department row determines its school row");
  expect_true(!navsql::spans(f.schools, f.school_departments),
              "a school does not determine a department");
  expect_true(!navsql::spans(f.schools, f.departments), "unrelated tables do not span");
}

void test_dominates() {
  Fixture f;
  expect_true(navsql::dominates(f.department_school_space, f.departments),
              "a total direct join loses no rows");
  expect_true(!navsql::dominates(f.school_departments, f.schools),
              "a reverse join may lose schools");
  SpacePtr old = navsql::make_filtered(f.schools, campus_is_old(f, f.schools));
  expect_true(navsql::dominates(f.schools, old), "the unfiltered space dominates its filter");
  expect_true(!navsql::dominates(old, f.schools), "a filter loses rows");
}

void test_conforms() {
  Fixture f;
  expect_true(navsql::conforms(f.departments, f.department_school_space),
              "department and department.school are one-to-one");
  expect_true(!navsql::conforms(f.schools, f.school_departments),
              "school and school.department are not");
}

void test_inflate_and_prune() {
  Fixture f;
  SpacePtr old = navsql::make_filtered(f.schools, campus_is_old(f, f.schools));
  expect_true(!old->is_inflated, "a filter is not inflated");
  expect_true(navsql::same_space(navsql::inflate(old), f.schools),
              "inflate drops the filter");
  expect_true(navsql::same_space(navsql::prune(old, old), f.schools),
              "prune drops what the mask applies");
  expect_true(navsql::concludes(old, f.schools), "the base is among the ancestors");
}

void test_concludes_without_dominating() {
  Fixture f;
  SpacePtr old = navsql::make_filtered(f.schools, campus_is_old(f, f.schools));
  expect_true(navsql::concludes(old, f.schools), "a filter concludes its base");
  expect_true(navsql::spans(old, f.schools), "each old school is a school");
  expect_true(!navsql::dominates(old, f.schools), "but not every school is old");
  expect_true(navsql::concludes(f.school_departments, f.schools),
              "a reverse join concludes its origin");
  expect_true(!navsql::dominates(f.school_departments, f.schools),
              "schools without departments are lost");
}

void test_inflate_is_idempotent() {
  Fixture f;
  SpacePtr old = navsql::make_filtered(f.school_departments, campus_is_old(f, f.schools));
  const SpacePtr spaces[] = {f.root, f.schools, f.department_school_space, f.school_departments, old};
  for (const auto& space : spaces) {
    SpacePtr once = navsql::inflate(space);
    expect_true(once->is_inflated, "inflate yields an inflated space");
    expect_true(navsql::same_space(navsql::inflate(once), once),
                "inflating twice changes nothing: " + navsql::space_to_string(space));
  }
}

void test_keyless_table_cannot_be_sewn() {
  navsql::Catalog catalog;
  navsql::Table& note = catalog.add_schema("ad").add_table("note");
  note.add_column("body", navsql::Domain::text(), true);
  SpacePtr notes = navsql::make_direct_table(navsql::make_root(), note);
  std::string message;
  try {
    navsql::sew(notes);
  } catch (const navsql::Error& ex) {
    message = ex.what();
  }
  expect_str(message, "unable to connect a table lacking a primary key",
             "a table without an identity cannot be joined to itself");
}

void test_rendering() {
  Fixture f;
  expect_str(navsql::space_to_string(f.school_departments), "@.school.~department",
             "reverse fibers are marked");
}

}  // namespace

void register_space_tests(std::vector<TestCase>& tests) {
  tests.push_back({"space_structural_equality", test_structural_equality});
  tests.push_back({"space_join_flags", test_join_flags});
  tests.push_back({"space_spans", test_spans});
  tests.push_back({"space_dominates", test_dominates});
  tests.push_back({"space_conforms", test_conforms});
  tests.push_back({"space_inflate_and_prune", test_inflate_and_prune});
  tests.push_back({"space_concludes_without_dominating", test_concludes_without_dominating});
  tests.push_back({"space_inflate_is_idempotent", test_inflate_is_idempotent});
  tests.push_back({"space_keyless_table_cannot_be_sewn", test_keyless_table_cannot_be_sewn});
  tests.push_back({"space_rendering", test_rendering});
}
