#include "test_utils.h"

#include <stdexcept>

#include "bind/binder.h"
#include "syntax/syntax.h"

namespace {

using navsql::Domain;

class FakeCursor : public navsql::Cursor {
 public:
  explicit FakeCursor(std::vector<std::vector<navsql::Cell>> rows) : rows_(std::move(rows)) {}

  bool fetch(std::vector<navsql::Cell>& row) override {
    if (next_ >= rows_.size()) return false;
    row = rows_[next_++];
    return true;
  }

 private:
  std::vector<std::vector<navsql::Cell>> rows_;
  size_t next_ = 0;
};

}  // namespace

std::unique_ptr<navsql::Catalog> make_university_catalog() {
  auto catalog = std::make_unique<navsql::Catalog>();
  navsql::Schema& ad = catalog->add_schema("ad");

  navsql::Table& school = ad.add_table("school");
  school.add_column("code", Domain::text(), false);
  school.add_column("name", Domain::text(), false);
  school.add_column("campus", Domain::enumeration({"old", "north", "south"}), true);
  school.add_unique_key({"code"}, true);
  school.add_unique_key({"name"}, false);

  navsql::Table& department = ad.add_table("department");
  department.add_column("code", Domain::text(), false);
  department.add_column("name", Domain::text(), false);
  department.add_column("school_code", Domain::text(), false);
  department.add_unique_key({"code"}, true);

  navsql::Table& program = ad.add_table("program");
  program.add_column("school_code", Domain::text(), false);
  program.add_column("code", Domain::text(), false);
  program.add_column("title", Domain::text(), false);
  program.add_column("degree", Domain::text(), true);
  program.add_unique_key({"school_code", "code"}, true);

  navsql::Table& course = ad.add_table("course");
  course.add_column("department_code", Domain::text(), false);
  course.add_column("no", Domain::integer(), false);
  course.add_column("title", Domain::text(), false);
  course.add_column("credits", Domain::integer(), true);
  course.add_column("description", Domain::text(), true);
  course.add_unique_key({"department_code", "no"}, true);

  navsql::Table& student = ad.add_table("student");
  student.add_column("id", Domain::integer(), false);
  student.add_column("name", Domain::text(), false);
  student.add_column("dob", Domain::date(), false);
  student.add_column("school_code", Domain::text(), false);
  student.add_column("program_code", Domain::text(), false);
  student.add_unique_key({"id"}, true);

  navsql::Table& transfer = ad.add_table("transfer");
  transfer.add_column("id", Domain::integer(), false);
  transfer.add_column("from_school", Domain::text(), false);
  transfer.add_column("to_school", Domain::text(), false);
  transfer.add_unique_key({"id"}, true);

  catalog->add_foreign_key(department, {"school_code"}, school, {"code"});
  catalog->add_foreign_key(program, {"school_code"}, school, {"code"});
  catalog->add_foreign_key(course, {"department_code"}, department, {"code"});
  catalog->add_foreign_key(student, {"school_code", "program_code"}, program,
                           {"school_code", "code"});
  catalog->add_foreign_key(transfer, {"from_school"}, school, {"code"});
  catalog->add_foreign_key(transfer, {"to_school"}, school, {"code"});
  return catalog;
}

std::string translate_sql(const std::string& query, navsql::Dialect dialect,
                          const navsql::Environment& environment) {
  auto catalog = make_university_catalog();
  navsql::TranslateOptions options;
  options.dialect = dialect;
  return navsql::translate(query, *catalog, environment, options).plan().sql;
}

std::string translate_error(const std::string& query, const navsql::Environment& environment) {
  auto catalog = make_university_catalog();
  try {
    navsql::translate(query, *catalog, environment);
  } catch (const navsql::Error& ex) {
    return ex.what();
  }
  return {};
}

navsql::Segment encode_query(const navsql::Catalog& catalog, const std::string& query) {
  auto text = std::make_shared<const std::string>(query);
  navsql::ParseResult parsed = navsql::parse_query(query);
  if (!parsed.query) throw std::runtime_error("query does not parse: " + query);
  navsql::Environment environment;
  navsql::Binder binder(catalog, environment, text);
  navsql::BindingPtr binding = binder.bind_query(*parsed.query, std::nullopt);
  if (!binding) throw std::runtime_error("query selects nothing: " + query);
  navsql::Encoder encoder;
  return encoder.collect(binding);
}

std::unique_ptr<navsql::Cursor> FakeConnection::execute(
    const std::string& sql, const std::vector<navsql::Cell>& parameters) {
  ++executions;
  last_sql = sql;
  last_parameters = parameters;
  if (fail_execute) {
    throw std::runtime_error("relation \"ad.school\" does not exist");
  }
  return std::make_unique<FakeCursor>(rows);
}
