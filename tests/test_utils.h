#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "navsql/navsql.h"
#include "tr/encode.h"

/// Builds the university catalog shared by the tests.
/// Schema `ad` holds school, department, program, course, student and transfer;
/// transfer refers to school twice so that `school` is ambiguous from it.
std::unique_ptr<navsql::Catalog> make_university_catalog();

/// Translates a query against the shared catalog and returns the SQL text.
std::string translate_sql(const std::string& query,
                          navsql::Dialect dialect = navsql::Dialect::Ansi,
                          const navsql::Environment& environment = {});

/// Runs a query expected to fail and returns the error message, or an empty string.
std::string translate_error(const std::string& query, const navsql::Environment& environment = {});

/// Parses, binds and encodes a query; the catalog must outlive the segment.
navsql::Segment encode_query(const navsql::Catalog& catalog, const std::string& query);

/// Records executed statements and replays canned rows.
class FakeConnection : public navsql::Connection {
 public:
  bool readable = true;
  bool fail_execute = false;
  std::vector<std::vector<navsql::Cell>> rows;

  std::string last_sql;
  std::vector<navsql::Cell> last_parameters;
  int executions = 0;

  bool can_read() const override { return readable; }
  std::unique_ptr<navsql::Cursor> execute(const std::string& sql,
                                          const std::vector<navsql::Cell>& parameters) override;
};
