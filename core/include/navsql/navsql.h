#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "navsql/connect.h"
#include "navsql/domain.h"
#include "navsql/entity.h"
#include "navsql/error.h"

namespace navsql {

/// A value supplied for a `$name` reference in the query.
/// An Untyped domain lets the query decide the type; the value then holds text.
struct ParameterValue {
  Value value;
  DomainPtr domain;
};

using Environment = std::map<std::string, ParameterValue>;

enum class Dialect { Ansi, PgSql, Sqlite };

/// Explicit translation settings; there is no global configuration.
/// MUST be passed by value to translate() and MUST NOT be mutated while translating.
/// Inputs are caller choices; an unset limit leaves the row count untouched.
struct TranslateOptions {
  std::optional<int64_t> limit;
  Dialect dialect = Dialect::Ansi;
  bool explain = false;
};

struct Field {
  std::string title;
  DomainPtr domain;
};

/// Output record shape needed to decode result rows.
struct Profile {
  std::string tag;
  std::vector<Field> fields;
};

/// One positional placeholder in the SQL text and the environment entry feeding it.
struct Placeholder {
  size_t index = 0;
  std::string name;
  DomainPtr domain;
};

/// The translated query: SQL text plus everything needed to run it.
/// MUST list domains in select order and placeholders in text order.
/// Inputs are produced by translate(); an empty sql means the query selects nothing.
struct Plan {
  std::string sql;
  std::vector<DomainPtr> domains;
  std::vector<Placeholder> placeholders;
  Profile profile;
  // Select position feeding each profile field.
  std::vector<size_t> outputs;
};

using Row = std::vector<Value>;

struct Product {
  Profile profile;
  std::optional<std::vector<Row>> data;
};

/// Intermediate stage dumps collected when TranslateOptions::explain is set.
struct Explanation {
  std::vector<std::pair<std::string, std::string>> stages;
};

/// Executes a translated query against a live connection.
/// MUST check read permission once per call and MUST wrap driver failures as EngineError.
/// Inputs are a connection; outputs are a Product with converted values.
class Pipe {
 public:
  Pipe(Plan plan, Environment environment, Explanation explanation);

  const Plan& plan() const { return plan_; }
  const Explanation& explanation() const { return explanation_; }

  Product operator()(Connection& connection) const;

 private:
  std::vector<std::optional<std::string>> bind_parameters() const;

  Plan plan_;
  Environment environment_;
  Explanation explanation_;
};

/// Translates a navigational query into a SQL plan over the catalog.
/// MUST throw navsql::Error for any failure caused by the query text, before any I/O.
/// Inputs are query text, a frozen catalog, parameter values and options.
Pipe translate(const std::string& query, const Catalog& catalog,
               const Environment& environment = {}, const TranslateOptions& options = {});

}  // namespace navsql
