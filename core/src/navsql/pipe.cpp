#include <exception>
#include <stdexcept>
#include <string>

#include "navsql/navsql.h"

namespace navsql {

namespace {

/// Converts one result cell into a value of the output domain.
/// Drivers spell booleans differently (`t`, `1`, `TRUE`), so they are normalized first.
Value parse_cell(const DomainPtr& domain, const std::string& text) {
  if (domain->kind() == DomainKind::Boolean) {
    if (text == "t" || text == "1" || text == "TRUE" || text == "true") {
      return Value::boolean(true);
    }
    if (text == "f" || text == "0" || text == "FALSE" || text == "false") {
      return Value::boolean(false);
    }
  }
  if (domain->kind() == DomainKind::Untyped || domain->kind() == DomainKind::Opaque) {
    return Value::text(text);
  }
  return domain->parse(text);
}

}  // namespace

Pipe::Pipe(Plan plan, Environment environment, Explanation explanation)
    : plan_(std::move(plan)),
      environment_(std::move(environment)),
      explanation_(std::move(explanation)) {}

std::vector<std::optional<std::string>> Pipe::bind_parameters() const {
  std::vector<std::optional<std::string>> parameters;
  parameters.reserve(plan_.placeholders.size());
  for (const auto& placeholder : plan_.placeholders) {
    auto found = environment_.find(placeholder.name);
    internal_check(found != environment_.end(), "every placeholder names a bound parameter");
    const ParameterValue& parameter = found->second;
    if (parameter.value.is_null()) {
      parameters.emplace_back(std::nullopt);
    } else if (!parameter.domain || parameter.domain->kind() == DomainKind::Untyped) {
      parameters.emplace_back(parameter.value.as_text());
    } else {
      parameters.emplace_back(parameter.domain->dump(parameter.value));
    }
  }
  return parameters;
}

Product Pipe::operator()(Connection& connection) const {
  Product product;
  product.profile = plan_.profile;
  if (plan_.sql.empty()) return product;
  if (!connection.can_read()) {
    throw PermissionError("not enough permissions to execute the query");
  }

  std::vector<std::optional<std::string>> parameters = bind_parameters();
  std::vector<std::vector<Cell>> cells;
  try {
    std::unique_ptr<Cursor> cursor = connection.execute(plan_.sql, parameters);
    std::vector<Cell> row;
    while (cursor->fetch(row)) cells.push_back(row);
  } catch (const EngineError&) {
    throw;
  } catch (const std::exception& ex) {
    throw EngineError(ex.what());
  }

  if (cells.empty()) return product;
  std::vector<Row> rows;
  rows.reserve(cells.size());
  for (const auto& raw : cells) {
    if (raw.size() != plan_.domains.size()) {
      throw EngineError("expected " + std::to_string(plan_.domains.size()) +
                        " columns per row; got " + std::to_string(raw.size()));
    }
    Row row;
    row.reserve(plan_.outputs.size());
    for (size_t i = 0; i < plan_.outputs.size(); ++i) {
      const Cell& cell = raw[plan_.outputs[i]];
      if (!cell) {
        row.emplace_back();
        continue;
      }
      try {
        row.push_back(parse_cell(plan_.profile.fields[i].domain, *cell));
      } catch (const std::invalid_argument& ex) {
        throw EngineError("unable to convert a result value: " + std::string(ex.what()));
      }
    }
    rows.push_back(std::move(row));
  }
  product.data = std::move(rows);
  return product;
}

}  // namespace navsql
