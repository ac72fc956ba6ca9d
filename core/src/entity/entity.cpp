#include "navsql/entity.h"

#include <algorithm>
#include <functional>
#include <stdexcept>

namespace navsql {

namespace {

const Column* require_column(const Table& table, const std::string& name) {
  const Column* column = table.find_column(name);
  if (!column) {
    throw std::invalid_argument("unknown column " + table.name() + "." + name);
  }
  return column;
}

bool covers_unique_key(const Table& table, const std::vector<const Column*>& columns) {
  for (const auto& key : table.unique_keys()) {
    bool covered = std::all_of(key.columns.begin(), key.columns.end(), [&](const Column* column) {
      return std::find(columns.begin(), columns.end(), column) != columns.end();
    });
    if (covered) return true;
  }
  return false;
}

}  // namespace

const UniqueKey* Table::primary_key() const {
  for (const auto& key : unique_keys_) {
    if (key.is_primary) return &key;
  }
  return nullptr;
}

const Column* Table::find_column(const std::string& name) const {
  for (const auto& column : columns_) {
    if (column->name == name) return column.get();
  }
  return nullptr;
}

Column& Table::add_column(const std::string& name, DomainPtr domain, bool is_nullable,
                          bool has_default) {
  if (find_column(name)) {
    throw std::invalid_argument("duplicate column " + name_ + "." + name);
  }
  auto column = std::make_unique<Column>();
  column->name = name;
  column->domain = std::move(domain);
  column->is_nullable = is_nullable;
  column->has_default = has_default;
  column->table = this;
  column->index = columns_.size();
  columns_.push_back(std::move(column));
  return *columns_.back();
}

void Table::add_unique_key(const std::vector<std::string>& columns, bool is_primary,
                           bool is_partial) {
  if (columns.empty()) {
    throw std::invalid_argument("a unique key of " + name_ + " needs at least one column");
  }
  if (is_primary && primary_key()) {
    throw std::invalid_argument("table " + name_ + " already has a primary key");
  }
  UniqueKey key;
  for (const auto& name : columns) {
    const Column* column = require_column(*this, name);
    // WHY: primary key columns can never hold NULL, whatever introspection said.
    if (is_primary) {
      columns_[column->index]->is_nullable = false;
    }
    key.columns.push_back(column);
  }
  key.is_primary = is_primary;
  key.is_partial = is_partial;
  unique_keys_.push_back(std::move(key));
}

const Table* Schema::find_table(const std::string& name) const {
  for (const auto& table : tables_) {
    if (table->name() == name) return table.get();
  }
  return nullptr;
}

Table& Schema::add_table(const std::string& name) {
  if (find_table(name)) {
    throw std::invalid_argument("duplicate table " + name_ + "." + name);
  }
  tables_.push_back(std::make_unique<Table>(this, name));
  return *tables_.back();
}

const Schema* Catalog::find_schema(const std::string& name) const {
  for (const auto& schema : schemas_) {
    if (schema->name() == name) return schema.get();
  }
  return nullptr;
}

Schema& Catalog::add_schema(const std::string& name) {
  if (find_schema(name)) {
    throw std::invalid_argument("duplicate schema " + name);
  }
  schemas_.push_back(std::make_unique<Schema>(name));
  return *schemas_.back();
}

const ForeignKey& Catalog::add_foreign_key(Table& origin, const std::vector<std::string>& origin_columns,
                                           Table& target, const std::vector<std::string>& target_columns,
                                           bool is_partial) {
  if (origin_columns.empty() || origin_columns.size() != target_columns.size()) {
    throw std::invalid_argument("foreign key " + origin.name() + " -> " + target.name() +
                                " has mismatched columns");
  }
  auto key = std::make_unique<ForeignKey>();
  key->origin = &origin;
  key->target = &target;
  key->is_partial = is_partial;
  for (const auto& name : origin_columns) {
    key->origin_columns.push_back(require_column(origin, name));
  }
  for (const auto& name : target_columns) {
    key->target_columns.push_back(require_column(target, name));
  }
  origin.foreign_keys_.push_back(key.get());
  target.referring_.push_back(key.get());
  foreign_keys_.push_back(std::move(key));
  return *foreign_keys_.back();
}

Join Join::direct(const ForeignKey& key) {
  Join join;
  join.kind = Kind::Direct;
  join.foreign_key = &key;
  join.origin = key.origin;
  join.target = key.target;
  join.origin_columns = key.origin_columns;
  join.target_columns = key.target_columns;
  join.is_expanding = !key.is_partial &&
                      std::none_of(key.origin_columns.begin(), key.origin_columns.end(),
                                   [](const Column* column) { return column->is_nullable; });
  join.is_contracting = covers_unique_key(*key.target, key.target_columns);
  return join;
}

Join Join::reverse(const ForeignKey& key) {
  Join join;
  join.kind = Kind::Reverse;
  join.foreign_key = &key;
  join.origin = key.target;
  join.target = key.origin;
  join.origin_columns = key.target_columns;
  join.target_columns = key.origin_columns;
  join.is_expanding = false;
  join.is_contracting = covers_unique_key(*key.origin, key.origin_columns);
  return join;
}

size_t hash_table(const Table* table) {
  if (!table) return 0;
  std::hash<std::string> hasher;
  return hasher(table->schema().name()) * 31 + hasher(table->name());
}

size_t hash_column(const Column* column) {
  if (!column) return 0;
  return hash_table(column->table) * 31 + std::hash<std::string>()(column->name);
}

size_t Join::hash() const {
  size_t seed = kind == Kind::Direct ? 17 : 29;
  seed = seed * 31 + hash_table(origin);
  seed = seed * 31 + hash_table(target);
  for (const Column* column : origin_columns) {
    seed = seed * 31 + hash_column(column);
  }
  return seed;
}

}  // namespace navsql
