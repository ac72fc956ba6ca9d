#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "navsql/domain.h"

namespace navsql {

class Schema;
class Table;

/// Describes one table column as reported by schema introspection.
/// MUST stay owned by its table and MUST NOT change after the catalog is frozen.
struct Column {
  std::string name;
  DomainPtr domain;
  bool is_nullable = true;
  bool has_default = false;
  const Table* table = nullptr;
  size_t index = 0;
};

struct UniqueKey {
  std::vector<const Column*> columns;
  bool is_primary = false;
  bool is_partial = false;
};

struct ForeignKey {
  const Table* origin = nullptr;
  std::vector<const Column*> origin_columns;
  const Table* target = nullptr;
  std::vector<const Column*> target_columns;
  bool is_partial = false;
};

/// Holds the columns and keys of one table; owned by a Schema.
/// MUST keep pointers stable for the lifetime of the catalog.
/// Inputs are the add_* calls made while building; side effects are owned allocations.
class Table {
 public:
  Table(const Schema* schema, std::string name) : schema_(schema), name_(std::move(name)) {}

  const std::string& name() const { return name_; }
  const Schema& schema() const { return *schema_; }
  const std::vector<std::unique_ptr<Column>>& columns() const { return columns_; }
  const std::vector<UniqueKey>& unique_keys() const { return unique_keys_; }
  const std::vector<const ForeignKey*>& foreign_keys() const { return foreign_keys_; }
  const std::vector<const ForeignKey*>& referring_foreign_keys() const { return referring_; }

  /// Returns the primary key, or nullptr when the table has none.
  const UniqueKey* primary_key() const;
  const Column* find_column(const std::string& name) const;

  Column& add_column(const std::string& name, DomainPtr domain, bool is_nullable,
                     bool has_default = false);
  /// Registers a unique key by column names; throws std::invalid_argument on unknown columns.
  void add_unique_key(const std::vector<std::string>& columns, bool is_primary,
                      bool is_partial = false);

 private:
  friend class Catalog;

  const Schema* schema_;
  std::string name_;
  std::vector<std::unique_ptr<Column>> columns_;
  std::vector<UniqueKey> unique_keys_;
  std::vector<const ForeignKey*> foreign_keys_;
  std::vector<const ForeignKey*> referring_;
};

class Schema {
 public:
  explicit Schema(std::string name) : name_(std::move(name)) {}

  const std::string& name() const { return name_; }
  const std::vector<std::unique_ptr<Table>>& tables() const { return tables_; }
  const Table* find_table(const std::string& name) const;

  Table& add_table(const std::string& name);

 private:
  std::string name_;
  std::vector<std::unique_ptr<Table>> tables_;
};

/// Read-only snapshot of the database schema consumed by the translator.
/// MUST be fully built before translation and MUST NOT be mutated while translating.
/// Inputs are add_* calls during construction; side effects are owned allocations.
class Catalog {
 public:
  Catalog() = default;
  Catalog(const Catalog&) = delete;
  Catalog& operator=(const Catalog&) = delete;

  const std::vector<std::unique_ptr<Schema>>& schemas() const { return schemas_; }
  const Schema* find_schema(const std::string& name) const;

  Schema& add_schema(const std::string& name);
  /// Connects origin columns to target columns; throws std::invalid_argument on
  /// unknown columns or mismatched arity.
  const ForeignKey& add_foreign_key(Table& origin, const std::vector<std::string>& origin_columns,
                                    Table& target, const std::vector<std::string>& target_columns,
                                    bool is_partial = false);

 private:
  std::vector<std::unique_ptr<Schema>> schemas_;
  std::vector<std::unique_ptr<ForeignKey>> foreign_keys_;
};

/// A navigation step derived from a foreign key, in either direction.
/// MUST compute is_expanding/is_contracting from key nullability and uniqueness.
/// Inputs are a foreign key; outputs are immutable join descriptors.
struct Join {
  enum class Kind { Direct, Reverse };

  Kind kind = Kind::Direct;
  const ForeignKey* foreign_key = nullptr;
  const Table* origin = nullptr;
  const Table* target = nullptr;
  std::vector<const Column*> origin_columns;
  std::vector<const Column*> target_columns;
  bool is_expanding = false;
  bool is_contracting = false;

  static Join direct(const ForeignKey& key);
  static Join reverse(const ForeignKey& key);

  bool operator==(const Join& other) const {
    return kind == other.kind && foreign_key == other.foreign_key;
  }
  bool operator!=(const Join& other) const { return !(*this == other); }
  size_t hash() const;
};

/// Stable structural hashes for entities, independent of allocation addresses.
size_t hash_table(const Table* table);
size_t hash_column(const Column* column);

}  // namespace navsql
