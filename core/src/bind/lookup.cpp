#include "lookup.h"

#include <cctype>
#include <sstream>

namespace navsql {

namespace {

/// Follows scope-preserving operations (filters, sorts, selections) to the node that names things.
BindingPtr naming_scope(BindingPtr scope) {
  while (scope) {
    switch (scope->kind) {
      case BindingKind::Sieve:
      case BindingKind::Sort:
      case BindingKind::Selection:
      case BindingKind::Direction:
        scope = scope->base;
        continue;
      case BindingKind::Column:
        if (scope->link) {
          scope = scope->link;
          continue;
        }
        return scope;
      default:
        return scope;
    }
  }
  return scope;
}

BindingPtr make_table_binding(const BindingPtr& scope, const Table& table, const Mark& mark) {
  auto binding = std::make_shared<Binding>();
  binding->kind = BindingKind::Table;
  binding->base = scope;
  binding->table = &table;
  binding->domain = Domain::entity(table.name());
  binding->mark = mark;
  binding->title = table.name();
  return binding;
}

BindingPtr make_attach_binding(const BindingPtr& scope, const Join& join, const std::string& title,
                               const Mark& mark) {
  auto binding = std::make_shared<Binding>();
  binding->kind = BindingKind::Attach;
  binding->base = scope;
  binding->join = join;
  binding->table = join.target;
  binding->domain = Domain::entity(join.target->name());
  binding->mark = mark;
  binding->title = title;
  return binding;
}

std::string describe_alternative(const Binding& binding) {
  std::ostringstream oss;
  switch (binding.kind) {
    case BindingKind::Table:
      oss << "table " << binding.table->schema().name() << "." << binding.table->name();
      break;
    case BindingKind::Column:
      oss << "column " << binding.column->table->name() << "." << binding.column->name;
      break;
    case BindingKind::Attach: {
      const Join& join = *binding.join;
      oss << (join.kind == Join::Kind::Direct ? "link " : "reverse link ") << join.origin->name()
          << "(";
      for (size_t i = 0; i < join.origin_columns.size(); ++i) {
        if (i > 0) oss << ",";
        oss << join.origin_columns[i]->name;
      }
      oss << ") -> " << join.target->name() << "(";
      for (size_t i = 0; i < join.target_columns.size(); ++i) {
        if (i > 0) oss << ",";
        oss << join.target_columns[i]->name;
      }
      oss << ")";
      break;
    }
    case BindingKind::Kernel:
      oss << "kernel " << binding.title;
      break;
    case BindingKind::Complement:
      oss << "complement " << binding.title;
      break;
    default:
      oss << binding.title;
      break;
  }
  return oss.str();
}

}  // namespace

std::string normalize_name(const std::string& name) {
  std::string out;
  out.reserve(name.size());
  for (char c : name) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) || uc >= 0x80) {
      out.push_back(static_cast<char>(std::tolower(uc)));
    } else {
      out.push_back('_');
    }
  }
  return out;
}

const Table* scope_table(const BindingPtr& scope) {
  BindingPtr naming = naming_scope(scope);
  if (!naming) return nullptr;
  switch (naming->kind) {
    case BindingKind::Table:
    case BindingKind::Attach:
      return naming->table;
    case BindingKind::Complement: {
      BindingPtr quotient = naming_scope(naming->base);
      return quotient ? scope_table(quotient->seed) : nullptr;
    }
    case BindingKind::Cover:
    case BindingKind::Link:
      return scope_table(naming->seed);
    case BindingKind::Fork:
      return scope_table(naming->base);
    default:
      return nullptr;
  }
}

Error ambiguous_error(const Binding& binding) {
  std::string hint = "candidates are ";
  for (size_t i = 0; i < binding.elements.size(); ++i) {
    if (i > 0) hint += i + 1 == binding.elements.size() ? " and " : ", ";
    hint += describe_alternative(*binding.elements[i]);
  }
  return Error("ambiguous name '" + binding.title + "'", binding.mark, hint);
}

BindingPtr make_column_binding(const BindingPtr& scope, const Column& column, const Mark& mark) {
  auto binding = std::make_shared<Binding>();
  binding->kind = BindingKind::Column;
  binding->base = scope;
  binding->column = &column;
  binding->domain = column.domain;
  binding->mark = mark;
  binding->title = column.name;
  const ForeignKey* sole = nullptr;
  size_t count = 0;
  for (const ForeignKey* key : column.table->foreign_keys()) {
    if (key->origin_columns.size() == 1 && key->origin_columns[0] == &column) {
      sole = key;
      ++count;
    }
  }
  if (count == 1) {
    binding->link = make_attach_binding(scope, Join::direct(*sole), column.name, mark);
  }
  return binding;
}

BindingPtr find_attribute(const Catalog& catalog, const BindingPtr& scope, const std::string& name,
                          const Mark& mark) {
  std::string key = normalize_name(name);
  BindingPtr owner = scope;
  if (owner && owner->kind == BindingKind::Column && owner->link) owner = owner->link;
  BindingPtr naming = naming_scope(owner);
  if (naming && naming->kind == BindingKind::Ambiguous) {
    throw ambiguous_error(*naming);
  }

  std::vector<BindingPtr> candidates;
  if (naming && (naming->kind == BindingKind::Root || naming->kind == BindingKind::Home)) {
    for (const auto& schema : catalog.schemas()) {
      for (const auto& table : schema->tables()) {
        if (normalize_name(table->name()) == key) {
          candidates.push_back(make_table_binding(owner, *table, mark));
        }
      }
    }
  } else if (naming && naming->kind == BindingKind::Quotient) {
    for (size_t i = 0; i < naming->elements.size(); ++i) {
      const BindingPtr& kernel = naming->elements[i];
      if (normalize_name(kernel->title) != key) continue;
      auto binding = std::make_shared<Binding>();
      binding->kind = BindingKind::Kernel;
      binding->base = owner;
      binding->index = i;
      binding->domain = kernel->domain;
      binding->mark = mark;
      binding->title = kernel->title;
      candidates.push_back(binding);
    }
    if (naming->seed && normalize_name(naming->seed->title) == key) {
      candidates.push_back(lookup_complement(owner, mark));
    }
  } else if (const Table* table = scope_table(naming)) {
    for (const auto& column : table->columns()) {
      if (normalize_name(column->name) == key) {
        candidates.push_back(make_column_binding(owner, *column, mark));
      }
    }
    for (const ForeignKey* fk : table->foreign_keys()) {
      if (normalize_name(fk->target->name()) != key) continue;
      Join join = Join::direct(*fk);
      bool shadowed = false;
      for (const auto& candidate : candidates) {
        if (candidate->link && candidate->link->join == join) shadowed = true;
      }
      if (!shadowed) candidates.push_back(make_attach_binding(owner, join, name, mark));
    }
    for (const ForeignKey* fk : table->referring_foreign_keys()) {
      if (normalize_name(fk->origin->name()) != key) continue;
      candidates.push_back(make_attach_binding(owner, Join::reverse(*fk), name, mark));
    }
  }

  if (candidates.empty()) {
    return nullptr;
  }
  if (candidates.size() == 1) {
    return candidates.front();
  }
  auto ambiguous = std::make_shared<Binding>();
  ambiguous->kind = BindingKind::Ambiguous;
  ambiguous->base = owner;
  ambiguous->domain = Domain::void_type();
  ambiguous->mark = mark;
  ambiguous->title = name;
  ambiguous->elements = std::move(candidates);
  return ambiguous;
}

BindingPtr lookup_attribute(const Catalog& catalog, const BindingPtr& scope, const std::string& name,
                            const Mark& mark) {
  BindingPtr binding = find_attribute(catalog, scope, name, mark);
  if (!binding) {
    throw Error("unable to find attribute '" + name + "'", mark);
  }
  return binding;
}

BindingPtr lookup_complement(const BindingPtr& scope, const Mark& mark) {
  BindingPtr naming = naming_scope(scope);
  if (!naming || naming->kind != BindingKind::Quotient) {
    throw Error("expected a quotient scope", mark);
  }
  auto binding = std::make_shared<Binding>();
  binding->kind = BindingKind::Complement;
  binding->base = scope;
  binding->domain = naming->seed->domain;
  binding->mark = mark;
  binding->title = naming->seed->title;
  return binding;
}

std::vector<BindingPtr> expand_scope(const BindingPtr& scope, const Mark& mark) {
  std::vector<BindingPtr> bindings;
  BindingPtr naming = naming_scope(scope);
  if (naming && naming->kind == BindingKind::Quotient) {
    for (size_t i = 0; i < naming->elements.size(); ++i) {
      auto binding = std::make_shared<Binding>();
      binding->kind = BindingKind::Kernel;
      binding->base = scope;
      binding->index = i;
      binding->domain = naming->elements[i]->domain;
      binding->mark = mark;
      binding->title = naming->elements[i]->title;
      bindings.push_back(binding);
    }
    return bindings;
  }
  const Table* table = scope_table(scope);
  if (!table) {
    throw Error("expected a table or a quotient scope", mark);
  }
  BindingPtr owner = scope;
  if (owner->kind == BindingKind::Column && owner->link) owner = owner->link;
  for (const auto& column : table->columns()) {
    bindings.push_back(make_column_binding(owner, *column, mark));
  }
  return bindings;
}

}  // namespace navsql
