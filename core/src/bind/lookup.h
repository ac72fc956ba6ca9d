#pragma once

#include <string>
#include <vector>

#include "binding.h"

namespace navsql {

/// Folds an identifier to its lookup form: lower case with non-alphanumerics as '_'.
std::string normalize_name(const std::string& name);

/// Returns the table whose columns a scope exposes, or nullptr for scalar scopes.
const Table* scope_table(const BindingPtr& scope);

/// Same as lookup_attribute() but returns nullptr when no attribute matches.
BindingPtr find_attribute(const Catalog& catalog, const BindingPtr& scope, const std::string& name,
                          const Mark& mark);

/// Resolves a name in a scope to a column, link, table, kernel or complement.
/// MUST return an Ambiguous binding when several distinct targets match and
/// MUST throw Error "unable to find attribute" when none does.
/// Inputs are the catalog for root lookups, the scope binding and the identifier.
BindingPtr lookup_attribute(const Catalog& catalog, const BindingPtr& scope, const std::string& name,
                            const Mark& mark);

/// Resolves `^` inside a quotient scope to its complement.
BindingPtr lookup_complement(const BindingPtr& scope, const Mark& mark);

/// Lists the public attributes of a scope for wildcard selections.
/// Table scopes yield their columns; quotient scopes yield their kernels.
std::vector<BindingPtr> expand_scope(const BindingPtr& scope, const Mark& mark);

/// Builds a column binding, attaching the direct link when the column alone
/// forms a single-column foreign key.
BindingPtr make_column_binding(const BindingPtr& scope, const Column& column, const Mark& mark);

}  // namespace navsql
