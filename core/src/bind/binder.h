#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "binding.h"
#include "navsql/navsql.h"
#include "syntax/syntax.h"

namespace navsql {

/// Resolves a syntax tree against the catalog into a Binding tree.
/// MUST attach a mark to every binding and MUST throw Error for unresolved names,
/// ambiguous names used as values, and ill-typed operands.
/// Inputs are a frozen catalog, parameter values and the query text shared with marks.
class Binder {
 public:
  Binder(const Catalog& catalog, const Environment& environment,
         std::shared_ptr<const std::string> text);

  /// Binds the whole query into a Collect binding, or returns nullptr for `/`.
  BindingPtr bind_query(const QuerySyntax& query, const std::optional<int64_t>& limit);

  /// Binds one syntax node in the given scope. An ambiguous identifier is returned
  /// as an Ambiguous binding; callers that need a value go through bind_value().
  BindingPtr bind(const SyntaxPtr& syntax, const BindingPtr& scope);

  const BindingPtr& root() const { return root_; }

 private:
  Mark mark_of(const Syntax& syntax) const;

  BindingPtr bind_value(const SyntaxPtr& syntax, const BindingPtr& scope);
  BindingPtr bind_scalar(const SyntaxPtr& syntax, const BindingPtr& scope);
  BindingPtr bind_flow(const SyntaxPtr& syntax, const BindingPtr& scope);
  /// Binds the operand of a sieve, sort, limit or selection: a flow, or a selection over one.
  BindingPtr bind_target(const SyntaxPtr& syntax, const BindingPtr& scope);

  BindingPtr bind_identifier(const Syntax& syntax, const BindingPtr& scope);
  BindingPtr bind_number(const Syntax& syntax);
  BindingPtr bind_reference(const Syntax& syntax);
  BindingPtr bind_compose(const Syntax& syntax, const BindingPtr& scope);
  BindingPtr bind_sieve(const Syntax& syntax, const BindingPtr& scope);
  BindingPtr bind_project(const Syntax& syntax, const BindingPtr& scope);
  BindingPtr bind_link(const Syntax& syntax, const BindingPtr& scope);
  BindingPtr bind_operator(const Syntax& syntax, const BindingPtr& scope);
  BindingPtr bind_prefix(const Syntax& syntax, const BindingPtr& scope);
  BindingPtr bind_function(const Syntax& syntax, const BindingPtr& scope);
  BindingPtr bind_selection(const BindingPtr& base, const std::vector<SyntaxPtr>& args,
                            const Mark& mark);
  BindingPtr bind_sort(const BindingPtr& scope, const std::vector<SyntaxPtr>& args,
                       const Mark& mark);
  BindingPtr bind_limit(const BindingPtr& scope, const std::vector<SyntaxPtr>& args,
                        const Mark& mark);
  BindingPtr bind_aggregate(const Syntax& syntax, const BindingPtr& scope, SignatureKind kind);

  const Catalog& catalog_;
  const Environment& environment_;
  std::shared_ptr<const std::string> text_;
  BindingPtr root_;
};

/// Casts a binding to the given domain, returning it unchanged when the domain matches.
BindingPtr cast_binding(const BindingPtr& binding, const DomainPtr& domain);

/// Gives an untyped binding the text domain; other bindings pass through.
BindingPtr finalize_binding(const BindingPtr& binding);

}  // namespace navsql
