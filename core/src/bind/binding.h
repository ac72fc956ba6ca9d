#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "navsql/domain.h"
#include "navsql/entity.h"
#include "navsql/error.h"
#include "tr/signature.h"

namespace navsql {

enum class BindingKind {
  Root,
  Home,
  Table,
  Attach,
  Column,
  Quotient,
  Kernel,
  Complement,
  Cover,
  Fork,
  Link,
  Sieve,
  Sort,
  Rescoping,
  Selection,
  Direction,
  Literal,
  Parameter,
  Cast,
  Formula,
  Ambiguous,
  Collect
};

struct Binding;
using BindingPtr = std::shared_ptr<const Binding>;
using BindingImage = std::pair<BindingPtr, BindingPtr>;

/// One node of the attributed query tree produced by the binder.
/// MUST carry exactly one domain and the mark of the syntax it was bound from.
/// Fields are used per kind; `base` is the scope a navigation extends or the operand
/// of a cast, direction or rescoping.
struct Binding {
  BindingKind kind = BindingKind::Root;
  BindingPtr base;
  DomainPtr domain;
  Mark mark;
  std::string title;

  const Table* table = nullptr;
  std::optional<Join> join;
  const Column* column = nullptr;
  BindingPtr link;
  BindingPtr seed;
  BindingPtr scope;
  BindingPtr filter;
  std::vector<BindingPtr> elements;
  std::vector<BindingImage> images;
  size_t index = 0;
  int direction = 0;
  Value value;
  std::string name;
  Signature signature;
  std::optional<int64_t> limit;
  std::optional<int64_t> offset;
};

/// Tells whether the binding denotes a row set rather than a scalar value.
inline bool is_flow(const Binding& binding) {
  return binding.domain && binding.domain->kind() == DomainKind::Entity;
}

/// Builds the "ambiguous name" error listing the alternatives of an Ambiguous binding.
Error ambiguous_error(const Binding& binding);

/// Renders a binding tree as indented text for --explain.
std::string dump_binding(const BindingPtr& binding);

}  // namespace navsql
