#include "binding.h"

#include <sstream>

namespace navsql {

namespace {

const char* kind_name(BindingKind kind) {
  switch (kind) {
    case BindingKind::Root: return "Root";
    case BindingKind::Home: return "Home";
    case BindingKind::Table: return "Table";
    case BindingKind::Attach: return "Attach";
    case BindingKind::Column: return "Column";
    case BindingKind::Quotient: return "Quotient";
    case BindingKind::Kernel: return "Kernel";
    case BindingKind::Complement: return "Complement";
    case BindingKind::Cover: return "Cover";
    case BindingKind::Fork: return "Fork";
    case BindingKind::Link: return "Link";
    case BindingKind::Sieve: return "Sieve";
    case BindingKind::Sort: return "Sort";
    case BindingKind::Rescoping: return "Rescoping";
    case BindingKind::Selection: return "Selection";
    case BindingKind::Direction: return "Direction";
    case BindingKind::Literal: return "Literal";
    case BindingKind::Parameter: return "Parameter";
    case BindingKind::Cast: return "Cast";
    case BindingKind::Formula: return "Formula";
    case BindingKind::Ambiguous: return "Ambiguous";
    case BindingKind::Collect: return "Collect";
  }
  return "?";
}

void write_binding(std::ostream& os, const BindingPtr& binding, int depth, const char* role) {
  os << std::string(static_cast<size_t>(depth) * 2, ' ');
  if (role) os << role << ": ";
  if (!binding) {
    os << "-\n";
    return;
  }
  os << kind_name(binding->kind);
  if (!binding->title.empty()) os << " '" << binding->title << "'";
  if (binding->domain) os << " : " << binding->domain->to_string();
  switch (binding->kind) {
    case BindingKind::Formula:
      os << " [" << binding->signature.to_string() << "]";
      break;
    case BindingKind::Kernel:
      os << " #" << binding->index;
      break;
    case BindingKind::Direction:
      os << (binding->direction < 0 ? " desc" : " asc");
      break;
    case BindingKind::Sort:
      if (binding->limit) os << " limit " << *binding->limit;
      if (binding->offset) os << " offset " << *binding->offset;
      break;
    default:
      break;
  }
  os << "\n";
  // The root is shared by every chain; printing it once per node adds nothing.
  if (binding->base && binding->base->kind != BindingKind::Root) {
    write_binding(os, binding->base, depth + 1, "base");
  }
  if (binding->seed) write_binding(os, binding->seed, depth + 1, "seed");
  if (binding->scope) write_binding(os, binding->scope, depth + 1, "scope");
  if (binding->filter) write_binding(os, binding->filter, depth + 1, "filter");
  if (binding->link) write_binding(os, binding->link, depth + 1, "link");
  for (const auto& element : binding->elements) {
    write_binding(os, element, depth + 1, nullptr);
  }
  for (const auto& image : binding->images) {
    write_binding(os, image.first, depth + 1, "origin");
    write_binding(os, image.second, depth + 1, "target");
  }
}

}  // namespace

std::string dump_binding(const BindingPtr& binding) {
  std::ostringstream oss;
  write_binding(oss, binding, 0, nullptr);
  return oss.str();
}

}  // namespace navsql
