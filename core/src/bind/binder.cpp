#include "binder.h"

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <utility>

#include "lookup.h"

namespace navsql {

namespace {

std::shared_ptr<Binding> make_binding(BindingKind kind, const BindingPtr& base, DomainPtr domain,
                                      const Mark& mark) {
  auto binding = std::make_shared<Binding>();
  binding->kind = kind;
  binding->base = base;
  binding->domain = std::move(domain);
  binding->mark = mark;
  return binding;
}

BindingPtr make_literal(Value value, DomainPtr domain, const Mark& mark, const std::string& title) {
  auto binding = make_binding(BindingKind::Literal, nullptr, std::move(domain), mark);
  binding->value = std::move(value);
  binding->title = title;
  return binding;
}

BindingPtr make_formula(const Signature& signature, std::vector<BindingPtr> args, DomainPtr domain,
                        const BindingPtr& scope, const Mark& mark, const std::string& title) {
  auto binding = make_binding(BindingKind::Formula, scope, std::move(domain), mark);
  binding->signature = signature;
  binding->elements = std::move(args);
  binding->title = title;
  return binding;
}

/// Rebuilds a selection on top of a transformed base so that filters, sorts and
/// limits applied after `{...}` keep the selected columns.
BindingPtr wrap_base(const BindingPtr& scope, const std::function<BindingPtr(const BindingPtr&)>& wrap) {
  if (scope->kind == BindingKind::Selection) {
    auto copy = std::make_shared<Binding>(*scope);
    copy->base = wrap(scope->base);
    return copy;
  }
  return wrap(scope);
}

bool is_comparable(const DomainPtr& domain) {
  switch (domain->kind()) {
    case DomainKind::Integer:
    case DomainKind::Float:
    case DomainKind::Decimal:
    case DomainKind::Text:
    case DomainKind::Enum:
    case DomainKind::Date:
    case DomainKind::Time:
    case DomainKind::DateTime:
      return true;
    default:
      return false;
  }
}

bool is_scalar_domain(const DomainPtr& domain) {
  switch (domain->kind()) {
    case DomainKind::Entity:
    case DomainKind::Record:
    case DomainKind::Void:
    case DomainKind::List:
    case DomainKind::Identity:
      return false;
    default:
      return true;
  }
}

/// Finds a common scalar domain for all operands; untyped operands settle on text.
DomainPtr coerce_operands(const std::vector<BindingPtr>& operands, const Mark& mark) {
  DomainPtr domain = operands.front()->domain;
  for (size_t i = 1; i < operands.size() && domain; ++i) {
    domain = coerce(domain, operands[i]->domain);
  }
  if (!domain || !is_scalar_domain(domain)) {
    throw Error("cannot coerce values to a common type", mark);
  }
  if (domain->kind() == DomainKind::Untyped) return Domain::text();
  return domain;
}

std::vector<BindingPtr> cast_all(const std::vector<BindingPtr>& operands, const DomainPtr& domain) {
  std::vector<BindingPtr> out;
  out.reserve(operands.size());
  for (const auto& operand : operands) {
    out.push_back(cast_binding(operand, domain));
  }
  return out;
}

void expect_arity(const Syntax& syntax, size_t min_count, size_t max_count, const Mark& mark) {
  size_t count = syntax.args.size();
  if (count >= min_count && count <= max_count) return;
  std::string expected;
  if (min_count == max_count) {
    expected = std::to_string(min_count);
  } else if (max_count == static_cast<size_t>(-1)) {
    expected = "at least " + std::to_string(min_count);
  } else {
    expected = std::to_string(min_count) + " to " + std::to_string(max_count);
  }
  throw Error("function '" + syntax.text + "' expects " + expected + " argument" +
                  (expected == "1" ? "" : "s") + ", got " + std::to_string(count),
              mark);
}

DomainPtr cast_target(const std::string& name) {
  if (name == "boolean") return Domain::boolean();
  if (name == "integer") return Domain::integer();
  if (name == "decimal") return Domain::decimal();
  if (name == "float") return Domain::floating();
  if (name == "text" || name == "string") return Domain::text();
  if (name == "date") return Domain::date();
  if (name == "time") return Domain::time();
  if (name == "datetime") return Domain::datetime();
  return nullptr;
}

const Syntax& strip_direction(const Syntax& syntax) {
  return syntax.kind == SyntaxKind::Direct ? *syntax.lhs : syntax;
}

}  // namespace

BindingPtr cast_binding(const BindingPtr& binding, const DomainPtr& domain) {
  if (same_domain(binding->domain, domain)) return binding;
  auto cast = make_binding(BindingKind::Cast, binding, domain, binding->mark);
  cast->title = binding->title;
  return cast;
}

BindingPtr finalize_binding(const BindingPtr& binding) {
  if (binding->domain->kind() == DomainKind::Untyped) {
    return cast_binding(binding, Domain::text());
  }
  return binding;
}

Binder::Binder(const Catalog& catalog, const Environment& environment,
               std::shared_ptr<const std::string> text)
    : catalog_(catalog), environment_(environment), text_(std::move(text)) {
  auto root = make_binding(BindingKind::Root, nullptr, Domain::entity("@"), Mark(text_, 0, 0));
  root->title = "@";
  root_ = root;
}

Mark Binder::mark_of(const Syntax& syntax) const {
  return Mark(text_, syntax.span.start, syntax.span.end);
}

BindingPtr Binder::bind_value(const SyntaxPtr& syntax, const BindingPtr& scope) {
  BindingPtr binding = bind(syntax, scope);
  if (binding->kind == BindingKind::Ambiguous) {
    throw ambiguous_error(*binding);
  }
  return binding;
}

BindingPtr Binder::bind_scalar(const SyntaxPtr& syntax, const BindingPtr& scope) {
  BindingPtr binding = bind_value(syntax, scope);
  if (!is_scalar_domain(binding->domain) && binding->domain->kind() != DomainKind::Untyped) {
    throw Error("expected a scalar expression", binding->mark);
  }
  return binding;
}

BindingPtr Binder::bind_flow(const SyntaxPtr& syntax, const BindingPtr& scope) {
  BindingPtr binding = bind_value(syntax, scope);
  if (binding->kind == BindingKind::Column && binding->link) return binding->link;
  if (!is_flow(*binding)) {
    throw Error("expected a flow expression", binding->mark);
  }
  return binding;
}

BindingPtr Binder::bind_target(const SyntaxPtr& syntax, const BindingPtr& scope) {
  BindingPtr binding = bind_value(syntax, scope);
  if (binding->kind == BindingKind::Selection) return binding;
  if (binding->kind == BindingKind::Column && binding->link) return binding->link;
  if (!is_flow(*binding)) {
    throw Error("expected a flow expression", binding->mark);
  }
  return binding;
}

BindingPtr Binder::bind(const SyntaxPtr& syntax, const BindingPtr& scope) {
  const Syntax& node = *syntax;
  switch (node.kind) {
    case SyntaxKind::Identifier:
      return bind_identifier(node, scope);
    case SyntaxKind::String:
      return make_literal(Value::text(node.text), Domain::untyped(), mark_of(node),
                          syntax_to_string(node));
    case SyntaxKind::Integer:
    case SyntaxKind::Decimal:
    case SyntaxKind::Float:
      return bind_number(node);
    case SyntaxKind::Reference:
      return bind_reference(node);
    case SyntaxKind::Apply:
      return bind_function(node, scope);
    case SyntaxKind::Compose:
      return bind_compose(node, scope);
    case SyntaxKind::Sieve:
      return bind_sieve(node, scope);
    case SyntaxKind::Project:
      return bind_project(node, scope);
    case SyntaxKind::Select:
      return bind_selection(bind_target(node.lhs, scope), node.rhs->args, mark_of(node));
    case SyntaxKind::Record:
      return bind_selection(scope, node.args, mark_of(node));
    case SyntaxKind::Direct: {
      BindingPtr base = bind_scalar(node.lhs, scope);
      auto direction = make_binding(BindingKind::Direction, base, base->domain, mark_of(node));
      direction->direction = node.direction;
      direction->title = base->title;
      return direction;
    }
    case SyntaxKind::Operator:
      return bind_operator(node, scope);
    case SyntaxKind::Prefix:
      return bind_prefix(node, scope);
    case SyntaxKind::Wildcard:
      throw Error("a wildcard is only allowed in a selection", mark_of(node));
    case SyntaxKind::Complement:
      return lookup_complement(scope, mark_of(node));
    case SyntaxKind::Link:
      return bind_link(node, scope);
    case SyntaxKind::Group:
      return bind(node.lhs, scope);
  }
  throw Error("unsupported expression", mark_of(node));
}

BindingPtr Binder::bind_identifier(const Syntax& syntax, const BindingPtr& scope) {
  Mark mark = mark_of(syntax);
  BindingPtr binding = find_attribute(catalog_, scope, syntax.text, mark);
  if (binding) return binding;
  std::string name = normalize_name(syntax.text);
  if (name == "true" || name == "false") {
    return make_literal(Value::boolean(name == "true"), Domain::boolean(), mark, name);
  }
  if (name == "null") {
    return make_literal(Value(), Domain::untyped(), mark, name);
  }
  throw Error("unable to find attribute '" + syntax.text + "'", mark);
}

BindingPtr Binder::bind_number(const Syntax& syntax) {
  DomainPtr domain = syntax.kind == SyntaxKind::Integer
                         ? Domain::integer()
                         : (syntax.kind == SyntaxKind::Decimal ? Domain::decimal() : Domain::floating());
  Mark mark = mark_of(syntax);
  try {
    return make_literal(domain->parse(syntax.text), domain, mark, syntax.text);
  } catch (const std::invalid_argument& ex) {
    throw Error("invalid " + domain->to_string() + " literal", mark, ex.what());
  }
}

BindingPtr Binder::bind_reference(const Syntax& syntax) {
  Mark mark = mark_of(syntax);
  auto it = environment_.find(syntax.text);
  if (it == environment_.end()) {
    throw Error("unable to find parameter '$" + syntax.text + "'", mark);
  }
  DomainPtr domain = it->second.domain ? it->second.domain : Domain::untyped();
  auto binding = make_binding(BindingKind::Parameter, nullptr, domain, mark);
  binding->name = syntax.text;
  binding->title = "$" + syntax.text;
  return binding;
}

BindingPtr Binder::bind_compose(const Syntax& syntax, const BindingPtr& scope) {
  BindingPtr lhs = bind_value(syntax.lhs, scope);
  bool linked = lhs->kind == BindingKind::Column && lhs->link;
  bool selected = lhs->kind == BindingKind::Selection;
  if (!is_flow(*lhs) && !linked && !selected) {
    throw Error("expected a flow expression", lhs->mark);
  }
  BindingPtr rhs = bind(syntax.rhs, lhs);
  switch (rhs->kind) {
    case BindingKind::Literal:
    case BindingKind::Parameter:
    case BindingKind::Cast:
    case BindingKind::Formula: {
      auto rescoping = make_binding(BindingKind::Rescoping, rhs, rhs->domain, mark_of(syntax));
      rescoping->scope = linked ? lhs->link : selected ? lhs->base : lhs;
      rescoping->title = syntax_to_string(syntax);
      return rescoping;
    }
    default:
      return rhs;
  }
}

BindingPtr Binder::bind_sieve(const Syntax& syntax, const BindingPtr& scope) {
  BindingPtr base = bind_target(syntax.lhs, scope);
  Mark mark = mark_of(syntax);
  return wrap_base(base, [&](const BindingPtr& inner) {
    BindingPtr filter = cast_binding(bind_value(syntax.rhs, inner), Domain::boolean());
    auto sieve = make_binding(BindingKind::Sieve, inner, inner->domain, mark);
    sieve->filter = filter;
    sieve->title = inner->title;
    return BindingPtr(sieve);
  });
}

BindingPtr Binder::bind_project(const Syntax& syntax, const BindingPtr& scope) {
  BindingPtr seed = bind_flow(syntax.lhs, scope);
  std::vector<SyntaxPtr> kernel_syntax;
  if (syntax.rhs->kind == SyntaxKind::Record) {
    kernel_syntax = syntax.rhs->args;
  } else {
    kernel_syntax.push_back(syntax.rhs);
  }
  auto quotient = make_binding(BindingKind::Quotient, scope, nullptr, mark_of(syntax));
  for (const auto& item : kernel_syntax) {
    BindingPtr kernel = bind_value(item, seed);
    if (!is_scalar_domain(kernel->domain) && kernel->domain->kind() != DomainKind::Untyped) {
      throw Error("quotient column must be scalar", kernel->mark);
    }
    auto titled = std::make_shared<Binding>(*finalize_binding(kernel));
    titled->title = syntax_to_string(*item);
    quotient->elements.push_back(titled);
  }
  quotient->seed = seed;
  quotient->domain = Domain::entity(seed->title);
  quotient->title = syntax_to_string(syntax);
  return quotient;
}

BindingPtr Binder::bind_link(const Syntax& syntax, const BindingPtr& scope) {
  Mark mark = mark_of(syntax);
  auto home = make_binding(BindingKind::Home, scope, Domain::entity("@"), mark);
  home->title = "@";
  BindingPtr seed = bind_flow(syntax.rhs, home);

  std::vector<SyntaxPtr> image_syntax;
  if (syntax.lhs->kind == SyntaxKind::Record) {
    image_syntax = syntax.lhs->args;
  } else {
    image_syntax.push_back(syntax.lhs);
  }
  auto link = make_binding(BindingKind::Link, scope, seed->domain, mark);
  for (const auto& item : image_syntax) {
    BindingPtr origin = bind_scalar(item, scope);
    BindingPtr target = bind_scalar(item, seed);
    DomainPtr domain = coerce(origin->domain, target->domain);
    if (!domain || !is_scalar_domain(domain)) {
      throw Error("cannot coerce origin and target columns to a common type", mark_of(*item));
    }
    if (domain->kind() == DomainKind::Untyped) domain = Domain::text();
    link->images.emplace_back(cast_binding(origin, domain), cast_binding(target, domain));
  }
  link->seed = seed;
  link->title = seed->title;
  return link;
}

BindingPtr Binder::bind_operator(const Syntax& syntax, const BindingPtr& scope) {
  const std::string& op = syntax.text;
  Mark mark = mark_of(syntax);
  std::string title = syntax_to_string(syntax);

  if ((op == "=" || op == "!=") && syntax.rhs->kind == SyntaxKind::Record) {
    std::vector<BindingPtr> operands{bind_value(syntax.lhs, scope)};
    for (const auto& item : syntax.rhs->args) {
      operands.push_back(bind_value(item, scope));
    }
    DomainPtr domain = coerce_operands(operands, mark);
    return make_formula(Signature::polar(SignatureKind::IsIn, op == "=" ? 1 : -1),
                        cast_all(operands, domain), Domain::boolean(), scope, mark, title);
  }

  BindingPtr lhs = bind_value(syntax.lhs, scope);
  BindingPtr rhs = bind_value(syntax.rhs, scope);

  if (op == "&" || op == "|") {
    std::vector<BindingPtr> args{cast_binding(lhs, Domain::boolean()),
                                 cast_binding(rhs, Domain::boolean())};
    return make_formula(Signature::make(op == "&" ? SignatureKind::And : SignatureKind::Or),
                        std::move(args), Domain::boolean(), scope, mark, title);
  }
  if (op == "=" || op == "!=" || op == "==" || op == "!==") {
    DomainPtr domain = coerce_operands({lhs, rhs}, mark);
    int polarity = op[0] == '!' ? -1 : 1;
    SignatureKind kind =
        op.size() == 1 || op == "!=" ? SignatureKind::IsEqual : SignatureKind::IsTotallyEqual;
    return make_formula(Signature::polar(kind, polarity), cast_all({lhs, rhs}, domain),
                        Domain::boolean(), scope, mark, title);
  }
  if (op == "~" || op == "!~") {
    std::vector<BindingPtr> args{cast_binding(lhs, Domain::text()), cast_binding(rhs, Domain::text())};
    return make_formula(Signature::polar(SignatureKind::Like, op == "~" ? 1 : -1), std::move(args),
                        Domain::boolean(), scope, mark, title);
  }
  if (op == "<" || op == "<=" || op == ">" || op == ">=") {
    DomainPtr domain = coerce_operands({lhs, rhs}, mark);
    if (!is_comparable(domain)) {
      throw Error("values of type " + domain->to_string() + " are not comparable", mark);
    }
    return make_formula(Signature::compare(op), cast_all({lhs, rhs}, domain), Domain::boolean(),
                        scope, mark, title);
  }

  // Arithmetic: + - * /
  DomainPtr domain = coerce(lhs->domain, rhs->domain);
  if (domain && domain->kind() == DomainKind::Untyped) domain = Domain::text();
  if (!domain || !(domain->is_numeric() || (op == "+" && domain->kind() == DomainKind::Text))) {
    throw Error("cannot apply operator '" + op + "' to values of type " +
                    lhs->domain->to_string() + " and " + rhs->domain->to_string(),
                mark);
  }
  if (domain->kind() == DomainKind::Text) {
    return make_formula(Signature::make(SignatureKind::Concat), cast_all({lhs, rhs}, domain),
                        domain, scope, mark, title);
  }
  if (op == "/" && domain->kind() == DomainKind::Integer) {
    domain = Domain::decimal();
  }
  SignatureKind kind = op == "+"   ? SignatureKind::Add
                       : op == "-" ? SignatureKind::Subtract
                       : op == "*" ? SignatureKind::Multiply
                                   : SignatureKind::Divide;
  return make_formula(Signature::make(kind), cast_all({lhs, rhs}, domain), domain, scope, mark,
                      title);
}

BindingPtr Binder::bind_prefix(const Syntax& syntax, const BindingPtr& scope) {
  Mark mark = mark_of(syntax);
  BindingPtr operand = bind_value(syntax.lhs, scope);
  if (syntax.text == "!") {
    return make_formula(Signature::make(SignatureKind::Not),
                        {cast_binding(operand, Domain::boolean())}, Domain::boolean(), scope, mark,
                        syntax_to_string(syntax));
  }
  if (!operand->domain->is_numeric()) {
    throw Error("expected a numeric operand for '" + syntax.text + "'", mark,
                "got a value of type " + operand->domain->to_string());
  }
  if (syntax.text == "+") return operand;
  return make_formula(Signature::make(SignatureKind::Negate), {operand}, operand->domain, scope,
                      mark, syntax_to_string(syntax));
}

BindingPtr Binder::bind_selection(const BindingPtr& base, const std::vector<SyntaxPtr>& args,
                                  const Mark& mark) {
  BindingPtr scope = base;
  BindingPtr flow = base->kind == BindingKind::Selection ? base->base : base;
  std::vector<BindingPtr> elements;
  std::vector<BindingPtr> orders;
  for (const auto& arg : args) {
    const Syntax& item = strip_direction(*arg);
    if (item.kind == SyntaxKind::Wildcard) {
      for (const auto& element : expand_scope(scope, mark_of(item))) {
        elements.push_back(element);
      }
      continue;
    }
    if (item.kind == SyntaxKind::Compose && item.rhs->kind == SyntaxKind::Wildcard) {
      BindingPtr owner = bind_flow(item.lhs, scope);
      for (const auto& element : expand_scope(owner, mark_of(item))) {
        elements.push_back(element);
      }
      continue;
    }
    BindingPtr element = bind_value(arg, scope);
    if (element->kind == BindingKind::Direction) {
      orders.push_back(element);
      element = element->base;
    }
    if (is_flow(*element)) {
      throw Error("expected a scalar expression", element->mark, "nested segments are not supported");
    }
    if (!is_scalar_domain(element->domain) && element->domain->kind() != DomainKind::Untyped) {
      throw Error("expected a scalar expression", element->mark);
    }
    auto titled = std::make_shared<Binding>(*finalize_binding(element));
    titled->title = syntax_to_string(item);
    elements.push_back(titled);
  }
  if (!orders.empty()) {
    auto sort = make_binding(BindingKind::Sort, flow, flow->domain, mark);
    sort->elements = std::move(orders);
    sort->title = flow->title;
    flow = sort;
  }
  std::vector<DomainField> fields;
  for (const auto& element : elements) {
    fields.push_back(DomainField{element->title, element->domain});
  }
  auto selection = make_binding(BindingKind::Selection, flow, Domain::record(std::move(fields)), mark);
  selection->elements = std::move(elements);
  selection->title = flow->title;
  return selection;
}

BindingPtr Binder::bind_sort(const BindingPtr& scope, const std::vector<SyntaxPtr>& args,
                             const Mark& mark) {
  BindingPtr flow = scope->kind == BindingKind::Selection ? scope->base : scope;
  std::vector<BindingPtr> orders;
  for (const auto& arg : args) {
    BindingPtr order = bind_value(arg, flow);
    BindingPtr value = order->kind == BindingKind::Direction ? order->base : order;
    BindingPtr final_value = finalize_binding(value);
    if (!is_scalar_domain(final_value->domain)) {
      throw Error("expected a scalar expression", value->mark);
    }
    if (final_value != value) {
      auto direction = make_binding(BindingKind::Direction, final_value, final_value->domain,
                                    order->mark);
      direction->direction = order->kind == BindingKind::Direction ? order->direction : 0;
      order = direction;
    }
    orders.push_back(order);
  }
  return wrap_base(scope, [&](const BindingPtr& inner) {
    auto sort = make_binding(BindingKind::Sort, inner, inner->domain, mark);
    sort->elements = orders;
    sort->title = inner->title;
    return BindingPtr(sort);
  });
}

BindingPtr Binder::bind_limit(const BindingPtr& scope, const std::vector<SyntaxPtr>& args,
                              const Mark& mark) {
  std::vector<int64_t> values;
  for (const auto& arg : args) {
    if (arg->kind != SyntaxKind::Integer) {
      throw Error("expected a non-negative integer", mark_of(*arg));
    }
    Integer number(arg->text.c_str());
    if (number > Integer(INT64_MAX)) {
      throw Error("expected a non-negative integer", mark_of(*arg), "the value is too large");
    }
    values.push_back(static_cast<int64_t>(number));
  }
  return wrap_base(scope, [&](const BindingPtr& inner) {
    auto sort = make_binding(BindingKind::Sort, inner, inner->domain, mark);
    sort->limit = values[0];
    if (values.size() > 1) sort->offset = values[1];
    sort->title = inner->title;
    return BindingPtr(sort);
  });
}

BindingPtr Binder::bind_aggregate(const Syntax& syntax, const BindingPtr& scope, SignatureKind kind) {
  Mark mark = mark_of(syntax);
  std::string title = syntax_to_string(syntax);
  BindingPtr operand = bind_value(syntax.args[0], scope);
  switch (kind) {
    case SignatureKind::Count:
      return make_formula(Signature::make(kind), {cast_binding(operand, Domain::boolean())},
                          Domain::integer(), scope, mark, title);
    case SignatureKind::Sum:
    case SignatureKind::Avg: {
      if (!operand->domain->is_numeric()) {
        throw Error("expected a numeric argument", operand->mark,
                    "got a value of type " + operand->domain->to_string());
      }
      DomainPtr domain = operand->domain;
      if (kind == SignatureKind::Avg && domain->kind() == DomainKind::Integer) {
        domain = Domain::decimal();
        operand = cast_binding(operand, domain);
      }
      return make_formula(Signature::make(kind), {operand}, domain, scope, mark, title);
    }
    case SignatureKind::Min:
    case SignatureKind::Max: {
      operand = finalize_binding(operand);
      if (!is_comparable(operand->domain)) {
        throw Error("values of type " + operand->domain->to_string() + " are not comparable",
                    operand->mark);
      }
      return make_formula(Signature::make(kind), {operand}, operand->domain, scope, mark, title);
    }
    default:
      break;
  }
  internal_check(false, "unexpected aggregate kind");
  return nullptr;
}

BindingPtr Binder::bind_function(const Syntax& syntax, const BindingPtr& scope) {
  Mark mark = mark_of(syntax);
  std::string name = normalize_name(syntax.text);
  std::string title = syntax_to_string(syntax);
  const size_t any = static_cast<size_t>(-1);

  if (name == "filter") {
    expect_arity(syntax, 1, 1, mark);
    return wrap_base(scope, [&](const BindingPtr& inner) {
      auto sieve = make_binding(BindingKind::Sieve, inner, inner->domain, mark);
      sieve->filter = cast_binding(bind_value(syntax.args[0], inner), Domain::boolean());
      sieve->title = inner->title;
      return BindingPtr(sieve);
    });
  }
  if (name == "sort") {
    expect_arity(syntax, 1, any, mark);
    return bind_sort(scope, syntax.args, mark);
  }
  if (name == "limit") {
    expect_arity(syntax, 1, 2, mark);
    return bind_limit(scope, syntax.args, mark);
  }
  if (name == "select") {
    return bind_selection(scope, syntax.args, mark);
  }
  if (name == "count") {
    expect_arity(syntax, 1, 1, mark);
    return bind_aggregate(syntax, scope, SignatureKind::Count);
  }
  if (name == "sum" || name == "avg" || name == "min" || name == "max") {
    expect_arity(syntax, 1, 1, mark);
    SignatureKind kind = name == "sum"   ? SignatureKind::Sum
                         : name == "avg" ? SignatureKind::Avg
                         : name == "min" ? SignatureKind::Min
                                         : SignatureKind::Max;
    return bind_aggregate(syntax, scope, kind);
  }
  if (name == "exists" || name == "every") {
    expect_arity(syntax, 1, 1, mark);
    BindingPtr operand = cast_binding(bind_value(syntax.args[0], scope), Domain::boolean());
    return make_formula(Signature::polar(SignatureKind::Exists, name == "exists" ? 1 : -1),
                        {operand}, Domain::boolean(), scope, mark, title);
  }
  if (name == "is_null") {
    expect_arity(syntax, 1, 1, mark);
    BindingPtr operand = finalize_binding(bind_scalar(syntax.args[0], scope));
    return make_formula(Signature::polar(SignatureKind::IsNull, 1), {operand}, Domain::boolean(),
                        scope, mark, title);
  }
  if (name == "if_null" || name == "null_if") {
    expect_arity(syntax, 2, any, mark);
    std::vector<BindingPtr> operands;
    for (const auto& arg : syntax.args) {
      operands.push_back(bind_scalar(arg, scope));
    }
    DomainPtr domain = coerce_operands(operands, mark);
    SignatureKind kind = name == "if_null" ? SignatureKind::IfNull : SignatureKind::NullIf;
    return make_formula(Signature::make(kind), cast_all(operands, domain), domain, scope, mark,
                        title);
  }
  if (name == "null") {
    expect_arity(syntax, 0, 0, mark);
    return make_literal(Value(), Domain::untyped(), mark, title);
  }
  if (name == "true" || name == "false") {
    expect_arity(syntax, 0, 0, mark);
    return make_literal(Value::boolean(name == "true"), Domain::boolean(), mark, title);
  }
  if (name == "fork") {
    if (!is_flow(*scope) || !scope_table(scope)) {
      throw Error("expected a table scope", mark);
    }
    auto fork = make_binding(BindingKind::Fork, scope, scope->domain, mark);
    for (const auto& arg : syntax.args) {
      fork->elements.push_back(finalize_binding(bind_scalar(arg, scope)));
    }
    fork->title = scope->title;
    return fork;
  }
  if (name == "moniker") {
    expect_arity(syntax, 1, 1, mark);
    BindingPtr seed = bind_flow(syntax.args[0], scope);
    auto cover = make_binding(BindingKind::Cover, scope, seed->domain, mark);
    cover->seed = seed;
    cover->title = seed->title;
    return cover;
  }
  if (DomainPtr target = cast_target(name)) {
    expect_arity(syntax, 1, 1, mark);
    BindingPtr operand = bind_value(syntax.args[0], scope);
    if (!is_scalar_domain(operand->domain) && target->kind() != DomainKind::Boolean &&
        operand->domain->kind() != DomainKind::Untyped) {
      throw Error("cannot convert a value of type " + operand->domain->to_string() + " to " +
                      target->to_string(),
                  mark);
    }
    BindingPtr cast = cast_binding(operand, target);
    if (cast == operand) return operand;
    auto titled = std::make_shared<Binding>(*cast);
    titled->title = title;
    titled->mark = mark;
    return titled;
  }
  throw Error("unable to find function '" + syntax.text + "'", mark);
}

BindingPtr Binder::bind_query(const QuerySyntax& query, const std::optional<int64_t>& limit) {
  if (!query.flow) return nullptr;
  BindingPtr binding = bind_value(query.flow, root_);
  Mark mark = mark_of(*query.flow);

  auto limited = [&](const BindingPtr& base) -> BindingPtr {
    if (!limit) return base;
    auto sort = make_binding(BindingKind::Sort, base, base->domain, base->mark);
    sort->limit = *limit;
    sort->title = base->title;
    return sort;
  };

  BindingPtr seed;
  if (binding->kind == BindingKind::Selection) {
    auto selection = std::make_shared<Binding>(*binding);
    selection->base = limited(binding->base);
    seed = selection;
  } else if (is_flow(*binding) || (binding->kind == BindingKind::Column && binding->link)) {
    BindingPtr base = limited(binding->kind == BindingKind::Column ? binding->link : binding);
    auto selection = make_binding(BindingKind::Selection, base, nullptr, mark);
    selection->elements = expand_scope(base, mark);
    std::vector<DomainField> fields;
    for (const auto& element : selection->elements) {
      fields.push_back(DomainField{element->title, element->domain});
    }
    selection->domain = Domain::record(std::move(fields));
    selection->title = base->title;
    seed = selection;
  } else {
    auto scalar = std::make_shared<Binding>(*finalize_binding(binding));
    scalar->title = syntax_to_string(*query.flow);
    seed = scalar;
  }

  auto collect = make_binding(BindingKind::Collect, root_, seed->domain, mark);
  collect->seed = seed;
  collect->title = seed->title;
  return collect;
}

}  // namespace navsql
