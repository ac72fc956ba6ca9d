#include "encode.h"

#include <sstream>
#include <stdexcept>

#include "bind/lookup.h"

namespace navsql {

namespace {

CodePtr boolean_literal(bool value, const Mark& mark) {
  return make_literal(Value::boolean(value), Domain::boolean(), mark);
}

CodePtr not_null(CodePtr code, const Mark& mark) {
  return make_formula(Signature::polar(SignatureKind::IsNull, -1), Domain::boolean(),
                      {std::move(code)}, mark);
}

bool is_text_like(DomainKind kind) { return kind == DomainKind::Text; }

Error conversion_error(const DomainPtr& from, const DomainPtr& to, const Mark& mark) {
  return Error("cannot convert a value of type " + from->to_string() + " to " + to->to_string(),
               mark);
}

/// Escapes LIKE metacharacters so that a literal pattern matches as a substring.
std::string contains_pattern(const std::string& text) {
  std::string out = "%";
  for (char c : text) {
    if (c == '\\' || c == '%' || c == '_') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('%');
  return out;
}

}  // namespace

SpacePtr Encoder::relate(const BindingPtr& binding) {
  auto it = spaces_.find(binding.get());
  if (it != spaces_.end()) return it->second;
  SpacePtr space = relate_node(binding);
  spaces_.emplace(binding.get(), space);
  return space;
}

CodePtr Encoder::encode(const BindingPtr& binding) {
  auto it = codes_.find(binding.get());
  if (it != codes_.end()) return it->second;
  CodePtr code = encode_node(binding);
  codes_.emplace(binding.get(), code);
  return code;
}

SpacePtr Encoder::relate_node(const BindingPtr& binding) {
  const Binding& node = *binding;
  switch (node.kind) {
    case BindingKind::Root:
      return make_root(node.mark);
    case BindingKind::Home:
      return make_scalar(relate(node.base), node.mark);
    case BindingKind::Table:
      return make_direct_table(relate(node.base), *node.table, node.mark);
    case BindingKind::Attach:
      return make_fiber_table(relate(node.base), *node.join, node.mark);
    case BindingKind::Column:
      if (node.link) return relate(node.link);
      break;
    case BindingKind::Sieve:
      return make_filtered(relate(node.base), encode(node.filter), node.mark);
    case BindingKind::Sort: {
      SpacePtr base = relate(node.base);
      std::vector<OrderItem> order;
      for (const auto& element : node.elements) {
        if (element->kind == BindingKind::Direction) {
          order.emplace_back(encode(element->base), element->direction < 0 ? -1 : 1);
        } else {
          order.emplace_back(encode(element), 1);
        }
      }
      return make_ordered(base, std::move(order), node.limit, node.offset, node.mark);
    }
    case BindingKind::Quotient: {
      SpacePtr base = relate(node.base);
      SpacePtr seed = relate(node.seed);
      if (spans(base, seed)) {
        throw Error("expected a plural expression", node.seed->mark);
      }
      if (!spans(seed, base)) {
        throw Error("expected a descendant expression", node.seed->mark);
      }
      std::vector<CodePtr> kernels;
      for (const auto& kernel : node.elements) {
        kernels.push_back(encode(kernel));
      }
      return make_quotient(base, seed, std::move(kernels), node.mark);
    }
    case BindingKind::Complement:
      return make_complement(relate(node.base), node.mark);
    case BindingKind::Cover:
      return make_moniker(relate(node.base), relate(node.seed), node.mark);
    case BindingKind::Fork: {
      SpacePtr base = relate(node.base);
      std::vector<CodePtr> kernels;
      for (const auto& kernel : node.elements) {
        kernels.push_back(encode(kernel));
      }
      // The seed starts as the base; the rewriter may narrow it later.
      return make_forked(base, base, std::move(kernels), node.mark);
    }
    case BindingKind::Link: {
      SpacePtr base = relate(node.base);
      SpacePtr seed = relate(node.seed);
      std::vector<Image> images;
      for (const auto& image : node.images) {
        images.emplace_back(encode(image.first), encode(image.second));
      }
      return make_linked(base, seed, std::move(images), node.mark);
    }
    case BindingKind::Ambiguous:
      throw ambiguous_error(node);
    default:
      break;
  }
  if (!node.base) {
    throw Error("expected a flow expression", node.mark);
  }
  return relate(node.base);
}

CodePtr Encoder::encode_node(const BindingPtr& binding) {
  const Binding& node = *binding;
  switch (node.kind) {
    case BindingKind::Column:
      return make_column_unit(*node.column, relate(node.base), node.mark);
    case BindingKind::Kernel: {
      SpacePtr space = relate(node.base);
      internal_check(node.index < space->family.kernels.size(), "kernel index out of range");
      return make_kernel_unit(space->family.kernels[node.index], space, node.mark);
    }
    case BindingKind::Literal:
      return make_literal(node.value, node.domain, node.mark);
    case BindingKind::Parameter:
      return make_parameter(node.name, node.domain, node.mark);
    case BindingKind::Cast:
      return convert(binding);
    case BindingKind::Rescoping:
      return make_scalar_unit(encode(node.base), relate(node.scope), node.mark);
    case BindingKind::Formula:
      return encode_formula(binding);
    case BindingKind::Direction:
      return encode(node.base);
    case BindingKind::Ambiguous:
      throw ambiguous_error(node);
    default:
      break;
  }
  throw Error("expected a scalar expression", node.mark);
}

CodePtr Encoder::convert(const BindingPtr& binding) {
  const BindingPtr& base = binding->base;
  const DomainPtr& target = binding->domain;
  const DomainPtr& source = base->domain;
  const Mark& mark = binding->mark;

  if (source->kind() == DomainKind::Untyped) {
    return convert_untyped(binding);
  }
  if (same_domain(source, target)) {
    return encode(base);
  }
  switch (target->kind()) {
    case DomainKind::Boolean:
      switch (source->kind()) {
        case DomainKind::Entity:
        case DomainKind::Record: {
          CodePtr unit = make_scalar_unit(boolean_literal(true, mark), relate(base), mark);
          return not_null(unit, mark);
        }
        case DomainKind::Text: {
          CodePtr code = encode(base);
          CodePtr empty = make_literal(Value::text(""), source, mark);
          code = make_formula(Signature::make(SignatureKind::NullIf), source, {code, empty}, mark);
          return not_null(code, mark);
        }
        case DomainKind::Integer:
        case DomainKind::Float:
        case DomainKind::Decimal:
        case DomainKind::Enum:
        case DomainKind::Date:
        case DomainKind::Time:
        case DomainKind::DateTime:
        case DomainKind::Opaque:
          return not_null(encode(base), mark);
        default:
          break;
      }
      break;
    case DomainKind::Text:
      switch (source->kind()) {
        case DomainKind::Boolean:
        case DomainKind::Integer:
        case DomainKind::Float:
        case DomainKind::Decimal:
        case DomainKind::Enum:
        case DomainKind::Date:
        case DomainKind::Time:
        case DomainKind::DateTime:
        case DomainKind::Opaque:
          return make_cast(encode(base), target, mark);
        default:
          break;
      }
      break;
    case DomainKind::Integer:
      if (source->kind() == DomainKind::Decimal || source->kind() == DomainKind::Float ||
          is_text_like(source->kind())) {
        return make_cast(encode(base), target, mark);
      }
      break;
    case DomainKind::Decimal:
      if (source->kind() == DomainKind::Integer || source->kind() == DomainKind::Float ||
          is_text_like(source->kind())) {
        CodePtr code = encode(base);
        if (code->kind == CodeKind::Literal && source->kind() == DomainKind::Integer) {
          if (code->value.is_null()) return make_literal(Value(), target, mark);
          return make_literal(target->parse(source->dump(code->value)), target, mark);
        }
        return make_cast(code, target, mark);
      }
      break;
    case DomainKind::Float:
      if (source->kind() == DomainKind::Integer || source->kind() == DomainKind::Decimal ||
          is_text_like(source->kind())) {
        CodePtr code = encode(base);
        if (code->kind == CodeKind::Literal && source->kind() != DomainKind::Text) {
          if (code->value.is_null()) return make_literal(Value(), target, mark);
          return make_literal(target->parse(source->dump(code->value)), target, mark);
        }
        return make_cast(code, target, mark);
      }
      break;
    case DomainKind::Date:
    case DomainKind::Time:
      if (is_text_like(source->kind()) || source->kind() == DomainKind::DateTime) {
        return make_cast(encode(base), target, mark);
      }
      break;
    case DomainKind::DateTime:
      if (is_text_like(source->kind()) || source->kind() == DomainKind::Date) {
        return make_cast(encode(base), target, mark);
      }
      break;
    default:
      break;
  }
  throw conversion_error(source, target, mark);
}

/// Gives an untyped literal or parameter the target domain, looking through the
/// scalar units that rescoping wrapped around it.
CodePtr Encoder::convert_untyped(const BindingPtr& binding) {
  const DomainPtr& target = binding->domain;
  CodePtr code = encode(binding->base);
  std::vector<CodePtr> wrappers;
  while (code->kind == CodeKind::Scalar) {
    wrappers.push_back(code);
    code = code->code;
  }
  if (code->kind == CodeKind::Parameter) {
    code = make_parameter(code->name, target, binding->mark);
  } else {
    internal_check(code->kind == CodeKind::Literal, "an untyped code must be a literal");
    if (code->value.is_null()) {
      code = make_literal(Value(), target, binding->mark);
    } else {
      const std::string& text = code->value.as_text();
      try {
        code = make_literal(target->parse(text), target, binding->mark);
      } catch (const std::invalid_argument& ex) {
        throw Error("cannot convert '" + text + "' to " + target->to_string(), binding->mark,
                    ex.what());
      }
    }
  }
  while (!wrappers.empty()) {
    const CodePtr& wrapper = wrappers.back();
    code = make_scalar_unit(code, wrapper->space, wrapper->mark);
    wrappers.pop_back();
  }
  return code;
}

CodePtr Encoder::encode_formula(const BindingPtr& binding) {
  const Binding& node = *binding;
  switch (node.signature.kind) {
    case SignatureKind::Like:
      return encode_contains(binding);
    case SignatureKind::Count: {
      CodePtr op = encode(node.elements[0]);
      CodePtr false_literal = make_literal(Value::boolean(false), op->domain, node.mark);
      op = make_formula(Signature::make(SignatureKind::NullIf), op->domain, {op, false_literal},
                        node.mark);
      CodePtr count =
          make_formula(Signature::make(SignatureKind::Count), node.domain, {op}, node.mark);
      return encode_aggregate(binding, count);
    }
    case SignatureKind::Sum:
    case SignatureKind::Avg:
    case SignatureKind::Min:
    case SignatureKind::Max: {
      CodePtr op = make_formula(node.signature, node.domain, {encode(node.elements[0])}, node.mark);
      return encode_aggregate(binding, op);
    }
    case SignatureKind::Exists:
      return encode_quantify(binding);
    default:
      break;
  }
  std::vector<CodePtr> args;
  args.reserve(node.elements.size());
  for (const auto& element : node.elements) {
    args.push_back(encode(element));
  }
  return make_formula(node.signature, node.domain, std::move(args), node.mark);
}

CodePtr Encoder::encode_contains(const BindingPtr& binding) {
  const Binding& node = *binding;
  const Mark& mark = node.mark;
  CodePtr lop = encode(node.elements[0]);
  CodePtr rop = encode(node.elements[1]);
  if (rop->kind == CodeKind::Literal) {
    if (!rop->value.is_null()) {
      rop = make_literal(Value::text(contains_pattern(rop->value.as_text())), rop->domain, mark);
    }
  } else {
    DomainPtr text = rop->domain;
    auto literal = [&](const char* value) { return make_literal(Value::text(value), text, mark); };
    Signature replace = Signature::make(SignatureKind::Replace);
    Signature concat = Signature::make(SignatureKind::Concat);
    rop = make_formula(replace, text, {rop, literal("\\"), literal("\\\\")}, mark);
    rop = make_formula(replace, text, {rop, literal("%"), literal("\\%")}, mark);
    rop = make_formula(replace, text, {rop, literal("_"), literal("\\_")}, mark);
    rop = make_formula(concat, text, {literal("%"), rop}, mark);
    rop = make_formula(concat, text, {rop, literal("%")}, mark);
  }
  return make_formula(node.signature, node.domain, {lop, rop}, mark);
}

/// Finds the space an aggregate reduces over: the dominating space among the
/// operand units that the current space does not span.
SpacePtr Encoder::plural_space(const CodePtr& op, const SpacePtr& space, const Mark& mark) {
  std::vector<SpacePtr> candidates;
  for (const auto& unit : units_of(op)) {
    if (spans(space, unit->space)) continue;
    bool covered = false;
    for (const auto& candidate : candidates) {
      if (dominates(candidate, unit->space)) covered = true;
    }
    if (covered) continue;
    std::vector<SpacePtr> kept;
    for (const auto& candidate : candidates) {
      if (!dominates(unit->space, candidate)) kept.push_back(candidate);
    }
    kept.push_back(unit->space);
    candidates = std::move(kept);
  }
  if (candidates.empty()) {
    throw Error("a plural operand is required", mark);
  }
  if (candidates.size() > 1) {
    throw Error("invalid plural operand", mark, "cannot deduce an unambiguous aggregate flow");
  }
  SpacePtr plural = candidates.front();
  if (spans(space, plural)) {
    throw Error("expected a plural operand", mark);
  }
  if (!spans(plural, space)) {
    throw Error("expected a descendant operand", mark);
  }
  return plural;
}

CodePtr Encoder::encode_aggregate(const BindingPtr& binding, const CodePtr& op) {
  const Mark& mark = binding->mark;
  SpacePtr space = relate(binding->base);
  SpacePtr plural = plural_space(op, space, binding->elements[0]->mark);
  CodePtr wrapper = make_aggregate_unit(op, plural, space, mark);
  SignatureKind kind = op->signature.kind;
  if (kind == SignatureKind::Count || kind == SignatureKind::Sum) {
    CodePtr zero = make_literal(wrapper->domain->parse("0"), wrapper->domain, mark);
    wrapper = make_formula(Signature::make(SignatureKind::IfNull), wrapper->domain, {wrapper, zero},
                           mark);
  }
  return make_scalar_unit(wrapper, space, mark);
}

CodePtr Encoder::encode_quantify(const BindingPtr& binding) {
  const Binding& node = *binding;
  const Mark& mark = node.mark;
  CodePtr op = encode(node.elements[0]);
  SpacePtr space = relate(node.base);
  SpacePtr plural = plural_space(op, space, node.elements[0]->mark);
  int polarity = node.signature.polarity;
  if (polarity < 0) {
    op = make_formula(Signature::make(SignatureKind::Not), op->domain, {op}, mark);
  }
  plural = make_filtered(plural, op, mark);
  CodePtr unit = make_correlated_unit(boolean_literal(true, mark), plural, space, mark);
  CodePtr wrapper =
      make_formula(Signature::polar(SignatureKind::Exists, 1), Domain::boolean(), {unit}, mark);
  if (polarity < 0) {
    wrapper = make_formula(Signature::make(SignatureKind::Not), Domain::boolean(), {wrapper}, mark);
  }
  return make_scalar_unit(wrapper, space, mark);
}

Segment Encoder::collect(const BindingPtr& binding) {
  internal_check(binding->kind == BindingKind::Collect, "collect expects a Collect binding");
  const Mark& mark = binding->mark;
  const BindingPtr& seed = binding->seed;
  Segment segment;
  segment.mark = mark;
  segment.root = relate(binding->base);

  CodePtr scalar;
  if (seed->kind == BindingKind::Selection) {
    segment.space = relate(seed);
    for (const auto& element : seed->elements) {
      segment.codes.push_back(encode(element));
    }
  } else {
    scalar = encode(seed);
    segment.codes.push_back(scalar);
    std::vector<SpacePtr> maximal;
    for (const auto& unit : units_of(scalar)) {
      bool covered = false;
      for (const auto& space : maximal) {
        if (dominates(space, unit->space)) covered = true;
      }
      if (covered) continue;
      std::vector<SpacePtr> kept;
      for (const auto& space : maximal) {
        if (!dominates(unit->space, space)) kept.push_back(space);
      }
      kept.push_back(unit->space);
      maximal = std::move(kept);
    }
    if (maximal.size() > 1) {
      throw Error("cannot deduce an unambiguous segment flow", mark);
    }
    segment.space = maximal.empty() ? segment.root : maximal.front();
  }

  if (!spans(segment.space, segment.root)) {
    throw Error("expected a descendant segment flow", mark);
  }

  if (scalar) {
    // A scalar segment produces no row when its value is NULL.
    if (scalar->kind == CodeKind::Literal && scalar->value.is_null()) {
      segment.space = make_filtered(segment.space, boolean_literal(false, mark), mark);
    } else if (scalar->kind != CodeKind::Literal) {
      segment.space = make_filtered(segment.space, not_null(scalar, mark), mark);
    }
  }

  for (const auto& code : segment.codes) {
    for (const auto& unit : units_of(code)) {
      if (!spans(segment.space, unit->space)) {
        throw Error("a singular expression is expected", unit->mark);
      }
    }
  }
  return segment;
}

std::string dump_segment(const Segment& segment) {
  std::ostringstream oss;
  oss << "segment " << space_to_string(segment.space) << "\n";
  for (const auto& code : segment.codes) {
    oss << "  " << code_to_string(code) << "\n";
  }
  return oss.str();
}

}  // namespace navsql
