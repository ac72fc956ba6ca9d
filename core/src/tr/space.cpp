#include "space.h"

#include <algorithm>
#include <functional>
#include <sstream>

namespace navsql {

namespace {

size_t mix(size_t seed, size_t value) {
  return seed ^ (value + 0x9e3779b9 + (seed << 6) + (seed >> 2));
}

size_t hash_space(const SpacePtr& space) { return space ? space->hash_value : 0x51ed; }
size_t hash_code(const CodePtr& code) { return code ? code->hash_value : 0xc0de; }

size_t hash_codes(size_t seed, const std::vector<CodePtr>& codes) {
  seed = mix(seed, codes.size());
  for (const auto& code : codes) seed = mix(seed, hash_code(code));
  return seed;
}

bool same_codes(const std::vector<CodePtr>& left, const std::vector<CodePtr>& right) {
  if (left.size() != right.size()) return false;
  for (size_t i = 0; i < left.size(); ++i) {
    if (!same_code(left[i], right[i])) return false;
  }
  return true;
}

/// Compares the kind-specific fields of two spaces without looking at their bases.
bool same_basis(const Space& left, const Space& right) {
  if (left.kind != right.kind) return false;
  switch (left.kind) {
    case SpaceKind::Root:
    case SpaceKind::Scalar:
    case SpaceKind::Complement:
      return true;
    case SpaceKind::DirectTable:
      return left.table == right.table;
    case SpaceKind::FiberTable:
      return left.join == right.join;
    case SpaceKind::Quotient:
    case SpaceKind::Forked:
      return same_space(left.seed, right.seed) && same_codes(left.kernels, right.kernels);
    case SpaceKind::Moniker:
      return same_space(left.seed, right.seed);
    case SpaceKind::Linked:
      if (!same_space(left.seed, right.seed)) return false;
      if (left.images.size() != right.images.size()) return false;
      for (size_t i = 0; i < left.images.size(); ++i) {
        if (!same_code(left.images[i].first, right.images[i].first)) return false;
        if (!same_code(left.images[i].second, right.images[i].second)) return false;
      }
      return true;
    case SpaceKind::Filtered:
      return same_code(left.filter, right.filter);
    case SpaceKind::Ordered:
      if (left.limit != right.limit || left.offset != right.offset) return false;
      if (left.order.size() != right.order.size()) return false;
      for (size_t i = 0; i < left.order.size(); ++i) {
        if (left.order[i].second != right.order[i].second) return false;
        if (!same_code(left.order[i].first, right.order[i].first)) return false;
      }
      return true;
  }
  return false;
}

size_t basis_hash(const Space& space) {
  size_t seed = static_cast<size_t>(space.kind) * 7919u;
  switch (space.kind) {
    case SpaceKind::Root:
    case SpaceKind::Scalar:
    case SpaceKind::Complement:
      break;
    case SpaceKind::DirectTable:
      seed = mix(seed, hash_table(space.table));
      break;
    case SpaceKind::FiberTable:
      seed = mix(seed, space.join->hash());
      break;
    case SpaceKind::Quotient:
    case SpaceKind::Forked:
      seed = mix(seed, hash_space(space.seed));
      seed = hash_codes(seed, space.kernels);
      break;
    case SpaceKind::Moniker:
      seed = mix(seed, hash_space(space.seed));
      break;
    case SpaceKind::Linked:
      seed = mix(seed, hash_space(space.seed));
      for (const auto& image : space.images) {
        seed = mix(seed, hash_code(image.first));
        seed = mix(seed, hash_code(image.second));
      }
      break;
    case SpaceKind::Filtered:
      seed = mix(seed, hash_code(space.filter));
      break;
    case SpaceKind::Ordered:
      for (const auto& item : space.order) {
        seed = mix(seed, hash_code(item.first));
        seed = mix(seed, static_cast<size_t>(item.second + 2));
      }
      seed = mix(seed, space.limit ? static_cast<size_t>(*space.limit) : 0x11u);
      seed = mix(seed, space.offset ? static_cast<size_t>(*space.offset) : 0x13u);
      break;
  }
  return seed;
}

/// Walks from the seed toward the root until the base spans the parent of the ground.
SpacePtr find_ground(const SpacePtr& base, const SpacePtr& seed) {
  SpacePtr ground = seed;
  while (ground->base && !spans(base, ground->base)) {
    ground = ground->base;
  }
  return ground;
}

SpacePtr first_axis(SpacePtr space) {
  while (!space->is_axis) space = space->base;
  return space;
}

void append_unique(std::vector<CodePtr>& units, const CodePtr& unit) {
  for (const auto& existing : units) {
    if (same_code(existing, unit)) return;
  }
  units.push_back(unit);
}

void collect_units(const CodePtr& code, std::vector<CodePtr>& units) {
  if (!code) return;
  if (code->is_unit()) {
    append_unique(units, code);
    return;
  }
  for (const auto& unit : code->nested_units) append_unique(units, unit);
}

std::string join_codes(const std::vector<CodePtr>& codes) {
  std::string out;
  for (size_t i = 0; i < codes.size(); ++i) {
    if (i > 0) out += ", ";
    out += code_to_string(codes[i]);
  }
  return out;
}

}  // namespace

SpacePtr build_space(Space parts) {
  const SpacePtr& base = parts.base;
  switch (parts.kind) {
    case SpaceKind::Root:
      internal_check(!base, "the root space has no base");
      parts.is_axis = true;
      parts.is_root = true;
      parts.family = Family{};
      break;
    case SpaceKind::Scalar:
      internal_check(base != nullptr, "a scalar space needs a base");
      parts.is_axis = true;
      parts.is_contracting = true;
      parts.is_expanding = true;
      parts.family = Family{};
      break;
    case SpaceKind::DirectTable:
      internal_check(base && base->family.kind == FamilyKind::Scalar,
                     "a table is attached to a scalar space");
      internal_check(parts.table != nullptr, "a table space needs a table");
      parts.is_axis = true;
      parts.family.kind = FamilyKind::Table;
      parts.family.table = parts.table;
      break;
    case SpaceKind::FiberTable:
      internal_check(base && parts.join, "a fiber space needs a base and a join");
      internal_check(base->family.kind == FamilyKind::Table &&
                         base->family.table == parts.join->origin,
                     "a fiber join starts from the base table");
      parts.is_axis = true;
      parts.table = parts.join->target;
      parts.is_contracting = parts.join->is_contracting;
      parts.is_expanding = parts.join->is_expanding;
      parts.family.kind = FamilyKind::Table;
      parts.family.table = parts.join->target;
      break;
    case SpaceKind::Quotient:
      internal_check(base && parts.seed, "a quotient needs a base and a seed");
      internal_check(spans(parts.seed, base) && !spans(base, parts.seed),
                     "a quotient seed is plural relative to its base");
      parts.is_axis = true;
      parts.ground = find_ground(base, parts.seed);
      parts.is_contracting = parts.kernels.empty();
      parts.is_expanding = base->is_root && parts.kernels.empty();
      parts.family.kind = FamilyKind::Quotient;
      parts.family.seed = parts.seed;
      parts.family.ground = parts.ground;
      parts.family.kernels = parts.kernels;
      break;
    case SpaceKind::Complement:
      internal_check(base && base->family.kind == FamilyKind::Quotient,
                     "a complement is attached to a quotient");
      parts.is_axis = true;
      parts.seed = base->family.seed;
      parts.ground = base->family.ground;
      parts.kernels = base->family.kernels;
      parts.is_contracting = false;
      parts.is_expanding = true;
      parts.family = parts.seed->family;
      break;
    case SpaceKind::Moniker:
      internal_check(base && parts.seed && spans(parts.seed, base),
                     "a moniker seed spans its base");
      parts.is_axis = true;
      parts.ground = first_axis(parts.seed);
      if (!spans(base, parts.ground)) {
        parts.ground = find_ground(base, parts.ground);
      }
      parts.is_contracting = spans(base, parts.seed);
      parts.is_expanding = dominates(parts.seed, base);
      parts.family = parts.seed->family;
      break;
    case SpaceKind::Forked:
      internal_check(base && parts.seed && spans(base, parts.seed) && spans(parts.seed, base),
                     "a fork seed conforms to its base");
      parts.is_axis = true;
      parts.ground = first_axis(parts.seed);
      parts.is_contracting = parts.ground->is_contracting;
      parts.is_expanding = parts.kernels.empty() && dominates(parts.seed, base);
      parts.family = base->family;
      break;
    case SpaceKind::Linked:
      internal_check(base && parts.seed, "a link needs a base and a seed");
      internal_check(spans(parts.seed, base) && !spans(base, parts.seed),
                     "a link seed is plural relative to its base");
      parts.is_axis = true;
      parts.ground = find_ground(base, parts.seed);
      parts.family = parts.seed->family;
      break;
    case SpaceKind::Filtered:
      internal_check(base && parts.filter, "a filter needs a base and a condition");
      parts.is_contracting = true;
      parts.family = base->family;
      break;
    case SpaceKind::Ordered:
      internal_check(base != nullptr, "an ordering needs a base");
      parts.is_contracting = true;
      parts.is_expanding = !parts.limit && !parts.offset;
      parts.is_commutative = !parts.limit && !parts.offset;
      parts.family = base->family;
      break;
  }
  parts.is_inflated = parts.is_root || (base && base->is_inflated && parts.is_axis);
  parts.hash_value = mix(basis_hash(parts), hash_space(base));
  return std::make_shared<const Space>(std::move(parts));
}

SpacePtr make_root(const Mark& mark) {
  Space parts;
  parts.kind = SpaceKind::Root;
  parts.mark = mark;
  return build_space(std::move(parts));
}

SpacePtr make_scalar(SpacePtr base, const Mark& mark) {
  Space parts;
  parts.kind = SpaceKind::Scalar;
  parts.base = std::move(base);
  parts.mark = mark;
  return build_space(std::move(parts));
}

SpacePtr make_direct_table(SpacePtr base, const Table& table, const Mark& mark) {
  Space parts;
  parts.kind = SpaceKind::DirectTable;
  parts.base = std::move(base);
  parts.table = &table;
  parts.mark = mark;
  return build_space(std::move(parts));
}

SpacePtr make_fiber_table(SpacePtr base, const Join& join, const Mark& mark) {
  Space parts;
  parts.kind = SpaceKind::FiberTable;
  parts.base = std::move(base);
  parts.join = join;
  parts.mark = mark;
  return build_space(std::move(parts));
}

SpacePtr make_quotient(SpacePtr base, SpacePtr seed, std::vector<CodePtr> kernels,
                       const Mark& mark, std::vector<CodePtr> companions) {
  Space parts;
  parts.kind = SpaceKind::Quotient;
  parts.base = std::move(base);
  parts.seed = std::move(seed);
  parts.kernels = std::move(kernels);
  parts.companions = std::move(companions);
  parts.mark = mark;
  return build_space(std::move(parts));
}

SpacePtr make_complement(SpacePtr base, const Mark& mark, std::vector<CodePtr> companions) {
  Space parts;
  parts.kind = SpaceKind::Complement;
  parts.base = std::move(base);
  parts.companions = std::move(companions);
  parts.mark = mark;
  return build_space(std::move(parts));
}

SpacePtr make_moniker(SpacePtr base, SpacePtr seed, const Mark& mark,
                      std::vector<CodePtr> companions) {
  Space parts;
  parts.kind = SpaceKind::Moniker;
  parts.base = std::move(base);
  parts.seed = std::move(seed);
  parts.companions = std::move(companions);
  parts.mark = mark;
  return build_space(std::move(parts));
}

SpacePtr make_forked(SpacePtr base, SpacePtr seed, std::vector<CodePtr> kernels,
                     const Mark& mark, std::vector<CodePtr> companions) {
  Space parts;
  parts.kind = SpaceKind::Forked;
  parts.base = std::move(base);
  parts.seed = std::move(seed);
  parts.kernels = std::move(kernels);
  parts.companions = std::move(companions);
  parts.mark = mark;
  return build_space(std::move(parts));
}

SpacePtr make_linked(SpacePtr base, SpacePtr seed, std::vector<Image> images,
                     const Mark& mark, std::vector<CodePtr> companions) {
  Space parts;
  parts.kind = SpaceKind::Linked;
  parts.base = std::move(base);
  parts.seed = std::move(seed);
  parts.images = std::move(images);
  parts.companions = std::move(companions);
  parts.mark = mark;
  return build_space(std::move(parts));
}

SpacePtr make_filtered(SpacePtr base, CodePtr filter, const Mark& mark) {
  Space parts;
  parts.kind = SpaceKind::Filtered;
  parts.base = std::move(base);
  parts.filter = std::move(filter);
  parts.mark = mark;
  return build_space(std::move(parts));
}

SpacePtr make_ordered(SpacePtr base, std::vector<OrderItem> order,
                      std::optional<int64_t> limit, std::optional<int64_t> offset,
                      const Mark& mark) {
  Space parts;
  parts.kind = SpaceKind::Ordered;
  parts.base = std::move(base);
  parts.order = std::move(order);
  parts.limit = limit;
  parts.offset = offset;
  parts.mark = mark;
  return build_space(std::move(parts));
}

SpacePtr space_with_base(const SpacePtr& space, SpacePtr base) {
  if (space->kind == SpaceKind::Root) return space;
  if (space->base == base) return space;
  Space parts = *space;
  parts.base = std::move(base);
  if (parts.kind == SpaceKind::Complement) {
    parts.seed.reset();
    parts.kernels.clear();
  }
  return build_space(std::move(parts));
}

SpacePtr space_with_companions(const SpacePtr& space, std::vector<CodePtr> companions) {
  Space parts = *space;
  parts.companions = std::move(companions);
  if (parts.kind == SpaceKind::Complement) {
    parts.seed.reset();
    parts.kernels.clear();
  }
  return build_space(std::move(parts));
}

CodePtr build_code(Code parts) {
  size_t seed = static_cast<size_t>(parts.kind) * 104729u;
  seed = mix(seed, parts.domain ? parts.domain->hash() : 0);
  switch (parts.kind) {
    case CodeKind::Literal:
      seed = mix(seed, parts.value.hash());
      break;
    case CodeKind::Parameter:
      seed = mix(seed, std::hash<std::string>()(parts.name));
      break;
    case CodeKind::Cast:
      internal_check(parts.base != nullptr, "a cast needs an operand");
      seed = mix(seed, hash_code(parts.base));
      collect_units(parts.base, parts.nested_units);
      break;
    case CodeKind::Formula:
      seed = mix(seed, parts.signature.hash());
      seed = hash_codes(seed, parts.args);
      for (const auto& arg : parts.args) collect_units(arg, parts.nested_units);
      break;
    case CodeKind::Correlation:
      // WHY: the correlated operand is evaluated by the enclosing frame, not the shoot.
      internal_check(parts.code != nullptr, "a correlation needs an operand");
      seed = mix(seed, hash_code(parts.code));
      break;
    case CodeKind::Column:
      internal_check(parts.column && parts.space, "a column unit needs a column and a space");
      seed = mix(seed, hash_column(parts.column));
      seed = mix(seed, hash_space(parts.space));
      break;
    case CodeKind::Scalar:
    case CodeKind::Kernel:
    case CodeKind::Covering:
      internal_check(parts.code && parts.space, "a unit needs an operand and a space");
      seed = mix(seed, hash_code(parts.code));
      seed = mix(seed, hash_space(parts.space));
      break;
    case CodeKind::Aggregate:
    case CodeKind::Correlated:
      internal_check(parts.code && parts.space && parts.plural_space,
                     "an aggregate unit needs an operand and two spaces");
      seed = mix(seed, hash_code(parts.code));
      seed = mix(seed, hash_space(parts.plural_space));
      seed = mix(seed, hash_space(parts.space));
      break;
  }
  parts.hash_value = seed;
  return std::make_shared<const Code>(std::move(parts));
}

CodePtr make_literal(Value value, DomainPtr domain, const Mark& mark) {
  Code parts;
  parts.kind = CodeKind::Literal;
  parts.value = std::move(value);
  parts.domain = std::move(domain);
  parts.mark = mark;
  return build_code(std::move(parts));
}

CodePtr make_parameter(std::string name, DomainPtr domain, const Mark& mark) {
  Code parts;
  parts.kind = CodeKind::Parameter;
  parts.name = std::move(name);
  parts.domain = std::move(domain);
  parts.mark = mark;
  return build_code(std::move(parts));
}

CodePtr make_cast(CodePtr base, DomainPtr domain, const Mark& mark) {
  Code parts;
  parts.kind = CodeKind::Cast;
  parts.base = std::move(base);
  parts.domain = std::move(domain);
  parts.mark = mark;
  return build_code(std::move(parts));
}

CodePtr make_formula(Signature signature, DomainPtr domain, std::vector<CodePtr> args,
                     const Mark& mark) {
  Code parts;
  parts.kind = CodeKind::Formula;
  parts.signature = std::move(signature);
  parts.domain = std::move(domain);
  parts.args = std::move(args);
  parts.mark = mark;
  return build_code(std::move(parts));
}

CodePtr make_correlation(CodePtr code) {
  Code parts;
  parts.kind = CodeKind::Correlation;
  parts.domain = code->domain;
  parts.mark = code->mark;
  parts.code = std::move(code);
  return build_code(std::move(parts));
}

CodePtr make_column_unit(const Column& column, SpacePtr space, const Mark& mark) {
  Code parts;
  parts.kind = CodeKind::Column;
  parts.column = &column;
  parts.domain = column.domain;
  parts.space = std::move(space);
  parts.mark = mark;
  return build_code(std::move(parts));
}

CodePtr make_scalar_unit(CodePtr code, SpacePtr space, const Mark& mark,
                         std::vector<CodePtr> companions) {
  Code parts;
  parts.kind = CodeKind::Scalar;
  parts.domain = code->domain;
  parts.code = std::move(code);
  parts.space = std::move(space);
  parts.companions = std::move(companions);
  parts.mark = mark;
  return build_code(std::move(parts));
}

CodePtr make_aggregate_unit(CodePtr code, SpacePtr plural_space, SpacePtr space,
                            const Mark& mark, std::vector<CodePtr> companions) {
  Code parts;
  parts.kind = CodeKind::Aggregate;
  parts.domain = code->domain;
  parts.code = std::move(code);
  parts.plural_space = std::move(plural_space);
  parts.space = std::move(space);
  parts.companions = std::move(companions);
  parts.mark = mark;
  return build_code(std::move(parts));
}

CodePtr make_correlated_unit(CodePtr code, SpacePtr plural_space, SpacePtr space,
                             const Mark& mark) {
  Code parts;
  parts.kind = CodeKind::Correlated;
  parts.domain = code->domain;
  parts.code = std::move(code);
  parts.plural_space = std::move(plural_space);
  parts.space = std::move(space);
  parts.mark = mark;
  return build_code(std::move(parts));
}

CodePtr make_kernel_unit(CodePtr code, SpacePtr space, const Mark& mark) {
  Code parts;
  parts.kind = CodeKind::Kernel;
  parts.domain = code->domain;
  parts.code = std::move(code);
  parts.space = std::move(space);
  parts.mark = mark;
  return build_code(std::move(parts));
}

CodePtr make_covering_unit(CodePtr code, SpacePtr space, const Mark& mark) {
  Code parts;
  parts.kind = CodeKind::Covering;
  parts.domain = code->domain;
  parts.code = std::move(code);
  parts.space = std::move(space);
  parts.mark = mark;
  return build_code(std::move(parts));
}

CodePtr unit_with_space(const CodePtr& unit, SpacePtr space) {
  internal_check(unit->is_unit(), "only units are re-spaced");
  if (unit->space == space) return unit;
  Code parts = *unit;
  parts.space = std::move(space);
  return build_code(std::move(parts));
}

CodePtr code_with_companions(const CodePtr& unit, std::vector<CodePtr> companions) {
  Code parts = *unit;
  parts.companions = std::move(companions);
  return build_code(std::move(parts));
}

std::vector<CodePtr> units_of(const CodePtr& code) {
  if (!code) return {};
  if (code->is_unit()) return {code};
  return code->nested_units;
}

bool same_space(const SpacePtr& left, const SpacePtr& right) {
  if (left == right) return true;
  if (!left || !right) return false;
  if (left->hash_value != right->hash_value) return false;
  return same_basis(*left, *right) && same_space(left->base, right->base);
}

bool same_code(const CodePtr& left, const CodePtr& right) {
  if (left == right) return true;
  if (!left || !right) return false;
  if (left->hash_value != right->hash_value) return false;
  if (left->kind != right->kind) return false;
  if (!same_domain(left->domain, right->domain)) return false;
  switch (left->kind) {
    case CodeKind::Literal:
      return left->value == right->value;
    case CodeKind::Parameter:
      return left->name == right->name;
    case CodeKind::Cast:
      return same_code(left->base, right->base);
    case CodeKind::Formula:
      return left->signature == right->signature && same_codes(left->args, right->args);
    case CodeKind::Correlation:
      return same_code(left->code, right->code);
    case CodeKind::Column:
      return left->column == right->column && same_space(left->space, right->space);
    case CodeKind::Scalar:
    case CodeKind::Kernel:
    case CodeKind::Covering:
      return same_code(left->code, right->code) && same_space(left->space, right->space);
    case CodeKind::Aggregate:
    case CodeKind::Correlated:
      return same_code(left->code, right->code) &&
             same_space(left->plural_space, right->plural_space) &&
             same_space(left->space, right->space);
  }
  return false;
}

std::vector<SpacePtr> unfold(const SpacePtr& space) {
  std::vector<SpacePtr> spaces;
  for (SpacePtr current = space; current; current = current->base) {
    spaces.push_back(current);
  }
  return spaces;
}

bool resembles(const SpacePtr& left, const SpacePtr& right) {
  return same_basis(*left, *right);
}

SpacePtr inflate(const SpacePtr& space) {
  if (space->is_inflated) return space;
  SpacePtr prefix = inflate(space->base);
  if (space->is_axis) return space_with_base(space, prefix);
  return prefix;
}

SpacePtr prune(const SpacePtr& space, const SpacePtr& other) {
  if (space->is_inflated) return space;
  std::vector<SpacePtr> mine = unfold(space);
  std::vector<SpacePtr> theirs = unfold(other);
  SpacePtr result;
  while (!mine.empty() && !theirs.empty()) {
    const SpacePtr& step = mine.back();
    if (resembles(step, theirs.back())) {
      if (!(step->is_commutative || same_space(step, theirs.back()))) return space;
      if (step->is_axis) result = space_with_base(step, result);
      mine.pop_back();
      theirs.pop_back();
    } else if (!theirs.back()->is_axis) {
      theirs.pop_back();
    } else if (!step->is_axis) {
      if (!step->is_commutative) return space;
      result = space_with_base(step, result);
      mine.pop_back();
    } else {
      break;
    }
  }
  while (!mine.empty()) {
    if (!mine.back()->is_commutative) return space;
    result = space_with_base(mine.back(), result);
    mine.pop_back();
  }
  return result;
}

bool spans(const SpacePtr& space, const SpacePtr& other) {
  if (same_space(space, other)) return true;
  std::vector<SpacePtr> mine;
  std::vector<SpacePtr> theirs;
  for (const auto& step : unfold(space)) {
    if (step->is_axis) mine.push_back(step);
  }
  for (const auto& step : unfold(other)) {
    if (step->is_axis) theirs.push_back(step);
  }
  while (!mine.empty() && !theirs.empty() && resembles(mine.back(), theirs.back())) {
    mine.pop_back();
    theirs.pop_back();
  }
  return std::all_of(theirs.begin(), theirs.end(),
                     [](const SpacePtr& step) { return step->is_contracting; });
}

bool dominates(const SpacePtr& space, const SpacePtr& other) {
  if (same_space(space, other)) return true;
  std::vector<SpacePtr> mine = unfold(space);
  std::vector<SpacePtr> theirs = unfold(other);
  while (!mine.empty() && !theirs.empty()) {
    if (resembles(mine.back(), theirs.back())) {
      mine.pop_back();
      theirs.pop_back();
    } else if (!theirs.back()->is_axis && theirs.back()->is_contracting) {
      theirs.pop_back();
    } else {
      break;
    }
  }
  for (const auto& step : mine) {
    if (!step->is_expanding) return false;
  }
  for (const auto& step : theirs) {
    if (!step->is_contracting) return false;
  }
  return true;
}

bool conforms(const SpacePtr& space, const SpacePtr& other) {
  if (same_space(space, other)) return true;
  return dominates(space, other) && dominates(other, space);
}

bool concludes(const SpacePtr& space, const SpacePtr& other) {
  for (SpacePtr current = space; current; current = current->base) {
    if (same_space(current, other)) return true;
  }
  return false;
}

std::string space_to_string(const SpacePtr& space) {
  if (!space) return "-";
  std::ostringstream oss;
  switch (space->kind) {
    case SpaceKind::Root:
      return "@";
    case SpaceKind::Scalar:
      oss << space_to_string(space->base) << ".@";
      break;
    case SpaceKind::DirectTable:
      oss << space_to_string(space->base) << "." << space->table->name();
      break;
    case SpaceKind::FiberTable:
      oss << space_to_string(space->base) << "."
          << (space->join->kind == Join::Kind::Direct ? "" : "~") << space->table->name();
      break;
    case SpaceKind::Quotient:
      oss << space_to_string(space->base) << ".(" << space_to_string(space->seed) << " ^ {"
          << join_codes(space->kernels) << "})";
      break;
    case SpaceKind::Complement:
      oss << space_to_string(space->base) << ".^";
      break;
    case SpaceKind::Moniker:
      oss << space_to_string(space->base) << ".moniker(" << space_to_string(space->seed) << ")";
      break;
    case SpaceKind::Forked:
      oss << space_to_string(space->base) << ".fork(" << join_codes(space->kernels) << ")";
      break;
    case SpaceKind::Linked: {
      oss << space_to_string(space->base) << ".(" << space_to_string(space->seed) << " -> {";
      for (size_t i = 0; i < space->images.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << code_to_string(space->images[i].first) << " = "
            << code_to_string(space->images[i].second);
      }
      oss << "})";
      break;
    }
    case SpaceKind::Filtered:
      oss << space_to_string(space->base) << " ? " << code_to_string(space->filter);
      break;
    case SpaceKind::Ordered:
      oss << space_to_string(space->base) << ".sort(";
      for (size_t i = 0; i < space->order.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << code_to_string(space->order[i].first)
            << (space->order[i].second < 0 ? "-" : "+");
      }
      oss << ")";
      if (space->limit) oss << ".limit(" << *space->limit;
      if (space->offset) oss << (space->limit ? ", " : ".skip(") << *space->offset;
      if (space->limit || space->offset) oss << ")";
      break;
  }
  return oss.str();
}

std::string code_to_string(const CodePtr& code) {
  if (!code) return "-";
  std::ostringstream oss;
  switch (code->kind) {
    case CodeKind::Literal:
      if (code->value.is_null()) return "null";
      if (code->value.kind() == Value::Kind::Text) return "'" + code->value.as_text() + "'";
      if (code->value.kind() == Value::Kind::Boolean) return code->value.as_bool() ? "true" : "false";
      return code->domain->dump(code->value);
    case CodeKind::Parameter:
      return "$" + code->name;
    case CodeKind::Cast:
      oss << code->domain->to_string() << "(" << code_to_string(code->base) << ")";
      break;
    case CodeKind::Formula:
      oss << code->signature.to_string() << "(" << join_codes(code->args) << ")";
      break;
    case CodeKind::Correlation:
      oss << "^" << code_to_string(code->code);
      break;
    case CodeKind::Column:
      oss << "(" << space_to_string(code->space) << ")." << code->column->name;
      break;
    case CodeKind::Scalar:
      oss << "scalar<" << code_to_string(code->code) << " @ " << space_to_string(code->space) << ">";
      break;
    case CodeKind::Aggregate:
      oss << "aggregate<" << code_to_string(code->code) << " @ "
          << space_to_string(code->plural_space) << " / " << space_to_string(code->space) << ">";
      break;
    case CodeKind::Correlated:
      oss << "correlated<" << code_to_string(code->code) << " @ "
          << space_to_string(code->plural_space) << " / " << space_to_string(code->space) << ">";
      break;
    case CodeKind::Kernel:
      oss << "kernel<" << code_to_string(code->code) << " @ " << space_to_string(code->space) << ">";
      break;
    case CodeKind::Covering:
      oss << "covering<" << code_to_string(code->code) << " @ " << space_to_string(code->space)
          << ">";
      break;
  }
  return oss.str();
}

}  // namespace navsql
