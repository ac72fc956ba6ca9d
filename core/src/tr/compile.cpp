#include "compile.h"

#include <algorithm>

namespace navsql {

namespace {

bool same_or_null(const SpacePtr& left, const SpacePtr& right) {
  if (!left || !right) return !left && !right;
  return same_space(left, right);
}

SpacePtr inflated_ancestor(SpacePtr space) {
  while (!space->is_inflated) space = space->base;
  return space;
}

/// Builds `op IS NOT NULL` over every kernel, joined with AND.
CodePtr kernel_filter(const std::vector<CodePtr>& kernels, const Mark& mark) {
  std::vector<CodePtr> filters;
  for (const auto& kernel : kernels) {
    filters.push_back(make_formula(Signature::polar(SignatureKind::IsNull, -1), Domain::boolean(),
                                   {kernel}, kernel->mark));
  }
  if (filters.size() == 1) return filters.front();
  return make_formula(Signature::make(SignatureKind::And), Domain::boolean(), std::move(filters),
                      mark);
}

void route_spread(Routes& routes, const SpacePtr& space, const SpacePtr& backbone) {
  for (const auto& unit : spread(space)) {
    routes.set(unit, routes.at(unit_with_space(unit, backbone)));
  }
}

class BaselineScope {
 public:
  BaselineScope(SpacePtr& current, std::vector<SpacePtr>& stack, const SpacePtr& baseline)
      : current_(current), stack_(stack), active_(baseline != nullptr) {
    if (!active_) return;
    internal_check(baseline->is_inflated, "a baseline is an inflated space");
    stack_.push_back(current_);
    current_ = baseline;
  }
  ~BaselineScope() {
    if (!active_) return;
    current_ = stack_.back();
    stack_.pop_back();
  }
  BaselineScope(const BaselineScope&) = delete;
  BaselineScope& operator=(const BaselineScope&) = delete;

 private:
  SpacePtr& current_;
  std::vector<SpacePtr>& stack_;
  bool active_;
};

}  // namespace

Compiler::Compiler(SpacePtr root) : root_(std::move(root)), baseline_(root_) {}

TermPtr Compiler::compile_segment(const Segment& segment) {
  // The root dominates every chain, so the trunk is the flow itself.
  TermPtr trunk = compile(segment.space, root_);

  std::vector<OrderItem> order;
  for (const SpacePtr& space : {segment.root, segment.space}) {
    for (const auto& item : arrange(space)) {
      bool duplicate = std::any_of(order.begin(), order.end(), [&](const OrderItem& kept) {
        return same_code(kept.first, item.first);
      });
      if (!duplicate) order.push_back(item);
    }
  }
  std::vector<CodePtr> codes = segment.codes;
  for (const auto& item : order) codes.push_back(item.first);

  TermPtr kid = inject(trunk, codes);
  if (!order.empty()) {
    kid = make_order_term(next_tag(), kid, order, std::nullopt, std::nullopt, kid->space,
                          kid->baseline, kid->routes);
  }
  return make_segment_term(next_tag(), kid, segment.codes, kid->space, kid->baseline,
                           kid->routes);
}

TermPtr Compiler::compile(const SpacePtr& space, const SpacePtr& baseline) {
  BaselineScope scope(baseline_, baseline_stack_, baseline);
  internal_check(concludes(space, baseline_), "a space is compiled above its baseline");
  return compile_node(space);
}

TermPtr Compiler::compile_node(const SpacePtr& space) {
  switch (space->kind) {
    case SpaceKind::Root:
    case SpaceKind::Scalar:
      return compile_scalar(space);
    case SpaceKind::DirectTable:
    case SpaceKind::FiberTable:
      return compile_table(space);
    case SpaceKind::Quotient:
      return compile_quotient(space);
    case SpaceKind::Complement:
      return compile_complement(space);
    case SpaceKind::Moniker:
    case SpaceKind::Forked:
    case SpaceKind::Linked:
      return compile_covering(space);
    case SpaceKind::Filtered:
      return compile_filtered(space);
    case SpaceKind::Ordered:
      return compile_ordered(space);
  }
  internal_check(false, "unknown space kind");
  return nullptr;
}

TermPtr Compiler::compile_scalar(const SpacePtr& space) {
  if (same_space(space, baseline_)) {
    return make_scalar_term(next_tag(), space, space, Routes());
  }
  TermPtr term = compile(space->base);
  return make_wrapper_term(next_tag(), term, space, term->baseline, term->routes);
}

TermPtr Compiler::compile_table(const SpacePtr& space) {
  SpacePtr backbone = inflate(space);
  if (same_space(space, baseline_)) {
    int tag = next_tag();
    Routes routes;
    for (const auto& unit : spread(space)) routes.set(unit, tag);
    return make_table_term(tag, space, baseline_, std::move(routes));
  }
  TermPtr term = compile(space->base);
  std::vector<CodePtr> backbone_units = spread(backbone);
  bool exported = std::all_of(backbone_units.begin(), backbone_units.end(),
                              [&](const CodePtr& unit) { return term->routes.contains(unit); });
  if (conforms(space, term->space) && exported) {
    Routes routes = term->routes;
    route_spread(routes, space, backbone);
    return make_wrapper_term(next_tag(), term, space, term->baseline, std::move(routes));
  }
  TermPtr lkid = term;
  TermPtr rkid = compile(backbone, backbone);
  Routes routes = lkid->routes;
  routes.update(rkid->routes);
  route_spread(routes, space, backbone);
  return make_join_term(next_tag(), lkid, rkid, navsql::tie(space), false, false, space, lkid->baseline,
                        std::move(routes));
}

/// Compiles a quotient into a GROUP BY projection of its seed.
/// MUST drop seed rows whose kernels are all NULL and MUST keep a constant kernel
/// projection behind a permanent term.
TermPtr Compiler::compile_quotient(const SpacePtr& space) {
  SpacePtr backbone = inflate(space);
  TermPtr seed_term = compile(space->seed, inflated_ancestor(space->ground));
  if (!space->kernels.empty()) {
    seed_term = inject(seed_term, space->kernels);
    seed_term = make_filter_term(next_tag(), seed_term, kernel_filter(space->kernels, space->mark),
                                 seed_term->space, seed_term->baseline, seed_term->routes);
  }
  seed_term = make_wrapper_term(next_tag(), seed_term, seed_term->space, seed_term->baseline,
                                seed_term->routes);
  bool is_regular = same_space(seed_term->baseline, space->ground);

  std::vector<CodePtr> aggregates;
  SpacePtr quotient = space_with_companions(backbone, {});
  SpacePtr complement = make_complement(quotient, space->mark);
  if (!space->companions.empty() && is_regular) {
    Routes routes;
    for (const auto& entry : seed_term->routes) {
      routes.set(make_covering_unit(entry.first, complement, entry.first->mark), seed_term->tag);
    }
    for (const auto& kernel : space->kernels) {
      routes.set(make_covering_unit(kernel, complement, kernel->mark), seed_term->tag);
    }
    for (const auto& unit : spread(inflate(space->seed))) {
      routes.set(unit_with_space(unit, complement), seed_term->routes.at(unit));
    }
    TermPtr complement_term =
        make_wrapper_term(next_tag(), seed_term, complement, complement, std::move(routes));
    complement_term = inject(complement_term, space->companions);
    if (same_space(complement_term->baseline, complement)) {
      aggregates = space->companions;
      Routes seed_routes;
      for (const auto& code : aggregates) {
        for (const auto& unit : units_of(code)) {
          seed_routes.set(unit, complement_term->routes.at(unit));
        }
      }
      seed_routes.update(seed_term->routes);
      seed_term = make_wrapper_term(next_tag(), complement_term, seed_term->space,
                                    seed_term->baseline, std::move(seed_routes));
    }
  }

  TermPtr trunk_term;
  std::vector<CodePtr> basis;
  std::vector<CodePtr> units;
  std::vector<Joint> joints;
  if (is_regular) {
    if (!same_space(space, baseline_)) {
      trunk_term = compile(space->base);
      joints = navsql::tie(space);
    }
  } else {
    SpacePtr baseline = baseline_;
    if (same_space(baseline, space)) baseline = baseline->base;
    trunk_term = compile(space->base, baseline);
    for (const auto& joint : glue_terms(trunk_term, seed_term)) {
      basis.push_back(joint.rop);
      CodePtr unit = make_kernel_unit(joint.rop, backbone, joint.rop->mark);
      units.push_back(unit);
      joints.push_back(Joint{joint.lop, unit});
    }
  }
  for (const auto& joint : navsql::tie(space->ground)) {
    basis.push_back(joint.rop);
    units.push_back(make_kernel_unit(joint.rop, backbone, joint.rop->mark));
  }
  for (const auto& kernel : space->kernels) {
    basis.push_back(kernel);
    units.push_back(make_kernel_unit(kernel, backbone, kernel->mark));
  }
  for (const auto& code : aggregates) {
    units.push_back(make_aggregate_unit(code, complement, backbone, code->mark));
  }
  bool constant = std::all_of(space->kernels.begin(), space->kernels.end(),
                              [](const CodePtr& kernel) { return units_of(kernel).empty(); });
  if (constant) {
    CodePtr basis_code = make_literal(Value::boolean(true), Domain::boolean(), space->mark);
    CodePtr basis_unit = make_scalar_unit(basis_code, space->seed, space->mark);
    basis.push_back(basis_unit);
    Routes routes = seed_term->routes;
    routes.set(basis_unit, seed_term->tag);
    seed_term = make_permanent_term(next_tag(), seed_term, seed_term->space, seed_term->baseline,
                                    std::move(routes));
  }

  int tag = next_tag();
  Routes routes;
  for (const auto& unit : units) routes.set(unit, tag);
  TermPtr term = make_projection_term(tag, seed_term, basis, backbone, backbone, std::move(routes));
  if (!trunk_term) return term;

  TermPtr lkid = inject_joints(trunk_term, joints);
  Routes join_routes = lkid->routes;
  join_routes.update(term->routes);
  for (const auto& unit : units) join_routes.set(unit_with_space(unit, space), term->tag);
  return make_join_term(next_tag(), lkid, term, joints, false, false, space, lkid->baseline,
                        std::move(join_routes));
}

TermPtr Compiler::compile_complement(const SpacePtr& space) {
  SpacePtr backbone = inflate(space);
  TermPtr seed_term = compile(space->seed, inflated_ancestor(space->ground));
  std::vector<CodePtr> codes = space->kernels;
  codes.insert(codes.end(), space->companions.begin(), space->companions.end());
  seed_term = inject(seed_term, codes);
  bool is_regular = same_space(seed_term->baseline, space->ground);
  bool has_quotient = (!same_space(baseline_, space) || !is_regular) &&
                      space->base->kind == SpaceKind::Quotient &&
                      space->base->companions.empty();
  if (has_quotient && !space->kernels.empty()) {
    seed_term = make_filter_term(next_tag(), seed_term, kernel_filter(space->kernels, space->mark),
                                 seed_term->space, seed_term->baseline, seed_term->routes);
  }
  seed_term = make_wrapper_term(next_tag(), seed_term, seed_term->space, seed_term->baseline,
                                seed_term->routes);

  TermPtr trunk_term;
  std::vector<CodePtr> covering_units;
  std::vector<CodePtr> quotient_units;
  std::vector<Joint> joints;
  SpacePtr axis = has_quotient ? space->base->base : space->base;
  SpacePtr baseline = baseline_;
  if (!is_regular) {
    while (!concludes(axis, baseline)) baseline = baseline->base;
  }
  if (concludes(axis, baseline)) trunk_term = compile(axis, baseline);
  if (trunk_term) {
    if (!is_regular) {
      for (const auto& joint : glue_terms(trunk_term, seed_term)) {
        CodePtr unit = make_covering_unit(joint.rop, backbone, joint.rop->mark);
        joints.push_back(Joint{joint.lop, unit});
        covering_units.push_back(unit);
      }
    }
    for (const auto& joint : navsql::tie(has_quotient ? space->base : space)) joints.push_back(joint);
  }
  if (has_quotient) quotient_units = spread(inflate(space->base));
  for (const auto& entry : seed_term->routes) {
    covering_units.push_back(make_covering_unit(entry.first, backbone, entry.first->mark));
  }
  for (const auto& joint : navsql::tie(space->ground)) {
    covering_units.push_back(make_covering_unit(joint.rop, backbone, joint.rop->mark));
  }
  for (const auto& code : codes) {
    covering_units.push_back(make_covering_unit(code, backbone, code->mark));
  }

  Routes routes;
  for (const auto& unit : quotient_units) routes.set(unit, seed_term->tag);
  for (const auto& unit : covering_units) routes.set(unit, seed_term->tag);
  for (const auto& unit : spread(space->seed)) {
    routes.set(unit_with_space(unit, backbone), seed_term->routes.at(unit));
  }
  SpacePtr term_baseline = has_quotient ? backbone->base : backbone;
  TermPtr term = make_wrapper_term(next_tag(), seed_term, backbone, term_baseline, std::move(routes));
  if (!trunk_term) return term;

  TermPtr lkid = inject_joints(trunk_term, joints);
  Routes join_routes = lkid->routes;
  join_routes.update(term->routes);
  for (const auto& unit : quotient_units) {
    join_routes.set(unit_with_space(unit, space->base), seed_term->tag);
  }
  for (const auto& unit : covering_units) {
    join_routes.set(unit_with_space(unit, space), seed_term->tag);
  }
  for (const auto& unit : spread(space->seed)) {
    join_routes.set(unit_with_space(unit, space), seed_term->routes.at(unit));
  }
  return make_join_term(next_tag(), lkid, term, joints, false, false, space, lkid->baseline,
                        std::move(join_routes));
}

/// Compiles moniker, fork and link spaces: the seed is computed on its own and
/// attached to the base through covering units.
TermPtr Compiler::compile_covering(const SpacePtr& space) {
  SpacePtr backbone = inflate(space);
  TermPtr seed_term = compile(space->seed, inflated_ancestor(space->ground));
  std::vector<CodePtr> codes;
  if (space->kind == SpaceKind::Forked) {
    codes.insert(codes.end(), space->kernels.begin(), space->kernels.end());
  }
  if (space->kind == SpaceKind::Linked) {
    for (const auto& image : space->images) codes.push_back(image.second);
  }
  codes.insert(codes.end(), space->companions.begin(), space->companions.end());
  seed_term = inject(seed_term, codes);
  bool is_regular = same_space(seed_term->baseline, space->ground);
  seed_term = make_wrapper_term(next_tag(), seed_term, seed_term->space, seed_term->baseline,
                                seed_term->routes);

  TermPtr trunk_term;
  std::vector<Joint> joints;
  if (is_regular) {
    if (!same_space(baseline_, space)) trunk_term = compile(space->base);
    joints = navsql::tie(space);
  } else {
    SpacePtr baseline = baseline_;
    if (same_space(baseline, space)) baseline = baseline->base;
    trunk_term = compile(space->base, baseline);
    std::vector<Joint> seed_joints =
        space->kind == SpaceKind::Forked
            ? glue_spaces(trunk_term->space, trunk_term->baseline, space->ground->base,
                          seed_term->baseline)
            : glue_terms(trunk_term, seed_term);
    for (const auto& joint : seed_joints) {
      joints.push_back(Joint{joint.lop, make_covering_unit(joint.rop, backbone, joint.rop->mark)});
    }
    for (const auto& joint : navsql::tie(space)) joints.push_back(joint);
  }

  std::vector<CodePtr> units;
  for (const auto& entry : seed_term->routes) {
    units.push_back(make_covering_unit(entry.first, backbone, entry.first->mark));
  }
  for (const auto& joint : joints) units.push_back(joint.rop);
  for (const auto& code : codes) units.push_back(make_covering_unit(code, backbone, code->mark));
  Routes routes;
  for (const auto& unit : units) routes.set(unit, seed_term->tag);
  for (const auto& unit : spread(space->seed)) {
    routes.set(unit_with_space(unit, backbone), seed_term->routes.at(unit));
  }
  TermPtr term = make_wrapper_term(next_tag(), seed_term, backbone, backbone, std::move(routes));
  if (!trunk_term) return term;

  TermPtr lkid = inject_joints(trunk_term, joints);
  Routes join_routes = lkid->routes;
  join_routes.update(term->routes);
  for (const auto& unit : units) join_routes.set(unit_with_space(unit, space), seed_term->tag);
  for (const auto& unit : spread(space->seed)) {
    join_routes.set(unit_with_space(unit, space), seed_term->routes.at(unit));
  }
  return make_join_term(next_tag(), lkid, term, joints, false, false, space, lkid->baseline,
                        std::move(join_routes));
}

TermPtr Compiler::compile_filtered(const SpacePtr& space) {
  TermPtr kid = inject(compile(space->base), {space->filter});
  Routes routes = kid->routes;
  route_spread(routes, space, inflate(space));
  return make_filter_term(next_tag(), kid, space->filter, space, kid->baseline, std::move(routes));
}

TermPtr Compiler::compile_ordered(const SpacePtr& space) {
  SpacePtr backbone = inflate(space);
  if (space->is_expanding) {
    TermPtr term = compile(space->base);
    Routes routes = term->routes;
    route_spread(routes, space, backbone);
    return make_wrapper_term(next_tag(), term, space, term->baseline, std::move(routes));
  }
  // WHY: a slice makes the row count observable, so no axis may be pruned below it.
  std::vector<OrderItem> order = arrange(space);
  std::vector<CodePtr> codes;
  for (const auto& item : order) codes.push_back(item.first);
  TermPtr kid = inject(compile(space->base, root_), codes);
  Routes routes = kid->routes;
  route_spread(routes, space, backbone);
  return make_order_term(next_tag(), kid, std::move(order), space->limit, space->offset, space,
                         kid->baseline, std::move(routes));
}

TermPtr Compiler::inject(TermPtr term, const std::vector<CodePtr>& codes) {
  for (const auto& code : codes) {
    if (term->routes.contains(code)) continue;
    if (code->is_unit()) {
      term = inject_unit(term, code);
    } else {
      term = inject(term, units_of(code));
    }
  }
  return term;
}

TermPtr Compiler::inject_space(TermPtr term, const SpacePtr& space) {
  std::vector<CodePtr> units = spread(space);
  if (std::all_of(units.begin(), units.end(),
                  [&](const CodePtr& unit) { return term->routes.contains(unit); })) {
    return term;
  }
  if (concludes(term->space, space)) {
    TermPtr lkid = compile(term->baseline->base, space);
    std::vector<Joint> joints = navsql::tie(term->baseline);
    lkid = inject_joints(lkid, joints);
    Routes routes = lkid->routes;
    routes.update(term->routes);
    return make_join_term(next_tag(), lkid, term, joints, false, false, term->space,
                          lkid->baseline, std::move(routes));
  }
  TermPtr space_term = compile_shoot(space, term->space);
  Routes extra_routes;
  for (const auto& unit : units) extra_routes.set(unit, space_term->routes.at(unit));
  return join_terms(term, space_term, extra_routes);
}

TermPtr Compiler::inject_unit(TermPtr term, const CodePtr& unit) {
  if (term->routes.contains(unit)) return term;
  if (!spans(term->space, unit->space)) {
    throw Error("expected a singular expression", unit->mark);
  }
  switch (unit->kind) {
    case CodeKind::Column:
      return inject_space(term, unit->space);
    case CodeKind::Scalar:
      return inject_scalar(term, unit);
    case CodeKind::Aggregate:
      return inject_aggregate(term, unit);
    case CodeKind::Correlated:
      return inject_correlated(term, unit);
    case CodeKind::Kernel: {
      term = inject_space(term, unit->space);
      internal_check(term->routes.contains(unit), "a kernel unit is exported by its space");
      return term;
    }
    case CodeKind::Covering:
      return inject_covering(term, unit);
    default:
      break;
  }
  internal_check(false, "only units are injected");
  return term;
}

TermPtr Compiler::inject_scalar(TermPtr term, const CodePtr& unit) {
  std::vector<CodePtr> units = {unit};
  for (const auto& code : unit->companions) {
    CodePtr companion = make_scalar_unit(code, unit->space, code->mark);
    if (!term->routes.contains(companion)) units.push_back(companion);
  }
  std::vector<CodePtr> codes;
  for (const auto& item : units) codes.push_back(item->code);
  if (dominates(unit->space, term->space)) {
    TermPtr kid = inject(term, codes);
    int tag = next_tag();
    Routes routes = kid->routes;
    for (const auto& item : units) routes.set(item, tag);
    return make_wrapper_term(tag, kid, kid->space, kid->baseline, std::move(routes));
  }
  TermPtr unit_term = compile_shoot(unit->space, term->space, &codes);
  if (unit_term->is_nullary()) {
    unit_term = make_wrapper_term(next_tag(), unit_term, unit_term->space, unit_term->baseline,
                                  unit_term->routes);
  }
  Routes extra_routes;
  for (const auto& item : units) extra_routes.set(item, unit_term->tag);
  return join_terms(term, unit_term, extra_routes);
}

/// Attaches an aggregate as a projection of its plural space grouped by the
/// joints tying the plural space to the unit space.
TermPtr Compiler::inject_aggregate(TermPtr term, const CodePtr& unit) {
  std::vector<CodePtr> units = {unit};
  for (const auto& code : unit->companions) {
    CodePtr companion = make_aggregate_unit(code, unit->plural_space, unit->space, code->mark);
    if (!term->routes.contains(companion)) units.push_back(companion);
  }
  std::vector<CodePtr> codes;
  for (const auto& item : units) codes.push_back(item->code);

  bool is_native = false;
  for (SpacePtr step = term->space; step; step = step->base) {
    if (dominates(unit->space, step)) {
      is_native = true;
      break;
    }
  }
  TermPtr unit_term = is_native ? term : compile_shoot(unit->space, term->space);
  SpacePtr unit_space = unit_term->space;
  SpacePtr unit_baseline = unit_term->baseline;

  TermPtr plural_term = compile_shoot(unit->plural_space, unit_space, &codes);
  std::vector<Joint> unit_joints =
      glue_spaces(unit_space, unit_baseline, plural_term->space, plural_term->baseline);
  unit_term = inject_joints(unit_term, unit_joints);
  std::vector<CodePtr> basis;
  for (const auto& joint : unit_joints) basis.push_back(joint.rop);
  SpacePtr projected = make_quotient(inflate(unit->space), unit->plural_space, {}, unit->mark);

  int tag = next_tag();
  std::vector<Joint> joints;
  Routes projected_routes;
  for (const auto& joint : unit_joints) {
    CodePtr rop = make_kernel_unit(joint.rop, projected, joint.rop->mark);
    projected_routes.set(rop, tag);
    joints.push_back(Joint{joint.lop, rop});
  }
  TermPtr projected_term = make_projection_term(tag, plural_term, basis, projected, projected,
                                                std::move(projected_routes));
  bool is_left = !dominates(projected, unit_term->space);
  Routes routes = unit_term->routes;
  for (const auto& item : units) routes.set(item, projected_term->tag);
  unit_term = make_join_term(next_tag(), unit_term, projected_term, joints, is_left, false,
                             unit_term->space, unit_term->baseline, std::move(routes));
  if (is_native) return unit_term;
  Routes extra_routes;
  for (const auto& item : units) extra_routes.set(item, projected_term->tag);
  return join_terms(term, unit_term, extra_routes);
}

/// Attaches a correlated subquery over the plural space.
TermPtr Compiler::inject_correlated(TermPtr term, const CodePtr& unit) {
  bool is_native = dominates(unit->space, term->space);
  TermPtr unit_term = is_native ? term : compile_shoot(unit->space, term->space);
  std::vector<CodePtr> codes = {unit->code};
  TermPtr plural_term = compile_shoot(unit->plural_space, unit_term->space, &codes);
  std::vector<Joint> joints = glue_terms(unit_term, plural_term);
  unit_term = inject_joints(unit_term, joints);

  std::vector<CodePtr> correlations;
  std::vector<CodePtr> filters;
  for (const auto& joint : joints) {
    correlations.push_back(joint.lop);
    filters.push_back(make_formula(Signature::polar(SignatureKind::IsEqual, +1), Domain::boolean(),
                                   {make_correlation(joint.lop), joint.rop}, unit->mark));
  }
  if (!filters.empty()) {
    CodePtr filter = filters.size() == 1
                         ? filters.front()
                         : make_formula(Signature::make(SignatureKind::And), Domain::boolean(),
                                        filters, unit->mark);
    plural_term = make_filter_term(next_tag(), plural_term, filter, plural_term->space,
                                   plural_term->baseline, plural_term->routes);
  }
  plural_term = make_correlation_term(next_tag(), plural_term, plural_term->space,
                                      plural_term->baseline, plural_term->routes);
  Routes routes = unit_term->routes;
  routes.set(unit, plural_term->tag);
  unit_term = make_embedding_term(next_tag(), unit_term, plural_term, std::move(correlations),
                                  unit_term->space, unit_term->baseline, std::move(routes));
  if (is_native) return unit_term;
  Routes extra_routes;
  extra_routes.set(unit, plural_term->tag);
  return join_terms(term, unit_term, extra_routes);
}

TermPtr Compiler::inject_covering(TermPtr term, const CodePtr& unit) {
  std::vector<CodePtr> companions = unit->space->companions;
  companions.push_back(unit->code);
  SpacePtr space = space_with_companions(unit->space, std::move(companions));
  TermPtr space_term = compile_shoot(space, term->space);
  Routes extra_routes;
  extra_routes.set(unit, space_term->routes.at(unit));
  term = join_terms(term, space_term, extra_routes);
  internal_check(term->routes.contains(unit), "a covering unit is exported by its space");
  return term;
}

/// Compiles a shoot for `space` that only keeps the axes the trunk cannot supply.
TermPtr Compiler::compile_shoot(const SpacePtr& space, const SpacePtr& trunk,
                                const std::vector<CodePtr>* codes) {
  SpacePtr baseline = inflated_ancestor(space);
  if (!spans(trunk, baseline)) {
    while (!spans(trunk, baseline->base)) baseline = baseline->base;
  }
  TermPtr term = compile(space, baseline);
  if (codes) term = inject(term, *codes);
  return term;
}

/// Finds the joints attaching a shoot term to a trunk term.
/// MUST sew parallel axes when the trunk already has the shoot baseline, and MUST
/// tie the shoot baseline to its base otherwise.
std::vector<Joint> Compiler::glue_spaces(const SpacePtr& space, const SpacePtr& baseline,
                                         const SpacePtr& shoot, const SpacePtr& shoot_baseline) {
  std::vector<Joint> joints;
  SpacePtr backbone = inflate(space);
  SpacePtr shoot_backbone = inflate(shoot);
  if (concludes(backbone, shoot_baseline)) {
    SpacePtr axis = backbone;
    while (!concludes(shoot_backbone, axis)) axis = axis->base;
    std::vector<SpacePtr> axes;
    while (axis && !same_or_null(axis, shoot_baseline->base)) {
      if (!axis->is_contracting || same_space(axis, shoot_baseline)) axes.push_back(axis);
      axis = axis->base;
    }
    for (auto it = axes.rbegin(); it != axes.rend(); ++it) {
      for (const auto& joint : sew(*it)) joints.push_back(joint);
    }
    return joints;
  }
  joints = navsql::tie(shoot_baseline);
  SpacePtr origin = shoot_baseline->base;
  if (origin && concludes(baseline, origin) && !same_space(baseline, origin)) {
    SpacePtr axis = baseline;
    while (!same_space(axis->base, origin)) axis = axis->base;
    std::vector<Joint> trunk_joints = navsql::tie(axis);
    bool parallel = trunk_joints.size() == joints.size();
    for (size_t i = 0; parallel && i < joints.size(); ++i) {
      parallel = same_code(trunk_joints[i].lop, joints[i].lop);
    }
    if (parallel) {
      std::vector<Joint> shortcut;
      for (size_t i = 0; i < joints.size(); ++i) {
        shortcut.push_back(Joint{trunk_joints[i].rop, joints[i].rop});
      }
      joints = std::move(shortcut);
    }
  }
  return joints;
}

std::vector<Joint> Compiler::glue_terms(const TermPtr& trunk, const TermPtr& shoot) {
  return glue_spaces(trunk->space, trunk->baseline, shoot->space, shoot->baseline);
}

TermPtr Compiler::inject_joints(TermPtr term, const std::vector<Joint>& joints) {
  std::vector<CodePtr> codes;
  for (const auto& joint : joints) codes.push_back(joint.lop);
  return inject(std::move(term), codes);
}

/// Joins a shoot to the trunk without changing the rows of the trunk.
TermPtr Compiler::join_terms(TermPtr trunk, const TermPtr& shoot, const Routes& extra_routes) {
  internal_check(spans(trunk->space, shoot->space), "a shoot is singular against its trunk");
  std::vector<Joint> joints = glue_terms(trunk, shoot);
  trunk = inject_joints(trunk, joints);
  SpacePtr space = trunk->space;
  while (!spans(shoot->space, space)) space = space->base;
  bool is_left = !dominates(shoot->space, space);
  Routes routes = trunk->routes;
  routes.update(extra_routes);
  return make_join_term(next_tag(), trunk, shoot, std::move(joints), is_left, false, trunk->space,
                        trunk->baseline, std::move(routes));
}

}  // namespace navsql
