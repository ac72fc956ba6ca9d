#include "rewrite.h"

#include <algorithm>

namespace navsql {

namespace {

SpacePtr rebuild_space(Space parts) {
  if (parts.kind == SpaceKind::Complement) {
    parts.seed.reset();
    parts.kernels.clear();
  }
  return build_space(std::move(parts));
}

CodePtr rebuild_code(Code parts) {
  parts.nested_units.clear();
  return build_code(std::move(parts));
}

size_t kernel_index(const CodePtr& unit) {
  const auto& kernels = unit->space->family.kernels;
  for (size_t i = 0; i < kernels.size(); ++i) {
    if (same_code(kernels[i], unit->code)) return i;
  }
  internal_check(false, "a kernel unit refers to a kernel of its space");
  return 0;
}

bool is_true_literal(const CodePtr& code) {
  return code->kind == CodeKind::Literal && code->domain->kind() == DomainKind::Boolean &&
         !code->value.is_null() && code->value.as_bool();
}

}  // namespace

Rewriter::Rewriter(SpacePtr root) : root_(std::move(root)), mask_(root_) {}

Segment Rewriter::run(const Segment& segment) {
  Segment out = segment;
  out.root = rewrite(segment.root);
  out.space = rewrite(segment.space);
  for (auto& code : out.codes) code = rewrite(code);

  for (auto& code : out.codes) code = unmask(code, out.space);
  out.space = unmask(out.space, out.root);
  out.root = unmask(out.root);

  collect(out.root);
  collect(out.space);
  for (const auto& code : out.codes) collect(code);
  recombine();
  out.root = replace(out.root);
  out.space = replace(out.space);
  for (auto& code : out.codes) code = replace(code);
  return out;
}

SpacePtr Rewriter::rewrite(const SpacePtr& space) {
  auto it = rewritten_spaces_.find(space.get());
  if (it != rewritten_spaces_.end()) return it->second;
  SpacePtr result = rewrite_node(space);
  rewritten_spaces_.emplace(space.get(), result);
  return result;
}

CodePtr Rewriter::rewrite(const CodePtr& code) {
  auto it = rewritten_codes_.find(code.get());
  if (it != rewritten_codes_.end()) return it->second;
  CodePtr result = rewrite_node(code);
  rewritten_codes_.emplace(code.get(), result);
  return result;
}

SpacePtr Rewriter::rewrite_node(const SpacePtr& space) {
  if (!space->base) return space;
  Space parts = *space;
  parts.base = rewrite(space->base);
  switch (space->kind) {
    case SpaceKind::Quotient:
    case SpaceKind::Forked:
      parts.seed = rewrite(space->seed);
      for (auto& kernel : parts.kernels) kernel = rewrite(kernel);
      break;
    case SpaceKind::Moniker:
      parts.seed = rewrite(space->seed);
      break;
    case SpaceKind::Linked:
      parts.seed = rewrite(space->seed);
      for (auto& image : parts.images) {
        image = Image(rewrite(image.first), rewrite(image.second));
      }
      break;
    case SpaceKind::Filtered:
      parts.filter = rewrite(space->filter);
      if (is_true_literal(parts.filter)) return parts.base;
      break;
    case SpaceKind::Ordered:
      for (auto& item : parts.order) item.first = rewrite(item.first);
      break;
    default:
      break;
  }
  return rebuild_space(std::move(parts));
}

CodePtr Rewriter::rewrite_node(const CodePtr& code) {
  Code parts = *code;
  switch (code->kind) {
    case CodeKind::Literal:
    case CodeKind::Parameter:
      return code;
    case CodeKind::Cast:
      parts.base = rewrite(code->base);
      break;
    case CodeKind::Formula:
      for (auto& arg : parts.args) arg = rewrite(arg);
      break;
    case CodeKind::Correlation:
      parts.code = rewrite(code->code);
      break;
    case CodeKind::Column:
      parts.space = rewrite(code->space);
      break;
    case CodeKind::Kernel: {
      size_t index = kernel_index(code);
      parts.space = rewrite(code->space);
      parts.code = parts.space->family.kernels[index];
      break;
    }
    case CodeKind::Scalar:
    case CodeKind::Covering:
      parts.code = rewrite(code->code);
      parts.space = rewrite(code->space);
      break;
    case CodeKind::Aggregate:
    case CodeKind::Correlated:
      parts.code = rewrite(code->code);
      parts.plural_space = rewrite(code->plural_space);
      parts.space = rewrite(code->space);
      break;
  }
  return rebuild_code(std::move(parts));
}

SpacePtr Rewriter::unmask(const SpacePtr& space, const SpacePtr& mask) {
  if (mask) {
    mask_stack_.push_back(mask_);
    mask_ = mask;
  }
  auto key = std::make_pair(mask_.get(), space.get());
  SpacePtr result;
  auto it = unmasked_spaces_.find(key);
  if (it != unmasked_spaces_.end()) {
    result = it->second;
  } else {
    result = unmask_node(space);
    unmasked_spaces_.emplace(key, result);
  }
  if (mask) {
    mask_ = mask_stack_.back();
    mask_stack_.pop_back();
  }
  return result;
}

CodePtr Rewriter::unmask(const CodePtr& code, const SpacePtr& mask) {
  if (mask) {
    mask_stack_.push_back(mask_);
    mask_ = mask;
  }
  auto key = std::make_pair(mask_.get(), code.get());
  CodePtr result;
  auto it = unmasked_codes_.find(key);
  if (it != unmasked_codes_.end()) {
    result = it->second;
  } else {
    result = unmask_node(code);
    unmasked_codes_.emplace(key, result);
  }
  if (mask) {
    mask_ = mask_stack_.back();
    mask_stack_.pop_back();
  }
  return result;
}

SpacePtr Rewriter::unmask_node(const SpacePtr& space) {
  if (!space->base) return space;
  Space parts = *space;
  switch (space->kind) {
    case SpaceKind::Quotient: {
      bool constant = true;
      for (auto& kernel : parts.kernels) {
        kernel = unmask(kernel, space->seed);
        if (!units_of(kernel).empty()) constant = false;
      }
      if (constant) {
        throw Error("an empty or constant kernel is not allowed", space->mark);
      }
      parts.seed = unmask(space->seed, space->base);
      parts.base = unmask(space->base);
      break;
    }
    case SpaceKind::Moniker:
      parts.seed = unmask(space->seed, space->base);
      parts.base = unmask(space->base);
      break;
    case SpaceKind::Forked:
      parts.seed = unmask(space->seed, space->ground);
      for (auto& kernel : parts.kernels) kernel = unmask(kernel, space->base);
      parts.base = unmask(space->base);
      break;
    case SpaceKind::Linked:
      parts.seed = unmask(space->seed, space->base);
      for (auto& image : parts.images) {
        image = Image(unmask(image.first, space->base), unmask(image.second, space->seed));
      }
      parts.base = unmask(space->base);
      break;
    case SpaceKind::Filtered:
    case SpaceKind::Ordered: {
      if (same_space(prune(space, mask_), prune(space->base, mask_))) {
        return unmask(space->base);
      }
      SpacePtr code_mask = dominates(space->base, mask_) ? nullptr : space->base;
      if (space->kind == SpaceKind::Filtered) {
        parts.filter = unmask(space->filter, code_mask);
        parts.base = unmask(space->base);
      } else {
        for (auto& item : parts.order) item.first = unmask(item.first, code_mask);
        // A sliced base must be computed in full before the slice applies.
        parts.base = space->is_expanding ? unmask(space->base) : unmask(space->base, root_);
      }
      break;
    }
    default:
      parts.base = unmask(space->base);
      break;
  }
  return rebuild_space(std::move(parts));
}

CodePtr Rewriter::unmask_node(const CodePtr& code) {
  Code parts = *code;
  switch (code->kind) {
    case CodeKind::Literal:
    case CodeKind::Parameter:
      return code;
    case CodeKind::Cast:
      parts.base = unmask(code->base);
      break;
    case CodeKind::Formula:
      for (auto& arg : parts.args) arg = unmask(arg);
      break;
    case CodeKind::Correlation:
      parts.code = unmask(code->code);
      break;
    case CodeKind::Column: {
      SpacePtr space = unmask(code->space);
      const Column* column = code->column;
      // A direct join that neither adds nor loses rows reads the same value from
      // the origin column.
      while (space->kind == SpaceKind::FiberTable && space->join->kind == Join::Kind::Direct &&
             space->is_expanding && space->is_contracting) {
        const Join& join = *space->join;
        bool found = false;
        for (size_t i = 0; i < join.target_columns.size(); ++i) {
          if (join.target_columns[i] == column) {
            column = join.origin_columns[i];
            space = space->base;
            found = true;
            break;
          }
        }
        if (!found) break;
      }
      parts.space = space;
      parts.column = column;
      break;
    }
    case CodeKind::Scalar:
      if (dominates(code->space, mask_)) {
        return unmask(code->code);
      }
      if (code->code->is_unit() && dominates(code->space, code->code->space)) {
        return unmask(code->code);
      }
      parts.code = unmask(code->code, code->space);
      parts.space = unmask(code->space);
      break;
    case CodeKind::Aggregate:
    case CodeKind::Correlated:
      parts.code = unmask(code->code, code->plural_space);
      parts.plural_space = dominates(code->space, mask_) ? unmask(code->plural_space)
                                                         : unmask(code->plural_space, code->space);
      parts.space = unmask(code->space);
      break;
    case CodeKind::Kernel: {
      size_t index = kernel_index(code);
      parts.space = unmask(code->space);
      parts.code = parts.space->family.kernels[index];
      break;
    }
    case CodeKind::Covering:
      parts.code = unmask(code->code, code->space->seed);
      parts.space = unmask(code->space);
      break;
  }
  return rebuild_code(std::move(parts));
}

void Rewriter::collect(const SpacePtr& space) {
  for (SpacePtr step = space; step; step = step->base) {
    if (step->seed && step->kind != SpaceKind::Complement) collect(step->seed);
    for (const auto& kernel : step->kernels) collect(kernel);
    for (const auto& image : step->images) {
      collect(image.first);
      collect(image.second);
    }
    if (step->filter) collect(step->filter);
    for (const auto& item : step->order) collect(item.first);
  }
}

void Rewriter::collect(const CodePtr& code) {
  for (const auto& unit : units_of(code)) {
    collection_.push_back(unit);
    if (unit->code) collect(unit->code);
    if (unit->plural_space) collect(unit->plural_space);
    collect(unit->space);
  }
}

/// Gives scalar units over one space, and aggregate units over one pair of
/// spaces, each other as companions.
/// MUST leave singleton batches alone unless the aggregate feeds its own quotient.
void Rewriter::recombine() {
  std::vector<std::vector<CodePtr>> scalar_batches;
  std::vector<std::vector<CodePtr>> aggregate_batches;
  std::vector<CodePtr> seen;
  for (const auto& unit : collection_) {
    if (std::any_of(seen.begin(), seen.end(),
                    [&](const CodePtr& other) { return same_code(other, unit); })) {
      continue;
    }
    seen.push_back(unit);
    if (unit->kind == CodeKind::Scalar) {
      auto batch = std::find_if(scalar_batches.begin(), scalar_batches.end(),
                                [&](const std::vector<CodePtr>& b) {
                                  return same_space(b.front()->space, unit->space);
                                });
      if (batch == scalar_batches.end()) {
        scalar_batches.push_back({unit});
      } else {
        batch->push_back(unit);
      }
    } else if (unit->kind == CodeKind::Aggregate) {
      auto batch = std::find_if(aggregate_batches.begin(), aggregate_batches.end(),
                                [&](const std::vector<CodePtr>& b) {
                                  return same_space(b.front()->space, unit->space) &&
                                         same_space(b.front()->plural_space, unit->plural_space);
                                });
      if (batch == aggregate_batches.end()) {
        aggregate_batches.push_back({unit});
      } else {
        batch->push_back(unit);
      }
    }
  }

  auto batch_codes = [](const std::vector<CodePtr>& batch) {
    std::vector<CodePtr> codes;
    for (const auto& unit : batch) {
      if (!std::any_of(codes.begin(), codes.end(),
                       [&](const CodePtr& code) { return same_code(code, unit->code); })) {
        codes.push_back(unit->code);
      }
    }
    return codes;
  };

  for (const auto& batch : scalar_batches) {
    if (batch.size() < 2) continue;
    auto codes = batch_codes(batch);
    for (const auto& unit : batch) unit_companions_[unit] = codes;
  }
  for (const auto& batch : aggregate_batches) {
    const SpacePtr& space = batch.front()->space;
    const SpacePtr& plural = batch.front()->plural_space;
    auto codes = batch_codes(batch);
    // WHY: an aggregate over the complement of its own quotient is computed by
    // the GROUP BY frame of the quotient itself.
    if (space->kind == SpaceKind::Quotient && plural->kind == SpaceKind::Complement &&
        same_space(plural->base, space)) {
      auto& companions = space_companions_[space];
      for (const auto& code : codes) {
        if (!std::any_of(companions.begin(), companions.end(),
                         [&](const CodePtr& other) { return same_code(other, code); })) {
          companions.push_back(code);
        }
      }
      for (const auto& unit : batch) unit_companions_[unit] = codes;
      continue;
    }
    if (batch.size() < 2) continue;
    for (const auto& unit : batch) unit_companions_[unit] = codes;
  }
}

SpacePtr Rewriter::replace(const SpacePtr& space) {
  auto it = replaced_spaces_.find(space.get());
  if (it != replaced_spaces_.end()) return it->second;
  SpacePtr result = space;
  if (space->base) {
    Space parts = *space;
    parts.base = replace(space->base);
    if (space->kind != SpaceKind::Complement && space->seed) parts.seed = replace(space->seed);
    if (space->kind != SpaceKind::Complement) {
      for (auto& kernel : parts.kernels) kernel = replace(kernel);
    }
    for (auto& image : parts.images) image = Image(replace(image.first), replace(image.second));
    if (space->filter) parts.filter = replace(space->filter);
    for (auto& item : parts.order) item.first = replace(item.first);
    auto companions = space_companions_.find(space);
    if (companions != space_companions_.end()) {
      parts.companions.clear();
      for (const auto& code : companions->second) parts.companions.push_back(replace(code));
    }
    result = rebuild_space(std::move(parts));
  }
  replaced_spaces_.emplace(space.get(), result);
  return result;
}

CodePtr Rewriter::replace(const CodePtr& code) {
  auto it = replaced_codes_.find(code.get());
  if (it != replaced_codes_.end()) return it->second;
  Code parts = *code;
  switch (code->kind) {
    case CodeKind::Literal:
    case CodeKind::Parameter:
      replaced_codes_.emplace(code.get(), code);
      return code;
    case CodeKind::Cast:
      parts.base = replace(code->base);
      break;
    case CodeKind::Formula:
      for (auto& arg : parts.args) arg = replace(arg);
      break;
    case CodeKind::Correlation:
      parts.code = replace(code->code);
      break;
    case CodeKind::Column:
      parts.space = replace(code->space);
      break;
    case CodeKind::Kernel: {
      size_t index = kernel_index(code);
      parts.space = replace(code->space);
      parts.code = parts.space->family.kernels[index];
      break;
    }
    case CodeKind::Scalar:
    case CodeKind::Covering:
      parts.code = replace(code->code);
      parts.space = replace(code->space);
      break;
    case CodeKind::Aggregate:
    case CodeKind::Correlated:
      parts.code = replace(code->code);
      parts.plural_space = replace(code->plural_space);
      parts.space = replace(code->space);
      break;
  }
  auto companions = unit_companions_.find(code);
  if (companions != unit_companions_.end()) {
    parts.companions.clear();
    for (const auto& companion : companions->second) {
      parts.companions.push_back(replace(companion));
    }
  }
  CodePtr result = rebuild_code(std::move(parts));
  replaced_codes_.emplace(code.get(), result);
  return result;
}

SpacePtr rewrite_space(const SpacePtr& space, const SpacePtr& mask) {
  Rewriter rewriter(unfold(space).back());
  SpacePtr rewritten = rewriter.rewrite(space);
  return rewriter.unmask(rewritten, mask ? rewriter.rewrite(mask) : nullptr);
}

}  // namespace navsql
