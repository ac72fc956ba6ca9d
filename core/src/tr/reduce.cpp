#include "reduce.h"

#include <memory>
#include <unordered_set>

#include "navsql/error.h"

namespace navsql {

namespace {

PhrasePtr with_nullable(const PhrasePtr& phrase) {
  if (phrase->is_nullable) return phrase;
  auto copy = std::make_shared<Phrase>(*phrase);
  copy->is_nullable = true;
  return copy;
}

PhrasePtr null_phrase(const DomainPtr& domain) { return make_literal_phrase(Value(), domain); }

PhrasePtr boolean_phrase(bool value) {
  return make_literal_phrase(Value::boolean(value), Domain::boolean());
}

bool is_null_literal(const PhrasePtr& phrase) {
  return phrase->kind == PhraseKind::Literal && phrase->value.is_null();
}

PhrasePtr rebuild(const PhrasePtr& phrase, std::vector<PhrasePtr> args) {
  if (phrase->kind == PhraseKind::Cast) return make_cast_phrase(args[0], phrase->domain);
  return make_formula_phrase(phrase->signature, phrase->domain, phrase->is_nullable,
                             std::move(args));
}

// Replaces the exports of one frame with the phrases it selects.
PhrasePtr resolve(const PhrasePtr& phrase, int tag, const std::vector<PhrasePtr>& select) {
  if (phrase->kind == PhraseKind::Reference && phrase->tag == tag) {
    return select.at(phrase->index);
  }
  if (phrase->kind != PhraseKind::Formula && phrase->kind != PhraseKind::Cast) return phrase;
  std::vector<PhrasePtr> args;
  args.reserve(phrase->args.size());
  for (const auto& arg : phrase->args) args.push_back(resolve(arg, tag, select));
  return rebuild(phrase, std::move(args));
}

PhrasePtr conjoin(const PhrasePtr& left, const PhrasePtr& right) {
  if (!left) return right;
  if (!right) return left;
  return make_formula_phrase(Signature::make(SignatureKind::And), Domain::boolean(),
                             left->is_nullable || right->is_nullable, {left, right});
}

bool all_literals(const std::vector<PhrasePtr>& phrases) {
  for (const auto& phrase : phrases) {
    if (!is_literal(phrase)) return false;
  }
  return true;
}

bool has_right_anchor(const Frame& frame) {
  for (size_t i = 1; i < frame.include.size(); ++i) {
    if (frame.include[i].is_right) return true;
  }
  return false;
}

bool same_order(const std::vector<SortItem>& left, const std::vector<SortItem>& right) {
  if (left.size() != right.size()) return false;
  for (size_t i = 0; i < left.size(); ++i) {
    if (left[i].second != right[i].second || !same_phrase(left[i].first, right[i].first)) {
      return false;
    }
  }
  return true;
}

}  // namespace

FramePtr Reducer::run(const FramePtr& frame) { return reduce(collapse(frame)); }

FramePtr Reducer::collapse(const FramePtr& frame) {
  if (frame->is_leaf()) return frame;
  auto result = std::make_shared<Frame>(*frame);
  for (auto& anchor : result->include) anchor.frame = collapse(anchor.frame);
  for (auto& embedded : result->embed) embedded = collapse(embedded);
  while (absorb_head(*result)) {
  }
  unwrap_anchors(*result);
  return result;
}

/// Merges the leading anchor of the frame into the frame itself.
/// MUST leave the frame untouched and return false when the merge would
/// change the rows the frame produces.
bool Reducer::absorb_head(Frame& frame) {
  if (frame.include.empty()) return false;
  const FramePtr head = frame.include.front().frame;

  if (head->kind == FrameKind::Table) return false;
  if (head->kind == FrameKind::Scalar) {
    if (frame.include.size() == 1) {
      frame.include.clear();
      return false;
    }
    Anchor& next = frame.include[1];
    if (next.is_left || next.is_right) return false;
    frame.where = conjoin(frame.where, next.condition);
    next.condition = nullptr;
    frame.include.erase(frame.include.begin());
    return true;
  }

  if (head->is_permanent) return false;
  if (has_right_anchor(frame)) return false;
  if (head->include.empty() && frame.include.size() > 1) return false;

  bool is_sliced = head->limit || head->offset;
  bool is_grouped = !head->group.empty();
  bool is_single = frame.include.size() == 1;

  if (is_sliced) {
    if (!is_single || frame.where || !frame.group.empty() || frame.having || frame.limit ||
        frame.offset) {
      return false;
    }
    if (!frame.order.empty()) {
      std::vector<SortItem> resolved;
      for (const auto& item : frame.order) {
        resolved.emplace_back(resolve(item.first, head->tag, head->select), item.second);
      }
      if (!same_order(resolved, head->order)) return false;
    }
  }
  if (is_grouped) {
    if (!is_single || !frame.group.empty() || frame.having || head->having) return false;
    if (frame.where && all_literals(head->group)) return false;
    // WHY: a correlated subquery cannot refer to the input rows of a grouped query.
    if (!frame.embed.empty()) return false;
  }

  substitutes_[head->tag] = head->select;

  std::vector<Anchor> include = head->include;
  include.insert(include.end(), frame.include.begin() + 1, frame.include.end());
  frame.include = std::move(include);

  std::vector<FramePtr> embed = head->embed;
  embed.insert(embed.end(), frame.embed.begin(), frame.embed.end());
  frame.embed = std::move(embed);

  bool had_group = !frame.group.empty();
  if (is_grouped) {
    frame.having = frame.where;
    frame.where = head->where;
    frame.group = head->group;
  } else {
    frame.where = conjoin(head->where, frame.where);
  }

  if (is_sliced) {
    frame.order = head->order;
    frame.limit = head->limit;
    frame.offset = head->offset;
  } else if (frame.order.empty() && !had_group) {
    frame.order = head->order;
  }
  return true;
}

void Reducer::unwrap_anchors(Frame& frame) {
  for (size_t i = 1; i < frame.include.size(); ++i) {
    const FramePtr& nested = frame.include[i].frame;
    if (nested->kind != FrameKind::Nested || nested->is_permanent) continue;
    if (nested->include.size() != 1 || nested->include.front().frame->kind != FrameKind::Table) {
      continue;
    }
    if (nested->where || !nested->group.empty() || nested->having || !nested->order.empty() ||
        nested->limit || nested->offset || !nested->embed.empty()) {
      continue;
    }
    substitutes_[nested->tag] = nested->select;
    frame.include[i].frame = nested->include.front().frame;
  }
}

FramePtr Reducer::reduce(const FramePtr& frame) {
  if (frame->is_leaf()) return frame;
  auto result = std::make_shared<Frame>(*frame);
  for (auto& anchor : result->include) {
    anchor.frame = reduce(anchor.frame);
    if (!anchor.condition) continue;
    anchor.condition = reduce_phrase(anchor.condition);
    if (!anchor.is_left && !anchor.is_right && is_boolean_literal(anchor.condition, true)) {
      anchor.condition = nullptr;
    }
  }
  for (auto& embedded : result->embed) embedded = reduce(embedded);
  for (auto& phrase : result->select) phrase = reduce_phrase(phrase);
  if (result->where) {
    result->where = reduce_phrase(result->where);
    if (is_boolean_literal(result->where, true)) result->where = nullptr;
  }
  std::vector<PhrasePtr> group;
  for (const auto& phrase : result->group) {
    PhrasePtr reduced = reduce_phrase(phrase);
    if (!is_literal(reduced)) group.push_back(reduced);
  }
  result->group = std::move(group);
  if (result->having) {
    result->having = reduce_phrase(result->having);
    if (is_boolean_literal(result->having, true)) result->having = nullptr;
  }
  std::vector<SortItem> order;
  for (const auto& item : result->order) {
    PhrasePtr reduced = reduce_phrase(item.first);
    if (!is_literal(reduced)) order.emplace_back(reduced, item.second);
  }
  result->order = std::move(order);
  return result;
}

PhrasePtr Reducer::reduce_phrase(const PhrasePtr& phrase) {
  switch (phrase->kind) {
    case PhraseKind::Reference: {
      auto found = substitutes_.find(phrase->tag);
      if (found == substitutes_.end()) return phrase;
      internal_check(phrase->index < found->second.size(), "a reference points into the select");
      PhrasePtr target = reduce_phrase(found->second[phrase->index]);
      return phrase->is_nullable ? with_nullable(target) : target;
    }
    case PhraseKind::Cast: {
      PhrasePtr base = reduce_phrase(phrase->args[0]);
      if (is_null_literal(base)) return null_phrase(phrase->domain);
      return make_cast_phrase(base, phrase->domain);
    }
    case PhraseKind::Formula: {
      std::vector<PhrasePtr> args;
      args.reserve(phrase->args.size());
      for (const auto& arg : phrase->args) args.push_back(reduce_phrase(arg));
      return reduce_formula(phrase, std::move(args));
    }
    default:
      return phrase;
  }
}

PhrasePtr Reducer::reduce_formula(const PhrasePtr& phrase, std::vector<PhrasePtr> args) {
  const Signature& signature = phrase->signature;
  bool any_nullable = false;
  for (const auto& arg : args) any_nullable = any_nullable || arg->is_nullable;

  switch (signature.kind) {
    case SignatureKind::ToPredicate: {
      const PhrasePtr& arg = args[0];
      if (arg->kind == PhraseKind::Formula &&
          arg->signature.kind == SignatureKind::FromPredicate) {
        return arg->args[0];
      }
      if (is_literal(arg)) return arg;
      break;
    }
    case SignatureKind::FromPredicate: {
      const PhrasePtr& arg = args[0];
      if (arg->kind == PhraseKind::Formula && arg->signature.kind == SignatureKind::ToPredicate) {
        return arg->args[0];
      }
      if (is_literal(arg)) return arg;
      break;
    }
    case SignatureKind::And:
    case SignatureKind::Or:
      return reduce_connective(phrase, std::move(args));
    case SignatureKind::Not: {
      const PhrasePtr& arg = args[0];
      if (arg->kind == PhraseKind::Formula && arg->signature.kind == SignatureKind::Not) {
        return arg->args[0];
      }
      if (is_null_literal(arg)) return null_phrase(phrase->domain);
      if (is_boolean_literal(arg, true)) return boolean_phrase(false);
      if (is_boolean_literal(arg, false)) return boolean_phrase(true);
      break;
    }
    case SignatureKind::IsNull:
      if (is_literal(args[0])) {
        return boolean_phrase(args[0]->value.is_null() == (signature.polarity > 0));
      }
      break;
    case SignatureKind::IsTotallyEqual:
      // Only Boolean literals compare the same on every engine; text and numbers
      // depend on collation and scale.
      if (is_literal(args[0]) && is_literal(args[1]) &&
          args[0]->domain->kind() == DomainKind::Boolean &&
          args[1]->domain->kind() == DomainKind::Boolean) {
        return boolean_phrase((args[0]->value == args[1]->value) == (signature.polarity > 0));
      }
      if (is_null_literal(args[0]) || is_null_literal(args[1])) {
        PhrasePtr other = is_null_literal(args[0]) ? args[1] : args[0];
        if (is_literal(other)) {
          return boolean_phrase(other->value.is_null() == (signature.polarity > 0));
        }
        return make_formula_phrase(Signature::polar(SignatureKind::IsNull, signature.polarity),
                                   phrase->domain, false, {other});
      }
      break;
    case SignatureKind::Concat: {
      bool changed = false;
      for (auto& arg : args) {
        if (is_null_literal(arg)) {
          arg = make_literal_phrase(Value::text(""), phrase->domain);
          changed = true;
        } else if (arg->is_nullable) {
          PhrasePtr empty = make_literal_phrase(Value::text(""), phrase->domain);
          arg = make_formula_phrase(Signature::make(SignatureKind::IfNull), arg->domain, false,
                                    {arg, empty});
          changed = true;
        }
      }
      if (changed || phrase->is_nullable) {
        return make_formula_phrase(signature, phrase->domain, false, std::move(args));
      }
      break;
    }
    case SignatureKind::IfNull: {
      std::vector<PhrasePtr> kept;
      for (const auto& arg : args) {
        if (!is_null_literal(arg)) kept.push_back(arg);
      }
      if (kept.empty()) return null_phrase(phrase->domain);
      if (!kept.front()->is_nullable || kept.size() == 1) return kept.front();
      bool all_nullable = true;
      for (const auto& arg : kept) all_nullable = all_nullable && arg->is_nullable;
      return make_formula_phrase(signature, phrase->domain, all_nullable, std::move(kept));
    }
    case SignatureKind::NullIf:
      if (is_null_literal(args[0])) return null_phrase(phrase->domain);
      break;
    case SignatureKind::IsEqual:
      if (is_boolean_literal(args[0], true) || is_boolean_literal(args[0], false)) {
        if (is_boolean_literal(args[1], true) || is_boolean_literal(args[1], false)) {
          return boolean_phrase((args[0]->value == args[1]->value) == (signature.polarity > 0));
        }
      }
      break;
    default:
      break;
  }

  if (signature.is_null_regular() && signature.kind != SignatureKind::Concat) {
    for (const auto& arg : args) {
      if (is_null_literal(arg)) return null_phrase(phrase->domain);
    }
  }
  return make_formula_phrase(signature, phrase->domain, phrase->is_nullable && any_nullable,
                             std::move(args));
}

/// Flattens nested AND/OR chains and folds constant operands.
PhrasePtr Reducer::reduce_connective(const PhrasePtr& phrase, std::vector<PhrasePtr> args) {
  SignatureKind kind = phrase->signature.kind;
  bool identity = kind == SignatureKind::And;

  std::vector<PhrasePtr> flat;
  std::vector<PhrasePtr> pending(args.rbegin(), args.rend());
  while (!pending.empty()) {
    PhrasePtr arg = pending.back();
    pending.pop_back();
    if (arg->kind == PhraseKind::Formula && arg->signature.kind == kind) {
      pending.insert(pending.end(), arg->args.rbegin(), arg->args.rend());
      continue;
    }
    flat.push_back(arg);
  }

  std::vector<PhrasePtr> kept;
  std::unordered_set<PhrasePtr, PhraseHash, PhraseEq> seen;
  bool is_nullable = false;
  for (const auto& arg : flat) {
    if (is_boolean_literal(arg, identity)) continue;
    if (is_boolean_literal(arg, !identity)) return boolean_phrase(!identity);
    if (!seen.insert(arg).second) continue;
    is_nullable = is_nullable || arg->is_nullable;
    kept.push_back(arg);
  }
  if (kept.empty()) return boolean_phrase(identity);
  if (kept.size() == 1) return kept.front();
  return make_formula_phrase(phrase->signature, phrase->domain, is_nullable, std::move(kept));
}

}  // namespace navsql
