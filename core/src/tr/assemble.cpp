#include "assemble.h"

namespace navsql {

size_t ClaimHash::operator()(const Claim& claim) const {
  size_t seed = claim.unit->hash_value;
  seed ^= static_cast<size_t>(claim.broker) * 0x9e3779b9u + (seed << 6) + (seed >> 2);
  seed ^= static_cast<size_t>(claim.target) * 0x85ebca6bu + (seed << 6) + (seed >> 2);
  return seed;
}

bool ClaimEq::operator()(const Claim& left, const Claim& right) const {
  return left.broker == right.broker && left.target == right.target &&
         same_code(left.unit, right.unit);
}

PhrasePtr to_predicate(const PhrasePtr& phrase) {
  return make_formula_phrase(Signature::make(SignatureKind::ToPredicate), phrase->domain,
                             phrase->is_nullable, {phrase});
}

PhrasePtr from_predicate(const PhrasePtr& phrase) {
  return make_formula_phrase(Signature::make(SignatureKind::FromPredicate), phrase->domain,
                             phrase->is_nullable, {phrase});
}

FramePtr Assembler::assemble_segment(const TermPtr& term) {
  internal_check(term->kind == TermKind::Segment, "assembling starts from a segment term");
  gate_ = Gate{false, &term->offsprings, &term->routes};
  claims_by_broker_[term->tag];
  for (const auto& entry : term->offsprings) claims_by_broker_[entry.first];
  FramePtr frame = assemble(term);
  internal_check(claims_.size() == phrases_.size(), "every claim is supplied");
  return frame;
}

FramePtr Assembler::assemble(const TermPtr& term) {
  switch (term->kind) {
    case TermKind::Scalar: {
      internal_check(claims_by_broker_[term->tag].empty(), "a scalar term exports nothing");
      auto frame = std::make_shared<Frame>();
      frame->kind = FrameKind::Scalar;
      frame->tag = term->tag;
      return frame;
    }
    case TermKind::Table: {
      const Table* table = term->space->family.table;
      std::vector<Claim> claims = claims_by_broker_[term->tag];
      for (const auto& claim : claims) {
        internal_check(claim.target == term->tag && claim.unit->kind == CodeKind::Column,
                       "a table term exports its own columns");
        const Column& column = *claim.unit->column;
        internal_check(column.table == table, "a column belongs to the table of its term");
        supply(claim,
               make_column_phrase(term->tag, column, column.is_nullable || gate_.is_nullable));
      }
      auto frame = std::make_shared<Frame>();
      frame->kind = FrameKind::Table;
      frame->tag = term->tag;
      frame->table = table;
      return frame;
    }
    default:
      return assemble_branch(term);
  }
}

/// Builds the SELECT for a unary or binary term.
/// MUST run delegate() before assembling the kids so they know what to export.
FramePtr Assembler::assemble_branch(const TermPtr& term) {
  delegate(*term);
  auto frame = std::make_shared<Frame>();
  frame->kind = term->kind == TermKind::Segment ? FrameKind::Segment : FrameKind::Nested;
  frame->tag = term->tag;
  frame->is_permanent = term->kind == TermKind::Permanent;
  frame->include = assemble_include(*term);

  if (term->kind == TermKind::Embedding) {
    std::unordered_map<CodePtr, PhrasePtr, CodeHash, CodeEq> correlations;
    for (const auto& code : term->correlations) {
      correlations[code] = evaluate(code, nullptr, term->lkid().get());
    }
    correlations_stack_.push_back(std::move(correlations_));
    correlations_ = std::move(correlations);
    push_gate(true, term->rkid().get(), nullptr);
    frame->embed.push_back(assemble(term->rkid()));
    pop_gate();
    correlations_ = std::move(correlations_stack_.back());
    correlations_stack_.pop_back();
  }

  if (term->kind == TermKind::Segment) {
    std::unordered_map<PhrasePtr, size_t, PhraseHash, PhraseEq> index_by_phrase;
    for (const auto& code : term->codes) {
      PhrasePtr phrase = evaluate(code);
      auto found = index_by_phrase.find(phrase);
      if (found == index_by_phrase.end()) {
        found = index_by_phrase.emplace(phrase, frame->select.size()).first;
        frame->select.push_back(phrase);
      }
      frame->outputs.push_back(found->second);
    }
    if (frame->select.empty()) frame->select.push_back(make_true_phrase());
  } else {
    frame->select = assemble_select(*term);
  }

  const Term* kid = term->kids.empty() ? nullptr : term->kid().get();
  switch (term->kind) {
    case TermKind::Filter:
      frame->where = to_predicate(evaluate(term->filter, nullptr, kid));
      break;
    case TermKind::Projection:
      for (const auto& kernel : term->kernels) {
        if (units_of(kernel).empty()) continue;
        frame->group.push_back(evaluate(kernel, nullptr, kid));
      }
      if (frame->group.empty()) frame->group.push_back(make_true_phrase());
      break;
    case TermKind::Order:
      for (const auto& item : term->order) {
        if (units_of(item.first).empty()) continue;
        frame->order.emplace_back(evaluate(item.first, nullptr, kid), item.second);
      }
      frame->limit = term->limit;
      frame->offset = term->offset;
      break;
    default:
      break;
  }
  return frame;
}

void Assembler::delegate(const Term& term) {
  std::vector<Claim> claims = claims_by_broker_[term.tag];
  if (term.kind == TermKind::Segment) {
    internal_check(claims.empty(), "a segment term is never claimed");
    for (const auto& code : term.codes) schedule(code);
    return;
  }
  if (term.kind == TermKind::Correlation) {
    internal_check(claims.size() == 1 && claims.front().target == term.tag,
                   "a correlation term exports exactly one value");
    schedule(claims.front().unit->code);
    return;
  }
  bool is_projection = term.kind == TermKind::Projection;
  if (is_projection) push_gate(std::nullopt, nullptr, term.kid().get());
  for (const auto& claim : claims) {
    if (claim.target != term.tag) {
      demand(forward(claim));
    } else {
      internal_check(claim.unit->is_compound(), "a term computes compound units only");
      schedule(claim.unit->code);
    }
  }
  if (is_projection) {
    for (const auto& kernel : term.kernels) schedule(kernel);
    pop_gate();
  }
  switch (term.kind) {
    case TermKind::Filter:
      schedule(term.filter, nullptr, term.kid().get());
      break;
    case TermKind::Order:
      for (const auto& item : term.order) schedule(item.first, nullptr, term.kid().get());
      break;
    case TermKind::Join:
      for (const auto& joint : term.joints) {
        schedule(joint.lop, nullptr, term.lkid().get());
        schedule(joint.rop, nullptr, term.rkid().get());
      }
      break;
    case TermKind::Embedding:
      for (const auto& code : term.correlations) schedule(code, nullptr, term.lkid().get());
      break;
    default:
      break;
  }
}

std::vector<Anchor> Assembler::assemble_include(const Term& term) {
  std::vector<Anchor> include;
  if (term.kind != TermKind::Join) {
    push_gate(false, term.kid().get(), nullptr);
    include.push_back(Anchor{assemble(term.kid()), nullptr, false, false});
    pop_gate();
    return include;
  }
  push_gate(term.is_right, term.lkid().get(), nullptr);
  include.push_back(Anchor{assemble(term.lkid()), nullptr, false, false});
  pop_gate();
  push_gate(term.is_left, term.rkid().get(), nullptr);
  FramePtr rframe = assemble(term.rkid());
  pop_gate();

  std::vector<PhrasePtr> equalities;
  bool is_nullable = false;
  for (const auto& joint : term.joints) {
    PhrasePtr lop = evaluate(joint.lop, nullptr, term.lkid().get());
    PhrasePtr rop = evaluate(joint.rop, nullptr, term.rkid().get());
    bool nullable = lop->is_nullable || rop->is_nullable;
    is_nullable = is_nullable || nullable;
    equalities.push_back(make_formula_phrase(Signature::polar(SignatureKind::IsEqual, +1),
                                             Domain::boolean(), nullable, {lop, rop}));
  }
  PhrasePtr condition;
  if (!equalities.empty()) {
    condition = make_formula_phrase(Signature::make(SignatureKind::And), Domain::boolean(),
                                    is_nullable, std::move(equalities));
  } else if (term.is_left || term.is_right) {
    condition = to_predicate(make_true_phrase());
  }
  include.push_back(Anchor{rframe, condition, term.is_left, term.is_right});
  return include;
}

/// Exports every claim brokered by the term, one SELECT column per distinct phrase.
std::vector<PhrasePtr> Assembler::assemble_select(const Term& term) {
  std::vector<Claim> claims = claims_by_broker_[term.tag];
  std::vector<PhrasePtr> select;
  if (term.kind == TermKind::Correlation) {
    const Claim& claim = claims.front();
    PhrasePtr phrase = evaluate(claim.unit->code);
    supply(claim, make_embedding_phrase(term.tag, phrase->domain));
    select.push_back(phrase);
    return select;
  }
  bool is_projection = term.kind == TermKind::Projection;
  if (is_projection) push_gate(std::nullopt, nullptr, term.kid().get());
  std::unordered_map<PhrasePtr, size_t, PhraseHash, PhraseEq> index_by_phrase;
  for (const auto& claim : claims) {
    PhrasePtr phrase;
    if (claim.target != term.tag) {
      auto found = phrases_.find(forward(claim));
      internal_check(found != phrases_.end(), "a forwarded claim is supplied by the kid");
      phrase = found->second;
    } else {
      phrase = evaluate(claim.unit->code);
    }
    auto found = index_by_phrase.find(phrase);
    if (found == index_by_phrase.end()) {
      found = index_by_phrase.emplace(phrase, select.size()).first;
      select.push_back(phrase);
    }
    bool is_nullable = phrase->is_nullable || gate_.is_nullable;
    supply(claim, make_reference_phrase(term.tag, found->second, phrase->domain, is_nullable));
  }
  if (is_projection) pop_gate();
  if (select.empty()) select.push_back(make_true_phrase());
  return select;
}

void Assembler::push_gate(std::optional<bool> is_nullable, const Term* dispatcher,
                          const Term* router) {
  if (!router) router = dispatcher;
  Gate gate;
  gate.is_nullable = is_nullable ? *is_nullable : gate_.is_nullable;
  gate.dispatches = dispatcher ? &dispatcher->offsprings : gate_.dispatches;
  gate.routes = router ? &router->routes : gate_.routes;
  gate_stack_.push_back(gate_);
  gate_ = gate;
}

void Assembler::pop_gate() {
  gate_ = gate_stack_.back();
  gate_stack_.pop_back();
}

Claim Assembler::appoint(const CodePtr& unit) const {
  int target = gate_.routes->at(unit);
  auto broker = gate_.dispatches->find(target);
  internal_check(broker != gate_.dispatches->end(), "a routed term is a descendant");
  return Claim{unit, broker->second, target};
}

Claim Assembler::forward(const Claim& claim) const {
  auto broker = gate_.dispatches->find(claim.target);
  internal_check(broker != gate_.dispatches->end(), "a claimed term is a descendant");
  return Claim{claim.unit, broker->second, claim.target};
}

void Assembler::demand(const Claim& claim) {
  if (claims_.insert(claim).second) claims_by_broker_[claim.broker].push_back(claim);
}

void Assembler::supply(const Claim& claim, PhrasePtr phrase) {
  internal_check(claims_.count(claim) != 0, "a supplied claim was demanded");
  bool inserted = phrases_.emplace(claim, std::move(phrase)).second;
  internal_check(inserted, "a claim is supplied once");
}

void Assembler::schedule(const CodePtr& code, const Term* dispatcher, const Term* router) {
  push_gate(std::nullopt, dispatcher, router);
  for (const auto& unit : units_of(code)) demand(appoint(unit));
  pop_gate();
}

PhrasePtr Assembler::evaluate(const CodePtr& code, const Term* dispatcher, const Term* router) {
  push_gate(std::nullopt, dispatcher, router);
  PhrasePtr phrase = evaluate_node(code);
  pop_gate();
  return phrase;
}

PhrasePtr Assembler::evaluate_node(const CodePtr& code) {
  switch (code->kind) {
    case CodeKind::Literal:
      return make_literal_phrase(code->value, code->domain);
    case CodeKind::Parameter:
      return make_parameter_phrase(code->name, code->domain);
    case CodeKind::Cast:
      return make_cast_phrase(evaluate_node(code->base), code->domain);
    case CodeKind::Formula:
      return evaluate_formula(code);
    case CodeKind::Correlation: {
      auto found = correlations_.find(code->code);
      internal_check(found != correlations_.end(), "a correlation is evaluated by its embedding");
      return found->second;
    }
    default: {
      auto found = phrases_.find(appoint(code));
      internal_check(found != phrases_.end(), "a unit is supplied before it is evaluated");
      return found->second;
    }
  }
}

PhrasePtr Assembler::evaluate_formula(const CodePtr& code) {
  std::vector<PhrasePtr> args;
  bool any_nullable = false;
  bool all_nullable = true;
  for (const auto& arg : code->args) {
    args.push_back(evaluate_node(arg));
    any_nullable = any_nullable || args.back()->is_nullable;
    all_nullable = all_nullable && args.back()->is_nullable;
  }
  const Signature& signature = code->signature;
  switch (signature.kind) {
    case SignatureKind::IsEqual:
    case SignatureKind::IsIn:
    case SignatureKind::Compare:
    case SignatureKind::Like:
      return from_predicate(
          make_formula_phrase(signature, code->domain, any_nullable, std::move(args)));
    case SignatureKind::IsTotallyEqual:
    case SignatureKind::IsNull:
    case SignatureKind::Exists:
      return from_predicate(make_formula_phrase(signature, code->domain, false, std::move(args)));
    case SignatureKind::NullIf:
      return make_formula_phrase(signature, code->domain, true, std::move(args));
    case SignatureKind::IfNull:
      return make_formula_phrase(signature, code->domain, all_nullable, std::move(args));
    case SignatureKind::Count:
      return make_formula_phrase(signature, code->domain, false, std::move(args));
    case SignatureKind::And:
    case SignatureKind::Or:
    case SignatureKind::Not:
      for (auto& arg : args) arg = to_predicate(arg);
      return from_predicate(
          make_formula_phrase(signature, code->domain, any_nullable, std::move(args)));
    default:
      return make_formula_phrase(signature, code->domain, any_nullable, std::move(args));
  }
}

}  // namespace navsql
