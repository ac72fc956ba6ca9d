#pragma once

#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "frame.h"
#include "term.h"

namespace navsql {

/// A request that the `broker` frame export a value computed by `target`.
struct Claim {
  CodePtr unit;
  int broker = 0;
  int target = 0;
};

struct ClaimHash {
  size_t operator()(const Claim& claim) const;
};
struct ClaimEq {
  bool operator()(const Claim& left, const Claim& right) const;
};

/// Translates a term tree into a frame tree.
/// MUST supply every demanded claim exactly once before the top frame is returned.
/// Inputs are segment terms produced by the compiler; one assembler per tree.
class Assembler {
 public:
  FramePtr assemble_segment(const TermPtr& term);

  /// Number of claims demanded and supplied so far.
  size_t demanded() const { return claims_.size(); }
  size_t supplied() const { return phrases_.size(); }

 private:
  struct Gate {
    bool is_nullable = false;
    const std::unordered_map<int, int>* dispatches = nullptr;
    const Routes* routes = nullptr;
  };

  FramePtr assemble(const TermPtr& term);
  FramePtr assemble_branch(const TermPtr& term);

  void push_gate(std::optional<bool> is_nullable, const Term* dispatcher, const Term* router);
  void pop_gate();

  Claim appoint(const CodePtr& unit) const;
  Claim forward(const Claim& claim) const;
  void demand(const Claim& claim);
  void supply(const Claim& claim, PhrasePtr phrase);
  void schedule(const CodePtr& code, const Term* dispatcher = nullptr, const Term* router = nullptr);
  PhrasePtr evaluate(const CodePtr& code, const Term* dispatcher = nullptr,
                     const Term* router = nullptr);
  PhrasePtr evaluate_node(const CodePtr& code);
  PhrasePtr evaluate_formula(const CodePtr& code);

  void delegate(const Term& term);
  std::vector<PhrasePtr> assemble_select(const Term& term);
  std::vector<Anchor> assemble_include(const Term& term);

  Gate gate_;
  std::vector<Gate> gate_stack_;
  std::unordered_set<Claim, ClaimHash, ClaimEq> claims_;
  std::unordered_map<int, std::vector<Claim>> claims_by_broker_;
  std::unordered_map<Claim, PhrasePtr, ClaimHash, ClaimEq> phrases_;
  std::unordered_map<CodePtr, PhrasePtr, CodeHash, CodeEq> correlations_;
  std::vector<std::unordered_map<CodePtr, PhrasePtr, CodeHash, CodeEq>> correlations_stack_;
};

PhrasePtr to_predicate(const PhrasePtr& phrase);
PhrasePtr from_predicate(const PhrasePtr& phrase);

}  // namespace navsql
