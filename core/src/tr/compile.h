#pragma once

#include <vector>

#include "encode.h"
#include "term.h"

namespace navsql {

/// Translates a rewritten segment into a tree of relational terms.
/// MUST report units that are not singular against their term as Error and MUST
/// never change the row count of a trunk while attaching shoots to it.
/// Inputs are segments produced by the rewriter; every call uses fresh tags.
class Compiler {
 public:
  explicit Compiler(SpacePtr root);

  TermPtr compile_segment(const Segment& segment);

  /// Compiles a space; terms may omit the axes strictly below `baseline`.
  /// A null baseline keeps the one of the enclosing call.
  TermPtr compile(const SpacePtr& space, const SpacePtr& baseline = nullptr);
  /// Grows the term until it routes every unit of the given codes.
  TermPtr inject(TermPtr term, const std::vector<CodePtr>& codes);

 private:
  int next_tag() { return next_tag_++; }

  TermPtr compile_node(const SpacePtr& space);
  TermPtr compile_scalar(const SpacePtr& space);
  TermPtr compile_table(const SpacePtr& space);
  TermPtr compile_quotient(const SpacePtr& space);
  TermPtr compile_complement(const SpacePtr& space);
  TermPtr compile_covering(const SpacePtr& space);
  TermPtr compile_filtered(const SpacePtr& space);
  TermPtr compile_ordered(const SpacePtr& space);

  TermPtr inject_space(TermPtr term, const SpacePtr& space);
  TermPtr inject_unit(TermPtr term, const CodePtr& unit);
  TermPtr inject_scalar(TermPtr term, const CodePtr& unit);
  TermPtr inject_aggregate(TermPtr term, const CodePtr& unit);
  TermPtr inject_correlated(TermPtr term, const CodePtr& unit);
  TermPtr inject_covering(TermPtr term, const CodePtr& unit);

  TermPtr compile_shoot(const SpacePtr& space, const SpacePtr& trunk,
                        const std::vector<CodePtr>* codes = nullptr);
  std::vector<Joint> glue_spaces(const SpacePtr& space, const SpacePtr& baseline,
                                 const SpacePtr& shoot, const SpacePtr& shoot_baseline);
  std::vector<Joint> glue_terms(const TermPtr& trunk, const TermPtr& shoot);
  TermPtr inject_joints(TermPtr term, const std::vector<Joint>& joints);
  TermPtr join_terms(TermPtr trunk, const TermPtr& shoot, const Routes& extra_routes);

  int next_tag_ = 1;
  SpacePtr root_;
  SpacePtr baseline_;
  std::vector<SpacePtr> baseline_stack_;
};

}  // namespace navsql
