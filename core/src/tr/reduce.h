#pragma once

#include <unordered_map>
#include <vector>

#include "frame.h"

namespace navsql {

/// Flattens nested SELECTs and simplifies phrases of an assembled frame tree.
/// MUST preserve the rows and the select list of the top frame.
/// Inputs are frames produced by the assembler; one reducer per tree.
class Reducer {
 public:
  FramePtr run(const FramePtr& frame);

  /// Merges nested frames into their parents, children first.
  FramePtr collapse(const FramePtr& frame);
  /// Substitutes merged frames and folds constant phrases.
  FramePtr reduce(const FramePtr& frame);
  PhrasePtr reduce_phrase(const PhrasePtr& phrase);

 private:
  bool absorb_head(Frame& frame);
  void unwrap_anchors(Frame& frame);

  PhrasePtr reduce_formula(const PhrasePtr& phrase, std::vector<PhrasePtr> args);
  PhrasePtr reduce_connective(const PhrasePtr& phrase, std::vector<PhrasePtr> args);

  std::unordered_map<int, std::vector<PhrasePtr>> substitutes_;
};

}  // namespace navsql
