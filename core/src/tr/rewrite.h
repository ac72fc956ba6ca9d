#pragma once

#include <map>
#include <unordered_map>
#include <utility>
#include <vector>

#include "encode.h"
#include "space.h"

namespace navsql {

/// Simplifies a segment before compilation.
/// MUST preserve the rows and values the segment denotes.
/// Three passes run in order: rewrite drops trivial operations, unmask prunes
/// operations already enforced by the enclosing mask, recombine attaches
/// companions so that similar units share one frame.
class Rewriter {
 public:
  explicit Rewriter(SpacePtr root);

  Segment run(const Segment& segment);

  SpacePtr rewrite(const SpacePtr& space);
  CodePtr rewrite(const CodePtr& code);

  /// Prunes what the mask already guarantees; a null mask uses the current one.
  SpacePtr unmask(const SpacePtr& space, const SpacePtr& mask = nullptr);
  CodePtr unmask(const CodePtr& code, const SpacePtr& mask = nullptr);

 private:
  SpacePtr rewrite_node(const SpacePtr& space);
  CodePtr rewrite_node(const CodePtr& code);
  SpacePtr unmask_node(const SpacePtr& space);
  CodePtr unmask_node(const CodePtr& code);

  void collect(const SpacePtr& space);
  void collect(const CodePtr& code);
  void recombine();
  SpacePtr replace(const SpacePtr& space);
  CodePtr replace(const CodePtr& code);

  SpacePtr root_;
  SpacePtr mask_;
  std::vector<SpacePtr> mask_stack_;

  std::unordered_map<const Space*, SpacePtr> rewritten_spaces_;
  std::unordered_map<const Code*, CodePtr> rewritten_codes_;
  std::map<std::pair<const Space*, const Space*>, SpacePtr> unmasked_spaces_;
  std::map<std::pair<const Space*, const Code*>, CodePtr> unmasked_codes_;

  std::vector<CodePtr> collection_;
  std::unordered_map<CodePtr, std::vector<CodePtr>, CodeHash, CodeEq> unit_companions_;
  std::unordered_map<SpacePtr, std::vector<CodePtr>, SpaceHash, SpaceEq> space_companions_;
  std::unordered_map<const Space*, SpacePtr> replaced_spaces_;
  std::unordered_map<const Code*, CodePtr> replaced_codes_;
};

/// Rewrites and unmasks a space against a mask; used on its own by tests.
SpacePtr rewrite_space(const SpacePtr& space, const SpacePtr& mask);

}  // namespace navsql
