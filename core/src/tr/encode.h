#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "bind/binding.h"
#include "space.h"

namespace navsql {

/// The top-level output of the encoder: the rows to produce and the values per row.
/// `root` is the space every row is correlated with; `space` is the flow of rows.
struct Segment {
  SpacePtr root;
  SpacePtr space;
  std::vector<CodePtr> codes;
  Mark mark;
};

/// Translates bindings into spaces and codes.
/// MUST report invalid plural operands and failed literal conversions as Error.
/// Inputs are bindings produced by the binder; relate() and encode() memoize per node.
class Encoder {
 public:
  /// Encodes a Collect binding into the segment the compiler starts from.
  Segment collect(const BindingPtr& binding);

  CodePtr encode(const BindingPtr& binding);
  SpacePtr relate(const BindingPtr& binding);

 private:
  SpacePtr relate_node(const BindingPtr& binding);
  CodePtr encode_node(const BindingPtr& binding);
  CodePtr convert(const BindingPtr& binding);
  CodePtr convert_untyped(const BindingPtr& binding);
  CodePtr encode_formula(const BindingPtr& binding);
  CodePtr encode_contains(const BindingPtr& binding);
  CodePtr encode_aggregate(const BindingPtr& binding, const CodePtr& op);
  CodePtr encode_quantify(const BindingPtr& binding);
  SpacePtr plural_space(const CodePtr& op, const SpacePtr& space, const Mark& mark);

  std::unordered_map<const Binding*, SpacePtr> spaces_;
  std::unordered_map<const Binding*, CodePtr> codes_;
};

std::string dump_segment(const Segment& segment);

}  // namespace navsql
