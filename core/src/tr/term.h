#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "space.h"
#include "stitch.h"

namespace navsql {

/// Maps every unit a term can produce to the tag of the descendant computing it.
/// MUST keep insertion order so covering units are generated deterministically.
class Routes {
 public:
  bool contains(const CodePtr& unit) const { return index_.count(unit) != 0; }
  /// Returns the tag routed for the unit or -1 when the unit is missing.
  int find(const CodePtr& unit) const;
  int at(const CodePtr& unit) const;
  void set(const CodePtr& unit, int tag);
  void update(const Routes& other);

  size_t size() const { return entries_.size(); }
  std::vector<std::pair<CodePtr, int>>::const_iterator begin() const { return entries_.begin(); }
  std::vector<std::pair<CodePtr, int>>::const_iterator end() const { return entries_.end(); }

 private:
  std::vector<std::pair<CodePtr, int>> entries_;
  std::unordered_map<CodePtr, size_t, CodeHash, CodeEq> index_;
};

enum class TermKind {
  Scalar,
  Table,
  Filter,
  Join,
  Embedding,
  Correlation,
  Projection,
  Order,
  Wrapper,
  Permanent,
  Segment
};

struct Term;
using TermPtr = std::shared_ptr<const Term>;

/// One relational operation of the compiled query.
/// MUST carry a tag unique within the tree; `space` is the promise the term keeps
/// once tied to its neighbours and `baseline` is the leftmost axis it exports.
/// Fields beyond the common ones are used per kind.
struct Term {
  TermKind kind = TermKind::Scalar;
  int tag = 0;
  std::vector<TermPtr> kids;
  SpacePtr space;
  SpacePtr baseline;
  SpacePtr backbone;
  Routes routes;
  // Maps the tag of every descendant to the tag of the kid holding it.
  std::unordered_map<int, int> offsprings;

  CodePtr filter;
  std::vector<Joint> joints;
  bool is_left = false;
  bool is_right = false;
  std::vector<CodePtr> kernels;
  std::vector<CodePtr> correlations;
  std::vector<OrderItem> order;
  std::optional<int64_t> limit;
  std::optional<int64_t> offset;
  std::vector<CodePtr> codes;

  bool is_nullary() const { return kids.empty(); }
  const TermPtr& kid() const { return kids.front(); }
  const TermPtr& lkid() const { return kids.front(); }
  const TermPtr& rkid() const { return kids.back(); }
};

TermPtr make_scalar_term(int tag, SpacePtr space, SpacePtr baseline, Routes routes);
TermPtr make_table_term(int tag, SpacePtr space, SpacePtr baseline, Routes routes);
TermPtr make_filter_term(int tag, TermPtr kid, CodePtr filter, SpacePtr space,
                         SpacePtr baseline, Routes routes);
TermPtr make_join_term(int tag, TermPtr lkid, TermPtr rkid, std::vector<Joint> joints,
                       bool is_left, bool is_right, SpacePtr space, SpacePtr baseline,
                       Routes routes);
TermPtr make_embedding_term(int tag, TermPtr lkid, TermPtr rkid,
                            std::vector<CodePtr> correlations, SpacePtr space,
                            SpacePtr baseline, Routes routes);
TermPtr make_correlation_term(int tag, TermPtr kid, SpacePtr space, SpacePtr baseline,
                              Routes routes);
TermPtr make_projection_term(int tag, TermPtr kid, std::vector<CodePtr> kernels,
                             SpacePtr space, SpacePtr baseline, Routes routes);
TermPtr make_order_term(int tag, TermPtr kid, std::vector<OrderItem> order,
                        std::optional<int64_t> limit, std::optional<int64_t> offset,
                        SpacePtr space, SpacePtr baseline, Routes routes);
TermPtr make_wrapper_term(int tag, TermPtr kid, SpacePtr space, SpacePtr baseline,
                          Routes routes);
/// A wrapper the reducer never merges into its parent.
TermPtr make_permanent_term(int tag, TermPtr kid, SpacePtr space, SpacePtr baseline,
                            Routes routes);
TermPtr make_segment_term(int tag, TermPtr kid, std::vector<CodePtr> codes, SpacePtr space,
                          SpacePtr baseline, Routes routes);

std::string dump_term(const TermPtr& term);

}  // namespace navsql
