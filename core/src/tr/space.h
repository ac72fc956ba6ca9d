#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "navsql/domain.h"
#include "navsql/entity.h"
#include "navsql/error.h"
#include "signature.h"

namespace navsql {

struct Space;
struct Code;
using SpacePtr = std::shared_ptr<const Space>;
using CodePtr = std::shared_ptr<const Code>;

using Image = std::pair<CodePtr, CodePtr>;
using OrderItem = std::pair<CodePtr, int>;

enum class SpaceKind {
  Root,
  Scalar,
  DirectTable,
  FiberTable,
  Quotient,
  Complement,
  Moniker,
  Forked,
  Linked,
  Filtered,
  Ordered
};

enum class FamilyKind { Scalar, Table, Quotient };

/// Describes the shape of the rows of a space.
/// Table families name the table; quotient families carry seed, ground and kernels.
struct Family {
  FamilyKind kind = FamilyKind::Scalar;
  const Table* table = nullptr;
  SpacePtr seed;
  SpacePtr ground;
  std::vector<CodePtr> kernels;
};

/// One step of a space chain; a space denotes a multiset of rows built from the root.
/// MUST be created through build_space() so derived flags and the hash are consistent.
/// Fields are used per kind; companions and mark never take part in equality.
struct Space {
  SpaceKind kind = SpaceKind::Root;
  SpacePtr base;
  Mark mark;

  const Table* table = nullptr;
  std::optional<Join> join;
  SpacePtr seed;
  std::vector<CodePtr> kernels;
  std::vector<CodePtr> companions;
  std::vector<Image> images;
  CodePtr filter;
  std::vector<OrderItem> order;
  std::optional<int64_t> limit;
  std::optional<int64_t> offset;

  // Derived by build_space().
  Family family;
  SpacePtr ground;
  bool is_axis = false;
  bool is_root = false;
  bool is_contracting = false;
  bool is_expanding = false;
  bool is_inflated = false;
  bool is_commutative = true;
  size_t hash_value = 0;
};

enum class CodeKind {
  Literal,
  Parameter,
  Cast,
  Formula,
  Correlation,
  Column,
  Scalar,
  Aggregate,
  Correlated,
  Kernel,
  Covering
};

/// A scalar or aggregate function over one or more spaces.
/// MUST be created through build_code(); units are the indivisible per-row functions
/// (Column, Scalar, Aggregate, Correlated, Kernel, Covering).
struct Code {
  CodeKind kind = CodeKind::Literal;
  DomainPtr domain;
  Mark mark;

  Value value;
  std::string name;
  CodePtr base;
  CodePtr code;
  Signature signature;
  std::vector<CodePtr> args;
  const Column* column = nullptr;
  SpacePtr space;
  SpacePtr plural_space;
  std::vector<CodePtr> companions;

  // Derived by build_code().
  size_t hash_value = 0;
  std::vector<CodePtr> nested_units;

  bool is_unit() const { return kind >= CodeKind::Column; }
  bool is_compound() const { return kind > CodeKind::Column; }
};

/// Validates a space, computes its derived flags and freezes it.
/// MUST throw std::logic_error when the structural preconditions of the kind fail.
/// Inputs are a space with kind, base and kind fields filled in; outputs are shared nodes.
SpacePtr build_space(Space parts);
CodePtr build_code(Code parts);

SpacePtr make_root(const Mark& mark = {});
SpacePtr make_scalar(SpacePtr base, const Mark& mark = {});
SpacePtr make_direct_table(SpacePtr base, const Table& table, const Mark& mark = {});
SpacePtr make_fiber_table(SpacePtr base, const Join& join, const Mark& mark = {});
SpacePtr make_quotient(SpacePtr base, SpacePtr seed, std::vector<CodePtr> kernels,
                       const Mark& mark = {}, std::vector<CodePtr> companions = {});
SpacePtr make_complement(SpacePtr base, const Mark& mark = {},
                         std::vector<CodePtr> companions = {});
SpacePtr make_moniker(SpacePtr base, SpacePtr seed, const Mark& mark = {},
                      std::vector<CodePtr> companions = {});
SpacePtr make_forked(SpacePtr base, SpacePtr seed, std::vector<CodePtr> kernels,
                     const Mark& mark = {}, std::vector<CodePtr> companions = {});
SpacePtr make_linked(SpacePtr base, SpacePtr seed, std::vector<Image> images,
                     const Mark& mark = {}, std::vector<CodePtr> companions = {});
SpacePtr make_filtered(SpacePtr base, CodePtr filter, const Mark& mark = {});
SpacePtr make_ordered(SpacePtr base, std::vector<OrderItem> order,
                      std::optional<int64_t> limit, std::optional<int64_t> offset,
                      const Mark& mark = {});

/// Rebuilds a space over a different base, keeping every other field.
SpacePtr space_with_base(const SpacePtr& space, SpacePtr base);
SpacePtr space_with_companions(const SpacePtr& space, std::vector<CodePtr> companions);

CodePtr make_literal(Value value, DomainPtr domain, const Mark& mark = {});
CodePtr make_parameter(std::string name, DomainPtr domain, const Mark& mark = {});
CodePtr make_cast(CodePtr base, DomainPtr domain, const Mark& mark = {});
CodePtr make_formula(Signature signature, DomainPtr domain, std::vector<CodePtr> args,
                     const Mark& mark = {});
CodePtr make_correlation(CodePtr code);
CodePtr make_column_unit(const Column& column, SpacePtr space, const Mark& mark = {});
CodePtr make_scalar_unit(CodePtr code, SpacePtr space, const Mark& mark = {},
                         std::vector<CodePtr> companions = {});
CodePtr make_aggregate_unit(CodePtr code, SpacePtr plural_space, SpacePtr space,
                            const Mark& mark = {}, std::vector<CodePtr> companions = {});
CodePtr make_correlated_unit(CodePtr code, SpacePtr plural_space, SpacePtr space,
                             const Mark& mark = {});
CodePtr make_kernel_unit(CodePtr code, SpacePtr space, const Mark& mark = {});
CodePtr make_covering_unit(CodePtr code, SpacePtr space, const Mark& mark = {});

/// Rebuilds a unit over a different space, keeping every other field.
CodePtr unit_with_space(const CodePtr& unit, SpacePtr space);
CodePtr code_with_companions(const CodePtr& unit, std::vector<CodePtr> companions);

/// Returns the units a code is built from; a unit returns itself.
std::vector<CodePtr> units_of(const CodePtr& code);

bool same_space(const SpacePtr& left, const SpacePtr& right);
bool same_code(const CodePtr& left, const CodePtr& right);

struct SpaceHash {
  size_t operator()(const SpacePtr& space) const { return space ? space->hash_value : 0; }
};
struct SpaceEq {
  bool operator()(const SpacePtr& left, const SpacePtr& right) const {
    return same_space(left, right);
  }
};
struct CodeHash {
  size_t operator()(const CodePtr& code) const { return code ? code->hash_value : 0; }
};
struct CodeEq {
  bool operator()(const CodePtr& left, const CodePtr& right) const {
    return same_code(left, right);
  }
};

/// Lists the space and its ancestors, from the space itself down to the root.
std::vector<SpacePtr> unfold(const SpacePtr& space);
/// Tells whether two spaces apply the same operation, ignoring their bases.
bool resembles(const SpacePtr& left, const SpacePtr& right);
/// Rebuilds the space keeping only its axis ancestors.
/// MUST return the space itself when it is already inflated.
/// Inputs are any space; outputs satisfy is_inflated.
SpacePtr inflate(const SpacePtr& space);
/// Drops the non-axis operations of the space that the other space already applies.
SpacePtr prune(const SpacePtr& space, const SpacePtr& other);
/// Tells whether every row of `space` determines at most one row of `other`.
/// MUST be reflexive; unmatched axes of `other` must all be contracting.
bool spans(const SpacePtr& space, const SpacePtr& other);
/// Tells whether `space` spans `other` and its extra axes lose no rows.
/// MUST be reflexive and MUST imply spans().
bool dominates(const SpacePtr& space, const SpacePtr& other);
/// Tells whether both spaces denote the same rows up to one-to-one operations.
bool conforms(const SpacePtr& space, const SpacePtr& other);
/// Tells whether `other` appears verbatim among the ancestors of `space`.
bool concludes(const SpacePtr& space, const SpacePtr& other);

std::string space_to_string(const SpacePtr& space);
std::string code_to_string(const CodePtr& code);

}  // namespace navsql
