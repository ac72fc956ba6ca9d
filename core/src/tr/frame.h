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
#include "signature.h"

namespace navsql {

enum class PhraseKind {
  Literal,
  Parameter,
  Cast,
  Formula,
  // Exports read from a child frame.
  Column,
  Reference,
  Embedding
};

struct Phrase;
using PhrasePtr = std::shared_ptr<const Phrase>;

/// A scalar SQL expression.
/// MUST compare by value (ignoring nullability) so that equal expressions share
/// one SELECT column. `tag` names the frame an export reads from.
struct Phrase {
  PhraseKind kind = PhraseKind::Literal;
  DomainPtr domain;
  bool is_nullable = true;

  Value value;
  std::string name;
  Signature signature;
  std::vector<PhrasePtr> args;
  int tag = 0;
  const Column* column = nullptr;
  size_t index = 0;

  size_t hash_value = 0;
};

PhrasePtr make_literal_phrase(Value value, DomainPtr domain);
PhrasePtr make_true_phrase();
PhrasePtr make_parameter_phrase(std::string name, DomainPtr domain);
PhrasePtr make_cast_phrase(PhrasePtr base, DomainPtr domain);
PhrasePtr make_formula_phrase(Signature signature, DomainPtr domain, bool is_nullable,
                              std::vector<PhrasePtr> args);
PhrasePtr make_column_phrase(int tag, const Column& column, bool is_nullable);
PhrasePtr make_reference_phrase(int tag, size_t index, DomainPtr domain, bool is_nullable);
PhrasePtr make_embedding_phrase(int tag, DomainPtr domain);

bool same_phrase(const PhrasePtr& left, const PhrasePtr& right);
bool is_literal(const PhrasePtr& phrase);
/// Tells whether the phrase is a non-null boolean literal with the given value.
bool is_boolean_literal(const PhrasePtr& phrase, bool value);

struct PhraseHash {
  size_t operator()(const PhrasePtr& phrase) const { return phrase ? phrase->hash_value : 0; }
};
struct PhraseEq {
  bool operator()(const PhrasePtr& left, const PhrasePtr& right) const {
    return same_phrase(left, right);
  }
};

enum class FrameKind { Scalar, Table, Nested, Segment };

struct Frame;
using FramePtr = std::shared_ptr<const Frame>;

/// One FROM entry; the first anchor of a frame has no condition.
struct Anchor {
  FramePtr frame;
  PhrasePtr condition;
  bool is_left = false;
  bool is_right = false;

  bool is_cross() const { return !condition && !is_left && !is_right; }
};

using SortItem = std::pair<PhrasePtr, int>;

/// A SELECT statement; frames compare by identity.
/// MUST keep a non-empty select list for nested and segment frames.
/// `tag` is the tag of the term the frame was assembled from.
struct Frame {
  FrameKind kind = FrameKind::Scalar;
  int tag = 0;
  const Table* table = nullptr;
  bool is_permanent = false;

  std::vector<Anchor> include;
  std::vector<FramePtr> embed;
  std::vector<PhrasePtr> select;
  PhrasePtr where;
  std::vector<PhrasePtr> group;
  PhrasePtr having;
  std::vector<SortItem> order;
  std::optional<int64_t> limit;
  std::optional<int64_t> offset;

  // Segment frames only: the select position producing each output field.
  std::vector<size_t> outputs;

  bool is_leaf() const { return kind == FrameKind::Scalar || kind == FrameKind::Table; }
};

std::string phrase_to_string(const PhrasePtr& phrase);
std::string dump_frame(const FramePtr& frame);

}  // namespace navsql
