#pragma once

#include <cstddef>
#include <string>

namespace navsql {

enum class SignatureKind {
  IsEqual,
  IsTotallyEqual,
  IsIn,
  IsNull,
  Compare,
  And,
  Or,
  Not,
  NullIf,
  IfNull,
  Add,
  Subtract,
  Multiply,
  Divide,
  Negate,
  Like,
  Concat,
  Replace,
  Count,
  Sum,
  Min,
  Max,
  Avg,
  Exists,
  ToPredicate,
  FromPredicate
};

/// Names a formula operator together with its polarity or comparison symbol.
/// MUST compare by value so formulas with equal operators and arguments are equal.
/// Polarity is +1/-1 for IsEqual, IsTotallyEqual, IsIn, IsNull and Like; op holds
/// the comparison symbol for Compare.
struct Signature {
  SignatureKind kind = SignatureKind::And;
  int polarity = 0;
  std::string op;

  static Signature make(SignatureKind kind) { return Signature{kind, 0, {}}; }
  static Signature polar(SignatureKind kind, int polarity) { return Signature{kind, polarity, {}}; }
  static Signature compare(const std::string& op) { return Signature{SignatureKind::Compare, 0, op}; }

  bool is_aggregate() const;
  /// Operators whose result is NULL whenever any operand is NULL.
  bool is_null_regular() const;

  bool operator==(const Signature& other) const {
    return kind == other.kind && polarity == other.polarity && op == other.op;
  }
  bool operator!=(const Signature& other) const { return !(*this == other); }
  size_t hash() const;
  std::string to_string() const;
};

}  // namespace navsql
