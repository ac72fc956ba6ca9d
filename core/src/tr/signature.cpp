#include "signature.h"

#include <functional>

namespace navsql {

bool Signature::is_aggregate() const {
  switch (kind) {
    case SignatureKind::Count:
    case SignatureKind::Sum:
    case SignatureKind::Min:
    case SignatureKind::Max:
    case SignatureKind::Avg:
      return true;
    default:
      return false;
  }
}

bool Signature::is_null_regular() const {
  switch (kind) {
    case SignatureKind::IsEqual:
    case SignatureKind::Compare:
    case SignatureKind::Add:
    case SignatureKind::Subtract:
    case SignatureKind::Multiply:
    case SignatureKind::Divide:
    case SignatureKind::Negate:
    case SignatureKind::Like:
    case SignatureKind::Concat:
      return true;
    default:
      return false;
  }
}

size_t Signature::hash() const {
  size_t seed = static_cast<size_t>(kind) * 1000003u;
  seed ^= static_cast<size_t>(polarity + 7) * 31u;
  seed ^= std::hash<std::string>()(op) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
  return seed;
}

std::string Signature::to_string() const {
  auto sign = [this](const std::string& positive, const std::string& negative) {
    return polarity < 0 ? negative : positive;
  };
  switch (kind) {
    case SignatureKind::IsEqual: return sign("=", "!=");
    case SignatureKind::IsTotallyEqual: return sign("==", "!==");
    case SignatureKind::IsIn: return sign("in", "not_in");
    case SignatureKind::IsNull: return sign("is_null", "is_not_null");
    case SignatureKind::Compare: return op;
    case SignatureKind::And: return "&";
    case SignatureKind::Or: return "|";
    case SignatureKind::Not: return "!";
    case SignatureKind::NullIf: return "null_if";
    case SignatureKind::IfNull: return "if_null";
    case SignatureKind::Add: return "+";
    case SignatureKind::Subtract: return "-";
    case SignatureKind::Multiply: return "*";
    case SignatureKind::Divide: return "/";
    case SignatureKind::Negate: return "negate";
    case SignatureKind::Like: return sign("~", "!~");
    case SignatureKind::Concat: return "concat";
    case SignatureKind::Replace: return "replace";
    case SignatureKind::Count: return "count";
    case SignatureKind::Sum: return "sum";
    case SignatureKind::Min: return "min";
    case SignatureKind::Max: return "max";
    case SignatureKind::Avg: return "avg";
    case SignatureKind::Exists: return "exists";
    case SignatureKind::ToPredicate: return "to_predicate";
    case SignatureKind::FromPredicate: return "from_predicate";
  }
  return "?";
}

}  // namespace navsql
