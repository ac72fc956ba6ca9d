#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace navsql {

struct Span {
  size_t start = 0;
  size_t end = 0;
};

enum class SyntaxKind {
  Identifier,
  String,
  Integer,
  Decimal,
  Float,
  Reference,
  Apply,
  Compose,
  Sieve,
  Project,
  Select,
  Record,
  Direct,
  Operator,
  Prefix,
  Wildcard,
  Complement,
  Link,
  Group
};

struct Syntax;
using SyntaxPtr = std::shared_ptr<const Syntax>;

/// One node of the concrete query syntax.
/// MUST keep span covering the full source fragment of the node.
/// Fields are used per kind: text holds names, literals and operator symbols;
/// lhs/rhs hold operands of binary forms; args holds call arguments and record fields.
struct Syntax {
  SyntaxKind kind = SyntaxKind::Identifier;
  std::string text;
  SyntaxPtr lhs;
  SyntaxPtr rhs;
  std::vector<SyntaxPtr> args;
  int direction = 0;
  Span span;
};

/// A parsed query: the leading '/' followed by an optional flow.
struct QuerySyntax {
  SyntaxPtr flow;
  Span span;
};

/// Describes a parse failure with a message and byte position.
/// MUST report positions relative to the original input string.
struct ParseError {
  std::string message;
  size_t position = 0;
};

/// Wraps either a parsed query or a ParseError.
/// MUST contain exactly one of query or error.
struct ParseResult {
  std::optional<QuerySyntax> query;
  std::optional<ParseError> error;
};

/// Parses query text into a syntax tree.
/// MUST return errors without throwing on invalid syntax.
/// Inputs are query text; outputs are ParseResult with optional error.
ParseResult parse_query(const std::string& input);

/// Renders a syntax node back to canonical query text for headers and debugging.
std::string syntax_to_string(const Syntax& syntax);

}  // namespace navsql
