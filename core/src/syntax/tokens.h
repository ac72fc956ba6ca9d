#pragma once

#include <cstddef>
#include <string>

namespace navsql {

/// Enumerates lexical tokens produced by the query lexer.
/// MUST remain consistent with parser expectations.
/// Inputs are characters; outputs are token kinds with no side effects.
enum class TokenType {
  Name,
  String,
  Integer,
  Decimal,
  Float,
  Reference,
  Slash,
  Dot,
  Comma,
  LParen,
  RParen,
  LBrace,
  RBrace,
  Semicolon,
  Question,
  Caret,
  Star,
  Plus,
  Minus,
  Pipe,
  Ampersand,
  Bang,
  Equal,
  NotEqual,
  TotallyEqual,
  TotallyNotEqual,
  Contains,
  NotContains,
  Less,
  LessEqual,
  Greater,
  GreaterEqual,
  Arrow,
  Invalid,
  End
};

/// Represents a single token with source text and position metadata.
/// MUST track byte positions to support precise error reporting.
/// Inputs are lexer output; outputs are consumed by the parser.
struct Token {
  TokenType type;
  std::string text;
  size_t pos = 0;
  size_t end = 0;
};

}  // namespace navsql
