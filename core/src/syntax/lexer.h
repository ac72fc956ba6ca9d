#pragma once

#include <string>

#include "tokens.h"

namespace navsql {

/// Tokenizes query input into a stream for the parser.
/// MUST be deterministic and MUST not skip meaningful characters.
/// Inputs are query strings; outputs are tokens with position metadata.
class Lexer {
 public:
  /// Constructs a lexer over a stable input string reference.
  /// MUST NOT outlive the referenced input buffer.
  explicit Lexer(const std::string& input);
  /// Produces the next token from the input stream.
  /// MUST advance the cursor and MUST return End at input exhaustion.
  /// Inputs are internal state; outputs are tokens with positions.
  Token next();

 private:
  /// Lexes a single-quoted string where a doubled quote stands for one quote.
  /// MUST return an Invalid token when the closing quote is missing.
  Token lex_string();
  Token lex_name();
  /// Lexes integer, decimal (with a point) and float (with an exponent) literals.
  /// MUST only consume a point when a digit follows it.
  Token lex_number();
  Token lex_reference();
  Token make(TokenType type, size_t start, std::string text);
  void skip_ws();
  static bool is_name_start(char c);
  static bool is_name_char(char c);

  const std::string& input_;
  size_t pos_ = 0;
};

}  // namespace navsql
