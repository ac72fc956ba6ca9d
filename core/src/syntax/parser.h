#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "lexer.h"
#include "syntax.h"

namespace navsql {

/// Implements recursive-descent parsing over the token stream.
/// MUST preserve token order and MUST set error_ on first failure.
/// Inputs are lexer tokens; outputs are ParseResult with no side effects.
class Parser {
 public:
  /// Constructs a parser for a given query input.
  /// MUST immediately read the first token to initialize state.
  explicit Parser(const std::string& input);
  /// Parses a full query and returns either a QuerySyntax or a ParseError.
  /// MUST consume all tokens or report an unexpected trailing token.
  ParseResult parse();

 private:
  bool parse_flow(SyntaxPtr& out);
  bool parse_selection(SyntaxPtr& out);
  bool parse_disjunction(SyntaxPtr& out);
  bool parse_conjunction(SyntaxPtr& out);
  bool parse_negation(SyntaxPtr& out);
  bool parse_comparison(SyntaxPtr& out);
  bool parse_expression(SyntaxPtr& out);
  bool parse_term(SyntaxPtr& out);
  bool parse_factor(SyntaxPtr& out);
  bool parse_link(SyntaxPtr& out);
  bool parse_location(SyntaxPtr& out);
  bool parse_atom(SyntaxPtr& out);
  bool parse_call(const Token& name, SyntaxPtr& out);
  bool parse_arguments(TokenType close, std::vector<SyntaxPtr>& out);

  bool consume(TokenType type, const std::string& message);
  bool set_error(const std::string& message);
  ParseResult error_result();

  void advance();
  Token peek();

  static SyntaxPtr make_binary(SyntaxKind kind, const std::string& text, SyntaxPtr lhs, SyntaxPtr rhs);
  static bool is_direction_end(TokenType type);

  Lexer lexer_;
  Token current_{};
  Token previous_{};
  Token peek_{};
  bool has_peek_ = false;
  std::optional<ParseError> error_;
};

}  // namespace navsql
