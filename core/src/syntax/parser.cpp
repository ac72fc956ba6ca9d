#include "parser.h"

#include <sstream>

namespace navsql {

Parser::Parser(const std::string& input) : lexer_(input) { advance(); }

ParseResult Parser::parse() {
  QuerySyntax query;
  size_t start = current_.pos;
  if (!consume(TokenType::Slash, "Expected '/' at the start of a query")) return error_result();
  if (current_.type != TokenType::End && current_.type != TokenType::Semicolon) {
    if (!parse_flow(query.flow)) return error_result();
  }
  if (current_.type == TokenType::Semicolon) {
    advance();
  }
  if (current_.type != TokenType::End) {
    set_error("Unexpected token '" + current_.text + "' after query");
    return error_result();
  }
  query.span = Span{start, previous_.end};
  ParseResult res;
  res.query = query;
  return res;
}

SyntaxPtr Parser::make_binary(SyntaxKind kind, const std::string& text, SyntaxPtr lhs, SyntaxPtr rhs) {
  auto node = std::make_shared<Syntax>();
  node->kind = kind;
  node->text = text;
  node->span = Span{lhs->span.start, rhs->span.end};
  node->lhs = std::move(lhs);
  node->rhs = std::move(rhs);
  return node;
}

bool Parser::is_direction_end(TokenType type) {
  return type == TokenType::Comma || type == TokenType::RParen || type == TokenType::RBrace ||
         type == TokenType::End || type == TokenType::Semicolon;
}

/// Parses sieves, projections and selections applied to a disjunction.
/// MUST allow '.' navigation after a selection.
bool Parser::parse_flow(SyntaxPtr& out) {
  if (!parse_disjunction(out)) return false;
  while (true) {
    if (current_.type == TokenType::Question || current_.type == TokenType::Caret) {
      SyntaxKind kind = current_.type == TokenType::Question ? SyntaxKind::Sieve : SyntaxKind::Project;
      std::string symbol = current_.text;
      advance();
      SyntaxPtr rhs;
      if (!parse_disjunction(rhs)) return false;
      out = make_binary(kind, symbol, out, rhs);
      continue;
    }
    if (current_.type == TokenType::LBrace) {
      SyntaxPtr record;
      if (!parse_selection(record)) return false;
      out = make_binary(SyntaxKind::Select, "", out, record);
      while (current_.type == TokenType::Dot) {
        advance();
        SyntaxPtr rhs;
        if (!parse_atom(rhs)) return false;
        out = make_binary(SyntaxKind::Compose, ".", out, rhs);
      }
      continue;
    }
    return true;
  }
}

bool Parser::parse_selection(SyntaxPtr& out) {
  size_t start = current_.pos;
  if (!consume(TokenType::LBrace, "Expected '{'")) return false;
  auto node = std::make_shared<Syntax>();
  node->kind = SyntaxKind::Record;
  if (!parse_arguments(TokenType::RBrace, node->args)) return false;
  node->span = Span{start, previous_.end};
  out = node;
  return true;
}

bool Parser::parse_disjunction(SyntaxPtr& out) {
  if (!parse_conjunction(out)) return false;
  while (current_.type == TokenType::Pipe) {
    advance();
    SyntaxPtr rhs;
    if (!parse_conjunction(rhs)) return false;
    out = make_binary(SyntaxKind::Operator, "|", out, rhs);
  }
  return true;
}

bool Parser::parse_conjunction(SyntaxPtr& out) {
  if (!parse_negation(out)) return false;
  while (current_.type == TokenType::Ampersand) {
    advance();
    SyntaxPtr rhs;
    if (!parse_negation(rhs)) return false;
    out = make_binary(SyntaxKind::Operator, "&", out, rhs);
  }
  return true;
}

bool Parser::parse_negation(SyntaxPtr& out) {
  if (current_.type == TokenType::Bang) {
    size_t start = current_.pos;
    advance();
    SyntaxPtr arm;
    if (!parse_negation(arm)) return false;
    auto node = std::make_shared<Syntax>();
    node->kind = SyntaxKind::Prefix;
    node->text = "!";
    node->span = Span{start, arm->span.end};
    node->lhs = arm;
    out = node;
    return true;
  }
  return parse_comparison(out);
}

bool Parser::parse_comparison(SyntaxPtr& out) {
  if (!parse_expression(out)) return false;
  switch (current_.type) {
    case TokenType::Equal:
    case TokenType::NotEqual:
    case TokenType::TotallyEqual:
    case TokenType::TotallyNotEqual:
    case TokenType::Contains:
    case TokenType::NotContains:
    case TokenType::Less:
    case TokenType::LessEqual:
    case TokenType::Greater:
    case TokenType::GreaterEqual: {
      std::string symbol = current_.text;
      advance();
      SyntaxPtr rhs;
      if (!parse_expression(rhs)) return false;
      out = make_binary(SyntaxKind::Operator, symbol, out, rhs);
      return true;
    }
    default:
      return true;
  }
}

/// Parses additive expressions; a trailing '+'/'-' before a closing token is a sort direction.
bool Parser::parse_expression(SyntaxPtr& out) {
  if (!parse_term(out)) return false;
  while (current_.type == TokenType::Plus || current_.type == TokenType::Minus) {
    Token op = current_;
    if (is_direction_end(peek().type)) {
      advance();
      auto node = std::make_shared<Syntax>();
      node->kind = SyntaxKind::Direct;
      node->direction = op.type == TokenType::Plus ? 1 : -1;
      node->span = Span{out->span.start, op.end};
      node->lhs = out;
      out = node;
      return true;
    }
    advance();
    SyntaxPtr rhs;
    if (!parse_term(rhs)) return false;
    out = make_binary(SyntaxKind::Operator, op.text, out, rhs);
  }
  return true;
}

bool Parser::parse_term(SyntaxPtr& out) {
  if (!parse_factor(out)) return false;
  while (current_.type == TokenType::Star || current_.type == TokenType::Slash) {
    std::string symbol = current_.text;
    advance();
    SyntaxPtr rhs;
    if (!parse_factor(rhs)) return false;
    out = make_binary(SyntaxKind::Operator, symbol, out, rhs);
  }
  return true;
}

bool Parser::parse_factor(SyntaxPtr& out) {
  if (current_.type == TokenType::Plus || current_.type == TokenType::Minus) {
    Token op = current_;
    advance();
    SyntaxPtr arm;
    if (!parse_factor(arm)) return false;
    auto node = std::make_shared<Syntax>();
    node->kind = SyntaxKind::Prefix;
    node->text = op.text;
    node->span = Span{op.pos, arm->span.end};
    node->lhs = arm;
    out = node;
    return true;
  }
  return parse_link(out);
}

bool Parser::parse_link(SyntaxPtr& out) {
  if (!parse_location(out)) return false;
  if (current_.type == TokenType::Arrow) {
    advance();
    SyntaxPtr rhs;
    if (!parse_location(rhs)) return false;
    out = make_binary(SyntaxKind::Link, "->", out, rhs);
  }
  return true;
}

bool Parser::parse_location(SyntaxPtr& out) {
  if (!parse_atom(out)) return false;
  while (current_.type == TokenType::Dot) {
    advance();
    SyntaxPtr rhs;
    if (!parse_atom(rhs)) return false;
    out = make_binary(SyntaxKind::Compose, ".", out, rhs);
  }
  return true;
}

bool Parser::parse_atom(SyntaxPtr& out) {
  Token token = current_;
  auto node = std::make_shared<Syntax>();
  node->span = Span{token.pos, token.end};
  switch (token.type) {
    case TokenType::Name:
      advance();
      if (current_.type == TokenType::LParen) {
        return parse_call(token, out);
      }
      node->kind = SyntaxKind::Identifier;
      node->text = token.text;
      out = node;
      return true;
    case TokenType::Reference:
      advance();
      node->kind = SyntaxKind::Reference;
      node->text = token.text;
      out = node;
      return true;
    case TokenType::String:
      advance();
      node->kind = SyntaxKind::String;
      node->text = token.text;
      out = node;
      return true;
    case TokenType::Integer:
    case TokenType::Decimal:
    case TokenType::Float:
      advance();
      node->kind = token.type == TokenType::Integer
                       ? SyntaxKind::Integer
                       : (token.type == TokenType::Decimal ? SyntaxKind::Decimal : SyntaxKind::Float);
      node->text = token.text;
      out = node;
      return true;
    case TokenType::Star:
      advance();
      node->kind = SyntaxKind::Wildcard;
      node->text = "*";
      out = node;
      return true;
    case TokenType::Caret:
      advance();
      node->kind = SyntaxKind::Complement;
      node->text = "^";
      out = node;
      return true;
    case TokenType::LBrace:
      return parse_selection(out);
    case TokenType::LParen: {
      advance();
      SyntaxPtr arm;
      if (!parse_flow(arm)) return false;
      if (!consume(TokenType::RParen, "Expected ')' to close a group")) return false;
      node->kind = SyntaxKind::Group;
      node->lhs = arm;
      node->span = Span{token.pos, previous_.end};
      out = node;
      return true;
    }
    case TokenType::Invalid:
      if (!token.text.empty() && token.text[0] == '\'') {
        return set_error("Unterminated string literal");
      }
      return set_error("Unexpected character '" + token.text + "'");
    case TokenType::End:
      return set_error("Unexpected end of query");
    default:
      return set_error("Unexpected token '" + token.text + "'");
  }
}

bool Parser::parse_call(const Token& name, SyntaxPtr& out) {
  if (!consume(TokenType::LParen, "Expected '(' after function name")) return false;
  auto node = std::make_shared<Syntax>();
  node->kind = SyntaxKind::Apply;
  node->text = name.text;
  if (!parse_arguments(TokenType::RParen, node->args)) return false;
  node->span = Span{name.pos, previous_.end};
  out = node;
  return true;
}

bool Parser::parse_arguments(TokenType close, std::vector<SyntaxPtr>& out) {
  const char* message = close == TokenType::RParen ? "Expected ',' or ')' after argument"
                                                   : "Expected ',' or '}' after selection item";
  if (current_.type == close) {
    advance();
    return true;
  }
  while (true) {
    SyntaxPtr item;
    if (!parse_flow(item)) return false;
    out.push_back(item);
    if (current_.type == TokenType::Comma) {
      advance();
      // WHY: a trailing comma before the closing bracket is accepted.
      if (current_.type == close) {
        advance();
        return true;
      }
      continue;
    }
    if (current_.type == close) {
      advance();
      return true;
    }
    return set_error(message);
  }
}

bool Parser::consume(TokenType type, const std::string& message) {
  if (current_.type != type) {
    return set_error(message);
  }
  advance();
  return true;
}

bool Parser::set_error(const std::string& message) {
  if (!error_.has_value()) {
    error_ = ParseError{message, current_.pos};
  }
  return false;
}

ParseResult Parser::error_result() {
  ParseResult res;
  res.error = error_;
  return res;
}

void Parser::advance() {
  previous_ = current_;
  if (has_peek_) {
    current_ = peek_;
    has_peek_ = false;
    return;
  }
  current_ = lexer_.next();
}

Token Parser::peek() {
  if (!has_peek_) {
    peek_ = lexer_.next();
    has_peek_ = true;
  }
  return peek_;
}

ParseResult parse_query(const std::string& input) {
  Parser parser(input);
  return parser.parse();
}

namespace {

void write_syntax(std::ostream& os, const Syntax& syntax) {
  switch (syntax.kind) {
    case SyntaxKind::Identifier:
    case SyntaxKind::Integer:
    case SyntaxKind::Decimal:
    case SyntaxKind::Float:
      os << syntax.text;
      return;
    case SyntaxKind::String:
      os << '\'';
      for (char c : syntax.text) {
        if (c == '\'') os << '\'';
        os << c;
      }
      os << '\'';
      return;
    case SyntaxKind::Reference:
      os << '$' << syntax.text;
      return;
    case SyntaxKind::Wildcard:
    case SyntaxKind::Complement:
      os << syntax.text;
      return;
    case SyntaxKind::Apply:
      os << syntax.text << '(';
      for (size_t i = 0; i < syntax.args.size(); ++i) {
        if (i > 0) os << ',';
        write_syntax(os, *syntax.args[i]);
      }
      os << ')';
      return;
    case SyntaxKind::Record:
      os << '{';
      for (size_t i = 0; i < syntax.args.size(); ++i) {
        if (i > 0) os << ',';
        write_syntax(os, *syntax.args[i]);
      }
      os << '}';
      return;
    case SyntaxKind::Compose:
      write_syntax(os, *syntax.lhs);
      os << '.';
      write_syntax(os, *syntax.rhs);
      return;
    case SyntaxKind::Select:
      write_syntax(os, *syntax.lhs);
      write_syntax(os, *syntax.rhs);
      return;
    case SyntaxKind::Sieve:
    case SyntaxKind::Project:
    case SyntaxKind::Link:
      write_syntax(os, *syntax.lhs);
      os << syntax.text;
      write_syntax(os, *syntax.rhs);
      return;
    case SyntaxKind::Operator:
      write_syntax(os, *syntax.lhs);
      os << syntax.text;
      write_syntax(os, *syntax.rhs);
      return;
    case SyntaxKind::Prefix:
      os << syntax.text;
      write_syntax(os, *syntax.lhs);
      return;
    case SyntaxKind::Direct:
      write_syntax(os, *syntax.lhs);
      os << (syntax.direction > 0 ? '+' : '-');
      return;
    case SyntaxKind::Group:
      os << '(';
      write_syntax(os, *syntax.lhs);
      os << ')';
      return;
  }
}

}  // namespace

std::string syntax_to_string(const Syntax& syntax) {
  std::ostringstream oss;
  write_syntax(oss, syntax);
  return oss.str();
}

}  // namespace navsql
