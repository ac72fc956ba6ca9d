#include "lexer.h"

#include <cctype>

namespace navsql {

Lexer::Lexer(const std::string& input) : input_(input) {}

Token Lexer::make(TokenType type, size_t start, std::string text) {
  return Token{type, std::move(text), start, pos_};
}

Token Lexer::next() {
  skip_ws();
  if (pos_ >= input_.size()) {
    return Token{TokenType::End, "", pos_, pos_};
  }

  size_t start = pos_;
  char c = input_[pos_];
  char n = pos_ + 1 < input_.size() ? input_[pos_ + 1] : '\0';
  char nn = pos_ + 2 < input_.size() ? input_[pos_ + 2] : '\0';

  if (c == '\'') {
    return lex_string();
  }
  if (std::isdigit(static_cast<unsigned char>(c))) {
    return lex_number();
  }
  if (is_name_start(c)) {
    return lex_name();
  }
  if (c == '$') {
    return lex_reference();
  }
  if (c == '=' && n == '=') {
    pos_ += 2;
    return make(TokenType::TotallyEqual, start, "==");
  }
  if (c == '!' && n == '=' && nn == '=') {
    pos_ += 3;
    return make(TokenType::TotallyNotEqual, start, "!==");
  }
  if (c == '!' && n == '=') {
    pos_ += 2;
    return make(TokenType::NotEqual, start, "!=");
  }
  if (c == '!' && n == '~') {
    pos_ += 2;
    return make(TokenType::NotContains, start, "!~");
  }
  if (c == '<' && n == '=') {
    pos_ += 2;
    return make(TokenType::LessEqual, start, "<=");
  }
  if (c == '>' && n == '=') {
    pos_ += 2;
    return make(TokenType::GreaterEqual, start, ">=");
  }
  if (c == '-' && n == '>') {
    pos_ += 2;
    return make(TokenType::Arrow, start, "->");
  }

  TokenType type = TokenType::Invalid;
  switch (c) {
    case '/': type = TokenType::Slash; break;
    case '.': type = TokenType::Dot; break;
    case ',': type = TokenType::Comma; break;
    case '(': type = TokenType::LParen; break;
    case ')': type = TokenType::RParen; break;
    case '{': type = TokenType::LBrace; break;
    case '}': type = TokenType::RBrace; break;
    case ';': type = TokenType::Semicolon; break;
    case '?': type = TokenType::Question; break;
    case '^': type = TokenType::Caret; break;
    case '*': type = TokenType::Star; break;
    case '+': type = TokenType::Plus; break;
    case '-': type = TokenType::Minus; break;
    case '|': type = TokenType::Pipe; break;
    case '&': type = TokenType::Ampersand; break;
    case '!': type = TokenType::Bang; break;
    case '=': type = TokenType::Equal; break;
    case '~': type = TokenType::Contains; break;
    case '<': type = TokenType::Less; break;
    case '>': type = TokenType::Greater; break;
    default: break;
  }
  // WHY: advance on unknown input to avoid infinite loops on malformed queries.
  ++pos_;
  return make(type, start, std::string(1, c));
}

Token Lexer::lex_string() {
  size_t start = pos_;
  ++pos_;
  std::string out;
  while (pos_ < input_.size()) {
    char c = input_[pos_++];
    if (c == '\'') {
      if (pos_ < input_.size() && input_[pos_] == '\'') {
        out.push_back('\'');
        ++pos_;
        continue;
      }
      return make(TokenType::String, start, out);
    }
    out.push_back(c);
  }
  return make(TokenType::Invalid, start, "'" + out);
}

Token Lexer::lex_name() {
  size_t start = pos_;
  std::string out;
  while (pos_ < input_.size() && is_name_char(input_[pos_])) {
    out.push_back(input_[pos_++]);
  }
  return make(TokenType::Name, start, out);
}

Token Lexer::lex_number() {
  size_t start = pos_;
  TokenType type = TokenType::Integer;
  while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_]))) {
    ++pos_;
  }
  if (pos_ + 1 < input_.size() && input_[pos_] == '.' &&
      std::isdigit(static_cast<unsigned char>(input_[pos_ + 1]))) {
    type = TokenType::Decimal;
    ++pos_;
    while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_]))) {
      ++pos_;
    }
  }
  if (pos_ < input_.size() && (input_[pos_] == 'e' || input_[pos_] == 'E')) {
    size_t ahead = pos_ + 1;
    if (ahead < input_.size() && (input_[ahead] == '+' || input_[ahead] == '-')) ++ahead;
    if (ahead < input_.size() && std::isdigit(static_cast<unsigned char>(input_[ahead]))) {
      type = TokenType::Float;
      pos_ = ahead;
      while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_]))) {
        ++pos_;
      }
    }
  }
  return make(type, start, input_.substr(start, pos_ - start));
}

Token Lexer::lex_reference() {
  size_t start = pos_;
  ++pos_;
  if (pos_ >= input_.size() || !is_name_start(input_[pos_])) {
    return make(TokenType::Invalid, start, "$");
  }
  std::string out;
  while (pos_ < input_.size() && is_name_char(input_[pos_])) {
    out.push_back(input_[pos_++]);
  }
  return make(TokenType::Reference, start, out);
}

void Lexer::skip_ws() {
  while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
    ++pos_;
  }
}

bool Lexer::is_name_start(char c) {
  // WHY: bytes above 0x7f belong to UTF-8 sequences and are valid in names.
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_' ||
         static_cast<unsigned char>(c) >= 0x80;
}

bool Lexer::is_name_char(char c) {
  return is_name_start(c) || std::isdigit(static_cast<unsigned char>(c));
}

}  // namespace navsql
