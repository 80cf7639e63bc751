#include "circ_dsl/syntax/lexer.hpp"

#include <cctype>

namespace circ_dsl::syntax
{
namespace
{

bool is_ident_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_'; }
bool is_ident_continue(unsigned char c) { return (std::isalnum(c) != 0) || c == '_'; }

}  // namespace

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    Token t = next_token();
    out.push_back(t);
    if (t.kind == TokenKind::Eof) {
      break;
    }
  }
  return out;
}

void Lexer::skip_trivia()
{
  while (!eof()) {
    const char c = peek();
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
      advance();
      continue;
    }
    if (c == '/' && peek(1) == '/') {
      while (!eof() && peek() != '\n') {
        advance();
      }
      continue;
    }
    if (c == '/' && peek(1) == '*') {
      const size_t close = src_.find("*/", pos_ + 2);
      if (close == std::string_view::npos) {
        return;  // left for next_token to report
      }
      pos_ = close + 2;
      continue;
    }
    break;
  }
}

Token Lexer::make_token(TokenKind kind, size_t start) const noexcept
{
  Token t;
  t.kind = kind;
  t.range = make_range(start, pos_);
  t.text = src_.substr(start, pos_ - start);
  return t;
}

Token Lexer::lex_identifier()
{
  const size_t start = pos_;
  advance();
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance();
  }
  return make_token(TokenKind::Identifier, start);
}

Token Lexer::lex_number()
{
  const size_t start = pos_;
  while (!eof() && std::isdigit(static_cast<unsigned char>(peek())) != 0) {
    advance();
  }
  // Type suffix: 10u32, 1field, 2group
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance();
  }
  return make_token(TokenKind::IntLiteral, start);
}

Token Lexer::lex_string()
{
  const size_t start = pos_;
  advance();  // opening quote
  while (!eof() && peek() != '"' && peek() != '\n') {
    if (peek() == '\\' && pos_ + 1 < src_.size()) {
      advance();
    }
    advance();
  }

  if (eof() || peek() != '"') {
    return make_token(TokenKind::Unknown, start);
  }
  advance();  // closing quote

  Token t;
  t.kind = TokenKind::StringLiteral;
  t.range = make_range(start, pos_);
  t.text = src_.substr(start + 1, pos_ - start - 2);
  return t;
}

Token Lexer::next_token()
{
  skip_trivia();

  const size_t start = pos_;
  if (eof()) {
    return make_token(TokenKind::Eof, start);
  }

  const char c = peek();
  const char n = peek(1);

  if (is_ident_start(static_cast<unsigned char>(c))) {
    return lex_identifier();
  }
  if (std::isdigit(static_cast<unsigned char>(c)) != 0) {
    return lex_number();
  }
  if (c == '"') {
    return lex_string();
  }

  const auto two = [&](TokenKind kind) {
    advance(2);
    return make_token(kind, start);
  };
  const auto one = [&](TokenKind kind) {
    advance(1);
    return make_token(kind, start);
  };

  switch (c) {
    case '(':
      return one(TokenKind::LParen);
    case ')':
      return one(TokenKind::RParen);
    case '{':
      return one(TokenKind::LBrace);
    case '}':
      return one(TokenKind::RBrace);
    case '[':
      return one(TokenKind::LBracket);
    case ']':
      return one(TokenKind::RBracket);
    case ',':
      return one(TokenKind::Comma);
    case ':':
      return one(TokenKind::Colon);
    case ';':
      return one(TokenKind::Semicolon);
    case '.':
      return n == '.' ? two(TokenKind::DotDot) : one(TokenKind::Dot);
    case '+':
      return n == '=' ? two(TokenKind::PlusEq) : one(TokenKind::Plus);
    case '-':
      if (n == '>') return two(TokenKind::Arrow);
      return n == '=' ? two(TokenKind::MinusEq) : one(TokenKind::Minus);
    case '*':
      if (n == '*') return two(TokenKind::StarStar);
      return n == '=' ? two(TokenKind::StarEq) : one(TokenKind::Star);
    case '/':
      if (n == '*') {
        // Unterminated block comment
        pos_ = src_.size();
        return make_token(TokenKind::Unknown, start);
      }
      return n == '=' ? two(TokenKind::SlashEq) : one(TokenKind::Slash);
    case '!':
      return n == '=' ? two(TokenKind::Ne) : one(TokenKind::Bang);
    case '=':
      return n == '=' ? two(TokenKind::EqEq) : one(TokenKind::Eq);
    case '<':
      return n == '=' ? two(TokenKind::Le) : one(TokenKind::Lt);
    case '>':
      return n == '=' ? two(TokenKind::Ge) : one(TokenKind::Gt);
    case '&':
      return n == '&' ? two(TokenKind::AndAnd) : one(TokenKind::Unknown);
    case '|':
      return n == '|' ? two(TokenKind::OrOr) : one(TokenKind::Unknown);
    default:
      return one(TokenKind::Unknown);
  }
}

}  // namespace circ_dsl::syntax
