// circ_dsl/syntax/token.hpp - Token kinds produced by the lexer
#pragma once

#include <cstdint>
#include <string_view>

#include "circ_dsl/basic/source_manager.hpp"

namespace circ_dsl::syntax
{

// Keywords are lexed as identifiers and recognised by the parser.
enum class TokenKind : uint8_t {
  Eof,
  Unknown,

  Identifier,
  IntLiteral,
  StringLiteral,  // token.text is the string contents (without quotes)

  LParen,
  RParen,
  LBrace,
  RBrace,
  LBracket,
  RBracket,

  Comma,
  Colon,
  Semicolon,
  Dot,
  DotDot,
  Arrow,

  Plus,
  Minus,
  Star,
  StarStar,
  Slash,
  Bang,

  AndAnd,
  OrOr,

  Eq,
  EqEq,
  Ne,
  Lt,
  Le,
  Gt,
  Ge,

  PlusEq,
  MinusEq,
  StarEq,
  SlashEq,
};

struct Token
{
  TokenKind kind = TokenKind::Unknown;
  SourceRange range;
  std::string_view text;

  [[nodiscard]] uint32_t begin() const noexcept { return range.get_begin().offset(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.get_end().offset(); }
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Unknown:
      return "<unknown>";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::IntLiteral:
      return "integer";
    case TokenKind::StringLiteral:
      return "string";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::LBrace:
      return "{";
    case TokenKind::RBrace:
      return "}";
    case TokenKind::LBracket:
      return "[";
    case TokenKind::RBracket:
      return "]";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Colon:
      return ":";
    case TokenKind::Semicolon:
      return ";";
    case TokenKind::Dot:
      return ".";
    case TokenKind::DotDot:
      return "..";
    case TokenKind::Arrow:
      return "->";
    case TokenKind::Plus:
      return "+";
    case TokenKind::Minus:
      return "-";
    case TokenKind::Star:
      return "*";
    case TokenKind::StarStar:
      return "**";
    case TokenKind::Slash:
      return "/";
    case TokenKind::Bang:
      return "!";
    case TokenKind::AndAnd:
      return "&&";
    case TokenKind::OrOr:
      return "||";
    case TokenKind::Eq:
      return "=";
    case TokenKind::EqEq:
      return "==";
    case TokenKind::Ne:
      return "!=";
    case TokenKind::Lt:
      return "<";
    case TokenKind::Le:
      return "<=";
    case TokenKind::Gt:
      return ">";
    case TokenKind::Ge:
      return ">=";
    case TokenKind::PlusEq:
      return "+=";
    case TokenKind::MinusEq:
      return "-=";
    case TokenKind::StarEq:
      return "*=";
    case TokenKind::SlashEq:
      return "/=";
  }
  return "<unknown>";
}

}  // namespace circ_dsl::syntax
