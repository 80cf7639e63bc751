// tests/unit/syntax/test_lexer.cpp - Unit tests for the lexer
//

#include <gtest/gtest.h>

#include <string_view>
#include <vector>

#include "circ_dsl/syntax/lexer.hpp"
#include "circ_dsl/syntax/token.hpp"

using circ_dsl::FileId;
using circ_dsl::syntax::Lexer;
using circ_dsl::syntax::Token;
using circ_dsl::syntax::TokenKind;

namespace
{

std::vector<Token> lex(std::string_view src)
{
  Lexer lexer(FileId{0}, src);
  return lexer.lex_all();
}

std::vector<TokenKind> kinds(const std::vector<Token> & toks)
{
  std::vector<TokenKind> out;
  out.reserve(toks.size());
  for (const auto & t : toks) {
    out.push_back(t.kind);
  }
  return out;
}

}  // namespace

TEST(SyntaxLexer, DropsLineAndBlockComments)
{
  const auto toks = lex(
    "// leading\n"
    "circuit /* inline */ Point {}\n"
    "/* trailing */");

  const std::vector<TokenKind> expected = {
    TokenKind::Identifier, TokenKind::Identifier, TokenKind::LBrace, TokenKind::RBrace,
    TokenKind::Eof};
  EXPECT_EQ(kinds(toks), expected);
  EXPECT_EQ(toks[0].text, "circuit");
  EXPECT_EQ(toks[1].text, "Point");
}

TEST(SyntaxLexer, RangeOperatorIsNotSplitFromIntegers)
{
  const auto toks = lex("0..10");
  ASSERT_EQ(toks.size(), 4U);
  EXPECT_EQ(toks[0].kind, TokenKind::IntLiteral);
  EXPECT_EQ(toks[0].text, "0");
  EXPECT_EQ(toks[1].kind, TokenKind::DotDot);
  EXPECT_EQ(toks[2].kind, TokenKind::IntLiteral);
  EXPECT_EQ(toks[2].text, "10");
}

TEST(SyntaxLexer, IntegerLiteralKeepsTypeSuffix)
{
  const auto toks = lex("let total: u64 = 100u64;");
  bool saw = false;
  for (const auto & t : toks) {
    if (t.kind == TokenKind::IntLiteral) {
      EXPECT_EQ(t.text, "100u64");
      saw = true;
    }
  }
  EXPECT_TRUE(saw);
}

TEST(SyntaxLexer, StringTextExcludesQuotes)
{
  const auto toks = lex("\"hello\"");
  ASSERT_EQ(toks[0].kind, TokenKind::StringLiteral);
  EXPECT_EQ(toks[0].text, "hello");
  EXPECT_EQ(toks[0].begin(), 0U);
  EXPECT_EQ(toks[0].end(), 7U);
}

TEST(SyntaxLexer, UnterminatedStringIsUnknown)
{
  const auto toks = lex("\"open\n");
  EXPECT_EQ(toks[0].kind, TokenKind::Unknown);
}

TEST(SyntaxLexer, TwoCharacterOperators)
{
  const auto toks = lex("-> ** += -= *= /= == != <= >= && ||");
  const std::vector<TokenKind> expected = {
    TokenKind::Arrow,  TokenKind::StarStar, TokenKind::PlusEq, TokenKind::MinusEq,
    TokenKind::StarEq, TokenKind::SlashEq,  TokenKind::EqEq,   TokenKind::Ne,
    TokenKind::Le,     TokenKind::Ge,       TokenKind::AndAnd, TokenKind::OrOr,
    TokenKind::Eof};
  EXPECT_EQ(kinds(toks), expected);
}

TEST(SyntaxLexer, SingleAmpersandIsUnknown)
{
  const auto toks = lex("a & b");
  ASSERT_EQ(toks.size(), 4U);
  EXPECT_EQ(toks[1].kind, TokenKind::Unknown);
  EXPECT_EQ(toks[1].text, "&");
}

TEST(SyntaxLexer, UnterminatedBlockCommentConsumesRest)
{
  const auto toks = lex("a /* never closed");
  ASSERT_EQ(toks.size(), 3U);
  EXPECT_EQ(toks[0].kind, TokenKind::Identifier);
  EXPECT_EQ(toks[1].kind, TokenKind::Unknown);
  EXPECT_EQ(toks[2].kind, TokenKind::Eof);
}

TEST(SyntaxLexer, RangesCarryFileId)
{
  Lexer lexer(FileId{3}, "x");
  const auto toks = lexer.lex_all();
  EXPECT_EQ(toks[0].range.file_id().value, 3U);
}
