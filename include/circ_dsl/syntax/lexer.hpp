// circ_dsl/syntax/lexer.hpp - Hand-written lexer
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "circ_dsl/syntax/token.hpp"

namespace circ_dsl::syntax
{

/**
 * Splits source text into tokens. Comments and whitespace are dropped; the
 * returned stream always ends with an Eof token.
 */
class Lexer
{
public:
  Lexer(FileId file_id, std::string_view src) : file_id_(file_id), src_(src) {}

  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }

  void advance(size_t n = 1) noexcept { pos_ += n; }

  void skip_trivia();

  [[nodiscard]] Token lex_identifier();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_string();
  [[nodiscard]] Token make_token(TokenKind kind, size_t start) const noexcept;

  [[nodiscard]] SourceRange make_range(size_t start, size_t end) const noexcept
  {
    return {file_id_, static_cast<uint32_t>(start), static_cast<uint32_t>(end)};
  }

  FileId file_id_;
  std::string_view src_;
  size_t pos_ = 0;
};

}  // namespace circ_dsl::syntax
