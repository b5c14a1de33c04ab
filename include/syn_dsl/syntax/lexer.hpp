// syn_dsl/syntax/lexer.hpp - Scanner for .syn sources
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "syn_dsl/syntax/token.hpp"

namespace syn_dsl::syntax
{

/**
 * Hand-written scanner for .syn sources.
 *
 * Produces the full token sequence terminated by an Eof token, or throws
 * TokenizeError (unterminated string, unexpected character, or a source
 * that contains no tokens at all).
 */
class Lexer
{
public:
  explicit Lexer(std::string_view src) : src_(src) {}

  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept { pos_ += n; }

  void skip_trivia();

  [[nodiscard]] Token lex_word();
  [[nodiscard]] Token lex_string();
  [[nodiscard]] Token make_token(TokenKind kind, size_t start) const noexcept;

  std::string_view src_;
  size_t pos_ = 0;
};

}  // namespace syn_dsl::syntax
