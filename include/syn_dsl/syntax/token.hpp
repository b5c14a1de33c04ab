// syn_dsl/syntax/token.hpp - Token kinds produced by the Lexer
#pragma once

#include <cstdint>
#include <string_view>

#include "syn_dsl/basic/source_manager.hpp"

namespace syn_dsl::syntax
{

enum class TokenKind : uint8_t {
  Eof,

  Keyword,  // one of k_keywords, matched as a whole word
  Word,     // identifiers, numbers, dataset paths, model names
  String,   // "..." or '...'; token.text keeps the quotes

  LBrace,
  RBrace,
  LBracket,
  RBracket,
  Comma,
  Semicolon,

  Eq,
  Ne,
  Lt,
  Le,
  Gt,
  Ge,
};

struct Token
{
  TokenKind kind = TokenKind::Eof;
  SourceRange range;
  std::string_view text;  // exact source spelling

  [[nodiscard]] uint32_t begin() const noexcept { return range.get_begin().get_offset(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.get_end().get_offset(); }

  [[nodiscard]] bool is_keyword(std::string_view kw) const noexcept
  {
    return kind == TokenKind::Keyword && text == kw;
  }

  [[nodiscard]] bool is_operator() const noexcept
  {
    return kind >= TokenKind::Eq && kind <= TokenKind::Ge;
  }
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "end of input";
    case TokenKind::Keyword:
      return "keyword";
    case TokenKind::Word:
      return "word";
    case TokenKind::String:
      return "string";
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
    case TokenKind::Semicolon:
      return ";";
    case TokenKind::Eq:
      return "=";
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
  }
  return "";
}

}  // namespace syn_dsl::syntax
