#include "syn_dsl/syntax/lexer.hpp"

#include <cctype>
#include <string>

#include "syn_dsl/basic/error.hpp"
#include "syn_dsl/syntax/keywords.hpp"

namespace syn_dsl::syntax
{
namespace
{

bool is_word_char(unsigned char c)
{
  return (std::isalnum(c) != 0) || c == '_' || c == '.' || c == '/' || c == '-';
}

std::string describe_char(unsigned char c)
{
  if (std::isprint(c) != 0) {
    return std::string("'") + static_cast<char>(c) + "'";
  }
  static constexpr char k_hex[] = "0123456789abcdef";
  return std::string("byte 0x") + k_hex[c >> 4] + k_hex[c & 0xF];
}

}  // namespace

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

void Lexer::skip_trivia()
{
  while (!eof()) {
    const char c = peek();
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
      advance();
      continue;
    }
    if (c == '#') {
      while (!eof() && peek() != '\n') {
        advance();
      }
      continue;
    }
    break;
  }
}

Token Lexer::make_token(TokenKind kind, size_t start) const noexcept
{
  Token t;
  t.kind = kind;
  t.range = SourceRange(static_cast<uint32_t>(start), static_cast<uint32_t>(pos_));
  t.text = src_.substr(start, pos_ - start);
  return t;
}

Token Lexer::lex_word()
{
  const size_t start = pos_;
  while (!eof() && is_word_char(static_cast<unsigned char>(peek()))) {
    advance();
  }
  Token t = make_token(TokenKind::Word, start);
  if (is_keyword(t.text)) {
    t.kind = TokenKind::Keyword;
  }
  return t;
}

Token Lexer::lex_string()
{
  const size_t start = pos_;
  const char quote = peek();
  advance();

  while (!eof() && peek() != quote) {
    advance();
  }
  if (eof()) {
    throw TokenizeError(
      "E0002", "unterminated string literal",
      SourceRange(static_cast<uint32_t>(start), static_cast<uint32_t>(start + 1)));
  }
  advance();  // closing quote
  return make_token(TokenKind::String, start);
}

Token Lexer::next_token()
{
  skip_trivia();

  if (eof()) {
    return make_token(TokenKind::Eof, pos_);
  }

  const size_t start = pos_;
  const auto c = static_cast<unsigned char>(peek());

  if (c == '"' || c == '\'') {
    return lex_string();
  }

  if (starts_with(">=")) {
    advance(2);
    return make_token(TokenKind::Ge, start);
  }
  if (starts_with("<=")) {
    advance(2);
    return make_token(TokenKind::Le, start);
  }
  if (starts_with("!=")) {
    advance(2);
    return make_token(TokenKind::Ne, start);
  }

  TokenKind single = TokenKind::Eof;
  switch (c) {
    case '{':
      single = TokenKind::LBrace;
      break;
    case '}':
      single = TokenKind::RBrace;
      break;
    case '[':
      single = TokenKind::LBracket;
      break;
    case ']':
      single = TokenKind::RBracket;
      break;
    case ',':
      single = TokenKind::Comma;
      break;
    case ';':
      single = TokenKind::Semicolon;
      break;
    case '=':
      single = TokenKind::Eq;
      break;
    case '>':
      single = TokenKind::Gt;
      break;
    case '<':
      single = TokenKind::Lt;
      break;
    default:
      break;
  }
  if (single != TokenKind::Eof) {
    advance();
    return make_token(single, start);
  }

  if (is_word_char(c)) {
    return lex_word();
  }

  throw TokenizeError(
    "E0003", "unexpected character " + describe_char(c),
    SourceRange(static_cast<uint32_t>(start), static_cast<uint32_t>(start + 1)));
}

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

  if (out.size() == 1) {
    throw TokenizeError(
      "E0001", "tokenization error: no recognizable tokens found",
      SourceRange(0, static_cast<uint32_t>(src_.size())));
  }
  return out;
}

}  // namespace syn_dsl::syntax
