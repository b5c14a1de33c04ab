// syn_dsl/test_support/parse_helpers.hpp - helpers for unit tests
//
// Thin wrappers over the lexer and parser that keep the AstContext alive
// next to the Program and rethrow front-end errors.
//
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "syn_dsl/ast/ast.hpp"
#include "syn_dsl/ast/ast_context.hpp"
#include "syn_dsl/syntax/lexer.hpp"
#include "syn_dsl/syntax/parser.hpp"

namespace syn_dsl::test_support
{

struct TestParseUnit
{
  std::string source;
  std::unique_ptr<AstContext> ast;
  Program * program = nullptr;
  size_t tokens_consumed = 0;
  size_t token_count = 0;

  [[nodiscard]] Stmt * stmt(size_t i) const { return program->stmts[i]; }
};

/// Lex and parse `src`; TokenizeError / ParseError propagate to the caller.
[[nodiscard]] inline TestParseUnit parse(std::string src)
{
  TestParseUnit out;
  out.source = std::move(src);
  out.ast = std::make_unique<AstContext>();

  syntax::Lexer lexer(out.source);
  syntax::Parser parser(*out.ast, lexer.lex_all());
  out.program = parser.parse_program();
  out.tokens_consumed = parser.position();
  out.token_count = parser.token_count();
  return out;
}

[[nodiscard]] inline std::vector<syntax::Token> lex(std::string_view src)
{
  syntax::Lexer lexer(src);
  return lexer.lex_all();
}

}  // namespace syn_dsl::test_support
