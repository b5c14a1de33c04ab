// syn_dsl/syntax/parser.hpp - Recursive-descent parser for .syn sources
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "syn_dsl/ast/ast.hpp"
#include "syn_dsl/ast/ast_context.hpp"
#include "syn_dsl/syntax/token.hpp"

namespace syn_dsl::syntax
{

/**
 * Builds a Program from the token sequence produced by Lexer.
 *
 * One-token lookahead, fail-fast: the first grammar violation throws
 * ParseError and no partial tree is returned. Names and string values are
 * quote-stripped and interned in the AstContext.
 */
class Parser
{
public:
  Parser(AstContext & ast, std::vector<Token> tokens) : ast_(ast), tokens_(std::move(tokens)) {}

  [[nodiscard]] Program * parse_program();

  /// Number of tokens consumed so far; equals token_count() after a successful parse.
  [[nodiscard]] size_t position() const noexcept { return idx_; }
  [[nodiscard]] size_t token_count() const noexcept { return tokens_.size(); }

private:
  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_eof() const;
  [[nodiscard]] bool at_kw(std::string_view kw) const;

  const Token & advance();
  bool match(TokenKind k);
  const Token & expect(TokenKind k, std::string_view what);

  [[noreturn]] void error_at(const Token & t, std::string code, std::string msg) const;
  [[noreturn]] void error_at(SourceRange range, std::string code, std::string msg) const;
  [[nodiscard]] static std::string describe(const Token & t);

  // Small scanners
  [[nodiscard]] std::string_view parse_name(std::string_view what);
  [[nodiscard]] std::vector<std::string_view> parse_name_list(std::string_view what);
  [[nodiscard]] int64_t parse_integer(std::string_view what);
  [[nodiscard]] int64_t parse_concurrency(std::string_view what);
  [[nodiscard]] double parse_float(std::string_view what);
  [[nodiscard]] FilterOp parse_filter_op();
  [[nodiscard]] FilterValue parse_filter_value(std::string_view op_spelling);
  [[nodiscard]] std::string_view strip_and_intern(std::string_view text);
  [[nodiscard]] SourceRange range_from(const Token & start) const;

  // Statements
  [[nodiscard]] Stmt * parse_stmt();
  [[nodiscard]] Block * parse_block();
  [[nodiscard]] FromStmt * parse_from();
  [[nodiscard]] WithStmt * parse_with();
  [[nodiscard]] FieldsStmt * parse_fields();
  [[nodiscard]] Stmt * parse_using();
  [[nodiscard]] UsingStmt * parse_using_entry(const Token & start);
  [[nodiscard]] Stmt * parse_filter();
  [[nodiscard]] MergeStmt * parse_merge();
  [[nodiscard]] SaveStmt * parse_save();
  [[nodiscard]] GenerateStmt * parse_generate();
  [[nodiscard]] PromptStmt * parse_prompt(const Token & start, PromptRole role);
  [[nodiscard]] PragmaStmt * parse_pragma();

  AstContext & ast_;
  std::vector<Token> tokens_;
  size_t idx_ = 0;
};

}  // namespace syn_dsl::syntax
