// syn_dsl/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "syn_dsl/ast/ast.hpp"
#include "syn_dsl/ast/ast_context.hpp"
#include "syn_dsl/basic/diagnostic.hpp"
#include "syn_dsl/basic/source_manager.hpp"

namespace syn_dsl
{

/// Everything produced by parsing one source. Not movable: the AST points into `ast`.
struct ParsedUnit
{
  SourceManager source;
  AstContext ast;
  DiagnosticBag diags;
  Program * program = nullptr;  ///< nullptr when tokenizing or parsing failed

  [[nodiscard]] bool ok() const noexcept { return program != nullptr && !diags.has_errors(); }
};

// Parse pipeline:
// source -> lexer (token stream) -> recursive-descent parser (AST) -> diagnostics
//
// Tokenize and parse errors are fail-fast: the first one is recorded in
// `diags` and `program` stays null.
[[nodiscard]] std::unique_ptr<ParsedUnit> parse_source(
  std::string source_text, const std::filesystem::path & path = {});

}  // namespace syn_dsl
