// syn_dsl/syntax/frontend.cpp - High-level parse pipeline
#include "syn_dsl/syntax/frontend.hpp"

#include <utility>
#include <vector>

#include "syn_dsl/basic/error.hpp"
#include "syn_dsl/syntax/lexer.hpp"
#include "syn_dsl/syntax/parser.hpp"

namespace syn_dsl
{

std::unique_ptr<ParsedUnit> parse_source(std::string source_text, const std::filesystem::path & path)
{
  auto unit = std::make_unique<ParsedUnit>();
  unit->source = path.empty() ? SourceManager(std::move(source_text))
                              : SourceManager(path, std::move(source_text));

  try {
    syntax::Lexer lexer(unit->source.get_source());
    std::vector<syntax::Token> tokens = lexer.lex_all();

    syntax::Parser parser(unit->ast, std::move(tokens));
    unit->program = parser.parse_program();
  } catch (const TokenizeError & e) {
    unit->diags.add(e.diagnostic());
  } catch (const ParseError & e) {
    unit->diags.add(e.diagnostic());
  }

  return unit;
}

}  // namespace syn_dsl
