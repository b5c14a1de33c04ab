#include "syn_dsl/syntax/parser.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <string>
#include <system_error>

#include "syn_dsl/basic/error.hpp"

namespace syn_dsl::syntax
{
namespace
{

// Parse error codes (E0100-E0199).
constexpr const char * k_err_unexpected_token = "E0100";
constexpr const char * k_err_expected = "E0101";
constexpr const char * k_err_unclosed_block = "E0102";
constexpr const char * k_err_invalid_operator = "E0103";
constexpr const char * k_err_invalid_number = "E0104";
constexpr const char * k_err_unknown_with = "E0105";
constexpr const char * k_err_unknown_using = "E0106";
constexpr const char * k_err_unknown_generate_param = "E0107";
constexpr const char * k_err_unknown_pragma = "E0108";
constexpr const char * k_err_merge_operands = "E0109";
constexpr const char * k_err_missing_prompt = "E0110";
constexpr const char * k_err_missing_template = "E0111";
constexpr const char * k_err_missing_as_to = "E0112";

std::string_view strip_quotes(std::string_view s) noexcept
{
  if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
    return s.substr(1, s.size() - 2);
  }
  return s;
}

/// Whole-token base-10 integer; a leading '+' is accepted.
bool parse_int64(std::string_view text, int64_t & out) noexcept
{
  if (!text.empty() && text.front() == '+') {
    text.remove_prefix(1);
  }
  if (text.empty()) {
    return false;
  }
  const char * const end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, out);
  return ec == std::errc() && ptr == end;
}

bool is_value_token(const Token & t) noexcept
{
  return t.kind == TokenKind::Word || t.kind == TokenKind::String;
}

}  // namespace

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[i];
}

bool Parser::at(TokenKind k) const { return cur().kind == k; }

bool Parser::at_eof() const { return at(TokenKind::Eof); }

bool Parser::at_kw(std::string_view kw) const { return cur().is_keyword(kw); }

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    ++idx_;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

const Token & Parser::expect(TokenKind k, std::string_view what)
{
  if (!at(k)) {
    error_at(cur(), k_err_expected, "expected " + std::string(what) + ", got: " + describe(cur()));
  }
  return advance();
}

void Parser::error_at(const Token & t, std::string code, std::string msg) const
{
  error_at(t.range, std::move(code), std::move(msg));
}

void Parser::error_at(SourceRange range, std::string code, std::string msg) const
{
  throw ParseError(std::move(code), std::move(msg), range);
}

std::string Parser::describe(const Token & t)
{
  if (t.kind == TokenKind::Eof) {
    return std::string(to_string(TokenKind::Eof));
  }
  return std::string(t.text);
}

SourceRange Parser::range_from(const Token & start) const
{
  if (idx_ == 0) {
    return start.range;
  }
  return {start.range.get_begin(), tokens_[idx_ - 1].range.get_end()};
}

// ============================================================================
// Small scanners
// ============================================================================

std::string_view Parser::strip_and_intern(std::string_view text)
{
  return ast_.intern(strip_quotes(text));
}

std::string_view Parser::parse_name(std::string_view what)
{
  if (!is_value_token(cur())) {
    error_at(cur(), k_err_expected, "expected " + std::string(what) + ", got: " + describe(cur()));
  }
  return strip_and_intern(advance().text);
}

std::vector<std::string_view> Parser::parse_name_list(std::string_view what)
{
  expect(TokenKind::LBracket, "[");

  std::vector<std::string_view> names;
  while (!at(TokenKind::RBracket)) {
    if (at_eof()) {
      error_at(cur(), k_err_unclosed_block, "expected closing bracket ]");
    }
    names.push_back(parse_name(what));
    // Commas between list items are optional.
    match(TokenKind::Comma);
  }
  advance();  // ]
  return names;
}

int64_t Parser::parse_integer(std::string_view what)
{
  const Token & t = cur();
  int64_t value = 0;
  if (t.kind != TokenKind::Word || !parse_int64(t.text, value)) {
    error_at(
      t, k_err_invalid_number,
      "expected integer value for " + std::string(what) + ", got: " + describe(t));
  }
  advance();
  return value;
}

int64_t Parser::parse_concurrency(std::string_view what)
{
  const Token & t = cur();
  const int64_t value = parse_integer(what);
  if (value < 1) {
    error_at(
      t, k_err_invalid_number,
      "concurrency must be at least 1 for " + std::string(what) + ", got: " + describe(t));
  }
  return value;
}

double Parser::parse_float(std::string_view what)
{
  const Token & t = cur();
  if (t.kind != TokenKind::Word) {
    error_at(
      t, k_err_invalid_number,
      "expected numeric value for " + std::string(what) + ", got: " + describe(t));
  }

  // strtod requires a null-terminated string.
  const std::string tmp(t.text);
  char * end = nullptr;
  const double v = std::strtod(tmp.c_str(), &end);
  if (end != tmp.c_str() + tmp.size() || !std::isfinite(v)) {
    error_at(
      t, k_err_invalid_number,
      "expected numeric value for " + std::string(what) + ", got: " + describe(t));
  }
  advance();
  return v;
}

FilterOp Parser::parse_filter_op()
{
  const Token & t = cur();
  FilterOp op = FilterOp::Eq;
  switch (t.kind) {
    case TokenKind::Eq:
      op = FilterOp::Eq;
      break;
    case TokenKind::Ne:
      op = FilterOp::Ne;
      break;
    case TokenKind::Lt:
      op = FilterOp::Lt;
      break;
    case TokenKind::Le:
      op = FilterOp::Le;
      break;
    case TokenKind::Gt:
      op = FilterOp::Gt;
      break;
    case TokenKind::Ge:
      op = FilterOp::Ge;
      break;
    default:
      error_at(
        t, k_err_invalid_operator, "expected operator (=, >, <, >=, <=, !=), got: " + describe(t));
  }
  advance();
  return op;
}

FilterValue Parser::parse_filter_value(std::string_view op_spelling)
{
  const Token & t = cur();
  if (!is_value_token(t)) {
    error_at(
      t, k_err_expected,
      "expected value after " + std::string(op_spelling) + ", got: " + describe(t));
  }
  advance();

  int64_t number = 0;
  if (t.kind == TokenKind::Word && parse_int64(t.text, number)) {
    return FilterValue::integer(number);
  }
  return FilterValue::string(strip_and_intern(t.text));
}

// ============================================================================
// Program / Block
// ============================================================================

Program * Parser::parse_program()
{
  std::vector<Stmt *> stmts;
  while (!at_eof()) {
    stmts.push_back(parse_stmt());
  }

  const uint32_t end = tokens_.empty() ? 0 : tokens_.back().end();
  auto * program = ast_.create<Program>(SourceRange(0, end));
  program->stmts = ast_.copy_to_arena(stmts);

  // Step over the Eof sentinel so that position() reports every token consumed.
  if (idx_ < tokens_.size()) {
    ++idx_;
  }
  return program;
}

Block * Parser::parse_block()
{
  const Token & open = expect(TokenKind::LBrace, "{");

  std::vector<Stmt *> stmts;
  while (!at(TokenKind::RBrace)) {
    if (at_eof()) {
      error_at(cur(), k_err_unclosed_block, "expected closing brace }");
    }
    if (match(TokenKind::Semicolon)) {
      continue;
    }
    stmts.push_back(parse_stmt());
  }
  advance();  // }

  return ast_.create<Block>(ast_.copy_to_arena(stmts), range_from(open));
}

// ============================================================================
// Statements
// ============================================================================

Stmt * Parser::parse_stmt()
{
  const Token & t = cur();
  if (t.kind != TokenKind::Keyword) {
    error_at(t, k_err_unexpected_token, "unexpected token: " + describe(t));
  }

  if (t.is_keyword("FROM")) return parse_from();
  if (t.is_keyword("WITH")) return parse_with();
  if (t.is_keyword("FIELDS")) return parse_fields();
  if (t.is_keyword("USING")) return parse_using();
  if (t.is_keyword("FILTER")) return parse_filter();
  if (t.is_keyword("MERGE")) return parse_merge();
  if (t.is_keyword("SAVE")) return parse_save();
  if (t.is_keyword("GENERATE")) return parse_generate();
  if (t.is_keyword("PRAGMA")) return parse_pragma();

  if (t.is_keyword("PROMPT")) {
    const Token & start = advance();
    return parse_prompt(start, PromptRole::User);
  }

  if (t.is_keyword("SYSTEM") || t.is_keyword("USER")) {
    const Token & start = advance();
    if (!at_kw("PROMPT")) {
      error_at(
        cur(), k_err_missing_prompt,
        "expected PROMPT after " + std::string(start.text) + ", got: " + describe(cur()));
    }
    advance();
    return parse_prompt(start, start.is_keyword("SYSTEM") ? PromptRole::System : PromptRole::User);
  }

  error_at(t, k_err_unexpected_token, "unexpected token: " + describe(t));
}

FromStmt * Parser::parse_from()
{
  const Token & start = advance();  // FROM
  const Token & name_tok = cur();
  const std::string_view dataset = parse_name("dataset name after FROM");
  if (dataset.empty()) {
    error_at(name_tok, k_err_expected, "dataset name must not be empty");
  }

  Block * block = at(TokenKind::LBrace) ? parse_block() : nullptr;
  return ast_.create<FromStmt>(dataset, block, range_from(start));
}

WithStmt * Parser::parse_with()
{
  const Token & start = advance();  // WITH

  WithKind option = WithKind::Stream;
  int64_t value = 1;
  if (at_kw("CONCURRENCY")) {
    advance();
    option = WithKind::Concurrency;
    value = parse_concurrency("WITH CONCURRENCY");
  } else if (at_kw("STREAM")) {
    advance();
  } else if (at_eof()) {
    error_at(cur(), k_err_unknown_with, "expected setting type after WITH");
  } else {
    error_at(cur(), k_err_unknown_with, "unknown WITH type: " + describe(cur()));
  }

  Block * block = at(TokenKind::LBrace) ? parse_block() : nullptr;
  return ast_.create<WithStmt>(option, value, block, range_from(start));
}

FieldsStmt * Parser::parse_fields()
{
  const Token & start = advance();  // FIELDS

  std::vector<std::string_view> fields;
  if (at(TokenKind::LBracket)) {
    fields = parse_name_list("field name");
    if (fields.empty()) {
      error_at(range_from(start), k_err_expected, "expected at least one field name in FIELDS");
    }
  } else {
    fields.push_back(parse_name("field name after FIELDS"));
  }

  return ast_.create<FieldsStmt>(ast_.copy_to_arena(fields), range_from(start));
}

Stmt * Parser::parse_using()
{
  const Token & start = advance();  // USING

  if (!at(TokenKind::LBrace)) {
    return parse_using_entry(start);
  }

  advance();  // {
  std::vector<UsingStmt *> entries;
  while (!at(TokenKind::RBrace)) {
    if (at_eof()) {
      error_at(cur(), k_err_unclosed_block, "expected closing brace }");
    }
    if (match(TokenKind::Semicolon)) {
      continue;
    }
    entries.push_back(parse_using_entry(cur()));
  }
  advance();  // }

  return ast_.create<UsingBlock>(ast_.copy_to_arena(entries), range_from(start));
}

UsingStmt * Parser::parse_using_entry(const Token & start)
{
  const Token & t = cur();
  UsingKind target = UsingKind::Model;
  if (t.is_keyword("MODEL")) {
    target = UsingKind::Model;
  } else if (t.is_keyword("KEY")) {
    target = UsingKind::Key;
  } else if (t.is_keyword("URL")) {
    target = UsingKind::Url;
  } else {
    error_at(t, k_err_unknown_using, "expected USING type (MODEL, KEY, URL), got: " + describe(t));
  }
  advance();

  const std::string_view value = parse_name("value after USING " + std::string(t.text));
  return ast_.create<UsingStmt>(target, value, range_from(start));
}

Stmt * Parser::parse_filter()
{
  const Token & start = advance();  // FILTER
  const std::string_view field = parse_name("field after FILTER");

  if (!at(TokenKind::LBrace)) {
    const FilterOp op = parse_filter_op();
    const FilterValue value = parse_filter_value(to_string(op));
    return ast_.create<FilterStmt>(field, op, value, range_from(start));
  }

  advance();  // {
  std::vector<FilterCondition> conditions;
  while (!at(TokenKind::RBrace)) {
    if (at_eof()) {
      error_at(cur(), k_err_unclosed_block, "expected closing brace }");
    }
    if (match(TokenKind::Semicolon)) {
      continue;
    }

    const Token & cond_start = cur();
    FilterCondition cond;
    cond.field = parse_name("subfield in FILTER block");
    cond.op = parse_filter_op();
    cond.value = parse_filter_value(to_string(cond.op));
    cond.range = range_from(cond_start);
    conditions.push_back(cond);
  }
  advance();  // }

  return ast_.create<FilterBlock>(field, ast_.copy_to_arena(conditions), range_from(start));
}

MergeStmt * Parser::parse_merge()
{
  const Token & start = advance();  // MERGE

  std::vector<std::string_view> datasets;
  if (at(TokenKind::LBracket)) {
    datasets = parse_name_list("dataset name");
  } else {
    datasets.push_back(parse_name("dataset name after MERGE"));
    if (!match(TokenKind::Comma)) {
      error_at(cur(), k_err_merge_operands, "expected comma between datasets in MERGE");
    }
    datasets.push_back(parse_name("dataset name after ,"));
  }

  if (datasets.size() < 2) {
    error_at(range_from(start), k_err_merge_operands, "at least two datasets are required for MERGE");
  }

  return ast_.create<MergeStmt>(ast_.copy_to_arena(datasets), range_from(start));
}

SaveStmt * Parser::parse_save()
{
  const Token & start = advance();  // SAVE
  const std::string_view filename = parse_name("filename after SAVE");
  return ast_.create<SaveStmt>(filename, range_from(start));
}

GenerateStmt * Parser::parse_generate()
{
  const Token & start = advance();  // GENERATE
  const std::string_view source_field = parse_name("source field after GENERATE");

  if (!at_kw("AS") && !at_kw("TO")) {
    error_at(
      cur(), k_err_missing_as_to, "expected 'AS' or 'TO' after source field, got: " + describe(cur()));
  }
  advance();

  const std::string_view target_field = parse_name("target field after AS/TO");
  auto * stmt = ast_.create<GenerateStmt>(source_field, target_field);

  if (at(TokenKind::LBrace)) {
    advance();  // {

    std::vector<std::string_view> prompts;
    while (!at(TokenKind::RBrace)) {
      if (at_eof()) {
        error_at(cur(), k_err_unclosed_block, "expected closing brace }");
      }
      if (match(TokenKind::Semicolon)) {
        continue;
      }

      const Token & param = cur();
      if (param.is_keyword("MODEL")) {
        advance();
        stmt->model = parse_name("model name after MODEL");
      } else if (param.is_keyword("TEMPERATURE")) {
        advance();
        stmt->temperature = parse_float("TEMPERATURE");
      } else if (param.is_keyword("TOKENS")) {
        advance();
        stmt->maxTokens = parse_integer("TOKENS");
      } else if (param.is_keyword("PROMPT")) {
        advance();
        prompts.push_back(parse_name("prompt name after PROMPT"));
      } else {
        error_at(param, k_err_unknown_generate_param, "unknown GENERATE parameter: " + describe(param));
      }
    }
    advance();  // }

    stmt->prompts = ast_.copy_to_arena(prompts);
  }

  stmt->range_ = range_from(start);
  return stmt;
}

PromptStmt * Parser::parse_prompt(const Token & start, PromptRole role)
{
  const std::string_view name = parse_name("prompt name after PROMPT");

  std::vector<std::string_view> fields;
  std::string_view text;

  if (at(TokenKind::LBrace)) {
    advance();  // {

    if (at_kw("FIELDS")) {
      advance();
      if (at(TokenKind::LBracket)) {
        fields = parse_name_list("field name");
      } else {
        fields.push_back(parse_name("field name after FIELDS"));
      }
      if (at(TokenKind::RBrace) || at_eof()) {
        error_at(cur(), k_err_missing_template, "expected text template after field list");
      }
    }

    // The template is every remaining token up to '}', joined by single spaces.
    std::string joined;
    while (!at(TokenKind::RBrace)) {
      if (at_eof()) {
        error_at(cur(), k_err_unclosed_block, "expected closing brace }");
      }
      if (!joined.empty()) {
        joined += ' ';
      }
      joined += advance().text;
    }
    advance();  // }

    text = strip_and_intern(joined);
  } else {
    if (!is_value_token(cur())) {
      error_at(cur(), k_err_expected, "expected text template, got: " + describe(cur()));
    }
    text = strip_and_intern(advance().text);
  }

  return ast_.create<PromptStmt>(name, text, ast_.copy_to_arena(fields), role, range_from(start));
}

PragmaStmt * Parser::parse_pragma()
{
  const Token & start = advance();  // PRAGMA

  if (at_kw("AUTOSAVE")) {
    advance();
    return ast_.create<PragmaStmt>(PragmaKind::Autosave, 1, range_from(start));
  }
  if (at_kw("CONCURRENCY")) {
    advance();
    const int64_t value = parse_concurrency("PRAGMA CONCURRENCY");
    return ast_.create<PragmaStmt>(PragmaKind::Concurrency, value, range_from(start));
  }
  if (at_eof()) {
    error_at(cur(), k_err_unknown_pragma, "expected pragma type after PRAGMA");
  }
  error_at(cur(), k_err_unknown_pragma, "unknown PRAGMA directive: " + describe(cur()));
}

}  // namespace syn_dsl::syntax
