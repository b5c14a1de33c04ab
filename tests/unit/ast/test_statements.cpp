#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

#include "syn_dsl/ast/ast.hpp"
#include "syn_dsl/basic/casting.hpp"
#include "syn_dsl/test_support/parse_helpers.hpp"

using syn_dsl::cast;
using syn_dsl::dyn_cast;
using syn_dsl::isa;
using syn_dsl::test_support::parse;

namespace
{

std::vector<std::string> to_strings(gsl::span<std::string_view> items)
{
  return {items.begin(), items.end()};
}

}  // namespace

TEST(AstStatements, FromBlockWithFieldsAndSave)
{
  auto unit = parse(
    "FROM squad {\n"
    "  FIELDS [\"question\", \"answers\"]\n"
    "  SAVE \"output.json\"\n"
    "}\n");

  ASSERT_EQ(unit.program->stmts.size(), 1U);
  auto * from = dyn_cast<syn_dsl::FromStmt>(unit.stmt(0));
  ASSERT_NE(from, nullptr);
  EXPECT_EQ(from->dataset, "squad");
  ASSERT_NE(from->block, nullptr);
  ASSERT_EQ(from->block->stmts.size(), 2U);

  auto * fields = dyn_cast<syn_dsl::FieldsStmt>(from->block->stmts[0]);
  ASSERT_NE(fields, nullptr);
  EXPECT_EQ(to_strings(fields->fields), (std::vector<std::string>{"question", "answers"}));

  auto * save = dyn_cast<syn_dsl::SaveStmt>(from->block->stmts[1]);
  ASSERT_NE(save, nullptr);
  EXPECT_EQ(save->filename, "output.json");
}

TEST(AstStatements, ParserConsumesEveryToken)
{
  auto unit = parse(
    "PRAGMA CONCURRENCY 4\n"
    "USING { MODEL gpt-4o; KEY \"sk-test\"; URL "http://localhost:8000/v1" }\n"
    "FROM squad { FILTER difficulty >= 8 GENERATE question AS answer }\n"
    "SAVE out.json\n");
  EXPECT_EQ(unit.tokens_consumed, unit.token_count);
  EXPECT_EQ(unit.program->stmts.size(), 4U);
}

TEST(AstStatements, FromWithoutBlock)
{
  auto unit = parse("FROM 'rajpurkar/squad'");
  auto * from = cast<syn_dsl::FromStmt>(unit.stmt(0));
  EXPECT_EQ(from->dataset, "rajpurkar/squad");
  EXPECT_EQ(from->block, nullptr);
}

TEST(AstStatements, StandaloneFilter)
{
  auto unit = parse("FILTER difficulty >= 8");
  auto * f = dyn_cast<syn_dsl::FilterStmt>(unit.stmt(0));
  ASSERT_NE(f, nullptr);
  EXPECT_EQ(f->field, "difficulty");
  EXPECT_EQ(f->op, syn_dsl::FilterOp::Ge);
  ASSERT_TRUE(f->value.is_integer());
  EXPECT_EQ(f->value.as_integer(), 8);
}

TEST(AstStatements, FilterValueKinds)
{
  auto unit = parse(
    "FILTER a = -3\n"
    "FILTER b != 8.5\n"
    "FILTER c < \"42\"\n"
    "FILTER d <= hard\n");

  auto * a = cast<syn_dsl::FilterStmt>(unit.stmt(0));
  EXPECT_EQ(a->op, syn_dsl::FilterOp::Eq);
  ASSERT_TRUE(a->value.is_integer());
  EXPECT_EQ(a->value.as_integer(), -3);

  auto * b = cast<syn_dsl::FilterStmt>(unit.stmt(1));
  EXPECT_EQ(b->op, syn_dsl::FilterOp::Ne);
  ASSERT_TRUE(b->value.is_string());
  EXPECT_EQ(b->value.as_string(), "8.5");

  // Quoted digits stay a string.
  auto * c = cast<syn_dsl::FilterStmt>(unit.stmt(2));
  EXPECT_EQ(c->op, syn_dsl::FilterOp::Lt);
  ASSERT_TRUE(c->value.is_string());
  EXPECT_EQ(c->value.as_string(), "42");

  auto * d = cast<syn_dsl::FilterStmt>(unit.stmt(3));
  EXPECT_EQ(d->op, syn_dsl::FilterOp::Le);
  EXPECT_EQ(d->value, syn_dsl::FilterValue::string("hard"));
}

TEST(AstStatements, FilterBlock)
{
  auto unit = parse("FILTER meta { lang = en; score > 3 }");
  auto * fb = dyn_cast<syn_dsl::FilterBlock>(unit.stmt(0));
  ASSERT_NE(fb, nullptr);
  EXPECT_EQ(fb->field, "meta");
  ASSERT_EQ(fb->conditions.size(), 2U);
  EXPECT_EQ(fb->conditions[0].field, "lang");
  EXPECT_EQ(fb->conditions[0].op, syn_dsl::FilterOp::Eq);
  EXPECT_EQ(fb->conditions[0].value.as_string(), "en");
  EXPECT_EQ(fb->conditions[1].field, "score");
  EXPECT_EQ(fb->conditions[1].op, syn_dsl::FilterOp::Gt);
  EXPECT_EQ(fb->conditions[1].value.as_integer(), 3);
}

TEST(AstStatements, UsingSingleAndBlock)
{
  auto unit = parse(
    "USING MODEL gpt-4o-mini\n"
    "USING {\n"
    "  KEY \"sk-123\"\n"
    "  URL 'https://api.example.com/v1'\n"
    "}\n");

  auto * single = dyn_cast<syn_dsl::UsingStmt>(unit.stmt(0));
  ASSERT_NE(single, nullptr);
  EXPECT_EQ(single->target, syn_dsl::UsingKind::Model);
  EXPECT_EQ(single->value, "gpt-4o-mini");

  auto * block = dyn_cast<syn_dsl::UsingBlock>(unit.stmt(1));
  ASSERT_NE(block, nullptr);
  ASSERT_EQ(block->entries.size(), 2U);
  EXPECT_EQ(block->entries[0]->target, syn_dsl::UsingKind::Key);
  EXPECT_EQ(block->entries[0]->value, "sk-123");
  EXPECT_EQ(block->entries[1]->target, syn_dsl::UsingKind::Url);
  EXPECT_EQ(block->entries[1]->value, "https://api.example.com/v1");
}

TEST(AstStatements, WithConcurrencyAndStream)
{
  auto unit = parse(
    "WITH CONCURRENCY 8 { FROM squad }\n"
    "WITH STREAM\n");

  auto * w = cast<syn_dsl::WithStmt>(unit.stmt(0));
  EXPECT_EQ(w->option, syn_dsl::WithKind::Concurrency);
  EXPECT_EQ(w->value, 8);
  ASSERT_NE(w->block, nullptr);
  ASSERT_EQ(w->block->stmts.size(), 1U);
  EXPECT_TRUE(isa<syn_dsl::FromStmt>(w->block->stmts[0]));

  auto * s = cast<syn_dsl::WithStmt>(unit.stmt(1));
  EXPECT_EQ(s->option, syn_dsl::WithKind::Stream);
  EXPECT_EQ(s->value, 1);
  EXPECT_EQ(s->block, nullptr);
}

TEST(AstStatements, MergeForms)
{
  auto unit = parse(
    "MERGE x, y\n"
    "MERGE [a, b c]\n");

  auto * m1 = cast<syn_dsl::MergeStmt>(unit.stmt(0));
  EXPECT_EQ(to_strings(m1->datasets), (std::vector<std::string>{"x", "y"}));

  // Commas inside brackets are optional.
  auto * m2 = cast<syn_dsl::MergeStmt>(unit.stmt(1));
  EXPECT_EQ(to_strings(m2->datasets), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(AstStatements, GenerateDefaults)
{
  auto unit = parse("GENERATE question TO answer");
  auto * g = cast<syn_dsl::GenerateStmt>(unit.stmt(0));
  EXPECT_EQ(g->sourceField, "question");
  EXPECT_EQ(g->targetField, "answer");
  EXPECT_FALSE(g->model.has_value());
  EXPECT_DOUBLE_EQ(g->temperature, 0.7);
  EXPECT_EQ(g->maxTokens, 1024);
  EXPECT_TRUE(g->prompts.empty());
}

TEST(AstStatements, GenerateWithParameters)
{
  auto unit = parse(
    "GENERATE question AS answer {\n"
    "  MODEL gpt-4o\n"
    "  TEMPERATURE 0.2;\n"
    "  TOKENS 256\n"
    "  PROMPT qa\n"
    "  PROMPT backup\n"
    "}\n");
  auto * g = cast<syn_dsl::GenerateStmt>(unit.stmt(0));
  ASSERT_TRUE(g->model.has_value());
  EXPECT_EQ(*g->model, "gpt-4o");
  EXPECT_DOUBLE_EQ(g->temperature, 0.2);
  EXPECT_EQ(g->maxTokens, 256);
  EXPECT_EQ(to_strings(g->prompts), (std::vector<std::string>{"qa", "backup"}));
}

TEST(AstStatements, PromptForms)
{
  auto unit = parse(
    "PROMPT short \"Answer briefly\"\n"
    "SYSTEM PROMPT sys { \"You are a helpful tutor.\" }\n"
    "USER PROMPT qa {\n"
    "  FIELDS [question, context]\n"
    "  \"Context: {context} Question: {question}\"\n"
    "}\n");

  auto * p0 = cast<syn_dsl::PromptStmt>(unit.stmt(0));
  EXPECT_EQ(p0->name, "short");
  EXPECT_EQ(p0->role, syn_dsl::PromptRole::User);
  EXPECT_EQ(p0->templateText, "Answer briefly");
  EXPECT_TRUE(p0->fields.empty());

  auto * p1 = cast<syn_dsl::PromptStmt>(unit.stmt(1));
  EXPECT_EQ(p1->role, syn_dsl::PromptRole::System);
  EXPECT_EQ(p1->templateText, "You are a helpful tutor.");

  auto * p2 = cast<syn_dsl::PromptStmt>(unit.stmt(2));
  EXPECT_EQ(p2->role, syn_dsl::PromptRole::User);
  EXPECT_EQ(to_strings(p2->fields), (std::vector<std::string>{"question", "context"}));
  EXPECT_EQ(p2->templateText, "Context: {context} Question: {question}");
}

TEST(AstStatements, UnquotedPromptTextIsJoinedWithSpaces)
{
  auto unit = parse("PROMPT p { Summarize the text }");
  auto * p = cast<syn_dsl::PromptStmt>(unit.stmt(0));
  EXPECT_EQ(p->templateText, "Summarize the text");
}

TEST(AstStatements, Pragmas)
{
  auto unit = parse(
    "PRAGMA AUTOSAVE\n"
    "PRAGMA CONCURRENCY 16\n");
  auto * p0 = cast<syn_dsl::PragmaStmt>(unit.stmt(0));
  EXPECT_EQ(p0->directive, syn_dsl::PragmaKind::Autosave);
  EXPECT_EQ(p0->value, 1);
  auto * p1 = cast<syn_dsl::PragmaStmt>(unit.stmt(1));
  EXPECT_EQ(p1->directive, syn_dsl::PragmaKind::Concurrency);
  EXPECT_EQ(p1->value, 16);
}

TEST(AstStatements, StatementRangesCoverTheirTokens)
{
  const std::string src = "SAVE out.json\nMERGE a, b";
  auto unit = parse(src);
  const auto r0 = unit.stmt(0)->get_range();
  EXPECT_EQ(r0.get_begin().get_offset(), 0U);
  EXPECT_EQ(r0.get_end().get_offset(), 13U);
  const auto r1 = unit.stmt(1)->get_range();
  EXPECT_EQ(r1.get_begin().get_offset(), 14U);
  EXPECT_EQ(r1.get_end().get_offset(), static_cast<uint32_t>(src.size()));
}
