#include <gtest/gtest.h>

#include <string>
#include <string_view>

#include "syn_dsl/codegen/python_generator.hpp"
#include "syn_dsl/test_support/parse_helpers.hpp"

using syn_dsl::codegen::PythonGenerator;
using syn_dsl::test_support::parse;

namespace
{

std::string generate(const std::string & src)
{
  auto unit = parse(src);
  return PythonGenerator::generate(*unit.program);
}

/// Lowered statements only: everything after the pipeline marker, up to the entry point.
std::string pipeline_of(const std::string & program)
{
  const auto begin = program.find(syn_dsl::codegen::k_pipeline_marker);
  EXPECT_NE(begin, std::string::npos);
  const auto body = begin + syn_dsl::codegen::k_pipeline_marker.size();
  const auto end = program.find("\n\nif __name__ == '__main__':");
  EXPECT_NE(end, std::string::npos);
  return program.substr(body, end - body);
}

size_t count_of(std::string_view haystack, std::string_view needle)
{
  size_t n = 0;
  for (size_t pos = haystack.find(needle); pos != std::string_view::npos;
       pos = haystack.find(needle, pos + needle.size())) {
    ++n;
  }
  return n;
}

}  // namespace

// ============================================================================
// Literal helpers
// ============================================================================

TEST(CodegenHelpers, SanitizeIdentifier)
{
  EXPECT_EQ(syn_dsl::codegen::sanitize_identifier("a/b-c.d"), "a_b_c_d");
  EXPECT_EQ(syn_dsl::codegen::sanitize_identifier("squad_v2"), "squad_v2");
  EXPECT_EQ(syn_dsl::codegen::sanitize_identifier(""), "");
  EXPECT_EQ(syn_dsl::codegen::dataset_variable("rajpurkar/squad"), "ds_rajpurkar_squad");
}

TEST(CodegenHelpers, QuotePythonString)
{
  EXPECT_EQ(syn_dsl::codegen::quote_python_string("plain"), "'plain'");
  EXPECT_EQ(syn_dsl::codegen::quote_python_string("it's"), "'it\\'s'");
  EXPECT_EQ(syn_dsl::codegen::quote_python_string("a\\b"), "'a\\\\b'");
  EXPECT_EQ(syn_dsl::codegen::quote_python_string("l1\nl2\t"), "'l1\\nl2\\t'");
  EXPECT_EQ(syn_dsl::codegen::quote_python_string(std::string_view("\x01", 1)), "'\\x01'");
}

TEST(CodegenHelpers, FormatPythonFloat)
{
  EXPECT_EQ(syn_dsl::codegen::format_python_float(0.7), "0.7");
  EXPECT_EQ(syn_dsl::codegen::format_python_float(1.0), "1.0");
  EXPECT_EQ(syn_dsl::codegen::format_python_float(0.0), "0.0");
  EXPECT_EQ(syn_dsl::codegen::format_python_float(1.25), "1.25");
}

// ============================================================================
// Program structure
// ============================================================================

TEST(PythonGenerator, ProgramLayout)
{
  const std::string out = generate("FROM squad");
  EXPECT_EQ(out.rfind(std::string(syn_dsl::codegen::python_prelude()), 0), 0U);
  EXPECT_NE(out.find("def main():"), std::string::npos);
  EXPECT_NE(out.find("import datasets"), std::string::npos);
  const std::string_view tail = "\n\nif __name__ == '__main__':\n    main()\n";
  ASSERT_GE(out.size(), tail.size());
  EXPECT_EQ(out.substr(out.size() - tail.size()), tail);
}

TEST(PythonGenerator, OutputIsDeterministic)
{
  const std::string src =
    "PRAGMA CONCURRENCY 4\n"
    "USING MODEL gpt-4o\n"
    "FROM squad { FILTER level > 2; GENERATE q AS a; SAVE out.json }\n"
    "FROM trivia\n"
    "MERGE [squad, trivia]\n";
  EXPECT_EQ(generate(src), generate(src));
}

// ============================================================================
// Statement lowering
// ============================================================================

TEST(PythonGenerator, FromBlockWithFieldsAndSave)
{
  const std::string body = pipeline_of(generate(
    "FROM squad {\n"
    "  FIELDS [\"question\", \"answers\"]\n"
    "  SAVE \"output.json\"\n"
    "}\n"));

  const std::string expected =
    "    # FROM 'squad'\n"
    "    fields_ds_squad = list(fields)\n"
    "    filters_ds_squad = dict(filters)\n"
    "    fields_ds_squad = ['question', 'answers']\n"
    "    ds_squad = load_dataset_with_config('squad', streaming=stream, fields=fields_ds_squad, "
    "filters=filters_ds_squad)\n"
    "    loaded_datasets['ds_squad'] = ds_squad\n"
    "    output_file = 'output.json'\n"
    "    was_saved = True\n"
    "    save_current_results()\n";
  EXPECT_EQ(body, expected);
  EXPECT_EQ(count_of(body, "generate_content("), 0U);
  EXPECT_EQ(count_of(body, "save_current_results()"), 1U);
}

TEST(PythonGenerator, GenerateInsideFromRunsAfterLoad)
{
  const std::string body = pipeline_of(generate(
    "FROM squad {\n"
    "  GENERATE question AS answer\n"
    "  FIELDS [question]\n"
    "}\n"));

  const auto load = body.find("ds_squad = load_dataset_with_config(");
  const auto fields = body.find("fields_ds_squad = ['question']");
  const auto gen = body.find(
    "ds_squad = generate_content(ds_squad, 'question', 'answer', None, 0.7, 1024, None)");
  ASSERT_NE(load, std::string::npos);
  ASSERT_NE(fields, std::string::npos);
  ASSERT_NE(gen, std::string::npos);
  EXPECT_LT(fields, load);
  EXPECT_LT(load, gen);
}

TEST(PythonGenerator, SaveInsideFromRunsAfterGenerate)
{
  const std::string body = pipeline_of(generate(
    "FROM squad { SAVE first.json GENERATE q TO a }\n"));
  EXPECT_LT(body.find("generate_content("), body.find("output_file = 'first.json'"));
}

TEST(PythonGenerator, FiltersInsideFrom)
{
  const std::string body = pipeline_of(generate(
    "FROM squad {\n"
    "  FILTER difficulty >= 8\n"
    "  FILTER meta { lang = en; score != 0 }\n"
    "}\n"));

  EXPECT_NE(
    body.find("filters_ds_squad['difficulty'] = {'op': '>=', 'value': 8}"), std::string::npos);
  EXPECT_NE(
    body.find("filters_ds_squad['meta.lang'] = {'op': '==', 'value': 'en'}"), std::string::npos);
  EXPECT_NE(
    body.find("filters_ds_squad['meta.score'] = {'op': '!=', 'value': 0}"), std::string::npos);
}

TEST(PythonGenerator, TopLevelSettings)
{
  const std::string body = pipeline_of(generate(
    "USING { MODEL gpt-4o KEY sk-1 URL \"http://localhost/v1\" }\n"
    "WITH STREAM\n"
    "WITH CONCURRENCY 5\n"
    "FIELDS [a, b]\n"
    "FILTER x < 3\n"));

  const std::string expected =
    "    model = 'gpt-4o'\n"
    "    api_key = 'sk-1'\n"
    "    api_url = 'http://localhost/v1'\n"
    "    stream = True\n"
    "    concurrency = 5\n"
    "    fields = ['a', 'b']\n"
    "    filters['x'] = {'op': '<', 'value': 3}\n";
  EXPECT_EQ(body, expected);
}

TEST(PythonGenerator, WithBlockAppliesSettingBeforeNestedStatements)
{
  const std::string body = pipeline_of(generate("WITH CONCURRENCY 8 { FROM squad }"));
  EXPECT_EQ(body.find("    concurrency = 8\n"), 0U);
  EXPECT_NE(body.find("# FROM 'squad'"), std::string::npos);
}

TEST(PythonGenerator, WithInsideFromIsFlattened)
{
  const std::string body = pipeline_of(generate(
    "FROM squad { WITH CONCURRENCY 2 { FIELDS [q] GENERATE q AS a } }"));
  const auto conc = body.find("concurrency = 2");
  const auto fields = body.find("fields_ds_squad = ['q']");
  const auto load = body.find("ds_squad = load_dataset_with_config(");
  const auto gen = body.find("ds_squad = generate_content(ds_squad");
  ASSERT_NE(gen, std::string::npos);
  EXPECT_LT(conc, fields);
  EXPECT_LT(fields, load);
  EXPECT_LT(load, gen);
}

TEST(PythonGenerator, TopLevelGenerateTargetsLastDataset)
{
  const std::string body = pipeline_of(generate(
    "FROM squad\n"
    "GENERATE question TO answer { MODEL gpt-4o TEMPERATURE 1 TOKENS 64 PROMPT qa }\n"));

  EXPECT_NE(body.find("    last_dataset_name = list(loaded_datasets.keys())[-1]\n"), std::string::npos);
  EXPECT_NE(
    body.find(
      "    loaded_datasets[last_dataset_name] = generate_content("
      "loaded_datasets[last_dataset_name], 'question', 'answer', 'gpt-4o', 1.0, 64, 'qa')\n"),
    std::string::npos);
}

TEST(PythonGenerator, OnlyFirstPromptIsUsed)
{
  const std::string body = pipeline_of(generate(
    "FROM squad { GENERATE q AS a { PROMPT first PROMPT second PROMPT third } }"));
  EXPECT_NE(
    body.find("# only the first PROMPT is used; ignored: 'second', 'third'"), std::string::npos);
  EXPECT_NE(body.find(", 'first')"), std::string::npos);
  EXPECT_EQ(body.find(", 'second')"), std::string::npos);
}

TEST(PythonGenerator, Prompts)
{
  const std::string body = pipeline_of(generate(
    "SYSTEM PROMPT tutor \"You're kind\"\n"
    "PROMPT qa { FIELDS [question] \"Q: {question}\" }\n"));
  const std::string expected =
    "    system_prompts['tutor'] = 'You\\'re kind'\n"
    "    prompt_templates['qa'] = {'template': 'Q: {question}', 'fields': ['question']}\n";
  EXPECT_EQ(body, expected);
}

TEST(PythonGenerator, MergeNamesFollowDatasetCount)
{
  const std::string body = pipeline_of(generate(
    "FROM squad\n"
    "FROM rajpurkar/trivia\n"
    "MERGE [squad, rajpurkar/trivia]\n"));
  EXPECT_NE(
    body.find("    merged_ds_3 = concatenate_datasets([ds_squad, ds_rajpurkar_trivia])\n"),
    std::string::npos);
  EXPECT_NE(body.find("    loaded_datasets['merged_ds_3'] = merged_ds_3\n"), std::string::npos);
}

TEST(PythonGenerator, AutosaveRegistrationAppearsAtPragmaPosition)
{
  const std::string out = generate(
    "FROM squad\n"
    "PRAGMA AUTOSAVE\n"
    "SAVE out.json\n");
  const std::string body = pipeline_of(out);

  EXPECT_EQ(count_of(out, "signal.signal(signal.SIGINT, signal_handler)"), 1U);
  const auto load = body.find("loaded_datasets['ds_squad'] = ds_squad");
  const auto reg = body.find("    sigint_handler_registered = True\n"
                             "    signal.signal(signal.SIGINT, signal_handler)\n");
  const auto save = body.find("output_file = 'out.json'");
  ASSERT_NE(reg, std::string::npos);
  EXPECT_LT(load, reg);
  EXPECT_LT(reg, save);
}

TEST(PythonGenerator, NoAutosaveMeansNoHandlerRegistration)
{
  const std::string out = generate("FROM squad\nSAVE out.json\n");
  EXPECT_EQ(count_of(out, "signal.signal(signal.SIGINT, signal_handler)"), 0U);
}

TEST(PythonGenerator, PragmaConcurrency)
{
  EXPECT_EQ(pipeline_of(generate("PRAGMA CONCURRENCY 12")), "    concurrency = 12\n");
}

TEST(PythonGenerator, RepeatedAutosaveRegistersHandlerOnce)
{
  const std::string body = pipeline_of(generate(
    "PRAGMA AUTOSAVE\n"
    "FROM squad\n"
    "PRAGMA AUTOSAVE\n"));
  EXPECT_EQ(count_of(body, "# PRAGMA AUTOSAVE\n"), 2U);
  EXPECT_EQ(count_of(body, "signal.signal(signal.SIGINT, signal_handler)"), 1U);
  EXPECT_LT(
    body.find("signal.signal(signal.SIGINT, signal_handler)"),
    body.find("loaded_datasets['ds_squad'] = ds_squad"));
}

TEST(PythonGenerator, NamesInCommentsCannotEscapeTheComment)
{
  const std::string body = pipeline_of(generate(
    "FROM \"squad\nimport os; print('x')\"\n"
    "GENERATE q AS a { PROMPT p PROMPT \"it's\nprint('y')\" }\n"));

  EXPECT_NE(body.find("    # FROM 'squad\\nimport os; print(\\'x\\')'\n"), std::string::npos)
    << body;
  EXPECT_NE(
    body.find("    # only the first PROMPT is used; ignored: 'it\\'s\\nprint(\\'y\\')'\n"),
    std::string::npos)
    << body;

  // Every lowered line stays inside main().
  size_t start = 0;
  while (start < body.size()) {
    const size_t end = body.find('\n', start);
    const size_t stop = end == std::string::npos ? body.size() : end;
    const std::string_view line(body.data() + start, stop - start);
    if (!line.empty()) {
      EXPECT_EQ(line.substr(0, 4), "    ") << line;
    }
    if (end == std::string::npos) {
      break;
    }
    start = end + 1;
  }
}
