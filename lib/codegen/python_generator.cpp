#include "syn_dsl/codegen/python_generator.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "syn_dsl/ast/ast_enums.hpp"
#include "syn_dsl/basic/casting.hpp"
#include "syn_dsl/codegen/codegen_context.hpp"

namespace syn_dsl::codegen
{

// ============================================================================
// Literal helpers
// ============================================================================

std::string sanitize_identifier(std::string_view name)
{
  std::string out;
  out.reserve(name.size());
  for (const char c : name) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                    c == '_';
    out.push_back(ok ? c : '_');
  }
  return out;
}

std::string dataset_variable(std::string_view dataset_name)
{
  return "ds_" + sanitize_identifier(dataset_name);
}

std::string quote_python_string(std::string_view s)
{
  std::string escaped;
  escaped.reserve(s.size() + 2);
  escaped.push_back('\'');
  for (const char c : s) {
    switch (c) {
      case '\\':
        escaped += "\\\\";
        break;
      case '\'':
        escaped += "\\'";
        break;
      case '\n':
        escaped += "\\n";
        break;
      case '\r':
        escaped += "\\r";
        break;
      case '\t':
        escaped += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20 || c == 0x7F) {
          escaped += fmt::format("\\x{:02x}", static_cast<unsigned char>(c));
        } else {
          escaped.push_back(c);
        }
        break;
    }
  }
  escaped.push_back('\'');
  return escaped;
}

std::string format_python_float(double v)
{
  std::string s = fmt::format("{}", v);
  if (s.find_first_of(".eEn") == std::string::npos) {
    s += ".0";
  }
  return s;
}

namespace
{

// ============================================================================
// Lowering helpers
// ============================================================================

std::string python_list(gsl::span<const std::string_view> items)
{
  std::string out = "[";
  for (size_t i = 0; i < items.size(); ++i) {
    if (i != 0) {
      out += ", ";
    }
    out += quote_python_string(items[i]);
  }
  out += "]";
  return out;
}

std::string_view python_operator(FilterOp op)
{
  switch (op) {
    case FilterOp::Eq:
      return "==";
    case FilterOp::Ne:
      return "!=";
    case FilterOp::Gt:
      return ">";
    case FilterOp::Lt:
      return "<";
    case FilterOp::Ge:
      return ">=";
    case FilterOp::Le:
      return "<=";
  }
  return "==";
}

std::string python_value(const FilterValue & v)
{
  if (v.is_integer()) {
    return std::to_string(v.as_integer());
  }
  return quote_python_string(v.as_string());
}

void emit_filter(
  CodegenContext & ctx, std::string_view dict_name, const std::string & key, FilterOp op,
  const FilterValue & value)
{
  ctx.line(fmt::format(
    "{}[{}] = {{'op': '{}', 'value': {}}}", dict_name, quote_python_string(key),
    python_operator(op), python_value(value)));
}

void emit_using(CodegenContext & ctx, const UsingStmt & u)
{
  switch (u.target) {
    case UsingKind::Model:
      ctx.line("model = " + quote_python_string(u.value));
      break;
    case UsingKind::Key:
      ctx.line("api_key = " + quote_python_string(u.value));
      break;
    case UsingKind::Url:
      ctx.line("api_url = " + quote_python_string(u.value));
      break;
  }
}

void emit_with_setting(CodegenContext & ctx, const WithStmt & w)
{
  switch (w.option) {
    case WithKind::Concurrency:
      ctx.line(fmt::format("concurrency = {}", w.value));
      break;
    case WithKind::Stream:
      ctx.line("stream = True");
      break;
  }
}

void emit_prompt(CodegenContext & ctx, const PromptStmt & p)
{
  switch (p.role) {
    case PromptRole::System:
      ctx.line(fmt::format(
        "system_prompts[{}] = {}", quote_python_string(p.name),
        quote_python_string(p.templateText)));
      break;
    case PromptRole::User:
      ctx.line(fmt::format(
        "prompt_templates[{}] = {{'template': {}, 'fields': {}}}", quote_python_string(p.name),
        quote_python_string(p.templateText), python_list(p.fields)));
      break;
  }
}

void emit_pragma(CodegenContext & ctx, const PragmaStmt & p)
{
  switch (p.directive) {
    case PragmaKind::Autosave:
      ctx.line("# PRAGMA AUTOSAVE");
      if (ctx.sigint_handler_enabled()) {
        break;
      }
      ctx.enable_sigint_handler();
      ctx.line("sigint_handler_registered = True");
      ctx.line("signal.signal(signal.SIGINT, signal_handler)");
      break;
    case PragmaKind::Concurrency:
      ctx.line(fmt::format("concurrency = {}", p.value));
      break;
  }
}

void emit_merge(CodegenContext & ctx, const MergeStmt & m)
{
  const std::string merged = fmt::format("merged_ds_{}", ctx.dataset_count() + 1);
  ctx.register_dataset(merged);

  std::string sources;
  for (size_t i = 0; i < m.datasets.size(); ++i) {
    if (i != 0) {
      sources += ", ";
    }
    sources += dataset_variable(m.datasets[i]);
  }

  ctx.line(fmt::format("{} = concatenate_datasets([{}])", merged, sources));
  ctx.line(fmt::format("loaded_datasets[{}] = {}", quote_python_string(merged), merged));
}

void emit_save(CodegenContext & ctx, const SaveStmt & s)
{
  ctx.line("output_file = " + quote_python_string(s.filename));
  ctx.line("was_saved = True");
  ctx.line("save_current_results()");
}

/// Positional arguments after the dataset: src, dst, model, temperature, tokens, prompt.
std::string generate_arguments(const GenerateStmt & g)
{
  const std::string model = g.model ? quote_python_string(*g.model) : "None";
  const std::string prompt = g.prompts.empty() ? "None" : quote_python_string(g.prompts[0]);
  return fmt::format(
    "{}, {}, {}, {}, {}, {}", quote_python_string(g.sourceField),
    quote_python_string(g.targetField), model, format_python_float(g.temperature), g.maxTokens,
    prompt);
}

void emit_ignored_prompts(CodegenContext & ctx, const GenerateStmt & g)
{
  if (g.prompts.size() < 2) {
    return;
  }
  std::string names;
  for (size_t i = 1; i < g.prompts.size(); ++i) {
    if (i != 1) {
      names += ", ";
    }
    names += quote_python_string(g.prompts[i]);
  }
  ctx.line(fmt::format("# only the first PROMPT is used; ignored: {}", names));
}

void emit_generate_top_level(CodegenContext & ctx, const GenerateStmt & g)
{
  emit_ignored_prompts(ctx, g);
  ctx.line("last_dataset_name = list(loaded_datasets.keys())[-1]");
  ctx.line(fmt::format(
    "loaded_datasets[last_dataset_name] = generate_content(loaded_datasets[last_dataset_name], "
    "{})",
    generate_arguments(g)));
}

void emit_generate_for(CodegenContext & ctx, const GenerateStmt & g, const std::string & var)
{
  emit_ignored_prompts(ctx, g);
  ctx.line(fmt::format("{} = generate_content({}, {})", var, var, generate_arguments(g)));
  ctx.line(fmt::format("loaded_datasets[{}] = {}", quote_python_string(var), var));
}

// ============================================================================
// Statement lowering
// ============================================================================

void lower_stmt(CodegenContext & ctx, const Stmt * stmt);
void lower_from(CodegenContext & ctx, const FromStmt & from);

/// Lower a configuration-phase statement of a FROM block bound to `var`.
void lower_dataset_config(CodegenContext & ctx, const Stmt * stmt, const std::string & var)
{
  const std::string fields_var = "fields_" + var;
  const std::string filters_var = "filters_" + var;

  switch (stmt->get_kind()) {
    case NodeKind::FieldsStmt:
      ctx.line(fields_var + " = " + python_list(cast<FieldsStmt>(stmt)->fields));
      return;
    case NodeKind::FilterStmt: {
      const auto * f = cast<FilterStmt>(stmt);
      emit_filter(ctx, filters_var, std::string(f->field), f->op, f->value);
      return;
    }
    case NodeKind::FilterBlock: {
      const auto * f = cast<FilterBlock>(stmt);
      for (const auto & c : f->conditions) {
        emit_filter(ctx, filters_var, fmt::format("{}.{}", f->field, c.field), c.op, c.value);
      }
      return;
    }
    case NodeKind::WithStmt:
      // The block was already partitioned by the caller.
      emit_with_setting(ctx, *cast<WithStmt>(stmt));
      return;
    case NodeKind::FromStmt:
    case NodeKind::UsingStmt:
    case NodeKind::UsingBlock:
    case NodeKind::MergeStmt:
    case NodeKind::SaveStmt:
    case NodeKind::GenerateStmt:
    case NodeKind::PromptStmt:
    case NodeKind::PragmaStmt:
    case NodeKind::Block:
    case NodeKind::Program:
      lower_stmt(ctx, stmt);
      return;
  }
}

struct DatasetPhases
{
  std::vector<const Stmt *> config;
  std::vector<const GenerateStmt *> generate;
  std::vector<const SaveStmt *> save;
};

/// Stable split into configuration, generate and save phases; WITH blocks are flattened.
void partition(const Block * block, DatasetPhases & phases)
{
  if (block == nullptr) {
    return;
  }
  for (const Stmt * s : block->stmts) {
    if (const auto * g = dyn_cast<GenerateStmt>(s)) {
      phases.generate.push_back(g);
    } else if (const auto * sv = dyn_cast<SaveStmt>(s)) {
      phases.save.push_back(sv);
    } else if (const auto * w = dyn_cast<WithStmt>(s)) {
      phases.config.push_back(w);
      partition(w->block, phases);
    } else {
      phases.config.push_back(s);
    }
  }
}

void lower_from(CodegenContext & ctx, const FromStmt & from)
{
  const std::string var = dataset_variable(from.dataset);
  ctx.register_dataset(var);

  DatasetPhases phases;
  partition(from.block, phases);

  ctx.line(fmt::format("# FROM {}", quote_python_string(from.dataset)));
  ctx.line(fmt::format("fields_{} = list(fields)", var));
  ctx.line(fmt::format("filters_{} = dict(filters)", var));

  for (const Stmt * s : phases.config) {
    lower_dataset_config(ctx, s, var);
  }

  ctx.line(fmt::format(
    "{0} = load_dataset_with_config({1}, streaming=stream, fields=fields_{0}, "
    "filters=filters_{0})",
    var, quote_python_string(from.dataset)));
  ctx.line(fmt::format("loaded_datasets[{}] = {}", quote_python_string(var), var));

  for (const GenerateStmt * g : phases.generate) {
    emit_generate_for(ctx, *g, var);
  }
  for (const SaveStmt * s : phases.save) {
    emit_save(ctx, *s);
  }
}

void lower_stmt(CodegenContext & ctx, const Stmt * stmt)
{
  switch (stmt->get_kind()) {
    case NodeKind::FromStmt:
      lower_from(ctx, *cast<FromStmt>(stmt));
      break;
    case NodeKind::WithStmt: {
      const auto * w = cast<WithStmt>(stmt);
      emit_with_setting(ctx, *w);
      if (w->block != nullptr) {
        for (const Stmt * s : w->block->stmts) {
          lower_stmt(ctx, s);
        }
      }
      break;
    }
    case NodeKind::FieldsStmt:
      ctx.line("fields = " + python_list(cast<FieldsStmt>(stmt)->fields));
      break;
    case NodeKind::UsingStmt:
      emit_using(ctx, *cast<UsingStmt>(stmt));
      break;
    case NodeKind::UsingBlock:
      for (const UsingStmt * u : cast<UsingBlock>(stmt)->entries) {
        emit_using(ctx, *u);
      }
      break;
    case NodeKind::FilterStmt: {
      const auto * f = cast<FilterStmt>(stmt);
      emit_filter(ctx, "filters", std::string(f->field), f->op, f->value);
      break;
    }
    case NodeKind::FilterBlock: {
      const auto * f = cast<FilterBlock>(stmt);
      for (const auto & c : f->conditions) {
        emit_filter(ctx, "filters", fmt::format("{}.{}", f->field, c.field), c.op, c.value);
      }
      break;
    }
    case NodeKind::MergeStmt:
      emit_merge(ctx, *cast<MergeStmt>(stmt));
      break;
    case NodeKind::SaveStmt:
      emit_save(ctx, *cast<SaveStmt>(stmt));
      break;
    case NodeKind::GenerateStmt:
      emit_generate_top_level(ctx, *cast<GenerateStmt>(stmt));
      break;
    case NodeKind::PromptStmt:
      emit_prompt(ctx, *cast<PromptStmt>(stmt));
      break;
    case NodeKind::PragmaStmt:
      emit_pragma(ctx, *cast<PragmaStmt>(stmt));
      break;
    case NodeKind::Block:
    case NodeKind::Program:
      // Not statements; never reached from a Program's statement list.
      break;
  }
}

}  // namespace

// ============================================================================
// PythonGenerator
// ============================================================================

std::string PythonGenerator::generate(const Program & program)
{
  CodegenContext ctx;
  ctx.raw(python_prelude());
  ctx.raw(k_pipeline_marker);

  for (const Stmt * s : program.stmts) {
    lower_stmt(ctx, s);
  }

  ctx.raw("\n\nif __name__ == '__main__':\n    main()\n");
  return ctx.take_output();
}

}  // namespace syn_dsl::codegen
