// syn_dsl/driver/compiler.cpp - Compiler driver implementation
//
#include "syn_dsl/driver/compiler.hpp"

#include <fstream>
#include <sstream>
#include <utility>

#include "syn_dsl/codegen/python_generator.hpp"
#include "syn_dsl/syntax/frontend.hpp"

namespace syn_dsl
{

namespace
{

/// Keeps the parsed unit alive while exposing only its SourceManager.
std::shared_ptr<const SourceManager> share_source(std::shared_ptr<ParsedUnit> unit)
{
  return std::shared_ptr<const SourceManager>(unit, &unit->source);
}

}  // namespace

CompileResult Compiler::compile_from_text(std::string source, const std::filesystem::path & path)
{
  CompileResult result;

  std::shared_ptr<ParsedUnit> unit = parse_source(std::move(source), path);
  for (const auto & diag : unit->diags) {
    result.diagnostics.add(diag);
  }

  if (unit->ok()) {
    result.program_text = codegen::PythonGenerator::generate(*unit->program);
    result.success = true;
  }

  result.source = share_source(std::move(unit));
  return result;
}

CompileResult Compiler::compile_file(const std::filesystem::path & file)
{
  namespace fs = std::filesystem;

  if (!fs::exists(file)) {
    CompileResult result;
    result.diagnostics.report_error(SourceRange{}, "file not found: " + file.string())
      .with_code("E0200");
    result.source = std::make_shared<const SourceManager>(file, std::string());
    return result;
  }

  std::ifstream in(file, std::ios::binary);
  if (!in.is_open()) {
    CompileResult result;
    result.diagnostics.report_error(SourceRange{}, "failed to open file: " + file.string())
      .with_code("E0200");
    result.source = std::make_shared<const SourceManager>(file, std::string());
    return result;
  }

  std::stringstream buffer;
  buffer << in.rdbuf();
  return compile_from_text(buffer.str(), file);
}

exec::ExecutionReport Compiler::execute_generated_program(
  std::string_view program_text, bool keep_file, const std::filesystem::path & destination,
  const exec::ExecutorOptions & options)
{
  exec::Executor executor(options);
  return executor.run(program_text, keep_file, destination);
}

CompileResult Compiler::run_file(
  const std::filesystem::path & file, const exec::ExecutorOptions & options, bool keep_file,
  exec::ExecutionReport * report)
{
  CompileResult result = compile_file(file);
  if (!result.success) {
    return result;
  }

  exec::ExecutionReport r = execute_generated_program(
    result.program_text, keep_file, script_path_for(file, options), options);
  if (report != nullptr) {
    *report = std::move(r);
  }
  return result;
}

std::filesystem::path Compiler::script_path_for(
  const std::filesystem::path & file, const exec::ExecutorOptions & options)
{
  return options.script_dir / (file.stem().string() + ".py");
}

}  // namespace syn_dsl
