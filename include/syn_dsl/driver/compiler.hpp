// syn_dsl/driver/compiler.hpp - Compiler driver
//
// Single entry point for the compile and execute pipeline.
// Used by the CLI and can be integrated into other tools.
//
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "syn_dsl/basic/diagnostic.hpp"
#include "syn_dsl/basic/source_manager.hpp"
#include "syn_dsl/exec/executor.hpp"

namespace syn_dsl
{

// ============================================================================
// Compile Result
// ============================================================================

struct CompileResult
{
  /// Whether compilation succeeded (no errors)
  bool success = false;

  /// Generated Python program (only populated on success)
  std::string program_text;

  /// Collected diagnostics (at most one error: the pipeline is fail-fast)
  DiagnosticBag diagnostics;

  /// Source the diagnostics point into (for DiagnosticPrinter)
  std::shared_ptr<const SourceManager> source;
};

// ============================================================================
// Compiler
// ============================================================================

/**
 * Compiler driver: tokenize -> parse -> generate, and optionally execute.
 *
 * Tokenize and parse errors are reported through CompileResult; execution
 * failures are thrown as ExecutionError.
 */
class Compiler
{
public:
  /**
   * Compile DSL source text into a Python program.
   *
   * @param source Full DSL source
   * @param path Path shown in diagnostics (empty for in-memory sources)
   */
  [[nodiscard]] static CompileResult compile_from_text(
    std::string source, const std::filesystem::path & path = {});

  /// Read and compile a .syn file. A missing or unreadable file is reported as E0200.
  [[nodiscard]] static CompileResult compile_file(const std::filesystem::path & file);

  /**
   * Write and execute a generated program.
   *
   * @param program_text Output of compile_*
   * @param keep_file Keep the program file after a successful run
   * @param destination Program path; `<script_dir>/syn_script.py` when empty
   * @throws ExecutionError
   */
  static exec::ExecutionReport execute_generated_program(
    std::string_view program_text, bool keep_file, const std::filesystem::path & destination,
    const exec::ExecutorOptions & options);

  /**
   * Compile a .syn file and execute it as `<script_dir>/<stem>.py`.
   *
   * Returns the compile result; `report` is filled only when the program ran.
   * @throws ExecutionError
   */
  static CompileResult run_file(
    const std::filesystem::path & file, const exec::ExecutorOptions & options, bool keep_file,
    exec::ExecutionReport * report = nullptr);

  /// Default destination used by run_file.
  [[nodiscard]] static std::filesystem::path script_path_for(
    const std::filesystem::path & file, const exec::ExecutorOptions & options);
};

}  // namespace syn_dsl
