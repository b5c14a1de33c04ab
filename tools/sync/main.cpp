// sync - SYN-DSL compiler and pipeline runner
//
// Usage:
//   sync run <file.syn> [--keep-script] [-o script.py] [--python exe] [--debug]
//   sync build <file.syn> [-o script.py]
//   sync check <file.syn>
//   sync ast <file.syn>
//   sync --compile <file.syn>          (same as `sync run`)
//
#include <fmt/core.h>
#include <fmt/ostream.h>

#include <cstdio>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

#include <unistd.h>

#include "syn_dsl/ast/json_visitor.hpp"
#include "syn_dsl/basic/diagnostic_printer.hpp"
#include "syn_dsl/basic/error.hpp"
#include "syn_dsl/driver/compiler.hpp"
#include "syn_dsl/project/project_config.hpp"
#include "syn_dsl/syntax/frontend.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "SYN-DSL Compiler v0.1.0\n\n"
            << "Usage: " << program_name << " <command> <file.syn> [options]\n\n"
            << "Commands:\n"
            << "  run <file.syn>           Compile and execute the pipeline\n"
            << "  build <file.syn>         Compile only; print or write the program\n"
            << "  check <file.syn>         Tokenize and parse only\n"
            << "  ast <file.syn>           Print the syntax tree as JSON\n\n"
            << "Options:\n"
            << "  -o, --output <path>      Program file to write\n"
            << "  --keep-script            Keep the program file after a successful run\n"
            << "  --python <exe>           Interpreter used to run the program\n"
            << "  --debug                  Run the program with SYN_DEBUG=1\n"
            << "  --compile <file.syn>     Same as `run <file.syn>`\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

bool stderr_is_tty() { return isatty(fileno(stderr)) != 0; }

void print_diagnostics(const syn_dsl::CompileResult & result)
{
  syn_dsl::DiagnosticPrinter printer(std::cerr, stderr_is_tty());
  if (result.source) {
    printer.print_all(result.diagnostics, *result.source);
    return;
  }
  const syn_dsl::SourceManager empty;
  printer.print_all(result.diagnostics, empty);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string output_path;
  std::optional<std::string> interpreter;
  bool keep_script = false;
  bool debug = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  int first = 2;
  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }
  if (args.command == "--compile") {
    args.command = "run";
    if (argc < 3) {
      args.error = "--compile requires a file argument";
      return args;
    }
    args.input_file = argv[2];
    first = 3;
  }

  for (int i = first; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "-o" || arg == "--output" || arg == "--python") {
      if (i + 1 >= argc) {
        args.error = "missing value for " + arg;
        return args;
      }
      if (arg == "--python") {
        args.interpreter = argv[++i];
      } else {
        args.output_path = argv[++i];
      }
    } else if (arg == "--keep-script") {
      args.keep_script = true;
    } else if (arg == "--debug") {
      args.debug = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    } else {
      args.error = "unexpected argument: " + arg;
      return args;
    }
  }

  return args;
}

/// sync.yaml (if any) with command-line flags applied on top.
std::optional<syn_dsl::ProjectConfig> resolve_config(const CommandArgs & args)
{
  syn_dsl::ProjectConfig config;

  if (auto config_path = syn_dsl::find_project_config(fs::current_path())) {
    auto loaded = syn_dsl::load_project_config(*config_path);
    if (!loaded.success) {
      std::cerr << "error: " << config_path->string() << ": " << loaded.error << "\n";
      return std::nullopt;
    }
    if (args.verbose) {
      std::cerr << "Using configuration: " << config_path->string() << "\n";
    }
    config = std::move(loaded.config);
  }

  if (args.interpreter) {
    config.interpreter = *args.interpreter;
  }
  if (args.keep_script) {
    config.keep_script = true;
  }
  if (args.debug) {
    config.debug = true;
  }
  return config;
}

bool require_input(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: input file required\n";
    std::cerr << "usage: sync " << args.command << " <file.syn>\n";
    return false;
  }
  return true;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_run(const CommandArgs & args)
{
  if (!require_input(args)) {
    return 1;
  }

  const auto config = resolve_config(args);
  if (!config) {
    return 1;
  }

  const fs::path input_path = fs::absolute(args.input_file);
  if (args.verbose) {
    std::cerr << "Compiling: " << input_path.string() << "\n";
  }

  const syn_dsl::CompileResult result = syn_dsl::Compiler::compile_file(input_path);
  if (!result.success) {
    print_diagnostics(result);
    return 1;
  }

  syn_dsl::exec::ExecutorOptions options = config->executor_options();
  options.verbose = args.verbose;

  const fs::path destination = args.output_path.empty()
                                 ? syn_dsl::Compiler::script_path_for(input_path, options)
                                 : fs::path(args.output_path);

  try {
    const auto report = syn_dsl::Compiler::execute_generated_program(
      result.program_text, config->keep_script, destination, options);
    if (report.interrupted) {
      std::cerr << "Pipeline interrupted.\n";
    }
    if (config->keep_script) {
      std::cerr << "Program kept at " << report.script_path.string() << "\n";
    }
  } catch (const syn_dsl::ExecutionError & e) {
    fmt::print(std::cerr, "error: {}\n", e.what());
    return 1;
  }

  return 0;
}

int cmd_build(const CommandArgs & args)
{
  if (!require_input(args)) {
    return 1;
  }

  const fs::path input_path = fs::absolute(args.input_file);
  const syn_dsl::CompileResult result = syn_dsl::Compiler::compile_file(input_path);
  if (!result.success) {
    print_diagnostics(result);
    return 1;
  }

  if (args.output_path.empty()) {
    std::cout << result.program_text;
    return 0;
  }

  const fs::path out_path(args.output_path);
  if (out_path.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(out_path.parent_path(), ec);
    if (ec) {
      std::cerr << "error: cannot create directory " << out_path.parent_path().string() << ": "
                << ec.message() << "\n";
      return 1;
    }
  }

  std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    std::cerr << "error: failed to open output file: " << out_path.string() << "\n";
    return 1;
  }
  out << result.program_text;
  out.close();
  if (!out) {
    std::cerr << "error: failed to write output file: " << out_path.string() << "\n";
    return 1;
  }

  std::cerr << "Generated: " << out_path.string() << "\n";
  return 0;
}

int cmd_check(const CommandArgs & args)
{
  if (!require_input(args)) {
    return 1;
  }

  const syn_dsl::CompileResult result =
    syn_dsl::Compiler::compile_file(fs::absolute(args.input_file));
  if (!result.success) {
    print_diagnostics(result);
    return 1;
  }

  std::cout << args.input_file << ": OK\n";
  return 0;
}

int cmd_ast(const CommandArgs & args)
{
  if (!require_input(args)) {
    return 1;
  }

  const fs::path input_path = fs::absolute(args.input_file);
  std::ifstream in(input_path, std::ios::binary);
  if (!in.is_open()) {
    std::cerr << "error: file not found: " << input_path.string() << "\n";
    return 1;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  const auto unit = syn_dsl::parse_source(buffer.str(), input_path);
  if (!unit->ok()) {
    syn_dsl::DiagnosticPrinter printer(std::cerr, stderr_is_tty());
    printer.print_all(unit->diags, unit->source);
    return 1;
  }

  std::cout << syn_dsl::to_json(unit->program).dump(2) << "\n";
  return 0;
}

}  // namespace

// ============================================================================
// Main
// ============================================================================

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }
  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    print_usage(argv[0]);
    return 1;
  }

  try {
    if (args.command == "run") {
      return cmd_run(args);
    }
    if (args.command == "build") {
      return cmd_build(args);
    }
    if (args.command == "check") {
      return cmd_check(args);
    }
    if (args.command == "ast") {
      return cmd_ast(args);
    }
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }

  std::cerr << "error: unknown command: " << args.command << "\n";
  print_usage(argv[0]);
  return 1;
}
