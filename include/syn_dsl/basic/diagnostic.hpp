// syn_dsl/basic/diagnostic.hpp - Diagnostics produced by the front end and driver
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "syn_dsl/basic/source_manager.hpp"

namespace syn_dsl
{

// ============================================================================
// Core Structures
// ============================================================================

enum class Severity : uint8_t {
  Error,
  Warning,
  Note,
};

enum class LabelStyle : uint8_t {
  Primary,    // where the problem is
  Secondary,  // related context
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

/**
 * One reportable problem.
 *
 * `code` identifies the problem class (E0001.. for tokenizer errors,
 * E0100.. for parse errors, E0200.. for driver errors, E0300 for execution).
 */
struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;
  std::string message;

  std::vector<Label> labels;
  std::optional<std::string> help_message;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fluent builder returned by DiagnosticBag::report_*.
 *
 * The diagnostic is committed to the bag when the builder is destroyed.
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);
  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string msg);
  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBuilder report_error(
    SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_warning(
    SourceRange range, std::string message, std::string label_message = "");

  void add(Diagnostic diag);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }
  [[nodiscard]] bool has_errors() const;

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace syn_dsl
