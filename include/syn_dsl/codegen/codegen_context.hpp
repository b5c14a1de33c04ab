// syn_dsl/codegen/codegen_context.hpp - Transient state of one PythonGenerator run
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>

namespace syn_dsl::codegen
{

/**
 * Output buffer plus the facts the lowering functions share.
 *
 * One context per generate() call; it is threaded explicitly through every
 * lowering function and discarded afterwards.
 */
class CodegenContext
{
public:
  static constexpr std::string_view k_indent = "    ";

  /// Append one line of pipeline code at main() body indentation.
  void line(std::string_view text)
  {
    out_ += k_indent;
    out_ += text;
    out_ += '\n';
  }

  void raw(std::string_view text) { out_ += text; }

  [[nodiscard]] std::string take_output() { return std::move(out_); }

  // ===========================================================================
  // Dataset variables
  // ===========================================================================

  /// Re-registering a variable (a dataset loaded twice) is a no-op.
  void register_dataset(std::string var) { datasets_.insert(std::move(var)); }

  [[nodiscard]] size_t dataset_count() const noexcept { return datasets_.size(); }

  // ===========================================================================
  // Interrupt handling
  // ===========================================================================

  /// Set by the first PRAGMA AUTOSAVE; never reset. Later ones register nothing.
  void enable_sigint_handler() noexcept { sigint_handler_enabled_ = true; }
  [[nodiscard]] bool sigint_handler_enabled() const noexcept { return sigint_handler_enabled_; }

private:
  std::string out_;
  std::unordered_set<std::string> datasets_;
  bool sigint_handler_enabled_ = false;
};

}  // namespace syn_dsl::codegen
