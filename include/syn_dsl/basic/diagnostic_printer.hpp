// syn_dsl/basic/diagnostic_printer.hpp
//
// Renders diagnostics with the offending source line and a caret marker.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "syn_dsl/basic/diagnostic.hpp"
#include "syn_dsl/basic/source_manager.hpp"

namespace syn_dsl
{

/**
 * Prints diagnostics in the compact Rust style:
 *
 *   error[E0103]: at least two datasets are required for MERGE
 *     --> pipeline.syn:4:1
 *      |
 *    4 | MERGE [squad]
 *      | ^^^^^
 *      |
 *      = help: list the datasets as MERGE [a, b]
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (normally std::cerr)
   * @param use_color Emit terminal colors via rang
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceManager & source);

  /// Print every diagnostic, ordered by primary location.
  void print_all(const DiagnosticBag & diags, const SourceManager & source);

private:
  void print_header(const Diagnostic & diag);
  void print_label(const Label & label, const SourceManager & source);
  void print_help(std::string_view message);

  [[nodiscard]] std::string gutter() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace syn_dsl
