// syn_dsl/codegen/python_generator.hpp - Lower a Program into a Python pipeline script
#pragma once

#include <string>
#include <string_view>

#include "syn_dsl/ast/ast.hpp"

namespace syn_dsl::codegen
{

/// Marker line separating the runtime prelude from the lowered statements.
inline constexpr std::string_view k_pipeline_marker = "    # --- pipeline ---\n";

/**
 * Map a dataset name to a Python identifier fragment.
 *
 * Every character outside [A-Za-z0-9_] becomes '_':
 * `sanitize_identifier("a/b-c.d") == "a_b_c_d"`.
 */
[[nodiscard]] std::string sanitize_identifier(std::string_view name);

/// `ds_<sanitized name>`
[[nodiscard]] std::string dataset_variable(std::string_view dataset_name);

/// Single-quoted Python string literal with backslash escapes.
[[nodiscard]] std::string quote_python_string(std::string_view s);

/// Shortest round-trip spelling that Python reads back as a float ("0.7", "1.0").
[[nodiscard]] std::string format_python_float(double v);

/// Imports, `def main():` and the runtime helpers, ending just before the pipeline marker.
[[nodiscard]] std::string_view python_prelude() noexcept;

/**
 * Code generator for the Python pipeline program.
 *
 * Output is deterministic: equal trees give byte-identical text. No
 * semantic validation happens here; a GENERATE that names a missing dataset
 * fails when the script runs.
 */
class PythonGenerator
{
public:
  PythonGenerator() = default;

  [[nodiscard]] static std::string generate(const Program & program);
};

}  // namespace syn_dsl::codegen
