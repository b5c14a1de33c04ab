// syn_dsl/project/project_config.hpp - Project configuration (sync.yaml)
//
// Defaults for `sync run` / `sync build`; command-line flags override them.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include "syn_dsl/exec/executor.hpp"

namespace syn_dsl
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Complete project configuration (sync.yaml).
 *
 * @code
 *   interpreter: python3
 *   script_dir: output
 *   keep_script: false
 *   debug: false
 *   shutdown_timeout_ms: 30000
 * @endcode
 */
struct ProjectConfig
{
  std::string interpreter = "python3";

  /// Where generated programs are written (relative to project_root)
  std::filesystem::path script_dir = "output";

  bool keep_script = false;
  bool debug = false;
  int64_t shutdown_timeout_ms = 30000;

  /// Directory containing sync.yaml; empty for built-in defaults
  std::filesystem::path project_root;

  /// Executor settings with script_dir resolved against project_root.
  [[nodiscard]] exec::ExecutorOptions executor_options() const;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a sync.yaml file.
 *
 * Missing keys keep their defaults; a key with a value of the wrong type
 * fails the whole load.
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Search for sync.yaml starting from start_dir and moving up the directory
 * hierarchy until the filesystem root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_project_config_file_name = "sync.yaml";

}  // namespace syn_dsl
