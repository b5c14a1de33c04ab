// syn_dsl/project/project_config.cpp - Project configuration implementation
//
#include "syn_dsl/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <chrono>

namespace syn_dsl
{

namespace
{

/// Read `root[key]` into `out` if present; false (with `error` set) on a type mismatch.
template <typename T>
bool read_scalar(const YAML::Node & root, const char * key, const char * expected, T & out,
                 std::string & error)
{
  const YAML::Node node = root[key];
  if (!node) {
    return true;
  }
  if (!node.IsScalar()) {
    error = std::string("'") + key + "' must be " + expected;
    return false;
  }
  try {
    out = node.as<T>();
  } catch (const YAML::BadConversion &) {
    error = std::string("'") + key + "' must be " + expected + ", got '" + node.Scalar() + "'";
    return false;
  }
  return true;
}

}  // namespace

exec::ExecutorOptions ProjectConfig::executor_options() const
{
  exec::ExecutorOptions opts;
  opts.interpreter = interpreter;
  opts.script_dir =
    (script_dir.is_relative() && !project_root.empty()) ? project_root / script_dir : script_dir;
  opts.debug = debug;
  opts.shutdown_timeout = std::chrono::milliseconds(shutdown_timeout_ms);
  return opts;
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  // An empty file is a valid configuration with every default.
  if (root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("sync.yaml must contain a map of settings");
  }

  std::string error;
  std::string script_dir = config.script_dir.string();
  if (
    !read_scalar(root, "interpreter", "a string", config.interpreter, error) ||
    !read_scalar(root, "script_dir", "a string", script_dir, error) ||
    !read_scalar(root, "keep_script", "a boolean", config.keep_script, error) ||
    !read_scalar(root, "debug", "a boolean", config.debug, error) ||
    !read_scalar(root, "shutdown_timeout_ms", "an integer", config.shutdown_timeout_ms, error)) {
    return ConfigLoadResult::fail("invalid configuration: " + error);
  }
  config.script_dir = script_dir;

  if (config.interpreter.empty()) {
    return ConfigLoadResult::fail("invalid configuration: 'interpreter' must not be empty");
  }
  if (config.shutdown_timeout_ms < 0) {
    return ConfigLoadResult::fail("invalid configuration: 'shutdown_timeout_ms' must be >= 0");
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace syn_dsl
