// circ_dsl/project/project_config.hpp - Project configuration (circ.yaml)
//
// Parses and validates circ.yaml project configuration files.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace circ_dsl
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Compiler configuration section.
 */
struct CompilerConfig
{
  /// Entry point files to check (relative to circ.yaml)
  std::vector<std::filesystem::path> entry_points;

  /// Directory whose `src/` holds importable packages (relative to circ.yaml)
  std::filesystem::path search_root = ".";
};

/**
 * Package metadata section.
 */
struct PackageConfig
{
  std::string name;
  std::string version;
};

/**
 * Complete project configuration (circ.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  CompilerConfig compiler;

  /// Directory containing circ.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  /// Search root resolved against the project root.
  [[nodiscard]] std::filesystem::path resolved_search_root() const;

  /// Entry points resolved against the project root.
  [[nodiscard]] std::vector<std::filesystem::path> resolved_entry_points() const;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
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
 * Load a project configuration from a circ.yaml file.
 *
 * @param config_path Path to circ.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Find circ.yaml by searching upward from start_dir to the filesystem root.
 *
 * @return Path to circ.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_project_config_file_name = "circ.yaml";

}  // namespace circ_dsl
