// format_check/project/project_config.hpp - Project configuration (format-check.yaml)
//
// Parses and validates format-check.yaml project configuration files.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "format_check/driver/style_args.hpp"

namespace format_check
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Declared root source files of the project.
 *
 * Relative paths are resolved against the directory holding the config file.
 */
struct SourcesConfig
{
  /// Individual files to check
  std::vector<std::filesystem::path> files;

  /// Directories scanned recursively for files with a matching extension
  std::vector<std::filesystem::path> directories;

  /// File name endings picked up from directories
  std::vector<std::string> extensions = {".ts", ".tsx", ".js"};

  /// File name endings never checked (declaration-only files)
  std::vector<std::string> exclude_suffixes = {".d.ts"};

  /// Directory names skipped while scanning
  std::vector<std::string> exclude_directories = {"node_modules"};
};

/**
 * Formatter section.
 */
struct FormatConfig
{
  /// Formatter executable (looked up on PATH unless it contains '/')
  std::string clang_format = "clang-format";

  /// Inline style used when the project has no .clang-format
  StyleDefaults style;
};

/**
 * Package metadata section.
 */
struct PackageConfig
{
  std::string name;
};

/**
 * Complete project configuration (format-check.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  SourcesConfig sources;
  FormatConfig format;

  /// Directory containing format-check.yaml (for resolving relative paths)
  std::filesystem::path project_root;
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

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  /// Create a successful result
  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  /// Create a failed result
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
 * Load a project configuration from a format-check.yaml file.
 *
 * @param config_path Path to format-check.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory to start searching from
 * @return Path to format-check.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "format-check.yaml";

}  // namespace format_check
