// format_check/project/project_config.cpp - Project configuration implementation
//
#include "format_check/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace format_check
{

namespace
{

/// Parse an optional list of strings under `key`
bool parse_string_list(
  const YAML::Node & parent, const char * key, const std::string & qualified_name,
  std::vector<std::string> & out, std::string & error)
{
  const YAML::Node node = parent[key];
  if (!node) {
    return true;
  }
  if (!node.IsSequence()) {
    error = qualified_name + " must be a list";
    return false;
  }
  out.clear();
  for (const auto & item : node) {
    out.push_back(item.as<std::string>());
  }
  return true;
}

bool parse_path_list(
  const YAML::Node & parent, const char * key, const std::string & qualified_name,
  std::vector<std::filesystem::path> & out, std::string & error)
{
  std::vector<std::string> items;
  if (!parse_string_list(parent, key, qualified_name, items, error)) {
    return false;
  }
  for (auto & item : items) {
    out.emplace_back(std::move(item));
  }
  return true;
}

/// Parse the 'format.style' section
bool parse_style(const YAML::Node & node, StyleDefaults & style, std::string & error)
{
  if (!node.IsMap()) {
    error = "format.style must be a map";
    return false;
  }

  if (node["language"]) {
    style.language = node["language"].as<std::string>();
  }
  if (node["based_on_style"]) {
    style.based_on_style = node["based_on_style"].as<std::string>();
  }
  if (node["column_limit"]) {
    style.column_limit = node["column_limit"].as<int>();
    if (style.column_limit <= 0) {
      error = "format.style.column_limit must be a positive integer";
      return false;
    }
  }
  return true;
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  // Load YAML
  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  if (root.IsNull()) {
    // Empty file: all defaults
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  std::string error;
  try {
    // Parse 'package' section
    if (root["package"]) {
      const auto & pkg = root["package"];
      if (pkg["name"]) {
        config.package.name = pkg["name"].as<std::string>();
      }
    }

    // Parse 'sources' section
    if (root["sources"]) {
      const auto & src = root["sources"];
      if (!src.IsMap()) {
        return ConfigLoadResult::fail("sources must be a map");
      }
      if (
        !parse_path_list(src, "files", "sources.files", config.sources.files, error) ||
        !parse_path_list(
          src, "directories", "sources.directories", config.sources.directories, error) ||
        !parse_string_list(
          src, "extensions", "sources.extensions", config.sources.extensions, error) ||
        !parse_string_list(
          src, "exclude_suffixes", "sources.exclude_suffixes", config.sources.exclude_suffixes,
          error) ||
        !parse_string_list(
          src, "exclude_directories", "sources.exclude_directories",
          config.sources.exclude_directories, error)) {
        return ConfigLoadResult::fail(error);
      }
    }

    // Parse 'format' section
    if (root["format"]) {
      const auto & fmt_node = root["format"];
      if (!fmt_node.IsMap()) {
        return ConfigLoadResult::fail("format must be a map");
      }
      if (fmt_node["clang_format"]) {
        config.format.clang_format = fmt_node["clang_format"].as<std::string>();
        if (config.format.clang_format.empty()) {
          return ConfigLoadResult::fail("format.clang_format must not be empty");
        }
      }
      if (fmt_node["style"] && !parse_style(fmt_node["style"], config.format.style, error)) {
        return ConfigLoadResult::fail(error);
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If startDir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    // Move up to parent
    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace format_check
