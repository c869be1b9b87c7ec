// format_check/project/source_discovery.cpp - Root source file discovery
//
#include "format_check/project/source_discovery.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

namespace format_check
{

namespace
{

bool ends_with_any(std::string_view name, const std::vector<std::string> & suffixes)
{
  return std::any_of(suffixes.begin(), suffixes.end(), [name](const std::string & s) {
    return !s.empty() && name.size() >= s.size() &&
           name.compare(name.size() - s.size(), s.size(), s) == 0;
  });
}

bool is_excluded_dir(const fs::path & dir, const SourcesConfig & sources)
{
  const std::string name = dir.filename().string();
  return std::find(sources.exclude_directories.begin(), sources.exclude_directories.end(), name) !=
         sources.exclude_directories.end();
}

fs::path to_display_path(const fs::path & abs_path)
{
  std::error_code ec;
  auto rel_path = fs::relative(abs_path, fs::current_path(), ec);
  return (ec || rel_path.empty()) ? abs_path : rel_path;
}

}  // namespace

std::vector<fs::path> collect_source_files(const ProjectConfig & config)
{
  const SourcesConfig & sources = config.sources;
  std::vector<fs::path> found;

  for (const auto & file : sources.files) {
    const fs::path abs_path = (config.project_root / file).lexically_normal();
    if (!fs::is_regular_file(abs_path)) {
      throw std::runtime_error("source file not found: " + abs_path.string());
    }
    if (!ends_with_any(abs_path.filename().string(), sources.exclude_suffixes)) {
      found.push_back(abs_path);
    }
  }

  for (const auto & dir : sources.directories) {
    const fs::path abs_dir = (config.project_root / dir).lexically_normal();
    if (!fs::is_directory(abs_dir)) {
      throw std::runtime_error("source directory not found: " + abs_dir.string());
    }

    auto it = fs::recursive_directory_iterator(
      abs_dir, fs::directory_options::skip_permission_denied);
    for (; it != fs::recursive_directory_iterator(); ++it) {
      const fs::directory_entry & entry = *it;
      if (entry.is_directory()) {
        if (is_excluded_dir(entry.path(), sources)) {
          it.disable_recursion_pending();
        }
        continue;
      }
      if (!entry.is_regular_file()) {
        continue;
      }
      const std::string name = entry.path().filename().string();
      if (ends_with_any(name, sources.extensions) && !ends_with_any(name, sources.exclude_suffixes)) {
        found.push_back(entry.path().lexically_normal());
      }
    }
  }

  std::sort(found.begin(), found.end());
  found.erase(std::unique(found.begin(), found.end()), found.end());

  std::vector<fs::path> result;
  result.reserve(found.size());
  for (const auto & p : found) {
    result.push_back(to_display_path(p));
  }
  return result;
}

}  // namespace format_check
