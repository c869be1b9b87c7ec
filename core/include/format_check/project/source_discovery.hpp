// format_check/project/source_discovery.hpp - Root source file discovery
#pragma once

#include <filesystem>
#include <vector>

#include "format_check/project/project_config.hpp"

namespace format_check
{

/**
 * List the project's root source files.
 *
 * Collects sources.files plus every regular file below sources.directories
 * whose name ends with one of sources.extensions, then drops names ending
 * with one of sources.exclude_suffixes. Paths are made relative to the
 * current directory where possible. The result is sorted and free of
 * duplicates.
 *
 * @throws std::runtime_error if a declared file or directory does not exist
 */
[[nodiscard]] std::vector<std::filesystem::path> collect_source_files(
  const ProjectConfig & config);

}  // namespace format_check
