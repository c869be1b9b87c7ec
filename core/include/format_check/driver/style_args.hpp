// format_check/driver/style_args.hpp - clang-format style argument selection
#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace format_check
{

/**
 * Inline style used when the project has no style file of its own.
 */
struct StyleDefaults
{
  std::string language = "JavaScript";
  std::string based_on_style = "Google";
  int column_limit = 80;
};

/// Name of the project-local style file clang-format picks up with -style=file
inline constexpr const char * k_style_file_name = ".clang-format";

/**
 * Render the inline style descriptor, e.g.
 * "{Language: JavaScript, BasedOnStyle: Google, ColumnLimit: 80}".
 */
[[nodiscard]] std::string inline_style(const StyleDefaults & style);

/**
 * Choose the style arguments for one batch.
 *
 * Returns {"-style=file"} if root_dir contains a .clang-format file, and
 * {"-style", inline_style(defaults)} otherwise.
 */
[[nodiscard]] std::vector<std::string> select_style_args(
  const std::filesystem::path & root_dir, const StyleDefaults & defaults);

}  // namespace format_check
