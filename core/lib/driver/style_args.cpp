// format_check/driver/style_args.cpp - Style argument selection
#include "format_check/driver/style_args.hpp"

#include <fmt/core.h>

namespace format_check
{

std::string inline_style(const StyleDefaults & style)
{
  return fmt::format(
    "{{Language: {}, BasedOnStyle: {}, ColumnLimit: {}}}", style.language,
    style.based_on_style, style.column_limit);
}

std::vector<std::string> select_style_args(
  const std::filesystem::path & root_dir, const StyleDefaults & defaults)
{
  std::error_code ec;
  if (std::filesystem::exists(root_dir / k_style_file_name, ec)) {
    return {"-style=file"};
  }
  return {"-style", inline_style(defaults)};
}

}  // namespace format_check
