#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "format_check/driver/style_args.hpp"

namespace fs = std::filesystem;

using format_check::inline_style;
using format_check::select_style_args;
using format_check::StyleDefaults;

static fs::path make_temp_dir(std::string_view prefix)
{
  const auto base = fs::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = base / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

TEST(DriverStyleArgs, DefaultInlineStyle)
{
  EXPECT_EQ(
    inline_style(StyleDefaults{}), "{Language: JavaScript, BasedOnStyle: Google, ColumnLimit: 80}");
}

TEST(DriverStyleArgs, InlineStyleWhenNoStyleFile)
{
  const fs::path dir = make_temp_dir("format_check_style_inline");

  StyleDefaults style;
  style.language = "Cpp";
  style.based_on_style = "LLVM";
  style.column_limit = 120;

  const std::vector<std::string> expected = {
    "-style", "{Language: Cpp, BasedOnStyle: LLVM, ColumnLimit: 120}"};
  EXPECT_EQ(select_style_args(dir, style), expected);

  fs::remove_all(dir);
}

TEST(DriverStyleArgs, StyleFileWinsWhenPresent)
{
  const fs::path dir = make_temp_dir("format_check_style_file");
  {
    std::ofstream out(dir / ".clang-format");
    out << "BasedOnStyle: Google\n";
  }

  const std::vector<std::string> expected = {"-style=file"};
  EXPECT_EQ(select_style_args(dir, StyleDefaults{}), expected);

  fs::remove_all(dir);
}

TEST(DriverStyleArgs, StyleFileInSubdirectoryIsIgnored)
{
  const fs::path dir = make_temp_dir("format_check_style_nested");
  fs::create_directories(dir / "src");
  {
    std::ofstream out(dir / "src" / ".clang-format");
    out << "BasedOnStyle: Google\n";
  }

  EXPECT_EQ(select_style_args(dir, StyleDefaults{}).front(), "-style");

  fs::remove_all(dir);
}
