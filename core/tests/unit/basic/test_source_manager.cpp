#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>

#include "format_check/basic/source_manager.hpp"

namespace fs = std::filesystem;

using format_check::SourceFile;

static fs::path make_temp_dir(std::string_view prefix)
{
  const auto base = fs::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = base / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

TEST(BasicSourceFile, GetLineStripsTerminator)
{
  const SourceFile file("a.ts", "const x=1;\nlet y = 2;\n");

  EXPECT_EQ(file.get_line(1), "const x=1;");
  EXPECT_EQ(file.get_line(2), "let y = 2;");
  EXPECT_EQ(file.get_line(3), "");
  EXPECT_EQ(file.get_line(0), "");
  EXPECT_EQ(file.get_line(4), "");
  EXPECT_EQ(file.lines().line_count(), 3U);
}

TEST(BasicSourceFile, CopiesKeepLineTableInSync)
{
  SourceFile original("a.ts", "one\ntwo\n");
  const SourceFile copy = original;
  original = SourceFile("b.ts", "x");

  EXPECT_EQ(copy.path().string(), "a.ts");
  EXPECT_EQ(copy.get_line(2), "two");
  EXPECT_EQ(original.get_line(1), "x");
}

TEST(BasicSourceFile, LoadReadsBytesVerbatim)
{
  const fs::path dir = make_temp_dir("format_check_source_load");
  const fs::path path = dir / "crlf.ts";
  {
    std::ofstream out(path, std::ios::binary);
    out << "a;\r\nb;\r\n";
  }

  const SourceFile file = SourceFile::load(path);
  EXPECT_EQ(file.path().string(), path.string());
  EXPECT_EQ(file.content(), "a;\r\nb;\r\n");
  EXPECT_EQ(file.get_line(1), "a;\r");

  fs::remove_all(dir);
}

TEST(BasicSourceFile, LoadMissingFileThrows)
{
  const fs::path dir = make_temp_dir("format_check_source_missing");
  EXPECT_THROW((void)SourceFile::load(dir / "does_not_exist.ts"), std::runtime_error);
  fs::remove_all(dir);
}

TEST(BasicSourceFile, LoadRejectsFileBeyondOffsetRange)
{
  const fs::path dir = make_temp_dir("format_check_source_huge");
  const fs::path path = dir / "huge.ts";
  {
    std::ofstream out(path, std::ios::binary);
    out << "x;\n";
  }

  // Sparse file one byte past the 32-bit offset range
  std::error_code ec;
  fs::resize_file(path, std::uintmax_t{UINT32_MAX} + 1, ec);
  if (ec) {
    fs::remove_all(dir);
    GTEST_SKIP() << "cannot create sparse file: " << ec.message();
  }

  EXPECT_THROW((void)SourceFile::load(path), std::runtime_error);
  fs::remove_all(dir);
}
