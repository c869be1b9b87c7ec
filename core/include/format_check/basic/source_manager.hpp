// format_check/basic/source_manager.hpp - Source file content and lines
//
// Holds the raw text of a checked file together with its line table.
//
#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "format_check/basic/line_index.hpp"

namespace format_check
{

// ============================================================================
// SourceFile - One file's text and line table
// ============================================================================

/**
 * Source content of a single file.
 *
 * Features:
 * - Stores the file path as given by the caller (used in diagnostics)
 * - Stores the raw file content, byte for byte
 * - Pre-computes the line table for offset lookups
 */
class SourceFile
{
public:
  SourceFile() = default;

  /// Initialize with file path and source content
  SourceFile(std::filesystem::path path, std::string content);

  /**
   * Read a file from disk.
   *
   * @throws std::runtime_error if the file cannot be read or is too large to
   *         index
   */
  [[nodiscard]] static SourceFile load(const std::filesystem::path & path);

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view content() const noexcept { return content_; }
  [[nodiscard]] const LineIndex & lines() const noexcept { return lines_; }

  /// Get the content of a line without its '\n' (1-indexed line number)
  [[nodiscard]] std::string_view get_line(uint32_t line_number) const noexcept;

private:
  std::filesystem::path path_;
  std::string content_;
  LineIndex lines_;
};

}  // namespace format_check
