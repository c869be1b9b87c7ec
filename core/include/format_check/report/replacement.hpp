// format_check/report/replacement.hpp - Formatter replacement report types
#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

namespace format_check
{

/**
 * A region of a file the formatter wants changed.
 */
struct ReplacementSpan
{
  uint32_t offset = 0;  ///< Byte offset into the file
  uint32_t length = 0;  ///< Number of bytes replaced

  [[nodiscard]] bool operator==(const ReplacementSpan & other) const
  {
    return offset == other.offset && length == other.length;
  }
};

/**
 * All replacements reported for one submitted file, sorted by offset.
 */
struct FileReport
{
  std::filesystem::path file_path;
  std::vector<ReplacementSpan> spans;

  /// True when the formatter has nothing to change in this file
  [[nodiscard]] bool conforms() const noexcept { return spans.empty(); }
};

}  // namespace format_check
