// format_check/basic/line_index.hpp - Byte offset to line/column mapping
//
// This header provides the line table used to anchor formatter replacements
// to source lines.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <string_view>
#include <vector>

namespace format_check
{

// ============================================================================
// LineColumn - Human-readable position
// ============================================================================

/**
 * Line and column of a byte offset.
 */
struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 0-indexed byte column within the line

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0; }

  [[nodiscard]] constexpr bool operator==(LineColumn other) const noexcept
  {
    return line == other.line && column == other.column;
  }
  [[nodiscard]] constexpr bool operator!=(LineColumn other) const noexcept
  {
    return !(*this == other);
  }
};

// ============================================================================
// LineIndex - Line table for one text buffer
// ============================================================================

/**
 * Line table of a text buffer split on '\n'.
 *
 * The terminator is not part of a line but occupies one offset unit between
 * consecutive lines. A buffer ending in '\n' has a final empty line, so the
 * table always holds at least one line.
 *
 * The index stores offsets only; it does not keep a reference to the text.
 */
class LineIndex
{
public:
  /// Build the table for an empty buffer (one empty line)
  LineIndex() : LineIndex(std::string_view{}) {}

  /// Largest text the index can address with 32-bit offsets
  static constexpr size_t k_max_text_size = UINT32_MAX;

  /**
   * Build the table for the given text.
   *
   * @throws std::length_error if the text is larger than k_max_text_size
   */
  explicit LineIndex(std::string_view text);

  /// Number of lines (always >= 1)
  [[nodiscard]] size_t line_count() const noexcept { return line_starts_.size(); }

  /// Total byte size of the indexed text
  [[nodiscard]] uint32_t text_size() const noexcept { return text_size_; }

  /// Byte offset where a line starts (0-indexed line)
  [[nodiscard]] uint32_t line_start(size_t line_index) const noexcept
  {
    return line_starts_[line_index];
  }

  /// Length of a line in bytes, excluding the '\n' terminator (0-indexed line)
  [[nodiscard]] uint32_t line_length(size_t line_index) const noexcept
  {
    return line_lengths_[line_index];
  }

  /**
   * Resolve a non-decreasing sequence of offsets in one forward pass.
   *
   * An offset equal to the end of a line (the '\n' terminator) belongs to
   * the following line at column 0. An offset equal to text_size() resolves
   * to the end of the last line.
   *
   * @throws std::invalid_argument if offsets are not sorted ascending
   * @throws std::out_of_range if an offset is past the end of the text
   */
  [[nodiscard]] std::vector<LineColumn> resolve(gsl::span<const uint32_t> offsets) const;

private:
  std::vector<uint32_t> line_starts_;
  std::vector<uint32_t> line_lengths_;
  uint32_t text_size_ = 0;
};

}  // namespace format_check
