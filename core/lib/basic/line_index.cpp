// format_check/basic/line_index.cpp - Line table implementation
#include "format_check/basic/line_index.hpp"

#include <fmt/core.h>

#include <stdexcept>

namespace format_check
{

LineIndex::LineIndex(std::string_view text)
{
  if (text.size() > k_max_text_size) {
    throw std::length_error(
      fmt::format("text of {} bytes exceeds the {} byte limit", text.size(), k_max_text_size));
  }
  text_size_ = static_cast<uint32_t>(text.size());

  uint32_t start = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\n') {
      line_starts_.push_back(start);
      line_lengths_.push_back(static_cast<uint32_t>(i) - start);
      start = static_cast<uint32_t>(i + 1);
    }
  }
  // Trailing segment (empty when the text ends with '\n')
  line_starts_.push_back(start);
  line_lengths_.push_back(text_size_ - start);
}

std::vector<LineColumn> LineIndex::resolve(gsl::span<const uint32_t> offsets) const
{
  std::vector<LineColumn> result;
  result.reserve(offsets.size());

  size_t line_count = 0;
  uint32_t prev_char_count = 0;
  uint32_t prev_offset = 0;

  for (const uint32_t offset : offsets) {
    if (offset < prev_offset) {
      throw std::invalid_argument(
        fmt::format("offsets must be sorted ascending ({} follows {})", offset, prev_offset));
    }
    if (offset > text_size_) {
      throw std::out_of_range(
        fmt::format("offset {} is past the end of the text ({} bytes)", offset, text_size_));
    }
    prev_offset = offset;

    while (line_count + 1 < line_starts_.size() &&
           offset >= prev_char_count + line_lengths_[line_count]) {
      // +1 for the '\n' not counted in the line length
      prev_char_count += line_lengths_[line_count] + 1;
      ++line_count;
    }

    const uint32_t column = offset > prev_char_count ? offset - prev_char_count : 0;
    result.push_back({static_cast<uint32_t>(line_count + 1), column});
  }

  return result;
}

}  // namespace format_check
