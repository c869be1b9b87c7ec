#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "format_check/basic/line_index.hpp"

using format_check::LineColumn;
using format_check::LineIndex;

static const std::string k_two_lines = "const x=1;\nlet y = 2;\n";

TEST(BasicLineIndex, SplitsOnNewlineWithTrailingEmptyLine)
{
  const LineIndex index(k_two_lines);

  ASSERT_EQ(index.line_count(), 3U);
  EXPECT_EQ(index.line_start(0), 0U);
  EXPECT_EQ(index.line_length(0), 10U);
  EXPECT_EQ(index.line_start(1), 11U);
  EXPECT_EQ(index.line_length(1), 10U);
  EXPECT_EQ(index.line_start(2), 22U);
  EXPECT_EQ(index.line_length(2), 0U);
  EXPECT_EQ(index.text_size(), 22U);
}

TEST(BasicLineIndex, EmptyTextHasOneEmptyLine)
{
  const LineIndex index("");
  ASSERT_EQ(index.line_count(), 1U);
  EXPECT_EQ(index.line_length(0), 0U);
  EXPECT_EQ(index.resolve(std::vector<uint32_t>{0}).front(), (LineColumn{1, 0}));
}

TEST(BasicLineIndex, ResolvesOffsetInFirstLine)
{
  const LineIndex index(k_two_lines);
  const std::vector<uint32_t> offsets = {8};

  const auto positions = index.resolve(offsets);
  ASSERT_EQ(positions.size(), 1U);
  EXPECT_EQ(positions[0].line, 1U);
  EXPECT_EQ(positions[0].column, 8U);
}

TEST(BasicLineIndex, ReconstructsOffsetFromLineStartAndColumn)
{
  const std::string text = "a\n\nbcd\nefgh\n\n  ij";
  const LineIndex index(text);

  std::vector<uint32_t> offsets;
  for (uint32_t i = 0; i <= text.size(); ++i) {
    if (i < text.size() && text[i] == '\n') {
      continue;  // terminators are attributed to the next line
    }
    offsets.push_back(i);
  }

  const auto positions = index.resolve(offsets);
  ASSERT_EQ(positions.size(), offsets.size());
  for (size_t i = 0; i < offsets.size(); ++i) {
    const LineColumn pos = positions[i];
    ASSERT_TRUE(pos.is_valid());
    EXPECT_EQ(index.line_start(pos.line - 1) + pos.column, offsets[i]) << "offset " << offsets[i];
  }
}

TEST(BasicLineIndex, OffsetAtLineBoundaryBelongsToNextLine)
{
  const LineIndex index(k_two_lines);
  const std::vector<uint32_t> offsets = {9, 10, 11};

  const auto positions = index.resolve(offsets);
  ASSERT_EQ(positions.size(), 3U);
  EXPECT_EQ(positions[0], (LineColumn{1, 9}));
  EXPECT_EQ(positions[1], (LineColumn{2, 0}));
  EXPECT_EQ(positions[2], (LineColumn{2, 0}));
}

TEST(BasicLineIndex, RepeatedOffsetsResolveToSamePosition)
{
  const LineIndex index(k_two_lines);
  const std::vector<uint32_t> offsets = {12, 12, 15};

  const auto positions = index.resolve(offsets);
  ASSERT_EQ(positions.size(), 3U);
  EXPECT_EQ(positions[0], (LineColumn{2, 1}));
  EXPECT_EQ(positions[1], (LineColumn{2, 1}));
  EXPECT_EQ(positions[2], (LineColumn{2, 4}));
}

TEST(BasicLineIndex, EndOfTextResolvesToLastLine)
{
  const LineIndex with_newline(k_two_lines);
  EXPECT_EQ(with_newline.resolve(std::vector<uint32_t>{22}).front(), (LineColumn{3, 0}));

  const LineIndex without_newline("ab\ncd");
  const std::vector<uint32_t> offsets = {5};
  const auto positions = without_newline.resolve(offsets);
  ASSERT_EQ(positions.size(), 1U);
  EXPECT_EQ(positions[0], (LineColumn{2, 2}));
}

TEST(BasicLineIndex, RejectsUnsortedOffsets)
{
  const LineIndex index(k_two_lines);
  const std::vector<uint32_t> offsets = {12, 3};
  EXPECT_THROW((void)index.resolve(offsets), std::invalid_argument);
}

TEST(BasicLineIndex, RejectsOffsetPastEndOfText)
{
  const LineIndex index(k_two_lines);
  const std::vector<uint32_t> offsets = {23};
  EXPECT_THROW((void)index.resolve(offsets), std::out_of_range);
}

TEST(BasicLineIndex, CarriageReturnCountsAsLineContent)
{
  const LineIndex index("ab\r\ncd\r\n");
  EXPECT_EQ(index.line_length(0), 3U);
  EXPECT_EQ(index.line_start(1), 4U);
  EXPECT_EQ(index.resolve(std::vector<uint32_t>{5}).front(), (LineColumn{2, 1}));
}
