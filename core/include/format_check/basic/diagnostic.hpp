// format_check/basic/diagnostic.hpp - Formatting diagnostic type
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace format_check
{

/**
 * One formatting difference anchored to a source line.
 *
 * The span [column, column + length) is measured in bytes of line_text and
 * may run past the end of the line; the printer clamps it.
 */
struct FormatDiagnostic
{
  std::string file_path;
  uint32_t line_number = 0;  ///< 1-indexed
  std::string line_text;     ///< Line content without its '\n'
  uint32_t column = 0;       ///< 0-indexed start of the span
  uint32_t length = 0;       ///< Span length in bytes
};

using DiagnosticList = std::vector<FormatDiagnostic>;

}  // namespace format_check
