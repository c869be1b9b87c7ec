// format_check/report/diagnostic_mapper.cpp - Diagnostic mapping implementation
#include "format_check/report/diagnostic_mapper.hpp"

#include <cstdint>
#include <vector>

namespace format_check
{

DiagnosticList map_replacements(const SourceFile & source, const FileReport & report)
{
  std::vector<uint32_t> offsets;
  offsets.reserve(report.spans.size());
  for (const auto & span : report.spans) {
    offsets.push_back(span.offset);
  }

  const LineIndex & lines = source.lines();
  const std::vector<LineColumn> positions = lines.resolve(offsets);

  DiagnosticList diags;
  diags.reserve(report.spans.size());
  for (size_t i = 0; i < report.spans.size(); ++i) {
    const ReplacementSpan & span = report.spans[i];
    const LineColumn pos = positions[i];

    const uint64_t anchor = static_cast<uint64_t>(lines.line_start(pos.line - 1)) + pos.column;
    const uint64_t span_end = static_cast<uint64_t>(span.offset) + span.length;

    FormatDiagnostic diag;
    diag.file_path = report.file_path.string();
    diag.line_number = pos.line;
    diag.line_text = std::string(source.get_line(pos.line));
    diag.column = pos.column;
    diag.length = span_end > anchor ? static_cast<uint32_t>(span_end - anchor) : 0;
    diags.push_back(std::move(diag));
  }

  return diags;
}

}  // namespace format_check
