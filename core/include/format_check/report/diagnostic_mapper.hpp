// format_check/report/diagnostic_mapper.hpp - Replacement spans to diagnostics
#pragma once

#include "format_check/basic/diagnostic.hpp"
#include "format_check/basic/source_manager.hpp"
#include "format_check/report/replacement.hpp"

namespace format_check
{

/**
 * Anchor every span of a report to a line of its source file.
 *
 * Diagnostics come out in ascending offset order. A span that starts on a
 * line terminator is shown from the start of the next line, shortened by the
 * bytes it covered before that line.
 *
 * @throws std::out_of_range if a span starts past the end of the file
 */
[[nodiscard]] DiagnosticList map_replacements(const SourceFile & source, const FileReport & report);

}  // namespace format_check
