// format_check/basic/diagnostic_printer.hpp
//
// Prints formatting diagnostics as a source line followed by an underline
// row marking the span the formatter wants changed.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "format_check/basic/diagnostic.hpp"

namespace format_check
{

/**
 * Prints diagnostics in two-row form.
 *
 * Produces output like:
 *   src/a.ts:1   const x=1;
 *                --------^-
 *
 * The underline row has one marker per character of the line: '^' inside
 * the span, '-' elsewhere, so it lines up under the source text. Spans are
 * given in bytes and converted to UTF-8 character columns for display.
 */
class DiagnosticPrinter
{
public:
  /// Spaces between the "file:line" header and the source text
  static constexpr size_t k_header_padding = 3;

  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cout)
   * @param use_color Whether to highlight the caret run
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /**
   * Print a single diagnostic.
   */
  void print(const FormatDiagnostic & diag);

  /**
   * Print diagnostics in the given order.
   */
  void print_all(const DiagnosticList & diags);

  /**
   * Render a diagnostic without colour, both rows newline-terminated.
   */
  [[nodiscard]] static std::string render(const FormatDiagnostic & diag);

  /**
   * Build the underline row for a line of `line_width` characters, without
   * the leading padding. `column` and `length` are in characters.
   */
  [[nodiscard]] static std::string underline(
    size_t line_width, uint32_t column, uint32_t length);

private:
  std::ostream & os_;
  bool use_color_;
};

}  // namespace format_check
