// format_check/basic/diagnostic_printer.cpp - Two-row diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "format_check/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <cstdint>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <string_view>
#include <utility>

namespace format_check
{

namespace
{

/// Strip a single trailing '\r' so CRLF files do not garble the output
std::string_view display_text(std::string_view line)
{
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }
  return line;
}

std::string make_header(const FormatDiagnostic & diag)
{
  return fmt::format("{}:{}", diag.file_path, diag.line_number);
}

/// Number of characters in UTF-8 text (bytes that are not continuation bytes)
size_t char_count(std::string_view text)
{
  return static_cast<size_t>(std::count_if(text.begin(), text.end(), [](char c) {
    return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
  }));
}

/// Caret run [begin, end) in characters for a byte span, clamped to the line
std::pair<size_t, size_t> caret_range(std::string_view line, uint32_t column, uint32_t length)
{
  const uint64_t span_end = static_cast<uint64_t>(column) + length;
  const size_t begin_byte = std::min<size_t>(column, line.size());
  const size_t end_byte = static_cast<size_t>(std::min<uint64_t>(span_end, line.size()));
  const size_t begin = char_count(line.substr(0, begin_byte));
  const size_t end = char_count(line.substr(0, end_byte));
  return {begin, std::max(begin, end)};
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  // Configure rang based on use_color setting
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const FormatDiagnostic & diag)
{
  if (!use_color_) {
    fmt::print(os_, "{}", render(diag));
    return;
  }

  const std::string_view line = display_text(diag.line_text);
  const std::string header = make_header(diag);
  const size_t padding = char_count(header) + k_header_padding;

  os_ << rang::style::bold << header << rang::style::reset;
  fmt::print(os_, "{}{}\n", std::string(k_header_padding, ' '), line);

  const auto [begin, end] = caret_range(line, diag.column, diag.length);
  fmt::print(os_, "{}{}", std::string(padding, ' '), std::string(begin, '-'));
  os_ << rang::fg::red << rang::style::bold << std::string(end - begin, '^')
      << rang::style::reset << rang::fg::reset;
  fmt::print(os_, "{}\n", std::string(char_count(line) - end, '-'));
}

void DiagnosticPrinter::print_all(const DiagnosticList & diags)
{
  for (const auto & d : diags) {
    print(d);
  }
}

std::string DiagnosticPrinter::render(const FormatDiagnostic & diag)
{
  const std::string_view line = display_text(diag.line_text);
  const std::string header = make_header(diag);
  const size_t padding = char_count(header) + k_header_padding;

  const auto [begin, end] = caret_range(line, diag.column, diag.length);

  return fmt::format(
    "{}{}{}\n{}{}\n", header, std::string(k_header_padding, ' '), line,
    std::string(padding, ' '),
    underline(char_count(line), static_cast<uint32_t>(begin), static_cast<uint32_t>(end - begin)));
}

std::string DiagnosticPrinter::underline(size_t line_width, uint32_t column, uint32_t length)
{
  const size_t begin = std::min<size_t>(column, line_width);
  const size_t end =
    std::max(begin, static_cast<size_t>(std::min<uint64_t>(
                      static_cast<uint64_t>(column) + length, line_width)));
  std::string row(line_width, '-');
  std::fill(row.begin() + static_cast<std::ptrdiff_t>(begin),
            row.begin() + static_cast<std::ptrdiff_t>(end), '^');
  return row;
}

}  // namespace format_check
