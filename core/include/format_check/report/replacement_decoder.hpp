// format_check/report/replacement_decoder.hpp - clang-format XML report decoder
//
// Decodes the output of `clang-format -output-replacements-xml`. For a batch
// of N files clang-format writes N XML documents back to back, one per file
// in argument order, each starting with the XML declaration.
//
#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "format_check/report/replacement.hpp"

namespace format_check
{

class ReplacementDecoder
{
public:
  /// Literal that starts every document in the report
  static constexpr std::string_view k_document_marker = "<?xml version='1.0'?>";

  /**
   * Decode a batch report.
   *
   * Report i is paired with files[i]. A report without any document marker
   * is treated as a single document.
   *
   * @param output Complete formatter output
   * @param files Files in the order they were passed to the formatter
   * @return One FileReport per file, spans sorted by offset
   * @throws std::runtime_error if the report is malformed or the number of
   *         documents does not match the number of files
   */
  [[nodiscard]] static std::vector<FileReport> decode(
    std::string_view output, const std::vector<std::filesystem::path> & files);

  /**
   * Split a batch report into its XML documents.
   *
   * @throws std::runtime_error if non-whitespace text precedes the first
   *         marker
   */
  [[nodiscard]] static std::vector<std::string> split_documents(std::string_view output);

  /**
   * Parse the replacements of a single XML document.
   *
   * @throws std::runtime_error if the document is malformed
   */
  [[nodiscard]] static std::vector<ReplacementSpan> parse_document(const std::string & xml);
};

}  // namespace format_check
