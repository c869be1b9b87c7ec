// format_check/basic/logger.hpp - User-facing message channel
//
// Notices, advisories and verbose traces. Diagnostics themselves go through
// DiagnosticPrinter, not through the logger.
//
#pragma once

#include <iosfwd>
#include <string_view>

namespace format_check
{

class Logger
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param verbose Whether debug() messages are emitted
   * @param use_color Whether to colour the "error:" label
   */
  explicit Logger(std::ostream & os, bool verbose = false, bool use_color = false);

  /// Always-printed notice
  void log(std::string_view message);

  /// Always-printed error, prefixed with "error: "
  void error(std::string_view message);

  /// Trace message, printed only in verbose mode
  void debug(std::string_view message);

  [[nodiscard]] bool is_verbose() const noexcept { return verbose_; }

private:
  std::ostream & os_;
  bool verbose_;
  bool use_color_;
};

}  // namespace format_check
