// format_check/driver/formatter_invoker.hpp - External formatter process
//
// Runs the external formatter with a given argument list. The interface is
// the seam between the driver and the real process so tests can substitute
// canned output.
//
#pragma once

#include <string>
#include <vector>

namespace format_check
{

// ============================================================================
// Output Mode
// ============================================================================

enum class OutputMode {
  Capture,  ///< stdin from /dev/null, stdout captured, stderr inherited
  Inherit,  ///< All standard streams inherited from this process
};

struct FormatterOutput
{
  /// Everything the formatter wrote to stdout (Capture mode only)
  std::string stdout_text;
};

// ============================================================================
// FormatterInvoker
// ============================================================================

class FormatterInvoker
{
public:
  virtual ~FormatterInvoker() = default;

  /**
   * Run the formatter to completion.
   *
   * In Capture mode the output stream is drained to end-of-stream before
   * returning.
   *
   * @param args Arguments after the executable name
   * @param mode How standard streams are connected
   * @throws std::runtime_error if the formatter cannot be started, is killed
   *         by a signal, or exits with a non-zero status
   */
  virtual FormatterOutput run(const std::vector<std::string> & args, OutputMode mode) = 0;
};

// ============================================================================
// ClangFormatProcess
// ============================================================================

/**
 * Spawns clang-format (or a compatible executable) as a child process.
 *
 * The executable is looked up on PATH unless it contains a '/'.
 */
class ClangFormatProcess final : public FormatterInvoker
{
public:
  static constexpr const char * k_default_executable = "clang-format";

  explicit ClangFormatProcess(std::string executable = k_default_executable);

  FormatterOutput run(const std::vector<std::string> & args, OutputMode mode) override;

  [[nodiscard]] const std::string & executable() const noexcept { return executable_; }

private:
  std::string executable_;
};

}  // namespace format_check
