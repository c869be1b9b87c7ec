// format_check/driver/format_driver.hpp - Format check/fix driver
//
// Single entry point for checking or fixing a batch of files.
// Used by the CLI and can be integrated into other tools.
//
#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "format_check/basic/diagnostic_printer.hpp"
#include "format_check/basic/logger.hpp"
#include "format_check/driver/formatter_invoker.hpp"
#include "format_check/driver/style_args.hpp"
#include "format_check/project/project_config.hpp"

namespace format_check
{

// ============================================================================
// Format Options
// ============================================================================

struct FormatOptions
{
  /// Directory searched for a .clang-format style file
  std::filesystem::path target_root_dir = ".";

  /// Never rewrite files. A fix request is downgraded to a check.
  bool dry_run = false;

  /// Inline style used when target_root_dir has no .clang-format
  StyleDefaults style;

  /// Project whose root source files are used when no files are given
  std::optional<ProjectConfig> project;
};

// ============================================================================
// FormatDriver
// ============================================================================

/**
 * Runs the formatter over a batch of files and reports the result.
 *
 * check() prints one diagnostic per reported replacement; fix() lets the
 * formatter rewrite the files in place. Each call spawns exactly one
 * formatter process for the whole batch.
 */
class FormatDriver
{
public:
  /// Flag asking clang-format for an XML replacement report
  static constexpr const char * k_check_flag = "-output-replacements-xml";

  /// Flag asking clang-format to rewrite files in place
  static constexpr const char * k_fix_flag = "-i";

  /**
   * @param invoker Formatter process runner
   * @param logger Channel for notices and verbose traces
   * @param out Stream receiving diagnostics (typically std::cout)
   * @param use_color Whether diagnostics are coloured
   */
  FormatDriver(
    FormatterInvoker & invoker, Logger & logger, std::ostream & out, bool use_color = false);

  /**
   * Check or fix a batch of files.
   *
   * When `files` is empty the project's root source files are used. A dry
   * run always checks, even when `fix` is requested.
   *
   * @return true if every file conforms (check) or the fix succeeded
   * @throws std::runtime_error on formatter, report or file read failure
   */
  bool format(const FormatOptions & options, std::vector<std::filesystem::path> files, bool fix);

  /**
   * Report formatting differences without changing any file.
   *
   * @param files Files to check; diagnostics are printed in this order
   * @param base_args Style arguments placed before the mode flag
   * @return true if the formatter reported no replacement for any file
   */
  bool check(
    const std::vector<std::filesystem::path> & files, const std::vector<std::string> & base_args);

  /**
   * Rewrite files in place.
   *
   * @return true once the formatter has finished successfully
   */
  bool fix(
    const std::vector<std::filesystem::path> & files, const std::vector<std::string> & base_args);

  /// Formatter arguments: [base_args..., mode_flag, files...]
  [[nodiscard]] static std::vector<std::string> build_args(
    const std::vector<std::string> & base_args, const char * mode_flag,
    const std::vector<std::filesystem::path> & files);

private:
  FormatterInvoker & invoker_;
  Logger & logger_;
  DiagnosticPrinter printer_;
};

}  // namespace format_check
