// format_check/driver/format_driver.cpp - Format driver implementation
//
#include "format_check/driver/format_driver.hpp"

#include <fmt/core.h>

#include <stdexcept>

#include "format_check/basic/source_manager.hpp"
#include "format_check/project/source_discovery.hpp"
#include "format_check/report/diagnostic_mapper.hpp"
#include "format_check/report/replacement_decoder.hpp"

namespace format_check
{

namespace
{

std::string join_args(const std::vector<std::string> & args)
{
  std::string joined;
  for (const auto & a : args) {
    if (!joined.empty()) {
      joined += ' ';
    }
    joined += a;
  }
  return joined;
}

}  // namespace

FormatDriver::FormatDriver(
  FormatterInvoker & invoker, Logger & logger, std::ostream & out, bool use_color)
: invoker_(invoker), logger_(logger), printer_(out, use_color)
{
}

bool FormatDriver::format(
  const FormatOptions & options, std::vector<std::filesystem::path> files, bool fix)
{
  if (options.dry_run && fix) {
    logger_.log("format: skipping auto fix since --dry-run was passed");
    fix = false;
  }

  // If the project has a .clang-format, use it. Else pass the default style
  // inline.
  const std::vector<std::string> base_args =
    select_style_args(options.target_root_dir, options.style);

  // Only the project's own root sources are formatted, never generated or
  // third-party files outside the declared set.
  if (files.empty() && options.project) {
    files = collect_source_files(*options.project);
  }

  if (files.empty()) {
    logger_.debug("format: no source files to format");
    return true;
  }

  if (fix) {
    return this->fix(files, base_args);
  }

  const bool result = check(files, base_args);
  if (!result) {
    logger_.log("clang-format reported errors... run `format-check fix` to address.");
  }
  return result;
}

bool FormatDriver::check(
  const std::vector<std::filesystem::path> & files, const std::vector<std::string> & base_args)
{
  if (files.empty()) {
    return true;
  }

  const std::vector<std::string> args = build_args(base_args, k_check_flag, files);
  logger_.debug("format: running formatter with " + join_args(args));

  const FormatterOutput output = invoker_.run(args, OutputMode::Capture);

  // Decode the whole batch before printing anything
  const std::vector<FileReport> reports = ReplacementDecoder::decode(output.stdout_text, files);

  bool conforms = true;
  for (const auto & report : reports) {
    logger_.debug(
      fmt::format("format: {}: {} replacement(s)", report.file_path.string(), report.spans.size()));
    if (report.conforms()) {
      continue;
    }
    conforms = false;

    // Re-read the original file; the report offsets refer to its bytes
    const SourceFile source = SourceFile::load(report.file_path);
    DiagnosticList diags;
    try {
      diags = map_replacements(source, report);
    } catch (const std::out_of_range & e) {
      throw std::runtime_error(report.file_path.string() + ": " + e.what());
    }
    printer_.print_all(diags);
  }

  return conforms;
}

bool FormatDriver::fix(
  const std::vector<std::filesystem::path> & files, const std::vector<std::string> & base_args)
{
  if (files.empty()) {
    return true;
  }

  const std::vector<std::string> args = build_args(base_args, k_fix_flag, files);
  logger_.debug("format: running formatter with " + join_args(args));

  (void)invoker_.run(args, OutputMode::Inherit);
  return true;
}

std::vector<std::string> FormatDriver::build_args(
  const std::vector<std::string> & base_args, const char * mode_flag,
  const std::vector<std::filesystem::path> & files)
{
  std::vector<std::string> args = base_args;
  args.reserve(base_args.size() + 1 + files.size());
  args.emplace_back(mode_flag);
  for (const auto & f : files) {
    args.push_back(f.string());
  }
  return args;
}

}  // namespace format_check
