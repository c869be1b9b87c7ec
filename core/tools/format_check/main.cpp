// format-check - clang-format verification command line interface
//
// Usage:
//   format-check check [files...]
//   format-check fix [files...]
//
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <unistd.h>

#include "format_check/basic/logger.hpp"
#include "format_check/driver/format_driver.hpp"
#include "format_check/driver/formatter_invoker.hpp"
#include "format_check/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "format-check v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options] [files...]\n\n"
            << "Commands:\n"
            << "  check [files...]         Report formatting differences\n"
            << "  fix [files...]           Rewrite files in place\n\n"
            << "Without files, the root sources declared in format-check.yaml are used.\n\n"
            << "Options:\n"
            << "  --config <path>          Project file (default: search for format-check.yaml)\n"
            << "  --clang-format <path>    Formatter executable\n"
            << "  --dry-run                Never rewrite files (fix only checks)\n"
            << "  --no-color               Disable coloured output\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<fs::path> files;
  std::string config_path;
  std::string clang_format;
  bool dry_run = false;
  bool no_color = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--config" || arg == "--clang-format") {
      if (i + 1 >= argc) {
        args.error = "missing value for " + arg;
        return args;
      }
      (arg == "--config" ? args.config_path : args.clang_format) = argv[++i];
    } else if (arg == "--dry-run") {
      args.dry_run = true;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] == '-') {
      args.error = "unknown option '" + arg + "'";
      return args;
    } else {
      args.files.emplace_back(arg);
    }
  }

  return args;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_format(const CommandArgs & args, bool fix)
{
  const bool use_color = !args.no_color && isatty(fileno(stdout)) != 0;
  format_check::Logger logger(std::cerr, args.verbose, use_color && isatty(fileno(stderr)) != 0);

  // Locate the project file: explicit --config, else search upward
  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::path(args.config_path);
  } else {
    config_path = format_check::find_project_config(fs::current_path());
  }

  format_check::FormatOptions options;
  options.dry_run = args.dry_run;
  options.target_root_dir = fs::current_path();
  std::string executable = format_check::ClangFormatProcess::k_default_executable;

  if (config_path) {
    auto config_result = format_check::load_project_config(*config_path);
    if (!config_result.success) {
      logger.error(config_result.error);
      return 1;
    }
    logger.debug("format: using project file " + config_path->string());
    if (!config_result.config.package.name.empty()) {
      logger.debug("format: package " + config_result.config.package.name);
    }

    options.target_root_dir = config_result.config.project_root;
    options.style = config_result.config.format.style;
    executable = config_result.config.format.clang_format;
    options.project = std::move(config_result.config);
  } else if (args.files.empty()) {
    logger.error(
      std::string("no ") + format_check::k_project_config_file_name +
      " found in current directory or parents; pass files explicitly");
    return 1;
  }

  if (!args.clang_format.empty()) {
    executable = args.clang_format;
  }

  logger.debug(
    "format: target root " + options.target_root_dir.string() + ", formatter " + executable);

  format_check::ClangFormatProcess formatter(executable);
  format_check::FormatDriver driver(formatter, logger, std::cout, use_color);

  try {
    const bool ok = driver.format(options, args.files, fix);
    std::cout.flush();
    return ok ? 0 : 1;
  } catch (const std::exception & e) {
    std::cout.flush();
    logger.error(e.what());
    return 1;
  }
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    print_usage(argv[0]);
    return 1;
  }

  if (args.command == "check") {
    return cmd_format(args, false);
  }

  if (args.command == "fix") {
    return cmd_format(args, true);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
