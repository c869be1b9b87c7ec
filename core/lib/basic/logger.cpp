// format_check/basic/logger.cpp - Logger implementation
#include "format_check/basic/logger.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <ostream>
#include <rang.hpp>

namespace format_check
{

Logger::Logger(std::ostream & os, bool verbose, bool use_color)
: os_(os), verbose_(verbose), use_color_(use_color)
{
}

void Logger::log(std::string_view message) { fmt::print(os_, "{}\n", message); }

void Logger::error(std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::red << rang::style::bold << "error" << rang::style::reset << rang::fg::reset;
    fmt::print(os_, ": {}\n", message);
  } else {
    fmt::print(os_, "error: {}\n", message);
  }
}

void Logger::debug(std::string_view message)
{
  if (!verbose_) {
    return;
  }
  fmt::print(os_, "{}\n", message);
}

}  // namespace format_check
