// format_check/basic/source_manager.cpp - Source file implementation
#include "format_check/basic/source_manager.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace format_check
{

SourceFile::SourceFile(std::filesystem::path path, std::string content)
: path_(std::move(path)), content_(std::move(content)), lines_(content_)
{
}

SourceFile SourceFile::load(const std::filesystem::path & path)
{
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (!ec && size > LineIndex::k_max_text_size) {
    throw std::runtime_error(
      "File too large: " + path.string() + " (" + std::to_string(size) + " bytes)");
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    throw std::runtime_error("Failed to read file: " + path.string());
  }
  return SourceFile(path, buffer.str());
}

std::string_view SourceFile::get_line(uint32_t line_number) const noexcept
{
  if (line_number == 0 || line_number > lines_.line_count()) {
    return {};
  }
  const size_t line_index = line_number - 1;
  return std::string_view(content_).substr(
    lines_.line_start(line_index), lines_.line_length(line_index));
}

}  // namespace format_check
