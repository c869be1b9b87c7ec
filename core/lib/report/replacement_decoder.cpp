// format_check/report/replacement_decoder.cpp - Replacement report decoder
#include "format_check/report/replacement_decoder.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <stdexcept>

#include "tinyxml2.h"

namespace format_check
{

namespace
{

bool is_blank(std::string_view text)
{
  return text.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

uint32_t get_unsigned_attr(const tinyxml2::XMLElement * elem, const char * name)
{
  unsigned value = 0;
  if (elem->QueryUnsignedAttribute(name, &value) != tinyxml2::XML_SUCCESS) {
    const char * raw = elem->Attribute(name);
    throw std::runtime_error(fmt::format(
      "Malformed replacement at line {}: attribute '{}' {}", elem->GetLineNum(), name,
      raw ? fmt::format("is not an unsigned integer ('{}')", raw) : std::string("is missing")));
  }
  return static_cast<uint32_t>(value);
}

}  // namespace

std::vector<std::string> ReplacementDecoder::split_documents(std::string_view output)
{
  std::vector<std::string> documents;

  size_t pos = output.find(k_document_marker);
  if (pos == std::string_view::npos) {
    // Single self-contained document without a declaration
    if (!is_blank(output)) {
      documents.emplace_back(output);
    }
    return documents;
  }

  if (!is_blank(output.substr(0, pos))) {
    throw std::runtime_error("Malformed replacement report: unexpected text before first document");
  }

  while (pos != std::string_view::npos) {
    const size_t next = output.find(k_document_marker, pos + k_document_marker.size());
    const size_t end = (next == std::string_view::npos) ? output.size() : next;
    documents.emplace_back(output.substr(pos, end - pos));
    pos = next;
  }

  return documents;
}

std::vector<ReplacementSpan> ReplacementDecoder::parse_document(const std::string & xml)
{
  tinyxml2::XMLDocument doc;
  const tinyxml2::XMLError err = doc.Parse(xml.c_str(), xml.size());
  if (err != tinyxml2::XML_SUCCESS) {
    throw std::runtime_error("Failed to parse replacement report: " + std::string(doc.ErrorStr()));
  }

  const auto * root = doc.RootElement();
  if (!root || std::string_view(root->Name()) != "replacements") {
    throw std::runtime_error("Malformed replacement report: expected <replacements> root element");
  }

  std::vector<ReplacementSpan> spans;
  for (const auto * child = root->FirstChildElement("replacement"); child;
       child = child->NextSiblingElement("replacement")) {
    ReplacementSpan span;
    span.offset = get_unsigned_attr(child, "offset");
    span.length = get_unsigned_attr(child, "length");
    spans.push_back(std::move(span));
  }

  // Line resolution walks spans in offset order
  const auto by_offset = [](const ReplacementSpan & a, const ReplacementSpan & b) {
    return a.offset < b.offset;
  };
  if (!std::is_sorted(spans.begin(), spans.end(), by_offset)) {
    std::stable_sort(spans.begin(), spans.end(), by_offset);
  }

  return spans;
}

std::vector<FileReport> ReplacementDecoder::decode(
  std::string_view output, const std::vector<std::filesystem::path> & files)
{
  const std::vector<std::string> documents = split_documents(output);
  if (documents.size() != files.size()) {
    throw std::runtime_error(fmt::format(
      "Malformed replacement report: {} document(s) for {} file(s)", documents.size(),
      files.size()));
  }

  std::vector<FileReport> reports;
  reports.reserve(files.size());
  for (size_t i = 0; i < files.size(); ++i) {
    reports.push_back(FileReport{files[i], parse_document(documents[i])});
  }
  return reports;
}

}  // namespace format_check
