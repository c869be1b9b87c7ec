#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "format_check/basic/diagnostic_printer.hpp"
#include "format_check/basic/source_manager.hpp"
#include "format_check/report/diagnostic_mapper.hpp"

using format_check::DiagnosticPrinter;
using format_check::FileReport;
using format_check::map_replacements;
using format_check::ReplacementSpan;
using format_check::SourceFile;

static const char * k_source = "const x=1;\nlet y = 2;\n";

TEST(ReportDiagnosticMapper, AnchorsSpanToLineAndColumn)
{
  const SourceFile source("a.ts", k_source);
  const FileReport report{"a.ts", {ReplacementSpan{8, 1}}};

  const auto diags = map_replacements(source, report);
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags[0].file_path, "a.ts");
  EXPECT_EQ(diags[0].line_number, 1U);
  EXPECT_EQ(diags[0].line_text, "const x=1;");
  EXPECT_EQ(diags[0].column, 8U);
  EXPECT_EQ(diags[0].length, 1U);

  const std::string underline = DiagnosticPrinter::underline(diags[0].line_text.size(), 8, 1);
  EXPECT_EQ(underline, "--------^-");
}

TEST(ReportDiagnosticMapper, SeveralSpansOnOneLineKeepOrder)
{
  const SourceFile source("a.ts", k_source);
  const FileReport report{"a.ts", {{6, 0}, {7, 0}, {8, 0}, {14, 2}}};

  const auto diags = map_replacements(source, report);
  ASSERT_EQ(diags.size(), 4U);
  EXPECT_EQ(diags[0].line_number, 1U);
  EXPECT_EQ(diags[0].column, 6U);
  EXPECT_EQ(diags[1].column, 7U);
  EXPECT_EQ(diags[2].column, 8U);
  EXPECT_EQ(diags[3].line_number, 2U);
  EXPECT_EQ(diags[3].column, 3U);
  EXPECT_EQ(diags[3].length, 2U);
}

TEST(ReportDiagnosticMapper, SpanStartingOnTerminatorIsShownOnNextLine)
{
  // Replacing "\n  " with " " joins the two lines
  const SourceFile source("b.ts", "if (a) {\n  b();\n}\n");
  const FileReport report{"b.ts", {ReplacementSpan{8, 3}}};

  const auto diags = map_replacements(source, report);
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags[0].line_number, 2U);
  EXPECT_EQ(diags[0].line_text, "  b();");
  EXPECT_EQ(diags[0].column, 0U);
  EXPECT_EQ(diags[0].length, 2U);
}

TEST(ReportDiagnosticMapper, EmptyReportYieldsNoDiagnostics)
{
  const SourceFile source("a.ts", k_source);
  EXPECT_TRUE(map_replacements(source, FileReport{"a.ts", {}}).empty());
}

TEST(ReportDiagnosticMapper, SpanPastEndOfFileThrows)
{
  const SourceFile source("a.ts", k_source);
  const FileReport report{"a.ts", {ReplacementSpan{40, 1}}};
  EXPECT_THROW((void)map_replacements(source, report), std::out_of_range);
}
