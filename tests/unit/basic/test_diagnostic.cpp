// tests/unit/basic/test_diagnostic.cpp - DiagnosticBag and DiagnosticPrinter tests
//

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "circ_dsl/basic/diagnostic.hpp"
#include "circ_dsl/basic/diagnostic_printer.hpp"

using namespace circ_dsl;

TEST(BasicDiagnostic, BuilderCommitsOnDestruction)
{
  DiagnosticBag diags;
  {
    auto builder = diags.report_error(SourceRange{}, "boom");
    builder.with_code("E0001").with_help("try again");
    EXPECT_TRUE(diags.empty());
  }
  ASSERT_EQ(diags.size(), 1U);
  const Diagnostic & d = diags.all().front();
  EXPECT_EQ(d.code, "E0001");
  EXPECT_EQ(d.message, "boom");
  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_EQ(*d.help_message, "try again");
}

TEST(BasicDiagnostic, CountsBySeverityAndCode)
{
  DiagnosticBag diags;
  diags.report_error(SourceRange{}, "a").with_code("E0101");
  diags.report_error(SourceRange{}, "b").with_code("E0101");
  diags.report_warning(SourceRange{}, "c").with_code("W0001");

  EXPECT_TRUE(diags.has_errors());
  EXPECT_TRUE(diags.has_warnings());
  EXPECT_EQ(diags.errors().size(), 2U);
  EXPECT_EQ(diags.warnings().size(), 1U);
  EXPECT_EQ(diags.count_code("E0101"), 2U);
  EXPECT_EQ(diags.count_code("E9999"), 0U);
  ASSERT_NE(diags.find_code("W0001"), nullptr);
  EXPECT_EQ(diags.find_code("W0001")->message, "c");
}

TEST(BasicDiagnostic, MergeMovesDiagnostics)
{
  DiagnosticBag a;
  DiagnosticBag b;
  a.report_error(SourceRange{}, "first");
  b.report_error(SourceRange{}, "second");

  a.merge(std::move(b));
  ASSERT_EQ(a.size(), 2U);
  EXPECT_EQ(a.all()[1].message, "second");
}

TEST(BasicDiagnosticPrinter, RendersSourceExcerpt)
{
  SourceRegistry sources;
  const FileId id = sources.register_file("token.leo", "record Token {\n  balance: u64,\n}\n");

  DiagnosticBag diags;
  diags
    .report_error(SourceRange(id, 7, 12), "record `Token` is missing required variable `owner: address`")
    .with_code("E0105")
    .with_help("add `owner: address` to the record");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(diags, sources);

  const std::string text = out.str();
  EXPECT_NE(text.find("error[E0105]: record `Token` is missing"), std::string::npos);
  EXPECT_NE(text.find("token.leo:1:8"), std::string::npos);
  EXPECT_NE(text.find("record Token {"), std::string::npos);
  EXPECT_NE(text.find("^^^^^"), std::string::npos);
  EXPECT_NE(text.find("= help: add `owner: address` to the record"), std::string::npos);
  EXPECT_NE(text.find("1 error, 0 warnings emitted"), std::string::npos);
}

TEST(BasicDiagnosticPrinter, FixItsDistinguishInsertAndReplace)
{
  SourceRegistry sources;
  const FileId id = sources.register_file("fix.leo", "let x = 1\n");

  DiagnosticBag diags;
  diags.report_error(SourceRange(id, 0, 3), "wrong")
    .with_fixit(SourceRange(id, 9, 9), ";")
    .with_fixit(SourceRange(id, 0, 3), "const");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print(diags.all().front(), sources);

  const std::string text = out.str();
  EXPECT_NE(text.find("help: insert `;`"), std::string::npos);
  EXPECT_NE(text.find("help: replace with `const`"), std::string::npos);
}
