// tests/basic/test_diagnostic.cpp - Unit tests for diagnostics and their printer
//

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <utility>

#include "typegraph/basic/diagnostic.hpp"
#include "typegraph/basic/diagnostic_printer.hpp"

using namespace typegraph;

// ============================================================================
// DeclLocation
// ============================================================================

TEST(BasicDeclLocation, PrintedForms)
{
  const ClassId cls(3);
  EXPECT_EQ(DeclLocation::of_class(cls, "User").to_string(), "User");
  EXPECT_EQ(DeclLocation::of_member(cls, "User", "name").to_string(), "User.name");
  EXPECT_EQ(
    DeclLocation::of_parameter(cls, "UserResolver", "getUser", 1).to_string(),
    "UserResolver.getUser#1");
  EXPECT_EQ(DeclLocation::of_class(cls, "").to_string(), "<class #3>");
  EXPECT_EQ(DeclLocation{}.to_string(), "<unknown>");
  EXPECT_FALSE(DeclLocation{}.is_valid());
}

// ============================================================================
// DiagnosticBag
// ============================================================================

TEST(BasicDiagnosticBag, BuilderRegistersOnDestruction)
{
  DiagnosticBag bag;
  {
    auto builder = bag.report_error(DeclLocation::of_class(ClassId(0), "User"), "bad");
    builder.with_code("TG002").with_help("add a field");
    EXPECT_TRUE(bag.empty());
  }

  ASSERT_EQ(bag.size(), 1U);
  const Diagnostic & d = bag.all().front();
  EXPECT_EQ(d.severity, Severity::Error);
  EXPECT_EQ(d.code, "TG002");
  EXPECT_EQ(d.message, "bad");
  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_EQ(*d.help_message, "add a field");
}

TEST(BasicDiagnosticBag, MovedBuilderRegistersOnce)
{
  DiagnosticBag bag;
  {
    auto first = bag.report_warning(DeclLocation{}, "w");
    auto second = std::move(first);
    second.with_note("n");
  }
  ASSERT_EQ(bag.size(), 1U);
  ASSERT_EQ(bag.all()[0].notes.size(), 1U);
}

TEST(BasicDiagnosticBag, SeverityQueries)
{
  DiagnosticBag bag;
  bag.report_warning(DeclLocation{}, "w");
  bag.report_note(DeclLocation{}, "n");
  EXPECT_FALSE(bag.has_errors());
  EXPECT_TRUE(bag.has_warnings());

  bag.report_error(DeclLocation{}, "e");
  EXPECT_TRUE(bag.has_errors());
  EXPECT_EQ(bag.errors().size(), 1U);
  EXPECT_EQ(bag.warnings().size(), 1U);
  EXPECT_EQ(bag.size(), 3U);
}

TEST(BasicDiagnosticBag, Merge)
{
  DiagnosticBag a;
  DiagnosticBag b;
  DiagnosticBag empty;
  a.report_error(DeclLocation{}, "one");
  b.report_error(DeclLocation{}, "two");

  a.merge(std::move(b));
  ASSERT_EQ(a.size(), 2U);
  EXPECT_EQ(a.all()[1].message, "two");

  empty.merge(std::move(a));
  EXPECT_EQ(empty.size(), 2U);
}

TEST(BasicDiagnosticBag, CountsAndClassLookup)
{
  DiagnosticBag bag;
  const ClassId user(0);
  const ClassId post(1);
  bag.report_error(DeclLocation::of_class(user, "User"), "a");
  bag.report_warning(DeclLocation::of_member(user, "User", "name"), "b");
  bag.report_error(DeclLocation::of_class(post, "Post"), "c");

  EXPECT_EQ(bag.count(Severity::Error), 2U);
  EXPECT_EQ(bag.count(Severity::Warning), 1U);
  EXPECT_EQ(bag.count(Severity::Note), 0U);

  const auto on_user = bag.for_class(user);
  ASSERT_EQ(on_user.size(), 2U);
  EXPECT_EQ(on_user[0]->message, "a");
  EXPECT_EQ(on_user[1]->message, "b");
  EXPECT_TRUE(bag.for_class(ClassId(7)).empty());
}

// ============================================================================
// DiagnosticPrinter
// ============================================================================

TEST(BasicDiagnosticPrinter, PlainOutput)
{
  DiagnosticBag bag;
  const ClassId resolver(1);
  bag
    .report_error(
      DeclLocation::of_member(resolver, "UserResolver", "find"), "query mixes argument styles")
    .with_code("TG005")
    .with_related(DeclLocation::of_parameter(resolver, "UserResolver", "find", 0))
    .with_help("use one style");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(bag);

  const std::string text = out.str();
  EXPECT_NE(text.find("error[TG005]: query mixes argument styles\n"), std::string::npos);
  EXPECT_NE(text.find("  --> UserResolver.find\n"), std::string::npos);
  EXPECT_NE(text.find("      = related: UserResolver.find#0\n"), std::string::npos);
  EXPECT_NE(text.find("      = help: use one style\n"), std::string::npos);
}

TEST(BasicDiagnosticPrinter, GroupsByClass)
{
  DiagnosticBag bag;
  bag.report_warning(DeclLocation::of_class(ClassId(2), "B"), "second");
  bag.report_error(DeclLocation::of_class(ClassId(0), "A"), "first");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(bag);

  const std::string text = out.str();
  const auto first = text.find("error: first");
  const auto second = text.find("warning: second");
  ASSERT_NE(first, std::string::npos);
  ASSERT_NE(second, std::string::npos);
  EXPECT_LT(first, second);
}

TEST(BasicDiagnosticPrinter, UnknownLocationHasNoArrow)
{
  DiagnosticBag bag;
  bag.report_error(DeclLocation{}, "manifest not found");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(bag);

  EXPECT_EQ(out.str().find("-->"), std::string::npos);
}
