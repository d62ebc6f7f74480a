#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "minml/basic/diagnostic.hpp"

using minml::Diagnostic;
using minml::DiagnosticBag;
using minml::Label;
using minml::LabelStyle;
using minml::Severity;
using minml::SourceId;
using minml::Span;

namespace
{

constexpr SourceId k_src{0};

}  // namespace

TEST(BasicDiagnostic, ReportErrorAppendsLabeledError)
{
  DiagnosticBag bag;
  Diagnostic & added = bag.report_error(Span{k_src, 1, 2}, "bad thing", "here");
  added.code = "test::bad";
  ASSERT_EQ(bag.size(), 1u);

  const Diagnostic & d = bag.all().front();
  EXPECT_EQ(d.severity, Severity::Error);
  EXPECT_EQ(d.code, "test::bad");
  EXPECT_EQ(d.message, "bad thing");
  ASSERT_EQ(d.labels.size(), 1u);
  EXPECT_EQ(d.labels[0].message, "here");
  EXPECT_EQ(d.labels[0].style, LabelStyle::Primary);
  EXPECT_FALSE(d.help_message.has_value());
}

TEST(BasicDiagnostic, PrimaryLabelPrefersPrimaryStyle)
{
  Diagnostic d;
  d.labels.push_back(Label{Span{k_src, 0, 1}, "opened here", LabelStyle::Secondary});
  d.labels.push_back(Label{Span{k_src, 5, 6}, "unclosed", LabelStyle::Primary});
  EXPECT_EQ(d.primary_span(), (Span{k_src, 5, 6}));
  ASSERT_NE(d.primary_label(), nullptr);
  EXPECT_EQ(d.primary_label()->message, "unclosed");

  Diagnostic secondary_only;
  secondary_only.labels.push_back(Label{Span{k_src, 3, 4}, "", LabelStyle::Secondary});
  EXPECT_EQ(secondary_only.primary_span(), (Span{k_src, 3, 4}));
}

TEST(BasicDiagnostic, PrimarySpanOfUnlabeledDiagnosticIsInvalid)
{
  const Diagnostic d;
  EXPECT_EQ(d.primary_label(), nullptr);
  EXPECT_TRUE(d.primary_span().is_invalid());
}

TEST(BasicDiagnostic, BagKeepsInsertionOrder)
{
  DiagnosticBag bag;
  Diagnostic warning;
  warning.severity = Severity::Warning;
  warning.message = "careful";
  bag.add(warning);
  bag.report_error(Span{k_src, 2, 3}, "broken");

  std::vector<std::string> messages;
  for (const auto & d : bag) {
    messages.push_back(d.message);
  }
  EXPECT_EQ(messages, (std::vector<std::string>{"careful", "broken"}));
  EXPECT_EQ(bag.all()[0].severity, Severity::Warning);
}

TEST(BasicDiagnostic, SeverityNames)
{
  EXPECT_EQ(minml::to_string(Severity::Error), "error");
  EXPECT_EQ(minml::to_string(Severity::Warning), "warning");
  EXPECT_EQ(minml::to_string(Severity::Info), "info");
  EXPECT_EQ(minml::to_string(Severity::Hint), "hint");
}
