#include <gtest/gtest.h>

#include <string>

#include "minml/basic/source_manager.hpp"

using minml::SourceFile;
using minml::SourceId;
using minml::SourceRegistry;
using minml::Span;

TEST(BasicSourceFile, LineColumnIsOneIndexed)
{
  const SourceFile f("<test>", "ab\ncd\n\nef");

  EXPECT_EQ(f.line_count(), 4u);

  auto lc = f.get_line_column(0);
  EXPECT_EQ(lc.line, 1u);
  EXPECT_EQ(lc.column, 1u);

  lc = f.get_line_column(4);  // 'd'
  EXPECT_EQ(lc.line, 2u);
  EXPECT_EQ(lc.column, 2u);

  lc = f.get_line_column(7);  // 'e'
  EXPECT_EQ(lc.line, 4u);
  EXPECT_EQ(lc.column, 1u);
}

TEST(BasicSourceFile, OffsetPastEndClampsToEnd)
{
  const SourceFile f("<test>", "abc");
  const auto lc = f.get_line_column(100);
  EXPECT_EQ(lc.line, 1u);
  EXPECT_EQ(lc.column, 4u);
}

TEST(BasicSourceFile, GetLineStripsTerminators)
{
  const SourceFile f("<test>", "first\r\nsecond\nthird");
  EXPECT_EQ(f.get_line(0), "first");
  EXPECT_EQ(f.get_line(1), "second");
  EXPECT_EQ(f.get_line(2), "third");
  EXPECT_EQ(f.get_line(3), "");
}

TEST(BasicSourceRegistry, RegistersAndSlices)
{
  SourceRegistry reg;
  const SourceId id = reg.register_file("<a>", "val x = 42");
  ASSERT_TRUE(id.is_valid());
  EXPECT_EQ(reg.size(), 1u);

  EXPECT_EQ(reg.get_slice(Span{id, 4, 5}), "x");
  EXPECT_EQ(reg.get_slice(Span{id, 8, 10}), "42");
  EXPECT_EQ(reg.get_slice(Span{id, 8, 99}), "42");
  EXPECT_EQ(reg.get_slice(Span{}), "");
  EXPECT_EQ(reg.get_path(id).string(), "<a>");
}

TEST(BasicSourceRegistry, SameNameReturnsSameIdAndUpdatesContent)
{
  SourceRegistry reg;
  const SourceId a = reg.register_file("<a>", "old");
  const SourceId b = reg.register_file("<b>", "other");
  const SourceId a2 = reg.register_file("<a>", "new text");

  EXPECT_EQ(a, a2);
  EXPECT_NE(a, b);
  EXPECT_EQ(reg.size(), 2u);
  EXPECT_EQ(reg.get_file(a)->content(), "new text");
  EXPECT_EQ(reg.get_file(b)->content(), "other");
}

TEST(BasicSourceRegistry, FullRangeAcrossLines)
{
  SourceRegistry reg;
  const SourceId id = reg.register_file("<a>", "let\n  x\nin");

  const auto fr = reg.get_full_range(Span{id, 6, 10});
  ASSERT_TRUE(fr.is_valid());
  EXPECT_EQ(fr.start_line, 2u);
  EXPECT_EQ(fr.start_column, 3u);
  EXPECT_EQ(fr.end_line, 3u);
  EXPECT_EQ(fr.end_column, 3u);
  EXPECT_EQ(fr.start_byte, 6u);
  EXPECT_EQ(fr.end_byte, 10u);
}

TEST(BasicSourceRegistry, UnknownIdIsHarmless)
{
  SourceRegistry reg;
  EXPECT_EQ(reg.get_file(SourceId{3}), nullptr);
  EXPECT_TRUE(reg.get_path(SourceId{3}).empty());
  EXPECT_FALSE(reg.get_full_range(Span{SourceId{3}, 0, 1}).is_valid());
  EXPECT_EQ(reg.get_slice(Span{SourceId{3}, 0, 1}), "");
  EXPECT_EQ(reg.size(), 0u);
}
