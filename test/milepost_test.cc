#include "gtest/gtest.h"
#include "core/Milepost.hpp"
#include "models/SegmentModel.hpp"

#include <unordered_map>

TEST(MilepostTest, ParsesMajorPlusMinor) {
  auto mp = parse_milepost("663+0.0150");
  ASSERT_TRUE(mp.has_value());
  EXPECT_DOUBLE_EQ(*mp, 663.015);

  auto zero = parse_milepost("000+0.0000");
  ASSERT_TRUE(zero.has_value());
  EXPECT_DOUBLE_EQ(*zero, 0.0);

  EXPECT_DOUBLE_EQ(*parse_milepost("005+0.5"), 5.5);
  EXPECT_DOUBLE_EQ(*parse_milepost("15+0.0"), 15.0);
}

TEST(MilepostTest, EmptyMajorReadsAsZero) {
  EXPECT_DOUBLE_EQ(*parse_milepost("+0.25"), 0.25);
}

TEST(MilepostTest, MalformedInputIsUnparseable) {
  EXPECT_FALSE(parse_milepost("garbage").has_value());
  EXPECT_FALSE(parse_milepost("").has_value());
  EXPECT_FALSE(parse_milepost("12.5").has_value());
  EXPECT_FALSE(parse_milepost("1+2+3").has_value());
  EXPECT_FALSE(parse_milepost("12+").has_value());
  EXPECT_FALSE(parse_milepost("ab+0.1").has_value());
  EXPECT_FALSE(parse_milepost("1+0.1x").has_value());
  EXPECT_FALSE(parse_milepost("1+nan").has_value());
}

TEST(MilepostTest, NormalizeAndStrip) {
  EXPECT_EQ(normalize_id("  mt-1 "), "MT-1");
  EXPECT_EQ(strip_trailing_letter("N-1A"), "N-1");
  EXPECT_EQ(strip_trailing_letter(" u-8133 "), "U-8133");
  EXPECT_EQ(strip_trailing_letter(""), "");
}

TEST(MilepostTest, ParseNumberIsStrict) {
  EXPECT_DOUBLE_EQ(*parse_number(" 42.5 "), 42.5);
  EXPECT_FALSE(parse_number("42 cars").has_value());
  EXPECT_FALSE(parse_number("").has_value());
  EXPECT_FALSE(parse_number("inf").has_value());
}

TEST(SegmentKeyTest, NormalizesIdsButKeepsMileposts) {
  SegmentKey k = SegmentKey::make(" c000001 ", "000+0.0000", "001+0.5000", "n-1a");
  EXPECT_EQ(k.corridor, "C000001");
  EXPECT_EQ(k.dept_id, "N-1A");
  EXPECT_EQ(k.start_mp, "000+0.0000");
  EXPECT_EQ(k.to_string(), "C000001_000+0.0000_001+0.5000_N-1A");
}

TEST(SegmentKeyTest, UnderscoresDoNotCollide) {
  // same joined text, different keys
  SegmentKey a{"A_B", "1", "2", "D"};
  SegmentKey b{"A", "B_1", "2", "D"};
  ASSERT_EQ(a.to_string(), b.to_string());
  EXPECT_NE(a, b);

  std::unordered_map<SegmentKey, int> counts;
  ++counts[a];
  ++counts[b];
  EXPECT_EQ(counts.size(), 2u);
}
