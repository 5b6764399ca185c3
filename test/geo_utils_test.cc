#include "gtest/gtest.h"
#include "core/GeoUtils.hpp"

class GeoUtilsTest : public testing::Test {
public:
  const Polyline two_points{{-110.0, 45.0}, {-109.99, 45.01}};
};

TEST_F(GeoUtilsTest, HaversineOneDegreeOfLatitude) {
  EXPECT_NEAR(GeoUtils::distanceMeters({0.0, 0.0}, {0.0, 1.0}), 111194.9266,
              1e-3);
  EXPECT_NEAR(GeoUtils::distanceMiles({0.0, 0.0}, {0.0, 1.0}), 69.094094,
              1e-5);
  EXPECT_DOUBLE_EQ(GeoUtils::distanceMeters({12.5, 48.1}, {12.5, 48.1}), 0.0);
}

TEST_F(GeoUtilsTest, BearingCardinalDirections) {
  EXPECT_NEAR(GeoUtils::bearingDegrees({0, 0}, {0, 1}), 0.0, 1e-9);
  EXPECT_NEAR(GeoUtils::bearingDegrees({0, 0}, {1, 0}), 90.0, 1e-9);
  EXPECT_NEAR(GeoUtils::bearingDegrees({0, 1}, {0, 0}), 180.0, 1e-9);
  EXPECT_NEAR(GeoUtils::bearingDegrees({1, 0}, {0, 0}), 270.0, 1e-9);
}

TEST_F(GeoUtilsTest, BearingAlwaysInRange) {
  for (double lon = -1.0; lon <= 1.0; lon += 0.25) {
    for (double lat = -1.0; lat <= 1.0; lat += 0.25) {
      const double b = GeoUtils::bearingDegrees({0, 0}, {lon, lat});
      EXPECT_GE(b, 0.0);
      EXPECT_LT(b, 360.0);
    }
  }
}

TEST_F(GeoUtilsTest, BearingDiffIsCircular) {
  EXPECT_DOUBLE_EQ(GeoUtils::bearingDiff(350.0, 10.0), 20.0);
  EXPECT_DOUBLE_EQ(GeoUtils::bearingDiff(10.0, 350.0), 20.0);
  EXPECT_DOUBLE_EQ(GeoUtils::bearingDiff(0.0, 180.0), 180.0);
  EXPECT_DOUBLE_EQ(GeoUtils::bearingDiff(90.0, 90.0), 0.0);
  EXPECT_DOUBLE_EQ(GeoUtils::bearingDiff(0.0, 90.0), 90.0);
}

TEST_F(GeoUtilsTest, PointAtFractionEndpoints) {
  auto first = GeoUtils::pointAtFraction(two_points, 0.0);
  auto last = GeoUtils::pointAtFraction(two_points, 1.0);
  ASSERT_TRUE(first && last);
  EXPECT_EQ(*first, two_points.front());
  EXPECT_EQ(*last, two_points.back());
  EXPECT_EQ(*GeoUtils::pointAtFraction(two_points, -0.5), two_points.front());
  EXPECT_EQ(*GeoUtils::pointAtFraction(two_points, 7.0), two_points.back());
}

TEST_F(GeoUtilsTest, PointAtFractionMidpointOfTwoPointLine) {
  auto mid = GeoUtils::pointAtFraction(two_points, 0.5);
  ASSERT_TRUE(mid);
  EXPECT_NEAR((*mid)[0], -109.995, 1e-12);
  EXPECT_NEAR((*mid)[1], 45.005, 1e-12);
}

TEST_F(GeoUtilsTest, PointAtFractionDegenerateLines) {
  EXPECT_FALSE(GeoUtils::pointAtFraction({}, 0.5).has_value());
  const Polyline zero{{3.0, 4.0}, {3.0, 4.0}, {3.0, 4.0}};
  EXPECT_EQ(*GeoUtils::pointAtFraction(zero, 0.5), zero.front());
}

TEST_F(GeoUtilsTest, PointAtFractionFollowsArcLengthNotVertices) {
  // long first leg, short second leg: halfway is inside the first leg
  const Polyline line{{0.0, 0.0}, {0.0, 0.9}, {0.0, 1.0}};
  auto p = GeoUtils::pointAtFraction(line, 0.5);
  ASSERT_TRUE(p);
  EXPECT_NEAR((*p)[1], 0.5, 1e-9);
}

TEST_F(GeoUtilsTest, SampleLineCountsAndEnds) {
  const Polyline pts = GeoUtils::sampleLine(two_points, 12);
  ASSERT_EQ(pts.size(), 12u);
  EXPECT_EQ(pts.front(), two_points.front());
  EXPECT_EQ(pts.back(), two_points.back());
  for (std::size_t i = 1; i < pts.size(); ++i)
    EXPECT_GT(pts[i][1], pts[i - 1][1]);
}

TEST_F(GeoUtilsTest, SampleLineSmallInputs) {
  EXPECT_TRUE(GeoUtils::sampleLine({}, 12).empty());
  const Polyline single{{1.0, 2.0}};
  ASSERT_EQ(GeoUtils::sampleLine(single, 12).size(), 1u);
  EXPECT_EQ(GeoUtils::sampleLine(single, 12).front(), single.front());
  const Polyline one = GeoUtils::sampleLine(two_points, 1);
  ASSERT_EQ(one.size(), 1u);
  EXPECT_EQ(one.front(), two_points.front());
}

TEST_F(GeoUtilsTest, LengthMilesSumsLegs) {
  const Polyline line{{0.0, 0.0}, {0.0, 0.5}, {0.0, 1.0}};
  EXPECT_NEAR(GeoUtils::lengthMiles(line), 69.094094, 1e-5);
  EXPECT_DOUBLE_EQ(GeoUtils::lengthMiles({{0.0, 0.0}}), 0.0);
}
