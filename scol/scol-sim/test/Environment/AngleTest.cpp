// Ticket: 0001_spline_sampling_core

#include <gtest/gtest.h>
#include <cmath>
#include <numbers>

#include "scol-sim/src/DataTypes/Vector3D.hpp"
#include "scol-sim/src/Environment/Angle.hpp"

using namespace scol_sim;

// ============================================================================
// Conversion Tests
// ============================================================================

TEST(AngleTest, DefaultIsZero)
{
  Angle angle{};
  EXPECT_DOUBLE_EQ(angle.getRad(), 0.0);
  EXPECT_DOUBLE_EQ(angle.toDeg(), 0.0);
}

TEST(AngleTest, FromDegreesRoundTripsThroughRadians)
{
  EXPECT_DOUBLE_EQ(Angle::fromDegrees(180.0).getRad(), std::numbers::pi);
  EXPECT_DOUBLE_EQ(Angle::fromRadians(std::numbers::pi / 2.0).toDeg(), 90.0);
}

TEST(AngleTest, ArithmeticAndComparison)
{
  Angle const a = Angle::fromDegrees(30.0);
  Angle const b = Angle::fromDegrees(60.0);

  EXPECT_NEAR((a + b).toDeg(), 90.0, 1e-12);
  EXPECT_NEAR((b - a).toDeg(), 30.0, 1e-12);
  EXPECT_TRUE(a < b);
  EXPECT_TRUE(b > a);
  EXPECT_TRUE(a <= a);
  EXPECT_TRUE(b >= a);
}

// ============================================================================
// Angle Between Directions
// ============================================================================

TEST(AngleTest, BetweenPerpendicularIsHalfPi)
{
  Angle const angle =
    Angle::between(Vector3D{1.0, 0.0, 0.0}, Vector3D{0.0, 1.0, 0.0});
  EXPECT_NEAR(angle.getRad(), std::numbers::pi / 2.0, 1e-12);
}

TEST(AngleTest, BetweenIgnoresMagnitude)
{
  Angle const angle =
    Angle::between(Vector3D{2.0, 0.0, 0.0}, Vector3D{0.0, 0.0, 5.0});
  EXPECT_NEAR(angle.toDeg(), 90.0, 1e-10);
}

TEST(AngleTest, BetweenParallelIsZero)
{
  Angle const angle =
    Angle::between(Vector3D{1.0, 1.0, 0.0}, Vector3D{3.0, 3.0, 0.0});
  EXPECT_NEAR(angle.getRad(), 0.0, 1e-7);
}

TEST(AngleTest, BetweenAntiparallelIsPi)
{
  Angle const angle =
    Angle::between(Vector3D{0.0, 0.0, 1.0}, Vector3D{0.0, 0.0, -4.0});
  EXPECT_DOUBLE_EQ(angle.getRad(), std::numbers::pi);
}

TEST(AngleTest, BetweenZeroVectorIsZeroNotNaN)
{
  Angle const angle =
    Angle::between(Vector3D{0.0, 0.0, 0.0}, Vector3D{1.0, 0.0, 0.0});
  EXPECT_FALSE(std::isnan(angle.getRad()));
  EXPECT_DOUBLE_EQ(angle.getRad(), 0.0);
}
