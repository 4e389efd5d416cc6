// Ticket: 0001_spline_sampling_core

#include <gtest/gtest.h>
#include <cmath>

#include "scol-sim/src/DataTypes/Quaternion.hpp"
#include "scol-sim/src/DataTypes/Vector3D.hpp"

using namespace scol_sim;

namespace
{

void expectVectorNear(const Vector3D& actual,
                      const Vector3D& expected,
                      double tolerance)
{
  EXPECT_NEAR(actual.x(), expected.x(), tolerance);
  EXPECT_NEAR(actual.y(), expected.y(), tolerance);
  EXPECT_NEAR(actual.z(), expected.z(), tolerance);
}

}  // namespace

TEST(QuaternionTest, DefaultIsIdentity)
{
  QuaternionD const q;
  EXPECT_DOUBLE_EQ(q.w(), 1.0);
  EXPECT_DOUBLE_EQ(q.x(), 0.0);
  EXPECT_DOUBLE_EQ(q.y(), 0.0);
  EXPECT_DOUBLE_EQ(q.z(), 0.0);
}

TEST(QuaternionTest, FromToRotatesUpOntoTarget)
{
  Vector3D const target{1.0, 0.0, 0.0};
  QuaternionD const q = QuaternionD::fromTo(Vector3D::unitY(), target);

  expectVectorNear(q.rotate(Vector3D::unitY()), target, 1e-12);
  EXPECT_NEAR(q.norm(), 1.0, 1e-12);
}

TEST(QuaternionTest, FromToAcceptsUnnormalizedInput)
{
  Vector3D const target{0.0, 3.0, 4.0};
  QuaternionD const q = QuaternionD::fromTo(Vector3D::unitY(), target);

  expectVectorNear(q.rotate(Vector3D::unitY()),
                   Vector3D{0.0, 0.6, 0.8},
                   1e-12);
}

TEST(QuaternionTest, FromToAntiparallelIsFinite)
{
  QuaternionD const q =
    QuaternionD::fromTo(Vector3D::unitY(), Vector3D{0.0, -2.0, 0.0});

  EXPECT_TRUE(q.isFinite());
  expectVectorNear(
    q.rotate(Vector3D::unitY()), Vector3D{0.0, -1.0, 0.0}, 1e-9);
}

TEST(QuaternionTest, FromToZeroTargetIsIdentity)
{
  QuaternionD const q =
    QuaternionD::fromTo(Vector3D::unitY(), Vector3D{0.0, 0.0, 0.0});

  EXPECT_TRUE(q.isFinite());
  EXPECT_DOUBLE_EQ(q.w(), 1.0);
}

TEST(QuaternionTest, InverseUndoesRotation)
{
  QuaternionD const q =
    QuaternionD::fromTo(Vector3D::unitY(), Vector3D{1.0, 1.0, 0.0});
  Vector3D const v{0.3, -0.2, 0.9};

  expectVectorNear(q.inverse().rotate(q.rotate(v)), v, 1e-12);
}
