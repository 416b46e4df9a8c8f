// Ticket: 0008_narrow_phase

#include <gtest/gtest.h>

#include <cmath>

#include "clash-core/src/Narrowphase/PrimitiveDistance.hpp"

using namespace clash_core;

namespace
{

WorldBox axisBox(const Coordinate& center, const Eigen::Vector3d& half)
{
  WorldBox box;
  box.center = center;
  box.halfExtents = half;
  return box;
}

}  // anonymous namespace

TEST(PrimitiveDistanceTest, SphereSphere_Separated)
{
  const Proximity p = PrimitiveDistance::sphereSphere(
    WorldSphere{Coordinate{0.0, 0.0, 0.0}, 1.0}, WorldSphere{Coordinate{3.0, 0.0, 0.0}, 1.0});

  EXPECT_DOUBLE_EQ(1.0, p.distance);
  EXPECT_DOUBLE_EQ(1.0, p.contact.pointA.x());
  EXPECT_DOUBLE_EQ(2.0, p.contact.pointB.x());
}

TEST(PrimitiveDistanceTest, SphereSphere_Overlapping)
{
  const Proximity p = PrimitiveDistance::sphereSphere(
    WorldSphere{Coordinate{0.0, 0.0, 0.0}, 1.0}, WorldSphere{Coordinate{1.5, 0.0, 0.0}, 1.0});

  EXPECT_DOUBLE_EQ(-0.5, p.distance);
}

TEST(PrimitiveDistanceTest, SphereSphere_Concentric)
{
  const Proximity p = PrimitiveDistance::sphereSphere(
    WorldSphere{Coordinate{0.0, 0.0, 0.0}, 1.0}, WorldSphere{Coordinate{0.0, 0.0, 0.0}, 2.0});

  EXPECT_DOUBLE_EQ(-3.0, p.distance);
  EXPECT_TRUE(p.contact.pointA.allFinite());
}

TEST(PrimitiveDistanceTest, SphereBox_FaceGap)
{
  const Proximity p =
    PrimitiveDistance::sphereBox(WorldSphere{Coordinate{3.0, 0.5, 0.0}, 1.0},
                                 axisBox(Coordinate{0.0, 0.0, 0.0}, Eigen::Vector3d{1.0, 1.0, 1.0}));

  EXPECT_NEAR(1.0, p.distance, 1e-12);
  EXPECT_NEAR(2.0, p.contact.pointA.x(), 1e-12);
  EXPECT_NEAR(1.0, p.contact.pointB.x(), 1e-12);
}

TEST(PrimitiveDistanceTest, SphereBox_CornerGap)
{
  const Proximity p =
    PrimitiveDistance::sphereBox(WorldSphere{Coordinate{2.0, 2.0, 2.0}, 0.5},
                                 axisBox(Coordinate{0.0, 0.0, 0.0}, Eigen::Vector3d{1.0, 1.0, 1.0}));

  EXPECT_NEAR(std::sqrt(3.0) - 0.5, p.distance, 1e-12);
}

TEST(PrimitiveDistanceTest, SphereBox_CentreInsideBox)
{
  const Proximity p =
    PrimitiveDistance::sphereBox(WorldSphere{Coordinate{0.8, 0.0, 0.0}, 0.5},
                                 axisBox(Coordinate{0.0, 0.0, 0.0}, Eigen::Vector3d{1.0, 1.0, 1.0}));

  // 0.2 below the +x face plus the radius
  EXPECT_NEAR(-0.7, p.distance, 1e-12);
  EXPECT_NEAR(1.0, p.contact.pointB.x(), 1e-12);
}

TEST(PrimitiveDistanceTest, BoxBox_SeparatedAlongAxis)
{
  const Eigen::Vector3d half{0.5, 0.5, 0.5};
  const Proximity p = PrimitiveDistance::boxBox(axisBox(Coordinate{0.0, 0.0, 0.0}, half),
                                                axisBox(Coordinate{1.05, 0.0, 0.0}, half));

  EXPECT_NEAR(0.05, p.distance, 1e-9);
  EXPECT_NEAR(0.5, p.contact.pointA.x(), 1e-9);
  EXPECT_NEAR(0.55, p.contact.pointB.x(), 1e-9);
}

TEST(PrimitiveDistanceTest, BoxBox_PenetrationDepth)
{
  const Eigen::Vector3d half{1.0, 1.0, 1.0};
  const Proximity p = PrimitiveDistance::boxBox(axisBox(Coordinate{0.0, 0.0, 0.0}, half),
                                                axisBox(Coordinate{1.7, 0.2, 0.0}, half));

  EXPECT_NEAR(-0.3, p.distance, 1e-12);
}

TEST(PrimitiveDistanceTest, BoxBox_RotatedSeparation)
{
  // B turned 45 degrees about z: its edge points at A
  WorldBox b = axisBox(Coordinate{3.0, 0.0, 0.0}, Eigen::Vector3d{1.0, 1.0, 1.0});
  b.axes = Eigen::AngleAxisd{M_PI / 4.0, Eigen::Vector3d::UnitZ()}.toRotationMatrix();

  const Proximity p = PrimitiveDistance::boxBox(
    axisBox(Coordinate{0.0, 0.0, 0.0}, Eigen::Vector3d{1.0, 1.0, 1.0}), b);

  EXPECT_NEAR(2.0 - std::sqrt(2.0), p.distance, 1e-9);
}
