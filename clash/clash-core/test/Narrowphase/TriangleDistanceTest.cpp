// Ticket: 0008_narrow_phase

#include <gtest/gtest.h>

#include <cmath>

#include "clash-core/src/Narrowphase/TriangleDistance.hpp"

using namespace clash_core;

namespace
{

// Right triangle in the z = height plane with legs along +x and +y
Triangle unitTriangle(double height = 0.0)
{
  return Triangle{Coordinate{0.0, 0.0, height},
                  Coordinate{1.0, 0.0, height},
                  Coordinate{0.0, 1.0, height}};
}

}  // anonymous namespace

// ============================================================================
// Point to triangle
// ============================================================================

TEST(TriangleDistanceTest, ClosestPoint_AboveInterior)
{
  const TrianglePoint p =
    TriangleDistance::closestPointOnTriangle(Coordinate{0.25, 0.25, 2.0}, unitTriangle());

  EXPECT_NEAR(0.25, p.point.x(), 1e-12);
  EXPECT_NEAR(0.25, p.point.y(), 1e-12);
  EXPECT_NEAR(0.0, p.point.z(), 1e-12);
  EXPECT_NEAR(1.0, p.weights.sum(), 1e-12);
}

TEST(TriangleDistanceTest, ClosestPoint_BeyondVertex)
{
  const TrianglePoint p =
    TriangleDistance::closestPointOnTriangle(Coordinate{-1.0, -1.0, 0.0}, unitTriangle());

  EXPECT_NEAR(0.0, (p.point - Coordinate{0.0, 0.0, 0.0}).norm(), 1e-12);
  EXPECT_NEAR(1.0, p.weights[0], 1e-12);
}

TEST(TriangleDistanceTest, ClosestPoint_BeyondHypotenuse)
{
  const TrianglePoint p =
    TriangleDistance::closestPointOnTriangle(Coordinate{1.0, 1.0, 0.0}, unitTriangle());

  EXPECT_NEAR(0.5, p.point.x(), 1e-12);
  EXPECT_NEAR(0.5, p.point.y(), 1e-12);
}

// ============================================================================
// Segment to segment
// ============================================================================

TEST(TriangleDistanceTest, SegmentSegment_Skew)
{
  const ClosestPoints c = TriangleDistance::segmentSegment(Coordinate{-1.0, 0.0, 0.0},
                                                           Coordinate{1.0, 0.0, 0.0},
                                                           Coordinate{0.0, -1.0, 2.0},
                                                           Coordinate{0.0, 1.0, 2.0});
  EXPECT_NEAR(2.0, c.distance, 1e-12);
  EXPECT_NEAR(0.0, c.pointA.norm(), 1e-12);
  EXPECT_NEAR(2.0, c.pointB.z(), 1e-12);
}

TEST(TriangleDistanceTest, SegmentSegment_Parallel)
{
  const ClosestPoints c = TriangleDistance::segmentSegment(Coordinate{0.0, 0.0, 0.0},
                                                           Coordinate{1.0, 0.0, 0.0},
                                                           Coordinate{0.5, 1.0, 0.0},
                                                           Coordinate{2.0, 1.0, 0.0});
  EXPECT_NEAR(1.0, c.distance, 1e-12);
}

// ============================================================================
// Triangle to triangle
// ============================================================================

TEST(TriangleDistanceTest, TriangleTriangle_ParallelPlanes)
{
  const ClosestPoints c =
    TriangleDistance::triangleTriangle(unitTriangle(0.0), unitTriangle(0.3));
  EXPECT_NEAR(0.3, c.distance, 1e-12);
  EXPECT_NEAR(0.3, (c.pointB - c.pointA).norm(), 1e-12);
}

TEST(TriangleDistanceTest, TriangleTriangle_Crossing)
{
  // Vertical triangle piercing the unit triangle
  const Triangle vertical{Coordinate{0.2, 0.2, -1.0},
                          Coordinate{0.3, 0.2, 1.0},
                          Coordinate{0.2, 0.3, 1.0}};
  const ClosestPoints c = TriangleDistance::triangleTriangle(unitTriangle(), vertical);
  EXPECT_NEAR(0.0, c.distance, 1e-12);
}

TEST(TriangleDistanceTest, TriangleTriangle_EdgeToEdge)
{
  // Coplanar neighbour along +x; closest features are vertex (1,0,0) and (2,0,0)
  const Triangle other{Coordinate{2.0, 0.0, 0.0},
                       Coordinate{3.0, 0.0, 0.0},
                       Coordinate{3.0, 1.0, 0.0}};
  const ClosestPoints c = TriangleDistance::triangleTriangle(unitTriangle(), other);
  EXPECT_NEAR(1.0, c.distance, 1e-12);
}

// ============================================================================
// Segment / ray against triangle
// ============================================================================

TEST(TriangleDistanceTest, SegmentIntersectsTriangle_ReportsHit)
{
  Coordinate hit;
  EXPECT_TRUE(TriangleDistance::segmentIntersectsTriangle(
    Coordinate{0.25, 0.25, -1.0}, Coordinate{0.25, 0.25, 1.0}, unitTriangle(), hit));
  EXPECT_NEAR(0.0, hit.z(), 1e-12);

  EXPECT_FALSE(TriangleDistance::segmentIntersectsTriangle(
    Coordinate{0.25, 0.25, 0.5}, Coordinate{0.25, 0.25, 1.0}, unitTriangle(), hit));
}

TEST(TriangleDistanceTest, RayHitsTriangle_OnlyForward)
{
  const Eigen::Vector3d up{0.0, 0.0, 1.0};
  EXPECT_TRUE(
    TriangleDistance::rayHitsTriangle(Coordinate{0.25, 0.25, -1.0}, up, unitTriangle()));
  EXPECT_FALSE(
    TriangleDistance::rayHitsTriangle(Coordinate{0.25, 0.25, 1.0}, up, unitTriangle()));
  EXPECT_FALSE(
    TriangleDistance::rayHitsTriangle(Coordinate{2.0, 2.0, -1.0}, up, unitTriangle()));
}
