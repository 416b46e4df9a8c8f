// Ticket: 0008_narrow_phase

#ifndef CLASH_CORE_NARROWPHASE_TRIANGLE_DISTANCE_HPP
#define CLASH_CORE_NARROWPHASE_TRIANGLE_DISTANCE_HPP

#include <array>

#include "clash-core/src/DataTypes/Coordinate.hpp"

namespace clash_core
{

using Triangle = std::array<Coordinate, 3>;

/**
 * @brief Closest pair of points between two features and their distance
 */
struct ClosestPoints
{
  Coordinate pointA;
  Coordinate pointB;
  double distance{0.0};
};

/**
 * @brief Closest point of triangle to point, with barycentric weights
 */
struct TrianglePoint
{
  Coordinate point;
  Eigen::Vector3d weights{1.0, 0.0, 0.0};  // Of tri[0], tri[1], tri[2]
};

/**
 * @brief Exact point, segment and triangle proximity queries
 *
 * Closest-feature formulations follow Ericson, "Real-Time Collision
 * Detection", chapter 5. All routines tolerate degenerate (collinear or
 * point-like) triangles and segments.
 */
namespace TriangleDistance
{

TrianglePoint closestPointOnTriangle(const Coordinate& p, const Triangle& tri);

/**
 * @brief Closest points between segments [p1, q1] and [p2, q2]
 *
 * pointA lies on the first segment, pointB on the second.
 */
ClosestPoints segmentSegment(const Coordinate& p1,
                             const Coordinate& q1,
                             const Coordinate& p2,
                             const Coordinate& q2);

/**
 * @brief Segment [p, q] crosses or touches the triangle
 *
 * @param hit Receives the crossing point when the result is true
 */
bool segmentIntersectsTriangle(const Coordinate& p,
                               const Coordinate& q,
                               const Triangle& tri,
                               Coordinate& hit);

/**
 * @brief Minimum distance between two solid triangles
 *
 * Zero when they intersect, with both points at a crossing point.
 */
ClosestPoints triangleTriangle(const Triangle& a, const Triangle& b);

/**
 * @brief Ray origin + t * direction, t > 0, hits the triangle
 *
 * Möller-Trumbore. Rays parallel to the triangle plane never hit.
 */
bool rayHitsTriangle(const Coordinate& origin,
                     const Eigen::Vector3d& direction,
                     const Triangle& tri);

}  // namespace TriangleDistance

}  // namespace clash_core

#endif  // CLASH_CORE_NARROWPHASE_TRIANGLE_DISTANCE_HPP
