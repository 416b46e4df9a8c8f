// Ticket: 0008_narrow_phase

#include "clash-core/src/Narrowphase/MeshDistance.hpp"

#include <array>
#include <cmath>
#include <limits>

namespace clash_core
{
namespace MeshDistance
{

namespace
{

// Skewed off the coordinate axes so rays rarely pass exactly through the
// shared edges of axis-aligned faces
const std::array<Eigen::Vector3d, 3> kParityRays{
  Eigen::Vector3d{1.0, 0.0123, 0.0347}.normalized(),
  Eigen::Vector3d{0.0211, 1.0, 0.0179}.normalized(),
  Eigen::Vector3d{0.0157, 0.0293, 1.0}.normalized()};

BoundingBox cubeAround(const Coordinate& point, double halfSize)
{
  const Eigen::Vector3d h{halfSize, halfSize, halfSize};
  return BoundingBox{Coordinate{point - h}, Coordinate{point + h}};
}

BoundingBox rayBounds(const Coordinate& origin,
                      const Eigen::Vector3d& direction,
                      double length)
{
  BoundingBox bounds;
  bounds.expand(origin);
  bounds.expand(origin + length * direction);
  return bounds;
}

struct Containment
{
  double depth{0.0};  // > 0 once any vertex is inside
  Coordinate inner;   // The contained vertex
  Coordinate surface;  // Its nearest point on the containing surface
};

// Deepest vertex of inner that lies inside the closed mesh outer
Containment deepestContained(const WorldMesh& inner, const WorldMesh& outer)
{
  Containment deepest;
  if (!outer.closed)
  {
    return deepest;
  }

  const BoundingBox outerBounds = outer.triangleTree.rootBounds();
  for (const auto& vertex : inner.mesh.getVertices())
  {
    if (!outerBounds.contains(vertex) || !containsPoint(outer, vertex))
    {
      continue;
    }
    const ClosestPoints nearest = closestOnSurface(outer, vertex);
    if (nearest.distance > deepest.depth)
    {
      deepest.depth = nearest.distance;
      deepest.inner = vertex;
      deepest.surface = nearest.pointB;
    }
  }
  return deepest;
}

}  // namespace

bool containsPoint(const WorldMesh& mesh, const Coordinate& point)
{
  if (!mesh.closed)
  {
    return false;
  }

  const BoundingBox bounds = mesh.triangleTree.rootBounds();
  if (!bounds.contains(point))
  {
    return false;
  }
  const double length = 2.0 * bounds.diagonal() + 1.0;

  int insideVotes = 0;
  for (const auto& direction : kParityRays)
  {
    size_t crossings = 0;
    mesh.triangleTree.visit(rayBounds(point, direction, length),
                            [&](uint32_t t)
                            {
                              if (TriangleDistance::rayHitsTriangle(
                                    point, direction, mesh.mesh.triangle(t)))
                              {
                                ++crossings;
                              }
                            });
    if (crossings % 2 == 1)
    {
      ++insideVotes;
    }
  }
  return insideVotes >= 2;
}

ClosestPoints closestOnSurface(const WorldMesh& mesh, const Coordinate& point)
{
  ClosestPoints best{point, point, std::numeric_limits<double>::infinity()};
  if (mesh.triangleTree.empty())
  {
    return best;
  }

  auto scan = [&](double halfSize)
  {
    mesh.triangleTree.visit(
      cubeAround(point, halfSize),
      [&](uint32_t t)
      {
        const TrianglePoint p =
          TriangleDistance::closestPointOnTriangle(point, mesh.mesh.triangle(t));
        const double d = (p.point - point).norm();
        if (d < best.distance)
        {
          best.pointB = p.point;
          best.distance = d;
        }
      });
  };

  // Grow a cube around the point until it reaches some triangle, then rescan
  // with the cube that encloses every triangle at or below that distance
  const BoundingBox bounds = mesh.triangleTree.rootBounds();
  const Eigen::Vector3d clamped = point.cwiseMax(bounds.min).cwiseMin(bounds.max);
  double halfSize = (point - clamped).norm() + bounds.diagonal() / 16.0 +
                    std::numeric_limits<double>::min();
  while (!std::isfinite(best.distance))
  {
    scan(halfSize);
    halfSize *= 2.0;
  }
  scan(best.distance);
  return best;
}

std::optional<Proximity> meshMesh(const WorldMesh& a,
                                  const WorldMesh& b,
                                  double searchRadius,
                                  double overlapThreshold)
{
  Proximity result;
  result.distance = std::numeric_limits<double>::infinity();

  for (size_t i = 0; i < a.mesh.triangleCount(); ++i)
  {
    const Triangle triA = a.mesh.triangle(i);
    b.triangleTree.visit(
      a.triangleTree.itemBounds(i).inflated(searchRadius),
      [&](uint32_t j)
      {
        const ClosestPoints closest =
          TriangleDistance::triangleTriangle(triA, b.mesh.triangle(j));
        if (closest.distance <= overlapThreshold)
        {
          ++result.overlappingTriangles;
        }
        if (closest.distance < result.distance)
        {
          result.distance = closest.distance;
          result.contact = ContactLocation{closest.pointA, closest.pointB};
        }
      });
  }

  // Solids: a vertex buried in the other mesh outweighs any surface contact
  const Containment aInB = deepestContained(a, b);
  const Containment bInA = deepestContained(b, a);
  if (aInB.depth > 0.0 || bInA.depth > 0.0)
  {
    if (aInB.depth >= bInA.depth)
    {
      result.distance = -aInB.depth;
      result.contact = ContactLocation{aInB.inner, aInB.surface};
    }
    else
    {
      result.distance = -bInA.depth;
      result.contact = ContactLocation{bInA.surface, bInA.inner};
    }
    return result;
  }

  if (!std::isfinite(result.distance))
  {
    return std::nullopt;
  }
  return result;
}

std::optional<Proximity> meshSphere(const WorldMesh& mesh,
                                    const WorldSphere& sphere,
                                    double searchRadius,
                                    double overlapThreshold)
{
  Proximity result;
  result.distance = std::numeric_limits<double>::infinity();

  mesh.triangleTree.visit(
    cubeAround(sphere.center, sphere.radius + searchRadius),
    [&](uint32_t t)
    {
      const TrianglePoint p =
        TriangleDistance::closestPointOnTriangle(sphere.center, mesh.mesh.triangle(t));
      const Eigen::Vector3d toSurface = p.point - sphere.center;
      const double centreDistance = toSurface.norm();
      const double gap = centreDistance - sphere.radius;
      if (gap <= overlapThreshold)
      {
        ++result.overlappingTriangles;
      }
      if (gap < result.distance)
      {
        result.distance = gap;
        result.contact.pointA = p.point;
        result.contact.pointB =
          centreDistance > 0.0
            ? Coordinate{sphere.center + sphere.radius * (toSurface / centreDistance)}
            : sphere.center;
      }
    });

  if (containsPoint(mesh, sphere.center))
  {
    const ClosestPoints nearest = closestOnSurface(mesh, sphere.center);
    const Eigen::Vector3d toSurface = nearest.pointB - sphere.center;
    const double length = toSurface.norm();

    result.distance = -(nearest.distance + sphere.radius);
    result.contact.pointA = nearest.pointB;
    result.contact.pointB =
      length > 0.0 ? Coordinate{sphere.center - sphere.radius * (toSurface / length)}
                   : sphere.center;
    return result;
  }

  if (!std::isfinite(result.distance))
  {
    return std::nullopt;
  }
  return result;
}

}  // namespace MeshDistance
}  // namespace clash_core
