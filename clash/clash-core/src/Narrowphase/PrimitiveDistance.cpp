// Ticket: 0008_narrow_phase

#include "clash-core/src/Narrowphase/PrimitiveDistance.hpp"

#include <array>
#include <cmath>
#include <limits>

#include "clash-core/src/Narrowphase/GJKDistance.hpp"

namespace clash_core
{
namespace PrimitiveDistance
{

namespace
{

constexpr double kAxisTolerance = 1e-9;

// Vertex of box furthest along direction
Coordinate boxSupport(const WorldBox& box, const Eigen::Vector3d& direction)
{
  Eigen::Vector3d point = box.center;
  for (Eigen::Index i = 0; i < 3; ++i)
  {
    const double sign = box.axes.col(i).dot(direction) >= 0.0 ? 1.0 : -1.0;
    point += sign * box.halfExtents[i] * box.axes.col(i);
  }
  return Coordinate{point};
}

double projectedRadius(const WorldBox& box, const Eigen::Vector3d& axis)
{
  return (box.axes.transpose() * axis).cwiseAbs().dot(box.halfExtents);
}

}  // namespace

Proximity sphereSphere(const WorldSphere& a, const WorldSphere& b)
{
  const Eigen::Vector3d between = b.center - a.center;
  const double centres = between.norm();
  const Eigen::Vector3d dir =
    centres > 0.0 ? Eigen::Vector3d{between / centres} : Eigen::Vector3d::UnitX();

  Proximity result;
  result.distance = centres - a.radius - b.radius;
  result.contact.pointA = a.center + a.radius * dir;
  result.contact.pointB = b.center - b.radius * dir;
  return result;
}

Proximity sphereBox(const WorldSphere& sphere, const WorldBox& box)
{
  Proximity result;

  const Eigen::Vector3d local = box.axes.transpose() * (sphere.center - box.center);
  if (box.contains(sphere.center))
  {
    // Nearest face: smallest depth below a face plane
    const Eigen::Vector3d depth = box.halfExtents - local.cwiseAbs();
    Eigen::Index axis{0};
    depth.minCoeff(&axis);

    const double sign = local[axis] >= 0.0 ? 1.0 : -1.0;
    const Eigen::Vector3d normal = sign * box.axes.col(axis);

    Eigen::Vector3d onFace = local;
    onFace[axis] = sign * box.halfExtents[axis];

    result.distance = -(depth[axis] + sphere.radius);
    result.contact.pointA = sphere.center - sphere.radius * normal;
    result.contact.pointB = box.center + box.axes * onFace;
    return result;
  }

  const Coordinate closest = box.closestPoint(sphere.center);
  const Eigen::Vector3d toBox = closest - sphere.center;
  const double gap = toBox.norm();

  result.distance = gap - sphere.radius;
  result.contact.pointA = sphere.center + sphere.radius * (toBox / gap);
  result.contact.pointB = closest;
  return result;
}

Proximity boxBox(const WorldBox& a, const WorldBox& b)
{
  std::array<Eigen::Vector3d, 15> axes;
  size_t count = 0;
  for (Eigen::Index i = 0; i < 3; ++i)
  {
    axes[count++] = a.axes.col(i);
    axes[count++] = b.axes.col(i);
  }
  for (Eigen::Index i = 0; i < 3; ++i)
  {
    for (Eigen::Index j = 0; j < 3; ++j)
    {
      const Eigen::Vector3d cross = a.axes.col(i).cross(b.axes.col(j));
      const double length = cross.norm();
      // Parallel edges add nothing beyond the face axes
      if (length > kAxisTolerance)
      {
        axes[count++] = cross / length;
      }
    }
  }

  const Eigen::Vector3d between = b.center - a.center;
  double minOverlap = std::numeric_limits<double>::max();
  Eigen::Vector3d minAxis = Eigen::Vector3d::UnitX();
  bool separated = false;

  for (size_t k = 0; k < count; ++k)
  {
    const Eigen::Vector3d& axis = axes[k];
    const double centreDistance = between.dot(axis);
    const double overlap =
      projectedRadius(a, axis) + projectedRadius(b, axis) - std::abs(centreDistance);
    if (overlap < 0.0)
    {
      separated = true;
      break;
    }
    if (overlap < minOverlap)
    {
      minOverlap = overlap;
      minAxis = centreDistance >= 0.0 ? axis : Eigen::Vector3d{-axis};
    }
  }

  Proximity result;
  if (separated)
  {
    const auto cornersA = a.corners();
    const auto cornersB = b.corners();
    const ClosestPoints closest = gjkDistance(cornersA, cornersB);
    result.distance = closest.distance;
    result.contact.pointA = closest.pointA;
    result.contact.pointB = closest.pointB;
    return result;
  }

  // minAxis points from A towards B
  result.distance = -minOverlap;
  result.contact.pointA = boxSupport(a, minAxis);
  result.contact.pointB = boxSupport(b, -minAxis);
  return result;
}

}  // namespace PrimitiveDistance
}  // namespace clash_core
