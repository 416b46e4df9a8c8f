#ifndef CLASH_CORE_GEOMETRY_BOUNDING_BOX_HPP
#define CLASH_CORE_GEOMETRY_BOUNDING_BOX_HPP

#include <limits>

#include "clash-core/src/DataTypes/Coordinate.hpp"

namespace clash_core
{

/**
 * @brief World-space axis-aligned bounding box.
 *
 * A default-constructed box is empty (min > max) so that expand() and
 * merge() can be used to accumulate bounds from nothing.
 */
struct BoundingBox
{
  Coordinate min{std::numeric_limits<double>::max(),
                 std::numeric_limits<double>::max(),
                 std::numeric_limits<double>::max()};
  Coordinate max{std::numeric_limits<double>::lowest(),
                 std::numeric_limits<double>::lowest(),
                 std::numeric_limits<double>::lowest()};

  BoundingBox() = default;

  BoundingBox(const Coordinate& minCorner, const Coordinate& maxCorner)
    : min{minCorner}, max{maxCorner}
  {
  }

  [[nodiscard]] bool isEmpty() const
  {
    return min.x() > max.x() || min.y() > max.y() || min.z() > max.z();
  }

  void expand(const Eigen::Vector3d& point)
  {
    min = min.cwiseMin(point);
    max = max.cwiseMax(point);
  }

  void merge(const BoundingBox& other)
  {
    if (other.isEmpty())
    {
      return;
    }
    min = min.cwiseMin(other.min);
    max = max.cwiseMax(other.max);
  }

  /**
   * @brief Copy of this box grown by margin on every side
   */
  [[nodiscard]] BoundingBox inflated(double margin) const
  {
    const Eigen::Vector3d m{margin, margin, margin};
    return BoundingBox{min - m, max + m};
  }

  /**
   * @brief Closed overlap test (touching boxes overlap)
   */
  [[nodiscard]] bool overlaps(const BoundingBox& other) const
  {
    return !(max.x() < other.min.x() || min.x() > other.max.x() ||
             max.y() < other.min.y() || min.y() > other.max.y() ||
             max.z() < other.min.z() || min.z() > other.max.z());
  }

  [[nodiscard]] bool contains(const Eigen::Vector3d& point) const
  {
    return point.x() >= min.x() && point.x() <= max.x() &&
           point.y() >= min.y() && point.y() <= max.y() &&
           point.z() >= min.z() && point.z() <= max.z();
  }

  [[nodiscard]] Coordinate center() const
  {
    return Coordinate{0.5 * (min + max)};
  }

  [[nodiscard]] Eigen::Vector3d extent() const
  {
    return max - min;
  }

  [[nodiscard]] double diagonal() const
  {
    return isEmpty() ? 0.0 : extent().norm();
  }

  /**
   * @brief Index (0, 1, 2) of the longest side
   */
  [[nodiscard]] Eigen::Index longestAxis() const
  {
    Eigen::Index axis{0};
    extent().maxCoeff(&axis);
    return axis;
  }
};

}  // namespace clash_core

#endif  // CLASH_CORE_GEOMETRY_BOUNDING_BOX_HPP
