#ifndef CLASH_CORE_RESOLVER_WORLD_SHAPE_HPP
#define CLASH_CORE_RESOLVER_WORLD_SHAPE_HPP

#include <array>
#include <variant>

#include <Eigen/Dense>

#include "clash-core/src/DataTypes/Coordinate.hpp"
#include "clash-core/src/Geometry/AabbTree.hpp"
#include "clash-core/src/Geometry/BoundingBox.hpp"
#include "clash-core/src/Geometry/TriangleMesh.hpp"

namespace clash_core
{

struct WorldSphere
{
  Coordinate center;
  double radius{0.0};
};

/**
 * @brief Oriented box: unit axes as columns of a rotation matrix
 */
struct WorldBox
{
  Coordinate center;
  Eigen::Matrix3d axes{Eigen::Matrix3d::Identity()};
  Eigen::Vector3d halfExtents{Eigen::Vector3d::Zero()};

  std::array<Coordinate, 8> corners() const;

  /**
   * @brief The box surface as a closed 12-triangle world-space mesh
   */
  TriangleMesh surface() const;

  /**
   * @brief Closest point of the solid box to point
   */
  Coordinate closestPoint(const Coordinate& point) const;

  /**
   * @brief Point lies inside or on the box
   */
  bool contains(const Coordinate& point, double tolerance = 0.0) const;
};

/**
 * @brief World-space triangle mesh with its per-triangle bounds tree
 */
struct WorldMesh
{
  TriangleMesh mesh;
  AabbTree triangleTree;
  bool closed{false};
};

/**
 * @brief Geometry baked into world space once per proxy
 *
 * Mirrors GeometryPayload one-to-one; the narrow phase dispatches on this.
 */
using WorldShape = std::variant<WorldSphere, WorldBox, WorldMesh>;

/**
 * @brief Wrap a world-space mesh with its triangle tree and closed flag
 */
WorldMesh makeWorldMesh(TriangleMesh mesh);

BoundingBox computeBounds(const WorldShape& shape);

}  // namespace clash_core

#endif  // CLASH_CORE_RESOLVER_WORLD_SHAPE_HPP
