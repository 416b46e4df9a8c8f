#ifndef CLASH_CORE_GEOMETRY_FACTORY_HPP
#define CLASH_CORE_GEOMETRY_FACTORY_HPP

#include <array>

#include <Eigen/Dense>

#include "clash-core/src/Geometry/TriangleMesh.hpp"

namespace clash_core
{

/**
 * @brief Factory for closed, indexed triangle meshes of common shapes
 *
 * All meshes are centred at the origin with outward (counter-clockwise)
 * winding. The resolver uses these to tessellate primitives the narrow phase
 * does not evaluate natively, and the evaluator uses createBox() to treat a
 * box exactly as its surface when it meets a mesh.
 *
 * Usage:
 *   auto box = GeometryFactory::createBox(Eigen::Vector3d{0.5, 0.5, 0.5});
 *   auto can = GeometryFactory::createCylinder(0.25, 2.0, 32);
 */
class GeometryFactory
{
public:
  /**
   * @brief Box with 8 vertices and 12 triangles (2 per face)
   */
  static TriangleMesh createBox(const Eigen::Vector3d& halfExtents);

  /**
   * @brief Cylinder along Z with capped ends
   *
   * @param radius Cylinder radius
   * @param height Full height (extends from -height/2 to +height/2)
   * @param segments Number of sides, clamped to at least 3
   */
  static TriangleMesh createCylinder(double radius,
                                     double height,
                                     int segments = 32);

  /**
   * @brief UV sphere with poles on the Z axis
   *
   * @param radius Sphere radius
   * @param rings Latitude bands, clamped to at least 2
   * @param segments Longitude segments, clamped to at least 3
   */
  static TriangleMesh createSphere(double radius,
                                   int rings = 12,
                                   int segments = 24);

  /**
   * @brief The 8 corners of a box, indexed as used by createBox()
   */
  static std::array<Eigen::Vector3d, 8> getBoxCorners(
    const Eigen::Vector3d& halfExtents);
};

}  // namespace clash_core

#endif  // CLASH_CORE_GEOMETRY_FACTORY_HPP
