#ifndef CLASH_CORE_GEOMETRY_TRIANGLE_MESH_HPP
#define CLASH_CORE_GEOMETRY_TRIANGLE_MESH_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "clash-core/src/DataTypes/Coordinate.hpp"
#include "clash-core/src/Geometry/BoundingBox.hpp"

namespace clash_core
{

using TriangleIndices = std::array<uint32_t, 3>;

/**
 * @brief Indexed triangle mesh
 *
 * Vertex positions are expressed in whatever frame the owner declares: scene
 * meshes are local to the object, proxy world shapes hold world-space copies.
 * The mesh is a plain value type; proxies share it through
 * std::shared_ptr<const ...> once it is final.
 */
class TriangleMesh
{
public:
  TriangleMesh() = default;

  /**
   * @brief Construct from positions and triangle indices
   * @throws std::invalid_argument if any index is out of range
   */
  TriangleMesh(std::vector<Coordinate> vertices,
               std::vector<TriangleIndices> triangles);

  size_t vertexCount() const
  {
    return vertices_.size();
  }

  size_t triangleCount() const
  {
    return triangles_.size();
  }

  const std::vector<Coordinate>& getVertices() const
  {
    return vertices_;
  }

  const std::vector<TriangleIndices>& getTriangles() const
  {
    return triangles_;
  }

  const Coordinate& vertex(size_t index) const
  {
    return vertices_[index];
  }

  /**
   * @brief The three corner positions of triangle index
   */
  std::array<Coordinate, 3> triangle(size_t index) const;

  BoundingBox triangleBounds(size_t index) const;

  BoundingBox getBoundingBox() const;

  /**
   * @brief Twice the area of a triangle is below areaTolerance
   */
  bool isDegenerate(size_t index, double areaTolerance) const;

  /**
   * @brief Remove zero-area triangles
   * @return Number of triangles removed
   */
  size_t removeDegenerateTriangles(double areaTolerance);

  /**
   * @brief Every undirected edge is shared by exactly two triangles
   *
   * Only closed meshes bound a volume, so only they support containment
   * queries.
   */
  bool isClosed() const;

private:
  std::vector<Coordinate> vertices_;
  std::vector<TriangleIndices> triangles_;
};

}  // namespace clash_core

#endif  // CLASH_CORE_GEOMETRY_TRIANGLE_MESH_HPP
