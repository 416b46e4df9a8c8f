#include "clash-core/src/Geometry/TriangleMesh.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>

namespace clash_core
{

TriangleMesh::TriangleMesh(std::vector<Coordinate> vertices,
                           std::vector<TriangleIndices> triangles)
  : vertices_{std::move(vertices)}, triangles_{std::move(triangles)}
{
  for (const auto& tri : triangles_)
  {
    for (uint32_t index : tri)
    {
      if (index >= vertices_.size())
      {
        throw std::invalid_argument(
          "TriangleMesh: triangle index " + std::to_string(index) +
          " out of range for " + std::to_string(vertices_.size()) +
          " vertices");
      }
    }
  }
}

std::array<Coordinate, 3> TriangleMesh::triangle(size_t index) const
{
  const auto& tri = triangles_[index];
  return {vertices_[tri[0]], vertices_[tri[1]], vertices_[tri[2]]};
}

BoundingBox TriangleMesh::triangleBounds(size_t index) const
{
  BoundingBox bounds;
  for (uint32_t v : triangles_[index])
  {
    bounds.expand(vertices_[v]);
  }
  return bounds;
}

BoundingBox TriangleMesh::getBoundingBox() const
{
  BoundingBox bounds;
  for (const auto& tri : triangles_)
  {
    for (uint32_t v : tri)
    {
      bounds.expand(vertices_[v]);
    }
  }
  return bounds;
}

bool TriangleMesh::isDegenerate(size_t index, double areaTolerance) const
{
  const auto corners = triangle(index);
  const Eigen::Vector3d normal =
    (corners[1] - corners[0]).cross(corners[2] - corners[0]);
  return normal.norm() <= areaTolerance;
}

size_t TriangleMesh::removeDegenerateTriangles(double areaTolerance)
{
  const size_t before = triangles_.size();
  std::vector<TriangleIndices> kept;
  kept.reserve(before);
  for (size_t i = 0; i < before; ++i)
  {
    if (!isDegenerate(i, areaTolerance))
    {
      kept.push_back(triangles_[i]);
    }
  }
  triangles_ = std::move(kept);
  return before - triangles_.size();
}

bool TriangleMesh::isClosed() const
{
  if (triangles_.empty())
  {
    return false;
  }

  std::map<std::pair<uint32_t, uint32_t>, int> edgeUse;
  for (const auto& tri : triangles_)
  {
    for (size_t e = 0; e < 3; ++e)
    {
      uint32_t a = tri[e];
      uint32_t b = tri[(e + 1) % 3];
      if (a > b)
      {
        std::swap(a, b);
      }
      ++edgeUse[{a, b}];
    }
  }

  return std::all_of(edgeUse.begin(),
                     edgeUse.end(),
                     [](const auto& entry) { return entry.second == 2; });
}

}  // namespace clash_core
