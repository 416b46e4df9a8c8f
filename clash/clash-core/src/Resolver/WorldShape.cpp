#include "clash-core/src/Resolver/WorldShape.hpp"

#include <cmath>
#include <type_traits>
#include <utility>
#include <vector>

#include "clash-core/src/Geometry/GeometryFactory.hpp"

namespace clash_core
{

std::array<Coordinate, 8> WorldBox::corners() const
{
  const auto local = GeometryFactory::getBoxCorners(halfExtents);
  std::array<Coordinate, 8> result;
  for (size_t i = 0; i < local.size(); ++i)
  {
    result[i] = center + axes * local[i];
  }
  return result;
}

TriangleMesh WorldBox::surface() const
{
  const TriangleMesh local = GeometryFactory::createBox(halfExtents);
  std::vector<Coordinate> vertices;
  vertices.reserve(local.vertexCount());
  for (const auto& v : local.getVertices())
  {
    vertices.emplace_back(center + axes * v);
  }
  return TriangleMesh{std::move(vertices), local.getTriangles()};
}

Coordinate WorldBox::closestPoint(const Coordinate& point) const
{
  const Eigen::Vector3d local = axes.transpose() * (point - center);
  const Eigen::Vector3d clamped =
    local.cwiseMax(-halfExtents).cwiseMin(halfExtents);
  return Coordinate{center + axes * clamped};
}

bool WorldBox::contains(const Coordinate& point, double tolerance) const
{
  const Eigen::Vector3d local = axes.transpose() * (point - center);
  return (local.cwiseAbs().array() <= halfExtents.array() + tolerance).all();
}

WorldMesh makeWorldMesh(TriangleMesh mesh)
{
  std::vector<BoundingBox> triangleBounds;
  triangleBounds.reserve(mesh.triangleCount());
  for (size_t t = 0; t < mesh.triangleCount(); ++t)
  {
    triangleBounds.push_back(mesh.triangleBounds(t));
  }

  WorldMesh world;
  world.triangleTree = AabbTree{std::move(triangleBounds)};
  world.closed = mesh.isClosed();
  world.mesh = std::move(mesh);
  return world;
}

BoundingBox computeBounds(const WorldShape& shape)
{
  return std::visit(
    [](const auto& s) -> BoundingBox
    {
      using T = std::decay_t<decltype(s)>;
      if constexpr (std::is_same_v<T, WorldSphere>)
      {
        const Eigen::Vector3d r{s.radius, s.radius, s.radius};
        return BoundingBox{Coordinate{s.center - r}, Coordinate{s.center + r}};
      }
      else if constexpr (std::is_same_v<T, WorldBox>)
      {
        // Half-width along each world axis is |R| * h
        const Eigen::Vector3d reach = s.axes.cwiseAbs() * s.halfExtents;
        return BoundingBox{Coordinate{s.center - reach},
                           Coordinate{s.center + reach}};
      }
      else
      {
        return s.triangleTree.rootBounds();
      }
    },
    shape);
}

}  // namespace clash_core
