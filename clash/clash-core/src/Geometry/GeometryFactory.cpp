#include "clash-core/src/Geometry/GeometryFactory.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <vector>

namespace clash_core
{

std::array<Eigen::Vector3d, 8> GeometryFactory::getBoxCorners(
  const Eigen::Vector3d& halfExtents)
{
  const double hx = halfExtents.x();
  const double hy = halfExtents.y();
  const double hz = halfExtents.z();

  return {
    Eigen::Vector3d{-hx, -hy, -hz},  // 0
    Eigen::Vector3d{hx, -hy, -hz},   // 1
    Eigen::Vector3d{hx, hy, -hz},    // 2
    Eigen::Vector3d{-hx, hy, -hz},   // 3
    Eigen::Vector3d{-hx, -hy, hz},   // 4
    Eigen::Vector3d{hx, -hy, hz},    // 5
    Eigen::Vector3d{hx, hy, hz},     // 6
    Eigen::Vector3d{-hx, hy, hz}     // 7
  };
}

TriangleMesh GeometryFactory::createBox(const Eigen::Vector3d& halfExtents)
{
  auto corners = getBoxCorners(halfExtents);
  std::vector<Coordinate> vertices(corners.begin(), corners.end());

  // Counter-clockwise seen from outside
  std::vector<TriangleIndices> triangles{
    {0, 2, 1}, {0, 3, 2},  // -Z
    {4, 5, 6}, {4, 6, 7},  // +Z
    {0, 1, 5}, {0, 5, 4},  // -Y
    {3, 7, 6}, {3, 6, 2},  // +Y
    {0, 4, 7}, {0, 7, 3},  // -X
    {1, 2, 6}, {1, 6, 5}   // +X
  };

  return TriangleMesh{std::move(vertices), std::move(triangles)};
}

TriangleMesh GeometryFactory::createCylinder(double radius,
                                             double height,
                                             int segments)
{
  const auto n = static_cast<uint32_t>(std::max(segments, 3));
  const double halfHeight = height / 2.0;

  std::vector<Coordinate> vertices;
  vertices.reserve(2 + 2 * n);
  vertices.emplace_back(0.0, 0.0, -halfHeight);  // 0: bottom centre
  vertices.emplace_back(0.0, 0.0, halfHeight);   // 1: top centre

  for (uint32_t i = 0; i < n; ++i)
  {
    const double theta = 2.0 * std::numbers::pi * i / n;
    vertices.emplace_back(
      radius * std::cos(theta), radius * std::sin(theta), -halfHeight);
  }
  for (uint32_t i = 0; i < n; ++i)
  {
    const double theta = 2.0 * std::numbers::pi * i / n;
    vertices.emplace_back(
      radius * std::cos(theta), radius * std::sin(theta), halfHeight);
  }

  const uint32_t bottomRing = 2;
  const uint32_t topRing = 2 + n;

  std::vector<TriangleIndices> triangles;
  triangles.reserve(4 * n);
  for (uint32_t i = 0; i < n; ++i)
  {
    const uint32_t next = (i + 1) % n;
    triangles.push_back({0, bottomRing + next, bottomRing + i});
    triangles.push_back({1, topRing + i, topRing + next});
    triangles.push_back({bottomRing + i, bottomRing + next, topRing + next});
    triangles.push_back({bottomRing + i, topRing + next, topRing + i});
  }

  return TriangleMesh{std::move(vertices), std::move(triangles)};
}

TriangleMesh GeometryFactory::createSphere(double radius,
                                           int rings,
                                           int segments)
{
  const auto r = static_cast<uint32_t>(std::max(rings, 2));
  const auto n = static_cast<uint32_t>(std::max(segments, 3));

  std::vector<Coordinate> vertices;
  vertices.reserve(2 + (r - 1) * n);
  vertices.emplace_back(0.0, 0.0, radius);   // 0: north pole
  vertices.emplace_back(0.0, 0.0, -radius);  // 1: south pole

  for (uint32_t k = 1; k < r; ++k)
  {
    const double phi = std::numbers::pi * k / r;
    const double z = radius * std::cos(phi);
    const double rho = radius * std::sin(phi);
    for (uint32_t j = 0; j < n; ++j)
    {
      const double theta = 2.0 * std::numbers::pi * j / n;
      vertices.emplace_back(rho * std::cos(theta), rho * std::sin(theta), z);
    }
  }

  auto ringVertex = [n](uint32_t k, uint32_t j) -> uint32_t
  { return 2 + (k - 1) * n + (j % n); };

  std::vector<TriangleIndices> triangles;
  triangles.reserve(2 * n * (r - 1));
  for (uint32_t j = 0; j < n; ++j)
  {
    triangles.push_back({0, ringVertex(1, j), ringVertex(1, j + 1)});
    triangles.push_back({1, ringVertex(r - 1, j + 1), ringVertex(r - 1, j)});
  }
  for (uint32_t k = 1; k + 1 < r; ++k)
  {
    for (uint32_t j = 0; j < n; ++j)
    {
      const uint32_t upper = ringVertex(k, j);
      const uint32_t upperNext = ringVertex(k, j + 1);
      const uint32_t lower = ringVertex(k + 1, j);
      const uint32_t lowerNext = ringVertex(k + 1, j + 1);
      triangles.push_back({lower, lowerNext, upperNext});
      triangles.push_back({lower, upperNext, upper});
    }
  }

  return TriangleMesh{std::move(vertices), std::move(triangles)};
}

}  // namespace clash_core
