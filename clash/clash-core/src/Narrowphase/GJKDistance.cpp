// Ticket: 0008_narrow_phase

#include "clash-core/src/Narrowphase/GJKDistance.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <stdexcept>
#include <utility>

#include "clash-core/src/Geometry/BoundingBox.hpp"

namespace clash_core
{

namespace
{

bool sameSide(const Eigen::Vector3d& normal,
              const Eigen::Vector3d& fromFace,
              const Eigen::Vector3d& opposite)
{
  const double a = normal.dot(fromFace);
  const double b = normal.dot(opposite);
  return (a >= 0.0 && b > 0.0) || (a <= 0.0 && b < 0.0);
}

}  // namespace

GJKDistance::GJKDistance(std::span<const Coordinate> verticesA,
                         std::span<const Coordinate> verticesB,
                         double epsilon)
  : verticesA_{verticesA}, verticesB_{verticesB}, epsilon_{epsilon}
{
  if (verticesA_.empty() || verticesB_.empty())
  {
    throw std::invalid_argument("GJKDistance: vertex sets must not be empty");
  }
}

ClosestPoints GJKDistance::compute(int maxIterations)
{
  BoundingBox extent;
  for (const auto& v : verticesA_)
  {
    extent.expand(v);
  }
  for (const auto& v : verticesB_)
  {
    extent.expand(v);
  }
  const double scale = std::max(extent.diagonal(), 1.0);
  const double touchSq = (epsilon_ * scale) * (epsilon_ * scale);

  // Start from the direction between the two vertex centroids
  Eigen::Vector3d centroidA = Eigen::Vector3d::Zero();
  Eigen::Vector3d centroidB = Eigen::Vector3d::Zero();
  for (const auto& v : verticesA_)
  {
    centroidA += v;
  }
  for (const auto& v : verticesB_)
  {
    centroidB += v;
  }
  centroidA /= static_cast<double>(verticesA_.size());
  centroidB /= static_cast<double>(verticesB_.size());

  Eigen::Vector3d direction = centroidB - centroidA;
  if (direction.norm() < epsilon_)
  {
    direction = Eigen::Vector3d::UnitX();
  }

  simplex_.clear();
  simplex_.push_back(support(direction));
  weights_.assign(1, 1.0);
  intersecting_ = false;
  Eigen::Vector3d closest = simplex_.front().minkowski;

  for (iterations_ = 0; iterations_ < maxIterations; ++iterations_)
  {
    const double closestSq = closest.squaredNorm();
    if (closestSq <= touchSq)
    {
      intersecting_ = true;
      break;
    }

    const SupportPoint next = support(-closest);

    // No support point gets meaningfully closer to the origin
    if (closestSq - closest.dot(next.minkowski) <= epsilon_ * closestSq)
    {
      break;
    }

    const bool repeated = std::any_of(
      simplex_.begin(),
      simplex_.end(),
      [&next](const SupportPoint& s)
      { return (s.minkowski - next.minkowski).squaredNorm() == 0.0; });
    if (repeated)
    {
      break;
    }

    simplex_.push_back(next);
    closest = reduceSimplex();
    if (intersecting_)
    {
      break;
    }
  }

  if (intersecting_)
  {
    const ClosestPoints w = witnesses();
    return ClosestPoints{w.pointA, w.pointA, 0.0};
  }
  return witnesses();
}

SupportPoint GJKDistance::support(const Eigen::Vector3d& direction) const
{
  auto furthest = [](std::span<const Coordinate> vertices,
                     const Eigen::Vector3d& dir) -> const Coordinate&
  {
    size_t best = 0;
    double bestDot = std::numeric_limits<double>::lowest();
    for (size_t i = 0; i < vertices.size(); ++i)
    {
      const double d = vertices[i].dot(dir);
      if (d > bestDot)
      {
        bestDot = d;
        best = i;
      }
    }
    return vertices[best];
  };

  const Coordinate& a = furthest(verticesA_, direction);
  const Coordinate& b = furthest(verticesB_, -direction);
  return SupportPoint{Coordinate{a - b}, a, b};
}

Eigen::Vector3d GJKDistance::reduceSimplex()
{
  auto keep = [this](const std::vector<size_t>& indices,
                     const std::vector<double>& weights)
  {
    std::vector<SupportPoint> reduced;
    std::vector<double> reducedWeights;
    for (size_t k = 0; k < indices.size(); ++k)
    {
      if (weights[k] > 0.0)
      {
        reduced.push_back(simplex_[indices[k]]);
        reducedWeights.push_back(weights[k]);
      }
    }
    simplex_ = std::move(reduced);
    weights_ = std::move(reducedWeights);

    Eigen::Vector3d point = Eigen::Vector3d::Zero();
    for (size_t k = 0; k < simplex_.size(); ++k)
    {
      point += weights_[k] * simplex_[k].minkowski;
    }
    return point;
  };

  const Coordinate origin{0.0, 0.0, 0.0};

  switch (simplex_.size())
  {
    case 2:
    {
      const Coordinate& a = simplex_[0].minkowski;
      const Coordinate& b = simplex_[1].minkowski;
      const Eigen::Vector3d ab = b - a;
      const double lengthSq = ab.squaredNorm();
      const double t =
        lengthSq > 0.0 ? std::clamp(-a.dot(ab) / lengthSq, 0.0, 1.0) : 0.0;
      return keep({0, 1}, {1.0 - t, t});
    }
    case 3:
    {
      const TrianglePoint p = TriangleDistance::closestPointOnTriangle(
        origin,
        Triangle{simplex_[0].minkowski, simplex_[1].minkowski, simplex_[2].minkowski});
      return keep({0, 1, 2}, {p.weights[0], p.weights[1], p.weights[2]});
    }
    case 4:
    {
      const std::array<std::array<size_t, 4>, 4> faces{
        {{0, 1, 2, 3}, {0, 1, 3, 2}, {0, 2, 3, 1}, {1, 2, 3, 0}}};

      bool inside = true;
      double bestSq = std::numeric_limits<double>::max();
      std::vector<size_t> bestIndices;
      std::vector<double> bestWeights;

      for (const auto& f : faces)
      {
        const Coordinate& a = simplex_[f[0]].minkowski;
        const Coordinate& b = simplex_[f[1]].minkowski;
        const Coordinate& c = simplex_[f[2]].minkowski;
        const Coordinate& d = simplex_[f[3]].minkowski;
        const Eigen::Vector3d normal = (b - a).cross(c - a);

        if (sameSide(normal, origin - a, d - a))
        {
          continue;
        }
        inside = false;

        const TrianglePoint p =
          TriangleDistance::closestPointOnTriangle(origin, Triangle{a, b, c});
        const double distSq = p.point.squaredNorm();
        if (distSq < bestSq)
        {
          bestSq = distSq;
          bestIndices = {f[0], f[1], f[2]};
          bestWeights = {p.weights[0], p.weights[1], p.weights[2]};
        }
      }

      if (inside)
      {
        intersecting_ = true;
        return Eigen::Vector3d::Zero();
      }
      return keep(bestIndices, bestWeights);
    }
    default:
      weights_.assign(simplex_.size(), 1.0);
      return simplex_.front().minkowski;
  }
}

ClosestPoints GJKDistance::witnesses() const
{
  Eigen::Vector3d pointA = Eigen::Vector3d::Zero();
  Eigen::Vector3d pointB = Eigen::Vector3d::Zero();
  double total = 0.0;
  for (size_t k = 0; k < simplex_.size(); ++k)
  {
    pointA += weights_[k] * simplex_[k].witnessA;
    pointB += weights_[k] * simplex_[k].witnessB;
    total += weights_[k];
  }
  if (total > 0.0)
  {
    pointA /= total;
    pointB /= total;
  }
  return ClosestPoints{Coordinate{pointA}, Coordinate{pointB}, (pointA - pointB).norm()};
}

ClosestPoints gjkDistance(std::span<const Coordinate> verticesA,
                          std::span<const Coordinate> verticesB,
                          double epsilon,
                          int maxIterations)
{
  GJKDistance gjk{verticesA, verticesB, epsilon};
  return gjk.compute(maxIterations);
}

}  // namespace clash_core
