// Ticket: 0008_narrow_phase

#ifndef CLASH_CORE_NARROWPHASE_GJK_DISTANCE_HPP
#define CLASH_CORE_NARROWPHASE_GJK_DISTANCE_HPP

#include <span>
#include <vector>

#include "clash-core/src/DataTypes/Coordinate.hpp"
#include "clash-core/src/Narrowphase/TriangleDistance.hpp"

namespace clash_core
{

/**
 * @brief Minkowski difference support point with its witnesses on A and B
 */
struct SupportPoint
{
  Coordinate minkowski;  // witnessA - witnessB
  Coordinate witnessA;
  Coordinate witnessB;
};

/**
 * @brief GJK (Gilbert-Johnson-Keerthi) distance between two convex polytopes
 *
 * Each shape is given by its world-space vertices; the support function is
 * a linear scan. Unlike the boolean variant, every iteration reduces the
 * simplex to the smallest sub-simplex containing the point closest to the
 * origin, so on termination that point is the separation vector and the
 * simplex weights give the witness points on both shapes.
 *
 * Terminates when the support point no longer improves the bound by more
 * than a relative epsilon, when the simplex encloses the origin
 * (intersection), or after maxIterations.
 *
 * @ticket 0008_narrow_phase
 */
class GJKDistance
{
public:
  /**
   * @param verticesA Vertices of convex shape A (non-empty)
   * @param verticesB Vertices of convex shape B (non-empty)
   * @param epsilon Relative convergence tolerance
   * @throws std::invalid_argument if either vertex set is empty
   */
  GJKDistance(std::span<const Coordinate> verticesA,
              std::span<const Coordinate> verticesB,
              double epsilon = 1e-10);

  /**
   * @brief Closest points between the two shapes
   *
   * Distance is zero when they overlap; the witnesses are then not
   * meaningful.
   */
  ClosestPoints compute(int maxIterations = 64);

  /**
   * @brief True if the last compute() found the shapes overlapping
   */
  bool intersects() const
  {
    return intersecting_;
  }

  int iterations() const
  {
    return iterations_;
  }

private:
  SupportPoint support(const Eigen::Vector3d& direction) const;

  /**
   * @brief Reduce simplex_ to the feature closest to the origin
   * @return Closest point of the simplex to the origin
   */
  Eigen::Vector3d reduceSimplex();

  ClosestPoints witnesses() const;

  std::span<const Coordinate> verticesA_;
  std::span<const Coordinate> verticesB_;
  double epsilon_;

  std::vector<SupportPoint> simplex_;
  std::vector<double> weights_;
  bool intersecting_{false};
  int iterations_{0};
};

/**
 * @brief Convenience wrapper around GJKDistance::compute()
 */
ClosestPoints gjkDistance(std::span<const Coordinate> verticesA,
                          std::span<const Coordinate> verticesB,
                          double epsilon = 1e-10,
                          int maxIterations = 64);

}  // namespace clash_core

#endif  // CLASH_CORE_NARROWPHASE_GJK_DISTANCE_HPP
