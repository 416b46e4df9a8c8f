// Ticket: 0008_narrow_phase

#include "clash-core/src/Narrowphase/TriangleDistance.hpp"

#include <algorithm>
#include <cmath>

namespace clash_core
{
namespace TriangleDistance
{

namespace
{

constexpr double kParallelTolerance = 1e-14;

// Parameter in [0, 1] of the point of [a, b] closest to p
double closestOnSegment(const Coordinate& p,
                        const Coordinate& a,
                        const Coordinate& b)
{
  const Eigen::Vector3d ab = b - a;
  const double lengthSq = ab.squaredNorm();
  if (lengthSq <= 0.0)
  {
    return 0.0;
  }
  return std::clamp((p - a).dot(ab) / lengthSq, 0.0, 1.0);
}

void keepCloser(ClosestPoints& best, const Coordinate& a, const Coordinate& b)
{
  const double d = (a - b).norm();
  if (d < best.distance)
  {
    best.pointA = a;
    best.pointB = b;
    best.distance = d;
  }
}

}  // namespace

TrianglePoint closestPointOnTriangle(const Coordinate& p, const Triangle& tri)
{
  const Coordinate& a = tri[0];
  const Coordinate& b = tri[1];
  const Coordinate& c = tri[2];

  const Eigen::Vector3d ab = b - a;
  const Eigen::Vector3d ac = c - a;
  const Eigen::Vector3d ap = p - a;

  // Vertex region A
  const double d1 = ab.dot(ap);
  const double d2 = ac.dot(ap);
  if (d1 <= 0.0 && d2 <= 0.0)
  {
    return TrianglePoint{a, Eigen::Vector3d{1.0, 0.0, 0.0}};
  }

  // Vertex region B
  const Eigen::Vector3d bp = p - b;
  const double d3 = ab.dot(bp);
  const double d4 = ac.dot(bp);
  if (d3 >= 0.0 && d4 <= d3)
  {
    return TrianglePoint{b, Eigen::Vector3d{0.0, 1.0, 0.0}};
  }

  // Edge region AB
  const double vc = d1 * d4 - d3 * d2;
  if (vc <= 0.0 && d1 >= 0.0 && d3 <= 0.0)
  {
    const double v = d1 / (d1 - d3);
    return TrianglePoint{Coordinate{a + v * ab}, Eigen::Vector3d{1.0 - v, v, 0.0}};
  }

  // Vertex region C
  const Eigen::Vector3d cp = p - c;
  const double d5 = ab.dot(cp);
  const double d6 = ac.dot(cp);
  if (d6 >= 0.0 && d5 <= d6)
  {
    return TrianglePoint{c, Eigen::Vector3d{0.0, 0.0, 1.0}};
  }

  // Edge region AC
  const double vb = d5 * d2 - d1 * d6;
  if (vb <= 0.0 && d2 >= 0.0 && d6 <= 0.0)
  {
    const double w = d2 / (d2 - d6);
    return TrianglePoint{Coordinate{a + w * ac}, Eigen::Vector3d{1.0 - w, 0.0, w}};
  }

  // Edge region BC
  const double va = d3 * d6 - d5 * d4;
  if (va <= 0.0 && (d4 - d3) >= 0.0 && (d5 - d6) >= 0.0)
  {
    const double w = (d4 - d3) / ((d4 - d3) + (d5 - d6));
    return TrianglePoint{Coordinate{b + w * (c - b)},
                         Eigen::Vector3d{0.0, 1.0 - w, w}};
  }

  const double denom = va + vb + vc;
  if (std::abs(denom) <= kParallelTolerance * ab.squaredNorm() * ac.squaredNorm())
  {
    // Collinear triangle: nearest of its three edges
    TrianglePoint best{a, Eigen::Vector3d{1.0, 0.0, 0.0}};
    double bestDistSq = (p - a).squaredNorm();
    const std::array<std::array<int, 2>, 3> edges{{{0, 1}, {1, 2}, {2, 0}}};
    for (const auto& edge : edges)
    {
      const Coordinate& e0 = tri[edge[0]];
      const Coordinate& e1 = tri[edge[1]];
      const double t = closestOnSegment(p, e0, e1);
      const Coordinate q{e0 + t * (e1 - e0)};
      const double distSq = (p - q).squaredNorm();
      if (distSq < bestDistSq)
      {
        bestDistSq = distSq;
        best.point = q;
        best.weights.setZero();
        best.weights[edge[0]] = 1.0 - t;
        best.weights[edge[1]] = t;
      }
    }
    return best;
  }

  // Face region
  const double v = vb / denom;
  const double w = vc / denom;
  return TrianglePoint{Coordinate{a + ab * v + ac * w},
                       Eigen::Vector3d{1.0 - v - w, v, w}};
}

ClosestPoints segmentSegment(const Coordinate& p1,
                             const Coordinate& q1,
                             const Coordinate& p2,
                             const Coordinate& q2)
{
  const Eigen::Vector3d d1 = q1 - p1;
  const Eigen::Vector3d d2 = q2 - p2;
  const Eigen::Vector3d r = p1 - p2;
  const double a = d1.squaredNorm();
  const double e = d2.squaredNorm();
  const double f = d2.dot(r);

  double s = 0.0;
  double t = 0.0;

  if (a <= kParallelTolerance && e <= kParallelTolerance)
  {
    // Both segments are points
  }
  else if (a <= kParallelTolerance)
  {
    t = std::clamp(f / e, 0.0, 1.0);
  }
  else
  {
    const double c = d1.dot(r);
    if (e <= kParallelTolerance)
    {
      s = std::clamp(-c / a, 0.0, 1.0);
    }
    else
    {
      const double b = d1.dot(d2);
      const double denom = a * e - b * b;
      if (denom > kParallelTolerance * a * e)
      {
        s = std::clamp((b * f - c * e) / denom, 0.0, 1.0);
      }
      t = (b * s + f) / e;
      if (t < 0.0)
      {
        t = 0.0;
        s = std::clamp(-c / a, 0.0, 1.0);
      }
      else if (t > 1.0)
      {
        t = 1.0;
        s = std::clamp((b - c) / a, 0.0, 1.0);
      }
    }
  }

  ClosestPoints result;
  result.pointA = p1 + d1 * s;
  result.pointB = p2 + d2 * t;
  result.distance = (result.pointA - result.pointB).norm();
  return result;
}

bool segmentIntersectsTriangle(const Coordinate& p,
                               const Coordinate& q,
                               const Triangle& tri,
                               Coordinate& hit)
{
  const Eigen::Vector3d ab = tri[1] - tri[0];
  const Eigen::Vector3d ac = tri[2] - tri[0];
  const Eigen::Vector3d n = ab.cross(ac);
  if (n.squaredNorm() <= kParallelTolerance * ab.squaredNorm() * ac.squaredNorm())
  {
    return false;
  }

  const double dp = n.dot(p - tri[0]);
  const double dq = n.dot(q - tri[0]);
  if ((dp > 0.0 && dq > 0.0) || (dp < 0.0 && dq < 0.0))
  {
    return false;
  }
  if (dp == 0.0 && dq == 0.0)
  {
    // Coplanar: the edge-edge and vertex-face queries cover this case
    return false;
  }

  const double t = dp / (dp - dq);
  const Coordinate x{p + t * (q - p)};

  for (int i = 0; i < 3; ++i)
  {
    const Coordinate& e0 = tri[i];
    const Coordinate& e1 = tri[(i + 1) % 3];
    if ((e1 - e0).cross(x - e0).dot(n) < 0.0)
    {
      return false;
    }
  }

  hit = x;
  return true;
}

ClosestPoints triangleTriangle(const Triangle& a, const Triangle& b)
{
  Coordinate hit;
  for (int i = 0; i < 3; ++i)
  {
    if (segmentIntersectsTriangle(a[i], a[(i + 1) % 3], b, hit) ||
        segmentIntersectsTriangle(b[i], b[(i + 1) % 3], a, hit))
    {
      return ClosestPoints{hit, hit, 0.0};
    }
  }

  ClosestPoints best{a[0], b[0], (a[0] - b[0]).norm()};

  for (int i = 0; i < 3; ++i)
  {
    keepCloser(best, a[i], closestPointOnTriangle(a[i], b).point);
    keepCloser(best, closestPointOnTriangle(b[i], a).point, b[i]);
  }

  for (int i = 0; i < 3; ++i)
  {
    for (int j = 0; j < 3; ++j)
    {
      const ClosestPoints edge =
        segmentSegment(a[i], a[(i + 1) % 3], b[j], b[(j + 1) % 3]);
      if (edge.distance < best.distance)
      {
        best = edge;
      }
    }
  }

  return best;
}

bool rayHitsTriangle(const Coordinate& origin,
                     const Eigen::Vector3d& direction,
                     const Triangle& tri)
{
  const Eigen::Vector3d e1 = tri[1] - tri[0];
  const Eigen::Vector3d e2 = tri[2] - tri[0];
  const Eigen::Vector3d pvec = direction.cross(e2);
  const double det = e1.dot(pvec);
  if (std::abs(det) <= kParallelTolerance * e1.norm() * e2.norm())
  {
    return false;
  }

  const double invDet = 1.0 / det;
  const Eigen::Vector3d tvec = origin - tri[0];
  const double u = tvec.dot(pvec) * invDet;
  if (u < 0.0 || u > 1.0)
  {
    return false;
  }

  const Eigen::Vector3d qvec = tvec.cross(e1);
  const double v = direction.dot(qvec) * invDet;
  if (v < 0.0 || u + v > 1.0)
  {
    return false;
  }

  return e2.dot(qvec) * invDet > 0.0;
}

}  // namespace TriangleDistance
}  // namespace clash_core
