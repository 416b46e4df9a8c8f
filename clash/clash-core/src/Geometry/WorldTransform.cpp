#include "clash-core/src/Geometry/WorldTransform.hpp"

#include <cmath>
#include <stdexcept>

namespace clash_core
{

WorldTransform::WorldTransform()
  : affine_{Eigen::Affine3d::Identity()}, linear_{Eigen::Matrix3d::Identity()}
{
}

WorldTransform::WorldTransform(const Eigen::Affine3d& affine)
  : affine_{affine}, linear_{affine.linear()}
{
}

WorldTransform::WorldTransform(const Eigen::Matrix4d& matrix)
  : affine_{Eigen::Affine3d::Identity()}, linear_{Eigen::Matrix3d::Identity()}
{
  if (matrix(3, 0) != 0.0 || matrix(3, 1) != 0.0 || matrix(3, 2) != 0.0 ||
      matrix(3, 3) != 1.0)
  {
    throw std::invalid_argument(
      "WorldTransform: last row of matrix must be [0 0 0 1]");
  }
  affine_.matrix() = matrix;
  linear_ = affine_.linear();
}

WorldTransform WorldTransform::fromComponents(
  const Coordinate& translation,
  const Eigen::Quaterniond& rotation,
  const Eigen::Vector3d& scale)
{
  Eigen::Affine3d affine = Eigen::Affine3d::Identity();
  affine.translate(translation);
  affine.rotate(rotation.normalized());
  affine.scale(scale);
  return WorldTransform{affine};
}

WorldTransform WorldTransform::fromTranslation(const Coordinate& translation)
{
  Eigen::Affine3d affine = Eigen::Affine3d::Identity();
  affine.translate(translation);
  return WorldTransform{affine};
}

Coordinate WorldTransform::localToGlobal(const Coordinate& localPoint) const
{
  return Coordinate{linear_ * localPoint + affine_.translation()};
}

Eigen::Vector3d WorldTransform::localToGlobalRelative(
  const Eigen::Vector3d& localVector) const
{
  return linear_ * localVector;
}

void WorldTransform::localToGlobalBatch(Eigen::Matrix3Xd& localPoints) const
{
  // Rotate/scale all points in one multiply, then translate
  localPoints.applyOnTheLeft(linear_);
  localPoints.colwise() += affine_.translation();
}

BoundingBox WorldTransform::transformBounds(const BoundingBox& localBounds) const
{
  if (localBounds.isEmpty())
  {
    return BoundingBox{};
  }

  // Rotation changes which corners are min/max, so transform all eight
  Eigen::Matrix3Xd corners(3, 8);
  const double minX = localBounds.min.x(), minY = localBounds.min.y(),
               minZ = localBounds.min.z();
  const double maxX = localBounds.max.x(), maxY = localBounds.max.y(),
               maxZ = localBounds.max.z();

  corners.col(0) << minX, minY, minZ;
  corners.col(1) << maxX, minY, minZ;
  corners.col(2) << minX, maxY, minZ;
  corners.col(3) << maxX, maxY, minZ;
  corners.col(4) << minX, minY, maxZ;
  corners.col(5) << maxX, minY, maxZ;
  corners.col(6) << minX, maxY, maxZ;
  corners.col(7) << maxX, maxY, maxZ;

  localToGlobalBatch(corners);

  return BoundingBox{Coordinate{corners.row(0).minCoeff(),
                                corners.row(1).minCoeff(),
                                corners.row(2).minCoeff()},
                     Coordinate{corners.row(0).maxCoeff(),
                                corners.row(1).maxCoeff(),
                                corners.row(2).maxCoeff()}};
}

bool WorldTransform::isOrthogonal(double tolerance) const
{
  const Eigen::Vector3d c0 = linear_.col(0);
  const Eigen::Vector3d c1 = linear_.col(1);
  const Eigen::Vector3d c2 = linear_.col(2);

  const double n0 = c0.norm();
  const double n1 = c1.norm();
  const double n2 = c2.norm();
  if (n0 <= tolerance || n1 <= tolerance || n2 <= tolerance)
  {
    return false;
  }

  return std::abs(c0.dot(c1)) <= tolerance * n0 * n1 &&
         std::abs(c0.dot(c2)) <= tolerance * n0 * n2 &&
         std::abs(c1.dot(c2)) <= tolerance * n1 * n2;
}

bool WorldTransform::isUniformScale(double tolerance) const
{
  if (!isOrthogonal(tolerance))
  {
    return false;
  }
  const double n0 = linear_.col(0).norm();
  const double n1 = linear_.col(1).norm();
  const double n2 = linear_.col(2).norm();
  return std::abs(n0 - n1) <= tolerance * n0 &&
         std::abs(n0 - n2) <= tolerance * n0;
}

bool WorldTransform::operator==(const WorldTransform& other) const
{
  return affine_.matrix() == other.affine_.matrix();
}

}  // namespace clash_core
