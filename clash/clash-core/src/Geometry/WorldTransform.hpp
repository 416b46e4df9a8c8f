#ifndef CLASH_CORE_GEOMETRY_WORLD_TRANSFORM_HPP
#define CLASH_CORE_GEOMETRY_WORLD_TRANSFORM_HPP

#include <Eigen/Dense>
#include <Eigen/Geometry>

#include "clash-core/src/DataTypes/Coordinate.hpp"
#include "clash-core/src/Geometry/BoundingBox.hpp"

namespace clash_core
{

/**
 * @brief 4x4 affine transform from an object's local frame to world space
 *
 * Wraps Eigen::Affine3d and provides the point/direction/batch transforms the
 * resolver and evaluator need. Unlike a rigid frame the linear part may carry
 * scale or shear; callers that need a rigid motion query isOrthogonal() and
 * isUniformScale() first.
 */
class WorldTransform
{
public:
  /**
   * @brief Identity transform
   */
  WorldTransform();

  explicit WorldTransform(const Eigen::Affine3d& affine);

  /**
   * @brief Build from a row-major 4x4 matrix (last row must be 0 0 0 1)
   * @throws std::invalid_argument if the last row is not affine
   */
  explicit WorldTransform(const Eigen::Matrix4d& matrix);

  /**
   * @brief Translation, then rotation (unit quaternion), then scale
   */
  static WorldTransform fromComponents(const Coordinate& translation,
                                       const Eigen::Quaterniond& rotation,
                                       const Eigen::Vector3d& scale =
                                         Eigen::Vector3d::Ones());

  static WorldTransform fromTranslation(const Coordinate& translation);

  Coordinate localToGlobal(const Coordinate& localPoint) const;

  /**
   * @brief Transform a direction (linear part only, no translation)
   */
  Eigen::Vector3d localToGlobalRelative(const Eigen::Vector3d& localVector) const;

  /**
   * @brief Batch transform 3xN local points to world space in place
   */
  void localToGlobalBatch(Eigen::Matrix3Xd& localPoints) const;

  /**
   * @brief World-space AABB of a local-space AABB (all eight corners)
   */
  BoundingBox transformBounds(const BoundingBox& localBounds) const;

  const Eigen::Matrix3d& linear() const
  {
    return linear_;
  }

  Coordinate translation() const
  {
    return Coordinate{affine_.translation()};
  }

  const Eigen::Affine3d& affine() const
  {
    return affine_;
  }

  Eigen::Matrix4d matrix() const
  {
    return affine_.matrix();
  }

  /**
   * @brief True when the linear part's columns are mutually orthogonal
   *
   * Such a transform maps a box onto an oriented box.
   */
  bool isOrthogonal(double tolerance = 1e-9) const;

  /**
   * @brief True when the linear part is a rotation times a uniform scale
   */
  bool isUniformScale(double tolerance = 1e-9) const;

  /**
   * @brief Exact element-wise equality of the 4x4 matrices
   */
  bool operator==(const WorldTransform& other) const;

private:
  Eigen::Affine3d affine_;
  Eigen::Matrix3d linear_;
};

}  // namespace clash_core

#endif  // CLASH_CORE_GEOMETRY_WORLD_TRANSFORM_HPP
