// Ticket: 0002_geometry_payload_variant

#ifndef CLASH_CORE_COORDINATE_HPP
#define CLASH_CORE_COORDINATE_HPP

#include <Eigen/Dense>

namespace clash_core
{

/**
 * @brief World- or local-space point [scene units]
 *
 * A thin strong type over Eigen::Vector3d: every Eigen expression converts
 * into a Coordinate, so geometric code can mix the two freely while public
 * interfaces state that they expect a position.
 */
struct Coordinate : Eigen::Vector3d
{
  Coordinate() : Eigen::Vector3d{Eigen::Vector3d::Zero()}
  {
  }

  Coordinate(double x, double y, double z) : Eigen::Vector3d{x, y, z}
  {
  }

  // Implicit so that Eigen expressions (a + b, R * p, ...) bind to Coordinate
  template <typename Expr>
  Coordinate(const Eigen::MatrixBase<Expr>& expr) : Eigen::Vector3d{expr}
  {
  }

  template <typename Expr>
  Coordinate& operator=(const Eigen::MatrixBase<Expr>& expr)
  {
    Eigen::Vector3d::operator=(expr);
    return *this;
  }
};

}  // namespace clash_core

#endif  // CLASH_CORE_COORDINATE_HPP
