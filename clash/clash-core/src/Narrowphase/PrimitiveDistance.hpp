// Ticket: 0008_narrow_phase

#ifndef CLASH_CORE_NARROWPHASE_PRIMITIVE_DISTANCE_HPP
#define CLASH_CORE_NARROWPHASE_PRIMITIVE_DISTANCE_HPP

#include "clash-core/src/Narrowphase/Proximity.hpp"
#include "clash-core/src/Resolver/WorldShape.hpp"

namespace clash_core
{

/**
 * @brief Closed-form signed distances between native primitives
 *
 * Every function is exact for separated shapes. For penetrating shapes the
 * distance is minus the depth along the axis of least penetration.
 */
namespace PrimitiveDistance
{

Proximity sphereSphere(const WorldSphere& a, const WorldSphere& b);

/**
 * @brief Sphere against solid oriented box
 *
 * A centre inside the box penetrates by its depth below the nearest face
 * plus the radius.
 */
Proximity sphereBox(const WorldSphere& sphere, const WorldBox& box);

/**
 * @brief Oriented box against oriented box
 *
 * Separating-axis test over the 15 candidate axes. Overlapping boxes report
 * the minimum overlap as penetration; separated boxes are measured exactly
 * with GJK on their corners.
 */
Proximity boxBox(const WorldBox& a, const WorldBox& b);

}  // namespace PrimitiveDistance

}  // namespace clash_core

#endif  // CLASH_CORE_NARROWPHASE_PRIMITIVE_DISTANCE_HPP
