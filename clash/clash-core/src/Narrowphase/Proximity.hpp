#ifndef CLASH_CORE_NARROWPHASE_PROXIMITY_HPP
#define CLASH_CORE_NARROWPHASE_PROXIMITY_HPP

#include <cstdint>

#include "clash-core/src/Detection/ClashTypes.hpp"

namespace clash_core
{

/**
 * @brief Measured separation between two shapes
 *
 * distance is signed: positive gap, zero contact, negative penetration depth.
 * contact.pointA lies on the first shape passed to the query.
 */
struct Proximity
{
  double distance{0.0};
  ContactLocation contact;
  uint32_t overlappingTriangles{0};
};

}  // namespace clash_core

#endif  // CLASH_CORE_NARROWPHASE_PROXIMITY_HPP
