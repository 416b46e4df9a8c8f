// Ticket: 0006_geometry_resolver

#ifndef CLASH_CORE_RESOLVER_GEOMETRIC_PROXY_HPP
#define CLASH_CORE_RESOLVER_GEOMETRIC_PROXY_HPP

#include <cstdint>
#include <memory>
#include <string>

#include "clash-core/src/Geometry/BoundingBox.hpp"
#include "clash-core/src/Geometry/GeometryPayload.hpp"
#include "clash-core/src/Geometry/WorldTransform.hpp"
#include "clash-core/src/Resolver/WorldShape.hpp"

namespace clash_core
{

/**
 * @brief Immutable, self-contained snapshot of one scene object at one time
 *
 * Holds a copy of the local payload, the world transform, the payload's
 * content hash, and the world-space shape and bounds derived from them.
 * Nothing refers back into the scene. Copies are cheap: the payload and the
 * world shape are shared.
 *
 * The payload must be natively representable under the transform: a sphere
 * needs a rotation with uniform scale, a box needs orthogonal axes. The
 * resolver tessellates anything else into a mesh before constructing a
 * proxy.
 *
 * @ticket 0006_geometry_resolver
 */
class GeometricProxy
{
public:
  /**
   * @param key Stable identity key (the source object path)
   * @param payload Local-space geometry
   * @param transform Local-to-world transform
   * @throws std::invalid_argument if payload cannot be represented under
   * transform, or if payload is empty
   */
  GeometricProxy(std::string key,
                 GeometryPayload payload,
                 const WorldTransform& transform);

  const std::string& key() const
  {
    return key_;
  }

  const GeometryPayload& payload() const
  {
    return *payload_;
  }

  const WorldTransform& transform() const
  {
    return transform_;
  }

  uint64_t contentHash() const
  {
    return contentHash_;
  }

  const WorldShape& worldShape() const
  {
    return *worldShape_;
  }

  const BoundingBox& bounds() const
  {
    return bounds_;
  }

  /**
   * @brief Same content hash and exactly the same world transform
   */
  bool isSameInstanceAs(const GeometricProxy& other) const
  {
    return contentHash_ == other.contentHash_ && transform_ == other.transform_;
  }

private:
  std::string key_;
  std::shared_ptr<const GeometryPayload> payload_;
  WorldTransform transform_;
  uint64_t contentHash_{0};
  std::shared_ptr<const WorldShape> worldShape_;
  BoundingBox bounds_;
};

}  // namespace clash_core

#endif  // CLASH_CORE_RESOLVER_GEOMETRIC_PROXY_HPP
