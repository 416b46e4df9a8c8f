// Ticket: 0001_scene_access_interface

#ifndef CLASH_CORE_SCENE_SOURCE_HPP
#define CLASH_CORE_SCENE_SOURCE_HPP

#include <optional>
#include <string>
#include <vector>

#include "clash-core/src/Geometry/GeometryPayload.hpp"
#include "clash-core/src/Geometry/WorldTransform.hpp"

namespace clash_core
{

/**
 * @brief Shape and placement of one scene object at one instant
 */
struct SceneGeometry
{
  SceneShape shape;
  WorldTransform transform;
};

/**
 * @brief Read-only, time-parameterised access to an externally owned scene
 *
 * The detection core never holds on to anything returned from here beyond
 * the call that produced it: the resolver copies what it needs into proxies.
 * Implementations must be safe to call concurrently from multiple threads
 * for const access.
 *
 * @ticket 0001_scene_access_interface
 */
class SceneSource
{
public:
  virtual ~SceneSource() = default;

  /**
   * @brief Effective geometry of an object at a point in time
   *
   * @param path Object path
   * @param time Scene time [s]
   * @return Geometry and world transform, std::nullopt if the object does not
   * exist (or has no geometry) at that time
   */
  virtual std::optional<SceneGeometry> getGeometry(const std::string& path,
                                                   double time) const = 0;

  /**
   * @brief Ordered member paths of a named collection
   *
   * @param collectionPath Collection path
   * @return Member paths in declared order, std::nullopt if collectionPath
   * does not name a collection
   */
  virtual std::optional<std::vector<std::string>> listCollectionMembers(
    const std::string& collectionPath) const = 0;
};

}  // namespace clash_core

#endif  // CLASH_CORE_SCENE_SOURCE_HPP
