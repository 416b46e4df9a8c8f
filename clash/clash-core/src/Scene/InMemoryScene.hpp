// Ticket: 0001_scene_access_interface

#ifndef CLASH_CORE_IN_MEMORY_SCENE_HPP
#define CLASH_CORE_IN_MEMORY_SCENE_HPP

#include <limits>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <Eigen/Geometry>

#include "clash-core/src/Scene/SceneSource.hpp"

namespace clash_core
{

/**
 * @brief Pose of an animated object at one keyframe time
 */
struct TransformKeyframe
{
  double time{0.0};
  Coordinate translation;
  Eigen::Quaterniond rotation{Eigen::Quaterniond::Identity()};
  Eigen::Vector3d scale{Eigen::Vector3d::Ones()};
};

/**
 * @brief SceneSource backed by in-process object and collection tables
 *
 * Objects are either static (one WorldTransform) or animated (a keyframe
 * track interpolated linearly in translation/scale and by slerp in rotation;
 * times outside the track clamp to the first/last key). An optional lifetime
 * window makes an object absent outside [from, until].
 *
 * Mutators are not synchronised: populate the scene before handing it to a
 * detector. Const queries are safe from any number of threads.
 */
class InMemoryScene : public SceneSource
{
public:
  InMemoryScene() = default;

  /**
   * @brief Add or replace a static object
   */
  void addObject(const std::string& path,
                 SceneShape shape,
                 const WorldTransform& transform = WorldTransform{});

  /**
   * @brief Add or replace an animated object
   * @throws std::invalid_argument if keyframes is empty
   */
  void addAnimatedObject(const std::string& path,
                         SceneShape shape,
                         std::vector<TransformKeyframe> keyframes);

  /**
   * @brief Restrict an existing object to the closed window [from, until]
   * @throws std::out_of_range if path is not an object
   */
  void setLifetime(const std::string& path, double from, double until);

  /**
   * @brief Add or replace a collection with ordered member paths
   *
   * Members need not exist; absent members surface as resolution warnings.
   */
  void addCollection(const std::string& path, std::vector<std::string> members);

  /**
   * @return true if an object was removed
   */
  bool removeObject(const std::string& path);

  std::optional<SceneGeometry> getGeometry(const std::string& path,
                                           double time) const override;

  std::optional<std::vector<std::string>> listCollectionMembers(
    const std::string& collectionPath) const override;

  size_t objectCount() const
  {
    return objects_.size();
  }

private:
  struct ObjectEntry
  {
    SceneShape shape;
    std::optional<WorldTransform> staticTransform;
    std::vector<TransformKeyframe> keyframes;  // sorted by time
    double activeFrom{std::numeric_limits<double>::lowest()};
    double activeUntil{std::numeric_limits<double>::max()};
  };

  static WorldTransform interpolate(const std::vector<TransformKeyframe>& keys,
                                    double time);

  std::map<std::string, ObjectEntry> objects_;
  std::map<std::string, std::vector<std::string>> collections_;
};

}  // namespace clash_core

#endif  // CLASH_CORE_IN_MEMORY_SCENE_HPP
