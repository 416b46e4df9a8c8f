#include "clash-core/src/Scene/InMemoryScene.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace clash_core
{

void InMemoryScene::addObject(const std::string& path,
                              SceneShape shape,
                              const WorldTransform& transform)
{
  ObjectEntry entry{};
  entry.shape = std::move(shape);
  entry.staticTransform = transform;
  objects_.insert_or_assign(path, std::move(entry));
}

void InMemoryScene::addAnimatedObject(const std::string& path,
                                      SceneShape shape,
                                      std::vector<TransformKeyframe> keyframes)
{
  if (keyframes.empty())
  {
    throw std::invalid_argument("InMemoryScene: animated object '" + path +
                                "' needs at least one keyframe");
  }

  std::stable_sort(keyframes.begin(),
                   keyframes.end(),
                   [](const TransformKeyframe& a, const TransformKeyframe& b)
                   { return a.time < b.time; });

  ObjectEntry entry{};
  entry.shape = std::move(shape);
  entry.keyframes = std::move(keyframes);
  objects_.insert_or_assign(path, std::move(entry));
}

void InMemoryScene::setLifetime(const std::string& path,
                                double from,
                                double until)
{
  auto& entry = objects_.at(path);
  entry.activeFrom = from;
  entry.activeUntil = until;
}

void InMemoryScene::addCollection(const std::string& path,
                                  std::vector<std::string> members)
{
  collections_.insert_or_assign(path, std::move(members));
}

bool InMemoryScene::removeObject(const std::string& path)
{
  return objects_.erase(path) > 0;
}

std::optional<SceneGeometry> InMemoryScene::getGeometry(const std::string& path,
                                                        double time) const
{
  auto it = objects_.find(path);
  if (it == objects_.end())
  {
    return std::nullopt;
  }

  const ObjectEntry& entry = it->second;
  if (time < entry.activeFrom || time > entry.activeUntil)
  {
    return std::nullopt;
  }

  if (entry.staticTransform.has_value())
  {
    return SceneGeometry{entry.shape, *entry.staticTransform};
  }
  return SceneGeometry{entry.shape, interpolate(entry.keyframes, time)};
}

std::optional<std::vector<std::string>> InMemoryScene::listCollectionMembers(
  const std::string& collectionPath) const
{
  auto it = collections_.find(collectionPath);
  if (it == collections_.end())
  {
    return std::nullopt;
  }
  return it->second;
}

WorldTransform InMemoryScene::interpolate(
  const std::vector<TransformKeyframe>& keys,
  double time)
{
  const TransformKeyframe* lower = &keys.front();
  const TransformKeyframe* upper = &keys.front();

  if (time <= keys.front().time)
  {
    upper = lower;
  }
  else if (time >= keys.back().time)
  {
    lower = &keys.back();
    upper = lower;
  }
  else
  {
    auto next = std::upper_bound(keys.begin(),
                                 keys.end(),
                                 time,
                                 [](double t, const TransformKeyframe& key)
                                 { return t < key.time; });
    upper = &*next;
    lower = &*(next - 1);
  }

  const double span = upper->time - lower->time;
  const double alpha = span > 0.0 ? (time - lower->time) / span : 0.0;

  const Coordinate translation{(1.0 - alpha) * lower->translation +
                               alpha * upper->translation};
  const Eigen::Quaterniond rotation =
    lower->rotation.normalized().slerp(alpha, upper->rotation.normalized());
  const Eigen::Vector3d scale = (1.0 - alpha) * lower->scale + alpha * upper->scale;

  return WorldTransform::fromComponents(translation, rotation, scale);
}

}  // namespace clash_core
