// Ticket: 0016_clash_test_suite

#include "clash-core/test/Helpers/SceneFixtures.hpp"

#include <utility>

#include "clash-core/src/Geometry/GeometryFactory.hpp"

namespace clash_core::test
{

DetectionConfig makeStaticConfig(std::vector<std::string> groupA,
                                 double clashTolerance,
                                 double clearanceTolerance,
                                 std::optional<std::vector<std::string>> groupB)
{
  DetectionConfig config;
  config.groupA = std::move(groupA);
  config.groupB = std::move(groupB);
  config.clashTolerance = clashTolerance;
  config.clearanceTolerance = clearanceTolerance;
  config.mode = DetectionMode::Static;
  config.workerCount = 2;
  config.pairBatchSize = 2;
  config.queryName = "test";
  return config;
}

DetectionConfig makeDynamicConfig(std::vector<std::string> groupA,
                                  double startTime,
                                  double endTime,
                                  double timeStep,
                                  double clashTolerance,
                                  double clearanceTolerance)
{
  DetectionConfig config =
    makeStaticConfig(std::move(groupA), clashTolerance, clearanceTolerance);
  config.mode = DetectionMode::Dynamic;
  config.startTime = startTime;
  config.endTime = endTime;
  config.timeStep = timeStep;
  return config;
}

GeometricProxy sphereProxy(const std::string& key,
                           const Coordinate& center,
                           double radius)
{
  return GeometricProxy{
    key, SpherePrimitive{radius}, WorldTransform::fromTranslation(center)};
}

GeometricProxy boxProxy(const std::string& key,
                        const Coordinate& center,
                        const Eigen::Vector3d& halfExtents)
{
  return GeometricProxy{
    key, BoxPrimitive{halfExtents}, WorldTransform::fromTranslation(center)};
}

GeometricProxy meshBoxProxy(const std::string& key,
                            const Coordinate& center,
                            const Eigen::Vector3d& halfExtents)
{
  return GeometricProxy{key,
                        GeometryFactory::createBox(halfExtents),
                        WorldTransform::fromTranslation(center)};
}

std::shared_ptr<InMemoryScene> makeFlyByScene()
{
  auto scene = std::make_shared<InMemoryScene>();
  scene->addObject("/World/A", SpherePrimitive{1.0});

  // x(t): 10 at t=0, 1.5 at t=1, 0 at t=2, -1.5 at t=3, -10 at t=4
  std::vector<TransformKeyframe> keys(5);
  const double xs[] = {10.0, 1.5, 0.0, -1.5, -10.0};
  for (size_t i = 0; i < keys.size(); ++i)
  {
    keys[i].time = static_cast<double>(i);
    keys[i].translation = Coordinate{xs[i], 0.0, 0.0};
  }
  scene->addAnimatedObject("/World/B", SpherePrimitive{1.0}, std::move(keys));
  return scene;
}

}  // namespace clash_core::test
