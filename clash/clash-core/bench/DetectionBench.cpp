// Ticket: 0017_detection_performance
//
// Benchmarks for the broad phase, the mesh narrow phase and a complete
// detection run over a grid of tessellated objects.

#include <benchmark/benchmark.h>

#include <memory>
#include <string>
#include <vector>

#include "clash-core/src/Broadphase/PairGenerator.hpp"
#include "clash-core/src/Broadphase/ProxySet.hpp"
#include "clash-core/src/Broadphase/SpatialIndex.hpp"
#include "clash-core/src/Geometry/GeometryFactory.hpp"
#include "clash-core/src/Narrowphase/NarrowPhaseEvaluator.hpp"
#include "clash-core/src/Pipeline/ClashDetector.hpp"
#include "clash-core/src/Scene/InMemoryScene.hpp"

using namespace clash_core;

// ============================================================================
// Helpers
// ============================================================================

namespace
{

constexpr double kSpacing = 1.9;    // Unit spheres on this pitch overlap their neighbours
constexpr double kRadius = 1.0;
constexpr int kSphereRings = 12;
constexpr int kSphereSegments = 24;

std::string gridPath(int i, int j)
{
  return "/World/Grid/S_" + std::to_string(i) + "_" + std::to_string(j);
}

std::vector<GeometricProxy> makeGridProxies(int side)
{
  std::vector<GeometricProxy> proxies;
  proxies.reserve(static_cast<size_t>(side * side));
  for (int i = 0; i < side; ++i)
  {
    for (int j = 0; j < side; ++j)
    {
      proxies.emplace_back(
        gridPath(i, j),
        SpherePrimitive{kRadius},
        WorldTransform::fromTranslation(Coordinate{i * kSpacing, j * kSpacing, 0.0}));
    }
  }
  return proxies;
}

std::shared_ptr<InMemoryScene> makeGridScene(int side)
{
  auto scene = std::make_shared<InMemoryScene>();
  std::vector<std::string> members;
  for (int i = 0; i < side; ++i)
  {
    for (int j = 0; j < side; ++j)
    {
      scene->addObject(
        gridPath(i, j),
        GeometryFactory::createSphere(kRadius, kSphereRings, kSphereSegments),
        WorldTransform::fromTranslation(Coordinate{i * kSpacing, j * kSpacing, 0.0}));
      members.push_back(gridPath(i, j));
    }
  }
  scene->addCollection("/World/Grid", std::move(members));
  return scene;
}

}  // namespace

// ============================================================================
// Broad phase
// ============================================================================

/**
 * @brief Spatial index build plus candidate pair generation for an NxN grid
 *
 * @ticket 0017_detection_performance
 */
static void BM_BroadPhase_GridPairs(benchmark::State& state)
{
  const int side = static_cast<int>(state.range(0));
  const ProxySet proxies = ProxySet::fromGroups(makeGridProxies(side), std::nullopt);

  for (auto _ : state)
  {
    const SpatialIndex index{proxies, 0.01};
    auto pairs = PairGenerator::generate(proxies, index, 0.0);
    benchmark::DoNotOptimize(pairs.candidates.data());
  }
  state.SetComplexityN(side * side);
}
BENCHMARK(BM_BroadPhase_GridPairs)->RangeMultiplier(2)->Range(4, 64)->Complexity();

// ============================================================================
// Narrow phase
// ============================================================================

/**
 * @brief Mesh-vs-mesh distance between two overlapping tessellated spheres
 *
 * Exercises the per-triangle AABB tree descent and triangle-triangle tests.
 *
 * @ticket 0017_detection_performance
 */
static void BM_NarrowPhase_MeshMesh(benchmark::State& state)
{
  const int segments = static_cast<int>(state.range(0));
  const GeometricProxy a{"/A",
                         GeometryFactory::createSphere(kRadius, segments / 2, segments),
                         WorldTransform{}};
  const GeometricProxy b{
    "/B",
    GeometryFactory::createSphere(kRadius, segments / 2, segments),
    WorldTransform::fromTranslation(Coordinate{kSpacing, 0.0, 0.0})};

  const NarrowPhaseEvaluator evaluator{EvaluationSettings{0.0, 0.01, 1e-9}};

  for (auto _ : state)
  {
    auto proximity = evaluator.measure(a, b);
    benchmark::DoNotOptimize(proximity);
  }
}
BENCHMARK(BM_NarrowPhase_MeshMesh)->Arg(8)->Arg(16)->Arg(32)->Arg(64);

// ============================================================================
// Full detection
// ============================================================================

/**
 * @brief Static clash detection of an NxN grid of mesh spheres
 *
 * @ticket 0017_detection_performance
 */
static void BM_Detection_StaticGrid(benchmark::State& state)
{
  const int side = static_cast<int>(state.range(0));
  const ClashDetector detector{makeGridScene(side)};

  DetectionConfig config;
  config.groupA = {"/World/Grid"};
  config.clearanceTolerance = 0.05;

  for (auto _ : state)
  {
    ReportDocument report = detector.run(config);
    benchmark::DoNotOptimize(report.records.data());
  }
}
BENCHMARK(BM_Detection_StaticGrid)->Arg(4)->Arg(8)->Arg(16)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
