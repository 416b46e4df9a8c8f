// Ticket: 0008_narrow_phase

#include "clash-core/src/Narrowphase/NarrowPhaseEvaluator.hpp"

#include <algorithm>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "clash-core/src/Narrowphase/MeshDistance.hpp"
#include "clash-core/src/Narrowphase/PrimitiveDistance.hpp"

namespace clash_core
{

namespace
{

Proximity flipped(Proximity proximity)
{
  std::swap(proximity.contact.pointA, proximity.contact.pointB);
  return proximity;
}

std::optional<Proximity> flipped(std::optional<Proximity> proximity)
{
  if (proximity.has_value())
  {
    std::swap(proximity->contact.pointA, proximity->contact.pointB);
  }
  return proximity;
}

}  // namespace

EvaluationSettings EvaluationSettings::fromConfig(const DetectionConfig& config,
                                                  double sceneExtent)
{
  EvaluationSettings settings;
  settings.clashTolerance = config.clashTolerance;
  settings.clearanceTolerance = config.clearanceTolerance;
  settings.epsilon =
    config.epsilon > 0.0 ? config.epsilon : 1e-9 * std::max(1.0, sceneExtent);
  return settings;
}

NarrowPhaseEvaluator::NarrowPhaseEvaluator(EvaluationSettings settings)
  : settings_{settings}
{
  if (!(settings_.epsilon >= 0.0))
  {
    throw std::invalid_argument("NarrowPhaseEvaluator: epsilon must be non-negative");
  }
}

std::optional<Proximity> NarrowPhaseEvaluator::measure(const GeometricProxy& a,
                                                       const GeometricProxy& b) const
{
  const double radius = settings_.searchRadius();
  const double overlap = settings_.clashTolerance + settings_.epsilon;

  return std::visit(
    [&](const auto& shapeA, const auto& shapeB) -> std::optional<Proximity>
    {
      using A = std::decay_t<decltype(shapeA)>;
      using B = std::decay_t<decltype(shapeB)>;

      if constexpr (std::is_same_v<A, WorldSphere> && std::is_same_v<B, WorldSphere>)
      {
        return PrimitiveDistance::sphereSphere(shapeA, shapeB);
      }
      else if constexpr (std::is_same_v<A, WorldSphere> && std::is_same_v<B, WorldBox>)
      {
        return PrimitiveDistance::sphereBox(shapeA, shapeB);
      }
      else if constexpr (std::is_same_v<A, WorldBox> && std::is_same_v<B, WorldSphere>)
      {
        return flipped(PrimitiveDistance::sphereBox(shapeB, shapeA));
      }
      else if constexpr (std::is_same_v<A, WorldBox> && std::is_same_v<B, WorldBox>)
      {
        return PrimitiveDistance::boxBox(shapeA, shapeB);
      }
      else if constexpr (std::is_same_v<A, WorldMesh> && std::is_same_v<B, WorldSphere>)
      {
        return MeshDistance::meshSphere(shapeA, shapeB, radius, overlap);
      }
      else if constexpr (std::is_same_v<A, WorldSphere> && std::is_same_v<B, WorldMesh>)
      {
        return flipped(MeshDistance::meshSphere(shapeB, shapeA, radius, overlap));
      }
      else if constexpr (std::is_same_v<A, WorldMesh> && std::is_same_v<B, WorldBox>)
      {
        return MeshDistance::meshMesh(
          shapeA, makeWorldMesh(shapeB.surface()), radius, overlap);
      }
      else if constexpr (std::is_same_v<A, WorldBox> && std::is_same_v<B, WorldMesh>)
      {
        return MeshDistance::meshMesh(
          makeWorldMesh(shapeA.surface()), shapeB, radius, overlap);
      }
      else
      {
        static_assert(std::is_same_v<A, WorldMesh> && std::is_same_v<B, WorldMesh>,
                      "unhandled WorldShape combination");
        return MeshDistance::meshMesh(shapeA, shapeB, radius, overlap);
      }
    },
    a.worldShape(),
    b.worldShape());
}

Classification NarrowPhaseEvaluator::classify(double distance) const
{
  if (distance <= settings_.clashTolerance + settings_.epsilon)
  {
    return Classification::Clash;
  }
  if (distance <= settings_.clearanceTolerance + settings_.epsilon)
  {
    return Classification::Clearance;
  }
  return Classification::None;
}

std::optional<ClashRecord> NarrowPhaseEvaluator::evaluate(const GeometricProxy& a,
                                                          const GeometricProxy& b,
                                                          uint32_t sampleIndex,
                                                          double time) const
{
  std::optional<Proximity> proximity = measure(a, b);
  if (!proximity.has_value())
  {
    return std::nullopt;
  }

  const Classification classification = classify(proximity->distance);
  if (classification == Classification::None)
  {
    return std::nullopt;
  }

  ClashRecord record;
  record.pair = ClashPair{a.key(), b.key()};
  record.classification = classification;
  record.distance = proximity->distance;
  record.startTime = time;
  record.endTime = time;
  record.startSample = sampleIndex;
  record.endSample = sampleIndex;
  record.overlappingTriangles = proximity->overlappingTriangles;
  record.contact = proximity->contact;
  if (record.pair.first() != a.key())
  {
    std::swap(record.contact->pointA, record.contact->pointB);
  }
  return record;
}

}  // namespace clash_core
