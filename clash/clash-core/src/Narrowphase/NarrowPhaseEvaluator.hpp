// Ticket: 0008_narrow_phase

#ifndef CLASH_CORE_NARROWPHASE_EVALUATOR_HPP
#define CLASH_CORE_NARROWPHASE_EVALUATOR_HPP

#include <cstdint>
#include <optional>

#include "clash-core/src/Detection/ClashTypes.hpp"
#include "clash-core/src/Detection/DetectionConfig.hpp"
#include "clash-core/src/Narrowphase/Proximity.hpp"
#include "clash-core/src/Resolver/GeometricProxy.hpp"

namespace clash_core
{

/**
 * @brief Tolerances the evaluator classifies against
 */
struct EvaluationSettings
{
  double clashTolerance{0.0};
  double clearanceTolerance{0.01};
  double epsilon{1e-9};  // Slack added to both tolerances

  /**
   * @brief Tolerances of config; epsilon is config.epsilon when positive,
   * otherwise 1e-9 * max(1, sceneExtent)
   */
  static EvaluationSettings fromConfig(const DetectionConfig& config,
                                       double sceneExtent);

  /**
   * @brief Largest distance that can still produce a record
   */
  double searchRadius() const
  {
    return (clearanceTolerance > clashTolerance ? clearanceTolerance
                                                : clashTolerance) +
           epsilon;
  }
};

/**
 * @brief Exact signed distance and classification of one proxy pair
 *
 * Dispatches on the pair of WorldShape alternatives:
 * - sphere/sphere, sphere/box: closed form
 * - box/box: separating axes, GJK when separated
 * - anything with a mesh: triangle-level distance restricted by the
 *   per-triangle tree; a box meets a mesh through its 12-triangle surface
 *
 * Stateless after construction; one instance is shared by every worker.
 *
 * @ticket 0008_narrow_phase
 */
class NarrowPhaseEvaluator
{
public:
  explicit NarrowPhaseEvaluator(EvaluationSettings settings);

  /**
   * @brief Signed distance between a and b
   *
   * contact.pointA lies on a. Mesh queries return std::nullopt when nothing
   * lies within searchRadius().
   */
  std::optional<Proximity> measure(const GeometricProxy& a,
                                   const GeometricProxy& b) const;

  /**
   * @brief Clash at or below clashTolerance + epsilon, Clearance at or below
   * clearanceTolerance + epsilon, None beyond
   */
  Classification classify(double distance) const;

  /**
   * @brief Point record for the pair at one sample, or nothing when the pair
   * is beyond clearance
   *
   * The record's contact is oriented to its normalised pair.
   */
  std::optional<ClashRecord> evaluate(const GeometricProxy& a,
                                      const GeometricProxy& b,
                                      uint32_t sampleIndex,
                                      double time) const;

  const EvaluationSettings& settings() const
  {
    return settings_;
  }

private:
  EvaluationSettings settings_;
};

}  // namespace clash_core

#endif  // CLASH_CORE_NARROWPHASE_EVALUATOR_HPP
