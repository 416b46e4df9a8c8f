// Ticket: 0011_temporal_sampler

#ifndef CLASH_CORE_PIPELINE_TEMPORAL_SAMPLER_HPP
#define CLASH_CORE_PIPELINE_TEMPORAL_SAMPLER_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string_view>
#include <vector>

#include "clash-core/src/Detection/DetectionConfig.hpp"
#include "clash-core/src/Detection/ReportDocument.hpp"
#include "clash-core/src/Pipeline/ResultAggregator.hpp"
#include "clash-core/src/Resolver/GeometryResolver.hpp"
#include "clash-core/src/Scene/SceneSource.hpp"

namespace clash_core
{

class WorkerPool;

template <typename T>
class BoundedChannel;

enum class SamplerState : uint8_t
{
  Idle = 0,
  Sampling = 1,
  Merging = 2,
  Done = 3,
  Cancelled = 4
};

std::string_view toString(SamplerState state);

/**
 * @brief Progress of a run, reported after each completed sample
 */
struct SampleProgress
{
  size_t completedSamples{0};
  size_t totalSamples{0};
  double time{0.0};          // Time of the sample just completed
  size_t candidatePairs{0};  // Narrow-phase pairs of that sample
  size_t recordCount{0};     // Point records collected so far
};

using ProgressCallback = std::function<void(const SampleProgress&)>;

/**
 * @brief Drives one detection run across its sample times
 *
 * State machine: Idle -> Sampling -> Merging -> Done, with Cancelled
 * reachable from Sampling and Merging. For every sample time it resolves
 * both groups, rebuilds the spatial index, regenerates candidate pairs and
 * evaluates them on a worker pool. Workers push finished batches into a
 * bounded channel drained by the calling thread, which is the aggregator's
 * only writer. Static mode is a single sample.
 *
 * Cancellation is cooperative: the stop token is checked between samples,
 * between batches and before merging. A cancelled run produces no report.
 *
 * A sampler runs once; create a new one per run.
 *
 * @ticket 0011_temporal_sampler
 */
class TemporalSampler
{
public:
  TemporalSampler(std::shared_ptr<const SceneSource> scene, DetectionConfig config);

  /**
   * @brief Execute the run on the calling thread
   *
   * @return The report, or std::nullopt if stopToken was triggered
   * @throws InvalidRangeError or std::invalid_argument from
   * DetectionConfig::validate() before any sampling
   * @throws UnresolvedReferenceError when strict resolution finds nothing
   * @throws std::logic_error if the sampler already ran
   */
  std::optional<ReportDocument> run(std::stop_token stopToken,
                                    const ProgressCallback& progress = {});

  SamplerState state() const
  {
    return state_.load();
  }

  size_t completedSamples() const
  {
    return completedSamples_.load();
  }

  /**
   * @brief Sample times of the run (empty until run() validated the config)
   */
  const std::vector<double>& sampleTimes() const
  {
    return sampleTimes_;
  }

  const DetectionConfig& config() const
  {
    return config_;
  }

private:
  struct BatchResult;

  /**
   * @return Number of candidate pairs, or std::nullopt if cancelled
   */
  std::optional<size_t> sampleOnce(uint32_t sampleIndex,
                                   double time,
                                   WorkerPool& pool,
                                   BoundedChannel<BatchResult>& channel,
                                   std::stop_source& runStop);

  void cancel(const char* phase);

  std::shared_ptr<const SceneSource> scene_;
  DetectionConfig config_;
  GeometryResolver resolver_;
  ResultAggregator aggregator_;
  std::vector<double> sampleTimes_;
  std::atomic<SamplerState> state_{SamplerState::Idle};
  std::atomic<size_t> completedSamples_{0};
};

}  // namespace clash_core

#endif  // CLASH_CORE_PIPELINE_TEMPORAL_SAMPLER_HPP
