// Ticket: 0011_temporal_sampler

#include "clash-core/src/Pipeline/TemporalSampler.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <stdexcept>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "clash-core/src/Broadphase/PairGenerator.hpp"
#include "clash-core/src/Broadphase/ProxySet.hpp"
#include "clash-core/src/Broadphase/SpatialIndex.hpp"
#include "clash-core/src/Narrowphase/NarrowPhaseEvaluator.hpp"
#include "clash-core/src/Pipeline/BoundedChannel.hpp"
#include "clash-core/src/Pipeline/WorkerPool.hpp"

namespace clash_core
{

std::string_view toString(SamplerState state)
{
  switch (state)
  {
    case SamplerState::Idle:
      return "Idle";
    case SamplerState::Sampling:
      return "Sampling";
    case SamplerState::Merging:
      return "Merging";
    case SamplerState::Done:
      return "Done";
    case SamplerState::Cancelled:
      return "Cancelled";
  }
  return "Unknown";
}

struct TemporalSampler::BatchResult
{
  std::vector<ClashRecord> records;
  std::exception_ptr error;
};

TemporalSampler::TemporalSampler(std::shared_ptr<const SceneSource> scene,
                                 DetectionConfig config)
  : scene_{std::move(scene)}, config_{std::move(config)}, resolver_{scene_}
{
}

std::optional<ReportDocument> TemporalSampler::run(std::stop_token stopToken,
                                                   const ProgressCallback& progress)
{
  if (state_.load() != SamplerState::Idle)
  {
    throw std::logic_error("TemporalSampler::run: sampler already ran");
  }

  config_.validate();
  sampleTimes_ = config_.sampleTimes();

  spdlog::info("Clash detection '{}' started: {} mode, {} sample(s), {} + {} reference(s)",
               config_.queryName,
               toString(config_.mode),
               sampleTimes_.size(),
               config_.groupA.size(),
               config_.groupB.has_value() ? config_.groupB->size() : 0);

  // Internal source so that a failing batch can stop its siblings too
  std::stop_source runStop;
  std::stop_callback forwardStop{stopToken, [&runStop] { runStop.request_stop(); }};

  state_ = SamplerState::Sampling;

  const size_t workerCount =
    config_.workerCount != 0
      ? config_.workerCount
      : std::max<size_t>(std::thread::hardware_concurrency(), 1);

  // The channel must outlive the pool whose tasks push into it
  BoundedChannel<BatchResult> channel{2 * workerCount};
  WorkerPool pool{workerCount};

  for (size_t i = 0; i < sampleTimes_.size(); ++i)
  {
    if (runStop.stop_requested())
    {
      cancel("sampling");
      return std::nullopt;
    }

    const double time = sampleTimes_[i];
    const std::optional<size_t> candidates =
      sampleOnce(static_cast<uint32_t>(i), time, pool, channel, runStop);
    if (!candidates.has_value())
    {
      cancel("sampling");
      return std::nullopt;
    }

    completedSamples_ = i + 1;
    if (progress)
    {
      progress(SampleProgress{i + 1,
                              sampleTimes_.size(),
                              time,
                              *candidates,
                              aggregator_.recordCount()});
    }
  }

  if (runStop.stop_requested())
  {
    cancel("merging");
    return std::nullopt;
  }
  state_ = SamplerState::Merging;

  ReportDocument document = aggregator_.finalize(
    config_,
    sampleTimes_,
    std::chrono::time_point_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now()));

  if (runStop.stop_requested())
  {
    cancel("merging");
    return std::nullopt;
  }
  state_ = SamplerState::Done;

  spdlog::info("Clash detection '{}' finished: {} record(s), {} duplicate(s), {} warning(s)",
               config_.queryName,
               document.records.size(),
               document.duplicates.size(),
               document.warnings.size());
  return document;
}

std::optional<size_t> TemporalSampler::sampleOnce(uint32_t sampleIndex,
                                                  double time,
                                                  WorkerPool& pool,
                                                  BoundedChannel<BatchResult>& channel,
                                                  std::stop_source& runStop)
{
  ResolveResult groupA =
    resolver_.resolveGroup(config_.groupA, time, config_.strictResolution);
  aggregator_.addWarnings(groupA.warnings);

  std::optional<std::vector<GeometricProxy>> proxiesB;
  if (config_.groupB.has_value())
  {
    ResolveResult groupB =
      resolver_.resolveGroup(*config_.groupB, time, config_.strictResolution);
    aggregator_.addWarnings(groupB.warnings);
    proxiesB = std::move(groupB.proxies);
  }

  const ProxySet proxies =
    ProxySet::fromGroups(std::move(groupA.proxies), std::move(proxiesB));
  const EvaluationSettings settings =
    EvaluationSettings::fromConfig(config_, proxies.bounds().diagonal());
  const NarrowPhaseEvaluator evaluator{settings};
  const SpatialIndex index{proxies, settings.searchRadius()};
  const PairGenerationResult pairs = PairGenerator::generate(proxies, index, time);
  aggregator_.addDuplicates(pairs.duplicates);

  const size_t pairCount = pairs.candidates.size();
  const size_t batchSize = config_.pairBatchSize;
  const size_t batchCount = (pairCount + batchSize - 1) / batchSize;
  const std::stop_token runToken = runStop.get_token();

  for (size_t b = 0; b < batchCount; ++b)
  {
    const size_t first = b * batchSize;
    const size_t last = std::min(first + batchSize, pairCount);
    pool.submit(
      [&, first, last, runToken](std::stop_token poolToken)
      {
        if (runToken.stop_requested() || poolToken.stop_requested())
        {
          return;
        }

        BatchResult result;
        try
        {
          for (size_t k = first; k < last; ++k)
          {
            const CandidatePair& candidate = pairs.candidates[k];
            std::optional<ClashRecord> record = evaluator.evaluate(
              proxies[candidate.first], proxies[candidate.second], sampleIndex, time);
            if (record.has_value())
            {
              result.records.push_back(std::move(*record));
            }
          }
        }
        catch (...)
        {
          // Handed to the consumer, which rethrows it on the caller's thread
          result.records.clear();
          result.error = std::current_exception();
        }
        channel.push(std::move(result), runToken);
      });
  }

  try
  {
    for (size_t received = 0; received < batchCount; ++received)
    {
      std::optional<BatchResult> batch = channel.pop(runToken);
      if (!batch.has_value())
      {
        pool.waitIdle();
        return std::nullopt;
      }
      if (batch->error)
      {
        std::rethrow_exception(batch->error);
      }
      aggregator_.addRecords(std::move(batch->records));
    }
  }
  catch (...)
  {
    runStop.request_stop();
    pool.waitIdle();
    throw;
  }
  pool.waitIdle();

  spdlog::debug("Sample {} (t={}): {} proxies, {} candidate pair(s), {} duplicate(s), "
                "{} record(s) so far",
                sampleIndex,
                time,
                proxies.size(),
                pairCount,
                pairs.duplicates.size(),
                aggregator_.recordCount());
  return pairCount;
}

void TemporalSampler::cancel(const char* phase)
{
  state_ = SamplerState::Cancelled;
  spdlog::info("Clash detection '{}' cancelled during {} after {}/{} sample(s)",
               config_.queryName,
               phase,
               completedSamples_.load(),
               sampleTimes_.size());
}

}  // namespace clash_core
