// Ticket: 0012_clash_detector

#ifndef CLASH_CORE_PIPELINE_CLASH_DETECTOR_HPP
#define CLASH_CORE_PIPELINE_CLASH_DETECTOR_HPP

#include <chrono>
#include <cstddef>
#include <future>
#include <memory>
#include <stop_token>
#include <thread>
#include <variant>

#include "clash-core/src/Detection/DetectionConfig.hpp"
#include "clash-core/src/Detection/ReportDocument.hpp"
#include "clash-core/src/Pipeline/TemporalSampler.hpp"
#include "clash-core/src/Scene/SceneSource.hpp"

namespace clash_core
{

/**
 * @brief Terminal state of a run that was stopped before producing a report
 *
 * Diagnostic only; no partial results are carried.
 */
struct CancellationOutcome
{
  size_t completedSamples{0};
  size_t totalSamples{0};
  SamplerState state{SamplerState::Cancelled};
};

using DetectionOutcome = std::variant<ReportDocument, CancellationOutcome>;

/**
 * @brief Handle to a detection running on its own thread
 *
 * Destroying the handle cancels the run and waits for the thread.
 */
class DetectionTask
{
public:
  DetectionTask(DetectionTask&&) = default;
  DetectionTask& operator=(DetectionTask&&) = default;
  ~DetectionTask() = default;

  /**
   * @brief Request cooperative cancellation; returns immediately
   */
  void cancel();

  /**
   * @brief Block until the run ends and take its outcome
   *
   * May be called once.
   * @throws Whatever the run threw (InvalidRangeError,
   * UnresolvedReferenceError, ...)
   */
  DetectionOutcome get();

  void wait() const;

  /**
   * @brief The outcome is available without blocking
   */
  bool isReady() const;

private:
  friend class ClashDetector;

  DetectionTask(std::future<DetectionOutcome> outcome, std::jthread thread);

  std::future<DetectionOutcome> outcome_;
  // Declared last: destroyed (stopped and joined) before the future
  std::jthread thread_;
};

/**
 * @brief Entry point of the detection core
 *
 * Holds the scene only as a shared, read-only collaborator. Each call runs
 * an independent TemporalSampler; a detector may serve any number of
 * concurrent runs.
 *
 * Usage:
 *   ClashDetector detector{scene};
 *   ReportDocument report = detector.run(config);
 *
 *   auto task = detector.runAsync(config, [](const SampleProgress& p) { ... });
 *   task.cancel();
 *   auto outcome = task.get();  // CancellationOutcome or ReportDocument
 *
 * @ticket 0012_clash_detector
 */
class ClashDetector
{
public:
  /**
   * @throws std::invalid_argument if scene is null
   */
  explicit ClashDetector(std::shared_ptr<const SceneSource> scene);

  /**
   * @brief Run to completion on the calling thread
   *
   * @throws InvalidRangeError, std::invalid_argument, UnresolvedReferenceError
   */
  ReportDocument run(const DetectionConfig& config) const;

  /**
   * @brief Run on the calling thread, stopping when stopToken fires
   */
  DetectionOutcome run(const DetectionConfig& config,
                       std::stop_token stopToken,
                       const ProgressCallback& progress = {}) const;

  /**
   * @brief Start a cancellable run on a background thread
   *
   * progress is invoked on that thread after every completed sample.
   */
  DetectionTask runAsync(DetectionConfig config, ProgressCallback progress = {}) const;

private:
  static DetectionOutcome execute(std::shared_ptr<const SceneSource> scene,
                                  DetectionConfig config,
                                  std::stop_token stopToken,
                                  const ProgressCallback& progress);

  std::shared_ptr<const SceneSource> scene_;
};

}  // namespace clash_core

#endif  // CLASH_CORE_PIPELINE_CLASH_DETECTOR_HPP
