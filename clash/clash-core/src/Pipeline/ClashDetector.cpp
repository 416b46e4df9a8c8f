// Ticket: 0012_clash_detector

#include "clash-core/src/Pipeline/ClashDetector.hpp"

#include <exception>
#include <optional>
#include <stdexcept>
#include <utility>

namespace clash_core
{

DetectionTask::DetectionTask(std::future<DetectionOutcome> outcome, std::jthread thread)
  : outcome_{std::move(outcome)}, thread_{std::move(thread)}
{
}

void DetectionTask::cancel()
{
  thread_.request_stop();
}

DetectionOutcome DetectionTask::get()
{
  return outcome_.get();
}

void DetectionTask::wait() const
{
  outcome_.wait();
}

bool DetectionTask::isReady() const
{
  return outcome_.wait_for(std::chrono::seconds{0}) == std::future_status::ready;
}

ClashDetector::ClashDetector(std::shared_ptr<const SceneSource> scene)
  : scene_{std::move(scene)}
{
  if (!scene_)
  {
    throw std::invalid_argument("ClashDetector: scene must not be null");
  }
}

ReportDocument ClashDetector::run(const DetectionConfig& config) const
{
  // A default stop_token can never be triggered
  DetectionOutcome outcome = execute(scene_, config, std::stop_token{}, {});
  return std::get<ReportDocument>(std::move(outcome));
}

DetectionOutcome ClashDetector::run(const DetectionConfig& config,
                                    std::stop_token stopToken,
                                    const ProgressCallback& progress) const
{
  return execute(scene_, config, std::move(stopToken), progress);
}

DetectionTask ClashDetector::runAsync(DetectionConfig config,
                                      ProgressCallback progress) const
{
  std::promise<DetectionOutcome> promise;
  std::future<DetectionOutcome> future = promise.get_future();

  std::jthread thread{
    [scene = scene_,
     config = std::move(config),
     progress = std::move(progress),
     promise = std::move(promise)](std::stop_token stopToken) mutable
    {
      try
      {
        promise.set_value(execute(scene, std::move(config), stopToken, progress));
      }
      catch (...)
      {
        // Surfaces from DetectionTask::get()
        promise.set_exception(std::current_exception());
      }
    }};

  return DetectionTask{std::move(future), std::move(thread)};
}

DetectionOutcome ClashDetector::execute(std::shared_ptr<const SceneSource> scene,
                                        DetectionConfig config,
                                        std::stop_token stopToken,
                                        const ProgressCallback& progress)
{
  TemporalSampler sampler{std::move(scene), std::move(config)};
  std::optional<ReportDocument> document = sampler.run(std::move(stopToken), progress);
  if (!document.has_value())
  {
    return CancellationOutcome{
      sampler.completedSamples(), sampler.sampleTimes().size(), sampler.state()};
  }
  return std::move(*document);
}

}  // namespace clash_core
