// Ticket: 0004_detection_config

#ifndef CLASH_CORE_DETECTION_CONFIG_HPP
#define CLASH_CORE_DETECTION_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clash_core
{

enum class DetectionMode : uint8_t
{
  Static = 0,
  Dynamic = 1
};

std::string_view toString(DetectionMode mode);

/**
 * @throws std::invalid_argument for an unknown name
 */
DetectionMode detectionModeFromString(std::string_view name);

/**
 * @brief Parameters of one detection run
 *
 * Supplied by the caller and treated as immutable for the duration of the
 * run. Groups hold object or collection paths; with no groupB the run tests
 * groupA against itself.
 *
 * @ticket 0004_detection_config
 */
struct DetectionConfig
{
  std::vector<std::string> groupA;
  std::optional<std::vector<std::string>> groupB;

  double clashTolerance{0.0};       // Distances at or below are clashes
  double clearanceTolerance{0.01};  // Distances at or below are clearances

  DetectionMode mode{DetectionMode::Static};
  double staticTime{0.0};  // Sample time in Static mode [s]
  double startTime{0.0};   // Dynamic range start [s]
  double endTime{0.0};     // Dynamic range end, inclusive [s]
  double timeStep{1.0};    // Dynamic sample step [s]

  bool strictResolution{false};

  // Classification epsilon; <= 0 selects 1e-9 scaled by the scene extent
  double epsilon{0.0};

  static constexpr size_t kMaxWorkerCount = 1024;

  size_t workerCount{0};      // 0 selects std::thread::hardware_concurrency
  size_t pairBatchSize{64};   // Candidate pairs per worker task

  std::string queryName;
  std::string comment;

  /**
   * @brief Larger of the two tolerances; the broad phase inflates by this
   */
  double maxTolerance() const
  {
    return clearanceTolerance > clashTolerance ? clearanceTolerance
                                               : clashTolerance;
  }

  /**
   * @brief Reject inconsistent settings
   *
   * @throws InvalidRangeError in Dynamic mode if endTime < startTime or
   * timeStep <= 0 (or either is not finite)
   * @throws std::invalid_argument if groupA is empty, a tolerance is negative
   * or not finite, clearanceTolerance <= clashTolerance, pairBatchSize is 0
   * or workerCount exceeds kMaxWorkerCount
   */
  void validate() const;

  /**
   * @brief Sample times of the run: {staticTime} in Static mode, otherwise
   * start, start + step, ... with endTime always included
   *
   * @throws InvalidRangeError as validate()
   */
  std::vector<double> sampleTimes() const;

  bool operator==(const DetectionConfig& other) const = default;
};

}  // namespace clash_core

#endif  // CLASH_CORE_DETECTION_CONFIG_HPP
