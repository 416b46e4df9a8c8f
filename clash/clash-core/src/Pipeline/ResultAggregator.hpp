// Ticket: 0010_result_aggregator

#ifndef CLASH_CORE_PIPELINE_RESULT_AGGREGATOR_HPP
#define CLASH_CORE_PIPELINE_RESULT_AGGREGATOR_HPP

#include <cstddef>
#include <map>
#include <mutex>
#include <vector>

#include "clash-core/src/Detection/ClashTypes.hpp"
#include "clash-core/src/Detection/DetectionConfig.hpp"
#include "clash-core/src/Detection/ReportDocument.hpp"

namespace clash_core
{

/**
 * @brief Collects the findings of a run and turns them into a ReportDocument
 *
 * The one place where results from every worker meet. In a detection run
 * it is fed by the single channel consumer; the internal lock only guards
 * against misuse from other threads.
 *
 * - Records are kept as point records until finalize() merges them.
 * - Duplicate advisories are folded per pair, widening [firstTime, lastTime].
 * - Warnings keep their first-seen order; exact repeats are dropped.
 *
 * @ticket 0010_result_aggregator
 */
class ResultAggregator
{
public:
  void addRecords(std::vector<ClashRecord> records);

  void addDuplicates(const std::vector<DuplicateGeometry>& duplicates);

  void addWarnings(const std::vector<ResolutionWarning>& warnings);

  size_t recordCount() const;

  /**
   * @brief Drop everything collected so far
   */
  void clear();

  /**
   * @brief Fold consecutive-sample records of the same pair and
   * classification into interval records
   *
   * Records of one pair and classification whose sample ranges touch or
   * overlap (next.startSample <= current.endSample + 1) become one record
   * spanning both. The merged distance is the minimum over the interval,
   * with its contact; overlappingTriangles is the maximum. Exact repeats
   * are removed. Applying the function to its own output returns that
   * output unchanged.
   *
   * @return Records sorted by pair, then start time, then classification
   */
  static std::vector<ClashRecord> mergeIntervals(std::vector<ClashRecord> records);

  /**
   * @brief Merge the collected records and package the run's results
   */
  ReportDocument finalize(const DetectionConfig& config,
                          std::vector<double> sampleTimes,
                          ReportTimestamp resolvedAt) const;

private:
  mutable std::mutex mutex_;
  std::vector<ClashRecord> records_;
  std::map<ClashPair, DuplicateGeometry> duplicates_;
  std::vector<ResolutionWarning> warnings_;
};

}  // namespace clash_core

#endif  // CLASH_CORE_PIPELINE_RESULT_AGGREGATOR_HPP
