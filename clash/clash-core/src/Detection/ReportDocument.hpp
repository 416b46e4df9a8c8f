#ifndef CLASH_CORE_DETECTION_REPORT_DOCUMENT_HPP
#define CLASH_CORE_DETECTION_REPORT_DOCUMENT_HPP

#include <chrono>
#include <cstdint>
#include <vector>

#include "clash-core/src/Detection/ClashTypes.hpp"
#include "clash-core/src/Detection/DetectionConfig.hpp"

namespace clash_core
{

using ReportTimestamp =
  std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

/**
 * @brief Result of one completed detection run; the unit of export/import
 *
 * Records are sorted by pair, then by start time. Duplicates are sorted by
 * pair. Warnings keep the order in which they were first raised.
 */
struct ReportDocument
{
  static constexpr uint32_t kSchemaVersion = 1;

  uint32_t schemaVersion{kSchemaVersion};
  DetectionConfig config;
  ReportTimestamp resolvedAt{};
  std::vector<double> sampleTimes;
  std::vector<ClashRecord> records;
  std::vector<DuplicateGeometry> duplicates;
  std::vector<ResolutionWarning> warnings;

  bool operator==(const ReportDocument& other) const = default;
};

}  // namespace clash_core

#endif  // CLASH_CORE_DETECTION_REPORT_DOCUMENT_HPP
