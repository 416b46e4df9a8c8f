// Ticket: 0010_result_aggregator

#include "clash-core/src/Pipeline/ResultAggregator.hpp"

#include <algorithm>
#include <iterator>
#include <tuple>
#include <utility>

namespace clash_core
{

void ResultAggregator::addRecords(std::vector<ClashRecord> records)
{
  std::scoped_lock lock{mutex_};
  records_.insert(records_.end(),
                  std::make_move_iterator(records.begin()),
                  std::make_move_iterator(records.end()));
}

void ResultAggregator::addDuplicates(const std::vector<DuplicateGeometry>& duplicates)
{
  std::scoped_lock lock{mutex_};
  for (const auto& duplicate : duplicates)
  {
    auto [it, inserted] = duplicates_.try_emplace(duplicate.pair, duplicate);
    if (!inserted)
    {
      it->second.firstTime = std::min(it->second.firstTime, duplicate.firstTime);
      it->second.lastTime = std::max(it->second.lastTime, duplicate.lastTime);
    }
  }
}

void ResultAggregator::addWarnings(const std::vector<ResolutionWarning>& warnings)
{
  std::scoped_lock lock{mutex_};
  for (const auto& warning : warnings)
  {
    if (std::find(warnings_.begin(), warnings_.end(), warning) == warnings_.end())
    {
      warnings_.push_back(warning);
    }
  }
}

size_t ResultAggregator::recordCount() const
{
  std::scoped_lock lock{mutex_};
  return records_.size();
}

void ResultAggregator::clear()
{
  std::scoped_lock lock{mutex_};
  records_.clear();
  duplicates_.clear();
  warnings_.clear();
}

std::vector<ClashRecord> ResultAggregator::mergeIntervals(std::vector<ClashRecord> records)
{
  std::sort(records.begin(),
            records.end(),
            [](const ClashRecord& lhs, const ClashRecord& rhs)
            {
              return std::tie(lhs.pair, lhs.classification, lhs.startSample, lhs.endSample) <
                     std::tie(rhs.pair, rhs.classification, rhs.startSample, rhs.endSample);
            });

  std::vector<ClashRecord> merged;
  merged.reserve(records.size());
  for (auto& record : records)
  {
    if (!merged.empty())
    {
      ClashRecord& current = merged.back();
      if (current.pair == record.pair &&
          current.classification == record.classification &&
          record.startSample <= current.endSample + 1)
      {
        current.endSample = std::max(current.endSample, record.endSample);
        current.endTime = std::max(current.endTime, record.endTime);
        current.overlappingTriangles =
          std::max(current.overlappingTriangles, record.overlappingTriangles);
        if (record.distance < current.distance)
        {
          current.distance = record.distance;
          current.contact = record.contact;
        }
        continue;
      }
    }
    merged.push_back(std::move(record));
  }

  std::sort(merged.begin(),
            merged.end(),
            [](const ClashRecord& lhs, const ClashRecord& rhs)
            {
              return std::tie(lhs.pair, lhs.startTime, lhs.classification, lhs.startSample) <
                     std::tie(rhs.pair, rhs.startTime, rhs.classification, rhs.startSample);
            });
  return merged;
}

ReportDocument ResultAggregator::finalize(const DetectionConfig& config,
                                          std::vector<double> sampleTimes,
                                          ReportTimestamp resolvedAt) const
{
  std::scoped_lock lock{mutex_};

  ReportDocument document;
  document.config = config;
  document.resolvedAt = resolvedAt;
  document.sampleTimes = std::move(sampleTimes);
  document.records = mergeIntervals(records_);
  document.duplicates.reserve(duplicates_.size());
  for (const auto& [pair, duplicate] : duplicates_)
  {
    document.duplicates.push_back(duplicate);
  }
  document.warnings = warnings_;
  return document;
}

}  // namespace clash_core
