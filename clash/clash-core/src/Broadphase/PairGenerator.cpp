// Ticket: 0007_pair_generator

#include "clash-core/src/Broadphase/PairGenerator.hpp"

#include <algorithm>
#include <utility>

namespace clash_core
{

PairGenerationResult PairGenerator::generate(const ProxySet& proxies,
                                             const SpatialIndex& index,
                                             double time)
{
  PairGenerationResult result;

  for (size_t i = 0; i < proxies.size(); ++i)
  {
    for (uint32_t j : index.query(i))
    {
      // Each unordered pair is reached from both ends; keep the lower index
      if (j <= i || !proxies.isCrossGroup(i, j))
      {
        continue;
      }

      const GeometricProxy& a = proxies[i];
      const GeometricProxy& b = proxies[j];
      ClashPair pair{a.key(), b.key()};

      if (a.isSameInstanceAs(b))
      {
        result.duplicates.push_back(
          DuplicateGeometry{std::move(pair), a.contentHash(), time, time});
        continue;
      }

      const bool aFirst = pair.first() == a.key();
      result.candidates.push_back(
        CandidatePair{std::move(pair),
                      aFirst ? static_cast<uint32_t>(i) : j,
                      aFirst ? j : static_cast<uint32_t>(i)});
    }
  }

  std::sort(result.candidates.begin(),
            result.candidates.end(),
            [](const CandidatePair& lhs, const CandidatePair& rhs)
            { return lhs.pair < rhs.pair; });
  std::sort(result.duplicates.begin(),
            result.duplicates.end(),
            [](const DuplicateGeometry& lhs, const DuplicateGeometry& rhs)
            { return lhs.pair < rhs.pair; });

  return result;
}

}  // namespace clash_core
