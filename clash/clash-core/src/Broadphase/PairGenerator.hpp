// Ticket: 0007_pair_generator

#ifndef CLASH_CORE_BROADPHASE_PAIR_GENERATOR_HPP
#define CLASH_CORE_BROADPHASE_PAIR_GENERATOR_HPP

#include <cstdint>
#include <vector>

#include "clash-core/src/Broadphase/ProxySet.hpp"
#include "clash-core/src/Broadphase/SpatialIndex.hpp"
#include "clash-core/src/Detection/ClashTypes.hpp"

namespace clash_core
{

/**
 * @brief Two proxies selected for narrow-phase evaluation
 */
struct CandidatePair
{
  ClashPair pair;
  uint32_t first{0};   // ProxySet index of pair.first()
  uint32_t second{0};  // ProxySet index of pair.second()
};

struct PairGenerationResult
{
  std::vector<CandidatePair> candidates;    // Sorted by pair, unique
  std::vector<DuplicateGeometry> duplicates;  // Sorted by pair, unique
};

/**
 * @brief Enumerates the candidate pairs of one sample
 *
 * For every proxy the spatial index supplies its neighbours; a neighbour
 * becomes a candidate when the two proxies are in opposite groups (or, in
 * single-group mode, are simply distinct). Pairs whose proxies share a
 * content hash and an identical world transform are the same physical
 * instance: they are diverted into DuplicateGeometry records and never
 * reach the narrow phase.
 *
 * Output order is ascending by (pair.first, pair.second), so identical
 * input always yields identical output.
 *
 * @ticket 0007_pair_generator
 */
class PairGenerator
{
public:
  /**
   * @param proxies Proxies of the sample
   * @param index Spatial index built from proxies
   * @param time Sample time stamped on DuplicateGeometry records
   */
  static PairGenerationResult generate(const ProxySet& proxies,
                                       const SpatialIndex& index,
                                       double time);
};

}  // namespace clash_core

#endif  // CLASH_CORE_BROADPHASE_PAIR_GENERATOR_HPP
