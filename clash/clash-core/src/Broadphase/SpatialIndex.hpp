// Ticket: 0005_spatial_index

#ifndef CLASH_CORE_BROADPHASE_SPATIAL_INDEX_HPP
#define CLASH_CORE_BROADPHASE_SPATIAL_INDEX_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

#include "clash-core/src/Broadphase/ProxySet.hpp"
#include "clash-core/src/Geometry/AabbTree.hpp"

namespace clash_core
{

/**
 * @brief Broad-phase index over the bounds of one sample's proxies
 *
 * Built once per sample from the full proxy set and immutable afterwards, so
 * evaluator workers may query it concurrently. A query returns every proxy
 * whose bounds overlap the queried bounds grown by the margin (the larger
 * tolerance plus the classification epsilon): two proxies closer than the
 * margin always have overlapping inflated bounds.
 *
 * @ticket 0005_spatial_index
 */
class SpatialIndex
{
public:
  SpatialIndex(const ProxySet& proxies, double margin);

  /**
   * @brief Proxies near proxy index, ascending, excluding index itself
   */
  std::vector<uint32_t> query(size_t index) const;

  /**
   * @brief Proxies whose bounds overlap bounds inflated by the margin
   */
  std::vector<uint32_t> query(const BoundingBox& bounds) const;

  double margin() const
  {
    return margin_;
  }

  size_t size() const
  {
    return tree_.size();
  }

private:
  AabbTree tree_;
  double margin_;
};

}  // namespace clash_core

#endif  // CLASH_CORE_BROADPHASE_SPATIAL_INDEX_HPP
