// Ticket: 0005_spatial_index

#include "clash-core/src/Broadphase/SpatialIndex.hpp"

#include <algorithm>
#include <stdexcept>

namespace clash_core
{

namespace
{

std::vector<BoundingBox> collectBounds(const ProxySet& proxies)
{
  std::vector<BoundingBox> bounds;
  bounds.reserve(proxies.size());
  for (const auto& proxy : proxies.proxies())
  {
    bounds.push_back(proxy.bounds());
  }
  return bounds;
}

}  // namespace

SpatialIndex::SpatialIndex(const ProxySet& proxies, double margin)
  : tree_{collectBounds(proxies)}, margin_{margin}
{
  if (!(margin_ >= 0.0))
  {
    throw std::invalid_argument("SpatialIndex: margin must be non-negative");
  }
}

std::vector<uint32_t> SpatialIndex::query(size_t index) const
{
  std::vector<uint32_t> result = query(tree_.itemBounds(index));
  result.erase(std::remove(result.begin(), result.end(), static_cast<uint32_t>(index)),
               result.end());
  return result;
}

std::vector<uint32_t> SpatialIndex::query(const BoundingBox& bounds) const
{
  return tree_.query(bounds.inflated(margin_));
}

}  // namespace clash_core
