// Ticket: 0005_spatial_index

#include "clash-core/src/Geometry/AabbTree.hpp"

#include <algorithm>
#include <numeric>
#include <utility>

namespace clash_core
{

AabbTree::AabbTree(std::vector<BoundingBox> itemBounds, size_t leafSize)
  : items_{std::move(itemBounds)}, leafSize_{std::max<size_t>(leafSize, 1)}
{
  if (items_.empty())
  {
    return;
  }

  order_.resize(items_.size());
  std::iota(order_.begin(), order_.end(), 0U);

  // A binary tree with n leaves-or-fewer has at most 2n - 1 nodes
  nodes_.reserve(2 * items_.size());
  build(0, static_cast<uint32_t>(items_.size()));
}

std::vector<uint32_t> AabbTree::query(const BoundingBox& box) const
{
  std::vector<uint32_t> result;
  visit(box, [&result](uint32_t index) { result.push_back(index); });
  std::sort(result.begin(), result.end());
  return result;
}

BoundingBox AabbTree::rootBounds() const
{
  return nodes_.empty() ? BoundingBox{} : nodes_.front().bounds;
}

uint32_t AabbTree::build(uint32_t first, uint32_t count)
{
  const auto nodeIndex = static_cast<uint32_t>(nodes_.size());
  nodes_.emplace_back();

  BoundingBox bounds;
  BoundingBox centroidBounds;
  for (uint32_t i = first; i < first + count; ++i)
  {
    const BoundingBox& item = items_[order_[i]];
    bounds.merge(item);
    centroidBounds.expand(item.center());
  }
  nodes_[nodeIndex].bounds = bounds;

  if (count <= leafSize_)
  {
    nodes_[nodeIndex].first = first;
    nodes_[nodeIndex].count = count;
    return nodeIndex;
  }

  // Median split on the longest centroid axis
  const Eigen::Index axis = centroidBounds.longestAxis();
  const uint32_t half = count / 2;
  auto begin = order_.begin() + first;
  std::nth_element(begin,
                   begin + half,
                   begin + count,
                   [this, axis](uint32_t a, uint32_t b)
                   {
                     const double ca = items_[a].min[axis] + items_[a].max[axis];
                     const double cb = items_[b].min[axis] + items_[b].max[axis];
                     return ca < cb || (ca == cb && a < b);
                   });

  // nodes_ may reallocate during recursion; write children through the index
  const uint32_t left = build(first, half);
  const uint32_t right = build(first + half, count - half);
  nodes_[nodeIndex].left = left;
  nodes_[nodeIndex].right = right;
  return nodeIndex;
}

}  // namespace clash_core
