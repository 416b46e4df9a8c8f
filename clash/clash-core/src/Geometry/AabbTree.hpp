// Ticket: 0005_spatial_index

#ifndef CLASH_CORE_GEOMETRY_AABB_TREE_HPP
#define CLASH_CORE_GEOMETRY_AABB_TREE_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

#include "clash-core/src/Geometry/BoundingBox.hpp"

namespace clash_core
{

/**
 * @brief Static bounding volume hierarchy over a fixed set of boxes
 *
 * Built once, top-down: each node splits its items at the median centroid
 * along the longest axis of the centroid bounds. The tree is immutable after
 * construction and can be queried concurrently.
 *
 * Used both as the proxy-level broad phase (SpatialIndex) and as the
 * per-triangle broad phase inside mesh evaluation.
 *
 * @ticket 0005_spatial_index
 */
class AabbTree
{
public:
  static constexpr size_t kDefaultLeafSize = 4;

  AabbTree() = default;

  explicit AabbTree(std::vector<BoundingBox> itemBounds,
                    size_t leafSize = kDefaultLeafSize);

  /**
   * @brief Indices of all items whose bounds overlap box, ascending
   */
  std::vector<uint32_t> query(const BoundingBox& box) const;

  /**
   * @brief Call visitor(index) for every item whose bounds overlap box
   *
   * Visit order follows the tree, not the item index.
   */
  template <typename Visitor>
  void visit(const BoundingBox& box, Visitor&& visitor) const
  {
    if (nodes_.empty())
    {
      return;
    }

    std::vector<uint32_t> stack;
    stack.push_back(0);
    while (!stack.empty())
    {
      const Node& node = nodes_[stack.back()];
      stack.pop_back();

      if (!node.bounds.overlaps(box))
      {
        continue;
      }

      if (node.count > 0)
      {
        for (uint32_t i = node.first; i < node.first + node.count; ++i)
        {
          const uint32_t item = order_[i];
          if (items_[item].overlaps(box))
          {
            visitor(item);
          }
        }
      }
      else
      {
        stack.push_back(node.left);
        stack.push_back(node.right);
      }
    }
  }

  size_t size() const
  {
    return items_.size();
  }

  bool empty() const
  {
    return items_.empty();
  }

  const BoundingBox& itemBounds(size_t index) const
  {
    return items_[index];
  }

  /**
   * @brief Bounds of all items (empty box for an empty tree)
   */
  BoundingBox rootBounds() const;

  size_t nodeCount() const
  {
    return nodes_.size();
  }

private:
  struct Node
  {
    BoundingBox bounds;
    uint32_t left{0};
    uint32_t right{0};
    uint32_t first{0};
    uint32_t count{0};  // > 0 marks a leaf
  };

  uint32_t build(uint32_t first, uint32_t count);

  std::vector<BoundingBox> items_;
  std::vector<uint32_t> order_;  // Item indices, grouped by leaf
  std::vector<Node> nodes_;
  size_t leafSize_{kDefaultLeafSize};
};

}  // namespace clash_core

#endif  // CLASH_CORE_GEOMETRY_AABB_TREE_HPP
