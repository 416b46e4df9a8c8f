// Ticket: 0007_pair_generator

#ifndef CLASH_CORE_BROADPHASE_PROXY_SET_HPP
#define CLASH_CORE_BROADPHASE_PROXY_SET_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "clash-core/src/Geometry/BoundingBox.hpp"
#include "clash-core/src/Resolver/GeometricProxy.hpp"

namespace clash_core
{

/**
 * @brief Every proxy of one sample, each tagged with its group membership
 *
 * An object reached from both groups is stored once and carries both tags.
 * Indices into the set are the proxy indices used by SpatialIndex and
 * PairGenerator.
 */
class ProxySet
{
public:
  enum Membership : uint8_t
  {
    InGroupA = 1U << 0U,
    InGroupB = 1U << 1U
  };

  ProxySet() = default;

  /**
   * @brief Merge the resolved groups of one sample
   *
   * @param groupA Proxies of group A, in resolution order
   * @param groupB Proxies of group B, or std::nullopt for single-group mode
   */
  static ProxySet fromGroups(std::vector<GeometricProxy> groupA,
                             std::optional<std::vector<GeometricProxy>> groupB);

  size_t size() const
  {
    return proxies_.size();
  }

  bool empty() const
  {
    return proxies_.empty();
  }

  bool isSingleGroup() const
  {
    return singleGroup_;
  }

  const GeometricProxy& operator[](size_t index) const
  {
    return proxies_[index];
  }

  const std::vector<GeometricProxy>& proxies() const
  {
    return proxies_;
  }

  uint8_t membership(size_t index) const
  {
    return membership_[index];
  }

  /**
   * @brief Whether proxies i and j should be tested against each other
   *
   * Single-group mode: any two distinct proxies. Two-group mode: one must
   * belong to A and the other to B.
   */
  bool isCrossGroup(size_t i, size_t j) const;

  /**
   * @brief Union of all proxy bounds
   */
  BoundingBox bounds() const;

private:
  std::vector<GeometricProxy> proxies_;
  std::vector<uint8_t> membership_;
  bool singleGroup_{true};
};

}  // namespace clash_core

#endif  // CLASH_CORE_BROADPHASE_PROXY_SET_HPP
