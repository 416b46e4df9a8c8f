// Ticket: 0007_pair_generator

#include "clash-core/src/Broadphase/ProxySet.hpp"

#include <string>
#include <unordered_map>
#include <utility>

namespace clash_core
{

ProxySet ProxySet::fromGroups(std::vector<GeometricProxy> groupA,
                              std::optional<std::vector<GeometricProxy>> groupB)
{
  ProxySet set;
  set.singleGroup_ = !groupB.has_value();

  std::unordered_map<std::string, size_t> slotByKey;
  auto add = [&set, &slotByKey](GeometricProxy&& proxy, Membership tag)
  {
    auto [it, inserted] = slotByKey.try_emplace(proxy.key(), set.proxies_.size());
    if (inserted)
    {
      set.proxies_.push_back(std::move(proxy));
      set.membership_.push_back(tag);
    }
    else
    {
      set.membership_[it->second] |= tag;
    }
  };

  for (auto& proxy : groupA)
  {
    add(std::move(proxy), InGroupA);
  }
  if (groupB.has_value())
  {
    for (auto& proxy : *groupB)
    {
      add(std::move(proxy), InGroupB);
    }
  }
  return set;
}

bool ProxySet::isCrossGroup(size_t i, size_t j) const
{
  if (i == j)
  {
    return false;
  }
  if (singleGroup_)
  {
    return true;
  }
  return ((membership_[i] & InGroupA) != 0 && (membership_[j] & InGroupB) != 0) ||
         ((membership_[j] & InGroupA) != 0 && (membership_[i] & InGroupB) != 0);
}

BoundingBox ProxySet::bounds() const
{
  BoundingBox all;
  for (const auto& proxy : proxies_)
  {
    all.merge(proxy.bounds());
  }
  return all;
}

}  // namespace clash_core
