#include "clash-core/src/Geometry/GeometryPayload.hpp"

#include <cstring>
#include <type_traits>

namespace clash_core
{

namespace
{

constexpr uint64_t kFnvOffsetBasis = 14695981039346656037ULL;
constexpr uint64_t kFnvPrime = 1099511628211ULL;

class Fnv1a
{
public:
  void addBytes(const void* data, size_t size)
  {
    const auto* bytes = static_cast<const unsigned char*>(data);
    for (size_t i = 0; i < size; ++i)
    {
      hash_ ^= bytes[i];
      hash_ *= kFnvPrime;
    }
  }

  void addDouble(double value)
  {
    // -0.0 and 0.0 describe the same geometry
    if (value == 0.0)
    {
      value = 0.0;
    }
    uint64_t bits{0};
    std::memcpy(&bits, &value, sizeof(bits));
    addBytes(&bits, sizeof(bits));
  }

  void addUint(uint64_t value)
  {
    addBytes(&value, sizeof(value));
  }

  uint64_t value() const
  {
    return hash_;
  }

private:
  uint64_t hash_{kFnvOffsetBasis};
};

}  // namespace

std::string_view payloadKindName(const GeometryPayload& payload)
{
  return std::visit(
    [](const auto& shape) -> std::string_view
    {
      using T = std::decay_t<decltype(shape)>;
      if constexpr (std::is_same_v<T, SpherePrimitive>)
      {
        return "sphere";
      }
      else if constexpr (std::is_same_v<T, BoxPrimitive>)
      {
        return "box";
      }
      else
      {
        return "mesh";
      }
    },
    payload);
}

uint64_t computeContentHash(const GeometryPayload& payload)
{
  Fnv1a hasher;
  hasher.addUint(payload.index());

  std::visit(
    [&hasher](const auto& shape)
    {
      using T = std::decay_t<decltype(shape)>;
      if constexpr (std::is_same_v<T, SpherePrimitive>)
      {
        hasher.addDouble(shape.radius);
      }
      else if constexpr (std::is_same_v<T, BoxPrimitive>)
      {
        hasher.addDouble(shape.halfExtents.x());
        hasher.addDouble(shape.halfExtents.y());
        hasher.addDouble(shape.halfExtents.z());
      }
      else
      {
        hasher.addUint(shape.vertexCount());
        for (const auto& v : shape.getVertices())
        {
          hasher.addDouble(v.x());
          hasher.addDouble(v.y());
          hasher.addDouble(v.z());
        }
        hasher.addUint(shape.triangleCount());
        for (const auto& tri : shape.getTriangles())
        {
          hasher.addUint(tri[0]);
          hasher.addUint(tri[1]);
          hasher.addUint(tri[2]);
        }
      }
    },
    payload);

  return hasher.value();
}

}  // namespace clash_core
