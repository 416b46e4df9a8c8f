// Ticket: 0002_geometry_payload_variant

#ifndef CLASH_CORE_GEOMETRY_PAYLOAD_HPP
#define CLASH_CORE_GEOMETRY_PAYLOAD_HPP

#include <cstdint>
#include <string_view>
#include <variant>

#include <Eigen/Dense>

#include "clash-core/src/Geometry/TriangleMesh.hpp"

namespace clash_core
{

/**
 * @brief Sphere centred at the local origin
 */
struct SpherePrimitive
{
  double radius{0.0};
};

/**
 * @brief Box centred at the local origin, aligned with the local axes
 */
struct BoxPrimitive
{
  Eigen::Vector3d halfExtents{Eigen::Vector3d::Zero()};
};

/**
 * @brief Cylinder centred at the local origin with its axis along local Z
 *
 * Not evaluated natively; the resolver tessellates it into a TriangleMesh.
 */
struct CylinderPrimitive
{
  double radius{0.0};
  double height{0.0};
};

/**
 * @brief Geometry kinds the narrow phase evaluates natively
 *
 * The set is closed on purpose: every visitor over this variant is checked
 * for exhaustiveness at compile time.
 *
 * @ticket 0002_geometry_payload_variant
 */
using GeometryPayload =
  std::variant<SpherePrimitive, BoxPrimitive, TriangleMesh>;

/**
 * @brief Geometry kinds a scene may hand to the resolver
 */
using SceneShape = std::variant<SpherePrimitive,
                                BoxPrimitive,
                                CylinderPrimitive,
                                TriangleMesh>;

/**
 * @brief Human readable payload kind ("sphere", "box", "mesh")
 */
std::string_view payloadKindName(const GeometryPayload& payload);

/**
 * @brief 64-bit FNV-1a hash over the payload kind and its numeric content
 *
 * Two payloads hash equal when they describe the same local-space geometry
 * bit for bit (with -0.0 folded onto 0.0). The world transform is not part
 * of the hash.
 */
uint64_t computeContentHash(const GeometryPayload& payload);

}  // namespace clash_core

#endif  // CLASH_CORE_GEOMETRY_PAYLOAD_HPP
