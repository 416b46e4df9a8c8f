// Ticket: 0008_narrow_phase

#ifndef CLASH_CORE_NARROWPHASE_MESH_DISTANCE_HPP
#define CLASH_CORE_NARROWPHASE_MESH_DISTANCE_HPP

#include <optional>

#include "clash-core/src/Narrowphase/Proximity.hpp"
#include "clash-core/src/Narrowphase/TriangleDistance.hpp"
#include "clash-core/src/Resolver/WorldShape.hpp"

namespace clash_core
{

/**
 * @brief Triangle-level proximity queries on world-space meshes
 *
 * Surface distances only visit triangle pairs whose bounds, grown by the
 * search radius, overlap (per-triangle AabbTree query). Closed meshes are
 * treated as solids: a vertex or sphere centre inside one (ray parity)
 * turns the result into a penetration.
 */
namespace MeshDistance
{

/**
 * @brief Whether point lies inside a closed mesh
 *
 * Majority vote of three slightly skewed ray-parity tests so that rays
 * grazing an edge or vertex do not flip the answer. Always false for open
 * meshes.
 */
bool containsPoint(const WorldMesh& mesh, const Coordinate& point);

/**
 * @brief Closest surface point of mesh to point
 *
 * pointA is the query point, pointB the surface point.
 */
ClosestPoints closestOnSurface(const WorldMesh& mesh, const Coordinate& point);

/**
 * @brief Signed distance between two meshes
 *
 * @param searchRadius Triangle pairs further apart than this are ignored
 * @param overlapThreshold Triangle pairs at or below this distance are
 * counted in overlappingTriangles
 * @return std::nullopt if no triangle pair lies within searchRadius and
 * neither mesh contains the other
 */
std::optional<Proximity> meshMesh(const WorldMesh& a,
                                  const WorldMesh& b,
                                  double searchRadius,
                                  double overlapThreshold);

/**
 * @brief Signed distance between a mesh and a sphere
 *
 * contact.pointA lies on the mesh, contact.pointB on the sphere.
 */
std::optional<Proximity> meshSphere(const WorldMesh& mesh,
                                    const WorldSphere& sphere,
                                    double searchRadius,
                                    double overlapThreshold);

}  // namespace MeshDistance

}  // namespace clash_core

#endif  // CLASH_CORE_NARROWPHASE_MESH_DISTANCE_HPP
