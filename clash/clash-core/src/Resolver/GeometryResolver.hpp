// Ticket: 0006_geometry_resolver

#ifndef CLASH_CORE_RESOLVER_GEOMETRY_RESOLVER_HPP
#define CLASH_CORE_RESOLVER_GEOMETRY_RESOLVER_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "clash-core/src/Detection/ClashTypes.hpp"
#include "clash-core/src/Resolver/GeometricProxy.hpp"
#include "clash-core/src/Scene/SceneSource.hpp"

namespace clash_core
{

/**
 * @brief Proxies produced by one resolution call plus any warnings raised
 */
struct ResolveResult
{
  std::vector<GeometricProxy> proxies;
  std::vector<ResolutionWarning> warnings;
};

/**
 * @brief Turns configured references into GeometricProxy snapshots
 *
 * A reference names either a collection (SceneSource::listCollectionMembers
 * returns a value) or a single object. Geometry is sampled at the requested
 * time and copied into the proxy; the scene is only borrowed for the call.
 *
 * Native primitives stay primitives when the transform allows it (sphere:
 * uniform scale, box: orthogonal axes). Everything else (cylinders, scaled
 * or sheared primitives) is tessellated into a TriangleMesh. Degenerate
 * geometry is dropped and reported as a warning.
 *
 * Thread safety: const and stateless apart from the scene pointer; safe to
 * call concurrently if the SceneSource is.
 *
 * @ticket 0006_geometry_resolver
 */
class GeometryResolver
{
public:
  struct Settings
  {
    int tessellationSegments{32};  // Around cylinders and spheres
    int tessellationRings{16};     // Latitude bands of tessellated spheres
    double degenerateAreaRatio{1e-12};  // Relative to the squared mesh extent
  };

  explicit GeometryResolver(std::shared_ptr<const SceneSource> scene);

  GeometryResolver(std::shared_ptr<const SceneSource> scene, Settings settings);

  /**
   * @brief Resolve one reference at one time
   *
   * Single object: at most one proxy (none if it is missing or degenerate).
   * Collection: one proxy per surviving member in declared order; missing
   * members are skipped with a MissingMember warning.
   */
  ResolveResult resolve(const std::string& reference, double atTime) const;

  /**
   * @brief Resolve every reference of a group, in order
   *
   * An object reached twice (listed twice, or through two collections) is
   * resolved once, at its first position.
   *
   * @throws UnresolvedReferenceError if strict, references is non-empty and
   * nothing resolved
   */
  ResolveResult resolveGroup(const std::vector<std::string>& references,
                             double atTime,
                             bool strict) const;

  /**
   * @brief Convert one scene object into a proxy, or explain why not
   */
  std::optional<GeometricProxy> makeProxy(
    const std::string& path,
    const SceneGeometry& geometry,
    double atTime,
    std::vector<ResolutionWarning>& warnings) const;

private:
  std::optional<GeometricProxy> resolveObject(
    const std::string& path,
    double atTime,
    WarningKind missingKind,
    std::vector<ResolutionWarning>& warnings) const;

  std::shared_ptr<const SceneSource> scene_;
  Settings settings_;
};

}  // namespace clash_core

#endif  // CLASH_CORE_RESOLVER_GEOMETRY_RESOLVER_HPP
