// Ticket: 0006_geometry_resolver

#include "clash-core/src/Resolver/GeometryResolver.hpp"

#include <cmath>
#include <stdexcept>
#include <type_traits>
#include <unordered_set>
#include <utility>

#include <spdlog/spdlog.h>

#include "clash-core/src/Detection/DetectionErrors.hpp"
#include "clash-core/src/Geometry/GeometryFactory.hpp"

namespace clash_core
{

namespace
{

ResolutionWarning makeWarning(WarningKind kind,
                              const std::string& path,
                              double time,
                              std::string message)
{
  spdlog::warn("Resolution warning [{}] {} at t={}: {}",
                toString(kind),
                path,
                time,
                message);
  return ResolutionWarning{kind, path, time, std::move(message)};
}

bool isUsableTransform(const WorldTransform& transform)
{
  if (!transform.matrix().allFinite())
  {
    return false;
  }
  return std::abs(transform.linear().determinant()) > 1e-15;
}

}  // namespace

GeometryResolver::GeometryResolver(std::shared_ptr<const SceneSource> scene)
  : GeometryResolver{std::move(scene), Settings{}}
{
}

GeometryResolver::GeometryResolver(std::shared_ptr<const SceneSource> scene,
                                   Settings settings)
  : scene_{std::move(scene)}, settings_{settings}
{
  if (!scene_)
  {
    throw std::invalid_argument("GeometryResolver: scene must not be null");
  }
}

ResolveResult GeometryResolver::resolve(const std::string& reference,
                                        double atTime) const
{
  ResolveResult result;

  auto members = scene_->listCollectionMembers(reference);
  if (!members.has_value())
  {
    auto proxy =
      resolveObject(reference, atTime, WarningKind::MissingObject, result.warnings);
    if (proxy.has_value())
    {
      result.proxies.push_back(std::move(*proxy));
    }
    return result;
  }

  result.proxies.reserve(members->size());
  for (const auto& member : *members)
  {
    auto proxy =
      resolveObject(member, atTime, WarningKind::MissingMember, result.warnings);
    if (proxy.has_value())
    {
      result.proxies.push_back(std::move(*proxy));
    }
  }
  return result;
}

ResolveResult GeometryResolver::resolveGroup(
  const std::vector<std::string>& references,
  double atTime,
  bool strict) const
{
  ResolveResult group;
  std::unordered_set<std::string> seen;

  for (const auto& reference : references)
  {
    ResolveResult single = resolve(reference, atTime);
    for (auto& proxy : single.proxies)
    {
      if (seen.insert(proxy.key()).second)
      {
        group.proxies.push_back(std::move(proxy));
      }
    }
    for (auto& warning : single.warnings)
    {
      group.warnings.push_back(std::move(warning));
    }
  }

  if (strict && !references.empty() && group.proxies.empty())
  {
    throw UnresolvedReferenceError(
      "No geometry resolved from " + std::to_string(references.size()) +
      " reference(s) at t=" + std::to_string(atTime) + " (first: '" +
      references.front() + "')");
  }

  return group;
}

std::optional<GeometricProxy> GeometryResolver::resolveObject(
  const std::string& path,
  double atTime,
  WarningKind missingKind,
  std::vector<ResolutionWarning>& warnings) const
{
  auto geometry = scene_->getGeometry(path, atTime);
  if (!geometry.has_value())
  {
    warnings.push_back(
      makeWarning(missingKind, path, atTime, "object not found in scene"));
    return std::nullopt;
  }
  return makeProxy(path, *geometry, atTime, warnings);
}

std::optional<GeometricProxy> GeometryResolver::makeProxy(
  const std::string& path,
  const SceneGeometry& geometry,
  double atTime,
  std::vector<ResolutionWarning>& warnings) const
{
  const WorldTransform& transform = geometry.transform;
  if (!isUsableTransform(transform))
  {
    warnings.push_back(makeWarning(WarningKind::UnsupportedTransform,
                                   path,
                                   atTime,
                                   "transform is singular or not finite"));
    return std::nullopt;
  }

  auto degenerate = [&](const std::string& why) -> std::optional<GeometricProxy>
  {
    warnings.push_back(
      makeWarning(WarningKind::DegenerateGeometry, path, atTime, why));
    return std::nullopt;
  };

  return std::visit(
    [&](const auto& shape) -> std::optional<GeometricProxy>
    {
      using T = std::decay_t<decltype(shape)>;
      if constexpr (std::is_same_v<T, SpherePrimitive>)
      {
        if (!std::isfinite(shape.radius) || shape.radius <= 0.0)
        {
          return degenerate("sphere radius is not positive");
        }
        if (transform.isUniformScale())
        {
          return GeometricProxy{path, shape, transform};
        }
        return GeometricProxy{path,
                              GeometryFactory::createSphere(
                                shape.radius,
                                settings_.tessellationRings,
                                settings_.tessellationSegments),
                              transform};
      }
      else if constexpr (std::is_same_v<T, BoxPrimitive>)
      {
        if (!shape.halfExtents.allFinite() || (shape.halfExtents.array() <= 0.0).any())
        {
          return degenerate("box has a non-positive half extent");
        }
        if (transform.isOrthogonal())
        {
          return GeometricProxy{path, shape, transform};
        }
        return GeometricProxy{
          path, GeometryFactory::createBox(shape.halfExtents), transform};
      }
      else if constexpr (std::is_same_v<T, CylinderPrimitive>)
      {
        if (!std::isfinite(shape.radius) || !std::isfinite(shape.height) ||
            shape.radius <= 0.0 || shape.height <= 0.0)
        {
          return degenerate("cylinder has a non-positive radius or height");
        }
        return GeometricProxy{
          path,
          GeometryFactory::createCylinder(
            shape.radius, shape.height, settings_.tessellationSegments),
          transform};
      }
      else
      {
        TriangleMesh mesh = shape;
        const double extent = mesh.getBoundingBox().diagonal();
        const size_t removed = mesh.removeDegenerateTriangles(
          settings_.degenerateAreaRatio * extent * extent);
        if (mesh.triangleCount() == 0)
        {
          return degenerate("mesh has no non-degenerate triangles");
        }
        if (removed > 0)
        {
          warnings.push_back(
            makeWarning(WarningKind::DegenerateGeometry,
                        path,
                        atTime,
                        std::to_string(removed) +
                          " zero-area triangle(s) skipped"));
        }
        return GeometricProxy{path, std::move(mesh), transform};
      }
    },
    geometry.shape);
}

}  // namespace clash_core
