// Ticket: 0006_geometry_resolver

#include "clash-core/src/Resolver/GeometricProxy.hpp"

#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace clash_core
{

namespace
{

WorldShape bakeWorldShape(const std::string& key,
                          const GeometryPayload& payload,
                          const WorldTransform& transform)
{
  return std::visit(
    [&](const auto& shape) -> WorldShape
    {
      using T = std::decay_t<decltype(shape)>;
      if constexpr (std::is_same_v<T, SpherePrimitive>)
      {
        if (!transform.isUniformScale())
        {
          throw std::invalid_argument("GeometricProxy '" + key +
                                      "': sphere needs a uniform-scale "
                                      "transform");
        }
        const double scale = transform.linear().col(0).norm();
        return WorldSphere{transform.localToGlobal(Coordinate{0.0, 0.0, 0.0}),
                           shape.radius * scale};
      }
      else if constexpr (std::is_same_v<T, BoxPrimitive>)
      {
        if (!transform.isOrthogonal())
        {
          throw std::invalid_argument("GeometricProxy '" + key +
                                      "': box needs an orthogonal transform");
        }
        WorldBox box;
        box.center = transform.localToGlobal(Coordinate{0.0, 0.0, 0.0});
        for (Eigen::Index c = 0; c < 3; ++c)
        {
          const Eigen::Vector3d column = transform.linear().col(c);
          const double length = column.norm();
          box.axes.col(c) = column / length;
          box.halfExtents[c] = shape.halfExtents[c] * length;
        }
        return box;
      }
      else
      {
        if (shape.triangleCount() == 0)
        {
          throw std::invalid_argument("GeometricProxy '" + key +
                                      "': mesh has no triangles");
        }

        Eigen::Matrix3Xd points(3, static_cast<Eigen::Index>(shape.vertexCount()));
        for (size_t i = 0; i < shape.vertexCount(); ++i)
        {
          points.col(static_cast<Eigen::Index>(i)) = shape.vertex(i);
        }
        transform.localToGlobalBatch(points);

        std::vector<Coordinate> worldVertices;
        worldVertices.reserve(shape.vertexCount());
        for (Eigen::Index i = 0; i < points.cols(); ++i)
        {
          worldVertices.emplace_back(points.col(i));
        }

        return makeWorldMesh(
          TriangleMesh{std::move(worldVertices), shape.getTriangles()});
      }
    },
    payload);
}

}  // namespace

GeometricProxy::GeometricProxy(std::string key,
                               GeometryPayload payload,
                               const WorldTransform& transform)
  : key_{std::move(key)},
    payload_{std::make_shared<const GeometryPayload>(std::move(payload))},
    transform_{transform},
    contentHash_{computeContentHash(*payload_)},
    worldShape_{std::make_shared<const WorldShape>(
      bakeWorldShape(key_, *payload_, transform_))},
    bounds_{computeBounds(*worldShape_)}
{
}

}  // namespace clash_core
