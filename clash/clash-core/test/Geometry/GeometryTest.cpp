// Ticket: 0002_geometry_model

#include <gtest/gtest.h>

#include <cmath>

#include "clash-core/src/Geometry/GeometryFactory.hpp"
#include "clash-core/src/Geometry/GeometryPayload.hpp"
#include "clash-core/src/Geometry/TriangleMesh.hpp"
#include "clash-core/src/Geometry/WorldTransform.hpp"

using namespace clash_core;

// ============================================================================
// TriangleMesh
// ============================================================================

TEST(TriangleMeshTest, FactoryBox_IsClosedWithTwelveTriangles)
{
  const TriangleMesh box = GeometryFactory::createBox(Eigen::Vector3d{1.0, 2.0, 3.0});

  EXPECT_EQ(8u, box.vertexCount());
  EXPECT_EQ(12u, box.triangleCount());
  EXPECT_TRUE(box.isClosed());

  const BoundingBox bounds = box.getBoundingBox();
  EXPECT_DOUBLE_EQ(-1.0, bounds.min.x());
  EXPECT_DOUBLE_EQ(3.0, bounds.max.z());
}

TEST(TriangleMeshTest, SingleTriangle_IsOpen)
{
  const TriangleMesh tri{{Coordinate{0, 0, 0}, Coordinate{1, 0, 0}, Coordinate{0, 1, 0}},
                         {TriangleIndices{0, 1, 2}}};
  EXPECT_FALSE(tri.isClosed());
}

TEST(TriangleMeshTest, RemoveDegenerateTriangles_DropsZeroArea)
{
  TriangleMesh mesh{{Coordinate{0, 0, 0},
                     Coordinate{1, 0, 0},
                     Coordinate{0, 1, 0},
                     Coordinate{2, 0, 0}},
                    {TriangleIndices{0, 1, 2},
                     TriangleIndices{0, 1, 3},    // Collinear
                     TriangleIndices{2, 2, 1}}};  // Repeated vertex

  EXPECT_TRUE(mesh.isDegenerate(1, 1e-12));
  EXPECT_EQ(2u, mesh.removeDegenerateTriangles(1e-12));
  EXPECT_EQ(1u, mesh.triangleCount());
}

TEST(TriangleMeshTest, FactoryCylinder_IsClosed)
{
  const TriangleMesh cylinder = GeometryFactory::createCylinder(0.5, 2.0, 16);
  EXPECT_TRUE(cylinder.isClosed());

  const BoundingBox bounds = cylinder.getBoundingBox();
  EXPECT_NEAR(2.0, bounds.extent().z(), 1e-12);
}

TEST(TriangleMeshTest, FactorySphere_VerticesOnRadius)
{
  const TriangleMesh sphere = GeometryFactory::createSphere(2.0, 8, 12);
  EXPECT_TRUE(sphere.isClosed());
  for (const auto& v : sphere.getVertices())
  {
    EXPECT_NEAR(2.0, v.norm(), 1e-12);
  }
}

// ============================================================================
// WorldTransform
// ============================================================================

TEST(WorldTransformTest, Translation_MovesPoints)
{
  const auto transform = WorldTransform::fromTranslation(Coordinate{1.0, 2.0, 3.0});
  const Coordinate p = transform.localToGlobal(Coordinate{1.0, 0.0, 0.0});

  EXPECT_DOUBLE_EQ(2.0, p.x());
  EXPECT_DOUBLE_EQ(2.0, p.y());
  EXPECT_DOUBLE_EQ(3.0, p.z());
  EXPECT_TRUE(transform.isUniformScale());
}

TEST(WorldTransformTest, RotationWithUniformScale_IsUniform)
{
  const Eigen::Quaterniond rotation{
    Eigen::AngleAxisd{M_PI / 3.0, Eigen::Vector3d::UnitZ()}};
  const auto transform = WorldTransform::fromComponents(
    Coordinate{0.0, 0.0, 0.0}, rotation, Eigen::Vector3d{2.0, 2.0, 2.0});

  EXPECT_TRUE(transform.isOrthogonal());
  EXPECT_TRUE(transform.isUniformScale());
  EXPECT_NEAR(2.0, transform.localToGlobalRelative(Eigen::Vector3d::UnitX()).norm(), 1e-12);
}

TEST(WorldTransformTest, NonUniformScale_IsNotUniform)
{
  const auto transform = WorldTransform::fromComponents(Coordinate{0.0, 0.0, 0.0},
                                                        Eigen::Quaterniond::Identity(),
                                                        Eigen::Vector3d{1.0, 3.0, 1.0});
  EXPECT_FALSE(transform.isUniformScale());
}

TEST(WorldTransformTest, Shear_IsNotOrthogonal)
{
  Eigen::Matrix4d m = Eigen::Matrix4d::Identity();
  m(0, 1) = 0.5;
  EXPECT_FALSE(WorldTransform{m}.isOrthogonal());
}

TEST(WorldTransformTest, TransformBounds_EnclosesRotatedBox)
{
  const Eigen::Quaterniond rotation{
    Eigen::AngleAxisd{M_PI / 4.0, Eigen::Vector3d::UnitZ()}};
  const auto transform =
    WorldTransform::fromComponents(Coordinate{0.0, 0.0, 0.0}, rotation);
  const BoundingBox local{Coordinate{-1.0, -1.0, -1.0}, Coordinate{1.0, 1.0, 1.0}};

  const BoundingBox world = transform.transformBounds(local);
  EXPECT_NEAR(std::sqrt(2.0), world.max.x(), 1e-12);
  EXPECT_NEAR(1.0, world.max.z(), 1e-12);
}

TEST(WorldTransformTest, Equality_IsExact)
{
  const auto a = WorldTransform::fromTranslation(Coordinate{1.0, 0.0, 0.0});
  const auto b = WorldTransform::fromTranslation(Coordinate{1.0, 0.0, 0.0});
  const auto c = WorldTransform::fromTranslation(Coordinate{1.0 + 1e-12, 0.0, 0.0});

  EXPECT_TRUE(a == b);
  EXPECT_FALSE(a == c);
}

// ============================================================================
// Content hash
// ============================================================================

TEST(ContentHashTest, EqualPayloads_HashEqual)
{
  const GeometryPayload a = GeometryFactory::createBox(Eigen::Vector3d{1.0, 1.0, 1.0});
  const GeometryPayload b = GeometryFactory::createBox(Eigen::Vector3d{1.0, 1.0, 1.0});
  EXPECT_EQ(computeContentHash(a), computeContentHash(b));
}

TEST(ContentHashTest, DifferentPayloads_HashDiffers)
{
  EXPECT_NE(computeContentHash(GeometryPayload{SpherePrimitive{1.0}}),
            computeContentHash(GeometryPayload{SpherePrimitive{1.5}}));

  // Same numbers, different kinds
  EXPECT_NE(computeContentHash(GeometryPayload{SpherePrimitive{1.0}}),
            computeContentHash(GeometryPayload{BoxPrimitive{Eigen::Vector3d{1.0, 0.0, 0.0}}}));
}
