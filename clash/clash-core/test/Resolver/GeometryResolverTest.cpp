// Ticket: 0006_geometry_resolver

#include <gtest/gtest.h>

#include <memory>
#include <variant>

#include "clash-core/src/Detection/DetectionErrors.hpp"
#include "clash-core/src/Geometry/GeometryFactory.hpp"
#include "clash-core/src/Resolver/GeometryResolver.hpp"
#include "clash-core/src/Scene/InMemoryScene.hpp"

using namespace clash_core;

class GeometryResolverTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    scene_ = std::make_shared<InMemoryScene>();
    scene_->addObject("/World/Ball", SpherePrimitive{1.0});
    scene_->addObject("/World/Crate",
                      BoxPrimitive{Eigen::Vector3d{1.0, 1.0, 1.0}},
                      WorldTransform::fromTranslation(Coordinate{5.0, 0.0, 0.0}));
    scene_->addObject("/World/Pipe", CylinderPrimitive{0.5, 2.0});
    scene_->addCollection("/Sets/Props", {"/World/Crate", "/World/Gone", "/World/Ball"});
  }

  std::shared_ptr<InMemoryScene> scene_;
};

TEST_F(GeometryResolverTest, SingleObject_YieldsOneProxy)
{
  GeometryResolver resolver{scene_};
  const ResolveResult result = resolver.resolve("/World/Ball", 0.0);

  ASSERT_EQ(1u, result.proxies.size());
  EXPECT_EQ("/World/Ball", result.proxies[0].key());
  EXPECT_TRUE(result.warnings.empty());
}

TEST_F(GeometryResolverTest, Collection_KeepsDeclaredOrderAndWarnsForMissingMember)
{
  GeometryResolver resolver{scene_};
  const ResolveResult result = resolver.resolve("/Sets/Props", 0.0);

  ASSERT_EQ(2u, result.proxies.size());
  EXPECT_EQ("/World/Crate", result.proxies[0].key());
  EXPECT_EQ("/World/Ball", result.proxies[1].key());

  ASSERT_EQ(1u, result.warnings.size());
  EXPECT_EQ(WarningKind::MissingMember, result.warnings[0].kind);
  EXPECT_EQ("/World/Gone", result.warnings[0].path);
}

TEST_F(GeometryResolverTest, MissingObject_IsWarningNotError)
{
  GeometryResolver resolver{scene_};
  const ResolveResult result = resolver.resolve("/World/Nothing", 0.0);

  EXPECT_TRUE(result.proxies.empty());
  ASSERT_EQ(1u, result.warnings.size());
  EXPECT_EQ(WarningKind::MissingObject, result.warnings[0].kind);
}

TEST_F(GeometryResolverTest, StrictGroupWithNothingResolved_Throws)
{
  GeometryResolver resolver{scene_};
  EXPECT_THROW(resolver.resolveGroup({"/World/Nothing", "/World/Gone"}, 0.0, true),
               UnresolvedReferenceError);
}

TEST_F(GeometryResolverTest, StrictGroupWithPartialResolution_Proceeds)
{
  GeometryResolver resolver{scene_};
  const ResolveResult result =
    resolver.resolveGroup({"/World/Nothing", "/World/Ball"}, 0.0, true);

  EXPECT_EQ(1u, result.proxies.size());
  EXPECT_EQ(1u, result.warnings.size());
}

TEST_F(GeometryResolverTest, LenientGroupWithNothingResolved_ReturnsEmpty)
{
  GeometryResolver resolver{scene_};
  const ResolveResult result = resolver.resolveGroup({"/World/Nothing"}, 0.0, false);

  EXPECT_TRUE(result.proxies.empty());
  EXPECT_EQ(1u, result.warnings.size());
}

TEST_F(GeometryResolverTest, Group_ObjectReachedTwiceIsResolvedOnce)
{
  GeometryResolver resolver{scene_};
  const ResolveResult result =
    resolver.resolveGroup({"/World/Ball", "/Sets/Props"}, 0.0, false);

  ASSERT_EQ(2u, result.proxies.size());
  EXPECT_EQ("/World/Ball", result.proxies[0].key());
  EXPECT_EQ("/World/Crate", result.proxies[1].key());
}

TEST_F(GeometryResolverTest, Primitives_StayNativeUnderRigidTransforms)
{
  GeometryResolver resolver{scene_};

  const auto ball = resolver.resolve("/World/Ball", 0.0).proxies.at(0);
  EXPECT_TRUE(std::holds_alternative<SpherePrimitive>(ball.payload()));
  EXPECT_TRUE(std::holds_alternative<WorldSphere>(ball.worldShape()));

  const auto crate = resolver.resolve("/World/Crate", 0.0).proxies.at(0);
  EXPECT_TRUE(std::holds_alternative<BoxPrimitive>(crate.payload()));
  EXPECT_DOUBLE_EQ(5.0, std::get<WorldBox>(crate.worldShape()).center.x());
}

TEST_F(GeometryResolverTest, Cylinder_IsTessellated)
{
  GeometryResolver resolver{scene_};
  const auto pipe = resolver.resolve("/World/Pipe", 0.0).proxies.at(0);

  ASSERT_TRUE(std::holds_alternative<TriangleMesh>(pipe.payload()));
  EXPECT_TRUE(std::get<WorldMesh>(pipe.worldShape()).closed);
}

TEST_F(GeometryResolverTest, SphereUnderNonUniformScale_IsTessellated)
{
  scene_->addObject("/World/Egg",
                    SpherePrimitive{1.0},
                    WorldTransform::fromComponents(Coordinate{0.0, 0.0, 0.0},
                                                   Eigen::Quaterniond::Identity(),
                                                   Eigen::Vector3d{1.0, 1.0, 2.0}));
  GeometryResolver resolver{scene_};
  const auto egg = resolver.resolve("/World/Egg", 0.0).proxies.at(0);

  EXPECT_TRUE(std::holds_alternative<WorldMesh>(egg.worldShape()));
  EXPECT_NEAR(2.0, egg.bounds().max.z(), 1e-9);
}

TEST_F(GeometryResolverTest, DegenerateSphere_SkippedWithWarning)
{
  scene_->addObject("/World/Point", SpherePrimitive{0.0});
  GeometryResolver resolver{scene_};
  const ResolveResult result = resolver.resolve("/World/Point", 0.0);

  EXPECT_TRUE(result.proxies.empty());
  ASSERT_EQ(1u, result.warnings.size());
  EXPECT_EQ(WarningKind::DegenerateGeometry, result.warnings[0].kind);
}

TEST_F(GeometryResolverTest, MeshWithZeroAreaTriangles_KeepsTheRest)
{
  TriangleMesh mesh = GeometryFactory::createBox(Eigen::Vector3d{1.0, 1.0, 1.0});
  std::vector<TriangleIndices> triangles = mesh.getTriangles();
  triangles.push_back(TriangleIndices{0, 0, 1});
  scene_->addObject("/World/Dirty", TriangleMesh{mesh.getVertices(), triangles});

  GeometryResolver resolver{scene_};
  const ResolveResult result = resolver.resolve("/World/Dirty", 0.0);

  ASSERT_EQ(1u, result.proxies.size());
  EXPECT_EQ(12u, std::get<TriangleMesh>(result.proxies[0].payload()).triangleCount());
  ASSERT_EQ(1u, result.warnings.size());
  EXPECT_EQ(WarningKind::DegenerateGeometry, result.warnings[0].kind);
}

TEST_F(GeometryResolverTest, SingularTransform_SkippedWithWarning)
{
  scene_->addObject("/World/Flat",
                    BoxPrimitive{Eigen::Vector3d{1.0, 1.0, 1.0}},
                    WorldTransform::fromComponents(Coordinate{0.0, 0.0, 0.0},
                                                   Eigen::Quaterniond::Identity(),
                                                   Eigen::Vector3d{1.0, 1.0, 0.0}));
  GeometryResolver resolver{scene_};
  const ResolveResult result = resolver.resolve("/World/Flat", 0.0);

  EXPECT_TRUE(result.proxies.empty());
  ASSERT_EQ(1u, result.warnings.size());
  EXPECT_EQ(WarningKind::UnsupportedTransform, result.warnings[0].kind);
}

TEST_F(GeometryResolverTest, AnimatedObject_ResolvedAtRequestedTime)
{
  scene_->addAnimatedObject(
    "/World/Drone",
    SpherePrimitive{0.5},
    {TransformKeyframe{0.0, Coordinate{0.0, 0.0, 0.0}},
     TransformKeyframe{2.0, Coordinate{4.0, 0.0, 0.0}}});
  GeometryResolver resolver{scene_};

  const auto proxy = resolver.resolve("/World/Drone", 1.0).proxies.at(0);
  EXPECT_NEAR(2.0, std::get<WorldSphere>(proxy.worldShape()).center.x(), 1e-12);
}

TEST_F(GeometryResolverTest, ObjectOutsideLifetime_IsMissing)
{
  scene_->setLifetime("/World/Ball", 1.0, 2.0);
  GeometryResolver resolver{scene_};

  EXPECT_TRUE(resolver.resolve("/World/Ball", 0.0).proxies.empty());
  EXPECT_EQ(1u, resolver.resolve("/World/Ball", 1.5).proxies.size());
}

TEST(GeometryResolverConstructionTest, NullScene_Throws)
{
  EXPECT_THROW(GeometryResolver{nullptr}, std::invalid_argument);
}
