#include <gtest/gtest.h>

#include <glm/geometric.hpp>
#include <vector>

#include "Jelly/Physics/DeformableBody.hpp"
#include "Jelly/Scene/SimulationConfig.hpp"
#include "Jelly/Systems/CollisionSystem.hpp"

namespace jelly {
  namespace {

    DeformableBody grownBody(BodyId id, const glm::vec2& center, const glm::vec2& velocity, float radius = 50.0f)
    {
      BodySettings settings{};
      settings.startAge = settings.growthDuration;
      return DeformableBody{id, center, velocity, radius, {1.0f, 1.0f, 1.0f}, settings};
    }

    class CollisionSystemTest : public ::testing::Test
    {
    protected:
      SimulationConfig::Physics physics{};
      CollisionSystem           collisions{physics};
      const glm::vec2           extent{800.0f, 600.0f};
    };

    TEST_F(CollisionSystemTest, WallClampsAndReflectsOutgoingVelocity)
    {
      std::vector<DeformableBody> bodies;
      bodies.push_back(grownBody(0, {770.0f, 300.0f}, {10.0f, 2.0f}));
      bodies.push_back(grownBody(1, {400.0f, 20.0f}, {1.0f, -3.0f}));
      collisions.resolveWalls(bodies, extent);

      EXPECT_FLOAT_EQ(bodies[0].center().x + bodies[0].baseRadius(), 800.0f);
      EXPECT_FLOAT_EQ(bodies[0].velocity().x, -10.0f);
      EXPECT_FLOAT_EQ(bodies[0].velocity().y, 2.0f);

      EXPECT_FLOAT_EQ(bodies[1].center().y, 50.0f);
      EXPECT_FLOAT_EQ(bodies[1].velocity().y, 3.0f);
      EXPECT_FLOAT_EQ(bodies[1].velocity().x, 1.0f);
    }

    TEST_F(CollisionSystemTest, WallKeepsInwardVelocity)
    {
      std::vector<DeformableBody> bodies;
      bodies.push_back(grownBody(0, {30.0f, 300.0f}, {4.0f, 0.0f}));
      collisions.resolveWalls(bodies, extent);

      EXPECT_FLOAT_EQ(bodies[0].center().x, 50.0f);
      EXPECT_FLOAT_EQ(bodies[0].velocity().x, 4.0f);
    }

    TEST_F(CollisionSystemTest, BodyWiderThanDomainIsCentred)
    {
      std::vector<DeformableBody> bodies;
      bodies.push_back(grownBody(0, {10.0f, 300.0f}, {4.0f, 1.0f}, 500.0f));
      collisions.resolveWalls(bodies, extent);

      EXPECT_FLOAT_EQ(bodies[0].center().x, 400.0f);
      EXPECT_FLOAT_EQ(bodies[0].velocity().x, 0.0f);
    }

    TEST_F(CollisionSystemTest, OverlapIsSplitEvenly)
    {
      auto a = grownBody(0, {300.0f, 300.0f}, {0.0f, 0.0f});
      auto b = grownBody(1, {380.0f, 300.0f}, {0.0f, 0.0f});

      EXPECT_TRUE(collisions.resolvePair(a, b));
      EXPECT_FLOAT_EQ(a.center().x, 290.0f);
      EXPECT_FLOAT_EQ(b.center().x, 390.0f);
      EXPECT_FLOAT_EQ(glm::distance(a.center(), b.center()), 100.0f);

      // not approaching: no impulse, no dent
      EXPECT_EQ(a.velocity().x, 0.0f);
      EXPECT_EQ(a.contour()[0].velocity, 0.0f);
    }

    TEST_F(CollisionSystemTest, ApproachingPairLosesClosingSpeedAndDents)
    {
      auto a = grownBody(0, {300.0f, 300.0f}, {1.0f, 0.0f});
      auto b = grownBody(1, {380.0f, 300.0f}, {-1.0f, 0.0f});

      ASSERT_TRUE(collisions.resolvePair(a, b));

      // j = (1 + e) * 2 / (2 / 2500); dv = j / m * scale
      const float impulse = (1.0f + physics.restitution) * 2.0f / (2.0f / 2500.0f);
      const float dv      = impulse / 2500.0f * physics.collisionVelocityScale;
      EXPECT_FLOAT_EQ(a.velocity().x, 1.0f - dv);
      EXPECT_FLOAT_EQ(b.velocity().x, -1.0f + dv);
      EXPECT_LT(a.velocity().x - b.velocity().x, 2.0f);

      // A is hit on its +x side (node 0), B on its -x side (node 20)
      const float kick = -impulse * physics.collisionDeformationFactor / 50.0f;
      EXPECT_FLOAT_EQ(a.contour()[0].velocity, kick);
      EXPECT_FLOAT_EQ(b.contour()[20].velocity, kick);
      EXPECT_FLOAT_EQ(b.contour()[19].velocity, 0.5f * kick);
      EXPECT_EQ(a.contour()[20].velocity, 0.0f);
    }

    TEST_F(CollisionSystemTest, DentedBoundaryLetsNeighbourCloser)
    {
      auto a = grownBody(0, {300.0f, 300.0f}, {0.0f, 0.0f});
      a.applyImpulseAt(0.0f, -500.0f);
      a.update(1.0f);
      ASSERT_LT(a.effectiveRadiusAt(0.0f), 45.0f);

      auto b = grownBody(1, {395.0f, 300.0f}, {0.0f, 0.0f});
      EXPECT_FALSE(collisions.resolvePair(a, b));
      EXPECT_FLOAT_EQ(b.center().x, 395.0f);

      auto c = grownBody(2, {300.0f, 395.0f}, {0.0f, 0.0f});
      EXPECT_TRUE(collisions.resolvePair(a, c));
    }

    TEST_F(CollisionSystemTest, CoincidentPairIsSkipped)
    {
      auto a = grownBody(0, {300.0f, 300.0f}, {1.0f, 0.0f});
      auto b = grownBody(1, {300.0f, 300.0f}, {-1.0f, 0.0f});

      EXPECT_FALSE(collisions.resolvePair(a, b));
      EXPECT_EQ(a.center().x, 300.0f);
      EXPECT_EQ(b.velocity().x, -1.0f);
    }

    TEST_F(CollisionSystemTest, ResolveBodiesCountsContacts)
    {
      std::vector<DeformableBody> bodies;
      bodies.push_back(grownBody(0, {100.0f, 100.0f}, {0.0f, 0.0f}));
      bodies.push_back(grownBody(1, {180.0f, 100.0f}, {0.0f, 0.0f}));
      bodies.push_back(grownBody(2, {600.0f, 400.0f}, {0.0f, 0.0f}));

      EXPECT_EQ(collisions.resolveBodies(bodies), 1u);
      EXPECT_EQ(bodies[2].center().x, 600.0f);
    }

  } // namespace
} // namespace jelly
