#include <gtest/gtest.h>

#include <cmath>
#include <functional>
#include <limits>
#include <string>

#include "Jelly/Core/Exceptions.hpp"
#include "Jelly/Scene/SimulationConfig.hpp"

namespace jelly {
  namespace {

    // Applies one bad edit to a default config and returns the validation message.
    std::string rejectionFor(const std::function<void(SimulationConfig&)>& edit)
    {
      SimulationConfig config{};
      edit(config);
      try
      {
        config.validate();
      }
      catch (const InvalidConfigException& e)
      {
        return e.what();
      }
      return {};
    }

    TEST(SimulationConfigTest, DefaultsAreValid)
    {
      EXPECT_NO_THROW(SimulationConfig{}.validate());
    }

    TEST(SimulationConfigTest, DefaultsMatchDocumentedConstants)
    {
      const SimulationConfig config{};
      EXPECT_EQ(config.contour.resolution, 40u);
      EXPECT_EQ(config.contour.sampling, BoundarySampling::Nearest);
      EXPECT_FLOAT_EQ(config.growth.duration, 20.0f);
      EXPECT_FLOAT_EQ(config.physics.restitution, 0.1f);
      EXPECT_FLOAT_EQ(config.physics.collisionVelocityScale, 0.2f);
      EXPECT_EQ(config.world.maxBodies, 0u);
    }

    TEST(SimulationConfigTest, RejectionNamesTheField)
    {
      EXPECT_NE(rejectionFor([](SimulationConfig& c) { c.contour.damping = 0.0f; }).find("contour.damping"), std::string::npos);
      EXPECT_NE(rejectionFor([](SimulationConfig& c) { c.contour.damping = 1.5f; }).find("contour.damping"), std::string::npos);
      EXPECT_NE(rejectionFor([](SimulationConfig& c) { c.contour.resolution = 2; }).find("contour.resolution"), std::string::npos);
      EXPECT_NE(rejectionFor([](SimulationConfig& c) { c.world.initialBodyCount = 10001; }).find("world.initialBodyCount"), std::string::npos);
      EXPECT_NE(rejectionFor([](SimulationConfig& c) { c.world.maxBodies = static_cast<std::size_t>(-1); }).find("world.maxBodies"), std::string::npos);
      EXPECT_NE(rejectionFor([](SimulationConfig& c) { c.growth.duration = 0.0f; }).find("growth.duration"), std::string::npos);
      EXPECT_NE(rejectionFor([](SimulationConfig& c) { c.growth.initialRadiusRange = {60.0f, 30.0f}; }).find("growth.initialRadiusRange"),
                std::string::npos);
      EXPECT_NE(rejectionFor([](SimulationConfig& c) { c.physics.centerDamping = 1.01f; }).find("physics.centerDamping"), std::string::npos);
      EXPECT_NE(rejectionFor([](SimulationConfig& c) { c.physics.restitution = -0.1f; }).find("physics.restitution"), std::string::npos);
      EXPECT_NE(rejectionFor([](SimulationConfig& c) { c.world.width = 0.0f; }).find("world.width"), std::string::npos);
      EXPECT_NE(rejectionFor([](SimulationConfig& c) { c.clock.maxTimestep = 0.5f; }).find("clock.maxTimestep"), std::string::npos);
    }

    TEST(SimulationConfigTest, RejectsNonFiniteValues)
    {
      SimulationConfig config{};
      config.physics.gravityConstant = std::numeric_limits<float>::quiet_NaN();
      EXPECT_THROW(config.validate(), InvalidConfigException);

      config              = SimulationConfig{};
      config.world.height = std::numeric_limits<float>::infinity();
      EXPECT_THROW(config.validate(), InvalidConfigException);
    }

    TEST(SimulationConfigTest, PaletteHasUsableColors)
    {
      for (const auto& color : SimulationConfig::palette)
      {
        EXPECT_GE(color.r, 0.0f);
        EXPECT_LE(color.r, 1.0f);
        EXPECT_GE(color.g, 0.0f);
        EXPECT_LE(color.b, 1.0f);
      }
    }

  } // namespace
} // namespace jelly
