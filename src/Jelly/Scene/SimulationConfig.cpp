#include "Jelly/Scene/SimulationConfig.hpp"

#include <cmath>
#include <string>

#include "Jelly/Core/Exceptions.hpp"

namespace jelly {

  namespace {
    constexpr std::size_t kMaxBodyCount = 10000;

    void require(bool condition, const std::string& field, const char* rule)
    {
      if (!condition)
      {
        throw InvalidConfigException("invalid config value '" + field + "': must be " + rule);
      }
    }

    bool finite(float value) { return std::isfinite(value); }

    // Sub-unit multiplicative decay applied once per tick
    bool isDecayFactor(float value) { return finite(value) && value > 0.0f && value <= 1.0f; }

    void requireRange(const glm::vec2& range, const std::string& field)
    {
      require(finite(range.x) && finite(range.y) && range.x >= 1.0f, field, "a range starting at 1 or more");
      require(range.x <= range.y, field, "an ordered [min, max] range");
    }
  } // namespace

  void SimulationConfig::validate() const
  {
    require(finite(contour.restStiffness) && contour.restStiffness >= 0.0f, "contour.restStiffness", "non-negative");
    require(finite(contour.neighborStiffness) && contour.neighborStiffness >= 0.0f, "contour.neighborStiffness", "non-negative");
    require(isDecayFactor(contour.damping), "contour.damping", "in (0, 1]");
    require(finite(contour.maxDisplacementRatio) && contour.maxDisplacementRatio > 0.0f && contour.maxDisplacementRatio < 1.0f,
            "contour.maxDisplacementRatio",
            "in (0, 1)");
    require(contour.resolution >= 3 && contour.resolution <= 4096, "contour.resolution", "in [3, 4096]");

    require(finite(growth.duration) && growth.duration > 0.0f, "growth.duration", "positive");
    requireRange(growth.initialRadiusRange, "growth.initialRadiusRange");
    requireRange(growth.interactiveRadiusRange, "growth.interactiveRadiusRange");

    require(finite(physics.gravityConstant) && physics.gravityConstant >= 0.0f, "physics.gravityConstant", "non-negative");
    require(finite(physics.maxGravityForce) && physics.maxGravityForce >= 0.0f, "physics.maxGravityForce", "non-negative");
    require(isDecayFactor(physics.centerDamping), "physics.centerDamping", "in (0, 1]");
    require(finite(physics.collisionDeformationFactor) && physics.collisionDeformationFactor >= 0.0f,
            "physics.collisionDeformationFactor",
            "non-negative");
    require(finite(physics.restitution) && physics.restitution >= 0.0f && physics.restitution <= 1.0f, "physics.restitution", "in [0, 1]");
    require(finite(physics.collisionVelocityScale) && physics.collisionVelocityScale >= 0.0f, "physics.collisionVelocityScale", "non-negative");
    require(finite(physics.initialSpeed) && physics.initialSpeed >= 0.0f, "physics.initialSpeed", "non-negative");

    require(finite(input.mouseImpulseFactor) && input.mouseImpulseFactor >= 0.0f, "input.mouseImpulseFactor", "non-negative");
    require(finite(input.dragDeformationScale) && input.dragDeformationScale >= 0.0f, "input.dragDeformationScale", "non-negative");
    require(finite(input.grabRadiusScale) && input.grabRadiusScale > 0.0f, "input.grabRadiusScale", "positive");

    require(finite(world.width) && world.width > 0.0f, "world.width", "positive");
    require(finite(world.height) && world.height > 0.0f, "world.height", "positive");
    require(world.initialBodyCount <= kMaxBodyCount, "world.initialBodyCount", "at most 10000");
    require(world.maxBodies <= kMaxBodyCount, "world.maxBodies", "at most 10000");

    require(finite(clock.timeScale) && clock.timeScale > 0.0f, "clock.timeScale", "positive");
    require(finite(clock.defaultTimestep) && clock.defaultTimestep > 0.0f, "clock.defaultTimestep", "positive");
    require(finite(clock.maxTimestep) && clock.maxTimestep >= clock.defaultTimestep, "clock.maxTimestep", "at least clock.defaultTimestep");
  }

} // namespace jelly
