#pragma once

#include <array>
#include <cstddef>
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

namespace jelly {

  // How a contour answers radius queries between its samples.
  enum class BoundarySampling
  {
    Nearest, // snap to the closest node
    Linear   // blend the two bracketing nodes
  };

  /**
   * @class SimulationConfig
   * @brief Every tunable of the jelly simulation, grouped by concern.
   *
   * Built once (defaults or ConfigSerializer), validated, then handed to the
   * world by const reference. Bodies keep a copy of the contour settings.
   */
  class SimulationConfig
  {
  public:
    struct Contour
    {
      float            restStiffness{0.05f};
      float            neighborStiffness{0.1f};
      float            damping{0.9f};
      float            maxDisplacementRatio{0.5f}; // of baseRadius
      std::size_t      resolution{40};
      BoundarySampling sampling{BoundarySampling::Nearest};
    };

    struct Growth
    {
      float     duration{20.0f};
      glm::vec2 initialRadiusRange{30.0f, 60.0f};
      glm::vec2 interactiveRadiusRange{60.0f, 70.0f};
    };

    struct Physics
    {
      float gravityConstant{0.1f};
      float maxGravityForce{50.0f};
      float centerDamping{0.995f};
      float collisionDeformationFactor{0.02f};
      float restitution{0.1f};
      float collisionVelocityScale{0.2f};
      float initialSpeed{2.0f};
    };

    struct Input
    {
      float mouseImpulseFactor{0.05f};
      float dragDeformationScale{10.0f};
      float grabRadiusScale{1.0f};
    };

    struct World
    {
      float       width{800.0f};
      float       height{600.0f};
      std::size_t initialBodyCount{8};
      std::size_t maxBodies{0}; // 0 keeps every body ever spawned
    };

    struct Clock
    {
      float timeScale{60.0f};
      float defaultTimestep{1.0f};
      float maxTimestep{3.0f};
    };

    static inline const std::array<glm::vec3, 8> palette = {
            glm::vec3{1.0f, 0.42f, 0.42f},
            glm::vec3{1.0f, 0.72f, 0.3f},
            glm::vec3{1.0f, 0.92f, 0.4f},
            glm::vec3{0.45f, 0.9f, 0.5f},
            glm::vec3{0.3f, 0.8f, 0.95f},
            glm::vec3{0.45f, 0.55f, 1.0f},
            glm::vec3{0.75f, 0.45f, 1.0f},
            glm::vec3{1.0f, 0.5f, 0.8f},
    };

    Contour contour{};
    Growth  growth{};
    Physics physics{};
    Input   input{};
    World   world{};
    Clock   clock{};

    // Throws InvalidConfigException naming the first field out of range.
    void validate() const;
  };

} // namespace jelly
