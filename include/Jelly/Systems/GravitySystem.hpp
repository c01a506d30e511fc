#pragma once

#include <glm/vec2.hpp>
#include <vector>

#include "Jelly/Physics/DeformableBody.hpp"
#include "Jelly/Scene/SimulationConfig.hpp"

namespace jelly {

  class GravitySystem
  {
  public:
    explicit GravitySystem(const SimulationConfig::Physics& physics);

    // Accumulates pairwise attraction into every body's velocity.
    void update(std::vector<DeformableBody>& bodies, float dt) const;

    // Force pulling @p toBody towards @p fromBody, capped at maxGravityForce.
    glm::vec2 computeForce(const DeformableBody& fromBody, const DeformableBody& toBody) const;

  private:
    float gravityConstant;
    float maxForce;
  };

} // namespace jelly
