#include "Jelly/Systems/GravitySystem.hpp"

#include <glm/common.hpp>
#include <glm/geometric.hpp>
#include <glm/glm.hpp>

namespace jelly {

  GravitySystem::GravitySystem(const SimulationConfig::Physics& physics)
      : gravityConstant{physics.gravityConstant}, maxForce{physics.maxGravityForce}
  {
  }

  glm::vec2 GravitySystem::computeForce(const DeformableBody& fromBody, const DeformableBody& toBody) const
  {
    const glm::vec2 offset          = fromBody.center() - toBody.center();
    const float     distanceSquared = glm::dot(offset, offset);
    // coincident centers have no direction; the pair is skipped this tick
    if (distanceSquared <= 0.0f)
    {
      return {0.0f, 0.0f};
    }

    const float force = glm::min(gravityConstant * toBody.mass() * fromBody.mass() / distanceSquared, maxForce);
    return force * offset / glm::sqrt(distanceSquared);
  }

  void GravitySystem::update(std::vector<DeformableBody>& bodies, float dt) const
  {
    for (auto iterA = bodies.begin(); iterA != bodies.end(); ++iterA)
    {
      auto& bodyA = *iterA;
      for (auto iterB = iterA + 1; iterB != bodies.end(); ++iterB)
      {
        auto& bodyB = *iterB;

        // force on A points towards B
        const glm::vec2 force = computeForce(bodyB, bodyA);
        bodyA.addVelocity(dt * force / bodyA.mass());
        bodyB.addVelocity(dt * -force / bodyB.mass());
      }
    }
  }

} // namespace jelly
