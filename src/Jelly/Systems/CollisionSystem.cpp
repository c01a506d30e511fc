#include "Jelly/Systems/CollisionSystem.hpp"

#include <glm/common.hpp>
#include <glm/geometric.hpp>
#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

namespace jelly {

  CollisionSystem::CollisionSystem(const SimulationConfig::Physics& physics)
      : restitution{physics.restitution},
        velocityScale{physics.collisionVelocityScale},
        deformationFactor{physics.collisionDeformationFactor}
  {
  }

  void CollisionSystem::resolveWalls(std::vector<DeformableBody>& bodies, const glm::vec2& extent) const
  {
    for (auto& body : bodies)
    {
      glm::vec2   pos    = body.center();
      glm::vec2   vel    = body.velocity();
      const float radius = body.baseRadius();

      for (int axis = 0; axis < 2; ++axis)
      {
        float&      coord    = axis == 0 ? pos.x : pos.y;
        float&      velocity = axis == 0 ? vel.x : vel.y;
        const float limit    = axis == 0 ? extent.x : extent.y;

        // Only an outward component is reversed, not every component at a wall,
        // so a body resting on or growing into a wall keeps its inward velocity.
        if (2.0f * radius >= limit)
        {
          // wider than the domain: pin to the middle of that axis
          coord    = 0.5f * limit;
          velocity = 0.0f;
        }
        else if (coord - radius < 0.0f)
        {
          coord = radius;
          if (velocity < 0.0f) velocity = -velocity;
        }
        else if (coord + radius > limit)
        {
          coord = limit - radius;
          if (velocity > 0.0f) velocity = -velocity;
        }
      }

      body.setCenter(pos);
      body.setVelocity(vel);
    }
  }

  std::size_t CollisionSystem::resolveBodies(std::vector<DeformableBody>& bodies) const
  {
    std::size_t       contacts = 0;
    const std::size_t count    = bodies.size();
    for (std::size_t i = 0; i < count; ++i)
    {
      for (std::size_t j = i + 1; j < count; ++j)
      {
        if (resolvePair(bodies[i], bodies[j])) ++contacts;
      }
    }
    return contacts;
  }

  bool CollisionSystem::resolvePair(DeformableBody& bodyA, DeformableBody& bodyB) const
  {
    const glm::vec2 offset   = bodyB.center() - bodyA.center();
    const float     distance = glm::length(offset);
    if (distance <= 0.0f) return false;

    const glm::vec2 normal       = offset / distance;
    const float     contactAngle = glm::atan(normal.y, normal.x);
    const float     radiusA      = bodyA.effectiveRadiusAt(contactAngle);
    const float     radiusB      = bodyB.effectiveRadiusAt(contactAngle + glm::pi<float>());

    const float overlap = radiusA + radiusB - distance;
    if (overlap <= 0.0f) return false;

    const glm::vec2 separation = normal * (overlap * 0.5f);
    bodyA.translate(-separation);
    bodyB.translate(separation);

    const float closingSpeed = glm::dot(bodyB.velocity() - bodyA.velocity(), normal);
    if (closingSpeed < 0.0f)
    {
      const float invMassA = 1.0f / bodyA.mass();
      const float invMassB = 1.0f / bodyB.mass();
      const float impulse  = -(1.0f + restitution) * closingSpeed / (invMassA + invMassB);

      bodyA.addVelocity(-normal * (impulse * invMassA * velocityScale));
      bodyB.addVelocity(normal * (impulse * invMassB * velocityScale));

      const float dent = -impulse * deformationFactor;
      bodyA.applyImpulseAt(contactAngle, dent);
      bodyB.applyImpulseAt(contactAngle + glm::pi<float>(), dent);
    }
    return true;
  }

} // namespace jelly
