#pragma once

#include <cstddef>
#include <glm/vec2.hpp>
#include <vector>

#include "Jelly/Physics/DeformableBody.hpp"
#include "Jelly/Scene/SimulationConfig.hpp"

namespace jelly {

  /**
   * @class CollisionSystem
   * @brief Wall containment and soft body-body contacts.
   *
   * Contacts are tested against each body's direction-dependent radius, so a
   * dented body lets its neighbour in a little further. Every approaching
   * contact also dents both outlines at the contact point.
   */
  class CollisionSystem
  {
  public:
    explicit CollisionSystem(const SimulationConfig::Physics& physics);

    // Keeps every body inside [radius, extent - radius] on both axes.
    void resolveWalls(std::vector<DeformableBody>& bodies, const glm::vec2& extent) const;

    // Returns the number of overlapping pairs that were separated.
    std::size_t resolveBodies(std::vector<DeformableBody>& bodies) const;

    bool resolvePair(DeformableBody& bodyA, DeformableBody& bodyB) const;

  private:
    float restitution;
    float velocityScale;
    float deformationFactor;
  };

} // namespace jelly
