#pragma once

#include <cstddef>
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>
#include <optional>
#include <random>
#include <vector>

#include "Jelly/Physics/DeformableBody.hpp"
#include "Jelly/Scene/SimulationConfig.hpp"
#include "Jelly/Systems/CollisionSystem.hpp"
#include "Jelly/Systems/GravitySystem.hpp"

namespace jelly {

  // Per-spawn overrides; anything left empty is randomised.
  struct SpawnParams
  {
    std::optional<glm::vec2> velocity{};
    std::optional<glm::vec3> color{};
    float                    startAge{0.0f};
  };

  /**
   * @class SimulationWorld
   * @brief Owns the jelly bodies and advances them in a fixed five-phase tick:
   * integrate, gravity, walls, body contacts, damping.
   *
   * Bodies are kept in insertion order, which is also the draw order.
   */
  class SimulationWorld
  {
  public:
    explicit SimulationWorld(const SimulationConfig& config);

    // delete copy operations
    SimulationWorld(const SimulationWorld&)            = delete;
    SimulationWorld& operator=(const SimulationWorld&) = delete;

    BodyId addBody(const glm::vec2& position, float targetRadius, const SpawnParams& params = {});
    BodyId spawnInteractive(const glm::vec2& position);
    void   spawnInitialBodies();

    void step(float dt);
    void resize(float width, float height);

    const std::vector<DeformableBody>& bodies() const { return bodyList; }

    DeformableBody*       findBody(BodyId id);
    const DeformableBody* findBody(BodyId id) const;

    // Topmost body whose grab radius contains @p point, or nullptr.
    DeformableBody* bodyAt(const glm::vec2& point);

    float                   width() const { return extent.x; }
    float                   height() const { return extent.y; }
    std::size_t             bodyCount() const { return bodyList.size(); }
    std::size_t             lastContactCount() const { return contactCount; }
    float                   kineticEnergy() const;
    const SimulationConfig& config() const { return settings; }

  private:
    BodySettings makeBodySettings(float startAge) const;
    glm::vec2    randomVelocity();
    glm::vec3    randomColor();
    float        randomRadius(const glm::vec2& range);
    void         enforceCapacity();

    const SimulationConfig      settings;
    GravitySystem               gravitySystem;
    CollisionSystem             collisionSystem;
    glm::vec2                   extent;
    std::vector<DeformableBody> bodyList{};
    BodyId                      nextId{0};
    std::size_t                 contactCount{0};
    std::mt19937                rng{std::random_device{}()};
  };

} // namespace jelly
