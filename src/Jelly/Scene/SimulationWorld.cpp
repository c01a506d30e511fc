#include "Jelly/Scene/SimulationWorld.hpp"

#include <algorithm>
#include <cmath>
#include <glm/common.hpp>
#include <glm/geometric.hpp>
#include <iostream>

#include "Jelly/Core/ansi_colors.hpp"

namespace jelly {

  namespace {
    const SimulationConfig& validated(const SimulationConfig& config)
    {
      config.validate();
      return config;
    }
  } // namespace

  SimulationWorld::SimulationWorld(const SimulationConfig& config)
      : settings{validated(config)},
        gravitySystem{settings.physics},
        collisionSystem{settings.physics},
        extent{settings.world.width, settings.world.height}
  {
  }

  BodySettings SimulationWorld::makeBodySettings(float startAge) const
  {
    return BodySettings{.contour = settings.contour, .growthDuration = settings.growth.duration, .startAge = startAge};
  }

  glm::vec2 SimulationWorld::randomVelocity()
  {
    const float                           half = 0.5f * settings.physics.initialSpeed;
    std::uniform_real_distribution<float> dist{-half, half};
    return {dist(rng), dist(rng)};
  }

  glm::vec3 SimulationWorld::randomColor()
  {
    std::uniform_int_distribution<std::size_t> dist{0, SimulationConfig::palette.size() - 1};
    return SimulationConfig::palette[dist(rng)];
  }

  float SimulationWorld::randomRadius(const glm::vec2& range)
  {
    std::uniform_real_distribution<float> dist{range.x, range.y};
    return dist(rng);
  }

  void SimulationWorld::enforceCapacity()
  {
    const std::size_t cap = settings.world.maxBodies;
    if (cap == 0) return;

    while (bodyList.size() >= cap)
    {
      std::cout << "[" << YELLOW << "World" << RESET << "] capacity of " << cap << " reached, evicting body " << bodyList.front().id()
                << std::endl;
      bodyList.erase(bodyList.begin());
    }
  }

  BodyId SimulationWorld::addBody(const glm::vec2& position, float targetRadius, const SpawnParams& params)
  {
    enforceCapacity();

    const glm::vec2 velocity = params.velocity ? *params.velocity : randomVelocity();
    const glm::vec3 color    = params.color ? *params.color : randomColor();
    const BodyId    id       = nextId++;
    bodyList.emplace_back(id, position, velocity, targetRadius, color, makeBodySettings(params.startAge));
    return id;
  }

  BodyId SimulationWorld::spawnInteractive(const glm::vec2& position)
  {
    return addBody(position, randomRadius(settings.growth.interactiveRadiusRange));
  }

  void SimulationWorld::spawnInitialBodies()
  {
    for (std::size_t i = 0; i < settings.world.initialBodyCount; ++i)
    {
      const float radius = randomRadius(settings.growth.initialRadiusRange);
      // keep the full-grown disc inside the walls where the domain allows it
      const float marginX = glm::min(radius, 0.5f * extent.x);
      const float marginY = glm::min(radius, 0.5f * extent.y);

      std::uniform_real_distribution<float> distX{marginX, extent.x - marginX};
      std::uniform_real_distribution<float> distY{marginY, extent.y - marginY};
      addBody({distX(rng), distY(rng)}, radius);
    }
    std::cout << "[" << GREEN << "World" << RESET << "] spawned " << settings.world.initialBodyCount << " bodies in " << extent.x << "x"
              << extent.y << std::endl;
  }

  void SimulationWorld::step(float dt)
  {
    if (!std::isfinite(dt) || dt <= 0.0f)
    {
      dt = settings.clock.defaultTimestep;
    }

    // integrate
    for (auto& body : bodyList)
    {
      body.update(dt);
      body.translate(body.velocity() * dt);
    }

    gravitySystem.update(bodyList, dt);
    collisionSystem.resolveWalls(bodyList, extent);
    contactCount = collisionSystem.resolveBodies(bodyList);

    for (auto& body : bodyList)
    {
      body.setVelocity(body.velocity() * settings.physics.centerDamping);
    }
  }

  void SimulationWorld::resize(float width, float height)
  {
    if (!std::isfinite(width) || !std::isfinite(height) || width <= 0.0f || height <= 0.0f)
    {
      std::cerr << "[" << RED << "World" << RESET << "] ignoring resize to " << width << "x" << height << std::endl;
      return;
    }
    extent = {width, height};
  }

  DeformableBody* SimulationWorld::findBody(BodyId id)
  {
    auto it = std::find_if(bodyList.begin(), bodyList.end(), [id](const DeformableBody& body) { return body.id() == id; });
    return it != bodyList.end() ? &*it : nullptr;
  }

  const DeformableBody* SimulationWorld::findBody(BodyId id) const
  {
    auto it = std::find_if(bodyList.begin(), bodyList.end(), [id](const DeformableBody& body) { return body.id() == id; });
    return it != bodyList.end() ? &*it : nullptr;
  }

  DeformableBody* SimulationWorld::bodyAt(const glm::vec2& point)
  {
    // last drawn is on top
    for (auto it = bodyList.rbegin(); it != bodyList.rend(); ++it)
    {
      if (glm::distance(it->center(), point) <= it->baseRadius() * settings.input.grabRadiusScale)
      {
        return &*it;
      }
    }
    return nullptr;
  }

  float SimulationWorld::kineticEnergy() const
  {
    float energy = 0.0f;
    for (const auto& body : bodyList)
    {
      energy += 0.5f * body.mass() * glm::dot(body.velocity(), body.velocity());
    }
    return energy;
  }

} // namespace jelly
