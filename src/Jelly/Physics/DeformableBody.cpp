#include "Jelly/Physics/DeformableBody.hpp"

#include <cmath>
#include <glm/common.hpp>
#include <glm/gtc/constants.hpp>
#include <glm/trigonometric.hpp>

#include "Jelly/Core/Exceptions.hpp"
#include "Jelly/Physics/Easing.hpp"

namespace jelly {

  float normalizeAngle(float angle)
  {
    const float twoPi   = glm::two_pi<float>();
    float       wrapped = std::fmod(angle, twoPi);
    if (wrapped < 0.0f) wrapped += twoPi;
    // fmod of a tiny negative angle can round up to exactly 2pi
    if (wrapped >= twoPi) wrapped = 0.0f;
    return wrapped;
  }

  DeformableBody::DeformableBody(BodyId              objId,
                                 const glm::vec2&    center,
                                 const glm::vec2&    velocity,
                                 float               targetRadius,
                                 const glm::vec3&    color,
                                 const BodySettings& settings)
      : bodyId{objId},
        centerPos{center},
        linearVelocity{velocity},
        finalRadius{glm::max(targetRadius, 1.0f)},
        ageTime{glm::max(settings.startAge, 0.0f)},
        growthTime{settings.growthDuration},
        displayColor{color},
        springs{settings.contour}
  {
    if (springs.resolution < 3)
    {
      throw InvalidConfigException("body contour needs at least 3 nodes");
    }
    if (!std::isfinite(growthTime) || growthTime <= 0.0f)
    {
      throw InvalidConfigException("body growth duration must be positive");
    }

    const std::size_t count = springs.resolution;
    nodes.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
    {
      nodes.push_back({static_cast<float>(i) * glm::two_pi<float>() / static_cast<float>(count)});
    }
    applyGrowth();
  }

  void DeformableBody::update(float dt)
  {
    ageTime += dt;
    applyGrowth();
    integrateContour(dt);
  }

  void DeformableBody::applyGrowth()
  {
    const float t    = glm::clamp(ageTime / growthTime, 0.0f, 1.0f);
    const float ease = jellyGrowthEase(t);
    // The curve dips below zero early on; never let the disc shrink under radius 1.
    radius   = glm::max(1.0f, 1.0f + (finalRadius - 1.0f) * ease);
    bodyMass = radius * radius;
  }

  void DeformableBody::integrateContour(float dt)
  {
    const std::size_t count = nodes.size();

    // Forces depend on displacements only, so velocities can be updated in place
    // before any displacement moves.
    for (std::size_t i = 0; i < count; ++i)
    {
      const float prev      = nodes[(i + count - 1) % count].displacement;
      const float next      = nodes[(i + 1) % count].displacement;
      const float current   = nodes[i].displacement;
      const float laplacian = prev + next - 2.0f * current;
      const float force     = -springs.restStiffness * current + springs.neighborStiffness * laplacian;

      nodes[i].velocity += force * dt;
      nodes[i].velocity *= springs.damping;
    }

    const float limit = radius * springs.maxDisplacementRatio;
    for (auto& node : nodes)
    {
      node.displacement += node.velocity * dt;
      node.displacement = glm::clamp(node.displacement, -limit, limit);
    }
  }

  float DeformableBody::angleStep() const
  {
    return glm::two_pi<float>() / static_cast<float>(nodes.size());
  }

  std::size_t DeformableBody::nearestNodeIndex(float angle) const
  {
    const float       position = normalizeAngle(angle) / angleStep();
    const std::size_t index    = static_cast<std::size_t>(std::lround(position));
    return index % nodes.size();
  }

  void DeformableBody::applyImpulseAt(float angle, float force)
  {
    const std::size_t count   = nodes.size();
    const std::size_t index   = nearestNodeIndex(angle);
    const float       impulse = force / radius;

    nodes[index].velocity += impulse;
    nodes[(index + count - 1) % count].velocity += impulse * 0.5f;
    nodes[(index + 1) % count].velocity += impulse * 0.5f;
  }

  float DeformableBody::effectiveRadiusAt(float angle) const
  {
    if (springs.sampling == BoundarySampling::Nearest)
    {
      return radius + nodes[nearestNodeIndex(angle)].displacement;
    }

    const std::size_t count    = nodes.size();
    const float       position = normalizeAngle(angle) / angleStep();
    const float       lower    = std::floor(position);
    const std::size_t first    = static_cast<std::size_t>(lower) % count;
    const std::size_t second   = (first + 1) % count;
    const float       blend    = position - lower;
    return radius + glm::mix(nodes[first].displacement, nodes[second].displacement, blend);
  }

  std::vector<glm::vec2> DeformableBody::outline() const
  {
    std::vector<glm::vec2> points{};
    points.reserve(nodes.size());
    for (const auto& node : nodes)
    {
      const float r = radius + node.displacement;
      points.push_back(centerPos + r * glm::vec2{glm::cos(node.angle), glm::sin(node.angle)});
    }
    return points;
  }

} // namespace jelly
