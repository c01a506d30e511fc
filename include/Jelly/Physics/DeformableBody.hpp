#pragma once

#include <cstddef>
#include <cstdint>
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>
#include <vector>

#include "Jelly/Scene/SimulationConfig.hpp"

namespace jelly {

  using BodyId        = std::uint32_t;
  using TextureHandle = std::uint32_t; // owned and interpreted by the renderer

  // Wraps any angle into [0, 2pi).
  float normalizeAngle(float angle);

  struct ContourNode
  {
    float angle;               // fixed at construction
    float displacement{0.0f};  // radial offset from baseRadius
    float velocity{0.0f};
  };

  struct BodySettings
  {
    SimulationConfig::Contour contour{};
    float                     growthDuration{20.0f};
    float                     startAge{0.0f};
  };

  /**
   * @class DeformableBody
   * @brief A soft disc whose outline is a closed ring of spring-mass nodes.
   *
   * The body grows from radius 1 towards its target radius along an eased
   * curve. Each node stores a radial displacement that is pulled back to the
   * base circle and coupled to its two ring neighbours, so a dent spreads as
   * a ripple and fades out.
   */
  class DeformableBody
  {
  public:
    DeformableBody(BodyId              objId,
                   const glm::vec2&    center,
                   const glm::vec2&    velocity,
                   float               targetRadius,
                   const glm::vec3&    color,
                   const BodySettings& settings);

    // delete copy operations
    DeformableBody(const DeformableBody&)            = delete;
    DeformableBody& operator=(const DeformableBody&) = delete;

    // default move operations
    DeformableBody(DeformableBody&&) noexcept            = default;
    DeformableBody& operator=(DeformableBody&&) noexcept = default;

    // Advances growth and integrates the contour ring by dt.
    void update(float dt);

    /**
     * @brief Kicks the node closest to @p angle by force / baseRadius and its
     * two ring neighbours by half of that.
     */
    void applyImpulseAt(float angle, float force);

    // Distance from the center to the boundary in direction @p angle.
    float effectiveRadiusAt(float angle) const;

    std::size_t nearestNodeIndex(float angle) const;

    // Closed polygon through every node, in world space.
    std::vector<glm::vec2> outline() const;

    BodyId           id() const { return bodyId; }
    const glm::vec2& center() const { return centerPos; }
    const glm::vec2& velocity() const { return linearVelocity; }
    float            baseRadius() const { return radius; }
    float            targetRadius() const { return finalRadius; }
    float            age() const { return ageTime; }
    float            growthDuration() const { return growthTime; }
    float            mass() const { return bodyMass; }
    const glm::vec3& color() const { return displayColor; }

    const std::vector<ContourNode>&   contour() const { return nodes; }
    const SimulationConfig::Contour& contourSettings() const { return springs; }

    TextureHandle textureHandle() const { return texture; }
    void          setTextureHandle(TextureHandle handle) { texture = handle; }

    void setCenter(const glm::vec2& position) { centerPos = position; }
    void translate(const glm::vec2& offset) { centerPos += offset; }
    void setVelocity(const glm::vec2& v) { linearVelocity = v; }
    void addVelocity(const glm::vec2& dv) { linearVelocity += dv; }

  private:
    void  applyGrowth();
    void  integrateContour(float dt);
    float angleStep() const;

    BodyId                    bodyId;
    glm::vec2                 centerPos;
    glm::vec2                 linearVelocity;
    float                     radius{1.0f};
    float                     finalRadius;
    float                     ageTime;
    float                     growthTime;
    float                     bodyMass{1.0f};
    glm::vec3                 displayColor;
    TextureHandle             texture{0};
    SimulationConfig::Contour springs;
    std::vector<ContourNode>  nodes{};
  };

} // namespace jelly
