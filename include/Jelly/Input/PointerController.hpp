#pragma once

#include <glm/vec2.hpp>
#include <optional>

#include "Jelly/Physics/DeformableBody.hpp"
#include "Jelly/Scene/SimulationWorld.hpp"

namespace jelly {

  /**
   * @class PointerController
   * @brief Maps pointer gestures onto the world: drag-and-release flicks a
   * body and dents it in the drag direction, a spawn request adds a body.
   *
   * Window-system independent; the caller forwards positions in world units.
   */
  class PointerController
  {
  public:
    explicit PointerController(SimulationWorld& world) : world{world} {}

    // Starts a drag on the body under @p point. Returns false if there is none.
    bool press(const glm::vec2& point);
    void move(const glm::vec2& point);
    // Applies the flick. Returns false if no drag was active or its body is gone.
    bool release(const glm::vec2& point);

    BodyId spawn(const glm::vec2& point);

    bool                  isDragging() const { return dragged.has_value(); }
    std::optional<BodyId> draggedBody() const { return dragged; }
    glm::vec2             dragVector() const { return dragCurrent - dragStart; }

  private:
    SimulationWorld&      world;
    std::optional<BodyId> dragged{};
    glm::vec2             dragStart{0.0f};
    glm::vec2             dragCurrent{0.0f};
  };

} // namespace jelly
