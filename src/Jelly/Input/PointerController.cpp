#include "Jelly/Input/PointerController.hpp"

#include <glm/geometric.hpp>
#include <glm/trigonometric.hpp>

namespace jelly {

  bool PointerController::press(const glm::vec2& point)
  {
    const DeformableBody* body = world.bodyAt(point);
    if (!body) return false;

    dragged     = body->id();
    dragStart   = point;
    dragCurrent = point;
    return true;
  }

  void PointerController::move(const glm::vec2& point)
  {
    if (dragged) dragCurrent = point;
  }

  bool PointerController::release(const glm::vec2& point)
  {
    if (!dragged) return false;

    dragCurrent          = point;
    DeformableBody* body = world.findBody(*dragged);
    dragged.reset();
    if (!body) return false; // evicted while held

    const auto&     input     = world.config().input;
    const glm::vec2 drag      = dragCurrent - dragStart;
    const float     magnitude = glm::length(drag);

    body->addVelocity(drag * input.mouseImpulseFactor);
    if (magnitude > 0.0f)
    {
      body->applyImpulseAt(glm::atan(drag.y, drag.x), magnitude * input.mouseImpulseFactor * input.dragDeformationScale);
    }
    return true;
  }

  BodyId PointerController::spawn(const glm::vec2& point)
  {
    return world.spawnInteractive(point);
  }

} // namespace jelly
