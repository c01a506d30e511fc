#include "Jelly/Physics/Easing.hpp"

#include <glm/common.hpp>

namespace jelly {

  float cubicBezierY(float t, float y1, float y2)
  {
    const float u = 1.0f - t;
    return 3.0f * u * u * t * y1 + 3.0f * u * t * t * y2 + t * t * t;
  }

  float jellyGrowthEase(float t)
  {
    return cubicBezierY(glm::clamp(t, 0.0f, 1.0f), kJellyEaseY1, kJellyEaseY2);
  }

} // namespace jelly
