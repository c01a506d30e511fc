#pragma once

namespace jelly {

  // Control-point y values of the growth curve; y2 > 1 makes the radius overshoot and settle.
  inline constexpr float kJellyEaseY1 = -0.26f;
  inline constexpr float kJellyEaseY2 = 1.61f;

  /**
   * @brief y component of a cubic Bezier from (0,0) to (1,1) with control
   * y values @p y1 and @p y2, evaluated directly at parameter @p t.
   *
   * y(0) == 0 and y(1) == 1 for any control points.
   */
  float cubicBezierY(float t, float y1, float y2);

  // Growth easing: t is clamped to [0, 1] before evaluation.
  float jellyGrowthEase(float t);

} // namespace jelly
