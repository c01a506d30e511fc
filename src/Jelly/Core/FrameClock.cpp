#include "Jelly/Core/FrameClock.hpp"

#include <cmath>

namespace jelly {

  FrameClock::FrameClock(const SimulationConfig::Clock& settings) : clockSettings{settings}, lastTime{clock::now()} {}

  float FrameClock::tick()
  {
    const auto  newTime   = clock::now();
    const float frameTime = std::chrono::duration<float>(newTime - lastTime).count();
    lastTime              = newTime;
    return sanitize(frameTime * clockSettings.timeScale);
  }

  void FrameClock::reset()
  {
    lastTime = clock::now();
  }

  float FrameClock::sanitize(float dt) const
  {
    if (!std::isfinite(dt) || dt <= 0.0f) return clockSettings.defaultTimestep;
    if (dt > clockSettings.maxTimestep) return clockSettings.maxTimestep;
    return dt;
  }

} // namespace jelly
