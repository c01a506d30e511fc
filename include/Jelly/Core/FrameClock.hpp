#pragma once

#include <chrono>

#include "Jelly/Scene/SimulationConfig.hpp"

namespace jelly {

  /**
   * @class FrameClock
   * @brief Turns wall-clock time between frames into a bounded simulation timestep.
   *
   * One frame at 60 Hz maps to dt = 1 with the default time scale.
   */
  class FrameClock
  {
  public:
    explicit FrameClock(const SimulationConfig::Clock& settings);

    // Timestep for the frame that just ended; restarts the measurement.
    float tick();

    // Restart the measurement without producing a timestep (e.g. after a pause).
    void reset();

    float sanitize(float dt) const;

    const SimulationConfig::Clock& settings() const { return clockSettings; }

  private:
    using clock = std::chrono::steady_clock;

    SimulationConfig::Clock clockSettings;
    clock::time_point       lastTime;
  };

} // namespace jelly
