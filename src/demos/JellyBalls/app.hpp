#pragma once

#include <cstddef>
#include <glm/vec2.hpp>
#include <string>

#include "Jelly/Core/FrameClock.hpp"
#include "Jelly/Input/PointerController.hpp"
#include "Jelly/Scene/SimulationConfig.hpp"
#include "Jelly/Scene/SimulationWorld.hpp"

namespace jelly {

  /**
   * @class App
   * @brief Headless driver: runs the frame loop for a fixed number of frames
   * with a scripted pointer, logging world statistics as it goes.
   */
  class App
  {
  public:
    App(const SimulationConfig& config, std::size_t frameCount);

    // delete copy operations
    App(const App&)            = delete;
    App& operator=(const App&) = delete;

    void run();

    // Parses a frame count argument; throws RuntimeException unless it is a whole number >= 1.
    static std::size_t parseFrameCount(const std::string& text);

  private:
    void scriptedInput(std::size_t frame);
    void logStats(std::size_t frame) const;

    SimulationWorld   world;
    PointerController pointer{world};
    FrameClock        frameClock;
    std::size_t       frames;
    glm::vec2         grabPoint{0.0f};
  };

} // namespace jelly
