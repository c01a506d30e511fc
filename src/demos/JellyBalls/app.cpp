#include "app.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "Jelly/Core/Exceptions.hpp"
#include "Jelly/Core/ansi_colors.hpp"

namespace jelly {

  namespace {
    constexpr std::size_t kStatsInterval = 60;
    constexpr std::size_t kGrabFrame     = 120;
    constexpr std::size_t kReleaseFrame  = 135;
    constexpr std::size_t kSpawnFrame    = 240;
    constexpr auto        kFramePeriod   = std::chrono::microseconds{16667};
  } // namespace

  App::App(const SimulationConfig& config, std::size_t frameCount) : world{config}, frameClock{config.clock}, frames{frameCount} {}

  std::size_t App::parseFrameCount(const std::string& text)
  {
    long long   value    = 0;
    std::size_t consumed = 0;
    try
    {
      value = std::stoll(text, &consumed);
    }
    catch (const std::logic_error&)
    {
      consumed = 0;
    }

    if (consumed == 0 || consumed != text.size() || value < 1)
    {
      throw RuntimeException("frame count must be a positive integer, got '" + text + "'");
    }
    return static_cast<std::size_t>(value);
  }

  void App::run()
  {
    world.spawnInitialBodies();
    frameClock.reset();

    auto nextFrame = std::chrono::steady_clock::now();
    for (std::size_t frame = 1; frame <= frames; ++frame)
    {
      nextFrame += kFramePeriod;
      std::this_thread::sleep_until(nextFrame);

      scriptedInput(frame);
      world.step(frameClock.tick());

      if (frame % kStatsInterval == 0) logStats(frame);
    }

    std::cout << "[" << GREEN << "Demo" << RESET << "] finished " << frames << " frames with " << world.bodyCount() << " bodies" << std::endl;
  }

  void App::scriptedInput(std::size_t frame)
  {
    if (world.bodies().empty()) return;

    if (frame == kGrabFrame)
    {
      grabPoint = world.bodies().front().center();
      if (pointer.press(grabPoint))
      {
        std::cout << "[" << BLUE << "Demo" << RESET << "] grabbed body " << *pointer.draggedBody() << std::endl;
      }
    }
    else if (frame > kGrabFrame && frame < kReleaseFrame && pointer.isDragging())
    {
      // pull towards the lower left a little more every frame
      pointer.move(grabPoint + static_cast<float>(frame - kGrabFrame) * glm::vec2{-4.0f, 3.0f});
    }
    else if (frame == kReleaseFrame && pointer.isDragging())
    {
      const glm::vec2 flick = pointer.dragVector();
      if (pointer.release(grabPoint + flick))
      {
        std::cout << "[" << BLUE << "Demo" << RESET << "] released drag (" << flick.x << ", " << flick.y << ")" << std::endl;
      }
    }
    else if (frame == kSpawnFrame)
    {
      const BodyId id = pointer.spawn({0.5f * world.width(), 0.5f * world.height()});
      std::cout << "[" << BLUE << "Demo" << RESET << "] spawned body " << id << std::endl;
    }
  }

  void App::logStats(std::size_t frame) const
  {
    std::cout << "[" << GREEN << "Demo" << RESET << "] frame " << std::setw(5) << frame << "  bodies " << world.bodyCount() << "  contacts "
              << world.lastContactCount() << "  kinetic energy " << std::fixed << std::setprecision(2) << world.kineticEnergy() << std::endl;
  }

} // namespace jelly
