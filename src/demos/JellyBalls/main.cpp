#include <cstddef>
#include <cstdlib>
#include <exception>
#include <iostream>

#include "Jelly/Core/ansi_colors.hpp"
#include "Jelly/Scene/ConfigSerializer.hpp"
#include "Jelly/Scene/SimulationConfig.hpp"
#include "app.hpp"

// usage: jelly_demo [config.json] [frames]
int main(int argc, char** argv)
{
  try
  {
    jelly::SimulationConfig config{};
    if (argc > 1)
    {
      jelly::ConfigSerializer serializer{config};
      if (!serializer.deserialize(argv[1]))
      {
        std::cerr << "[" << jelly::YELLOW << "Demo" << jelly::RESET << "] using default configuration" << std::endl;
      }
    }

    std::size_t frames = 600;
    if (argc > 2)
    {
      frames = jelly::App::parseFrameCount(argv[2]);
    }

    jelly::App app{config, frames};
    app.run();
  }
  catch (const std::exception& e)
  {
    std::cerr << "[" << jelly::RED << "Demo" << jelly::RESET << "] " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
