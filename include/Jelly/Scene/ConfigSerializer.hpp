#pragma once

#include <string>

#include "Jelly/Scene/SimulationConfig.hpp"

namespace jelly {

  /**
   * @class ConfigSerializer
   * @brief Reads and writes a SimulationConfig as JSON.
   *
   * Every key is optional; missing keys keep the current value. A file that
   * cannot be read or parsed leaves the config untouched and returns false.
   * A file that parses but holds out-of-range values throws
   * InvalidConfigException.
   */
  class ConfigSerializer
  {
  public:
    explicit ConfigSerializer(SimulationConfig& config);

    void serialize(const std::string& filepath) const;
    bool deserialize(const std::string& filepath);

    std::string toJson() const;
    bool        fromJson(const std::string& text);

  private:
    SimulationConfig& config;
  };

} // namespace jelly
