#include "Jelly/Scene/ConfigSerializer.hpp"

#include <fstream>
#include <glm/glm.hpp>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

#include "Jelly/Core/Exceptions.hpp"
#include "Jelly/Core/ansi_colors.hpp"

// Helper for glm serialization
namespace glm {
  void to_json(nlohmann::json& j, const vec2& v)
  {
    j = nlohmann::json{v.x, v.y};
  }

  void from_json(const nlohmann::json& j, vec2& v)
  {
    v.x = j.at(0).get<float>();
    v.y = j.at(1).get<float>();
  }
} // namespace glm

namespace jelly {

  NLOHMANN_JSON_SERIALIZE_ENUM(BoundarySampling,
                               {
                                       {BoundarySampling::Nearest, "nearest"},
                                       {BoundarySampling::Linear, "linear"},
                               })

  namespace {
    nlohmann::json buildJson(const SimulationConfig& config)
    {
      nlohmann::json root;

      const auto& c   = config.contour;
      root["contour"] = {{"restStiffness", c.restStiffness},
                         {"neighborStiffness", c.neighborStiffness},
                         {"damping", c.damping},
                         {"maxDisplacementRatio", c.maxDisplacementRatio},
                         {"resolution", c.resolution},
                         {"sampling", c.sampling}};

      const auto& g  = config.growth;
      root["growth"] = {{"duration", g.duration}, {"initialRadiusRange", g.initialRadiusRange}, {"interactiveRadiusRange", g.interactiveRadiusRange}};

      const auto& p   = config.physics;
      root["physics"] = {{"gravityConstant", p.gravityConstant},
                         {"maxGravityForce", p.maxGravityForce},
                         {"centerDamping", p.centerDamping},
                         {"collisionDeformationFactor", p.collisionDeformationFactor},
                         {"restitution", p.restitution},
                         {"collisionVelocityScale", p.collisionVelocityScale},
                         {"initialSpeed", p.initialSpeed}};

      const auto& in = config.input;
      root["input"]  = {{"mouseImpulseFactor", in.mouseImpulseFactor},
                        {"dragDeformationScale", in.dragDeformationScale},
                        {"grabRadiusScale", in.grabRadiusScale}};

      const auto& w = config.world;
      root["world"] = {{"width", w.width}, {"height", w.height}, {"initialBodyCount", w.initialBodyCount}, {"maxBodies", w.maxBodies}};

      const auto& clk = config.clock;
      root["clock"]   = {{"timeScale", clk.timeScale}, {"defaultTimestep", clk.defaultTimestep}, {"maxTimestep", clk.maxTimestep}};

      return root;
    }

    // Counts must be plain non-negative integers. nlohmann would otherwise cast
    // -1 or 1e30 straight into a size_t.
    std::size_t readCount(const nlohmann::json& j, const char* section, const char* key, std::size_t fallback)
    {
      if (!j.contains(key)) return fallback;
      const auto& value = j.at(key);
      if (!value.is_number_unsigned())
      {
        throw InvalidConfigException(std::string{"invalid config value '"} + section + "." + key + "': must be a non-negative integer");
      }
      return value.get<std::size_t>();
    }

    BoundarySampling readSampling(const nlohmann::json& j, BoundarySampling fallback)
    {
      if (!j.contains("sampling")) return fallback;
      const auto& value = j.at("sampling");
      if (value.is_string())
      {
        const auto& name = value.get_ref<const std::string&>();
        if (name == "nearest") return BoundarySampling::Nearest;
        if (name == "linear") return BoundarySampling::Linear;
      }
      throw InvalidConfigException("invalid config value 'contour.sampling': must be \"nearest\" or \"linear\"");
    }

    // Overwrites only the keys present in @p root.
    void applyJson(const nlohmann::json& root, SimulationConfig& config)
    {
      if (root.contains("contour"))
      {
        auto& j                = root["contour"];
        auto& c                = config.contour;
        c.restStiffness        = j.value("restStiffness", c.restStiffness);
        c.neighborStiffness    = j.value("neighborStiffness", c.neighborStiffness);
        c.damping              = j.value("damping", c.damping);
        c.maxDisplacementRatio = j.value("maxDisplacementRatio", c.maxDisplacementRatio);
        c.resolution           = readCount(j, "contour", "resolution", c.resolution);
        c.sampling             = readSampling(j, c.sampling);
      }

      if (root.contains("growth"))
      {
        auto& j                  = root["growth"];
        auto& g                  = config.growth;
        g.duration               = j.value("duration", g.duration);
        g.initialRadiusRange     = j.value("initialRadiusRange", g.initialRadiusRange);
        g.interactiveRadiusRange = j.value("interactiveRadiusRange", g.interactiveRadiusRange);
      }

      if (root.contains("physics"))
      {
        auto& j                      = root["physics"];
        auto& p                      = config.physics;
        p.gravityConstant            = j.value("gravityConstant", p.gravityConstant);
        p.maxGravityForce            = j.value("maxGravityForce", p.maxGravityForce);
        p.centerDamping              = j.value("centerDamping", p.centerDamping);
        p.collisionDeformationFactor = j.value("collisionDeformationFactor", p.collisionDeformationFactor);
        p.restitution                = j.value("restitution", p.restitution);
        p.collisionVelocityScale     = j.value("collisionVelocityScale", p.collisionVelocityScale);
        p.initialSpeed               = j.value("initialSpeed", p.initialSpeed);
      }

      if (root.contains("input"))
      {
        auto& j                 = root["input"];
        auto& in                = config.input;
        in.mouseImpulseFactor   = j.value("mouseImpulseFactor", in.mouseImpulseFactor);
        in.dragDeformationScale = j.value("dragDeformationScale", in.dragDeformationScale);
        in.grabRadiusScale      = j.value("grabRadiusScale", in.grabRadiusScale);
      }

      if (root.contains("world"))
      {
        auto& j            = root["world"];
        auto& w            = config.world;
        w.width            = j.value("width", w.width);
        w.height           = j.value("height", w.height);
        w.initialBodyCount = readCount(j, "world", "initialBodyCount", w.initialBodyCount);
        w.maxBodies        = readCount(j, "world", "maxBodies", w.maxBodies);
      }

      if (root.contains("clock"))
      {
        auto& j             = root["clock"];
        auto& clk           = config.clock;
        clk.timeScale       = j.value("timeScale", clk.timeScale);
        clk.defaultTimestep = j.value("defaultTimestep", clk.defaultTimestep);
        clk.maxTimestep     = j.value("maxTimestep", clk.maxTimestep);
      }
    }
  } // namespace

  ConfigSerializer::ConfigSerializer(SimulationConfig& config) : config(config) {}

  std::string ConfigSerializer::toJson() const
  {
    return buildJson(config).dump(4);
  }

  void ConfigSerializer::serialize(const std::string& filepath) const
  {
    std::ofstream out(filepath);
    if (!out.is_open())
    {
      throw ConfigFileException("failed to open config file for writing: " + filepath);
    }
    out << toJson();
  }

  bool ConfigSerializer::fromJson(const std::string& text)
  {
    SimulationConfig candidate = config;
    try
    {
      applyJson(nlohmann::json::parse(text), candidate);
    }
    catch (const nlohmann::json::exception& e)
    {
      std::cerr << "[" << RED << "ConfigSerializer" << RESET << "] Failed to parse config: " << e.what() << std::endl;
      return false;
    }

    candidate.validate();
    config = candidate;
    return true;
  }

  bool ConfigSerializer::deserialize(const std::string& filepath)
  {
    std::ifstream in(filepath);
    if (!in.is_open())
    {
      std::cerr << "[" << RED << "ConfigSerializer" << RESET << "] Failed to open config file: " << filepath << std::endl;
      return false;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    if (!fromJson(buffer.str())) return false;

    std::cout << "[" << GREEN << "ConfigSerializer" << RESET << "] Loaded " << filepath << std::endl;
    return true;
  }

} // namespace jelly
