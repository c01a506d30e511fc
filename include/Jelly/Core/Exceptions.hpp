#pragma once
#include <exception>
#include <stdexcept>
#include <string>
namespace jelly {

  /**
   * @class RuntimeException
   * @brief Generic runtime error used across the simulation instead of
   * std::runtime_error
   */
  class RuntimeException : public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  // A configuration value is outside its allowed domain
  class InvalidConfigException : public RuntimeException
  {
  public:
    using RuntimeException::RuntimeException;
  };

  class ConfigFileException : public RuntimeException
  {
  public:
    using RuntimeException::RuntimeException;
  };

} // namespace jelly
