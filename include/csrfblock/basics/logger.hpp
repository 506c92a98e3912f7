#ifndef CSRFBLOCK_BASICS_LOGGER_HPP
#define CSRFBLOCK_BASICS_LOGGER_HPP

#include <string_view>

namespace csrfblock::basics
{
  /**
   * @brief Logging sink, provided to a pipeline through Services.
   *
   * Nothing is logged when no ILogger has been provided. Messages never
   * carry session identifiers or token values.
   */
  struct ILogger
  {
    virtual ~ILogger() = default;
    virtual void info(std::string_view msg) = 0;
    virtual void warn(std::string_view msg) = 0;
    virtual void error(std::string_view msg) = 0;
  };

} // namespace csrfblock::basics

#endif // CSRFBLOCK_BASICS_LOGGER_HPP
