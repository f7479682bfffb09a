#pragma once

#include "rsvp/config/service_config.hpp"

#include <stdexcept>
#include <string>

namespace rsvp {

// -----------------------------------------------------------------------------
// ConfigError
// -----------------------------------------------------------------------------
// Responsibility: Raised when a configuration file cannot be read or does not
// describe a valid ServiceConfig. what() names the offending file or key.
// -----------------------------------------------------------------------------
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// -----------------------------------------------------------------------------
// parseConfig(text)
// -----------------------------------------------------------------------------
// @brief  Builds a ServiceConfig from a JSON document.
//
// @details
// The document must be a JSON object. Recognized keys overwrite the
// defaults; unknown keys are ignored with a warning on stderr so a typo does
// not go unnoticed. A key of the wrong JSON type, an unknown "clock" value
// or a negative amount raises ConfigError.
//
// @throws ConfigError
// -----------------------------------------------------------------------------
ServiceConfig parseConfig(const std::string& text);

// -----------------------------------------------------------------------------
// loadConfig(path)
// -----------------------------------------------------------------------------
// @brief  Reads `path` and hands its content to parseConfig().
//
// @throws ConfigError  file missing/unreadable, or parseConfig() failed (the
//                      message is prefixed with the path).
// -----------------------------------------------------------------------------
ServiceConfig loadConfig(const std::string& path);

}  // namespace rsvp
