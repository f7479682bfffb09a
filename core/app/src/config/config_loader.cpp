#include "rsvp/config/config_loader.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>

namespace rsvp {

namespace {

// Reads a non-negative integer field; nlohmann stores JSON integers >= 0 as
// number_unsigned, so a negative or fractional value fails this check.
std::uint64_t requireUnsigned(const nlohmann::json& value,
                              const std::string& key) {
  if (!value.is_number_unsigned()) {
    throw ConfigError("'" + key + "' must be a non-negative integer");
  }
  return value.get<std::uint64_t>();
}

std::string requireString(const nlohmann::json& value,
                          const std::string& key) {
  if (!value.is_string()) {
    throw ConfigError("'" + key + "' must be a string");
  }
  return value.get<std::string>();
}

ClockMode parseClockMode(const std::string& text) {
  if (text == "live") {
    return ClockMode::Live;
  }
  if (text == "simulation") {
    return ClockMode::Simulation;
  }
  throw ConfigError("'clock' must be \"live\" or \"simulation\", got \"" +
                    text + "\"");
}

}  // namespace

// -----------------------------------------------------------------------------
// clockModeToString()
// -----------------------------------------------------------------------------
const char* clockModeToString(ClockMode mode) {
  switch (mode) {
    case ClockMode::Live:       return "live";
    case ClockMode::Simulation: return "simulation";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// parseConfig(): JSON object -> ServiceConfig
// -----------------------------------------------------------------------------
ServiceConfig parseConfig(const std::string& text) {
  nlohmann::json root;
  try {
    root = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError(std::string("invalid JSON: ") + e.what());
  }

  if (!root.is_object()) {
    throw ConfigError("configuration must be a JSON object");
  }

  ServiceConfig config;

  for (const auto& [key, value] : root.items()) {
    if (key == "cmd_endpoint") {
      config.cmd_endpoint = requireString(value, key);
    } else if (key == "pub_endpoint") {
      config.pub_endpoint = requireString(value, key);
    } else if (key == "clock") {
      config.clock = parseClockMode(requireString(value, key));
    } else if (key == "initial_time_s") {
      config.initial_time_s = requireUnsigned(value, key);
    } else if (key == "telemetry_queue_capacity") {
      config.telemetry_queue_capacity =
          static_cast<std::size_t>(requireUnsigned(value, key));
    } else if (key == "opening_balances") {
      if (!value.is_object()) {
        throw ConfigError("'opening_balances' must be an object");
      }
      for (const auto& [account, amount] : value.items()) {
        if (account.empty()) {
          throw ConfigError("'opening_balances' has an empty account name");
        }
        config.opening_balances[account] =
            requireUnsigned(amount, "opening_balances." + account);
      }
    } else {
      std::cerr << "[ConfigLoader] WARNING: ignoring unknown key '" << key
                << "'\n";
    }
  }

  return config;
}

// -----------------------------------------------------------------------------
// loadConfig(): file -> parseConfig()
// -----------------------------------------------------------------------------
ServiceConfig loadConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file '" + path + "'");
  }

  std::stringstream buffer;
  buffer << in.rdbuf();

  try {
    ServiceConfig config = parseConfig(buffer.str());
    std::cout << "[ConfigLoader] loaded " << path << " (clock="
              << clockModeToString(config.clock) << ")\n";
    return config;
  } catch (const ConfigError& e) {
    throw ConfigError(path + ": " + e.what());
  }
}

}  // namespace rsvp
