#pragma once

#include "rsvp/domain/types.hpp"

#include <cstddef>
#include <map>
#include <string>

namespace rsvp {

// -----------------------------------------------------------------------------
// ClockMode
// -----------------------------------------------------------------------------
// Responsibility: Selects the ITimeProvider the service wires into the
// engine. Live reads the system clock; Simulation starts at
// ServiceConfig::initial_time_s and only moves on ADVANCE_TIME commands.
// -----------------------------------------------------------------------------
enum class ClockMode {
  Live,
  Simulation,
};

// -----------------------------------------------------------------------------
// ServiceConfig — startup parameters of the ledger service
// -----------------------------------------------------------------------------
//
// @brief  Plain data struct with in-class defaults. Loaded from JSON by
//         loadConfig()/parseConfig(); any key absent from the file keeps the
//         default below.
//
// @details
// Example file:
//
//   {
//     "cmd_endpoint": "tcp://127.0.0.1:5556",
//     "pub_endpoint": "tcp://127.0.0.1:5557",
//     "clock": "simulation",
//     "initial_time_s": 1000,
//     "telemetry_queue_capacity": 4096,
//     "opening_balances": { "alice": 100, "bob": 100 }
//   }
//
// An empty cmd_endpoint or pub_endpoint disables the IpcServer entirely;
// unit tests construct the service that way and call executeCommand()
// directly.
//
// Thread model:
//   Value type, copied into LedgerService at construction.
// -----------------------------------------------------------------------------
struct ServiceConfig {
  std::string cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string pub_endpoint{"tcp://127.0.0.1:5557"};

  ClockMode clock{ClockMode::Live};

  // Starting time of the simulation clock. Ignored in Live mode.
  domain::Seconds initial_time_s{0};

  // Bound on buffered telemetry awaiting publication; 0 means unbounded.
  std::size_t telemetry_queue_capacity{4096};

  // Accounts credited in the InMemoryCustodian at startup.
  std::map<domain::ParticipantId, domain::Amount> opening_balances;
};

// "live" / "simulation"
const char* clockModeToString(ClockMode mode);

}  // namespace rsvp
