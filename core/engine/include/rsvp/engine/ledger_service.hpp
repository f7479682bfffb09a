#pragma once

#include "rsvp/config/service_config.hpp"
#include "rsvp/custody/in_memory_custodian.hpp"
#include "rsvp/eventbus/notification_bus.hpp"
#include "rsvp/network/ipc_server.hpp"
#include "rsvp/settlement/settlement_engine.hpp"
#include "rsvp/time/i_time_provider.hpp"
#include "rsvp/time/simulation_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace rsvp {

// -----------------------------------------------------------------------------
// LedgerService — top-level owner and orchestrator
// -----------------------------------------------------------------------------
//
// @brief  Wires a clock, a custodian and a notification bus around one
//         SettlementEngine, and exposes the engine over a JSON command
//         channel (IpcServer) when endpoints are configured.
//
// @details
// Construction order (members are declared in this order):
//   1. ServiceConfig (copied).
//   2. ITimeProvider: LiveTimeProvider or SimulationTimeProvider, chosen by
//      config.clock.
//   3. InMemoryCustodian, credited with config.opening_balances.
//   4. NotificationBus.
//   5. SettlementEngine, borrowing 2-4.
//   The engine is usable immediately; start() only brings up the IPC layer.
//
// start():
//   Creates the IpcServer (if both endpoints are non-empty), bridges every
//   notification from the bus into its telemetry queue, and starts it.
//   Idempotent.
//
// stop():
//   Removes the telemetry bridge and destroys the IpcServer (joining its
//   thread). Idempotent; the destructor calls it.
//
// Command protocol (executeCommand):
//   Request: a JSON object {"command": "<NAME>", ...arguments}. A request
//   that is not JSON is treated as a bare command name with no arguments,
//   so `PING` and `STATUS` work from a shell one-liner.
//
//   Commands and their arguments:
//     PING
//     STATUS
//     CREATE_EVENT        caller, name, capacity, price, start_time, duration
//     GET_EVENT_METADATA  event_id
//     GET_EVENT           event_id
//     RESERVE             caller, event_id, amount
//     CHECK_IN            caller, event_id
//     SWEEP               caller, event_id
//     RESERVATION         event_id, participant
//     BALANCE             account
//     DEPOSIT             account, amount
//     ADVANCE_TIME        now                    (simulation clock only)
//
//   Success: {"status":"ok", ...result fields}
//   Failure: {"status":"error","code":"<Code>","category":"<category>",
//             "response":"<message>"}
//   where code is an ErrorCode name, or one of CustodyFailed, BadRequest,
//   UnknownCommand, ClockNotSimulated, InvalidTime.
//
//   executeCommand() never throws; every failure becomes an error response
//   and refused ledger operations are logged once on stderr.
//
// Thread model:
//   executeCommand() may run on the IPC thread while the main thread uses
//   engine() directly; SettlementEngine serializes both.
// -----------------------------------------------------------------------------
class LedgerService {
 public:
  explicit LedgerService(ServiceConfig config = {});

  ~LedgerService();

  LedgerService(const LedgerService&) = delete;
  LedgerService& operator=(const LedgerService&) = delete;
  LedgerService(LedgerService&&) = delete;
  LedgerService& operator=(LedgerService&&) = delete;

  void start();

  void stop();

  bool isRunning() const { return running_; }

  std::string executeCommand(const std::string& cmd);

  // -------------------------------------------------------------------------
  // Shutdown signalling
  // -------------------------------------------------------------------------
  // requestShutdown() only performs an atomic store, so it is safe to call
  // from a signal handler. waitForShutdown() polls the flag and returns once
  // it is set.
  // -------------------------------------------------------------------------
  void requestShutdown() { shutdown_requested_.store(true); }

  void waitForShutdown(
      std::chrono::milliseconds poll = std::chrono::milliseconds(100)) const;

  SettlementEngine& engine() { return engine_; }
  NotificationBus& notificationBus() { return bus_; }
  InMemoryCustodian& custodian() { return custodian_; }
  const ITimeProvider& clock() const { return *clock_; }

  // The simulation clock, or nullptr when running on the live clock.
  SimulationTimeProvider* simulationClock() { return sim_clock_; }

  const ServiceConfig& config() const { return config_; }

 private:
  nlohmann::json dispatch(const std::string& command,
                          const nlohmann::json& args);

  nlohmann::json status() const;

  ServiceConfig config_;

  std::unique_ptr<ITimeProvider> clock_;
  SimulationTimeProvider* sim_clock_{nullptr};

  InMemoryCustodian custodian_;
  NotificationBus bus_;
  SettlementEngine engine_;

  std::unique_ptr<IpcServer> ipc_server_;
  NotificationBus::SubscriptionId telemetry_sub_id_{0};

  bool running_{false};
  std::atomic<bool> shutdown_requested_{false};
};

}  // namespace rsvp
