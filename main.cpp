// -----------------------------------------------------------------------------
// rsvp_escrow — single executable entry point.
//
//   1) Load the ServiceConfig from the JSON file named by argv[1], or use
//      the built-in defaults when no path is given.
//   2) Create the LedgerService and subscribe logging callbacks to its
//      NotificationBus so every committed ledger operation is visible.
//   3) Start the service: the IpcServer binds its REP (commands) and PUB
//      (telemetry) sockets and runs on its own thread.
//   4) Block the main thread until Ctrl-C, then shut down cleanly.
//
// Thread layout:
//   main thread   → waits for shutdown
//   ipc thread    → IpcServer (commands execute here, notifications are
//                   published from here)
//
// Example session, from another terminal with any ZeroMQ REQ client:
//   {"command":"CREATE_EVENT","caller":"alice","name":"yakult event",
//    "capacity":1,"price":1,"start_time":1000,"duration":2000}
//   {"command":"RESERVE","caller":"bob","event_id":1,"amount":2}
// -----------------------------------------------------------------------------

#include "rsvp/config/config_loader.hpp"
#include "rsvp/engine/ledger_service.hpp"
#include "rsvp/events/notification_types.hpp"

#include <zmq.hpp>

#include <csignal>
#include <iostream>

// -----------------------------------------------------------------------------
// Global pointer for signal handler access. Set once before the handler is
// installed and cleared after the service has stopped.
// -----------------------------------------------------------------------------
static rsvp::LedgerService* g_service_ptr = nullptr;

// -----------------------------------------------------------------------------
// sigint_handler
// -----------------------------------------------------------------------------
// @brief  POSIX signal handler for SIGINT / SIGTERM.
//
// @details
// requestShutdown() is a single atomic store. waitForShutdown() on the main
// thread notices it within one poll interval.
// -----------------------------------------------------------------------------
static void sigint_handler(int /*signum*/) {
  if (g_service_ptr != nullptr) {
    g_service_ptr->requestShutdown();
  }
}

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration
  // -------------------------------------------------------------------------
  rsvp::ServiceConfig config;
  if (argc > 1) {
    try {
      config = rsvp::loadConfig(argv[1]);
    } catch (const rsvp::ConfigError& e) {
      std::cerr << "[main] configuration error: " << e.what() << "\n";
      return 1;
    }
  }

  // -------------------------------------------------------------------------
  // 2) Service and logging callbacks
  // These callbacks run on whichever thread committed the operation.
  // -------------------------------------------------------------------------
  rsvp::LedgerService service(config);

  service.notificationBus().subscribe<rsvp::EventCreatedNotification>(
      [](const rsvp::EventCreatedNotification& n) {
        std::cout << "[Ledger] EventCreated: id=" << n.record.id
                  << " owner=" << n.record.owner << " name=\""
                  << n.record.name << "\" capacity=" << n.record.capacity
                  << " price=" << n.record.price
                  << " start=" << n.record.start_time
                  << " duration=" << n.record.duration << "\n";
      });

  service.notificationBus().subscribe<rsvp::ReservedNotification>(
      [](const rsvp::ReservedNotification& n) {
        std::cout << "[Ledger] Reserved: event=" << n.event_id
                  << " participant=" << n.participant
                  << " amount=" << n.amount << "\n";
      });

  service.notificationBus().subscribe<rsvp::CheckedInNotification>(
      [](const rsvp::CheckedInNotification& n) {
        std::cout << "[Ledger] CheckedIn: event=" << n.event_id
                  << " participant=" << n.participant << "\n";
      });

  service.notificationBus().subscribe<rsvp::WithdrawnNotification>(
      [](const rsvp::WithdrawnNotification& n) {
        std::cout << "[Ledger] Withdrawn: event=" << n.event_id
                  << " amount=" << n.amount << "\n";
      });

  // -------------------------------------------------------------------------
  // 3) Start
  // -------------------------------------------------------------------------
  try {
    service.start();
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] failed to start IPC: " << e.what() << "\n";
    return 1;
  }

  g_service_ptr = &service;
  std::signal(SIGINT, sigint_handler);
  std::signal(SIGTERM, sigint_handler);

  std::cout << "[main] commands on " << config.cmd_endpoint
            << ", notifications on " << config.pub_endpoint << "\n"
            << "[main] Press Ctrl-C to shut down.\n";

  // -------------------------------------------------------------------------
  // 4) Wait, then stop (joins the IPC thread)
  // -------------------------------------------------------------------------
  service.waitForShutdown();

  std::cout << "\n[main] Shutdown requested. Stopping service...\n";
  service.stop();

  g_service_ptr = nullptr;

  return 0;
}
