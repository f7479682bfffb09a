#pragma once

#include "rsvp/concurrent/thread_safe_queue.hpp"
#include "rsvp/events/notification.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace rsvp {

// -----------------------------------------------------------------------------
// IpcServer — dual-socket ZeroMQ gateway for commands and telemetry
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that accepts JSON command requests on a
//         REP socket and broadcasts ledger notifications as JSON on a PUB
//         socket.
//
// @details
// The ledger core has no dependency on this class. Two ZeroMQ sockets share
// one worker thread:
//
//   1. REP socket (cmd_endpoint):
//      Each request is handed to the CommandHandler (bound to
//      LedgerService::executeCommand()) and its return value is sent back
//      verbatim. ZMQ_RCVTIMEO keeps recv() from blocking forever, so the
//      thread alternates between command polling and telemetry draining.
//
//   2. PUB socket (pub_endpoint):
//      Notifications arrive through pushTelemetry() from whichever thread
//      committed the ledger operation, are buffered in a ThreadSafeQueue,
//      and are serialized and sent from the worker thread. JSON encoding
//      and socket I/O therefore never run under the SettlementEngine lock.
//
// Wire format of telemetry messages (one JSON object per message):
//   {"type":"event_created","event_id":1,"owner":"alice","name":"...",
//    "capacity":10,"price":2,"start_time":1000,"duration":2000,
//    "timestamp_s":..,"sequence_id":..}
//   {"type":"reserved","event_id":1,"participant":"bob","amount":2,...}
//   {"type":"checked_in","event_id":1,"participant":"bob",...}
//   {"type":"withdrawn","event_id":1,"amount":4,...}
//
// Thread model:
//   Constructed, started and stopped on the main thread (via
//   LedgerService). The CommandHandler runs on the IPC thread.
//
// Ownership:
//   Owned by LedgerService via std::unique_ptr. Owns the ZMQ context, both
//   sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @brief  Stores parameters; no sockets are opened and no thread is
  //         spawned until start().
  //
  // @param  telemetry_capacity  Bound on buffered notifications (oldest
  //                             dropped first); 0 means unbounded.
  // -------------------------------------------------------------------------
  IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
            std::string pub_endpoint, std::size_t telemetry_capacity = 4096);

  // RAII: stops the thread if still running.
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @brief  Binds both sockets and spawns the worker thread. No-op if
  //         already running.
  //
  // @throws zmq::error_t if an endpoint cannot be bound; nothing is left
  //         running in that case.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // @brief  Signals the worker thread, joins it after it has flushed the
  //         remaining telemetry, and closes the sockets. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  bool isRunning() const { return running_.load(); }

  // Thread-safe enqueue; callable from any thread.
  void pushTelemetry(Notification notification);

  // Notifications discarded because the telemetry queue was full.
  std::size_t droppedTelemetry() const { return telemetry_queue_.dropped(); }

  // -------------------------------------------------------------------------
  // formatTelemetry(notification)
  // -------------------------------------------------------------------------
  // @brief  Serializes one notification to the wire format above.
  //
  // @details
  // Static; usable without a running server.
  // -------------------------------------------------------------------------
  static std::string formatTelemetry(const Notification& notification);

 private:
  static constexpr int kRecvTimeoutMs = 50;

  // Binds both endpoints; on failure closes whatever was opened and rethrows.
  void openSockets();

  void closeSockets();

  // Worker thread body: alternate publishPending() / serveOneRequest()
  // until stop(), then publish what is left.
  void serveLoop();

  void publishPending();

  // Waits up to kRecvTimeoutMs for one request and answers it.
  void serveOneRequest();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Notification> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace rsvp
