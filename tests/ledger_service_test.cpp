// =============================================================================
// ledger_service_test.cpp
// =============================================================================
// Unit tests for rsvp::LedgerService and the JSON command surface.
//
// Validates:
//   - Lifecycle: idempotent start() / stop(), RAII destructor
//   - Opening balances are credited at construction
//   - Every command on the happy path, driven through executeCommand()
//   - Ledger refusals map to {"status":"error","code":...,"category":...}
//   - Malformed requests never throw out of executeCommand()
//   - ADVANCE_TIME only on the simulation clock, forward only
//   - A payout whose recipient fails reports RecipientFailed and stands
//   - stop() waits for a command the IPC thread is still publishing
//   - IpcServer::formatTelemetry() wire format
//
// Design: Endpoints are left empty so no sockets are opened; commands are
// passed straight to executeCommand(). Only LedgerServiceIpcTest binds
// sockets, on ipc:// paths under the test temp dir.
// =============================================================================

#include "rsvp/engine/ledger_service.hpp"
#include "rsvp/events/notification_types.hpp"
#include "rsvp/network/ipc_server.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

using nlohmann::json;

// =============================================================================
// Test fixture: simulation clock at t=0, no IPC, bob and carol funded.
// =============================================================================
class LedgerServiceTest : public ::testing::Test {
 protected:
  static rsvp::ServiceConfig makeConfig() {
    rsvp::ServiceConfig config;
    config.cmd_endpoint.clear();
    config.pub_endpoint.clear();
    config.clock = rsvp::ClockMode::Simulation;
    config.initial_time_s = 0;
    config.opening_balances = {{"bob", 50}, {"carol", 50}};
    return config;
  }

  json run(const json& request) {
    return json::parse(service.executeCommand(request.dump()));
  }

  rsvp::domain::EventId createYakult(std::uint32_t capacity = 2) {
    json reply = run({{"command", "CREATE_EVENT"},
                      {"caller", "alice"},
                      {"name", "yakult event"},
                      {"capacity", capacity},
                      {"price", 2},
                      {"start_time", 1000},
                      {"duration", 2000}});
    EXPECT_EQ(reply["status"], "ok") << reply.dump();
    return reply.value("event_id", rsvp::domain::EventId{0});
  }

  rsvp::LedgerService service{makeConfig()};
};

// -----------------------------------------------------------------------------
// 1. start() and stop() are idempotent; without endpoints there is no IPC.
// -----------------------------------------------------------------------------
TEST_F(LedgerServiceTest, IdempotentLifecycle) {
  EXPECT_FALSE(service.isRunning());

  service.start();
  service.start();
  EXPECT_TRUE(service.isRunning());
  EXPECT_EQ(run({{"command", "STATUS"}})["ipc"], false);

  service.stop();
  service.stop();
  EXPECT_FALSE(service.isRunning());
}

// -----------------------------------------------------------------------------
// 2. The destructor stops a running service.
// -----------------------------------------------------------------------------
TEST(LedgerServiceLifecycleTest, DestructorStops) {
  rsvp::ServiceConfig config;
  config.cmd_endpoint.clear();
  config.pub_endpoint.clear();
  {
    rsvp::LedgerService service(config);
    service.start();
    EXPECT_TRUE(service.isRunning());
  }
  SUCCEED();
}

// -----------------------------------------------------------------------------
// 3. Opening balances land in the custodian.
// -----------------------------------------------------------------------------
TEST_F(LedgerServiceTest, OpeningBalancesAreCredited) {
  EXPECT_EQ(service.custodian().balanceOf("bob"), 50u);
  EXPECT_EQ(service.custodian().balanceOf("carol"), 50u);

  json reply = run({{"command", "BALANCE"}, {"account", "bob"}});
  EXPECT_EQ(reply["status"], "ok");
  EXPECT_EQ(reply["balance"], 50);
}

// -----------------------------------------------------------------------------
// 4. PING works both as JSON and as a bare word.
// -----------------------------------------------------------------------------
TEST_F(LedgerServiceTest, PingBareAndJson) {
  json bare = json::parse(service.executeCommand("PING"));
  EXPECT_EQ(bare["status"], "ok");
  EXPECT_EQ(bare["response"], "PONG");

  json wrapped = run({{"command", "PING"}});
  EXPECT_EQ(wrapped["response"], "PONG");

  json padded = json::parse(service.executeCommand("  STATUS\n"));
  EXPECT_EQ(padded["status"], "ok");
  EXPECT_EQ(padded["clock"], "simulation");
}

// -----------------------------------------------------------------------------
// 5. Full lifecycle over the command surface: create, reserve, check in,
//    advance past the end, sweep.
// -----------------------------------------------------------------------------
TEST_F(LedgerServiceTest, FullLifecycleOverCommands) {
  auto id = createYakult();
  EXPECT_EQ(id, 1u);

  json meta = run({{"command", "GET_EVENT_METADATA"}, {"event_id", id}});
  EXPECT_EQ(meta["name"], "yakult event");
  EXPECT_EQ(meta["owner"], "alice");

  EXPECT_EQ(run({{"command", "RESERVE"},
                 {"caller", "bob"},
                 {"event_id", id},
                 {"amount", 2}})["status"],
            "ok");
  EXPECT_EQ(run({{"command", "RESERVE"},
                 {"caller", "carol"},
                 {"event_id", id},
                 {"amount", 3}})["status"],
            "ok");

  json event = run({{"command", "GET_EVENT"}, {"event_id", id}})["event"];
  EXPECT_EQ(event["escrowed_balance"], 5);
  EXPECT_EQ(event["staked_count"], 2);

  EXPECT_EQ(run({{"command", "ADVANCE_TIME"}, {"now", 1500}})["now"], 1500);
  EXPECT_EQ(run({{"command", "CHECK_IN"},
                 {"caller", "bob"},
                 {"event_id", id}})["status"],
            "ok");

  json res = run({{"command", "RESERVATION"},
                  {"event_id", id},
                  {"participant", "bob"}})["reservation"];
  EXPECT_EQ(res["status"], "settled");
  EXPECT_EQ(res["stake"], 2);

  run({{"command", "ADVANCE_TIME"}, {"now", 3000}});
  json sweep = run({{"command", "SWEEP"}, {"caller", "alice"}, {"event_id", id}});
  EXPECT_EQ(sweep["status"], "ok");
  EXPECT_EQ(sweep["amount"], 3);

  json carol = run({{"command", "RESERVATION"},
                    {"event_id", id},
                    {"participant", "carol"}})["reservation"];
  EXPECT_EQ(carol["status"], "staked");
  EXPECT_EQ(carol["forfeited"], true);

  json status = run({{"command", "STATUS"}});
  EXPECT_EQ(status["events"], 1);
  EXPECT_EQ(status["total_escrowed"], 0);
  EXPECT_EQ(status["custody_balance"], 0);
  EXPECT_EQ(run({{"command", "BALANCE"}, {"account", "alice"}})["balance"], 3);
}

// -----------------------------------------------------------------------------
// 6. Ledger refusals carry the error code and category.
// -----------------------------------------------------------------------------
TEST_F(LedgerServiceTest, LedgerErrorsMapToResponses) {
  auto id = createYakult(1);
  run({{"command", "RESERVE"}, {"caller", "bob"}, {"event_id", id},
       {"amount", 2}});

  json overbooked = run({{"command", "RESERVE"},
                         {"caller", "carol"},
                         {"event_id", id},
                         {"amount", 2}});
  EXPECT_EQ(overbooked["status"], "error");
  EXPECT_EQ(overbooked["code"], "Overbooked");
  EXPECT_EQ(overbooked["category"], "state_conflict");

  json missing = run({{"command", "CHECK_IN"},
                      {"caller", "bob"},
                      {"event_id", 99}});
  EXPECT_EQ(missing["code"], "EventNotFound");
  EXPECT_EQ(missing["category"], "not_found");

  json early = run({{"command", "CHECK_IN"},
                    {"caller", "bob"},
                    {"event_id", id}});
  EXPECT_EQ(early["code"], "EventNotInProgress");
  EXPECT_EQ(early["category"], "time_window");

  json thief = run({{"command", "SWEEP"}, {"caller", "bob"}, {"event_id", id}});
  EXPECT_EQ(thief["code"], "NotCreator");
  EXPECT_EQ(thief["category"], "authorization");

  json free_event = run({{"command", "CREATE_EVENT"},
                         {"caller", "alice"},
                         {"name", "free"},
                         {"capacity", 1},
                         {"price", 0},
                         {"start_time", 1},
                         {"duration", 1}});
  EXPECT_EQ(free_event["code"], "MissingPrice");
  EXPECT_EQ(free_event["category"], "validation");
}

// -----------------------------------------------------------------------------
// 7. A reservation the participant cannot fund reports CustodyFailed.
// -----------------------------------------------------------------------------
TEST_F(LedgerServiceTest, CustodyFailureIsReported) {
  auto id = createYakult();
  json reply = run({{"command", "RESERVE"},
                    {"caller", "dave"},
                    {"event_id", id},
                    {"amount", 2}});
  EXPECT_EQ(reply["status"], "error");
  EXPECT_EQ(reply["code"], "CustodyFailed");

  EXPECT_EQ(run({{"command", "DEPOSIT"}, {"account", "dave"},
                 {"amount", 2}})["balance"],
            2);
  EXPECT_EQ(run({{"command", "RESERVE"},
                 {"caller", "dave"},
                 {"event_id", id},
                 {"amount", 2}})["status"],
            "ok");
}

// -----------------------------------------------------------------------------
// 8. Malformed requests become BadRequest / UnknownCommand, never throws.
// Why: executeCommand() runs on the IPC thread; an escaping exception would
//      terminate the process.
// -----------------------------------------------------------------------------
TEST_F(LedgerServiceTest, MalformedRequests) {
  EXPECT_EQ(json::parse(service.executeCommand("[1,2,3]"))["code"],
            "BadRequest");
  EXPECT_EQ(run({{"nocommand", 1}})["code"], "BadRequest");
  EXPECT_EQ(run({{"command", 7}})["code"], "BadRequest");
  EXPECT_EQ(run({{"command", "RESERVE"}, {"caller", "bob"}})["code"],
            "BadRequest");
  EXPECT_EQ(run({{"command", "RESERVE"},
                 {"caller", "bob"},
                 {"event_id", -1},
                 {"amount", 2}})["code"],
            "BadRequest");
  EXPECT_EQ(run({{"command", "CREATE_EVENT"},
                 {"caller", "alice"},
                 {"name", "huge"},
                 {"capacity", 5000000000ULL},
                 {"price", 1},
                 {"start_time", 1},
                 {"duration", 1}})["code"],
            "BadRequest");
  EXPECT_EQ(run({{"command", "DEPOSIT"}, {"account", ""}, {"amount", 1}})["code"],
            "BadRequest");

  json unknown = json::parse(service.executeCommand("LAUNCH"));
  EXPECT_EQ(unknown["status"], "error");
  EXPECT_EQ(unknown["code"], "UnknownCommand");

  EXPECT_EQ(service.engine().eventCount(), 0u);
}

// -----------------------------------------------------------------------------
// 9. ADVANCE_TIME moves forward only.
// -----------------------------------------------------------------------------
TEST_F(LedgerServiceTest, AdvanceTimeForwardOnly) {
  EXPECT_EQ(run({{"command", "ADVANCE_TIME"}, {"now", 500}})["now"], 500);
  EXPECT_EQ(run({{"command", "ADVANCE_TIME"}, {"now", 500}})["status"], "ok");

  json back = run({{"command", "ADVANCE_TIME"}, {"now", 499}});
  EXPECT_EQ(back["code"], "InvalidTime");
  EXPECT_EQ(service.clock().now_s(), 500u);
}

// -----------------------------------------------------------------------------
// 10. ADVANCE_TIME is refused on the live clock.
// -----------------------------------------------------------------------------
TEST(LedgerServiceLiveClockTest, AdvanceTimeRequiresSimulation) {
  rsvp::ServiceConfig config;
  config.cmd_endpoint.clear();
  config.pub_endpoint.clear();
  rsvp::LedgerService service(config);

  EXPECT_EQ(service.simulationClock(), nullptr);
  json reply = json::parse(service.executeCommand(
      R"({"command":"ADVANCE_TIME","now":1})"));
  EXPECT_EQ(reply["code"], "ClockNotSimulated");
}

// -----------------------------------------------------------------------------
// 11. GET_EVENT on an unknown id returns a null event, not an error.
// -----------------------------------------------------------------------------
TEST_F(LedgerServiceTest, GetUnknownEventIsNull) {
  json reply = run({{"command", "GET_EVENT"}, {"event_id", 12}});
  EXPECT_EQ(reply["status"], "ok");
  EXPECT_TRUE(reply["event"].is_null());

  json meta = run({{"command", "GET_EVENT_METADATA"}, {"event_id", 12}});
  EXPECT_EQ(meta["name"], "");
  EXPECT_EQ(meta["owner"], "");
}

// -----------------------------------------------------------------------------
// 12. Telemetry wire format for each notification type.
// -----------------------------------------------------------------------------
TEST(IpcTelemetryFormatTest, FormatsEachNotification) {
  rsvp::EventCreatedNotification created;
  created.record.id = 1;
  created.record.owner = "alice";
  created.record.name = "yakult event";
  created.record.capacity = 1;
  created.record.price = 1;
  created.record.start_time = 1000;
  created.record.duration = 2000;
  created.timestamp_s = 5;
  created.sequence_id = 1;

  json c = json::parse(rsvp::IpcServer::formatTelemetry(created));
  EXPECT_EQ(c["type"], "event_created");
  EXPECT_EQ(c["event_id"], 1);
  EXPECT_EQ(c["owner"], "alice");
  EXPECT_EQ(c["name"], "yakult event");
  EXPECT_EQ(c["duration"], 2000);
  EXPECT_EQ(c["timestamp_s"], 5);
  EXPECT_EQ(c["sequence_id"], 1);

  rsvp::ReservedNotification reserved;
  reserved.event_id = 1;
  reserved.participant = "bob";
  reserved.amount = 2;
  reserved.sequence_id = 2;
  json r = json::parse(rsvp::IpcServer::formatTelemetry(reserved));
  EXPECT_EQ(r["type"], "reserved");
  EXPECT_EQ(r["participant"], "bob");
  EXPECT_EQ(r["amount"], 2);

  rsvp::CheckedInNotification checked_in;
  checked_in.event_id = 1;
  checked_in.participant = "bob";
  json k = json::parse(rsvp::IpcServer::formatTelemetry(checked_in));
  EXPECT_EQ(k["type"], "checked_in");
  EXPECT_EQ(k["participant"], "bob");

  rsvp::WithdrawnNotification withdrawn;
  withdrawn.event_id = 1;
  withdrawn.amount = 4;
  json w = json::parse(rsvp::IpcServer::formatTelemetry(withdrawn));
  EXPECT_EQ(w["type"], "withdrawn");
  EXPECT_EQ(w["amount"], 4);
}

// -----------------------------------------------------------------------------
// 13. A refund that is paid before the recipient fails is reported as
//     RecipientFailed and is not rolled back.
// -----------------------------------------------------------------------------
TEST_F(LedgerServiceTest, RecipientFailureIsReported) {
  auto id = createYakult();
  run({{"command", "RESERVE"}, {"caller", "bob"}, {"event_id", id},
       {"amount", 2}});
  run({{"command", "ADVANCE_TIME"}, {"now", 1500}});

  service.custodian().setPayoutHook(
      [](const rsvp::domain::ParticipantId&, rsvp::domain::Amount) {
        throw std::runtime_error("wallet offline");
      });

  json reply = run({{"command", "CHECK_IN"}, {"caller", "bob"},
                    {"event_id", id}});
  EXPECT_EQ(reply["status"], "error");
  EXPECT_EQ(reply["code"], "RecipientFailed");
  EXPECT_EQ(reply["category"], "custody");

  json res = run({{"command", "RESERVATION"},
                  {"event_id", id},
                  {"participant", "bob"}})["reservation"];
  EXPECT_EQ(res["status"], "settled");
  EXPECT_EQ(run({{"command", "BALANCE"}, {"account", "bob"}})["balance"], 50);
  EXPECT_EQ(run({{"command", "STATUS"}})["custody_balance"], 0);
}

// -----------------------------------------------------------------------------
// 14. stop() while the IPC thread is inside a command's publish.
// Why: The telemetry bridge runs on the IPC thread and uses the IpcServer.
//      stop() must join that thread before the server is destroyed.
// -----------------------------------------------------------------------------
TEST(LedgerServiceIpcTest, StopWaitsForCommandInFlight) {
  const std::string base = "ipc://" + ::testing::TempDir() + "rsvp_stop_test";
  rsvp::ServiceConfig config;
  config.cmd_endpoint = base + "_cmd";
  config.pub_endpoint = base + "_pub";
  config.clock = rsvp::ClockMode::Simulation;
  rsvp::LedgerService service(config);

  // Subscribed before start(), so it runs ahead of the telemetry bridge and
  // keeps the IPC thread inside publish() while stop() begins.
  std::atomic<bool> publishing{false};
  service.notificationBus().subscribe(
      [&publishing](const rsvp::Notification&) {
        publishing.store(true);
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
      });

  service.start();

  zmq::context_t context(1);
  zmq::socket_t client(context, zmq::socket_type::req);
  client.set(zmq::sockopt::linger, 0);
  client.connect(config.cmd_endpoint);

  const std::string request = json{{"command", "CREATE_EVENT"},
                                   {"caller", "alice"},
                                   {"name", "yakult event"},
                                   {"capacity", 2},
                                   {"price", 2},
                                   {"start_time", 1000},
                                   {"duration", 2000}}
                                  .dump();
  auto sent = client.send(zmq::buffer(request), zmq::send_flags::none);
  ASSERT_TRUE(sent.has_value());

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (!publishing.load() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  ASSERT_TRUE(publishing.load()) << "command never reached the ledger";

  service.stop();

  EXPECT_FALSE(service.isRunning());
  EXPECT_TRUE(service.engine().eventExists(1));
}
