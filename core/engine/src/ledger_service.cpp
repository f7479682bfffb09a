#include "rsvp/engine/ledger_service.hpp"

#include "rsvp/custody/i_custodian.hpp"
#include "rsvp/errors/ledger_error.hpp"
#include "rsvp/time/live_time_provider.hpp"

#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace rsvp {

namespace {

// A request the service refuses before it reaches the ledger. Carries the
// code and category reported in the error response.
class CommandError : public std::runtime_error {
 public:
  CommandError(std::string code, std::string category,
               const std::string& message)
      : std::runtime_error(message),
        code_(std::move(code)),
        category_(std::move(category)) {}

  const std::string& code() const noexcept { return code_; }
  const std::string& category() const noexcept { return category_; }

 private:
  std::string code_;
  std::string category_;
};

CommandError badRequest(const std::string& message) {
  return CommandError("BadRequest", "request", message);
}

std::unique_ptr<ITimeProvider> makeClock(const ServiceConfig& config) {
  if (config.clock == ClockMode::Simulation) {
    return std::make_unique<SimulationTimeProvider>(config.initial_time_s);
  }
  return std::make_unique<LiveTimeProvider>();
}

std::uint64_t unsignedArg(const nlohmann::json& args, const char* key) {
  auto it = args.find(key);
  if (it == args.end()) {
    throw badRequest(std::string("missing argument '") + key + "'");
  }
  if (!it->is_number_unsigned()) {
    throw badRequest(std::string("argument '") + key +
                     "' must be a non-negative integer");
  }
  return it->get<std::uint64_t>();
}

std::string stringArg(const nlohmann::json& args, const char* key) {
  auto it = args.find(key);
  if (it == args.end()) {
    throw badRequest(std::string("missing argument '") + key + "'");
  }
  if (!it->is_string()) {
    throw badRequest(std::string("argument '") + key + "' must be a string");
  }
  return it->get<std::string>();
}

std::string trim(const std::string& text) {
  const char* ws = " \t\r\n";
  auto first = text.find_first_not_of(ws);
  if (first == std::string::npos) {
    return {};
  }
  auto last = text.find_last_not_of(ws);
  return text.substr(first, last - first + 1);
}

std::string errorResponse(const std::string& code, const std::string& category,
                          const std::string& message) {
  nlohmann::json response;
  response["status"] = "error";
  response["code"] = code;
  response["category"] = category;
  response["response"] = message;
  return response.dump();
}

nlohmann::json snapshotToJson(const EventSnapshot& snap) {
  nlohmann::json j;
  j["event_id"] = snap.record.id;
  j["owner"] = snap.record.owner;
  j["name"] = snap.record.name;
  j["capacity"] = snap.record.capacity;
  j["price"] = snap.record.price;
  j["start_time"] = snap.record.start_time;
  j["duration"] = snap.record.duration;
  j["escrowed_balance"] = snap.escrowed_balance;
  j["staked_count"] = snap.staked_count;
  j["settled_count"] = snap.settled_count;
  j["total_swept"] = snap.total_swept;
  return j;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
LedgerService::LedgerService(ServiceConfig config)
    : config_(std::move(config)),
      clock_(makeClock(config_)),
      sim_clock_(dynamic_cast<SimulationTimeProvider*>(clock_.get())),
      engine_(*clock_, custodian_, bus_) {
  for (const auto& [account, amount] : config_.opening_balances) {
    custodian_.deposit(account, amount);
  }
}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
LedgerService::~LedgerService() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void LedgerService::start() {
  if (running_) {
    return;
  }

  if (!config_.cmd_endpoint.empty() && !config_.pub_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.cmd_endpoint, config_.pub_endpoint,
        config_.telemetry_queue_capacity);
    ipc_server_->start();

    // Telemetry bridge: every committed notification goes out on PUB.
    IpcServer* server = ipc_server_.get();
    telemetry_sub_id_ = bus_.subscribe(
        [server](const Notification& n) { server->pushTelemetry(n); });
  }

  running_ = true;

  std::cout << "[LedgerService] started. clock="
            << clockModeToString(config_.clock) << " now=" << clock_->now_s()
            << (ipc_server_ ? " ipc=on" : " ipc=off") << "\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void LedgerService::stop() {
  if (!running_) {
    return;
  }

  // ---  1) Join the IPC thread; no command can be mid-publish after this ---
  if (ipc_server_) {
    ipc_server_->stop();
  }

  // ---  2) Detach the bridge before the server it points at goes away ------
  if (telemetry_sub_id_ != 0) {
    bus_.unsubscribe(telemetry_sub_id_);
    telemetry_sub_id_ = 0;
  }

  // ---  3) Destroy IpcServer ------------------------------------------------
  if (ipc_server_) {
    const auto dropped = ipc_server_->droppedTelemetry();
    ipc_server_.reset();
    if (dropped > 0) {
      std::cerr << "[LedgerService] WARNING: " << dropped
                << " telemetry message(s) dropped (queue full).\n";
    }
  }

  running_ = false;

  std::cout << "[LedgerService] stopped. events=" << engine_.eventCount()
            << " escrowed=" << engine_.totalEscrowed() << "\n";
}

// -----------------------------------------------------------------------------
// waitForShutdown()
// -----------------------------------------------------------------------------
void LedgerService::waitForShutdown(std::chrono::milliseconds poll) const {
  while (!shutdown_requested_.load()) {
    std::this_thread::sleep_for(poll);
  }
}

// -----------------------------------------------------------------------------
// executeCommand(): parse, dispatch, map failures to error responses
// -----------------------------------------------------------------------------
std::string LedgerService::executeCommand(const std::string& cmd) {
  std::string command;
  nlohmann::json args = nlohmann::json::object();

  nlohmann::json root = nlohmann::json::parse(cmd, nullptr, false);
  if (root.is_discarded()) {
    command = trim(cmd);
  } else if (root.is_object()) {
    auto it = root.find("command");
    if (it == root.end() || !it->is_string()) {
      return errorResponse("BadRequest", "request",
                           "request needs a string 'command' field");
    }
    command = it->get<std::string>();
    args = std::move(root);
  } else {
    return errorResponse("BadRequest", "request",
                         "request must be a JSON object or a bare command");
  }

  try {
    nlohmann::json response = dispatch(command, args);
    response["status"] = "ok";
    return response.dump();
  } catch (const LedgerError& e) {
    std::cerr << "[LedgerService] " << command << " rejected: "
              << errorCodeToString(e.code()) << "\n";
    return errorResponse(errorCodeToString(e.code()),
                         errorCategoryToString(e.category()), e.what());
  } catch (const CustodyError& e) {
    std::cerr << "[LedgerService] " << command
              << " failed in custody: " << e.what() << "\n";
    return errorResponse("CustodyFailed", "custody", e.what());
  } catch (const RecipientError& e) {
    std::cerr << "[LedgerService] " << command
              << " committed, recipient failed: " << e.what() << "\n";
    return errorResponse("RecipientFailed", "custody", e.what());
  } catch (const CommandError& e) {
    return errorResponse(e.code(), e.category(), e.what());
  } catch (const nlohmann::json::exception& e) {
    return errorResponse("BadRequest", "request", e.what());
  } catch (const std::exception& e) {
    std::cerr << "[LedgerService] " << command
              << " failed: " << e.what() << "\n";
    return errorResponse("InternalError", "internal", e.what());
  }
}

// -----------------------------------------------------------------------------
// dispatch(): one branch per command; throws on any failure
// -----------------------------------------------------------------------------
nlohmann::json LedgerService::dispatch(const std::string& command,
                                       const nlohmann::json& args) {
  nlohmann::json response = nlohmann::json::object();

  if (command == "PING") {
    response["response"] = "PONG";
  } else if (command == "STATUS") {
    response = status();
  } else if (command == "CREATE_EVENT") {
    const std::uint64_t capacity = unsignedArg(args, "capacity");
    if (capacity > std::numeric_limits<std::uint32_t>::max()) {
      throw badRequest("argument 'capacity' is out of range");
    }
    response["event_id"] = engine_.createEvent(
        stringArg(args, "caller"), stringArg(args, "name"),
        static_cast<std::uint32_t>(capacity), unsignedArg(args, "price"),
        unsignedArg(args, "start_time"), unsignedArg(args, "duration"));
  } else if (command == "GET_EVENT_METADATA") {
    const auto meta = engine_.getEventMetadata(unsignedArg(args, "event_id"));
    response["name"] = meta.name;
    response["owner"] = meta.owner;
  } else if (command == "GET_EVENT") {
    const auto snap = engine_.eventSnapshot(unsignedArg(args, "event_id"));
    response["event"] = snap ? snapshotToJson(*snap) : nlohmann::json();
  } else if (command == "RESERVE") {
    engine_.reserve(unsignedArg(args, "event_id"), stringArg(args, "caller"),
                    unsignedArg(args, "amount"));
  } else if (command == "CHECK_IN") {
    engine_.checkIn(unsignedArg(args, "event_id"), stringArg(args, "caller"));
  } else if (command == "SWEEP") {
    response["amount"] =
        engine_.sweep(unsignedArg(args, "event_id"), stringArg(args, "caller"));
  } else if (command == "RESERVATION") {
    const auto r = engine_.reservation(unsignedArg(args, "event_id"),
                                       stringArg(args, "participant"));
    response["reservation"] = {
        {"status", domain::reservationStatusToString(r.status)},
        {"stake", r.stake},
        {"forfeited", r.forfeited}};
  } else if (command == "BALANCE") {
    const std::string account = stringArg(args, "account");
    response["account"] = account;
    response["balance"] = custodian_.balanceOf(account);
  } else if (command == "DEPOSIT") {
    const std::string account = stringArg(args, "account");
    if (account.empty()) {
      throw badRequest("argument 'account' must not be empty");
    }
    custodian_.deposit(account, unsignedArg(args, "amount"));
    response["account"] = account;
    response["balance"] = custodian_.balanceOf(account);
  } else if (command == "ADVANCE_TIME") {
    if (sim_clock_ == nullptr) {
      throw CommandError("ClockNotSimulated", "clock",
                         "ADVANCE_TIME requires the simulation clock");
    }
    const domain::Seconds target = unsignedArg(args, "now");
    if (!sim_clock_->advance_time(target)) {
      throw CommandError("InvalidTime", "clock",
                         "clock cannot move backwards to " +
                             std::to_string(target));
    }
    response["now"] = sim_clock_->now_s();
  } else {
    throw CommandError("UnknownCommand", "request",
                       "Unknown command: " + command);
  }

  return response;
}

// -----------------------------------------------------------------------------
// status(): aggregate view for STATUS
// -----------------------------------------------------------------------------
nlohmann::json LedgerService::status() const {
  nlohmann::json j;
  j["clock"] = clockModeToString(config_.clock);
  j["now"] = clock_->now_s();
  j["events"] = engine_.eventCount();
  j["total_escrowed"] = engine_.totalEscrowed();
  j["custody_balance"] = custodian_.custodyBalance();
  j["ipc"] = ipc_server_ != nullptr;
  return j;
}

}  // namespace rsvp
