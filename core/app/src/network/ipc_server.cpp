#include "rsvp/network/ipc_server.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstdint>
#include <iostream>
#include <utility>
#include <variant>

namespace rsvp {

namespace {

// Fields shared by every telemetry message.
nlohmann::json envelope(const char* type, domain::Seconds timestamp_s,
                        std::uint64_t sequence_id) {
  return nlohmann::json{{"type", type},
                        {"timestamp_s", timestamp_s},
                        {"sequence_id", sequence_id}};
}

nlohmann::json toJson(const EventCreatedNotification& n) {
  nlohmann::json j = envelope("event_created", n.timestamp_s, n.sequence_id);
  j["event_id"] = n.record.id;
  j["owner"] = n.record.owner;
  j["name"] = n.record.name;
  j["capacity"] = n.record.capacity;
  j["price"] = n.record.price;
  j["start_time"] = n.record.start_time;
  j["duration"] = n.record.duration;
  return j;
}

nlohmann::json toJson(const ReservedNotification& n) {
  nlohmann::json j = envelope("reserved", n.timestamp_s, n.sequence_id);
  j["event_id"] = n.event_id;
  j["participant"] = n.participant;
  j["amount"] = n.amount;
  return j;
}

nlohmann::json toJson(const CheckedInNotification& n) {
  nlohmann::json j = envelope("checked_in", n.timestamp_s, n.sequence_id);
  j["event_id"] = n.event_id;
  j["participant"] = n.participant;
  return j;
}

nlohmann::json toJson(const WithdrawnNotification& n) {
  nlohmann::json j = envelope("withdrawn", n.timestamp_s, n.sequence_id);
  j["event_id"] = n.event_id;
  j["amount"] = n.amount;
  return j;
}

}  // namespace

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint, std::size_t telemetry_capacity)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)),
      telemetry_queue_(telemetry_capacity) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start() / stop()
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  openSockets();
  running_.store(true);
  thread_ = std::thread([this] { serveLoop(); });

  std::cout << "[IpcServer] listening. commands=" << cmd_endpoint_
            << " telemetry=" << pub_endpoint_ << "\n";
}

void IpcServer::stop() {
  const bool was_running = running_.exchange(false);
  if (thread_.joinable()) {
    thread_.join();
  }
  if (!was_running) {
    return;
  }

  closeSockets();
  std::cout << "[IpcServer] closed.\n";
}

void IpcServer::pushTelemetry(Notification notification) {
  telemetry_queue_.push(std::move(notification));
}

std::string IpcServer::formatTelemetry(const Notification& notification) {
  return std::visit([](const auto& n) { return toJson(n).dump(); },
                    notification);
}

// -----------------------------------------------------------------------------
// Socket setup
// -----------------------------------------------------------------------------
// linger 0: a stopped server must not hold the process open waiting for
// unsent telemetry.
// -----------------------------------------------------------------------------
void IpcServer::openSockets() {
  context_ = std::make_unique<zmq::context_t>(1);
  try {
    cmd_socket_ =
        std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
    pub_socket_ =
        std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

    cmd_socket_->set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
    cmd_socket_->set(zmq::sockopt::linger, 0);
    pub_socket_->set(zmq::sockopt::linger, 0);

    cmd_socket_->bind(cmd_endpoint_);
    pub_socket_->bind(pub_endpoint_);
  } catch (const zmq::error_t& e) {
    std::cerr << "[IpcServer] cannot bind (" << e.what() << ")\n";
    closeSockets();
    throw;
  }
}

void IpcServer::closeSockets() {
  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();
}

// -----------------------------------------------------------------------------
// Worker thread
// -----------------------------------------------------------------------------
void IpcServer::serveLoop() {
  while (running_.load()) {
    publishPending();
    serveOneRequest();
  }
  publishPending();
}

void IpcServer::publishPending() {
  while (std::optional<Notification> next = telemetry_queue_.try_pop()) {
    const std::string payload = formatTelemetry(*next);
    if (!pub_socket_->send(zmq::buffer(payload), zmq::send_flags::dontwait)) {
      std::cerr << "[IpcServer] WARNING: telemetry send would block, "
                   "message dropped.\n";
    }
  }
}

void IpcServer::serveOneRequest() {
  zmq::message_t request;
  zmq::recv_result_t received;
  try {
    received = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    // Interrupted by a signal; the loop re-checks running_.
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!received) {
    return;  // timed out
  }

  const std::string reply = command_handler_(request.to_string());
  if (!cmd_socket_->send(zmq::buffer(reply), zmq::send_flags::none)) {
    std::cerr << "[IpcServer] WARNING: reply could not be sent.\n";
  }
}

}  // namespace rsvp
