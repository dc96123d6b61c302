#include "rxpos/network/ipc_server.hpp"
#include "rxpos/domain/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace rxpos {

namespace {

// One overload per Event alternative.
struct TelemetryFormatter {
  nlohmann::json operator()(const SaleCompletedEvent& e) const {
    nlohmann::json j;
    j["type"] = "sale_completed";
    j["sale"] = e.sale;
    return j;
  }

  nlohmann::json operator()(const StockAlertEvent& e) const {
    nlohmann::json j;
    j["type"] = "stock_alert";
    j["sale_id"] = e.sale_id;
    j["medicine_id"] = e.medicine_id;
    j["medicine_name"] = e.medicine_name;
    j["requested"] = e.requested;
    j["reason"] = e.reason;
    j["alert"] = "sale recorded but inventory may be inconsistent";
    return j;
  }

  nlohmann::json operator()(const LowStockEvent& e) const {
    nlohmann::json j;
    j["type"] = "low_stock";
    j["medicine_id"] = e.medicine_id;
    j["name"] = e.name;
    j["remaining"] = e.remaining;
    j["threshold"] = e.threshold;
    return j;
  }
};

}  // namespace

// -----------------------------------------------------------------------------
// Constructor / destructor
// -----------------------------------------------------------------------------
IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run(): combined drain/poll loop
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto maybe_event = telemetry_queue_.try_pop()) {
    std::string payload = formatTelemetry(*maybe_event);
    zmq::message_t msg(payload.data(), payload.size());
    pub_socket_->send(msg, zmq::send_flags::dontwait);
  }
}

// -----------------------------------------------------------------------------
// processCommands(): one request/reply exchange, or a timeout
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response = command_handler_(cmd);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

std::string IpcServer::formatTelemetry(const Event& event) {
  return std::visit(TelemetryFormatter{}, event).dump();
}

}  // namespace rxpos
