#include "tradeloop/network/ipc_server.hpp"
#include "tradeloop/time/time_utils.hpp"

#include <cerrno>
#include <exception>
#include <iostream>
#include <type_traits>
#include <utility>
#include <variant>

namespace tradeloop {

namespace {

nlohmann::json orderToJson(const domain::Order& order) {
  nlohmann::json j;
  j["order_id"] = order.id;
  j["symbol"] = order.instrument;
  j["side"] = domain::sideToString(order.side);
  j["kind"] = domain::orderKindToString(order.kind);
  j["quantity"] = order.quantity;
  if (order.limit_price) {
    j["limit_price"] = *order.limit_price;
  }
  j["created_at"] = order.created_at;
  return j;
}

}  // namespace

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind sockets, spawn worker
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
// stop(): signal, join, release sockets
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  const bool was_running = running_.exchange(false);

  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  if (was_running) {
    std::cout << "[IpcServer] stopped.\n";
  }
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }

  // Final drain so the last decisions still reach subscribers.
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto maybe_event = telemetry_queue_.try_pop()) {
    const std::string payload = formatTelemetry(*maybe_event).dump();
    pub_socket_->send(zmq::buffer(payload), zmq::send_flags::dontwait);
  }
}

// -----------------------------------------------------------------------------
// processCommands(): one request/reply exchange or a poll timeout
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

  std::string response;
  try {
    response = command_handler_(request.to_string());
  } catch (const std::exception& e) {
    // REP must always answer, or the socket is stuck for the next client.
    response = nlohmann::json{{"status", "error"}, {"error", e.what()}}.dump();
  }

  cmd_socket_->send(zmq::buffer(response), zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatTelemetry(): one JSON object per Event alternative
// -----------------------------------------------------------------------------
nlohmann::json IpcServer::formatTelemetry(const Event& event) {
  return std::visit(
      [](const auto& e) -> nlohmann::json {
        using T = std::decay_t<decltype(e)>;
        nlohmann::json j;
        j["timestamp_ms"] = timestamp_to_ms(e.timestamp);

        if constexpr (std::is_same_v<T, SignalEvent>) {
          j["type"] = "signal";
          j["strategy"] = e.strategy_name;
          j["symbol"] = e.signal.instrument;
          j["action"] = domain::sideToString(e.signal.action);
          j["confidence"] = e.signal.confidence;
          j["target_price"] = e.signal.target_price;
          j["quantity"] = e.signal.quantity;
        } else if constexpr (std::is_same_v<T, RiskRejectEvent>) {
          j["type"] = "risk_reject";
          j["order"] = orderToJson(e.order);
          j["reference_price"] = e.reference_price;
          j["reason"] = e.reason;
        } else if constexpr (std::is_same_v<T, ExecutionReportEvent>) {
          j["type"] = "execution_report";
          j["order"] = orderToJson(e.order);
          j["status"] = executionStatusToString(e.result.status);
          if (e.result.ok()) {
            j["venue_order_id"] = e.result.venue_order_id;
          } else {
            j["error"] = e.result.error;
          }
        } else if constexpr (std::is_same_v<T, PositionUpdateEvent>) {
          j["type"] = "position_update";
          j["symbol"] = e.position.instrument;
          j["quantity"] = e.position.quantity;
          j["average_price"] = e.position.average_price;
          j["realized_pnl"] = e.position.realized_pnl;
          j["fill_quantity"] = e.fill_quantity;
          j["fill_price"] = e.fill_price;
        }
        return j;
      },
      event);
}

}  // namespace tradeloop
