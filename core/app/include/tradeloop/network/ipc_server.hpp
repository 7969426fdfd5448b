#pragma once

#include "tradeloop/concurrent/thread_safe_queue.hpp"
#include "tradeloop/events/event.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace tradeloop {

// -----------------------------------------------------------------------------
// IpcServer — ZeroMQ control and telemetry endpoint
// -----------------------------------------------------------------------------
//
// @brief  Runs one worker thread that answers command requests on a REP
//         socket and broadcasts decision-loop events as JSON on a PUB
//         socket.
//
// @details
// Commands (REP):
//   Each request is a plain command string ("PING", "STATUS",
//   "CANCEL <id>", "STOP"). It is handed to the command handler (bound to
//   TradingOrchestrator::executeCommand) and the JSON string it returns is
//   sent back. The REP socket has a receive timeout so the worker keeps
//   alternating between commands and telemetry.
//
// Telemetry (PUB):
//   pushTelemetry() enqueues an Event from the decision thread. The worker
//   drains the queue, formats each event with formatTelemetry() and
//   publishes it. The decision thread never waits on socket I/O.
//
// Thread model:
//   start()/stop() from the owning thread. pushTelemetry() from any thread.
//   The command handler runs on the IPC worker thread.
//
// Ownership:
//   Owned by TradingOrchestrator via std::unique_ptr for the duration of
//   one start(). Owns the ZMQ context, both sockets, the queue and the
//   worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
            std::string pub_endpoint);

  // RAII: stops the worker if still running.
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Binds both sockets and spawns the worker. No-op if already running.
  //
  // @throws zmq::error_t if an endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // Idempotent. Publishes queued telemetry, then joins the worker.
  void stop();

  void pushTelemetry(Event event);

  bool isRunning() const { return running_.load(); }

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  // @return JSON object with a "type" field naming the event:
  //         "signal", "risk_reject", "execution_report", "position_update".
  // -------------------------------------------------------------------------
  static nlohmann::json formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace tradeloop
