#pragma once

#include "tradeloop/concurrent/cancellation_token.hpp"
#include "tradeloop/concurrent/order_id_generator.hpp"
#include "tradeloop/config/engine_config.hpp"
#include "tradeloop/eventbus/event_bus.hpp"
#include "tradeloop/execution/order_execution_coordinator.hpp"
#include "tradeloop/market/price_history_store.hpp"
#include "tradeloop/network/ipc_server.hpp"
#include "tradeloop/risk/risk_gate.hpp"
#include "tradeloop/strategy/strategy_engine.hpp"
#include "tradeloop/time/i_time_provider.hpp"
#include "tradeloop/venue/i_venue_client.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tradeloop {

// Counters for one pass of the decision loop.
struct DecisionCycleReport {
  std::size_t instruments_evaluated{0};
  std::size_t book_failures{0};
  std::size_t signals{0};
  std::size_t rejected{0};
  std::size_t submitted{0};
  std::size_t failed{0};
};

// -----------------------------------------------------------------------------
// TradingOrchestrator
// -----------------------------------------------------------------------------
//
// @brief  Owns the trading state and the Stopped/Running lifecycle; runs the
//         per-instrument collectors and the decision loop that ties
//         StrategyEngine → RiskGate → OrderExecutionCoordinator together.
//
// @details
// start(symbols) blocks the caller:
//   1. Flip to Running and create a fresh CancellationSource.
//   2. Start the IpcServer if both endpoints are configured.
//   3. Spawn one MarketDataCollector thread per symbol and one decision
//      thread.
//   4. Join all of them. They exit once stop() cancels the token.
//
// Decision cycle (runDecisionCycle):
//   - Copy the full history out of PriceHistoryStore. No lock is held past
//     the copy.
//   - For every instrument with at least min_history_points samples, fetch
//     a fresh order book and evaluate every registered strategy.
//   - For every emitted signal: synthesize a Market order with a fresh id,
//     check it with RiskGate, submit it, and on success apply the fill to
//     the position at the signal's target price.
//
// A failed book fetch skips that instrument for the cycle. A rejected or
// failed order drops the signal; nothing is retried.
//
// Submission and position update are separate steps with separate locks.
// A crash between them leaves the venue ahead of the position book.
//
// Events published on eventBus() from the decision thread:
//   SignalEvent, RiskRejectEvent, ExecutionReportEvent, PositionUpdateEvent
//
// Thread model:
//   start() blocks; stop(), isRunning(), executeCommand() and the accessors
//   may be called from any thread while it runs. Components reached through
//   the accessors are individually thread-safe.
//
// Ownership:
//   TradingOrchestrator
//    ├── venue_        (IVenueClient& — non-owning, must outlive this)
//    ├── clock_        (const ITimeProvider& — non-owning)
//    ├── config_       (EngineConfig — copied in)
//    ├── event_bus_, history_, strategies_, risk_gate_, execution_,
//    │   order_ids_    (value members)
//    └── ipc_server_   (unique_ptr<IpcServer> — lives for one start())
//
//   The destructor calls stop(). The thread running start() must have
//   returned before the orchestrator is destroyed.
// -----------------------------------------------------------------------------
class TradingOrchestrator {
 public:
  // Registers the default MomentumStrategy from config.momentum.
  TradingOrchestrator(IVenueClient& venue, const ITimeProvider& clock,
                      EngineConfig config);

  ~TradingOrchestrator();

  TradingOrchestrator(const TradingOrchestrator&) = delete;
  TradingOrchestrator& operator=(const TradingOrchestrator&) = delete;
  TradingOrchestrator(TradingOrchestrator&&) = delete;
  TradingOrchestrator& operator=(TradingOrchestrator&&) = delete;

  // -------------------------------------------------------------------------
  // start(symbols)
  // -------------------------------------------------------------------------
  // @brief  Runs collectors and the decision loop until stop().
  //
  // @details
  // Blocks until every task has exited. Calling start() while a run is
  // active (or still winding down) logs and returns immediately. After it
  // returns the orchestrator can be started again; history, positions and
  // pending orders carry over.
  // -------------------------------------------------------------------------
  void start(const std::vector<std::string>& symbols);

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // @brief  Flips to Stopped and cancels the run's token.
  //
  // @details
  // Does not wait: tasks notice at their next loop top or wake from their
  // sleep immediately. An in-flight venue call runs to completion.
  // Idempotent; safe from any thread, including the IPC worker.
  // -------------------------------------------------------------------------
  void stop();

  bool isRunning() const;

  // One pass of the decision loop. Also called directly by tests.
  DecisionCycleReport runDecisionCycle();

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  // @brief  Text command interface used by the IpcServer.
  //
  // @details
  //   PING          → {"status":"ok","response":"PONG"}
  //   STATUS        → running flag, daily PnL, positions, pending order
  //                   count, history size per instrument
  //   CANCEL <id>   → cancels the pending order (idempotent)
  //   STOP          → stop()
  //   anything else → {"status":"error",...}
  //
  // @return JSON string.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  PriceHistoryStore& historyStore() { return history_; }
  StrategyEngine& strategyEngine() { return strategies_; }
  RiskGate& riskGate() { return risk_gate_; }
  OrderExecutionCoordinator& executionCoordinator() { return execution_; }
  EventBus& eventBus() { return event_bus_; }
  const EngineConfig& config() const { return config_; }

 private:
  void decisionLoop(const CancellationToken& token);

  // Signal → order → risk → submit → position. Updates the report.
  void processSignal(const StrategySignal& emitted,
                     const std::string& instrument,
                     DecisionCycleReport& report);

  Timestamp now() const;

  IVenueClient& venue_;
  const ITimeProvider& clock_;
  const EngineConfig config_;

  EventBus event_bus_;
  PriceHistoryStore history_;
  StrategyEngine strategies_;
  RiskGate risk_gate_;
  OrderExecutionCoordinator execution_;
  OrderIdGenerator order_ids_;

  // Guards the lifecycle fields below.
  mutable std::mutex state_mutex_;
  bool running_{false};
  bool tasks_active_{false};
  CancellationSource cancellation_;

  std::unique_ptr<IpcServer> ipc_server_;
};

}  // namespace tradeloop
