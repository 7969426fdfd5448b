#include "tradeloop/engine/trading_orchestrator.hpp"
#include "tradeloop/market/market_data_collector.hpp"
#include "tradeloop/strategy/momentum_strategy.hpp"
#include "tradeloop/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <iostream>
#include <sstream>
#include <thread>
#include <utility>

namespace tradeloop {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
TradingOrchestrator::TradingOrchestrator(IVenueClient& venue,
                                         const ITimeProvider& clock,
                                         EngineConfig config)
    : venue_(venue),
      clock_(clock),
      config_(std::move(config)),
      history_(config_.timing.history_capacity),
      risk_gate_(config_.risk),
      execution_(venue_) {
  strategies_.addStrategy(std::make_unique<MomentumStrategy>(
      config_.momentum.lookback, config_.momentum.threshold,
      config_.momentum.order_quantity, config_.momentum.volume_floor));
}

TradingOrchestrator::~TradingOrchestrator() { stop(); }

// -----------------------------------------------------------------------------
// start(): spawn collectors + decision loop, join them all
// -----------------------------------------------------------------------------
void TradingOrchestrator::start(const std::vector<std::string>& symbols) {
  CancellationToken token;
  {
    std::lock_guard lock(state_mutex_);
    if (running_ || tasks_active_) {
      std::cerr << "[TradingOrchestrator] start() ignored: already running\n";
      return;
    }
    running_ = true;
    tasks_active_ = true;
    cancellation_ = CancellationSource{};
    token = cancellation_.token();
  }

  // ---  1) Optional IPC server -----------------------------------------------
  EventBus::SubscriptionId telemetry_sub = 0;
  bool telemetry_subscribed = false;
  if (config_.ipc.enabled()) {
    try {
      ipc_server_ = std::make_unique<IpcServer>(
          [this](const std::string& cmd) { return executeCommand(cmd); },
          config_.ipc.command_endpoint, config_.ipc.telemetry_endpoint);
      ipc_server_->start();
      telemetry_sub = event_bus_.subscribe(
          [this](const Event& e) { ipc_server_->pushTelemetry(e); });
      telemetry_subscribed = true;
    } catch (const std::exception& e) {
      std::cerr << "[TradingOrchestrator] IPC server disabled: " << e.what()
                << "\n";
      ipc_server_.reset();
    }
  }

  // ---  2) One collector per instrument --------------------------------------
  std::vector<std::unique_ptr<MarketDataCollector>> collectors;
  collectors.reserve(symbols.size());
  for (const auto& symbol : symbols) {
    collectors.push_back(std::make_unique<MarketDataCollector>(
        symbol, venue_, history_, config_.timing.collector_interval));
  }

  std::vector<std::thread> tasks;
  tasks.reserve(collectors.size() + 1);
  for (auto& collector : collectors) {
    MarketDataCollector* c = collector.get();
    tasks.emplace_back([c, token] { c->run(token); });
  }

  // ---  3) Decision loop -----------------------------------------------------
  tasks.emplace_back([this, token] { decisionLoop(token); });

  std::cout << "[TradingOrchestrator] running: " << collectors.size()
            << " collector(s) + decision loop\n";

  // ---  4) Wait for every task ----------------------------------------------
  for (auto& task : tasks) {
    task.join();
  }

  if (telemetry_subscribed) {
    event_bus_.unsubscribe(telemetry_sub);
  }
  ipc_server_.reset();

  {
    std::lock_guard lock(state_mutex_);
    running_ = false;
    tasks_active_ = false;
  }

  std::cout << "[TradingOrchestrator] stopped. All tasks joined.\n";
}

// -----------------------------------------------------------------------------
// stop(): flip the flag and cancel; never joins
// -----------------------------------------------------------------------------
void TradingOrchestrator::stop() {
  std::lock_guard lock(state_mutex_);
  if (!running_) {
    return;
  }
  running_ = false;
  cancellation_.cancel();
  std::cout << "[TradingOrchestrator] stop requested\n";
}

bool TradingOrchestrator::isRunning() const {
  std::lock_guard lock(state_mutex_);
  return running_;
}

void TradingOrchestrator::decisionLoop(const CancellationToken& token) {
  while (!token.isCancelled()) {
    runDecisionCycle();
    if (token.waitFor(config_.timing.decision_interval)) {
      break;
    }
  }
}

// -----------------------------------------------------------------------------
// runDecisionCycle(): history copy → book → strategies → signals
// -----------------------------------------------------------------------------
DecisionCycleReport TradingOrchestrator::runDecisionCycle() {
  DecisionCycleReport report;

  const auto snapshot = history_.snapshot();

  for (const auto& [instrument, history] : snapshot) {
    if (history.size() < config_.timing.min_history_points) {
      continue;
    }

    domain::OrderBookSnapshot book;
    try {
      book = venue_.getOrderBook(instrument);
    } catch (const std::exception& e) {
      ++report.book_failures;
      std::cerr << "[TradingOrchestrator] order book for " << instrument
                << " unavailable: " << e.what() << "\n";
      continue;
    }
    ++report.instruments_evaluated;

    auto signals = strategies_.evaluate(history, book);
    if (signals.empty()) {
      if (auto change = windowPriceChange(history, config_.momentum.lookback)) {
        std::cout << "[TradingOrchestrator] " << instrument
                  << " no signal: change=" << (*change * 100.0)
                  << "% threshold=" << (config_.momentum.threshold * 100.0)
                  << "%\n";
      }
      continue;
    }

    for (const auto& emitted : signals) {
      processSignal(emitted, instrument, report);
    }
  }

  return report;
}

// -----------------------------------------------------------------------------
// processSignal(): one signal through risk, execution and position update
// -----------------------------------------------------------------------------
void TradingOrchestrator::processSignal(const StrategySignal& emitted,
                                        const std::string& instrument,
                                        DecisionCycleReport& report) {
  const domain::TradingSignal& signal = emitted.signal;
  ++report.signals;

  std::cout << "[TradingOrchestrator] " << emitted.strategy_name
            << " signal: " << domain::sideToString(signal.action) << " "
            << signal.quantity << " " << instrument
            << " @ " << signal.target_price
            << " (confidence " << signal.confidence << ")\n";

  event_bus_.publish(SignalEvent{emitted.strategy_name, signal, now()});

  domain::Order order;
  order.id = order_ids_.next_id();
  order.instrument = signal.instrument.empty() ? instrument : signal.instrument;
  order.side = signal.action;
  order.kind = domain::OrderKind::Market;
  order.quantity = signal.quantity;
  order.created_at = now_seconds(clock_);

  // ---  Risk ----------------------------------------------------------------
  RiskDecision decision = risk_gate_.check(order, signal.target_price);
  if (!decision.approved) {
    ++report.rejected;
    std::cerr << "[RiskGate] Order rejected: " << order.id << " "
              << decision.reason << "\n";
    event_bus_.publish(
        RiskRejectEvent{order, signal.target_price, decision.reason, now()});
    return;
  }

  // ---  Execution -----------------------------------------------------------
  ExecutionResult result = execution_.submitOrder(order);
  event_bus_.publish(ExecutionReportEvent{order, result, now()});
  if (!result.ok()) {
    ++report.failed;
    return;
  }
  ++report.submitted;

  // ---  Position (separate step, not atomic with the submission) ------------
  const double fill_qty = domain::signedQuantity(order);
  domain::Position position =
      risk_gate_.updatePosition(order.instrument, fill_qty, signal.target_price);

  std::cout << "[TradingOrchestrator] position " << position.instrument
            << " qty=" << position.quantity
            << " avg=" << position.average_price
            << " realized=" << position.realized_pnl << "\n";

  event_bus_.publish(
      PositionUpdateEvent{position, fill_qty, signal.target_price, now()});
}

// -----------------------------------------------------------------------------
// executeCommand(): IPC command handling
// -----------------------------------------------------------------------------
std::string TradingOrchestrator::executeCommand(const std::string& cmd) {
  nlohmann::json response;

  std::istringstream in(cmd);
  std::string verb;
  std::string argument;
  in >> verb >> argument;

  if (verb == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";

  } else if (verb == "STATUS") {
    response["status"] = "ok";
    response["running"] = isRunning();
    response["daily_pnl"] = risk_gate_.dailyPnl();
    response["pending_orders"] = execution_.pendingCount();

    nlohmann::json positions_json = nlohmann::json::array();
    for (const auto& pos : risk_gate_.positions()) {
      positions_json.push_back({{"symbol", pos.instrument},
                                {"quantity", pos.quantity},
                                {"average_price", pos.average_price},
                                {"realized_pnl", pos.realized_pnl}});
    }
    response["positions"] = std::move(positions_json);

    nlohmann::json history_json = nlohmann::json::object();
    for (const auto& symbol : history_.instruments()) {
      history_json[symbol] = history_.size(symbol);
    }
    response["history"] = std::move(history_json);

  } else if (verb == "CANCEL") {
    if (argument.empty()) {
      response["status"] = "error";
      response["response"] = "CANCEL requires an order id";
    } else {
      execution_.cancelOrder(argument);
      response["status"] = "ok";
      response["response"] = "Cancelled " + argument;
    }

  } else if (verb == "STOP") {
    stop();
    response["status"] = "ok";
    response["response"] = "Stopping";

  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump();
}

Timestamp TradingOrchestrator::now() const {
  return ms_to_timestamp(clock_.now_ms());
}

}  // namespace tradeloop
