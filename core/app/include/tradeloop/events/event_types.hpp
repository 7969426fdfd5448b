#pragma once

#include "tradeloop/domain/order.hpp"
#include "tradeloop/domain/position.hpp"
#include "tradeloop/domain/trading_signal.hpp"
#include "tradeloop/execution/execution_result.hpp"

#include <chrono>
#include <string>

namespace tradeloop {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock (or simulated) time at which an event was published.
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// SignalEvent
// -----------------------------------------------------------------------------
// Published by the orchestrator for every signal a strategy emits, before
// the order is synthesized and risk-checked.
// -----------------------------------------------------------------------------
struct SignalEvent {
  std::string strategy_name;
  domain::TradingSignal signal;
  Timestamp timestamp{};
};

// -----------------------------------------------------------------------------
// RiskRejectEvent
// -----------------------------------------------------------------------------
// Published when RiskGate refuses an order. A rejection is a normal
// decision outcome, not an error.
// -----------------------------------------------------------------------------
struct RiskRejectEvent {
  domain::Order order;
  double reference_price{0.0};
  std::string reason;
  Timestamp timestamp{};
};

// -----------------------------------------------------------------------------
// ExecutionReportEvent
// -----------------------------------------------------------------------------
// Published after every submission attempt, successful or not.
// -----------------------------------------------------------------------------
struct ExecutionReportEvent {
  domain::Order order;
  ExecutionResult result;
  Timestamp timestamp{};
};

// -----------------------------------------------------------------------------
// PositionUpdateEvent
// -----------------------------------------------------------------------------
// Snapshot of the position immediately after RiskGate::updatePosition().
// -----------------------------------------------------------------------------
struct PositionUpdateEvent {
  domain::Position position;
  double fill_quantity{0.0};  // Signed
  double fill_price{0.0};
  Timestamp timestamp{};
};

}  // namespace tradeloop
