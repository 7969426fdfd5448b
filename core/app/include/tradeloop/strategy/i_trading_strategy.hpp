#pragma once

#include "tradeloop/domain/order_book.hpp"
#include "tradeloop/domain/price_point.hpp"
#include "tradeloop/domain/trading_signal.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tradeloop {

// -----------------------------------------------------------------------------
// ITradingStrategy — pluggable signal generator
// -----------------------------------------------------------------------------
//
// @brief  Turns one instrument's price history plus a fresh order book
//         snapshot into zero or one TradingSignal.
//
// @details
// history is ordered oldest first (arrival order, as held by
// PriceHistoryStore). Implementations must not keep references to either
// argument past the call.
//
// A strategy may throw; StrategyEngine logs the failure and carries on with
// the remaining strategies.
//
// Thread model:
//   analyze() is only called from the decision thread, but it must be
//   const-correct: strategies hold configuration, not per-cycle state.
// -----------------------------------------------------------------------------
class ITradingStrategy {
 public:
  virtual ~ITradingStrategy() = default;

  virtual std::optional<domain::TradingSignal> analyze(
      const std::vector<domain::PricePoint>& history,
      const domain::OrderBookSnapshot& book) const = 0;

  virtual std::string name() const = 0;
};

}  // namespace tradeloop
