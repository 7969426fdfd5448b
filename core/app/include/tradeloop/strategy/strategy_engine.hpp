#pragma once

#include "tradeloop/domain/order_book.hpp"
#include "tradeloop/domain/price_point.hpp"
#include "tradeloop/domain/trading_signal.hpp"
#include "tradeloop/strategy/i_trading_strategy.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tradeloop {

// A signal together with the name of the strategy that produced it.
struct StrategySignal {
  std::string strategy_name;
  domain::TradingSignal signal;
};

// -----------------------------------------------------------------------------
// StrategyEngine — registry of signal generators
// -----------------------------------------------------------------------------
//
// @brief  Owns the registered strategies and evaluates all of them against
//         one instrument's history and order book.
//
// @details
// evaluate() returns every emitted signal in registration order. There is
// no arbitration between strategies: the orchestrator processes all of them.
// A strategy that throws is logged and skipped for that call only.
//
// Thread model:
//   addStrategy() and evaluate() may run on different threads; the registry
//   is guarded by a mutex. Strategies themselves are only invoked from the
//   thread calling evaluate().
//
// Ownership:
//   Owns strategies via std::unique_ptr. Owned by TradingOrchestrator.
// -----------------------------------------------------------------------------
class StrategyEngine {
 public:
  StrategyEngine() = default;

  StrategyEngine(const StrategyEngine&) = delete;
  StrategyEngine& operator=(const StrategyEngine&) = delete;

  // @throws std::invalid_argument on a null strategy.
  void addStrategy(std::unique_ptr<ITradingStrategy> strategy);

  std::vector<StrategySignal> evaluate(
      const std::vector<domain::PricePoint>& history,
      const domain::OrderBookSnapshot& book) const;

  std::size_t strategyCount() const;
  std::vector<std::string> strategyNames() const;

 private:
  mutable std::mutex mutex_;
  std::vector<std::unique_ptr<ITradingStrategy>> strategies_;
};

}  // namespace tradeloop
