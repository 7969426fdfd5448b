#pragma once

#include "tradeloop/strategy/i_trading_strategy.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tradeloop {

// -----------------------------------------------------------------------------
// MomentumStrategy
// -----------------------------------------------------------------------------
//
// @brief  Emits a signal in the direction of the recent price move when the
//         move and the traded volume are both large enough.
//
// @details
// Over the window of the newest `lookback` samples (fewer if the history is
// shorter):
//
//   change     = (newest - oldest) / oldest
//   avg_volume = sum(volume) / window_size
//
// A signal is emitted when |change| > threshold AND avg_volume > volume
// floor:
//
//   action       = Buy if change > 0, else Sell
//   confidence   = min(|change|, 1.0)
//   target_price = newest price
//   quantity     = configured order quantity
//
// No signal when the window holds fewer than 2 samples or the oldest price
// is zero. The order book is not consulted.
// -----------------------------------------------------------------------------
class MomentumStrategy final : public ITradingStrategy {
 public:
  static constexpr double kDefaultVolumeFloor = 1000.0;
  static constexpr double kDefaultOrderQuantity = 0.001;

  // @throws std::invalid_argument if lookback < 2 or threshold < 0.
  MomentumStrategy(std::size_t lookback, double threshold,
                   double order_quantity = kDefaultOrderQuantity,
                   double volume_floor = kDefaultVolumeFloor);

  std::optional<domain::TradingSignal> analyze(
      const std::vector<domain::PricePoint>& history,
      const domain::OrderBookSnapshot& book) const override;

  std::string name() const override { return "MomentumStrategy"; }

  std::size_t lookback() const { return lookback_; }
  double threshold() const { return threshold_; }

 private:
  const std::size_t lookback_;
  const double threshold_;
  const double order_quantity_;
  const double volume_floor_;
};

// -----------------------------------------------------------------------------
// windowPriceChange(history, lookback)
// -----------------------------------------------------------------------------
// Relative change between the oldest and newest of the newest `lookback`
// samples. std::nullopt when fewer than 2 samples or the oldest price is
// zero. Shared by MomentumStrategy and the orchestrator's no-signal debug
// line.
// -----------------------------------------------------------------------------
std::optional<double> windowPriceChange(
    const std::vector<domain::PricePoint>& history, std::size_t lookback);

}  // namespace tradeloop
