#include "tradeloop/strategy/momentum_strategy.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace tradeloop {

namespace {

// Index of the oldest sample inside the window of the newest `lookback`.
std::size_t windowBegin(const std::vector<domain::PricePoint>& history,
                        std::size_t lookback) {
  return history.size() > lookback ? history.size() - lookback : 0;
}

}  // namespace

std::optional<double> windowPriceChange(
    const std::vector<domain::PricePoint>& history, std::size_t lookback) {
  const std::size_t begin = windowBegin(history, lookback);
  if (history.size() - begin < 2) {
    return std::nullopt;
  }

  const double oldest = history[begin].price;
  const double newest = history.back().price;
  if (oldest == 0.0) {
    return std::nullopt;
  }
  return (newest - oldest) / oldest;
}

MomentumStrategy::MomentumStrategy(std::size_t lookback, double threshold,
                                   double order_quantity, double volume_floor)
    : lookback_(lookback),
      threshold_(threshold),
      order_quantity_(order_quantity),
      volume_floor_(volume_floor) {
  if (lookback_ < 2) {
    throw std::invalid_argument("MomentumStrategy lookback must be >= 2");
  }
  if (threshold_ < 0.0) {
    throw std::invalid_argument("MomentumStrategy threshold must be >= 0");
  }
}

// -----------------------------------------------------------------------------
// analyze: window change + average volume gate
// -----------------------------------------------------------------------------
std::optional<domain::TradingSignal> MomentumStrategy::analyze(
    const std::vector<domain::PricePoint>& history,
    const domain::OrderBookSnapshot& /*book*/) const {
  const auto change = windowPriceChange(history, lookback_);
  if (!change) {
    return std::nullopt;
  }

  const std::size_t begin = windowBegin(history, lookback_);
  const std::size_t window = history.size() - begin;

  double volume_sum = 0.0;
  for (std::size_t i = begin; i < history.size(); ++i) {
    volume_sum += history[i].volume;
  }
  const double avg_volume = volume_sum / static_cast<double>(window);

  if (!(std::abs(*change) > threshold_) || !(avg_volume > volume_floor_)) {
    return std::nullopt;
  }

  domain::TradingSignal signal;
  signal.instrument = history.back().instrument;
  signal.action = *change > 0.0 ? domain::Side::Buy : domain::Side::Sell;
  signal.confidence = std::min(std::abs(*change), 1.0);
  signal.target_price = history.back().price;
  signal.quantity = order_quantity_;
  return signal;
}

}  // namespace tradeloop
