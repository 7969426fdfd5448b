#include "tradeloop/strategy/strategy_engine.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace tradeloop {

void StrategyEngine::addStrategy(std::unique_ptr<ITradingStrategy> strategy) {
  if (!strategy) {
    throw std::invalid_argument("StrategyEngine: null strategy");
  }
  std::lock_guard lock(mutex_);
  std::cout << "[StrategyEngine] registered " << strategy->name() << "\n";
  strategies_.push_back(std::move(strategy));
}

// -----------------------------------------------------------------------------
// evaluate: every strategy, registration order, failures isolated
// -----------------------------------------------------------------------------
std::vector<StrategySignal> StrategyEngine::evaluate(
    const std::vector<domain::PricePoint>& history,
    const domain::OrderBookSnapshot& book) const {
  std::lock_guard lock(mutex_);

  std::vector<StrategySignal> signals;
  for (const auto& strategy : strategies_) {
    try {
      if (auto signal = strategy->analyze(history, book)) {
        signals.push_back(StrategySignal{strategy->name(), std::move(*signal)});
      }
    } catch (const std::exception& e) {
      std::cerr << "[StrategyEngine] " << strategy->name() << " failed on "
                << book.instrument << ": " << e.what() << "\n";
    }
  }
  return signals;
}

std::size_t StrategyEngine::strategyCount() const {
  std::lock_guard lock(mutex_);
  return strategies_.size();
}

std::vector<std::string> StrategyEngine::strategyNames() const {
  std::lock_guard lock(mutex_);
  std::vector<std::string> names;
  names.reserve(strategies_.size());
  for (const auto& strategy : strategies_) {
    names.push_back(strategy->name());
  }
  return names;
}

}  // namespace tradeloop
