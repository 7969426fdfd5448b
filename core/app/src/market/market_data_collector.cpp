#include "tradeloop/market/market_data_collector.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace tradeloop {

MarketDataCollector::MarketDataCollector(std::string instrument,
                                         IVenueClient& venue,
                                         PriceHistoryStore& store,
                                         std::chrono::milliseconds interval)
    : instrument_(std::move(instrument)),
      venue_(venue),
      store_(store),
      interval_(interval) {}

// -----------------------------------------------------------------------------
// run(): loop-top cancellation check, fetch, cancellable sleep
// -----------------------------------------------------------------------------
void MarketDataCollector::run(const CancellationToken& token) {
  std::cout << "[MarketDataCollector] " << instrument_ << " started (every "
            << interval_.count() << "ms)\n";

  while (!token.isCancelled()) {
    collectOnce();
    if (token.waitFor(interval_)) {
      break;
    }
  }

  std::cout << "[MarketDataCollector] " << instrument_ << " stopped after "
            << samples_collected_.load() << " samples, "
            << fetch_failures_.load() << " failures\n";
}

// -----------------------------------------------------------------------------
// collectOnce(): fetch and append, or log and skip
// -----------------------------------------------------------------------------
bool MarketDataCollector::collectOnce() {
  try {
    domain::PricePoint point = venue_.getPrice(instrument_);

    // Some venues echo a normalized symbol; key the history by ours.
    point.instrument = instrument_;

    std::cout << "[MarketDataCollector] " << instrument_
              << " price=" << point.price << " volume=" << point.volume
              << "\n";

    store_.append(std::move(point));
    samples_collected_.fetch_add(1, std::memory_order_relaxed);
    return true;

  } catch (const std::exception& e) {
    fetch_failures_.fetch_add(1, std::memory_order_relaxed);
    std::cerr << "[MarketDataCollector] " << instrument_
              << " fetch failed: " << e.what() << "\n";
    return false;
  }
}

}  // namespace tradeloop
