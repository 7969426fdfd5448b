#pragma once

#include "tradeloop/concurrent/cancellation_token.hpp"
#include "tradeloop/market/price_history_store.hpp"
#include "tradeloop/venue/i_venue_client.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace tradeloop {

// -----------------------------------------------------------------------------
// MarketDataCollector — per-instrument price sampling task
// -----------------------------------------------------------------------------
//
// @brief  Periodically fetches the latest price for ONE instrument and
//         appends it to the shared PriceHistoryStore.
//
// @details
// Each cycle:
//   1. venue_.getPrice(instrument_)
//   2. on success → store_.append(point)
//      on failure → log to std::cerr and skip (no retry, no backoff)
//   3. wait `interval_` on the cancellation token, whatever the outcome
//
// A failure never escapes run(). One instrument's collector failing does
// not affect any other collector or the decision loop.
//
// Thread model:
//   run() blocks the calling thread until the token is cancelled. The
//   orchestrator calls it on a dedicated std::thread, one per instrument.
//   collectOnce() may be called directly from tests.
//
// Ownership:
//   Owned by TradingOrchestrator for the duration of one start().
//   Holds references to the venue client and the history store; both must
//   outlive the collector.
// -----------------------------------------------------------------------------
class MarketDataCollector {
 public:
  MarketDataCollector(std::string instrument, IVenueClient& venue,
                      PriceHistoryStore& store,
                      std::chrono::milliseconds interval);

  MarketDataCollector(const MarketDataCollector&) = delete;
  MarketDataCollector& operator=(const MarketDataCollector&) = delete;

  // -------------------------------------------------------------------------
  // run(token)
  // -------------------------------------------------------------------------
  // @brief  Collect loop. Returns once the token is cancelled.
  //
  // @details
  // The token is checked at the top of every iteration and the inter-cycle
  // sleep is token.waitFor(interval_), so a cancel wakes the task at once.
  // An in-flight getPrice() is never interrupted.
  // -------------------------------------------------------------------------
  void run(const CancellationToken& token);

  // One fetch/append cycle. Returns true if a sample was recorded.
  bool collectOnce();

  const std::string& instrument() const { return instrument_; }

  std::uint64_t samplesCollected() const { return samples_collected_.load(); }
  std::uint64_t fetchFailures() const { return fetch_failures_.load(); }

 private:
  const std::string instrument_;
  IVenueClient& venue_;
  PriceHistoryStore& store_;
  const std::chrono::milliseconds interval_;

  std::atomic<std::uint64_t> samples_collected_{0};
  std::atomic<std::uint64_t> fetch_failures_{0};
};

}  // namespace tradeloop
