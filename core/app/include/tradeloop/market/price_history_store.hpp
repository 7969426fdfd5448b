#pragma once

#include "tradeloop/domain/price_point.hpp"

#include <cstddef>
#include <deque>
#include <map>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tradeloop {

// -----------------------------------------------------------------------------
// PriceHistoryStore — bounded per-instrument price history
// -----------------------------------------------------------------------------
//
// @brief  Shared map from instrument to the most recent `capacity` price
//         samples, in arrival order.
//
// @details
// Write path (collectors): append() pushes the sample to the back of the
// instrument's sequence and evicts from the front while the sequence is
// longer than the capacity. The oldest arrival always goes first; samples
// are never reordered by price or observed_at.
//
// Read path (decision loop): snapshot() and history() copy the data out
// under a shared lock. The decision loop then works on its copy, so no lock
// is held across venue calls or strategy evaluation.
//
// Locking discipline:
//   One std::shared_mutex guards the whole map. Readers share it; append()
//   takes it exclusively. Appends for the same instrument are therefore
//   serialized and none is lost.
//
// Thread model:
//   All public methods are safe to call from any thread.
//
// Ownership:
//   Owned by TradingOrchestrator by value. Collectors receive a reference.
// -----------------------------------------------------------------------------
class PriceHistoryStore {
 public:
  static constexpr std::size_t kDefaultCapacity = 100;

  // @throws std::invalid_argument if capacity is zero.
  explicit PriceHistoryStore(std::size_t capacity = kDefaultCapacity);

  PriceHistoryStore(const PriceHistoryStore&) = delete;
  PriceHistoryStore& operator=(const PriceHistoryStore&) = delete;

  // -------------------------------------------------------------------------
  // append(point)
  // -------------------------------------------------------------------------
  // @brief  Records a sample for point.instrument, trimming the oldest
  //         entries beyond capacity.
  //
  // Thread-safety: Exclusive lock.
  // Side-effects:  Creates the instrument's sequence on first use.
  // -------------------------------------------------------------------------
  void append(domain::PricePoint point);

  // Copy of one instrument's history, oldest first. Empty if unknown.
  std::vector<domain::PricePoint> history(const std::string& instrument) const;

  // -------------------------------------------------------------------------
  // snapshot()
  // -------------------------------------------------------------------------
  // @brief  Copy of every instrument's history, oldest first.
  //
  // @details
  // Returned as an ordered map so a decision cycle walks instruments in a
  // stable order. Consistent across instruments: taken under one shared
  // lock.
  // -------------------------------------------------------------------------
  std::map<std::string, std::vector<domain::PricePoint>> snapshot() const;

  // Number of samples held for the instrument (0 if unknown).
  std::size_t size(const std::string& instrument) const;

  std::vector<std::string> instruments() const;

  std::size_t capacity() const { return capacity_; }

 private:
  const std::size_t capacity_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::deque<domain::PricePoint>> history_;
};

}  // namespace tradeloop
