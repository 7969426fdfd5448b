#pragma once

#include <cstdint>
#include <string>

namespace tradeloop {
namespace domain {

// -----------------------------------------------------------------------------
// PricePoint — one observed price sample for an instrument
// -----------------------------------------------------------------------------
//
// @brief  Immutable sample produced by the venue's price endpoint and stored
//         in PriceHistoryStore in arrival order.
//
// @details
// observed_at is Unix seconds as reported by the venue client (or by the
// time provider of the simulated venue). The store never reorders samples
// by this field; arrival order is authoritative.
//
// Thread model:
//   Value type. Copied into and out of the history store under its lock.
// -----------------------------------------------------------------------------
struct PricePoint {
  std::string instrument;        // e.g. "BTCUSDT"
  double price{0.0};             // Last traded price
  std::int64_t observed_at{0};   // Unix seconds
  double volume{0.0};            // Traded volume reported with the sample
};

}  // namespace domain
}  // namespace tradeloop
