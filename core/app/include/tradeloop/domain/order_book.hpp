#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tradeloop {
namespace domain {

// One price level of the book: (price, quantity).
struct BookLevel {
  double price{0.0};
  double quantity{0.0};
};

// -----------------------------------------------------------------------------
// OrderBookSnapshot
// -----------------------------------------------------------------------------
//
// @brief  Depth snapshot for one instrument as returned by the venue.
//
// @details
// Bids are ordered best (highest) first, asks best (lowest) first, in the
// order the venue reported them. A snapshot is replaced wholesale on every
// fetch; nothing in the engine merges snapshots incrementally.
//
// Thread model:
//   Value type. Fetched by the decision loop and passed by const reference
//   to strategies for the duration of one evaluation.
// -----------------------------------------------------------------------------
struct OrderBookSnapshot {
  std::string instrument;
  std::vector<BookLevel> bids;
  std::vector<BookLevel> asks;
  std::int64_t observed_at{0};  // Unix seconds
};

}  // namespace domain
}  // namespace tradeloop
