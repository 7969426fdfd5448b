#pragma once

#include "tradeloop/domain/order.hpp"

#include <string>

namespace tradeloop {
namespace domain {

// -----------------------------------------------------------------------------
// TradingSignal
// -----------------------------------------------------------------------------
// A strategy's recommendation for one instrument. Ephemeral: produced by a
// strategy during a decision cycle and consumed immediately by the
// orchestrator, never stored.
// -----------------------------------------------------------------------------
struct TradingSignal {
  std::string instrument;
  Side action{Side::Buy};
  double confidence{0.0};    // In [0, 1]
  double target_price{0.0};  // Used as reference and fill price downstream
  double quantity{0.0};
};

}  // namespace domain
}  // namespace tradeloop
