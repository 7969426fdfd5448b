#pragma once

#include <string>

namespace tradeloop {
namespace domain {

// -----------------------------------------------------------------------------
// Position — per-instrument holding
// -----------------------------------------------------------------------------
//
// @brief  Net signed quantity and volume-weighted average entry price for a
//         single instrument.
//
// @details
// Sign convention for quantity:
//   positive → net long
//   negative → net short
//   zero     → flat (the record is kept, never deleted)
//
// average_price follows
//   (prev_qty * prev_avg + signed_fill_qty * fill_price) / new_qty
// and is left untouched when new_qty is exactly zero.
//
// realized_pnl accumulates the profit/loss booked when a fill closes part or
// all of the existing position (see RiskGate::updatePosition).
//
// unrealized_pnl is carried for reporting but is not re-marked by the engine.
//
// Thread model:
//   The authoritative copy lives in RiskGate behind a shared_mutex. Readers
//   receive copies.
// -----------------------------------------------------------------------------
struct Position {
  std::string instrument;
  double quantity{0.0};
  double average_price{0.0};
  double unrealized_pnl{0.0};
  double realized_pnl{0.0};
};

}  // namespace domain
}  // namespace tradeloop
