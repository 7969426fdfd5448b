#pragma once

#include "tradeloop/domain/order.hpp"
#include "tradeloop/domain/position.hpp"
#include "tradeloop/domain/risk_limits.hpp"

#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tradeloop {

// -----------------------------------------------------------------------------
// RiskDecision
// -----------------------------------------------------------------------------
// Outcome of a pre-trade check. A rejection is a value, not an error: the
// orchestrator logs the reason and moves on to the next signal.
// -----------------------------------------------------------------------------
struct RiskDecision {
  bool approved{false};
  std::string reason;  // Empty when approved

  static RiskDecision approve() { return RiskDecision{true, {}}; }
  static RiskDecision reject(std::string why) {
    return RiskDecision{false, std::move(why)};
  }
};

// -----------------------------------------------------------------------------
// RiskGate — pre-trade validator and post-trade position/PnL tracker
// -----------------------------------------------------------------------------
//
// @brief  Validates orders against RiskLimits before submission and applies
//         fills to the per-instrument Position map after a successful
//         submission.
//
// @details
// Pre-trade gates, evaluated in this fixed order, first failure wins:
//
//   1. Daily loss  : dailyPnl() < -max_daily_loss
//   2. Position    : |current_qty + signed(order)| > max_position_size
//   3. Trade loss  : quantity * reference_price * stop_loss_pct
//                      > max_loss_per_trade
//
// All gates are pure reads. The daily PnL and the position are read under
// their own locks; the two reads are not atomic with respect to each other.
//
// Post-trade update (updatePosition):
//   new_qty = old_qty + signed_qty
//   new_avg = (old_qty * old_avg + signed_qty * fill_price) / new_qty
//   (average left unchanged when new_qty is exactly 0)
//
//   When the fill reduces or reverses the position, the closed portion
//   books realized PnL against the cost basis of the open quantity:
//     closed   = min(|old_qty|, |signed_qty|)
//     realized = closed * (fill_price - basis) * sign(old_qty)
//   The amount is added to the position's realized_pnl and to dailyPnl().
//
//   The basis is tracked apart from average_price. The average formula
//   above yields a value unrelated to any fill once a position reverses
//   (long 2@10, sell 3@8 gives avg 4); the basis of the reversed remainder
//   is the reversing fill's price (8). Adds re-weight the basis, partial
//   closes keep it, and a flat position clears it.
//
// Locking discipline:
//   positions_mutex_ (std::shared_mutex) guards positions_: shared for
//   reads, exclusive for updatePosition(). pnl_mutex_ (std::mutex) guards
//   daily_pnl_. When both are needed (updatePosition booking realized PnL)
//   the position lock is released before pnl_mutex_ is taken; the two are
//   never held together.
//
// Thread model:
//   All public methods are safe to call from any thread.
//
// Ownership:
//   Owned by TradingOrchestrator by value. Limits are copied in.
// -----------------------------------------------------------------------------
class RiskGate {
 public:
  explicit RiskGate(const domain::RiskLimits& limits = {});

  RiskGate(const RiskGate&) = delete;
  RiskGate& operator=(const RiskGate&) = delete;

  // -------------------------------------------------------------------------
  // check(order, reference_price)
  // -------------------------------------------------------------------------
  // @brief  Runs the three gates and returns the decision with its reason.
  //
  // Thread-safety: Shared lock on positions, exclusive lock on daily PnL,
  //                taken one after the other.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  RiskDecision check(const domain::Order& order, double reference_price) const;

  // check() plus a "[RiskGate] Order rejected: ..." line on rejection.
  bool validateOrder(const domain::Order& order, double reference_price) const;

  // -------------------------------------------------------------------------
  // updatePosition(instrument, signed_quantity, fill_price)
  // -------------------------------------------------------------------------
  // @brief  Applies a fill. Creates the Position on first use; never
  //         deletes it.
  //
  // @return Copy of the position after the update.
  //
  // Thread-safety: Exclusive lock on positions, then (if PnL was realized)
  //                the PnL lock.
  // -------------------------------------------------------------------------
  domain::Position updatePosition(const std::string& instrument,
                                  double signed_quantity, double fill_price);

  // Copy of one position, std::nullopt if the instrument never traded.
  std::optional<domain::Position> position(const std::string& instrument) const;

  std::vector<domain::Position> positions() const;

  double dailyPnl() const;

  // Adds an externally computed realized PnL delta (fees, reconciliation).
  void recordRealizedPnl(double delta);

  // Starts a new trading day.
  void resetDailyPnl();

  const domain::RiskLimits& limits() const { return limits_; }

 private:
  const domain::RiskLimits limits_;

  mutable std::shared_mutex positions_mutex_;
  std::unordered_map<std::string, domain::Position> positions_;
  std::unordered_map<std::string, double> cost_basis_;  // Guarded by positions_mutex_

  mutable std::mutex pnl_mutex_;
  double daily_pnl_{0.0};
};

}  // namespace tradeloop
