#pragma once

namespace tradeloop {
namespace domain {

// -----------------------------------------------------------------------------
// RiskLimits — engine-wide risk thresholds
// -----------------------------------------------------------------------------
//
// @brief  Configuration consumed by RiskGate for pre-trade validation.
//
// @details
// Loaded by ConfigLoader (JSON file, "risk" object) and copied into RiskGate
// at construction. Never mutated at runtime.
//
// Sign convention:
//   max_daily_loss and max_loss_per_trade are POSITIVE magnitudes. The daily
//   gate rejects when daily PnL < -max_daily_loss.
//
// take_profit_pct is carried as configuration only; no gate reads it.
// -----------------------------------------------------------------------------
struct RiskLimits {
  /// Maximum absolute net quantity per instrument after a fill.
  double max_position_size{1000.0};

  /// Maximum tolerated loss for a single order, estimated as
  /// quantity * reference_price * stop_loss_pct.
  double max_loss_per_trade{100.0};

  /// Maximum cumulative loss for the trading day (positive magnitude).
  double max_daily_loss{500.0};

  /// Stop-loss distance as a fraction of the reference price.
  double stop_loss_pct{0.02};

  /// Take-profit distance as a fraction of the reference price.
  double take_profit_pct{0.04};
};

}  // namespace domain
}  // namespace tradeloop
