#include "tradeloop/risk/risk_gate.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

namespace tradeloop {

RiskGate::RiskGate(const domain::RiskLimits& limits) : limits_(limits) {}

// -----------------------------------------------------------------------------
// check: daily loss → position size → per-trade loss
// -----------------------------------------------------------------------------
RiskDecision RiskGate::check(const domain::Order& order,
                             double reference_price) const {
  // --- Gate 1: daily loss ----------------------------------------------------
  const double pnl = dailyPnl();
  if (pnl < -limits_.max_daily_loss) {
    std::ostringstream why;
    why << "daily loss limit reached (pnl=" << pnl
        << ", limit=" << limits_.max_daily_loss << ")";
    return RiskDecision::reject(why.str());
  }

  // --- Gate 2: resulting position size ---------------------------------------
  double current_qty = 0.0;
  {
    std::shared_lock lock(positions_mutex_);
    auto it = positions_.find(order.instrument);
    if (it != positions_.end()) {
      current_qty = it->second.quantity;
    }
  }
  const double resulting_qty = current_qty + domain::signedQuantity(order);
  if (std::abs(resulting_qty) > limits_.max_position_size) {
    std::ostringstream why;
    why << "position limit exceeded for " << order.instrument
        << " (resulting=" << resulting_qty
        << ", limit=" << limits_.max_position_size << ")";
    return RiskDecision::reject(why.str());
  }

  // --- Gate 3: estimated loss for this trade ---------------------------------
  const double potential_loss =
      order.quantity * reference_price * limits_.stop_loss_pct;
  if (potential_loss > limits_.max_loss_per_trade) {
    std::ostringstream why;
    why << "per-trade loss limit exceeded (potential=" << potential_loss
        << ", limit=" << limits_.max_loss_per_trade << ")";
    return RiskDecision::reject(why.str());
  }

  return RiskDecision::approve();
}

bool RiskGate::validateOrder(const domain::Order& order,
                             double reference_price) const {
  RiskDecision decision = check(order, reference_price);
  if (!decision.approved) {
    std::cerr << "[RiskGate] Order rejected: " << order.id << " "
              << domain::sideToString(order.side) << " " << order.quantity
              << " " << order.instrument << ": " << decision.reason << "\n";
  }
  return decision.approved;
}

// -----------------------------------------------------------------------------
// updatePosition: average-price update plus realized PnL on the closed part
// -----------------------------------------------------------------------------
domain::Position RiskGate::updatePosition(const std::string& instrument,
                                          double signed_quantity,
                                          double fill_price) {
  domain::Position snapshot;
  double realized = 0.0;

  {
    std::unique_lock lock(positions_mutex_);

    domain::Position& pos = positions_[instrument];
    if (pos.instrument.empty()) {
      pos.instrument = instrument;
    }

    const double old_qty = pos.quantity;
    const double old_avg = pos.average_price;
    double& basis = cost_basis_[instrument];

    // Opposite signs: the fill closes min(|old|, |fill|) of the position.
    const double closed =
        old_qty * signed_quantity < 0.0
            ? std::min(std::abs(old_qty), std::abs(signed_quantity))
            : 0.0;
    if (closed > 0.0) {
      const double direction = old_qty > 0.0 ? 1.0 : -1.0;
      realized = closed * (fill_price - basis) * direction;
      pos.realized_pnl += realized;
    }

    const double new_qty = old_qty + signed_quantity;
    if (new_qty != 0.0) {
      pos.average_price =
          (old_qty * old_avg + signed_quantity * fill_price) / new_qty;
    }

    // Cost basis: weighted on adds, kept on partial closes, the fill price
    // for whatever is left after a reversal.
    if (new_qty == 0.0) {
      basis = 0.0;
    } else if (closed == 0.0) {
      basis = (std::abs(old_qty) * basis +
               std::abs(signed_quantity) * fill_price) /
              std::abs(new_qty);
    } else if (old_qty * new_qty < 0.0) {
      basis = fill_price;
    }
    pos.quantity = new_qty;

    snapshot = pos;
  }

  if (realized != 0.0) {
    recordRealizedPnl(realized);
  }

  return snapshot;
}

std::optional<domain::Position> RiskGate::position(
    const std::string& instrument) const {
  std::shared_lock lock(positions_mutex_);
  auto it = positions_.find(instrument);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Position> RiskGate::positions() const {
  std::shared_lock lock(positions_mutex_);
  std::vector<domain::Position> result;
  result.reserve(positions_.size());
  for (const auto& [instrument, pos] : positions_) {
    result.push_back(pos);
  }
  return result;
}

double RiskGate::dailyPnl() const {
  std::lock_guard lock(pnl_mutex_);
  return daily_pnl_;
}

void RiskGate::recordRealizedPnl(double delta) {
  std::lock_guard lock(pnl_mutex_);
  daily_pnl_ += delta;
}

void RiskGate::resetDailyPnl() {
  std::lock_guard lock(pnl_mutex_);
  daily_pnl_ = 0.0;
}

}  // namespace tradeloop
