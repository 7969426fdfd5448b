#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace tradeloop {
namespace domain {

// -----------------------------------------------------------------------------
// OrderId
// -----------------------------------------------------------------------------
// Responsibility: Identifies an order for the lifetime of the process.
// Generated by OrderIdGenerator at order creation. The execution coordinator
// uses it as the only key when removing pending orders, so two orders must
// never share an id.
// -----------------------------------------------------------------------------
using OrderId = std::string;

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
// Buy fills increase the signed position, Sell fills decrease it.
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

// -----------------------------------------------------------------------------
// OrderKind
// -----------------------------------------------------------------------------
// Market orders carry no limit price. Limit orders must carry one; the venue
// clients refuse a Limit order without it.
// -----------------------------------------------------------------------------
enum class OrderKind {
  Market,
  Limit,
};

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
// Responsibility: The intent to trade, as synthesized by the orchestrator
// from a TradingSignal.
//
// @details
// Lifecycle: created by TradingOrchestrator, recorded as pending by
// OrderExecutionCoordinator before the venue call, and removed from the
// pending list on submission failure or explicit cancel. No fill state is
// tracked on the order itself.
//
// Plain value type: safe to copy between threads. Copies held by the pending
// list and by events are snapshots.
// -----------------------------------------------------------------------------
struct Order {
  OrderId id;                          // Unique for the process lifetime
  std::string instrument;              // e.g. "ETHUSDT"
  Side side{Side::Buy};
  OrderKind kind{OrderKind::Market};
  double quantity{0.0};                // Always positive; side gives the sign
  std::optional<double> limit_price;   // Set only for Limit orders
  std::int64_t created_at{0};          // Unix seconds
};

// Signed quantity of a fill for this order: +quantity for Buy, -quantity
// for Sell.
inline double signedQuantity(const Order& order) {
  return order.side == Side::Buy ? order.quantity : -order.quantity;
}

inline const char* sideToString(Side s) {
  switch (s) {
    case Side::Buy:  return "Buy";
    case Side::Sell: return "Sell";
  }
  return "Unknown";
}

inline const char* orderKindToString(OrderKind k) {
  switch (k) {
    case OrderKind::Market: return "Market";
    case OrderKind::Limit:  return "Limit";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace tradeloop
