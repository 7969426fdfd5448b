#pragma once

#include "tradeloop/domain/order.hpp"
#include "tradeloop/domain/order_book.hpp"
#include "tradeloop/domain/price_point.hpp"
#include "tradeloop/venue/venue_error.hpp"

#include <string>

namespace tradeloop {

// -----------------------------------------------------------------------------
// IVenueClient — market data and execution collaborator
// -----------------------------------------------------------------------------
//
// @brief  The only boundary between the trading core and the outside world.
//
// @details
// Every method either returns a value or throws VenueError. The core never
// inspects transport details; it only distinguishes success from failure.
//
// Implementations:
//   - SimulatedVenueClient → in-process random-walk market, used offline and
//                            in tests.
//   - ZmqVenueClient       → JSON over a ZeroMQ REQ socket to an external
//                            venue bridge process.
//
// Thread model:
//   Implementations MUST be safe to call concurrently: one collector thread
//   per instrument calls getPrice() while the decision thread calls
//   getOrderBook() and submitOrder().
//
// Ownership:
//   Owned by main() (or the test). The orchestrator and its collectors hold
//   references; the client must outlive them.
// -----------------------------------------------------------------------------
class IVenueClient {
 public:
  virtual ~IVenueClient() = default;

  // Latest price sample for the instrument.
  virtual domain::PricePoint getPrice(const std::string& instrument) = 0;

  // Fresh depth snapshot for the instrument.
  virtual domain::OrderBookSnapshot getOrderBook(
      const std::string& instrument) = 0;

  // -------------------------------------------------------------------------
  // submitOrder(order)
  // -------------------------------------------------------------------------
  // @return The venue's identifier for the accepted order.
  // @throws VenueError if the order is refused or the call fails.
  // -------------------------------------------------------------------------
  virtual std::string submitOrder(const domain::Order& order) = 0;

  // @throws VenueError if the venue reports a failure.
  virtual void cancelOrder(const domain::OrderId& order_id) = 0;
};

// -----------------------------------------------------------------------------
// isWellFormed(order)
// -----------------------------------------------------------------------------
// Shape check shared by the venue clients before accepting a submission:
// non-empty id and instrument, positive quantity, and a positive limit
// price for Limit orders.
// -----------------------------------------------------------------------------
inline bool isWellFormed(const domain::Order& order, std::string* reason) {
  auto fail = [reason](const char* why) {
    if (reason != nullptr) {
      *reason = why;
    }
    return false;
  };

  if (order.id.empty()) {
    return fail("order id is empty");
  }
  if (order.instrument.empty()) {
    return fail("instrument is empty");
  }
  if (!(order.quantity > 0.0)) {
    return fail("quantity must be positive");
  }
  if (order.kind == domain::OrderKind::Limit &&
      (!order.limit_price.has_value() || !(*order.limit_price > 0.0))) {
    return fail("limit order without a positive limit price");
  }
  return true;
}

}  // namespace tradeloop
