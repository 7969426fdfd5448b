#pragma once

#include "tradeloop/domain/order.hpp"
#include "tradeloop/execution/execution_result.hpp"
#include "tradeloop/venue/i_venue_client.hpp"

#include <cstddef>
#include <mutex>
#include <vector>

namespace tradeloop {

// -----------------------------------------------------------------------------
// OrderExecutionCoordinator — submission and pending-order bookkeeping
// -----------------------------------------------------------------------------
//
// @brief  Forwards approved orders to the venue and keeps the list of
//         orders known to have been sent.
//
// @details
// submitOrder(order):
//   1. Append the order to pending_ (exclusive lock, released before the
//      venue call).
//   2. venue_.submitOrder(order)
//   3. success → the order stays pending; Accepted result with the venue id
//      failure → remove the order from pending_ by id; Failed result
//
// "Pending" means "sent", not "open": accepted orders are never removed
// automatically. Only a failed submission or cancelOrder() removes one.
//
// cancelOrder(id):
//   Removes the record by id and returns true, whether or not the id was
//   present. The venue is asked to cancel only if the order was pending;
//   a venue failure is logged and does not change the outcome.
//
// Thread model:
//   All public methods are safe from any thread. pending_mutex_ is never
//   held across a venue call.
//
// Ownership:
//   Owned by TradingOrchestrator. Holds a reference to the venue client.
// -----------------------------------------------------------------------------
class OrderExecutionCoordinator {
 public:
  explicit OrderExecutionCoordinator(IVenueClient& venue);

  OrderExecutionCoordinator(const OrderExecutionCoordinator&) = delete;
  OrderExecutionCoordinator& operator=(const OrderExecutionCoordinator&) =
      delete;

  // Never throws for venue failures; they come back as a Failed result.
  ExecutionResult submitOrder(const domain::Order& order);

  // Idempotent. Always returns true.
  bool cancelOrder(const domain::OrderId& order_id);

  std::vector<domain::Order> pendingOrders() const;
  std::size_t pendingCount() const;

 private:
  // Removes every pending record with this id. Returns true if one existed.
  bool removePending(const domain::OrderId& order_id);

  IVenueClient& venue_;

  mutable std::mutex pending_mutex_;
  std::vector<domain::Order> pending_;
};

}  // namespace tradeloop
