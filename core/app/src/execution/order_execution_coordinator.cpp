#include "tradeloop/execution/order_execution_coordinator.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <string>
#include <utility>

namespace tradeloop {

OrderExecutionCoordinator::OrderExecutionCoordinator(IVenueClient& venue)
    : venue_(venue) {}

// -----------------------------------------------------------------------------
// submitOrder: record intent, call venue, roll back on failure
// -----------------------------------------------------------------------------
ExecutionResult OrderExecutionCoordinator::submitOrder(
    const domain::Order& order) {
  {
    std::lock_guard lock(pending_mutex_);
    pending_.push_back(order);
  }

  try {
    std::string venue_id = venue_.submitOrder(order);
    std::cout << "[OrderExecutionCoordinator] " << order.id << " accepted as "
              << venue_id << "\n";
    return ExecutionResult::accepted(order.id, std::move(venue_id));

  } catch (const std::exception& e) {
    removePending(order.id);
    std::cerr << "[OrderExecutionCoordinator] " << order.id
              << " submission failed: " << e.what() << "\n";
    return ExecutionResult::failed(order.id, e.what());
  }
}

// -----------------------------------------------------------------------------
// cancelOrder: drop the in-memory record, best-effort venue cancel
// -----------------------------------------------------------------------------
bool OrderExecutionCoordinator::cancelOrder(const domain::OrderId& order_id) {
  if (!removePending(order_id)) {
    return true;
  }

  try {
    venue_.cancelOrder(order_id);
  } catch (const std::exception& e) {
    std::cerr << "[OrderExecutionCoordinator] venue cancel for " << order_id
              << " failed: " << e.what() << "\n";
  }
  return true;
}

std::vector<domain::Order> OrderExecutionCoordinator::pendingOrders() const {
  std::lock_guard lock(pending_mutex_);
  return pending_;
}

std::size_t OrderExecutionCoordinator::pendingCount() const {
  std::lock_guard lock(pending_mutex_);
  return pending_.size();
}

bool OrderExecutionCoordinator::removePending(const domain::OrderId& order_id) {
  std::lock_guard lock(pending_mutex_);
  auto it = std::remove_if(
      pending_.begin(), pending_.end(),
      [&order_id](const domain::Order& o) { return o.id == order_id; });
  const bool found = it != pending_.end();
  pending_.erase(it, pending_.end());
  return found;
}

}  // namespace tradeloop
