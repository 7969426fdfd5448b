#pragma once

#include "tradeloop/domain/order.hpp"

#include <string>
#include <utility>

namespace tradeloop {

// -----------------------------------------------------------------------------
// ExecutionStatus
// -----------------------------------------------------------------------------
//
// @brief  Outcome of one submission attempt as seen by the coordinator.
//
// @details
//   Accepted — the venue acknowledged the order and returned its own id.
//              The order stays in the pending list.
//   Failed   — the venue refused the order or the call failed. The pending
//              record was rolled back; no position was touched.
// -----------------------------------------------------------------------------
enum class ExecutionStatus {
  Accepted,
  Failed,
};

// -----------------------------------------------------------------------------
// ExecutionResult
// -----------------------------------------------------------------------------
// Returned by OrderExecutionCoordinator::submitOrder(). venue_order_id is
// set only when Accepted, error only when Failed.
// -----------------------------------------------------------------------------
struct ExecutionResult {
  ExecutionStatus status{ExecutionStatus::Failed};
  domain::OrderId order_id;
  std::string venue_order_id;
  std::string error;

  bool ok() const { return status == ExecutionStatus::Accepted; }

  static ExecutionResult accepted(domain::OrderId id, std::string venue_id) {
    ExecutionResult r;
    r.status = ExecutionStatus::Accepted;
    r.order_id = std::move(id);
    r.venue_order_id = std::move(venue_id);
    return r;
  }

  static ExecutionResult failed(domain::OrderId id, std::string error) {
    ExecutionResult r;
    r.status = ExecutionStatus::Failed;
    r.order_id = std::move(id);
    r.error = std::move(error);
    return r;
  }
};

inline const char* executionStatusToString(ExecutionStatus s) {
  switch (s) {
    case ExecutionStatus::Accepted: return "Accepted";
    case ExecutionStatus::Failed:   return "Failed";
  }
  return "Unknown";
}

}  // namespace tradeloop
