#pragma once

#include "tradeloop/events/event_types.hpp"

#include <variant>

namespace tradeloop {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// Single envelope type carried by the EventBus. Subscribers pick the
// alternative they care about with EventBus::subscribe<T>() or
// std::get_if.
// -----------------------------------------------------------------------------
using Event = std::variant<
    SignalEvent,
    RiskRejectEvent,
    ExecutionReportEvent,
    PositionUpdateEvent>;

}  // namespace tradeloop
