#pragma once

#include "tradeloop/events/event_types.hpp"
#include "tradeloop/time/i_time_provider.hpp"

#include <chrono>
#include <cstdint>

namespace tradeloop {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
// The time providers speak epoch milliseconds, domain objects carry Unix
// seconds, and events carry a chrono Timestamp. These helpers convert
// between the three. Stateless; safe from any thread.
// -----------------------------------------------------------------------------

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// Unix seconds according to the given provider. Truncates toward zero.
inline std::int64_t now_seconds(const ITimeProvider& clock) {
  return clock.now_ms() / 1000;
}

}  // namespace tradeloop
