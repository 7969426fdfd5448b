#pragma once

#include "tradeloop/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace tradeloop {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose value is set explicitly with advance_time().
//
// @details
// Tests inject it into SimulatedVenueClient and TradingOrchestrator so that
// price timestamps and order created_at values are reproducible.
//
// Stored as std::atomic<int64_t>: readers on collector and decision threads
// never block the writer. Monotonicity is not enforced; callers may set any
// time they like.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  void advance_time(std::int64_t new_time_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace tradeloop
