#pragma once

#include <cstdint>

namespace tradeloop {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract time source
// -----------------------------------------------------------------------------
//
// @brief  Abstracts "now" away from std::chrono::system_clock so components
//         that stamp data (simulated venue prices, order created_at) can be
//         driven deterministically in tests.
//
// @details
//   - LiveTimeProvider       → delegates to std::chrono::system_clock.
//   - SimulationTimeProvider → returns a value set by the caller.
//
// Components hold `const ITimeProvider&`; the provider must outlive them.
//
// Thread-safety contract:
//   now_ms() must be safe to call concurrently. Collectors for different
//   instruments and the decision loop all read the clock.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Epoch milliseconds.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace tradeloop
