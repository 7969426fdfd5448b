#pragma once

#include "tradeloop/time/i_time_provider.hpp"

#include <cstdint>

namespace tradeloop {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock time source
// -----------------------------------------------------------------------------
// Used by main() for real runs. Stateless; safe to share between threads.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  LiveTimeProvider() = default;

  std::int64_t now_ms() const override;
};

}  // namespace tradeloop
