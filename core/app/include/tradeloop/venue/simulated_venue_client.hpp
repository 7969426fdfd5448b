#pragma once

#include "tradeloop/time/i_time_provider.hpp"
#include "tradeloop/venue/i_venue_client.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>

namespace tradeloop {

// -----------------------------------------------------------------------------
// SimulatedVenueClient — in-process venue
// -----------------------------------------------------------------------------
//
// @brief  IVenueClient that fabricates market data with a seeded random walk
//         and acknowledges every well-formed order after a fixed delay.
//
// @details
// Prices:
//   Each instrument starts at its configured initial price (or
//   default_initial_price) and moves by a normally distributed relative
//   step of standard deviation `volatility` on every getPrice() call.
//   Volume is drawn uniformly from [min_volume, max_volume].
//
// Order book:
//   `book_depth` levels each side around the current price (without
//   advancing the walk), spaced by `tick_size`, best level first.
//
// Orders:
//   submitOrder() refuses malformed orders with VenueError, otherwise
//   sleeps `submit_delay` and returns "sim_<order id>". cancelOrder()
//   always succeeds.
//
// Same seed and same call sequence give the same prices. Timestamps come
// from the injected ITimeProvider.
//
// Thread model:
//   All methods are safe to call concurrently. The random engine and the
//   price table are guarded by one mutex; the submit delay is spent
//   outside it.
//
// Ownership:
//   Owned by main() or the test. Holds a reference to the time provider.
// -----------------------------------------------------------------------------
class SimulatedVenueClient final : public IVenueClient {
 public:
  struct Options {
    std::uint32_t seed{42};
    std::map<std::string, double> initial_prices{{"BTCUSDT", 65000.0},
                                                 {"ETHUSDT", 3500.0}};
    double default_initial_price{100.0};
    double volatility{0.001};
    double min_volume{1500.0};
    double max_volume{5000.0};
    std::size_t book_depth{5};
    double tick_size{0.01};
    std::chrono::milliseconds submit_delay{50};
  };

  explicit SimulatedVenueClient(const ITimeProvider& clock);
  SimulatedVenueClient(const ITimeProvider& clock, Options options);

  domain::PricePoint getPrice(const std::string& instrument) override;
  domain::OrderBookSnapshot getOrderBook(
      const std::string& instrument) override;
  std::string submitOrder(const domain::Order& order) override;
  void cancelOrder(const domain::OrderId& order_id) override;

  std::uint64_t submittedCount() const;

 private:
  // Current price for the instrument, seeding it on first use.
  // Caller holds mutex_.
  double& priceLocked(const std::string& instrument);

  const ITimeProvider& clock_;
  const Options options_;

  mutable std::mutex mutex_;
  std::mt19937 rng_;
  std::unordered_map<std::string, double> prices_;
  std::uint64_t submitted_{0};
};

}  // namespace tradeloop
