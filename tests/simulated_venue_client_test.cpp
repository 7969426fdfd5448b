// =============================================================================
// simulated_venue_client_test.cpp
// =============================================================================
// Unit tests for tradeloop::SimulatedVenueClient.
//
// Validates:
//   - Same seed, same calls → same prices
//   - Samples are stamped by the injected clock and stay above the
//     momentum volume floor with default options
//   - Book ladder shape (depth, ordering, no crossed book)
//   - Well-formed orders are acknowledged with "sim_<id>"; malformed ones
//     are refused with VenueError
// =============================================================================

#include "tradeloop/time/simulation_time_provider.hpp"
#include "tradeloop/venue/simulated_venue_client.hpp"

#include "fake_venue_client.hpp"

#include <gtest/gtest.h>

#include <chrono>

using namespace tradeloop;
using fakes::makeOrder;

class SimulatedVenueClientTest : public ::testing::Test {
 protected:
  static SimulatedVenueClient::Options fastOptions() {
    SimulatedVenueClient::Options options;
    options.submit_delay = std::chrono::milliseconds(0);
    return options;
  }

  SimulationTimeProvider clock{1'700'000'000'500};
  SimulatedVenueClient venue{clock, fastOptions()};
};

// -----------------------------------------------------------------------------
// 1. Reproducibility: two clients with the same seed walk identically.
// -----------------------------------------------------------------------------
TEST_F(SimulatedVenueClientTest, SameSeedSamePrices) {
  SimulatedVenueClient twin(clock, fastOptions());

  for (int i = 0; i < 20; ++i) {
    auto a = venue.getPrice("BTCUSDT");
    auto b = twin.getPrice("BTCUSDT");
    EXPECT_DOUBLE_EQ(a.price, b.price);
    EXPECT_DOUBLE_EQ(a.volume, b.volume);
  }
}

// -----------------------------------------------------------------------------
// 2. Sample fields: instrument, clock timestamp, plausible price and volume.
// -----------------------------------------------------------------------------
TEST_F(SimulatedVenueClientTest, PriceSampleFields) {
  auto point = venue.getPrice("ETHUSDT");

  EXPECT_EQ(point.instrument, "ETHUSDT");
  EXPECT_EQ(point.observed_at, 1'700'000'000);
  EXPECT_NEAR(point.price, 3500.0, 3500.0 * 0.05);
  EXPECT_GE(point.volume, 1500.0);
  EXPECT_LE(point.volume, 5000.0);

  clock.advance_time(1'700'000'060'000);
  EXPECT_EQ(venue.getPrice("ETHUSDT").observed_at, 1'700'000'060);
}

// -----------------------------------------------------------------------------
// 3. Unknown instruments start at the default price.
// -----------------------------------------------------------------------------
TEST_F(SimulatedVenueClientTest, UnknownInstrumentUsesDefaultPrice) {
  auto point = venue.getPrice("XYZUSDT");
  EXPECT_NEAR(point.price, 100.0, 5.0);
  EXPECT_THROW(venue.getPrice(""), VenueError);
}

// -----------------------------------------------------------------------------
// 4. Book: book_depth levels per side, best first, bid below ask.
// -----------------------------------------------------------------------------
TEST_F(SimulatedVenueClientTest, OrderBookLadder) {
  auto book = venue.getOrderBook("BTCUSDT");

  EXPECT_EQ(book.instrument, "BTCUSDT");
  ASSERT_EQ(book.bids.size(), 5u);
  ASSERT_EQ(book.asks.size(), 5u);
  EXPECT_LT(book.bids.front().price, book.asks.front().price);
  for (std::size_t i = 1; i < book.bids.size(); ++i) {
    EXPECT_LT(book.bids[i].price, book.bids[i - 1].price);
    EXPECT_GT(book.asks[i].price, book.asks[i - 1].price);
  }
  for (const auto& level : book.bids) {
    EXPECT_GT(level.quantity, 0.0);
  }
}

// -----------------------------------------------------------------------------
// 5. Submission: acknowledged with a synthetic venue id.
// -----------------------------------------------------------------------------
TEST_F(SimulatedVenueClientTest, SubmitReturnsSyntheticId) {
  auto id = venue.submitOrder(makeOrder("s-1", "BTCUSDT", domain::Side::Buy, 0.5));

  EXPECT_EQ(id, "sim_s-1");
  EXPECT_EQ(venue.submittedCount(), 1u);
  EXPECT_NO_THROW(venue.cancelOrder("s-1"));
}

// -----------------------------------------------------------------------------
// 6. Malformed orders are refused and not counted.
// Why: The venue is the last line of defence for shape errors the risk
//      gate does not look at.
// -----------------------------------------------------------------------------
TEST_F(SimulatedVenueClientTest, MalformedOrdersRefused) {
  auto zero_qty = makeOrder("s-2", "BTCUSDT", domain::Side::Buy, 0.0);
  EXPECT_THROW(venue.submitOrder(zero_qty), VenueError);

  auto no_instrument = makeOrder("s-3", "", domain::Side::Sell, 1.0);
  EXPECT_THROW(venue.submitOrder(no_instrument), VenueError);

  auto limit_without_price = makeOrder("s-4", "BTCUSDT", domain::Side::Buy, 1.0);
  limit_without_price.kind = domain::OrderKind::Limit;
  EXPECT_THROW(venue.submitOrder(limit_without_price), VenueError);

  EXPECT_EQ(venue.submittedCount(), 0u);
}
