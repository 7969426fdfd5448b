#include "tradeloop/venue/simulated_venue_client.hpp"
#include "tradeloop/time/time_utils.hpp"

#include <iostream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace tradeloop {

SimulatedVenueClient::SimulatedVenueClient(const ITimeProvider& clock)
    : SimulatedVenueClient(clock, Options{}) {}

SimulatedVenueClient::SimulatedVenueClient(const ITimeProvider& clock,
                                           Options options)
    : clock_(clock), options_(std::move(options)), rng_(options_.seed) {
  if (!(options_.min_volume <= options_.max_volume)) {
    throw std::invalid_argument(
        "SimulatedVenueClient: min_volume must not exceed max_volume");
  }
}

double& SimulatedVenueClient::priceLocked(const std::string& instrument) {
  auto it = prices_.find(instrument);
  if (it != prices_.end()) {
    return it->second;
  }
  auto seeded = options_.initial_prices.find(instrument);
  double start = seeded != options_.initial_prices.end()
                     ? seeded->second
                     : options_.default_initial_price;
  return prices_.emplace(instrument, start).first->second;
}

// -----------------------------------------------------------------------------
// getPrice: one random-walk step
// -----------------------------------------------------------------------------
domain::PricePoint SimulatedVenueClient::getPrice(
    const std::string& instrument) {
  if (instrument.empty()) {
    throw VenueError("getPrice: empty instrument");
  }

  std::lock_guard lock(mutex_);
  double& price = priceLocked(instrument);

  std::normal_distribution<double> step(0.0, options_.volatility);
  price *= 1.0 + step(rng_);
  if (price < options_.tick_size) {
    price = options_.tick_size;
  }

  std::uniform_real_distribution<double> volume(options_.min_volume,
                                                options_.max_volume);

  domain::PricePoint point;
  point.instrument = instrument;
  point.price = price;
  point.observed_at = now_seconds(clock_);
  point.volume = volume(rng_);
  return point;
}

// -----------------------------------------------------------------------------
// getOrderBook: symmetric ladder around the current price
// -----------------------------------------------------------------------------
domain::OrderBookSnapshot SimulatedVenueClient::getOrderBook(
    const std::string& instrument) {
  if (instrument.empty()) {
    throw VenueError("getOrderBook: empty instrument");
  }

  std::lock_guard lock(mutex_);
  const double mid = priceLocked(instrument);
  std::uniform_real_distribution<double> size(0.1, 5.0);

  domain::OrderBookSnapshot book;
  book.instrument = instrument;
  book.observed_at = now_seconds(clock_);
  book.bids.reserve(options_.book_depth);
  book.asks.reserve(options_.book_depth);
  for (std::size_t level = 1; level <= options_.book_depth; ++level) {
    const double offset = options_.tick_size * static_cast<double>(level);
    book.bids.push_back({mid - offset, size(rng_)});
    book.asks.push_back({mid + offset, size(rng_)});
  }
  return book;
}

// -----------------------------------------------------------------------------
// submitOrder: shape check, artificial delay, synthetic id
// -----------------------------------------------------------------------------
std::string SimulatedVenueClient::submitOrder(const domain::Order& order) {
  std::string reason;
  if (!isWellFormed(order, &reason)) {
    throw VenueError("order refused: " + reason);
  }

  std::cout << "[SimulatedVenue] " << domain::sideToString(order.side) << " "
            << order.quantity << " " << order.instrument << " ("
            << domain::orderKindToString(order.kind) << ") id=" << order.id
            << "\n";

  std::this_thread::sleep_for(options_.submit_delay);

  {
    std::lock_guard lock(mutex_);
    ++submitted_;
  }
  return "sim_" + order.id;
}

void SimulatedVenueClient::cancelOrder(const domain::OrderId& order_id) {
  std::cout << "[SimulatedVenue] cancel " << order_id << "\n";
}

std::uint64_t SimulatedVenueClient::submittedCount() const {
  std::lock_guard lock(mutex_);
  return submitted_;
}

}  // namespace tradeloop
