#pragma once

#include "tradeloop/config/engine_config.hpp"
#include "tradeloop/time/i_time_provider.hpp"
#include "tradeloop/venue/i_venue_client.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tradeloop {

// -----------------------------------------------------------------------------
// ZmqVenueClient — venue bridge client over ZeroMQ REQ/REP
// -----------------------------------------------------------------------------
//
// @brief  Fetches market data from an external venue bridge process that
//         speaks JSON over a ZeroMQ REP socket. Authenticated HTTP, request
//         signing and exchange specifics live in the bridge.
//
// @details
// Request / reply format:
//   → {"op": "price", "symbol": "BTCUSDT"}
//   ← {"status": "ok", "price": "65000.10", "volume": "1234.5",
//      "timestamp": 1700000000}
//
//   → {"op": "depth", "symbol": "BTCUSDT", "limit": 10}
//   ← {"status": "ok", "bids": [["64999.9", "0.5"], ...],
//      "asks": [["65000.1", "0.3"], ...]}
//
//   ← {"status": "error", "error": "<message>"}  on any failure
//
// Numeric fields may be JSON numbers or decimal strings (the exchange
// format). "timestamp" (Unix seconds) and "volume" are optional; the
// injected clock and 0 are used when absent.
//
// Orders never reach the bridge:
//   simulation → logged, acknowledged after kSimulatedSubmitDelay with
//                "sim_<order id>"
//   live       → refused with VenueError
//
// Timeouts:
//   Both send and receive use config.request_timeout. A REQ socket that
//   timed out is stuck mid-exchange, so it is destroyed and recreated
//   lazily on the next request.
//
// Thread model:
//   A REQ socket allows one outstanding request; all requests are
//   serialized on socket_mutex_. Collectors for different instruments
//   therefore queue behind each other on this client.
//
// Ownership:
//   Owns the ZMQ context and socket. Holds a reference to the time
//   provider. Owned by main().
// -----------------------------------------------------------------------------
class ZmqVenueClient final : public IVenueClient {
 public:
  static constexpr std::chrono::milliseconds kSimulatedSubmitDelay{50};
  static constexpr int kDepthLimit = 10;

  ZmqVenueClient(const VenueConfig& config, const ITimeProvider& clock);

  ZmqVenueClient(const ZmqVenueClient&) = delete;
  ZmqVenueClient& operator=(const ZmqVenueClient&) = delete;

  domain::PricePoint getPrice(const std::string& instrument) override;
  domain::OrderBookSnapshot getOrderBook(
      const std::string& instrument) override;
  std::string submitOrder(const domain::Order& order) override;
  void cancelOrder(const domain::OrderId& order_id) override;

  // -------------------------------------------------------------------------
  // parseDecimal(value)
  // -------------------------------------------------------------------------
  // Accepts a JSON number or a string holding a finite decimal number.
  // @throws VenueError for anything else, including "nan" and "inf".
  // -------------------------------------------------------------------------
  static double parseDecimal(const nlohmann::json& value);

  // Unix seconds from a number or decimal string.
  // @throws VenueError when negative or too large for int64.
  static std::int64_t parseTimestamp(const nlohmann::json& value);

  // Decodes a depth side: [[price, qty], ...].
  static std::vector<domain::BookLevel> parseLevels(const nlohmann::json& side);

 private:
  // -------------------------------------------------------------------------
  // request(payload)
  // -------------------------------------------------------------------------
  // @brief  One send/recv exchange with the bridge.
  //
  // @return The reply object, already checked for "status": "ok".
  // @throws VenueError on transport failure, timeout, malformed JSON or an
  //         error reply.
  // -------------------------------------------------------------------------
  nlohmann::json request(const nlohmann::json& payload);

  // Creates the socket if needed. Caller holds socket_mutex_.
  zmq::socket_t& socketLocked();

  const VenueConfig config_;
  const ITimeProvider& clock_;

  std::mutex socket_mutex_;
  zmq::context_t context_{1};
  std::unique_ptr<zmq::socket_t> socket_;
};

}  // namespace tradeloop
