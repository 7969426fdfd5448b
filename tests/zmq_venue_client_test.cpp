// =============================================================================
// zmq_venue_client_test.cpp
// =============================================================================
// Unit tests for tradeloop::ZmqVenueClient.
//
// Validates:
//   - Decimal decoding of exchange-style string numbers
//   - Depth level decoding
//   - Price and depth requests against a scripted REP bridge
//   - Error replies and timeouts surface as VenueError
//   - Order handling in simulation vs live mode
// =============================================================================

#include "tradeloop/time/simulation_time_provider.hpp"
#include "tradeloop/venue/zmq_venue_client.hpp"

#include "fake_venue_client.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace tradeloop;
using fakes::makeOrder;

namespace {

// REP socket that answers each incoming request with the next scripted
// reply and records what it received.
class ScriptedBridge {
 public:
  ScriptedBridge(const std::string& endpoint, std::vector<std::string> replies)
      : socket_(context_, zmq::socket_type::rep), replies_(std::move(replies)) {
    socket_.set(zmq::sockopt::linger, 0);
    socket_.set(zmq::sockopt::rcvtimeo, 2000);
    socket_.bind(endpoint);
    thread_ = std::thread([this] { serve(); });
  }

  ~ScriptedBridge() {
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  std::vector<nlohmann::json> requests() {
    if (thread_.joinable()) {
      thread_.join();
    }
    return requests_;
  }

 private:
  void serve() {
    for (const auto& reply : replies_) {
      zmq::message_t request;
      if (!socket_.recv(request, zmq::recv_flags::none).has_value()) {
        return;
      }
      requests_.push_back(nlohmann::json::parse(request.to_string()));
      socket_.send(zmq::buffer(reply), zmq::send_flags::none);
    }
  }

  zmq::context_t context_{1};
  zmq::socket_t socket_;
  std::vector<std::string> replies_;
  std::vector<nlohmann::json> requests_;
  std::thread thread_;
};

VenueConfig bridgeConfig(const std::string& endpoint, bool simulation = true) {
  VenueConfig config;
  config.bridge_endpoint = endpoint;
  config.simulation = simulation;
  config.request_timeout = std::chrono::milliseconds(300);
  return config;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. parseDecimal: numbers and decimal strings, nothing else.
// -----------------------------------------------------------------------------
TEST(ZmqVenueClientParseTest, ParseDecimal) {
  EXPECT_DOUBLE_EQ(ZmqVenueClient::parseDecimal(65000.5), 65000.5);
  EXPECT_DOUBLE_EQ(ZmqVenueClient::parseDecimal("64999.90000000"), 64999.9);
  EXPECT_DOUBLE_EQ(ZmqVenueClient::parseDecimal(12), 12.0);

  EXPECT_THROW(ZmqVenueClient::parseDecimal("12abc"), VenueError);
  EXPECT_THROW(ZmqVenueClient::parseDecimal(""), VenueError);
  EXPECT_THROW(ZmqVenueClient::parseDecimal(nullptr), VenueError);
  EXPECT_THROW(ZmqVenueClient::parseDecimal(nlohmann::json::array()),
               VenueError);
}

// -----------------------------------------------------------------------------
// 2. parseLevels keeps venue order and rejects malformed entries.
// -----------------------------------------------------------------------------
TEST(ZmqVenueClientParseTest, ParseLevels) {
  auto levels = ZmqVenueClient::parseLevels(
      nlohmann::json::parse(R"([["100.5", "1.25"], [100.4, 3]])"));
  ASSERT_EQ(levels.size(), 2u);
  EXPECT_DOUBLE_EQ(levels[0].price, 100.5);
  EXPECT_DOUBLE_EQ(levels[0].quantity, 1.25);
  EXPECT_DOUBLE_EQ(levels[1].price, 100.4);

  EXPECT_THROW(ZmqVenueClient::parseLevels(nlohmann::json::parse(R"([["1"]])")),
               VenueError);
  EXPECT_THROW(ZmqVenueClient::parseLevels(nlohmann::json::object()),
               VenueError);
}

// -----------------------------------------------------------------------------
// 2b. Non-finite decimals and unrepresentable timestamps are refused.
// Why: Casting NaN or an out-of-range double to int64 is undefined.
// -----------------------------------------------------------------------------
TEST(ZmqVenueClientParseTest, RejectsNonFiniteAndOutOfRange) {
  EXPECT_THROW(ZmqVenueClient::parseDecimal("nan"), VenueError);
  EXPECT_THROW(ZmqVenueClient::parseDecimal("inf"), VenueError);
  EXPECT_THROW(ZmqVenueClient::parseDecimal("1e999"), VenueError);

  EXPECT_EQ(ZmqVenueClient::parseTimestamp(1700000000), 1'700'000'000);
  EXPECT_EQ(ZmqVenueClient::parseTimestamp("1700000000"), 1'700'000'000);
  EXPECT_THROW(ZmqVenueClient::parseTimestamp("nan"), VenueError);
  EXPECT_THROW(ZmqVenueClient::parseTimestamp(-1), VenueError);
  EXPECT_THROW(ZmqVenueClient::parseTimestamp(1e30), VenueError);
  EXPECT_THROW(ZmqVenueClient::parseTimestamp("9.3e18"), VenueError);
}

// -----------------------------------------------------------------------------
// 3. Price and depth requests against a scripted bridge.
// -----------------------------------------------------------------------------
TEST(ZmqVenueClientBridgeTest, PriceAndDepthRequests) {
  const std::string endpoint = "tcp://127.0.0.1:45611";
  ScriptedBridge bridge(
      endpoint,
      {R"({"status":"ok","price":"65000.10","volume":"1234.5","timestamp":1700000000})",
       R"({"status":"ok","price":3500})",
       R"({"status":"ok","bids":[["99.9","1"]],"asks":[["100.1","2"]]})"});

  SimulationTimeProvider clock(1'700'000'042'000);
  ZmqVenueClient client(bridgeConfig(endpoint), clock);

  auto btc = client.getPrice("BTCUSDT");
  EXPECT_EQ(btc.instrument, "BTCUSDT");
  EXPECT_DOUBLE_EQ(btc.price, 65000.10);
  EXPECT_DOUBLE_EQ(btc.volume, 1234.5);
  EXPECT_EQ(btc.observed_at, 1'700'000'000);

  // No timestamp or volume in the reply: clock time and zero volume.
  auto eth = client.getPrice("ETHUSDT");
  EXPECT_DOUBLE_EQ(eth.price, 3500.0);
  EXPECT_DOUBLE_EQ(eth.volume, 0.0);
  EXPECT_EQ(eth.observed_at, 1'700'000'042);

  auto book = client.getOrderBook("BTCUSDT");
  ASSERT_EQ(book.bids.size(), 1u);
  ASSERT_EQ(book.asks.size(), 1u);
  EXPECT_DOUBLE_EQ(book.asks[0].quantity, 2.0);

  auto requests = bridge.requests();
  ASSERT_EQ(requests.size(), 3u);
  EXPECT_EQ(requests[0]["op"], "price");
  EXPECT_EQ(requests[0]["symbol"], "BTCUSDT");
  EXPECT_EQ(requests[2]["op"], "depth");
  EXPECT_EQ(requests[2]["limit"], ZmqVenueClient::kDepthLimit);
}

// -----------------------------------------------------------------------------
// 4. Error replies and missing fields become VenueError.
// -----------------------------------------------------------------------------
TEST(ZmqVenueClientBridgeTest, ErrorRepliesThrow) {
  const std::string endpoint = "tcp://127.0.0.1:45612";
  ScriptedBridge bridge(endpoint,
                        {R"({"status":"error","error":"Invalid symbol."})",
                         R"({"status":"ok"})",
                         R"(not json)"});

  SimulationTimeProvider clock;
  ZmqVenueClient client(bridgeConfig(endpoint), clock);

  try {
    client.getPrice("NOPE");
    FAIL() << "expected VenueError";
  } catch (const VenueError& e) {
    EXPECT_STREQ(e.what(), "Invalid symbol.");
  }
  EXPECT_THROW(client.getPrice("BTCUSDT"), VenueError);
  EXPECT_THROW(client.getOrderBook("BTCUSDT"), VenueError);
}

// -----------------------------------------------------------------------------
// 5. No bridge listening: the request times out with VenueError.
// Why: A dead bridge must cost a collector one interval, not hang it.
// -----------------------------------------------------------------------------
TEST(ZmqVenueClientBridgeTest, TimeoutWithoutBridge) {
  SimulationTimeProvider clock;
  ZmqVenueClient client(bridgeConfig("tcp://127.0.0.1:45613"), clock);

  const auto begin = std::chrono::steady_clock::now();
  EXPECT_THROW(client.getPrice("BTCUSDT"), VenueError);
  EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(2));

  // The socket was reset; a second attempt fails the same way.
  EXPECT_THROW(client.getPrice("BTCUSDT"), VenueError);
}

// -----------------------------------------------------------------------------
// 6. Orders: simulated acknowledgement vs live refusal.
// -----------------------------------------------------------------------------
TEST(ZmqVenueClientOrderTest, SimulationAndLiveModes) {
  SimulationTimeProvider clock;
  auto order = makeOrder("z-1", "BTCUSDT", domain::Side::Buy, 0.001);

  ZmqVenueClient simulated(bridgeConfig("tcp://127.0.0.1:45614", true), clock);
  EXPECT_EQ(simulated.submitOrder(order), "sim_z-1");
  EXPECT_NO_THROW(simulated.cancelOrder("z-1"));

  ZmqVenueClient live(bridgeConfig("tcp://127.0.0.1:45614", false), clock);
  EXPECT_THROW(live.submitOrder(order), VenueError);
  EXPECT_THROW(live.cancelOrder("z-1"), VenueError);

  auto malformed = makeOrder("z-2", "BTCUSDT", domain::Side::Buy, -1.0);
  EXPECT_THROW(simulated.submitOrder(malformed), VenueError);
}

// -----------------------------------------------------------------------------
// 7. An empty endpoint is a construction error.
// -----------------------------------------------------------------------------
TEST(ZmqVenueClientOrderTest, EmptyEndpointRejected) {
  SimulationTimeProvider clock;
  EXPECT_THROW(ZmqVenueClient(bridgeConfig(""), clock), VenueError);
}
