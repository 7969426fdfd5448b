#include "tradeloop/venue/zmq_venue_client.hpp"
#include "tradeloop/time/time_utils.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iostream>
#include <thread>
#include <utility>

namespace tradeloop {

ZmqVenueClient::ZmqVenueClient(const VenueConfig& config,
                               const ITimeProvider& clock)
    : config_(config), clock_(clock) {
  if (config_.bridge_endpoint.empty()) {
    throw VenueError("ZmqVenueClient: bridge endpoint is empty");
  }
  std::cout << "[ZmqVenueClient] bridge=" << config_.bridge_endpoint
            << " base_url=" << config_.base_url
            << (config_.simulation ? " (simulation)" : " (live)") << "\n";
}

zmq::socket_t& ZmqVenueClient::socketLocked() {
  if (!socket_) {
    const int timeout_ms = static_cast<int>(config_.request_timeout.count());
    socket_ = std::make_unique<zmq::socket_t>(context_, zmq::socket_type::req);
    socket_->set(zmq::sockopt::linger, 0);
    socket_->set(zmq::sockopt::rcvtimeo, timeout_ms);
    socket_->set(zmq::sockopt::sndtimeo, timeout_ms);
    socket_->connect(config_.bridge_endpoint);
  }
  return *socket_;
}

// -----------------------------------------------------------------------------
// request(): send, wait for reply, reset the socket on timeout
// -----------------------------------------------------------------------------
nlohmann::json ZmqVenueClient::request(const nlohmann::json& payload) {
  std::string reply_text;
  {
    std::lock_guard lock(socket_mutex_);
    try {
      zmq::socket_t& socket = socketLocked();

      const std::string body = payload.dump();
      auto sent = socket.send(zmq::buffer(body), zmq::send_flags::none);
      if (!sent.has_value()) {
        socket_.reset();
        throw VenueError("bridge send timed out");
      }

      zmq::message_t reply;
      auto received = socket.recv(reply, zmq::recv_flags::none);
      if (!received.has_value()) {
        socket_.reset();
        throw VenueError("bridge reply timed out after " +
                         std::to_string(config_.request_timeout.count()) +
                         "ms");
      }
      reply_text = reply.to_string();

    } catch (const zmq::error_t& e) {
      socket_.reset();
      throw VenueError(std::string("bridge transport error: ") + e.what());
    }
  }

  nlohmann::json reply;
  try {
    reply = nlohmann::json::parse(reply_text);
  } catch (const nlohmann::json::exception& e) {
    throw VenueError(std::string("malformed bridge reply: ") + e.what());
  }

  if (!reply.is_object() || reply.value("status", "") != "ok") {
    std::string error = reply.is_object()
                            ? reply.value("error", "unknown bridge error")
                            : "unexpected bridge reply";
    throw VenueError(error);
  }
  return reply;
}

double ZmqVenueClient::parseDecimal(const nlohmann::json& value) {
  if (value.is_number()) {
    return value.get<double>();
  }
  if (value.is_string()) {
    const auto& text = value.get_ref<const std::string&>();
    try {
      std::size_t consumed = 0;
      double parsed = std::stod(text, &consumed);
      // stod also accepts "nan" and "inf".
      if (consumed == text.size() && std::isfinite(parsed)) {
        return parsed;
      }
    } catch (const std::exception&) {
      // Falls through to the error below.
    }
    throw VenueError("not a decimal: \"" + text + "\"");
  }
  throw VenueError("expected a number, got " + value.dump());
}

std::int64_t ZmqVenueClient::parseTimestamp(const nlohmann::json& value) {
  const double seconds = parseDecimal(value);
  // 2^63 is exactly representable; anything at or above it does not fit.
  constexpr double kLimit = 9223372036854775808.0;
  if (!(seconds >= 0.0 && seconds < kLimit)) {
    throw VenueError("timestamp out of range: " + value.dump());
  }
  return static_cast<std::int64_t>(seconds);
}

std::vector<domain::BookLevel> ZmqVenueClient::parseLevels(
    const nlohmann::json& side) {
  if (!side.is_array()) {
    throw VenueError("depth side is not an array");
  }
  std::vector<domain::BookLevel> levels;
  levels.reserve(side.size());
  for (const auto& entry : side) {
    if (!entry.is_array() || entry.size() < 2) {
      throw VenueError("malformed depth level: " + entry.dump());
    }
    levels.push_back({parseDecimal(entry[0]), parseDecimal(entry[1])});
  }
  return levels;
}

// -----------------------------------------------------------------------------
// getPrice()
// -----------------------------------------------------------------------------
domain::PricePoint ZmqVenueClient::getPrice(const std::string& instrument) {
  nlohmann::json reply =
      request({{"op", "price"}, {"symbol", instrument}});

  if (!reply.contains("price")) {
    throw VenueError("price reply without a price");
  }

  domain::PricePoint point;
  point.instrument = instrument;
  point.price = parseDecimal(reply.at("price"));
  point.volume = reply.contains("volume") ? parseDecimal(reply.at("volume"))
                                          : 0.0;
  point.observed_at =
      reply.contains("timestamp")
          ? parseTimestamp(reply.at("timestamp"))
          : now_seconds(clock_);
  return point;
}

// -----------------------------------------------------------------------------
// getOrderBook()
// -----------------------------------------------------------------------------
domain::OrderBookSnapshot ZmqVenueClient::getOrderBook(
    const std::string& instrument) {
  nlohmann::json reply = request(
      {{"op", "depth"}, {"symbol", instrument}, {"limit", kDepthLimit}});

  if (!reply.contains("bids") || !reply.contains("asks")) {
    throw VenueError("depth reply without bids/asks");
  }

  domain::OrderBookSnapshot book;
  book.instrument = instrument;
  book.bids = parseLevels(reply.at("bids"));
  book.asks = parseLevels(reply.at("asks"));
  book.observed_at = now_seconds(clock_);
  return book;
}

// -----------------------------------------------------------------------------
// submitOrder(): simulation acknowledges locally, live refuses
// -----------------------------------------------------------------------------
std::string ZmqVenueClient::submitOrder(const domain::Order& order) {
  std::string reason;
  if (!isWellFormed(order, &reason)) {
    throw VenueError("order refused: " + reason);
  }
  if (!config_.simulation) {
    throw VenueError("Live trading not implemented");
  }

  std::cout << "[ZmqVenueClient] simulated " << domain::sideToString(order.side)
            << " " << order.quantity << " " << order.instrument
            << " id=" << order.id << "\n";
  std::this_thread::sleep_for(kSimulatedSubmitDelay);
  return "sim_" + order.id;
}

void ZmqVenueClient::cancelOrder(const domain::OrderId& order_id) {
  if (!config_.simulation) {
    throw VenueError("Live trading not implemented");
  }
  std::cout << "[ZmqVenueClient] simulated cancel " << order_id << "\n";
}

}  // namespace tradeloop
