#pragma once

#include "tradeloop/domain/risk_limits.hpp"

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace tradeloop {

// -----------------------------------------------------------------------------
// ConfigError
// -----------------------------------------------------------------------------
// Thrown by ConfigLoader for missing or invalid settings. Fatal at startup:
// main() reports it and exits before any task is started.
// -----------------------------------------------------------------------------
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

inline constexpr const char* kLiveBaseUrl = "https://api.binance.com";
inline constexpr const char* kSimulationBaseUrl =
    "https://testnet.binance.vision";

// -----------------------------------------------------------------------------
// VenueConfig
// -----------------------------------------------------------------------------
// Credentials and endpoints for the venue collaborator. The core never
// interprets api_key/secret_key; they are forwarded to the venue bridge.
//
// bridge_endpoint empty → main() uses the in-process SimulatedVenueClient.
// -----------------------------------------------------------------------------
struct VenueConfig {
  std::string api_key;
  std::string secret_key;
  std::string base_url{kSimulationBaseUrl};
  std::string bridge_endpoint;
  bool simulation{true};
  std::chrono::milliseconds request_timeout{2000};
};

// Parameters of the default MomentumStrategy.
struct MomentumConfig {
  std::size_t lookback{5};
  double threshold{0.00001};
  double order_quantity{0.001};
  double volume_floor{1000.0};
};

// Loop cadence and history sizing.
struct TimingConfig {
  std::chrono::milliseconds collector_interval{5000};
  std::chrono::milliseconds decision_interval{10000};
  std::size_t history_capacity{100};
  std::size_t min_history_points{3};
};

// -----------------------------------------------------------------------------
// IpcConfig
// -----------------------------------------------------------------------------
// ZeroMQ endpoints of the optional IpcServer. The server is created only
// when both are non-empty.
// -----------------------------------------------------------------------------
struct IpcConfig {
  std::string command_endpoint;
  std::string telemetry_endpoint;

  bool enabled() const {
    return !command_endpoint.empty() && !telemetry_endpoint.empty();
  }
};

// -----------------------------------------------------------------------------
// EngineConfig — everything the process needs to run
// -----------------------------------------------------------------------------
// Plain value object. Built by ConfigLoader, copied into the orchestrator.
// -----------------------------------------------------------------------------
struct EngineConfig {
  VenueConfig venue;
  domain::RiskLimits risk;
  MomentumConfig momentum;
  TimingConfig timing;
  IpcConfig ipc;
  std::vector<std::string> symbols{"BTCUSDT", "ETHUSDT"};
  std::chrono::seconds run_duration{60};
};

}  // namespace tradeloop
