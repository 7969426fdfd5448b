#pragma once

#include "tradeloop/config/engine_config.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>

namespace tradeloop {

// -----------------------------------------------------------------------------
// ConfigLoader — builds and validates EngineConfig
// -----------------------------------------------------------------------------
//
// @brief  Layers configuration sources in a fixed order and rejects an
//         unusable result with ConfigError.
//
// @details
// Layering (later wins):
//   1. Compiled-in defaults (EngineConfig member initializers)
//   2. Optional JSON file
//   3. Environment variables:
//        TRADELOOP_API_KEY, TRADELOOP_SECRET_KEY   credentials (required)
//        TRADELOOP_SIMULATION     "true"/"1"/"yes" → simulation mode
//        TRADELOOP_BRIDGE_ENDPOINT  ZeroMQ endpoint of the venue bridge
//        TRADELOOP_SYMBOLS        comma separated instrument list
//
// JSON layout (every key optional):
//   {
//     "venue":    { "api_key", "secret_key", "base_url", "bridge_endpoint",
//                   "simulation", "request_timeout_ms" },
//     "risk":     { "max_position_size", "max_loss_per_trade",
//                   "max_daily_loss", "stop_loss_pct", "take_profit_pct" },
//     "momentum": { "lookback", "threshold", "order_quantity",
//                   "volume_floor" },
//     "timing":   { "collector_interval_ms", "decision_interval_ms",
//                   "history_capacity", "min_history_points" },
//     "ipc":      { "command_endpoint", "telemetry_endpoint" },
//     "symbols":  [ "BTCUSDT", ... ],
//     "run_duration_s": 60
//   }
//
// Stateless: every member is static.
// -----------------------------------------------------------------------------
class ConfigLoader {
 public:
  // Returns the variable's value, std::nullopt when unset.
  using EnvLookup = std::function<std::optional<std::string>(const char*)>;

  // Full pipeline with the process environment: defaults → file → env →
  // validate. An empty path skips the file layer.
  // @throws ConfigError
  static EngineConfig load(const std::string& path = {});

  // @throws ConfigError if the file cannot be read or parsed.
  static nlohmann::json readFile(const std::string& path);

  // Applies a parsed JSON document on top of `config`.
  // @throws ConfigError on a wrongly typed value.
  static void applyJson(EngineConfig& config, const nlohmann::json& doc);

  static void applyEnvironment(EngineConfig& config, const EnvLookup& env);

  // @throws ConfigError naming the first problem found.
  static void validate(const EngineConfig& config);

  // Lookup backed by std::getenv.
  static std::optional<std::string> processEnv(const char* name);
};

}  // namespace tradeloop
