#include "tradeloop/config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace tradeloop {

namespace {

std::string trim(const std::string& s) {
  const char* ws = " \t\r\n";
  auto begin = s.find_first_not_of(ws);
  if (begin == std::string::npos) {
    return {};
  }
  auto end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}

bool parseBool(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  value = trim(value);
  return value == "1" || value == "true" || value == "yes";
}

std::vector<std::string> splitSymbols(const std::string& csv) {
  std::vector<std::string> result;
  std::stringstream stream(csv);
  std::string item;
  while (std::getline(stream, item, ',')) {
    item = trim(item);
    if (!item.empty()) {
      result.push_back(item);
    }
  }
  return result;
}

// Copies doc[key] into `out` when present.
template <typename T>
void readOptional(const nlohmann::json& doc, const char* key, T& out) {
  if (doc.contains(key)) {
    out = doc.at(key).get<T>();
  }
}

// Counts and sizes. A negative JSON integer would wrap when read straight
// into std::size_t, so the sign is checked first.
void readCount(const nlohmann::json& doc, const char* key, std::size_t& out) {
  if (!doc.contains(key)) {
    return;
  }
  const auto& value = doc.at(key);
  if (!value.is_number_unsigned()) {
    throw ConfigError(std::string(key) + " must be a non-negative integer");
  }
  out = value.get<std::size_t>();
}

void readMillis(const nlohmann::json& doc, const char* key,
                std::chrono::milliseconds& out) {
  if (doc.contains(key)) {
    out = std::chrono::milliseconds{doc.at(key).get<std::int64_t>()};
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// load(): defaults → file → environment → validate
// -----------------------------------------------------------------------------
EngineConfig ConfigLoader::load(const std::string& path) {
  EngineConfig config;
  if (!path.empty()) {
    applyJson(config, readFile(path));
  }
  applyEnvironment(config, &ConfigLoader::processEnv);
  validate(config);
  return config;
}

nlohmann::json ConfigLoader::readFile(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw ConfigError("cannot open config file: " + path);
  }
  try {
    return nlohmann::json::parse(in);
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError("invalid JSON in " + path + ": " + e.what());
  }
}

// -----------------------------------------------------------------------------
// applyJson(): every section and key is optional
// -----------------------------------------------------------------------------
void ConfigLoader::applyJson(EngineConfig& config, const nlohmann::json& doc) {
  if (!doc.is_object()) {
    throw ConfigError("config root must be a JSON object");
  }

  try {
    if (doc.contains("venue")) {
      const auto& v = doc.at("venue");
      readOptional(v, "api_key", config.venue.api_key);
      readOptional(v, "secret_key", config.venue.secret_key);
      readOptional(v, "bridge_endpoint", config.venue.bridge_endpoint);
      readMillis(v, "request_timeout_ms", config.venue.request_timeout);
      if (v.contains("simulation")) {
        config.venue.simulation = v.at("simulation").get<bool>();
        config.venue.base_url =
            config.venue.simulation ? kSimulationBaseUrl : kLiveBaseUrl;
      }
      // An explicit base_url beats the one implied by the mode.
      readOptional(v, "base_url", config.venue.base_url);
    }

    if (doc.contains("risk")) {
      const auto& r = doc.at("risk");
      readOptional(r, "max_position_size", config.risk.max_position_size);
      readOptional(r, "max_loss_per_trade", config.risk.max_loss_per_trade);
      readOptional(r, "max_daily_loss", config.risk.max_daily_loss);
      readOptional(r, "stop_loss_pct", config.risk.stop_loss_pct);
      readOptional(r, "take_profit_pct", config.risk.take_profit_pct);
    }

    if (doc.contains("momentum")) {
      const auto& m = doc.at("momentum");
      readCount(m, "lookback", config.momentum.lookback);
      readOptional(m, "threshold", config.momentum.threshold);
      readOptional(m, "order_quantity", config.momentum.order_quantity);
      readOptional(m, "volume_floor", config.momentum.volume_floor);
    }

    if (doc.contains("timing")) {
      const auto& t = doc.at("timing");
      readMillis(t, "collector_interval_ms", config.timing.collector_interval);
      readMillis(t, "decision_interval_ms", config.timing.decision_interval);
      readCount(t, "history_capacity", config.timing.history_capacity);
      readCount(t, "min_history_points", config.timing.min_history_points);
    }

    if (doc.contains("ipc")) {
      const auto& i = doc.at("ipc");
      readOptional(i, "command_endpoint", config.ipc.command_endpoint);
      readOptional(i, "telemetry_endpoint", config.ipc.telemetry_endpoint);
    }

    readOptional(doc, "symbols", config.symbols);

    if (doc.contains("run_duration_s")) {
      config.run_duration =
          std::chrono::seconds{doc.at("run_duration_s").get<std::int64_t>()};
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("invalid config value: ") + e.what());
  }
}

// -----------------------------------------------------------------------------
// applyEnvironment(): process environment overrides the file
// -----------------------------------------------------------------------------
void ConfigLoader::applyEnvironment(EngineConfig& config,
                                    const EnvLookup& env) {
  if (auto key = env("TRADELOOP_API_KEY")) {
    config.venue.api_key = *key;
  }
  if (auto secret = env("TRADELOOP_SECRET_KEY")) {
    config.venue.secret_key = *secret;
  }
  if (auto simulation = env("TRADELOOP_SIMULATION")) {
    config.venue.simulation = parseBool(*simulation);
    config.venue.base_url =
        config.venue.simulation ? kSimulationBaseUrl : kLiveBaseUrl;
  }
  if (auto endpoint = env("TRADELOOP_BRIDGE_ENDPOINT")) {
    config.venue.bridge_endpoint = trim(*endpoint);
  }
  if (auto symbols = env("TRADELOOP_SYMBOLS")) {
    config.symbols = splitSymbols(*symbols);
  }
}

// -----------------------------------------------------------------------------
// validate(): first problem wins
// -----------------------------------------------------------------------------
void ConfigLoader::validate(const EngineConfig& config) {
  if (config.venue.api_key.empty()) {
    throw ConfigError("TRADELOOP_API_KEY is required");
  }
  if (config.venue.secret_key.empty()) {
    throw ConfigError("TRADELOOP_SECRET_KEY is required");
  }
  if (!config.venue.simulation && config.venue.base_url.empty()) {
    throw ConfigError("live mode requires venue.base_url");
  }
  if (config.venue.request_timeout.count() <= 0) {
    throw ConfigError("venue.request_timeout_ms must be positive");
  }
  if (config.symbols.empty()) {
    throw ConfigError("at least one symbol is required");
  }
  if (config.timing.collector_interval.count() <= 0 ||
      config.timing.decision_interval.count() <= 0) {
    throw ConfigError("timing intervals must be positive");
  }
  if (config.timing.history_capacity == 0) {
    throw ConfigError("timing.history_capacity must be positive");
  }
  if (config.momentum.lookback < 2) {
    throw ConfigError("momentum.lookback must be at least 2");
  }
  if (config.momentum.threshold < 0.0) {
    throw ConfigError("momentum.threshold must not be negative");
  }
  if (!(config.momentum.order_quantity > 0.0)) {
    throw ConfigError("momentum.order_quantity must be positive");
  }
  if (config.run_duration.count() <= 0) {
    throw ConfigError("run_duration_s must be positive");
  }
}

std::optional<std::string> ConfigLoader::processEnv(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr) {
    return std::nullopt;
  }
  return std::string(value);
}

}  // namespace tradeloop
