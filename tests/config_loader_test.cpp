// =============================================================================
// config_loader_test.cpp
// =============================================================================
// Unit tests for tradeloop::ConfigLoader.
//
// Validates:
//   - JSON layering on top of defaults (partial documents keep defaults)
//   - Environment overrides beat the file
//   - Missing credentials and bad values are rejected with ConfigError
//   - Unreadable or malformed files raise ConfigError
//
// The environment is injected as a lambda so tests never touch the real one.
// =============================================================================

#include "tradeloop/config/config_loader.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <map>
#include <string>

using namespace tradeloop;

namespace {

ConfigLoader::EnvLookup envFrom(std::map<std::string, std::string> vars) {
  return [vars](const char* name) -> std::optional<std::string> {
    auto it = vars.find(name);
    if (it == vars.end()) {
      return std::nullopt;
    }
    return it->second;
  };
}

EngineConfig validConfig() {
  EngineConfig config;
  config.venue.api_key = "key";
  config.venue.secret_key = "secret";
  return config;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Defaults are the documented ones.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, DefaultsMatchDocumentedValues) {
  EngineConfig config;

  EXPECT_TRUE(config.venue.simulation);
  EXPECT_EQ(config.venue.base_url, kSimulationBaseUrl);
  EXPECT_EQ(config.timing.collector_interval, std::chrono::milliseconds(5000));
  EXPECT_EQ(config.timing.decision_interval, std::chrono::milliseconds(10000));
  EXPECT_EQ(config.timing.history_capacity, 100u);
  EXPECT_EQ(config.momentum.lookback, 5u);
  EXPECT_DOUBLE_EQ(config.risk.max_position_size, 1000.0);
  EXPECT_DOUBLE_EQ(config.risk.max_daily_loss, 500.0);
  ASSERT_EQ(config.symbols.size(), 2u);
  EXPECT_EQ(config.symbols[0], "BTCUSDT");
  EXPECT_FALSE(config.ipc.enabled());
}

// -----------------------------------------------------------------------------
// 2. A partial JSON document overrides only what it names.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, JsonOverridesOnlyNamedKeys) {
  EngineConfig config;
  auto doc = nlohmann::json::parse(R"({
    "risk":     { "max_position_size": 5.0 },
    "momentum": { "lookback": 8, "threshold": 0.002 },
    "timing":   { "collector_interval_ms": 250 },
    "ipc":      { "command_endpoint": "tcp://127.0.0.1:7001",
                  "telemetry_endpoint": "tcp://127.0.0.1:7002" },
    "symbols":  [ "SOLUSDT" ],
    "run_duration_s": 5
  })");

  ConfigLoader::applyJson(config, doc);

  EXPECT_DOUBLE_EQ(config.risk.max_position_size, 5.0);
  EXPECT_DOUBLE_EQ(config.risk.max_daily_loss, 500.0);
  EXPECT_EQ(config.momentum.lookback, 8u);
  EXPECT_DOUBLE_EQ(config.momentum.threshold, 0.002);
  EXPECT_EQ(config.timing.collector_interval, std::chrono::milliseconds(250));
  EXPECT_EQ(config.timing.decision_interval, std::chrono::milliseconds(10000));
  EXPECT_TRUE(config.ipc.enabled());
  ASSERT_EQ(config.symbols.size(), 1u);
  EXPECT_EQ(config.symbols[0], "SOLUSDT");
  EXPECT_EQ(config.run_duration, std::chrono::seconds(5));
}

// -----------------------------------------------------------------------------
// 3. The simulation flag selects the base URL unless one is given.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, SimulationFlagSelectsBaseUrl) {
  EngineConfig live;
  ConfigLoader::applyJson(live, nlohmann::json::parse(
                                    R"({"venue": {"simulation": false}})"));
  EXPECT_FALSE(live.venue.simulation);
  EXPECT_EQ(live.venue.base_url, kLiveBaseUrl);

  EngineConfig custom;
  ConfigLoader::applyJson(custom, nlohmann::json::parse(R"({
    "venue": {"simulation": false, "base_url": "https://example.test"}
  })"));
  EXPECT_EQ(custom.venue.base_url, "https://example.test");
}

// -----------------------------------------------------------------------------
// 4. A wrongly typed value surfaces as ConfigError, not a json exception.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, WrongTypeIsConfigError) {
  EngineConfig config;
  EXPECT_THROW(ConfigLoader::applyJson(
                   config, nlohmann::json::parse(R"({"momentum": {"lookback": "five"}})")),
               ConfigError);
  EXPECT_THROW(ConfigLoader::applyJson(config, nlohmann::json::array()),
               ConfigError);
}

// -----------------------------------------------------------------------------
// 5. Environment variables override whatever the file said.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, EnvironmentOverridesFile) {
  EngineConfig config;
  ConfigLoader::applyJson(config, nlohmann::json::parse(
                                      R"({"venue": {"api_key": "from-file"}})"));

  ConfigLoader::applyEnvironment(
      config, envFrom({{"TRADELOOP_API_KEY", "from-env"},
                       {"TRADELOOP_SECRET_KEY", "s3cret"},
                       {"TRADELOOP_SIMULATION", "False"},
                       {"TRADELOOP_BRIDGE_ENDPOINT", " tcp://127.0.0.1:5555 "},
                       {"TRADELOOP_SYMBOLS", " BTCUSDT, ,ADAUSDT "}}));

  EXPECT_EQ(config.venue.api_key, "from-env");
  EXPECT_EQ(config.venue.secret_key, "s3cret");
  EXPECT_FALSE(config.venue.simulation);
  EXPECT_EQ(config.venue.base_url, kLiveBaseUrl);
  EXPECT_EQ(config.venue.bridge_endpoint, "tcp://127.0.0.1:5555");
  ASSERT_EQ(config.symbols.size(), 2u);
  EXPECT_EQ(config.symbols[0], "BTCUSDT");
  EXPECT_EQ(config.symbols[1], "ADAUSDT");
}

// -----------------------------------------------------------------------------
// 6. Unset variables leave the configuration untouched.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, UnsetEnvironmentChangesNothing) {
  EngineConfig config = validConfig();
  ConfigLoader::applyEnvironment(config, envFrom({}));

  EXPECT_EQ(config.venue.api_key, "key");
  EXPECT_TRUE(config.venue.simulation);
  EXPECT_EQ(config.symbols.size(), 2u);
}

// -----------------------------------------------------------------------------
// 7. Missing credentials are a startup error.
// Why: The process must refuse to start rather than fail on first order.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, MissingCredentialsRejected) {
  EngineConfig no_key = validConfig();
  no_key.venue.api_key.clear();
  EXPECT_THROW(ConfigLoader::validate(no_key), ConfigError);

  EngineConfig no_secret = validConfig();
  no_secret.venue.secret_key.clear();
  EXPECT_THROW(ConfigLoader::validate(no_secret), ConfigError);

  EXPECT_NO_THROW(ConfigLoader::validate(validConfig()));
}

// -----------------------------------------------------------------------------
// 8. Out-of-range values are rejected.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, InvalidValuesRejected) {
  auto expectRejected = [](void (*mutate)(EngineConfig&)) {
    EngineConfig config = validConfig();
    mutate(config);
    EXPECT_THROW(ConfigLoader::validate(config), ConfigError);
  };

  expectRejected([](EngineConfig& c) { c.symbols.clear(); });
  expectRejected([](EngineConfig& c) { c.timing.history_capacity = 0; });
  expectRejected([](EngineConfig& c) {
    c.timing.decision_interval = std::chrono::milliseconds(0);
  });
  expectRejected([](EngineConfig& c) { c.momentum.lookback = 1; });
  expectRejected([](EngineConfig& c) { c.momentum.threshold = -0.1; });
  expectRejected([](EngineConfig& c) { c.momentum.order_quantity = 0.0; });
  expectRejected([](EngineConfig& c) {
    c.venue.simulation = false;
    c.venue.base_url.clear();
  });
  expectRejected([](EngineConfig& c) {
    c.run_duration = std::chrono::seconds(0);
  });
}

// -----------------------------------------------------------------------------
// 8b. Negative counts in the file are refused, not wrapped.
// Why: min_history_points = -1 read as SIZE_MAX would keep every instrument
//      below the evaluation threshold and silently disable trading.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, NegativeCountsRejected) {
  for (const char* doc : {R"({"timing": {"min_history_points": -1}})",
                          R"({"timing": {"history_capacity": -1}})",
                          R"({"momentum": {"lookback": -1}})",
                          R"({"momentum": {"lookback": 2.5}})"}) {
    EngineConfig config = validConfig();
    EXPECT_THROW(ConfigLoader::applyJson(config, nlohmann::json::parse(doc)),
                 ConfigError)
        << doc;
    EXPECT_EQ(config.timing.min_history_points, 3u);
    EXPECT_EQ(config.timing.history_capacity, 100u);
    EXPECT_EQ(config.momentum.lookback, 5u);
  }

  EngineConfig zero = validConfig();
  ConfigLoader::applyJson(
      zero, nlohmann::json::parse(R"({"timing": {"min_history_points": 0}})"));
  EXPECT_EQ(zero.timing.min_history_points, 0u);
}

// -----------------------------------------------------------------------------
// 9. File layer: missing and malformed files are ConfigError.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, ReadFileErrors) {
  EXPECT_THROW(ConfigLoader::readFile("/nonexistent/tradeloop.json"),
               ConfigError);

  const std::string path = ::testing::TempDir() + "tradeloop_bad_config.json";
  {
    std::ofstream out(path);
    out << "{ not json";
  }
  EXPECT_THROW(ConfigLoader::readFile(path), ConfigError);
  std::remove(path.c_str());
}

// -----------------------------------------------------------------------------
// 10. File layer: a valid file parses.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, ReadFileParsesDocument) {
  const std::string path = ::testing::TempDir() + "tradeloop_good_config.json";
  {
    std::ofstream out(path);
    out << R"({"symbols": ["BTCUSDT"], "timing": {"history_capacity": 10}})";
  }

  EngineConfig config;
  ConfigLoader::applyJson(config, ConfigLoader::readFile(path));
  EXPECT_EQ(config.timing.history_capacity, 10u);
  EXPECT_EQ(config.symbols.size(), 1u);
  std::remove(path.c_str());
}
