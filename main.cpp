// -----------------------------------------------------------------------------
// tradeloop — single executable entry point.
//
//   1) Load EngineConfig (optional JSON file argument + environment).
//      Configuration errors are fatal: nothing starts.
//   2) Pick the venue: the in-process SimulatedVenueClient when no bridge
//      endpoint is configured, otherwise the ZeroMQ bridge client.
//   3) Probe connectivity with one price fetch for the first symbol.
//   4) Subscribe logging callbacks on the orchestrator's EventBus.
//   5) Run the orchestrator on a worker thread until the configured
//      duration elapses, SIGINT arrives, or a STOP command is received.
//   6) stop() and join.
//
// Thread layout:
//   main thread     → waits on the run deadline / SIGINT flag
//   worker thread   → TradingOrchestrator::start() (blocking)
//   collector x N   → MarketDataCollector::run()
//   decision thread → TradingOrchestrator::runDecisionCycle() loop
//   ipc thread      → IpcServer (only when endpoints are configured)
// -----------------------------------------------------------------------------

#include "tradeloop/config/config_loader.hpp"
#include "tradeloop/engine/trading_orchestrator.hpp"
#include "tradeloop/events/event_types.hpp"
#include "tradeloop/time/live_time_provider.hpp"
#include "tradeloop/venue/simulated_venue_client.hpp"
#include "tradeloop/venue/zmq_venue_client.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

// Set by the SIGINT handler, polled by main(). The only global in the
// program.
static volatile std::sig_atomic_t g_interrupted = 0;

static void sigint_handler(int /*signum*/) { g_interrupted = 1; }

int main(int argc, char** argv) {
  // ---  1) Configuration -----------------------------------------------------
  tradeloop::EngineConfig config;
  try {
    config = tradeloop::ConfigLoader::load(argc > 1 ? argv[1] : "");
  } catch (const tradeloop::ConfigError& e) {
    std::cerr << "[main] configuration error: " << e.what() << "\n";
    return 1;
  }

  std::cout << "[main] mode=" << (config.venue.simulation ? "simulation" : "live")
            << " base_url=" << config.venue.base_url
            << " symbols=" << config.symbols.size()
            << " duration=" << config.run_duration.count() << "s\n";

  // ---  2) Venue -------------------------------------------------------------
  tradeloop::LiveTimeProvider clock;
  std::unique_ptr<tradeloop::IVenueClient> venue;
  try {
    if (config.venue.bridge_endpoint.empty()) {
      std::cout << "[main] no bridge endpoint, using in-process venue\n";
      venue = std::make_unique<tradeloop::SimulatedVenueClient>(clock);
    } else {
      venue = std::make_unique<tradeloop::ZmqVenueClient>(config.venue, clock);
    }
  } catch (const std::exception& e) {
    std::cerr << "[main] cannot create venue client: " << e.what() << "\n";
    return 1;
  }

  // ---  3) Connectivity probe ------------------------------------------------
  try {
    const auto probe = venue->getPrice(config.symbols.front());
    std::cout << "[main] connectivity ok: " << probe.instrument << " = "
              << probe.price << "\n";
  } catch (const std::exception& e) {
    std::cerr << "[main] connectivity check failed: " << e.what() << "\n";
    return 1;
  }

  // ---  4) Orchestrator and logging subscriptions ----------------------------
  tradeloop::TradingOrchestrator orchestrator(*venue, clock, config);

  orchestrator.eventBus().subscribe<tradeloop::ExecutionReportEvent>(
      [](const tradeloop::ExecutionReportEvent& e) {
        std::cout << "[ExecutionReport] order_id=" << e.order.id << " status="
                  << tradeloop::executionStatusToString(e.result.status);
        if (e.result.ok()) {
          std::cout << " venue_id=" << e.result.venue_order_id;
        } else {
          std::cout << " error=" << e.result.error;
        }
        std::cout << "\n";
      });

  orchestrator.eventBus().subscribe<tradeloop::RiskRejectEvent>(
      [](const tradeloop::RiskRejectEvent& e) {
        std::cout << "[RiskReject] " << e.order.instrument << " "
                  << tradeloop::domain::sideToString(e.order.side) << " "
                  << e.order.quantity << ": " << e.reason << "\n";
      });

  orchestrator.eventBus().subscribe<tradeloop::PositionUpdateEvent>(
      [](const tradeloop::PositionUpdateEvent& e) {
        std::cout << "[PositionUpdate] symbol=" << e.position.instrument
                  << " qty=" << e.position.quantity
                  << " avg_price=" << e.position.average_price
                  << " realized_pnl=" << e.position.realized_pnl << "\n";
      });

  // ---  5) Run ---------------------------------------------------------------
  std::signal(SIGINT, sigint_handler);

  std::atomic<bool> finished{false};
  std::thread worker([&] {
    orchestrator.start(config.symbols);
    finished.store(true);
  });

  const auto deadline = std::chrono::steady_clock::now() + config.run_duration;
  while (!finished.load() && g_interrupted == 0 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (g_interrupted != 0) {
    std::cout << "\n[main] SIGINT received. Shutting down...\n";
  } else if (!finished.load()) {
    std::cout << "[main] run duration elapsed. Shutting down...\n";
  }

  // ---  6) Shutdown ----------------------------------------------------------
  // Repeat stop() until the worker returns: a stop() issued before start()
  // has flipped to Running would otherwise be lost.
  while (!finished.load()) {
    orchestrator.stop();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  worker.join();

  std::cout << "[main] final daily PnL: "
            << orchestrator.riskGate().dailyPnl() << ", pending orders: "
            << orchestrator.executionCoordinator().pendingCount() << "\n";
  return 0;
}
