// -----------------------------------------------------------------------------
// rxpos_server: single executable entry point.
//
//   1) Load StoreConfig from argv[1] (optional; defaults otherwise).
//   2) Create the wall clock and the PosEngine (opens the database and
//      creates the schema).
//   3) Subscribe log lines for sale and stock notifications.
//   4) start(): the IPC server begins accepting register commands on the REP
//      endpoint and publishing telemetry on the PUB endpoint.
//   5) Block until SIGINT/SIGTERM, then stop() and exit.
//
// Thread layout:
//   main thread   → waits for the shutdown flag
//   ipc thread    → command handling (PosEngine::executeCommand) + telemetry
// -----------------------------------------------------------------------------

#include "rxpos/config/store_config.hpp"
#include "rxpos/domain/money.hpp"
#include "rxpos/engine/pos_engine.hpp"
#include "rxpos/events/pos_events.hpp"
#include "rxpos/storage/database.hpp"
#include "rxpos/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

// Set by the signal handler, polled by main(). std::atomic<bool> is
// lock-free, so the store is async-signal-safe.
static std::atomic<bool> g_shutdown_requested{false};

static void shutdown_handler(int /*signum*/) {
  g_shutdown_requested.store(true);
}

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration
  // -------------------------------------------------------------------------
  rxpos::StoreConfig config;
  if (argc > 1) {
    try {
      config = rxpos::loadStoreConfig(argv[1]);
    } catch (const rxpos::ConfigError& e) {
      std::cerr << "[main] " << e.what() << "\n";
      return 2;
    }
  }

  // -------------------------------------------------------------------------
  // 2) Engine
  // -------------------------------------------------------------------------
  rxpos::LiveTimeProvider clock;

  std::unique_ptr<rxpos::PosEngine> engine;
  try {
    engine = std::make_unique<rxpos::PosEngine>(config, clock);
  } catch (const rxpos::storage::StorageError& e) {
    std::cerr << "[main] cannot open database: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 3) Log subscribers
  // -------------------------------------------------------------------------
  const std::string symbol = config.currency_symbol;
  engine->eventBus().subscribe<rxpos::SaleCompletedEvent>(
      [symbol](const rxpos::SaleCompletedEvent& e) {
        std::cout << "[Sale] #" << e.sale.id << " " << e.sale.date << " "
                  << rxpos::money::formatCurrency(e.sale.total, symbol)
                  << " (" << e.sale.items.size() << " line(s))\n";
      });
  engine->eventBus().subscribe<rxpos::LowStockEvent>(
      [](const rxpos::LowStockEvent& e) {
        std::cout << "[LowStock] " << e.name << ": " << e.remaining
                  << " left (threshold " << e.threshold << ")\n";
      });

  // -------------------------------------------------------------------------
  // 4) Start
  // -------------------------------------------------------------------------
  std::signal(SIGINT, shutdown_handler);
  std::signal(SIGTERM, shutdown_handler);

  try {
    engine->start();
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] cannot bind IPC endpoints: " << e.what() << "\n";
    return 1;
  }

  std::cout << "[main] " << config.store_name << " ready. CMD="
            << config.ipc_cmd_endpoint << " PUB=" << config.ipc_pub_endpoint
            << "\n"
            << "[main] Press Ctrl-C to shut down.\n";

  // -------------------------------------------------------------------------
  // 5) Wait for shutdown
  // -------------------------------------------------------------------------
  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] Shutdown requested. Stopping engine...\n";
  engine->stop();

  return 0;
}
