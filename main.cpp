// -----------------------------------------------------------------------------
// credit_ledger: single executable entry point.
//
//   1) Load the AppConfig from the JSON file given as argv[1] (defaults are
//      used when no file is given).
//   2) Build the LedgerService: clock, in-memory custody / reputation /
//      prices / proofs, risk policy, interest model, and the LoanLedger.
//   3) Start it. The IpcServer thread now answers JSON commands on the REP
//      endpoint and publishes ledger events on the PUB endpoint.
//   4) Sleep on the main thread until SIGINT, then shut down cleanly.
//
// Thread layout:
//   main thread   waits for SIGINT
//   ipc thread    IpcServer loop; every ledger call happens here
// -----------------------------------------------------------------------------

#include "credit/config/config_loader.hpp"
#include "credit/engine/ledger_service.hpp"
#include "credit/errors/ledger_error.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <thread>

// Set by the SIGINT handler, polled by main(). Lock-free atomic stores are
// async-signal-safe.
static std::atomic<bool> g_stop_requested{false};

static void sigint_handler(int /*signum*/) { g_stop_requested.store(true); }

int main(int argc, char** argv) {
  credit::config::AppConfig cfg;

  try {
    if (argc > 1) {
      cfg = credit::config::loadConfig(argv[1]);
    } else {
      std::cout << "[main] no config file given, using defaults.\n";
    }
  } catch (const credit::LedgerError& e) {
    std::cerr << "[main] invalid configuration: " << e.what() << "\n";
    return 1;
  }

  credit::LedgerService service(cfg);
  try {
    service.start();
  } catch (const std::exception& e) {
    std::cerr << "[main] failed to start: " << e.what() << "\n";
    return 1;
  }

  std::signal(SIGINT, sigint_handler);

  while (!g_stop_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] SIGINT received. Shutting down...\n";
  service.stop();

  std::cout << "[main] clean exit.\n";
  return 0;
}
