// -----------------------------------------------------------------------------
// trade_copier: single executable entry point.
//
//   trade_copier [config.json]
//
//   1) Load the configuration (default "copier.json").
//   2) Build the CopierEngine on a ZmqBridgeTransport and start it.
//   3) Wait for Ctrl-C or for the session to turn fatal (bad credentials,
//      reconnect attempts exhausted).
//   4) Stop the engine; in-flight dispatches get the configured grace period.
//
// Exit status: 0 after an interrupt, 1 on a config error or a fatal session.
// -----------------------------------------------------------------------------

#include "copier/config/copier_config.hpp"
#include "copier/engine/copier_engine.hpp"
#include "copier/network/zmq_bridge_transport.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

// Set from the signal handler, polled by main(). The only global in the
// program.
static std::atomic<bool> g_interrupted{false};

static void sigint_handler(int /*signum*/) { g_interrupted.store(true); }

int main(int argc, char** argv) {
  const std::string config_path = argc > 1 ? argv[1] : "copier.json";

  auto config = copier::loadConfig(config_path);
  if (!config) {
    std::cerr << "[main] invalid configuration, exiting.\n";
    return 1;
  }

  auto transport = std::make_unique<copier::ZmqBridgeTransport>(config->bridge);
  copier::CopierEngine engine(std::move(*config), std::move(transport));

  std::signal(SIGINT, sigint_handler);
  std::signal(SIGTERM, sigint_handler);

  engine.start();
  std::cout << "[main] Press Ctrl-C to shut down.\n";

  while (!g_interrupted.load() && !engine.fatal()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  const bool fatal = engine.fatal();
  if (g_interrupted.load()) {
    std::cout << "\n[main] interrupt received. Shutting down...\n";
  } else {
    std::cerr << "[main] session is fatal. Shutting down...\n";
  }

  engine.stop();
  return fatal && !g_interrupted.load() ? 1 : 0;
}
