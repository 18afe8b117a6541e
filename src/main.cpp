/**
 * @file main.cpp
 * @brief Entry point for the live chunker daemon
 *
 * @details Loads the stream catalog, starts every desired-active stream with
 *          its chunk schedule, serves the control API and waits for SIGINT or
 *          SIGTERM to shut down.
 *
 * @note The catalog path is taken from argv[1], falling back to STREAMS_FILE.
 *       All other settings come from the environment (see config.hpp).
 */

#include <csignal>
#include <cstdio>
#include <exception>
#include <string>

#include <pthread.h>
#include <signal.h>

#include "live_chunker/config.hpp"
#include "live_chunker/control_server.hpp"
#include "live_chunker/control_surface.hpp"
#include "live_chunker/detection_client.hpp"
#include "live_chunker/logging.hpp"
#include "live_chunker/service.hpp"
#include "live_chunker/stream_catalog.hpp"
#include "live_chunker/subprocess.hpp"

using namespace live_chunker;

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  std::string catalog_path = argc > 1 ? argv[1] : Config::streams_file();

  /// Block termination signals before any thread exists so every thread
  /// inherits the mask and sigwait below is the only receiver
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);
  std::signal(SIGPIPE, SIG_IGN);

  StreamCatalog catalog;
  try {
    std::size_t count = catalog.load(catalog_path);
    LOG_INFO("Loaded {} streams from {}", count, catalog_path);
  } catch (const std::exception &e) {
    LOG_ERROR("Cannot load stream catalog {}: {}", catalog_path, e.what());
    return 1;
  }

  PosixProcessLauncher launcher;
  HttpDetectionClient detector(DetectionClientOptions::from_env());

  Service service(ServiceOptions::from_env(), catalog, launcher, detector);
  ControlSurface surface(service);
  ControlServer server(surface);

  LOG_PHASE("Live Chunker");
  int started = service.start();
  LOG_INFO("{} streams started", started);

  if (!server.start("0.0.0.0", Config::control_port())) {
    service.shutdown();
    return 1;
  }

  int sig = 0;
  sigwait(&signals, &sig);
  LOG_WARN("Received signal {}, shutting down", sig);

  server.stop();
  service.shutdown();
  LOG_SUCCESS("Shutdown complete");
  return 0;
}
