/**
 * LogoWatch - live logo detection stream server
 * Captures a video source, matches reference logos and serves the result
 */

#include <csignal>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include "config.hpp"
#include "frame_source.hpp"
#include "http_server.hpp"
#include "processing_loop.hpp"
#include "reference_set.hpp"
#include "shared_state.hpp"

using namespace logowatch;

namespace {

volatile std::sig_atomic_t g_shutdown = 0;

void onSignal(int) {
  g_shutdown = 1;
}

void printConfig(const AppConfig& config) {
  std::cout << "[Init] Configuration:" << std::endl;
  if (!config.configPath.empty()) {
    std::cout << "  - Config file: " << config.configPath << std::endl;
  }
  std::cout << "  - Source: " << config.source.locator << std::endl;
  std::cout << "  - Detector: " << config.loop.detector.type
            << " (ratio " << config.loop.detector.matchRatioThreshold
            << ", min matches " << config.loop.detector.minGoodMatches << ")" << std::endl;
  std::cout << "  - Process every: " << config.loop.processEvery << " frame(s)" << std::endl;
  std::cout << "  - Frame size: " << config.loop.frameSize.width << "x"
            << config.loop.frameSize.height << std::endl;
  std::cout << "  - Count policy: " << config.loop.countPolicy << std::endl;
  for (const auto& reference : config.loop.initialReferences) {
    std::cout << "  - Slot " << reference.first << ": "
              << (reference.second.empty() ? "(empty)" : reference.second) << std::endl;
  }
  std::cout << "  - HTTP port: " << config.server.port << std::endl;
}

} // namespace

int main(int argc, char** argv) {
  std::cout << "======================================" << std::endl;
  std::cout << "LogoWatch - live logo matching stream" << std::endl;
  std::cout << "======================================" << std::endl;

  AppConfig config;
  std::string error;
  if (!parseCommandLine(argc, argv, config, error)) {
    std::cerr << "[Config] " << error << std::endl;
    std::cerr << "Usage: " << argv[0]
              << " [config.json] [--source L] [--port N] [--process-every N]" << std::endl;
    return 2;
  }
  printConfig(config);

  std::signal(SIGINT, onSignal);
  std::signal(SIGTERM, onSignal);

  auto references = std::make_shared<ReferenceSet>(config.slotNames(),
                                                   config.loop.detector);
  auto shared = std::make_shared<SharedState>();

  ProcessingLoop loop(config.loop,
                      std::make_unique<VideoCaptureSource>(config.source),
                      references, shared);

  ErrorCode startError = loop.start();
  if (startError != ErrorCode::None) {
    std::cerr << "[Init] Startup failed: " << errorName(startError) << std::endl;
    return 1;
  }

  HttpServer server(config.server, shared, references);
  if (!server.start()) {
    std::cerr << "[Init] HTTP server could not start" << std::endl;
    loop.stop();
    return 1;
  }

  std::cout << "[Init] Stream at http://0.0.0.0:" << config.server.port
            << "/stream, stats at /stats" << std::endl;

  while (!g_shutdown) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  std::cout << "\n[Exit] Shutting down..." << std::endl;
  server.stop();
  loop.stop();

  Statistics last = shared->readStats();
  std::cout << "[Exit] Frames captured: " << last.framesCaptured
            << ", processed: " << last.framesProcessed
            << ", published: " << last.framesPublished << std::endl;
  return 0;
}
