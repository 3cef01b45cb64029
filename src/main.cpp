#include "Config.hpp"
#include "Errors.hpp"
#include "Pipeline.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

std::atomic<bool> running{true};

static void signalHandler(int) { running.store(false); }

static void usage(const char *argv0) {
  std::cerr << "usage: " << argv0 << " [-v] [-i interval_ms] <config.json>"
            << std::endl;
}

int main(int argc, char **argv) {
  bool verbose = false;
  int intervalMs = 0;
  std::string configPath;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-v") {
      verbose = true;
    } else if (arg == "-i" && i + 1 < argc) {
      intervalMs = std::atoi(argv[++i]);
      if (intervalMs <= 0) {
        usage(argv[0]);
        return 2;
      }
    } else if (arg == "-h" || arg == "--help") {
      usage(argv[0]);
      return 0;
    } else if (configPath.empty() && arg[0] != '-') {
      configPath = arg;
    } else {
      usage(argv[0]);
      return 2;
    }
  }
  if (configPath.empty()) {
    usage(argv[0]);
    return 2;
  }

  watchflow::PipelineConfig config;
  try {
    config = watchflow::loadConfig(configPath);
  } catch (const watchflow::ConfigError &e) {
    std::cerr << "[Config] " << e.what() << std::endl;
    return 1;
  }

  watchflow::PipelineOptions options;
  options.name = config.name;
  options.verbose = verbose || config.verbose;
  options.batchInterval = intervalMs > 0
                              ? std::chrono::milliseconds(intervalMs)
                              : config.batchInterval;

  watchflow::Pipeline pipeline(options);

  for (const auto &watch : config.watches) {
    try {
      if (watch.recursive)
        pipeline.watchRecursive(watch.path, !watch.includeHidden);
      else
        pipeline.watch(watch.path);
    } catch (const watchflow::ResolutionError &e) {
      std::cerr << "[Main] " << e.what() << std::endl;
    }
  }

  try {
    watchflow::addWorkflows(pipeline, config);
  } catch (const watchflow::ConfigError &e) {
    std::cerr << "[Config] " << e.what() << std::endl;
    return 1;
  }

  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  auto handle = pipeline.start();
  if (!handle)
    return 1;
  std::cout << "[Main] Running " << pipeline.name()
            << ". Press Ctrl+C to exit." << std::endl;

  while (running.load())
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

  std::cout << "[Main] Shutdown signal received" << std::endl;
  handle->stop();
  std::cout << "[Main] Finished." << std::endl;
  return 0;
}
