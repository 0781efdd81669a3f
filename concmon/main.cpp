#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "services/common/time_source.h"
#include "services/config/app_config.h"
#include "services/log/file_sink.h"
#include "services/log/logger.h"
#include "system_manager.h"

#ifndef CONCMON_DEFAULT_CONFIG
#define CONCMON_DEFAULT_CONFIG "config/concmon.json"
#endif

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void handleSignal(int) { g_stop_requested = 1; }

}  // namespace

int main(int argc, char* argv[]) {
  using namespace concmon;

  const std::string config_path = argc > 1 ? argv[1] : CONCMON_DEFAULT_CONFIG;

  Logger logger;
  logger.info("MAIN", "--- concmon conductivity / concentration gateway ---");

  AppConfig config;
  Status st = config.loadFromFile(config_path);
  if (!st.ok()) {
    logger.error("MAIN", "Cannot load " + config_path + ": " + st.toString());
    return EXIT_FAILURE;
  }

  logger.setLevel(config.logging.level);
  std::unique_ptr<FileLogSink> file_sink;
  if (!config.logging.file.empty()) {
    file_sink = std::make_unique<FileLogSink>(config.logging.file,
                                              config.logging.max_file_size_mb);
    FileLogSink* sink = file_sink.get();
    logger.addSink([sink](const LogRecord& record) { sink->write(record); });
    logger.info("MAIN", "Logging to " + config.logging.file);
  }

  logger.info("MAIN", "Loaded " + config_path + ": " +
                          std::to_string(config.validInstrumentCount()) + "/" +
                          std::to_string(config.instruments.size()) +
                          " instrument(s) usable");

  std::signal(SIGINT, handleSignal);
  std::signal(SIGTERM, handleSignal);

  int exit_code = EXIT_SUCCESS;
  try {
    SystemManager manager(config, logger);
    if (!manager.start()) {
      logger.error("MAIN", "Startup failed");
      exit_code = EXIT_FAILURE;
    } else {
      SystemTimeSource clock;
      while (!g_stop_requested) {
        clock.sleepFor(std::chrono::milliseconds(200));
      }
      logger.info("MAIN", "Stop requested");
      manager.stop();
    }
  } catch (const std::exception& e) {
    logger.error("MAIN", std::string("Fatal: ") + e.what());
    exit_code = EXIT_FAILURE;
  }

  if (file_sink) file_sink->forceFlush();
  return exit_code;
}
