#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include "drivers/driver.h"
#include "services/acquisition/acquisition_loop.h"
#include "services/calibration/calibration_model.h"
#include "services/common/time_source.h"
#include "services/config/app_config.h"
#include "services/log/logger.h"
#include "services/presentation/console_monitor.h"
#include "services/publish/fanout_channel.h"
#include "services/publish/publish_sink.h"
#include "services/publish/sample_publisher.h"
#include "services/simulation/simulation_source.h"
#include "services/slave_store/modbus_tcp_server.h"
#include "services/slave_store/slave_data_store.h"
#include "services/transport/zmq/zmq_transport.h"

namespace concmon {

// Session matching the instrument's transport section.
std::unique_ptr<Session> makeSession(const InstrumentConfig& config);

class SystemManager {
 public:
  // Builds every component; nothing runs until start().
  SystemManager(const AppConfig& config, Logger& logger);

  // Stops and joins everything still running
  ~SystemManager();

  SystemManager(const SystemManager&) = delete;
  SystemManager& operator=(const SystemManager&) = delete;

  /**
   * @brief Start the Modbus server and every worker thread, once.
   * @return false when the server cannot bind its address; nothing is left
   * running in that case.
   */
  bool start();

  // Graceful shutdown: wakes all sleepers, then joins each thread.
  void stop();

  bool isRunning() const { return m_is_running; }
  std::size_t loopCount() const { return m_loops.size(); }

  SlaveDataStore& store() { return m_store; }
  FanoutChannel& channel() { return m_channel; }

 private:
  void buildLoops();

  const AppConfig& m_config;
  Logger& m_log;
  std::atomic<bool> m_is_running{false};

  SystemTimeSource m_time;
  CalibrationModel m_model;
  SlaveDataStore m_store;
  FanoutChannel m_channel;
  DataStorePublishSink m_sink;
  ModbusTcpServer m_server;

  // --- WORKERS ---
  std::vector<std::unique_ptr<AcquisitionLoop>> m_loops;
  std::unique_ptr<SimulationSource> m_simulation;
  std::unique_ptr<ConsoleMonitor> m_monitor;
  std::unique_ptr<transport::ZmqTransport> m_transport;
  std::unique_ptr<SamplePublisher> m_publisher;

  std::vector<std::thread> m_threads;
};

}  // namespace concmon
