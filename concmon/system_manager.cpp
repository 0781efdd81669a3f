#include "system_manager.h"

#include <iostream>

namespace concmon {

namespace {

const char* TAG = "MANAGER";

}  // namespace

std::unique_ptr<Session> makeSession(const InstrumentConfig& config) {
  if (config.transport == TransportKind::SERIAL) {
    return std::make_unique<RtuSession>(config.serial, config.response_timeout);
  }
  return std::make_unique<TcpSession>(config.tcp, config.response_timeout);
}

SystemManager::SystemManager(const AppConfig& config, Logger& logger)
    : m_config(config),
      m_log(logger),
      m_model(config.calibration_slope, config.calibration_intercept),
      m_store(config.server.unit_id, config.server.tables),
      m_sink(m_store, m_channel, logger),
      m_server(config.server.settings, m_store, logger) {
  m_log.info(TAG, "Calibration: concentration = " +
                      std::to_string(m_model.slope()) + " * conductivity + " +
                      std::to_string(m_model.intercept()));

  // Subscriptions exist before any producer starts, so nothing is missed.
  // The publisher subscribes in start(), once its socket is bound.
  if (m_config.display.enabled) {
    m_monitor = std::make_unique<ConsoleMonitor>(
        m_config.display,
        m_channel.subscribe("display", m_config.display.queue_capacity), m_time,
        m_log, std::cout);
  }
  if (m_config.publisher.enabled) {
    m_transport =
        std::make_unique<transport::ZmqTransport>(m_config.publisher.endpoint);
  }

  buildLoops();

  if (m_config.simulation.enabled) {
    m_simulation = std::make_unique<SimulationSource>(
        m_config.simulation, m_store, m_channel, m_time, m_log);
  }
}

SystemManager::~SystemManager() { stop(); }

void SystemManager::buildLoops() {
  for (const auto& entry : m_config.instruments) {
    if (!entry.status.ok()) {
      // A bad entry only costs its own loop
      m_log.error(entry.name, "Configuration error, loop not started: " +
                                  entry.status.toString());
      continue;
    }
    m_loops.push_back(std::make_unique<AcquisitionLoop>(
        entry.config, makeSession(entry.config), m_model, m_sink, m_time,
        m_log));
  }
}

bool SystemManager::start() {
  if (m_is_running.exchange(true)) {
    m_log.warn(TAG, "System already running");
    return true;
  }

  m_log.info(TAG, "Starting Modbus TCP server (unit " +
                      std::to_string(m_store.unitId()) + ")...");
  if (!m_server.start()) {
    m_is_running = false;
    return false;
  }

  if (m_transport) {
    if (m_transport->open()) {
      m_log.info(TAG, "Publishing on " + m_config.publisher.endpoint);
      if (!m_publisher) {
        m_publisher = std::make_unique<SamplePublisher>(
            *m_transport,
            m_channel.subscribe("publisher", m_config.publisher.queue_capacity),
            m_time, m_log);
      }
    } else {
      m_log.error(TAG, "Cannot bind publisher on " +
                           m_config.publisher.endpoint + ": " +
                           m_transport->lastError() +
                           ". Continuing without it.");
      m_transport.reset();
    }
  }

  m_log.info(TAG, "Starting " + std::to_string(m_loops.size()) +
                      " acquisition loop(s)");
  for (auto& loop : m_loops) {
    AcquisitionLoop* l = loop.get();
    m_threads.emplace_back([this, l] { l->run(m_is_running); });
  }
  if (m_simulation) {
    m_threads.emplace_back([this] { m_simulation->run(m_is_running); });
  }
  if (m_monitor) {
    m_threads.emplace_back([this] { m_monitor->run(m_is_running); });
  }
  if (m_publisher) {
    m_threads.emplace_back([this] { m_publisher->run(m_is_running); });
  }

  m_log.info(TAG, "All threads started (" + std::to_string(m_threads.size()) +
                      ")");
  return true;
}

void SystemManager::stop() {
  if (!m_is_running.exchange(false)) return;

  m_log.info(TAG, "Shutting down...");
  m_time.interrupt();

  for (auto& t : m_threads) {
    if (t.joinable()) t.join();
  }
  m_threads.clear();

  m_server.stop();
  if (m_transport) m_transport->close();

  if (m_channel.droppedTotal() > 0) {
    m_log.warn(TAG, std::to_string(m_channel.droppedTotal()) +
                        " fan-out messages dropped by slow consumers");
  }
  m_log.info(TAG, "System stopped");
}

}  // namespace concmon
