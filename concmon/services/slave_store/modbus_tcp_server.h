#pragma once

#include <atomic>
#include <string>
#include <thread>

#include "modbus_context.h"
#include "services/log/logger.h"
#include "services/slave_store/slave_data_store.h"

namespace concmon {

struct ServerSettings {
  std::string host = "0.0.0.0";  // all interfaces
  int port = 5020;
  int backlog = 8;
};

/**
 * @brief Modbus TCP slave exposing a SlaveDataStore.
 *
 * start() binds the listening socket on the caller's thread so a bad address
 * is reported immediately, then serves every client from one worker thread
 * with select(). Requests addressed to another unit id are answered with a
 * "gateway target failed" exception.
 */
class ModbusTcpServer {
 public:
  ModbusTcpServer(const ServerSettings& settings, SlaveDataStore& store,
                  Logger& logger);
  ~ModbusTcpServer();

  ModbusTcpServer(const ModbusTcpServer&) = delete;
  ModbusTcpServer& operator=(const ModbusTcpServer&) = delete;

  bool start();
  void stop();

  bool isRunning() const { return running_; }

 private:
  void serveLoop();
  void handleRequest(const uint8_t* query, int length);

  ServerSettings settings_;
  SlaveDataStore& store_;
  Logger& log_;

  ModbusContextPtr ctx_;
  int listen_socket_ = -1;
  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace concmon
