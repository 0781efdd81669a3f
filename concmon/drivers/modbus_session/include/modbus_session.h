#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "drivers/driver.h"
#include "modbus_context.h"

namespace concmon {

struct TcpSettings {
  std::string host;
  int port = 502;
};

struct SerialSettings {
  std::string device;  // "/dev/ttyUSB0", "COM7"
  int baudrate = 9600;
  char parity = 'N';   // 'N', 'E' or 'O'
  int byte_size = 8;
  int stop_bits = 1;
};

/**
 * @brief Session on top of a libmodbus context.
 *
 * A fresh context is created on every connect() and destroyed on close(), so
 * a reconnect never reuses a context that has seen an error. The response
 * timeout also bounds the TCP connect.
 */
class ModbusSession : public Session {
 public:
  ~ModbusSession() override;

  Status connect() override;
  bool isOpen() const override;
  ConnectionState state() const override;

  Status readHoldingRegisters(uint16_t addr, uint16_t count, int unit,
                              std::vector<uint16_t>& dest) override;
  Status readDiscreteInputs(uint16_t addr, uint16_t count, int unit,
                            std::vector<bool>& dest) override;
  Status writeRegister(uint16_t addr, uint16_t value, int unit) override;

  void close() override;

  std::chrono::milliseconds responseTimeout() const { return response_timeout_; }

 protected:
  explicit ModbusSession(std::chrono::milliseconds response_timeout);

  // Returns nullptr when libmodbus rejects the settings.
  virtual ModbusContextPtr createContext() const = 0;

 private:
  // Caller holds bus_mutex_.
  Status beginRequest(int unit, const char* what);
  Status ioFailure(ErrorCode code, const char* what);

  mutable std::mutex bus_mutex_;  // serializes I/O with close()
  ModbusContextPtr ctx_;
  ConnectionState state_ = ConnectionState::DISCONNECTED;
  std::chrono::milliseconds response_timeout_;
};

class TcpSession final : public ModbusSession {
 public:
  TcpSession(const TcpSettings& settings,
             std::chrono::milliseconds response_timeout);

  std::string describe() const override;

 protected:
  ModbusContextPtr createContext() const override;

 private:
  TcpSettings settings_;
};

class RtuSession final : public ModbusSession {
 public:
  RtuSession(const SerialSettings& settings,
             std::chrono::milliseconds response_timeout);

  std::string describe() const override;

 protected:
  ModbusContextPtr createContext() const override;

 private:
  SerialSettings settings_;
};

}  // namespace concmon
