#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "services/common/status.h"

namespace concmon {

enum class ConnectionState { DISCONNECTED, CONNECTED, FAULTED };

inline const char* connectionStateName(ConnectionState state) {
  switch (state) {
    case ConnectionState::DISCONNECTED:
      return "Disconnected";
    case ConnectionState::CONNECTED:
      return "Connected";
    case ConnectionState::FAULTED:
      return "Faulted";
  }
  return "?";
}

/**
 * @brief One connection to one instrument.
 *
 * Reads and writes are only attempted in the CONNECTED state; otherwise they
 * return NOT_CONNECTED without touching the link. Any failed read or write
 * leaves the session FAULTED until close() is called. close() is idempotent.
 */
class Session {
 public:
  virtual ~Session() = default;

  virtual Status connect() = 0;
  virtual bool isOpen() const = 0;
  virtual ConnectionState state() const = 0;

  // Function code 03
  virtual Status readHoldingRegisters(uint16_t addr, uint16_t count, int unit,
                                      std::vector<uint16_t>& dest) = 0;
  // Function code 02
  virtual Status readDiscreteInputs(uint16_t addr, uint16_t count, int unit,
                                    std::vector<bool>& dest) = 0;
  // Function code 06
  virtual Status writeRegister(uint16_t addr, uint16_t value, int unit) = 0;

  virtual void close() = 0;

  // "tcp://192.168.10.1:502", "rtu:///dev/ttyUSB0@9600,8N1"
  virtual std::string describe() const = 0;
};

}  // namespace concmon
