#pragma once

#include <modbus/modbus.h>

#include <memory>

namespace concmon {

// Custom deleter to close and free a libmodbus context
struct ModbusContextDeleter {
  void operator()(modbus_t* ctx) const {
    if (ctx) {
      modbus_close(ctx);
      modbus_free(ctx);
    }
  }
};

using ModbusContextPtr = std::unique_ptr<modbus_t, ModbusContextDeleter>;

}  // namespace concmon
