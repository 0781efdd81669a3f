#pragma once

#include <modbus/modbus.h>

#include <array>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "services/common/status.h"

namespace concmon {

struct ModbusMappingDeleter {
  void operator()(modbus_mapping_t* mapping) const {
    if (mapping) modbus_mapping_free(mapping);
  }
};

using ModbusMappingPtr = std::unique_ptr<modbus_mapping_t, ModbusMappingDeleter>;

struct TableSizes {
  int coils = 100;
  int discrete_inputs = 100;
  int holding_registers = 100;
  int input_registers = 100;
};

enum class Table { COILS = 0, DISCRETE_INPUTS, HOLDING_REGISTERS, INPUT_REGISTERS };

/**
 * @brief Register table served to SCADA clients.
 *
 * Every table has its own mutex. A range write happens under that mutex in
 * one go, and server replies lock the table their function code reads or
 * writes, so a client never observes half of a range written by an
 * acquisition loop. Writes to different ranges carry no ordering guarantee
 * relative to each other.
 *
 * All tables start zeroed; nothing is persisted.
 */
class SlaveDataStore {
 public:
  // Throws std::runtime_error when the mapping cannot be allocated.
  SlaveDataStore(int unit_id, const TableSizes& sizes);

  SlaveDataStore(const SlaveDataStore&) = delete;
  SlaveDataStore& operator=(const SlaveDataStore&) = delete;

  int unitId() const { return unit_id_; }

  Status writeHoldingRegisters(uint16_t address,
                               const std::vector<uint16_t>& values);
  Status readHoldingRegisters(uint16_t address, uint16_t count,
                              std::vector<uint16_t>& dest) const;

  Status writeDiscreteInputs(uint16_t address, const std::vector<bool>& values);
  Status readDiscreteInputs(uint16_t address, uint16_t count,
                            std::vector<bool>& dest) const;

  /**
   * @brief Answer one request received on ctx with modbus_reply(), holding
   * the lock of the table the request touches.
   * @return modbus_reply() result, -1 on error.
   */
  int reply(modbus_t* ctx, const uint8_t* request, int request_length);

  static Table tableForFunction(int function_code);

 private:
  std::mutex& lockFor(Table table) const {
    return mutexes_[static_cast<std::size_t>(table)];
  }

  int unit_id_;
  ModbusMappingPtr mapping_;
  mutable std::array<std::mutex, 4> mutexes_;
};

}  // namespace concmon
