#include "services/slave_store/slave_data_store.h"

#include <cerrno>
#include <stdexcept>
#include <string>

namespace concmon {

namespace {

Status rangeError(ErrorCode code, const char* table, uint16_t address,
                  std::size_t count, int size) {
  return Status(code, std::string(table) + " range " + std::to_string(address) +
                          "+" + std::to_string(count) +
                          " outside table of size " + std::to_string(size));
}

bool inRange(uint16_t address, std::size_t count, int size) {
  return count > 0 && static_cast<std::size_t>(address) + count <=
                          static_cast<std::size_t>(size);
}

}  // namespace

SlaveDataStore::SlaveDataStore(int unit_id, const TableSizes& sizes)
    : unit_id_(unit_id),
      mapping_(modbus_mapping_new(sizes.coils, sizes.discrete_inputs,
                                  sizes.holding_registers,
                                  sizes.input_registers)) {
  if (!mapping_) {
    throw std::runtime_error(std::string("Failed to allocate Modbus mapping: ") +
                             modbus_strerror(errno));
  }
}

Status SlaveDataStore::writeHoldingRegisters(
    uint16_t address, const std::vector<uint16_t>& values) {
  std::lock_guard<std::mutex> lock(lockFor(Table::HOLDING_REGISTERS));

  if (!inRange(address, values.size(), mapping_->nb_registers)) {
    return rangeError(ErrorCode::WRITE_ERROR, "holding register", address,
                      values.size(), mapping_->nb_registers);
  }
  for (std::size_t i = 0; i < values.size(); ++i) {
    mapping_->tab_registers[address + i] = values[i];
  }
  return Status();
}

Status SlaveDataStore::readHoldingRegisters(uint16_t address, uint16_t count,
                                            std::vector<uint16_t>& dest) const {
  std::lock_guard<std::mutex> lock(lockFor(Table::HOLDING_REGISTERS));

  if (!inRange(address, count, mapping_->nb_registers)) {
    return rangeError(ErrorCode::READ_ERROR, "holding register", address, count,
                      mapping_->nb_registers);
  }
  dest.assign(mapping_->tab_registers + address,
              mapping_->tab_registers + address + count);
  return Status();
}

Status SlaveDataStore::writeDiscreteInputs(uint16_t address,
                                           const std::vector<bool>& values) {
  std::lock_guard<std::mutex> lock(lockFor(Table::DISCRETE_INPUTS));

  if (!inRange(address, values.size(), mapping_->nb_input_bits)) {
    return rangeError(ErrorCode::WRITE_ERROR, "discrete input", address,
                      values.size(), mapping_->nb_input_bits);
  }
  for (std::size_t i = 0; i < values.size(); ++i) {
    mapping_->tab_input_bits[address + i] = values[i] ? 1 : 0;
  }
  return Status();
}

Status SlaveDataStore::readDiscreteInputs(uint16_t address, uint16_t count,
                                          std::vector<bool>& dest) const {
  std::lock_guard<std::mutex> lock(lockFor(Table::DISCRETE_INPUTS));

  if (!inRange(address, count, mapping_->nb_input_bits)) {
    return rangeError(ErrorCode::READ_ERROR, "discrete input", address, count,
                      mapping_->nb_input_bits);
  }
  dest.clear();
  for (uint16_t i = 0; i < count; ++i) {
    dest.push_back(mapping_->tab_input_bits[address + i] != 0);
  }
  return Status();
}

Table SlaveDataStore::tableForFunction(int function_code) {
  switch (function_code) {
    case MODBUS_FC_READ_COILS:
    case MODBUS_FC_WRITE_SINGLE_COIL:
    case MODBUS_FC_WRITE_MULTIPLE_COILS:
      return Table::COILS;
    case MODBUS_FC_READ_DISCRETE_INPUTS:
      return Table::DISCRETE_INPUTS;
    case MODBUS_FC_READ_INPUT_REGISTERS:
      return Table::INPUT_REGISTERS;
    default:
      // FC 3, 6, 16, 22, 23 and anything libmodbus answers with an exception
      return Table::HOLDING_REGISTERS;
  }
}

int SlaveDataStore::reply(modbus_t* ctx, const uint8_t* request,
                          int request_length) {
  int header_length = modbus_get_header_length(ctx);
  if (request_length <= header_length) {
    errno = EMBBADDATA;
    return -1;
  }

  Table table = tableForFunction(request[header_length]);
  std::lock_guard<std::mutex> lock(lockFor(table));
  return modbus_reply(ctx, request, request_length, mapping_.get());
}

}  // namespace concmon
