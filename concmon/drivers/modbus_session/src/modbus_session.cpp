#include "modbus_session.h"

#include <cerrno>
#include <sstream>

namespace concmon {

namespace {

void splitTimeout(std::chrono::milliseconds timeout, uint32_t& sec,
                  uint32_t& usec) {
  long long ms = timeout.count() > 0 ? timeout.count() : 1;
  sec = static_cast<uint32_t>(ms / 1000);
  usec = static_cast<uint32_t>((ms % 1000) * 1000);
}

// Distinguishes an exception response from the device from a link failure
// in the log text only; both are handled the same way.
std::string describeErrno(int err) {
  std::string text = modbus_strerror(err);
  if (err > MODBUS_ENOBASE && err < MODBUS_ENOBASE + MODBUS_EXCEPTION_MAX) {
    return "device exception: " + text;
  }
  return text;
}

}  // namespace

ModbusSession::ModbusSession(std::chrono::milliseconds response_timeout)
    : response_timeout_(response_timeout) {}

ModbusSession::~ModbusSession() { close(); }

Status ModbusSession::connect() {
  std::lock_guard<std::mutex> lock(bus_mutex_);

  if (state_ == ConnectionState::CONNECTED) return Status();

  ctx_.reset();
  state_ = ConnectionState::DISCONNECTED;

  ModbusContextPtr ctx = createContext();
  if (!ctx) {
    return Status(ErrorCode::CONN_ERROR,
                  std::string("cannot create Modbus context: ") +
                      modbus_strerror(errno));
  }

  uint32_t sec = 0;
  uint32_t usec = 0;
  splitTimeout(response_timeout_, sec, usec);
  if (modbus_set_response_timeout(ctx.get(), sec, usec) == -1) {
    return Status(ErrorCode::CONN_ERROR,
                  std::string("cannot set response timeout: ") +
                      modbus_strerror(errno));
  }

  if (modbus_connect(ctx.get()) == -1) {
    return Status(ErrorCode::CONN_ERROR, modbus_strerror(errno));
  }

  ctx_ = std::move(ctx);
  state_ = ConnectionState::CONNECTED;
  return Status();
}

bool ModbusSession::isOpen() const {
  std::lock_guard<std::mutex> lock(bus_mutex_);
  return state_ == ConnectionState::CONNECTED;
}

ConnectionState ModbusSession::state() const {
  std::lock_guard<std::mutex> lock(bus_mutex_);
  return state_;
}

Status ModbusSession::beginRequest(int unit, const char* what) {
  if (state_ != ConnectionState::CONNECTED || !ctx_) {
    return Status(ErrorCode::NOT_CONNECTED,
                  std::string(what) + " refused, session is " +
                      connectionStateName(state_));
  }
  if (modbus_set_slave(ctx_.get(), unit) == -1) {
    return Status(ErrorCode::READ_ERROR,
                  "invalid unit id " + std::to_string(unit) + ": " +
                      modbus_strerror(errno));
  }
  return Status();
}

Status ModbusSession::ioFailure(ErrorCode code, const char* what) {
  int err = errno;
  state_ = ConnectionState::FAULTED;
  return Status(code, std::string(what) + " failed: " + describeErrno(err));
}

Status ModbusSession::readHoldingRegisters(uint16_t addr, uint16_t count,
                                           int unit,
                                           std::vector<uint16_t>& dest) {
  std::lock_guard<std::mutex> lock(bus_mutex_);

  Status status = beginRequest(unit, "read holding registers");
  if (!status.ok()) return status;

  dest.assign(count, 0);
  int rc = modbus_read_registers(ctx_.get(), addr, count, dest.data());
  if (rc == -1) {
    return ioFailure(ErrorCode::READ_ERROR, "read holding registers");
  }

  if (rc != count) {
    state_ = ConnectionState::FAULTED;
    return Status(ErrorCode::DECODE_ERROR,
                  "expected " + std::to_string(count) + " registers, got " +
                      std::to_string(rc));
  }
  return Status();
}

Status ModbusSession::readDiscreteInputs(uint16_t addr, uint16_t count,
                                         int unit, std::vector<bool>& dest) {
  std::lock_guard<std::mutex> lock(bus_mutex_);

  Status status = beginRequest(unit, "read discrete inputs");
  if (!status.ok()) return status;

  std::vector<uint8_t> bits(count, 0);
  int rc = modbus_read_input_bits(ctx_.get(), addr, count, bits.data());
  if (rc == -1) {
    return ioFailure(ErrorCode::READ_ERROR, "read discrete inputs");
  }

  if (rc != count) {
    state_ = ConnectionState::FAULTED;
    return Status(ErrorCode::DECODE_ERROR,
                  "expected " + std::to_string(count) + " inputs, got " +
                      std::to_string(rc));
  }

  dest.clear();
  for (uint8_t bit : bits) dest.push_back(bit != 0);
  return Status();
}

Status ModbusSession::writeRegister(uint16_t addr, uint16_t value, int unit) {
  std::lock_guard<std::mutex> lock(bus_mutex_);

  Status status = beginRequest(unit, "write register");
  if (!status.ok()) {
    if (status.code() == ErrorCode::READ_ERROR) {
      return Status(ErrorCode::WRITE_ERROR, status.message());
    }
    return status;
  }

  if (modbus_write_register(ctx_.get(), addr, value) == -1) {
    return ioFailure(ErrorCode::WRITE_ERROR, "write register");
  }
  return Status();
}

void ModbusSession::close() {
  std::lock_guard<std::mutex> lock(bus_mutex_);
  ctx_.reset();
  state_ = ConnectionState::DISCONNECTED;
}

// ---------------- TCP ----------------

TcpSession::TcpSession(const TcpSettings& settings,
                       std::chrono::milliseconds response_timeout)
    : ModbusSession(response_timeout), settings_(settings) {}

ModbusContextPtr TcpSession::createContext() const {
  return ModbusContextPtr(modbus_new_tcp(settings_.host.c_str(), settings_.port));
}

std::string TcpSession::describe() const {
  return "tcp://" + settings_.host + ":" + std::to_string(settings_.port);
}

// ---------------- RTU ----------------

RtuSession::RtuSession(const SerialSettings& settings,
                       std::chrono::milliseconds response_timeout)
    : ModbusSession(response_timeout), settings_(settings) {}

ModbusContextPtr RtuSession::createContext() const {
  ModbusContextPtr ctx(modbus_new_rtu(settings_.device.c_str(),
                                      settings_.baudrate, settings_.parity,
                                      settings_.byte_size, settings_.stop_bits));
  if (ctx) {
    modbus_set_byte_timeout(ctx.get(), 0, 500000);
  }
  return ctx;
}

std::string RtuSession::describe() const {
  std::ostringstream oss;
  oss << "rtu://" << settings_.device << "@" << settings_.baudrate << ","
      << settings_.byte_size << settings_.parity << settings_.stop_bits;
  return oss.str();
}

}  // namespace concmon
