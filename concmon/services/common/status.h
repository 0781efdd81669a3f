#pragma once

#include <string>
#include <utility>

namespace concmon {

// Error taxonomy shared by the transport, codec and configuration layers.
enum class ErrorCode {
  OK = 0,
  CONN_ERROR,     // transport unreachable or timed out
  READ_ERROR,     // protocol or I/O failure on an open connection (read)
  WRITE_ERROR,    // protocol or I/O failure on an open connection (write)
  DECODE_ERROR,   // malformed / short register payload
  NOT_CONNECTED,  // I/O requested outside the Connected state
  INVALID_INPUT,  // non-numeric calibration input
  CONFIG_ERROR    // missing or invalid startup configuration
};

const char* errorCodeName(ErrorCode code);

/**
 * @brief Result of an operation that has no value of its own.
 *
 * Operations producing data return a Status and fill an output parameter,
 * the same way readModbusData() fills its raw_data buffer.
 */
class Status {
 public:
  Status() = default;
  Status(ErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {}

  bool ok() const { return code_ == ErrorCode::OK; }
  ErrorCode code() const { return code_; }
  const std::string& message() const { return message_; }

  // "READ_ERROR: Connection timed out"
  std::string toString() const;

 private:
  ErrorCode code_ = ErrorCode::OK;
  std::string message_;
};

}  // namespace concmon
