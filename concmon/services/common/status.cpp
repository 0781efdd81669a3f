#include "services/common/status.h"

namespace concmon {

const char* errorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "OK";
    case ErrorCode::CONN_ERROR:
      return "CONN_ERROR";
    case ErrorCode::READ_ERROR:
      return "READ_ERROR";
    case ErrorCode::WRITE_ERROR:
      return "WRITE_ERROR";
    case ErrorCode::DECODE_ERROR:
      return "DECODE_ERROR";
    case ErrorCode::NOT_CONNECTED:
      return "NOT_CONNECTED";
    case ErrorCode::INVALID_INPUT:
      return "INVALID_INPUT";
    case ErrorCode::CONFIG_ERROR:
      return "CONFIG_ERROR";
  }
  return "UNKNOWN";
}

std::string Status::toString() const {
  if (ok()) return "OK";
  if (message_.empty()) return errorCodeName(code_);
  return std::string(errorCodeName(code_)) + ": " + message_;
}

}  // namespace concmon
