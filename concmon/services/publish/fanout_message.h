#pragma once

#include <string>
#include <variant>

#include "services/common/time_source.h"

namespace concmon {

using FanoutValue = std::variant<double, bool, std::string>;

// One (key, value) update for the local consumers.
struct FanoutMessage {
  std::string source;  // instrument or worker that produced it
  std::string key;     // "conductivity", "concentration", "status", ...
  FanoutValue value;
  TimePoint timestamp;
};

std::string fanoutValueToString(const FanoutValue& value);

}  // namespace concmon
