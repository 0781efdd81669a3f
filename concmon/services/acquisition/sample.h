#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "services/common/time_source.h"

namespace concmon {

struct Measurement {
  std::string name;
  double value;
};

struct DiscreteState {
  std::string name;
  bool on;
};

// Result of one successful poll cycle.
struct Sample {
  std::string source;  // instrument name
  TimePoint timestamp;
  std::vector<Measurement> measurements;
  std::vector<DiscreteState> discretes;
  std::vector<uint16_t> raw_registers;  // holding-register frame as read

  const Measurement* find(const std::string& name) const {
    for (const auto& m : measurements) {
      if (m.name == name) return &m;
    }
    return nullptr;
  }
};

}  // namespace concmon
