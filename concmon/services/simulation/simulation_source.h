#pragma once

#include <atomic>
#include <random>

#include "services/common/time_source.h"
#include "services/config/app_config.h"
#include "services/log/logger.h"
#include "services/publish/fanout_channel.h"
#include "services/slave_store/slave_data_store.h"

namespace concmon {

// Etch bath values in the ranges the analyser reports.
struct SimulatedReading {
  double sg = 0.0;    // specific gravity, 1.10 .. 1.25
  double hcl = 0.0;   // %, 30 .. 38
  double h2o2 = 0.0;  // %, 30 .. 40
};

/**
 * @brief Stand-in for the bath analyser when no sensor is attached.
 *
 * Every update writes three big-endian float32 values (six holding
 * registers) at the configured address and publishes them as "sg", "hcl"
 * and "h2o2".
 */
class SimulationSource {
 public:
  static constexpr const char* SOURCE = "simulation";

  SimulationSource(const SimulationConfig& config, SlaveDataStore& store,
                   FanoutChannel& channel, TimeSource& time, Logger& logger);

  void run(const std::atomic<bool>& running);

  // One update plus the sleep after it; false once shutdown interrupts it.
  bool step();

  const SimulatedReading& last() const { return last_; }

 private:
  static constexpr int ERROR_BACKOFF_MS = 5000;

  SimulatedReading generate();

  SimulationConfig config_;
  SlaveDataStore& store_;
  FanoutChannel& channel_;
  TimeSource& time_;
  Logger& log_;

  std::mt19937 rng_;
  SimulatedReading last_;
};

}  // namespace concmon
