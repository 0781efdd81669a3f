#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "drivers/driver.h"
#include "services/acquisition/sample.h"
#include "services/calibration/calibration_model.h"
#include "services/common/status.h"
#include "services/common/time_source.h"
#include "services/config/app_config.h"
#include "services/log/logger.h"
#include "services/publish/publish_sink.h"

namespace concmon {

enum class LoopState { IDLE, CONNECTING, CONFIGURING, POLLING, FAULTED };

const char* loopStateName(LoopState state);

enum class ConfigOutcome { NOT_ATTEMPTED, SKIPPED, ALREADY_SET, APPLIED, FAILED };

const char* configOutcomeName(ConfigOutcome outcome);

/**
 * @brief One-shot record of the device setup step.
 *
 * The first set() wins; later calls are ignored. A FAILED outcome is final
 * too: the step is never retried while the process runs.
 */
class ConfigurationLatch {
 public:
  bool isSet() const { return outcome_ != ConfigOutcome::NOT_ATTEMPTED; }
  ConfigOutcome outcome() const { return outcome_; }

  // Returns false when the latch was already set.
  bool set(ConfigOutcome outcome);

 private:
  std::atomic<ConfigOutcome> outcome_{ConfigOutcome::NOT_ATTEMPTED};
};

struct LoopCounters {
  uint64_t connect_attempts = 0;
  uint64_t connect_failures = 0;
  uint64_t faults = 0;
  uint64_t samples = 0;
};

/**
 * @brief Per-instrument acquisition state machine.
 *
 *   IDLE -> CONNECTING -> CONFIGURING -> POLLING -> POLLING ...
 *               ^                          |
 *               +-------- FAULTED <--------+
 *
 * A failed connect waits the reconnect delay and tries again, forever. Any
 * read or decode error closes the session, so the next step() reconnects
 * instead of reusing a faulted link. No error escapes step().
 */
class AcquisitionLoop {
 public:
  AcquisitionLoop(const InstrumentConfig& config,
                  std::unique_ptr<Session> session,
                  const CalibrationModel& model, PublishSink& sink,
                  TimeSource& time, Logger& logger);

  AcquisitionLoop(const AcquisitionLoop&) = delete;
  AcquisitionLoop& operator=(const AcquisitionLoop&) = delete;

  // Runs step() until running is cleared, then closes the session.
  void run(const std::atomic<bool>& running);

  /**
   * @brief One connect attempt or one poll cycle, including the sleep that
   * follows it.
   * @return false when the sleep was interrupted by shutdown.
   */
  bool step();

  const std::string& name() const { return config_.name; }
  LoopState state() const { return state_; }
  ConfigOutcome configOutcome() const { return latch_.outcome(); }
  LoopCounters counters() const;

 private:
  bool connect();
  void configureOnce();
  Status pollOnce(Sample& sample);
  void fault(const Status& reason);
  void setState(LoopState next);
  TimePoint nextTimestamp();

  InstrumentConfig config_;
  std::unique_ptr<Session> session_;
  CalibrationModel model_;
  PublishSink& sink_;
  TimeSource& time_;
  Logger& log_;

  std::atomic<LoopState> state_{LoopState::IDLE};
  ConfigurationLatch latch_;
  std::atomic<uint64_t> connect_attempts_{0};
  std::atomic<uint64_t> connect_failures_{0};
  std::atomic<uint64_t> faults_{0};
  std::atomic<uint64_t> samples_{0};
  TimePoint last_timestamp_{};
};

}  // namespace concmon
