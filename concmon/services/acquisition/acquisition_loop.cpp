#include "services/acquisition/acquisition_loop.h"

#include <iomanip>
#include <sstream>
#include <utility>
#include <vector>

namespace concmon {

namespace {

std::string formatSeconds(std::chrono::milliseconds ms) {
  std::ostringstream oss;
  oss << ms.count() / 1000.0 << "s";
  return oss.str();
}

std::string formatRegisters(const std::vector<uint16_t>& words) {
  std::ostringstream oss;
  oss << "[";
  for (std::size_t i = 0; i < words.size(); ++i) {
    if (i) oss << ", ";
    oss << words[i];
  }
  oss << "]";
  return oss.str();
}

}  // namespace

const char* loopStateName(LoopState state) {
  switch (state) {
    case LoopState::IDLE:
      return "Idle";
    case LoopState::CONNECTING:
      return "Connecting";
    case LoopState::CONFIGURING:
      return "Configuring";
    case LoopState::POLLING:
      return "Polling";
    case LoopState::FAULTED:
      return "Faulted";
  }
  return "?";
}

const char* configOutcomeName(ConfigOutcome outcome) {
  switch (outcome) {
    case ConfigOutcome::NOT_ATTEMPTED:
      return "NotAttempted";
    case ConfigOutcome::SKIPPED:
      return "Skipped";
    case ConfigOutcome::ALREADY_SET:
      return "AlreadySet";
    case ConfigOutcome::APPLIED:
      return "Applied";
    case ConfigOutcome::FAILED:
      return "Failed";
  }
  return "?";
}

bool ConfigurationLatch::set(ConfigOutcome outcome) {
  ConfigOutcome expected = ConfigOutcome::NOT_ATTEMPTED;
  return outcome_.compare_exchange_strong(expected, outcome);
}

AcquisitionLoop::AcquisitionLoop(const InstrumentConfig& config,
                                 std::unique_ptr<Session> session,
                                 const CalibrationModel& model,
                                 PublishSink& sink, TimeSource& time,
                                 Logger& logger)
    : config_(config),
      session_(std::move(session)),
      model_(model),
      sink_(sink),
      time_(time),
      log_(logger) {}

LoopCounters AcquisitionLoop::counters() const {
  LoopCounters c;
  c.connect_attempts = connect_attempts_;
  c.connect_failures = connect_failures_;
  c.faults = faults_;
  c.samples = samples_;
  return c;
}

void AcquisitionLoop::run(const std::atomic<bool>& running) {
  log_.info(name(), "Acquisition loop started (" + session_->describe() +
                        ", poll every " +
                        formatSeconds(config_.poll_interval) + ")");
  while (running) {
    if (!step()) break;
  }
  session_->close();
  setState(LoopState::IDLE);
  log_.info(name(), "Acquisition loop stopped");
}

bool AcquisitionLoop::step() {
  if (!session_->isOpen()) {
    if (!connect()) return time_.sleepFor(config_.reconnect_delay);
  }

  if (!latch_.isSet()) {
    setState(LoopState::CONFIGURING);
    configureOnce();
    if (!session_->isOpen()) {
      fault(Status(ErrorCode::READ_ERROR, "link lost during device setup"));
      return time_.sleepFor(config_.poll_interval);
    }
  }

  setState(LoopState::POLLING);
  Sample sample;
  Status st = pollOnce(sample);
  if (st.ok()) {
    sink_.publishSample(sample, config_.target);
    uint64_t n = ++samples_;

    std::ostringstream oss;
    oss << "[Data point #" << n << "] registers "
        << formatRegisters(sample.raw_registers);
    for (const auto& m : sample.measurements) {
      oss << ", " << m.name << "=" << std::fixed << std::setprecision(4)
          << m.value;
    }
    for (const auto& d : sample.discretes) {
      oss << ", " << d.name << "=" << (d.on ? "ON" : "OFF");
    }
    log_.info(name(), oss.str());

    sink_.publishStatus(name(),
                        name() + " OK | " + formatClockTime(sample.timestamp),
                        sample.timestamp);
  } else {
    fault(st);
  }

  return time_.sleepFor(config_.poll_interval);
}

bool AcquisitionLoop::connect() {
  setState(LoopState::CONNECTING);
  ++connect_attempts_;
  log_.info(name(), "Connecting to " + session_->describe() + "...");

  Status st = session_->connect();
  if (!st.ok()) {
    ++connect_failures_;
    setState(LoopState::FAULTED);
    session_->close();
    log_.error(name(), "Connection failed: " + st.message() + ". Retrying in " +
                           formatSeconds(config_.reconnect_delay));
    sink_.publishStatus(name(), name() + " FAULT | " + st.toString(),
                        time_.now());
    return false;
  }

  log_.info(name(), "Connected to " + session_->describe());
  return true;
}

void AcquisitionLoop::configureOnce() {
  if (!config_.setup.enabled) {
    latch_.set(ConfigOutcome::SKIPPED);
    log_.debug(name(), "Device setup disabled");
    return;
  }

  const uint16_t addr = config_.setup.address;
  const uint16_t wanted = config_.setup.value;
  log_.info(name(), "Checking mode register " + std::to_string(addr));

  std::vector<uint16_t> current;
  Status st = session_->readHoldingRegisters(addr, 1, config_.unit_id, current);
  if (st.ok() && current.size() != 1) {
    st = Status(ErrorCode::DECODE_ERROR, "empty mode register reply");
  }
  ConfigOutcome outcome;
  if (!st.ok()) {
    log_.warn(name(), "Failed to read mode register: " + st.toString());
    outcome = ConfigOutcome::FAILED;
  } else if (current[0] == wanted) {
    log_.info(name(), "Mode register already " + std::to_string(wanted) +
                          ", no action required");
    outcome = ConfigOutcome::ALREADY_SET;
  } else {
    log_.info(name(), "Mode register is " + std::to_string(current[0]) +
                          ", changing to " + std::to_string(wanted));
    st = session_->writeRegister(addr, wanted, config_.unit_id);
    if (st.ok()) {
      outcome = ConfigOutcome::APPLIED;
    } else {
      log_.error(name(), "Failed to set mode register: " + st.toString());
      outcome = ConfigOutcome::FAILED;
    }
  }

  latch_.set(outcome);
  log_.info(name(),
            std::string("Device setup done: ") + configOutcomeName(outcome));
}

Status AcquisitionLoop::pollOnce(Sample& sample) {
  sample.source = name();

  if (config_.discrete.enabled()) {
    const auto count = static_cast<uint16_t>(config_.discrete.names.size());
    std::vector<bool> bits;
    Status st = session_->readDiscreteInputs(config_.discrete.address, count,
                                             config_.unit_id, bits);
    if (!st.ok()) return st;
    if (bits.size() != count) {
      return Status(ErrorCode::DECODE_ERROR,
                    "expected " + std::to_string(count) + " discrete inputs, got " +
                        std::to_string(bits.size()));
    }
    for (std::size_t i = 0; i < bits.size(); ++i) {
      sample.discretes.push_back(
          DiscreteState{config_.discrete.names[i], bits[i]});
    }
  }

  std::vector<uint16_t> words;
  Status st = session_->readHoldingRegisters(
      config_.read_address, config_.read_count, config_.unit_id, words);
  if (!st.ok()) return st;
  if (words.size() != config_.read_count) {
    return Status(ErrorCode::DECODE_ERROR,
                  "expected " + std::to_string(config_.read_count) +
                      " registers, got " + std::to_string(words.size()));
  }

  for (const auto& channel : config_.channels) {
    double value = 0.0;
    st = decodeChannel(words, channel, config_.word_order, value);
    if (!st.ok()) return st;
    sample.measurements.push_back(Measurement{channel.name, value});
  }

  if (config_.derive_concentration) {
    const Measurement* cond = sample.find("conductivity");
    double concentration = 0.0;
    if (cond) {
      if (cond->value < 0.0) {
        log_.warn(name(), "Negative conductivity " + std::to_string(cond->value) +
                              ", concentration forced to 0");
      }
      try {
        concentration = model_.concentration(cond->value);
      } catch (const InvalidInputError& e) {
        Status reason(ErrorCode::INVALID_INPUT, e.what());
        log_.error(name(), "Concentration not computable, using 0: " +
                               reason.toString());
        concentration = 0.0;
      }
    }
    sample.measurements.push_back(Measurement{"concentration", concentration});
  }

  sample.raw_registers = std::move(words);
  sample.timestamp = nextTimestamp();
  return Status();
}

void AcquisitionLoop::fault(const Status& reason) {
  setState(LoopState::FAULTED);
  ++faults_;
  log_.error(name(), reason.toString() +
                         ". Closing connection to force reconnect.");
  session_->close();
  sink_.publishStatus(name(), name() + " FAULT | " + reason.toString(),
                      time_.now());
}

void AcquisitionLoop::setState(LoopState next) {
  LoopState prev = state_.exchange(next);
  if (prev != next) {
    log_.debug(name(), std::string(loopStateName(prev)) + " -> " +
                           loopStateName(next));
  }
}

TimePoint AcquisitionLoop::nextTimestamp() {
  TimePoint now = time_.now();
  if (now <= last_timestamp_) {
    now = last_timestamp_ +
          std::chrono::duration_cast<Clock::duration>(std::chrono::microseconds(1));
  }
  last_timestamp_ = now;
  return now;
}

}  // namespace concmon
