#include "services/presentation/console_monitor.h"

#include <iomanip>
#include <sstream>
#include <utility>
#include <vector>

namespace concmon {

namespace {

const char* TAG = "MONITOR";
const char* INITIALIZING = "Initializing...";

bool isAcquisitionKey(const std::string& key) {
  return key == "conductivity" || key == "concentration";
}

std::string formatValue(const std::string& key, const FanoutValue& value) {
  const double* d = std::get_if<double>(&value);
  if (!d) return fanoutValueToString(value);
  std::ostringstream oss;
  oss << std::fixed;
  if (key == "conductivity") {
    oss << std::setprecision(2) << *d << " uS/cm";
  } else if (key == "concentration") {
    oss << std::setprecision(4) << *d << " %";
  } else {
    oss << std::setprecision(4) << *d;
  }
  return oss.str();
}

}  // namespace

const char* adviceText(Advice advice) {
  switch (advice) {
    case Advice::WAITING:
      return "Waiting for data...";
    case Advice::NORMAL:
      return "Running normally, no action required";
    case Advice::TOO_HIGH:
      return "Concentration too high, add pure water";
    case Advice::TOO_LOW:
      return "Concentration too low, add sodium carbonate";
  }
  return "?";
}

Advice adviseConcentration(double concentration, const DisplayConfig& config) {
  if (concentration > config.concentration_high) return Advice::TOO_HIGH;
  if (concentration < config.concentration_low) return Advice::TOO_LOW;
  return Advice::NORMAL;
}

ConsoleMonitor::ConsoleMonitor(const DisplayConfig& config,
                               FanoutChannel::Subscription subscription,
                               TimeSource& time, Logger& logger,
                               std::ostream& out)
    : config_(config),
      subscription_(std::move(subscription)),
      time_(time),
      log_(logger),
      out_(out),
      conductivity_(config.historyCapacity()),
      concentration_(config.historyCapacity()) {}

void ConsoleMonitor::run(const std::atomic<bool>& running) {
  log_.info(TAG, "Console monitor started");
  TimePoint next_history = time_.now();
  TimePoint next_status = time_.now() + config_.status_interval;

  while (running) {
    processQueue();

    TimePoint now = time_.now();
    if (now >= next_history) {
      logDataPoint(now);
      next_history = now + config_.history_interval;
    }
    if (now >= next_status) {
      printStatus();
      next_status = now + config_.status_interval;
    }

    if (!time_.sleepFor(config_.refresh_interval)) break;
  }

  // Whatever arrived during shutdown still gets shown once.
  processQueue();
  log_.info(TAG, "Console monitor stopped");
}

std::size_t ConsoleMonitor::processQueue() {
  std::vector<FanoutMessage> messages;
  std::size_t n = subscription_->drain(messages);
  for (const auto& m : messages) apply(m);
  return n;
}

void ConsoleMonitor::apply(const FanoutMessage& message) {
  if (message.key == "status") {
    status_lines_[message.source] = fanoutValueToString(message.value);
    return;
  }

  std::string key = isAcquisitionKey(message.key)
                        ? message.key
                        : message.source + "/" + message.key;
  latest_[key] = Latest{message.value, message.timestamp};

  if (message.key == "concentration") {
    if (const double* d = std::get_if<double>(&message.value)) {
      advice_ = adviseConcentration(*d, config_);
    }
  }
}

void ConsoleMonitor::logDataPoint(TimePoint now) {
  Latest value;
  if (latest("conductivity", value)) {
    if (const double* d = std::get_if<double>(&value.value)) {
      conductivity_.append(now, *d);
    }
  }
  if (latest("concentration", value)) {
    if (const double* d = std::get_if<double>(&value.value)) {
      concentration_.append(now, *d);
    }
  }
}

std::string ConsoleMonitor::statusLine(const std::string& source) const {
  auto it = status_lines_.find(source);
  return it == status_lines_.end() ? INITIALIZING : it->second;
}

bool ConsoleMonitor::latest(const std::string& key, Latest& out) const {
  auto it = latest_.find(key);
  if (it == latest_.end()) return false;
  out = it->second;
  return true;
}

void ConsoleMonitor::printStatus() {
  std::ostringstream oss;
  oss << "\n========== SYSTEM STATUS ==========\n";
  if (status_lines_.empty()) {
    oss << "Status: " << INITIALIZING << "\n";
  }
  for (const auto& entry : status_lines_) {
    oss << "Status [" << entry.first << "]: " << entry.second << "\n";
  }

  TimePoint now = time_.now();
  for (const auto& entry : latest_) {
    auto age = std::chrono::duration_cast<std::chrono::seconds>(
                   now - entry.second.timestamp)
                   .count();
    oss << "  " << entry.first << ": "
        << formatValue(entry.first, entry.second.value) << " (age: " << age
        << "s)\n";
  }

  oss << "Advice: " << adviceText(advice_) << "\n";
  if (!concentration_.empty()) {
    oss << std::fixed << std::setprecision(4) << "Concentration history: "
        << concentration_.size() << " points, min " << concentration_.minValue()
        << " %, max " << concentration_.maxValue() << " % (ideal "
        << config_.concentration_ideal << " %)\n";
  }
  oss << "===================================\n";

  out_ << oss.str() << std::flush;
}

}  // namespace concmon
