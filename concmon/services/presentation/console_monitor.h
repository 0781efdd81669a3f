#pragma once

#include <atomic>
#include <map>
#include <ostream>
#include <string>
#include <vector>

#include "services/common/time_source.h"
#include "services/config/app_config.h"
#include "services/log/logger.h"
#include "services/presentation/history_buffer.h"
#include "services/publish/fanout_channel.h"

namespace concmon {

enum class Advice { WAITING, NORMAL, TOO_HIGH, TOO_LOW };

const char* adviceText(Advice advice);

// Operator action for a concentration reading against the display limits.
Advice adviseConcentration(double concentration, const DisplayConfig& config);

/**
 * @brief Text-mode operator display.
 *
 * Drains its fan-out subscription every RefreshInterval, keeps the latest
 * value per key (messages may be missing; the view only ever shows the
 * newest), appends conductivity / concentration to the history rings every
 * HistoryInterval and prints a status block every StatusInterval.
 */
class ConsoleMonitor {
 public:
  struct Latest {
    FanoutValue value;
    TimePoint timestamp;
  };

  ConsoleMonitor(const DisplayConfig& config,
                 FanoutChannel::Subscription subscription, TimeSource& time,
                 Logger& logger, std::ostream& out);

  void run(const std::atomic<bool>& running);

  // Applies every queued message; returns how many were applied.
  std::size_t processQueue();

  // Records the latest conductivity / concentration into history.
  void logDataPoint(TimePoint now);

  void printStatus();

  Advice advice() const { return advice_; }
  // Last status text of one source, "Initializing..." until it reports.
  std::string statusLine(const std::string& source) const;
  const std::map<std::string, std::string>& statusLines() const {
    return status_lines_;
  }
  bool latest(const std::string& key, Latest& out) const;

  const HistoryBuffer& conductivityHistory() const { return conductivity_; }
  const HistoryBuffer& concentrationHistory() const { return concentration_; }

 private:
  void apply(const FanoutMessage& message);

  DisplayConfig config_;
  FanoutChannel::Subscription subscription_;
  TimeSource& time_;
  Logger& log_;
  std::ostream& out_;

  // key -> latest value; keys are "<source>/<key>" except the acquisition
  // keys conductivity / concentration, which are shown bare.
  std::map<std::string, Latest> latest_;
  // source -> status text; never mixed into latest_
  std::map<std::string, std::string> status_lines_;
  HistoryBuffer conductivity_;
  HistoryBuffer concentration_;
  Advice advice_ = Advice::WAITING;
};

}  // namespace concmon
