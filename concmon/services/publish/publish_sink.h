#pragma once

#include <string>

#include "services/acquisition/sample.h"
#include "services/log/logger.h"
#include "services/publish/fanout_channel.h"
#include "services/slave_store/slave_data_store.h"

namespace concmon {

// Where one instrument's samples land in the slave store. -1 disables a write.
struct PublishTarget {
  int write_address = -1;                // raw holding-register mirror
  int write_address_concentration = -1;  // scaled concentration register
  int discrete_write_address = -1;       // discrete-input mirror
  double concentration_scale = 100.0;
};

// Converts a concentration to the register written for SCADA:
// int(concentration * scale), clamped to 0..65535.
uint16_t concentrationRegister(double concentration, double scale);

/**
 * @brief Output side of an acquisition loop.
 *
 * Implementations must not block on a consumer and must not fail the poll
 * cycle; problems are logged and the cycle goes on.
 */
class PublishSink {
 public:
  virtual ~PublishSink() = default;

  virtual void publishSample(const Sample& sample,
                             const PublishTarget& target) = 0;

  virtual void publishStatus(const std::string& source,
                             const std::string& text, TimePoint timestamp) = 0;
};

// Writes into the slave store and pushes every value to the fan-out channel.
class DataStorePublishSink : public PublishSink {
 public:
  DataStorePublishSink(SlaveDataStore& store, FanoutChannel& channel,
                       Logger& logger);

  void publishSample(const Sample& sample,
                     const PublishTarget& target) override;

  void publishStatus(const std::string& source, const std::string& text,
                     TimePoint timestamp) override;

 private:
  void writeStore(const Sample& sample, const PublishTarget& target);
  void fanOut(const Sample& sample);

  SlaveDataStore& store_;
  FanoutChannel& channel_;
  Logger& log_;
};

}  // namespace concmon
