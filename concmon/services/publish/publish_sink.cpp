#include "services/publish/publish_sink.h"

#include <cmath>
#include <vector>

namespace concmon {

uint16_t concentrationRegister(double concentration, double scale) {
  double scaled = concentration * scale;
  if (!std::isfinite(scaled) || scaled <= 0.0) return 0;
  if (scaled >= 65535.0) return 65535;
  return static_cast<uint16_t>(static_cast<int>(scaled));
}

DataStorePublishSink::DataStorePublishSink(SlaveDataStore& store,
                                           FanoutChannel& channel,
                                           Logger& logger)
    : store_(store), channel_(channel), log_(logger) {}

void DataStorePublishSink::publishSample(const Sample& sample,
                                         const PublishTarget& target) {
  writeStore(sample, target);
  fanOut(sample);
}

void DataStorePublishSink::publishStatus(const std::string& source,
                                         const std::string& text,
                                         TimePoint timestamp) {
  channel_.publish(FanoutMessage{source, "status", text, timestamp});
}

void DataStorePublishSink::writeStore(const Sample& sample,
                                      const PublishTarget& target) {
  if (target.write_address >= 0 && !sample.raw_registers.empty()) {
    Status st = store_.writeHoldingRegisters(
        static_cast<uint16_t>(target.write_address), sample.raw_registers);
    if (!st.ok()) log_.warn(sample.source, "Store write: " + st.toString());
  }

  if (target.write_address_concentration >= 0) {
    const Measurement* conc = sample.find("concentration");
    if (conc) {
      std::vector<uint16_t> reg{
          concentrationRegister(conc->value, target.concentration_scale)};
      Status st = store_.writeHoldingRegisters(
          static_cast<uint16_t>(target.write_address_concentration), reg);
      if (!st.ok()) {
        log_.warn(sample.source, "Concentration write: " + st.toString());
      }
    }
  }

  if (target.discrete_write_address >= 0 && !sample.discretes.empty()) {
    std::vector<bool> bits;
    bits.reserve(sample.discretes.size());
    for (const auto& d : sample.discretes) bits.push_back(d.on);
    Status st = store_.writeDiscreteInputs(
        static_cast<uint16_t>(target.discrete_write_address), bits);
    if (!st.ok()) log_.warn(sample.source, "Discrete write: " + st.toString());
  }
}

void DataStorePublishSink::fanOut(const Sample& sample) {
  for (const auto& m : sample.measurements) {
    channel_.publish(FanoutMessage{sample.source, m.name, m.value,
                                   sample.timestamp});
  }
  for (const auto& d : sample.discretes) {
    channel_.publish(FanoutMessage{sample.source, d.name, d.on,
                                   sample.timestamp});
  }
}

}  // namespace concmon
