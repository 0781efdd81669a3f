#include "services/simulation/simulation_source.h"

#include <cmath>
#include <sstream>
#include <vector>

#include "services/codec/register_codec.h"

namespace concmon {

namespace {

double roundTo(double value, int decimals) {
  double factor = std::pow(10.0, decimals);
  return std::round(value * factor) / factor;
}

}  // namespace

SimulationSource::SimulationSource(const SimulationConfig& config,
                                   SlaveDataStore& store,
                                   FanoutChannel& channel, TimeSource& time,
                                   Logger& logger)
    : config_(config),
      store_(store),
      channel_(channel),
      time_(time),
      log_(logger),
      rng_(config.seed != 0 ? config.seed : std::random_device{}()) {}

void SimulationSource::run(const std::atomic<bool>& running) {
  log_.info(SOURCE, "Starting simulated chemical data generation at register " +
                        std::to_string(config_.write_address));
  while (running) {
    if (!step()) break;
  }
  log_.info(SOURCE, "Simulation stopped");
}

SimulatedReading SimulationSource::generate() {
  std::uniform_real_distribution<double> sg(1.10, 1.25);
  std::uniform_real_distribution<double> hcl(30.0, 38.0);
  std::uniform_real_distribution<double> h2o2(30.0, 40.0);

  SimulatedReading r;
  r.sg = roundTo(sg(rng_), 4);
  r.hcl = roundTo(hcl(rng_), 2);
  r.h2o2 = roundTo(h2o2(rng_), 2);
  return r;
}

bool SimulationSource::step() {
  SimulatedReading r = generate();

  std::vector<uint16_t> payload;
  payload.reserve(6);
  for (double v : {r.sg, r.hcl, r.h2o2}) {
    auto words = encodeFloat32(static_cast<float>(v), WordOrder::BIG);
    payload.push_back(words[0]);
    payload.push_back(words[1]);
  }

  Status st = store_.writeHoldingRegisters(config_.write_address, payload);
  if (!st.ok()) {
    log_.error(SOURCE, "Error in simulated data loop: " + st.toString());
    return time_.sleepFor(std::chrono::milliseconds(ERROR_BACKOFF_MS));
  }
  last_ = r;

  TimePoint now = time_.now();
  channel_.publish(FanoutMessage{SOURCE, "sg", r.sg, now});
  channel_.publish(FanoutMessage{SOURCE, "hcl", r.hcl, now});
  channel_.publish(FanoutMessage{SOURCE, "h2o2", r.h2o2, now});

  std::ostringstream oss;
  oss << "Updated simulated data -> S.G.: " << r.sg << ", HCl: " << r.hcl
      << "%, H2O2: " << r.h2o2 << "%";
  log_.info(SOURCE, oss.str());

  return time_.sleepFor(config_.update_interval);
}

}  // namespace concmon
