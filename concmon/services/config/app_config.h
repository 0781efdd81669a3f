#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "modbus_session.h"
#include "services/codec/register_codec.h"
#include "services/common/status.h"
#include "services/log/logger.h"
#include "services/publish/publish_sink.h"
#include "services/slave_store/modbus_tcp_server.h"
#include "services/slave_store/slave_data_store.h"

namespace concmon {

enum class TransportKind { TCP, SERIAL };

// One-time read-modify-write of a device mode register.
struct DeviceSetup {
  bool enabled = false;
  uint16_t address = 32;  // temperature compensation mode
  uint16_t value = 1;
};

// Optional FC 2 block read before the holding registers.
struct DiscreteBlock {
  uint16_t address = 0;
  std::vector<std::string> names;  // one per input, in address order

  bool enabled() const { return !names.empty(); }
};

/**
 * @brief Everything one acquisition loop needs to know about its instrument.
 *
 * Built from one entry of the "Instruments" array and never modified after
 * loading.
 */
struct InstrumentConfig {
  std::string name;
  TransportKind transport = TransportKind::TCP;
  TcpSettings tcp;
  SerialSettings serial;
  int unit_id = 1;  // UnitID (tcp) or SlaveID (serial)

  uint16_t read_address = 0;
  uint16_t read_count = 2;
  WordOrder word_order = WordOrder::BIG;
  std::vector<ChannelConfig> channels;
  DiscreteBlock discrete;

  std::chrono::milliseconds poll_interval{1000};
  std::chrono::milliseconds reconnect_delay{5000};
  std::chrono::milliseconds response_timeout{1000};

  DeviceSetup setup;
  PublishTarget target;
  bool derive_concentration = false;

  /**
   * @brief Fill this entry from one JSON object.
   * @return CONFIG_ERROR naming the first missing or invalid key.
   */
  Status loadFromJson(const nlohmann::json& j);

  // Cross-field checks run after loading.
  Status validate() const;

  bool hasChannel(const std::string& channel_name) const;
};

// Server side of the gateway ("Modbus" + "TCPServer").
struct ServerConfig {
  int unit_id = 1;
  ServerSettings settings;
  TableSizes tables;
};

struct SimulationConfig {
  bool enabled = false;
  uint16_t write_address = 20;
  std::chrono::milliseconds update_interval{1000};
  uint32_t seed = 0;  // 0 picks a random seed
};

struct PublisherConfig {
  bool enabled = true;
  std::string endpoint = "tcp://*:5555";
  std::size_t queue_capacity = 256;
};

struct DisplayConfig {
  bool enabled = true;
  std::size_t queue_capacity = 256;
  std::chrono::milliseconds refresh_interval{100};
  std::chrono::milliseconds history_interval{60000};
  double history_hours = 1.0;
  std::chrono::milliseconds status_interval{5000};
  double concentration_low = 0.8;
  double concentration_high = 1.2;
  double concentration_ideal = 1.0;

  // Number of history points kept per quantity.
  std::size_t historyCapacity() const;
};

struct LoggingConfig {
  LogLevel level = LogLevel::INFO;
  std::string file;  // empty: console only
  std::size_t max_file_size_mb = 10;
};

// An instrument entry together with the outcome of loading it. An entry with
// a bad status is reported and its loop is not started.
struct InstrumentEntry {
  std::string name;
  InstrumentConfig config;
  Status status;
};

class AppConfig {
 public:
  ServerConfig server;
  std::vector<InstrumentEntry> instruments;
  double calibration_slope;
  double calibration_intercept;
  SimulationConfig simulation;
  PublisherConfig publisher;
  DisplayConfig display;
  LoggingConfig logging;

  AppConfig();

  /**
   * @brief Parse the whole configuration document.
   *
   * Malformed JSON, a missing "Modbus" / "TCPServer" section or an invalid
   * global section is a CONFIG_ERROR. A bad instrument entry is not: it is
   * kept in `instruments` with its own error status.
   */
  Status loadFromJson(const std::string& json_content);

  Status loadFromFile(const std::string& path);

  std::size_t validInstrumentCount() const;
};

// Empty string when the file cannot be opened.
std::string readFileToString(const std::string& filename);

}  // namespace concmon
