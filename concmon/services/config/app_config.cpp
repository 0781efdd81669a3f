#include "services/config/app_config.h"

#include <cmath>
#include <fstream>
#include <sstream>

#include "services/calibration/calibration_model.h"

using json = nlohmann::json;

namespace concmon {

namespace {

Status missingKey(const std::string& key) {
  return Status(ErrorCode::CONFIG_ERROR, "missing required key '" + key + "'");
}

Status invalidKey(const std::string& key, const std::string& why) {
  return Status(ErrorCode::CONFIG_ERROR,
                "invalid value for '" + key + "': " + why);
}

template <typename T>
Status readRequired(const json& j, const std::string& key, T& out) {
  if (!j.contains(key) || j.at(key).is_null()) return missingKey(key);
  try {
    out = j.at(key).get<T>();
  } catch (const json::exception& e) {
    return invalidKey(key, e.what());
  }
  return Status();
}

// Leaves out untouched when the key is absent.
template <typename T>
Status readOptional(const json& j, const std::string& key, T& out) {
  if (!j.contains(key) || j.at(key).is_null()) return Status();
  return readRequired(j, key, out);
}

Status readRegisterAddress(const json& j, const std::string& key, bool required,
                           int& out) {
  int value = out;
  Status st = required ? readRequired(j, key, value)
                       : readOptional(j, key, value);
  if (!st.ok()) return st;
  if (value < -1 || value > 65535) return invalidKey(key, "out of range");
  out = value;
  return Status();
}

// Intervals are written in seconds; fractions are allowed.
Status readSeconds(const json& j, const std::string& key, bool required,
                   bool allow_zero, std::chrono::milliseconds& out) {
  double seconds = 0.0;
  if (!j.contains(key) || j.at(key).is_null()) {
    return required ? missingKey(key) : Status();
  }
  Status st = readRequired(j, key, seconds);
  if (!st.ok()) return st;
  if (!std::isfinite(seconds) || seconds < 0.0 ||
      (!allow_zero && seconds == 0.0)) {
    return invalidKey(key, "must be a positive number of seconds");
  }
  out = std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
  return Status();
}

Status readChannels(const json& j, std::vector<ChannelConfig>& channels) {
  if (!j.is_array() || j.empty()) {
    return invalidKey("Channels", "expected a non-empty array");
  }
  channels.clear();
  for (const auto& item : j) {
    ChannelConfig ch;
    int offset = 0;
    std::string type = "float32";
    Status st = readRequired(item, "Name", ch.name);
    if (st.ok()) st = readRequired(item, "Offset", offset);
    if (st.ok()) st = readOptional(item, "Type", type);
    if (st.ok()) st = readOptional(item, "Scale", ch.scale);
    if (!st.ok()) return st;
    if (offset < 0 || offset > 124) {
      return invalidKey("Channels." + ch.name + ".Offset", "out of range");
    }
    if (!parseValueType(type, ch.type)) {
      return invalidKey("Channels." + ch.name + ".Type", type);
    }
    if (ch.type != ValueType::FLOAT32 && ch.scale == 0.0) {
      return invalidKey("Channels." + ch.name + ".Scale", "must not be zero");
    }
    ch.offset = static_cast<uint16_t>(offset);
    channels.push_back(ch);
  }
  return Status();
}

Status readDiscrete(const json& j, DiscreteBlock& block) {
  int address = 0;
  Status st = readRequired(j, "Address", address);
  if (st.ok()) st = readRequired(j, "Names", block.names);
  if (!st.ok()) return st;
  if (address < 0 || address > 65535) {
    return invalidKey("Discrete.Address", "out of range");
  }
  if (block.names.empty()) return invalidKey("Discrete.Names", "empty");
  block.address = static_cast<uint16_t>(address);
  return Status();
}

Status readSetup(const json& j, DeviceSetup& setup) {
  int address = setup.address;
  int value = setup.value;
  Status st = readOptional(j, "Enabled", setup.enabled);
  if (st.ok()) st = readOptional(j, "Address", address);
  if (st.ok()) st = readOptional(j, "Value", value);
  if (!st.ok()) return st;
  if (address < 0 || address > 65535) {
    return invalidKey("Setup.Address", "out of range");
  }
  if (value < 0 || value > 65535) {
    return invalidKey("Setup.Value", "out of range");
  }
  setup.address = static_cast<uint16_t>(address);
  setup.value = static_cast<uint16_t>(value);
  return Status();
}

}  // namespace

// ---- InstrumentConfig ----

Status InstrumentConfig::loadFromJson(const json& j) {
  if (!j.is_object()) {
    return Status(ErrorCode::CONFIG_ERROR, "instrument entry is not an object");
  }

  std::string transport_name = "serial";
  Status st = readOptional(j, "Transport", transport_name);
  if (!st.ok()) return st;
  if (transport_name == "serial" || transport_name == "rtu") {
    transport = TransportKind::SERIAL;
  } else if (transport_name == "tcp") {
    transport = TransportKind::TCP;
  } else {
    return invalidKey("Transport", transport_name);
  }

  // Name keeps the caller's default when the entry omits it
  st = readOptional(j, "Name", name);
  if (!st.ok()) return st;

  int address = 0;
  int count = 0;
  if (transport == TransportKind::SERIAL) {
    // Register map and timing are all mandatory for a serial sensor.
    st = readRequired(j, "SlaveID", unit_id);
    if (st.ok()) st = readRequired(j, "Port", serial.device);
    if (st.ok()) st = readRequired(j, "Baudrate", serial.baudrate);
    if (st.ok()) st = readSeconds(j, "PollInterval", true, false, poll_interval);
    if (st.ok()) st = readRequired(j, "ReadAddress", address);
    if (st.ok()) st = readRequired(j, "ReadCount", count);
    if (st.ok()) {
      st = readRegisterAddress(j, "WriteAddress", true, target.write_address);
    }
    if (st.ok()) {
      st = readRegisterAddress(j, "WriteAddressConcentration", true,
                               target.write_address_concentration);
    }
    if (!st.ok()) return st;

    std::string parity(1, serial.parity);
    st = readOptional(j, "Parity", parity);
    if (st.ok()) st = readOptional(j, "StopBits", serial.stop_bits);
    if (st.ok()) st = readOptional(j, "ByteSize", serial.byte_size);
    if (!st.ok()) return st;
    if (parity != "N" && parity != "E" && parity != "O") {
      return invalidKey("Parity", parity);
    }
    serial.parity = parity[0];

    // Failed reconnects wait one poll interval unless told otherwise.
    reconnect_delay = poll_interval;
    setup.enabled = true;
    channels = {ChannelConfig{"conductivity", 0, ValueType::FLOAT32, 1.0}};
  } else {
    st = readRequired(j, "UnitID", unit_id);
    if (st.ok()) st = readRequired(j, "Host", tcp.host);
    if (st.ok()) st = readRequired(j, "Port", tcp.port);
    if (!st.ok()) return st;

    // Etch bath analyser layout: S.G., HCl and H2O2 as float32 from 20.
    address = 20;
    count = 6;
    st = readOptional(j, "ReadAddress", address);
    if (st.ok()) st = readOptional(j, "ReadCount", count);
    if (st.ok()) {
      st = readSeconds(j, "PollInterval", false, false, poll_interval);
    }
    if (st.ok()) {
      st = readRegisterAddress(j, "WriteAddress", false, target.write_address);
    }
    if (st.ok()) {
      st = readRegisterAddress(j, "WriteAddressConcentration", false,
                               target.write_address_concentration);
    }
    if (!st.ok()) return st;
    channels = {ChannelConfig{"sg", 0, ValueType::FLOAT32, 1.0},
                ChannelConfig{"hcl", 2, ValueType::FLOAT32, 1.0},
                ChannelConfig{"h2o2", 4, ValueType::FLOAT32, 1.0}};
  }

  if (address < 0 || address > 65535) {
    return invalidKey("ReadAddress", "out of range");
  }
  if (count < 1 || count > MODBUS_MAX_READ_REGISTERS) {
    return invalidKey("ReadCount", "must be 1.." +
                                       std::to_string(MODBUS_MAX_READ_REGISTERS));
  }
  read_address = static_cast<uint16_t>(address);
  read_count = static_cast<uint16_t>(count);

  std::string order = "big";
  st = readOptional(j, "WordOrder", order);
  if (!st.ok()) return st;
  if (!parseWordOrder(order, word_order)) return invalidKey("WordOrder", order);

  st = readSeconds(j, "ReconnectDelay", false, true, reconnect_delay);
  if (st.ok()) st = readSeconds(j, "ResponseTimeout", false, false,
                                response_timeout);
  if (!st.ok()) return st;

  if (j.contains("Channels")) {
    st = readChannels(j.at("Channels"), channels);
    if (!st.ok()) return st;
  }
  if (j.contains("Discrete")) {
    st = readDiscrete(j.at("Discrete"), discrete);
    if (!st.ok()) return st;
  }
  if (j.contains("Setup")) {
    st = readSetup(j.at("Setup"), setup);
    if (!st.ok()) return st;
  }

  st = readRegisterAddress(j, "DiscreteWriteAddress", false,
                           target.discrete_write_address);
  if (st.ok()) st = readOptional(j, "ConcentrationScale",
                                 target.concentration_scale);
  if (!st.ok()) return st;

  derive_concentration = hasChannel("conductivity");
  bool derive = derive_concentration;
  st = readOptional(j, "DeriveConcentration", derive);
  if (!st.ok()) return st;
  if (derive && !hasChannel("conductivity")) {
    return invalidKey("DeriveConcentration",
                      "needs a channel named 'conductivity'");
  }
  derive_concentration = derive;

  return validate();
}

Status InstrumentConfig::validate() const {
  if (name.empty()) return invalidKey("Name", "empty");
  if (unit_id < 0 || unit_id > 247) {
    return invalidKey(transport == TransportKind::SERIAL ? "SlaveID" : "UnitID",
                      "must be 0..247");
  }
  if (transport == TransportKind::TCP) {
    if (tcp.host.empty()) return invalidKey("Host", "empty");
    if (tcp.port < 1 || tcp.port > 65535) return invalidKey("Port", "1..65535");
  } else {
    if (serial.device.empty()) return invalidKey("Port", "empty");
    if (serial.baudrate <= 0) return invalidKey("Baudrate", "must be positive");
    if (serial.byte_size < 5 || serial.byte_size > 8) {
      return invalidKey("ByteSize", "5..8");
    }
    if (serial.stop_bits != 1 && serial.stop_bits != 2) {
      return invalidKey("StopBits", "1 or 2");
    }
  }
  for (const auto& ch : channels) {
    if (ch.offset + registerWidth(ch.type) > read_count) {
      return invalidKey("Channels." + ch.name,
                        "does not fit in ReadCount registers");
    }
  }
  if (discrete.names.size() >
      static_cast<std::size_t>(MODBUS_MAX_READ_BITS)) {
    return invalidKey("Discrete.Names", "too many inputs");
  }
  if (!std::isfinite(target.concentration_scale) ||
      target.concentration_scale <= 0.0) {
    return invalidKey("ConcentrationScale", "must be positive");
  }
  return Status();
}

bool InstrumentConfig::hasChannel(const std::string& channel_name) const {
  for (const auto& ch : channels) {
    if (ch.name == channel_name) return true;
  }
  return false;
}

// ---- DisplayConfig ----

std::size_t DisplayConfig::historyCapacity() const {
  double interval_s = history_interval.count() / 1000.0;
  if (interval_s <= 0.0) return 1;
  auto points = static_cast<std::size_t>(history_hours * 3600.0 / interval_s);
  return points > 0 ? points : 1;
}

// ---- AppConfig ----

AppConfig::AppConfig()
    : calibration_slope(CalibrationModel::DEFAULT_SLOPE),
      calibration_intercept(CalibrationModel::DEFAULT_INTERCEPT) {}

Status AppConfig::loadFromJson(const std::string& json_content) {
  json root;
  try {
    root = json::parse(json_content);
  } catch (const json::parse_error& e) {
    return Status(ErrorCode::CONFIG_ERROR,
                  std::string("malformed configuration: ") + e.what());
  }
  if (!root.is_object()) {
    return Status(ErrorCode::CONFIG_ERROR, "configuration root is not an object");
  }

  if (!root.contains("Modbus")) return missingKey("Modbus");
  if (!root.contains("TCPServer")) return missingKey("TCPServer");

  Status st = readRequired(root.at("Modbus"), "UnitID", server.unit_id);
  if (!st.ok()) return st;
  if (server.unit_id < 1 || server.unit_id > 247) {
    return invalidKey("Modbus.UnitID", "must be 1..247");
  }

  const json& srv = root.at("TCPServer");
  st = readRequired(srv, "Host", server.settings.host);
  if (st.ok()) st = readRequired(srv, "Port", server.settings.port);
  if (!st.ok()) return st;
  if (server.settings.port < 1 || server.settings.port > 65535) {
    return invalidKey("TCPServer.Port", "1..65535");
  }
  if (srv.contains("Tables")) {
    const json& t = srv.at("Tables");
    st = readOptional(t, "Coils", server.tables.coils);
    if (st.ok()) st = readOptional(t, "DiscreteInputs",
                                   server.tables.discrete_inputs);
    if (st.ok()) st = readOptional(t, "HoldingRegisters",
                                   server.tables.holding_registers);
    if (st.ok()) st = readOptional(t, "InputRegisters",
                                   server.tables.input_registers);
    if (!st.ok()) return st;
  }

  if (root.contains("Calibration")) {
    const json& cal = root.at("Calibration");
    st = readOptional(cal, "Slope", calibration_slope);
    if (st.ok()) st = readOptional(cal, "Intercept", calibration_intercept);
    if (!st.ok()) return st;
    if (!std::isfinite(calibration_slope) ||
        !std::isfinite(calibration_intercept)) {
      return invalidKey("Calibration", "coefficients must be finite");
    }
  }

  if (root.contains("Simulation")) {
    const json& sim = root.at("Simulation");
    int address = simulation.write_address;
    st = readOptional(sim, "Enabled", simulation.enabled);
    if (st.ok()) st = readOptional(sim, "WriteAddress", address);
    if (st.ok()) st = readSeconds(sim, "UpdateInterval", false, false,
                                  simulation.update_interval);
    if (st.ok()) st = readOptional(sim, "Seed", simulation.seed);
    if (!st.ok()) return st;
    if (address < 0 || address > 65535 - 6) {
      return invalidKey("Simulation.WriteAddress", "out of range");
    }
    simulation.write_address = static_cast<uint16_t>(address);
  }

  if (root.contains("Publisher")) {
    const json& pub = root.at("Publisher");
    st = readOptional(pub, "Enabled", publisher.enabled);
    if (st.ok()) st = readOptional(pub, "Endpoint", publisher.endpoint);
    if (st.ok()) st = readOptional(pub, "QueueCapacity",
                                   publisher.queue_capacity);
    if (!st.ok()) return st;
    if (publisher.queue_capacity == 0) {
      return invalidKey("Publisher.QueueCapacity", "must be positive");
    }
  }

  if (root.contains("Display")) {
    const json& d = root.at("Display");
    st = readOptional(d, "Enabled", display.enabled);
    if (st.ok()) st = readOptional(d, "QueueCapacity", display.queue_capacity);
    if (st.ok()) st = readSeconds(d, "RefreshInterval", false, false,
                                  display.refresh_interval);
    if (st.ok()) st = readSeconds(d, "HistoryInterval", false, false,
                                  display.history_interval);
    if (st.ok()) st = readOptional(d, "HistoryHours", display.history_hours);
    if (st.ok()) st = readSeconds(d, "StatusInterval", false, false,
                                  display.status_interval);
    if (st.ok()) st = readOptional(d, "ConcentrationLow",
                                   display.concentration_low);
    if (st.ok()) st = readOptional(d, "ConcentrationHigh",
                                   display.concentration_high);
    if (st.ok()) st = readOptional(d, "ConcentrationIdeal",
                                   display.concentration_ideal);
    if (!st.ok()) return st;
    if (display.queue_capacity == 0) {
      return invalidKey("Display.QueueCapacity", "must be positive");
    }
    if (display.history_hours <= 0.0) {
      return invalidKey("Display.HistoryHours", "must be positive");
    }
    if (display.concentration_low >= display.concentration_high) {
      return invalidKey("Display.ConcentrationLow",
                        "must be below ConcentrationHigh");
    }
  }

  if (root.contains("Logging")) {
    const json& l = root.at("Logging");
    std::string level = logLevelName(logging.level);
    st = readOptional(l, "Level", level);
    if (st.ok()) st = readOptional(l, "File", logging.file);
    if (st.ok()) st = readOptional(l, "MaxFileSizeMB",
                                   logging.max_file_size_mb);
    if (!st.ok()) return st;
    if (!parseLogLevel(level, logging.level)) {
      return invalidKey("Logging.Level", level);
    }
  }

  instruments.clear();
  if (root.contains("Instruments")) {
    const json& list = root.at("Instruments");
    if (!list.is_array()) return invalidKey("Instruments", "expected an array");
    for (std::size_t i = 0; i < list.size(); ++i) {
      InstrumentEntry entry;
      const std::string fallback = "instrument[" + std::to_string(i) + "]";
      entry.config.name = fallback;
      entry.status = entry.config.loadFromJson(list[i]);
      entry.name = entry.config.name.empty() ? fallback : entry.config.name;
      instruments.push_back(entry);
    }
  }

  return Status();
}

Status AppConfig::loadFromFile(const std::string& path) {
  std::string content = readFileToString(path);
  if (content.empty()) {
    return Status(ErrorCode::CONFIG_ERROR,
                  "cannot read configuration file " + path);
  }
  return loadFromJson(content);
}

std::size_t AppConfig::validInstrumentCount() const {
  std::size_t n = 0;
  for (const auto& entry : instruments) {
    if (entry.status.ok()) ++n;
  }
  return n;
}

std::string readFileToString(const std::string& filename) {
  std::ifstream ifs(filename);
  if (!ifs.is_open()) return "";
  std::stringstream ss;
  ss << ifs.rdbuf();
  return ss.str();
}

}  // namespace concmon
