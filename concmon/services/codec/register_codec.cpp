#include "services/codec/register_codec.h"

#include <cstring>

namespace concmon {

bool parseWordOrder(const std::string& text, WordOrder& order) {
  if (text == "big" || text == "BIG") {
    order = WordOrder::BIG;
  } else if (text == "little" || text == "LITTLE") {
    order = WordOrder::LITTLE;
  } else {
    return false;
  }
  return true;
}

const char* wordOrderName(WordOrder order) {
  return order == WordOrder::BIG ? "big" : "little";
}

bool parseValueType(const std::string& text, ValueType& type) {
  if (text == "float32") {
    type = ValueType::FLOAT32;
  } else if (text == "int16" || text == "i16") {
    type = ValueType::INT16;
  } else if (text == "uint16" || text == "u16") {
    type = ValueType::UINT16;
  } else {
    return false;
  }
  return true;
}

const char* valueTypeName(ValueType type) {
  switch (type) {
    case ValueType::FLOAT32:
      return "float32";
    case ValueType::INT16:
      return "int16";
    case ValueType::UINT16:
      return "uint16";
  }
  return "?";
}

int registerWidth(ValueType type) { return type == ValueType::FLOAT32 ? 2 : 1; }

Status decodeFloat32(const std::vector<uint16_t>& words, WordOrder order,
                     float& value) {
  if (words.size() < 2) {
    return Status(ErrorCode::DECODE_ERROR,
                  "float32 needs 2 registers, got " +
                      std::to_string(words.size()));
  }

  uint16_t high = (order == WordOrder::BIG) ? words[0] : words[1];
  uint16_t low = (order == WordOrder::BIG) ? words[1] : words[0];
  uint32_t bits = (static_cast<uint32_t>(high) << 16) | low;

  std::memcpy(&value, &bits, sizeof(value));
  return Status();
}

std::array<uint16_t, 2> encodeFloat32(float value, WordOrder order) {
  uint32_t bits = 0;
  std::memcpy(&bits, &value, sizeof(bits));

  uint16_t high = static_cast<uint16_t>(bits >> 16);
  uint16_t low = static_cast<uint16_t>(bits & 0xFFFF);

  if (order == WordOrder::BIG) return {high, low};
  return {low, high};
}

Status decodeScaledInt16(uint16_t reg, double scale, double& value) {
  if (scale == 0.0) {
    return Status(ErrorCode::DECODE_ERROR, "scale must not be zero");
  }
  value = static_cast<double>(reg) / scale;
  return Status();
}

Status decodeChannel(const std::vector<uint16_t>& frame,
                     const ChannelConfig& channel, WordOrder order,
                     double& value) {
  std::size_t end = static_cast<std::size_t>(channel.offset) +
                    static_cast<std::size_t>(registerWidth(channel.type));
  if (end > frame.size()) {
    return Status(ErrorCode::DECODE_ERROR,
                  "channel '" + channel.name + "' needs registers up to " +
                      std::to_string(end) + ", frame has " +
                      std::to_string(frame.size()));
  }

  switch (channel.type) {
    case ValueType::FLOAT32: {
      std::vector<uint16_t> pair(frame.begin() + channel.offset,
                                 frame.begin() + channel.offset + 2);
      float f = 0.0f;
      Status status = decodeFloat32(pair, order, f);
      if (!status.ok()) return status;
      value = static_cast<double>(f);
      return Status();
    }
    case ValueType::INT16: {
      if (channel.scale == 0.0) {
        return Status(ErrorCode::DECODE_ERROR,
                      "channel '" + channel.name + "' has zero scale");
      }
      int16_t raw = static_cast<int16_t>(frame[channel.offset]);
      value = static_cast<double>(raw) / channel.scale;
      return Status();
    }
    case ValueType::UINT16:
      return decodeScaledInt16(frame[channel.offset], channel.scale, value);
  }
  return Status(ErrorCode::DECODE_ERROR, "unknown value type");
}

}  // namespace concmon
