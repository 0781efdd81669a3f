#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "services/common/status.h"

namespace concmon {

// Which of two consecutive registers carries the high half of a 32-bit value.
enum class WordOrder {
  BIG,    // first register is the high word
  LITTLE  // first register is the low word
};

enum class ValueType { FLOAT32, INT16, UINT16 };

// One named value inside a holding-register frame.
struct ChannelConfig {
  std::string name;
  uint16_t offset = 0;  // relative to the frame start address
  ValueType type = ValueType::FLOAT32;
  double scale = 1.0;   // divisor for INT16 / UINT16
};

bool parseWordOrder(const std::string& text, WordOrder& order);
const char* wordOrderName(WordOrder order);

bool parseValueType(const std::string& text, ValueType& type);
const char* valueTypeName(ValueType type);

// Number of registers a value of this type occupies.
int registerWidth(ValueType type);

/**
 * @brief Combine the first two words into an IEEE-754 float.
 * @return DECODE_ERROR when fewer than two words are given.
 */
Status decodeFloat32(const std::vector<uint16_t>& words, WordOrder order,
                     float& value);

std::array<uint16_t, 2> encodeFloat32(float value, WordOrder order);

// value = reg / scale
Status decodeScaledInt16(uint16_t reg, double scale, double& value);

/**
 * @brief Decode one configured channel out of a register frame.
 * @return DECODE_ERROR when the channel does not fit inside the frame.
 */
Status decodeChannel(const std::vector<uint16_t>& frame,
                     const ChannelConfig& channel, WordOrder order,
                     double& value);

}  // namespace concmon
