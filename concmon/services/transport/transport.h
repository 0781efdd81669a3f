#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace concmon {
namespace transport {

// Outbound message bus: every message is a channel name plus an opaque body.
class Transport {
 public:
  typedef std::vector<uint8_t> Payload;

  virtual ~Transport() = default;
  virtual bool open() = 0;
  virtual void close() = 0;
  virtual bool isOpen() const = 0;

  virtual bool send(const std::string& channel, const Payload& data) = 0;
};

}  // namespace transport
}  // namespace concmon
